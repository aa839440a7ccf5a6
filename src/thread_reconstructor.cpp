// src/thread_reconstructor.cpp
#include "thread_reconstructor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream> // For logging
#include <map>
#include <numeric>
#include <unordered_map>

namespace MailIngest
{
    namespace Threads
    {

        namespace
        {
            std::string toLower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            // Length of a leading "re:", "re[2]:", "re(2):", "fwd:" or "fw:" token, or 0.
            size_t replyPrefixLength(const std::string &s, size_t pos)
            {
                static const char *const prefixes[] = {"re", "fwd", "fw"};
                for (const char *prefix : prefixes)
                {
                    size_t len = std::char_traits<char>::length(prefix);
                    if (s.compare(pos, len, prefix) != 0)
                        continue;
                    size_t i = pos + len;
                    if (i < s.size() && (s[i] == '[' || s[i] == '('))
                    {
                        char close = s[i] == '[' ? ']' : ')';
                        size_t j = i + 1;
                        while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j])))
                            ++j;
                        if (j == i + 1 || j >= s.size() || s[j] != close)
                            continue;
                        i = j + 1;
                    }
                    if (i < s.size() && s[i] == ':')
                        return i + 1 - pos;
                }
                return 0;
            }

            bool hasTransportId(const Mail::ParsedMessage &m, const ThreadOptions &opts)
            {
                return opts.use_transport_thread_id && m.transport_thread_id && !m.transport_thread_id->empty();
            }
        } // namespace

        nlohmann::json Thread::toJson() const
        {
            nlohmann::json j;
            j["threadId"] = thread_id;
            j["subject"] = subject;
            j["messageCount"] = message_count;
            j["dateStart"] = Mail::formatIso8601(date_start);
            j["dateEnd"] = Mail::formatIso8601(date_end);
            j["participants"] = nlohmann::json::array();
            for (const auto &p : participants)
            {
                j["participants"].push_back(p.email);
            }
            j["messageIds"] = nlohmann::json::array();
            for (const auto &m : messages)
            {
                j["messageIds"].push_back(m.message_id);
            }
            return j;
        }

        DisjointSet::DisjointSet(size_t n) : parent(n)
        {
            std::iota(parent.begin(), parent.end(), 0);
        }

        size_t DisjointSet::find(size_t x)
        {
            size_t root = x;
            while (parent[root] != root)
                root = parent[root];
            while (parent[x] != root)
            {
                size_t next = parent[x];
                parent[x] = root;
                x = next;
            }
            return root;
        }

        void DisjointSet::unite(size_t a, size_t b)
        {
            size_t ra = find(a);
            size_t rb = find(b);
            if (ra == rb)
                return;
            if (ra < rb)
                parent[rb] = ra;
            else
                parent[ra] = rb;
        }

        ThreadReconstructor::ThreadReconstructor(ThreadOptions options) : opts(options)
        {
        }

        bool ThreadReconstructor::add(Mail::ParsedMessage message)
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!seen_ids.insert(message.message_id).second)
            {
                std::cerr << "[ThreadReconstructor] Ignoring duplicate message " << message.message_id << std::endl;
                return false;
            }
            messages.push_back(std::move(message));
            return true;
        }

        void ThreadReconstructor::clear()
        {
            std::lock_guard<std::mutex> lock(mtx);
            messages.clear();
            seen_ids.clear();
        }

        size_t ThreadReconstructor::messageCount() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            return messages.size();
        }

        std::string ThreadReconstructor::normalizeSubject(const std::string &subject)
        {
            std::string s = toLower(subject);

            size_t pos = 0;
            for (;;)
            {
                while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
                    ++pos;
                size_t len = replyPrefixLength(s, pos);
                if (len == 0)
                    break;
                pos += len;
            }

            std::string out;
            bool pending_space = false;
            for (size_t i = pos; i < s.size(); ++i)
            {
                if (std::isspace(static_cast<unsigned char>(s[i])))
                {
                    pending_space = true;
                    continue;
                }
                if (pending_space && !out.empty())
                    out += ' ';
                pending_space = false;
                out += s[i];
            }
            return out;
        }

        std::vector<Thread> ThreadReconstructor::buildThreads() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            const size_t n = messages.size();
            if (n == 0)
            {
                return {};
            }

            // Canonical order: every grouping decision below depends only on it.
            // Positions index into sorted; sorted[i] indexes into messages.
            std::vector<size_t> sorted(n);
            std::iota(sorted.begin(), sorted.end(), 0);
            std::sort(sorted.begin(), sorted.end(), [this](size_t a, size_t b)
                      {
                          const auto &ma = messages[a];
                          const auto &mb = messages[b];
                          if (ma.date != mb.date)
                              return ma.date < mb.date;
                          return ma.message_id < mb.message_id; });
            auto at = [&](size_t i) -> const Mail::ParsedMessage &
            { return messages[sorted[i]]; };

            std::unordered_map<std::string, size_t> by_id;
            for (size_t i = 0; i < n; ++i)
            {
                by_id.emplace(at(i).message_id, i);
            }

            DisjointSet sets(n);

            // Tier 1: transport thread id
            if (opts.use_transport_thread_id)
            {
                std::unordered_map<std::string, size_t> first_by_transport;
                for (size_t i = 0; i < n; ++i)
                {
                    if (!hasTransportId(at(i), opts))
                        continue;
                    auto inserted = first_by_transport.emplace(*at(i).transport_thread_id, i);
                    if (!inserted.second)
                    {
                        sets.unite(inserted.first->second, i);
                    }
                }
            }

            // Tier 2: reply chains for messages without a transport id
            std::vector<bool> linked(n, false);
            for (size_t i = 0; i < n; ++i)
            {
                const auto &m = at(i);
                if (hasTransportId(m, opts))
                    continue;

                auto link = [&](const std::string &target)
                {
                    auto it = by_id.find(target);
                    if (it == by_id.end() || it->second == i)
                        return;
                    sets.unite(i, it->second);
                    linked[i] = true;
                    linked[it->second] = true;
                };
                if (m.in_reply_to)
                {
                    link(*m.in_reply_to);
                }
                for (const auto &ref : m.references)
                {
                    link(ref);
                }
            }

            // Tier 3: subject within the date window
            if (opts.match_by_subject)
            {
                std::vector<std::string> normalized(n);
                std::map<std::string, std::vector<size_t>> by_subject;
                for (size_t i = 0; i < n; ++i)
                {
                    normalized[i] = normalizeSubject(at(i).subject);
                    if (!normalized[i].empty())
                    {
                        by_subject[normalized[i]].push_back(i);
                    }
                }

                const auto window = std::chrono::hours(24) * opts.subject_match_window_days;
                for (size_t i = 0; i < n; ++i)
                {
                    if (linked[i] || hasTransportId(at(i), opts) || normalized[i].empty())
                        continue;
                    for (size_t j : by_subject[normalized[i]])
                    {
                        if (j == i)
                            continue;
                        auto delta = at(i).date > at(j).date ? at(i).date - at(j).date : at(j).date - at(i).date;
                        if (delta <= window)
                        {
                            sets.unite(i, j);
                            break;
                        }
                    }
                }
            }

            // Assemble; indices within a component stay in canonical order.
            std::map<size_t, std::vector<size_t>> components;
            for (size_t i = 0; i < n; ++i)
            {
                components[sets.find(i)].push_back(i);
            }

            std::vector<Thread> threads;
            threads.reserve(components.size());
            for (const auto &component : components)
            {
                Thread thread;
                std::unordered_set<std::string> seen_participants;
                auto addParticipant = [&](const Mail::EmailAddress &address)
                {
                    std::string key = toLower(address.email);
                    if (key.empty() || !seen_participants.insert(key).second)
                        return;
                    thread.participants.push_back(address);
                };

                for (size_t idx : component.second)
                {
                    const auto &m = at(idx);
                    if (thread.thread_id.empty() && hasTransportId(m, opts))
                    {
                        thread.thread_id = *m.transport_thread_id;
                    }
                    addParticipant(m.from);
                    for (const auto &a : m.to)
                        addParticipant(a);
                    for (const auto &a : m.cc)
                        addParticipant(a);
                    thread.messages.push_back(m);
                }

                const auto &root = thread.messages.front();
                if (thread.thread_id.empty())
                {
                    thread.thread_id = root.message_id;
                }
                thread.subject = root.subject;
                thread.date_start = root.date;
                thread.date_end = thread.messages.back().date;
                thread.message_count = thread.messages.size();
                threads.push_back(std::move(thread));
            }

            std::sort(threads.begin(), threads.end(), [](const Thread &a, const Thread &b)
                      {
                          if (a.date_start != b.date_start)
                              return a.date_start < b.date_start;
                          return a.thread_id < b.thread_id; });

            std::cout << "[ThreadReconstructor] Built " << threads.size() << " threads from " << n
                      << " messages" << std::endl;
            return threads;
        }

    } // namespace Threads
} // namespace MailIngest
