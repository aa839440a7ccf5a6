// include/thread_reconstructor.hpp
#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "parsed_message.hpp"

namespace MailIngest {
namespace Threads {

struct ThreadOptions {
    bool use_transport_thread_id = true;
    int subject_match_window_days = 7;
    bool match_by_subject = true;
};

// A reconstructed conversation. messages are ordered by (date, message_id).
struct Thread {
    std::string thread_id; // Transport thread id if any member has one, else the root's message id
    std::vector<Mail::ParsedMessage> messages;
    std::vector<Mail::EmailAddress> participants;
    std::string subject;   // Root subject as written
    Mail::TimePoint date_start;
    Mail::TimePoint date_end;
    size_t message_count = 0;

    const Mail::ParsedMessage& rootMessage() const { return messages.front(); }

    // Summary without bodies, for reporting.
    nlohmann::json toJson() const;
};

// Union-find over indices. The smaller index always becomes the root, so the
// resulting partition does not depend on the order of unite() calls.
class DisjointSet {
public:
    explicit DisjointSet(size_t n);

    size_t find(size_t x);
    void unite(size_t a, size_t b);

private:
    std::vector<size_t> parent;
};

// Groups messages into conversations:
//   1. messages sharing a transport thread id,
//   2. reply chains (In-Reply-To / References) among the remaining messages,
//   3. messages still unlinked join the first message with the same
//      normalized subject within the date window.
class ThreadReconstructor {
public:
    explicit ThreadReconstructor(ThreadOptions options = ThreadOptions());

    // Safe to call from several threads. A message whose id was already added
    // is ignored and false is returned.
    bool add(Mail::ParsedMessage message);

    // Deterministic for a given set of messages, independent of add() order.
    // Holds the lock for the whole build; concurrent add() calls wait.
    std::vector<Thread> buildThreads() const;

    void clear();
    size_t messageCount() const;

    const ThreadOptions& options() const { return opts; }

    // Strips leading Re:, Re[n]:, Fwd: and FW: tokens, collapses whitespace and
    // lower-cases: "RE: Fwd:  Q3   Budget" -> "q3 budget".
    static std::string normalizeSubject(const std::string& subject);

private:
    ThreadOptions opts;
    mutable std::mutex mtx;
    std::vector<Mail::ParsedMessage> messages;
    std::unordered_set<std::string> seen_ids;
};

} // namespace Threads
} // namespace MailIngest
