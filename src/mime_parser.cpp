// src/mime_parser.cpp
#include "mime_parser.hpp"
#include "ingest_errors.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream> // For logging
#include <memory>
#include <mutex>
#include <random>
#include <sstream>

#include <gmime/gmime.h>

namespace MailIngest
{
    namespace Mail
    {

        namespace
        {

            struct GObjectUnref
            {
                void operator()(gpointer object) const
                {
                    if (object)
                    {
                        g_object_unref(object);
                    }
                }
            };

            template <typename T>
            using GObjectPtr = std::unique_ptr<T, GObjectUnref>;

            struct ParserOptionsFree
            {
                void operator()(GMimeParserOptions *options) const { g_mime_parser_options_free(options); }
            };

            using ParserOptionsPtr = std::unique_ptr<GMimeParserOptions, ParserOptionsFree>;

            std::string trim(const std::string &s)
            {
                const char *ws = " \t\r\n";
                size_t start = s.find_first_not_of(ws);
                if (start == std::string::npos)
                {
                    return "";
                }
                size_t end = s.find_last_not_of(ws);
                return s.substr(start, end - start + 1);
            }

            std::string toLower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            std::string orEmpty(const char *s)
            {
                return s ? std::string(s) : std::string();
            }

            // First structural error GMime reported while parsing one message.
            struct ParseProblems
            {
                std::string first_error;
            };

            void collectParserWarning(gint64 offset, GMimeParserWarning errcode, const gchar *item, gpointer user_data)
            {
                auto *problems = static_cast<ParseProblems *>(user_data);
                const char *what = nullptr;
                switch (errcode)
                {
                case GMIME_CRIT_INVALID_HEADER_NAME:
                    what = "Malformed header";
                    break;
                case GMIME_CRIT_MULTIPART_WITHOUT_BOUNDARY:
                    what = "Multipart entity without boundary parameter";
                    break;
                case GMIME_CRIT_NESTING_OVERFLOW:
                    what = "Multipart nesting too deep";
                    break;
                default:
                    // Recoverable irregularities are accepted.
                    return;
                }
                if (problems->first_error.empty())
                {
                    problems->first_error = std::string(what) + " at byte " + std::to_string(offset);
                    if (item)
                    {
                        problems->first_error += ": " + std::string(item).substr(0, 80);
                    }
                }
            }

            ParserOptionsPtr newParserOptions(ParseProblems *problems)
            {
                ParserOptionsPtr options(g_mime_parser_options_new());
                if (problems)
                {
                    g_mime_parser_options_set_warning_callback(options.get(), collectParserWarning, problems);
                }
                return options;
            }

            void appendMailboxes(InternetAddressList *list, std::vector<EmailAddress> &out)
            {
                if (!list)
                {
                    return;
                }
                int count = internet_address_list_length(list);
                for (int i = 0; i < count; ++i)
                {
                    InternetAddress *address = internet_address_list_get_address(list, i);
                    if (INTERNET_ADDRESS_IS_GROUP(address))
                    {
                        appendMailboxes(internet_address_group_get_members(INTERNET_ADDRESS_GROUP(address)), out);
                        continue;
                    }
                    if (!INTERNET_ADDRESS_IS_MAILBOX(address))
                    {
                        continue;
                    }

                    EmailAddress mailbox;
                    mailbox.email = toLower(trim(orEmpty(internet_address_mailbox_get_addr(INTERNET_ADDRESS_MAILBOX(address)))));
                    std::string name = trim(orEmpty(internet_address_get_name(address)));
                    if (!name.empty())
                    {
                        mailbox.name = name;
                    }
                    if (!mailbox.email.empty())
                    {
                        out.push_back(std::move(mailbox));
                    }
                }
            }

            std::vector<std::string> messageIds(GMimeParserOptions *options, const std::string &value)
            {
                std::vector<std::string> ids;
                GMimeReferences *refs = g_mime_references_parse(options, value.c_str());
                if (refs)
                {
                    int count = g_mime_references_length(refs);
                    for (int i = 0; i < count; ++i)
                    {
                        std::string id = trim(orEmpty(g_mime_references_get_message_id(refs, i)));
                        if (!id.empty())
                        {
                            ids.push_back("<" + id + ">");
                        }
                    }
                    g_mime_references_free(refs);
                }
                return ids;
            }

            std::string streamBytes(GMimeStream *source)
            {
                GObjectPtr<GMimeStream> sink(g_mime_stream_mem_new());
                g_mime_stream_reset(source);
                if (g_mime_stream_write_to_stream(source, sink.get()) < 0)
                {
                    throw MessageParseError("Failed to read MIME part content");
                }
                GByteArray *bytes = g_mime_stream_mem_get_byte_array(GMIME_STREAM_MEM(sink.get()));
                return std::string(reinterpret_cast<const char *>(bytes->data), bytes->len);
            }

            // Content as it appears in the message; transfer encodings are left in place.
            std::string rawContent(GMimePart *part)
            {
                GMimeDataWrapper *content = g_mime_part_get_content(part);
                if (!content)
                {
                    return "";
                }
                GMimeStream *stream = g_mime_data_wrapper_get_stream(content);
                return stream ? streamBytes(stream) : std::string();
            }

            std::string serializedBytes(GMimeObject *object)
            {
                GObjectPtr<GMimeStream> sink(g_mime_stream_mem_new());
                if (g_mime_object_write_to_stream(object, nullptr, sink.get()) < 0)
                {
                    throw MessageParseError("Failed to serialize embedded message");
                }
                GByteArray *bytes = g_mime_stream_mem_get_byte_array(GMIME_STREAM_MEM(sink.get()));
                return std::string(reinterpret_cast<const char *>(bytes->data), bytes->len);
            }

            std::string mediaTypeOf(GMimeObject *part)
            {
                GMimeContentType *content_type = g_mime_object_get_content_type(part);
                if (!content_type)
                {
                    return "text/plain";
                }
                gchar *mime_type = g_mime_content_type_get_mime_type(content_type);
                std::string media_type = toLower(orEmpty(mime_type));
                g_free(mime_type);
                return media_type;
            }

            struct BodyWalk
            {
                ParsedMessage *message;
                std::string error;
            };

            void visitPart(GMimeObject *part, ParsedMessage &message)
            {
                if (!part || GMIME_IS_MULTIPART(part))
                {
                    return;
                }

                GMimeContentDisposition *disposition = g_mime_object_get_content_disposition(part);
                const std::string disposition_type =
                    disposition ? toLower(orEmpty(g_mime_content_disposition_get_disposition(disposition))) : "";
                const std::string media_type = mediaTypeOf(part);

                std::string filename;
                std::string content;
                if (GMIME_IS_MESSAGE_PART(part))
                {
                    GMimeMessage *embedded = g_mime_message_part_get_message(GMIME_MESSAGE_PART(part));
                    content = embedded ? serializedBytes(GMIME_OBJECT(embedded)) : std::string();
                    if (disposition)
                    {
                        filename = orEmpty(g_mime_content_disposition_get_parameter(disposition, "filename"));
                    }
                }
                else if (GMIME_IS_PART(part))
                {
                    filename = orEmpty(g_mime_part_get_filename(GMIME_PART(part)));
                    content = rawContent(GMIME_PART(part));
                }
                else
                {
                    return;
                }

                bool is_text = media_type == "text/plain" || media_type == "text/html";
                if (disposition_type == "attachment" || !filename.empty() || !is_text)
                {
                    AttachmentMetadata attachment;
                    attachment.filename = filename.empty() ? "unnamed" : filename;
                    attachment.content_type = media_type.empty() ? "application/octet-stream" : media_type;
                    attachment.size_bytes = content.size();
                    std::string content_id = trim(orEmpty(g_mime_object_get_content_id(part)));
                    if (!content_id.empty())
                    {
                        attachment.content_id = "<" + content_id + ">";
                    }
                    attachment.is_inline = disposition_type == "inline";
                    message.attachments.push_back(std::move(attachment));
                    return;
                }

                if (media_type == "text/plain" && !message.body_text)
                {
                    message.body_text = std::move(content);
                }
                else if (media_type == "text/html" && !message.body_html)
                {
                    message.body_html = std::move(content);
                }
            }

            void visitForeach(GMimeObject *, GMimeObject *part, gpointer user_data)
            {
                auto *walk = static_cast<BodyWalk *>(user_data);
                if (!walk->error.empty())
                {
                    return;
                }
                // Exceptions must not unwind through GMime's C frames.
                try
                {
                    visitPart(part, *walk->message);
                }
                catch (const MessageParseError &e)
                {
                    walk->error = e.what();
                }
            }

        } // namespace

        void MimeParser::initialize()
        {
            static std::once_flag once;
            std::call_once(once, []
                           { g_mime_init(); });
        }

        std::vector<EmailAddress> MimeParser::parseAddressList(const std::string &value)
        {
            initialize();
            std::vector<EmailAddress> addresses;
            ParserOptionsPtr options = newParserOptions(nullptr);
            GObjectPtr<InternetAddressList> list(internet_address_list_parse(options.get(), value.c_str()));
            appendMailboxes(list.get(), addresses);
            return addresses;
        }

        std::vector<std::string> MimeParser::parseMessageIdList(const std::string &value)
        {
            initialize();
            ParserOptionsPtr options = newParserOptions(nullptr);
            std::vector<std::string> ids = messageIds(options.get(), value);
            if (ids.empty() && !trim(value).empty())
            {
                // A single bare id without angle brackets.
                gchar *decoded = g_mime_utils_decode_message_id(value.c_str());
                std::string id = trim(orEmpty(decoded));
                g_free(decoded);
                if (!id.empty())
                {
                    ids.push_back("<" + id + ">");
                }
            }
            return ids;
        }

        std::string MimeParser::syntheticMessageId()
        {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::stringstream ss;
            ss << "<generated-" << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng()
               << "@synthetic>";
            return ss.str();
        }

        ParsedMessage MimeParser::parseMessage(const std::string &raw_message)
        {
            if (trim(raw_message).empty())
            {
                throw MessageParseError("Message has no header section");
            }
            initialize();

            ParseProblems problems;
            ParserOptionsPtr options = newParserOptions(&problems);
            GObjectPtr<GMimeStream> stream(g_mime_stream_mem_new_with_buffer(raw_message.data(), raw_message.size()));
            GObjectPtr<GMimeParser> parser(g_mime_parser_new_with_stream(stream.get()));
            g_mime_parser_set_format(parser.get(), GMIME_FORMAT_MESSAGE);

            GObjectPtr<GMimeMessage> mime(g_mime_parser_construct_message(parser.get(), options.get()));
            if (!mime)
            {
                throw MessageParseError(problems.first_error.empty() ? "GMime could not parse the message"
                                                                     : problems.first_error);
            }
            if (!problems.first_error.empty())
            {
                throw MessageParseError(problems.first_error);
            }

            GMimeObject *object = GMIME_OBJECT(mime.get());
            ParsedMessage message;

            GMimeHeaderList *header_list = g_mime_object_get_header_list(object);
            int header_count = header_list ? g_mime_header_list_get_count(header_list) : 0;
            for (int i = 0; i < header_count; ++i)
            {
                GMimeHeader *header = g_mime_header_list_get_header_at(header_list, i);
                const char *name = header ? g_mime_header_get_name(header) : nullptr;
                if (!name)
                {
                    continue;
                }
                message.headers[toLower(name)].push_back(trim(orEmpty(g_mime_header_get_value(header))));
            }
            if (message.headers.empty())
            {
                throw MessageParseError("Message has no header section");
            }

            std::string id = trim(orEmpty(g_mime_message_get_message_id(mime.get())));
            message.message_id = id.empty() ? syntheticMessageId() : "<" + id + ">";

            auto collect = [&message](const std::string &name)
            {
                std::vector<EmailAddress> out;
                auto it = message.headers.find(name);
                if (it != message.headers.end())
                {
                    for (const auto &value : it->second)
                    {
                        auto parsed = parseAddressList(value);
                        out.insert(out.end(), parsed.begin(), parsed.end());
                    }
                }
                return out;
            };

            std::vector<EmailAddress> from = collect("from");
            if (from.empty())
            {
                message.from = EmailAddress{"unknown@unknown.com", std::string("Unknown")};
            }
            else
            {
                message.from = from.front();
            }
            message.to = collect("to");
            message.cc = collect("cc");
            message.bcc = collect("bcc");

            message.subject = trim(orEmpty(g_mime_message_get_subject(mime.get())));

            const char *date_header = g_mime_object_get_header(object, "Date");
            std::optional<TimePoint> date = date_header ? parseRfc2822Date(date_header) : std::nullopt;
            if (!date)
            {
                if (date_header)
                {
                    std::cerr << "[MimeParser] Warning: unparseable Date header '" << date_header
                              << "' in " << message.message_id << ", using current time." << std::endl;
                }
                else
                {
                    std::cerr << "[MimeParser] Warning: " << message.message_id
                              << " has no Date header, using current time." << std::endl;
                }
                date = std::chrono::system_clock::now();
            }
            message.date = *date;

            auto refs = message.headers.find("references");
            if (refs != message.headers.end())
            {
                for (const auto &value : refs->second)
                {
                    auto parsed = messageIds(options.get(), value);
                    message.references.insert(message.references.end(), parsed.begin(), parsed.end());
                }
            }

            const char *reply_header = g_mime_object_get_header(object, "In-Reply-To");
            if (reply_header)
            {
                auto reply_ids = parseMessageIdList(reply_header);
                if (!reply_ids.empty())
                {
                    message.in_reply_to = reply_ids.front();
                }
            }

            std::string thread_id = trim(orEmpty(g_mime_object_get_header(object, TRANSPORT_THREAD_HEADER)));
            if (!thread_id.empty())
            {
                message.transport_thread_id = thread_id;
            }

            BodyWalk walk{&message, ""};
            g_mime_message_foreach(mime.get(), visitForeach, &walk);
            if (!walk.error.empty())
            {
                throw MessageParseError(walk.error);
            }
            return message;
        }

    } // namespace Mail
} // namespace MailIngest
