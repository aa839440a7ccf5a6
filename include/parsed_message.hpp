// include/parsed_message.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mail_date.hpp"

namespace MailIngest {
namespace Mail {

struct EmailAddress {
    std::string email;               // Lower-cased address
    std::optional<std::string> name; // Display name as written, quotes removed
};

// Metadata only; attachment content is never retained.
struct AttachmentMetadata {
    std::string filename;
    std::string content_type;
    uint64_t size_bytes = 0;
    std::optional<std::string> content_id;
    bool is_inline = false;
};

// Header name (lower-cased) -> every value it appeared with, in order.
using HeaderMap = std::map<std::string, std::vector<std::string>>;

// One email taken from an mbox block. Produced by the streaming reader and
// treated as immutable afterwards.
struct ParsedMessage {
    std::string message_id;
    EmailAddress from;
    std::vector<EmailAddress> to;
    std::vector<EmailAddress> cc;
    std::vector<EmailAddress> bcc;
    std::string subject;
    TimePoint date;
    std::vector<std::string> references;
    std::optional<std::string> in_reply_to;
    std::optional<std::string> transport_thread_id;
    std::optional<std::string> body_text;
    std::optional<std::string> body_html;
    std::vector<AttachmentMetadata> attachments;
    HeaderMap headers;
};

} // namespace Mail
} // namespace MailIngest
