// include/mime_parser.hpp
#pragma once

#include <string>
#include <vector>

#include "parsed_message.hpp"

namespace MailIngest
{
    namespace Mail
    {

        // Header carrying the provider-assigned conversation id.
        constexpr const char *TRANSPORT_THREAD_HEADER = "X-GM-THRID";

        // Maps GMime's message model onto ParsedMessage.
        class MimeParser
        {
        public:
            // Initializes GMime once per process; safe to call from any thread.
            static void initialize();

            // Parse one RFC 822 message (the mbox "From " line already removed).
            // Throws MessageParseError if the message has no usable header section
            // or GMime reports a structural error.
            static ParsedMessage parseMessage(const std::string &raw_message);

            // Mailboxes of an address-list header value, groups flattened,
            // addresses lower-cased.
            static std::vector<EmailAddress> parseAddressList(const std::string &value);

            // Message ids of a References / In-Reply-To value, each in angle brackets.
            static std::vector<std::string> parseMessageIdList(const std::string &value);

            // Generates "<generated-XXXXXXXX...@synthetic>".
            static std::string syntheticMessageId();
        };

    } // namespace Mail
} // namespace MailIngest
