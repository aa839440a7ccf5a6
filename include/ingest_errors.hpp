// include/ingest_errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace MailIngest
{

    // Raised for a message block that cannot be turned into a ParsedMessage.
    // The reader skips these in lenient mode and rethrows them in strict mode.
    class MessageParseError : public std::runtime_error
    {
    public:
        explicit MessageParseError(const std::string &what) : std::runtime_error(what) {}
    };

    // Raised when a long-running split or read observes its cancellation flag.
    class OperationCancelled : public std::runtime_error
    {
    public:
        explicit OperationCancelled(const std::string &what) : std::runtime_error(what) {}
    };

} // namespace MailIngest
