// include/mail_date.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace MailIngest
{
    namespace Mail
    {

        using TimePoint = std::chrono::system_clock::time_point;

        // Parses an RFC 2822 date such as "Fri, 16 Nov 2012 13:16:09 -0400" with
        // GMime, which also copes with two-digit years, comments and the obsolete
        // zone names. Returns std::nullopt when the value is unusable.
        std::optional<TimePoint> parseRfc2822Date(const std::string &value);

        // ISO 8601 in UTC with second precision: "YYYY-MM-DDTHH:MM:SSZ".
        std::string formatIso8601(TimePoint tp);
        std::optional<TimePoint> parseIso8601(const std::string &value);

        std::string nowIso8601();

    } // namespace Mail
} // namespace MailIngest
