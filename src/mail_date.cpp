// src/mail_date.cpp
#include "mail_date.hpp"
#include "mime_parser.hpp"

#include <cstdio>
#include <ctime>

#include <gmime/gmime.h>

namespace MailIngest
{
    namespace Mail
    {

        namespace
        {

            // Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's days_from_civil).
            long long daysFromCivil(long long y, unsigned m, unsigned d)
            {
                y -= m <= 2;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<long long>(doe) - 719468;
            }

            bool isLeap(int y)
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            int daysInMonth(int y, int m)
            {
                static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                return (m == 2 && isLeap(y)) ? 29 : days[m - 1];
            }

            std::optional<TimePoint> makeUtcTimePoint(int year, int month, int day, int hour, int minute, int second)
            {
                if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month))
                {
                    return std::nullopt;
                }
                // 60 allows a leap second.
                if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60)
                {
                    return std::nullopt;
                }
                long long secs = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400LL +
                                 hour * 3600LL + minute * 60LL + second;
                return TimePoint(std::chrono::seconds(secs));
            }

        } // namespace

        std::optional<TimePoint> parseRfc2822Date(const std::string &value)
        {
            // GMime expects a non-empty date string.
            if (value.find_first_not_of(" \t\r\n") == std::string::npos)
            {
                return std::nullopt;
            }
            MimeParser::initialize();

            GDateTime *date = g_mime_utils_header_decode_date(value.c_str());
            if (!date)
            {
                return std::nullopt;
            }
            gint64 seconds = g_date_time_to_unix(date);
            g_date_time_unref(date);
            return TimePoint(std::chrono::seconds(seconds));
        }

        std::string formatIso8601(TimePoint tp)
        {
            std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm tm_utc{};
            gmtime_r(&t, &tm_utc);
            char buf[32];
            // Format as YYYY-MM-DDTHH:MM:SSZ
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
            return buf;
        }

        std::optional<TimePoint> parseIso8601(const std::string &value)
        {
            int year, month, day, hour, minute, second;
            char tail = '\0';
            if (std::sscanf(value.c_str(), "%d-%d-%dT%d:%d:%d%c", &year, &month, &day, &hour, &minute, &second, &tail) < 6)
            {
                return std::nullopt;
            }
            return makeUtcTimePoint(year, month, day, hour, minute, second);
        }

        std::string nowIso8601()
        {
            return formatIso8601(std::chrono::system_clock::now());
        }

    } // namespace Mail
} // namespace MailIngest
