#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Utils
    {
        namespace
        {
            std::tm localTime(TimePoint tp) noexcept
            {
                const std::time_t t = Clock::to_time_t(tp);
                std::tm out{};
            #if defined(_WIN32)
                localtime_s(&out, &t);
            #else
                localtime_r(&t, &out);
            #endif
                return out;
            }

            // Fixed-width run of decimal digits.
            std::optional<int> digits(std::string_view sv)
            {
                if (sv.empty())
                    return std::nullopt;

                int value = 0;
                for (const char c : sv)
                {
                    if (c < '0' || c > '9')
                        return std::nullopt;
                    value = value * 10 + (c - '0');
                }
                return value;
            }
        } // namespace

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        std::time_t to_time_t(TimePoint tp) noexcept
        {
            return Clock::to_time_t(tp);
        }

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const std::tm tm = localTime(tp);
            const std::string fmt(format);

            char buf[128];
            const std::size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
            return std::string(buf, n);
        }

        std::string toIso8601(TimePoint tp)
        {
            return formatTimestamp(tp, "%Y-%m-%dT%H:%M:%S");
        }

        std::optional<TimePoint> parseTimestamp(std::string_view sv)
        {
            //  0123456789012345678
            //  YYYY-MM-DD HH:MM:SS
            if (sv.size() != 19 || sv[4] != '-' || sv[7] != '-' ||
                (sv[10] != ' ' && sv[10] != 'T') || sv[13] != ':' || sv[16] != ':')
                return std::nullopt;

            const auto year  = digits(sv.substr(0, 4));
            const auto month = digits(sv.substr(5, 2));
            const auto day   = digits(sv.substr(8, 2));
            const auto hour  = digits(sv.substr(11, 2));
            const auto min   = digits(sv.substr(14, 2));
            const auto sec   = digits(sv.substr(17, 2));
            if (!year || !month || !day || !hour || !min || !sec)
                return std::nullopt;

            if (*month < 1 || *month > 12 || *day < 1 || *day > 31 ||
                *hour > 23 || *min > 59 || *sec > 60)
                return std::nullopt;

            std::tm tm{};
            tm.tm_year  = *year - 1900;
            tm.tm_mon   = *month - 1;
            tm.tm_mday  = *day;
            tm.tm_hour  = *hour;
            tm.tm_min   = *min;
            tm.tm_sec   = *sec;
            tm.tm_isdst = -1;

            const std::time_t t = std::mktime(&tm);
            if (t == static_cast<std::time_t>(-1))
                return std::nullopt;
            return Clock::from_time_t(t);
        }

        std::optional<TimePoint> parseUnixSeconds(std::string_view sv)
        {
            if (sv.empty() || sv.size() > 11)
                return std::nullopt;

            std::int64_t secs = 0;
            for (const char c : sv)
            {
                if (c < '0' || c > '9')
                    return std::nullopt;
                secs = secs * 10 + (c - '0');
            }
            return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(secs)));
        }

        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(tp.time_since_epoch()).count();
        }

        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept
        {
            return TimePoint(std::chrono::duration_cast<Clock::duration>(milliseconds(ms)));
        }

        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(end - start).count();
        }

    } // namespace Utils
} // namespace Sentinel
