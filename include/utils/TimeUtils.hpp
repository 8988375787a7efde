#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace Sentinel
{
    namespace Utils
    {
        /**
         * Observation timestamps are logical request times supplied by the
         * caller. They live on system_clock so that reports can print them as
         * local wall-clock time, and are exchanged as epoch milliseconds.
         * Parsers return std::nullopt on bad input and never throw.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = Clock::time_point;
        using milliseconds = std::chrono::milliseconds;

        TimePoint now() noexcept;

        std::time_t to_time_t(TimePoint tp) noexcept;

        /// strftime-style rendering in local time.
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// "YYYY-MM-DDTHH:MM:SS", local time.
        std::string toIso8601(TimePoint tp);

        /// "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS", read as local time.
        std::optional<TimePoint> parseTimestamp(std::string_view sv);

        /// Seconds since the UNIX epoch, at most 11 digits, no sign.
        std::optional<TimePoint> parseUnixSeconds(std::string_view sv);

        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept;
        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept;

        /// end - start, in milliseconds (negative when end precedes start).
        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept;

    } // namespace Utils
} // namespace Sentinel
