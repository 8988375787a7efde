#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Input
    {
        /// One logical request read from a metric stream.
        struct MetricBatch
        {
            Utils::TimePoint timestamp{};
            std::vector<std::pair<std::string, double>> metrics;   // in line order
        };

        /**
         * MetricParser
         *
         * Parses one line of a recorded metric stream:
         *
         *   2025-01-15 10:00:00 llm.tokens.total=512 llm.latency.ms=240.5
         *   2025-01-15T10:00:01 llm.tokens.total=498
         *   1736935200 llm.tokens.total=498 llm.latency.ms=251
         *
         * Blank lines and lines starting with '#' are skipped (not malformed).
         * A line is malformed when the timestamp is invalid, there are no
         * pairs, a pair lacks '=' or a name, a value is not a finite number,
         * or a metric name repeats within the line.
         *
         * Stateless; safe to share.
         */
        class MetricParser
        {
        public:
            struct ParseResult
            {
                std::optional<MetricBatch> batch;
                bool skipped = false;     // blank or comment
                bool malformed = false;
                std::string error;
            };

            MetricParser() = default;

            /// The batch, or std::nullopt for skipped and malformed lines.
            std::optional<MetricBatch> parseLine(std::string_view rawLine) const;

            /// Parse with diagnostics.
            ParseResult parseLineDetailed(std::string_view rawLine) const;

        private:
            /// Parse the leading timestamp; sets consumed to the number of tokens used.
            static std::optional<Utils::TimePoint> parseLeadingTimestamp(
                const std::vector<std::string_view> &tokens, std::size_t &consumed);
        };

    } // namespace Input
} // namespace Sentinel
