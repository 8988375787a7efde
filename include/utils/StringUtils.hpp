#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Sentinel
{
    namespace Utils
    {
        /**
         * Text helpers shared by the config loader, the metric stream parser
         * and the reporters. Views returned by these functions point into the
         * argument, so the caller keeps the source string alive.
         */

        /// Strip leading and trailing whitespace (space, tab, CR, LF).
        std::string_view trim(std::string_view sv) noexcept;

        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.substr(0, prefix.size()) == prefix;
        }

        /// ASCII case-insensitive comparison, used for level names and booleans.
        bool iequals(std::string_view a, std::string_view b) noexcept;

        /**
         * Cut @p sv at the first @p separator.
         *
         * "llm.latency.ms=240" -> {"llm.latency.ms", "240"}. Neither side is
         * trimmed. Returns std::nullopt when the separator is absent.
         */
        std::optional<std::pair<std::string_view, std::string_view>>
        splitOnce(std::string_view sv, char separator) noexcept;

        /// Comma-style list: split on @p delimiter, trim, drop empty items.
        std::vector<std::string_view> splitList(std::string_view sv, char delimiter);

        /// Split on runs of whitespace.
        std::vector<std::string_view> splitWhitespace(std::string_view sv);

        /// Whole-string signed integer (surrounding whitespace allowed).
        std::optional<long long> parseInteger(std::string_view sv);

        /// Whole-string finite decimal number; NaN and infinities are rejected.
        std::optional<double> parseNumber(std::string_view sv);

        /// Escape a string for a JSON string literal (RFC 8259).
        std::string escapeJson(std::string_view s);

        /// Fixed-point text, e.g. formatDouble(3.14159, 2) == "3.14". Non-finite gives "0".
        std::string formatDouble(double value, int precision);

    } // namespace Utils
} // namespace Sentinel
