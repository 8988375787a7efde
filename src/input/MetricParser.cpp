#include "input/MetricParser.hpp"

#include <set>

#include "utils/StringUtils.hpp"

namespace Sentinel
{
    namespace Input
    {
        using namespace Utils;

        std::optional<MetricBatch> MetricParser::parseLine(std::string_view rawLine) const
        {
            return parseLineDetailed(rawLine).batch;
        }

        MetricParser::ParseResult MetricParser::parseLineDetailed(std::string_view rawLine) const
        {
            ParseResult r;

            const auto line = trim(rawLine);
            if (line.empty() || line.front() == '#')
            {
                r.skipped = true;
                return r;
            }

            const auto tokens = splitWhitespace(line);

            std::size_t consumed = 0;
            const auto ts = parseLeadingTimestamp(tokens, consumed);
            if (!ts)
            {
                r.malformed = true;
                r.error = "Invalid timestamp";
                return r;
            }

            if (consumed >= tokens.size())
            {
                r.malformed = true;
                r.error = "No metric values";
                return r;
            }

            MetricBatch batch;
            batch.timestamp = *ts;

            std::set<std::string_view> seen;
            for (std::size_t i = consumed; i < tokens.size(); ++i)
            {
                const std::string_view token = tokens[i];
                const auto kv = splitOnce(token, '=');
                if (!kv || kv->first.empty())
                {
                    r.malformed = true;
                    r.error = "Expected name=value, got '" + std::string(token) + "'";
                    return r;
                }

                const std::string_view name = kv->first;
                const auto value = parseNumber(kv->second);
                if (!value)
                {
                    r.malformed = true;
                    r.error = "Invalid value for '" + std::string(name) + "'";
                    return r;
                }

                if (!seen.insert(name).second)
                {
                    r.malformed = true;
                    r.error = "Duplicate metric '" + std::string(name) + "'";
                    return r;
                }

                batch.metrics.emplace_back(std::string(name), *value);
            }

            r.batch = std::move(batch);
            return r;
        }

        std::optional<TimePoint> MetricParser::parseLeadingTimestamp(
            const std::vector<std::string_view> &tokens, std::size_t &consumed)
        {
            consumed = 0;
            if (tokens.empty())
                return std::nullopt;

            const std::string_view first = tokens.front();

            // UNIX seconds
            if (first.find('-') == std::string_view::npos)
            {
                consumed = 1;
                return parseUnixSeconds(first);
            }

            // YYYY-MM-DDTHH:MM:SS as one token
            if (first.size() == 19)
            {
                consumed = 1;
                return parseTimestamp(first);
            }

            // YYYY-MM-DD HH:MM:SS as two tokens
            if (tokens.size() < 2)
                return std::nullopt;

            const std::string joined = std::string(first) + " " + std::string(tokens[1]);
            consumed = 2;
            return parseTimestamp(joined);
        }

    } // namespace Input
} // namespace Sentinel
