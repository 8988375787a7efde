#include "detection/DetectorConfig.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Sentinel
{
    namespace Detection
    {
        namespace
        {
            constexpr std::string_view kRulePrefix = "pattern_rule.";

            // Negative values map to 0 so validate() reports them.
            std::size_t readSize(const Utils::ConfigLoader &config,
                                 std::string_view key, std::size_t fallback)
            {
                if (!config.hasKey(key))
                    return fallback;

                const auto v = config.getInt(key);
                if (!v)
                {
                    Utils::getLogger().warn("Config: '" + std::string(key) +
                                            "' is not an integer, using default " +
                                            std::to_string(fallback));
                    return fallback;
                }
                return *v < 0 ? 0 : static_cast<std::size_t>(*v);
            }

            double readDouble(const Utils::ConfigLoader &config,
                              std::string_view key, double fallback)
            {
                if (!config.hasKey(key))
                    return fallback;

                const auto v = config.getDouble(key);
                if (!v)
                {
                    Utils::getLogger().warn("Config: '" + std::string(key) +
                                            "' is not a number, using default " +
                                            Utils::formatDouble(fallback, 3));
                    return fallback;
                }
                return *v;
            }

            PatternRule parseRule(std::string_view key, std::string_view value)
            {
                const auto parts = Utils::splitOnce(value, ':');
                if (!parts)
                {
                    throw std::invalid_argument(std::string(key) +
                                                ": expected '<id>: metric, metric'");
                }

                PatternRule rule;
                rule.id = std::string(Utils::trim(parts->first));
                for (auto metric : Utils::splitList(parts->second, ','))
                    rule.metrics.emplace_back(metric);

                if (rule.id.empty())
                    throw std::invalid_argument(std::string(key) + ": empty pattern id");

                return rule;
            }
        } // anonymous namespace

        std::vector<PatternRule> defaultPatternRules()
        {
            return {
                {"high_token_latency_spike",
                 {"llm.tokens.total", "llm.latency.ms"}, 0,
                 "High token count causing increased latency"},
                {"cost_anomaly",
                 {"llm.cost.per_request", "llm.tokens.total"}, 0,
                 "Unexpected cost increase"},
                {"quality_degradation",
                 {"llm.response.is_refusal", "llm.response.length"}, 0,
                 "Increase in refusals or short responses"},
                {"throughput_drop",
                 {"llm.throughput.tokens_per_sec", "llm.latency.ms"}, 0,
                 "Decrease in processing speed"},
                {"context_exhaustion",
                 {"llm.prompt.context_utilization", "llm.response.is_truncated"}, 0,
                 "Context window being over-utilized"},
            };
        }

        DetectorConfig::DetectorConfig()
            : patternRules(defaultPatternRules())
        {
        }

        std::optional<std::string> DetectorConfig::validate() const
        {
            if (windowCapacity == 0)
                return std::string("window_capacity must be at least 1");
            if (minPoints == 0)
                return std::string("min_points must be at least 1");
            if (!std::isfinite(zScoreThreshold) || zScoreThreshold <= 0.0)
                return std::string("zscore_threshold must be a positive number");
            if (!std::isfinite(ewmaAlpha) || ewmaAlpha <= 0.0 || ewmaAlpha > 1.0)
                return std::string("ewma_alpha must lie in (0, 1]");
            if (!std::isfinite(severity.sev1) || !std::isfinite(severity.sev2) ||
                severity.sev2 <= 0.0)
                return std::string("severity boundaries must be positive numbers");
            if (severity.sev1 < severity.sev2)
                return std::string("sev1_zscore must not be below sev2_zscore");
            if (recentAnomalyCapacity == 0)
                return std::string("recent_anomaly_capacity must be at least 1");
            if (correlationWindow.count() < 0)
                return std::string("correlation_window_ms must not be negative");

            std::set<std::string> ids;
            for (const auto &rule : patternRules)
            {
                if (rule.id.empty())
                    return std::string("pattern rule with empty id");
                if (rule.id == "unclassified")
                    return std::string("pattern id 'unclassified' is reserved");
                if (!ids.insert(rule.id).second)
                    return "duplicate pattern id '" + rule.id + "'";
                if (rule.metrics.empty())
                    return "pattern '" + rule.id + "' names no metrics";
                if (rule.minMatches > rule.metrics.size())
                    return "pattern '" + rule.id + "' min_matches exceeds its metric count";
            }

            return std::nullopt;
        }

        DetectorConfig DetectorConfig::fromConfig(const Utils::ConfigLoader &config)
        {
            DetectorConfig out;

            out.windowCapacity = readSize(config, "window_capacity", out.windowCapacity);
            out.minPoints = readSize(config, "min_points", out.minPoints);
            out.zScoreThreshold = readDouble(config, "zscore_threshold", out.zScoreThreshold);
            out.ewmaAlpha = readDouble(config, "ewma_alpha", out.ewmaAlpha);
            out.severity.sev1 = readDouble(config, "sev1_zscore", out.severity.sev1);
            out.severity.sev2 = readDouble(config, "sev2_zscore", out.severity.sev2);
            out.recentAnomalyCapacity =
                readSize(config, "recent_anomaly_capacity", out.recentAnomalyCapacity);

            if (config.hasKey("correlation_window_ms"))
            {
                const auto ms = config.getInt("correlation_window_ms");
                if (ms)
                    out.correlationWindow = Utils::milliseconds(*ms);
                else
                    Utils::getLogger().warn("Config: 'correlation_window_ms' is not an integer, using default");
            }

            // pattern_rule.<N>[.min_matches|.description], ordered by N
            std::map<long long, PatternRule> rules;
            for (const auto &key : config.keysWithPrefix(kRulePrefix))
            {
                const std::string_view rest = std::string_view(key).substr(kRulePrefix.size());
                const auto dot = rest.find('.');
                const auto index = Utils::parseInteger(rest.substr(0, dot));
                if (!index)
                    throw std::invalid_argument(key + ": rule index must be an integer");

                const std::string value = config.getStringOr(key, "");
                if (dot == std::string_view::npos)
                {
                    PatternRule parsed = parseRule(key, value);
                    PatternRule &slot = rules[*index];
                    slot.id = std::move(parsed.id);
                    slot.metrics = std::move(parsed.metrics);
                }
                else if (rest.substr(dot + 1) == "min_matches")
                {
                    const auto n = Utils::parseInteger(value);
                    if (!n || *n < 0)
                        throw std::invalid_argument(key + ": expected a non-negative integer");
                    rules[*index].minMatches = static_cast<std::size_t>(*n);
                }
                else if (rest.substr(dot + 1) == "description")
                {
                    rules[*index].description = value;
                }
                else
                {
                    Utils::getLogger().warn("Config: unknown key '" + key + "' ignored");
                }
            }

            if (!rules.empty())
            {
                out.patternRules.clear();
                for (auto &[index, rule] : rules)
                {
                    if (rule.id.empty())
                    {
                        throw std::invalid_argument("pattern_rule." + std::to_string(index) +
                                                    " has options but no definition");
                    }
                    out.patternRules.push_back(std::move(rule));
                }
            }

            return out;
        }

    } // namespace Detection
} // namespace Sentinel
