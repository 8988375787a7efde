#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "utils/ConfigLoader.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Detection
    {
        /**
         * One row of the correlation rule table.
         *
         * The rule matches a group of anomalies when at least requiredMatches()
         * of its metric names are present. Rules are evaluated in table order;
         * the first match wins.
         */
        struct PatternRule
        {
            std::string id;
            std::vector<std::string> metrics;
            std::size_t minMatches = 0;       // 0 = every metric must be present
            std::string description;

            std::size_t requiredMatches() const noexcept
            {
                return minMatches == 0 ? metrics.size() : minMatches;
            }
        };

        /// |z| boundaries for SEV-1 and SEV-2; everything below sev2 is SEV-3.
        struct SeverityThresholds
        {
            double sev1 = 6.0;
            double sev2 = 4.5;
        };

        /**
         * Engine configuration, read once when the registry is constructed.
         *
         * Config file keys (see fromConfig):
         *   window_capacity, min_points, zscore_threshold, ewma_alpha,
         *   sev1_zscore, sev2_zscore, recent_anomaly_capacity,
         *   correlation_window_ms,
         *   pattern_rule.<N> = <id>: metricA, metricB
         *   pattern_rule.<N>.min_matches, pattern_rule.<N>.description
         */
        struct DetectorConfig
        {
            std::size_t windowCapacity = 100;
            std::size_t minPoints = 10;
            double zScoreThreshold = 3.0;
            double ewmaAlpha = 0.1;
            SeverityThresholds severity;
            std::size_t recentAnomalyCapacity = 50;
            Utils::milliseconds correlationWindow{1000};
            std::vector<PatternRule> patternRules;

            /// Defaults, including the standard LLM pattern table.
            DetectorConfig();

            /// First problem found, or std::nullopt when the config is usable.
            std::optional<std::string> validate() const;

            /**
             * Build from a loaded key = value file. Missing keys keep their
             * defaults. Configured pattern rules replace the default table.
             *
             * Throws std::invalid_argument on a malformed pattern_rule entry.
             * Range problems are left to validate().
             */
            static DetectorConfig fromConfig(const Utils::ConfigLoader &config);
        };

        /**
         * Rule table of the standard LLM metric set, in priority order:
         * high_token_latency_spike, cost_anomaly, quality_degradation,
         * throughput_drop, context_exhaustion.
         */
        std::vector<PatternRule> defaultPatternRules();

    } // namespace Detection
} // namespace Sentinel
