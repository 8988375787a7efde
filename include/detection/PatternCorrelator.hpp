#pragma once

#include <optional>
#include <vector>

#include "core/Anomaly.hpp"
#include "core/Pattern.hpp"
#include "detection/DetectorConfig.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Detection
    {
        /**
         * PatternCorrelator
         *
         * Turns a group of co-occurring anomalies into one classified Pattern
         * using an ordered rule table (see PatternRule):
         *  - a group of fewer than two anomalies never yields a Pattern
         *  - the first rule with enough of its metrics present wins
         *  - with no matching rule the group becomes an "unclassified" Pattern
         *  - severity is the most urgent severity among the members
         *
         * Members are ordered by metric name, then timestamp, so the result
         * does not depend on the order anomalies were produced in.
         *
         * Pure; the rule table is fixed at construction.
         */
        class PatternCorrelator
        {
        public:
            explicit PatternCorrelator(std::vector<PatternRule> rules = defaultPatternRules());

            /// Batch form: the group is exactly the given anomalies.
            std::optional<core::Pattern> correlate(const std::vector<core::Anomaly> &group) const;

            /**
             * Time-window form: the group is newAnomaly plus every anomaly in
             * recent whose timestamp lies within window of newAnomaly's.
             * recent must not already contain newAnomaly.
             */
            std::optional<core::Pattern> correlate(const core::Anomaly &newAnomaly,
                                                   const std::vector<core::Anomaly> &recent,
                                                   Utils::milliseconds window) const;

            const std::vector<PatternRule> &rules() const noexcept { return m_rules; }

        private:
            std::vector<PatternRule> m_rules;   // priority order
        };

    } // namespace Detection
} // namespace Sentinel
