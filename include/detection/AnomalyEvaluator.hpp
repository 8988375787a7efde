#pragma once

#include <optional>
#include <string>

#include "core/Anomaly.hpp"
#include "detection/DetectorConfig.hpp"
#include "detection/MetricWindow.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Detection
    {
        /**
         * AnomalyEvaluator
         *
         * Applies the z-score rule to one value against the snapshot of its
         * window (taken after the value was appended):
         *  - no verdict while the window is not yet valid (insufficient history)
         *  - no verdict when stddev is 0 (constant history, z undefined)
         *  - |z| > threshold yields an Anomaly with a severity from |z|
         *
         * Stateless apart from its configuration; safe to share between threads.
         */
        class AnomalyEvaluator
        {
        public:
            /// Default: 3-sigma threshold, SEV-1 at 6, SEV-2 at 4.5.
            explicit AnomalyEvaluator(double threshold = 3.0,
                                      SeverityThresholds severity = SeverityThresholds{});

            /// Evaluate with the configured threshold.
            std::optional<core::Anomaly> evaluate(const MetricWindow::Snapshot &snapshot,
                                                  double value,
                                                  const std::string &metricName,
                                                  Utils::TimePoint timestamp) const;

            /// Evaluate with an explicit threshold.
            std::optional<core::Anomaly> evaluate(const MetricWindow::Snapshot &snapshot,
                                                  double value,
                                                  const std::string &metricName,
                                                  Utils::TimePoint timestamp,
                                                  double threshold) const;

            /// Severity for a given |z|; monotonic in |z| as long as sev1 >= sev2.
            core::Severity classify(double absZ) const noexcept;

            double threshold() const noexcept { return m_threshold; }
            const SeverityThresholds &severityThresholds() const noexcept { return m_severity; }

        private:
            double m_threshold;
            SeverityThresholds m_severity;
        };

    } // namespace Detection
} // namespace Sentinel
