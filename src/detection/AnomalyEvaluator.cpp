#include "detection/AnomalyEvaluator.hpp"

#include <cmath>

namespace Sentinel
{
    namespace Detection
    {
        using core::Anomaly;
        using core::Direction;
        using core::Severity;

        AnomalyEvaluator::AnomalyEvaluator(double threshold, SeverityThresholds severity)
            : m_threshold(threshold),
              m_severity(severity)
        {
        }

        std::optional<Anomaly>
        AnomalyEvaluator::evaluate(const MetricWindow::Snapshot &snapshot,
                                   double value,
                                   const std::string &metricName,
                                   Utils::TimePoint timestamp) const
        {
            return evaluate(snapshot, value, metricName, timestamp, m_threshold);
        }

        std::optional<Anomaly>
        AnomalyEvaluator::evaluate(const MetricWindow::Snapshot &snapshot,
                                   double value,
                                   const std::string &metricName,
                                   Utils::TimePoint timestamp,
                                   double threshold) const
        {
            if (!snapshot.isValid)
                return std::nullopt;

            if (snapshot.stddev == 0.0)
                return std::nullopt;

            const double z = (value - snapshot.mean) / snapshot.stddev;
            const double absZ = std::abs(z);
            if (!(absZ > threshold))
                return std::nullopt;

            const double deviation = snapshot.mean != 0.0
                                         ? (value - snapshot.mean) / snapshot.mean * 100.0
                                         : 0.0;

            return Anomaly(metricName,
                           value,
                           z,
                           deviation,
                           z > 0.0 ? Direction::High : Direction::Low,
                           classify(absZ),
                           snapshot.mean,
                           snapshot.stddev,
                           snapshot.ewmaBaseline,
                           timestamp);
        }

        Severity AnomalyEvaluator::classify(double absZ) const noexcept
        {
            if (absZ >= m_severity.sev1)
                return Severity::Sev1;
            if (absZ >= m_severity.sev2)
                return Severity::Sev2;
            return Severity::Sev3;
        }

    } // namespace Detection
} // namespace Sentinel
