// File: include/core/Anomaly.hpp
//
// Core data model for a single per-metric anomaly. Produced by the
// AnomalyEvaluator, grouped by the PatternCorrelator and consumed by
// the reporters and the incident-creation collaborator.

#ifndef SENTINEL_CORE_ANOMALY_HPP
#define SENTINEL_CORE_ANOMALY_HPP

#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

namespace Sentinel
{
namespace core
{

/**
 * @brief Incident urgency label derived from anomaly magnitude.
 *
 * SEV-1 is the most urgent. The numeric value doubles as the ordering:
 * a smaller value is more severe.
 */
enum class Severity : std::uint8_t
{
    Sev1 = 1,   ///< Critical.
    Sev2 = 2,   ///< High.
    Sev3 = 3    ///< Medium.
};

/// "SEV-1", "SEV-2" or "SEV-3".
inline const char* severityLabel(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Sev1: return "SEV-1";
    case Severity::Sev2: return "SEV-2";
    case Severity::Sev3: return "SEV-3";
    }
    return "SEV-3";
}

/// Inverse of severityLabel(); std::nullopt for anything else.
inline std::optional<Severity> parseSeverity(std::string_view label) noexcept
{
    if (label == "SEV-1") return Severity::Sev1;
    if (label == "SEV-2") return Severity::Sev2;
    if (label == "SEV-3") return Severity::Sev3;
    return std::nullopt;
}

/// True if a is strictly more urgent than b.
inline bool isMoreSevere(Severity a, Severity b) noexcept
{
    return static_cast<int>(a) < static_cast<int>(b);
}

/// The more urgent of the two.
inline Severity mostSevere(Severity a, Severity b) noexcept
{
    return isMoreSevere(b, a) ? b : a;
}

/**
 * @brief Side of the baseline the anomalous value fell on.
 */
enum class Direction : std::uint8_t
{
    High = 0,
    Low
};

inline const char* directionLabel(Direction direction) noexcept
{
    return direction == Direction::High ? "high" : "low";
}

/**
 * @brief Immutable record of one statistically abnormal observation.
 *
 * Design notes:
 *  - Value type; created once per qualifying observation and never mutated.
 *  - Owned by whoever receives it from the registry.
 *  - baselineMean/baselineStddev describe the window the value was judged
 *    against (which already includes the value itself).
 */
class Anomaly
{
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    /**
     * @brief Construct a fully described anomaly.
     *
     * @param metricName Opaque metric identifier, e.g. "llm.latency.ms".
     * @param value The triggering raw value.
     * @param zScore Signed z-score of value against the window.
     * @param deviationPercent Signed deviation relative to baselineMean, in percent.
     * @param direction High or Low; always agrees with the sign of zScore.
     * @param severity Urgency label assigned from |zScore|.
     * @param baselineMean Window mean at evaluation time.
     * @param baselineStddev Window standard deviation at evaluation time.
     * @param ewmaBaseline Drift-following EWMA reference at evaluation time.
     * @param timestamp Logical timestamp of the observation.
     */
    Anomaly(std::string metricName,
            double value,
            double zScore,
            double deviationPercent,
            Direction direction,
            Severity severity,
            double baselineMean,
            double baselineStddev,
            double ewmaBaseline,
            TimePoint timestamp)
        : m_metricName(std::move(metricName)),
          m_value(value),
          m_zScore(zScore),
          m_deviationPercent(deviationPercent),
          m_direction(direction),
          m_severity(severity),
          m_baselineMean(baselineMean),
          m_baselineStddev(baselineStddev),
          m_ewmaBaseline(ewmaBaseline),
          m_timestamp(timestamp)
    {
    }

    Anomaly(const Anomaly&)            = default;
    Anomaly(Anomaly&&) noexcept        = default;
    Anomaly& operator=(const Anomaly&) = default;
    Anomaly& operator=(Anomaly&&) noexcept = default;

    ~Anomaly() = default;

    // ---------- Accessors ----------

    const std::string& metricName() const noexcept { return m_metricName; }

    double value() const noexcept { return m_value; }

    double zScore() const noexcept { return m_zScore; }

    double deviationPercent() const noexcept { return m_deviationPercent; }

    Direction direction() const noexcept { return m_direction; }

    Severity severity() const noexcept { return m_severity; }

    double baselineMean() const noexcept { return m_baselineMean; }

    double baselineStddev() const noexcept { return m_baselineStddev; }

    double ewmaBaseline() const noexcept { return m_ewmaBaseline; }

    const TimePoint& timestamp() const noexcept { return m_timestamp; }

private:
    std::string m_metricName;
    double      m_value{0.0};
    double      m_zScore{0.0};
    double      m_deviationPercent{0.0};
    Direction   m_direction{Direction::High};
    Severity    m_severity{Severity::Sev3};
    double      m_baselineMean{0.0};
    double      m_baselineStddev{0.0};
    double      m_ewmaBaseline{0.0};
    TimePoint   m_timestamp{};
};

} // namespace core
} // namespace Sentinel

#endif // SENTINEL_CORE_ANOMALY_HPP
