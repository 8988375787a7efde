// File: include/core/Pattern.hpp
//
// Classified incident candidate: a group of correlated anomalies from one
// logical request (or one correlation window) with a name and severity.

#ifndef SENTINEL_CORE_PATTERN_HPP
#define SENTINEL_CORE_PATTERN_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <utility>

#include "core/Anomaly.hpp"

namespace Sentinel
{
namespace core
{

/// Identifier used when several anomalies co-occur but no rule matches.
inline constexpr const char* kUnclassifiedPattern = "unclassified";

/**
 * @brief How completely the winning rule matched.
 *
 * High: every metric named by the rule was anomalous.
 * Medium: the rule matched through a min_matches lower than its metric count.
 * None: unclassified pattern, no rule involved.
 */
enum class MatchConfidence : std::uint8_t
{
    None = 0,
    Medium,
    High
};

inline const char* confidenceLabel(MatchConfidence confidence) noexcept
{
    switch (confidence)
    {
    case MatchConfidence::High:   return "high";
    case MatchConfidence::Medium: return "medium";
    case MatchConfidence::None:   return "none";
    }
    return "none";
}

/**
 * @brief Immutable record produced by the PatternCorrelator.
 *
 * Invariants (established by the correlator):
 *  - members() cover at least two distinct metrics
 *  - severity() is the most urgent severity among members()
 *  - windowStart() <= windowEnd(), spanning the member timestamps
 */
class Pattern
{
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Pattern(std::string patternId,
            std::string description,
            std::vector<Anomaly> members,
            std::vector<std::string> matchedMetrics,
            Severity severity,
            MatchConfidence confidence,
            TimePoint windowStart,
            TimePoint windowEnd)
        : m_patternId(std::move(patternId)),
          m_description(std::move(description)),
          m_members(std::move(members)),
          m_matchedMetrics(std::move(matchedMetrics)),
          m_severity(severity),
          m_confidence(confidence),
          m_windowStart(windowStart),
          m_windowEnd(windowEnd)
    {
    }

    Pattern(const Pattern&)            = default;
    Pattern(Pattern&&) noexcept        = default;
    Pattern& operator=(const Pattern&) = default;
    Pattern& operator=(Pattern&&) noexcept = default;

    ~Pattern() = default;

    /// Rule identifier, or kUnclassifiedPattern.
    const std::string& patternId() const noexcept { return m_patternId; }

    bool isUnclassified() const noexcept { return m_patternId == kUnclassifiedPattern; }

    /// Human-readable explanation taken from the rule table.
    const std::string& description() const noexcept { return m_description; }

    /// All anomalies that were correlated into this pattern.
    const std::vector<Anomaly>& members() const noexcept { return m_members; }

    /// Metric names of the rule that were present among the members (sorted).
    const std::vector<std::string>& matchedMetrics() const noexcept { return m_matchedMetrics; }

    Severity severity() const noexcept { return m_severity; }

    MatchConfidence confidence() const noexcept { return m_confidence; }

    const TimePoint& windowStart() const noexcept { return m_windowStart; }

    const TimePoint& windowEnd() const noexcept { return m_windowEnd; }

private:
    std::string              m_patternId;
    std::string              m_description;
    std::vector<Anomaly>     m_members;
    std::vector<std::string> m_matchedMetrics;
    Severity                 m_severity{Severity::Sev3};
    MatchConfidence          m_confidence{MatchConfidence::None};
    TimePoint                m_windowStart{};
    TimePoint                m_windowEnd{};
};

} // namespace core
} // namespace Sentinel

#endif // SENTINEL_CORE_PATTERN_HPP
