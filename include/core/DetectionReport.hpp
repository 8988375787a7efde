// File: include/core/DetectionReport.hpp
//
// Outcome of replaying a metric stream through the detection engine.
// Produced by the CLI driver and consumed by the console and JSON reporters.

#ifndef SENTINEL_CORE_DETECTION_REPORT_HPP
#define SENTINEL_CORE_DETECTION_REPORT_HPP

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

#include "core/Anomaly.hpp"
#include "core/Pattern.hpp"
#include "detection/RegistrySummary.hpp"

namespace Sentinel
{
namespace core
{

/**
 * @brief Aggregated result of one replay run.
 *
 * Responsibilities:
 *  - Hold run metadata (stream time range, input file, line counters).
 *  - Collect every anomaly and pattern raised during the run.
 *  - Carry the registry summary taken at the end of the run.
 *
 * Design notes:
 *  - Value type, built incrementally by the driver, then read-only.
 *  - Independent of any output format.
 */
class DetectionReport
{
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    DetectionReport() = default;

    DetectionReport(const DetectionReport&)            = default;
    DetectionReport(DetectionReport&&) noexcept        = default;
    DetectionReport& operator=(const DetectionReport&) = default;
    DetectionReport& operator=(DetectionReport&&) noexcept = default;

    ~DetectionReport() = default;

    // ---------- Metadata ----------

    /// Timestamp of the first batch in the stream.
    const TimePoint& analysisStart() const noexcept { return m_analysisStart; }

    /// Timestamp of the last batch in the stream.
    const TimePoint& analysisEnd() const noexcept { return m_analysisEnd; }

    const std::optional<std::string>& processedFile() const noexcept { return m_processedFile; }

    std::uint64_t batchesProcessed() const noexcept { return m_batchesProcessed; }

    std::uint64_t malformedLines() const noexcept { return m_malformedLines; }

    void setProcessedFile(std::optional<std::string> file) { m_processedFile = std::move(file); }

    void setSummary(Detection::RegistrySummary summary) { m_summary = std::move(summary); }

    /**
     * @brief Count one processed batch and widen the time range to include it.
     */
    void recordBatch(TimePoint timestamp) noexcept
    {
        if (m_batchesProcessed == 0 || timestamp < m_analysisStart)
            m_analysisStart = timestamp;
        if (m_batchesProcessed == 0 || timestamp > m_analysisEnd)
            m_analysisEnd = timestamp;
        ++m_batchesProcessed;
    }

    void recordMalformedLine() noexcept { ++m_malformedLines; }

    // ---------- Results ----------

    const std::vector<Anomaly>& anomalies() const noexcept { return m_anomalies; }

    const std::vector<Pattern>& patterns() const noexcept { return m_patterns; }

    void addAnomaly(const Anomaly& anomaly) { m_anomalies.push_back(anomaly); }

    void addPattern(const Pattern& pattern) { m_patterns.push_back(pattern); }

    /// Registry summary at the end of the run.
    const Detection::RegistrySummary& summary() const noexcept { return m_summary; }

    /// Number of anomalies with the given severity.
    std::size_t anomalyCount(Severity severity) const noexcept
    {
        std::size_t n = 0;
        for (const auto& a : m_anomalies)
        {
            if (a.severity() == severity)
                ++n;
        }
        return n;
    }

private:
    TimePoint                   m_analysisStart{};
    TimePoint                   m_analysisEnd{};
    std::optional<std::string>  m_processedFile;
    std::uint64_t               m_batchesProcessed{0};
    std::uint64_t               m_malformedLines{0};

    std::vector<Anomaly>        m_anomalies;
    std::vector<Pattern>        m_patterns;

    Detection::RegistrySummary  m_summary;
};

} // namespace core
} // namespace Sentinel

#endif // SENTINEL_CORE_DETECTION_REPORT_HPP
