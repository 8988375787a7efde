#include "report/ConsoleReporter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <map>
#include <sstream>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace Sentinel
{
namespace Report
{
    namespace
    {
        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        double severityToNormalized(core::Severity severity) noexcept
        {
            switch (severity)
            {
            case core::Severity::Sev1: return 1.0;
            case core::Severity::Sev2: return 0.66;
            case core::Severity::Sev3: return 0.33;
            }
            return 0.0;
        }

        std::string signedFixed(double value, int precision)
        {
            return (value >= 0.0 ? "+" : "") + Utils::formatDouble(value, precision);
        }

        std::string joinNames(const std::vector<std::string> &names)
        {
            std::string out;
            for (const auto &n : names)
            {
                if (!out.empty())
                    out += ", ";
                out += n;
            }
            return out;
        }

        // Pattern id -> occurrences, most frequent first.
        std::vector<std::pair<std::string, std::size_t>>
        tallyPatterns(const std::vector<core::Pattern> &patterns)
        {
            std::map<std::string, std::size_t> counts;
            for (const auto &p : patterns)
                ++counts[p.patternId()];

            std::vector<std::pair<std::string, std::size_t>> top(counts.begin(), counts.end());
            std::stable_sort(top.begin(), top.end(),
                             [](const auto &a, const auto &b) { return a.second > b.second; });
            return top;
        }
    } // namespace

    ConsoleReporter::ConsoleReporter(Verbosity verbosity, std::ostream &output)
        : m_verbosity(verbosity),
          m_colorsEnabled(false),
          m_maxAnomalies(25),
          m_output(&output)
    {
        m_colorsEnabled = (m_output == &std::cout) && stdoutIsTty();
    }

    void ConsoleReporter::generateReport(const core::DetectionReport &report)
    {
        if (m_verbosity == Verbosity::QUIET)
        {
            printSummary(report);
            return;
        }

        const auto &summary = report.summary();
        std::ostream &os = *m_output;

        os << "\n=== LLM SENTINEL REPORT ===\n";
        os << "Generated:      " << Utils::formatTimestamp(Utils::now()) << "\n";
        if (report.processedFile().has_value())
            os << "File:           " << *report.processedFile() << "\n";
        if (report.batchesProcessed() > 0)
        {
            os << "Stream Start:   " << Utils::formatTimestamp(report.analysisStart()) << "\n";
            os << "Stream End:     " << Utils::formatTimestamp(report.analysisEnd()) << "\n";
        }
        os << "Batches:        " << report.batchesProcessed() << "\n";
        os << "Malformed:      " << report.malformedLines() << "\n";
        os << "Datapoints:     " << summary.totalDatapoints << "\n";
        os << "Metrics:        " << summary.metricsTracked << "\n";
        os << "Anomalies:      " << report.anomalies().size()
           << " (SEV-1: " << report.anomalyCount(core::Severity::Sev1)
           << ", SEV-2: " << report.anomalyCount(core::Severity::Sev2)
           << ", SEV-3: " << report.anomalyCount(core::Severity::Sev3) << ")\n";
        os << "Patterns:       " << report.patterns().size() << "\n\n";

        const auto tally = tallyPatterns(report.patterns());
        if (!tally.empty())
        {
            const int colId = 32;
            const int colCount = 10;
            os << std::left << std::setw(colId) << "Pattern"
               << std::right << std::setw(colCount) << "Count" << "\n";
            os << std::string(colId + colCount, '-') << "\n";
            for (const auto &[id, count] : tally)
            {
                os << std::left << std::setw(colId) << id
                   << std::right << std::setw(colCount) << count << "\n";
            }
            os << "\n";
        }

        if (!summary.perMetric.empty())
        {
            printMetricTable(summary.perMetric);
            os << "\n";
        }

        const auto &anomalies = report.anomalies();
        if (anomalies.empty())
        {
            os << "No anomalies detected.\n";
        }
        else if (m_verbosity >= Verbosity::VERBOSE)
        {
            std::size_t limit = anomalies.size();
            if (m_maxAnomalies > 0)
                limit = std::min(limit, m_maxAnomalies);

            os << "Anomalies (showing " << limit << " of " << anomalies.size() << ")\n";
            os << std::string(70, '-') << "\n";
            for (std::size_t i = 0; i < limit; ++i)
                formatAnomalyDetails(os, anomalies[i]);

            if (limit < anomalies.size())
                os << "... and " << (anomalies.size() - limit) << " more\n";
        }

        os << "=== END REPORT ===\n\n";
        flush();
    }

    void ConsoleReporter::reportAnomaly(const core::Anomaly &anomaly)
    {
        if (m_verbosity == Verbosity::QUIET)
            return;

        formatAnomalyDetails(*m_output, anomaly);
        flush();
    }

    void ConsoleReporter::reportPattern(const core::Pattern &pattern)
    {
        if (m_verbosity == Verbosity::QUIET)
            return;

        formatPatternDetails(*m_output, pattern);
        flush();
    }

    void ConsoleReporter::printSummary(const core::DetectionReport &report)
    {
        *m_output << "SUMMARY: "
                  << report.batchesProcessed() << " batches, "
                  << report.summary().totalDatapoints << " datapoints, "
                  << report.anomalies().size() << " anomalies, "
                  << report.patterns().size() << " patterns\n";
        flush();
    }

    void ConsoleReporter::printMetricTable(const std::vector<Detection::MetricStats> &metrics,
                                           std::size_t limit)
    {
        const std::size_t n = (limit == 0) ? metrics.size() : std::min(limit, metrics.size());

        const int colName = 34;
        const int colNum = 12;
        std::ostream &os = *m_output;

        os << std::left << std::setw(colName) << "Metric"
           << std::right << std::setw(colNum) << "Count"
           << std::setw(colNum) << "Mean"
           << std::setw(colNum) << "Std"
           << std::setw(colNum) << "P95"
           << std::setw(colNum) << "Trend" << "\n";
        os << std::string(colName + 5 * colNum, '-') << "\n";

        for (std::size_t i = 0; i < n; ++i)
        {
            const auto &m = metrics[i];
            os << std::left << std::setw(colName) << m.metricName
               << std::right << std::setw(colNum) << m.count
               << std::setw(colNum) << Utils::formatDouble(m.mean, 4)
               << std::setw(colNum) << Utils::formatDouble(m.stddev, 4)
               << std::setw(colNum) << Utils::formatDouble(m.p95, 4)
               << std::setw(colNum) << Analysis::trendLabel(m.trend) << "\n";
        }
    }

    void ConsoleReporter::flush()
    {
        m_output->flush();
    }

    void ConsoleReporter::setVerbosity(Verbosity level) noexcept
    {
        m_verbosity = level;
    }

    void ConsoleReporter::setEnableColors(bool enable) noexcept
    {
        m_colorsEnabled = enable;
    }

    void ConsoleReporter::setMaxAnomalies(std::size_t count) noexcept
    {
        m_maxAnomalies = count;
    }

    // ---- Private helpers ----

    const char *ConsoleReporter::getSeverityColor(core::Severity severity)
    {
        switch (severity)
        {
        case core::Severity::Sev1: return "\033[91m"; // bright red
        case core::Severity::Sev2: return "\033[93m"; // yellow
        case core::Severity::Sev3: return "\033[33m"; // dark yellow
        }
        return "\033[97m";
    }

    void ConsoleReporter::printSeverityBar(std::ostream &os, core::Severity severity, int width)
    {
        if (width <= 0)
            return;

        const double norm = severityToNormalized(severity);
        const int full  = std::clamp(static_cast<int>(norm * width + 0.5), 0, width);
        const int empty = width - full;

        os << std::string(full, '=') << std::string(empty, '.');
    }

    std::string ConsoleReporter::severityTag(core::Severity severity) const
    {
        std::string tag = "[";
        tag += core::severityLabel(severity);
        tag += "]";
        if (!m_colorsEnabled)
            return tag;
        return std::string(getSeverityColor(severity)) + tag + "\033[0m";
    }

    void ConsoleReporter::formatAnomalyDetails(std::ostream &os, const core::Anomaly &anomaly) const
    {
        os << severityTag(anomaly.severity()) << " "
           << anomaly.metricName() << " = " << Utils::formatDouble(anomaly.value(), 4)
           << " (" << core::directionLabel(anomaly.direction())
           << ", z=" << signedFixed(anomaly.zScore(), 2)
           << ", " << signedFixed(anomaly.deviationPercent(), 1) << "%)"
           << " at " << Utils::formatTimestamp(anomaly.timestamp(), "%H:%M:%S") << "\n";

        if (m_verbosity >= Verbosity::VERBOSE)
        {
            os << "  ";
            printSeverityBar(os, anomaly.severity());
            os << "  baseline mean=" << Utils::formatDouble(anomaly.baselineMean(), 4)
               << " std=" << Utils::formatDouble(anomaly.baselineStddev(), 4)
               << " ewma=" << Utils::formatDouble(anomaly.ewmaBaseline(), 4) << "\n";
        }
    }

    void ConsoleReporter::formatPatternDetails(std::ostream &os, const core::Pattern &pattern) const
    {
        os << severityTag(pattern.severity()) << " PATTERN " << pattern.patternId();
        if (!pattern.isUnclassified())
            os << " (" << core::confidenceLabel(pattern.confidence()) << " confidence)";
        if (!pattern.description().empty())
            os << ": " << pattern.description();
        os << "\n";

        if (!pattern.matchedMetrics().empty())
            os << "  metrics: " << joinNames(pattern.matchedMetrics()) << "\n";

        if (m_verbosity >= Verbosity::VERBOSE)
        {
            os << "  window: " << Utils::formatTimestamp(pattern.windowStart())
               << " -> " << Utils::formatTimestamp(pattern.windowEnd()) << "\n";
            for (const auto &member : pattern.members())
            {
                os << "    - " << member.metricName()
                   << " z=" << signedFixed(member.zScore(), 2)
                   << " " << core::severityLabel(member.severity()) << "\n";
            }
        }
    }

} // namespace Report
} // namespace Sentinel
