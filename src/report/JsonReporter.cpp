#include "report/JsonReporter.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
namespace Report
{
    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty),
          m_maxAnomalies(0),
          m_minSeverity(core::Severity::Sev3)
    {
    }

    void JsonReporter::generateReport(const core::DetectionReport &report)
    {
        m_report = report;

        m_anomalies.clear();
        m_anomalies.reserve(report.anomalies().size());
        for (const auto &a : report.anomalies())
        {
            if (!core::isMoreSevere(m_minSeverity, a.severity()))
                m_anomalies.push_back(a);
        }

        std::stable_sort(m_anomalies.begin(), m_anomalies.end(),
                         [](const core::Anomaly &a, const core::Anomaly &b)
                         {
                             if (a.severity() != b.severity())
                                 return core::isMoreSevere(a.severity(), b.severity());
                             return std::abs(a.zScore()) > std::abs(b.zScore());
                         });

        if (m_maxAnomalies > 0 && m_anomalies.size() > m_maxAnomalies)
            m_anomalies.erase(m_anomalies.begin() + static_cast<std::ptrdiff_t>(m_maxAnomalies), m_anomalies.end());

        Utils::getLogger().debug(
            "Json report prepared: " + std::to_string(m_anomalies.size()) + " anomalies, " +
            std::to_string(m_report.patterns().size()) + " patterns");
    }

    void JsonReporter::writeJson(std::ostream &output) const
    {
        if (m_prettyPrint == PrettyPrint::PRETTY)
            writePrettyJson(output);
        else
            writeCompactJson(output);
    }

    std::string JsonReporter::getJsonString() const
    {
        std::ostringstream oss;
        writeJson(oss);
        return oss.str();
    }

    std::string JsonReporter::anomalyToJson(const core::Anomaly &a) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"metric\":" << quoted(a.metricName()) << ",";
        oss << "\"value\":" << number(a.value()) << ",";
        oss << "\"zScore\":" << number(a.zScore()) << ",";
        oss << "\"deviationPercent\":" << number(a.deviationPercent()) << ",";
        oss << "\"direction\":\"" << core::directionLabel(a.direction()) << "\",";
        oss << "\"severity\":\"" << core::severityLabel(a.severity()) << "\",";
        oss << "\"baselineMean\":" << number(a.baselineMean()) << ",";
        oss << "\"baselineStd\":" << number(a.baselineStddev()) << ",";
        oss << "\"ewmaBaseline\":" << number(a.ewmaBaseline()) << ",";
        oss << "\"timestamp\":\"" << formatIsoTimestamp(a.timestamp()) << "\"";
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::patternToJson(const core::Pattern &p) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"patternId\":" << quoted(p.patternId()) << ",";
        oss << "\"description\":" << quoted(p.description()) << ",";
        oss << "\"severity\":\"" << core::severityLabel(p.severity()) << "\",";
        oss << "\"confidence\":\"" << core::confidenceLabel(p.confidence()) << "\",";
        oss << "\"windowStart\":\"" << formatIsoTimestamp(p.windowStart()) << "\",";
        oss << "\"windowEnd\":\"" << formatIsoTimestamp(p.windowEnd()) << "\",";

        oss << "\"matchedMetrics\":[";
        for (std::size_t i = 0; i < p.matchedMetrics().size(); ++i)
        {
            if (i) oss << ",";
            oss << quoted(p.matchedMetrics()[i]);
        }
        oss << "],";

        oss << "\"members\":[";
        for (std::size_t i = 0; i < p.members().size(); ++i)
        {
            if (i) oss << ",";
            oss << anomalyToJson(p.members()[i]);
        }
        oss << "]";

        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::metricToJson(const Detection::MetricStats &m) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"metric\":" << quoted(m.metricName) << ",";
        oss << "\"count\":" << m.count << ",";
        oss << "\"windowSize\":" << m.windowSize << ",";
        oss << "\"valid\":" << (m.isValid ? "true" : "false") << ",";
        oss << "\"mean\":" << number(m.mean) << ",";
        oss << "\"std\":" << number(m.stddev) << ",";
        oss << "\"ewma\":" << number(m.ewmaBaseline) << ",";
        oss << "\"p50\":" << number(m.p50) << ",";
        oss << "\"p95\":" << number(m.p95) << ",";
        oss << "\"p99\":" << number(m.p99) << ",";
        oss << "\"trend\":\"" << Analysis::trendLabel(m.trend) << "\"";
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::summaryToJson(const core::DetectionReport &report) const
    {
        const auto &s = report.summary();

        std::ostringstream oss;
        oss << "{";
        oss << "\"analysisStart\":\"" << formatIsoTimestamp(report.analysisStart()) << "\",";
        oss << "\"analysisEnd\":\"" << formatIsoTimestamp(report.analysisEnd()) << "\",";
        oss << "\"batchesProcessed\":" << report.batchesProcessed() << ",";
        oss << "\"malformedLines\":" << report.malformedLines() << ",";
        oss << "\"totalDatapoints\":" << s.totalDatapoints << ",";
        oss << "\"totalAnomalies\":" << s.totalAnomalies << ",";
        oss << "\"totalPatterns\":" << s.totalPatterns << ",";
        oss << "\"metricsTracked\":" << s.metricsTracked << ",";
        oss << "\"recentAnomalies\":" << s.recentAnomalies;
        oss << "}";
        return oss.str();
    }

    void JsonReporter::setPrettyPrint(PrettyPrint mode) noexcept
    {
        m_prettyPrint = mode;
    }

    void JsonReporter::setMaxAnomalies(std::size_t count) noexcept
    {
        m_maxAnomalies = count;
    }

    void JsonReporter::setMinSeverity(core::Severity severity) noexcept
    {
        m_minSeverity = severity;
    }

    // ---- Private helpers ----

    std::string JsonReporter::quoted(const std::string &str)
    {
        return "\"" + Utils::escapeJson(str) + "\"";
    }

    std::string JsonReporter::number(double value)
    {
        return Utils::formatDouble(value, 6);
    }

    std::string JsonReporter::formatIsoTimestamp(Utils::TimePoint tp)
    {
        return Utils::toIso8601(tp);
    }

    void JsonReporter::writeCompactJson(std::ostream &output) const
    {
        output << "{";
        output << "\"generated\":\"" << formatIsoTimestamp(Utils::now()) << "\",";

        output << "\"processedFile\":";
        if (m_report.processedFile().has_value())
            output << quoted(*m_report.processedFile());
        else
            output << "null";
        output << ",";

        output << "\"summary\":" << summaryToJson(m_report) << ",";

        const auto &metrics = m_report.summary().perMetric;
        output << "\"metrics\":[";
        for (std::size_t i = 0; i < metrics.size(); ++i)
        {
            if (i) output << ",";
            output << metricToJson(metrics[i]);
        }
        output << "],";

        output << "\"anomalyCount\":" << m_anomalies.size() << ",";
        output << "\"anomalies\":[";
        for (std::size_t i = 0; i < m_anomalies.size(); ++i)
        {
            if (i) output << ",";
            output << anomalyToJson(m_anomalies[i]);
        }
        output << "],";

        const auto &patterns = m_report.patterns();
        output << "\"patternCount\":" << patterns.size() << ",";
        output << "\"patterns\":[";
        for (std::size_t i = 0; i < patterns.size(); ++i)
        {
            if (i) output << ",";
            output << patternToJson(patterns[i]);
        }
        output << "]";

        output << "}";
    }

    void JsonReporter::writePrettyJson(std::ostream &output) const
    {
        output << "{\n";
        output << "  \"generated\": \"" << formatIsoTimestamp(Utils::now()) << "\",\n";

        output << "  \"processedFile\": ";
        if (m_report.processedFile().has_value())
            output << quoted(*m_report.processedFile());
        else
            output << "null";
        output << ",\n";

        output << "  \"summary\": " << summaryToJson(m_report) << ",\n";

        const auto &metrics = m_report.summary().perMetric;
        output << "  \"metrics\": [\n";
        for (std::size_t i = 0; i < metrics.size(); ++i)
        {
            output << "    " << metricToJson(metrics[i]);
            output << (i + 1 < metrics.size() ? "," : "") << "\n";
        }
        output << "  ],\n";

        output << "  \"anomalyCount\": " << m_anomalies.size() << ",\n";
        output << "  \"anomalies\": [\n";
        for (std::size_t i = 0; i < m_anomalies.size(); ++i)
        {
            output << "    " << anomalyToJson(m_anomalies[i]);
            output << (i + 1 < m_anomalies.size() ? "," : "") << "\n";
        }
        output << "  ],\n";

        const auto &patterns = m_report.patterns();
        output << "  \"patternCount\": " << patterns.size() << ",\n";
        output << "  \"patterns\": [\n";
        for (std::size_t i = 0; i < patterns.size(); ++i)
        {
            output << "    " << patternToJson(patterns[i]);
            output << (i + 1 < patterns.size() ? "," : "") << "\n";
        }
        output << "  ]\n";
        output << "}\n";
    }

} // namespace Report
} // namespace Sentinel
