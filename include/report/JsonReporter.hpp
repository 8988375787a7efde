#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "core/Anomaly.hpp"
#include "core/DetectionReport.hpp"
#include "core/Pattern.hpp"
#include "detection/RegistrySummary.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Structured JSON of a DetectionReport for dashboards and tooling:
         *    summary, per-metric statistics, anomalies and patterns.
         *  - RFC 8259 string escaping.
         *
         * Design notes:
         *  - Written by hand, no JSON library on this path.
         *  - Severity is written as its label ("SEV-1"), timestamps as ISO-8601.
         *  - Anomalies are ordered most severe first, then by |z| descending.
         *  - Compact (single line) and pretty (one record per line) modes.
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,
                PRETTY
            };

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            JsonReporter(const JsonReporter &)            = default;
            JsonReporter &operator=(const JsonReporter &) = default;

            /// Take a copy of the report and prepare the filtered anomaly view.
            void generateReport(const core::DetectionReport &report);

            void writeJson(std::ostream &output) const;

            std::string getJsonString() const;

            std::string anomalyToJson(const core::Anomaly &anomaly) const;

            std::string patternToJson(const core::Pattern &pattern) const;

            std::string metricToJson(const Detection::MetricStats &stats) const;

            std::string summaryToJson(const core::DetectionReport &report) const;

            void setPrettyPrint(PrettyPrint mode) noexcept;

            /// Cap on written anomalies; 0 writes all of them.
            void setMaxAnomalies(std::size_t count) noexcept;

            /// Only write anomalies at least as severe as this.
            void setMinSeverity(core::Severity severity) noexcept;

        private:
            void writeCompactJson(std::ostream &output) const;
            void writePrettyJson(std::ostream &output) const;

            static std::string quoted(const std::string &str);
            static std::string number(double value);
            static std::string formatIsoTimestamp(Utils::TimePoint tp);

        private:
            core::DetectionReport m_report;
            std::vector<core::Anomaly> m_anomalies;   // filtered/sorted view
            PrettyPrint m_prettyPrint;
            std::size_t m_maxAnomalies;
            core::Severity m_minSeverity;
        };

    } // namespace Report
} // namespace Sentinel
