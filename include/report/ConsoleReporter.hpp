#pragma once

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "core/Anomaly.hpp"
#include "core/DetectionReport.hpp"
#include "core/Pattern.hpp"
#include "detection/RegistrySummary.hpp"

namespace Sentinel
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Stream anomalies and patterns as they are raised.
         *  - Print the end-of-run report: counters, pattern tally and a
         *    per-metric statistics table.
         *  - Colour severities when writing to a terminal.
         *
         * Verbosity:
         *  - QUIET: final summary line only, nothing streamed
         *  - NORMAL: streamed records and the full report
         *  - VERBOSE: adds baseline details, members and the anomaly list
         */
        class ConsoleReporter
        {
        public:
            enum class Verbosity
            {
                QUIET,
                NORMAL,
                VERBOSE
            };

            /// Colours are enabled when output is std::cout and stdout is a TTY.
            explicit ConsoleReporter(Verbosity verbosity = Verbosity::NORMAL,
                                     std::ostream &output = std::cout);

            ConsoleReporter(const ConsoleReporter &)            = default;
            ConsoleReporter &operator=(const ConsoleReporter &) = default;

            /// Complete end-of-run report.
            void generateReport(const core::DetectionReport &report);

            /// Stream one anomaly.
            void reportAnomaly(const core::Anomaly &anomaly);

            /// Stream one pattern.
            void reportPattern(const core::Pattern &pattern);

            /// One-line summary.
            void printSummary(const core::DetectionReport &report);

            /// Per-metric statistics table; limit == 0 prints every metric.
            void printMetricTable(const std::vector<Detection::MetricStats> &metrics,
                                  std::size_t limit = 0);

            void flush();

            void setVerbosity(Verbosity level) noexcept;
            void setEnableColors(bool enable) noexcept;
            void setMaxAnomalies(std::size_t count) noexcept;

        private:
            /// ANSI colour for a severity.
            static const char *getSeverityColor(core::Severity severity);
            static void printSeverityBar(std::ostream &os, core::Severity severity, int width = 20);

            void formatAnomalyDetails(std::ostream &os, const core::Anomaly &anomaly) const;
            void formatPatternDetails(std::ostream &os, const core::Pattern &pattern) const;

            /// "[SEV-1]" with colour codes when enabled.
            std::string severityTag(core::Severity severity) const;

        private:
            Verbosity m_verbosity;
            bool m_colorsEnabled;
            std::size_t m_maxAnomalies;
            std::ostream *m_output;
        };

    } // namespace Report
} // namespace Sentinel
