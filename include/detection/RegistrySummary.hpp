#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "analysis/SeriesStats.hpp"

namespace Sentinel
{
    namespace Detection
    {
        /// Read-only view of one metric's window.
        struct MetricStats
        {
            std::string metricName;
            double mean = 0.0;
            double stddev = 0.0;
            double ewmaBaseline = 0.0;
            std::size_t count = 0;         // observations since creation
            std::size_t windowSize = 0;    // values currently buffered
            bool isValid = false;
            double p50 = 0.0;
            double p95 = 0.0;
            double p99 = 0.0;
            Analysis::Trend trend = Analysis::Trend::Stable;
        };

        /// Health numbers for the status collaborator.
        struct RegistrySummary
        {
            std::size_t totalDatapoints = 0;
            std::size_t totalAnomalies = 0;
            std::size_t totalPatterns = 0;
            std::size_t metricsTracked = 0;
            std::size_t recentAnomalies = 0;
            std::vector<MetricStats> perMetric;   // sorted by metric name
        };

    } // namespace Detection
} // namespace Sentinel
