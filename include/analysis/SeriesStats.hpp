#pragma once

#include <cstddef>
#include <vector>

namespace Sentinel
{
    namespace Analysis
    {
        /**
         * Stateless statistics over a value series.
         *
         * Used by the registry summary (percentiles, trend), the baseline
         * generator (mean/std of generated values) and the tests' batch
         * recomputation. All functions are
         * thread-safe and take the series oldest-first.
         */

        enum class Trend
        {
            Stable = 0,
            Increasing,
            Decreasing,
        };

        /// "stable", "increasing" or "decreasing".
        const char *trendLabel(Trend trend) noexcept;

        struct MeanStd
        {
            double mean = 0.0;
            double stddev = 0.0;
        };

        /// Population mean and standard deviation; {0, 0} for an empty series.
        MeanStd meanAndStddev(const std::vector<double> &values);

        /**
         * Percentile with linear interpolation between closest ranks.
         * p is clamped to [0, 100]; 0 for an empty series.
         */
        double percentile(std::vector<double> values, double p);

        /**
         * Compare the means of the two halves of the last `window` values.
         * More than +10% is Increasing, less than -10% is Decreasing.
         * Stable with fewer than `window` values or a zero first-half mean.
         */
        Trend detectTrend(const std::vector<double> &values, std::size_t window = 20);

    } // namespace Analysis
} // namespace Sentinel
