#include "analysis/SeriesStats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace Sentinel
{
    namespace Analysis
    {
        namespace
        {
            double meanOf(std::vector<double>::const_iterator first,
                          std::vector<double>::const_iterator last)
            {
                const auto n = std::distance(first, last);
                if (n <= 0)
                    return 0.0;
                return std::accumulate(first, last, 0.0) / static_cast<double>(n);
            }
        } // anonymous namespace

        const char *trendLabel(Trend trend) noexcept
        {
            switch (trend)
            {
            case Trend::Increasing: return "increasing";
            case Trend::Decreasing: return "decreasing";
            case Trend::Stable:     return "stable";
            }
            return "stable";
        }

        MeanStd meanAndStddev(const std::vector<double> &values)
        {
            MeanStd out;
            if (values.empty())
                return out;

            out.mean = meanOf(values.begin(), values.end());

            double sq = 0.0;
            for (double v : values)
                sq += (v - out.mean) * (v - out.mean);

            out.stddev = std::sqrt(sq / static_cast<double>(values.size()));
            return out;
        }

        double percentile(std::vector<double> values, double p)
        {
            if (values.empty())
                return 0.0;

            p = std::clamp(p, 0.0, 100.0);
            std::sort(values.begin(), values.end());

            const double rank = p / 100.0 * static_cast<double>(values.size() - 1);
            const auto lo = static_cast<std::size_t>(std::floor(rank));
            const auto hi = std::min(lo + 1, values.size() - 1);
            const double frac = rank - static_cast<double>(lo);

            return values[lo] + (values[hi] - values[lo]) * frac;
        }

        Trend detectTrend(const std::vector<double> &values, std::size_t window)
        {
            if (window < 2 || values.size() < window)
                return Trend::Stable;

            const auto begin = values.end() - static_cast<std::ptrdiff_t>(window);
            const auto mid = begin + static_cast<std::ptrdiff_t>(window / 2);

            const double firstHalf = meanOf(begin, mid);
            const double secondHalf = meanOf(mid, values.end());
            if (firstHalf == 0.0)
                return Trend::Stable;

            const double changePct = (secondHalf - firstHalf) / std::abs(firstHalf) * 100.0;
            if (changePct > 10.0)
                return Trend::Increasing;
            if (changePct < -10.0)
                return Trend::Decreasing;
            return Trend::Stable;
        }

    } // namespace Analysis
} // namespace Sentinel
