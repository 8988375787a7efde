#include "detection/MetricWindow.hpp"

#include <algorithm>
#include <cmath>

namespace Sentinel
{
    namespace Detection
    {
        MetricWindow::MetricWindow(std::size_t capacity, std::size_t minPoints, double alpha)
            : m_capacity(std::max<std::size_t>(1, capacity)),
              m_minPoints(minPoints),
              m_alpha(alpha)
        {
        }

        MetricWindow::Snapshot MetricWindow::update(double value)
        {
            // EWMA over the full stream; seeded with the first observation.
            if (m_count == 0)
                m_ewma = value;
            else
                m_ewma = m_alpha * value + (1.0 - m_alpha) * m_ewma;

            ++m_count;
            m_values.push_back(value);

            if (m_values.size() > m_capacity)
            {
                m_values.pop_front();
                recompute();
            }
            else
            {
                // Welford's online update over the (not yet full) buffer
                const double n = static_cast<double>(m_values.size());
                const double delta = value - m_mean;
                m_mean += delta / n;
                const double delta2 = value - m_mean;
                m_m2 += delta * delta2;
            }

            return snapshot();
        }

        MetricWindow::Snapshot MetricWindow::snapshot() const noexcept
        {
            Snapshot s;
            s.mean = m_mean;
            s.stddev = stddev();
            s.ewmaBaseline = m_ewma;
            s.count = m_count;
            s.isValid = isValid();
            return s;
        }

        double MetricWindow::variance() const noexcept
        {
            if (m_values.size() < 2)
                return 0.0;

            // Population variance; guard tiny negative rounding
            return std::max(0.0, m_m2 / static_cast<double>(m_values.size()));
        }

        double MetricWindow::stddev() const noexcept
        {
            const double var = variance();
            return var > 0.0 ? std::sqrt(var) : 0.0;
        }

        void MetricWindow::recompute() noexcept
        {
            if (m_values.empty())
            {
                m_mean = 0.0;
                m_m2 = 0.0;
                return;
            }

            const auto [minIt, maxIt] = std::minmax_element(m_values.begin(), m_values.end());
            if (*minIt == *maxIt)
            {
                m_mean = *minIt;
                m_m2 = 0.0;
                return;
            }

            double mean = 0.0;
            double m2 = 0.0;
            std::size_t n = 0;
            for (double v : m_values)
            {
                ++n;
                const double delta = v - mean;
                mean += delta / static_cast<double>(n);
                m2 += delta * (v - mean);
            }

            m_mean = mean;
            m_m2 = m2;
        }

    } // namespace Detection
} // namespace Sentinel
