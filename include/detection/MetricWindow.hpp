#pragma once

#include <cstddef>
#include <deque>

namespace Sentinel
{
    namespace Detection
    {
        /**
         * MetricWindow
         *
         * Rolling statistics for one metric:
         *  - Fixed-capacity FIFO of the most recent raw values.
         *  - Mean / population variance of exactly the buffered values,
         *    maintained with Welford's online algorithm.
         *  - EWMA baseline over every value ever observed (independent of the buffer).
         *
         * Eviction: once the buffer is full, each update drops the oldest value
         * and mean/M2 are recomputed from the buffer. The buffer is small and
         * fixed, and a full pass avoids the drift of incremental removal.
         *
         * Not thread-safe; the DetectionRegistry serializes access per metric.
         * Precondition for update(): value is finite (checked by the registry).
         */
        class MetricWindow
        {
        public:
            struct Snapshot
            {
                double mean = 0.0;
                double stddev = 0.0;
                double ewmaBaseline = 0.0;
                std::size_t count = 0;     // total observations, not buffer size
                bool isValid = false;      // count >= minPoints
            };

            /// Defaults: 100 values, 10 points before judging, alpha 0.1.
            explicit MetricWindow(std::size_t capacity = 100,
                                  std::size_t minPoints = 10,
                                  double alpha = 0.1);

            /// Append a value and return the statistics including it.
            Snapshot update(double value);

            /// Current statistics without mutation.
            Snapshot snapshot() const noexcept;

            std::size_t capacity() const noexcept { return m_capacity; }
            std::size_t minPoints() const noexcept { return m_minPoints; }
            double alpha() const noexcept { return m_alpha; }

            /// Total number of update() calls since construction.
            std::size_t count() const noexcept { return m_count; }

            /// Number of buffered values: min(capacity, count).
            std::size_t size() const noexcept { return m_values.size(); }

            double mean() const noexcept { return m_mean; }
            double variance() const noexcept;
            double stddev() const noexcept;
            double ewmaBaseline() const noexcept { return m_ewma; }
            bool isValid() const noexcept { return m_count >= m_minPoints; }

            /// Buffered values, oldest first.
            const std::deque<double>& values() const noexcept { return m_values; }

        private:
            /// Full pass over m_values; exact zero M2 for constant buffers.
            void recompute() noexcept;

        private:
            std::size_t m_capacity;
            std::size_t m_minPoints;
            double m_alpha;

            std::deque<double> m_values;
            std::size_t m_count = 0;
            double m_mean = 0.0;
            double m_m2 = 0.0;        // sum of squared differences from the mean
            double m_ewma = 0.0;
        };

    } // namespace Detection
} // namespace Sentinel
