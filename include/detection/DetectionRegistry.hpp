#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/Anomaly.hpp"
#include "core/BaselineSnapshot.hpp"
#include "core/Pattern.hpp"
#include "detection/AnomalyEvaluator.hpp"
#include "detection/DetectorConfig.hpp"
#include "detection/MetricWindow.hpp"
#include "detection/PatternCorrelator.hpp"
#include "detection/RegistrySummary.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Detection
    {
        /// Outcome of a single observe() call.
        struct ObservationResult
        {
            std::optional<core::Anomaly> anomaly;
            std::optional<core::Pattern> pattern;
        };

        /// Outcome of observeBatch(): every anomaly of the batch plus at most one pattern.
        struct BatchResult
        {
            std::vector<core::Anomaly> anomalies;
            std::optional<core::Pattern> pattern;
        };

        /**
         * DetectionRegistry
         *
         * Responsibilities:
         *  - Own one MetricWindow per metric name (created lazily).
         *  - observe / observeBatch: update the window, evaluate, correlate.
         *  - Keep a bounded FIFO of recent anomalies.
         *  - Expose per-metric statistics, a summary and baseline snapshots.
         *
         * Thread-safety:
         *  - The name -> window map is guarded by a reader/writer lock.
         *  - Each window has its own mutex, so updates to one metric are
         *    serialized while different metrics proceed in parallel.
         *  - The recent-anomaly buffer has a separate mutex.
         *  - Counters are atomics.
         *
         * Invalid input (empty metric name, non-finite value) throws
         * std::invalid_argument before any state is touched.
         */
        class DetectionRegistry
        {
        public:
            using MetricValues = std::vector<std::pair<std::string, double>>;

            /// Throws std::invalid_argument if config.validate() reports a problem.
            explicit DetectionRegistry(DetectorConfig config = DetectorConfig{});

            DetectionRegistry(const DetectionRegistry &)            = delete;
            DetectionRegistry &operator=(const DetectionRegistry &) = delete;
            DetectionRegistry(DetectionRegistry &&)                 = delete;
            DetectionRegistry &operator=(DetectionRegistry &&)      = delete;

            /**
             * Observe one value. A resulting anomaly is correlated with the
             * recent anomalies inside the configured correlation window.
             */
            ObservationResult observe(const std::string &metricName,
                                      double value,
                                      Utils::TimePoint timestamp);

            /**
             * Observe every metric of one logical request. All anomalies carry
             * the batch timestamp; correlation runs once over exactly the
             * batch's anomalies, after every metric was observed.
             */
            BatchResult observeBatch(const MetricValues &metrics, Utils::TimePoint timestamp);

            /// Statistics for one metric, std::nullopt if it was never observed.
            std::optional<MetricStats> getStats(const std::string &metricName) const;

            RegistrySummary summary() const;

            /// Most recent anomalies, oldest first. limit == 0 returns the whole buffer.
            std::vector<core::Anomaly> recentAnomalies(std::size_t limit = 0) const;

            /// History and statistics of every window.
            core::BaselineSnapshot snapshot() const;

            /**
             * Feed historical values into a metric's window without evaluating
             * them. Only the last `capacity` values are kept. They do not count
             * as observed datapoints.
             */
            void seedHistory(const std::string &metricName, const std::vector<double> &values);

            /// Drop every window, the recent buffer and the counters.
            void reset();

            const DetectorConfig &config() const noexcept { return m_config; }

        private:
            struct MetricEntry
            {
                explicit MetricEntry(const DetectorConfig &config)
                    : window(config.windowCapacity, config.minPoints, config.ewmaAlpha)
                {
                }

                mutable std::mutex mutex;
                MetricWindow window;
            };

            using EntryPtr = std::shared_ptr<MetricEntry>;

            static void validateObservation(const std::string &metricName, double value);

            /// Find or create the entry for metricName.
            EntryPtr entryFor(const std::string &metricName);

            EntryPtr findEntry(const std::string &metricName) const;

            /// Update the window and evaluate; no correlation, no buffer.
            std::optional<core::Anomaly> updateAndEvaluate(const std::string &metricName,
                                                           double value,
                                                           Utils::TimePoint timestamp);

            /// Append to the recent buffer; returns the buffer content before the append.
            std::vector<core::Anomaly> pushRecent(const core::Anomaly &anomaly);

            void logAnomaly(const core::Anomaly &anomaly) const;
            void logPattern(const core::Pattern &pattern) const;

            static MetricStats statsOf(const std::string &metricName, const MetricWindow &window);

        private:
            DetectorConfig m_config;
            AnomalyEvaluator m_evaluator;
            PatternCorrelator m_correlator;

            mutable std::shared_mutex m_windowsMutex;
            std::unordered_map<std::string, EntryPtr> m_windows;

            mutable std::mutex m_recentMutex;
            std::deque<core::Anomaly> m_recent;

            std::atomic<std::size_t> m_totalDatapoints{0};
            std::atomic<std::size_t> m_totalAnomalies{0};
            std::atomic<std::size_t> m_totalPatterns{0};
        };

    } // namespace Detection
} // namespace Sentinel
