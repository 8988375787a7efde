#include "detection/DetectionRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Sentinel
{
    namespace Detection
    {
        using core::Anomaly;
        using core::Pattern;
        using namespace Utils;

        namespace
        {
            DetectorConfig validated(DetectorConfig config)
            {
                if (const auto problem = config.validate())
                    throw std::invalid_argument("Invalid detector configuration: " + *problem);
                return config;
            }

            std::string signedPercent(double pct)
            {
                return (pct >= 0.0 ? "+" : "") + formatDouble(pct, 1) + "%";
            }
        } // anonymous namespace

        DetectionRegistry::DetectionRegistry(DetectorConfig config)
            : m_config(validated(std::move(config))),
              m_evaluator(m_config.zScoreThreshold, m_config.severity),
              m_correlator(m_config.patternRules)
        {
            std::ostringstream oss;
            oss << "DetectionRegistry initialized (window=" << m_config.windowCapacity
                << ", min_points=" << m_config.minPoints
                << ", z-threshold=" << formatDouble(m_config.zScoreThreshold, 2)
                << ", alpha=" << formatDouble(m_config.ewmaAlpha, 2)
                << ", rules=" << m_config.patternRules.size() << ")";
            getLogger().info(oss.str());
        }

        ObservationResult DetectionRegistry::observe(const std::string &metricName,
                                                     double value,
                                                     TimePoint timestamp)
        {
            validateObservation(metricName, value);

            // Keeps totalAnomalies <= totalDatapoints for concurrent summary()
            m_totalDatapoints.fetch_add(1, std::memory_order_relaxed);

            ObservationResult result;
            result.anomaly = updateAndEvaluate(metricName, value, timestamp);

            if (!result.anomaly)
                return result;

            const auto recent = pushRecent(*result.anomaly);
            result.pattern = m_correlator.correlate(*result.anomaly,
                                                    recent,
                                                    m_config.correlationWindow);
            if (result.pattern)
            {
                m_totalPatterns.fetch_add(1, std::memory_order_relaxed);
                logPattern(*result.pattern);
            }

            return result;
        }

        BatchResult DetectionRegistry::observeBatch(const MetricValues &metrics, TimePoint timestamp)
        {
            // Validate everything first so a bad batch leaves no trace.
            for (const auto &[name, value] : metrics)
                validateObservation(name, value);

            BatchResult result;
            for (const auto &[name, value] : metrics)
            {
                m_totalDatapoints.fetch_add(1, std::memory_order_relaxed);
                auto anomaly = updateAndEvaluate(name, value, timestamp);

                if (anomaly)
                {
                    pushRecent(*anomaly);
                    result.anomalies.push_back(std::move(*anomaly));
                }
            }

            result.pattern = m_correlator.correlate(result.anomalies);
            if (result.pattern)
            {
                m_totalPatterns.fetch_add(1, std::memory_order_relaxed);
                logPattern(*result.pattern);
            }

            return result;
        }

        std::optional<MetricStats> DetectionRegistry::getStats(const std::string &metricName) const
        {
            const auto entry = findEntry(metricName);
            if (!entry)
                return std::nullopt;

            std::lock_guard<std::mutex> lock(entry->mutex);
            return statsOf(metricName, entry->window);
        }

        RegistrySummary DetectionRegistry::summary() const
        {
            RegistrySummary s;
            s.totalDatapoints = m_totalDatapoints.load(std::memory_order_relaxed);
            s.totalAnomalies = m_totalAnomalies.load(std::memory_order_relaxed);
            s.totalPatterns = m_totalPatterns.load(std::memory_order_relaxed);

            std::vector<std::pair<std::string, EntryPtr>> entries;
            {
                std::shared_lock<std::shared_mutex> lock(m_windowsMutex);
                entries.assign(m_windows.begin(), m_windows.end());
            }

            std::sort(entries.begin(), entries.end(),
                      [](const auto &a, const auto &b) { return a.first < b.first; });

            s.metricsTracked = entries.size();
            s.perMetric.reserve(entries.size());
            for (const auto &[name, entry] : entries)
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                s.perMetric.push_back(statsOf(name, entry->window));
            }

            {
                std::lock_guard<std::mutex> lock(m_recentMutex);
                s.recentAnomalies = m_recent.size();
            }

            return s;
        }

        std::vector<Anomaly> DetectionRegistry::recentAnomalies(std::size_t limit) const
        {
            std::lock_guard<std::mutex> lock(m_recentMutex);

            const std::size_t n = (limit == 0) ? m_recent.size() : std::min(limit, m_recent.size());
            return std::vector<Anomaly>(m_recent.end() - static_cast<std::ptrdiff_t>(n), m_recent.end());
        }

        core::BaselineSnapshot DetectionRegistry::snapshot() const
        {
            core::BaselineSnapshot out;
            out.updatedAt = now();

            std::shared_lock<std::shared_mutex> mapLock(m_windowsMutex);
            for (const auto &[name, entry] : m_windows)
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                const MetricWindow &w = entry->window;

                core::MetricBaseline b;
                b.mean = w.mean();
                b.stddev = w.stddev();
                b.ewma = w.ewmaBaseline();
                b.count = w.count();
                b.history.assign(w.values().begin(), w.values().end());
                out.metrics.emplace(name, std::move(b));
            }

            return out;
        }

        void DetectionRegistry::seedHistory(const std::string &metricName, const std::vector<double> &values)
        {
            if (metricName.empty())
                throw std::invalid_argument("seedHistory: metric name must not be empty");

            for (double v : values)
            {
                if (!std::isfinite(v))
                    throw std::invalid_argument("seedHistory: non-finite value for '" + metricName + "'");
            }

            if (values.empty())
                return;

            const auto entry = entryFor(metricName);
            const std::size_t keep = std::min(values.size(), m_config.windowCapacity);

            std::lock_guard<std::mutex> lock(entry->mutex);
            for (auto it = values.end() - static_cast<std::ptrdiff_t>(keep); it != values.end(); ++it)
                entry->window.update(*it);

            getLogger().debug("Seeded '" + metricName + "' with " + std::to_string(keep) + " values");
        }

        void DetectionRegistry::reset()
        {
            {
                std::unique_lock<std::shared_mutex> lock(m_windowsMutex);
                m_windows.clear();
            }
            {
                std::lock_guard<std::mutex> lock(m_recentMutex);
                m_recent.clear();
            }
            m_totalDatapoints.store(0, std::memory_order_relaxed);
            m_totalAnomalies.store(0, std::memory_order_relaxed);
            m_totalPatterns.store(0, std::memory_order_relaxed);

            getLogger().debug("DetectionRegistry reset");
        }

        // --- internals ---

        void DetectionRegistry::validateObservation(const std::string &metricName, double value)
        {
            if (metricName.empty())
                throw std::invalid_argument("observe: metric name must not be empty");
            if (!std::isfinite(value))
                throw std::invalid_argument("observe: non-finite value for '" + metricName + "'");
        }

        DetectionRegistry::EntryPtr DetectionRegistry::entryFor(const std::string &metricName)
        {
            if (auto entry = findEntry(metricName))
                return entry;

            std::unique_lock<std::shared_mutex> lock(m_windowsMutex);
            auto &slot = m_windows[metricName];
            if (!slot)
            {
                slot = std::make_shared<MetricEntry>(m_config);
                getLogger().debug("Created window for metric '" + metricName + "'");
            }
            return slot;
        }

        DetectionRegistry::EntryPtr DetectionRegistry::findEntry(const std::string &metricName) const
        {
            std::shared_lock<std::shared_mutex> lock(m_windowsMutex);
            auto it = m_windows.find(metricName);
            return it == m_windows.end() ? nullptr : it->second;
        }

        std::optional<Anomaly> DetectionRegistry::updateAndEvaluate(const std::string &metricName,
                                                                    double value,
                                                                    TimePoint timestamp)
        {
            const auto entry = entryFor(metricName);

            MetricWindow::Snapshot snap;
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                snap = entry->window.update(value);
            }

            auto anomaly = m_evaluator.evaluate(snap, value, metricName, timestamp);
            if (anomaly)
            {
                m_totalAnomalies.fetch_add(1, std::memory_order_relaxed);
                logAnomaly(*anomaly);
            }
            return anomaly;
        }

        std::vector<Anomaly> DetectionRegistry::pushRecent(const Anomaly &anomaly)
        {
            std::lock_guard<std::mutex> lock(m_recentMutex);

            std::vector<Anomaly> before(m_recent.begin(), m_recent.end());
            m_recent.push_back(anomaly);
            while (m_recent.size() > m_config.recentAnomalyCapacity)
                m_recent.pop_front();

            return before;
        }

        void DetectionRegistry::logAnomaly(const Anomaly &anomaly) const
        {
            Logger &logger = getLogger();
            if (!logger.isEnabled(LogLevel::WARN))
                return;

            std::ostringstream oss;
            oss << "Anomaly: " << anomaly.metricName() << "=" << formatDouble(anomaly.value(), 4)
                << " (z=" << formatDouble(anomaly.zScore(), 2)
                << ", " << signedPercent(anomaly.deviationPercent())
                << ", " << core::directionLabel(anomaly.direction())
                << ", " << core::severityLabel(anomaly.severity()) << ")";
            logger.warn(oss.str());
        }

        void DetectionRegistry::logPattern(const Pattern &pattern) const
        {
            std::ostringstream oss;
            oss << "Pattern " << pattern.patternId() << " [" << core::severityLabel(pattern.severity())
                << "] with " << pattern.members().size() << " anomalies";
            if (!pattern.description().empty())
                oss << ": " << pattern.description();
            getLogger().info(oss.str());
        }

        MetricStats DetectionRegistry::statsOf(const std::string &metricName, const MetricWindow &window)
        {
            const std::vector<double> values(window.values().begin(), window.values().end());

            MetricStats s;
            s.metricName = metricName;
            s.mean = window.mean();
            s.stddev = window.stddev();
            s.ewmaBaseline = window.ewmaBaseline();
            s.count = window.count();
            s.windowSize = window.size();
            s.isValid = window.isValid();
            s.p50 = Analysis::percentile(values, 50.0);
            s.p95 = Analysis::percentile(values, 95.0);
            s.p99 = Analysis::percentile(values, 99.0);
            s.trend = Analysis::detectTrend(values);
            return s;
        }

    } // namespace Detection
} // namespace Sentinel
