// File: include/core/BaselineSnapshot.hpp
//
// Exported registry history: what the BaselineStore writes to and reads
// from disk, and what the BaselineGenerator produces.

#ifndef SENTINEL_CORE_BASELINE_SNAPSHOT_HPP
#define SENTINEL_CORE_BASELINE_SNAPSHOT_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace Sentinel
{
namespace core
{

/**
 * @brief Statistics and raw history of one metric.
 *
 * history is oldest-first. mean/stddev describe history (population std),
 * ewma and count describe the whole stream the history came from.
 */
struct MetricBaseline
{
    double              mean{0.0};
    double              stddev{0.0};
    double              ewma{0.0};
    std::size_t         count{0};
    std::vector<double> history;
};

/**
 * @brief Point-in-time copy of every metric's baseline.
 */
struct BaselineSnapshot
{
    using Clock     = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    std::map<std::string, MetricBaseline> metrics;   // sorted by metric name
    TimePoint                             updatedAt{};
};

} // namespace core
} // namespace Sentinel

#endif // SENTINEL_CORE_BASELINE_SNAPSHOT_HPP
