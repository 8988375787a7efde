#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "core/BaselineSnapshot.hpp"

namespace Sentinel
{
    namespace Analysis
    {
        /**
         * BaselineGenerator
         *
         * Produces a synthetic BaselineSnapshot for the standard LLM metric set,
         * so a fresh deployment can detect anomalies before it has real history.
         *
         * For each metric:
         *  - numPoints values ~ N(mean, stddev), clipped to [min, max]
         *  - floor(numPoints * anomalyRate) distinct indices replaced by a value
         *    3 to 5 sigma above or below the mean (clipped as well)
         *  - mean/stddev/ewma computed over the generated values
         *
         * Deterministic for a given seed.
         */
        class BaselineGenerator
        {
        public:
            struct MetricProfile
            {
                std::string name;
                double mean;
                double stddev;
                double min;
                double max;
            };

            /// The 17 standard metrics with their expected distributions.
            static const std::vector<MetricProfile> &standardProfiles();

            explicit BaselineGenerator(std::size_t numPoints = 1000,
                                       double anomalyRate = 0.05,
                                       std::uint32_t seed = 42);

            /// Generate every standard metric. ewmaAlpha is used for the ewma field.
            core::BaselineSnapshot generate(double ewmaAlpha = 0.1);

            /// Generate the values of one metric.
            std::vector<double> generateValues(const MetricProfile &profile);

            std::size_t numPoints() const noexcept { return m_numPoints; }
            double anomalyRate() const noexcept { return m_anomalyRate; }

        private:
            std::size_t m_numPoints;
            double m_anomalyRate;
            std::mt19937 m_rng;
        };

    } // namespace Analysis
} // namespace Sentinel
