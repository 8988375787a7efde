#include "analysis/BaselineGenerator.hpp"

#include <algorithm>
#include <numeric>

#include "analysis/SeriesStats.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Analysis
    {
        const std::vector<BaselineGenerator::MetricProfile> &BaselineGenerator::standardProfiles()
        {
            // name, mean, stddev, min, max
            static const std::vector<MetricProfile> profiles = {
                {"llm.tokens.total",               500.0,   150.0,   50.0,     2000.0},
                {"llm.tokens.prompt",              200.0,   80.0,    20.0,     1000.0},
                {"llm.tokens.response",            300.0,   100.0,   20.0,     1500.0},
                {"llm.tokens.ratio",               0.8,     0.3,     0.1,      3.0},

                {"llm.cost.per_request",           0.0004,  0.00015, 0.00005,  0.002},
                {"llm.cost.input",                 0.00005, 0.00002, 0.000005, 0.00025},
                {"llm.cost.output",                0.00015, 0.00005, 0.00001,  0.00075},

                {"llm.latency.ms",                 250.0,   80.0,    100.0,    2000.0},
                {"llm.throughput.tokens_per_sec",  2000.0,  500.0,   500.0,    5000.0},

                {"llm.prompt.length",              800.0,   300.0,   50.0,     5000.0},
                {"llm.prompt.complexity_score",    15.0,    5.0,     5.0,      40.0},
                {"llm.prompt.question_count",      1.5,     1.0,     0.0,      5.0},
                {"llm.prompt.context_utilization", 3.0,     2.0,     0.1,      15.0},

                {"llm.response.length",            1200.0,  500.0,   50.0,     8000.0},
                {"llm.response.is_refusal",        0.02,    0.02,    0.0,      1.0},
                {"llm.response.has_code",          0.15,    0.1,     0.0,      1.0},
                {"llm.response.is_truncated",      0.01,    0.01,    0.0,      1.0},
            };
            return profiles;
        }

        BaselineGenerator::BaselineGenerator(std::size_t numPoints, double anomalyRate, std::uint32_t seed)
            : m_numPoints(numPoints),
              m_anomalyRate(std::clamp(anomalyRate, 0.0, 1.0)),
              m_rng(seed)
        {
        }

        core::BaselineSnapshot BaselineGenerator::generate(double ewmaAlpha)
        {
            core::BaselineSnapshot snapshot;
            snapshot.updatedAt = Utils::now();

            for (const auto &profile : standardProfiles())
            {
                core::MetricBaseline b;
                b.history = generateValues(profile);

                const MeanStd ms = meanAndStddev(b.history);
                b.mean = ms.mean;
                b.stddev = ms.stddev;
                b.count = b.history.size();

                if (!b.history.empty())
                {
                    b.ewma = b.history.front();
                    for (std::size_t i = 1; i < b.history.size(); ++i)
                        b.ewma = ewmaAlpha * b.history[i] + (1.0 - ewmaAlpha) * b.ewma;
                }

                snapshot.metrics.emplace(profile.name, std::move(b));
            }

            Utils::getLogger().info("Generated synthetic baseline for " +
                                    std::to_string(snapshot.metrics.size()) + " metrics (" +
                                    std::to_string(m_numPoints) + " points each)");
            return snapshot;
        }

        std::vector<double> BaselineGenerator::generateValues(const MetricProfile &profile)
        {
            std::normal_distribution<double> normal(profile.mean, profile.stddev);

            std::vector<double> values(m_numPoints);
            for (auto &v : values)
                v = std::clamp(normal(m_rng), profile.min, profile.max);

            const auto injected = static_cast<std::size_t>(static_cast<double>(m_numPoints) * m_anomalyRate);
            if (injected == 0)
                return values;

            // Distinct indices: shuffle and take a prefix
            std::vector<std::size_t> indices(m_numPoints);
            std::iota(indices.begin(), indices.end(), std::size_t{0});
            std::shuffle(indices.begin(), indices.end(), m_rng);

            std::uniform_real_distribution<double> coin(0.0, 1.0);
            std::uniform_real_distribution<double> sigmas(3.0, 5.0);
            for (std::size_t i = 0; i < injected; ++i)
            {
                const double k = sigmas(m_rng);
                double &v = values[indices[i]];
                if (coin(m_rng) > 0.5)
                    v = std::min(profile.mean + k * profile.stddev, profile.max);
                else
                    v = std::max(profile.mean - k * profile.stddev, profile.min);
            }

            return values;
        }

    } // namespace Analysis
} // namespace Sentinel
