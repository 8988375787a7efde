#include "persistence/BaselineStore.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel::Persistence
{
    using json = nlohmann::json;
    using Utils::getLogger;

    namespace
    {
        double numberOr(const json &obj, const char *key, double fallback)
        {
            const auto it = obj.find(key);
            if (it == obj.end() || !it->is_number())
                return fallback;
            return it->get<double>();
        }

        void readHistory(const json &history, core::BaselineSnapshot &out)
        {
            for (const auto &[metric, values] : history.items())
            {
                if (!values.is_array())
                {
                    getLogger().warn("Baseline: history of '" + metric + "' is not an array, skipped");
                    continue;
                }

                auto &b = out.metrics[metric];
                std::size_t skipped = 0;
                for (const auto &v : values)
                {
                    if (v.is_number())
                        b.history.push_back(v.get<double>());
                    else
                        ++skipped;
                }

                if (skipped > 0)
                {
                    getLogger().warn("Baseline: skipped " + std::to_string(skipped) +
                                     " non-numeric value(s) in history of '" + metric + "'");
                }
            }
        }

        void readBaseline(const json &baseline, core::BaselineSnapshot &out)
        {
            for (const auto &[metric, stats] : baseline.items())
            {
                if (!stats.is_object())
                {
                    getLogger().warn("Baseline: stats of '" + metric + "' are not an object, skipped");
                    continue;
                }

                auto &b = out.metrics[metric];
                b.mean = numberOr(stats, "mean", 0.0);
                b.stddev = numberOr(stats, "std", 0.0);
                b.ewma = numberOr(stats, "ewma", b.mean);

                const auto count = stats.find("count");
                if (count != stats.end() && count->is_number_unsigned())
                    b.count = count->get<std::size_t>();
            }
        }
    } // anonymous namespace

    BaselineStore::BaselineStore(std::string path)
        : m_path(std::move(path))
    {
    }

    std::optional<core::BaselineSnapshot> BaselineStore::load() const
    {
        std::ifstream in(m_path);
        if (!in.is_open())
        {
            getLogger().info("No baseline found at " + m_path);
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();

        auto snapshot = parse(buffer.str());
        if (!snapshot)
        {
            getLogger().warn("Baseline file " + m_path + " is not a valid snapshot");
            return std::nullopt;
        }

        getLogger().info("Loaded baseline for " + std::to_string(snapshot->metrics.size()) +
                         " metrics from " + m_path);
        return snapshot;
    }

    bool BaselineStore::save(const core::BaselineSnapshot &snapshot,
                             const Detection::DetectorConfig &config) const
    {
        namespace fs = std::filesystem;

        const fs::path target(m_path);
        if (target.has_parent_path())
        {
            std::error_code ec;
            fs::create_directories(target.parent_path(), ec);
            if (ec)
            {
                getLogger().error("Cannot create directory " + target.parent_path().string() +
                                  ": " + ec.message());
                return false;
            }
        }

        std::ofstream out(m_path, std::ios::trunc);
        if (!out.is_open())
        {
            getLogger().error("Cannot open " + m_path + " for writing");
            return false;
        }

        out << serialize(snapshot, config) << '\n';
        out.flush();
        if (!out)
        {
            getLogger().error("Failed writing baseline to " + m_path);
            return false;
        }

        getLogger().info("Saved baseline for " + std::to_string(snapshot.metrics.size()) +
                         " metrics to " + m_path);
        return true;
    }

    std::optional<core::BaselineSnapshot> BaselineStore::parse(std::string_view text)
    {
        json doc;
        try
        {
            doc = json::parse(text.begin(), text.end());
        }
        catch (const json::parse_error &e)
        {
            getLogger().warn(std::string("Baseline JSON parse error: ") + e.what());
            return std::nullopt;
        }

        if (!doc.is_object())
            return std::nullopt;

        core::BaselineSnapshot out;

        const auto history = doc.find("history");
        if (history != doc.end() && history->is_object())
            readHistory(*history, out);

        const auto baseline = doc.find("baseline");
        if (baseline != doc.end() && baseline->is_object())
            readBaseline(*baseline, out);

        const auto updated = doc.find("updated_at");
        if (updated != doc.end() && updated->is_string())
        {
            // Fractional seconds or a zone suffix are ignored
            const std::string ts = updated->get<std::string>();
            if (auto tp = Utils::parseTimestamp(std::string_view(ts).substr(0, 19)))
                out.updatedAt = *tp;
        }

        return out;
    }

    std::string BaselineStore::serialize(const core::BaselineSnapshot &snapshot,
                                         const Detection::DetectorConfig &config,
                                         int indent)
    {
        json baseline = json::object();
        json history = json::object();

        for (const auto &[metric, b] : snapshot.metrics)
        {
            baseline[metric] = {
                {"mean", b.mean},
                {"std", b.stddev},
                {"ewma", b.ewma},
                {"count", b.count},
            };
            history[metric] = b.history;
        }

        json doc = {
            {"baseline", std::move(baseline)},
            {"history", std::move(history)},
            {"updated_at", Utils::toIso8601(snapshot.updatedAt)},
            {"metadata", {
                {"window_size", config.windowCapacity},
                {"threshold", config.zScoreThreshold},
                {"ewma_alpha", config.ewmaAlpha},
            }},
        };

        return doc.dump(indent);
    }

    std::size_t BaselineStore::apply(const core::BaselineSnapshot &snapshot,
                                     Detection::DetectionRegistry &registry)
    {
        std::size_t seeded = 0;
        for (const auto &[metric, b] : snapshot.metrics)
        {
            if (metric.empty() || b.history.empty())
            {
                getLogger().warn("Baseline: no history for '" + metric + "', skipped");
                continue;
            }

            registry.seedHistory(metric, b.history);
            ++seeded;
        }

        getLogger().info("Seeded " + std::to_string(seeded) + " metric window(s) from baseline");
        return seeded;
    }

} // namespace Sentinel::Persistence
