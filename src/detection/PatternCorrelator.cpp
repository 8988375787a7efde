#include "detection/PatternCorrelator.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace Sentinel::Detection
{
    using core::Anomaly;
    using core::MatchConfidence;
    using core::Pattern;

    PatternCorrelator::PatternCorrelator(std::vector<PatternRule> rules)
        : m_rules(std::move(rules))
    {
    }

    std::optional<Pattern> PatternCorrelator::correlate(const std::vector<Anomaly> &group) const
    {
        if (group.size() < 2)
            return std::nullopt;

        // Correlation needs at least two distinct metrics
        std::set<std::string> present;
        for (const auto &a : group)
            present.insert(a.metricName());
        if (present.size() < 2)
            return std::nullopt;

        std::vector<Anomaly> members(group);
        std::stable_sort(members.begin(), members.end(),
                         [](const Anomaly &a, const Anomaly &b)
                         {
                             if (a.metricName() != b.metricName())
                                 return a.metricName() < b.metricName();
                             return a.timestamp() < b.timestamp();
                         });

        core::Severity severity = members.front().severity();
        auto windowStart = members.front().timestamp();
        auto windowEnd = members.front().timestamp();
        for (const auto &a : members)
        {
            severity = core::mostSevere(severity, a.severity());
            windowStart = std::min(windowStart, a.timestamp());
            windowEnd = std::max(windowEnd, a.timestamp());
        }

        for (const auto &rule : m_rules)
        {
            std::set<std::string> matched;
            for (const auto &metric : rule.metrics)
            {
                if (present.count(metric) != 0)
                    matched.insert(metric);
            }

            if (matched.empty() || matched.size() < rule.requiredMatches())
                continue;

            const auto confidence = matched.size() == std::set<std::string>(rule.metrics.begin(), rule.metrics.end()).size()
                                        ? MatchConfidence::High
                                        : MatchConfidence::Medium;

            return Pattern(rule.id,
                           rule.description,
                           std::move(members),
                           std::vector<std::string>(matched.begin(), matched.end()),
                           severity,
                           confidence,
                           windowStart,
                           windowEnd);
        }

        return Pattern(core::kUnclassifiedPattern,
                       "Correlated anomalies across " + std::to_string(present.size()) +
                           " metric(s) with no matching rule",
                       std::move(members),
                       {},
                       severity,
                       MatchConfidence::None,
                       windowStart,
                       windowEnd);
    }

    std::optional<Pattern> PatternCorrelator::correlate(const Anomaly &newAnomaly,
                                                        const std::vector<Anomaly> &recent,
                                                        Utils::milliseconds window) const
    {
        std::vector<Anomaly> group;
        group.reserve(recent.size() + 1);
        group.push_back(newAnomaly);

        for (const auto &a : recent)
        {
            const auto dt = a.timestamp() > newAnomaly.timestamp()
                                ? a.timestamp() - newAnomaly.timestamp()
                                : newAnomaly.timestamp() - a.timestamp();
            if (dt <= window)
                group.push_back(a);
        }

        return correlate(group);
    }

} // namespace Sentinel::Detection
