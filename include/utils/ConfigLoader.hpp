#pragma once

#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Sentinel
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Flat `key = value` settings for the detector and the CLI.
         *
         *   # comment            ; also a comment
         *   window_capacity   = 100
         *   zscore_threshold  = 3.0
         *   pattern_rule.1    = high_token_latency_spike: llm.tokens.total, llm.latency.ms
         *
         * Keys and values are trimmed, lines without '=' are ignored and a
         * repeated key keeps its last value. Getters never throw: a missing or
         * unparsable value is std::nullopt, and the *Or variants substitute
         * the fallback. All members are safe to call from several threads.
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            /// False if the file cannot be opened; the current values are then kept.
            bool loadFromFile(const std::string &filePath);

            /// Replaces the current values with those read from @p in.
            void loadFromStream(std::istream &in);

            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::string getStringOr(std::string_view key, std::string_view fallback) const;

            std::optional<long long> getInt(std::string_view key) const;
            long long getIntOr(std::string_view key, long long fallback) const;

            std::optional<double> getDouble(std::string_view key) const;
            double getDoubleOr(std::string_view key, double fallback) const;

            /// 1/true/yes/on and 0/false/no/off, any case.
            std::optional<bool> getBool(std::string_view key) const;
            bool getBoolOr(std::string_view key, bool fallback) const;

            /// Keys beginning with @p prefix, in lexical order.
            std::vector<std::string> keysWithPrefix(std::string_view prefix) const;

        private:
            std::unordered_map<std::string, std::string> m_values;
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace Sentinel
