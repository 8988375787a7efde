#include "utils/ConfigLoader.hpp"

#include <algorithm>
#include <fstream>

#include "utils/StringUtils.hpp"

namespace Sentinel
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
                return false;

            loadFromStream(in);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            std::unordered_map<std::string, std::string> parsed;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view stripped = trim(line);
                if (stripped.empty() || stripped.front() == '#' || stripped.front() == ';')
                    continue;

                const auto kv = splitOnce(stripped, '=');
                if (!kv)
                    continue;

                const std::string_view key = trim(kv->first);
                if (key.empty())
                    continue;

                parsed[std::string(key)] = std::string(trim(kv->second));
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(parsed);
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.count(std::string(key)) != 0;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const auto it = m_values.find(std::string(key));
            if (it == m_values.end())
                return std::nullopt;
            return it->second;
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view fallback) const
        {
            auto v = getString(key);
            return v ? std::move(*v) : std::string(fallback);
        }

        std::optional<long long> ConfigLoader::getInt(std::string_view key) const
        {
            const auto v = getString(key);
            return v ? parseInteger(*v) : std::nullopt;
        }

        long long ConfigLoader::getIntOr(std::string_view key, long long fallback) const
        {
            return getInt(key).value_or(fallback);
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            const auto v = getString(key);
            return v ? parseNumber(*v) : std::nullopt;
        }

        double ConfigLoader::getDoubleOr(std::string_view key, double fallback) const
        {
            return getDouble(key).value_or(fallback);
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v)
                return std::nullopt;

            const std::string_view s = trim(*v);
            for (const char *yes : {"1", "true", "yes", "on"})
            {
                if (iequals(s, yes))
                    return true;
            }
            for (const char *no : {"0", "false", "no", "off"})
            {
                if (iequals(s, no))
                    return false;
            }
            return std::nullopt;
        }

        bool ConfigLoader::getBoolOr(std::string_view key, bool fallback) const
        {
            return getBool(key).value_or(fallback);
        }

        std::vector<std::string> ConfigLoader::keysWithPrefix(std::string_view prefix) const
        {
            std::vector<std::string> keys;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (const auto &kv : m_values)
                {
                    if (startsWith(kv.first, prefix))
                        keys.push_back(kv.first);
                }
            }
            std::sort(keys.begin(), keys.end());
            return keys;
        }

    } // namespace Utils
} // namespace Sentinel
