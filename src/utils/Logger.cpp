#include "utils/Logger.hpp"

#include <iostream>
#include <string>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace Sentinel
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view name)
        {
            const std::string_view s = trim(name);
            for (const LogLevel level : {LogLevel::DEBUG, LogLevel::INFO,
                                         LogLevel::WARN, LogLevel::ERROR})
            {
                if (iequals(s, Logger::toString(level)))
                    return level;
            }
            if (iequals(s, "WARNING"))
                return LogLevel::WARN;
            return std::nullopt;
        }

        Logger::Logger()
            : m_level(LogLevel::INFO),
              m_console(&std::cerr)
        {
        }

        Logger::Logger(std::string_view filePath, LogLevel level)
            : m_level(level),
              m_console(&std::cerr)
        {
            if (!filePath.empty())
                m_file.open(std::string(filePath), std::ios::out | std::ios::app);
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            m_level.store(level, std::memory_order_relaxed);
        }

        LogLevel Logger::level() const noexcept
        {
            return m_level.load(std::memory_order_relaxed);
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            return static_cast<int>(level) >= static_cast<int>(this->level());
        }

        bool Logger::setFile(std::string_view filePath)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open())
                m_file.close();
            if (filePath.empty())
                return false;

            m_file.open(std::string(filePath), std::ios::out | std::ios::app);
            return m_file.is_open();
        }

        void Logger::setConsole(std::ostream *console) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_console = console;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
                return;

            std::string line = "[" + formatTimestamp(now()) + "] [" + toString(level) + "] ";
            line.append(message);
            line.push_back('\n');

            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_console)
                m_console->write(line.data(), static_cast<std::streamsize>(line.size())).flush();
            if (m_file.is_open())
                m_file.write(line.data(), static_cast<std::streamsize>(line.size())).flush();
        }

        const char *Logger::toString(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO";
            case LogLevel::WARN:  return "WARN";
            case LogLevel::ERROR: return "ERROR";
            }
            return "UNKNOWN";
        }

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace Sentinel
