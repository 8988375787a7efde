#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace Sentinel
{
    namespace Utils
    {
        /**
         * DEBUG  window creation, snapshot details
         * INFO   setup, pattern emission, baseline load/save
         * WARN   every anomaly, malformed input, skipped snapshot entries
         * ERROR  unreadable files, failed writes
         */
        enum class LogLevel
        {
            DEBUG = 0,
            INFO  = 1,
            WARN  = 2,
            ERROR = 3,
        };

        /// Case-insensitive level name; "WARNING" is accepted for WARN.
        std::optional<LogLevel> parseLogLevel(std::string_view name);

        /**
         * Logger
         *
         * Lines look like "[YYYY-MM-DD HH:MM:SS] [WARN] message" and go to a
         * console stream (stderr unless redirected) and, optionally, to a file
         * opened in append mode. Level checks are lock-free so that detection
         * threads can skip disabled messages cheaply; writes are serialized.
         *
         * The process-wide instance is reached through getLogger().
         */
        class Logger
        {
        public:
            Logger();

            /// A file that cannot be opened leaves the logger console-only.
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            void setLevel(LogLevel level) noexcept;
            LogLevel level() const noexcept;
            bool isEnabled(LogLevel level) const noexcept;

            /// Replace the file sink. False if it cannot be opened.
            bool setFile(std::string_view filePath);

            /// nullptr silences the console (tests do this).
            void setConsole(std::ostream *console) noexcept;

            void log(LogLevel level, std::string_view message);

            void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)  { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)  { log(LogLevel::WARN,  message); }
            void error(std::string_view message) { log(LogLevel::ERROR, message); }

            static const char *toString(LogLevel level) noexcept;

        private:
            std::atomic<LogLevel> m_level;
            std::ofstream         m_file;
            std::ostream         *m_console;
            std::mutex            m_mutex;   // sinks
        };

        /// Process-wide logger: stderr, INFO until configured.
        Logger &getLogger();

    } // namespace Utils
} // namespace Sentinel
