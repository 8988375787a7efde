#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace Sentinel
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Reads a recorded metric stream one line at a time, counting lines so
         * that malformed input can be reported as "Line N: ...". Trailing CR
         * from CRLF files is dropped. A reader that failed to open behaves as
         * an empty file.
         */
        class FileReader
        {
        public:
            explicit FileReader(const std::string &filePath);

            FileReader(FileReader &&)            = default;
            FileReader &operator=(FileReader &&) = default;

            bool isOpen() const noexcept { return m_stream.is_open(); }

            const std::string &filePath() const noexcept { return m_filePath; }

            /// std::nullopt at end of file.
            std::optional<std::string> nextLine();

            /// 1-based number of the line last returned; 0 before the first.
            std::size_t lineNumber() const noexcept { return m_lineNumber; }

            /// Back to line 1.
            bool rewind();

            void close();

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::size_t   m_lineNumber = 0;
        };

    } // namespace Input
} // namespace Sentinel
