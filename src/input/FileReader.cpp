#include "input/FileReader.hpp"

namespace Sentinel
{
    namespace Input
    {
        FileReader::FileReader(const std::string &filePath)
            : m_stream(filePath),
              m_filePath(filePath)
        {
        }

        std::optional<std::string> FileReader::nextLine()
        {
            std::string line;
            if (!m_stream.is_open() || !std::getline(m_stream, line))
                return std::nullopt;

            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            ++m_lineNumber;
            return line;
        }

        bool FileReader::rewind()
        {
            if (!m_stream.is_open())
                return false;

            m_stream.clear();
            m_stream.seekg(0);
            m_lineNumber = 0;
            return !m_stream.fail();
        }

        void FileReader::close()
        {
            m_stream.close();
            m_lineNumber = 0;
        }

    } // namespace Input
} // namespace Sentinel
