// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace Sentinel::Utils {

namespace {

bool isSpace(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string_view trim(std::string_view sv) noexcept
{
    std::size_t begin = 0;
    std::size_t end = sv.size();
    while (begin < end && isSpace(sv[begin]))
        ++begin;
    while (end > begin && isSpace(sv[end - 1]))
        --end;
    return sv.substr(begin, end - begin);
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::optional<std::pair<std::string_view, std::string_view>>
splitOnce(std::string_view sv, char separator) noexcept
{
    const auto pos = sv.find(separator);
    if (pos == std::string_view::npos)
        return std::nullopt;
    return std::make_pair(sv.substr(0, pos), sv.substr(pos + 1));
}

std::vector<std::string_view> splitList(std::string_view sv, char delimiter)
{
    std::vector<std::string_view> items;
    while (true)
    {
        const auto pos = sv.find(delimiter);
        const auto item = trim(sv.substr(0, pos));
        if (!item.empty())
            items.push_back(item);
        if (pos == std::string_view::npos)
            break;
        sv.remove_prefix(pos + 1);
    }
    return items;
}

std::vector<std::string_view> splitWhitespace(std::string_view sv)
{
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < sv.size())
    {
        while (i < sv.size() && isSpace(sv[i]))
            ++i;
        const std::size_t start = i;
        while (i < sv.size() && !isSpace(sv[i]))
            ++i;
        if (i > start)
            words.push_back(sv.substr(start, i - start));
    }
    return words;
}

std::optional<long long> parseInteger(std::string_view sv)
{
    const std::string text(trim(sv));
    if (text.empty())
        return std::nullopt;

    errno = 0;
    char *end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size())
        return std::nullopt;
    return value;
}

std::optional<double> parseNumber(std::string_view sv)
{
    const std::string text(trim(sv));
    if (text.empty())
        return std::nullopt;

    // strtod also takes hex floats; metric values are decimal only
    if (text.find_first_of("xX") != std::string::npos)
        return std::nullopt;

    errno = 0;
    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size() || !std::isfinite(value))
        return std::nullopt;
    return value;
}

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);

    for (const char c : s)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string formatDouble(double value, int precision)
{
    if (!std::isfinite(value))
        return "0";

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace Sentinel::Utils
