#include "utils/format_tools.hpp"

#include <ctime>

#include <fmt/chrono.h>

namespace pgtemp::format_tools
{

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(timestamp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", fmt::localtime(t), micros);
}

std::string quote_conninfo_value(std::string_view value)
{
    bool needs_quotes = value.empty();
    for (char c : value)
    {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\'' || c == '\\')
        {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes)
    {
        return std::string(value);
    }

    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (char c : value)
    {
        if (c == '\'' || c == '\\')
        {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

std::string join_lines(const std::vector<std::string> &lines)
{
    std::string out;
    for (const auto &line : lines)
    {
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace pgtemp::format_tools
