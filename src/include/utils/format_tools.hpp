// Tools for formatting strings
#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace pgtemp::format_tools
{

/**
 * @brief Formats a system_clock time_point with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.uuuuuu" (local time).
 */
std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Quotes a value for a libpq keyword/value connection string.
 * @details Returns the value unchanged when it is non-empty and contains no
 *          whitespace, quote or backslash; otherwise wraps it in single quotes
 *          and backslash-escapes embedded quotes and backslashes.
 */
std::string quote_conninfo_value(std::string_view value);

/**
 * @brief Joins lines, terminating every line (including the last) with '\n'.
 */
std::string join_lines(const std::vector<std::string> &lines);

} // namespace pgtemp::format_tools
