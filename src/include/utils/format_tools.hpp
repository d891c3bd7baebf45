// Tools for formatting strings
#pragma once
#include <chrono>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "docgate_utils_export.h"

namespace docgate::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
DOCGATE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    std::string_view::size_type last_separator_pos = std::string_view::npos;
    if (last_slash == std::string_view::npos)
        last_separator_pos = last_backslash;
    else if (last_backslash == std::string_view::npos)
        last_separator_pos = last_slash;
    else
        last_separator_pos = last_slash > last_backslash ? last_slash : last_backslash;

    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

/**
 * @brief Truncates a string for log output, appending "..." when it was cut.
 * @param text The text to shorten.
 * @param max_len Maximum number of characters kept before the ellipsis.
 */
DOCGATE_UTILS_EXPORT std::string truncate_for_log(std::string_view text, size_t max_len = 256);

} // namespace docgate::format_tools
