// format_tools.cpp
#include "dgt_base.hpp"

#include <fmt/chrono.h>

namespace docgate::format_tools
{

// Formatted local time with microsecond resolution. The fractional part is
// computed manually so the output does not depend on fmt's chrono subsecond support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string truncate_for_log(std::string_view text, size_t max_len)
{
    if (text.size() <= max_len)
        return std::string(text);
    std::string out(text.substr(0, max_len));
    out += "...";
    return out;
}

} // namespace docgate::format_tools
