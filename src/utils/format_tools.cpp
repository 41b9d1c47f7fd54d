// format_tools.cpp
#include "dlk_base.hpp"

namespace dirlock::format_tools
{

// Formatted time with microsecond resolution. The seconds part is rendered by fmt's chrono
// support and the fractional part is appended manually, which works across fmt versions
// whether or not they print subseconds themselves.
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

std::string formatted_file_time(std::filesystem::file_time_type mtime)
{
    const auto sys = std::chrono::file_clock::to_sys(mtime);
    return formatted_time(std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
}

} // namespace dirlock::format_tools
