// Tools for formatting strings, timestamps and source locations
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "dirlock_utils_export.h"

namespace dirlock::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (local time).
 */
DIRLOCK_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a filesystem modification time the same way as `formatted_time`.
 *
 * Lock directories are compared by their raw `file_time_type`; this is only used to make
 * log lines about stale locks readable.
 */
DIRLOCK_UTILS_EXPORT std::string formatted_file_time(std::filesystem::file_time_type mtime);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
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
    if (last_slash == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_slash + 1);
}

} // namespace dirlock::format_tools
