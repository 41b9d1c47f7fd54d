/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing, panic handling for fatal errors, and
 *        debug messaging.
 *
 * These functions live in `dirlock::debug`. They use `fmt` for compile-time format string
 * checks and `std::source_location` for automatic source location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "dirlock_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", dirlock::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace dirlock::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * Uses `backtrace` and `dladdr` to resolve and demangle symbol names. Errors during capture
 * are reported to `stderr` and never propagate.
 */
DIRLOCK_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable programmer errors (for example using a lifecycle-managed
 * service before its module is initialized). Prints the message with the caller's source
 * location, calls `print_stack_trace()`, then `std::abort()`.
 *
 * @param loc The source location where `panic` was called; captured by `DLK_PANIC`.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (...)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL UNKNOWN EXCEPTION DURING PANIC: fmt_str['{}']\n",
                   SRCLOC_TO_STR(loc), fmt::string_view(fmt_str));
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        fmt::print(stderr, "[DBG]  FATAL EXCEPTION DURING DEBUG_MSG: fmt_str['{}']\n",
                   fmt::string_view(fmt_str));
        std::fflush(stderr);
    }
}

} // namespace dirlock::debug

// ---------------- thin macros for convenience --------------

/**
 * @brief Triggers `dirlock::debug::panic` with the current source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef DLK_PANIC
#define DLK_PANIC(fmt, ...)                                                                        \
    ::dirlock::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a debug message; compiled out unless DIRLOCK_ENABLE_DEBUG_MESSAGES is set.
 */
#ifndef DLK_DEBUG
#if defined(DIRLOCK_ENABLE_DEBUG_MESSAGES)
#define DLK_DEBUG(fmt, ...) ::dirlock::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define DLK_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
