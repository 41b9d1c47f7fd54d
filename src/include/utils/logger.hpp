/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command Queue**
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message on
 *     the calling thread and push it into a queue. No I/O happens on the caller.
 * 2.  **Single Worker Thread**: one background thread is the sole consumer of the
 *     queue. It writes to the active sink and executes control commands (sink
 *     switches, flushes) in the order they were submitted.
 * 3.  **Sink Abstraction**: `Sink` defines write/flush/description. `ConsoleSink`
 *     writes to stderr; `FileSink` appends to a file, optionally under `flock` so
 *     that several processes can share one log file.
 * 4.  **Bounded Queue**: beyond a soft limit log messages are dropped (control
 *     commands are still accepted up to a hard limit). Dropped messages are
 *     counted and a summary is written once the worker catches up.
 * 5.  **Lifecycle**: the worker is started and stopped by the `LifecycleManager`
 *     through `Logger::GetLifecycleModule()`. Configuration methods called before
 *     initialization are a fatal programming error; log calls made before
 *     initialization or after shutdown are silently dropped.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("DirLock: acquired path='{}'", path.string());
 *
 * auto &logger = dirlock::utils::Logger::instance();
 * logger.set_logfile("/var/log/dirlock.log", true);
 * logger.set_level(dirlock::utils::Logger::Level::L_DEBUG);
 * logger.flush(); // blocks until every queued message has been written
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "dirlock_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace dirlock::utils
{

// Lifecycle callbacks registered through Logger::GetLifecycleModule().
void do_logger_startup(const char *arg);
void do_logger_shutdown(const char *arg);

class DIRLOCK_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /// Lifecycle module definition. Other modules that log should depend on it.
    static ModuleDef GetLifecycleModule();

    /// True once the lifecycle has started the logger (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    // --- Sinks ---
    // Sink switches are executed in order by the worker; these calls block until the
    // switch has happened and report whether it succeeded.

    /// Switch logging to the console (stderr).
    bool set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @param utf8_path Path to the log file. Its parent directory must exist.
     * @param use_flock Take an advisory `flock` around every write, for log files
     *                  shared between processes.
     * @return false if the file could not be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /**
     * @brief Stops the worker after it has written everything already queued.
     *
     * Normally called by the lifecycle; a no-op before initialization.
     */
    void shutdown();

    /// Blocks until every message queued before this call has been written and flushed.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked when a sink fails to write or cannot be created.
     *
     * The callback runs on an internal dispatcher thread, never on the logging worker,
     * so it may itself log.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    // --- Runtime format strings ---
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <typename... Args> void trace_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_TRACE, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void debug_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void error_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void system_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_SYSTEM, fmt_str, std::forward<Args>(args)...);
    }

    /// Enqueues an already formatted message. Used by callers that build their own text.
    bool log_message(Level lvl, std::string body) noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
        catch (...)
        {
            enqueue_log(lvl, "[UNKNOWN FORMAT ERROR]");
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        enqueue_log(lvl, std::string(mb.data(), mb.size()));
    }
    catch (const std::exception &ex)
    {
        enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
    catch (...)
    {
        enqueue_log(lvl, "[UNKNOWN FORMAT ERROR]");
    }
}

} // namespace dirlock::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::dirlock::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::dirlock::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::dirlock::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::dirlock::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::dirlock::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::dirlock::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE_RT(fmt, ...)                                                                  \
    ::dirlock::utils::Logger::instance().trace_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG_RT(fmt, ...)                                                                  \
    ::dirlock::utils::Logger::instance().debug_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::dirlock::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::dirlock::utils::Logger::instance().warn_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::dirlock::utils::Logger::instance().error_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM_RT(fmt, ...)                                                                 \
    ::dirlock::utils::Logger::instance().system_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
