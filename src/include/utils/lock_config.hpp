#pragma once
/**
 * @file lock_config.hpp
 * @brief DirLock configuration loaded from a JSON file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "lock": {
 *     "path":               "/var/lock/nightly-report",
 *     "poll_interval_ms":   10,
 *     "update_interval_ms": 100,
 *     "stale_duration_ms":  1000,
 *     "timeout_ms":         0,
 *     "on_stale":           "fail"
 *   },
 *   "logging": {
 *     "level": "info",
 *     "file":  ""
 *   }
 * }
 * @endcode
 *
 * Only `lock.path` is required. Interval fields left out fall back to the defaults of
 * `resolve_lock_timing`. `timeout_ms` of 0 (or absent) waits forever. `on_stale` is one of
 * `fail`, `break`, `wait`. An empty `logging.file` logs to the console.
 */
#include "utils/dir_lock.hpp"
#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dirlock::utils
{

struct LockConfig
{
    std::filesystem::path path;
    /// Timing fields only; `log_sink` and `filesystem` are left unset.
    DirLockOptions options;
    StalePolicy on_stale{StalePolicy::Fail};
    Logger::Level log_level{Logger::Level::L_INFO};
    std::string log_file; ///< empty = console
};

/**
 * @brief Builds a LockConfig from an already parsed document.
 * @throws std::runtime_error ("Lock config: ...") on a missing or invalid field.
 */
DIRLOCK_UTILS_EXPORT LockConfig parse_lock_config(const nlohmann::json &j);

/**
 * @brief Reads and parses a JSON config file.
 * @throws std::runtime_error if the file cannot be opened, is not valid JSON, or fails
 *         `parse_lock_config`.
 */
DIRLOCK_UTILS_EXPORT LockConfig load_lock_config(const std::filesystem::path &path);

/// Parses "trace", "debug", "info", "warning" (or "warn"), "error", "system".
DIRLOCK_UTILS_EXPORT std::optional<Logger::Level> log_level_from_string(std::string_view name);

} // namespace dirlock::utils
