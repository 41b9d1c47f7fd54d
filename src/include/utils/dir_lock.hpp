#pragma once
/**
 * @file dir_lock.hpp
 * @brief A cross-process lock whose acquire operation is an atomic `mkdir`.
 *
 * **Protocol**
 *
 * 1.  **Acquire**: `stat` the lock path. If nothing is there, create the parent
 *     directories and `mkdir` the lock directory; whoever's `mkdir` succeeds owns the
 *     lock. If a directory is there, poll it. A holder is judged *stale* once the
 *     directory's mtime has been seen unchanged on at least `stale_factor` consecutive
 *     polls *and* for longer than `stale_duration`; the caller's `on_stale` handler then
 *     decides what happens (throw, break the lock, keep waiting).
 * 2.  **Hold**: a heartbeat thread touches the directory every `update_interval`, so
 *     a live holder never looks stale, however long the protected block runs.
 * 3.  **Release**: stop the heartbeat, wait until it has really stopped, then `rmdir`.
 *     A directory that has already disappeared is logged as a warning, not an error.
 *
 * The directory's existence is the only cross-process state. Nothing else is shared.
 *
 * **Usage**
 * ```cpp
 * dirlock::utils::DirLock lock("/var/lock/nightly-report");
 * const int rows = lock.with_lock([&] { return regenerate_report(); });
 *
 * // Break abandoned locks instead of failing on them:
 * lock.with_lock(dirlock::utils::make_stale_handler(dirlock::utils::StalePolicy::Break),
 *                [&] { regenerate_report(); });
 * ```
 *
 * **Thread Safety**
 * A `DirLock` instance can be inside `with_lock` at most once at a time. A second call,
 * recursive or from another thread, throws `InvalidLockStateError` immediately. Separate
 * instances (in one process or many) naming the same path contend for the same lock.
 *
 * **Lifecycle**
 * `DirLock::GetLifecycleModule()` must be registered (after the Logger's) and initialized
 * before any lock is acquired; acquiring earlier is a fatal error.
 */
#include "dlk_base.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dirlock::utils
{

class LockFilesystem;
struct DirLockImpl;

/// Receives every message a lock emits. The default forwards to `Logger`.
using LockLogSink = std::function<void(Logger::Level, const std::string &)>;

/// Called with the lock path when the current holder is judged stale.
/// Returning normally retries acquisition; throwing aborts it.
using StaleHandler = std::function<void(const std::filesystem::path &)>;

/// Longest accepted interval or timeout.
inline constexpr std::chrono::milliseconds kMaxLockInterval = std::chrono::hours(24 * 30);

/**
 * @struct DirLockOptions
 * @brief Construction parameters. Every field is optional; see `resolve_lock_timing`.
 */
struct DirLockOptions
{
    std::chrono::milliseconds poll_interval{10};
    std::optional<std::chrono::milliseconds> update_interval;
    std::optional<std::chrono::milliseconds> stale_duration;
    /// Upper bound on one acquisition. Unset means wait forever.
    std::optional<std::chrono::milliseconds> take_timeout;
    /// Unset routes messages to the process-wide Logger.
    LockLogSink log_sink;
    /// Unset uses `PosixLockFilesystem::shared()`.
    std::shared_ptr<LockFilesystem> filesystem;
};

/// Fully resolved timing of a lock.
struct LockTiming
{
    std::chrono::milliseconds poll_interval;
    std::chrono::milliseconds update_interval;
    std::chrono::milliseconds stale_duration;
    /// Minimum number of consecutive unchanged-mtime polls before staleness is considered.
    uint64_t stale_factor;
};

/**
 * @brief Derives the timing of a lock from its options.
 *
 * - `update_interval`: as given; else `max(stale_duration / 6, 1ms)` when only the stale
 *   duration is given; else `10 * poll_interval`.
 * - `stale_duration`: as given; else `max(10 * update_interval, 1s)`.
 * - `stale_factor`: `max(stale_duration / poll_interval, 2)`.
 *
 * @throws std::invalid_argument if any interval is not positive, if any interval or
 *         `take_timeout` exceeds `kMaxLockInterval`, or if `update_interval >= stale_duration`.
 */
DIRLOCK_UTILS_EXPORT LockTiming resolve_lock_timing(const DirLockOptions &options);

enum class DirLockState : int
{
    Created,
    Taking,
    Owned,
    Releasing,
};

DIRLOCK_UTILS_EXPORT const char *to_string(DirLockState state) noexcept;

// ============================================================================
// Errors
// ============================================================================

enum class DirLockErrc : int
{
    InvalidState,
    StaleLock,
    Internal,
    Timeout,
};

/**
 * @class DirLockError
 * @brief Base of every lock-protocol error. Setup problems (the path is a file, `mkdir`
 *        fails with something other than EEXIST) are `std::filesystem::filesystem_error`.
 */
class DIRLOCK_UTILS_EXPORT DirLockError : public std::runtime_error
{
  public:
    DirLockError(DirLockErrc kind, std::filesystem::path path, const std::string &what);

    DirLockErrc kind() const noexcept { return m_kind; }
    const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    DirLockErrc m_kind;
    std::filesystem::path m_path;
};

/// `with_lock` was called on an instance that is already taking, holding or releasing.
class DIRLOCK_UTILS_EXPORT InvalidLockStateError : public DirLockError
{
  public:
    InvalidLockStateError(std::filesystem::path path, DirLockState current);
    DirLockState state() const noexcept { return m_state; }

  private:
    DirLockState m_state;
};

/// The holder of the lock stopped refreshing it. Thrown by the default stale handler.
class DIRLOCK_UTILS_EXPORT StaleLockError : public DirLockError
{
  public:
    explicit StaleLockError(std::filesystem::path path);
};

/// `mkdir` kept reporting EEXIST while `stat` never saw the directory.
class DIRLOCK_UTILS_EXPORT LockInternalError : public DirLockError
{
  public:
    LockInternalError(std::filesystem::path path, int creation_failures);
};

/// Acquisition took longer than `DirLockOptions::take_timeout`.
class DIRLOCK_UTILS_EXPORT LockTimeoutError : public DirLockError
{
  public:
    LockTimeoutError(std::filesystem::path path, std::chrono::milliseconds timeout);
};

// ============================================================================
// Stale policies
// ============================================================================

enum class StalePolicy : int
{
    Fail,  ///< throw StaleLockError
    Break, ///< remove the stale directory and retry
    Wait,  ///< log and keep waiting for the holder
};

DIRLOCK_UTILS_EXPORT const char *to_string(StalePolicy policy) noexcept;

/// Parses "fail", "break" or "wait".
DIRLOCK_UTILS_EXPORT std::optional<StalePolicy> stale_policy_from_string(std::string_view name);

/**
 * @brief Builds an `on_stale` handler implementing `policy`.
 * @param filesystem Used by `Break` to remove the directory; defaults to POSIX.
 * @param log_sink   Destination for the handler's messages; defaults to the Logger.
 */
DIRLOCK_UTILS_EXPORT StaleHandler make_stale_handler(StalePolicy policy,
                                                     std::shared_ptr<LockFilesystem> filesystem = {},
                                                     LockLogSink log_sink = {});

/// The sink used when `DirLockOptions::log_sink` is unset.
DIRLOCK_UTILS_EXPORT LockLogSink default_lock_log_sink();

// ============================================================================
// DirLock
// ============================================================================

class DIRLOCK_UTILS_EXPORT DirLock
{
  public:
    /**
     * @brief Creates a lock object for `path`. Touches nothing on disk.
     * @throws std::invalid_argument on invalid timing (see `resolve_lock_timing`) or an
     *         empty path.
     */
    explicit DirLock(std::filesystem::path path, DirLockOptions options = {});
    ~DirLock();

    DirLock(const DirLock &) = delete;
    DirLock &operator=(const DirLock &) = delete;
    DirLock(DirLock &&) = delete;
    DirLock &operator=(DirLock &&) = delete;

    /**
     * @brief Runs `block` while holding the lock and returns its result.
     *
     * A stale holder makes this throw `StaleLockError`. The lock is released on every
     * exit path; an exception from `block` propagates after the release.
     *
     * @throws InvalidLockStateError, StaleLockError, LockInternalError, LockTimeoutError,
     *         std::filesystem::filesystem_error, or whatever `block` throws.
     */
    template <typename Block> decltype(auto) with_lock(Block &&block)
    {
        return with_lock(make_default_stale_handler(), std::forward<Block>(block));
    }

    /**
     * @brief Like `with_lock(block)`, with `on_stale` deciding what a stale holder means.
     */
    template <typename Block> decltype(auto) with_lock(StaleHandler on_stale, Block &&block)
    {
        acquire(on_stale);
        auto release_guard = basics::make_scope_guard([this]() { release(); });
        return std::invoke(std::forward<Block>(block));
    }

    DirLockState state() const noexcept;
    const std::filesystem::path &path() const noexcept;
    const LockTiming &timing() const noexcept;

    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

  private:
    StaleHandler make_default_stale_handler() const;

    // Created -> Taking -> Owned; back to Created if acquisition fails.
    void acquire(const StaleHandler &on_stale);
    // Owned -> Releasing -> Created. Never throws; failures are logged.
    void release() noexcept;

    std::unique_ptr<DirLockImpl> pImpl;
};

} // namespace dirlock::utils
