/*******************************************************************************
 * @file dir_lock.cpp
 * @brief Acquisition loop, heartbeat wiring and release of the directory lock.
 *
 * **State machine**
 * `state` is an atomic `DirLockState`. `acquire()` moves Created -> Taking with a
 * compare-and-swap, so a second caller on the same instance sees the CAS fail and gets
 * `InvalidLockStateError` without touching the filesystem. A failed acquisition returns
 * the state to Created through a scope guard; a successful one stores Owned only after the
 * heartbeat thread is running. `release()` moves Owned -> Releasing -> Created.
 *
 * **Staleness**
 * Elapsed time is measured on the steady clock between our own observations of an mtime
 * change. Requiring `stale_factor` consecutive unchanged observations on top of the elapsed
 * time keeps a suspended-then-resumed waiter from declaring a live holder stale after a
 * single poll.
 ******************************************************************************/
#include "dlk_base.hpp"
#include "utils/dir_lock.hpp"
#include "utils/lifecycle.hpp"
#include "utils/lock_filesystem.hpp"

#include "lock_heartbeat.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

static std::atomic<bool> g_dirlock_initialized{false};
// Number of DirLock instances currently in the Owned state in this process.
static std::atomic<int> g_active_holders{0};

namespace
{
// mkdir losing with EEXIST this many times in a row, while stat never sees the directory,
// means the filesystem is not giving us atomic mkdir.
constexpr int kMaxCreationFailures = 50;
constexpr std::chrono::seconds kMinDefaultStaleDuration{1};
constexpr std::chrono::milliseconds kDirLockShutdownTimeoutMs{2000};
} // namespace

namespace dirlock::utils
{

// ============================================================================
// Timing
// ============================================================================

LockTiming resolve_lock_timing(const DirLockOptions &options)
{
    if (options.poll_interval <= milliseconds::zero())
    {
        throw std::invalid_argument("DirLock: poll_interval must be positive");
    }
    if (options.update_interval && *options.update_interval <= milliseconds::zero())
    {
        throw std::invalid_argument("DirLock: update_interval must be positive");
    }
    if (options.stale_duration && *options.stale_duration <= milliseconds::zero())
    {
        throw std::invalid_argument("DirLock: stale_duration must be positive");
    }
    if (options.take_timeout && *options.take_timeout < milliseconds::zero())
    {
        throw std::invalid_argument("DirLock: take_timeout must not be negative");
    }

    const auto check_max = [](const char *name, std::optional<milliseconds> value)
    {
        if (value && *value > kMaxLockInterval)
        {
            throw std::invalid_argument(fmt::format("DirLock: {} ({}ms) must be at most {}ms", name,
                                                    value->count(), kMaxLockInterval.count()));
        }
    };
    check_max("poll_interval", options.poll_interval);
    check_max("update_interval", options.update_interval);
    check_max("stale_duration", options.stale_duration);
    check_max("take_timeout", options.take_timeout);

    LockTiming timing{};
    timing.poll_interval = options.poll_interval;

    if (options.update_interval)
    {
        timing.update_interval = *options.update_interval;
    }
    else if (options.stale_duration)
    {
        timing.update_interval = std::max(*options.stale_duration / 6, milliseconds(1));
    }
    else
    {
        timing.update_interval = options.poll_interval * 10;
    }

    if (options.stale_duration)
    {
        timing.stale_duration = *options.stale_duration;
    }
    else
    {
        timing.stale_duration =
            std::max<milliseconds>(timing.update_interval * 10, kMinDefaultStaleDuration);
    }

    if (timing.update_interval >= timing.stale_duration)
    {
        throw std::invalid_argument(
            fmt::format("DirLock: update_interval ({}ms) must be shorter than stale_duration "
                        "({}ms)",
                        timing.update_interval.count(), timing.stale_duration.count()));
    }

    const auto ratio = static_cast<uint64_t>(timing.stale_duration / timing.poll_interval);
    timing.stale_factor = std::max<uint64_t>(ratio, 2);
    return timing;
}

const char *to_string(DirLockState state) noexcept
{
    switch (state)
    {
    case DirLockState::Created:
        return "created";
    case DirLockState::Taking:
        return "taking";
    case DirLockState::Owned:
        return "owned";
    case DirLockState::Releasing:
        return "releasing";
    }
    return "unknown";
}

// ============================================================================
// Errors
// ============================================================================

DirLockError::DirLockError(DirLockErrc kind, fs::path path, const std::string &what)
    : std::runtime_error(what), m_kind(kind), m_path(std::move(path))
{
}

InvalidLockStateError::InvalidLockStateError(fs::path path, DirLockState current)
    : DirLockError(DirLockErrc::InvalidState, path,
                   fmt::format("DirLock: lock '{}' is already in use (state: {})", path.string(),
                               to_string(current))),
      m_state(current)
{
}

StaleLockError::StaleLockError(fs::path path)
    : DirLockError(DirLockErrc::StaleLock, path,
                   fmt::format("DirLock: lock '{}' is stale; its holder stopped updating it",
                               path.string()))
{
}

LockInternalError::LockInternalError(fs::path path, int creation_failures)
    : DirLockError(DirLockErrc::Internal, path,
                   fmt::format("DirLock: mkdir of '{}' reported 'exists' {} times without the "
                               "directory ever being visible",
                               path.string(), creation_failures))
{
}

LockTimeoutError::LockTimeoutError(fs::path path, milliseconds timeout)
    : DirLockError(DirLockErrc::Timeout, path,
                   fmt::format("DirLock: timed out after {}ms waiting for lock '{}'",
                               timeout.count(), path.string()))
{
}

// ============================================================================
// Stale policies and log sink
// ============================================================================

const char *to_string(StalePolicy policy) noexcept
{
    switch (policy)
    {
    case StalePolicy::Fail:
        return "fail";
    case StalePolicy::Break:
        return "break";
    case StalePolicy::Wait:
        return "wait";
    }
    return "unknown";
}

std::optional<StalePolicy> stale_policy_from_string(std::string_view name)
{
    if (name == "fail")
        return StalePolicy::Fail;
    if (name == "break")
        return StalePolicy::Break;
    if (name == "wait")
        return StalePolicy::Wait;
    return std::nullopt;
}

LockLogSink default_lock_log_sink()
{
    return [](Logger::Level lvl, const std::string &message)
    { Logger::instance().log_message(lvl, message); };
}

StaleHandler make_stale_handler(StalePolicy policy, std::shared_ptr<LockFilesystem> filesystem,
                                LockLogSink log_sink)
{
    if (!filesystem)
        filesystem = PosixLockFilesystem::shared();
    if (!log_sink)
        log_sink = default_lock_log_sink();

    switch (policy)
    {
    case StalePolicy::Break:
        return [filesystem, log_sink](const fs::path &path)
        {
            log_sink(Logger::Level::L_WARNING,
                     fmt::format("DirLock: breaking stale lock path='{}'", path.string()));
            try
            {
                if (filesystem->remove_directory(path))
                {
                    log_sink(Logger::Level::L_INFO,
                             fmt::format("DirLock: removed stale lock path='{}'", path.string()));
                }
                else
                {
                    log_sink(Logger::Level::L_DEBUG,
                             fmt::format("DirLock: stale lock already gone path='{}'",
                                         path.string()));
                }
            }
            catch (const fs::filesystem_error &e)
            {
                // Acquisition retries either way; a holder that is actually alive keeps
                // the directory fresh and will not be broken again.
                log_sink(Logger::Level::L_ERROR,
                         fmt::format("DirLock: cannot remove stale lock path='{}' error='{}'",
                                     path.string(), e.what()));
            }
        };
    case StalePolicy::Wait:
        return [log_sink](const fs::path &path)
        {
            log_sink(Logger::Level::L_INFO,
                     fmt::format("DirLock: lock looks stale, still waiting path='{}'",
                                 path.string()));
        };
    case StalePolicy::Fail:
        break;
    }
    return [](const fs::path &path) { throw StaleLockError(path); };
}

// ============================================================================
// DirLock
// ============================================================================

struct DirLockImpl
{
    DirLockImpl(fs::path lock_path, DirLockOptions options)
        : path(std::move(lock_path)), timing(resolve_lock_timing(options)),
          take_timeout(options.take_timeout),
          log_sink(options.log_sink ? std::move(options.log_sink) : default_lock_log_sink()),
          filesystem(options.filesystem ? std::move(options.filesystem)
                                        : PosixLockFilesystem::shared()),
          heartbeat(filesystem, path, timing.update_interval, log_sink)
    {
    }

    // Logging must never turn into a lock failure.
    void log(Logger::Level lvl, const std::string &message) noexcept
    {
        try
        {
            log_sink(lvl, message);
        }
        catch (const std::exception &e)
        {
            DLK_DEBUG("DirLock: log sink threw: {}", e.what());
        }
    }

    void take(const StaleHandler &on_stale);

    fs::path path;
    LockTiming timing;
    std::optional<milliseconds> take_timeout;
    LockLogSink log_sink;
    std::shared_ptr<LockFilesystem> filesystem;
    std::atomic<DirLockState> state{DirLockState::Created};
    LockHeartbeat heartbeat;
};

void DirLockImpl::take(const StaleHandler &on_stale)
{
    const auto start = steady_clock::now();
    std::optional<fs::file_time_type> last_mtime;
    auto last_change = start;
    uint64_t unchanged_count = 0;
    int creation_failures = 0;
    bool reported_contention = false;

    auto check_timeout = [&]()
    {
        if (take_timeout && steady_clock::now() - start >= *take_timeout)
        {
            log(Logger::Level::L_WARNING,
                fmt::format("DirLock: gave up waiting after {}ms path='{}'", take_timeout->count(),
                            path.string()));
            throw LockTimeoutError(path, *take_timeout);
        }
    };

    while (true)
    {
        const LockEntryStatus status = filesystem->stat(path);

        if (status.exists && !status.is_directory)
        {
            throw fs::filesystem_error("lock path exists and is not a directory", path,
                                       std::make_error_code(std::errc::not_a_directory));
        }

        if (status.exists)
        {
            creation_failures = 0;
            const auto now = steady_clock::now();
            if (last_mtime && *last_mtime == status.mtime)
            {
                ++unchanged_count;
            }
            else
            {
                last_mtime = status.mtime;
                last_change = now;
                unchanged_count = 0;
                log(Logger::Level::L_TRACE,
                    fmt::format("DirLock: observed mtime {} path='{}'",
                                format_tools::formatted_file_time(status.mtime), path.string()));
            }

            if (!reported_contention)
            {
                reported_contention = true;
                log(Logger::Level::L_DEBUG,
                    fmt::format("DirLock: lock is held, polling every {}ms path='{}'",
                                timing.poll_interval.count(), path.string()));
            }

            const auto unchanged_for = now - last_change;
            if (unchanged_count >= timing.stale_factor && unchanged_for > timing.stale_duration)
            {
                log(Logger::Level::L_WARNING,
                    fmt::format("DirLock: stale lock detected, mtime unchanged for {}ms over {} "
                                "polls path='{}'",
                                std::chrono::duration_cast<milliseconds>(unchanged_for).count(),
                                unchanged_count, path.string()));
                on_stale(path);
                // The handler returned: re-check from scratch, but not in a tight loop.
                unchanged_count = 0;
            }

            check_timeout();
            std::this_thread::sleep_for(timing.poll_interval);
            continue;
        }

        filesystem->create_parent_directories(path);
        if (filesystem->create_directory_exclusive(path))
        {
            log(Logger::Level::L_INFO, fmt::format("DirLock: acquired path='{}'", path.string()));
            return;
        }

        ++creation_failures;
        if (creation_failures > kMaxCreationFailures)
        {
            log(Logger::Level::L_ERROR,
                fmt::format("DirLock: mkdir reported 'exists' {} times but the directory was "
                            "never visible path='{}' fs='{}' error='internal'",
                            creation_failures, path.string(), filesystem->description()));
            throw LockInternalError(path, creation_failures);
        }
        log(Logger::Level::L_DEBUG,
            fmt::format("DirLock: lost creation race ({}) path='{}'", creation_failures,
                        path.string()));
        check_timeout();
    }
}

DirLock::DirLock(fs::path path, DirLockOptions options)
{
    if (path.empty())
    {
        throw std::invalid_argument("DirLock: lock path must not be empty");
    }
    pImpl = std::make_unique<DirLockImpl>(std::move(path), std::move(options));
}

DirLock::~DirLock() = default;

DirLockState DirLock::state() const noexcept
{
    return pImpl->state.load(std::memory_order_acquire);
}

const fs::path &DirLock::path() const noexcept
{
    return pImpl->path;
}

const LockTiming &DirLock::timing() const noexcept
{
    return pImpl->timing;
}

StaleHandler DirLock::make_default_stale_handler() const
{
    return make_stale_handler(StalePolicy::Fail, pImpl->filesystem, pImpl->log_sink);
}

void DirLock::acquire(const StaleHandler &on_stale)
{
    if (!lifecycle_initialized())
    {
        DLK_PANIC("FATAL: DirLock used before its module was initialized via LifecycleManager. "
                  "Aborting.");
    }

    DirLockImpl &impl = *pImpl;
    DirLockState expected = DirLockState::Created;
    if (!impl.state.compare_exchange_strong(expected, DirLockState::Taking,
                                            std::memory_order_acq_rel))
    {
        throw InvalidLockStateError(impl.path, expected);
    }
    auto back_to_created = basics::make_scope_guard(
        [&impl]() { impl.state.store(DirLockState::Created, std::memory_order_release); });

    impl.take(on_stale);

    try
    {
        impl.heartbeat.start();
    }
    catch (const std::system_error &e)
    {
        impl.log(Logger::Level::L_ERROR,
                 fmt::format("DirLock: cannot start heartbeat path='{}' error='{}'",
                             impl.path.string(), e.what()));
        try
        {
            impl.filesystem->remove_directory(impl.path);
        }
        catch (const fs::filesystem_error &rm_err)
        {
            impl.log(Logger::Level::L_ERROR,
                     fmt::format("DirLock: cannot remove lock after failed start path='{}' "
                                 "error='{}'",
                                 impl.path.string(), rm_err.what()));
        }
        throw;
    }

    back_to_created.dismiss();
    g_active_holders.fetch_add(1, std::memory_order_relaxed);
    impl.state.store(DirLockState::Owned, std::memory_order_release);
}

void DirLock::release() noexcept
{
    DirLockImpl &impl = *pImpl;
    DirLockState expected = DirLockState::Owned;
    if (!impl.state.compare_exchange_strong(expected, DirLockState::Releasing,
                                            std::memory_order_acq_rel))
    {
        return;
    }

    try
    {
        impl.heartbeat.cancel();
        // The heartbeat may be mid-touch; removing the directory under it would turn a
        // clean release into a logged heartbeat failure.
        impl.heartbeat.wait_done();

        if (impl.filesystem->remove_directory(impl.path))
        {
            impl.log(Logger::Level::L_INFO,
                     fmt::format("DirLock: released path='{}'", impl.path.string()));
        }
        else
        {
            impl.log(Logger::Level::L_WARNING,
                     fmt::format("DirLock: lock directory was already gone at release path='{}'",
                                 impl.path.string()));
        }
    }
    catch (const std::exception &e)
    {
        impl.log(Logger::Level::L_ERROR,
                 fmt::format("DirLock: release failed path='{}' error='{}'", impl.path.string(),
                             e.what()));
    }

    try
    {
        impl.heartbeat.reset_done_signal();
    }
    catch (const std::exception &e)
    {
        impl.log(Logger::Level::L_ERROR,
                 fmt::format("DirLock: cannot re-arm heartbeat path='{}' error='{}'",
                             impl.path.string(), e.what()));
    }

    g_active_holders.fetch_sub(1, std::memory_order_relaxed);
    impl.state.store(DirLockState::Created, std::memory_order_release);
}

// ============================================================================
// Lifecycle integration
// ============================================================================

bool DirLock::lifecycle_initialized() noexcept
{
    return g_dirlock_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_dirlock_startup(const char *arg)
{
    (void)arg;
    g_dirlock_initialized.store(true, std::memory_order_release);
}

void do_dirlock_shutdown(const char *arg)
{
    (void)arg;
    const int held = g_active_holders.load(std::memory_order_acquire);
    if (held > 0)
    {
        LOGGER_WARN("DirLock: module shutting down while {} lock(s) are still held", held);
    }
    g_dirlock_initialized.store(false, std::memory_order_release);
}
} // namespace

ModuleDef DirLock::GetLifecycleModule()
{
    ModuleDef module("dirlock::utils::DirLock");
    module.add_dependency("dirlock::utils::Logger");
    module.set_startup(&do_dirlock_startup);
    module.set_shutdown(&do_dirlock_shutdown, kDirLockShutdownTimeoutMs);
    return module;
}

} // namespace dirlock::utils
