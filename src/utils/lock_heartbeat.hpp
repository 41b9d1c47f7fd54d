#pragma once
/**
 * @file lock_heartbeat.hpp
 * @brief Background worker that keeps a held lock directory's mtime fresh.
 *
 * Internal to the dirlock_utils library; DirLock owns one per instance.
 *
 * While started, the worker waits `update_interval` on a condition variable and then
 * touches the lock directory. `cancel()` wakes it immediately. A touch failure (typically
 * the directory was removed behind our back) is logged at error level and ends the worker;
 * it never reaches the caller's protected block.
 *
 * Every exit path of the worker fulfils the done signal exactly once, so `wait_done()`
 * cannot block forever. The signal is re-armed by `reset_done_signal()` for the next cycle.
 */
#include "dlk_base.hpp"
#include "utils/dir_lock.hpp"
#include "utils/lock_filesystem.hpp"

#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

namespace dirlock::utils
{

class LockHeartbeat
{
  public:
    LockHeartbeat(std::shared_ptr<LockFilesystem> filesystem, std::filesystem::path path,
                  std::chrono::nanoseconds update_interval, LockLogSink log_sink);
    ~LockHeartbeat();

    LockHeartbeat(const LockHeartbeat &) = delete;
    LockHeartbeat &operator=(const LockHeartbeat &) = delete;

    /// Spawns the worker. Must not be called while a previous cycle is still running.
    void start();

    /// Requests the worker to stop at its next wait. Idempotent.
    void cancel() noexcept;

    /// Blocks until the worker has signalled completion, then joins it.
    void wait_done();

    /// Re-arms the done signal so `start()` can be called again.
    void reset_done_signal();

  private:
    void run() noexcept;
    void log(Logger::Level lvl, const std::string &message) noexcept;

    std::shared_ptr<LockFilesystem> m_filesystem;
    std::filesystem::path m_path;
    std::chrono::nanoseconds m_update_interval;
    LockLogSink m_log_sink;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancel_requested = false;

    std::promise<void> m_done;
    std::future<void> m_done_future;
    std::thread m_thread;
};

} // namespace dirlock::utils
