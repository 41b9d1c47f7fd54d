/**
 * @file dirlock_example.cpp
 * @brief Example: two holders contending for one directory lock.
 *
 * Holder A takes the lock and keeps it for 300 ms. Holder B starts shortly after, with
 * its own DirLock on the same path, and has to wait. With a 10 ms poll and a 20 ms stale
 * duration, A's heartbeat touches the directory roughly every 3 ms, so B never mistakes
 * A for a crashed holder even though A holds the lock fifteen times longer than the stale
 * duration.
 *
 * Key concepts shown:
 *  - LifecycleGuard with the Logger and DirLock modules.
 *  - DirLockOptions and the timing derived from them.
 *  - with_lock() returning the block's value.
 *  - Separate DirLock instances (here threads, normally processes) sharing one path.
 *
 * Run with the lock path as the only optional argument (default /tmp/dirlock-example/lock).
 */
#include "dlk_service.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace dirlock::utils;
using namespace std::chrono_literals;

// ─── Configuration ────────────────────────────────────────────────────────────

constexpr auto kPollInterval = 10ms;
constexpr auto kStaleDuration = 20ms;
constexpr auto kHoldTime = 300ms;

DirLockOptions example_options()
{
    DirLockOptions options;
    options.poll_interval = kPollInterval;
    options.stale_duration = kStaleDuration;
    return options;
}

// ─── Holders ──────────────────────────────────────────────────────────────────

void run_holder_a(const std::filesystem::path &lock_path)
{
    DirLock lock(lock_path, example_options());
    lock.with_lock(
        [&]
        {
            LOGGER_INFO("[A] holding the lock for {}ms", kHoldTime.count());
            std::this_thread::sleep_for(kHoldTime);
            LOGGER_INFO("[A] done");
        });
}

void run_holder_b(const std::filesystem::path &lock_path)
{
    DirLock lock(lock_path, example_options());
    const auto t0 = std::chrono::steady_clock::now();
    const auto waited = lock.with_lock(
        [&]
        {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0);
            LOGGER_INFO("[B] got the lock after waiting {}ms; directory exists: {}", ms.count(),
                        std::filesystem::is_directory(lock_path));
            return ms;
        });
    LOGGER_INFO("[B] released; directory exists: {}", std::filesystem::exists(lock_path));
    std::cout << "Holder B waited " << waited.count() << " ms for holder A.\n";
}

// ─── main ─────────────────────────────────────────────────────────────────────

int main(int argc, char *argv[])
{
    const std::filesystem::path lock_path = argc > 1 ? std::filesystem::path(argv[1])
                                                     : std::filesystem::path("/tmp/dirlock-example/lock");

    LifecycleGuard app_lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), DirLock::GetLifecycleModule()));
    Logger::instance().set_level(Logger::Level::L_DEBUG);

    const LockTiming timing = resolve_lock_timing(example_options());
    LOGGER_INFO("lock='{}' poll={}ms update={}ms stale={}ms stale_factor={}", lock_path.string(),
                timing.poll_interval.count(), timing.update_interval.count(),
                timing.stale_duration.count(), timing.stale_factor);

    std::atomic<bool> failed{false};
    using Holder = void (*)(const std::filesystem::path &);
    auto guarded = [&failed, &lock_path](const char *name, Holder holder)
    {
        try
        {
            holder(lock_path);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("[{}] failed: {}", name, e.what());
            failed = true;
        }
    };

    std::thread holder_a(guarded, "A", &run_holder_a);
    std::this_thread::sleep_for(50ms); // let A win the race
    std::thread holder_b(guarded, "B", &run_holder_b);
    holder_a.join();
    holder_b.join();
    return failed ? 1 : 0;
}
