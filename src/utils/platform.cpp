/**
 * @file platform.cpp
 * @brief Implementations of the OS-specific utilities declared in `dirlock::platform`.
 *
 * Process and thread identifiers are used to tag log lines; the executable name labels
 * lifecycle diagnostics. Each function selects the native API for Linux, macOS or FreeBSD.
 */
#include "dlk_base.hpp"

#include <climits>
#include <thread>
#include <vector>

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(DIRLOCK_PLATFORM_APPLE)
#include <libproc.h>
#include <mach-o/dyld.h>
#include <pthread.h>
#elif defined(DIRLOCK_PLATFORM_FREEBSD)
#include <sys/sysctl.h>
#endif

namespace dirlock::platform
{

uint64_t get_pid()
{
    return static_cast<uint64_t>(getpid());
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses `pthread_threadid_np` on macOS and `syscall(SYS_gettid)` on Linux, so the
 *          value matches what `ps -L` and debuggers report.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(DIRLOCK_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(DIRLOCK_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(DIRLOCK_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(DIRLOCK_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = (realpath(buf.data(), resolved) != nullptr) ? resolved : buf.data();
            }
        }
        if (full_path.empty())
        {
            char procbuf[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
                full_path = procbuf;
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(DIRLOCK_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

} // namespace dirlock::platform
