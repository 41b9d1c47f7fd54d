#include "dlk_base.hpp"
#include "utils/lock_filesystem.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace dirlock::utils
{

namespace
{
[[noreturn]] void throw_fs_error(const char *what, const fs::path &path, int err)
{
    throw fs::filesystem_error(what, path, std::error_code(err, std::generic_category()));
}

// stat timestamps are UNIX-epoch based, i.e. system_clock.
fs::file_time_type to_file_time(const struct timespec &ts)
{
    const auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    const auto sys_tp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    return std::chrono::file_clock::from_sys(sys_tp);
}
} // namespace

LockEntryStatus PosixLockFilesystem::stat(const fs::path &path)
{
    struct ::stat st{};
    if (::stat(path.c_str(), &st) != 0)
    {
        const int err = errno;
        if (err == ENOENT)
        {
            return {};
        }
        throw_fs_error("stat failed for lock path", path, err);
    }

    LockEntryStatus status;
    status.exists = true;
    status.is_directory = S_ISDIR(st.st_mode);
#if defined(DIRLOCK_PLATFORM_APPLE)
    status.mtime = to_file_time(st.st_mtimespec);
#else
    status.mtime = to_file_time(st.st_mtim);
#endif
    return status;
}

void PosixLockFilesystem::create_parent_directories(const fs::path &path)
{
    const fs::path parent = path.parent_path();
    if (parent.empty())
    {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec)
    {
        throw fs::filesystem_error("cannot create parent directories of lock path", parent, ec);
    }
}

bool PosixLockFilesystem::create_directory_exclusive(const fs::path &path)
{
    if (::mkdir(path.c_str(), 0755) == 0)
    {
        return true;
    }
    const int err = errno;
    if (err == EEXIST)
    {
        return false;
    }
    throw_fs_error("mkdir failed for lock path", path, err);
}

bool PosixLockFilesystem::remove_directory(const fs::path &path)
{
    if (::rmdir(path.c_str()) == 0)
    {
        return true;
    }
    const int err = errno;
    if (err == ENOENT)
    {
        return false;
    }
    throw_fs_error("rmdir failed for lock path", path, err);
}

void PosixLockFilesystem::touch(const fs::path &path)
{
    // nullptr times means "set both to the current time".
    if (::utimensat(AT_FDCWD, path.c_str(), nullptr, 0) != 0)
    {
        throw_fs_error("cannot update modification time of lock path", path, errno);
    }
}

std::shared_ptr<LockFilesystem> PosixLockFilesystem::shared()
{
    static const std::shared_ptr<LockFilesystem> instance =
        std::make_shared<PosixLockFilesystem>();
    return instance;
}

} // namespace dirlock::utils
