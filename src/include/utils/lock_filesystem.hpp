#pragma once
/**
 * @file lock_filesystem.hpp
 * @brief The filesystem primitives a DirLock is built on.
 *
 * A directory lock needs exactly five operations from the filesystem: `stat` (existence,
 * type and modification time), an exclusive `mkdir`, `rmdir`, setting the modification time
 * to now, and recursive creation of parent directories. They sit behind the abstract
 * `LockFilesystem` so tests can substitute a filesystem that misbehaves on purpose.
 *
 * All operations report failure by throwing `std::filesystem::filesystem_error` carrying the
 * OS error code and the path. The two "expected" outcomes of lock contention are return
 * values instead: `create_directory_exclusive` returns false when the entry already exists,
 * and `remove_directory` returns false when it is already gone.
 */
#include "dlk_base.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace dirlock::utils
{

/// Result of `LockFilesystem::stat`.
struct LockEntryStatus
{
    bool exists = false;
    bool is_directory = false;
    std::filesystem::file_time_type mtime{};
};

class DIRLOCK_UTILS_EXPORT LockFilesystem
{
  public:
    virtual ~LockFilesystem() = default;

    /**
     * @brief Reports whether `path` exists, whether it is a directory, and its mtime.
     *        A missing entry is not an error.
     * @throws std::filesystem::filesystem_error for any other failure (EACCES, ELOOP, ...).
     */
    virtual LockEntryStatus stat(const std::filesystem::path &path) = 0;

    /// Creates every missing ancestor of `path` (not `path` itself).
    virtual void create_parent_directories(const std::filesystem::path &path) = 0;

    /**
     * @brief Atomically creates the directory `path`.
     * @return true if this call created it, false if something already existed there.
     * @throws std::filesystem::filesystem_error for any failure other than EEXIST.
     */
    virtual bool create_directory_exclusive(const std::filesystem::path &path) = 0;

    /**
     * @brief Removes the (empty) directory `path`.
     * @return false if it did not exist.
     */
    virtual bool remove_directory(const std::filesystem::path &path) = 0;

    /// Sets the modification (and access) time of `path` to now.
    virtual void touch(const std::filesystem::path &path) = 0;

    virtual std::string description() const = 0;
};

/**
 * @class PosixLockFilesystem
 * @brief `LockFilesystem` on top of `stat(2)`, `mkdir(2)`, `rmdir(2)` and `utimensat(2)`.
 *
 * `mkdir(2)` is atomic on local POSIX filesystems, which is what makes the directory lock
 * sound. Network filesystems that do not honour that are outside what this class promises.
 */
class DIRLOCK_UTILS_EXPORT PosixLockFilesystem : public LockFilesystem
{
  public:
    LockEntryStatus stat(const std::filesystem::path &path) override;
    void create_parent_directories(const std::filesystem::path &path) override;
    bool create_directory_exclusive(const std::filesystem::path &path) override;
    bool remove_directory(const std::filesystem::path &path) override;
    void touch(const std::filesystem::path &path) override;
    std::string description() const override { return "posix"; }

    /// Process-wide shared instance, used when a DirLock is given no filesystem.
    static std::shared_ptr<LockFilesystem> shared();
};

} // namespace dirlock::utils
