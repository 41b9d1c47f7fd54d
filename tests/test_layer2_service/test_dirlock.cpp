// tests/test_layer2_service/test_dirlock.cpp
/**
 * @file test_dirlock.cpp
 * @brief DirLock behavior within one process.
 *
 * Every scenario runs in its own worker process (see workers/dirlock_workers.cpp) because
 * DirLock depends on the Logger and DirLock lifecycle modules.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace dirlock::tests;
using namespace dirlock::tests::helper;
using namespace ::testing;

class DirLockTest : public IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = std::make_unique<dirlock::tests::helper::TempDir>(std::string("dirlock_") + info->name());
    }

    void TearDown() override { temp_dir_.reset(); }

    std::string LockPath() const { return (*temp_dir_ / "the.lock").string(); }
    const fs::path &BaseDir() const { return temp_dir_->path(); }

    std::unique_ptr<dirlock::tests::helper::TempDir> temp_dir_;
};

TEST_F(DirLockTest, BasicAcquireRelease)
{
    auto proc = SpawnWorker("dirlock.basic_acquire_release", {LockPath()});
    ExpectWorkerOk(proc, {"DirLock: acquired", "DirLock: released"});
}

TEST_F(DirLockTest, CreatesParentDirectories)
{
    auto proc = SpawnWorker("dirlock.creates_parent_directories", {BaseDir().string()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, ReuseAfterRelease)
{
    auto proc = SpawnWorker("dirlock.reuse_after_release", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, RecursiveUseThrows)
{
    auto proc = SpawnWorker("dirlock.recursive_use_throws", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, ConcurrentUseOfOneInstanceThrows)
{
    auto proc = SpawnWorker("dirlock.concurrent_use_same_instance_throws", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, SeparateInstancesSerialize)
{
    auto proc = SpawnWorker("dirlock.separate_instances_serialize", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, StaleLockFailsByDefault)
{
    auto proc = SpawnWorker("dirlock.stale_lock_fails", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, StaleHandlerRemovesAndRetries)
{
    auto proc = SpawnWorker("dirlock.stale_handler_removes_and_retries", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, StalePolicyBreak)
{
    auto proc = SpawnWorker("dirlock.stale_policy_break", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, StalePolicyWaitTimesOut)
{
    auto proc = SpawnWorker("dirlock.stale_policy_wait_times_out", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, StalePolicyWaitThenRemoved)
{
    auto proc = SpawnWorker("dirlock.stale_policy_wait_then_removed", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, HeartbeatKeepsLockFresh)
{
    auto proc = SpawnWorker("dirlock.heartbeat_keeps_lock_fresh", {LockPath()});
    ExpectWorkerOk(proc);
}

// The waiter logs its timeout as a warning through the Logger.
TEST_F(DirLockTest, TakeTimeoutExpires)
{
    auto proc = SpawnWorker("dirlock.take_timeout_expires", {LockPath()});
    ExpectWorkerOk(proc, {"gave up waiting after 150ms"});
}

// Heartbeat every 3ms keeps a 300ms hold from ever looking stale at 20ms.
TEST_F(DirLockTest, TwoHoldersEndToEnd)
{
    auto proc = SpawnWorker("dirlock.two_holders_end_to_end", {BaseDir().string()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, MkdirThatNeverSucceedsIsAnInternalError)
{
    auto proc = SpawnWorker("dirlock.lying_filesystem_internal_error", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, PathIsAFile)
{
    auto proc = SpawnWorker("dirlock.path_is_a_file", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, ReleaseWithMissingDirectoryWarns)
{
    auto proc = SpawnWorker("dirlock.release_with_missing_directory_warns", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, HeartbeatFailureIsLogged)
{
    auto proc = SpawnWorker("dirlock.heartbeat_failure_is_logged", {LockPath()});
    ExpectWorkerOk(proc);
}

TEST_F(DirLockTest, UseWithoutLifecycleAborts)
{
    auto proc = SpawnWorker("dirlock.use_without_lifecycle_aborts", {LockPath()});
    ASSERT_TRUE(proc.valid());
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("[PANIC]"));
    EXPECT_THAT(proc.get_stderr(), HasSubstr("DirLock used before its module was initialized"));
    EXPECT_FALSE(fs::exists(LockPath()));
}
