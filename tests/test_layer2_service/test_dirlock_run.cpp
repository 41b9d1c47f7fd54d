// tests/test_layer2_service/test_dirlock_run.cpp
/**
 * @file test_dirlock_run.cpp
 * @brief End-to-end tests of the dirlock-run command-line tool.
 *
 * The tool is spawned like a worker, with its first argument standing in for the worker
 * mode. DIRLOCK_RUN_EXE is set by the build to the tool's path.
 */
#include "shared_test_helpers.h"
#include "test_process_utils.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <chrono>
#include <csignal>
#include <fstream>
#include <thread>

#include <signal.h>
#include <sys/wait.h>

#ifndef DIRLOCK_RUN_EXE
#error "DIRLOCK_RUN_EXE must be defined by the build"
#endif

using namespace dirlock::tests::helper;
using namespace ::testing;

class DirLockRunTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = std::make_unique<dirlock::tests::helper::TempDir>(std::string("dirlock_run_") + info->name());
        lock_path_ = (*temp_dir_ / "run.lock").string();
    }

    void TearDown() override { temp_dir_.reset(); }

    /// Runs dirlock-run with `args` and returns its exit code.
    int Run(std::vector<std::string> args)
    {
        const std::string first = args.front();
        args.erase(args.begin());
        proc_ = std::make_unique<WorkerProcess>(DIRLOCK_RUN_EXE, first, args);
        if (!proc_->valid())
            return -1;
        return proc_->wait_for_exit();
    }

    std::unique_ptr<dirlock::tests::helper::TempDir> temp_dir_;
    std::string lock_path_;
    std::unique_ptr<WorkerProcess> proc_;
};

TEST_F(DirLockRunTest, PropagatesCommandExitCode)
{
    EXPECT_EQ(Run({"--path", lock_path_, "--", "/bin/sh", "-c", "exit 7"}), 7);
    EXPECT_FALSE(fs::exists(lock_path_));
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("DirLock: acquired"));
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("DirLock: released"));
}

TEST_F(DirLockRunTest, LockIsHeldWhileCommandRuns)
{
    const std::string script = "test -d '" + lock_path_ + "'";
    EXPECT_EQ(Run({"--path", lock_path_, "--", "/bin/sh", "-c", script}), 0)
        << proc_->get_stderr();
    EXPECT_FALSE(fs::exists(lock_path_));
}

TEST_F(DirLockRunTest, CommandKilledBySignal)
{
    EXPECT_EQ(Run({"--path", lock_path_, "--", "/bin/sh", "-c", "kill -TERM $$"}), 128 + 15);
    EXPECT_FALSE(fs::exists(lock_path_));
}

// The signal reaches the command, and the lock is released before the tool exits.
TEST_F(DirLockRunTest, TerminatedWhileHoldingLock)
{
    proc_ = std::make_unique<WorkerProcess>(
        DIRLOCK_RUN_EXE, "--path",
        std::vector<std::string>{lock_path_, "--", "/bin/sh", "-c", "sleep 5"});
    ASSERT_TRUE(proc_->valid());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!fs::exists(lock_path_) && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(fs::is_directory(lock_path_)) << proc_->get_stderr();
    // Let the command start.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    ASSERT_EQ(::kill(proc_->handle(), SIGTERM), 0);
    EXPECT_EQ(proc_->wait_for_exit(), 128 + SIGTERM);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("DirLock: released"));
    EXPECT_FALSE(fs::exists(lock_path_));
}

// SIGTERM at varying points between start-up and exit, including the moments right after
// the lock is taken and right before it is released, never leaves the lock directory behind.
TEST_F(DirLockRunTest, TerminationNeverLeaksLock)
{
    for (int i = 0; i < 40; ++i)
    {
        proc_ = std::make_unique<WorkerProcess>(
            DIRLOCK_RUN_EXE, "--path", std::vector<std::string>{lock_path_, "--", "/bin/true"});
        ASSERT_TRUE(proc_->valid());

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!fs::exists(lock_path_) && std::chrono::steady_clock::now() < deadline)
        {
            // Exited already (left unreaped for wait_for_exit()).
            siginfo_t info{};
            if (::waitid(P_PID, static_cast<id_t>(proc_->handle()), &info,
                         WEXITED | WNOHANG | WNOWAIT) == 0 &&
                info.si_pid != 0)
                break;
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100 * (i % 10)));
        ::kill(proc_->handle(), SIGTERM);

        const int code = proc_->wait_for_exit();
        EXPECT_TRUE(code == 0 || code == 128 + SIGTERM) << "exit code " << code;
        ASSERT_FALSE(fs::exists(lock_path_)) << "iteration " << i << "\n" << proc_->get_stderr();
    }
}

TEST_F(DirLockRunTest, CommandThatCannotBeExecuted)
{
    EXPECT_EQ(Run({"--path", lock_path_, "--", "/nonexistent/dirlock-test-command"}), 127);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("cannot execute"));
    EXPECT_FALSE(fs::exists(lock_path_));
}

TEST_F(DirLockRunTest, StaleLockFails)
{
    fs::create_directories(lock_path_);
    backdate_mtime(lock_path_, std::chrono::hours(1));
    EXPECT_EQ(Run({"--path", lock_path_, "--poll-ms", "10", "--stale-ms", "60", "--", "/bin/true"}),
              3);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("stale"));
    EXPECT_TRUE(fs::is_directory(lock_path_));
}

TEST_F(DirLockRunTest, StaleLockIsBroken)
{
    fs::create_directories(lock_path_);
    backdate_mtime(lock_path_, std::chrono::hours(1));
    EXPECT_EQ(Run({"--path", lock_path_, "--poll-ms", "10", "--stale-ms", "60", "--on-stale",
                   "break", "--", "/bin/true"}),
              0)
        << proc_->get_stderr();
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("breaking stale lock"));
    EXPECT_FALSE(fs::exists(lock_path_));
}

// The planted lock would only turn stale after the default second.
TEST_F(DirLockRunTest, TimesOutWaiting)
{
    fs::create_directories(lock_path_);
    EXPECT_EQ(Run({"--path", lock_path_, "--timeout-ms", "200", "--", "/bin/true"}), 4);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("gave up waiting"));
    EXPECT_TRUE(fs::is_directory(lock_path_));
}

TEST_F(DirLockRunTest, UsageErrors)
{
    EXPECT_EQ(Run({"--path", lock_path_}), 2);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("no command given"));

    EXPECT_EQ(Run({"--bogus", "x", "--", "/bin/true"}), 2);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("unknown argument"));

    EXPECT_EQ(Run({"--", "/bin/true"}), 2);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("--path <dir> is required"));

    EXPECT_EQ(Run({"--path", lock_path_, "--on-stale", "sometimes", "--", "/bin/true"}), 2);
    EXPECT_EQ(Run({"--path", lock_path_, "--poll-ms", "ten", "--", "/bin/true"}), 2);
    EXPECT_EQ(Run({"--path", lock_path_, "--poll-ms", "0", "--", "/bin/true"}), 2);
    EXPECT_EQ(Run({"--path", lock_path_, "--poll-ms", "9223372036854775807", "--", "/bin/true"}),
              2);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("must be at most"));
    // Heartbeat not faster than the stale duration.
    EXPECT_EQ(Run({"--path", lock_path_, "--update-ms", "500", "--stale-ms", "500", "--",
                   "/bin/true"}),
              2);
    EXPECT_FALSE(fs::exists(lock_path_));
}

TEST_F(DirLockRunTest, HelpPrintsUsage)
{
    EXPECT_EQ(Run({"--help"}), 0);
    EXPECT_THAT(proc_->get_stdout(), HasSubstr("Usage:"));
}

TEST_F(DirLockRunTest, ReadsConfigFile)
{
    const std::string config_path = (*temp_dir_ / "lock.json").string();
    const std::string log_path = (*temp_dir_ / "run.log").string();
    {
        std::ofstream cfg(config_path);
        cfg << R"({ "lock": { "path": ")" << lock_path_
            << R"(", "poll_interval_ms": 5 }, "logging": { "level": "debug", "file": ")"
            << log_path << R"(" } })";
    }
    EXPECT_EQ(Run({"--config", config_path, "--", "/bin/sh", "-c", "exit 0"}), 0)
        << proc_->get_stderr();

    std::string contents;
    ASSERT_TRUE(read_file_contents(log_path, contents));
    EXPECT_THAT(contents, HasSubstr("DirLock: acquired"));
    EXPECT_THAT(contents, HasSubstr("[DEBUG ]"));
    EXPECT_FALSE(fs::exists(lock_path_));
}

TEST_F(DirLockRunTest, CommandLineOverridesConfig)
{
    const std::string config_path = (*temp_dir_ / "lock.json").string();
    const std::string other_lock = (*temp_dir_ / "from-config.lock").string();
    {
        std::ofstream cfg(config_path);
        cfg << R"({ "lock": { "path": ")" << other_lock << R"(" } })";
    }
    const std::string script = "test -d '" + lock_path_ + "' && test ! -e '" + other_lock + "'";
    EXPECT_EQ(Run({"--config", config_path, "--path", lock_path_, "--", "/bin/sh", "-c", script}),
              0)
        << proc_->get_stderr();
}

TEST_F(DirLockRunTest, BadConfigFile)
{
    const std::string config_path = (*temp_dir_ / "broken.json").string();
    {
        std::ofstream cfg(config_path);
        cfg << "{ not json";
    }
    EXPECT_EQ(Run({"--config", config_path, "--", "/bin/true"}), 2);
    EXPECT_THAT(proc_->get_stderr(), HasSubstr("Config error"));
}
