/**
 * @file dirlock_run_main.cpp
 * @brief dirlock-run: run a command while holding a directory lock.
 *
 * ## Usage
 *
 *     dirlock-run --path /var/lock/nightly -- ./generate_report.sh --full
 *     dirlock-run --config lock.json -- make deploy
 *     dirlock-run --path /tmp/x/lock --stale-ms 2000 --on-stale break -- rsync ...
 *
 * Command-line values override those from `--config`.
 *
 * ## Exit codes
 *
 *     <n>   the command's own exit status (128 + signal if it was killed)
 *     2     usage or configuration error
 *     3     the lock is stale (with --on-stale fail)
 *     4     timed out waiting for the lock
 *     5     any other lock error (setup, internal)
 *     127   the command could not be executed
 */

#include "dlk_service.hpp"

#include <atomic>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace dirlock::utils;

namespace
{

constexpr int kExitUsage = 2;
constexpr int kExitStale = 3;
constexpr int kExitTimeout = 4;
constexpr int kExitLockError = 5;
constexpr int kExitExecFailed = 127;

// Child process currently running the command, for signal forwarding.
std::atomic<pid_t> g_child_pid{-1};
// Raised just before the mkdir that may take the lock, lowered once it is released again.
std::atomic<bool> g_defer_signals{false};
// A signal that arrived while deferring and no command was running, or 0.
std::atomic<int> g_pending_signal{0};

static_assert(std::atomic<pid_t>::is_always_lock_free && std::atomic<bool>::is_always_lock_free &&
                  std::atomic<int>::is_always_lock_free,
              "signal handler state must be lock-free");

// While the command runs, signals go to it. While the lock directory exists without a
// command running, the signal is remembered and acted on after release. Otherwise nothing
// is held and the signal just ends the process.
void forward_signal(int sig) noexcept
{
    const pid_t child = g_child_pid.load();
    if (child > 0)
    {
        ::kill(child, sig);
        return;
    }
    if (g_defer_signals.load())
    {
        g_pending_signal.store(sig);
        return;
    }
    std::_Exit(128 + sig);
}

// Nothing is held any more: a signal remembered meanwhile ends the process now.
void stop_deferring_signals() noexcept
{
    g_defer_signals.store(false);
    if (const int sig = g_pending_signal.exchange(0); sig != 0)
        std::_Exit(128 + sig);
}

// Defers signals across the mkdir that creates the lock directory, so that no signal can
// end the process between creating the directory and removing it again.
class SignalDeferringFilesystem : public PosixLockFilesystem
{
  public:
    bool create_directory_exclusive(const std::filesystem::path &path) override
    {
        g_defer_signals.store(true);
        auto not_taken = dirlock::basics::make_scope_guard([]() { stop_deferring_signals(); });
        const bool created = PosixLockFilesystem::create_directory_exclusive(path);
        if (created)
            not_taken.dismiss();
        return created;
    }

    std::string description() const override { return "posix (signal-deferring)"; }
};

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct RunArgs
{
    std::string config_path;
    std::string lock_path;
    std::optional<long long> poll_ms;
    std::optional<long long> update_ms;
    std::optional<long long> stale_ms;
    std::optional<long long> timeout_ms;
    std::string on_stale;
    std::string log_file;
    std::string log_level;
    std::vector<std::string> command;
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [options] -- COMMAND [ARGS...]\n\n"
        << "Options:\n"
        << "  --config <path>        JSON lock config (see lock_config.hpp)\n"
        << "  --path <dir>           Lock directory (required unless set in the config)\n"
        << "  --poll-ms <n>          Poll interval while waiting (default 10)\n"
        << "  --update-ms <n>        Heartbeat interval while holding\n"
        << "  --stale-ms <n>         Unchanged-mtime time after which a holder is stale\n"
        << "  --timeout-ms <n>       Give up after waiting this long (0 = never)\n"
        << "  --on-stale <policy>    fail | break | wait (default fail)\n"
        << "  --log-file <path>      Log to this file instead of stderr\n"
        << "  --log-level <level>    trace | debug | info | warning | error | system\n"
        << "  --help                 Show this message\n";
}

[[noreturn]] void usage_error(const char *prog, const std::string &message)
{
    std::cerr << "Error: " << message << "\n\n";
    print_usage(prog);
    std::exit(kExitUsage);
}

long long parse_number(const char *prog, std::string_view flag, std::string_view text)
{
    long long value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0)
        usage_error(prog, std::string(flag) + " expects a non-negative integer, got '" +
                              std::string(text) + "'");
    if (value > kMaxLockInterval.count())
        usage_error(prog, std::string(flag) + " must be at most " +
                              std::to_string(kMaxLockInterval.count()) + " milliseconds");
    return value;
}

RunArgs parse_args(int argc, char *argv[])
{
    RunArgs args;
    int i = 1;
    for (; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--")
        {
            ++i;
            break;
        }
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (i + 1 >= argc)
        {
            usage_error(argv[0], "missing value or unknown argument: " + std::string(arg));
        }
        const char *value = argv[i + 1];
        if (arg == "--config")
            args.config_path = value;
        else if (arg == "--path")
            args.lock_path = value;
        else if (arg == "--poll-ms")
            args.poll_ms = parse_number(argv[0], arg, value);
        else if (arg == "--update-ms")
            args.update_ms = parse_number(argv[0], arg, value);
        else if (arg == "--stale-ms")
            args.stale_ms = parse_number(argv[0], arg, value);
        else if (arg == "--timeout-ms")
            args.timeout_ms = parse_number(argv[0], arg, value);
        else if (arg == "--on-stale")
            args.on_stale = value;
        else if (arg == "--log-file")
            args.log_file = value;
        else if (arg == "--log-level")
            args.log_level = value;
        else
            usage_error(argv[0], "unknown argument: " + std::string(arg));
        ++i;
    }
    for (; i < argc; ++i)
    {
        args.command.emplace_back(argv[i]);
    }
    if (args.command.empty())
    {
        usage_error(argv[0], "no command given after '--'");
    }
    return args;
}

// Merges the config file (if any) with command-line overrides.
LockConfig build_config(const char *prog, const RunArgs &args)
{
    LockConfig cfg;
    if (!args.config_path.empty())
    {
        try
        {
            cfg = load_lock_config(args.config_path);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Config error: " << e.what() << "\n";
            std::exit(kExitUsage);
        }
    }

    if (!args.lock_path.empty())
        cfg.path = args.lock_path;
    if (cfg.path.empty())
        usage_error(prog, "--path <dir> is required (or 'lock.path' in --config)");

    auto positive = [prog](std::string_view flag, long long v)
    {
        if (v <= 0)
            usage_error(prog, std::string(flag) + " must be positive");
        return std::chrono::milliseconds(v);
    };
    if (args.poll_ms)
        cfg.options.poll_interval = positive("--poll-ms", *args.poll_ms);
    if (args.update_ms)
        cfg.options.update_interval = positive("--update-ms", *args.update_ms);
    if (args.stale_ms)
        cfg.options.stale_duration = positive("--stale-ms", *args.stale_ms);
    if (args.timeout_ms && *args.timeout_ms > 0)
        cfg.options.take_timeout = std::chrono::milliseconds(*args.timeout_ms);
    else if (args.timeout_ms)
        cfg.options.take_timeout.reset();
    if (!args.on_stale.empty())
    {
        auto policy = stale_policy_from_string(args.on_stale);
        if (!policy)
            usage_error(prog, "--on-stale must be one of fail, break, wait");
        cfg.on_stale = *policy;
    }
    if (!args.log_level.empty())
    {
        auto level = log_level_from_string(args.log_level);
        if (!level)
            usage_error(prog, "invalid --log-level '" + args.log_level + "'");
        cfg.log_level = *level;
    }
    if (!args.log_file.empty())
        cfg.log_file = args.log_file;
    return cfg;
}

// ---------------------------------------------------------------------------
// Running the command
// ---------------------------------------------------------------------------

int run_command(const std::vector<std::string> &command)
{
    std::vector<char *> child_argv;
    child_argv.reserve(command.size() + 1);
    for (const auto &s : command)
        child_argv.push_back(const_cast<char *>(s.c_str()));
    child_argv.push_back(nullptr);

    // Prepared before fork: the child may only use async-signal-safe calls.
    const std::string exec_failed_prefix = "dirlock-run: cannot execute '" + command[0] + "': ";

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        LOGGER_ERROR("dirlock-run: fork failed error='{}'", std::strerror(errno));
        return kExitExecFailed;
    }
    if (pid == 0)
    {
        ::execvp(child_argv[0], child_argv.data());
        const char *reason = std::strerror(errno);
        (void)!::write(STDERR_FILENO, exec_failed_prefix.data(), exec_failed_prefix.size());
        (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
        (void)!::write(STDERR_FILENO, "\n", 1);
        ::_exit(kExitExecFailed);
    }

    g_child_pid.store(pid);
    // A signal that came in while the child was being started is passed on now.
    if (const int sig = g_pending_signal.exchange(0); sig != 0)
        ::kill(pid, sig);
    LOGGER_DEBUG("dirlock-run: started '{}' pid={}", command[0], pid);

    int status = 0;
    pid_t waited = -1;
    do
    {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    g_child_pid.store(-1);

    if (waited < 0)
    {
        LOGGER_ERROR("dirlock-run: waitpid failed error='{}'", std::strerror(errno));
        return kExitExecFailed;
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return kExitExecFailed;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const RunArgs args = parse_args(argc, argv);
    const LockConfig cfg = build_config(argv[0], args);

    LifecycleGuard app_lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), DirLock::GetLifecycleModule()));

    auto &logger = Logger::instance();
    logger.set_level(cfg.log_level);
    if (!cfg.log_file.empty() && !logger.set_logfile(cfg.log_file, true))
    {
        std::cerr << "Error: cannot open log file '" << cfg.log_file << "'\n";
        return kExitUsage;
    }

    std::signal(SIGINT, forward_signal);
    std::signal(SIGTERM, forward_signal);
    std::signal(SIGHUP, forward_signal);

    int exit_code = kExitLockError;
    try
    {
        DirLockOptions options = cfg.options;
        options.filesystem = std::make_shared<SignalDeferringFilesystem>();
        DirLock lock(cfg.path, options);
        exit_code = lock.with_lock(make_stale_handler(cfg.on_stale, options.filesystem),
                                   [&args]()
                                   {
                                       // Signalled right after taking the lock: skip the command.
                                       if (const int sig = g_pending_signal.exchange(0); sig != 0)
                                           return 128 + sig;
                                       return run_command(args.command);
                                   });
    }
    catch (const StaleLockError &e)
    {
        std::cerr << "dirlock-run: " << e.what() << "\n";
        exit_code = kExitStale;
    }
    catch (const LockTimeoutError &e)
    {
        std::cerr << "dirlock-run: " << e.what() << "\n";
        exit_code = kExitTimeout;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        exit_code = kExitUsage;
    }
    catch (const std::exception &e)
    {
        // DirLockError (internal, invalid state) and filesystem_error setup failures.
        std::cerr << "dirlock-run: " << e.what() << "\n";
        exit_code = kExitLockError;
    }

    // Released (or never taken). A signal that arrived while the lock was held wins.
    g_defer_signals.store(false);
    if (const int sig = g_pending_signal.exchange(0); sig != 0)
        exit_code = 128 + sig;

    logger.flush();
    return exit_code;
}
