/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous command-queue logger.
 ******************************************************************************/

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "dlk_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace dirlock::format_tools;

namespace dirlock::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration calls before the lifecycle has started the worker are a programming error.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        DLK_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  function_name);
    }
    return state == LoggerState::Initialized;
}

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on their own thread.
 *
 * A callback that logs would otherwise re-enter the worker it is being called from.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[DLK] Logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &)
    {
        // Already satisfied; the waiter has its answer.
    }
}

static LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &message);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable() && !shutdown_requested_.load())
    {
        DLK_DEBUG("Logger destroyed without a prior shutdown; the lifecycle was not finalized.");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

// Commands that carry a promise are answered with `false` so their callers never block.
void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = queue_.size();
        const size_t max_queue_size_soft = m_max_queue_size;
        const size_t max_queue_size_hard = m_max_queue_size * 2;
        const bool is_log_message = std::holds_alternative<LogMessage>(cmd);

        // Log messages are dropped at the soft limit; control commands only at the hard one.
        if (current_queue_size >= max_queue_size_hard ||
            (is_log_message && current_queue_size >= max_queue_size_soft))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        DLK_DEBUG("Logger error with no error callback installed: {}", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                if (dropped_count > 0)
                {
                    dropping_duration_s =
                        std::chrono::duration_cast<std::chrono::duration<double>>(
                            std::chrono::system_clock::now() - m_dropping_since)
                            .count();
                }
            }

            if (shutdown_requested_.load())
            {
                g_logger_state.store(LoggerState::ShuttingDown, std::memory_order_release);
            }
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Switching log sink to: {}", new_desc)));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Log sink switched from: {}", old_desc)));
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            {
                                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                                if (sink_)
                                    sink_->flush();
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                // Unblock any waiter on a command that failed half way.
                reject_command(cmd);
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_message(
                        Logger::Level::L_WARNING,
                        make_buffer("Summary: the Logger dropped {} messages over {:.2f}s due to "
                                    "a full queue.",
                                    dropped_count, dropping_duration_s)));
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
        }

        local_queue.clear();

        if (shutdown_requested_.load())
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                // Late enqueues that raced with the shutdown request.
                lock.unlock();
                continue;
            }

            DLK_DEBUG("Logger worker thread shutting down.");
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                       make_buffer("Logger is shutting down.")));
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    DLK_DEBUG("Logger final write failed: {}", e.what());
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        pImpl->enqueue_command(
            SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        // Reported through the queue so it is ordered with the messages around it.
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    // enqueue_command rejects (and answers) the promise once shutdown has begun.
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::log_message(Level lvl, std::string body) noexcept
{
    if (!should_log(lvl))
        return false;
    return enqueue_log(lvl, std::move(body));
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        fmt::memory_buffer body;
        body.append(body_str.data(), body_str.data() + body_str.size());
        return pImpl->enqueue_command(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        // Allocation failure while building the message; the message is lost.
        return false;
    }
}

// ============================================================================
// Lifecycle integration
// ============================================================================

void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();

        int count = 0;
        while (count < 50 &&
               g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            count++;
        }
        if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            DLK_DEBUG("Logger shutdown timed out. Forcing shutdown state.");
        }
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("dirlock::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace dirlock::utils
