#include "lock_heartbeat.hpp"

namespace dirlock::utils
{

LockHeartbeat::LockHeartbeat(std::shared_ptr<LockFilesystem> filesystem,
                             std::filesystem::path path,
                             std::chrono::nanoseconds update_interval, LockLogSink log_sink)
    : m_filesystem(std::move(filesystem)), m_path(std::move(path)),
      m_update_interval(update_interval), m_log_sink(std::move(log_sink)),
      m_done_future(m_done.get_future())
{
}

LockHeartbeat::~LockHeartbeat()
{
    if (m_thread.joinable())
    {
        cancel();
        m_thread.join();
    }
}

void LockHeartbeat::start()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel_requested = false;
    }
    m_thread = std::thread(&LockHeartbeat::run, this);
}

void LockHeartbeat::cancel() noexcept
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel_requested = true;
    }
    m_cv.notify_all();
}

void LockHeartbeat::wait_done()
{
    if (m_done_future.valid())
    {
        m_done_future.wait();
    }
    if (m_thread.joinable())
    {
        m_thread.join();
    }
}

void LockHeartbeat::reset_done_signal()
{
    m_done = std::promise<void>();
    m_done_future = m_done.get_future();
}

void LockHeartbeat::run() noexcept
{
    auto signal_done = basics::make_scope_guard([this]() { m_done.set_value(); });

    try
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true)
        {
            if (m_cv.wait_for(lock, m_update_interval, [this] { return m_cancel_requested; }))
            {
                break;
            }
            lock.unlock();
            m_filesystem->touch(m_path);
            log(Logger::Level::L_TRACE,
                fmt::format("DirLock: heartbeat updated mtime path='{}'", m_path.string()));
            lock.lock();
        }
    }
    catch (const std::exception &e)
    {
        log(Logger::Level::L_ERROR,
            fmt::format("DirLock: heartbeat stopped, failed to update mtime path='{}' error='{}'",
                        m_path.string(), e.what()));
    }
}

void LockHeartbeat::log(Logger::Level lvl, const std::string &message) noexcept
{
    try
    {
        m_log_sink(lvl, message);
    }
    catch (const std::exception &e)
    {
        DLK_DEBUG("DirLock: heartbeat log sink threw: {}", e.what());
    }
}

} // namespace dirlock::utils
