#include "dlk_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace dirlock::utils
{

FileSink::FileSink(const std::string &path, bool use_flock) : m_path(path), m_use_flock(use_flock)
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, ec.message()));
    }
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void FileSink::write(const LogMessage &msg)
{
    if (m_fd == -1)
        return;

    const std::string line = format_logmsg(msg);

    if (m_use_flock)
    {
        // Advisory only, but every dirlock process writing this file honours it.
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, line.data(), line.size());
    const int write_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }

    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != line.size())
    {
        throw std::system_error(write_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
}

void FileSink::flush()
{
    if (m_fd != -1)
    {
        ::fsync(m_fd);
    }
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace dirlock::utils
