#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace dirlock::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a file.
 *
 * Uses a raw POSIX descriptor opened with `O_APPEND`, so every line is written by a single
 * `write(2)`. With `use_flock` the write is additionally bracketed by `flock(LOCK_EX)`, which
 * keeps lines from several processes sharing the same file intact.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /// @throws std::system_error if the line could not be written completely.
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock = false;
    int m_fd = -1;
};

} // namespace dirlock::utils
