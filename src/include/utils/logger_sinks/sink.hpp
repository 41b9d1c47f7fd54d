#pragma once

#include "dlk_base.hpp"

namespace dirlock::utils
{

// A single log event as seen by the worker thread.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Logger::Level as int, so sinks do not need logger.hpp.
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination. Only the logger worker calls it.
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace dirlock::utils
