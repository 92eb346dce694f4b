#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace comphub::utils
{

// One queued log event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Logger::Level as int, so sinks need not include logger.hpp
    fmt::memory_buffer body;
};

// Destination for formatted log lines. Only the logger worker thread calls into a sink.
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

} // namespace comphub::utils
