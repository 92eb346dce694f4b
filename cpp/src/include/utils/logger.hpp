/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging service used across comphub.
 *
 * **Command-Queue Pattern**
 * Calls from application threads (`LOGGER_INFO(...)`) only format the message
 * body and push a command onto a bounded queue. A single worker thread is the
 * sole consumer of that queue: it performs all I/O and owns the active `Sink`.
 * Control operations (switching sinks, flushing, installing an error callback)
 * travel through the same queue, so they are ordered with respect to the
 * messages around them.
 *
 * The worker starts the first time `Logger::instance()` is called and stops in
 * `shutdown()`, which drains whatever is queued. Logging after shutdown is a
 * silent no-op.
 *
 * **Usage**
 * ```cpp
 * #include "cph_service.hpp"
 * LOGGER_INFO("component '{}' created", name);
 *
 * auto &logger = comphub::utils::Logger::instance();
 * logger.set_logfile("/var/log/comphub.log");
 * logger.set_level(comphub::utils::Logger::Level::L_DEBUG);
 * logger.shutdown();
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "comphub_utils_export.h"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace comphub::utils
{

class COMPHUB_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---

    /**
     * @brief Switches logging to stderr.
     * @return `true` once the worker has installed the console sink.
     */
    bool set_console();

    /**
     * @brief Switches logging to a file opened in append mode.
     * @param utf8_path Path to the log file.
     * @param use_flock Take an advisory `flock` around each write (POSIX only).
     * @return `false` if the file could not be opened; the reason is delivered to
     *         the write-error callback, and the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = false);

    /**
     * @brief Drains the queue, writes a final system line and joins the worker.
     * Idempotent.
     */
    void shutdown();

    /// @return `true` once `shutdown()` has started.
    [[nodiscard]] bool is_shut_down() const noexcept;

    /**
     * @brief Blocks until every message queued before this call has been written
     *        and the sink flushed.
     */
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /**
     * @brief Installs a callback for sink creation and write failures.
     * The callback runs on a dedicated dispatcher thread, never on the worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// Soft limit on queued log messages; commands may use up to twice this.
    void set_max_queue_size(size_t max_size);
    [[nodiscard]] size_t get_max_queue_size() const;

    /// Messages dropped because the queue was full, since the last sink switch.
    [[nodiscard]] size_t get_total_dropped_since_sink_switch() const;

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    /// Enqueues an already formatted message body.
    void log_string(Level lvl, std::string body) noexcept;

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            log_string(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace comphub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::comphub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::comphub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::comphub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::comphub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::comphub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::comphub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
