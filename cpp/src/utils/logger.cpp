/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous command-queue logger.
 ******************************************************************************/

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "cph_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace comphub::format_tools;

namespace comphub::utils
{

enum class LoggerState
{
    Initialized,
    ShuttingDown,
    Shutdown
};

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on their own thread so a slow or
 *        throwing callback can never stall the logger worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : m_shutdown_requested(false)
    {
        m_worker = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (m_shutdown_requested.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            m_queue.push_back(std::move(fn));
        }
        m_cv.notify_one();
    }

    void shutdown()
    {
        if (m_shutdown_requested.exchange(true))
        {
            return;
        }
        m_cv.notify_one();
        if (m_worker.joinable())
        {
            m_worker.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(m_mutex);
                m_cv.wait(ul, [this] { return m_shutdown_requested.load() || !m_queue.empty(); });
                if (m_shutdown_requested.load() && m_queue.empty())
                {
                    return;
                }
                fn = std::move(m_queue.front());
                m_queue.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                comphub::debug::debug_msg("Logger write-error callback threw: {}", e.what());
            }
            catch (...)
            {
                comphub::debug::debug_msg("Logger write-error callback threw a non-standard exception");
            }
        }
    }

    std::deque<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_shutdown_requested;
};

// ============================================================================
// Commands
// ============================================================================

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

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand, SetErrorCallbackCommand>;

namespace
{

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &e)
    {
        // Already satisfied; the waiter has its answer.
        CPH_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = comphub::platform::get_pid(),
                      .thread_id = comphub::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

// ============================================================================
// Logger::Impl
// ============================================================================

struct Logger::Impl
{
    Impl();
    ~Impl();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &message);
    void shutdown();
    bool install_sink(std::function<std::unique_ptr<Sink>()> make_sink, const char *sink_name);

    std::function<void(const std::string &)> m_error_callback; // worker thread only
    std::thread m_worker_thread;
    std::unique_ptr<Sink> m_sink;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> m_queue;
    std::condition_variable m_cv;
    std::mutex m_queue_mutex;
    std::mutex m_sink_mutex;
    CallbackDispatcher m_callback_dispatcher;
    std::atomic<Logger::Level> m_level{Logger::Level::L_INFO};
    std::atomic<LoggerState> m_state{LoggerState::Initialized};
    std::atomic<bool> m_shutdown_requested{false};
    std::atomic<bool> m_shutdown_completed{false};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : m_sink(std::make_unique<ConsoleSink>())
{
    m_worker_thread = std::thread(&Logger::Impl::worker_loop, this);
}

Logger::Impl::~Impl()
{
    shutdown();
}

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
    if (m_shutdown_requested.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (m_shutdown_requested.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = m_queue.size();
        const size_t max_queue_size_soft = m_max_queue_size;
        const size_t max_queue_size_hard = m_max_queue_size * 2;
        const bool is_message = std::holds_alternative<LogMessage>(cmd);

        if (current_queue_size >= max_queue_size_hard ||
            (is_message && current_queue_size >= max_queue_size_soft))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        m_queue.emplace_back(std::move(cmd));
    }
    m_cv.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (m_error_callback)
    {
        auto cb = m_error_callback;
        m_callback_dispatcher.post([cb, message]() { cb(message); });
    }
    else
    {
        CPH_DEBUG("Logger error with no write-error callback installed: {}", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_shutdown_requested.load(); });
            local_queue.swap(m_queue);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration_cast<std::chrono::duration<double>>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }
        }

        // Only the last sink switch in a batch takes effect; earlier ones report false.
        std::ptrdiff_t last_set_sink_idx = -1;
        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[i]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(local_queue.size()); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (m_sink && msg->level >= static_cast<int>(m_level.load(std::memory_order_relaxed)))
                    {
                        m_sink->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [&, this, i](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            if (i != last_set_sink_idx)
                            {
                                promise_set_safe(arg.promise, false);
                                return;
                            }
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            const std::string old_desc = m_sink ? m_sink->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (m_sink)
                            {
                                m_sink->write(make_internal_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Switching log sink to: {}", new_desc)));
                                m_sink->flush();
                            }
                            m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
                            m_sink = std::move(arg.new_sink);
                            if (m_sink)
                            {
                                m_sink->write(make_internal_message(
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
                                if (m_sink)
                                {
                                    m_sink->flush();
                                }
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            m_error_callback = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (m_sink)
            {
                try
                {
                    m_sink->write(make_internal_message(
                        Logger::Level::L_WARNING,
                        make_buffer("Logger dropped {} messages over {:.2f}s due to full queue.",
                                    dropped_count, dropping_duration_s)));
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
        }

        local_queue.clear();

        if (m_shutdown_requested.load())
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            if (!m_queue.empty())
            {
                lock.unlock();
                continue; // drain what arrived between the swap and the shutdown request
            }

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (m_sink)
            {
                try
                {
                    m_sink->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                        make_buffer("Logger is shutting down.")));
                    m_sink->flush();
                }
                catch (const std::exception &e)
                {
                    CPH_DEBUG("Logger final write failed: {}", e.what());
                }
            }
            m_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (m_shutdown_completed.load() || m_shutdown_requested.exchange(true))
    {
        return;
    }
    m_state.store(LoggerState::ShuttingDown, std::memory_order_release);
    m_cv.notify_one();
    if (m_worker_thread.joinable())
    {
        m_worker_thread.join();
    }
    m_callback_dispatcher.shutdown();
    m_shutdown_completed.store(true);
}

bool Logger::Impl::install_sink(std::function<std::unique_ptr<Sink>()> make_sink, const char *sink_name)
{
    if (m_shutdown_requested.load())
        return false;
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        enqueue_command(SetSinkCommand{make_sink(), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create {}: {}", sink_name, e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
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

bool Logger::set_console()
{
    return pImpl->install_sink([] { return std::make_unique<ConsoleSink>(); }, "ConsoleSink");
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    return pImpl->install_sink([&] { return std::make_unique<FileSink>(utf8_path, use_flock); },
                               "FileSink");
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

bool Logger::is_shut_down() const noexcept
{
    return pImpl->m_state.load(std::memory_order_acquire) != LoggerState::Initialized;
}

void Logger::flush()
{
    // An enqueue rejected during shutdown resolves the promise to false, so this never hangs.
    if (pImpl->m_shutdown_requested.load())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->m_level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->m_level.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->m_queue_mutex);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_queue_mutex);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (pImpl->m_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->m_level.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        return pImpl->enqueue_command(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        CPH_DEBUG("Logger::enqueue_log failed: {}", e.what());
        return false;
    }
}

void Logger::log_string(Level lvl, std::string body) noexcept
{
    if (!should_log(lvl))
        return;
    try
    {
        (void)enqueue_log(lvl, make_buffer("{}", body));
    }
    catch (const std::exception &e)
    {
        CPH_DEBUG("Logger::log_string failed: {}", e.what());
    }
}

} // namespace comphub::utils
