// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines COMPHUB_IS_POSIX before any platform-conditional includes.
#include "cph_platform.hpp"

#include <filesystem>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for the comphub test suites: stderr capture, file
 *        reading, temporary paths and a barrier-started thread racer.
 */

#if COMPHUB_IS_POSIX
#include <fcntl.h>
#include <unistd.h>
#else              // Windows
#include <cstdio>  // for _fileno, stderr
#include <fcntl.h> // For _O_BINARY
#include <io.h>
#define STDERR_FILENO _fileno(stderr)
#endif

#include "gtest/gtest.h"

#include "cph_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace comphub::tests::helper
{

/**
 * @brief Redirects a file descriptor (usually stderr) into a pipe until
 *        `GetOutput()` restores it and returns what was written.
 * Keep captured output small: the pipe is only drained in `GetOutput()`.
 */
class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture) : fd_to_capture_(fd_to_capture), original_fd_(-1)
    {
#if COMPHUB_IS_POSIX
        if (pipe(pipe_fds_) != 0)
            return;
        original_fd_ = dup(fd_to_capture_);
        dup2(pipe_fds_[1], fd_to_capture_);
        close(pipe_fds_[1]);
#else // Windows
        if (_pipe(pipe_fds_, 4096, _O_BINARY) != 0)
            return;
        original_fd_ = _dup(fd_to_capture_);
        _dup2(pipe_fds_[1], fd_to_capture_);
        _close(pipe_fds_[1]);
#endif
    }

    ~StringCapture() { restore(); }

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    std::string GetOutput()
    {
        fflush(stderr);
        restore();

        std::string output;
        std::vector<char> buffer(1024);
#if COMPHUB_IS_POSIX
        ssize_t bytes_read;
        while ((bytes_read = read(pipe_fds_[0], buffer.data(), buffer.size())) > 0)
        {
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
        close(pipe_fds_[0]);
#else // Windows
        int bytes_read;
        while ((bytes_read = _read(pipe_fds_[0], buffer.data(),
                                   static_cast<unsigned int>(buffer.size()))) > 0)
        {
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
        _close(pipe_fds_[0]);
#endif
        return output;
    }

  private:
    void restore()
    {
        if (original_fd_ == -1)
            return;
#if COMPHUB_IS_POSIX
        dup2(original_fd_, fd_to_capture_);
        close(original_fd_);
#else // Windows
        _dup2(original_fd_, fd_to_capture_);
        _close(original_fd_);
#endif
        original_fd_ = -1; // Mark as restored
    }

    int fd_to_capture_;
    int original_fd_;
    int pipe_fds_[2]{-1, -1};
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines in `text`, optionally only those containing
 *        `must_include` and not containing `must_exclude`.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until `expected` appears in it or `timeout` elapses.
 * @return True if the string was found.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/// A path under the system temp directory unique to this process; any stale file is removed.
fs::path unique_temp_path(const std::string &stem, const std::string &extension);

/**
 * @brief Sets an environment variable for the lifetime of the object and
 *        restores the previous value (or unsets it) afterwards.
 */
class ScopedEnv
{
  public:
    ScopedEnv(std::string name, const std::string &value);
    ~ScopedEnv();

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string name_;
    std::optional<std::string> previous_;
};

// ============================================================================
// ThreadRacer: start N threads at once
// ============================================================================

/**
 * @brief Runs N threads simultaneously to test concurrent behavior.
 *
 * All threads start at the same time (synchronized via a barrier).
 * Any exception thrown by a thread is captured and available from exceptions().
 *
 * @code
 *   ThreadRacer racer(8);
 *   ASSERT_TRUE(racer.race([&](int thread_id) {
 *       auto inst = registry.get_or_create("cache", builder);
 *   }));
 * @endcode
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /// @return true if all threads completed without throwing.
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    // Spin until all threads are ready
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();

        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

} // namespace comphub::tests::helper
