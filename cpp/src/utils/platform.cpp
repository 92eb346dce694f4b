/**
 * @file platform.cpp
 * @brief OS-specific implementations behind the `comphub::platform` API.
 *
 * Process and thread identifiers feed the logger's line prefix. Each query has
 * one branch per supported platform, selected by the COMPHUB_PLATFORM_* macros.
 */
#include "cph_base.hpp"

#include <functional>
#include <thread>

#if defined(COMPHUB_IS_POSIX)
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(COMPHUB_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace comphub::platform
{

uint64_t get_pid()
{
#if defined(COMPHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

uint64_t get_native_thread_id() noexcept
{
#if defined(COMPHUB_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    // No native id available: a stable hash of the std::thread id.
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

} // namespace comphub::platform
