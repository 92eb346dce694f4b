#pragma once
/**
 * @file cph_platform.hpp
 * @brief Layer 0: Platform detection and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (COMPHUB_PLATFORM_WIN64, COMPHUB_IS_POSIX, etc.) should include
 * this. It is self-contained and can be included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)

#define COMPHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)
#define COMPHUB_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define COMPHUB_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define COMPHUB_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define COMPHUB_PLATFORM_UNKNOWN 1

#else
// Fallback detection
#if defined(_WIN64)
#define COMPHUB_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#define COMPHUB_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define COMPHUB_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define COMPHUB_PLATFORM_LINUX 1
#else
#define COMPHUB_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(COMPHUB_PLATFORM_WIN64)
#define COMPHUB_IS_WINDOWS 1
#undef COMPHUB_IS_POSIX
#elif defined(COMPHUB_PLATFORM_APPLE) || defined(COMPHUB_PLATFORM_FREEBSD) ||                      \
    defined(COMPHUB_PLATFORM_LINUX)
#undef COMPHUB_IS_WINDOWS
#define COMPHUB_IS_POSIX 1
#else
#undef COMPHUB_IS_WINDOWS
#undef COMPHUB_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses std::source_location, concepts, designated initializers and
// std::atomic<std::shared_ptr>. MSVC reports the standard through _MSVC_LANG
// unless /Zc:__cplusplus is enabled.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "comphub_utils_export.h"

namespace comphub::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
COMPHUB_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
COMPHUB_UTILS_EXPORT uint64_t get_pid();

} // namespace comphub::platform
