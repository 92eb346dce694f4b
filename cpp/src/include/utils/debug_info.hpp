/**
 * @file debug_info.hpp
 * @brief Provides cross-platform debugging utilities, including stack trace printing,
 *        panic handling for fatal errors, and debug messaging.
 *
 * This header defines a set of functions and macros within the `comphub::debug`
 * namespace designed for robust error reporting and debugging. It leverages `fmt`
 * for compile-time format string checks and `std::source_location` for automatic
 * source code location reporting.
 */
#pragma once

#include <cstdio>          // for fflush
#include <cstdlib>         // for std::abort
#include <fmt/format.h>    // for fmt::format_string, fmt::print, fmt::format
#include <source_location> // for std::source_location
#include <string>
#include <string_view>

#include "utils/format_tools.hpp" // for comphub::format_tools::filename_only

namespace comphub::debug
{

/**
 * @brief Renders a source location as `file:line:function`.
 */
inline std::string srcloc_to_str(std::source_location loc)
{
    return fmt::format("{}:{}:{}", comphub::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * On POSIX systems it uses `backtrace`, `dladdr` and `__cxa_demangle`. On other
 * platforms a short notice is printed instead. Errors during capture or symbol
 * resolution are reported to `stderr`.
 *
 * @warning Not async-signal-safe: it allocates and formats.
 */
COMPHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors. It formats and prints an error message to
 * `stderr` together with the source location where `panic` was called, then calls
 * `print_stack_trace()` and `std::abort()`.
 *
 * @tparam Args Variadic template arguments for the format string.
 * @param loc The source location where `panic` was called. Captured by `CPH_PANIC`.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", srcloc_to_str(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fputs("[PANIC] FATAL ERROR WHILE FORMATTING PANIC MESSAGE: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 *
 * @tparam Args Variadic template arguments for the format string.
 * @param fmt_str The `fmt`-style format string for the debug message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fputs("[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace comphub::debug

// ---------------- thin macros for convenience --------------

#ifndef CPH_LOC_HERE_STR
#define CPH_LOC_HERE_STR (::comphub::debug::srcloc_to_str(std::source_location::current()))
#endif

/**
 * @brief Macro for calling `comphub::debug::panic` with automatic source location.
 * @param fmt The `fmt`-style format string literal.
 * @param ... Variable arguments to be formatted into `fmt`.
 */
#ifndef CPH_PANIC
#define CPH_PANIC(fmt, ...)                                                                        \
    ::comphub::debug::panic(std::source_location::current(),                                       \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Macro for calling `comphub::debug::debug_msg`.
 * @details Compiled out unless `COMPHUB_ENABLE_DEBUG_MESSAGES` is defined.
 */
#ifndef CPH_DEBUG
#if defined(COMPHUB_ENABLE_DEBUG_MESSAGES)
#define CPH_DEBUG(fmt, ...) ::comphub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define CPH_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
