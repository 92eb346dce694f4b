/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace printing for comphub::debug::print_stack_trace()
 *
 * Macro assumptions:
 * - COMPHUB_IS_POSIX : defined for POSIX-like platforms (Linux, macOS, FreeBSD)
 *
 * Symbol resolution is done in-process with dladdr and the C++ ABI demangler;
 * no external symbolizer is spawned.
 */

#include "cph_base.hpp"

#if defined(COMPHUB_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

#include <cstdio>
#include <cstdlib>
#include <new>

namespace comphub::debug
{

#if defined(COMPHUB_IS_POSIX)
namespace
{

// Returns the demangled form of `mangled`, or `mangled` itself when demangling fails.
std::string demangle(const char *mangled)
{
    if (mangled == nullptr)
    {
        return "??";
    }
    int status = 0;
    char *demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && demangled != nullptr)
    {
        std::string out(demangled);
        std::free(demangled);
        return out;
    }
    std::free(demangled);
    return mangled;
}

} // namespace
#endif

void print_stack_trace() noexcept
{
    try
    {
#if defined(COMPHUB_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        const int frames = ::backtrace(callstack, kMaxFrames);

        fmt::print(stderr, "Stack Trace (most recent call first):\n");
        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < frames; ++i)
        {
            Dl_info info{};
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            if (::dladdr(callstack[i], &info) != 0 && info.dli_sname != nullptr)
            {
                const auto offset = addr - reinterpret_cast<uintptr_t>(info.dli_saddr);
                fmt::print(stderr, "  #{:02}  {:#018x}  {} + {:#x}  ({})\n", i, addr,
                           demangle(info.dli_sname), offset,
                           info.dli_fname ? comphub::format_tools::filename_only(info.dli_fname)
                                          : std::string_view("?"));
            }
            else
            {
                fmt::print(stderr, "  #{:02}  {:#018x}  [symbol unknown]  ({})\n", i, addr,
                           info.dli_fname ? comphub::format_tools::filename_only(info.dli_fname)
                                          : std::string_view("?"));
            }
        }
        std::fflush(stderr);
#else
        fmt::print(stderr, "  [Stack trace not available on this platform]\n");
#endif
    }
    catch (const fmt::format_error &e)
    {
        std::fputs("Error: Stack trace generation failed with fmt::format_error.\n", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Error: Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Error: Stack trace generation failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace comphub::debug
