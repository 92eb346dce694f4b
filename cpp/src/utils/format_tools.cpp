// format_tools.cpp
#include "cph_base.hpp"

namespace comphub::format_tools
{

// --- Helper: formatted local time with sub-second resolution ---
// If the build system detected fmt chrono subseconds support (HAVE_FMT_CHRONO_SUBSECONDS),
// fmt formats the microsecond-truncated time_point in one step. Otherwise the fractional
// part is computed and appended manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
#if defined(HAVE_FMT_CHRONO_SUBSECONDS) && HAVE_FMT_CHRONO_SUBSECONDS
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tp_us);
#else
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
#endif
}

std::string quoted_list(const std::vector<std::string> &names)
{
    if (names.empty())
    {
        return "<none>";
    }
    fmt::memory_buffer mb;
    for (size_t i = 0; i < names.size(); ++i)
    {
        fmt::format_to(std::back_inserter(mb), "{}'{}'", i == 0 ? "" : ", ", names[i]);
    }
    return fmt::to_string(mb);
}

} // namespace comphub::format_tools
