// format_tools.cpp
#include "hbl_base.hpp"

namespace hublink::format_tools
{

// Formatted local time with sub-second resolution.
//  - If the build system detected fmt chrono subseconds support (HAVE_FMT_CHRONO_SUBSECONDS),
//    use single-step fmt formatting on a microsecond-truncated time_point.
//  - Otherwise, compute the fractional microsecond part and append it manually.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
#if defined(HAVE_FMT_CHRONO_SUBSECONDS) && HAVE_FMT_CHRONO_SUBSECONDS
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tp_us);
#else
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

int64_t to_epoch_ms(std::chrono::system_clock::time_point timestamp) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) noexcept
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

std::string format_duration(std::chrono::milliseconds d)
{
    const auto ms = d.count();
    if (ms < 1000)
        return fmt::format("{}ms", ms);
    if (ms < 60'000)
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    const auto total_min = ms / 60'000;
    if (total_min < 60)
        return fmt::format("{}m{:02}s", total_min, (ms / 1000) % 60);
    return fmt::format("{}h{:02}m", total_min / 60, total_min % 60);
}

} // namespace hublink::format_tools
