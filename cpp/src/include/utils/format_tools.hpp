// Tools for formatting strings and timestamps
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "hublink_core_export.h"

namespace hublink::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
HUBLINK_CORE_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Milliseconds since the Unix epoch, the persisted form of every timestamp.
 */
HUBLINK_CORE_EXPORT int64_t to_epoch_ms(std::chrono::system_clock::time_point timestamp) noexcept;

/**
 * @brief Inverse of to_epoch_ms().
 */
HUBLINK_CORE_EXPORT std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) noexcept;

/**
 * @brief Human-readable duration ("250ms", "12.5s", "3h04m").
 */
HUBLINK_CORE_EXPORT std::string format_duration(std::chrono::milliseconds d);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 * @tparam Args Argument types for the format string.
 * @param fmt_str The `fmt`-style format string.
 * @param args The arguments to format.
 * @return A `fmt::memory_buffer` containing the formatted result.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

} // namespace hublink::format_tools
