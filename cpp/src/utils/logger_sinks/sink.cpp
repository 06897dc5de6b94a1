#include "hbl_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <iterator>

namespace hublink::utils
{

const char *Sink::level_name(int level) noexcept
{
    static constexpr const char *kNames[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "SYSTEM"};
    if (level < 0 || level >= static_cast<int>(std::size(kNames)))
        return "UNK";
    return kNames[level];
}

std::string Sink::format_line(const LogRecord &record, WriteMode mode)
{
    return fmt::format("[{}] [{:<6}] [{}{}] {}\n", format_tools::formatted_time(record.timestamp),
                       level_name(record.level), mode == WriteMode::Direct ? "direct:" : "",
                       record.thread_id, fmt::to_string(record.body));
}

} // namespace hublink::utils
