#pragma once
/**
 * @file sink.hpp
 * @brief Log record and the destination interface the Logger writes to.
 *
 * Every sink renders a record as one line:
 *
 *     [2026-01-31 18:04:05.123456] [WARN  ] [140211] hub 'den' did not answer
 *
 * A record written on the caller's thread (the logger has already shut down)
 * carries `direct:` in front of the thread id.
 */
#include "hbl_base.hpp"

namespace hublink::utils
{

struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    int level; ///< A Logger::Level value.
    fmt::memory_buffer body;
};

class Sink
{
  public:
    enum class WriteMode
    {
        Queued, ///< From the logger's worker thread.
        Direct  ///< From the calling thread, bypassing the queue.
    };

    virtual ~Sink() = default;

    /// Throws std::runtime_error when the destination rejects the line.
    virtual void write(const LogRecord &record, WriteMode mode) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    /// "TRACE" ... "SYSTEM", or "UNK" for a value outside Logger::Level.
    static const char *level_name(int level) noexcept;
    static std::string format_line(const LogRecord &record, WriteMode mode);
};

} // namespace hublink::utils
