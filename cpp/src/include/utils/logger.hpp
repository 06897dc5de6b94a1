/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 * 1.  **Non-Blocking API**: Calls from application threads (e.g. `LOGGER_INFO(...)`)
 *     format the message and push a command object into a mutex-guarded queue.
 * 2.  **Asynchronous Worker Thread**: A single background thread is the sole
 *     consumer of the command queue. It performs all I/O and owns the active sink.
 * 3.  **Sink Abstraction**: `Sink` defines write/flush/description. `ConsoleSink`
 *     (stderr, the default) and `FileSink` (append-only) are provided.
 * 4.  **Graceful shutdown**: `shutdown()` drains the queue and joins the worker.
 *     Messages logged afterwards are written synchronously to stderr so that late
 *     diagnostics from destructors are not lost.
 *
 * The worker is started lazily on the first call to `instance()`. The composition
 * root (or test entry point) calls `shutdown()` before exiting.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Discovery: hub '{}' found at {}", hub.name, hub.address);
 *
 * auto &logger = hublink::utils::Logger::instance();
 * logger.set_logfile("/var/log/hublink.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown(); // Blocks until all logs are written
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "hublink_core_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hublink::utils
{

class HUBLINK_CORE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor. Starts the worker thread on first use.
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink switches are executed in order by the worker thread; these calls block
    // until the switch has been applied.

    /**
     * @brief Switch logging to the console (stderr).
     * @return true once the sink is active; false after shutdown.
     */
    bool set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @param utf8_path Path to the log file. Parent directories are created.
     * @return true once the sink is active; false if the file cannot be opened
     *         (the previous sink stays active and the write-error callback fires).
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Gracefully shuts down the logger.
     *
     * Blocks until the worker has written every queued message and terminated.
     * Idempotent: later calls return immediately.
     */
    void shutdown();

    /**
     * @brief Waits until every message queued before this call has been written.
     */
    void flush();

    [[nodiscard]] bool is_running() const noexcept;

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
     * @return nullopt for any other string (case-insensitive match).
     */
    [[nodiscard]] static std::optional<Level> level_from_string(std::string_view name) noexcept;

    /**
     * @brief Sets a callback invoked upon a sink error.
     *
     * The callback runs on a dedicated dispatcher thread, so it may itself log
     * without dead-locking the worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// Upper bound of queued messages before new log messages are dropped.
    void set_max_queue_size(size_t max_size);
    [[nodiscard]] size_t get_max_queue_size() const;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    // --- Runtime Path ---
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <typename... Args> void debug_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void error_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    // Enqueues a formatted message (or writes it to stderr after shutdown).
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    [[nodiscard]] bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        enqueue_log(lvl, std::move(mb));
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    fmt::memory_buffer mb;
    try
    {
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    }
    catch (const std::exception &ex)
    {
        mb.clear();
        fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
    }
    enqueue_log(lvl, std::move(mb));
}

} // namespace hublink::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::hublink::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::hublink::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::hublink::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::hublink::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::hublink::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::hublink::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_DEBUG_RT(fmt, ...)                                                                  \
    ::hublink::utils::Logger::instance().debug_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::hublink::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::hublink::utils::Logger::instance().warn_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::hublink::utils::Logger::instance().error_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
