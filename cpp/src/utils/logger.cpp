/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "hbl_service.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace hublink::format_tools;

namespace hublink::utils
{

namespace
{
enum class LoggerState
{
    Running,
    ShuttingDown,
    Shutdown
};

LogRecord make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogRecord{.timestamp = std::chrono::system_clock::now(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // namespace

/**
 * @class CallbackDispatcher
 * @brief Executes user-provided callbacks on a separate thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[hublink] Logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogRecord, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// Each promise is created by exactly one API call and fulfilled exactly once by the worker.
template <typename T> void promise_set(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (p)
        p->set_value(std::move(value));
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void write_to_sink(LogRecord &&msg);
    void report_error(std::string message);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::unique_ptr<Sink> sink_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex shutdown_mutex_;
    CallbackDispatcher callback_dispatcher_;
    std::thread worker_thread_;
    size_t max_queue_size_{10000};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<LoggerState> state_{LoggerState::Running};
    std::atomic<size_t> messages_dropped_{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

Logger::Impl::~Impl()
{
    shutdown();
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogRecord>)
            {
                promise_set(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (state_.load(std::memory_order_acquire) != LoggerState::Running)
        {
            reject_command(cmd);
            return false;
        }
        if (queue_.size() >= max_queue_size_ && std::holds_alternative<LogRecord>(cmd))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::write_to_sink(LogRecord &&msg)
{
    try
    {
        sink_->write(msg, Sink::WriteMode::Queued);
    }
    catch (const std::exception &e)
    {
        report_error(fmt::format("Logger sink '{}' write failed: {}", sink_->description(),
                                 e.what()));
    }
}

void Logger::Impl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[hublink] {}\n", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock,
                     [this]
                     {
                         return !queue_.empty() ||
                                state_.load(std::memory_order_acquire) != LoggerState::Running;
                     });
            local_queue.swap(queue_);
            stopping = state_.load(std::memory_order_acquire) != LoggerState::Running;
        }

        if (const size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed);
            dropped > 0)
        {
            write_to_sink(make_message(
                Logger::Level::L_WARNING,
                make_buffer("Logger queue overflow: {} messages were dropped.", dropped)));
        }

        for (auto &cmd : local_queue)
        {
            if (auto *msg = std::get_if<LogRecord>(&cmd))
            {
                if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                {
                    write_to_sink(std::move(*msg));
                }
                continue;
            }

            std::visit(
                [this](auto &&arg)
                {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, SetSinkCommand>)
                    {
                        const std::string old_desc = sink_->description();
                        const std::string new_desc = arg.new_sink->description();
                        write_to_sink(make_message(
                            Logger::Level::L_SYSTEM,
                            make_buffer("Switching log sink to: {}", new_desc)));
                        sink_->flush();
                        sink_ = std::move(arg.new_sink);
                        write_to_sink(make_message(
                            Logger::Level::L_SYSTEM,
                            make_buffer("Log sink switched from: {}", old_desc)));
                        promise_set(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                    {
                        write_to_sink(make_message(Logger::Level::L_ERROR,
                                                   make_buffer("{}", arg.error_message)));
                        report_error(arg.error_message);
                        promise_set(arg.promise, false);
                    }
                    else if constexpr (std::is_same_v<T, FlushCommand>)
                    {
                        sink_->flush();
                        promise_set(arg.promise, true);
                    }
                    else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                    {
                        error_callback_ = std::move(arg.callback);
                        promise_set(arg.promise, true);
                    }
                },
                cmd);
        }
        local_queue.clear();

        if (stopping)
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                // Commands that raced with shutdown() are processed before exiting.
                continue;
            }
            break;
        }
    }

    write_to_sink(make_message(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down.")));
    sink_->flush();
}

void Logger::Impl::shutdown()
{
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    if (state_.load(std::memory_order_acquire) == LoggerState::Shutdown)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        state_.store(LoggerState::ShuttingDown, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    state_.store(LoggerState::Shutdown, std::memory_order_release);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::is_running() const noexcept
{
    return pImpl->state_.load(std::memory_order_acquire) == LoggerState::Running;
}

bool Logger::set_console()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    std::unique_ptr<Sink> sink;
    std::string error;
    try
    {
        sink = std::make_unique<FileSink>(utf8_path);
    }
    catch (const std::exception &e)
    {
        error = fmt::format("Failed to create FileSink: {}", e.what());
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (sink)
        pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    else
        pImpl->enqueue_command(SinkCreationErrorCommand{std::move(error), promise});
    return future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warn" || lower == "warning")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->max_queue_size_ = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->max_queue_size_;
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    Command cmd{make_message(lvl, std::move(body))};
    if (pImpl->state_.load(std::memory_order_acquire) == LoggerState::Running)
    {
        // enqueue_command only moves from cmd when it accepts it.
        if (pImpl->enqueue_command(std::move(cmd)))
            return;
        if (pImpl->state_.load(std::memory_order_acquire) == LoggerState::Running)
            return; // dropped on overflow; the worker reports the count
    }
    // After shutdown the message goes straight to stderr.
    const auto &msg = std::get<LogRecord>(cmd);
    try
    {
        ConsoleSink{}.write(msg, Sink::WriteMode::Direct);
    }
    catch (const std::exception &e)
    {
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

} // namespace hublink::utils
