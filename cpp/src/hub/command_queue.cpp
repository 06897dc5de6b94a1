#include "hbl_hub.hpp"

#include <algorithm>
#include <future>
#include <thread>

namespace hublink::hub
{

CommandQueue::CommandQueue(CommandExecutor executor, CommandQueueConfig config)
    : m_executor(std::move(executor)), m_config(config)
{
    if (!m_executor)
        throw HubError(ErrorCategory::Validation, "command_queue", "no command executor given");
    if (m_config.max_concurrent == 0 || m_config.max_queue_size == 0)
    {
        throw HubError(ErrorCategory::Validation, "command_queue",
                       fmt::format("invalid limits (max_concurrent={}, max_queue_size={})",
                                   m_config.max_concurrent, m_config.max_queue_size));
    }
    m_workers.reserve(m_config.max_concurrent);
    for (size_t i = 0; i < m_config.max_concurrent; ++i)
        m_workers.emplace_back([this, i] { worker_loop(i); });
    LOGGER_DEBUG("CommandQueue: started {} worker(s), capacity {}", m_config.max_concurrent,
                 m_config.max_queue_size);
}

CommandQueue::~CommandQueue()
{
    shutdown();
}

// ============================================================================
// Public API
// ============================================================================

CommandTicket CommandQueue::enqueue(CommandRequest request)
{
    CommandTicket ticket;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown)
            throw HubError(ErrorCategory::Queue, "enqueue", "command queue is shut down");
        if (m_pending.size() >= m_config.max_queue_size)
        {
            LOGGER_WARN("CommandQueue: rejecting command '{}', queue full ({} entries)",
                        request.command.id, m_pending.size());
            throw HubError(ErrorCategory::Queue, "enqueue",
                           fmt::format("command queue is full (capacity {})",
                                       m_config.max_queue_size));
        }

        const uint64_t id = ++m_next_id;
        Entry entry;
        entry.result.request_id = id;
        entry.result.command = request.command;
        entry.result.status = CommandStatus::Queued;
        entry.result.queued_at = Clock::now();
        entry.request = std::move(request);
        entry.promise = std::make_shared<std::promise<CommandResult>>();

        ticket.id = id;
        ticket.result = entry.promise->get_future().share();

        LOGGER_DEBUG("CommandQueue: queued #{} '{}' for device '{}' (position {})", id,
                     entry.result.command.id, entry.result.command.device_id,
                     m_pending.size() + 1);
        m_entries.emplace(id, std::move(entry));
        m_pending.push_back(id);
    }
    m_cv.notify_one();
    return ticket;
}

size_t CommandQueue::cancel_all()
{
    std::vector<std::pair<CommandResult, CommandRequest>> cancelled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const uint64_t id : m_pending)
        {
            auto it = m_entries.find(id);
            if (it == m_entries.end())
                continue;
            CommandResult result = it->second.result;
            result.status = CommandStatus::Cancelled;
            result.completed_at = Clock::now();
            result.error = HubError(ErrorCategory::Queue, "cancel_all",
                                    fmt::format("command '{}' cancelled before it started",
                                                result.command.id));
            cancelled.emplace_back(std::move(result), it->second.request);
        }
        m_pending.clear();
    }
    if (!cancelled.empty())
        LOGGER_INFO("CommandQueue: cancelled {} pending command(s)", cancelled.size());
    for (auto &[result, request] : cancelled)
    {
        const uint64_t id = result.request_id;
        finish(id, std::move(result), request);
    }
    return cancelled.size();
}

std::optional<CommandResult> CommandQueue::get_result(uint64_t request_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(request_id);
    if (it == m_entries.end())
        return std::nullopt;
    return it->second.result;
}

QueueStatus CommandQueue::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QueueStatus status;
    status.queue_length = m_pending.size();
    status.executing = m_executing;
    for (const auto &[id, entry] : m_entries)
    {
        switch (entry.result.status)
        {
        case CommandStatus::Completed:
            ++status.completed;
            break;
        case CommandStatus::Failed:
        case CommandStatus::TimedOut:
            ++status.failed;
            break;
        case CommandStatus::Cancelled:
            ++status.cancelled;
            break;
        default:
            break;
        }
    }
    return status;
}

size_t CommandQueue::clear_completed()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto removed = std::erase_if(
        m_entries, [](const auto &item) { return is_terminal(item.second.result.status); });
    LOGGER_DEBUG("CommandQueue: cleared {} terminal result(s)", removed);
    return removed;
}

bool CommandQueue::forget(uint64_t request_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(request_id);
    if (it == m_entries.end() || !is_terminal(it->second.result.status))
        return false;
    m_entries.erase(it);
    return true;
}

void CommandQueue::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown && m_workers.empty())
            return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    cancel_all();
    m_cv.notify_all();
    for (auto &worker : m_workers)
    {
        if (worker.joinable())
            worker.join();
    }
    m_workers.clear();
    LOGGER_DEBUG("CommandQueue: shut down");
}

// ============================================================================
// Workers
// ============================================================================

void CommandQueue::worker_loop(size_t index)
{
    while (true)
    {
        uint64_t id = 0;
        CommandRequest request;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_shutdown || !m_pending.empty(); });
            if (m_pending.empty())
                break;
            id = m_pending.front();
            m_pending.pop_front();
            auto it = m_entries.find(id);
            if (it == m_entries.end())
                continue;
            ++m_executing;
            it->second.result.status = CommandStatus::Executing;
            it->second.result.started_at = Clock::now();
            request = it->second.request;
        }
        execute(id, std::move(request));
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_executing;
        }
    }
    LOGGER_TRACE("CommandQueue: worker {} exiting", index);
}

std::optional<HubError> CommandQueue::run_attempt(const Command &command,
                                                  std::chrono::milliseconds timeout)
{
    std::packaged_task<void()> task([this, &command, timeout] { m_executor(command, timeout); });
    auto future = task.get_future();
    std::thread attempt(std::move(task));

    const bool timed_out = future.wait_for(timeout) != std::future_status::ready;
    if (timed_out)
    {
        // The slot stays taken until the attempt returns: nothing else may reach the hub.
        LOGGER_WARN("CommandQueue: '{}' exceeded {}, waiting for the attempt to return",
                    command.id, format_tools::format_duration(timeout));
    }
    attempt.join();

    if (timed_out)
    {
        return HubError(ErrorCategory::Command, "execute_command",
                        fmt::format("command '{}' timed out after {}", command.id,
                                    format_tools::format_duration(timeout)),
                        "timeout");
    }
    try
    {
        future.get();
        return std::nullopt;
    }
    catch (const HubError &e)
    {
        return e;
    }
    catch (const std::exception &e)
    {
        return HubError(ErrorCategory::Command, "execute_command",
                        fmt::format("sending command '{}' failed", command.id), e.what());
    }
}

void CommandQueue::execute(uint64_t id, CommandRequest request)
{
    const Command &command = request.command;
    const auto timeout = request.timeout.value_or(m_config.default_timeout);
    const int retries = std::max(0, request.retries.value_or(m_config.default_retries));
    const int max_attempts = 1 + retries;
    const utils::ConstantBackoff backoff{m_config.retry_delay};

    LOGGER_INFO("CommandQueue: executing #{} '{}' on device '{}'", id, command.id,
                command.device_id);

    std::optional<HubError> last_error;
    bool every_attempt_timed_out = true;
    int attempts = 0;
    bool succeeded = false;

    for (int attempt = 0; attempt < max_attempts; ++attempt)
    {
        attempts = attempt + 1;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(id);
            if (it != m_entries.end())
                it->second.result.attempts = attempts;
        }
        LOGGER_DEBUG("CommandQueue: #{} attempt {}/{}", id, attempts, max_attempts);

        last_error = run_attempt(command, timeout);
        if (!last_error)
        {
            succeeded = true;
            break;
        }
        every_attempt_timed_out =
            every_attempt_timed_out && last_error->category() == ErrorCategory::Command &&
            last_error->cause() == "timeout";

        if (attempts < max_attempts)
        {
            LOGGER_WARN("CommandQueue: #{} attempt {}/{} failed, retrying: {}", id, attempts,
                        max_attempts, last_error->what());
            backoff(attempt);
        }
    }

    CommandResult result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it != m_entries.end())
            result = it->second.result;
        else
        {
            result.request_id = id;
            result.command = command;
        }
    }
    result.attempts = attempts;
    result.completed_at = Clock::now();

    if (succeeded)
    {
        result.status = CommandStatus::Completed;
        LOGGER_INFO("CommandQueue: #{} '{}' completed after {} attempt(s)", id, command.id,
                    attempts);
    }
    else
    {
        result.status = every_attempt_timed_out ? CommandStatus::TimedOut : CommandStatus::Failed;
        HubError error(ErrorCategory::Command, "execute_command",
                       fmt::format("command '{}' on device '{}' failed after {} attempt(s)",
                                   command.id, command.device_id, attempts),
                       last_error->what(), attempts);
        error.caused_by(last_error->cause_category().value_or(last_error->category()));
        LOGGER_ERROR("CommandQueue: #{} {}: {}", id, to_string(result.status), error.describe());
        result.error = std::move(error);
    }
    finish(id, std::move(result), request);
}

void CommandQueue::finish(uint64_t id, CommandResult result, const CommandRequest &request)
{
    std::shared_ptr<std::promise<CommandResult>> promise;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it != m_entries.end())
        {
            it->second.result = result;
            promise = it->second.promise;
        }
        prune_terminal_locked();
    }
    if (promise)
        promise->set_value(result);

    if (request.on_done)
    {
        try
        {
            request.on_done(result);
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("CommandQueue: completion callback of #{} threw: {}", id, e.what());
        }
    }
}

void CommandQueue::prune_terminal_locked()
{
    auto terminal = static_cast<size_t>(std::count_if(
        m_entries.begin(), m_entries.end(),
        [](const auto &item) { return is_terminal(item.second.result.status); }));
    // Ids grow with submission order, so the oldest results go first.
    for (auto it = m_entries.begin(); it != m_entries.end() && terminal > m_config.max_queue_size;)
    {
        if (is_terminal(it->second.result.status))
        {
            it = m_entries.erase(it);
            --terminal;
        }
        else
        {
            ++it;
        }
    }
}

} // namespace hublink::hub
