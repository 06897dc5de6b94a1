#pragma once
/**
 * @file command_queue.hpp
 * @brief Bounded FIFO command execution with per-attempt timeout and retry.
 *
 * Requests wait in a FIFO of at most `max_queue_size` entries and are started by
 * `max_concurrent` worker threads in submission order. A worker keeps a request
 * for all of its attempts, so a retried command never loses its slot.
 *
 * Each attempt runs the executor on a helper thread and races it against the
 * attempt timeout. An attempt that exceeds it counts as failed, but its worker
 * waits for it to return before retrying or taking the next request, so no two
 * attempts of one worker ever overlap. The executor bounds its own sends by
 * the timeout it is given. After the last failed attempt the result is
 * `TimedOut` when every attempt timed out, `Failed` otherwise.
 *
 * Every request produces exactly one terminal `CommandResult`, delivered through
 * its ticket's future and the optional `on_done` callback. At most
 * `max_queue_size` terminal results are kept for get_result(); older ones are
 * dropped first.
 */
#include "hub/hub_error.hpp"
#include "hub/hub_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace hublink::hub
{

struct CommandQueueConfig
{
    size_t max_queue_size{100};
    size_t max_concurrent{1};
    std::chrono::milliseconds default_timeout{std::chrono::seconds(5)};
    int default_retries{2};
    std::chrono::milliseconds retry_delay{100};
    std::chrono::milliseconds hold_duration{100};
};

struct CommandTicket
{
    uint64_t id{0};
    std::shared_future<CommandResult> result;
};

struct QueueStatus
{
    size_t queue_length{0};
    size_t executing{0};
    size_t completed{0};
    size_t failed{0}; ///< Failed or TimedOut.
    size_t cancelled{0};
};

/// Runs one attempt of a command; throws on failure.
using CommandExecutor =
    std::function<void(const Command &command, std::chrono::milliseconds attempt_timeout)>;

class HUBLINK_CORE_EXPORT CommandQueue
{
  public:
    explicit CommandQueue(CommandExecutor executor, CommandQueueConfig config = {});
    ~CommandQueue();

    CommandQueue(const CommandQueue &) = delete;
    CommandQueue &operator=(const CommandQueue &) = delete;

    /**
     * @brief Queues a request.
     * @throws HubError(Queue) when the queue is full or shut down.
     */
    CommandTicket enqueue(CommandRequest request);

    /// Cancels every not-yet-started request; returns how many were cancelled.
    size_t cancel_all();

    /// Latest known result (Queued/Executing included) of a request.
    [[nodiscard]] std::optional<CommandResult> get_result(uint64_t request_id) const;

    [[nodiscard]] QueueStatus status() const;

    /// Forgets terminal results; returns how many were removed.
    size_t clear_completed();

    /// Forgets one terminal result. False when unknown or still pending.
    bool forget(uint64_t request_id);

    /**
     * @brief Cancels pending requests, lets executing ones finish, joins all threads.
     *
     * Idempotent. Called by the destructor.
     */
    void shutdown();

    [[nodiscard]] const CommandQueueConfig &config() const noexcept { return m_config; }

  private:
    struct Entry
    {
        CommandRequest request;
        CommandResult result;
        std::shared_ptr<std::promise<CommandResult>> promise;
    };

    void worker_loop(size_t index);
    void execute(uint64_t id, CommandRequest request);
    /// Runs one attempt with timeout; returns nullopt on success.
    std::optional<HubError> run_attempt(const Command &command, std::chrono::milliseconds timeout);
    void finish(uint64_t id, CommandResult result, const CommandRequest &request);
    void prune_terminal_locked();

    CommandExecutor m_executor;
    CommandQueueConfig m_config;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<uint64_t> m_pending;
    std::map<uint64_t, Entry> m_entries;
    size_t m_executing{0};
    uint64_t m_next_id{0};
    bool m_shutdown{false};

    std::vector<std::thread> m_workers;
};

} // namespace hublink::hub
