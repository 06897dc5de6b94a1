#pragma once
/**
 * @file connection_manager.hpp
 * @brief Owner of the single live hub session.
 *
 * State machine: `Disconnected -> Connecting -> Connected`; any state can fall
 * back to `Disconnected` on error. The session handle never leaves this class.
 *
 * Concurrent `connect()` calls for the same hub share one in-flight attempt and
 * all observe its outcome; a call for a different hub runs after it.
 *
 * When the transport reports that the live session dropped, a dedicated
 * reconnect thread retries the current hub up to `max_reconnect_attempts` times
 * with exponential backoff. After the last failed attempt the state stays
 * `Disconnected` and the connection-lost listener receives the terminal error.
 * `connect()`, `disconnect()` and destruction cancel a pending reconnect.
 */
#include "hub/hub_error.hpp"
#include "hub/hub_messages.hpp"
#include "hub/hub_transport.hpp"
#include "hub/hub_types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hublink::hub
{

struct ConnectionConfig
{
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(5)};
    int max_reconnect_attempts{3};
    std::chrono::milliseconds reconnect_base_delay{std::chrono::seconds(1)};
    std::chrono::milliseconds reconnect_max_delay{std::chrono::seconds(10)};
};

class HUBLINK_CORE_EXPORT ConnectionManager
{
  public:
    using ConnectionLostListener = std::function<void(const HubError &)>;

    ConnectionManager(ISessionTransport &transport, ConnectionConfig config = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    /**
     * @brief Opens a session to @p hub.
     *
     * No-op when already connected to the same hub id; disconnects first when
     * connected to a different one.
     * @throws HubError(Connection) when the hub cannot be reached.
     */
    void connect(const Hub &hub);

    /// Drops the session. Local state is always cleared, even if closing fails.
    void disconnect();

    /// Disconnects when @p hub_id is the current hub, or unconditionally for nullopt.
    void drop_session_for(const std::optional<std::string> &hub_id);

    /**
     * @brief Verifies the session with a cheap read-only request.
     *
     * Any failure forces the state to Disconnected and releases the session.
     * @throws HubError(Connection)
     */
    void ensure_connected();

    /// @throws HubError(Connection) when not connected or the request fails.
    [[nodiscard]] std::vector<Device> fetch_devices();

    /**
     * @brief Lists activities and marks the hub's current one.
     *
     * At most one returned activity has `is_current` set.
     * @throws HubError(Connection)
     */
    [[nodiscard]] std::vector<Activity> fetch_activities();

    /// @throws HubError(Connection) when not connected, HubError(Command) when the hub refuses.
    void start_activity(const std::string &activity_id);

    /// One phase of a hold action. @throws HubError(Command)
    void send_hold_action(const Command &command, HoldPhase phase,
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] std::optional<Hub> current_hub() const;
    [[nodiscard]] std::optional<std::string> current_activity_id() const;
    [[nodiscard]] bool is_reconnecting() const;

    void set_connection_lost_listener(ConnectionLostListener listener);

    [[nodiscard]] const ConnectionConfig &config() const noexcept { return m_config; }

  private:
    nlohmann::json request(const std::string &request_type, const nlohmann::json &payload,
                           ErrorCategory category, const char *operation,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    struct InFlightConnect
    {
        std::string hub_id;
        std::shared_future<void> done;
    };

    void do_connect(const Hub &hub);
    void finish_connect(std::promise<void> &owner, std::exception_ptr error);
    void open_session(const Hub &hub, uint64_t generation);
    void on_session_closed(uint64_t generation, const std::string &reason);
    void reconnect_loop();
    void run_reconnect(const Hub &hub, uint64_t generation);

    /// Detaches the session under m_mutex; the caller closes it outside the lock.
    std::shared_ptr<ISession> release_session_locked();
    static void close_quietly(const std::shared_ptr<ISession> &session, const std::string &hub_id);
    void set_state_locked(ConnectionState next);

    ISessionTransport &m_transport;
    ConnectionConfig m_config;

    std::mutex m_op_mutex;   ///< Serializes connect / disconnect / reconnect attempts.
    std::mutex m_send_mutex; ///< Serializes requests on the session.

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    ConnectionState m_state{ConnectionState::Disconnected};
    std::shared_ptr<ISession> m_session;
    std::shared_ptr<ISession> m_dropped; ///< Dropped by the transport, awaiting close.
    std::optional<Hub> m_hub;
    std::optional<std::string> m_current_activity;
    uint64_t m_generation{0};
    std::optional<InFlightConnect> m_connect_in_flight;
    bool m_reconnect_pending{false};
    bool m_reconnecting{false};
    bool m_shutdown{false};

    std::mutex m_listener_mutex;
    ConnectionLostListener m_lost_listener;

    std::thread m_reconnect_thread;
};

} // namespace hublink::hub
