#pragma once
/**
 * @file hub_session.hpp
 * @brief Session facade composing cache, discovery, connection and command queue.
 *
 * `HubSession` is constructed explicitly by the composition root with its
 * transports, store and configuration; it owns one instance of each engine
 * component. Reads go cache -> discovery/connection -> hub; writes go
 * caller -> command queue -> connection -> hub.
 *
 * @code
 * hub::HubSession session(discovery_transport, session_transport, store, config, &sink);
 * auto data = session.get_session_data(nullptr, false);
 * auto result = session.execute_command("tv", "PowerToggle");
 * @endcode
 */
#include "hub/cache_store.hpp"
#include "hub/command_queue.hpp"
#include "hub/connection_manager.hpp"
#include "hub/discovery_coordinator.hpp"
#include "hub/hub_transport.hpp"
#include "hub/session_config.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hublink::hub
{

struct SessionData
{
    Hub hub;
    std::vector<Device> devices;
    std::vector<Activity> activities;
    Clock::time_point timestamp{};
    bool from_cache{false};
};

class HUBLINK_CORE_EXPORT HubSession
{
  public:
    /**
     * @param notifications optional; must outlive the session.
     * @param clock         time source of the cache (tests inject a fake one).
     */
    HubSession(IDiscoveryTransport &discovery_transport, ISessionTransport &session_transport,
               utils::IKeyValueStore &store, SessionConfig config = SessionConfig::defaults(),
               INotificationSink *notifications = nullptr,
               CacheStore::ClockFn clock = [] { return Clock::now(); });
    ~HubSession();

    HubSession(const HubSession &) = delete;
    HubSession &operator=(const HubSession &) = delete;

    DiscoveryResult discover_hubs(OnHubFound on_found = {});

    void connect(const Hub &hub);
    void disconnect();
    void ensure_connected();

    /**
     * @brief Devices and activities of @p hub (or of the current / last cached /
     *        first discovered hub when null).
     *
     * Without @p force_refresh a fresh cache entry is returned without touching
     * the network. Otherwise connects, fetches devices and activities
     * concurrently, and replaces the cache entry; a failed fetch leaves the
     * cache untouched.
     * @throws HubError
     */
    SessionData get_session_data(const Hub *hub = nullptr, bool force_refresh = false);

    std::vector<Device> get_devices();
    std::vector<Activity> get_activities();

    /// @throws HubError
    void start_activity(const std::string &activity_id);

    /**
     * @brief Queues a command and waits for its terminal result.
     *
     * Command failures are reported in the result, not thrown.
     * @throws HubError(Validation) for an unknown device or command,
     *         HubError(Queue) when the queue is full.
     */
    CommandResult execute_command(const std::string &device_id, const std::string &command_id);

    /// Queues a command without waiting. Same errors as execute_command().
    CommandTicket submit_command(const std::string &device_id, const std::string &command_id,
                                 std::function<void(const CommandResult &)> on_done = {});

    size_t cancel_pending_commands();

    /// Clears every cached snapshot and drops the live session.
    void clear_cache();

    [[nodiscard]] std::optional<SessionData> current_snapshot() const;

    [[nodiscard]] ConnectionManager &connection() noexcept { return m_connection; }
    [[nodiscard]] CommandQueue &queue() noexcept { return m_queue; }
    [[nodiscard]] CacheStore &cache() noexcept { return m_cache; }
    [[nodiscard]] const SessionConfig &config() const noexcept { return m_config; }

  private:
    Hub resolve_hub();
    void acquire_connection();
    void run_command_attempt(const Command &command, std::chrono::milliseconds timeout);

    void notify_progress(const std::string &message) noexcept;
    void notify_success(const std::string &message) noexcept;
    void notify_failure(const std::string &message, const HubError &error) noexcept;

    SessionConfig m_config;
    INotificationSink *m_notifications;

    CacheStore m_cache;
    DiscoveryCoordinator m_discovery;
    ConnectionManager m_connection;

    std::mutex m_refresh_mutex; ///< One get_session_data() refresh at a time.
    mutable std::mutex m_mutex;
    std::optional<SessionData> m_snapshot;

    CommandQueue m_queue; ///< Declared last: its workers use the members above.
};

} // namespace hublink::hub
