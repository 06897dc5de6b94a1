#include "hbl_hub.hpp"

namespace hublink::hub
{

ConnectionManager::ConnectionManager(ISessionTransport &transport, ConnectionConfig config)
    : m_transport(transport), m_config(config)
{
    m_reconnect_thread = std::thread([this] { reconnect_loop(); });
}

ConnectionManager::~ConnectionManager()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        ++m_generation;
    }
    m_cv.notify_all();
    if (m_reconnect_thread.joinable())
        m_reconnect_thread.join();

    std::shared_ptr<ISession> session;
    std::shared_ptr<ISession> dropped;
    std::string hub_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        hub_id = m_hub ? m_hub->id : std::string{};
        session = release_session_locked();
        dropped = std::move(m_dropped);
    }
    close_quietly(session, hub_id);
    close_quietly(dropped, hub_id);
}

// ============================================================================
// State helpers
// ============================================================================

void ConnectionManager::set_state_locked(ConnectionState next)
{
    if (m_state == next)
        return;
    LOGGER_DEBUG("Connection: {} -> {}", to_string(m_state), to_string(next));
    m_state = next;
}

std::shared_ptr<ISession> ConnectionManager::release_session_locked()
{
    auto session = std::move(m_session);
    m_session.reset();
    m_current_activity.reset();
    set_state_locked(ConnectionState::Disconnected);
    return session;
}

void ConnectionManager::close_quietly(const std::shared_ptr<ISession> &session,
                                      const std::string &hub_id)
{
    if (!session)
        return;
    try
    {
        session->close();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("Connection: closing session to hub '{}' failed: {}", hub_id, e.what());
    }
}

ConnectionState ConnectionManager::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool ConnectionManager::is_connected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == ConnectionState::Connected && m_session != nullptr;
}

std::optional<Hub> ConnectionManager::current_hub() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hub;
}

std::optional<std::string> ConnectionManager::current_activity_id() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_activity;
}

bool ConnectionManager::is_reconnecting() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reconnecting || m_reconnect_pending;
}

void ConnectionManager::set_connection_lost_listener(ConnectionLostListener listener)
{
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_lost_listener = std::move(listener);
}

// ============================================================================
// Connect / disconnect
// ============================================================================

void ConnectionManager::open_session(const Hub &hub, uint64_t generation)
{
    std::unique_ptr<ISession> opened = m_transport.open(
        hub, m_config.connect_timeout,
        [this, generation](const std::string &reason) { on_session_closed(generation, reason); });
    if (!opened)
        throw std::runtime_error("transport returned no session");

    std::lock_guard<std::mutex> lock(m_mutex);
    m_session = std::move(opened);
    m_hub = hub;
    set_state_locked(ConnectionState::Connected);
}

void ConnectionManager::connect(const Hub &hub)
{
    std::shared_ptr<std::promise<void>> owner;
    std::shared_future<void> in_flight;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_connect_in_flight && m_connect_in_flight->hub_id == hub.id)
        {
            in_flight = m_connect_in_flight->done;
        }
        else if (!m_connect_in_flight)
        {
            owner = std::make_shared<std::promise<void>>();
            m_connect_in_flight = InFlightConnect{hub.id, owner->get_future().share()};
        }
    }

    if (in_flight.valid())
    {
        LOGGER_DEBUG("Connection: joining in-flight connect to hub '{}'", hub.id);
        in_flight.get();
        return;
    }
    if (!owner)
    {
        // Another hub is being connected: run after it.
        do_connect(hub);
        return;
    }

    try
    {
        do_connect(hub);
    }
    catch (const std::exception &)
    {
        finish_connect(*owner, std::current_exception());
        throw;
    }
    finish_connect(*owner, nullptr);
}

void ConnectionManager::finish_connect(std::promise<void> &owner, std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connect_in_flight.reset();
    }
    if (error)
        owner.set_exception(error);
    else
        owner.set_value();
}

void ConnectionManager::do_connect(const Hub &hub)
{
    std::lock_guard<std::mutex> op(m_op_mutex);

    std::shared_ptr<ISession> previous;
    std::string previous_id;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == ConnectionState::Connected && m_session && m_hub && m_hub->id == hub.id)
        {
            LOGGER_DEBUG("Connection: already connected to hub '{}'", hub.id);
            return;
        }
        if (m_hub && m_hub->id != hub.id && m_session)
        {
            LOGGER_INFO("Connection: switching from hub '{}' to hub '{}'", m_hub->id, hub.id);
        }
        previous_id = m_hub ? m_hub->id : std::string{};
        previous = release_session_locked();
        m_reconnect_pending = false;
        generation = ++m_generation;
        set_state_locked(ConnectionState::Connecting);
    }
    m_cv.notify_all();
    close_quietly(previous, previous_id);

    LOGGER_INFO("Connection: connecting to hub '{}' at {}:{}", hub.name, hub.address, hub.port);
    try
    {
        open_session(hub, generation);
    }
    catch (const std::exception &e)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hub.reset();
            set_state_locked(ConnectionState::Disconnected);
        }
        LOGGER_ERROR("Connection: cannot connect to hub '{}': {}", hub.id, e.what());
        throw HubError(ErrorCategory::Connection, "connect",
                       fmt::format("cannot connect to hub '{}' at {}", hub.name, hub.address),
                       e.what());
    }
    LOGGER_INFO("Connection: connected to hub '{}'", hub.id);
}

void ConnectionManager::disconnect()
{
    std::lock_guard<std::mutex> op(m_op_mutex);

    std::shared_ptr<ISession> session;
    std::string hub_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_generation;
        m_reconnect_pending = false;
        hub_id = m_hub ? m_hub->id : std::string{};
        m_hub.reset();
        session = release_session_locked();
    }
    m_cv.notify_all();

    if (!session)
    {
        LOGGER_DEBUG("Connection: disconnect requested while not connected");
        return;
    }
    close_quietly(session, hub_id);
    LOGGER_INFO("Connection: disconnected from hub '{}'", hub_id);
}

void ConnectionManager::drop_session_for(const std::optional<std::string> &hub_id)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (hub_id && (!m_hub || m_hub->id != *hub_id))
            return;
    }
    disconnect();
}

// ============================================================================
// Requests
// ============================================================================

nlohmann::json ConnectionManager::request(const std::string &request_type,
                                          const nlohmann::json &payload, ErrorCategory category,
                                          const char *operation,
                                          std::optional<std::chrono::milliseconds> timeout)
{
    std::shared_ptr<ISession> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != ConnectionState::Connected || !m_session)
            throw HubError(ErrorCategory::Connection, operation, "not connected to a hub");
        session = m_session;
    }

    try
    {
        std::lock_guard<std::mutex> send_lock(m_send_mutex);
        return session->send(request_type, payload, timeout.value_or(m_config.request_timeout));
    }
    catch (const std::exception &e)
    {
        throw HubError(category, operation, fmt::format("'{}' request failed", request_type),
                       e.what());
    }
}

void ConnectionManager::ensure_connected()
{
    std::optional<std::string> activity;
    try
    {
        const auto body = request(request::kGetCurrentActivity, nlohmann::json::object(),
                                  ErrorCategory::Connection, "ensure_connected");
        const auto response = decode_response(request::kGetCurrentActivity, body);
        activity = std::get<CurrentActivityResponse>(response).activity_id;
    }
    catch (const HubError &e)
    {
        std::shared_ptr<ISession> session;
        std::string hub_id;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_generation;
            m_reconnect_pending = false;
            hub_id = m_hub ? m_hub->id : std::string{};
            session = release_session_locked();
        }
        m_cv.notify_all();
        close_quietly(session, hub_id);
        LOGGER_WARN("Connection: liveness check failed: {}", e.what());
        throw HubError(ErrorCategory::Connection, "ensure_connected",
                       "lost connection to hub", e.cause().empty() ? e.what() : e.cause())
            .caused_by(e.category());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_current_activity = activity;
    LOGGER_TRACE("Connection: liveness verified (current activity '{}')", *activity);
}

std::vector<Device> ConnectionManager::fetch_devices()
{
    const auto body = request(request::kGetConfig, nlohmann::json::object(),
                              ErrorCategory::Connection, "get_devices");
    auto config = std::get<ConfigResponse>(decode_response(request::kGetConfig, body));
    LOGGER_DEBUG("Connection: fetched {} devices", config.devices.size());
    return std::move(config.devices);
}

std::vector<Activity> ConnectionManager::fetch_activities()
{
    const auto config_body = request(request::kGetConfig, nlohmann::json::object(),
                                     ErrorCategory::Connection, "get_activities");
    auto activities =
        std::get<ConfigResponse>(decode_response(request::kGetConfig, config_body)).activities;

    const auto current_body = request(request::kGetCurrentActivity, nlohmann::json::object(),
                                      ErrorCategory::Connection, "get_activities");
    const auto current = std::get<CurrentActivityResponse>(
                             decode_response(request::kGetCurrentActivity, current_body))
                             .activity_id;

    bool marked = false;
    for (auto &activity : activities)
    {
        activity.is_current = !marked && activity.id == current;
        marked = marked || activity.is_current;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_current_activity = current;
    }
    LOGGER_DEBUG("Connection: fetched {} activities (current '{}')", activities.size(), current);
    return activities;
}

void ConnectionManager::start_activity(const std::string &activity_id)
{
    const auto body = request(request::kStartActivity, make_start_activity(activity_id),
                              ErrorCategory::Connection, "start_activity");
    const auto response = decode_response(request::kStartActivity, body);
    const auto &ack = std::get<AckResponse>(response);
    if (!ack.ok())
    {
        throw HubError(ErrorCategory::Command, "start_activity",
                       fmt::format("hub refused activity '{}' (code {})", activity_id, ack.code),
                       ack.message);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current_activity = activity_id;
    LOGGER_INFO("Connection: activity '{}' started", activity_id);
}

void ConnectionManager::send_hold_action(const Command &command, HoldPhase phase,
                                         std::optional<std::chrono::milliseconds> timeout)
{
    const auto body = request(request::kHoldAction, make_hold_action(command, phase),
                              ErrorCategory::Command, "execute_command", timeout);
    const auto response = decode_response(request::kHoldAction, body);
    const auto &ack = std::get<AckResponse>(response);
    if (!ack.ok())
    {
        throw HubError(ErrorCategory::Command, "execute_command",
                       fmt::format("hub rejected command '{}' (code {})", command.id, ack.code),
                       ack.message);
    }
}

// ============================================================================
// Reconnect-on-drop
// ============================================================================

void ConnectionManager::on_session_closed(uint64_t generation, const std::string &reason)
{
    std::string hub_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown || generation != m_generation || !m_session)
            return;
        hub_id = m_hub ? m_hub->id : std::string{};
        // Runs on a transport thread: the session is closed by the reconnect thread.
        m_dropped = release_session_locked();
        m_reconnect_pending = m_hub.has_value() && m_config.max_reconnect_attempts > 0;
    }
    LOGGER_WARN("Connection: session to hub '{}' dropped: {}", hub_id, reason);
    m_cv.notify_all();
}

void ConnectionManager::reconnect_loop()
{
    while (true)
    {
        Hub hub;
        uint64_t generation = 0;
        std::shared_ptr<ISession> dropped;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock,
                      [this] { return m_shutdown || m_reconnect_pending || m_dropped != nullptr; });
            if (m_shutdown)
                return;
            dropped = std::move(m_dropped);
            m_dropped.reset();
        }
        close_quietly(dropped, "dropped");
        dropped.reset();
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_reconnect_pending)
                continue;
            m_reconnect_pending = false;
            if (!m_hub)
                continue;
            hub = *m_hub;
            generation = m_generation;
            m_reconnecting = true;
        }
        run_reconnect(hub, generation);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_reconnecting = false;
        }
    }
}

void ConnectionManager::run_reconnect(const Hub &hub, uint64_t generation)
{
    const utils::ExponentialBackoff backoff{m_config.reconnect_base_delay,
                                            m_config.reconnect_max_delay};
    const int max_attempts = m_config.max_reconnect_attempts;
    std::string last_error;

    for (int attempt = 0; attempt < max_attempts; ++attempt)
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            const bool cancelled =
                m_cv.wait_for(lock, backoff.delay_for(attempt),
                              [&] { return m_shutdown || generation != m_generation; });
            if (cancelled)
            {
                LOGGER_DEBUG("Connection: reconnect to hub '{}' cancelled", hub.id);
                return;
            }
        }

        std::lock_guard<std::mutex> op(m_op_mutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown || generation != m_generation)
                return;
            set_state_locked(ConnectionState::Connecting);
        }
        LOGGER_INFO("Connection: reconnect attempt {}/{} to hub '{}'", attempt + 1, max_attempts,
                    hub.id);
        try
        {
            open_session(hub, generation);
            LOGGER_INFO("Connection: reconnected to hub '{}'", hub.id);
            return;
        }
        catch (const std::exception &e)
        {
            last_error = e.what();
            std::lock_guard<std::mutex> lock(m_mutex);
            set_state_locked(ConnectionState::Disconnected);
            LOGGER_WARN("Connection: reconnect attempt {}/{} failed: {}", attempt + 1,
                        max_attempts, last_error);
        }
    }

    HubError error(ErrorCategory::Connection, "reconnect",
                   fmt::format("hub '{}' unreachable after {} reconnect attempts", hub.name,
                               max_attempts),
                   last_error, max_attempts);
    LOGGER_ERROR("Connection: {}", error.describe());

    ConnectionLostListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        listener = m_lost_listener;
    }
    if (!listener)
        return;
    try
    {
        listener(error);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("Connection: connection-lost listener threw: {}", e.what());
    }
}

} // namespace hublink::hub
