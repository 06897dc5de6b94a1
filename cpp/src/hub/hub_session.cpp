#include "hbl_hub.hpp"

#include <future>
#include <thread>

namespace hublink::hub
{

HubSession::HubSession(IDiscoveryTransport &discovery_transport,
                       ISessionTransport &session_transport, utils::IKeyValueStore &store,
                       SessionConfig config, INotificationSink *notifications,
                       CacheStore::ClockFn clock)
    : m_config(std::move(config)), m_notifications(notifications),
      m_cache(store, m_config.cache.ttl, std::move(clock)),
      m_discovery(discovery_transport, m_config.discovery),
      m_connection(session_transport, m_config.connection),
      m_queue([this](const Command &command, std::chrono::milliseconds timeout)
              { run_command_attempt(command, timeout); },
              m_config.queue)
{
    m_cache.set_clear_listener([this](const std::optional<std::string> &hub_id)
                               { m_connection.drop_session_for(hub_id); });
    m_connection.set_connection_lost_listener(
        [this](const HubError &error)
        { notify_failure("Lost connection to the hub", error); });
}

HubSession::~HubSession()
{
    m_queue.shutdown();
    m_cache.set_clear_listener({});
    m_connection.set_connection_lost_listener({});
}

// ============================================================================
// Notifications
// ============================================================================

void HubSession::notify_progress(const std::string &message) noexcept
{
    if (!m_notifications)
        return;
    try
    {
        m_notifications->progress(message);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("HubSession: notification sink failed: {}", e.what());
    }
}

void HubSession::notify_success(const std::string &message) noexcept
{
    if (!m_notifications)
        return;
    try
    {
        m_notifications->success(message);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("HubSession: notification sink failed: {}", e.what());
    }
}

void HubSession::notify_failure(const std::string &message, const HubError &error) noexcept
{
    if (!m_notifications)
        return;
    try
    {
        m_notifications->failure(message, error);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("HubSession: notification sink failed: {}", e.what());
    }
}

// ============================================================================
// Discovery and connection
// ============================================================================

DiscoveryResult HubSession::discover_hubs(OnHubFound on_found)
{
    notify_progress("Searching for hubs...");
    DiscoveryResult result = m_discovery.discover(std::move(on_found));
    if (result.error)
        notify_failure("Hub discovery failed", *result.error);
    else if (result.hubs.empty())
        notify_progress("No hubs found");
    else
        notify_success(fmt::format("Found {} hub(s)", result.hubs.size()));
    return result;
}

void HubSession::connect(const Hub &hub)
{
    notify_progress(fmt::format("Connecting to {}...", hub.name));
    try
    {
        m_connection.connect(hub);
    }
    catch (const HubError &e)
    {
        notify_failure(fmt::format("Cannot connect to {}", hub.name), e);
        throw;
    }
}

void HubSession::disconnect()
{
    m_connection.disconnect();
}

void HubSession::ensure_connected()
{
    m_connection.ensure_connected();
}

Hub HubSession::resolve_hub()
{
    if (auto hub = m_connection.current_hub())
        return *hub;

    if (auto last = m_cache.last_hub_id())
    {
        if (auto snapshot = m_cache.get(*last))
            return snapshot->hub;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_snapshot)
            return m_snapshot->hub;
    }

    LOGGER_INFO("HubSession: no known hub, running discovery");
    DiscoveryResult result = discover_hubs();
    if (!result.hubs.empty())
    {
        if (result.error)
            LOGGER_WARN("HubSession: using partial discovery result: {}", result.error->what());
        return result.hubs.front();
    }
    if (result.error)
        throw *result.error;
    throw HubError(ErrorCategory::Discovery, "get_session_data", "no hub found on the network");
}

// ============================================================================
// Session data
// ============================================================================

SessionData HubSession::get_session_data(const Hub *hub, bool force_refresh)
{
    std::lock_guard<std::mutex> refresh(m_refresh_mutex);
    const Hub target = hub ? *hub : resolve_hub();

    if (!force_refresh)
    {
        if (auto cached = m_cache.get(target.id))
        {
            SessionData data{std::move(cached->hub), std::move(cached->devices),
                             std::move(cached->activities), cached->timestamp, true};
            std::lock_guard<std::mutex> lock(m_mutex);
            m_snapshot = data;
            return data;
        }
    }

    const auto current = m_connection.current_hub();
    const bool reusing =
        m_connection.is_connected() && current && current->id == target.id;
    connect(target);
    if (reusing)
    {
        // A session that died silently is only detected by a request.
        try
        {
            m_connection.ensure_connected();
        }
        catch (const HubError &e)
        {
            LOGGER_WARN("HubSession: session to hub '{}' is dead, reopening: {}", target.id,
                        e.what());
            connect(target);
        }
    }
    notify_progress(fmt::format("Loading devices from {}...", target.name));

    auto devices = std::async(std::launch::async, [this] { return m_connection.fetch_devices(); });
    auto activities =
        std::async(std::launch::async, [this] { return m_connection.fetch_activities(); });

    SessionData data;
    data.hub = target;
    try
    {
        data.activities = activities.get();
        data.devices = devices.get();
    }
    catch (const HubError &e)
    {
        notify_failure(fmt::format("Cannot load data from {}", target.name), e);
        throw;
    }
    data.timestamp = m_cache.now();

    m_cache.set(CachedSnapshot{data.hub, data.devices, data.activities, data.timestamp});
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_snapshot = data;
    }
    LOGGER_INFO("HubSession: loaded {} devices and {} activities from hub '{}'",
                data.devices.size(), data.activities.size(), target.id);
    return data;
}

std::vector<Device> HubSession::get_devices()
{
    return get_session_data(nullptr, false).devices;
}

std::vector<Activity> HubSession::get_activities()
{
    return get_session_data(nullptr, false).activities;
}

std::optional<SessionData> HubSession::current_snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

void HubSession::clear_cache()
{
    m_cache.clear();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_snapshot.reset();
    }
    LOGGER_INFO("HubSession: cache cleared");
}

// ============================================================================
// Activities and commands
// ============================================================================

void HubSession::acquire_connection()
{
    if (m_connection.is_connected() || m_connection.is_reconnecting())
        return;
    std::optional<Hub> hub = m_connection.current_hub();
    if (!hub)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_snapshot)
            hub = m_snapshot->hub;
    }
    if (hub)
        m_connection.connect(*hub);
}

void HubSession::start_activity(const std::string &activity_id)
{
    try
    {
        acquire_connection();
        m_connection.start_activity(activity_id);
    }
    catch (const HubError &e)
    {
        notify_failure(fmt::format("Cannot start activity '{}'", activity_id), e);
        throw;
    }

    std::optional<SessionData> updated;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_snapshot)
        {
            for (auto &activity : m_snapshot->activities)
                activity.is_current = activity.id == activity_id;
            updated = m_snapshot;
        }
    }
    if (updated)
    {
        m_cache.set(CachedSnapshot{updated->hub, updated->devices, updated->activities,
                                   updated->timestamp});
    }

    const bool power_off = activity_id == kPowerOffActivityId;
    notify_success(power_off ? std::string("Powered off")
                             : fmt::format("Started activity '{}'", activity_id));
}

void HubSession::run_command_attempt(const Command &command, std::chrono::milliseconds timeout)
{
    acquire_connection();
    m_connection.ensure_connected();
    m_connection.send_hold_action(command, HoldPhase::Press, timeout);
    std::this_thread::sleep_for(m_config.queue.hold_duration);
    m_connection.send_hold_action(command, HoldPhase::Release, timeout);
}

CommandTicket HubSession::submit_command(const std::string &device_id,
                                         const std::string &command_id,
                                         std::function<void(const CommandResult &)> on_done)
{
    std::optional<SessionData> snapshot = current_snapshot();
    if (!snapshot)
        snapshot = get_session_data(nullptr, false);

    const Device *device = nullptr;
    for (const auto &d : snapshot->devices)
    {
        if (d.id == device_id)
        {
            device = &d;
            break;
        }
    }
    if (!device)
        throw HubError(ErrorCategory::Validation, "execute_command",
                       fmt::format("unknown device '{}'", device_id));
    const Command *command = device->find_command(command_id);
    if (!command)
        throw HubError(ErrorCategory::Validation, "execute_command",
                       fmt::format("device '{}' has no command '{}'", device->label, command_id));

    CommandRequest request;
    request.command = *command;
    request.on_done = std::move(on_done);
    return m_queue.enqueue(std::move(request));
}

CommandResult HubSession::execute_command(const std::string &device_id,
                                          const std::string &command_id)
{
    CommandTicket ticket = submit_command(device_id, command_id);
    CommandResult result = ticket.result.get();
    m_queue.forget(ticket.id);
    if (result.status == CommandStatus::Completed)
        notify_success(fmt::format("Sent {}", result.command.label));
    else if (result.error)
        notify_failure(fmt::format("Failed to send {}", result.command.label), *result.error);
    return result;
}

size_t HubSession::cancel_pending_commands()
{
    return m_queue.cancel_all();
}

} // namespace hublink::hub
