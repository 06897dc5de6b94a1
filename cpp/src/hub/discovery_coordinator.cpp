#include "hbl_hub.hpp"

#include <algorithm>
#include <condition_variable>

namespace hublink::hub
{

// ============================================================================
// Run: shared state of one in-flight discovery
// ============================================================================

struct DiscoveryCoordinator::Run
{
    std::promise<DiscoveryResult> promise;
    std::shared_future<DiscoveryResult> future{promise.get_future().share()};

    // Held while callbacks run so that replay to a joining caller and live
    // delivery never interleave out of wire order.
    std::mutex delivery_mutex;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Hub> hubs;
    std::vector<OnHubFound> subscribers;
    std::optional<std::string> transport_error;
    bool stopped{false};

    void on_announce(const Hub &hub)
    {
        std::lock_guard<std::mutex> delivery(delivery_mutex);
        std::vector<OnHubFound> targets;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped)
                return;
            const bool seen = std::any_of(hubs.begin(), hubs.end(),
                                          [&](const Hub &h) { return h.id == hub.id; });
            if (seen)
            {
                LOGGER_TRACE("Discovery: duplicate announcement from hub '{}' ignored", hub.id);
                return;
            }
            hubs.push_back(hub);
            targets = subscribers;
        }
        cv.notify_all();
        LOGGER_INFO("Discovery: hub '{}' ({}) found at {}:{}", hub.name, hub.id, hub.address,
                    hub.port);
        for (const auto &cb : targets)
            deliver(cb, hub);
    }

    void on_error(const std::string &message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped || transport_error)
                return;
            transport_error = message;
        }
        LOGGER_ERROR("Discovery: transport error: {}", message);
        cv.notify_all();
    }

    /// Adds a subscriber and replays the hubs found so far.
    void join(OnHubFound cb)
    {
        if (!cb)
            return;
        std::lock_guard<std::mutex> delivery(delivery_mutex);
        std::vector<Hub> replay;
        {
            std::lock_guard<std::mutex> lock(mutex);
            replay = hubs;
            subscribers.push_back(cb);
        }
        for (const auto &hub : replay)
            deliver(cb, hub);
    }

    static void deliver(const OnHubFound &cb, const Hub &hub)
    {
        try
        {
            cb(hub);
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("Discovery: on_found callback for hub '{}' threw: {}", hub.id, e.what());
        }
    }
};

// ============================================================================
// DiscoveryCoordinator
// ============================================================================

DiscoveryCoordinator::DiscoveryCoordinator(IDiscoveryTransport &transport, DiscoveryConfig config)
    : m_transport(transport), m_config(config)
{
}

DiscoveryCoordinator::~DiscoveryCoordinator()
{
    std::shared_ptr<Run> run;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        run = m_current;
    }
    if (run)
    {
        // A run still owned by another thread resolves on its own deadline.
        run->future.wait();
    }
}

DiscoveryResult DiscoveryCoordinator::discover(OnHubFound on_found)
{
    std::shared_ptr<Run> run;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_current)
        {
            run = m_current;
        }
        else
        {
            run = std::make_shared<Run>();
            m_current = run;
            owner = true;
        }
    }

    run->join(std::move(on_found));

    if (!owner)
    {
        LOGGER_DEBUG("Discovery: joining the run already in flight");
        return run->future.get();
    }

    DiscoveryResult result = execute(run);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_hubs = result.hubs;
        m_current.reset();
    }
    run->promise.set_value(result);
    return result;
}

DiscoveryResult DiscoveryCoordinator::execute(const std::shared_ptr<Run> &run)
{
    const auto started = std::chrono::steady_clock::now();
    LOGGER_INFO("Discovery: started (window {}, grace {})",
                format_tools::format_duration(m_config.window),
                format_tools::format_duration(m_config.grace));

    bool transport_stopped = false;
    auto stop_transport = [&]() noexcept
    {
        if (transport_stopped)
            return;
        transport_stopped = true;
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->stopped = true;
        }
        try
        {
            m_transport.stop();
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("Discovery: stopping the listener failed: {}", e.what());
        }
    };
    auto guard = basics::make_scope_guard(stop_transport);

    DiscoveryResult result;
    try
    {
        m_transport.start([run](const Hub &hub) { run->on_announce(hub); },
                          [run](const std::string &msg) { run->on_error(msg); });
    }
    catch (const std::exception &e)
    {
        stop_transport();
        guard.dismiss();
        LOGGER_ERROR("Discovery: listener failed to start: {}", e.what());
        result.error = HubError(ErrorCategory::Discovery, "discover",
                                "discovery listener failed to start", e.what());
        return result;
    }

    {
        std::unique_lock<std::mutex> lock(run->mutex);
        const auto window_end = started + m_config.window;
        run->cv.wait_until(lock, window_end, [&] { return run->transport_error.has_value(); });

        if (!run->transport_error && !run->hubs.empty())
        {
            LOGGER_INFO("Discovery: {} hub(s) found, waiting {} for more",
                        run->hubs.size(), format_tools::format_duration(m_config.grace));
            const auto grace_end = std::chrono::steady_clock::now() + m_config.grace;
            run->cv.wait_until(lock, grace_end,
                               [&] { return run->transport_error.has_value(); });
        }
    }

    stop_transport();
    guard.dismiss();

    {
        std::lock_guard<std::mutex> lock(run->mutex);
        result.hubs = run->hubs;
        if (run->transport_error)
        {
            result.error = HubError(ErrorCategory::Discovery, "discover",
                                    fmt::format("discovery failed after finding {} hub(s)",
                                                run->hubs.size()),
                                    *run->transport_error);
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (result.ok())
        LOGGER_INFO("Discovery: finished with {} hub(s) in {}", result.hubs.size(),
                    format_tools::format_duration(elapsed));
    else
        LOGGER_WARN("Discovery: finished with error, returning {} partial hub(s)",
                    result.hubs.size());
    return result;
}

bool DiscoveryCoordinator::is_discovering() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current != nullptr;
}

std::vector<Hub> DiscoveryCoordinator::last_hubs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_hubs;
}

} // namespace hublink::hub
