#pragma once
/**
 * @file discovery_coordinator.hpp
 * @brief Time-bounded, deduplicating hub discovery with in-flight coalescing.
 *
 * A discovery run listens for the configured window. When at least one hub has
 * been found by the end of the window, it keeps listening for the grace period
 * to catch slower responders, then stops the transport and resolves.
 *
 * Only one run is in flight per coordinator. A caller that arrives while a run
 * is active joins it: its callback is first replayed with the hubs already
 * found (in wire order), then receives new hubs as they arrive, and it gets the
 * same `DiscoveryResult` as the caller that started the run.
 *
 * There is no external cancel; a run ends at its deadline or on error. On a
 * transport error the hubs accumulated so far are still returned, together
 * with the error.
 */
#include "hub/hub_error.hpp"
#include "hub/hub_transport.hpp"
#include "hub/hub_types.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace hublink::hub
{

struct DiscoveryConfig
{
    std::chrono::milliseconds window{std::chrono::seconds(30)};
    std::chrono::milliseconds grace{std::chrono::seconds(10)};
};

struct DiscoveryResult
{
    std::vector<Hub> hubs;         ///< Unique by id, in the order first observed.
    std::optional<HubError> error; ///< Set when the run failed; hubs may still be non-empty.

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/// Called once per unique hub, in wire order. Must not block for long and must not
/// call back into the coordinator.
using OnHubFound = std::function<void(const Hub &)>;

class HUBLINK_CORE_EXPORT DiscoveryCoordinator
{
  public:
    DiscoveryCoordinator(IDiscoveryTransport &transport, DiscoveryConfig config = {});
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator &) = delete;
    DiscoveryCoordinator &operator=(const DiscoveryCoordinator &) = delete;

    /**
     * @brief Runs discovery, or joins the run already in flight.
     *
     * Blocks until the run resolves: at most `window + grace` after it started.
     */
    DiscoveryResult discover(OnHubFound on_found = {});

    [[nodiscard]] bool is_discovering() const;

    /// Hubs of the most recent completed run.
    [[nodiscard]] std::vector<Hub> last_hubs() const;

    [[nodiscard]] const DiscoveryConfig &config() const noexcept { return m_config; }

  private:
    struct Run;

    DiscoveryResult execute(const std::shared_ptr<Run> &run);

    IDiscoveryTransport &m_transport;
    DiscoveryConfig m_config;

    mutable std::mutex m_mutex;
    std::shared_ptr<Run> m_current;
    std::vector<Hub> m_last_hubs;
};

} // namespace hublink::hub
