#pragma once
/**
 * @file session_config.hpp
 * @brief Deployment configuration of the hub engine.
 *
 * Loading strategy (priority low -> high):
 *  1. Built-in defaults (`SessionConfig::defaults()`)
 *  2. `<config_dir>/hublink.default.json`
 *  3. `<config_dir>/hublink.user.json`, merged on top of the defaults file
 *  4. An explicit file (`--config` or `HUBLINK_CONFIG_FILE`) replaces layers 2 and 3
 *  5. `HUBLINK_LOG_LEVEL`, `HUBLINK_STORE_PATH` and `HUBLINK_DISCOVERY_ENDPOINT`
 *
 * JSON layout:
 * @code
 * {
 *   "discovery":  { "window_ms": 30000, "grace_ms": 10000 },
 *   "connection": { "connect_timeout_ms": 5000, "request_timeout_ms": 5000,
 *                   "max_reconnect_attempts": 3, "reconnect_base_delay_ms": 1000,
 *                   "reconnect_max_delay_ms": 10000 },
 *   "queue":      { "max_queue_size": 100, "max_concurrent": 1, "default_timeout_ms": 5000,
 *                   "default_retries": 2, "retry_delay_ms": 100, "hold_duration_ms": 100 },
 *   "cache":      { "ttl_s": 86400 },
 *   "logging":    { "level": "info", "file": "" },
 *   "store":      { "path": "~/.cache/hublink/store.json" },
 *   "transport":  { "discovery_endpoint": "tcp://127.0.0.1:5224", "session_port": 5222 }
 * }
 * @endcode
 * Unknown keys are ignored; a known key with the wrong type is rejected.
 */
#include "hub/command_queue.hpp"
#include "hub/connection_manager.hpp"
#include "hub/discovery_coordinator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace hublink::hub
{

struct CacheConfig
{
    std::chrono::milliseconds ttl{std::chrono::hours(24)};
};

struct LoggingConfig
{
    std::string level{"info"};
    std::string file; ///< Empty: log to the console.
};

struct TransportConfig
{
    std::string discovery_endpoint{"tcp://127.0.0.1:5224"};
    uint16_t session_port{kDefaultSessionPort}; ///< Used when a hub does not announce a port.
};

struct HUBLINK_CORE_EXPORT SessionConfig
{
    DiscoveryConfig discovery;
    ConnectionConfig connection;
    CommandQueueConfig queue;
    CacheConfig cache;
    LoggingConfig logging;
    std::filesystem::path store_path;
    TransportConfig transport;

    /// Built-in defaults; the store lives in `~/.cache/hublink/store.json`.
    [[nodiscard]] static SessionConfig defaults();

    /**
     * @brief Applies the keys present in @p j on top of @p base.
     * @throws HubError(Validation) on a wrongly typed value.
     */
    [[nodiscard]] static SessionConfig from_json(const nlohmann::json &j, SessionConfig base);

    /**
     * @brief Runs the full layered load (files, then environment) and validates.
     *
     * @param config_dir    directory holding hublink.default.json / hublink.user.json;
     *                      empty to look next to the executable.
     * @param explicit_file replaces both file layers when non-empty.
     * @throws HubError(Validation) when a file is malformed or a value is invalid.
     */
    [[nodiscard]] static SessionConfig load(const std::filesystem::path &config_dir = {},
                                            const std::filesystem::path &explicit_file = {});

    /// Applies HUBLINK_LOG_LEVEL, HUBLINK_STORE_PATH and HUBLINK_DISCOVERY_ENDPOINT.
    void apply_env_overrides();

    /// @throws HubError(Validation) describing the first invalid value.
    void validate() const;

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Recursively merges @p overrides into @p base (objects merge, other values replace).
HUBLINK_CORE_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);

} // namespace hublink::hub
