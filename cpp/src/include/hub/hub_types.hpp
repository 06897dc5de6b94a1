#pragma once
/**
 * @file hub_types.hpp
 * @brief Data model of the hub engine: hubs, devices, commands, activities,
 *        cached snapshots and command requests/results.
 *
 * All types are plain values. Hubs are immutable once discovered; device and
 * activity lists are replaced wholesale on refresh and never mutated in place.
 * JSON conversions (nlohmann ADL `to_json`/`from_json`) define the persisted
 * snapshot layout; timestamps are stored as milliseconds since the Unix epoch.
 */
#include "hub/hub_error.hpp"
#include "hublink_core_export.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hublink::hub
{

using Clock = std::chrono::system_clock;

/// Default port of the hub's session protocol when an announcement omits it.
inline constexpr uint16_t kDefaultSessionPort = 5222;

struct Hub
{
    std::string id;      ///< Opaque identity (announcement uuid); distinct from the name.
    std::string name;    ///< Display name.
    std::string address; ///< Network address (IPv4/IPv6 literal or hostname).
    uint16_t port{kDefaultSessionPort};
    std::optional<std::string> firmware_version;
    std::optional<std::string> remote_id; ///< Needed by some firmware to open a session.
    std::optional<std::string> hub_id;
    std::optional<std::string> product_id;

    bool operator==(const Hub &) const = default;
};

struct Command
{
    std::string id;    ///< Hub-recognized command token.
    std::string label; ///< Human label.
    std::string device_id;
    std::optional<std::string> group; ///< Control group name ("Volume", "Power" ...).
    std::optional<std::string> type;  ///< Envelope tag; "IRCommand" when absent.

    bool operator==(const Command &) const = default;
};

struct Device
{
    std::string id;
    std::string label;
    std::string type{"Default"};
    std::vector<Command> commands;

    [[nodiscard]] const Command *find_command(const std::string &command_id) const noexcept;

    bool operator==(const Device &) const = default;
};

/// Activity id the hub uses for its "everything off" pseudo-activity.
inline constexpr const char *kPowerOffActivityId = "-1";

struct Activity
{
    std::string id;
    std::string label;
    std::string type;
    bool is_current{false};

    bool operator==(const Activity &) const = default;
};

/**
 * @brief Cached {hub, devices, activities, timestamp} tuple.
 *
 * Usable only while `now - timestamp < ttl` and the hub id matches the request.
 */
struct CachedSnapshot
{
    Hub hub;
    std::vector<Device> devices;
    std::vector<Activity> activities;
    Clock::time_point timestamp{};
};

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected,
};

enum class CommandStatus
{
    Queued,
    Executing,
    Completed,
    Failed,
    Cancelled,
    TimedOut,
};

[[nodiscard]] HUBLINK_CORE_EXPORT const char *to_string(ConnectionState state) noexcept;
[[nodiscard]] HUBLINK_CORE_EXPORT const char *to_string(CommandStatus status) noexcept;

/// Completed, Failed, Cancelled and TimedOut are terminal.
[[nodiscard]] HUBLINK_CORE_EXPORT bool is_terminal(CommandStatus status) noexcept;

struct CommandResult
{
    uint64_t request_id{0};
    Command command;
    CommandStatus status{CommandStatus::Queued};
    std::optional<HubError> error; ///< Set for Failed / Cancelled / TimedOut.
    int attempts{0};
    Clock::time_point queued_at{};
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;
};

struct CommandRequest
{
    Command command;
    std::optional<std::chrono::milliseconds> timeout; ///< Per attempt; queue default if unset.
    std::optional<int> retries; ///< Additional attempts after the first; queue default if unset.
    /// Invoked once with the terminal result, from a queue worker thread.
    std::function<void(const CommandResult &)> on_done;
};

// ============================================================================
// JSON conversions (persisted snapshot layout)
// ============================================================================

HUBLINK_CORE_EXPORT void to_json(nlohmann::json &j, const Hub &hub);
HUBLINK_CORE_EXPORT void from_json(const nlohmann::json &j, Hub &hub);
HUBLINK_CORE_EXPORT void to_json(nlohmann::json &j, const Command &cmd);
HUBLINK_CORE_EXPORT void from_json(const nlohmann::json &j, Command &cmd);
HUBLINK_CORE_EXPORT void to_json(nlohmann::json &j, const Device &device);
HUBLINK_CORE_EXPORT void from_json(const nlohmann::json &j, Device &device);
HUBLINK_CORE_EXPORT void to_json(nlohmann::json &j, const Activity &activity);
HUBLINK_CORE_EXPORT void from_json(const nlohmann::json &j, Activity &activity);
HUBLINK_CORE_EXPORT void to_json(nlohmann::json &j, const CachedSnapshot &snapshot);
HUBLINK_CORE_EXPORT void from_json(const nlohmann::json &j, CachedSnapshot &snapshot);

} // namespace hublink::hub
