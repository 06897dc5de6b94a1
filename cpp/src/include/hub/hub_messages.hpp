#pragma once
/**
 * @file hub_messages.hpp
 * @brief Typed view of the hub's request/response payloads.
 *
 * Session transports exchange JSON bodies keyed by a request-type string. This
 * module is the single place where those untyped bodies are validated and
 * converted: everything downstream works with the tagged `HubResponse` variant
 * or the model types of hub_types.hpp.
 *
 * Request types:
 *  - `getConfig`          -> ConfigResponse  {device[], activity[]}
 *  - `getCurrentActivity` -> CurrentActivityResponse {result}
 *  - `startActivity`      -> AckResponse {code, msg}
 *  - `holdAction`         -> AckResponse {code, msg}
 * Anything else decodes to RawResponse.
 */
#include "hub/hub_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hublink::hub
{

namespace request
{
inline constexpr const char *kGetConfig = "getConfig";
inline constexpr const char *kGetCurrentActivity = "getCurrentActivity";
inline constexpr const char *kStartActivity = "startActivity";
inline constexpr const char *kHoldAction = "holdAction";
} // namespace request

/// Envelope type used for commands that carry no type tag of their own.
inline constexpr const char *kDefaultCommandType = "IRCommand";

struct ConfigResponse
{
    std::vector<Device> devices;
    std::vector<Activity> activities; ///< is_current is false for all entries.
};

struct CurrentActivityResponse
{
    std::string activity_id;
};

struct AckResponse
{
    int code{200};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return code >= 200 && code < 300; }
};

struct RawResponse
{
    std::string request_type;
    nlohmann::json body;
};

using HubResponse = std::variant<ConfigResponse, CurrentActivityResponse, AckResponse, RawResponse>;

enum class HoldPhase
{
    Press,
    Release,
};

/**
 * @brief Decodes a response body for @p request_type.
 * @throws HubError(Validation) when a known response is structurally invalid.
 */
[[nodiscard]] HUBLINK_CORE_EXPORT HubResponse decode_response(std::string_view request_type,
                                                              const nlohmann::json &body);

/**
 * @brief Maps one raw device entry (with its controlGroup/function tree) to a Device.
 *
 * Commands whose action carries no command token and whose function has no name
 * are dropped with a warning. The action may be a JSON object or a JSON string.
 * @throws HubError(Validation) when the device itself has no id.
 */
[[nodiscard]] HUBLINK_CORE_EXPORT Device decode_device(const nlohmann::json &raw);

/**
 * @brief Decodes a hub announcement (uuid, ip, friendlyName, ...).
 * @throws HubError(Validation) when uuid or ip is missing.
 */
[[nodiscard]] HUBLINK_CORE_EXPORT Hub decode_announcement(const nlohmann::json &body);

/// `holdAction` body for one phase of a command.
[[nodiscard]] HUBLINK_CORE_EXPORT nlohmann::json make_hold_action(const Command &command,
                                                                  HoldPhase phase);

/// `startActivity` body.
[[nodiscard]] HUBLINK_CORE_EXPORT nlohmann::json make_start_activity(const std::string &activity_id);

} // namespace hublink::hub
