/**
 * @file hub_messages.cpp
 * @brief Boundary validation of hub payloads.
 */
#include "hbl_hub.hpp"

#include <cstdlib>

namespace hublink::hub
{

namespace
{
// Ids arrive as strings on newer firmware and as numbers on older firmware.
std::string id_string(const nlohmann::json &value)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_number_integer())
        return std::to_string(value.get<int64_t>());
    return {};
}

std::string first_id(const nlohmann::json &j, std::initializer_list<const char *> keys)
{
    for (const char *key : keys)
    {
        auto it = j.find(key);
        if (it != j.end())
        {
            auto s = id_string(*it);
            if (!s.empty())
                return s;
        }
    }
    return {};
}

std::string string_or(const nlohmann::json &j, const char *key, const std::string &fallback)
{
    auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty())
        return it->get<std::string>();
    return fallback;
}

HubError invalid(const char *operation, const std::string &message)
{
    return HubError(ErrorCategory::Validation, operation, message);
}

std::optional<Command> decode_function(const nlohmann::json &fn, const std::string &device_id,
                                       const std::optional<std::string> &group,
                                       const std::string &device_label)
{
    const std::string fn_name = string_or(fn, "name", "");
    std::string command_id;
    std::optional<std::string> type;

    auto action_it = fn.find("action");
    if (action_it != fn.end() && !action_it->is_null())
    {
        try
        {
            nlohmann::json action = action_it->is_string()
                                        ? nlohmann::json::parse(action_it->get<std::string>())
                                        : *action_it;
            command_id = string_or(action, "command", "");
            if (action.contains("type") && action["type"].is_string())
                type = action["type"].get<std::string>();
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("hub_messages: unparsable action for device '{}': {}", device_label,
                        e.what());
        }
    }
    if (command_id.empty())
        command_id = fn_name;
    if (command_id.empty())
    {
        LOGGER_WARN("hub_messages: dropping command without id on device '{}'", device_label);
        return std::nullopt;
    }

    Command cmd;
    cmd.id = command_id;
    cmd.label = string_or(fn, "label", command_id);
    cmd.device_id = device_id;
    cmd.group = group;
    cmd.type = std::move(type);
    return cmd;
}

Activity decode_activity(const nlohmann::json &raw)
{
    Activity activity;
    activity.id = first_id(raw, {"id"});
    if (activity.id.empty())
        throw invalid("decode_activity", "activity entry without id");
    activity.label = string_or(raw, "label", activity.id);
    activity.type = string_or(raw, "type", "");
    return activity;
}
} // namespace

Device decode_device(const nlohmann::json &raw)
{
    if (!raw.is_object())
        throw invalid("decode_device", "device entry is not an object");

    Device device;
    device.id = first_id(raw, {"id", "contentProfileKey"});
    if (device.id.empty())
        throw invalid("decode_device", "device entry without id");
    device.label = string_or(raw, "label", device.id);
    device.type = string_or(raw, "deviceTypeDisplayName", string_or(raw, "type", "Default"));

    auto groups = raw.find("controlGroup");
    if (groups == raw.end() || !groups->is_array())
        return device;

    for (const auto &group : *groups)
    {
        std::optional<std::string> group_name;
        if (group.contains("name") && group["name"].is_string())
            group_name = group["name"].get<std::string>();
        auto functions = group.find("function");
        if (functions == group.end() || !functions->is_array())
            continue;
        for (const auto &fn : *functions)
        {
            if (auto cmd = decode_function(fn, device.id, group_name, device.label))
                device.commands.push_back(std::move(*cmd));
        }
    }
    LOGGER_DEBUG("hub_messages: device '{}' mapped with {} commands", device.label,
                 device.commands.size());
    return device;
}

HubResponse decode_response(std::string_view request_type, const nlohmann::json &body)
{
    if (request_type == request::kGetConfig)
    {
        if (!body.is_object())
            throw invalid("getConfig", "response body is not an object");
        ConfigResponse out;
        if (auto it = body.find("device"); it != body.end() && it->is_array())
        {
            for (const auto &raw : *it)
                out.devices.push_back(decode_device(raw));
        }
        if (auto it = body.find("activity"); it != body.end() && it->is_array())
        {
            for (const auto &raw : *it)
                out.activities.push_back(decode_activity(raw));
        }
        return out;
    }
    if (request_type == request::kGetCurrentActivity)
    {
        if (!body.is_object() || !body.contains("result"))
            throw invalid("getCurrentActivity", "response without 'result'");
        CurrentActivityResponse out;
        out.activity_id = id_string(body["result"]);
        if (out.activity_id.empty())
            throw invalid("getCurrentActivity", "'result' is not an activity id");
        return out;
    }
    if (request_type == request::kStartActivity || request_type == request::kHoldAction)
    {
        AckResponse out;
        if (body.is_object())
        {
            auto code = body.find("code");
            if (code != body.end())
            {
                if (code->is_number_integer())
                    out.code = code->get<int>();
                else if (code->is_string())
                    out.code = std::atoi(code->get<std::string>().c_str());
            }
            out.message = string_or(body, "msg", "");
        }
        return out;
    }
    return RawResponse{std::string(request_type), body};
}

Hub decode_announcement(const nlohmann::json &body)
{
    if (!body.is_object())
        throw invalid("decode_announcement", "announcement is not an object");

    Hub hub;
    hub.id = first_id(body, {"uuid"});
    hub.address = string_or(body, "ip", "");
    if (hub.id.empty() || hub.address.empty())
        throw invalid("decode_announcement", "announcement without uuid or ip");
    hub.name = string_or(body, "friendlyName", hub.address);

    if (auto it = body.find("port"); it != body.end())
    {
        int port = it->is_number_integer() ? it->get<int>()
                   : it->is_string()       ? std::atoi(it->get<std::string>().c_str())
                                           : 0;
        if (port > 0 && port <= 65535)
            hub.port = static_cast<uint16_t>(port);
    }

    auto opt = [&body](const char *key) -> std::optional<std::string>
    {
        auto s = first_id(body, {key});
        if (s.empty())
            return std::nullopt;
        return s;
    };
    hub.firmware_version = opt("current_fw_version");
    hub.remote_id = opt("remoteId");
    hub.hub_id = opt("hubId");
    hub.product_id = opt("productId");
    return hub;
}

nlohmann::json make_hold_action(const Command &command, HoldPhase phase)
{
    return nlohmann::json{{"command", command.id},
                          {"deviceId", command.device_id},
                          {"type", command.type.value_or(kDefaultCommandType)},
                          {"status", phase == HoldPhase::Press ? "press" : "release"}};
}

nlohmann::json make_start_activity(const std::string &activity_id)
{
    return nlohmann::json{{"activityId", activity_id}};
}

} // namespace hublink::hub
