#include "hbl_hub.hpp"

namespace hublink::hub
{

namespace
{
template <typename T>
void put_optional(nlohmann::json &j, const char *key, const std::optional<T> &value)
{
    if (value)
        j[key] = *value;
}

template <typename T>
void get_optional(const nlohmann::json &j, const char *key, std::optional<T> &out)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        out = it->template get<T>();
    else
        out.reset();
}
} // namespace

const Command *Device::find_command(const std::string &command_id) const noexcept
{
    for (const auto &cmd : commands)
    {
        if (cmd.id == command_id)
            return &cmd;
    }
    return nullptr;
}

const char *to_string(ConnectionState state) noexcept
{
    switch (state)
    {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting:   return "Connecting";
    case ConnectionState::Connected:    return "Connected";
    }
    return "Unknown";
}

const char *to_string(CommandStatus status) noexcept
{
    switch (status)
    {
    case CommandStatus::Queued:    return "Queued";
    case CommandStatus::Executing: return "Executing";
    case CommandStatus::Completed: return "Completed";
    case CommandStatus::Failed:    return "Failed";
    case CommandStatus::Cancelled: return "Cancelled";
    case CommandStatus::TimedOut:  return "TimedOut";
    }
    return "Unknown";
}

bool is_terminal(CommandStatus status) noexcept
{
    return status != CommandStatus::Queued && status != CommandStatus::Executing;
}

void to_json(nlohmann::json &j, const Hub &hub)
{
    j = nlohmann::json{{"id", hub.id}, {"name", hub.name}, {"address", hub.address},
                       {"port", hub.port}};
    put_optional(j, "firmware_version", hub.firmware_version);
    put_optional(j, "remote_id", hub.remote_id);
    put_optional(j, "hub_id", hub.hub_id);
    put_optional(j, "product_id", hub.product_id);
}

void from_json(const nlohmann::json &j, Hub &hub)
{
    j.at("id").get_to(hub.id);
    j.at("name").get_to(hub.name);
    j.at("address").get_to(hub.address);
    hub.port = j.value("port", kDefaultSessionPort);
    get_optional(j, "firmware_version", hub.firmware_version);
    get_optional(j, "remote_id", hub.remote_id);
    get_optional(j, "hub_id", hub.hub_id);
    get_optional(j, "product_id", hub.product_id);
}

void to_json(nlohmann::json &j, const Command &cmd)
{
    j = nlohmann::json{{"id", cmd.id}, {"label", cmd.label}, {"device_id", cmd.device_id}};
    put_optional(j, "group", cmd.group);
    put_optional(j, "type", cmd.type);
}

void from_json(const nlohmann::json &j, Command &cmd)
{
    j.at("id").get_to(cmd.id);
    j.at("label").get_to(cmd.label);
    j.at("device_id").get_to(cmd.device_id);
    get_optional(j, "group", cmd.group);
    get_optional(j, "type", cmd.type);
}

void to_json(nlohmann::json &j, const Device &device)
{
    j = nlohmann::json{{"id", device.id},
                       {"label", device.label},
                       {"type", device.type},
                       {"commands", device.commands}};
}

void from_json(const nlohmann::json &j, Device &device)
{
    j.at("id").get_to(device.id);
    j.at("label").get_to(device.label);
    device.type = j.value("type", std::string("Default"));
    device.commands = j.value("commands", std::vector<Command>{});
}

void to_json(nlohmann::json &j, const Activity &activity)
{
    j = nlohmann::json{{"id", activity.id},
                       {"label", activity.label},
                       {"type", activity.type},
                       {"is_current", activity.is_current}};
}

void from_json(const nlohmann::json &j, Activity &activity)
{
    j.at("id").get_to(activity.id);
    j.at("label").get_to(activity.label);
    activity.type = j.value("type", std::string{});
    activity.is_current = j.value("is_current", false);
}

void to_json(nlohmann::json &j, const CachedSnapshot &snapshot)
{
    j = nlohmann::json{{"hub", snapshot.hub},
                       {"devices", snapshot.devices},
                       {"activities", snapshot.activities},
                       {"timestamp", format_tools::to_epoch_ms(snapshot.timestamp)}};
}

void from_json(const nlohmann::json &j, CachedSnapshot &snapshot)
{
    j.at("hub").get_to(snapshot.hub);
    j.at("devices").get_to(snapshot.devices);
    j.at("activities").get_to(snapshot.activities);
    snapshot.timestamp = format_tools::from_epoch_ms(j.at("timestamp").get<int64_t>());
}

} // namespace hublink::hub
