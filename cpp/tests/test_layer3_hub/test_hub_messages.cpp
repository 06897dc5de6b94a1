/**
 * @file test_hub_messages.cpp
 * @brief Decoding of hub payloads and the persisted snapshot layout.
 */
#include "hbl_hub.hpp"
#include "fake_transports.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace hublink::hub;
using namespace hublink::tests;
using nlohmann::json;

class HubMessagesTest : public PureApiTest
{
};

// ============================================================================
// Devices
// ============================================================================

TEST_F(HubMessagesTest, DeviceWithStringEncodedActions)
{
    const Device device = decode_device(device_entry("d1", "Receiver", {"PowerOn", "VolumeUp"}));

    EXPECT_EQ(device.id, "d1");
    EXPECT_EQ(device.label, "Receiver");
    EXPECT_EQ(device.type, "StereoReceiver");
    ASSERT_EQ(device.commands.size(), 2u);
    EXPECT_EQ(device.commands[0].id, "PowerOn");
    EXPECT_EQ(device.commands[0].device_id, "d1");
    EXPECT_EQ(device.commands[0].group, std::optional<std::string>("Power"));
    EXPECT_EQ(device.commands[0].type, std::optional<std::string>("IRCommand"));
    ASSERT_NE(device.find_command("VolumeUp"), nullptr);
    EXPECT_EQ(device.find_command("Mute"), nullptr);
}

TEST_F(HubMessagesTest, DeviceWithNumericIdAndObjectAction)
{
    json raw = {{"id", 51234},
                {"label", "TV"},
                {"deviceTypeDisplayName", "Television"},
                {"controlGroup",
                 {{{"name", "Volume"},
                   {"function",
                    {{{"name", "Mute"},
                      {"label", "Mute"},
                      {"action", {{"command", "Mute"}, {"type", "IRCommand"}}}}}}}}}};

    const Device device = decode_device(raw);
    EXPECT_EQ(device.id, "51234");
    EXPECT_EQ(device.type, "Television");
    ASSERT_EQ(device.commands.size(), 1u);
    EXPECT_EQ(device.commands[0].id, "Mute");
    EXPECT_EQ(device.commands[0].group, std::optional<std::string>("Volume"));
}

TEST_F(HubMessagesTest, CommandFallsBackToFunctionNameAndDropsNamelessOnes)
{
    json raw = {{"id", "d9"},
                {"controlGroup",
                 {{{"function",
                    {{{"name", "Input"}},                         // no action: name is the id
                     {{"label", "Broken"}, {"action", "{not json"}}, // nothing usable: dropped
                     {{"label", "Empty"}}}}}}}};

    const Device device = decode_device(raw);
    EXPECT_EQ(device.label, "d9");
    EXPECT_EQ(device.type, "Default");
    ASSERT_EQ(device.commands.size(), 1u);
    EXPECT_EQ(device.commands[0].id, "Input");
    EXPECT_EQ(device.commands[0].label, "Input");
    EXPECT_FALSE(device.commands[0].group.has_value());
    EXPECT_FALSE(device.commands[0].type.has_value());
}

TEST_F(HubMessagesTest, DeviceWithoutIdIsRejected)
{
    try
    {
        (void)decode_device(json{{"label", "Nameless"}});
        FAIL() << "expected HubError";
    }
    catch (const HubError &e)
    {
        EXPECT_EQ(e.category(), ErrorCategory::Validation);
    }
    EXPECT_THROW((void)decode_device(json::array()), HubError);
}

// ============================================================================
// Responses
// ============================================================================

TEST_F(HubMessagesTest, ConfigResponseDecodesDevicesAndActivities)
{
    json body = {{"device", {device_entry("d1", "Receiver", {"PowerOn"})}},
                 {"activity",
                  {{{"id", -1}, {"label", "PowerOff"}, {"type", "PowerOff"}},
                   {{"id", "100"}, {"label", "Watch TV"}}}}};

    auto response = decode_response(request::kGetConfig, body);
    ASSERT_TRUE(std::holds_alternative<ConfigResponse>(response));
    const auto &config = std::get<ConfigResponse>(response);
    ASSERT_EQ(config.devices.size(), 1u);
    ASSERT_EQ(config.activities.size(), 2u);
    EXPECT_EQ(config.activities[0].id, "-1");
    EXPECT_EQ(config.activities[1].label, "Watch TV");
    EXPECT_FALSE(config.activities[0].is_current);
    EXPECT_FALSE(config.activities[1].is_current);
}

TEST_F(HubMessagesTest, ConfigResponseMustBeObject)
{
    EXPECT_THROW((void)decode_response(request::kGetConfig, json::array()), HubError);
    EXPECT_THROW((void)decode_response(request::kGetConfig,
                                       json{{"activity", {{{"label", "no id"}}}}}),
                 HubError);
}

TEST_F(HubMessagesTest, CurrentActivityAcceptsNumberOrString)
{
    auto numeric = decode_response(request::kGetCurrentActivity, json{{"result", -1}});
    EXPECT_EQ(std::get<CurrentActivityResponse>(numeric).activity_id, "-1");

    auto text = decode_response(request::kGetCurrentActivity, json{{"result", "100"}});
    EXPECT_EQ(std::get<CurrentActivityResponse>(text).activity_id, "100");

    EXPECT_THROW((void)decode_response(request::kGetCurrentActivity, json::object()), HubError);
    EXPECT_THROW((void)decode_response(request::kGetCurrentActivity, json{{"result", nullptr}}),
                 HubError);
}

TEST_F(HubMessagesTest, AckCodes)
{
    auto ok = std::get<AckResponse>(decode_response(request::kHoldAction, json{{"code", 200}}));
    EXPECT_TRUE(ok.ok());

    auto text_code = std::get<AckResponse>(
        decode_response(request::kStartActivity, json{{"code", "404"}, {"msg", "no such"}}));
    EXPECT_EQ(text_code.code, 404);
    EXPECT_EQ(text_code.message, "no such");
    EXPECT_FALSE(text_code.ok());

    // An empty acknowledgement counts as success.
    auto empty = std::get<AckResponse>(decode_response(request::kHoldAction, json::object()));
    EXPECT_TRUE(empty.ok());
}

TEST_F(HubMessagesTest, UnknownRequestTypeIsRaw)
{
    auto response = decode_response("getFirmware", json{{"version", "4.15"}});
    ASSERT_TRUE(std::holds_alternative<RawResponse>(response));
    EXPECT_EQ(std::get<RawResponse>(response).request_type, "getFirmware");
    EXPECT_EQ(std::get<RawResponse>(response).body["version"], "4.15");
}

// ============================================================================
// Announcements and requests
// ============================================================================

TEST_F(HubMessagesTest, AnnouncementDecoding)
{
    json body = {{"uuid", "abc-123"},
                 {"ip", "192.168.1.20"},
                 {"friendlyName", "Living Room"},
                 {"port", "5300"},
                 {"current_fw_version", "4.15.250"},
                 {"remoteId", 9876}};

    const Hub hub = decode_announcement(body);
    EXPECT_EQ(hub.id, "abc-123");
    EXPECT_EQ(hub.name, "Living Room");
    EXPECT_EQ(hub.address, "192.168.1.20");
    EXPECT_EQ(hub.port, 5300);
    EXPECT_EQ(hub.firmware_version, std::optional<std::string>("4.15.250"));
    EXPECT_EQ(hub.remote_id, std::optional<std::string>("9876"));
    EXPECT_FALSE(hub.hub_id.has_value());
}

TEST_F(HubMessagesTest, AnnouncementDefaults)
{
    const Hub hub = decode_announcement(json{{"uuid", "u1"}, {"ip", "10.0.0.2"}, {"port", 99999}});
    EXPECT_EQ(hub.name, "10.0.0.2");
    EXPECT_EQ(hub.port, kDefaultSessionPort);
}

TEST_F(HubMessagesTest, AnnouncementWithoutIdentityIsRejected)
{
    EXPECT_THROW((void)decode_announcement(json{{"ip", "10.0.0.2"}}), HubError);
    EXPECT_THROW((void)decode_announcement(json{{"uuid", "u1"}}), HubError);
    EXPECT_THROW((void)decode_announcement(json("uuid")), HubError);
}

TEST_F(HubMessagesTest, HoldActionBody)
{
    Command cmd{"VolumeUp", "Volume Up", "d1", std::string("Volume"), std::nullopt};
    auto press = make_hold_action(cmd, HoldPhase::Press);
    EXPECT_EQ(press["command"], "VolumeUp");
    EXPECT_EQ(press["deviceId"], "d1");
    EXPECT_EQ(press["type"], kDefaultCommandType);
    EXPECT_EQ(press["status"], "press");

    cmd.type = "BluetoothCommand";
    auto release = make_hold_action(cmd, HoldPhase::Release);
    EXPECT_EQ(release["type"], "BluetoothCommand");
    EXPECT_EQ(release["status"], "release");

    EXPECT_EQ(make_start_activity("100")["activityId"], "100");
}

// ============================================================================
// Persisted snapshot layout
// ============================================================================

TEST_F(HubMessagesTest, SnapshotJsonLayout)
{
    CachedSnapshot snapshot;
    snapshot.hub = make_hub("h1", "10.0.0.9", "Den");
    snapshot.hub.remote_id = "77";
    snapshot.devices = {decode_device(device_entry("d1", "Receiver", {"PowerOn"}))};
    snapshot.activities = {Activity{"100", "Watch TV", "VirtualTelevisionN", true}};
    snapshot.timestamp = hublink::format_tools::from_epoch_ms(1'700'000'000'123);

    json j = snapshot;
    EXPECT_EQ(j["timestamp"], 1'700'000'000'123);
    EXPECT_EQ(j["hub"]["id"], "h1");
    EXPECT_EQ(j["hub"]["remote_id"], "77");
    EXPECT_FALSE(j["hub"].contains("firmware_version"));
    EXPECT_EQ(j["activities"][0]["is_current"], true);

    const auto back = j.get<CachedSnapshot>();
    EXPECT_EQ(back.hub, snapshot.hub);
    EXPECT_EQ(back.devices, snapshot.devices);
    EXPECT_EQ(back.activities, snapshot.activities);
    EXPECT_EQ(back.timestamp, snapshot.timestamp);
}

TEST_F(HubMessagesTest, StatusHelpers)
{
    EXPECT_FALSE(is_terminal(CommandStatus::Queued));
    EXPECT_FALSE(is_terminal(CommandStatus::Executing));
    EXPECT_TRUE(is_terminal(CommandStatus::Completed));
    EXPECT_TRUE(is_terminal(CommandStatus::Failed));
    EXPECT_TRUE(is_terminal(CommandStatus::Cancelled));
    EXPECT_TRUE(is_terminal(CommandStatus::TimedOut));
    EXPECT_STREQ(to_string(ConnectionState::Connecting), "Connecting");
    EXPECT_STREQ(to_string(CommandStatus::TimedOut), "TimedOut");
}
