/**
 * @file test_hub_session.cpp
 * @brief End-to-end behaviour of the HubSession facade over fake transports.
 */
#include "hbl_hub.hpp"
#include "fake_transports.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>

using namespace hublink::hub;
using namespace hublink::tests;
using namespace hublink::tests::helper;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class HubSessionTest : public PureApiTest
{
  protected:
    void SetUp() override { install_hub_handlers(m_transport); }

    static SessionConfig test_config()
    {
        SessionConfig config = SessionConfig::defaults();
        config.discovery = DiscoveryConfig{100ms, 20ms};
        config.connection.connect_timeout = 200ms;
        config.connection.request_timeout = 200ms;
        config.connection.max_reconnect_attempts = 1;
        config.connection.reconnect_base_delay = 5ms;
        config.connection.reconnect_max_delay = 5ms;
        config.queue.default_timeout = 500ms;
        config.queue.default_retries = 1;
        config.queue.retry_delay = 5ms;
        config.queue.hold_duration = 1ms;
        return config;
    }

    std::unique_ptr<HubSession> make_session(FakeSessionTransport &transport)
    {
        return std::make_unique<HubSession>(m_discovery, transport, m_store, test_config(),
                                            &m_sink, [this] { return now(); });
    }

    std::unique_ptr<HubSession> make_session() { return make_session(m_transport); }

    Clock::time_point now() const
    {
        return m_epoch + std::chrono::milliseconds(m_offset_ms.load());
    }

    void advance(std::chrono::milliseconds d) { m_offset_ms += d.count(); }

    NiceMock<MockNotificationSink> m_sink;
    FakeDiscoveryTransport m_discovery;
    FakeSessionTransport m_transport;
    hublink::utils::MemoryStore m_store;
    const Hub m_hub = make_hub("h1", "10.0.0.5", "Living Room");

  private:
    const Clock::time_point m_epoch = hublink::format_tools::from_epoch_ms(1'700'000'000'000);
    std::atomic<int64_t> m_offset_ms{0};
};

// ============================================================================
// Session data
// ============================================================================

TEST_F(HubSessionTest, FirstLoadFetchesAndCaches)
{
    auto session = make_session();
    const auto data = session->get_session_data(&m_hub, false);

    EXPECT_FALSE(data.from_cache);
    EXPECT_EQ(data.hub.id, "h1");
    ASSERT_EQ(data.devices.size(), 2u);
    ASSERT_EQ(data.activities.size(), 2u);
    EXPECT_TRUE(data.activities[0].is_current);
    EXPECT_EQ(data.timestamp, now());

    EXPECT_EQ(m_transport.open_count(), 1);
    EXPECT_EQ(m_transport.request_count(request::kGetConfig), 2);
    EXPECT_EQ(m_transport.request_count(request::kGetCurrentActivity), 1);

    auto cached = session->cache().get("h1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->devices, data.devices);
    EXPECT_EQ(session->cache().last_hub_id(), std::optional<std::string>("h1"));
    ASSERT_TRUE(session->current_snapshot().has_value());
}

TEST_F(HubSessionTest, CacheHitDoesNotTouchTheNetwork)
{
    {
        auto first = make_session();
        (void)first->get_session_data(&m_hub, false);
    }

    FakeSessionTransport idle_transport;
    auto session = make_session(idle_transport);
    advance(1h);
    const auto data = session->get_session_data(&m_hub, false);

    EXPECT_TRUE(data.from_cache);
    EXPECT_EQ(data.devices.size(), 2u);
    EXPECT_EQ(idle_transport.open_count(), 0);
    EXPECT_EQ(idle_transport.request_count(), 0);
}

TEST_F(HubSessionTest, ForcedRefreshBypassesCache)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);
    const int before = m_transport.request_count(request::kGetConfig);

    advance(1s);
    const auto data = session->get_session_data(&m_hub, true);
    EXPECT_FALSE(data.from_cache);
    EXPECT_EQ(m_transport.request_count(request::kGetConfig), before + 2);
    EXPECT_EQ(m_transport.open_count(), 1);
    EXPECT_EQ(session->cache().get("h1")->timestamp, now());
}

TEST_F(HubSessionTest, StaleCacheIsRefetched)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);

    advance(25h);
    const auto data = session->get_session_data(&m_hub, false);
    EXPECT_FALSE(data.from_cache);
    EXPECT_EQ(m_transport.request_count(request::kGetConfig), 4);
}

TEST_F(HubSessionTest, SilentlyDeadSessionIsReopenedOnRefresh)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, true);
    m_transport.kill_open_sessions();

    for (int i = 0; i < 3; ++i)
    {
        advance(1s);
        const auto data = session->get_session_data(&m_hub, true);
        EXPECT_FALSE(data.from_cache);
        EXPECT_EQ(data.devices.size(), 2u);
    }
    EXPECT_EQ(m_transport.open_count(), 2);
    EXPECT_EQ(m_transport.close_count(), 1);
    EXPECT_TRUE(session->connection().is_connected());
}

TEST_F(HubSessionTest, FailedFetchLeavesCacheUntouched)
{
    m_transport.on(request::kGetConfig, [](const nlohmann::json &) -> nlohmann::json
                   { throw std::runtime_error("receive timed out"); });
    auto session = make_session();
    EXPECT_CALL(m_sink, failure(HasSubstr("Cannot load data"), _)).Times(1);

    try
    {
        (void)session->get_session_data(&m_hub, false);
        FAIL() << "expected HubError";
    }
    catch (const HubError &e)
    {
        EXPECT_EQ(e.category(), ErrorCategory::Connection);
    }
    EXPECT_FALSE(session->cache().get("h1").has_value());
    EXPECT_FALSE(session->current_snapshot().has_value());
}

TEST_F(HubSessionTest, UnreachableHubReportsConnectFailure)
{
    m_transport.set_unreachable(true);
    auto session = make_session();
    EXPECT_CALL(m_sink, failure(HasSubstr("Cannot connect to Living Room"), _)).Times(1);

    EXPECT_THROW((void)session->get_session_data(&m_hub, false), HubError);
    EXPECT_FALSE(session->cache().get("h1").has_value());
}

TEST_F(HubSessionTest, GettersServeCurrentHub)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);

    EXPECT_EQ(session->get_devices().size(), 2u);
    EXPECT_EQ(session->get_activities().size(), 2u);
    EXPECT_EQ(m_transport.request_count(request::kGetConfig), 2);
}

// ============================================================================
// Hub resolution
// ============================================================================

TEST_F(HubSessionTest, UnknownHubIsDiscovered)
{
    m_discovery.announce_on_start = {m_hub, make_hub("h2", "10.0.0.6")};
    auto session = make_session();

    const auto data = session->get_session_data(nullptr, false);
    EXPECT_EQ(data.hub.id, "h1");
    EXPECT_EQ(m_discovery.start_count(), 1);
    EXPECT_EQ(m_transport.opened_hubs(), std::vector<std::string>{"h1"});
}

TEST_F(HubSessionTest, LastCachedHubIsUsedWithoutDiscovery)
{
    {
        auto first = make_session();
        (void)first->get_session_data(&m_hub, false);
    }
    auto session = make_session();
    const auto data = session->get_session_data(nullptr, false);

    EXPECT_TRUE(data.from_cache);
    EXPECT_EQ(data.hub.id, "h1");
    EXPECT_EQ(m_discovery.start_count(), 0);
}

TEST_F(HubSessionTest, NoHubAnywhereIsDiscoveryError)
{
    auto session = make_session();
    try
    {
        (void)session->get_session_data(nullptr, false);
        FAIL() << "expected HubError";
    }
    catch (const HubError &e)
    {
        EXPECT_EQ(e.category(), ErrorCategory::Discovery);
    }
}

TEST_F(HubSessionTest, DiscoverHubsNotifiesProgressAndSuccess)
{
    m_discovery.announce_on_start = {m_hub};
    auto session = make_session();
    EXPECT_CALL(m_sink, progress(HasSubstr("Searching"))).Times(1);
    EXPECT_CALL(m_sink, success(HasSubstr("Found 1 hub"))).Times(1);

    const auto result = session->discover_hubs();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.hubs.size(), 1u);
}

// ============================================================================
// Activities and commands
// ============================================================================

TEST_F(HubSessionTest, StartActivityUpdatesSnapshotAndCache)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);
    EXPECT_CALL(m_sink, success(HasSubstr("Started activity '100'"))).Times(1);

    session->start_activity("100");

    const auto snapshot = session->current_snapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_FALSE(snapshot->activities[0].is_current);
    EXPECT_TRUE(snapshot->activities[1].is_current);
    const auto cached = session->cache().get("h1");
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->activities[1].is_current);
    EXPECT_EQ(session->connection().current_activity_id(), std::optional<std::string>("100"));
}

TEST_F(HubSessionTest, PowerOffActivityNotifiesPoweredOff)
{
    install_hub_handlers(m_transport, "100");
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);
    EXPECT_CALL(m_sink, success(HasSubstr("Powered off"))).Times(1);

    session->start_activity(kPowerOffActivityId);
    EXPECT_TRUE(session->current_snapshot()->activities[0].is_current);
}

TEST_F(HubSessionTest, ExecuteCommandPressesAndReleases)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);
    EXPECT_CALL(m_sink, success(HasSubstr("Sent VolumeUp"))).Times(1);

    const auto result = session->execute_command("d1", "VolumeUp");
    EXPECT_EQ(result.status, CommandStatus::Completed);
    EXPECT_EQ(result.attempts, 1);

    std::vector<std::string> phases;
    for (const auto &[type, payload] : m_transport.requests())
    {
        if (type == request::kHoldAction)
        {
            EXPECT_EQ(payload["command"], "VolumeUp");
            EXPECT_EQ(payload["deviceId"], "d1");
            phases.push_back(payload["status"].get<std::string>());
        }
    }
    EXPECT_EQ(phases, (std::vector<std::string>{"press", "release"}));
    // One liveness check precedes the command.
    EXPECT_EQ(m_transport.request_count(request::kGetCurrentActivity), 2);
}

TEST_F(HubSessionTest, ExecutedCommandsDoNotAccumulateResults)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);

    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(session->execute_command("d1", "VolumeUp").status, CommandStatus::Completed);

    const auto status = session->queue().status();
    EXPECT_EQ(status.completed, 0u);
    EXPECT_EQ(status.failed, 0u);
    EXPECT_EQ(m_transport.request_count(request::kHoldAction), 40);
}

TEST_F(HubSessionTest, ExecuteCommandFromCacheConnectsLazily)
{
    {
        auto first = make_session();
        (void)first->get_session_data(&m_hub, false);
    }
    FakeSessionTransport transport;
    install_hub_handlers(transport);
    auto session = make_session(transport);
    EXPECT_TRUE(session->get_session_data(&m_hub, false).from_cache);
    EXPECT_EQ(transport.open_count(), 0);

    const auto result = session->execute_command("d2", "PowerToggle");
    EXPECT_EQ(result.status, CommandStatus::Completed);
    EXPECT_EQ(transport.open_count(), 1);
    EXPECT_EQ(transport.request_count(request::kHoldAction), 2);
}

TEST_F(HubSessionTest, UnknownDeviceOrCommandIsValidationError)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);

    try
    {
        (void)session->execute_command("nope", "PowerOn");
        FAIL() << "expected HubError";
    }
    catch (const HubError &e)
    {
        EXPECT_EQ(e.category(), ErrorCategory::Validation);
        EXPECT_EQ(recovery_action(e), RecoveryAction::Manual);
    }
    EXPECT_THROW((void)session->execute_command("d1", "Launch"), HubError);
    EXPECT_EQ(m_transport.request_count(request::kHoldAction), 0);
}

TEST_F(HubSessionTest, FailingCommandIsReportedInResult)
{
    m_transport.on(request::kHoldAction, [](const nlohmann::json &)
                   { return nlohmann::json{{"code", 500}, {"msg", "IR blaster busy"}}; });
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);
    EXPECT_CALL(m_sink, failure(HasSubstr("Failed to send PowerOn"), _)).Times(1);

    CommandResult result;
    ASSERT_NO_THROW(result = session->execute_command("d1", "PowerOn"));
    EXPECT_EQ(result.status, CommandStatus::Failed);
    EXPECT_EQ(result.attempts, 2);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->category(), ErrorCategory::Command);
    EXPECT_EQ(result.error->attempts(), 2);
}

TEST_F(HubSessionTest, SubmitCommandCompletesAsynchronously)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);

    std::atomic<bool> done{false};
    auto ticket = session->submit_command("d1", "PowerOn",
                                          [&](const CommandResult &result)
                                          {
                                              if (result.status == CommandStatus::Completed)
                                                  done = true;
                                          });
    EXPECT_EQ(ticket.result.get().status, CommandStatus::Completed);
    EXPECT_TRUE(wait_until([&] { return done.load(); }, 1s));
    EXPECT_EQ(session->cancel_pending_commands(), 0u);
}

// ============================================================================
// Cache clearing and connection loss
// ============================================================================

TEST_F(HubSessionTest, ClearCacheDropsSessionAndSnapshot)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);
    ASSERT_TRUE(session->connection().is_connected());

    session->clear_cache();
    EXPECT_FALSE(session->connection().is_connected());
    EXPECT_EQ(m_transport.close_count(), 1);
    EXPECT_FALSE(session->cache().get("h1").has_value());
    EXPECT_FALSE(session->current_snapshot().has_value());

    const auto data = session->get_session_data(&m_hub, false);
    EXPECT_FALSE(data.from_cache);
    EXPECT_EQ(m_transport.open_count(), 2);
}

TEST_F(HubSessionTest, ConnectionLossIsNotified)
{
    auto session = make_session();
    (void)session->get_session_data(&m_hub, false);

    std::atomic<bool> lost{false};
    EXPECT_CALL(m_sink, failure(HasSubstr("Lost connection"), _))
        .WillOnce([&](const std::string &, const HubError &error)
                  {
                      EXPECT_EQ(error.category(), ErrorCategory::Connection);
                      lost = true;
                  });
    EXPECT_CALL(m_sink, failure(::testing::Not(HasSubstr("Lost connection")), _))
        .Times(AnyNumber());

    m_transport.set_unreachable(true);
    m_transport.drop("peer reset");
    EXPECT_TRUE(wait_until([&] { return lost.load(); }, 2s));
    EXPECT_FALSE(session->connection().is_connected());
}
