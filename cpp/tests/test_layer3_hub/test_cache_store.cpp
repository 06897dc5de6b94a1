/**
 * @file test_cache_store.cpp
 * @brief CacheStore: freshness, hub-id matching, corruption and clearing.
 */
#include "hbl_hub.hpp"
#include "fake_transports.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace hublink::hub;
using namespace hublink::tests;
using namespace hublink::utils;
using namespace std::chrono_literals;

namespace
{

/// Store whose operations can be made to fail.
class FailingStore : public MemoryStore
{
  public:
    bool fail_reads{false};
    bool fail_writes{false};

    std::optional<std::string> get(const std::string &key) const override
    {
        if (fail_reads)
            throw std::runtime_error("disk unavailable");
        return MemoryStore::get(key);
    }
    void set(const std::string &key, const std::string &value) override
    {
        if (fail_writes)
            throw std::runtime_error("disk full");
        MemoryStore::set(key, value);
    }
    void remove(const std::string &key) override
    {
        if (fail_writes)
            throw std::runtime_error("read-only");
        MemoryStore::remove(key);
    }
};

} // namespace

class CacheStoreTest : public PureApiTest
{
  protected:
    CacheStoreTest() : m_cache(m_store, 24h, [this] { return m_now; }) {}

    CachedSnapshot snapshot_for(const std::string &hub_id)
    {
        CachedSnapshot snapshot;
        snapshot.hub = make_hub(hub_id);
        snapshot.devices = {decode_device(device_entry("d1", "Receiver", {"PowerOn"}))};
        snapshot.activities = {Activity{"-1", "PowerOff", "PowerOff", true}};
        snapshot.timestamp = m_now;
        return snapshot;
    }

    FailingStore m_store;
    Clock::time_point m_now{hublink::format_tools::from_epoch_ms(1'700'000'000'000)};
    CacheStore m_cache;
};

TEST_F(CacheStoreTest, MissWhenEmpty)
{
    EXPECT_FALSE(m_cache.get("h1").has_value());
    EXPECT_FALSE(m_cache.last_hub_id().has_value());
}

TEST_F(CacheStoreTest, HitReturnsStoredSnapshot)
{
    m_cache.set(snapshot_for("h1"));
    m_now += 1h;

    auto hit = m_cache.get("h1");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->hub.id, "h1");
    ASSERT_EQ(hit->devices.size(), 1u);
    EXPECT_EQ(hit->devices[0].commands[0].id, "PowerOn");
    EXPECT_TRUE(hit->activities[0].is_current);
    EXPECT_EQ(m_cache.last_hub_id(), std::optional<std::string>("h1"));
}

TEST_F(CacheStoreTest, StaleExactlyAtTtl)
{
    m_cache.set(snapshot_for("h1"));

    m_now += 24h - 1ms;
    EXPECT_TRUE(m_cache.get("h1").has_value());

    m_now += 1ms;
    EXPECT_FALSE(m_cache.get("h1").has_value());
}

TEST_F(CacheStoreTest, RecordIsPerHub)
{
    m_cache.set(snapshot_for("h1"));
    m_cache.set(snapshot_for("h2"));
    EXPECT_TRUE(m_cache.get("h1").has_value());
    EXPECT_TRUE(m_cache.get("h2").has_value());
    EXPECT_FALSE(m_cache.get("h3").has_value());
    EXPECT_EQ(m_cache.last_hub_id(), std::optional<std::string>("h2"));
}

TEST_F(CacheStoreTest, MismatchedHubIdIsMiss)
{
    // A record stored under the wrong key must never be served.
    m_store.set(std::string(CacheStore::kKeyPrefix) + "h1",
                nlohmann::json(snapshot_for("other")).dump());
    EXPECT_FALSE(m_cache.get("h1").has_value());
}

TEST_F(CacheStoreTest, CorruptRecordIsMiss)
{
    const std::string key = std::string(CacheStore::kKeyPrefix) + "h1";
    m_store.set(key, "{ truncated");
    EXPECT_FALSE(m_cache.get("h1").has_value());

    m_store.set(key, R"({"hub": {"id": "h1"}})");
    EXPECT_FALSE(m_cache.get("h1").has_value());
}

TEST_F(CacheStoreTest, ReadFailureIsMiss)
{
    m_cache.set(snapshot_for("h1"));
    m_store.fail_reads = true;
    EXPECT_FALSE(m_cache.get("h1").has_value());
    EXPECT_FALSE(m_cache.last_hub_id().has_value());
}

TEST_F(CacheStoreTest, WriteFailureIsStorageError)
{
    m_store.fail_writes = true;
    try
    {
        m_cache.set(snapshot_for("h1"));
        FAIL() << "expected HubError";
    }
    catch (const HubError &e)
    {
        EXPECT_EQ(e.category(), ErrorCategory::Storage);
        EXPECT_EQ(e.cause(), "disk full");
    }
}

TEST_F(CacheStoreTest, ClearAllRemovesEveryRecordAndNotifies)
{
    m_store.set("unrelated", "keep");
    m_cache.set(snapshot_for("h1"));
    m_cache.set(snapshot_for("h2"));

    std::vector<std::optional<std::string>> cleared;
    m_cache.set_clear_listener([&](const std::optional<std::string> &id) { cleared.push_back(id); });

    m_cache.clear();
    EXPECT_FALSE(m_cache.get("h1").has_value());
    EXPECT_FALSE(m_cache.get("h2").has_value());
    EXPECT_FALSE(m_cache.last_hub_id().has_value());
    EXPECT_TRUE(m_store.keys(CacheStore::kKeyPrefix).empty());
    EXPECT_EQ(m_store.get("unrelated"), std::optional<std::string>("keep"));
    ASSERT_EQ(cleared.size(), 1u);
    EXPECT_FALSE(cleared[0].has_value());
}

TEST_F(CacheStoreTest, ClearOneHub)
{
    m_cache.set(snapshot_for("h1"));
    m_cache.set(snapshot_for("h2"));

    std::vector<std::optional<std::string>> cleared;
    m_cache.set_clear_listener([&](const std::optional<std::string> &id) { cleared.push_back(id); });

    m_cache.clear("h1");
    EXPECT_FALSE(m_cache.get("h1").has_value());
    EXPECT_TRUE(m_cache.get("h2").has_value());
    EXPECT_EQ(m_cache.last_hub_id(), std::optional<std::string>("h2"));

    m_cache.clear("h2");
    EXPECT_FALSE(m_cache.last_hub_id().has_value());

    ASSERT_EQ(cleared.size(), 2u);
    EXPECT_EQ(cleared[0], std::optional<std::string>("h1"));
    EXPECT_EQ(cleared[1], std::optional<std::string>("h2"));
}

TEST_F(CacheStoreTest, ClearFailureIsStorageErrorWithoutNotification)
{
    m_cache.set(snapshot_for("h1"));
    bool notified = false;
    m_cache.set_clear_listener([&](const std::optional<std::string> &) { notified = true; });

    m_store.fail_writes = true;
    EXPECT_THROW(m_cache.clear(), HubError);
    EXPECT_FALSE(notified);
}
