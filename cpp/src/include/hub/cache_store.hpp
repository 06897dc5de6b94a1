#pragma once
/**
 * @file cache_store.hpp
 * @brief Persists the last known {hub, devices, activities} snapshot per hub.
 *
 * One record per hub id is stored in the key-value store under
 * `hublink.cache.<hub id>`, plus `hublink.cache.last_hub` naming the hub of the
 * most recent write. Records are JSON, versionless, and always replaced whole.
 *
 * `get()` reports a miss for stale data (`now - timestamp >= ttl`), for a record
 * whose hub id does not match, and for a corrupt record (logged, never thrown).
 * `clear()` notifies the registered clear listener after removal; the session
 * facade uses this to drop the live session of the cleared hub.
 */
#include "hub/hub_types.hpp"
#include "utils/key_value_store.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace hublink::hub
{

class HUBLINK_CORE_EXPORT CacheStore
{
  public:
    using ClockFn = std::function<Clock::time_point()>;
    /// Receives the cleared hub id, or nullopt when every record was cleared.
    using ClearListener = std::function<void(const std::optional<std::string> &hub_id)>;

    static constexpr const char *kKeyPrefix = "hublink.cache.";
    static constexpr const char *kLastHubKey = "hublink.cache.last_hub";

    CacheStore(utils::IKeyValueStore &store, std::chrono::milliseconds ttl,
               ClockFn clock = [] { return Clock::now(); });

    CacheStore(const CacheStore &) = delete;
    CacheStore &operator=(const CacheStore &) = delete;

    /// Fresh snapshot for @p hub_id, or nullopt (missing, stale, mismatched or corrupt).
    [[nodiscard]] std::optional<CachedSnapshot> get(const std::string &hub_id) const;

    /**
     * @brief Replaces the whole record of `snapshot.hub.id`.
     * @throws HubError(Cache) if the snapshot cannot be serialized,
     *         HubError(Storage) if the store rejects the write.
     */
    void set(const CachedSnapshot &snapshot);

    /// Removes every cached record. @throws HubError(Storage)
    void clear();

    /// Removes the record of one hub. @throws HubError(Storage)
    void clear(const std::string &hub_id);

    /// Hub id of the most recent successful set(), if it is still cached.
    [[nodiscard]] std::optional<std::string> last_hub_id() const;

    void set_clear_listener(ClearListener listener);

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return m_ttl; }

    /// Current time of the cache clock; snapshots are stamped with it.
    [[nodiscard]] Clock::time_point now() const { return m_clock(); }

  private:
    static std::string record_key(const std::string &hub_id) { return kKeyPrefix + hub_id; }
    void remove_key(const std::string &key);
    void notify_cleared(const std::optional<std::string> &hub_id);

    utils::IKeyValueStore &m_store;
    std::chrono::milliseconds m_ttl;
    ClockFn m_clock;
    mutable std::mutex m_mutex;
    std::mutex m_listener_mutex;
    ClearListener m_clear_listener;
};

} // namespace hublink::hub
