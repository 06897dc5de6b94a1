#include "hbl_hub.hpp"

namespace hublink::hub
{

CacheStore::CacheStore(utils::IKeyValueStore &store, std::chrono::milliseconds ttl, ClockFn clock)
    : m_store(store), m_ttl(ttl), m_clock(std::move(clock))
{
}

std::optional<CachedSnapshot> CacheStore::get(const std::string &hub_id) const
{
    std::optional<std::string> raw;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try
        {
            raw = m_store.get(record_key(hub_id));
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("CacheStore: reading '{}' failed, treating as miss: {}", hub_id, e.what());
            return std::nullopt;
        }
    }
    if (!raw)
    {
        LOGGER_DEBUG("CacheStore: miss for hub '{}' (no record)", hub_id);
        return std::nullopt;
    }

    CachedSnapshot snapshot;
    try
    {
        nlohmann::json::parse(*raw).get_to(snapshot);
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("CacheStore: corrupt record for hub '{}', treating as miss: {}", hub_id,
                    e.what());
        return std::nullopt;
    }

    if (snapshot.hub.id != hub_id)
    {
        LOGGER_WARN("CacheStore: record under '{}' belongs to hub '{}', treating as miss", hub_id,
                    snapshot.hub.id);
        return std::nullopt;
    }

    const auto age =
        std::chrono::duration_cast<std::chrono::milliseconds>(m_clock() - snapshot.timestamp);
    if (age >= m_ttl)
    {
        LOGGER_DEBUG("CacheStore: stale record for hub '{}' (age {}, ttl {})", hub_id,
                     format_tools::format_duration(age), format_tools::format_duration(m_ttl));
        return std::nullopt;
    }

    LOGGER_DEBUG("CacheStore: hit for hub '{}' ({} devices, {} activities, age {})", hub_id,
                 snapshot.devices.size(), snapshot.activities.size(),
                 format_tools::format_duration(age));
    return snapshot;
}

void CacheStore::set(const CachedSnapshot &snapshot)
{
    std::string serialized;
    try
    {
        serialized = nlohmann::json(snapshot).dump();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw HubError(ErrorCategory::Cache, "cache.set",
                       fmt::format("cannot serialize snapshot of hub '{}'", snapshot.hub.id),
                       e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try
    {
        m_store.set(record_key(snapshot.hub.id), serialized);
        m_store.set(kLastHubKey, snapshot.hub.id);
    }
    catch (const std::exception &e)
    {
        throw HubError(ErrorCategory::Storage, "cache.set",
                       fmt::format("cannot persist snapshot of hub '{}'", snapshot.hub.id),
                       e.what());
    }
    LOGGER_INFO("CacheStore: cached hub '{}' ({} devices, {} activities)", snapshot.hub.id,
                snapshot.devices.size(), snapshot.activities.size());
}

void CacheStore::remove_key(const std::string &key)
{
    try
    {
        m_store.remove(key);
    }
    catch (const std::exception &e)
    {
        throw HubError(ErrorCategory::Storage, "cache.clear",
                       fmt::format("cannot remove '{}'", key), e.what());
    }
}

void CacheStore::clear()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> keys;
        try
        {
            keys = m_store.keys(kKeyPrefix);
        }
        catch (const std::exception &e)
        {
            throw HubError(ErrorCategory::Storage, "cache.clear", "cannot list cache records",
                           e.what());
        }
        for (const auto &key : keys)
            remove_key(key);
        LOGGER_INFO("CacheStore: cleared {} records", keys.size());
    }
    notify_cleared(std::nullopt);
}

void CacheStore::clear(const std::string &hub_id)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        remove_key(record_key(hub_id));
        std::optional<std::string> last;
        try
        {
            last = m_store.get(kLastHubKey);
        }
        catch (const std::exception &e)
        {
            throw HubError(ErrorCategory::Storage, "cache.clear", "cannot read last hub id",
                           e.what());
        }
        if (last == hub_id)
            remove_key(kLastHubKey);
        LOGGER_INFO("CacheStore: cleared record of hub '{}'", hub_id);
    }
    notify_cleared(hub_id);
}

std::optional<std::string> CacheStore::last_hub_id() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    try
    {
        auto id = m_store.get(kLastHubKey);
        if (id && m_store.get(record_key(*id)))
            return id;
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("CacheStore: reading last hub id failed: {}", e.what());
    }
    return std::nullopt;
}

void CacheStore::set_clear_listener(ClearListener listener)
{
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_clear_listener = std::move(listener);
}

void CacheStore::notify_cleared(const std::optional<std::string> &hub_id)
{
    ClearListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        listener = m_clear_listener;
    }
    if (listener)
        listener(hub_id);
}

} // namespace hublink::hub
