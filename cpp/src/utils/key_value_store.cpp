/**
 * @file key_value_store.cpp
 * @brief MemoryStore and JsonFileStore implementations.
 */
#include "hbl_service.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace hublink::utils
{

namespace fs = std::filesystem;

namespace
{
std::vector<std::string> keys_with_prefix(const std::map<std::string, std::string> &values,
                                          const std::string &prefix)
{
    std::vector<std::string> out;
    for (auto it = values.lower_bound(prefix); it != values.end(); ++it)
    {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
            break;
        out.push_back(it->first);
    }
    return out;
}
} // namespace

// ============================================================================
// MemoryStore
// ============================================================================

std::optional<std::string> MemoryStore::get(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end())
        return std::nullopt;
    return it->second;
}

void MemoryStore::set(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = value;
}

void MemoryStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.erase(key);
}

std::vector<std::string> MemoryStore::keys(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return keys_with_prefix(m_values, prefix);
}

// ============================================================================
// JsonFileStore
// ============================================================================

JsonFileStore::JsonFileStore(fs::path path) : m_path(std::move(path))
{
    std::lock_guard<std::mutex> lock(m_mutex);
    load_locked();
}

void JsonFileStore::load_locked()
{
    m_values.clear();
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        LOGGER_DEBUG("JsonFileStore: '{}' does not exist yet; starting empty.", m_path.string());
        return;
    }
    try
    {
        std::ifstream in(m_path);
        if (!in.is_open())
        {
            LOGGER_WARN("JsonFileStore: cannot open '{}'; starting empty.", m_path.string());
            return;
        }
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object())
        {
            LOGGER_WARN("JsonFileStore: '{}' is not a JSON object; starting empty.",
                        m_path.string());
            return;
        }
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (it.value().is_string())
                m_values.emplace(it.key(), it.value().get<std::string>());
        }
        LOGGER_DEBUG("JsonFileStore: loaded {} keys from '{}'.", m_values.size(), m_path.string());
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("JsonFileStore: '{}' is corrupt ({}); starting empty.", m_path.string(),
                    e.what());
        m_values.clear();
    }
}

void JsonFileStore::persist_locked(const std::map<std::string, std::string> &values) const
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto &[k, v] : values)
        j[k] = v;

    std::error_code ec;
    if (m_path.has_parent_path())
    {
        fs::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("cannot create directory '{}': {}",
                                                 m_path.parent_path().string(), ec.message()));
        }
    }

    fs::path tmp = m_path;
    tmp += fmt::format(".{}.tmp", platform::get_pid());
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error(fmt::format("cannot open '{}' for writing", tmp.string()));
        }
        out << j.dump(2);
        out.flush();
        if (!out)
        {
            throw std::runtime_error(fmt::format("write to '{}' failed", tmp.string()));
        }
    }
    fs::rename(tmp, m_path, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        throw std::runtime_error(
            fmt::format("cannot replace '{}': {}", m_path.string(), ec.message()));
    }
}

std::optional<std::string> JsonFileStore::get(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end())
        return std::nullopt;
    return it->second;
}

void JsonFileStore::set(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto next = m_values;
    next[key] = value;
    persist_locked(next);
    m_values = std::move(next);
}

void JsonFileStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_values.find(key) == m_values.end())
        return;
    auto next = m_values;
    next.erase(key);
    persist_locked(next);
    m_values = std::move(next);
}

std::vector<std::string> JsonFileStore::keys(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return keys_with_prefix(m_values, prefix);
}

} // namespace hublink::utils
