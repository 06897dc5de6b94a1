#pragma once
/**
 * @file key_value_store.hpp
 * @brief Persistent string key-value storage.
 *
 * `IKeyValueStore` is the storage seam used by the cache (and by any long-lived
 * preference values). Two implementations are provided:
 *
 *  - `JsonFileStore` keeps every key in one JSON object file. Each mutation
 *    rewrites the file atomically (write temp file, then rename over the
 *    original), so a crash never leaves a half-written store behind.
 *  - `MemoryStore` keeps everything in memory; used by tests.
 *
 * Implementations are thread-safe. Persistence failures are reported by throwing
 * `std::runtime_error`.
 */
#include "hublink_core_export.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hublink::utils
{

class HUBLINK_CORE_EXPORT IKeyValueStore
{
  public:
    virtual ~IKeyValueStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string &key) const = 0;
    virtual void set(const std::string &key, const std::string &value) = 0;
    /// Removing a missing key is not an error.
    virtual void remove(const std::string &key) = 0;
    /// All keys beginning with @p prefix, in lexical order.
    [[nodiscard]] virtual std::vector<std::string> keys(const std::string &prefix) const = 0;
};

class HUBLINK_CORE_EXPORT MemoryStore : public IKeyValueStore
{
  public:
    [[nodiscard]] std::optional<std::string> get(const std::string &key) const override;
    void set(const std::string &key, const std::string &value) override;
    void remove(const std::string &key) override;
    [[nodiscard]] std::vector<std::string> keys(const std::string &prefix) const override;

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
};

class HUBLINK_CORE_EXPORT JsonFileStore : public IKeyValueStore
{
  public:
    /**
     * @brief Opens (or lazily creates) the store backed by @p path.
     *
     * A missing file is an empty store. An unreadable or malformed file is logged
     * and treated as empty; it is replaced on the next successful write.
     */
    explicit JsonFileStore(std::filesystem::path path);

    [[nodiscard]] std::optional<std::string> get(const std::string &key) const override;
    void set(const std::string &key, const std::string &value) override;
    void remove(const std::string &key) override;
    [[nodiscard]] std::vector<std::string> keys(const std::string &prefix) const override;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    void load_locked();
    void persist_locked(const std::map<std::string, std::string> &values) const;

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
};

} // namespace hublink::utils
