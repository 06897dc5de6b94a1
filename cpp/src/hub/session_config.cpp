/**
 * @file session_config.cpp
 * @brief Layered loading and validation of SessionConfig.
 */
#include "hbl_hub.hpp"

#include <cstdlib>
#include <fstream>

namespace hublink::hub
{

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers (anonymous namespace)
// ---------------------------------------------------------------------------

namespace
{

constexpr const char *kDefaultFileName = "hublink.default.json";
constexpr const char *kUserFileName = "hublink.user.json";

/// Config directory next to the executable: `<root>/bin/../config` or `<bin>/config`.
fs::path discover_config_dir()
{
    const fs::path bin = platform::get_executable_dir();
    if (bin.empty())
        return {};
    std::error_code ec;
    for (const fs::path &candidate : {bin / ".." / "config", bin / "config"})
    {
        if (fs::is_directory(candidate, ec))
            return fs::weakly_canonical(candidate, ec);
    }
    return {};
}

/// Expands a leading `~` to the home directory.
fs::path expand_home(const std::string &raw)
{
    if (raw.empty() || raw[0] != '~')
        return fs::path(raw);
    fs::path rest = raw.size() > 2 ? fs::path(raw.substr(2)) : fs::path{};
    return platform::get_home_dir() / rest;
}

/// Reads a JSON file; a missing file yields a null value, a malformed one throws.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw HubError(ErrorCategory::Validation, "load_config",
                       fmt::format("malformed configuration file '{}'", path.string()), e.what());
    }
}

template <typename T> void read_value(const nlohmann::json &section, const char *key, T &out)
{
    if (section.contains(key))
        out = section.at(key).get<T>();
}

void read_ms(const nlohmann::json &section, const char *key, std::chrono::milliseconds &out)
{
    if (section.contains(key))
        out = std::chrono::milliseconds(section.at(key).get<int64_t>());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// json_merge
// ---------------------------------------------------------------------------

void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
            json_merge(base[it.key()], it.value());
        else
            base[it.key()] = it.value();
    }
}

// ---------------------------------------------------------------------------
// SessionConfig
// ---------------------------------------------------------------------------

SessionConfig SessionConfig::defaults()
{
    SessionConfig config;
    config.store_path = platform::get_home_dir() / ".cache" / "hublink" / "store.json";
    return config;
}

SessionConfig SessionConfig::from_json(const nlohmann::json &j, SessionConfig base)
{
    if (j.is_null())
        return base;
    if (!j.is_object())
        throw HubError(ErrorCategory::Validation, "load_config",
                       "configuration root must be a JSON object");

    static const nlohmann::json kEmpty = nlohmann::json::object();
    auto section = [&j](const char *name) -> const nlohmann::json &
    {
        if (!j.contains(name))
            return kEmpty;
        const auto &s = j.at(name);
        if (!s.is_object())
            throw HubError(ErrorCategory::Validation, "load_config",
                           fmt::format("section '{}' must be an object", name));
        return s;
    };

    try
    {
        const auto &discovery = section("discovery");
        read_ms(discovery, "window_ms", base.discovery.window);
        read_ms(discovery, "grace_ms", base.discovery.grace);

        const auto &connection = section("connection");
        read_ms(connection, "connect_timeout_ms", base.connection.connect_timeout);
        read_ms(connection, "request_timeout_ms", base.connection.request_timeout);
        read_value(connection, "max_reconnect_attempts", base.connection.max_reconnect_attempts);
        read_ms(connection, "reconnect_base_delay_ms", base.connection.reconnect_base_delay);
        read_ms(connection, "reconnect_max_delay_ms", base.connection.reconnect_max_delay);

        const auto &queue = section("queue");
        read_value(queue, "max_queue_size", base.queue.max_queue_size);
        read_value(queue, "max_concurrent", base.queue.max_concurrent);
        read_ms(queue, "default_timeout_ms", base.queue.default_timeout);
        read_value(queue, "default_retries", base.queue.default_retries);
        read_ms(queue, "retry_delay_ms", base.queue.retry_delay);
        read_ms(queue, "hold_duration_ms", base.queue.hold_duration);

        const auto &cache = section("cache");
        if (cache.contains("ttl_s"))
            base.cache.ttl = std::chrono::seconds(cache.at("ttl_s").get<int64_t>());

        const auto &logging = section("logging");
        read_value(logging, "level", base.logging.level);
        read_value(logging, "file", base.logging.file);

        const auto &store = section("store");
        if (store.contains("path"))
            base.store_path = expand_home(store.at("path").get<std::string>());

        const auto &transport = section("transport");
        read_value(transport, "discovery_endpoint", base.transport.discovery_endpoint);
        read_value(transport, "session_port", base.transport.session_port);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw HubError(ErrorCategory::Validation, "load_config", "invalid configuration value",
                       e.what());
    }
    return base;
}

SessionConfig SessionConfig::load(const fs::path &config_dir, const fs::path &explicit_file)
{
    SessionConfig config = defaults();

    fs::path override_file = explicit_file;
    if (override_file.empty())
    {
        if (const char *env = std::getenv("HUBLINK_CONFIG_FILE"))
            override_file = env;
    }

    if (!override_file.empty())
    {
        nlohmann::json j = read_json_file(override_file);
        if (j.is_null())
        {
            throw HubError(ErrorCategory::Validation, "load_config",
                           fmt::format("configuration file '{}' not readable",
                                       override_file.string()));
        }
        LOGGER_INFO("SessionConfig: loading '{}'", override_file.string());
        config = from_json(j, config);
    }
    else
    {
        const fs::path dir = config_dir.empty() ? discover_config_dir() : config_dir;
        nlohmann::json merged = nlohmann::json::object();
        if (!dir.empty())
        {
            nlohmann::json jdef = read_json_file(dir / kDefaultFileName);
            if (!jdef.is_null())
            {
                LOGGER_INFO("SessionConfig: loading defaults from '{}'",
                            (dir / kDefaultFileName).string());
                json_merge(merged, jdef);
            }
            nlohmann::json juser = read_json_file(dir / kUserFileName);
            if (!juser.is_null())
            {
                LOGGER_INFO("SessionConfig: merging user overrides from '{}'",
                            (dir / kUserFileName).string());
                json_merge(merged, juser);
            }
        }
        else
        {
            LOGGER_INFO("SessionConfig: no config directory found, using built-in defaults");
        }
        config = from_json(merged, config);
    }

    config.apply_env_overrides();
    config.validate();

    LOGGER_DEBUG("SessionConfig: discovery window {} + grace {}",
                 format_tools::format_duration(config.discovery.window),
                 format_tools::format_duration(config.discovery.grace));
    LOGGER_DEBUG("SessionConfig: store_path = {}", config.store_path.string());
    LOGGER_DEBUG("SessionConfig: discovery_endpoint = {}", config.transport.discovery_endpoint);
    return config;
}

void SessionConfig::apply_env_overrides()
{
    if (const char *env = std::getenv("HUBLINK_LOG_LEVEL"))
        logging.level = env;
    if (const char *env = std::getenv("HUBLINK_STORE_PATH"))
        store_path = expand_home(env);
    if (const char *env = std::getenv("HUBLINK_DISCOVERY_ENDPOINT"))
        transport.discovery_endpoint = env;
}

void SessionConfig::validate() const
{
    auto reject = [](const std::string &what)
    { throw HubError(ErrorCategory::Validation, "validate_config", what); };
    using std::chrono::milliseconds;

    if (discovery.window <= milliseconds::zero())
        reject("discovery.window_ms must be positive");
    if (discovery.grace < milliseconds::zero())
        reject("discovery.grace_ms must not be negative");
    if (connection.connect_timeout <= milliseconds::zero())
        reject("connection.connect_timeout_ms must be positive");
    if (connection.request_timeout <= milliseconds::zero())
        reject("connection.request_timeout_ms must be positive");
    if (connection.max_reconnect_attempts < 0)
        reject("connection.max_reconnect_attempts must not be negative");
    if (connection.reconnect_base_delay < milliseconds::zero() ||
        connection.reconnect_max_delay < connection.reconnect_base_delay)
        reject("connection reconnect delays must satisfy 0 <= base <= max");
    if (queue.max_queue_size == 0)
        reject("queue.max_queue_size must be positive");
    if (queue.max_concurrent == 0)
        reject("queue.max_concurrent must be positive");
    if (queue.default_timeout <= milliseconds::zero())
        reject("queue.default_timeout_ms must be positive");
    if (queue.default_retries < 0)
        reject("queue.default_retries must not be negative");
    if (queue.retry_delay < milliseconds::zero() || queue.hold_duration < milliseconds::zero())
        reject("queue delays must not be negative");
    if (cache.ttl <= milliseconds::zero())
        reject("cache.ttl_s must be positive");
    if (!utils::Logger::level_from_string(logging.level))
        reject(fmt::format("logging.level '{}' is not a known level", logging.level));
    if (store_path.empty())
        reject("store.path must not be empty");
    if (transport.discovery_endpoint.empty())
        reject("transport.discovery_endpoint must not be empty");
    if (transport.session_port == 0)
        reject("transport.session_port must be positive");
}

nlohmann::json SessionConfig::to_json() const
{
    return nlohmann::json{
        {"discovery", {{"window_ms", discovery.window.count()}, {"grace_ms", discovery.grace.count()}}},
        {"connection",
         {{"connect_timeout_ms", connection.connect_timeout.count()},
          {"request_timeout_ms", connection.request_timeout.count()},
          {"max_reconnect_attempts", connection.max_reconnect_attempts},
          {"reconnect_base_delay_ms", connection.reconnect_base_delay.count()},
          {"reconnect_max_delay_ms", connection.reconnect_max_delay.count()}}},
        {"queue",
         {{"max_queue_size", queue.max_queue_size},
          {"max_concurrent", queue.max_concurrent},
          {"default_timeout_ms", queue.default_timeout.count()},
          {"default_retries", queue.default_retries},
          {"retry_delay_ms", queue.retry_delay.count()},
          {"hold_duration_ms", queue.hold_duration.count()}}},
        {"cache", {{"ttl_s", std::chrono::duration_cast<std::chrono::seconds>(cache.ttl).count()}}},
        {"logging", {{"level", logging.level}, {"file", logging.file}}},
        {"store", {{"path", store_path.string()}}},
        {"transport",
         {{"discovery_endpoint", transport.discovery_endpoint},
          {"session_port", transport.session_port}}},
    };
}

} // namespace hublink::hub
