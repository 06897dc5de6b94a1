#pragma once
/**
 * @file hub_transport.hpp
 * @brief Collaborator interfaces consumed by the hub engine.
 *
 * The engine never talks to a socket directly. It is handed:
 *  - an `IDiscoveryTransport` that emits decoded hub announcements,
 *  - an `ISessionTransport` that opens request/response sessions to a hub,
 *  - an `INotificationSink` for fire-and-forget user feedback.
 * Persistent storage is `utils::IKeyValueStore` (key_value_store.hpp).
 *
 * Transport implementations report failures by throwing `std::exception`
 * subclasses; the engine wraps them into `HubError` with context.
 */
#include "hub/hub_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace hublink::hub
{

class IDiscoveryTransport
{
  public:
    using AnnounceHandler = std::function<void(const Hub &)>;
    using ErrorHandler = std::function<void(const std::string &)>;

    virtual ~IDiscoveryTransport() = default;

    /**
     * @brief Starts listening for announcements.
     *
     * Handlers may be called from a transport-owned thread, in wire order, until
     * stop() returns. Throws if the listener cannot be started.
     */
    virtual void start(AnnounceHandler on_announce, ErrorHandler on_error) = 0;

    /// Stops listening. Must be safe to call more than once.
    virtual void stop() = 0;
};

class ISession
{
  public:
    virtual ~ISession() = default;

    /**
     * @brief Sends one request and waits for its response body.
     * @throws std::exception on send failure, timeout or a closed session.
     */
    virtual nlohmann::json send(const std::string &request_type, const nlohmann::json &payload,
                                std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

class ISessionTransport
{
  public:
    /// Invoked (from any thread) when an open session drops unexpectedly.
    using ClosedHandler = std::function<void(const std::string &reason)>;

    virtual ~ISessionTransport() = default;

    /// @throws std::exception when the hub cannot be reached within @p timeout.
    virtual std::unique_ptr<ISession> open(const Hub &hub, std::chrono::milliseconds timeout,
                                           ClosedHandler on_closed) = 0;
};

class INotificationSink
{
  public:
    virtual ~INotificationSink() = default;

    virtual void progress(const std::string &message) = 0;
    virtual void success(const std::string &message) = 0;
    virtual void failure(const std::string &message, const HubError &error) = 0;
};

} // namespace hublink::hub
