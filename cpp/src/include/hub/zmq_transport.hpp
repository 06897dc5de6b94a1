#pragma once
/**
 * @file zmq_transport.hpp
 * @brief ZeroMQ implementations of the discovery and session transports.
 *
 * All frames use the control framing `['C', <msg_type>, <json>]`.
 *
 * - `ZmqDiscoveryTransport` subscribes (SUB) to an announcement endpoint and
 *   decodes `HUB_ANNOUNCE` frames on a listener thread.
 * - `ZmqSessionTransport` opens one DEALER socket per session. Each session has
 *   a worker thread that owns its socket and a socket monitor; requests are
 *   handed to it as commands carrying a promise, and replies are expected as
 *   `<request_type>_ACK`. A monitored disconnect closes the session and is
 *   reported through the ClosedHandler.
 *
 * The `zmq::context_t` is owned by the caller and must outlive every transport.
 */
#include "hub/hub_transport.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace hublink::hub
{

inline constexpr char kFrameTypeControl = 'C';
inline constexpr const char *kMsgHubAnnounce = "HUB_ANNOUNCE";

class HUBLINK_CORE_EXPORT ZmqDiscoveryTransport : public IDiscoveryTransport
{
  public:
    ZmqDiscoveryTransport(zmq::context_t &context, std::string endpoint,
                          uint16_t default_port = kDefaultSessionPort);
    ~ZmqDiscoveryTransport() override;

    ZmqDiscoveryTransport(const ZmqDiscoveryTransport &) = delete;
    ZmqDiscoveryTransport &operator=(const ZmqDiscoveryTransport &) = delete;

    /// @throws std::runtime_error when already started or the endpoint is unusable.
    void start(AnnounceHandler on_announce, ErrorHandler on_error) override;
    void stop() override;

  private:
    void listen(zmq::socket_t socket, AnnounceHandler on_announce, ErrorHandler on_error);

    zmq::context_t &m_context;
    std::string m_endpoint;
    uint16_t m_default_port;

    std::mutex m_mutex;
    std::thread m_listener;
    std::atomic<bool> m_stop{false};
};

class HUBLINK_CORE_EXPORT ZmqSessionTransport : public ISessionTransport
{
  public:
    explicit ZmqSessionTransport(zmq::context_t &context,
                                 uint16_t default_port = kDefaultSessionPort);

    /// @throws std::runtime_error when no connection is established within @p timeout.
    std::unique_ptr<ISession> open(const Hub &hub, std::chrono::milliseconds timeout,
                                   ClosedHandler on_closed) override;

  private:
    zmq::context_t &m_context;
    uint16_t m_default_port;
    std::atomic<uint64_t> m_session_counter{0};
};

} // namespace hublink::hub
