#include "hbl_hub.hpp"
#include "hub/zmq_transport.hpp"

#include <zmq_addon.hpp>

#include <condition_variable>
#include <deque>
#include <future>
#include <variant>

namespace hublink::hub
{

namespace
{

constexpr std::chrono::milliseconds kPollInterval{50};

std::string frames_summary(const std::vector<zmq::message_t> &msgs)
{
    return msgs.size() >= 2 ? msgs[1].to_string() : fmt::format("<{} frame(s)>", msgs.size());
}

// ============================================================================
// Session commands (handed to the session worker thread)
// ============================================================================

struct SendCmd
{
    std::string request_type;
    nlohmann::json payload;
    std::chrono::milliseconds timeout;
    std::promise<nlohmann::json> result;
};

struct StopCmd
{
};

using SessionCommand = std::variant<SendCmd, StopCmd>;

class SessionMonitor : public zmq::monitor_t
{
  public:
    bool connected{false};
    bool disconnected{false};
    std::string reason;

    void on_event_connected(const zmq_event_t & /*event*/, const char *addr) override
    {
        connected = true;
        LOGGER_DEBUG("ZmqSession: connected to {}", addr);
    }

    void on_event_disconnected(const zmq_event_t & /*event*/, const char *addr) override
    {
        disconnected = true;
        reason = fmt::format("peer {} disconnected", addr);
    }
};

// ============================================================================
// ZmqSession
// ============================================================================

class ZmqSession : public ISession
{
  public:
    ZmqSession(zmq::context_t &context, std::string endpoint, std::string monitor_addr,
               ISessionTransport::ClosedHandler on_closed)
        : m_context(context), m_endpoint(std::move(endpoint)),
          m_monitor_addr(std::move(monitor_addr)), m_on_closed(std::move(on_closed))
    {
    }

    ~ZmqSession() override { close(); }

    ZmqSession(const ZmqSession &) = delete;
    ZmqSession &operator=(const ZmqSession &) = delete;

    /// Starts the worker and waits until the socket is connected.
    void open(std::chrono::milliseconds timeout)
    {
        std::promise<void> opened;
        auto ready = opened.get_future();
        m_worker = std::thread(&ZmqSession::worker_loop, this, std::move(opened), timeout);
        try
        {
            ready.get();
        }
        catch (const std::exception &)
        {
            m_worker.join();
            throw;
        }
    }

    nlohmann::json send(const std::string &request_type, const nlohmann::json &payload,
                        std::chrono::milliseconds timeout) override
    {
        if (m_closed.load(std::memory_order_acquire))
            throw std::runtime_error(fmt::format("session to {} is closed", m_endpoint));

        SendCmd cmd{request_type, payload, timeout, {}};
        auto future = cmd.result.get_future();
        enqueue(std::move(cmd));
        return future.get();
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(m_close_mutex);
        if (!m_worker.joinable())
            return;
        enqueue(StopCmd{});
        m_worker.join();
        LOGGER_DEBUG("ZmqSession: session to {} closed", m_endpoint);
    }

  private:
    void enqueue(SessionCommand cmd)
    {
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_queue.push_back(std::move(cmd));
        }
        m_queue_cv.notify_one();
    }

    void worker_loop(std::promise<void> opened, std::chrono::milliseconds timeout)
    {
        std::optional<zmq::socket_t> socket;
        SessionMonitor monitor;
        try
        {
            socket.emplace(m_context, zmq::socket_type::dealer);
            socket->set(zmq::sockopt::linger, 0);
            monitor.init(*socket, m_monitor_addr, ZMQ_EVENT_CONNECTED | ZMQ_EVENT_DISCONNECTED);
            socket->connect(m_endpoint);

            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (!monitor.connected && std::chrono::steady_clock::now() < deadline)
            {
                monitor.check_event(static_cast<int>(kPollInterval.count()));
            }
            if (!monitor.connected)
            {
                throw std::runtime_error(
                    fmt::format("no connection to {} within {}", m_endpoint,
                                format_tools::format_duration(timeout)));
            }
            opened.set_value();
        }
        catch (const std::exception &)
        {
            m_closed.store(true, std::memory_order_release);
            opened.set_exception(std::current_exception());
            return;
        }

        while (true)
        {
            std::deque<SessionCommand> batch;
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                m_queue_cv.wait_for(lock, kPollInterval, [this] { return !m_queue.empty(); });
                std::swap(batch, m_queue);
            }

            bool stop = false;
            for (auto &cmd : batch)
            {
                if (stop)
                {
                    reject(cmd);
                    continue;
                }
                stop = std::visit([&](auto &c) { return handle_command(c, *socket); }, cmd);
            }
            if (stop)
                break;

            while (monitor.check_event(0))
            {
            }
            if (monitor.disconnected && !m_closed.exchange(true))
            {
                LOGGER_WARN("ZmqSession: {}", monitor.reason);
                report_closed(monitor.reason);
            }
        }

        m_closed.store(true, std::memory_order_release);
        std::deque<SessionCommand> rest;
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            std::swap(rest, m_queue);
        }
        for (auto &cmd : rest)
            reject(cmd);
    }

    void reject(SessionCommand &cmd)
    {
        if (auto *send = std::get_if<SendCmd>(&cmd))
        {
            send->result.set_exception(std::make_exception_ptr(
                std::runtime_error(fmt::format("session to {} is closed", m_endpoint))));
        }
    }

    void report_closed(const std::string &reason)
    {
        if (!m_on_closed)
            return;
        try
        {
            m_on_closed(reason);
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("ZmqSession: closed handler threw: {}", e.what());
        }
    }

    bool handle_command(StopCmd & /*cmd*/, zmq::socket_t & /*socket*/) { return true; }

    bool handle_command(SendCmd &cmd, zmq::socket_t &socket)
    {
        try
        {
            if (m_closed.load(std::memory_order_acquire))
                throw std::runtime_error(fmt::format("session to {} is closed", m_endpoint));

            const std::string payload_str = cmd.payload.dump();
            std::vector<zmq::const_buffer> msgs = {zmq::buffer(&kFrameTypeControl, 1),
                                                   zmq::buffer(cmd.request_type),
                                                   zmq::buffer(payload_str)};
            if (!zmq::send_multipart(socket, msgs, zmq::send_flags::dontwait))
                throw std::runtime_error(fmt::format("'{}' could not be sent", cmd.request_type));

            const std::string expected = cmd.request_type + "_ACK";
            const auto deadline = std::chrono::steady_clock::now() + cmd.timeout;
            while (true)
            {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                    break;
                std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
                zmq::poll(items,
                          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
                if ((items[0].revents & ZMQ_POLLIN) == 0)
                    break;

                std::vector<zmq::message_t> recv_msgs;
                static_cast<void>(zmq::recv_multipart(socket, std::back_inserter(recv_msgs)));
                if (recv_msgs.size() < 3 || recv_msgs[0].size() != 1 ||
                    *recv_msgs[0].data<char>() != kFrameTypeControl)
                {
                    LOGGER_WARN("ZmqSession: discarding malformed reply {}",
                                frames_summary(recv_msgs));
                    continue;
                }
                if (recv_msgs[1].to_string() != expected)
                {
                    LOGGER_DEBUG("ZmqSession: discarding stale reply '{}' while waiting for '{}'",
                                 recv_msgs[1].to_string(), expected);
                    continue;
                }
                cmd.result.set_value(nlohmann::json::parse(recv_msgs[2].to_string()));
                return false;
            }
            throw std::runtime_error(fmt::format("no '{}' reply within {}", expected,
                                                 format_tools::format_duration(cmd.timeout)));
        }
        catch (const std::exception &)
        {
            cmd.result.set_exception(std::current_exception());
        }
        return false;
    }

    zmq::context_t &m_context;
    std::string m_endpoint;
    std::string m_monitor_addr;
    ISessionTransport::ClosedHandler m_on_closed;

    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::deque<SessionCommand> m_queue;

    std::mutex m_close_mutex;
    std::atomic<bool> m_closed{false};
    std::thread m_worker;
};

} // anonymous namespace

// ============================================================================
// ZmqDiscoveryTransport
// ============================================================================

ZmqDiscoveryTransport::ZmqDiscoveryTransport(zmq::context_t &context, std::string endpoint,
                                             uint16_t default_port)
    : m_context(context), m_endpoint(std::move(endpoint)), m_default_port(default_port)
{
}

ZmqDiscoveryTransport::~ZmqDiscoveryTransport()
{
    stop();
}

void ZmqDiscoveryTransport::start(AnnounceHandler on_announce, ErrorHandler on_error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_listener.joinable())
        throw std::runtime_error("discovery listener already running");

    zmq::socket_t socket(m_context, zmq::socket_type::sub);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::subscribe, "");
    socket.connect(m_endpoint);

    m_stop.store(false, std::memory_order_release);
    m_listener = std::thread(&ZmqDiscoveryTransport::listen, this, std::move(socket),
                             std::move(on_announce), std::move(on_error));
    LOGGER_INFO("ZmqDiscovery: listening on {}", m_endpoint);
}

void ZmqDiscoveryTransport::stop()
{
    m_stop.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_listener.joinable() && m_listener.get_id() != std::this_thread::get_id())
    {
        m_listener.join();
        LOGGER_DEBUG("ZmqDiscovery: listener stopped");
    }
}

void ZmqDiscoveryTransport::listen(zmq::socket_t socket, AnnounceHandler on_announce,
                                   ErrorHandler on_error)
{
    try
    {
        while (!m_stop.load(std::memory_order_acquire))
        {
            std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollInterval);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
                continue;

            std::vector<zmq::message_t> msgs;
            if (!zmq::recv_multipart(socket, std::back_inserter(msgs), zmq::recv_flags::dontwait))
                continue;
            if (msgs.size() < 3 || msgs[0].size() != 1 ||
                *msgs[0].data<char>() != kFrameTypeControl || msgs[1].to_string() != kMsgHubAnnounce)
            {
                LOGGER_WARN("ZmqDiscovery: ignoring unexpected message {}", frames_summary(msgs));
                continue;
            }

            Hub hub;
            try
            {
                hub = decode_announcement(nlohmann::json::parse(msgs[2].to_string()));
            }
            catch (const nlohmann::json::exception &e)
            {
                LOGGER_WARN("ZmqDiscovery: announcement is not valid JSON: {}", e.what());
                continue;
            }
            catch (const HubError &e)
            {
                LOGGER_WARN("ZmqDiscovery: ignoring announcement: {}", e.what());
                continue;
            }
            if (hub.port == 0)
                hub.port = m_default_port;
            on_announce(hub);
        }
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("ZmqDiscovery: socket error: {}", e.what());
        if (on_error)
            on_error(e.what());
    }
}

// ============================================================================
// ZmqSessionTransport
// ============================================================================

ZmqSessionTransport::ZmqSessionTransport(zmq::context_t &context, uint16_t default_port)
    : m_context(context), m_default_port(default_port)
{
}

std::unique_ptr<ISession> ZmqSessionTransport::open(const Hub &hub,
                                                    std::chrono::milliseconds timeout,
                                                    ClosedHandler on_closed)
{
    const uint16_t port = hub.port != 0 ? hub.port : m_default_port;
    const std::string endpoint = fmt::format("tcp://{}:{}", hub.address, port);
    const std::string monitor_addr =
        fmt::format("inproc://hublink-session-monitor-{}", ++m_session_counter);

    auto session =
        std::make_unique<ZmqSession>(m_context, endpoint, monitor_addr, std::move(on_closed));
    session->open(timeout);
    LOGGER_INFO("ZmqSession: opened {} for hub '{}'", endpoint, hub.id);
    return session;
}

} // namespace hublink::hub
