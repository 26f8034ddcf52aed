#pragma once

#include "relay/RelayClient.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace flowrelay {
namespace relay {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class BroadcastHub;

struct RelaySessionOptions {
    size_t maxQueuedEvents = 256;
    std::chrono::seconds writeTimeout{10};
};

/**
 * WebSocket session for one downstream client
 *
 * All socket work runs on the session's strand. Events are queued per
 * client and written one at a time in arrival order; each write is
 * bounded by the write timeout. Overflowing the queue, a timed-out write
 * or any socket error drops the client from the hub.
 */
class RelaySession : public RelayClient, public std::enable_shared_from_this<RelaySession> {
public:
    RelaySession(tcp::socket socket, BroadcastHub& hub, const RelaySessionOptions& options);

    void run();

    uint64_t id() const override { return m_id; }
    std::string remoteAddress() const override { return m_remoteAddress; }
    bool deliver(const upstream::RelayEventPtr& event) override;
    void close() override;

private:
    void onRun();
    void onAccept(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytesTransferred);
    void onWriteTimeout(beast::error_code ec);
    void fail(const std::string& reason);

    websocket::stream<beast::tcp_stream> m_ws;
    net::steady_timer m_writeTimer;
    beast::flat_buffer m_buffer;
    BroadcastHub& m_hub;
    RelaySessionOptions m_options;
    uint64_t m_id;
    std::string m_remoteAddress;

    // Strand-only state
    std::deque<upstream::RelayEventPtr> m_queue;
    bool m_writing = false;

    std::atomic<size_t> m_pending{0};
    std::atomic<bool> m_closed{false};
};

} // namespace relay
} // namespace flowrelay
