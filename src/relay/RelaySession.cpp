#include "relay/RelaySession.hpp"
#include "relay/BroadcastHub.hpp"
#include "server/Logger.hpp"

namespace flowrelay {
namespace relay {

namespace {

std::string describeEndpoint(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

RelaySession::RelaySession(tcp::socket socket, BroadcastHub& hub, const RelaySessionOptions& options)
    : m_ws(std::move(socket))
    , m_writeTimer(m_ws.get_executor())
    , m_hub(hub)
    , m_options(options)
    , m_id(hub.nextClientId())
    , m_remoteAddress(describeEndpoint(beast::get_lowest_layer(m_ws).socket()))
{
}

void RelaySession::run() {
    net::dispatch(
        m_ws.get_executor(),
        beast::bind_front_handler(&RelaySession::onRun, shared_from_this()));
}

void RelaySession::onRun() {
    m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    m_ws.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(beast::http::field::server, "flowrelay/1.0");
        }));

    m_ws.async_accept(
        beast::bind_front_handler(&RelaySession::onAccept, shared_from_this()));
}

void RelaySession::onAccept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("WebSocket handshake with " + m_remoteAddress + " failed: " + ec.message());
        m_closed = true;
        return;
    }

    m_hub.registerClient(shared_from_this());
    doRead();
}

void RelaySession::doRead() {
    m_ws.async_read(
        m_buffer,
        beast::bind_front_handler(&RelaySession::onRead, shared_from_this()));
}

void RelaySession::onRead(beast::error_code ec, std::size_t /*bytesTransferred*/) {
    if (ec) {
        if (ec == websocket::error::closed) {
            LOG_INFO("WebSocket client disconnected: " + m_remoteAddress);
        }
        return fail(ec.message());
    }

    // Downstream clients are consumers only; anything they send is just logged
    LOG_DEBUG("Received message from client " + m_remoteAddress + ": " +
              beast::buffers_to_string(m_buffer.data()).substr(0, 200));
    m_buffer.consume(m_buffer.size());
    doRead();
}

bool RelaySession::deliver(const upstream::RelayEventPtr& event) {
    if (m_closed) {
        return false;
    }
    if (++m_pending > m_options.maxQueuedEvents) {
        --m_pending;
        return false;
    }

    net::post(m_ws.get_executor(), [self = shared_from_this(), event]() {
        if (self->m_closed) {
            return;
        }
        self->m_queue.push_back(event);
        if (!self->m_writing) {
            self->doWrite();
        }
    });
    return true;
}

void RelaySession::doWrite() {
    m_writing = true;
    const auto& event = m_queue.front();
    m_ws.binary(event->isBinary());

    m_writeTimer.expires_after(m_options.writeTimeout);
    m_writeTimer.async_wait(
        beast::bind_front_handler(&RelaySession::onWriteTimeout, shared_from_this()));

    m_ws.async_write(
        net::buffer(event->raw()),
        beast::bind_front_handler(&RelaySession::onWrite, shared_from_this()));
}

void RelaySession::onWrite(beast::error_code ec, std::size_t /*bytesTransferred*/) {
    // Disarm; a stale expiry must not close a healthy client later
    m_writeTimer.expires_at(net::steady_timer::time_point::max());

    if (ec) {
        return fail("write failed: " + ec.message());
    }

    m_queue.pop_front();
    --m_pending;

    if (m_queue.empty() || m_closed) {
        m_writing = false;
        return;
    }
    doWrite();
}

void RelaySession::onWriteTimeout(beast::error_code ec) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (m_writeTimer.expiry() > net::steady_timer::clock_type::now()) {
        return;
    }
    LOG_WARN("Write to client " + m_remoteAddress + " timed out after " +
             std::to_string(m_options.writeTimeout.count()) + "s");
    fail("write timeout");
}

void RelaySession::fail(const std::string& reason) {
    if (m_closed.exchange(true)) {
        return;
    }
    LOG_DEBUG("Closing client " + m_remoteAddress + ": " + reason);
    m_hub.unregisterClient(m_id);
    m_writeTimer.cancel();

    beast::error_code ec;
    beast::get_lowest_layer(m_ws).socket().shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(m_ws).socket().close(ec);
}

void RelaySession::close() {
    net::post(m_ws.get_executor(), [self = shared_from_this()]() {
        if (self->m_closed.exchange(true)) {
            return;
        }
        self->m_hub.unregisterClient(self->m_id);
        self->m_writeTimer.cancel();

        if (self->m_writing) {
            // A close frame cannot overlap an in-flight write; drop the transport
            beast::error_code ec;
            beast::get_lowest_layer(self->m_ws).socket().close(ec);
            return;
        }
        self->m_ws.async_close(websocket::close_code::going_away,
            [self](beast::error_code) {
                beast::error_code ec;
                beast::get_lowest_layer(self->m_ws).socket().close(ec);
            });
    });
}

} // namespace relay
} // namespace flowrelay
