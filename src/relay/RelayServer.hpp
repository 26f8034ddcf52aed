#pragma once

#include "relay/RelaySession.hpp"
#include "server/Listener.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <string>

namespace flowrelay {
namespace relay {

/**
 * WebSocket endpoint downstream clients connect to
 *
 * Accepts connections and hands each one to a RelaySession, which joins
 * the hub once its handshake completes. No handshake payload is required.
 */
class RelayServer {
public:
    RelayServer(net::io_context& ioc, const std::string& address, unsigned short port,
                BroadcastHub& hub, RelaySessionOptions options);

    void run();
    void stop();

    /// Bound port (useful when constructed with port 0)
    unsigned short port() const { return m_listener.port(); }

private:
    BroadcastHub& m_hub;
    RelaySessionOptions m_options;
    server::Listener m_listener;
};

} // namespace relay
} // namespace flowrelay
