#include "relay/RelayServer.hpp"
#include "relay/BroadcastHub.hpp"
#include "server/Logger.hpp"

namespace flowrelay {
namespace relay {

RelayServer::RelayServer(net::io_context& ioc, const std::string& address, unsigned short port,
                         BroadcastHub& hub, RelaySessionOptions options)
    : m_hub(hub)
    , m_options(options)
    , m_listener(ioc, "WebSocket relay", address, port, [this](tcp::socket socket) {
          std::make_shared<RelaySession>(std::move(socket), m_hub, m_options)->run();
      })
{
    LOG_INFO("WebSocket relay listening on ws://" + address + ":" + std::to_string(m_listener.port()) +
             " (max " + std::to_string(m_options.maxQueuedEvents) + " queued events per client)");
}

void RelayServer::run() {
    m_listener.run();
}

void RelayServer::stop() {
    m_listener.stop();
    LOG_INFO("WebSocket relay stopped; " + std::to_string(m_hub.clientCount()) + " client(s) still attached");
}

} // namespace relay
} // namespace flowrelay
