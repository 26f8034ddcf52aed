#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"

namespace flowrelay {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
                       RequestHandler& handler)
    : m_handler(handler)
    , m_listener(ioc, "HTTP server", address, port, [this](tcp::socket socket) {
          std::make_shared<HttpSession>(std::move(socket), m_handler)->run();
      })
{
    LOG_INFO("HTTP server listening on http://" + address + ":" + std::to_string(m_listener.port()));
}

void HttpServer::run() {
    m_listener.run();
}

void HttpServer::stop() {
    LOG_DEBUG("HTTP server stopping after " + std::to_string(m_listener.acceptedCount()) + " connection(s)");
    m_listener.stop();
}

} // namespace server
} // namespace flowrelay
