#pragma once

#include "server/Listener.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <string>

namespace flowrelay {
namespace server {

class RequestHandler;

/**
 * HTTP control server based on Boost.Beast
 *
 * Every accepted connection becomes an HttpSession on its own strand, so
 * a request blocked in a long job does not hold up the others as long as
 * the io_context runs on more than one thread.
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, const std::string& address, unsigned short port,
               RequestHandler& handler);

    void run();
    void stop();

    /// Bound port (useful when constructed with port 0)
    unsigned short port() const { return m_listener.port(); }

private:
    RequestHandler& m_handler;
    Listener m_listener;
};

} // namespace server
} // namespace flowrelay
