#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <functional>
#include <string>

namespace flowrelay {
namespace server {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * TCP acceptor shared by the HTTP control server and the WebSocket relay
 *
 * Binds in the constructor (port 0 picks an ephemeral port) and throws
 * std::runtime_error naming the listener if that fails. Each accepted
 * socket gets its own strand and is handed to the connection handler.
 */
class Listener {
public:
    using ConnectionHandler = std::function<void(tcp::socket)>;

    Listener(net::io_context& ioc, std::string name, const std::string& address,
             unsigned short port, ConnectionHandler onConnection);

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void run();

    /**
     * Close the acceptor on its own executor; safe from any thread
     */
    void stop();

    /// Bound port (the real one when constructed with port 0)
    unsigned short port() const;

    /// Connections accepted so far
    uint64_t acceptedCount() const { return m_accepted; }

private:
    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    net::io_context& m_ioc;
    std::string m_name;
    tcp::acceptor m_acceptor;
    ConnectionHandler m_onConnection;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_accepted{0};
};

} // namespace server
} // namespace flowrelay
