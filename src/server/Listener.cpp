#include "server/Listener.hpp"
#include "server/Logger.hpp"
#include <stdexcept>

namespace flowrelay {
namespace server {

Listener::Listener(net::io_context& ioc, std::string name, const std::string& address,
                   unsigned short port, ConnectionHandler onConnection)
    : m_ioc(ioc)
    , m_name(std::move(name))
    , m_acceptor(net::make_strand(ioc))
    , m_onConnection(std::move(onConnection))
{
    beast::error_code ec;
    auto endpoint = tcp::endpoint(net::ip::make_address(address, ec), port);
    if (ec) {
        throw std::runtime_error(m_name + ": invalid listen address '" + address + "': " + ec.message());
    }

    m_acceptor.open(endpoint.protocol(), ec);
    if (!ec) m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error(m_name + ": cannot open acceptor: " + ec.message());
    }

    m_acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error(m_name + ": cannot bind " + address + ":" + std::to_string(port) +
                                 ": " + ec.message());
    }

    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error(m_name + ": cannot listen on port " + std::to_string(port) +
                                 ": " + ec.message());
    }
}

void Listener::run() {
    m_running = true;
    net::dispatch(m_acceptor.get_executor(), [this]() { doAccept(); });
}

void Listener::stop() {
    net::post(m_acceptor.get_executor(), [this]() {
        m_running = false;
        beast::error_code ec;
        m_acceptor.close(ec);
    });
}

unsigned short Listener::port() const {
    beast::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void Listener::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        beast::bind_front_handler(&Listener::onAccept, this));
}

void Listener::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }

    if (ec) {
        LOG_WARN(m_name + " accept error: " + ec.message());
    } else {
        ++m_accepted;
        m_onConnection(std::move(socket));
    }

    doAccept();
}

} // namespace server
} // namespace flowrelay
