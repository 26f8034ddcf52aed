#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace flowrelay {
namespace upstream {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

struct HttpReply {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status == 200; }

    /// Parsed body, or a discarded (null) value if it is not JSON
    nlohmann::json json() const {
        return nlohmann::json::parse(body, nullptr, false);
    }
};

/**
 * Blocking HTTP/1.1 client for the engine's control endpoints
 *
 * Each call runs on its own io_context so it can be issued from any
 * thread. The timeout bounds connect, write and read; name resolution is
 * bounded by the same budget. Network failures throw UpstreamUnreachable;
 * a non-200 status is returned to the caller as-is.
 */
class EngineHttpClient {
public:
    EngineHttpClient(std::string host, unsigned short port, std::chrono::seconds timeout);

    HttpReply get(const std::string& target) const;
    HttpReply head(const std::string& target) const;
    HttpReply post(const std::string& target, const std::string& body = "") const;
    HttpReply post(const std::string& target, const nlohmann::json& body) const;

    const std::string& host() const { return m_host; }
    unsigned short port() const { return m_port; }

private:
    HttpReply request(http::verb method, const std::string& target, const std::string& body) const;

    std::string m_host;
    unsigned short m_port;
    std::chrono::seconds m_timeout;
};

} // namespace upstream
} // namespace flowrelay
