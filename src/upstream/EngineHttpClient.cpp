#include "upstream/EngineHttpClient.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"

namespace flowrelay {
namespace upstream {

EngineHttpClient::EngineHttpClient(std::string host, unsigned short port, std::chrono::seconds timeout)
    : m_host(std::move(host))
    , m_port(port)
    , m_timeout(timeout)
{
}

HttpReply EngineHttpClient::get(const std::string& target) const {
    return request(http::verb::get, target, "");
}

HttpReply EngineHttpClient::head(const std::string& target) const {
    return request(http::verb::head, target, "");
}

HttpReply EngineHttpClient::post(const std::string& target, const std::string& body) const {
    return request(http::verb::post, target, body);
}

HttpReply EngineHttpClient::post(const std::string& target, const nlohmann::json& body) const {
    return request(http::verb::post, target, body.dump());
}

HttpReply EngineHttpClient::request(http::verb method, const std::string& target, const std::string& body) const {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, m_host + ":" + std::to_string(m_port));
    req.set(http::field::user_agent, "flowrelay/1.0");
    if (method == http::verb::post) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    if (method == http::verb::head) {
        // A HEAD reply announces a Content-Length but carries no body
        parser.skip(true);
    }
    beast::error_code result = net::error::would_block;
    std::string stage = "resolve";

    resolver.async_resolve(m_host, std::to_string(m_port),
        [&](beast::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) { result = ec; return; }
            stage = "connect";
            stream.expires_after(m_timeout);
            stream.async_connect(endpoints,
                [&](beast::error_code ec, tcp::endpoint) {
                    if (ec) { result = ec; return; }
                    stage = "write";
                    stream.expires_after(m_timeout);
                    http::async_write(stream, req,
                        [&](beast::error_code ec, std::size_t) {
                            if (ec) { result = ec; return; }
                            stage = "read";
                            stream.expires_after(m_timeout);
                            http::async_read(stream, buffer, parser,
                                [&](beast::error_code ec, std::size_t) {
                                    result = ec;
                                });
                        });
                });
        });

    // Resolution has no timer of its own; give the whole exchange a hard ceiling
    ioc.run_for(m_timeout * 4);

    const std::string url = "http://" + m_host + ":" + std::to_string(m_port) + target;
    if (result == net::error::would_block) {
        throw UpstreamUnreachable("Timed out (" + stage + ") on " + url);
    }
    if (result) {
        throw UpstreamUnreachable("Request to " + url + " failed during " + stage + ": " + result.message());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    auto res = parser.release();

    auto verb = http::to_string(method);
    LOG_DEBUG(std::string(verb.data(), verb.size()) + " " + url + " -> " + std::to_string(res.result_int()));
    return HttpReply{res.result_int(), std::move(res.body())};
}

} // namespace upstream
} // namespace flowrelay
