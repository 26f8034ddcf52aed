#include "server/HttpSession.hpp"
#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "core/Errors.hpp"

namespace flowrelay {
namespace server {

namespace {

constexpr const char* kServerName = "FlowRelay/1.0";

void setCorsHeaders(http::response<http::string_body>& res) {
    res.set(http::field::server, kServerName);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
}

// Build a JSON response
http::response<http::string_body> makeJsonResponse(
    unsigned status,
    const json& body,
    unsigned version,
    bool keepAlive,
    uint64_t requestId)
{
    http::response<http::string_body> res{static_cast<http::status>(status), version};
    setCorsHeaders(res);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(keepAlive);
    res.body() = body.dump();
    res.prepare_payload();

    Logger::instance().logResponse(requestId, static_cast<int>(status), res.body(), res.body().size());

    return res;
}

} // anonymous namespace

HttpSession::HttpSession(tcp::socket socket, RequestHandler& handler)
    : m_stream(std::move(socket))
    , m_handler(handler)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(10 * 1024 * 1024); // 10 MB
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    sendResponse(handleRequest(m_parser->release()));
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    // The handler may have blocked for a whole job; give the write a fresh deadline
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

http::response<http::string_body> HttpSession::handleRequest(
    http::request<http::string_body>&& req)
{
    auto& logger = Logger::instance();
    auto targetView = req.target();
    auto methodView = req.method_string();
    std::string target(targetView.data(), targetView.size());
    std::string method(methodView.data(), methodView.size());

    uint64_t requestId = logger.logRequest(method, target, req.body());

    // Query strings carry nothing the routes use
    std::string path = target.substr(0, target.find('?'));
    auto verb = req.method();

    // CORS preflight
    if (verb == http::verb::options) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        setCorsHeaders(res);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        logger.logResponse(requestId, 200, "", 0);
        return res;
    }

    auto respond = [&](const RouteResult& result) {
        return makeJsonResponse(result.first, result.second, req.version(), req.keep_alive(), requestId);
    };

    try {
        // GET /health
        if (verb == http::verb::get && path == "/health") {
            return respond(m_handler.handleHealth());
        }

        // GET /status
        if (verb == http::verb::get && path == "/status") {
            return respond(m_handler.handleStatus());
        }

        // GET /queue - run the loaded workflow and wait for its image
        if (verb == http::verb::get && path == "/queue") {
            return respond(m_handler.handleQueue());
        }

        // POST /interrupt
        if (verb == http::verb::post && path == "/interrupt") {
            return respond(m_handler.handleInterrupt());
        }

        // ============================================================
        // Workflow mutation
        // ============================================================

        if (verb == http::verb::post && path == "/update/text") {
            return respond(m_handler.handleUpdateText(RequestHandler::parseBody(req.body())));
        }

        if (verb == http::verb::post && path == "/update/image") {
            return respond(m_handler.handleUpdateImage(RequestHandler::parseBody(req.body())));
        }

        if (verb == http::verb::post && path == "/generate/image") {
            return respond(m_handler.handleGenerateImage(RequestHandler::parseBody(req.body())));
        }

        // 404 Not Found
        return respond({404, json{{"STATUS", "Not found: " + path}}});

    } catch (const RelayError& e) {
        return respond({e.httpStatus(), json{{"STATUS", e.what()}}});
    } catch (const std::exception& e) {
        LOG_ERROR("Unhandled error on " + method + " " + path + ": " + e.what());
        return respond({500, json{{"STATUS", std::string("Error: ") + e.what()}}});
    }
}

} // namespace server
} // namespace flowrelay
