#include "upstream/UpstreamConnector.hpp"
#include "workflow/WorkflowSerializer.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <utility>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace flowrelay {
namespace upstream {

UpstreamConnector::UpstreamConnector(const config::UpstreamConfig& config)
    : m_config(config)
    , m_http(config.host, config.port, config.requestTimeout)
    , m_clientId(boost::uuids::to_string(boost::uuids::random_generator()()))
{
}

UpstreamConnector::~UpstreamConnector() {
    close();
}

// =============================================================================
// Lifecycle
// =============================================================================

void UpstreamConnector::checkConnectivity() const {
    LOG_INFO("Testing connectivity to engine at " + m_config.baseUrl() + "/system_stats");
    HttpReply reply = m_http.get("/system_stats");
    if (!reply.ok()) {
        throw UpstreamUnreachable("Engine connectivity check failed: HTTP " + std::to_string(reply.status));
    }
    LOG_INFO("Engine connection successful");
}

void UpstreamConnector::connect() {
    const std::string target = "/ws?clientId=" + clientId();
    const std::string url = "ws://" + m_config.host + ":" + std::to_string(m_config.port) + target;
    LOG_INFO("Connecting to engine event socket at " + url);

    m_ws = std::make_unique<websocket::stream<beast::tcp_stream>>(m_ioc);
    m_ws->read_message_max(64 * 1024 * 1024);

    tcp::resolver resolver(m_ioc);
    beast::error_code result = net::error::would_block;
    const std::string hostHeader = m_config.host + ":" + std::to_string(m_config.port);

    resolver.async_resolve(m_config.host, std::to_string(m_config.port),
        [&](beast::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) { result = ec; return; }
            beast::get_lowest_layer(*m_ws).expires_after(m_config.connectTimeout);
            beast::get_lowest_layer(*m_ws).async_connect(endpoints,
                [&](beast::error_code ec, tcp::endpoint) {
                    if (ec) { result = ec; return; }
                    m_ws->set_option(websocket::stream_base::decorator(
                        [](websocket::request_type& req) {
                            req.set(http::field::user_agent, "flowrelay/1.0");
                        }));
                    m_ws->async_handshake(hostHeader, target,
                        [&](beast::error_code ec) {
                            result = ec;
                        });
                });
        });

    m_ioc.run_for(m_config.connectTimeout * 2);
    m_ioc.restart();

    if (result == net::error::would_block) {
        m_ws.reset();
        throw UpstreamUnreachable("Handshake with " + url + " did not complete within " +
                                  std::to_string(m_config.connectTimeout.count()) + "s");
    }
    if (result) {
        m_ws.reset();
        throw UpstreamUnreachable("Failed to connect to " + url + ": " + result.message());
    }

    // The websocket layer takes over timeouts once the session is up
    beast::get_lowest_layer(*m_ws).expires_never();
    m_ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    m_connected = true;
    m_closing = false;
    LOG_INFO("Connected to engine event socket (client id " + clientId() + ")");
}

void UpstreamConnector::start() {
    if (!m_ws) {
        throw UpstreamUnreachable("Event socket is not connected");
    }
    m_thread = std::thread([this]() { readLoop(); });
}

void UpstreamConnector::readLoop() {
    doRead();
    m_ioc.run();
    m_ioc.restart();
}

void UpstreamConnector::close() {
    if (!m_ws) {
        return;
    }
    m_closing = true;

    net::post(m_ioc, [this]() {
        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(*m_ws).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    });

    if (m_thread.joinable()) {
        m_thread.join();
    } else {
        m_ioc.run();
        m_ioc.restart();
    }
    m_ws.reset();
    m_connected = false;
}

void UpstreamConnector::doRead() {
    m_ws->async_read(
        m_buffer,
        [this](beast::error_code ec, std::size_t bytes) { onRead(ec, bytes); });
}

void UpstreamConnector::onRead(beast::error_code ec, std::size_t /*bytesTransferred*/) {
    if (ec) {
        m_connected = false;
        if (m_closing || ec == websocket::error::closed) {
            LOG_INFO("Engine event socket closed");
        } else {
            LOG_ERROR("Engine event socket lost: " + ec.message());
        }
        if (m_onDisconnect) {
            m_onDisconnect();
        }
        return;
    }

    bool isText = m_ws->got_text();
    std::string data = beast::buffers_to_string(m_buffer.data());
    m_buffer.consume(m_buffer.size());

    handleFrame(isText, std::move(data));
    doRead();
}

// =============================================================================
// Frame handling
// =============================================================================

void UpstreamConnector::handleFrame(bool isText, std::string data) {
    RelayEventPtr event;
    try {
        event = isText ? RelayEvent::fromText(std::move(data))
                       : RelayEvent::fromBinary(std::move(data));
    } catch (const std::invalid_argument& e) {
        LOG_WARN(std::string("Skipping malformed engine frame: ") + e.what());
        return;
    }

    if (event->type() == "status" && event->data().is_object() &&
        event->data().contains("sid") && event->data()["sid"].is_string()) {
        std::string sid = event->data()["sid"].get<std::string>();
        std::lock_guard<std::mutex> lock(m_mutex);
        if (sid != m_clientId) {
            LOG_INFO("Got session ID: " + sid);
            m_clientId = sid;
        }
    }

    // Logging never decides whether a frame is relayed
    try {
        logEvent(*event);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Could not log '" + event->type() + "' event: " + e.what());
    }

    if (!m_onEvent) {
        return;
    }
    try {
        m_onEvent(event);
    } catch (const std::exception& e) {
        LOG_ERROR("Error dispatching '" + event->type() + "' event: " + e.what());
    }
}

void UpstreamConnector::logEvent(const RelayEvent& event) {
    if (event.isBinary()) {
        LOG_DEBUG("Received preview image: " + server::Logger::formatSize(event.payload().size()) +
                  " (event type: " + std::to_string(event.eventTypeCode()) + ")");
        return;
    }

    static const nlohmann::json kEmpty = nlohmann::json::object();
    const auto& type = event.type();
    const auto& data = event.data().is_object() ? event.data() : kEmpty;
    if (type == "status") {
        LOG_DEBUG("EVENT: status");
    } else if (type == "progress") {
        int value = intField(data, "value", 0);
        int max = intField(data, "max", 100);
        int percent = max > 0 ? (value * 100) / max : 0;
        LOG_INFO("Progress: " + std::to_string(value) + "/" + std::to_string(max) +
                 " (" + std::to_string(percent) + "%)");
    } else if (type == "executing") {
        auto node = data.find("node");
        LOG_INFO("Executing node: " + (node != data.end() ? node->dump() : std::string("null")));
    } else if (type == "execution_error") {
        LOG_ERROR("Execution error: " + stringField(data, "exception_message", "Unknown error"));
    } else {
        LOG_INFO("EVENT: " + type);
    }
}

std::string UpstreamConnector::clientId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clientId;
}

// =============================================================================
// Control channel
// =============================================================================

std::string UpstreamConnector::submit(const workflow::WorkflowSnapshot& graph) {
    // Without the event socket the job's completion could never be observed
    if (!m_connected) {
        throw UpstreamUnreachable("Engine event socket is not connected; workflow not submitted");
    }

    nlohmann::json body = {
        {"prompt", workflow::WorkflowSerializer::toJson(*graph)},
        {"client_id", clientId()}
    };

    LOG_INFO("Submitting workflow to " + m_config.baseUrl() + "/prompt");
    HttpReply reply = m_http.post("/prompt", body);

    if (!reply.ok()) {
        throw SubmissionRejected("Engine rejected workflow (HTTP " + std::to_string(reply.status) +
                                 "): " + reply.body.substr(0, 500));
    }

    nlohmann::json result = reply.json();
    if (result.is_discarded() || !result.is_object()) {
        throw SubmissionRejected("Engine returned an unreadable submission reply");
    }
    auto nodeErrors = result.find("node_errors");
    if (nodeErrors != result.end() && !nodeErrors->is_null() && !nodeErrors->empty()) {
        throw SubmissionRejected("Node errors detected: " + nodeErrors->dump());
    }
    auto promptId = result.find("prompt_id");
    if (promptId == result.end() || !promptId->is_string()) {
        throw SubmissionRejected("Engine reply carries no prompt_id");
    }

    LOG_INFO("Workflow submitted successfully. Prompt ID: " + promptId->get<std::string>());
    return promptId->get<std::string>();
}

bool UpstreamConnector::interrupt() {
    LOG_INFO("Interrupting workflow execution");
    HttpReply reply = m_http.post("/interrupt");
    if (!reply.ok()) {
        LOG_ERROR("Failed to interrupt: HTTP " + std::to_string(reply.status));
        return false;
    }
    LOG_INFO("Interrupt request sent successfully");
    try {
        clearQueue();
    } catch (const RelayError& e) {
        LOG_ERROR("Failed to clear engine queue: " + std::string(e.what()));
    }
    return true;
}

nlohmann::json UpstreamConnector::history(const std::string& promptId) {
    HttpReply reply = m_http.get("/history/" + promptId);
    if (!reply.ok()) {
        LOG_DEBUG("History API returned " + std::to_string(reply.status) + " for " + promptId);
        return nullptr;
    }

    nlohmann::json entries = reply.json();
    if (!entries.is_object()) {
        return nullptr;
    }
    auto entry = entries.find(promptId);
    if (entry == entries.end() || !entry->is_object()) {
        return nullptr;
    }
    return *entry;
}

bool UpstreamConnector::isAvailable(const std::string& target) {
    return m_http.head(target).ok();
}

void UpstreamConnector::clearQueue() {
    HttpReply reply = m_http.get("/queue");
    if (!reply.ok()) {
        LOG_ERROR("Failed to get queue status: HTTP " + std::to_string(reply.status));
        return;
    }

    nlohmann::json queue = reply.json();
    if (!queue.is_object()) {
        LOG_WARN("Engine queue reply is not a JSON object");
        return;
    }

    // Queue items are arrays with the prompt id at index 1
    nlohmann::json promptIds = nlohmann::json::array();
    for (const char* key : {"queue_running", "queue_pending"}) {
        auto it = queue.find(key);
        if (it == queue.end() || !it->is_array()) continue;
        for (const auto& item : *it) {
            if (item.is_array() && item.size() > 1) {
                promptIds.push_back(item[1]);
            }
        }
    }

    if (promptIds.empty()) {
        LOG_INFO("No items in queue to clear");
        return;
    }

    HttpReply deleted = m_http.post("/queue", nlohmann::json{{"delete", promptIds}});
    if (deleted.ok()) {
        LOG_INFO("Cleared " + std::to_string(promptIds.size()) + " items from queue");
    } else {
        LOG_ERROR("Failed to clear queue: HTTP " + std::to_string(deleted.status));
    }
}

} // namespace upstream
} // namespace flowrelay
