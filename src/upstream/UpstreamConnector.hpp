#pragma once

#include "config/RelayConfig.hpp"
#include "execution/JobSubmitter.hpp"
#include "upstream/EngineHttpClient.hpp"
#include "upstream/RelayEvent.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace flowrelay {
namespace upstream {

namespace websocket = beast::websocket;

/**
 * The relay's single connection to the engine
 *
 * Owns the persistent event socket (`ws://host:port/ws?clientId=...`) and
 * the HTTP control channel. The read loop runs on a dedicated thread and
 * hands every classified event to the event callback, in arrival order.
 *
 * connect() is single-shot: there is no reconnection, because a new
 * socket would not carry the events of a job submitted on the old one.
 */
class UpstreamConnector : public execution::JobSubmitter {
public:
    using DisconnectCallback = std::function<void()>;

    explicit UpstreamConnector(const config::UpstreamConfig& config);
    ~UpstreamConnector() override;

    UpstreamConnector(const UpstreamConnector&) = delete;
    UpstreamConnector& operator=(const UpstreamConnector&) = delete;

    // === Lifecycle ===

    /**
     * GET /system_stats; throws UpstreamUnreachable unless the engine answers 200
     */
    void checkConnectivity() const;

    /**
     * Open the event socket. Throws UpstreamUnreachable if the handshake
     * does not complete within the connect timeout.
     */
    void connect();

    /**
     * Run readLoop() on the connector's own thread
     */
    void start();

    /**
     * Read frames until the socket closes. Blocks the calling thread.
     */
    void readLoop();

    /**
     * Close the event socket and join the read thread
     */
    void close();

    bool isConnected() const { return m_connected; }

    // === Callbacks ===

    void setEventCallback(EventCallback callback) { m_onEvent = std::move(callback); }
    void setDisconnectCallback(DisconnectCallback callback) { m_onDisconnect = std::move(callback); }

    // === Control channel ===

    /**
     * POST /prompt. Throws UpstreamUnreachable while the event socket is
     * down, SubmissionRejected if the engine refuses the graph.
     */
    std::string submit(const workflow::WorkflowSnapshot& graph) override;

    /**
     * POST /interrupt, then clear whatever is left in the engine queue
     */
    bool interrupt() override;

    /**
     * GET /history/{promptId}; the entry for that prompt or null
     */
    nlohmann::json history(const std::string& promptId) override;

    /**
     * HEAD `target`; true on 200
     */
    bool isAvailable(const std::string& target) override;

    // === Frame handling ===

    /**
     * Classify one inbound frame and dispatch it. Malformed frames are
     * logged and dropped; they never stop the read loop.
     */
    void handleFrame(bool isText, std::string data);

    /// Id sent as client_id with submissions (replaced by the engine's sid once seen)
    std::string clientId() const;

    const EngineHttpClient& http() const { return m_http; }

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void clearQueue();
    void logEvent(const RelayEvent& event);

    config::UpstreamConfig m_config;
    EngineHttpClient m_http;

    net::io_context m_ioc;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> m_ws;
    beast::flat_buffer m_buffer;
    std::thread m_thread;
    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_closing{false};

    mutable std::mutex m_mutex;
    std::string m_clientId;

    EventCallback m_onEvent;
    DisconnectCallback m_onDisconnect;
};

} // namespace upstream
} // namespace flowrelay
