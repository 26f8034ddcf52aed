#include <catch2/catch.hpp>
#include "upstream/UpstreamConnector.hpp"
#include "execution/ExecutionCoordinator.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"
#include <utility>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace flowrelay;
using namespace flowrelay::upstream;

namespace {

config::UpstreamConfig unreachableEngine() {
    config::UpstreamConfig config;
    config.host = "127.0.0.1";
    config.port = 1;  // nothing listens here
    config.connectTimeout = std::chrono::seconds(1);
    config.requestTimeout = std::chrono::seconds(1);
    return config;
}

/**
 * Minimal engine on an ephemeral loopback port
 *
 * Serves canned HTTP replies (one request per connection, as the
 * connector's client sends them) and accepts the event socket, which the
 * test then writes frames to.
 */
class FakeEngine {
public:
    FakeEngine()
        : m_acceptor(m_ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    {
        reply(http::verb::get, "/system_stats", 200, R"({"system": {"os": "posix"}})");
        m_acceptThread = std::thread([this]() { acceptLoop(); });
    }

    ~FakeEngine() {
        m_stopping = true;
        // Wake the blocking accept
        beast::error_code ec;
        tcp::socket wake(m_ioc);
        wake.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port()), ec);
        m_acceptThread.join();

        dropSocket();
        for (auto& t : m_connections) t.join();
    }

    unsigned short port() const { return m_acceptor.local_endpoint().port(); }

    config::UpstreamConfig config() const {
        config::UpstreamConfig config;
        config.host = "127.0.0.1";
        config.port = port();
        config.connectTimeout = std::chrono::seconds(2);
        config.requestTimeout = std::chrono::seconds(2);
        return config;
    }

    /// Canned reply for `method target`; anything else answers 404
    void reply(http::verb method, const std::string& target, unsigned status, const std::string& body) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_replies[key(method, target)] = {status, body};
    }

    /// Bodies of the requests received for `method target`
    std::vector<std::string> requestsFor(http::verb method, const std::string& target) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> bodies;
        for (const auto& [k, body] : m_requests) {
            if (k == key(method, target)) bodies.push_back(body);
        }
        return bodies;
    }

    bool waitForSocket() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_socketReady.wait_for(lock, std::chrono::seconds(2), [this]() { return m_ws != nullptr; });
    }

    std::string socketTarget() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_wsTarget;
    }

    void sendText(const std::string& frame) { send(frame, false); }
    void sendBinary(const std::string& frame) { send(frame, true); }

    /// Drop the event socket without a close handshake
    void dropSocket() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_ws) return;
        beast::error_code ec;
        m_ws->next_layer().shutdown(tcp::socket::shutdown_both, ec);
        m_ws->next_layer().close(ec);
        m_ws.reset();
    }

private:
    static std::string key(http::verb method, const std::string& target) {
        return std::string(http::to_string(method)) + " " + target;
    }

    void acceptLoop() {
        while (true) {
            tcp::socket socket(m_ioc);
            beast::error_code ec;
            m_acceptor.accept(socket, ec);
            if (ec || m_stopping) {
                return;
            }
            m_connections.emplace_back([this, s = std::move(socket)]() mutable { serve(std::move(s)); });
        }
    }

    void serve(tcp::socket socket) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        beast::error_code ec;
        http::read(socket, buffer, req, ec);
        if (ec) {
            return;
        }

        if (websocket::is_upgrade(req)) {
            auto ws = std::make_shared<websocket::stream<tcp::socket>>(std::move(socket));
            ws->accept(req, ec);
            if (ec) {
                return;
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_ws = ws;
            m_wsTarget = std::string(req.target());
            m_socketReady.notify_all();
            return;
        }

        std::string target(req.target());
        std::pair<unsigned, std::string> canned{404, R"({"error": "not found"})"};
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.emplace_back(key(req.method(), target), req.body());
            auto it = m_replies.find(key(req.method(), target));
            if (it != m_replies.end()) canned = it->second;
        }

        http::response<http::string_body> res{static_cast<http::status>(canned.first), req.version()};
        res.set(http::field::content_type, "application/json");
        if (req.method() != http::verb::head) {
            res.body() = canned.second;
        }
        res.keep_alive(false);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }

    void send(const std::string& frame, bool binary) {
        std::shared_ptr<websocket::stream<tcp::socket>> ws;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ws = m_ws;
        }
        REQUIRE(ws);
        ws->binary(binary);
        ws->write(net::buffer(frame));
    }

    net::io_context m_ioc;
    tcp::acceptor m_acceptor;
    std::thread m_acceptThread;
    std::vector<std::thread> m_connections;
    std::atomic<bool> m_stopping{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_socketReady;
    std::map<std::string, std::pair<unsigned, std::string>> m_replies;
    std::vector<std::pair<std::string, std::string>> m_requests;
    std::shared_ptr<websocket::stream<tcp::socket>> m_ws;
    std::string m_wsTarget;
};

} // namespace

// =============================================================================
// Frame handling (no socket)
// =============================================================================

TEST_CASE("Frames are dispatched in arrival order", "[UpstreamConnector]") {
    UpstreamConnector connector(unreachableEngine());
    std::vector<std::string> types;
    connector.setEventCallback([&](const RelayEventPtr& event) {
        types.push_back(event->type());
    });

    connector.handleFrame(true, R"({"type": "execution_start", "data": {"prompt_id": "p"}})");
    connector.handleFrame(false, std::string(8, '\0') + "img");
    connector.handleFrame(true, R"({"type": "executing", "data": {"node": "3"}})");

    REQUIRE(types == std::vector<std::string>{"execution_start", "binary", "executing"});
}

TEST_CASE("Malformed frames are skipped without stopping the stream", "[UpstreamConnector]") {
    UpstreamConnector connector(unreachableEngine());
    int count = 0;
    connector.setEventCallback([&](const RelayEventPtr&) { ++count; });

    connector.handleFrame(true, "garbage");
    connector.handleFrame(false, "short");
    connector.handleFrame(true, R"({"type": "progress", "data": {"value": 1, "max": 2}})");

    REQUIRE(count == 1);
}

TEST_CASE("A throwing event handler does not escape the read path", "[UpstreamConnector]") {
    UpstreamConnector connector(unreachableEngine());
    connector.setEventCallback([](const RelayEventPtr&) {
        throw std::runtime_error("handler failed");
    });

    REQUIRE_NOTHROW(connector.handleFrame(true, R"({"type": "executed", "data": {}})"));
}

TEST_CASE("Frames with oddly typed members are still dispatched", "[UpstreamConnector]") {
    UpstreamConnector connector(unreachableEngine());
    std::vector<std::string> raw;
    connector.setEventCallback([&](const RelayEventPtr& event) {
        raw.push_back(event->raw());
    });

    const std::string error = R"({"type": "execution_error", "data": {"exception_message": null}})";
    const std::string progress = R"({"type": "progress", "data": {"value": "3", "max": [1]}})";
    const std::string executing = R"({"type": "executing", "data": {"node": {"id": 3}}})";
    connector.handleFrame(true, error);
    connector.handleFrame(true, progress);
    connector.handleFrame(true, executing);

    REQUIRE(raw == std::vector<std::string>{error, progress, executing});
}

TEST_CASE("Lenient payload readers", "[RelayEvent]") {
    nlohmann::json data = {{"value", 3}, {"ratio", 2.7}, {"text", "x"}, {"null", nullptr}};

    REQUIRE(intField(data, "value", -1) == 3);
    REQUIRE(intField(data, "ratio", -1) == 2);
    REQUIRE(intField(data, "text", -1) == -1);
    REQUIRE(intField(data, "missing", -1) == -1);
    REQUIRE(intField(nlohmann::json::array(), "value", -1) == -1);

    REQUIRE(stringField(data, "text") == "x");
    REQUIRE(stringField(data, "null", "fallback") == "fallback");
    REQUIRE(stringField(data, "value", "fallback") == "fallback");
}

TEST_CASE("status sid replaces the client id", "[UpstreamConnector]") {
    UpstreamConnector connector(unreachableEngine());
    std::string generated = connector.clientId();
    REQUIRE(generated.size() == 36);

    connector.handleFrame(true, R"({"type": "status", "data": {"status": {}}})");
    REQUIRE(connector.clientId() == generated);

    connector.handleFrame(true, R"({"type": "status", "data": {"status": {}, "sid": "engine-sid"}})");
    REQUIRE(connector.clientId() == "engine-sid");
}

// =============================================================================
// Unreachable engine
// =============================================================================

TEST_CASE("Unreachable engine surfaces UpstreamUnreachable", "[UpstreamConnector][errors]") {
    UpstreamConnector connector(unreachableEngine());

    REQUIRE_THROWS_AS(connector.checkConnectivity(), UpstreamUnreachable);
    REQUIRE_THROWS_AS(connector.connect(), UpstreamUnreachable);
    REQUIRE_FALSE(connector.isConnected());
}

TEST_CASE("No submission without the event socket", "[UpstreamConnector][errors]") {
    UpstreamConnector connector(unreachableEngine());
    workflow::WorkflowStore store;
    store.load(testing::sampleWorkflow());

    // Never reaches the network: the port would answer with a connect error instead
    try {
        connector.submit(store.snapshot());
        FAIL("expected UpstreamUnreachable");
    } catch (const UpstreamUnreachable& e) {
        REQUIRE(std::string(e.what()).find("event socket") != std::string::npos);
    }
}

// =============================================================================
// Loopback engine
// =============================================================================

TEST_CASE("Event socket frames reach the callback verbatim", "[UpstreamConnector][loopback]") {
    FakeEngine engine;
    UpstreamConnector connector(engine.config());

    std::mutex mutex;
    std::vector<RelayEventPtr> events;
    connector.setEventCallback([&](const RelayEventPtr& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });

    REQUIRE_NOTHROW(connector.checkConnectivity());
    std::string generatedId = connector.clientId();
    connector.connect();
    connector.start();
    REQUIRE(connector.isConnected());
    REQUIRE(engine.waitForSocket());
    REQUIRE(engine.socketTarget() == "/ws?clientId=" + generatedId);

    const std::string status = R"({"type": "status", "data": {"status": {}, "sid": "engine-sid"}})";
    const std::string progress = R"({"type": "progress", "data": {"value": 2, "max": 20}})";
    const std::string preview = std::string("\x01\x00\x00\x00\x00\x00\x00\x00", 8) + "jpegbytes";
    engine.sendText(status);
    engine.sendText(progress);
    engine.sendBinary(preview);

    REQUIRE(testing::waitUntil([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return events.size() == 3;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(events[0]->raw() == status);
    REQUIRE(events[1]->raw() == progress);
    REQUIRE(events[2]->isBinary());
    REQUIRE(events[2]->raw() == preview);
    REQUIRE(connector.clientId() == "engine-sid");
}

TEST_CASE("Submission posts the graph with the client id", "[UpstreamConnector][loopback]") {
    FakeEngine engine;
    engine.reply(http::verb::post, "/prompt", 200, R"({"prompt_id": "p-77", "number": 1, "node_errors": {}})");
    UpstreamConnector connector(engine.config());
    connector.connect();
    connector.start();

    workflow::WorkflowStore store;
    store.load(testing::sampleWorkflow());

    REQUIRE(connector.submit(store.snapshot()) == "p-77");

    auto posted = engine.requestsFor(http::verb::post, "/prompt");
    REQUIRE(posted.size() == 1);
    auto body = nlohmann::json::parse(posted[0]);
    REQUIRE(body["client_id"] == connector.clientId());
    REQUIRE(body["prompt"]["6"]["inputs"]["text"] == "a lighthouse at dusk");
    REQUIRE(body["prompt"]["3"]["inputs"]["model"] == nlohmann::json::array({"4", 0}));
}

TEST_CASE("Engine refusals raise SubmissionRejected", "[UpstreamConnector][loopback][errors]") {
    FakeEngine engine;
    UpstreamConnector connector(engine.config());
    connector.connect();
    connector.start();

    workflow::WorkflowStore store;
    store.load(testing::sampleWorkflow());

    SECTION("node errors") {
        engine.reply(http::verb::post, "/prompt", 200,
                     R"({"prompt_id": "p-1", "node_errors": {"6": {"errors": [{"message": "bad clip"}]}}})");
        try {
            connector.submit(store.snapshot());
            FAIL("expected SubmissionRejected");
        } catch (const SubmissionRejected& e) {
            REQUIRE(std::string(e.what()).find("bad clip") != std::string::npos);
            REQUIRE(e.httpStatus() == 502);
        }
    }

    SECTION("HTTP error") {
        engine.reply(http::verb::post, "/prompt", 400, R"({"error": "invalid prompt"})");
        REQUIRE_THROWS_AS(connector.submit(store.snapshot()), SubmissionRejected);
    }

    SECTION("no prompt id") {
        engine.reply(http::verb::post, "/prompt", 200, R"({"number": 3})");
        REQUIRE_THROWS_AS(connector.submit(store.snapshot()), SubmissionRejected);
    }
}

TEST_CASE("Lost event socket fails the job and stops further submissions", "[UpstreamConnector][loopback][errors]") {
    FakeEngine engine;
    engine.reply(http::verb::post, "/prompt", 200, R"({"prompt_id": "p-1", "node_errors": {}})");
    UpstreamConnector connector(engine.config());
    execution::ExecutionCoordinator coordinator(connector, execution::CoordinatorOptions{});
    connector.setEventCallback([&](const RelayEventPtr& event) { coordinator.onEvent(*event); });
    connector.setDisconnectCallback([&]() { coordinator.onUpstreamClosed(); });
    connector.connect();
    connector.start();
    REQUIRE(engine.waitForSocket());

    workflow::WorkflowStore store;
    store.load(testing::sampleWorkflow());

    auto job = std::async(std::launch::async, [&]() {
        return coordinator.submitAndWait(store.snapshot(), std::chrono::milliseconds(10000));
    });
    REQUIRE(testing::waitUntil([&]() { return coordinator.currentPromptId() == "p-1"; }));
    engine.sendText(R"({"type": "execution_start", "data": {"prompt_id": "p-1"}})");
    REQUIRE(testing::waitUntil([&]() { return coordinator.state() == execution::ExecutionState::Running; }));

    engine.dropSocket();

    REQUIRE_THROWS_AS(job.get(), ExecutionFailed);
    REQUIRE(testing::waitUntil([&]() { return !connector.isConnected(); }));
    REQUIRE(coordinator.state() == execution::ExecutionState::Errored);

    REQUIRE_THROWS_AS(coordinator.submitAndWait(store.snapshot(), std::chrono::milliseconds(10000)),
                      UpstreamUnreachable);
    REQUIRE_THROWS_AS(connector.submit(store.snapshot()), UpstreamUnreachable);
    REQUIRE(engine.requestsFor(http::verb::post, "/prompt").size() == 1);
}

TEST_CASE("Interrupt clears running and pending prompts", "[UpstreamConnector][loopback]") {
    FakeEngine engine;
    engine.reply(http::verb::post, "/interrupt", 200, "");
    engine.reply(http::verb::get, "/queue", 200,
                 R"({"queue_running": [[4, "p-run", {}, {}, []]], "queue_pending": [[5, "p-wait", {}, {}, []]]})");
    engine.reply(http::verb::post, "/queue", 200, "");
    UpstreamConnector connector(engine.config());

    REQUIRE(connector.interrupt());

    REQUIRE(engine.requestsFor(http::verb::post, "/interrupt").size() == 1);
    auto deleted = engine.requestsFor(http::verb::post, "/queue");
    REQUIRE(deleted.size() == 1);
    REQUIRE(nlohmann::json::parse(deleted[0]) == nlohmann::json{{"delete", {"p-run", "p-wait"}}});
}

TEST_CASE("Refused interrupt leaves the queue alone", "[UpstreamConnector][loopback]") {
    FakeEngine engine;
    engine.reply(http::verb::post, "/interrupt", 500, "");
    UpstreamConnector connector(engine.config());

    REQUIRE_FALSE(connector.interrupt());
    REQUIRE(engine.requestsFor(http::verb::get, "/queue").empty());
}

TEST_CASE("History and image availability lookups", "[UpstreamConnector][loopback]") {
    FakeEngine engine;
    engine.reply(http::verb::get, "/history/p-1", 200,
                 R"({"p-1": {"outputs": {"9": {"images": [{"filename": "a.png", "subfolder": "", "type": "output"}]}}}})");
    engine.reply(http::verb::get, "/history/p-2", 200, "{}");
    engine.reply(http::verb::head, "/view?filename=a.png&type=output", 200, "");
    UpstreamConnector connector(engine.config());

    auto entry = connector.history("p-1");
    REQUIRE(entry["outputs"]["9"]["images"][0]["filename"] == "a.png");
    REQUIRE(connector.history("p-2").is_null());
    REQUIRE(connector.history("p-3").is_null());

    REQUIRE(connector.isAvailable("/view?filename=a.png&type=output"));
    REQUIRE_FALSE(connector.isAvailable("/view?filename=b.png&type=output"));
}
