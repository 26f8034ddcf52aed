#include <catch2/catch.hpp>
#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "upstream/EngineHttpClient.hpp"
#include "TestSupport.hpp"
#include <thread>

using namespace flowrelay;
using flowrelay::testing::FakeSubmitter;
namespace net = boost::asio;

namespace {

/**
 * Full HTTP stack on an ephemeral loopback port
 */
class LoopbackHttp {
public:
    LoopbackHttp()
        : m_mapper(m_config.mappings, m_store)
        , m_coordinator(m_submitter, execution::CoordinatorOptions{})
        , m_handler(m_store, m_mapper, m_coordinator, m_hub, m_submitter, m_config)
        , m_server(m_ioc, "127.0.0.1", 0, m_handler)
    {
        m_store.load(testing::sampleWorkflow());
        m_server.run();
        for (int i = 0; i < 2; ++i) {
            m_threads.emplace_back([this]() { m_ioc.run(); });
        }
    }

    ~LoopbackHttp() {
        m_server.stop();
        m_ioc.stop();
        for (auto& t : m_threads) t.join();
    }

    upstream::EngineHttpClient client() const {
        return upstream::EngineHttpClient("127.0.0.1", m_server.port(), std::chrono::seconds(5));
    }

    workflow::WorkflowStore& store() { return m_store; }

private:
    config::RelayConfig m_config;
    workflow::WorkflowStore m_store;
    workflow::NodeMapper m_mapper;
    FakeSubmitter m_submitter;
    relay::BroadcastHub m_hub;
    execution::ExecutionCoordinator m_coordinator;
    server::RequestHandler m_handler;
    net::io_context m_ioc;
    server::HttpServer m_server;
    std::vector<std::thread> m_threads;
};

} // namespace

TEST_CASE("Health over HTTP", "[HttpServer][loopback]") {
    LoopbackHttp http;
    auto reply = http.client().get("/health");

    REQUIRE(reply.ok());
    REQUIRE(reply.json()["STATUS"].is_string());
}

TEST_CASE("Status over HTTP", "[HttpServer][loopback]") {
    LoopbackHttp http;
    auto reply = http.client().get("/status");

    REQUIRE(reply.ok());
    REQUIRE(reply.json()["execution_status"] == "idle");
}

TEST_CASE("Update text over HTTP", "[HttpServer][loopback]") {
    LoopbackHttp http;
    auto reply = http.client().post("/update/text", nlohmann::json{{"node_id", 6}, {"text", "aurora"}});

    REQUIRE(reply.ok());
    REQUIRE(reply.json()["field"] == "text");
    REQUIRE(http.store().node("6")->inputs.at("text") == "aurora");
}

TEST_CASE("Errors map to HTTP statuses with a STATUS body", "[HttpServer][loopback][errors]") {
    LoopbackHttp http;
    auto client = http.client();

    auto badJson = client.post("/update/text", std::string("{oops"));
    REQUIRE(badJson.status == 400);
    REQUIRE(badJson.json()["STATUS"] == "Invalid JSON in request body");

    auto missing = client.post("/update/image", nlohmann::json{{"node_id", 10}});
    REQUIRE(missing.status == 400);
    REQUIRE(missing.json()["STATUS"] == "Missing required fields: filename");

    auto unknownNode = client.post("/update/text", nlohmann::json{{"node_id", 99}, {"text", "x"}});
    REQUIRE(unknownNode.status == 404);
    REQUIRE(unknownNode.json()["STATUS"] == "Node ID 99 not found in workflow");

    auto noTextField = client.post("/update/text", nlohmann::json{{"node_id", 9}, {"text", "x"}});
    REQUIRE(noTextField.status == 422);

    auto notFound = client.get("/nope");
    REQUIRE(notFound.status == 404);
}

TEST_CASE("Unreachable server raises UpstreamUnreachable", "[EngineHttpClient][errors]") {
    upstream::EngineHttpClient client("127.0.0.1", 1, std::chrono::seconds(1));
    REQUIRE_THROWS_AS(client.get("/system_stats"), UpstreamUnreachable);
}
