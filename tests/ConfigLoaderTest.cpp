#include <catch2/catch.hpp>
#include "config/ConfigLoader.hpp"
#include "core/Errors.hpp"

using namespace flowrelay;
using namespace flowrelay::config;

TEST_CASE("Empty configuration keeps defaults", "[ConfigLoader]") {
    auto config = ConfigLoader::loadString("");

    REQUIRE(config.upstream.host == "127.0.0.1");
    REQUIRE(config.upstream.port == 8188);
    REQUIRE(config.http.port == 8189);
    REQUIRE(config.relay.port == 8190);
    REQUIRE(config.execution.timeout == std::chrono::seconds(300));
    REQUIRE(config.execution.interruptFallback == std::chrono::seconds(10));
    REQUIRE(config.workflowPath == "workflows/workflow_api.json");
    REQUIRE(config.mappings.saveImageNodeId() == "9");
}

TEST_CASE("Full configuration file", "[ConfigLoader]") {
    auto config = ConfigLoader::loadString(R"(
# Engine
[comfy]
host = "192.168.1.20"
port = 8288
workflow = "workflows/portrait.json"
connect_timeout = 5

[http-server]
address = "127.0.0.1"
port = 9000
threads = 8

[server]
ws_port = 9001   # relay
max_queued_events = 64
write_timeout = 3

[execution]
timeout = 120
interrupt_fallback = 0

[logging]
level = "debug"
color = false

[node_mappings]
ollama_node = 17
save_image_node = "31"

[node_mappings.text_to_image]
prompt = "6"
mood_cue = '12'
)");

    REQUIRE(config.upstream.host == "192.168.1.20");
    REQUIRE(config.upstream.port == 8288);
    REQUIRE(config.upstream.connectTimeout == std::chrono::seconds(5));
    REQUIRE(config.upstream.baseUrl() == "http://192.168.1.20:8288");
    REQUIRE(config.workflowPath == "workflows/portrait.json");

    REQUIRE(config.http.address == "127.0.0.1");
    REQUIRE(config.http.port == 9000);
    REQUIRE(config.http.threads == 8);

    REQUIRE(config.relay.port == 9001);
    REQUIRE(config.relay.maxQueuedEvents == 64);
    REQUIRE(config.relay.writeTimeout == std::chrono::seconds(3));

    REQUIRE(config.execution.timeout == std::chrono::seconds(120));
    REQUIRE(config.execution.interruptFallback == std::chrono::seconds(0));

    REQUIRE(config.logging.level == "debug");
    REQUIRE_FALSE(config.logging.color);

    REQUIRE(config.mappings.roles.at("ollama_node") == "17");
    REQUIRE(config.mappings.saveImageNodeId() == "31");
    REQUIRE(config.mappings.variants.at("text_to_image").at("prompt") == "6");
    REQUIRE(config.mappings.variants.at("text_to_image").at("mood_cue") == "12");
}

TEST_CASE("Unknown keys and sections are ignored", "[ConfigLoader]") {
    auto config = ConfigLoader::loadString(R"(
[comfy]
api_key = "abc"
[telemetry]
enabled = true
)");
    REQUIRE(config.upstream.port == 8188);
}

TEST_CASE("Malformed values raise ConfigError", "[ConfigLoader][errors]") {
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[comfy]\nport = eighty\n"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[comfy]\nport = 70000\n"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[logging]\ncolor = maybe\n"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[comfy\nport = 1\n"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[comfy]\njust a line\n"), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::loadFile("/nonexistent/config.toml"), ConfigError);
}

TEST_CASE("The HTTP server needs a spare thread beside a running job", "[ConfigLoader][errors]") {
    REQUIRE(ConfigLoader::loadString("").http.threads >= 2);
    REQUIRE(ConfigLoader::loadString("[http-server]\nthreads = 2\n").http.threads == 2);
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[http-server]\nthreads = 1\n"), ConfigError);
}

TEST_CASE("History lookup attempts", "[ConfigLoader]") {
    REQUIRE(ConfigLoader::loadString("").execution.historyAttempts == 12);
    REQUIRE(ConfigLoader::loadString("[execution]\nhistory_attempts = 3\n").execution.historyAttempts == 3);
    REQUIRE_THROWS_AS(ConfigLoader::loadString("[execution]\nhistory_attempts = 0\n"), ConfigError);
}
