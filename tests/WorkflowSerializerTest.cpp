#include <catch2/catch.hpp>
#include "workflow/WorkflowSerializer.hpp"
#include "core/Errors.hpp"
#include "TestSupport.hpp"

using namespace flowrelay;
using namespace flowrelay::workflow;

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("Parse API-format workflow", "[WorkflowSerializer]") {
    auto graph = WorkflowSerializer::fromJson(testing::sampleWorkflow());

    REQUIRE(graph.size() == 9);
    REQUIRE(graph.at("6").classType == "CLIPTextEncode");
    REQUIRE(graph.at("6").inputs.at("text") == "a lighthouse at dusk");
    REQUIRE(graph.at("3").inputs.at("steps") == 25);
    REQUIRE(isNodeReference(graph.at("6").inputs.at("clip")));
    REQUIRE_FALSE(isNodeReference(graph.at("6").inputs.at("text")));
}

TEST_CASE("Unknown node keys survive a round trip", "[WorkflowSerializer]") {
    auto original = testing::sampleWorkflow();
    auto graph = WorkflowSerializer::fromJson(original);

    REQUIRE(graph.at("6").extra["_meta"]["title"] == "Positive");
    REQUIRE(WorkflowSerializer::toJson(graph) == original);
}

TEST_CASE("Malformed workflows are rejected", "[WorkflowSerializer][errors]") {
    REQUIRE_THROWS_AS(WorkflowSerializer::fromJson(json::array()), LoadError);
    REQUIRE_THROWS_AS(WorkflowSerializer::fromJson(json::object()), LoadError);
    REQUIRE_THROWS_AS(WorkflowSerializer::fromString("{not json"), LoadError);

    SECTION("node without class_type") {
        json j = {{"1", {{"inputs", json::object()}}}};
        REQUIRE_THROWS_AS(WorkflowSerializer::fromJson(j), LoadError);
    }

    SECTION("node without inputs") {
        json j = {{"1", {{"class_type", "SaveImage"}}}};
        REQUIRE_THROWS_AS(WorkflowSerializer::fromJson(j), LoadError);
    }
}

TEST_CASE("Node reference detection", "[WorkflowSerializer]") {
    REQUIRE(isNodeReference(json::parse(R"(["4", 1])")));
    REQUIRE(isNodeReference(json::parse(R"([4, 0])")));
    REQUIRE_FALSE(isNodeReference(json::parse(R"(["4", "1"])")));
    REQUIRE_FALSE(isNodeReference(json::parse(R"(["a", 1, 2])")));
    REQUIRE_FALSE(isNodeReference(json("text")));
}
