#include "workflow/WorkflowSerializer.hpp"
#include "core/Errors.hpp"

namespace flowrelay {
namespace workflow {

// =============================================================================
// Serialization
// =============================================================================

json WorkflowSerializer::toJson(const WorkflowGraph& graph) {
    json result = json::object();
    for (const auto& [nodeId, node] : graph) {
        result[nodeId] = nodeToJson(node);
    }
    return result;
}

std::string WorkflowSerializer::toString(const WorkflowGraph& graph, int indent) {
    return toJson(graph).dump(indent);
}

json WorkflowSerializer::nodeToJson(const WorkflowNode& node) {
    json result = node.extra.is_object() ? node.extra : json::object();
    result["class_type"] = node.classType;

    json inputs = json::object();
    for (const auto& [field, value] : node.inputs) {
        inputs[field] = value;
    }
    result["inputs"] = inputs;
    return result;
}

// =============================================================================
// Deserialization
// =============================================================================

WorkflowGraph WorkflowSerializer::fromJson(const json& j) {
    if (!j.is_object()) {
        throw LoadError("Workflow must be a JSON object mapping node ids to nodes");
    }
    if (j.empty()) {
        throw LoadError("Workflow contains no nodes");
    }

    WorkflowGraph graph;
    for (const auto& [nodeId, nodeJson] : j.items()) {
        graph.emplace(nodeId, jsonToNode(nodeId, nodeJson));
    }
    return graph;
}

WorkflowGraph WorkflowSerializer::fromString(const std::string& str) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw LoadError("Workflow contains invalid JSON: " + std::string(e.what()));
    }
    return fromJson(j);
}

WorkflowNode WorkflowSerializer::jsonToNode(const std::string& nodeId, const json& j) {
    if (!j.is_object()) {
        throw LoadError("Node " + nodeId + " is not an object");
    }
    if (!j.contains("class_type") || !j["class_type"].is_string()) {
        throw LoadError("Node " + nodeId + " is missing 'class_type'");
    }
    if (!j.contains("inputs") || !j["inputs"].is_object()) {
        throw LoadError("Node " + nodeId + " doesn't have 'inputs' section");
    }

    WorkflowNode node;
    node.classType = j["class_type"].get<std::string>();
    for (const auto& [field, value] : j["inputs"].items()) {
        node.inputs.emplace(field, value);
    }
    for (const auto& [key, value] : j.items()) {
        if (key != "class_type" && key != "inputs") {
            node.extra[key] = value;
        }
    }
    return node;
}

} // namespace workflow
} // namespace flowrelay
