#pragma once

#include "workflow/WorkflowGraph.hpp"
#include <string>

namespace flowrelay {
namespace workflow {

/**
 * Conversion between the engine's API-format JSON and WorkflowGraph
 *
 * JSON format:
 * {
 *   "6": {"class_type": "CLIPTextEncode", "inputs": {"text": "...", "clip": ["4", 1]},
 *         "_meta": {"title": "Positive prompt"}},
 *   "9": {"class_type": "SaveImage", "inputs": {"images": ["8", 0]}}
 * }
 */
class WorkflowSerializer {
public:
    // === Serialization ===

    static json toJson(const WorkflowGraph& graph);
    static std::string toString(const WorkflowGraph& graph, int indent = -1);

    // === Deserialization ===

    /**
     * Build a graph from JSON. Throws LoadError if the document is not a
     * mapping of node id to {class_type, inputs}.
     */
    static WorkflowGraph fromJson(const json& j);
    static WorkflowGraph fromString(const std::string& str);

    static json nodeToJson(const WorkflowNode& node);

private:
    static WorkflowNode jsonToNode(const std::string& nodeId, const json& j);
};

} // namespace workflow
} // namespace flowrelay
