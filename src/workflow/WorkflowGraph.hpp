#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace flowrelay {
namespace workflow {

using json = nlohmann::json;

/**
 * One executable step of an engine workflow
 *
 * `inputs` maps field name to value. A value is a scalar, a string, or a
 * node reference encoded as [source_node_id, output_index].
 * `extra` keeps any other keys of the node object (e.g. "_meta") so the
 * graph is submitted exactly as loaded.
 */
struct WorkflowNode {
    std::string classType;
    std::map<std::string, json> inputs;
    json extra = json::object();

    bool hasField(const std::string& field) const {
        return inputs.find(field) != inputs.end();
    }

    bool operator==(const WorkflowNode& other) const {
        return classType == other.classType && inputs == other.inputs && extra == other.extra;
    }
};

/// Node id -> node. Ordered so serialisation is deterministic.
using WorkflowGraph = std::map<std::string, WorkflowNode>;

/**
 * True for a [node_id, output_index] link to another node's output
 */
inline bool isNodeReference(const json& value) {
    return value.is_array() && value.size() == 2 &&
           (value[0].is_string() || value[0].is_number_integer()) &&
           value[1].is_number_integer();
}

} // namespace workflow
} // namespace flowrelay
