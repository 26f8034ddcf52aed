#pragma once

#include "workflow/WorkflowGraph.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flowrelay {
namespace workflow {

/// Immutable copy of the graph handed to the submission path
using WorkflowSnapshot = std::shared_ptr<const WorkflowGraph>;

/**
 * A single field write, used for batched updates
 */
struct FieldUpdate {
    std::string nodeId;
    std::string field;
    json value;
};

/**
 * Owner of the in-memory workflow graph
 *
 * Every call is atomic with respect to every other: a mutation is applied
 * completely under the store mutex, and snapshot() copies under the same
 * mutex, so a snapshot never sees a half-applied mutation. The graph held
 * here is never shared with the submission path; snapshot() deep-copies.
 *
 * Usage:
 *   WorkflowStore store;
 *   store.loadFile("workflows/workflow_api.json");
 *   json previous = store.setField("6", "text", "a red fox");
 *   auto snap = store.snapshot();
 */
class WorkflowStore {
public:
    WorkflowStore() = default;

    WorkflowStore(const WorkflowStore&) = delete;
    WorkflowStore& operator=(const WorkflowStore&) = delete;

    // === Loading ===

    /**
     * Replace the held graph wholesale. Throws LoadError on a malformed
     * graph, in which case the previous graph is kept.
     */
    void load(const json& graph);

    /**
     * Read and load a workflow file. Throws LoadError.
     */
    void loadFile(const std::string& path);

    bool isLoaded() const;
    size_t nodeCount() const;

    // === Mutation ===

    /**
     * Set one input field on one node and return the previous value.
     * Throws NodeNotFound or FieldNotAccepted; the graph is unchanged on failure.
     */
    json setField(const std::string& nodeId, const std::string& field, const json& value);

    /**
     * Apply several field writes all-or-nothing. Every update is validated
     * before any is applied. Returns the previous values in order.
     */
    std::vector<json> setFields(const std::vector<FieldUpdate>& updates);

    // === Reading ===

    /**
     * Deep copy of the current graph. Throws LoadError if nothing is loaded.
     */
    WorkflowSnapshot snapshot() const;

    /**
     * Copy of a single node, or nullopt if absent
     */
    std::optional<WorkflowNode> node(const std::string& nodeId) const;

    bool hasNode(const std::string& nodeId) const;

private:
    void validateLocked(const std::string& nodeId, const std::string& field) const;

    mutable std::mutex m_mutex;
    std::optional<WorkflowGraph> m_graph;
};

} // namespace workflow
} // namespace flowrelay
