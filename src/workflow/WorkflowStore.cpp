#include "workflow/WorkflowStore.hpp"
#include "workflow/WorkflowSerializer.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <fstream>
#include <sstream>

namespace flowrelay {
namespace workflow {

void WorkflowStore::load(const json& graph) {
    // Parse outside the lock; a malformed graph leaves the current one intact
    WorkflowGraph parsed = WorkflowSerializer::fromJson(graph);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_graph = std::move(parsed);
}

void WorkflowStore::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LoadError("Workflow file '" + path + "' not found");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    WorkflowGraph parsed = WorkflowSerializer::fromString(buffer.str());
    size_t count = parsed.size();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_graph = std::move(parsed);
    }
    LOG_INFO("Workflow loaded: " + path + " (" + std::to_string(count) + " nodes)");
}

bool WorkflowStore::isLoaded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_graph.has_value();
}

size_t WorkflowStore::nodeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_graph ? m_graph->size() : 0;
}

void WorkflowStore::validateLocked(const std::string& nodeId, const std::string& field) const {
    if (!m_graph) {
        throw NodeNotFound(nodeId);
    }
    auto it = m_graph->find(nodeId);
    if (it == m_graph->end()) {
        throw NodeNotFound(nodeId);
    }
    if (!it->second.hasField(field)) {
        throw FieldNotAccepted(nodeId, field);
    }
}

json WorkflowStore::setField(const std::string& nodeId, const std::string& field, const json& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    validateLocked(nodeId, field);

    json& slot = m_graph->at(nodeId).inputs.at(field);
    json previous = std::move(slot);
    slot = value;
    return previous;
}

std::vector<json> WorkflowStore::setFields(const std::vector<FieldUpdate>& updates) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& update : updates) {
        validateLocked(update.nodeId, update.field);
    }

    std::vector<json> previous;
    previous.reserve(updates.size());
    for (const auto& update : updates) {
        json& slot = m_graph->at(update.nodeId).inputs.at(update.field);
        previous.push_back(slot);
        slot = update.value;
    }
    return previous;
}

WorkflowSnapshot WorkflowStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_graph) {
        throw LoadError("No workflow loaded");
    }
    return std::make_shared<const WorkflowGraph>(*m_graph);
}

std::optional<WorkflowNode> WorkflowStore::node(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_graph) {
        return std::nullopt;
    }
    auto it = m_graph->find(nodeId);
    if (it == m_graph->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool WorkflowStore::hasNode(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_graph && m_graph->count(nodeId) > 0;
}

} // namespace workflow
} // namespace flowrelay
