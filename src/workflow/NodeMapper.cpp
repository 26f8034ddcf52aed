#include "workflow/NodeMapper.hpp"
#include "core/Errors.hpp"

namespace flowrelay {
namespace workflow {

namespace {

bool acceptsText(const WorkflowNode& node, const std::string& field) {
    auto it = node.inputs.find(field);
    return it != node.inputs.end() && !isNodeReference(it->second);
}

} // namespace

NodeMapper::NodeMapper(config::NodeMappings mappings, const WorkflowStore& store)
    : m_mappings(std::move(mappings))
    , m_store(store)
{
}

const std::vector<std::string>& NodeMapper::textFieldCandidates() {
    static const std::vector<std::string> candidates = {
        "text",
        "prompt",
        "value",
        "text_positive",
        "text_negative",
        "system",
        "style",
        "style_name",
        "key",
        "url",
        "model",
    };
    return candidates;
}

std::string NodeMapper::resolve(const std::string& roleOrId) const {
    auto it = m_mappings.roles.find(roleOrId);
    if (it != m_mappings.roles.end()) {
        return it->second;
    }
    return roleOrId;
}

std::optional<std::string> NodeMapper::resolveVariant(const std::string& variant, const std::string& role) const {
    auto variantIt = m_mappings.variants.find(variant);
    if (variantIt == m_mappings.variants.end()) {
        return std::nullopt;
    }
    auto roleIt = variantIt->second.find(role);
    if (roleIt == variantIt->second.end()) {
        return std::nullopt;
    }
    return roleIt->second;
}

std::string NodeMapper::findTextField(const std::string& nodeId, const std::string& preferredField) const {
    auto node = m_store.node(nodeId);
    if (!node) {
        throw NodeNotFound(nodeId);
    }

    if (!preferredField.empty() && acceptsText(*node, preferredField)) {
        return preferredField;
    }

    for (const auto& candidate : textFieldCandidates()) {
        if (acceptsText(*node, candidate)) {
            return candidate;
        }
    }

    throw NoTextFieldFound(nodeId);
}

} // namespace workflow
} // namespace flowrelay
