#pragma once

#include "config/RelayConfig.hpp"
#include "workflow/WorkflowStore.hpp"
#include <optional>
#include <string>
#include <vector>

namespace flowrelay {
namespace workflow {

/**
 * Resolves what an HTTP caller names into a concrete mutation target
 *
 * A caller may name a node by a configured role ("ollama_node") or by its
 * raw id ("17"). When no field is named, the node's inputs are searched
 * for the first recognised text field, which is what lets one HTTP
 * contract drive differently shaped workflows.
 */
class NodeMapper {
public:
    NodeMapper(config::NodeMappings mappings, const WorkflowStore& store);

    /**
     * Role name -> mapped node id; anything else is returned unchanged as a literal id
     */
    std::string resolve(const std::string& roleOrId) const;

    /**
     * Node id mapped for `role` inside a workflow variant, if configured
     */
    std::optional<std::string> resolveVariant(const std::string& variant, const std::string& role) const;

    /**
     * Field to write text into on `nodeId`.
     *
     * `preferredField` wins when the node has it; otherwise the first entry
     * of textFieldCandidates() the node accepts. Fields currently holding
     * a link to another node are never chosen.
     * Throws NodeNotFound or NoTextFieldFound.
     */
    std::string findTextField(const std::string& nodeId, const std::string& preferredField = "") const;

    /// Recognised text field names, in priority order
    static const std::vector<std::string>& textFieldCandidates();

    const config::NodeMappings& mappings() const { return m_mappings; }

private:
    config::NodeMappings m_mappings;
    const WorkflowStore& m_store;
};

} // namespace workflow
} // namespace flowrelay
