#include "server/RequestHandler.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include "upstream/RelayEvent.hpp"
#include <utility>
#include <boost/asio/post.hpp>
#include <vector>

namespace flowrelay {
namespace server {

namespace {

bool isPresent(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) return false;
    if (it->is_string()) return !it->get<std::string>().empty();
    if (it->is_object() || it->is_array()) return !it->empty();
    return true;
}

/// Optional string member, empty if absent or not a string
std::string optionalString(const json& object, const char* field) {
    auto it = object.find(field);
    if (it == object.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // anonymous namespace

RequestHandler::RequestHandler(workflow::WorkflowStore& store,
                               workflow::NodeMapper& mapper,
                               execution::ExecutionCoordinator& coordinator,
                               relay::BroadcastHub& hub,
                               execution::JobSubmitter& submitter,
                               const config::RelayConfig& config)
    : m_store(store)
    , m_mapper(mapper)
    , m_coordinator(coordinator)
    , m_hub(hub)
    , m_submitter(submitter)
    , m_engineAddress(config.upstream.host + ":" + std::to_string(config.upstream.port))
    , m_executionTimeout(config.execution.timeout)
    , m_interruptFallback(config.execution.interruptFallback)
{
}

RequestHandler::~RequestHandler() {
    m_background.join();
}

void RequestHandler::drain() {
    m_background.join();
}

// =============================================================================
// Request parsing helpers
// =============================================================================

json RequestHandler::parseBody(const std::string& raw) {
    if (raw.empty()) {
        return json::object();
    }
    try {
        json body = json::parse(raw);
        if (!body.is_object()) {
            throw BadRequest("Invalid JSON in request body");
        }
        return body;
    } catch (const json::parse_error&) {
        throw BadRequest("Invalid JSON in request body");
    }
}

void RequestHandler::requireFields(const json& body, std::initializer_list<const char*> fields) {
    std::string missing;
    for (const char* field : fields) {
        if (!isPresent(body, field)) {
            if (!missing.empty()) missing += ", ";
            missing += field;
        }
    }
    if (!missing.empty()) {
        throw BadRequest("Missing required fields: " + missing);
    }
}

std::string RequestHandler::resolveNodeId(const json& value) const {
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    if (value.is_string()) {
        return m_mapper.resolve(value.get<std::string>());
    }
    throw BadRequest("Invalid node_id - must be a number or a mapped role name");
}

// =============================================================================
// Status
// =============================================================================

RouteResult RequestHandler::handleHealth() const {
    return {200, json{{"STATUS", "FlowRelay is running"}}};
}

RouteResult RequestHandler::handleStatus() const {
    auto progress = m_coordinator.progress();
    std::string promptId = m_coordinator.currentPromptId();

    json status = {
        {"STATUS", "Server running"},
        {"execution_status", execution::toString(m_coordinator.state())},
        {"current_prompt_id", promptId.empty() ? json(nullptr) : json(promptId)},
        {"workflow_loaded", m_store.isLoaded()},
        {"connected_ws_clients", m_hub.clientCount()},
        {"comfy_server", m_engineAddress},
        {"save_image_node_id", m_mapper.mappings().saveImageNodeId()},
        {"progress", {
            {"value", progress.value},
            {"max", progress.max},
            {"node", progress.node.empty() ? json(nullptr) : json(progress.node)}
        }}
    };
    return {200, status};
}

// =============================================================================
// Execution
// =============================================================================

RouteResult RequestHandler::handleQueue() {
    LOG_INFO("Received request to execute workflow");
    return runAndPublish();
}

RouteResult RequestHandler::runAndPublish() {
    if (!m_store.isLoaded()) {
        throw BadRequest("No workflow loaded");
    }

    auto result = m_coordinator.submitAndWait(m_store.snapshot(), m_executionTimeout);

    if (result.state == execution::ExecutionState::Interrupted) {
        return {500, json{
            {"STATUS", "generation failed - interrupted"},
            {"execution_status", "interrupted"},
            {"prompt_id", result.promptId}
        }};
    }

    if (!result.hasImage() && !m_coordinator.recoverImage(result)) {
        LOG_WARN("Workflow completed but no image found");
        return {500, json{
            {"STATUS", "Workflow completed but no image found"},
            {"prompt_id", result.promptId}
        }};
    }

    LOG_INFO("Generated image: " + result.imageFilename + " (" + result.imageUrl + ")");

    json data = {
        {"image_filename", result.imageFilename},
        {"image_url", result.imageUrl},
        {"prompt_id", result.promptId}
    };
    size_t delivered = m_hub.broadcast(upstream::RelayEvent::makeText("image_generated", data));
    LOG_DEBUG("image_generated delivered to " + std::to_string(delivered) + " client(s)");

    json response = data;
    response["STATUS"] = "Workflow completed successfully";
    return {200, response};
}

RouteResult RequestHandler::handleInterrupt() {
    bool inFlight = execution::isInFlight(m_coordinator.state());
    LOG_INFO("Interrupt requested (job in flight: " + std::string(inFlight ? "yes" : "no") + ")");

    boost::asio::post(m_background, [this, inFlight]() {
        try {
            if (!m_submitter.interrupt()) {
                LOG_WARN("Engine did not accept the interrupt request");
            }
        } catch (const RelayError& e) {
            LOG_ERROR("Interrupt failed: " + std::string(e.what()));
        }

        if (inFlight && m_interruptFallback.count() > 0) {
            m_coordinator.awaitInterruptAck(m_interruptFallback);
        }
    });

    return {200, json{{"STATUS", "Interrupt request received, processing..."}}};
}

// =============================================================================
// Workflow mutation
// =============================================================================

RouteResult RequestHandler::handleUpdateText(const json& body) {
    requireFields(body, {"node_id", "text"});
    if (!body["text"].is_string()) {
        throw BadRequest("Invalid text - must be a string");
    }

    std::string nodeId = resolveNodeId(body["node_id"]);
    std::string field = m_mapper.findTextField(nodeId, optionalString(body, "field"));
    json previous = m_store.setField(nodeId, field, body["text"]);

    LOG_INFO("Updated text node " + nodeId + " (field '" + field + "')");
    return {200, json{
        {"STATUS", "Updated text in node " + nodeId + " successfully"},
        {"node_id", nodeId},
        {"field", field},
        {"previous", previous}
    }};
}

RouteResult RequestHandler::handleUpdateImage(const json& body) {
    requireFields(body, {"node_id", "filename"});
    if (!body["filename"].is_string()) {
        throw BadRequest("Invalid filename - must be a string");
    }

    std::string nodeId = resolveNodeId(body["node_id"]);
    std::string filename = body["filename"].get<std::string>();

    // Only a LoadImage node takes a file name; elsewhere "image" is a link
    auto node = m_store.node(nodeId);
    if (!node) {
        throw NodeNotFound(nodeId);
    }
    if (node->classType != "LoadImage") {
        throw FieldNotAccepted(nodeId, "image", "not a LoadImage node (class_type " +
                               (node->classType.empty() ? std::string("Unknown") : node->classType) + ")");
    }
    auto current = node->inputs.find("image");
    if (current != node->inputs.end() && workflow::isNodeReference(current->second)) {
        throw FieldNotAccepted(nodeId, "image", "input is linked to another node");
    }
    m_store.setField(nodeId, "image", filename);

    LOG_INFO("Updated image node " + nodeId + " with image: " + filename);
    return {200, json{
        {"STATUS", "Updated image in node " + nodeId + " to " + filename + " successfully"},
        {"node_id", nodeId}
    }};
}

RouteResult RequestHandler::handleGenerateImage(const json& body) {
    requireFields(body, {"image_description"});
    const json& description = body["image_description"];
    if (!description.is_object()) {
        throw BadRequest("Invalid image_description - must be an object");
    }
    requireFields(description, {"description"});

    std::string text = optionalString(description, "description");
    std::string visualCue = optionalString(description, "visualCue");
    std::string moodCue = optionalString(description, "moodCue");

    const std::string variant = "text_to_image";
    auto descriptionNode = m_mapper.resolveVariant(variant, "description");
    auto visualNode = m_mapper.resolveVariant(variant, "visual_cue");
    auto moodNode = m_mapper.resolveVariant(variant, "mood_cue");

    std::vector<workflow::FieldUpdate> updates;
    if (descriptionNode && visualNode && moodNode) {
        // One node per cue
        updates.push_back({*descriptionNode, m_mapper.findTextField(*descriptionNode), text});
        updates.push_back({*visualNode, m_mapper.findTextField(*visualNode), visualCue});
        updates.push_back({*moodNode, m_mapper.findTextField(*moodNode), moodCue});
    } else {
        std::string prompt = text;
        for (const std::string* cue : {&visualCue, &moodCue}) {
            if (!cue->empty()) {
                prompt += ". " + *cue;
            }
        }

        auto promptNode = m_mapper.resolveVariant(variant, "prompt");
        std::string nodeId = promptNode ? *promptNode : m_mapper.resolve("ollama_node");
        if (nodeId == "ollama_node") {
            throw ConfigError("No prompt node mapped for image generation");
        }
        updates.push_back({nodeId, m_mapper.findTextField(nodeId), prompt});
    }

    m_store.setFields(updates);
    LOG_INFO("Image description written to " + std::to_string(updates.size()) + " node(s)");

    return runAndPublish();
}

} // namespace server
} // namespace flowrelay
