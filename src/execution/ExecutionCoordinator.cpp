#include "execution/ExecutionCoordinator.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <thread>

namespace flowrelay {
namespace execution {

using json = nlohmann::json;

namespace {

/// Node ids arrive as strings or numbers depending on the engine version
std::string nodeIdString(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return "";
}

/// First output image in one node's output: {filename, subfolder, type}
bool findOutputImage(const json& output, std::string& filename, std::string& subfolder, std::string& type) {
    if (!output.is_object()) {
        return false;
    }

    auto images = output.find("images");
    if (images != output.end() && images->is_array()) {
        for (const auto& image : *images) {
            std::string name = upstream::stringField(image, "filename");
            std::string imageType = upstream::stringField(image, "type", "output");
            if (name.empty() || imageType != "output") {
                continue;
            }
            filename = name;
            subfolder = upstream::stringField(image, "subfolder");
            type = imageType;
            return true;
        }
        return false;
    }

    std::string direct = upstream::stringField(output, "filename");
    if (direct.empty()) {
        return false;
    }
    filename = direct;
    subfolder = upstream::stringField(output, "subfolder");
    type = upstream::stringField(output, "type", "output");
    return true;
}

/// Image in a history entry's outputs map, the save node's first
bool findImageInOutputs(const json& outputs, const std::string& saveNodeId,
                        std::string& filename, std::string& subfolder, std::string& type) {
    if (!outputs.is_object()) {
        return false;
    }
    auto saveNode = outputs.find(saveNodeId);
    if (saveNode != outputs.end() && findOutputImage(*saveNode, filename, subfolder, type)) {
        return true;
    }
    for (const auto& item : outputs.items()) {
        if (findOutputImage(item.value(), filename, subfolder, type)) {
            return true;
        }
    }
    return false;
}

} // namespace

ExecutionCoordinator::ExecutionCoordinator(JobSubmitter& submitter, CoordinatorOptions options)
    : m_submitter(submitter)
    , m_options(std::move(options))
{
}

// =============================================================================
// Submission
// =============================================================================

ExecutionResult ExecutionCoordinator::submitAndWait(const workflow::WorkflowSnapshot& graph,
                                                    std::chrono::milliseconds timeout) {
    std::future<ExecutionResult> future;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (isInFlight(m_state)) {
            throw AlreadyRunning();
        }
        if (m_upstreamClosed) {
            throw UpstreamUnreachable("Engine event socket is closed; workflow not submitted");
        }
        generation = ++m_generation;
        m_state = ExecutionState::Queued;
        m_promptId.clear();
        m_promise = std::promise<ExecutionResult>();
        future = m_promise.get_future();
        m_resolved = false;
        m_current = ExecutionResult{};
        m_imageFromSaveNode = false;
        m_progress = ExecutionProgress{};
        m_stateChanged.notify_all();
    }
    LOG_INFO("Received request to execute workflow (job " + std::to_string(generation) + ")");

    std::string promptId;
    try {
        promptId = m_submitter.submit(graph);
    } catch (const RelayError& e) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation == generation && !m_resolved) {
            finishLocked(ExecutionState::Errored, e.what());
        }
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // The engine may already have announced the job on the event socket
        if (m_generation == generation && m_promptId.empty()) {
            m_promptId = promptId;
        }
    }

    if (future.wait_for(timeout) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation == generation && !m_resolved) {
            abandonLocked(m_promptId);
            finishLocked(ExecutionState::Errored, "Execution timed out");
            throw ExecutionTimeout("Workflow did not finish within " +
                                   std::to_string(timeout.count() / 1000) + "s (prompt " + promptId + ")");
        }
    }

    ExecutionResult result = future.get();
    if (result.state == ExecutionState::Errored) {
        throw ExecutionFailed(result.errorMessage.empty() ? "Workflow execution failed" : result.errorMessage);
    }
    return result;
}

// =============================================================================
// Event interpretation
// =============================================================================

bool ExecutionCoordinator::acceptsLocked(const upstream::RelayEvent& event) {
    std::string promptId = event.promptId();
    if (promptId.empty()) {
        return true;
    }
    if (m_abandoned.count(promptId) > 0) {
        return false;
    }
    if (m_promptId.empty()) {
        m_promptId = promptId;
        return true;
    }
    return promptId == m_promptId;
}

void ExecutionCoordinator::onEvent(const upstream::RelayEvent& event) {
    if (!event.isText()) {
        return;
    }

    static const json kEmpty = json::object();
    const std::string& type = event.type();
    const json& data = event.data().is_object() ? event.data() : kEmpty;

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!isInFlight(m_state)) {
        // Only an error can move a machine that has no job in flight
        if (type == "execution_error") {
            std::string promptId = event.promptId();
            bool stale = !promptId.empty() &&
                         (m_abandoned.count(promptId) > 0 || promptId == m_lastResult.promptId);
            if (!stale) {
                finishLocked(ExecutionState::Errored,
                             upstream::stringField(data, "exception_message", "Unknown error"));
            }
        }
        return;
    }

    if (!acceptsLocked(event)) {
        LOG_DEBUG("Ignoring '" + type + "' for prompt " + event.promptId());
        return;
    }

    if (type == "execution_start") {
        m_state = ExecutionState::Running;
        m_stateChanged.notify_all();
    } else if (type == "progress") {
        m_state = ExecutionState::Running;
        m_progress.value = upstream::intField(data, "value", 0);
        m_progress.max = upstream::intField(data, "max", 0);
        auto node = data.find("node");
        if (node != data.end()) {
            m_progress.node = nodeIdString(*node);
        }
    } else if (type == "executing") {
        auto node = data.find("node");
        if (node != data.end() && node->is_null()) {
            // Older engines end a job with executing{node: null}
            if (m_state == ExecutionState::Running) {
                finishLocked(ExecutionState::Completed, "");
            }
            return;
        }
        m_state = ExecutionState::Running;
        if (node != data.end()) {
            m_progress.node = nodeIdString(*node);
        }
    } else if (type == "executed") {
        m_state = ExecutionState::Running;
        captureOutputLocked(data);
    } else if (type == "execution_success" || type == "execution_complete") {
        finishLocked(ExecutionState::Completed, "");
    } else if (type == "execution_error") {
        finishLocked(ExecutionState::Errored,
                     upstream::stringField(data, "exception_message", "Unknown error"));
    } else if (type == "execution_interrupted") {
        finishLocked(ExecutionState::Interrupted, "Execution interrupted");
    }
}

void ExecutionCoordinator::captureOutputLocked(const json& data) {
    auto nodeIt = data.find("node");
    std::string node = nodeIt != data.end() ? nodeIdString(*nodeIt) : "";
    bool fromSaveNode = node == m_options.saveImageNodeId;

    // The save-image node always wins; other nodes only fill an empty slot
    if (m_imageFromSaveNode || (!fromSaveNode && m_current.hasImage())) {
        return;
    }

    std::string filename;
    std::string subfolder;
    std::string type;
    auto output = data.find("output");
    if (output == data.end() || !findOutputImage(*output, filename, subfolder, type)) {
        return;
    }

    m_current.imageFilename = filename;
    m_current.imageSubfolder = subfolder;
    m_current.imageUrl = viewUrl(filename, subfolder, type);
    m_imageFromSaveNode = fromSaveNode;

    if (fromSaveNode) {
        LOG_INFO("Save image node (" + node + ") completed: " + filename);
    }
}

void ExecutionCoordinator::onUpstreamClosed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_upstreamClosed = true;
    if (isInFlight(m_state)) {
        finishLocked(ExecutionState::Errored, "Upstream connection closed during execution");
    }
}

bool ExecutionCoordinator::awaitInterruptAck(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!isInFlight(m_state)) {
        return true;
    }

    uint64_t generation = m_generation;
    bool acknowledged = m_stateChanged.wait_for(lock, grace, [this, generation]() {
        return m_generation != generation || !isInFlight(m_state);
    });
    if (acknowledged) {
        return true;
    }

    LOG_WARN("No interrupt acknowledgement from engine after " +
             std::to_string(grace.count()) + "ms; marking job interrupted");
    abandonLocked(m_promptId);
    finishLocked(ExecutionState::Interrupted, "Interrupted (engine did not acknowledge)");
    return false;
}

// =============================================================================
// History lookup
// =============================================================================

bool ExecutionCoordinator::recoverImage(ExecutionResult& result) {
    if (result.promptId.empty()) {
        return false;
    }
    LOG_INFO("No image in the execution events, checking history of " + result.promptId);

    const int attempts = std::max(1, m_options.historyAttempts);
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            auto wait = m_options.historyRetryDelay + attempt * m_options.historyRetryDelay / 2;
            LOG_DEBUG("History attempt " + std::to_string(attempt + 1) + "/" + std::to_string(attempts) +
                      " in " + std::to_string(wait.count()) + "ms");
            std::this_thread::sleep_for(wait);
        }

        try {
            json entry = m_submitter.history(result.promptId);
            if (!entry.is_object()) {
                LOG_DEBUG("Prompt " + result.promptId + " not in history yet");
                continue;
            }

            std::string filename;
            std::string subfolder;
            std::string type;
            auto outputs = entry.find("outputs");
            if (outputs == entry.end() ||
                !findImageInOutputs(*outputs, m_options.saveImageNodeId, filename, subfolder, type)) {
                LOG_DEBUG("No output images in history yet");
                continue;
            }

            if (!m_submitter.isAvailable(viewTarget(filename, subfolder, type))) {
                LOG_WARN("Image metadata found but file not accessible yet: " + filename);
                continue;
            }

            result.imageFilename = filename;
            result.imageSubfolder = subfolder;
            result.imageUrl = viewUrl(filename, subfolder, type);
            LOG_INFO("Image verified: " + filename);

            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_lastResult.promptId == result.promptId) {
                m_lastResult = result;
            }
            return true;
        } catch (const RelayError& e) {
            LOG_WARN("History attempt " + std::to_string(attempt + 1) + " failed: " + e.what());
        }
    }

    LOG_ERROR("Failed to get an accessible image after " + std::to_string(attempts) + " attempts");
    return false;
}

void ExecutionCoordinator::finishLocked(ExecutionState state, const std::string& message) {
    m_state = state;
    m_current.state = state;
    m_current.promptId = m_promptId;
    m_current.errorMessage = message;
    m_lastResult = m_current;

    if (!m_resolved) {
        m_resolved = true;
        m_promise.set_value(m_current);
    }
    m_stateChanged.notify_all();

    switch (state) {
        case ExecutionState::Completed:
            LOG_INFO("Workflow execution completed successfully");
            break;
        case ExecutionState::Interrupted:
            LOG_WARN("Workflow execution interrupted");
            break;
        default:
            LOG_ERROR("Workflow execution failed: " + message);
            break;
    }
}

void ExecutionCoordinator::abandonLocked(const std::string& promptId) {
    if (promptId.empty() || !m_abandoned.insert(promptId).second) {
        return;
    }
    m_abandonedOrder.push_back(promptId);
    while (m_abandonedOrder.size() > kMaxAbandoned) {
        m_abandoned.erase(m_abandonedOrder.front());
        m_abandonedOrder.pop_front();
    }
}

std::string ExecutionCoordinator::viewTarget(const std::string& filename, const std::string& subfolder,
                                             const std::string& type) const {
    std::string target = "/view?filename=" + filename;
    if (!subfolder.empty()) {
        target += "&subfolder=" + subfolder;
    }
    target += "&type=" + type;
    return target;
}

std::string ExecutionCoordinator::viewUrl(const std::string& filename, const std::string& subfolder,
                                          const std::string& type) const {
    return m_options.viewBaseUrl + viewTarget(filename, subfolder, type);
}

// =============================================================================
// Accessors
// =============================================================================

ExecutionState ExecutionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::string ExecutionCoordinator::currentPromptId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isInFlight(m_state) ? m_promptId : "";
}

ExecutionProgress ExecutionCoordinator::progress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_progress;
}

ExecutionResult ExecutionCoordinator::lastResult() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastResult;
}

size_t ExecutionCoordinator::abandonedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_abandoned.size();
}

} // namespace execution
} // namespace flowrelay
