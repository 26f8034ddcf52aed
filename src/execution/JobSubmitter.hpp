#pragma once

#include "workflow/WorkflowStore.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace flowrelay {
namespace execution {

/**
 * Control channel to the engine, as seen by the ExecutionCoordinator
 *
 * Implemented by UpstreamConnector; tests substitute a fake.
 */
class JobSubmitter {
public:
    virtual ~JobSubmitter() = default;

    /**
     * Submit a graph for execution and return the engine's job id.
     * Throws SubmissionRejected or UpstreamUnreachable.
     */
    virtual std::string submit(const workflow::WorkflowSnapshot& graph) = 0;

    /**
     * Ask the engine to stop the running job. Does not change local state;
     * the acknowledgement arrives as an event. Returns false if the engine
     * refused the request.
     */
    virtual bool interrupt() = 0;

    /**
     * History entry of a finished job ({"outputs": {...}, ...}), or null
     * while the engine has not recorded it yet. Throws UpstreamUnreachable.
     */
    virtual nlohmann::json history(const std::string& promptId) = 0;

    /**
     * True if `target` (an engine path such as "/view?filename=...")
     * answers a HEAD request with 200
     */
    virtual bool isAvailable(const std::string& target) = 0;
};

} // namespace execution
} // namespace flowrelay
