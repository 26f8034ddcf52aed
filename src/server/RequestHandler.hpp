#pragma once

#include "config/RelayConfig.hpp"
#include "execution/ExecutionCoordinator.hpp"
#include "execution/JobSubmitter.hpp"
#include "relay/BroadcastHub.hpp"
#include "workflow/NodeMapper.hpp"
#include "workflow/WorkflowStore.hpp"
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <initializer_list>
#include <string>
#include <utility>

namespace flowrelay {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * Business logic behind the HTTP control surface
 *
 * Handlers take an already parsed JSON body and either return a
 * RouteResult or throw a RelayError, which the session maps to its HTTP
 * status. handleQueue() and handleGenerateImage() block the calling
 * thread until the job finishes; handleInterrupt() returns immediately and
 * finishes its work on a background thread.
 */
class RequestHandler {
public:
    RequestHandler(workflow::WorkflowStore& store,
                   workflow::NodeMapper& mapper,
                   execution::ExecutionCoordinator& coordinator,
                   relay::BroadcastHub& hub,
                   execution::JobSubmitter& submitter,
                   const config::RelayConfig& config);
    ~RequestHandler();

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    // GET /health, GET /status
    RouteResult handleHealth() const;
    RouteResult handleStatus() const;

    // GET /queue
    RouteResult handleQueue();

    // POST /update/text  {node_id, text [, field]}
    RouteResult handleUpdateText(const json& body);

    // POST /update/image {node_id, filename}
    RouteResult handleUpdateImage(const json& body);

    // POST /generate/image {image_description: {description, visualCue, moodCue}}
    RouteResult handleGenerateImage(const json& body);

    // POST /interrupt
    RouteResult handleInterrupt();

    /**
     * Parse a request body. An empty body is an empty object.
     * Throws BadRequest("Invalid JSON in request body").
     */
    static json parseBody(const std::string& raw);

    /**
     * Throws BadRequest("Missing required fields: a, b") unless every field
     * is present and non-empty
     */
    static void requireFields(const json& body, std::initializer_list<const char*> fields);

    /**
     * Block until background work (interrupt follow-up) has drained.
     * Used at shutdown.
     */
    void drain();

private:
    std::string resolveNodeId(const json& value) const;
    RouteResult runAndPublish();

    workflow::WorkflowStore& m_store;
    workflow::NodeMapper& m_mapper;
    execution::ExecutionCoordinator& m_coordinator;
    relay::BroadcastHub& m_hub;
    execution::JobSubmitter& m_submitter;

    std::string m_engineAddress;
    std::chrono::milliseconds m_executionTimeout;
    std::chrono::milliseconds m_interruptFallback;

    boost::asio::thread_pool m_background{1};
};

} // namespace server
} // namespace flowrelay
