#pragma once

#include <chrono>
#include <map>
#include <string>

namespace flowrelay {
namespace config {

/**
 * Role -> node-id mappings.
 *
 * `roles` holds the global [node_mappings] table, `variants` the
 * per-workflow sub-tables such as [node_mappings.text_to_image].
 */
struct NodeMappings {
    std::map<std::string, std::string> roles;
    std::map<std::string, std::map<std::string, std::string>> variants;

    /// Node that produces the final image ("save_image_node" role, "9" by default)
    std::string saveImageNodeId() const {
        auto it = roles.find("save_image_node");
        return it != roles.end() ? it->second : "9";
    }
};

struct UpstreamConfig {
    std::string host = "127.0.0.1";
    unsigned short port = 8188;
    std::chrono::seconds connectTimeout{10};
    std::chrono::seconds requestTimeout{30};

    std::string baseUrl() const {
        return "http://" + host + ":" + std::to_string(port);
    }
};

struct HttpConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8189;
    // At least 2: a /queue call holds its thread for the whole job
    unsigned threads = 4;
};

struct RelayServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8190;
    unsigned threads = 2;
    std::size_t maxQueuedEvents = 256;
    std::chrono::seconds writeTimeout{10};
};

struct ExecutionConfig {
    std::chrono::seconds timeout{300};
    std::chrono::seconds interruptFallback{10};  // 0 disables the fallback
    int historyAttempts = 12;                    // history lookups when no event carried the image
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool color = true;
};

/**
 * Fully resolved relay configuration
 */
struct RelayConfig {
    UpstreamConfig upstream;
    HttpConfig http;
    RelayServerConfig relay;
    ExecutionConfig execution;
    LoggingConfig logging;
    std::string workflowPath = "workflows/workflow_api.json";
    NodeMappings mappings;
};

} // namespace config
} // namespace flowrelay
