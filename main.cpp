#include "config/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "execution/ExecutionCoordinator.hpp"
#include "relay/BroadcastHub.hpp"
#include "relay/RelayServer.hpp"
#include "server/HttpServer.hpp"
#include "server/Logger.hpp"
#include "server/RequestHandler.hpp"
#include "upstream/UpstreamConnector.hpp"
#include "workflow/NodeMapper.hpp"
#include "workflow/WorkflowStore.hpp"
#include <utility>
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace flowrelay;
using flowrelay::server::Logger;
namespace net = boost::asio;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config PATH    Configuration file (default: config.toml)\n"
              << "  -w, --workflow PATH  Workflow graph in API format (overrides [comfy] workflow)\n"
              << "  -p, --port PORT      HTTP control port (default: 8189)\n"
              << "  --ws-port PORT       WebSocket relay port (default: 8190)\n"
              << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: info)\n"
              << "  --log-file PATH      Append log lines to a file instead of stdout\n"
              << "  --no-color           Disable coloured log output\n"
              << "  -h, --help           Show this help\n";
}

unsigned short parsePortArg(const std::string& value) {
    int port = 0;
    try {
        port = std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError("Invalid port: " + value);
    }
    if (port < 0 || port > 65535) {
        throw ConfigError("Invalid port: " + value);
    }
    return static_cast<unsigned short>(port);
}

/**
 * Closes the engine connection, joining its read thread, when main()
 * unwinds. Declared after everything the read thread calls into.
 */
class ConnectionGuard {
public:
    explicit ConnectionGuard(upstream::UpstreamConnector& connector)
        : m_connector(connector)
    {}

    ~ConnectionGuard() {
        m_connector.close();
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

private:
    upstream::UpstreamConnector& m_connector;
};

/**
 * Run `ioc` on `count` threads, the calling thread excluded
 */
std::vector<std::thread> runOnThreads(net::io_context& ioc, unsigned count) {
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    return threads;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string configPath = "config.toml";
        bool configExplicit = false;
        std::optional<std::string> workflowPath;
        std::optional<unsigned short> httpPort;
        std::optional<unsigned short> wsPort;
        std::optional<std::string> logLevel;
        std::optional<std::string> logFile;
        bool noColor = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                configPath = argv[++i];
                configExplicit = true;
            } else if ((arg == "-w" || arg == "--workflow") && i + 1 < argc) {
                workflowPath = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                httpPort = parsePortArg(argv[++i]);
            } else if (arg == "--ws-port" && i + 1 < argc) {
                wsPort = parsePortArg(argv[++i]);
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                logLevel = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                logFile = argv[++i];
            } else if (arg == "--no-color") {
                noColor = true;
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        // Configuration: file first, command line on top
        config::RelayConfig config;
        if (configExplicit || std::ifstream(configPath).good()) {
            config = config::ConfigLoader::loadFile(configPath);
        }
        if (workflowPath) config.workflowPath = *workflowPath;
        if (httpPort) config.http.port = *httpPort;
        if (wsPort) config.relay.port = *wsPort;
        if (logLevel) config.logging.level = *logLevel;
        if (logFile) config.logging.file = *logFile;
        if (noColor) config.logging.color = false;

        // Configure Logger
        auto& logger = Logger::instance();
        logger.setLevel(Logger::levelFromString(config.logging.level));
        logger.setColorEnabled(config.logging.color && isatty(fileno(stdout)));
        if (!config.logging.file.empty()) {
            logger.enableFileLogging(config.logging.file);
        }

        std::cout << "=== FlowRelay ===" << std::endl;
        std::cout << std::endl;

        net::io_context httpIoc;
        net::io_context relayIoc;

        // Workflow
        workflow::WorkflowStore store;
        store.loadFile(config.workflowPath);
        workflow::NodeMapper mapper(config.mappings, store);

        relay::BroadcastHub hub;

        // Engine connection
        upstream::UpstreamConnector connector(config.upstream);
        connector.checkConnectivity();
        connector.connect();

        execution::CoordinatorOptions coordinatorOptions;
        coordinatorOptions.saveImageNodeId = config.mappings.saveImageNodeId();
        coordinatorOptions.viewBaseUrl = config.upstream.baseUrl();
        coordinatorOptions.historyAttempts = config.execution.historyAttempts;
        execution::ExecutionCoordinator coordinator(connector, coordinatorOptions);
        ConnectionGuard connectionGuard(connector);

        // Downstream WebSocket relay
        relay::RelaySessionOptions sessionOptions;
        sessionOptions.maxQueuedEvents = config.relay.maxQueuedEvents;
        sessionOptions.writeTimeout = config.relay.writeTimeout;
        relay::RelayServer relayServer(relayIoc, config.relay.address, config.relay.port, hub, sessionOptions);

        // HTTP control surface
        server::RequestHandler handler(store, mapper, coordinator, hub, connector, config);
        server::HttpServer httpServer(httpIoc, config.http.address, config.http.port, handler);

        // Every engine event goes to the clients first, then to the state machine
        connector.setEventCallback([&hub, &coordinator](const upstream::RelayEventPtr& event) {
            hub.broadcast(event);
            coordinator.onEvent(*event);
        });
        connector.setDisconnectCallback([&coordinator]() {
            coordinator.onUpstreamClosed();
        });
        connector.start();

        relayServer.run();
        httpServer.run();

        // The relay context never blocks on a job, so shutdown is always heard
        net::signal_set signals(relayIoc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int /*signal*/) {
            if (ec) return;
            LOG_INFO("Shutting down...");

            if (execution::isInFlight(coordinator.state())) {
                try {
                    connector.interrupt();
                } catch (const RelayError& e) {
                    LOG_WARN("Interrupt on shutdown failed: " + std::string(e.what()));
                }
            }

            httpServer.stop();
            relayServer.stop();
            hub.closeAll();
            connector.close();
            coordinator.onUpstreamClosed();

            relayIoc.stop();
            httpIoc.stop();
        });

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /health          - Health check" << std::endl;
        std::cout << "  GET  /status          - Execution status and progress" << std::endl;
        std::cout << "  GET  /queue           - Run the workflow and wait for the image" << std::endl;
        std::cout << "  POST /update/text     - Write text into a node" << std::endl;
        std::cout << "  POST /update/image    - Set the image of a LoadImage node" << std::endl;
        std::cout << "  POST /generate/image  - Write an image description and run" << std::endl;
        std::cout << "  POST /interrupt       - Interrupt the running job" << std::endl;
        std::cout << "  WS   ws://" << config.relay.address << ":" << relayServer.port()
                  << "         - Engine event relay" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        auto relayThreads = runOnThreads(relayIoc, std::max(1u, config.relay.threads));
        auto httpThreads = runOnThreads(httpIoc, std::max(2u, config.http.threads) - 1);

        httpIoc.run();

        for (auto& t : httpThreads) t.join();
        for (auto& t : relayThreads) t.join();
        handler.drain();

    } catch (const RelayError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
