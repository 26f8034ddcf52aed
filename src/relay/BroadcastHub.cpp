#include "relay/BroadcastHub.hpp"
#include "server/Logger.hpp"
#include <vector>

namespace flowrelay {
namespace relay {

void BroadcastHub::registerClient(std::shared_ptr<RelayClient> client) {
    uint64_t id = client->id();
    std::string address = client->remoteAddress();
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_clients[id] = std::move(client);
        count = m_clients.size();
    }
    LOG_INFO("New WebSocket client connected from " + address + ". Active clients: " + std::to_string(count));
}

void BroadcastHub::unregisterClient(uint64_t clientId) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_clients.erase(clientId) == 0) {
            return;
        }
        count = m_clients.size();
    }
    LOG_INFO("Client removed. Active clients: " + std::to_string(count));
}

size_t BroadcastHub::broadcast(const upstream::RelayEventPtr& event) {
    std::vector<std::shared_ptr<RelayClient>> clients;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_clients.empty()) {
            return 0;
        }
        clients.reserve(m_clients.size());
        for (const auto& [id, client] : m_clients) {
            clients.push_back(client);
        }
    }

    size_t delivered = 0;
    for (const auto& client : clients) {
        if (client->deliver(event)) {
            ++delivered;
            continue;
        }
        LOG_WARN("Dropping client " + client->remoteAddress() + " (cannot keep up or disconnected)");
        unregisterClient(client->id());
        client->close();
    }

    if (delivered > 0) {
        if (event->isBinary()) {
            LOG_DEBUG("Sent binary data (" + std::to_string(event->raw().size()) + " bytes) to " +
                      std::to_string(delivered) + " client(s)");
        } else {
            LOG_DEBUG("Broadcast '" + event->type() + "' event to " + std::to_string(delivered) + " clients");
        }
    }
    return delivered;
}

size_t BroadcastHub::clientCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.size();
}

void BroadcastHub::closeAll() {
    std::unordered_map<uint64_t, std::shared_ptr<RelayClient>> clients;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        clients.swap(m_clients);
    }
    for (const auto& [id, client] : clients) {
        client->close();
    }
}

} // namespace relay
} // namespace flowrelay
