#pragma once

#include "relay/RelayClient.hpp"
#include "upstream/RelayEvent.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace flowrelay {
namespace relay {

/**
 * Registry of downstream clients and fan-out of relayed events
 *
 * broadcast() copies the membership under the lock and delivers outside
 * it, so joins and leaves never disturb an in-progress fan-out and a slow
 * client never holds the lock. A client that refuses an event is removed
 * and closed; the others still receive it.
 */
class BroadcastHub {
public:
    BroadcastHub() = default;

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    void registerClient(std::shared_ptr<RelayClient> client);
    void unregisterClient(uint64_t clientId);

    /**
     * Deliver to every registered client. Returns the number of clients
     * that accepted the event.
     */
    size_t broadcast(const upstream::RelayEventPtr& event);

    size_t clientCount() const;

    /**
     * Close and forget every client (shutdown)
     */
    void closeAll();

    /// Next connection identity for a new client
    uint64_t nextClientId() { return ++m_nextClientId; }

private:
    mutable std::mutex m_mutex;
    std::unordered_map<uint64_t, std::shared_ptr<RelayClient>> m_clients;
    std::atomic<uint64_t> m_nextClientId{0};
};

} // namespace relay
} // namespace flowrelay
