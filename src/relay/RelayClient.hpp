#pragma once

#include "upstream/RelayEvent.hpp"
#include <cstdint>
#include <string>

namespace flowrelay {
namespace relay {

/**
 * A downstream consumer of relayed events
 *
 * deliver() must never block: it hands the event to the client's own
 * outbound queue and returns. Returning false means the client can no
 * longer keep up (queue full, socket closed) and should be dropped.
 */
class RelayClient {
public:
    virtual ~RelayClient() = default;

    virtual uint64_t id() const = 0;
    virtual std::string remoteAddress() const = 0;

    virtual bool deliver(const upstream::RelayEventPtr& event) = 0;

    /// Close the connection; safe to call more than once
    virtual void close() = 0;
};

} // namespace relay
} // namespace flowrelay
