#pragma once
#include <optional>
#include "bus/message.hpp"

namespace conclave::runtime {

// Domain behavior driven by an AgentRuntime. Hooks may throw; the runtime
// catches and reports every fault.
class Agent {
public:
    virtual ~Agent() = default;

    // Called once before the loops start.
    virtual void initialize() = 0;

    // At most one reply per inbound message. Must not block indefinitely.
    virtual std::optional<bus::Message> handle(const bus::Message& message) = 0;

    // Called once after the loops have been signaled to stop.
    virtual void shutdown() = 0;
};

} // namespace conclave::runtime
