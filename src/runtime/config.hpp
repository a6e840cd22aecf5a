#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include "runtime/agent/types.hpp"

namespace conclave::runtime {

// Process-wide settings for the coordinator and the agents it builds
struct CoordinatorConfig {
    std::string audit_path = "conclave_audit.jsonl";  // empty = no audit trail
    std::string log_level = "info";
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds query_timeout{30000};
    size_t mailbox_capacity = 10000;

    // Overlay CONCLAVE_* environment variables on the defaults.
    static CoordinatorConfig from_env();

    // Agent settings carrying these intervals and limits.
    AgentConfig agent_config(const std::string& agent_id, const std::string& name = "") const;
};

} // namespace conclave::runtime
