#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus/message.hpp"

namespace conclave::runtime {

// Agent status. ERROR is left when the next message completes successfully.
enum class AgentStatus {
    INITIALIZING,
    ACTIVE,
    IDLE,
    BUSY,
    ERROR,
    SHUTDOWN
};

const char* agent_status_to_string(AgentStatus status);

struct Capability {
    std::string name;
    std::string description;
};

// Per-agent runtime settings
struct AgentConfig {
    std::string agent_id;
    std::string name;
    std::string description;
    std::vector<Capability> capabilities;

    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds heartbeat_interval{30000};
    size_t mailbox_capacity = 10000;  // 0 = unbounded
};

// Point-in-time copy of an agent's descriptor
struct AgentSnapshot {
    std::string agent_id;
    std::string name;
    std::string description;
    AgentStatus status = AgentStatus::INITIALIZING;
    std::vector<std::string> capabilities;
    uint64_t tasks_completed = 0;
    uint64_t tasks_failed = 0;
    double average_response_time = 0.0;  // seconds
    bus::WallClock::time_point last_heartbeat;

    nlohmann::json to_json() const;
};

// avg' = (avg*(n-1) + elapsed)/n, n = completed count after the increment
double update_running_mean(double average, uint64_t completed, double elapsed_seconds);

} // namespace conclave::runtime
