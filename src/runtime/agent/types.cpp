#include "runtime/agent/types.hpp"

namespace conclave::runtime {

const char* agent_status_to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::INITIALIZING: return "initializing";
        case AgentStatus::ACTIVE:       return "active";
        case AgentStatus::IDLE:         return "idle";
        case AgentStatus::BUSY:         return "busy";
        case AgentStatus::ERROR:        return "error";
        case AgentStatus::SHUTDOWN:     return "shutdown";
        default: return "unknown";
    }
}

nlohmann::json AgentSnapshot::to_json() const {
    nlohmann::json j;
    j["agent_id"] = agent_id;
    j["name"] = name;
    j["description"] = description;
    j["status"] = agent_status_to_string(status);
    j["capabilities"] = capabilities;
    j["tasks_completed"] = tasks_completed;
    j["tasks_failed"] = tasks_failed;
    j["average_response_time"] = average_response_time;
    j["last_heartbeat"] = last_heartbeat == bus::WallClock::time_point{}
        ? nlohmann::json(nullptr)
        : nlohmann::json(bus::format_timestamp(last_heartbeat));
    return j;
}

double update_running_mean(double average, uint64_t completed, double elapsed_seconds) {
    if (completed == 0) {
        return average;
    }
    double n = static_cast<double>(completed);
    return (average * (n - 1.0) + elapsed_seconds) / n;
}

} // namespace conclave::runtime
