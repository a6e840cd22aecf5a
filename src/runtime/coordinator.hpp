#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus/message_bus.hpp"
#include "runtime/agent/runtime.hpp"

namespace conclave::runtime {

// Outcome of a start/stop pass over all agents
struct SweepReport {
    std::vector<std::string> succeeded;
    std::map<std::string, std::string> failures;  // agent id -> reason

    bool ok() const { return failures.empty(); }
};

// Coordinator - owns the agent runtimes, issues system commands and
// assigns tasks to the least-loaded capable agent.
class Coordinator {
public:
    explicit Coordinator(bus::MessageBus& bus);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // Register with the bus and track. nullptr on duplicate or reserved id.
    std::shared_ptr<AgentRuntime> register_and_track(const AgentConfig& config,
                                                     std::shared_ptr<Agent> agent);

    // Agents that fail to start are unregistered from the bus.
    SweepReport start_all();
    SweepReport stop_all();

    // Stop and unregister one agent. Its id stays reserved.
    bool stop_agent(const std::string& agent_id);

    std::shared_ptr<AgentRuntime> get_agent(const std::string& agent_id) const;
    std::vector<std::shared_ptr<AgentRuntime>> list_agents() const;

    bus::SendResult broadcast(bus::MessageKind kind, const nlohmann::json& payload,
                              int priority = bus::DEFAULT_PRIORITY);

    // False when the target is not registered; nothing is sent then.
    bool send_command(const std::string& target_agent, const std::string& command,
                      const nlohmann::json& parameters = nlohmann::json::object());

    std::optional<nlohmann::json> query(const std::string& target_agent,
                                        const std::string& query_type,
                                        const nlohmann::json& payload,
                                        std::chrono::milliseconds timeout);

    std::vector<std::string> agents_with_capability(const std::string& capability) const;

    // Send the task as a Command to the registered, not shut down candidate
    // with the fewest completed tasks (first in registration order on ties).
    std::optional<std::string> distribute_task(const std::string& task_kind,
                                               const nlohmann::json& task_data,
                                               const std::optional<std::string>& required_capability = std::nullopt);

    std::vector<AgentSnapshot> status_snapshot() const;
    nlohmann::json status_json() const;

    // Error responses received on the system inbox
    uint64_t system_errors() const { return system_errors_.load(); }

private:
    void on_system_message(const bus::Message& message);

    bus::MessageBus& bus_;

    // Registration order is the tie-break order for task distribution.
    std::vector<std::shared_ptr<AgentRuntime>> agents_;
    mutable std::mutex agents_mutex_;

    std::atomic<uint64_t> system_errors_{0};
};

} // namespace conclave::runtime
