#include "runtime/coordinator.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace conclave::runtime {

Coordinator::Coordinator(bus::MessageBus& bus) : bus_(bus) {
    bus_.set_system_inbox([this](const bus::Message& message) { on_system_message(message); });
    spdlog::debug("Coordinator initialized");
}

Coordinator::~Coordinator() {
    stop_all();
    bus_.set_system_inbox(nullptr);
}

std::shared_ptr<AgentRuntime> Coordinator::register_and_track(const AgentConfig& config,
                                                              std::shared_ptr<Agent> agent) {
    if (!agent) {
        spdlog::error("Agent {} has no implementation", config.agent_id);
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(agents_mutex_);
    for (const auto& existing : agents_) {
        if (existing->id() == config.agent_id) {
            spdlog::error("Agent {} already tracked", config.agent_id);
            return nullptr;
        }
    }

    auto mailbox = std::make_shared<bus::Mailbox>(config.mailbox_capacity);
    auto result = bus_.register_agent(config.agent_id, mailbox);
    if (!result.success) {
        spdlog::error("Cannot track agent {}: {}", config.agent_id, result.error);
        return nullptr;
    }

    auto runtime = std::make_shared<AgentRuntime>(config, std::move(agent), mailbox, bus_.outbound());
    agents_.push_back(runtime);
    return runtime;
}

SweepReport Coordinator::start_all() {
    SweepReport report;
    for (const auto& agent : list_agents()) {
        if (agent->status() != AgentStatus::INITIALIZING) {
            continue;
        }
        if (agent->start()) {
            report.succeeded.push_back(agent->id());
        } else {
            // A runtime without loops would only collect mail.
            report.failures[agent->id()] = "start failed";
            bus_.unregister_agent(agent->id());
        }
    }

    if (report.ok()) {
        spdlog::info("All agents started ({})", report.succeeded.size());
    } else {
        spdlog::warn("Started {} agents, {} failed", report.succeeded.size(), report.failures.size());
    }
    return report;
}

SweepReport Coordinator::stop_all() {
    SweepReport report;
    auto agents = list_agents();
    if (agents.empty()) {
        return report;
    }

    spdlog::info("Stopping all agents...");
    for (const auto& agent : agents) {
        if (agent->status() == AgentStatus::SHUTDOWN) {
            continue;
        }
        agent->stop();
        if (agent->status() == AgentStatus::SHUTDOWN) {
            report.succeeded.push_back(agent->id());
        } else {
            report.failures[agent->id()] = "did not reach shutdown";
        }
    }
    spdlog::info("All agents stopped");
    return report;
}

bool Coordinator::stop_agent(const std::string& agent_id) {
    auto agent = get_agent(agent_id);
    if (!agent) {
        spdlog::error("Agent {} not found", agent_id);
        return false;
    }
    agent->stop();
    bus_.unregister_agent(agent_id);
    return true;
}

std::shared_ptr<AgentRuntime> Coordinator::get_agent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    for (const auto& agent : agents_) {
        if (agent->id() == agent_id) {
            return agent;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<AgentRuntime>> Coordinator::list_agents() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    return agents_;
}

bus::SendResult Coordinator::broadcast(bus::MessageKind kind, const json& payload, int priority) {
    auto message = bus::Message::make(bus::SYSTEM_ID, bus::BROADCAST_ID, kind, payload, priority);
    return bus_.send(message);
}

bool Coordinator::send_command(const std::string& target_agent, const std::string& command,
                               const json& parameters) {
    if (!bus_.is_registered(target_agent)) {
        spdlog::warn("Command {} not sent: agent {} is not registered", command, target_agent);
        return false;
    }

    json payload;
    payload["command"] = command;
    payload["parameters"] = parameters.is_null() ? json::object() : parameters;

    auto message = bus::Message::make(bus::SYSTEM_ID, target_agent, bus::MessageKind::COMMAND, payload);
    auto result = bus_.send(message);
    if (!result.success) {
        spdlog::error("Command {} to {} failed: {}", command, target_agent, result.error);
        return false;
    }
    return true;
}

std::optional<json> Coordinator::query(const std::string& target_agent,
                                       const std::string& query_type,
                                       const json& payload,
                                       std::chrono::milliseconds timeout) {
    return bus_.query(target_agent, query_type, payload, timeout);
}

std::vector<std::string> Coordinator::agents_with_capability(const std::string& capability) const {
    std::vector<std::string> result;
    for (const auto& agent : list_agents()) {
        if (agent->has_capability(capability)) {
            result.push_back(agent->id());
        }
    }
    return result;
}

std::optional<std::string> Coordinator::distribute_task(const std::string& task_kind,
                                                        const json& task_data,
                                                        const std::optional<std::string>& required_capability) {
    std::shared_ptr<AgentRuntime> best;
    for (const auto& agent : list_agents()) {
        if (agent->status() == AgentStatus::SHUTDOWN || !bus_.is_registered(agent->id())) {
            continue;
        }
        if (required_capability && !agent->has_capability(*required_capability)) {
            continue;
        }
        if (!best || agent->tasks_completed() < best->tasks_completed()) {
            best = agent;
        }
    }

    if (!best) {
        spdlog::warn("No agents available for task type: {}", task_kind);
        return std::nullopt;
    }

    if (!send_command(best->id(), task_kind, task_data)) {
        return std::nullopt;
    }
    spdlog::debug("Task {} assigned to {} ({} completed)", task_kind, best->id(), best->tasks_completed());
    return best->id();
}

std::vector<AgentSnapshot> Coordinator::status_snapshot() const {
    std::vector<AgentSnapshot> snapshots;
    for (const auto& agent : list_agents()) {
        snapshots.push_back(agent->snapshot());
    }
    return snapshots;
}

json Coordinator::status_json() const {
    json status = json::object();
    for (const auto& snap : status_snapshot()) {
        status[snap.agent_id] = snap.to_json();
    }
    return status;
}

void Coordinator::on_system_message(const bus::Message& message) {
    if (message.kind == bus::MessageKind::RESPONSE &&
        message.payload.is_object() && message.payload.value("success", true) == false) {
        system_errors_.fetch_add(1);
        spdlog::warn("Agent {} reported failure: {}", message.sender,
            message.payload.value("error", std::string("unknown error")));
        return;
    }
    spdlog::debug("System received {} {} from {}",
        bus::message_kind_to_string(message.kind), message.id, message.sender);
}

} // namespace conclave::runtime
