#include "bus/message_bus.hpp"
#include "core/ids.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace conclave::bus {

MessageBus::MessageBus(std::shared_ptr<AuditSink> audit)
    : audit_(std::move(audit)) {
    spdlog::debug("MessageBus initialized (audit={})", audit_ ? "on" : "off");
}

RegisterResult MessageBus::register_agent(const std::string& agent_id, std::shared_ptr<Mailbox> mailbox) {
    RegisterResult result;
    if (agent_id.empty()) {
        result.error = "agent id required";
        return result;
    }
    if (agent_id == SYSTEM_ID || agent_id == BROADCAST_ID) {
        result.error = "reserved agent id: " + agent_id;
        spdlog::error("Cannot register reserved id '{}'", agent_id);
        return result;
    }
    if (!mailbox) {
        result.error = "mailbox required";
        return result;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (agents_.count(agent_id) > 0) {
        result.error = "DuplicateAgent: " + agent_id;
        spdlog::error("Agent {} already registered", agent_id);
        return result;
    }

    agents_[agent_id] = std::move(mailbox);
    spdlog::info("Registered agent: {}", agent_id);
    result.success = true;
    return result;
}

bool MessageBus::unregister_agent(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (agents_.erase(agent_id) == 0) {
        return false;
    }
    spdlog::info("Unregistered agent: {}", agent_id);
    return true;
}

SendResult MessageBus::send(const Message& message) {
    SendResult result;

    if (audit_) {
        try {
            audit_->append(AuditRecord{message});
        } catch (const std::exception& e) {
            spdlog::error("Audit write failed for message {}: {}", message.id, e.what());
            result.error = std::string("audit: ") + e.what();
            return result;
        }
    }
    result.success = true;

    if (message.kind == MessageKind::RESPONSE && message.correlation_id &&
        resolve_pending(message)) {
        result.resolved_query = true;
        return result;
    }

    if (message.is_broadcast()) {
        std::vector<std::pair<std::string, std::shared_ptr<Mailbox>>> targets;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            targets.reserve(agents_.size());
            for (const auto& [agent_id, mailbox] : agents_) {
                if (agent_id != message.sender) {
                    targets.emplace_back(agent_id, mailbox);
                }
            }
        }
        for (auto& [agent_id, mailbox] : targets) {
            if (mailbox->push(message)) {
                result.delivered++;
            } else {
                spdlog::warn("Mailbox of {} rejected broadcast {} (full or closed)", agent_id, message.id);
            }
        }
        spdlog::trace("Broadcast {} from {} delivered to {} agents",
            message.id, message.sender, result.delivered);
        return result;
    }

    if (message.recipient == SYSTEM_ID) {
        SystemInbox inbox;
        {
            std::lock_guard<std::mutex> lock(inbox_mutex_);
            inbox = system_inbox_;
        }
        if (inbox) {
            inbox(message);
        } else {
            spdlog::debug("No system inbox for {} {} from {}",
                message_kind_to_string(message.kind), message.id, message.sender);
        }
        return result;
    }

    std::shared_ptr<Mailbox> target;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = agents_.find(message.recipient);
        if (it != agents_.end()) {
            target = it->second;
        }
    }

    if (!target) {
        spdlog::warn("UnknownRecipient: {} (message {} from {})",
            message.recipient, message.id, message.sender);
        return result;
    }

    if (target->push(message)) {
        result.delivered = 1;
    } else {
        spdlog::warn("Mailbox of {} rejected message {} (full or closed)", message.recipient, message.id);
    }
    return result;
}

std::optional<json> MessageBus::query(const std::string& target_agent,
                                      const std::string& query_type,
                                      const json& payload,
                                      std::chrono::milliseconds timeout) {
    json body = payload.is_object() ? payload : json::object();
    body["query_type"] = query_type;

    Message query_message = Message::make(SYSTEM_ID, target_agent, MessageKind::QUERY, body);
    std::string correlation_id = core::make_id("query");
    query_message.correlation_id = correlation_id;

    auto waiter = std::make_shared<std::promise<json>>();
    auto answer = waiter->get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[correlation_id] = waiter;
    }

    auto sent = send(query_message);
    if (!sent.success) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(correlation_id);
        return std::nullopt;
    }

    if (answer.wait_for(timeout) == std::future_status::ready) {
        return answer.get();
    }

    bool answered = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        // A missing entry means a resolver took it and already set the value.
        answered = pending_.erase(correlation_id) == 0;
    }
    if (answered) {
        return answer.get();
    }

    spdlog::warn("Query to {} timed out ({} ms)", target_agent, timeout.count());
    return std::nullopt;
}

bool MessageBus::resolve_pending(const Message& response) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(*response.correlation_id);
        if (it == pending_.end()) {
            return false;
        }
        it->second->set_value(response.payload);
        pending_.erase(it);
    }
    spdlog::debug("Query {} answered by {}", *response.correlation_id, response.sender);
    return true;
}

Outbound MessageBus::outbound() {
    return [this](const Message& message) { return send(message); };
}

void MessageBus::set_system_inbox(SystemInbox inbox) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    system_inbox_ = std::move(inbox);
}

bool MessageBus::is_registered(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return agents_.count(agent_id) > 0;
}

std::vector<std::string> MessageBus::registered_agents() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::string> ids;
    ids.reserve(agents_.size());
    for (const auto& [agent_id, _] : agents_) {
        ids.push_back(agent_id);
    }
    return ids;
}

size_t MessageBus::pending_query_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

} // namespace conclave::bus
