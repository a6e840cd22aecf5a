#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus/audit_trail.hpp"
#include "bus/mailbox.hpp"
#include "bus/message.hpp"

namespace conclave::bus {

struct RegisterResult {
    bool success = false;
    std::string error;
};

struct SendResult {
    bool success = false;
    size_t delivered = 0;         // mailboxes that accepted the message
    bool resolved_query = false;  // consumed by a pending query waiter
    std::string error;
};

// Outbound-send capability handed to each agent runtime.
using Outbound = std::function<SendResult(const Message&)>;

// Receiver for messages addressed to the system identity.
using SystemInbox = std::function<void(const Message&)>;

class MessageBus {
public:
    // Without an audit sink messages are routed but not persisted.
    explicit MessageBus(std::shared_ptr<AuditSink> audit = nullptr);

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    RegisterResult register_agent(const std::string& agent_id, std::shared_ptr<Mailbox> mailbox);

    // Queued messages are not retracted.
    bool unregister_agent(const std::string& agent_id);

    // Audit, then route. Fails only when the audit write fails.
    SendResult send(const Message& message);

    // Query `target_agent` from the system identity and wait for the matching
    // Response. Returns nullopt on timeout.
    std::optional<nlohmann::json> query(const std::string& target_agent,
                                        const std::string& query_type,
                                        const nlohmann::json& payload,
                                        std::chrono::milliseconds timeout);

    Outbound outbound();

    void set_system_inbox(SystemInbox inbox);

    bool is_registered(const std::string& agent_id) const;
    std::vector<std::string> registered_agents() const;
    size_t pending_query_count() const;

private:
    // Hand a Response to its waiter; false if no waiter holds its correlation id.
    bool resolve_pending(const Message& response);

    std::shared_ptr<AuditSink> audit_;

    std::unordered_map<std::string, std::shared_ptr<Mailbox>> agents_;
    mutable std::mutex registry_mutex_;

    std::unordered_map<std::string, std::shared_ptr<std::promise<nlohmann::json>>> pending_;
    mutable std::mutex pending_mutex_;

    SystemInbox system_inbox_;
    std::mutex inbox_mutex_;
};

} // namespace conclave::bus
