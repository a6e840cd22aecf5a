#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "bus/mailbox.hpp"
#include "bus/message_bus.hpp"
#include "runtime/agent/agent.hpp"
#include "runtime/agent/types.hpp"

namespace conclave::runtime {

// Execution wrapper around one Agent: a processing thread draining the
// mailbox and a heartbeat thread. Counters are written only by the
// processing thread.
class AgentRuntime {
public:
    using SteadyNow = std::function<std::chrono::steady_clock::time_point()>;

    AgentRuntime(AgentConfig config,
                 std::shared_ptr<Agent> agent,
                 std::shared_ptr<bus::Mailbox> mailbox,
                 bus::Outbound outbound,
                 SteadyNow now = nullptr);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    // Run initialize() and launch both loops. False if already started,
    // already stopped, or initialize() failed.
    bool start();

    // Idempotent. Waits for the loops to exit, then runs shutdown().
    void stop();

    void add_capability(const std::string& name, const std::string& description = "");
    bool has_capability(const std::string& name) const;

    const std::string& id() const { return config_.agent_id; }
    const std::string& name() const { return config_.name; }
    AgentStatus status() const { return status_.load(); }
    uint64_t tasks_completed() const { return tasks_completed_.load(); }
    uint64_t tasks_failed() const { return tasks_failed_.load(); }
    const std::shared_ptr<bus::Mailbox>& mailbox() const { return mailbox_; }

    AgentSnapshot snapshot() const;

private:
    void processing_loop();
    void heartbeat_loop();
    void process(const bus::Message& message);
    void report_failure(const bus::Message& message, const std::string& error);
    void emit_heartbeat();
    void forward(const bus::Message& message);

    AgentConfig config_;
    std::shared_ptr<Agent> agent_;
    std::shared_ptr<bus::Mailbox> mailbox_;
    bus::Outbound outbound_;
    SteadyNow now_;

    std::atomic<AgentStatus> status_{AgentStatus::INITIALIZING};
    std::atomic<uint64_t> tasks_completed_{0};
    std::atomic<uint64_t> tasks_failed_{0};
    std::atomic<double> average_response_time_{0.0};
    std::atomic<int64_t> last_heartbeat_ms_{0};

    std::vector<Capability> capabilities_;
    mutable std::mutex capabilities_mutex_;

    std::atomic<bool> running_{false};
    bool started_ = false;
    bool stopped_ = false;
    std::mutex lifecycle_mutex_;

    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;

    std::thread processing_thread_;
    std::thread heartbeat_thread_;
};

} // namespace conclave::runtime
