#include "runtime/agent/runtime.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace conclave::runtime {

AgentRuntime::AgentRuntime(AgentConfig config,
                           std::shared_ptr<Agent> agent,
                           std::shared_ptr<bus::Mailbox> mailbox,
                           bus::Outbound outbound,
                           SteadyNow now)
    : config_(std::move(config)),
      agent_(std::move(agent)),
      mailbox_(std::move(mailbox)),
      outbound_(std::move(outbound)),
      now_(now ? std::move(now) : SteadyNow([] { return std::chrono::steady_clock::now(); })) {
    if (config_.name.empty()) {
        config_.name = config_.agent_id;
    }
    for (const auto& cap : config_.capabilities) {
        if (!has_capability(cap.name)) {
            capabilities_.push_back(cap);
        }
    }
    config_.capabilities.clear();
}

AgentRuntime::~AgentRuntime() {
    stop();
    if (processing_thread_.joinable()) {
        if (processing_thread_.get_id() == std::this_thread::get_id()) {
            processing_thread_.detach();
        } else {
            processing_thread_.join();
        }
    }
}

bool AgentRuntime::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        spdlog::error("Agent {} was shut down and cannot be restarted", id());
        return false;
    }
    if (started_) {
        spdlog::warn("Agent {} already started", id());
        return false;
    }
    started_ = true;

    try {
        agent_->initialize();
    } catch (const std::exception& e) {
        status_ = AgentStatus::ERROR;
        spdlog::error("Agent {} failed to initialize: {}", id(), e.what());
        return false;
    } catch (...) {
        status_ = AgentStatus::ERROR;
        spdlog::error("Agent {} failed to initialize: unknown error", id());
        return false;
    }

    status_ = AgentStatus::ACTIVE;
    running_ = true;
    processing_thread_ = std::thread([this]() { processing_loop(); });
    heartbeat_thread_ = std::thread([this]() { heartbeat_loop(); });

    spdlog::info("Agent {} ({}) started", config_.name, id());
    return true;
}

void AgentRuntime::stop() {
    std::thread processing;
    std::thread heartbeat;
    bool launched = false;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        launched = running_;
        {
            std::lock_guard<std::mutex> hb_lock(heartbeat_mutex_);
            running_ = false;
        }
        heartbeat_cv_.notify_all();
        mailbox_->close();

        // A handler stopping its own agent leaves the join to the destructor.
        if (processing_thread_.get_id() != std::this_thread::get_id()) {
            processing = std::move(processing_thread_);
        }
        heartbeat = std::move(heartbeat_thread_);
    }

    if (processing.joinable()) {
        processing.join();
    }
    if (heartbeat.joinable()) {
        heartbeat.join();
    }

    if (launched) {
        try {
            agent_->shutdown();
        } catch (const std::exception& e) {
            spdlog::error("Agent {} shutdown failed: {}", id(), e.what());
        } catch (...) {
            spdlog::error("Agent {} shutdown failed: unknown error", id());
        }
    }

    status_ = AgentStatus::SHUTDOWN;
    spdlog::info("Agent {} ({}) stopped", config_.name, id());
}

void AgentRuntime::add_capability(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(capabilities_mutex_);
    auto it = std::find_if(capabilities_.begin(), capabilities_.end(),
        [&name](const Capability& cap) { return cap.name == name; });
    if (it != capabilities_.end()) {
        return;
    }
    capabilities_.push_back(Capability{name, description});
    spdlog::info("Agent {} added capability: {}", id(), name);
}

bool AgentRuntime::has_capability(const std::string& name) const {
    std::lock_guard<std::mutex> lock(capabilities_mutex_);
    return std::any_of(capabilities_.begin(), capabilities_.end(),
        [&name](const Capability& cap) { return cap.name == name; });
}

AgentSnapshot AgentRuntime::snapshot() const {
    AgentSnapshot snap;
    snap.agent_id = config_.agent_id;
    snap.name = config_.name;
    snap.description = config_.description;
    snap.status = status_.load();
    snap.tasks_completed = tasks_completed_.load();
    snap.tasks_failed = tasks_failed_.load();
    snap.average_response_time = average_response_time_.load();

    int64_t hb_ms = last_heartbeat_ms_.load();
    if (hb_ms != 0) {
        snap.last_heartbeat = bus::WallClock::time_point(std::chrono::milliseconds(hb_ms));
    }

    std::lock_guard<std::mutex> lock(capabilities_mutex_);
    for (const auto& cap : capabilities_) {
        snap.capabilities.push_back(cap.name);
    }
    return snap;
}

void AgentRuntime::processing_loop() {
    spdlog::debug("Agent {} processing loop running (poll={}ms)", id(), config_.poll_interval.count());

    while (running_) {
        auto message = mailbox_->pop_for(config_.poll_interval);
        if (!message) {
            continue;
        }
        if (!running_) {
            break;
        }
        process(*message);
    }

    spdlog::debug("Agent {} processing loop exited", id());
}

void AgentRuntime::process(const bus::Message& message) {
    // Peer heartbeats are liveness announcements, not tasks.
    if (message.kind == bus::MessageKind::HEARTBEAT) {
        spdlog::trace("Agent {} saw heartbeat from {}", id(), message.sender);
        return;
    }

    auto started = now_();
    status_ = AgentStatus::BUSY;

    std::optional<bus::Message> reply;
    try {
        reply = agent_->handle(message);
    } catch (const std::exception& e) {
        report_failure(message, e.what());
        return;
    } catch (...) {
        report_failure(message, "unknown error");
        return;
    }

    if (reply) {
        forward(*reply);
    }

    double elapsed = std::chrono::duration<double>(now_() - started).count();
    uint64_t completed = tasks_completed_.load() + 1;
    average_response_time_ = update_running_mean(average_response_time_.load(), completed, elapsed);
    tasks_completed_ = completed;

    // A handler that stopped its own agent leaves it in SHUTDOWN.
    auto busy = AgentStatus::BUSY;
    status_.compare_exchange_strong(busy, AgentStatus::IDLE);
}

void AgentRuntime::report_failure(const bus::Message& message, const std::string& error) {
    tasks_failed_.fetch_add(1);
    auto busy = AgentStatus::BUSY;
    status_.compare_exchange_strong(busy, AgentStatus::ERROR);
    spdlog::error("Agent {} failed processing {} {}: {}",
        id(), bus::message_kind_to_string(message.kind), message.id, error);

    if (message.kind == bus::MessageKind::COMMAND || message.kind == bus::MessageKind::QUERY) {
        json error_payload;
        error_payload["success"] = false;
        error_payload["error"] = error;
        error_payload["agent_id"] = id();
        error_payload["request_id"] = message.id;
        forward(bus::make_response(message, id(), error_payload));
    }
}

void AgentRuntime::heartbeat_loop() {
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    while (running_) {
        lock.unlock();
        emit_heartbeat();
        lock.lock();
        heartbeat_cv_.wait_for(lock, config_.heartbeat_interval, [this]() { return !running_; });
    }
}

void AgentRuntime::emit_heartbeat() {
    auto snap = snapshot();

    json payload;
    payload["status"] = agent_status_to_string(snap.status);
    payload["tasks_completed"] = snap.tasks_completed;
    payload["tasks_failed"] = snap.tasks_failed;
    payload["average_response_time"] = snap.average_response_time;
    payload["capabilities"] = snap.capabilities;

    auto heartbeat = bus::Message::make(id(), bus::BROADCAST_ID, bus::MessageKind::HEARTBEAT, payload);
    last_heartbeat_ms_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        heartbeat.timestamp.time_since_epoch()).count();
    forward(heartbeat);
}

void AgentRuntime::forward(const bus::Message& message) {
    auto result = outbound_(message);
    if (!result.success) {
        spdlog::warn("Agent {} could not send {} {}: {}",
            id(), bus::message_kind_to_string(message.kind), message.id, result.error);
    }
}

} // namespace conclave::runtime
