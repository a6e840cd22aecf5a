#include "runtime/config.hpp"
#include "core/config.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace conclave::runtime {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

CoordinatorConfig CoordinatorConfig::from_env() {
    namespace cfg = core::config;
    CoordinatorConfig config;

    if (const char* raw = std::getenv("CONCLAVE_AUDIT_PATH")) {
        config.audit_path = raw;
    }
    config.log_level = cfg::get_env_or("CONCLAVE_LOG_LEVEL", config.log_level);

    if (auto secs = cfg::get_env_double("CONCLAVE_HEARTBEAT_SEC")) {
        if (*secs > 0) {
            config.heartbeat_interval = seconds_to_ms(*secs);
        } else {
            spdlog::warn("CONCLAVE_HEARTBEAT_SEC must be positive, keeping {}ms",
                config.heartbeat_interval.count());
        }
    }
    if (auto ms = cfg::get_env_int("CONCLAVE_POLL_MS")) {
        if (*ms > 0) {
            config.poll_interval = std::chrono::milliseconds(*ms);
        } else {
            spdlog::warn("CONCLAVE_POLL_MS must be positive, keeping {}ms", config.poll_interval.count());
        }
    }
    if (auto secs = cfg::get_env_double("CONCLAVE_QUERY_TIMEOUT_SEC")) {
        if (*secs >= 0) {
            config.query_timeout = seconds_to_ms(*secs);
        }
    }
    if (auto cap = cfg::get_env_int("CONCLAVE_MAILBOX_CAPACITY")) {
        if (*cap >= 0) {
            config.mailbox_capacity = static_cast<size_t>(*cap);
        }
    }
    return config;
}

AgentConfig CoordinatorConfig::agent_config(const std::string& agent_id, const std::string& name) const {
    AgentConfig config;
    config.agent_id = agent_id;
    config.name = name.empty() ? agent_id : name;
    config.poll_interval = poll_interval;
    config.heartbeat_interval = heartbeat_interval;
    config.mailbox_capacity = mailbox_capacity;
    return config;
}

} // namespace conclave::runtime
