#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>
#include "agents/echo_agent.hpp"
#include "bus/audit_trail.hpp"
#include "bus/message_bus.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/coordinator.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_signal(int) {
    g_interrupted = 1;
}

void print_usage(const char* argv0) {
    std::printf("Usage: %s [--agents N] [--run-seconds S] [--audit PATH] [--log-level LEVEL]\n", argv0);
}

struct Options {
    int agents = 3;
    double run_seconds = 5.0;
};

} // namespace

int main(int argc, char** argv) {
    using namespace conclave;

    core::init_logger();
    core::config::load_dotenv();
    auto config = runtime::CoordinatorConfig::from_env();

    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        try {
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--agents" && has_value) {
                options.agents = std::stoi(argv[++i]);
            } else if (arg == "--run-seconds" && has_value) {
                options.run_seconds = std::stod(argv[++i]);
            } else if (arg == "--audit" && has_value) {
                config.audit_path = argv[++i];
            } else if (arg == "--log-level" && has_value) {
                config.log_level = argv[++i];
            } else {
                spdlog::error("Unknown or incomplete argument: {}", arg);
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            spdlog::error("Invalid value for {}: {}", arg, e.what());
            return 1;
        }
    }
    if (options.agents < 1) {
        spdlog::error("--agents must be at least 1");
        return 1;
    }

    core::set_log_level(core::parse_log_level(config.log_level));

    spdlog::info("=================================");
    spdlog::info("  Conclave coordination core");
    spdlog::info("=================================");

    std::shared_ptr<bus::AuditSink> audit;
    if (!config.audit_path.empty()) {
        try {
            audit = std::make_shared<bus::FileAuditSink>(config.audit_path);
        } catch (const bus::AuditError& e) {
            spdlog::error("Failed to open audit trail: {}", e.what());
            return 1;
        }
    }

    bus::MessageBus message_bus(audit);
    runtime::Coordinator coordinator(message_bus);

    for (int i = 0; i < options.agents; ++i) {
        std::string agent_id = "echo_" + std::to_string(i + 1);
        auto agent_config = config.agent_config(agent_id, "Echo " + std::to_string(i + 1));
        agent_config.description = "Echoes commands and queries";
        agent_config.capabilities.push_back({"echo", "Return the request parameters"});
        if (i % 2 == 1) {
            agent_config.capabilities.push_back({"sleep", "Simulated long-running work"});
        }

        if (!coordinator.register_and_track(agent_config, std::make_shared<agents::EchoAgent>(agent_id))) {
            spdlog::error("Failed to register {}", agent_id);
            return 1;
        }
    }

    auto started = coordinator.start_all();
    if (started.succeeded.empty()) {
        spdlog::error("No agent could be started");
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto online = coordinator.broadcast(bus::MessageKind::ALERT, {{"event", "system_online"}});
    if (!online.success) {
        spdlog::warn("Startup broadcast failed: {}", online.error);
    }
    for (int i = 0; i < options.agents * 2; ++i) {
        if (!coordinator.distribute_task("echo", {{"task", i}}, std::string("echo"))) {
            spdlog::warn("No agent accepted echo task {}", i);
        }
    }
    if (!coordinator.distribute_task("sleep", {{"ms", 50}}, std::string("sleep"))) {
        spdlog::warn("No agent accepted the sleep task");
    }

    auto answer = coordinator.query(started.succeeded.front(), "ping", nlohmann::json::object(),
                                    config.query_timeout);
    if (answer) {
        spdlog::info("Query answer: {}", answer->dump());
    } else {
        spdlog::warn("Query to {} got no answer", started.succeeded.front());
    }

    auto deadline = std::chrono::steady_clock::now() +
        std::chrono::milliseconds(static_cast<long long>(options.run_seconds * 1000.0));
    while (!g_interrupted && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Status: {}", coordinator.status_json().dump());
    auto stopped = coordinator.stop_all();
    for (const auto& [agent_id, error] : stopped.failures) {
        spdlog::warn("Agent {} did not stop cleanly: {}", agent_id, error);
    }
    spdlog::info("Shutdown complete");
    return 0;
}
