#include <catch2/catch.hpp>
#include "agents/echo_agent.hpp"
#include "bus/message_bus.hpp"
#include "runtime/coordinator.hpp"
#include "test_helpers.hpp"

using namespace conclave;
using namespace conclave::runtime;
using namespace std::chrono_literals;
using conclave::testing::ScriptedAgent;
using conclave::testing::wait_until;
using json = nlohmann::json;

namespace {

AgentConfig agent_config(const std::string& agent_id, std::vector<std::string> capabilities = {}) {
    AgentConfig config;
    config.agent_id = agent_id;
    config.poll_interval = 10ms;
    config.heartbeat_interval = 1h;
    for (auto& cap : capabilities) {
        config.capabilities.push_back({cap, ""});
    }
    return config;
}

} // namespace

TEST_CASE("register_and_track rejects duplicate and reserved ids", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);

    REQUIRE(coordinator.register_and_track(agent_config("a"), std::make_shared<ScriptedAgent>()));
    REQUIRE_FALSE(coordinator.register_and_track(agent_config("a"), std::make_shared<ScriptedAgent>()));
    REQUIRE_FALSE(coordinator.register_and_track(agent_config(bus::SYSTEM_ID), std::make_shared<ScriptedAgent>()));
    REQUIRE_FALSE(coordinator.register_and_track(agent_config("b"), nullptr));

    REQUIRE(message_bus.is_registered("a"));
    REQUIRE_FALSE(message_bus.is_registered("b"));
    REQUIRE(coordinator.list_agents().size() == 1);
}

TEST_CASE("agents_with_capability filters by advertised capability", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    coordinator.register_and_track(agent_config("A", {"echo"}), std::make_shared<ScriptedAgent>());
    coordinator.register_and_track(agent_config("B", {"echo", "translate"}), std::make_shared<ScriptedAgent>());

    REQUIRE(coordinator.agents_with_capability("translate") == std::vector<std::string>{"B"});
    REQUIRE(coordinator.agents_with_capability("echo") == std::vector<std::string>{"A", "B"});
    REQUIRE(coordinator.agents_with_capability("fly").empty());

    coordinator.get_agent("A")->add_capability("translate");
    REQUIRE(coordinator.agents_with_capability("translate") == std::vector<std::string>{"A", "B"});
}

TEST_CASE("distribute_task picks the agent with the fewest completed tasks", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto a = coordinator.register_and_track(agent_config("a", {"work"}), std::make_shared<ScriptedAgent>());
    auto b = coordinator.register_and_track(agent_config("b", {"work"}), std::make_shared<ScriptedAgent>());
    auto c = coordinator.register_and_track(agent_config("c", {"work"}), std::make_shared<ScriptedAgent>());
    REQUIRE(coordinator.start_all().ok());

    for (int i = 0; i < 3; ++i) coordinator.send_command("a", "warmup");
    for (int i = 0; i < 1; ++i) coordinator.send_command("b", "warmup");
    for (int i = 0; i < 5; ++i) coordinator.send_command("c", "warmup");
    REQUIRE(wait_until([&]() {
        return a->tasks_completed() == 3 && b->tasks_completed() == 1 && c->tasks_completed() == 5;
    }));

    auto chosen = coordinator.distribute_task("work", {{"item", 1}}, std::string("work"));
    REQUIRE(chosen == std::optional<std::string>("b"));
    REQUIRE(wait_until([&]() { return b->tasks_completed() == 2; }));
}

TEST_CASE("distribute_task breaks ties by registration order", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    coordinator.register_and_track(agent_config("first"), std::make_shared<ScriptedAgent>());
    coordinator.register_and_track(agent_config("second"), std::make_shared<ScriptedAgent>());

    auto chosen = coordinator.distribute_task("work", json::object());
    REQUIRE(chosen == std::optional<std::string>("first"));
}

TEST_CASE("distribute_task reports no agent when none is capable", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    REQUIRE_FALSE(coordinator.distribute_task("work", json::object()).has_value());

    coordinator.register_and_track(agent_config("a", {"echo"}), std::make_shared<ScriptedAgent>());
    REQUIRE_FALSE(coordinator.distribute_task("work", json::object(), std::string("translate")).has_value());
}

TEST_CASE("send_command confirms delivery only to registered agents", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto agent = std::make_shared<ScriptedAgent>();
    coordinator.register_and_track(agent_config("a"), agent);
    REQUIRE(coordinator.start_all().ok());

    REQUIRE_FALSE(coordinator.send_command("nobody", "run"));
    REQUIRE(coordinator.send_command("a", "run", {{"speed", 2}}));
    REQUIRE(wait_until([&]() { return agent->seen_count() == 1; }));

    auto msg = agent->seen().front();
    REQUIRE(msg.kind == bus::MessageKind::COMMAND);
    REQUIRE(msg.sender == bus::SYSTEM_ID);
    REQUIRE(msg.payload["command"] == "run");
    REQUIRE(msg.payload["parameters"]["speed"] == 2);
}

TEST_CASE("broadcast from the system reaches every agent", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto a = std::make_shared<ScriptedAgent>();
    auto b = std::make_shared<ScriptedAgent>();
    coordinator.register_and_track(agent_config("a"), a);
    coordinator.register_and_track(agent_config("b"), b);
    REQUIRE(coordinator.start_all().ok());

    auto result = coordinator.broadcast(bus::MessageKind::ALERT, {{"level", "high"}}, 9);
    REQUIRE(result.success);
    REQUIRE(result.delivered == 2);
    REQUIRE(wait_until([&]() { return a->seen_count() == 1 && b->seen_count() == 1; }));
    REQUIRE(a->seen().front().kind == bus::MessageKind::ALERT);
    REQUIRE(a->seen().front().priority == 9);
}

TEST_CASE("start_all is best effort", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto broken = std::make_shared<ScriptedAgent>();
    broken->fail_initialize = true;
    coordinator.register_and_track(agent_config("ok1"), std::make_shared<ScriptedAgent>());
    coordinator.register_and_track(agent_config("broken"), broken);
    coordinator.register_and_track(agent_config("ok2"), std::make_shared<ScriptedAgent>());

    auto report = coordinator.start_all();
    REQUIRE_FALSE(report.ok());
    REQUIRE(report.succeeded == std::vector<std::string>{"ok1", "ok2"});
    REQUIRE(report.failures.count("broken") == 1);
    REQUIRE(coordinator.get_agent("broken")->status() == AgentStatus::ERROR);
    REQUIRE(coordinator.get_agent("ok2")->status() == AgentStatus::ACTIVE);
}

TEST_CASE("Agents that fail to start receive no tasks", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto broken = std::make_shared<ScriptedAgent>();
    broken->fail_initialize = true;
    auto broken_runtime = coordinator.register_and_track(agent_config("broken", {"work"}), broken);
    auto ok = coordinator.register_and_track(agent_config("ok", {"work"}), std::make_shared<ScriptedAgent>());

    REQUIRE_FALSE(coordinator.start_all().ok());
    REQUIRE_FALSE(message_bus.is_registered("broken"));
    REQUIRE_FALSE(coordinator.send_command("broken", "work"));

    for (int i = 0; i < 4; ++i) {
        REQUIRE(coordinator.distribute_task("work", {{"task", i}}) == std::optional<std::string>("ok"));
    }
    REQUIRE(wait_until([&]() { return ok->tasks_completed() == 4; }));
    REQUIRE(broken_runtime->mailbox()->size() == 0);
    REQUIRE(coordinator.agents_with_capability("work") == std::vector<std::string>{"broken", "ok"});
}

TEST_CASE("stop_all retires every agent", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto a = std::make_shared<ScriptedAgent>();
    coordinator.register_and_track(agent_config("a"), a);
    coordinator.register_and_track(agent_config("b"), std::make_shared<ScriptedAgent>());
    REQUIRE(coordinator.start_all().ok());

    auto report = coordinator.stop_all();
    REQUIRE(report.ok());
    REQUIRE(report.succeeded.size() == 2);
    for (const auto& snap : coordinator.status_snapshot()) {
        REQUIRE(snap.status == AgentStatus::SHUTDOWN);
    }
    REQUIRE(a->shutdown_calls == 1);
    REQUIRE_FALSE(coordinator.distribute_task("work", json::object()).has_value());
    REQUIRE(coordinator.stop_all().succeeded.empty());
}

TEST_CASE("stop_agent retires one agent and keeps its id reserved", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    coordinator.register_and_track(agent_config("a"), std::make_shared<ScriptedAgent>());
    coordinator.register_and_track(agent_config("b"), std::make_shared<ScriptedAgent>());
    REQUIRE(coordinator.start_all().ok());

    REQUIRE(coordinator.stop_agent("a"));
    REQUIRE_FALSE(coordinator.stop_agent("ghost"));
    REQUIRE_FALSE(message_bus.is_registered("a"));
    REQUIRE(coordinator.get_agent("a")->status() == AgentStatus::SHUTDOWN);
    REQUIRE_FALSE(coordinator.send_command("a", "run"));
    REQUIRE_FALSE(coordinator.register_and_track(agent_config("a"), std::make_shared<ScriptedAgent>()));
    REQUIRE(coordinator.distribute_task("work", json::object()) == std::optional<std::string>("b"));
}

TEST_CASE("status_snapshot is a detached copy", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto runtime = coordinator.register_and_track(agent_config("a", {"echo"}), std::make_shared<ScriptedAgent>());

    auto snapshot = coordinator.status_snapshot();
    REQUIRE(snapshot.size() == 1);
    snapshot[0].tasks_completed = 99;
    snapshot[0].capabilities.push_back("forged");

    REQUIRE(runtime->tasks_completed() == 0);
    REQUIRE_FALSE(runtime->has_capability("forged"));

    auto status = coordinator.status_json();
    REQUIRE(status["a"]["status"] == "initializing");
    REQUIRE(status["a"]["tasks_completed"] == 0);
    REQUIRE(status["a"]["capabilities"] == json::array({"echo"}));
    REQUIRE(status["a"]["last_heartbeat"].is_null());
}

TEST_CASE("query through the coordinator reaches an echo agent", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    coordinator.register_and_track(agent_config("echo_1", {"echo"}), std::make_shared<agents::EchoAgent>("echo_1"));
    REQUIRE(coordinator.start_all().ok());

    auto answer = coordinator.query("echo_1", "ping", json::object(), 2s);
    REQUIRE(answer.has_value());
    REQUIRE((*answer)["pong"] == true);
    REQUIRE((*answer)["agent_id"] == "echo_1");
}

TEST_CASE("query to an agent that never replies yields no answer", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    coordinator.register_and_track(agent_config("ghost_agent"), std::make_shared<ScriptedAgent>());
    REQUIRE(coordinator.start_all().ok());
    auto before = message_bus.pending_query_count();

    auto begin = std::chrono::steady_clock::now();
    auto answer = coordinator.query("ghost_agent", "anything", {{"x", 1}}, 50ms);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE_FALSE(answer.has_value());
    REQUIRE(elapsed < 1s);
    REQUIRE(message_bus.pending_query_count() == before);
}

TEST_CASE("Failed commands are reported to the system inbox", "[coordinator]") {
    bus::MessageBus message_bus;
    Coordinator coordinator(message_bus);
    auto runtime = coordinator.register_and_track(agent_config("echo_1"), std::make_shared<agents::EchoAgent>("echo_1"));
    REQUIRE(coordinator.start_all().ok());

    REQUIRE(coordinator.send_command("echo_1", "fail", {{"reason", "bad input"}}));
    REQUIRE(wait_until([&]() { return coordinator.system_errors() == 1; }));
    REQUIRE(runtime->tasks_failed() == 1);

    REQUIRE(coordinator.send_command("echo_1", "echo", {{"v", 1}}));
    REQUIRE(wait_until([&]() { return runtime->tasks_completed() == 1; }));
    REQUIRE(coordinator.system_errors() == 1);
}
