#include <catch2/catch.hpp>
#include "agents/echo_agent.hpp"
#include "runtime/agent/command_table.hpp"

using namespace conclave;
using namespace conclave::agents;
using json = nlohmann::json;

namespace {

bus::Message command(const std::string& name, const json& params = json::object()) {
    auto msg = bus::Message::make("client", "echo_1", bus::MessageKind::COMMAND,
                                  {{"command", name}, {"parameters", params}});
    msg.correlation_id = "corr_1";
    return msg;
}

enum class TableOp { ADD, NEGATE };

} // namespace

TEST_CASE("CommandTable dispatches to the registered handler only", "[echo]") {
    runtime::CommandTable<TableOp> table;
    table.register_handler(TableOp::ADD, [](const bus::Message&, const json& params) -> json {
        return params.value("a", 0) + params.value("b", 0);
    });

    auto msg = command("add");
    auto sum = table.dispatch(TableOp::ADD, msg, {{"a", 2}, {"b", 3}});
    REQUIRE(sum.has_value());
    REQUIRE(*sum == 5);
    REQUIRE_FALSE(table.dispatch(TableOp::NEGATE, msg, json::object()).has_value());
}

TEST_CASE("Echo operations parse from their wire names", "[echo]") {
    REQUIRE(echo_op_from_string("echo") == EchoOp::ECHO);
    REQUIRE(echo_op_from_string("ping") == EchoOp::PING);
    REQUIRE(echo_op_from_string("sleep") == EchoOp::SLEEP);
    REQUIRE(echo_op_from_string("fail") == EchoOp::FAIL);
    REQUIRE_FALSE(echo_op_from_string("Echo").has_value());
}

TEST_CASE("EchoAgent returns command parameters", "[echo]") {
    EchoAgent agent("echo_1");
    auto reply = agent.handle(command("echo", {{"text", "hi"}}));

    REQUIRE(reply.has_value());
    REQUIRE(reply->kind == bus::MessageKind::RESPONSE);
    REQUIRE(reply->sender == "echo_1");
    REQUIRE(reply->recipient == "client");
    REQUIRE(reply->correlation_id == std::optional<std::string>("corr_1"));
    REQUIRE(reply->payload["success"] == true);
    REQUIRE(reply->payload["echo"]["text"] == "hi");
}

TEST_CASE("EchoAgent answers queries by query_type", "[echo]") {
    EchoAgent agent("echo_1");
    auto query = bus::Message::make(bus::SYSTEM_ID, "echo_1", bus::MessageKind::QUERY, {{"query_type", "ping"}});
    auto reply = agent.handle(query);

    REQUIRE(reply.has_value());
    REQUIRE(reply->recipient == bus::SYSTEM_ID);
    REQUIRE(reply->payload["pong"] == true);
}

TEST_CASE("EchoAgent sleeps for a capped duration", "[echo]") {
    EchoAgent agent("echo_1");
    auto reply = agent.handle(command("sleep", {{"ms", 5}}));
    REQUIRE(reply->payload["slept_ms"] == 5);

    auto negative = agent.handle(command("sleep", {{"ms", -10}}));
    REQUIRE(negative->payload["slept_ms"] == 0);
}

TEST_CASE("EchoAgent rejects unknown operations with an error reply", "[echo]") {
    EchoAgent agent("echo_1");
    auto reply = agent.handle(command("teleport"));

    REQUIRE(reply.has_value());
    REQUIRE(reply->payload["success"] == false);
    REQUIRE(reply->payload["error"] == "unknown operation: teleport");
}

TEST_CASE("EchoAgent fail raises a handler fault", "[echo]") {
    EchoAgent agent("echo_1");
    REQUIRE_THROWS_WITH(agent.handle(command("fail", {{"reason", "nope"}})), "nope");
}

TEST_CASE("EchoAgent ignores alerts and broadcasts", "[echo]") {
    EchoAgent agent("echo_1");
    auto alert = bus::Message::make(bus::SYSTEM_ID, bus::BROADCAST_ID, bus::MessageKind::ALERT, {{"event", "x"}});
    REQUIRE_FALSE(agent.handle(alert).has_value());
}
