#include "agents/echo_agent.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace conclave::agents {

std::optional<EchoOp> echo_op_from_string(const std::string& str) {
    if (str == "echo")  return EchoOp::ECHO;
    if (str == "ping")  return EchoOp::PING;
    if (str == "sleep") return EchoOp::SLEEP;
    if (str == "fail")  return EchoOp::FAIL;
    return std::nullopt;
}

EchoAgent::EchoAgent(std::string agent_id) : agent_id_(std::move(agent_id)) {
    table_.register_handler(EchoOp::ECHO,
        [](const bus::Message&, const json& params) {
            json result;
            result["success"] = true;
            result["echo"] = params;
            return result;
        });
    table_.register_handler(EchoOp::PING,
        [this](const bus::Message&, const json&) {
            json result;
            result["success"] = true;
            result["pong"] = true;
            result["agent_id"] = agent_id_;
            return result;
        });
    table_.register_handler(EchoOp::SLEEP,
        [](const bus::Message&, const json& params) {
            int ms = std::clamp(params.value("ms", 0), 0, MAX_SLEEP_MS);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            json result;
            result["success"] = true;
            result["slept_ms"] = ms;
            return result;
        });
    table_.register_handler(EchoOp::FAIL,
        [](const bus::Message&, const json& params) -> json {
            throw std::runtime_error(params.value("reason", std::string("requested failure")));
        });
}

void EchoAgent::initialize() {
    spdlog::debug("EchoAgent {} ready", agent_id_);
}

std::optional<bus::Message> EchoAgent::handle(const bus::Message& message) {
    std::string op_name;
    json params = json::object();

    switch (message.kind) {
        case bus::MessageKind::COMMAND:
            op_name = message.payload.value("command", "");
            params = message.payload.value("parameters", json::object());
            break;
        case bus::MessageKind::QUERY:
            op_name = message.payload.value("query_type", "");
            params = message.payload;
            break;
        default:
            spdlog::debug("EchoAgent {} observed {} from {}",
                agent_id_, bus::message_kind_to_string(message.kind), message.sender);
            return std::nullopt;
    }

    auto op = echo_op_from_string(op_name);
    std::optional<json> result;
    if (op) {
        result = table_.dispatch(*op, message, params);
    }
    if (!result) {
        json error;
        error["success"] = false;
        error["error"] = "unknown operation: " + op_name;
        return bus::make_response(message, agent_id_, error);
    }
    return bus::make_response(message, agent_id_, *result);
}

void EchoAgent::shutdown() {
    spdlog::debug("EchoAgent {} shutting down", agent_id_);
}

} // namespace conclave::agents
