#pragma once
#include <optional>
#include <string>
#include "runtime/agent/agent.hpp"
#include "runtime/agent/command_table.hpp"

namespace conclave::agents {

enum class EchoOp {
    ECHO,   // reply with the parameters
    PING,   // reply with "pong"
    SLEEP,  // wait "ms" milliseconds, then reply
    FAIL    // raise a handler fault
};

std::optional<EchoOp> echo_op_from_string(const std::string& str);

// Reference agent answering Commands and Queries through a CommandTable.
class EchoAgent : public runtime::Agent {
public:
    static constexpr int MAX_SLEEP_MS = 5000;

    explicit EchoAgent(std::string agent_id);

    void initialize() override;
    std::optional<bus::Message> handle(const bus::Message& message) override;
    void shutdown() override;

private:
    std::string agent_id_;
    runtime::CommandTable<EchoOp> table_;
};

} // namespace conclave::agents
