#pragma once
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "bus/message.hpp"

namespace conclave::runtime {

// Dispatch table from a closed operation enum to handlers. Each agent type
// builds one and parses wire names into `Op` once.
template <typename Op>
class CommandTable {
public:
    using Handler = std::function<nlohmann::json(const bus::Message&, const nlohmann::json& params)>;

    void register_handler(Op op, Handler handler) {
        handlers_[op] = std::move(handler);
    }

    // Run the handler for `op`. nullopt when nothing is registered for it.
    std::optional<nlohmann::json> dispatch(Op op, const bus::Message& message,
                                           const nlohmann::json& params) const {
        auto it = handlers_.find(op);
        if (it == handlers_.end()) {
            return std::nullopt;
        }
        return it->second(message, params);
    }

private:
    std::unordered_map<Op, Handler> handlers_;
};

} // namespace conclave::runtime
