#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace conclave::bus {

// Reserved identities
inline constexpr const char* SYSTEM_ID = "system";
inline constexpr const char* BROADCAST_ID = "broadcast";

inline constexpr int MIN_PRIORITY = 1;
inline constexpr int MAX_PRIORITY = 10;
inline constexpr int DEFAULT_PRIORITY = 5;

enum class MessageKind {
    COMMAND,
    QUERY,
    RESPONSE,
    ALERT,
    BROADCAST,
    HEARTBEAT
};

const char* message_kind_to_string(MessageKind kind);
std::optional<MessageKind> message_kind_from_string(const std::string& str);

using WallClock = std::chrono::system_clock;

// One unit of inter-agent communication. Priority is advisory and expires_at
// is carried but not enforced.
struct Message {
    std::string id;
    std::string sender;
    std::string recipient;
    MessageKind kind = MessageKind::COMMAND;
    nlohmann::json payload = nlohmann::json::object();
    int priority = DEFAULT_PRIORITY;
    WallClock::time_point timestamp;
    std::optional<std::string> correlation_id;
    std::optional<WallClock::time_point> expires_at;

    // Fill id/timestamp if absent and clamp priority into range.
    static Message make(std::string sender, std::string recipient, MessageKind kind,
                        nlohmann::json payload, int priority = DEFAULT_PRIORITY);

    bool is_broadcast() const { return recipient == BROADCAST_ID; }

    nlohmann::json to_json() const;
    static Message from_json(const nlohmann::json& j);
};

// Reply to `request`, addressed to its sender and carrying its correlation id.
Message make_response(const Message& request, const std::string& responder,
                      nlohmann::json payload);

// ISO-8601 with milliseconds, UTC.
std::string format_timestamp(WallClock::time_point tp);
std::optional<WallClock::time_point> parse_timestamp(const std::string& str);

} // namespace conclave::bus
