#include "bus/message.hpp"
#include "core/ids.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <stdexcept>

using json = nlohmann::json;

namespace conclave::bus {

const char* message_kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::COMMAND:   return "command";
        case MessageKind::QUERY:     return "query";
        case MessageKind::RESPONSE:  return "response";
        case MessageKind::ALERT:     return "alert";
        case MessageKind::BROADCAST: return "broadcast";
        case MessageKind::HEARTBEAT: return "heartbeat";
        default: return "unknown";
    }
}

std::optional<MessageKind> message_kind_from_string(const std::string& str) {
    if (str == "command")   return MessageKind::COMMAND;
    if (str == "query")     return MessageKind::QUERY;
    if (str == "response")  return MessageKind::RESPONSE;
    if (str == "alert")     return MessageKind::ALERT;
    if (str == "broadcast") return MessageKind::BROADCAST;
    if (str == "heartbeat") return MessageKind::HEARTBEAT;
    return std::nullopt;
}

namespace {

const char* id_prefix(MessageKind kind) {
    switch (kind) {
        case MessageKind::COMMAND:   return "cmd";
        case MessageKind::QUERY:     return "q";
        case MessageKind::RESPONSE:  return "resp";
        case MessageKind::ALERT:     return "alert";
        case MessageKind::BROADCAST: return "bc";
        case MessageKind::HEARTBEAT: return "hb";
        default: return "msg";
    }
}

} // namespace

Message Message::make(std::string sender, std::string recipient, MessageKind kind,
                      json payload, int priority) {
    Message msg;
    msg.id = core::make_id(id_prefix(kind));
    msg.sender = std::move(sender);
    msg.recipient = std::move(recipient);
    msg.kind = kind;
    msg.payload = payload.is_null() ? json::object() : std::move(payload);
    msg.priority = std::clamp(priority, MIN_PRIORITY, MAX_PRIORITY);
    msg.timestamp = WallClock::now();
    return msg;
}

json Message::to_json() const {
    json j;
    j["id"] = id;
    j["sender"] = sender;
    j["recipient"] = recipient;
    j["kind"] = message_kind_to_string(kind);
    j["payload"] = payload;
    j["priority"] = priority;
    j["timestamp"] = format_timestamp(timestamp);
    j["correlation_id"] = correlation_id ? json(*correlation_id) : json(nullptr);
    j["expires_at"] = expires_at ? json(format_timestamp(*expires_at)) : json(nullptr);
    return j;
}

Message Message::from_json(const json& j) {
    Message msg;
    msg.sender = j.at("sender").get<std::string>();
    msg.recipient = j.at("recipient").get<std::string>();

    auto kind_str = j.at("kind").get<std::string>();
    auto kind = message_kind_from_string(kind_str);
    if (!kind) {
        throw std::invalid_argument("unknown message kind: " + kind_str);
    }
    msg.kind = *kind;

    msg.id = j.value("id", "");
    if (msg.id.empty()) {
        msg.id = core::make_id(id_prefix(msg.kind));
    }
    msg.payload = j.value("payload", json::object());
    msg.priority = std::clamp(j.value("priority", DEFAULT_PRIORITY), MIN_PRIORITY, MAX_PRIORITY);

    std::optional<WallClock::time_point> ts;
    if (j.contains("timestamp") && j["timestamp"].is_string()) {
        ts = parse_timestamp(j["timestamp"].get<std::string>());
    }
    msg.timestamp = ts.value_or(WallClock::now());

    if (j.contains("correlation_id") && j["correlation_id"].is_string()) {
        msg.correlation_id = j["correlation_id"].get<std::string>();
    }
    if (j.contains("expires_at") && j["expires_at"].is_string()) {
        msg.expires_at = parse_timestamp(j["expires_at"].get<std::string>());
    }
    return msg;
}

Message make_response(const Message& request, const std::string& responder, json payload) {
    Message reply = Message::make(responder, request.sender, MessageKind::RESPONSE,
                                  std::move(payload), request.priority);
    reply.correlation_id = request.correlation_id;
    return reply;
}

std::string format_timestamp(WallClock::time_point tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(millis / 1000);
    int ms = static_cast<int>(millis % 1000);
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

std::optional<WallClock::time_point> parse_timestamp(const std::string& str) {
    std::tm tm{};
    int ms = 0;
    int fields = std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d",
                             &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                             &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms);
    if (fields < 6) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = timegm(&tm);
    return WallClock::from_time_t(secs) + std::chrono::milliseconds(fields == 7 ? ms : 0);
}

} // namespace conclave::bus
