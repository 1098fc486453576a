#include "dropshare/relay.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/utils.hpp"

#include <algorithm>

namespace dropshare {

namespace {

long long epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

bool is_directed(const std::string& event) {
    return event == events::OFFER || event == events::ANSWER || event == events::ICE_CANDIDATE ||
           event == events::FILE_ACK || event == events::FILE_RESEND;
}

bool is_room_event(const std::string& event) {
    return event == events::FILE_INFO || event == events::FILE_CHUNK || event == events::FILE_COMPLETE;
}

} // namespace

Relay::Relay(Outbox& outbox, const ServerConfig& config, ClockFn clock, WallClockFn wall_clock)
    : outbox_(outbox),
      config_(config),
      clock_(std::move(clock)),
      wall_clock_(wall_clock ? std::move(wall_clock) : WallClockFn(epoch_millis)),
      registry_(config.max_room_size),
      limiter_(config.max_joins_per_window, config.rate_limit_window) {}

void Relay::send(const ConnectionId& to, std::string_view event, const nlohmann::json& data) {
    outbox_.send(to, make_frame(event, data));
}

void Relay::send_error(const ConnectionId& to, const char* code, const std::string& message) {
    send(to, events::ERROR, nlohmann::json{{"message", message}, {"code", code}});
}

void Relay::broadcast(const std::vector<ConnectionId>& members, std::string_view event,
                      const nlohmann::json& data, const ConnectionId* exclude) {
    std::string dump = make_frame(event, data);
    for (auto& member : members) {
        if (exclude && member == *exclude) continue;
        outbox_.send(member, dump);
    }
}

void Relay::broadcast(const std::string& room, std::string_view event, const nlohmann::json& data,
                      const ConnectionId* exclude) {
    broadcast(registry_.members(room), event, data, exclude);
}

void Relay::on_open(const ConnectionId& id) {
    LOG_INFO("Connection opened id=" << id);
    send(id, events::CONNECTED, nlohmann::json{{"id", id}});
}

void Relay::on_message(const ConnectionId& id, std::string_view raw) {
    LOG_DEBUG("Message received from " << id << " (" << raw.size() << " bytes)");

    if (raw.size() > config_.max_payload) {
        LOG_WARN("Message too large from " << id << " (" << raw.size() << " bytes)");
        send_error(id, errors::TOO_LARGE, "Message too large.");
        return;
    }

    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded() || !validate_schema(j, {{"event", "string"}})) {
        LOG_WARN("Invalid frame received from " << id);
        send_error(id, errors::VALIDATION, "Invalid message format.");
        return;
    }

    std::string event = j["event"].get<std::string>();
    const nlohmann::json data = j.contains("data") ? j["data"] : nlohmann::json();

    if (event == events::JOIN_ROOM) handle_join(id, data);
    else if (event == events::LEAVE_ROOM) handle_leave(id, data);
    else if (is_room_event(event)) handle_room_event(id, event, data);
    else if (is_directed(event)) handle_directed(id, event, data);
    else if (event == events::PING) handle_ping(id, data);
    else {
        LOG_WARN("Unknown event received from " << id << ": " << event);
        send_error(id, errors::VALIDATION, "Unknown event.");
    }
}

void Relay::handle_join(const ConnectionId& id, const nlohmann::json& data) {
    if (limiter_.admit(id, clock_()) == Admission::Deny) {
        LOG_WARN("Rate limit exceeded for " << id << " on join-room");
        send_error(id, errors::RATE_LIMITED, "Too many requests. Please wait.");
        return;
    }

    if (!data.is_string() || data.get<std::string>().empty()) {
        send_error(id, errors::VALIDATION, "Invalid room code format.");
        return;
    }

    JoinResult result = registry_.join(id, data.get<std::string>());
    if (result.status == JoinStatus::InvalidCode) {
        LOG_WARN("Rejecting join from " << id << ": bad room code");
        send_error(id, errors::VALIDATION, "Room code must be 6 alphanumeric characters.");
        return;
    }
    if (result.status == JoinStatus::RoomFull) {
        LOG_WARN("Rejecting join from " << id << ": room " << result.code << " is full");
        send_error(id, errors::ROOM_FULL,
                   "Room is full. Maximum " + std::to_string(config_.max_room_size) + " users allowed.");
        return;
    }

    nlohmann::json others = nlohmann::json::array();
    for (auto& member : result.members)
        if (member != id) others.push_back(member);
    send(id, events::USERS_IN_ROOM, others);

    broadcast(result.members, events::USER_JOINED, id, &id);

    nlohmann::json status{{"roomId", result.code},
                          {"userCount", result.members.size()},
                          {"users", result.members}};
    broadcast(result.members, events::ROOM_STATUS, status);
    LOG_INFO("Connection " << id << " joined room " << result.code << " (" << result.members.size() << " members)");
}

void Relay::handle_leave(const ConnectionId& id, const nlohmann::json& data) {
    if (!data.is_string()) {
        send_error(id, errors::VALIDATION, "Invalid room code format.");
        return;
    }
    auto departure = registry_.leave(id, data.get<std::string>());
    if (!departure) {
        LOG_DEBUG("Ignoring leave-room from " << id << ": not a member");
        return;
    }
    broadcast(departure->remaining, events::USER_LEFT, id);
    LOG_INFO("Connection " << id << " left room " << departure->code
             << (departure->room_deleted ? " (room deleted)" : ""));
}

void Relay::handle_directed(const ConnectionId& id, const std::string& event, const nlohmann::json& data) {
    if (!validate_schema(data, {{"target", "string"}})) {
        send_error(id, errors::VALIDATION, "Missing target for " + event + ".");
        return;
    }
    nlohmann::json forward = data;
    ConnectionId target = forward["target"].get<std::string>();
    forward.erase("target");
    forward["sender"] = id;
    send(target, event, forward);
}

void Relay::handle_room_event(const ConnectionId& id, const std::string& event, const nlohmann::json& data) {
    bool valid = false;
    if (event == events::FILE_CHUNK)
        valid = validate_schema(data, {{"room", "string"}, {"fileId", "string"},
                                       {"chunkIndex", "integer"}, {"data", "string"}});
    else
        valid = validate_schema(data, {{"room", "string"}, {"fileId", "string"}});
    if (!valid) {
        LOG_WARN("Invalid " << event << " payload from " << id);
        send_error(id, errors::VALIDATION, "Invalid " + event + " payload.");
        return;
    }

    nlohmann::json forward = data;
    std::string room = sanitize_room_code(forward["room"].get<std::string>());
    forward.erase("room");
    forward["sender"] = id;
    broadcast(room, event, forward, &id);
    LOG_DEBUG("Relayed " << event << " from " << id << " to room " << room);
}

void Relay::handle_ping(const ConnectionId& id, const nlohmann::json& data) {
    nlohmann::json timestamp = data.is_object() && data.contains("timestamp") ? data["timestamp"] : nlohmann::json();
    send(id, events::PONG, nlohmann::json{{"timestamp", timestamp}, {"serverTime", wall_clock_()}});
}

void Relay::on_close(const ConnectionId& id) {
    auto departures = registry_.remove_everywhere(id);
    if (departures.empty()) {
        LOG_INFO("Connection " << id << " closed (not in room)");
        return;
    }
    for (auto& d : departures) {
        broadcast(d.remaining, events::USER_LEFT, id);
        LOG_INFO("Connection " << id << " disconnected from room " << d.code
                 << (d.room_deleted ? " (room deleted)" : ""));
    }
}

void Relay::sweep() {
    std::size_t rooms = registry_.sweep_empty();
    std::size_t records = limiter_.sweep(clock_());
    LOG_DEBUG("Sweep removed " << rooms << " empty rooms and " << records << " rate-limit records");
}

} // namespace dropshare
