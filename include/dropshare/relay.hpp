#pragma once
#include "config.hpp"
#include "rate_limiter.hpp"
#include "room_registry.hpp"
#include "types.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace dropshare {

// Delivers an already-serialized frame to one connection. Unknown ids are ignored.
class Outbox {
public:
    virtual ~Outbox() = default;
    virtual void send(const ConnectionId& to, const std::string& frame) = 0;
};

// Routes incoming events: room membership, directed forwards, room broadcasts, heartbeats.
class Relay {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using WallClockFn = std::function<long long()>; // epoch milliseconds

    Relay(Outbox& outbox, const ServerConfig& config,
          ClockFn clock = Clock::now, WallClockFn wall_clock = nullptr);

    void on_open(const ConnectionId& id);
    void on_message(const ConnectionId& id, std::string_view raw);
    void on_close(const ConnectionId& id);

    // Periodic cleanup of empty rooms and idle rate-limit records.
    void sweep();

    const RoomRegistry& registry() const { return registry_; }
    const RateLimiter& rate_limiter() const { return limiter_; }

private:
    void handle_join(const ConnectionId& id, const nlohmann::json& data);
    void handle_leave(const ConnectionId& id, const nlohmann::json& data);
    void handle_directed(const ConnectionId& id, const std::string& event, const nlohmann::json& data);
    void handle_room_event(const ConnectionId& id, const std::string& event, const nlohmann::json& data);
    void handle_ping(const ConnectionId& id, const nlohmann::json& data);

    void send(const ConnectionId& to, std::string_view event, const nlohmann::json& data);
    void send_error(const ConnectionId& to, const char* code, const std::string& message);
    void broadcast(const std::string& room, std::string_view event, const nlohmann::json& data,
                   const ConnectionId* exclude = nullptr);
    void broadcast(const std::vector<ConnectionId>& members, std::string_view event,
                   const nlohmann::json& data, const ConnectionId* exclude = nullptr);

    Outbox& outbox_;
    ServerConfig config_;
    ClockFn clock_;
    WallClockFn wall_clock_;
    RoomRegistry registry_;
    RateLimiter limiter_;
};

} // namespace dropshare
