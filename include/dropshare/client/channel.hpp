#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace dropshare::client {

// Client side of the relay connection. emit() on a disconnected channel is dropped.
class EventChannel {
public:
    virtual ~EventChannel() = default;
    virtual void emit(const std::string& event, const nlohmann::json& data) = 0;
    virtual bool connected() const = 0;
    virtual void reconnect() = 0;
};

// Timer source for pacing, heartbeats and timeouts. Callbacks run on the client's loop.
class Scheduler {
public:
    using TimerId = std::uint64_t;
    static constexpr TimerId NO_TIMER = 0;

    virtual ~Scheduler() = default;
    virtual std::int64_t now_ms() const = 0;
    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;
    virtual void cancel(TimerId id) = 0;
};

} // namespace dropshare::client
