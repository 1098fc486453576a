#include "dropshare/client/resilience.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/types.hpp"

namespace dropshare::client {

const char* to_string(Health health) {
    switch (health) {
    case Health::Healthy: return "healthy";
    case Health::Unhealthy: return "unhealthy";
    case Health::Disconnected: return "disconnected";
    }
    return "unknown";
}

const char* to_string(LinkQuality quality) {
    switch (quality) {
    case LinkQuality::Excellent: return "excellent";
    case LinkQuality::Good: return "good";
    case LinkQuality::Fair: return "fair";
    case LinkQuality::Poor: return "poor";
    }
    return "unknown";
}

LinkQuality classify_latency(std::int64_t latency_ms) {
    if (latency_ms > 1000) return LinkQuality::Poor;
    if (latency_ms > 300) return LinkQuality::Fair;
    if (latency_ms > 100) return LinkQuality::Good;
    return LinkQuality::Excellent;
}

ResilienceMonitor::ResilienceMonitor(EventChannel& channel, Scheduler& scheduler, const TransferConfig& config)
    : channel_(channel), scheduler_(scheduler), config_(config) {}

ResilienceMonitor::~ResilienceMonitor() { stop(); }

std::chrono::milliseconds ResilienceMonitor::interval() const {
    return background_ ? config_.background_heartbeat_interval : config_.heartbeat_interval;
}

std::optional<LinkQuality> ResilienceMonitor::quality() const {
    if (!latency_ms_) return std::nullopt;
    return classify_latency(*latency_ms_);
}

std::int64_t ResilienceMonitor::silence_ms() const { return scheduler_.now_ms() - last_pong_ms_; }

void ResilienceMonitor::start() {
    if (running_) return;
    running_ = true;
    last_pong_ms_ = scheduler_.now_ms();
    set_health(channel_.connected() ? Health::Healthy : Health::Disconnected);
    arm_heartbeat();
    arm_probe();
}

void ResilienceMonitor::stop() {
    running_ = false;
    if (heartbeat_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(heartbeat_timer_);
    if (probe_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(probe_timer_);
    heartbeat_timer_ = Scheduler::NO_TIMER;
    probe_timer_ = Scheduler::NO_TIMER;
}

void ResilienceMonitor::set_background(bool background) {
    if (background_ == background) return;
    background_ = background;
    if (!running_) return;
    if (heartbeat_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(heartbeat_timer_);
    heartbeat_timer_ = Scheduler::NO_TIMER;
    arm_heartbeat();
}

void ResilienceMonitor::arm_heartbeat() {
    heartbeat_timer_ = scheduler_.schedule(interval(), [this] {
        heartbeat_timer_ = Scheduler::NO_TIMER;
        heartbeat();
    });
}

void ResilienceMonitor::arm_probe() {
    probe_timer_ = scheduler_.schedule(config_.reconnect_probe_interval, [this] {
        probe_timer_ = Scheduler::NO_TIMER;
        probe();
    });
}

void ResilienceMonitor::heartbeat() {
    if (!running_) return;
    if (channel_.connected()) {
        channel_.emit(events::PING, nlohmann::json{{"timestamp", scheduler_.now_ms()},
                                                   {"hasActiveTransfers", activity_ ? activity_() : false},
                                                   {"isBackground", background_}});
    }
    evaluate();
    if (running_) arm_heartbeat();
}

void ResilienceMonitor::probe() {
    if (!running_) return;
    if (wants_connection_ && !channel_.connected()) {
        LOG_INFO("Connection down while in a room, reconnecting");
        force_reconnect();
    }
    arm_probe();
}

Health ResilienceMonitor::evaluate() {
    if (!channel_.connected()) {
        set_health(Health::Disconnected);
    } else if (silence_ms() > config_.unhealthy_after.count()) {
        LOG_WARN("No pong for " << silence_ms() << " ms, connection may be unhealthy");
        set_health(Health::Unhealthy);
        force_reconnect();
    } else {
        set_health(Health::Healthy);
    }
    return health_;
}

void ResilienceMonitor::force_reconnect() {
    ++reconnect_attempts_;
    channel_.reconnect();
}

void ResilienceMonitor::on_pong(const nlohmann::json& data) {
    std::int64_t now = scheduler_.now_ms();
    last_pong_ms_ = now;
    if (data.is_object() && data.contains("timestamp") && data["timestamp"].is_number()) {
        latency_ms_ = now - data["timestamp"].get<std::int64_t>();
        LOG_DEBUG("Pong latency " << *latency_ms_ << " ms (" << to_string(classify_latency(*latency_ms_)) << ")");
    }
    set_health(Health::Healthy);
}

void ResilienceMonitor::on_connected() {
    last_pong_ms_ = scheduler_.now_ms();
    set_health(Health::Healthy);
}

void ResilienceMonitor::on_disconnected() { set_health(Health::Disconnected); }

void ResilienceMonitor::set_health(Health health) {
    if (health_ == health) return;
    LOG_INFO("Connection " << to_string(health_) << " -> " << to_string(health));
    health_ = health;
    if (listener_) listener_(health);
}

} // namespace dropshare::client
