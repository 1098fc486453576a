#pragma once
#include "channel.hpp"
#include "transfer_config.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>

namespace dropshare::client {

enum class Health { Healthy, Unhealthy, Disconnected };
enum class LinkQuality { Excellent, Good, Fair, Poor };

const char* to_string(Health health);
const char* to_string(LinkQuality quality);

LinkQuality classify_latency(std::int64_t latency_ms);

// Heartbeat and reconnect driver. Runs independently of any transfer.
class ResilienceMonitor {
public:
    using ActivityProbe = std::function<bool()>;
    using HealthListener = std::function<void(Health)>;

    ResilienceMonitor(EventChannel& channel, Scheduler& scheduler, const TransferConfig& config);
    ~ResilienceMonitor();

    ResilienceMonitor(const ResilienceMonitor&) = delete;
    ResilienceMonitor& operator=(const ResilienceMonitor&) = delete;

    void start();
    void stop();

    // Backgrounded clients ping more often to keep intermediaries from idling the link out.
    void set_background(bool background);
    void set_activity_probe(ActivityProbe probe) { activity_ = std::move(probe); }
    // While true, a disconnected channel is reconnected by the periodic probe.
    void set_wants_connection(bool wants) { wants_connection_ = wants; }
    void set_listener(HealthListener listener) { listener_ = std::move(listener); }

    void on_pong(const nlohmann::json& data);
    void on_connected();
    void on_disconnected();

    // Applies the silence threshold at the current time. Forces a reconnect when exceeded.
    Health evaluate();

    Health health() const { return health_; }
    bool background() const { return background_; }
    std::chrono::milliseconds interval() const;
    std::optional<std::int64_t> latency_ms() const { return latency_ms_; }
    std::optional<LinkQuality> quality() const;
    std::int64_t silence_ms() const;
    std::uint32_t reconnect_attempts() const { return reconnect_attempts_; }

private:
    void heartbeat();
    void probe();
    void arm_heartbeat();
    void arm_probe();
    void force_reconnect();
    void set_health(Health health);

    EventChannel& channel_;
    Scheduler& scheduler_;
    TransferConfig config_;

    bool running_ = false;
    bool background_ = false;
    bool wants_connection_ = false;
    Health health_ = Health::Disconnected;
    std::int64_t last_pong_ms_ = 0;
    std::optional<std::int64_t> latency_ms_;
    std::uint32_t reconnect_attempts_ = 0;

    Scheduler::TimerId heartbeat_timer_ = Scheduler::NO_TIMER;
    Scheduler::TimerId probe_timer_ = Scheduler::NO_TIMER;

    ActivityProbe activity_;
    HealthListener listener_;
};

} // namespace dropshare::client
