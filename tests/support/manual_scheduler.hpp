#pragma once
#include "dropshare/client/channel.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace dropshare::testing {

// Deterministic clock: timers fire only inside advance(), in due-time then FIFO order.
class ManualScheduler : public client::Scheduler {
public:
    std::int64_t now_ms() const override { return now_; }

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn) override {
        TimerId id = ++next_id_;
        Key key{now_ + delay.count(), id};
        timers_.emplace(key, std::move(fn));
        keys_.emplace(id, key);
        return id;
    }

    void cancel(TimerId id) override {
        auto it = keys_.find(id);
        if (it == keys_.end()) return;
        timers_.erase(it->second);
        keys_.erase(it);
    }

    void advance(std::chrono::milliseconds by) {
        std::int64_t target = now_ + by.count();
        while (!timers_.empty() && timers_.begin()->first.first <= target) {
            auto it = timers_.begin();
            now_ = it->first.first;
            auto fn = std::move(it->second);
            keys_.erase(it->first.second);
            timers_.erase(it);
            fn();
        }
        now_ = target;
    }

    // Runs everything already due without moving the clock.
    void flush() { advance(std::chrono::milliseconds(0)); }

    std::size_t pending() const { return timers_.size(); }

private:
    using Key = std::pair<std::int64_t, TimerId>;

    std::int64_t now_ = 1'700'000'000'000;
    TimerId next_id_ = 0;
    std::map<Key, std::function<void()>> timers_;
    std::unordered_map<TimerId, Key> keys_;
};

} // namespace dropshare::testing
