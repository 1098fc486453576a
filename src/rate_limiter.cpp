#include "dropshare/rate_limiter.hpp"

#include <algorithm>

namespace dropshare {

RateLimiter::RateLimiter(std::size_t max_events, Clock::duration window)
    : max_events_(max_events), window_(window) {}

void RateLimiter::prune(std::deque<Clock::time_point>& times, Clock::time_point now) const {
    while (!times.empty() && now - times.front() >= window_) times.pop_front();
}

Admission RateLimiter::admit(const ConnectionId& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& times = times_[id];
    prune(times, now);
    if (times.size() >= max_events_) return Admission::Deny;
    times.push_back(now);
    return Admission::Allow;
}

std::size_t RateLimiter::sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t dropped = 0;
    for (auto it = times_.begin(); it != times_.end();) {
        prune(it->second, now);
        if (it->second.empty()) {
            it = times_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t RateLimiter::recent_events(const ConnectionId& id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = times_.find(id);
    if (it == times_.end()) return 0;
    return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(),
        [&](Clock::time_point t) { return now - t < window_; }));
}

std::size_t RateLimiter::tracked_connections() const {
    std::lock_guard<std::mutex> lk(mu_);
    return times_.size();
}

} // namespace dropshare
