#pragma once
#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace dropshare {

enum class Admission { Allow, Deny };

// Sliding-window admission: at most max_events per connection within the trailing window.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter(std::size_t max_events = MAX_JOINS_PER_WINDOW,
                Clock::duration window = RATE_LIMIT_WINDOW);

    Admission admit(const ConnectionId& id, Clock::time_point now);

    // Drops records with no timestamps left in the window. Returns how many were dropped.
    std::size_t sweep(Clock::time_point now);

    std::size_t recent_events(const ConnectionId& id, Clock::time_point now) const;
    std::size_t tracked_connections() const;

private:
    void prune(std::deque<Clock::time_point>& times, Clock::time_point now) const;

    std::size_t max_events_;
    Clock::duration window_;
    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::deque<Clock::time_point>> times_;
};

} // namespace dropshare
