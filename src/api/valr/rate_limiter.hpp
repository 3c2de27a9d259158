#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <chrono>
#include <deque>
#include <mutex>

namespace ValrTrader {
namespace API {

/**
 * @brief Sliding-window request limiter shared by every gateway call.
 * acquire() blocks the caller until a slot is free; calls are never dropped.
 */
class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::milliseconds window);

    // Returns the time spent waiting for a slot.
    std::chrono::milliseconds acquire();
    int get_requests_in_window();

private:
    void prune_expired_unlocked(std::chrono::steady_clock::time_point now);

    int max_requests_per_window;
    std::chrono::milliseconds window_duration;
    std::mutex window_mutex;
    std::deque<std::chrono::steady_clock::time_point> request_times;
};

} // namespace API
} // namespace ValrTrader

#endif // RATE_LIMITER_HPP
