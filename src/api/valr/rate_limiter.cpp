#include "rate_limiter.hpp"
#include <stdexcept>
#include <string>
#include <thread>

namespace ValrTrader {
namespace API {

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window)
    : max_requests_per_window(max_requests), window_duration(window) {
    if (max_requests_per_window <= 0) {
        throw std::runtime_error("Rate limiter requires a positive request budget, got " + std::to_string(max_requests));
    }
    if (window_duration.count() <= 0) {
        throw std::runtime_error("Rate limiter requires a positive window");
    }
}

std::chrono::milliseconds RateLimiter::acquire() {
    std::chrono::steady_clock::time_point wait_started = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> window_lock(window_mutex);

    while (true) {
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
        prune_expired_unlocked(now);
        if (static_cast<int>(request_times.size()) < max_requests_per_window) {
            request_times.push_back(now);
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - wait_started);
        }

        // Sleep until the oldest request leaves the window, then re-check under the lock.
        std::chrono::steady_clock::time_point slot_free_at = request_times.front() + window_duration;
        window_lock.unlock();
        std::this_thread::sleep_until(slot_free_at);
        window_lock.lock();
    }
}

int RateLimiter::get_requests_in_window() {
    std::lock_guard<std::mutex> window_lock(window_mutex);
    prune_expired_unlocked(std::chrono::steady_clock::now());
    return static_cast<int>(request_times.size());
}

void RateLimiter::prune_expired_unlocked(std::chrono::steady_clock::time_point now) {
    while (!request_times.empty() && now - request_times.front() >= window_duration) {
        request_times.pop_front();
    }
}

} // namespace API
} // namespace ValrTrader
