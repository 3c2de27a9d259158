#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include "api/valr/rate_limiter.hpp"

using ValrTrader::API::RateLimiter;

TEST(RateLimiterTest, rejects_non_positive_budget_or_window) {
    EXPECT_THROW(RateLimiter(0, std::chrono::milliseconds(1000)), std::runtime_error);
    EXPECT_THROW(RateLimiter(5, std::chrono::milliseconds(0)), std::runtime_error);
}

TEST(RateLimiterTest, admits_requests_up_to_budget_without_waiting) {
    RateLimiter rate_limiter(3, std::chrono::milliseconds(60000));
    EXPECT_LT(rate_limiter.acquire().count(), 50);
    EXPECT_LT(rate_limiter.acquire().count(), 50);
    EXPECT_LT(rate_limiter.acquire().count(), 50);
    EXPECT_EQ(rate_limiter.get_requests_in_window(), 3);
}

TEST(RateLimiterTest, blocks_until_oldest_request_leaves_window) {
    RateLimiter rate_limiter(2, std::chrono::milliseconds(200));
    rate_limiter.acquire();
    rate_limiter.acquire();

    std::chrono::steady_clock::time_point wait_start = std::chrono::steady_clock::now();
    std::chrono::milliseconds reported_wait = rate_limiter.acquire();
    std::chrono::milliseconds measured_wait =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - wait_start);

    EXPECT_GE(measured_wait.count(), 150);
    EXPECT_GE(reported_wait.count(), 150);
}
