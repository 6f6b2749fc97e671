#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "carydes/services/RateLimiter.hpp"

using carydes::services::RateLimiter;
using std::chrono::seconds;

namespace {
    const RateLimiter::Clock::time_point kStart = RateLimiter::Clock::time_point(seconds(1700000000));
}

TEST(RateLimiterTest, DeniesEleventhMessageInsideWindow) {
    RateLimiter limiter(10, seconds(60));

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.admit(1, kStart + seconds(i))) << "message " << i;
    }

    auto denied = limiter.admit(1, kStart + seconds(10));
    EXPECT_FALSE(denied);
    EXPECT_EQ(denied.retry_after, seconds(50));

    EXPECT_TRUE(limiter.admit(1, kStart + seconds(61)));
}

TEST(RateLimiterTest, DeniedAttemptsDoNotConsumeBudget) {
    RateLimiter limiter(2, seconds(60));
    EXPECT_TRUE(limiter.admit(1, kStart));
    EXPECT_TRUE(limiter.admit(1, kStart + seconds(1)));

    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(limiter.admit(1, kStart + seconds(2)));
    }
    EXPECT_EQ(limiter.window_size(1), 2u);

    // Only the first timestamp has left the window
    EXPECT_TRUE(limiter.admit(1, kStart + seconds(60)));
    EXPECT_FALSE(limiter.admit(1, kStart + seconds(60)));
}

TEST(RateLimiterTest, RetryAfterIsAtLeastOneSecond) {
    RateLimiter limiter(1, seconds(60));
    ASSERT_TRUE(limiter.admit(1, kStart));

    auto denied = limiter.admit(1, kStart + seconds(59) + std::chrono::milliseconds(900));
    EXPECT_FALSE(denied);
    EXPECT_EQ(denied.retry_after, seconds(1));
}

TEST(RateLimiterTest, UsersHaveIndependentWindows) {
    RateLimiter limiter(3, seconds(60));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.admit(1, kStart));
    }
    EXPECT_FALSE(limiter.admit(1, kStart));
    EXPECT_TRUE(limiter.admit(2, kStart));
    EXPECT_EQ(limiter.window_size(2), 1u);
}

TEST(RateLimiterTest, EvictsExpiredTimestampsOnCheck) {
    RateLimiter limiter(10, seconds(60));
    for (int i = 0; i < 5; ++i) {
        limiter.admit(1, kStart);
    }
    EXPECT_EQ(limiter.window_size(1), 5u);

    limiter.admit(1, kStart + seconds(120));
    EXPECT_EQ(limiter.window_size(1), 1u);
}

TEST(RateLimiterTest, UnknownUserHasEmptyWindow) {
    RateLimiter limiter;
    EXPECT_EQ(limiter.window_size(42), 0u);
}

TEST(RateLimiterTest, ConcurrentAdmitsNeverExceedLimit) {
    RateLimiter limiter(50, seconds(60));
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                if (limiter.admit(7, kStart)) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(admitted.load(), 50);
    EXPECT_EQ(limiter.window_size(7), 50u);
}
