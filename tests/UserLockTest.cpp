#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "carydes/core/UserLock.hpp"

using carydes::core::UserLock;

namespace {
    void wait_for_pending(const UserLock& lock, uint64_t expected) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (lock.pending() < expected && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

TEST(UserLockTest, TryLockFailsWhileHeld) {
    UserLock lock;
    ASSERT_TRUE(lock.try_lock());
    EXPECT_FALSE(lock.try_lock());
    EXPECT_EQ(lock.pending(), 1u);

    lock.unlock();
    EXPECT_TRUE(lock.try_lock());
    lock.unlock();
    EXPECT_EQ(lock.pending(), 0u);
}

TEST(UserLockTest, ServesWaitersInArrivalOrder) {
    UserLock lock;
    std::mutex order_mutex;
    std::vector<int> order;

    lock.lock();

    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&, i]() {
            std::lock_guard<UserLock> guard(lock);
            std::lock_guard<std::mutex> record(order_mutex);
            order.push_back(i);
        });
        // Holder plus i + 1 queued waiters
        wait_for_pending(lock, static_cast<uint64_t>(i) + 2);
    }

    lock.unlock();
    for (auto& waiter : waiters) {
        waiter.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST(UserLockTest, ProvidesMutualExclusion) {
    UserLock lock;
    int counter = 0;
    int inside = 0;
    int max_inside = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                std::lock_guard<UserLock> guard(lock);
                ++inside;
                max_inside = std::max(max_inside, inside);
                ++counter;
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(counter, 8000);
    EXPECT_EQ(max_inside, 1);
}
