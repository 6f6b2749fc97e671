#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "carydes/core/UserTaskQueue.hpp"

using carydes::core::UserTaskQueue;

TEST(UserTaskQueueTest, RunsOneUsersTasksInPostedOrder) {
    std::mutex order_mutex;
    std::vector<int> order;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    UserTaskQueue queue(4);
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(queue.post(7, [&, i]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }
            --running;
        }));
    }
    queue.shutdown();

    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[i], i);
    }
    EXPECT_EQ(peak.load(), 1);
}

TEST(UserTaskQueueTest, BlockedUserDoesNotStallOtherUsers) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> others_done;
    std::atomic<int> completed{0};

    UserTaskQueue queue(2);
    queue.post(1, [released]() { released.wait(); });
    for (int i = 0; i < 5; ++i) {
        queue.post(2, [&]() {
            if (++completed == 5) {
                others_done.set_value();
            }
        });
    }

    auto status = others_done.get_future().wait_for(std::chrono::seconds(5));
    EXPECT_EQ(status, std::future_status::ready);

    release.set_value();
    queue.shutdown();
    EXPECT_EQ(queue.pending(), 0u);
}

TEST(UserTaskQueueTest, ShutdownFinishesQueuedWorkAndRefusesNewWork) {
    std::atomic<int> completed{0};

    UserTaskQueue queue(2);
    for (int i = 0; i < 20; ++i) {
        queue.post(i % 3, [&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++completed;
        });
    }
    queue.shutdown();

    EXPECT_EQ(completed.load(), 20);
    EXPECT_FALSE(queue.post(1, [&]() { ++completed; }));
    EXPECT_EQ(completed.load(), 20);
}

TEST(UserTaskQueueTest, FailingTaskDoesNotStopTheWorker) {
    std::atomic<bool> ran{false};

    UserTaskQueue queue(1);
    queue.post(3, []() { throw std::runtime_error("boom"); });
    queue.post(3, [&]() { ran = true; });
    queue.shutdown();

    EXPECT_TRUE(ran.load());
}

TEST(UserTaskQueueTest, ZeroWorkersStillGetsOne) {
    UserTaskQueue queue(0);
    EXPECT_EQ(queue.workers(), 1u);
}
