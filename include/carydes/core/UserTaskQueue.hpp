#ifndef CARYDES_CORE_USER_TASK_QUEUE_HPP
#define CARYDES_CORE_USER_TASK_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

#include "carydes/models/ConversationTurn.hpp"

namespace carydes {
namespace core {

/**
 * @brief Fixed pool of worker threads with one FIFO queue per user
 *
 * A user's tasks run one at a time in the order they were posted; tasks of
 * different users run in parallel up to the number of workers. The workers
 * are plain threads owned by the queue, so blocking inside a task (HTTP
 * round trips, retry backoff) never starves the cpprest thread pool that
 * completes those requests.
 *
 * A user has an entry in the queue map exactly while one of their tasks is
 * running or they are waiting in the ready list.
 */
class UserTaskQueue {
public:
    using Task = std::function<void()>;

    explicit UserTaskQueue(size_t workers) {
        if (workers == 0) {
            workers = 1;
        }
        _workers.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            _workers.emplace_back([this]() { worker_loop(); });
        }
    }

    UserTaskQueue(const UserTaskQueue&) = delete;
    UserTaskQueue& operator=(const UserTaskQueue&) = delete;

    ~UserTaskQueue() {
        shutdown();
    }

    // false once shutdown() has started
    bool post(models::UserId user_id, Task task) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_stopping) {
                return false;
            }
            ++_pending;
            auto it = _queues.find(user_id);
            if (it != _queues.end()) {
                it->second.push_back(std::move(task));
                return true;
            }
            _queues[user_id].push_back(std::move(task));
            _ready.push_back(user_id);
        }
        _available.notify_one();
        return true;
    }

    /**
     * @brief Run everything already posted, then join the workers
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _stopping = true;
        }
        _available.notify_all();
        for (auto& worker : _workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    // Tasks queued or running
    size_t pending() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _pending;
    }

    size_t workers() const { return _workers.size(); }

private:
    void worker_loop() {
        std::unique_lock<std::mutex> lock(_mutex);
        for (;;) {
            _available.wait(lock, [this]() { return _stopping || !_ready.empty(); });
            if (_ready.empty()) {
                return;
            }

            const models::UserId user_id = _ready.front();
            _ready.pop_front();
            Task task = std::move(_queues[user_id].front());
            _queues[user_id].pop_front();
            lock.unlock();

            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("[UserTaskQueue] Task for user {} failed: {}", user_id, e.what());
            }

            lock.lock();
            --_pending;
            auto it = _queues.find(user_id);
            if (it->second.empty()) {
                _queues.erase(it);
            } else {
                _ready.push_back(user_id);
                _available.notify_one();
            }
        }
    }

    mutable std::mutex _mutex;
    std::condition_variable _available;
    std::unordered_map<models::UserId, std::deque<Task>> _queues;
    std::deque<models::UserId> _ready;
    size_t _pending = 0;
    bool _stopping = false;
    std::vector<std::thread> _workers;
};

} // namespace core
} // namespace carydes

#endif // CARYDES_CORE_USER_TASK_QUEUE_HPP
