#ifndef CARYDES_CORE_USER_LOCK_HPP
#define CARYDES_CORE_USER_LOCK_HPP

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace carydes {
namespace core {

/**
 * @brief Fair mutual-exclusion handle for one user
 *
 * Ticket lock: waiters are served strictly in the order they called lock(),
 * so a user's exchanges run one at a time and in arrival order. Satisfies
 * BasicLockable, use it through std::unique_lock / std::lock_guard.
 */
class UserLock {
public:
    UserLock() = default;
    UserLock(const UserLock&) = delete;
    UserLock& operator=(const UserLock&) = delete;

    void lock() {
        std::unique_lock<std::mutex> guard(_mutex);
        const uint64_t ticket = _next_ticket++;
        _turn.wait(guard, [this, ticket]() { return _now_serving == ticket; });
    }

    bool try_lock() {
        std::lock_guard<std::mutex> guard(_mutex);
        if (_now_serving != _next_ticket) {
            return false;
        }
        ++_next_ticket;
        return true;
    }

    void unlock() {
        {
            std::lock_guard<std::mutex> guard(_mutex);
            ++_now_serving;
        }
        _turn.notify_all();
    }

    // Holders plus waiters
    uint64_t pending() const {
        std::lock_guard<std::mutex> guard(_mutex);
        return _next_ticket - _now_serving;
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _turn;
    uint64_t _next_ticket = 0;
    uint64_t _now_serving = 0;
};

} // namespace core
} // namespace carydes

#endif // CARYDES_CORE_USER_LOCK_HPP
