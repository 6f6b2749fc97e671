#ifndef CARYDES_CORE_USER_ARENA_HPP
#define CARYDES_CORE_USER_ARENA_HPP

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "carydes/models/ConversationTurn.hpp"

namespace carydes {
namespace core {

/**
 * @brief Per-user state container with a single creation path
 *
 * Entries are created lazily on first access and live for the whole
 * process. Lookups take a shared lock; creation takes the exclusive lock
 * and re-checks, so two threads racing on a user's first message always
 * end up with the same entry. References returned by get_or_create()
 * stay valid for the arena's lifetime.
 */
template<typename T>
class UserArena {
public:
    UserArena() = default;
    UserArena(const UserArena&) = delete;
    UserArena& operator=(const UserArena&) = delete;

    T& get_or_create(models::UserId user_id) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(user_id);
            if (it != entries_.end()) {
                return *it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = entries_[user_id];
        if (!slot) {
            slot = std::make_unique<T>();
        }
        return *slot;
    }

    /**
     * @brief Lookup without creating; nullptr when the user was never seen
     */
    T* find(models::UserId user_id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(user_id);
        return it != entries_.end() ? it->second.get() : nullptr;
    }

    std::vector<models::UserId> user_ids() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<models::UserId> ids;
        ids.reserve(entries_.size());
        for (const auto& pair : entries_) {
            ids.push_back(pair.first);
        }
        return ids;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<models::UserId, std::unique_ptr<T>> entries_;
};

} // namespace core
} // namespace carydes

#endif // CARYDES_CORE_USER_ARENA_HPP
