#ifndef CARYDES_SERVICES_SESSION_SERVICE_HPP
#define CARYDES_SERVICES_SESSION_SERVICE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

#include "carydes/core/UserArena.hpp"
#include "carydes/core/UserLock.hpp"
#include "carydes/models/ConversationTurn.hpp"

namespace carydes {
namespace services {

struct SessionInfo {
    models::UserId user_id = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point last_activity;
    size_t exchanges = 0;
};

/**
 * @brief Per-user locks and session bookkeeping
 *
 * Owns exactly one UserLock per user for the process lifetime. Callers hold
 * lock_for(user) for the whole of an exchange or command.
 */
class SessionService {
public:
    SessionService() = default;

    core::UserLock& lock_for(models::UserId user_id);

    // Session lifecycle
    void start_session(models::UserId user_id);
    void record_exchange(models::UserId user_id);

    std::optional<SessionInfo> get_session(models::UserId user_id) const;
    std::vector<SessionInfo> get_all_sessions() const;

private:
    struct UserSession {
        core::UserLock lock;
        mutable std::mutex info_mutex;
        std::optional<SessionInfo> info;
    };

    UserSession& session(models::UserId user_id);

    mutable core::UserArena<UserSession> _sessions;
};

} // namespace services
} // namespace carydes

#endif // CARYDES_SERVICES_SESSION_SERVICE_HPP
