#include "carydes/services/SessionService.hpp"
#include <spdlog/spdlog.h>

namespace carydes {
namespace services {

SessionService::UserSession& SessionService::session(models::UserId user_id) {
    return _sessions.get_or_create(user_id);
}

core::UserLock& SessionService::lock_for(models::UserId user_id) {
    return session(user_id).lock;
}

void SessionService::start_session(models::UserId user_id) {
    UserSession& entry = session(user_id);
    std::lock_guard<std::mutex> lock(entry.info_mutex);

    SessionInfo info;
    info.user_id = user_id;
    info.start_time = std::chrono::system_clock::now();
    info.last_activity = info.start_time;
    info.exchanges = 0;

    entry.info = info;
    spdlog::info("[SessionService] Started session for user: {}", user_id);
}

void SessionService::record_exchange(models::UserId user_id) {
    UserSession& entry = session(user_id);
    std::lock_guard<std::mutex> lock(entry.info_mutex);

    auto now = std::chrono::system_clock::now();
    if (!entry.info) {
        entry.info = SessionInfo{user_id, now, now, 0};
    }
    entry.info->last_activity = now;
    ++entry.info->exchanges;
}

std::optional<SessionInfo> SessionService::get_session(models::UserId user_id) const {
    const UserSession* entry = _sessions.find(user_id);
    if (entry == nullptr) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->info_mutex);
    return entry->info;
}

std::vector<SessionInfo> SessionService::get_all_sessions() const {
    std::vector<SessionInfo> sessions;
    for (auto user_id : _sessions.user_ids()) {
        if (auto info = get_session(user_id)) {
            sessions.push_back(*info);
        }
    }
    return sessions;
}

} // namespace services
} // namespace carydes
