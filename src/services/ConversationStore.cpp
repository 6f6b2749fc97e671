#include "carydes/services/ConversationStore.hpp"
#include <spdlog/spdlog.h>

namespace carydes {
    namespace services {

        ConversationStore::ConversationStore(size_t max_turns) : _max_turns(max_turns) {}

        void ConversationStore::append(models::UserId user_id, const models::ConversationTurn& turn) {
            History& history = _histories.get_or_create(user_id);
            std::lock_guard<std::mutex> lock(history.mutex);

            history.turns.push_back(turn);
            while (history.turns.size() > _max_turns) {
                history.turns.pop_front();
            }
        }

        std::vector<models::ConversationTurn> ConversationStore::snapshot(models::UserId user_id) const {
            const History* history = _histories.find(user_id);
            if (history == nullptr) {
                return {};
            }
            std::lock_guard<std::mutex> lock(history->mutex);
            return std::vector<models::ConversationTurn>(history->turns.begin(), history->turns.end());
        }

        void ConversationStore::clear(models::UserId user_id) {
            History* history = _histories.find(user_id);
            if (history == nullptr) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(history->mutex);
                history->turns.clear();
            }
            spdlog::info("[ConversationStore] Cleared conversation memory for user {}", user_id);
        }

        bool ConversationStore::clear_with_boundary(models::UserId user_id, TranscriptLogger& logger,
                                                    const std::string& label) {
            History& history = _histories.get_or_create(user_id);
            std::lock_guard<std::mutex> lock(history.mutex);

            // Boundary hits the transcript before the clear becomes visible
            bool logged = logger.record_boundary(user_id, label);
            if (!logged) {
                spdlog::warn("[ConversationStore] Session boundary not logged for user {}", user_id);
            }
            history.turns.clear();
            spdlog::info("[ConversationStore] New session started for user {}", user_id);
            return logged;
        }

        size_t ConversationStore::size(models::UserId user_id) const {
            const History* history = _histories.find(user_id);
            if (history == nullptr) {
                return 0;
            }
            std::lock_guard<std::mutex> lock(history->mutex);
            return history->turns.size();
        }

    }
}
