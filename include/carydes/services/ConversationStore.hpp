#ifndef CARYDES_SERVICES_CONVERSATION_STORE_HPP
#define CARYDES_SERVICES_CONVERSATION_STORE_HPP

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "carydes/core/UserArena.hpp"
#include "carydes/models/ConversationTurn.hpp"
#include "carydes/services/TranscriptLogger.hpp"

namespace carydes {
    namespace services {

        /**
         * @brief Bounded in-memory conversation history per user
         *
         * Each history holds at most max_turns turns; append() evicts the
         * oldest turns first. Histories are created on first use and cleared,
         * never destroyed.
         */
        class ConversationStore {
        public:
            explicit ConversationStore(size_t max_turns = 10);

            void append(models::UserId user_id, const models::ConversationTurn& turn);
            std::vector<models::ConversationTurn> snapshot(models::UserId user_id) const;
            void clear(models::UserId user_id);

            /**
             * @brief Write a session boundary to the transcript, then clear
             * @return false when the boundary could not be logged; the history
             *         is cleared either way
             */
            bool clear_with_boundary(models::UserId user_id, TranscriptLogger& logger,
                                     const std::string& label = TranscriptLogger::NEW_SESSION_LABEL);

            size_t size(models::UserId user_id) const;
            size_t max_turns() const { return _max_turns; }

        private:
            struct History {
                mutable std::mutex mutex;
                std::deque<models::ConversationTurn> turns;
            };

            const size_t _max_turns;
            mutable core::UserArena<History> _histories;
        };

    }
}

#endif // CARYDES_SERVICES_CONVERSATION_STORE_HPP
