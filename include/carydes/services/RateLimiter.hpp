#ifndef CARYDES_SERVICES_RATE_LIMITER_HPP
#define CARYDES_SERVICES_RATE_LIMITER_HPP

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

#include "carydes/core/UserArena.hpp"
#include "carydes/models/ConversationTurn.hpp"

namespace carydes {
    namespace services {

        struct AdmitDecision {
            bool admitted;
            // Zero when admitted
            std::chrono::seconds retry_after;

            explicit operator bool() const { return admitted; }
        };

        /**
         * @brief Sliding-window message limiter, one window per user
         */
        class RateLimiter {
        public:
            using Clock = std::chrono::system_clock;

            RateLimiter(uint32_t max_messages = 10,
                        std::chrono::seconds window = std::chrono::seconds(60));

            AdmitDecision admit(models::UserId user_id, Clock::time_point now = Clock::now());

            // Timestamps still inside the window as of the last check
            size_t window_size(models::UserId user_id) const;

            uint32_t max_messages() const { return _max_messages; }
            std::chrono::seconds window() const { return _window; }

        private:
            struct RateWindow {
                std::mutex mutex;
                std::deque<Clock::time_point> timestamps;
            };

            const uint32_t _max_messages;
            const std::chrono::seconds _window;
            core::UserArena<RateWindow> _windows;
        };

    }
}

#endif // CARYDES_SERVICES_RATE_LIMITER_HPP
