#include "carydes/services/RateLimiter.hpp"
#include <spdlog/spdlog.h>

namespace carydes {
    namespace services {

        RateLimiter::RateLimiter(uint32_t max_messages, std::chrono::seconds window)
            : _max_messages(max_messages), _window(window) {}

        AdmitDecision RateLimiter::admit(models::UserId user_id, Clock::time_point now) {
            RateWindow& rate_window = _windows.get_or_create(user_id);
            std::lock_guard<std::mutex> lock(rate_window.mutex);

            auto& timestamps = rate_window.timestamps;
            const auto window_start = now - _window;
            while (!timestamps.empty() && timestamps.front() <= window_start) {
                timestamps.pop_front();
            }

            if (timestamps.size() < _max_messages) {
                timestamps.push_back(now);
                return AdmitDecision{true, std::chrono::seconds(0)};
            }

            // Wait until the oldest entry leaves the window, rounded up
            auto remaining = timestamps.front() + _window - now;
            auto retry_after = std::chrono::duration_cast<std::chrono::seconds>(remaining);
            if (retry_after < remaining) {
                retry_after += std::chrono::seconds(1);
            }
            if (retry_after < std::chrono::seconds(1)) {
                retry_after = std::chrono::seconds(1);
            }

            spdlog::warn("[RateLimiter] Rate limit exceeded for user {} (retry in {}s)", user_id, retry_after.count());
            return AdmitDecision{false, retry_after};
        }

        size_t RateLimiter::window_size(models::UserId user_id) const {
            RateWindow* rate_window = _windows.find(user_id);
            if (rate_window == nullptr) {
                return 0;
            }
            std::lock_guard<std::mutex> lock(rate_window->mutex);
            return rate_window->timestamps.size();
        }

    }
}
