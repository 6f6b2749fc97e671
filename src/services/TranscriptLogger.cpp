#include "carydes/services/TranscriptLogger.hpp"
#include "carydes/utils/TimeUtils.hpp"

#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace carydes {
    namespace services {

        TranscriptLogger::TranscriptLogger(const std::string& root_dir, size_t max_line_length, ClockFunction clock)
            : _root(root_dir), _max_line_length(max_line_length), _clock(std::move(clock)) {}

        std::filesystem::path TranscriptLogger::file_for(models::UserId user_id, Clock::time_point when) const {
            return _root / std::to_string(user_id) / (utils::format_date(when) + ".txt");
        }

        bool TranscriptLogger::record(models::UserId user_id, const models::ConversationTurn& turn) {
            return append_line(user_id, turn.timestamp, models::to_string(turn.role), turn.content);
        }

        bool TranscriptLogger::record_boundary(models::UserId user_id, const std::string& label) {
            return append_line(user_id, _clock(), "system", label);
        }

        bool TranscriptLogger::append_line(models::UserId user_id, Clock::time_point when,
                                           const std::string& role, const std::string& text) {
            const auto path = file_for(user_id, when);

            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                spdlog::error("[TranscriptLogger] Cannot create {}: {}", path.parent_path().string(), ec.message());
                return false;
            }

            std::ofstream file(path, std::ios::app | std::ios::binary);
            if (!file.is_open()) {
                spdlog::error("[TranscriptLogger] Cannot open {}", path.string());
                return false;
            }

            file << "[" << utils::format_timestamp(when) << "] [" << role << "] "
                 << Sanitizer::sanitize_for_log(text, _max_line_length) << "\n";
            file.flush();
            if (!file) {
                spdlog::error("[TranscriptLogger] Write failed for {}", path.string());
                return false;
            }

            spdlog::debug("[TranscriptLogger] Logged message for user {}: [{}]", user_id, role);
            return true;
        }

    }
}
