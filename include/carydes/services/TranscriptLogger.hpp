#ifndef CARYDES_SERVICES_TRANSCRIPT_LOGGER_HPP
#define CARYDES_SERVICES_TRANSCRIPT_LOGGER_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

#include "carydes/models/ConversationTurn.hpp"
#include "carydes/services/Sanitizer.hpp"

namespace carydes {
    namespace services {

        /**
         * @brief Append-only per-user, per-day chat transcripts
         *
         * Layout: <root>/<user_id>/<YYYY-MM-DD>.txt, one line per record:
         *   [YYYY-MM-DD HH:MM:SS] [role] text
         * Paths are built from the numeric user id and the date only. Every
         * text goes through Sanitizer::sanitize_for_log first.
         *
         * Writes for one user are expected to be serialized by that user's
         * lock; different users never share a file.
         */
        class TranscriptLogger {
        public:
            using Clock = std::chrono::system_clock;
            using ClockFunction = std::function<Clock::time_point()>;

            static constexpr const char* NEW_SESSION_LABEL = "--- NEW SESSION STARTED ---";

            explicit TranscriptLogger(const std::string& root_dir,
                                      size_t max_line_length = Sanitizer::DEFAULT_MAX_LOG_LINE_LENGTH,
                                      ClockFunction clock = []() { return Clock::now(); });

            // false when the line could not be written
            bool record(models::UserId user_id, const models::ConversationTurn& turn);
            bool record_boundary(models::UserId user_id, const std::string& label = NEW_SESSION_LABEL);

            std::filesystem::path file_for(models::UserId user_id, Clock::time_point when) const;
            const std::filesystem::path& root() const { return _root; }

        private:
            bool append_line(models::UserId user_id, Clock::time_point when,
                             const std::string& role, const std::string& text);

            std::filesystem::path _root;
            size_t _max_line_length;
            ClockFunction _clock;
        };

    }
}

#endif // CARYDES_SERVICES_TRANSCRIPT_LOGGER_HPP
