#ifndef CARYDES_MODELS_SESSION_RESULT_HPP
#define CARYDES_MODELS_SESSION_RESULT_HPP

#include <chrono>
#include <optional>
#include <string>

namespace carydes {
    namespace models {

        enum class SessionState {
            RECEIVED,
            AUTHORIZED,
            SANITIZED,
            RATE_CHECKED,
            CONTEXTUALIZED,
            AWAITING_MODEL,
            LOGGED,
            REPLIED,
            REJECTED_UNAUTHORIZED,
            REJECTED_INVALID_INPUT,
            REJECTED_RATE_LIMITED,
            FAILED_UPSTREAM
        };

        inline const char* to_string(SessionState state) {
            switch (state) {
                case SessionState::RECEIVED: return "received";
                case SessionState::AUTHORIZED: return "authorized";
                case SessionState::SANITIZED: return "sanitized";
                case SessionState::RATE_CHECKED: return "rate_checked";
                case SessionState::CONTEXTUALIZED: return "contextualized";
                case SessionState::AWAITING_MODEL: return "awaiting_model";
                case SessionState::LOGGED: return "logged";
                case SessionState::REPLIED: return "replied";
                case SessionState::REJECTED_UNAUTHORIZED: return "rejected_unauthorized";
                case SessionState::REJECTED_INVALID_INPUT: return "rejected_invalid_input";
                case SessionState::REJECTED_RATE_LIMITED: return "rejected_rate_limited";
                case SessionState::FAILED_UPSTREAM: return "failed_upstream";
            }
            return "unknown";
        }

        // Error classes surfaced to the transport
        enum class SessionError {
            AUTHORIZATION,
            VALIDATION,
            RATE_LIMIT,
            UPSTREAM
        };

        enum class Command {
            START,
            HELP,
            NEW,
            RESET,
            STATUS,
            UNKNOWN
        };

        struct SessionResult {
            SessionState state = SessionState::RECEIVED;
            std::string reply;
            std::optional<SessionError> error;
            std::optional<std::chrono::seconds> retry_after;
            // Transcript write failed; the reply is still delivered
            bool logging_failed = false;

            bool ok() const { return !error.has_value(); }
        };

    }
}

#endif // CARYDES_MODELS_SESSION_RESULT_HPP
