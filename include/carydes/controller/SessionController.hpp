#ifndef CARYDES_CONTROLLER_SESSION_CONTROLLER_HPP
#define CARYDES_CONTROLLER_SESSION_CONTROLLER_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "carydes/models/ConversationTurn.hpp"
#include "carydes/models/SessionResult.hpp"

namespace carydes {
    namespace config {
        class AppConfig;
    }
    namespace services {
        class RateLimiter;
        class ConversationStore;
        class TranscriptLogger;
        class SessionService;
        class InferenceClient;
    }
}

namespace carydes {
namespace controller {

    /**
     * @brief Runs one inbound message or command through the safety pipeline
     *
     * Text: authorize, validate and filter, rate-limit, then under the user's
     * lock read the history, call the model, store both turns and log them.
     * Commands skip validation and rate limiting but still need
     * authorization and run under the user's lock.
     *
     * Every outcome is returned as a SessionResult; nothing here throws for a
     * per-message failure and a failed model call leaves no trace in history
     * or transcript.
     */
    class SessionController {
    public:
        using Clock = std::chrono::system_clock;
        using ClockFunction = std::function<Clock::time_point()>;
        // Invoked once the request is built, before the model call
        using ProgressCallback = std::function<void()>;

        SessionController(
            const config::AppConfig& config,
            services::RateLimiter& rateLimiter,
            services::ConversationStore& conversationStore,
            services::TranscriptLogger& transcriptLogger,
            services::SessionService& sessionService,
            services::InferenceClient& inferenceClient,
            ClockFunction clock = []() { return Clock::now(); }
        );

        models::SessionResult handle(models::UserId userId, const std::string& text,
                                     const ProgressCallback& onAwaitingModel = nullptr);

        models::SessionResult handleMessage(models::UserId userId, const std::string& text,
                                            const ProgressCallback& onAwaitingModel = nullptr);

        models::SessionResult handleCommand(models::UserId userId, models::Command command);

        bool isAuthorized(models::UserId userId) const;

        // nullopt when text is not a command
        static std::optional<models::Command> parseCommand(const std::string& text);

    private:
        models::SessionResult reject(models::SessionState state, models::SessionError error,
                                     const std::string& reply) const;
        models::SessionResult statusReport(models::UserId userId);

        const config::AppConfig& _config;
        services::RateLimiter& _rateLimiter;
        services::ConversationStore& _conversationStore;
        services::TranscriptLogger& _transcriptLogger;
        services::SessionService& _sessionService;
        services::InferenceClient& _inferenceClient;
        ClockFunction _clock;
    };

}
}

#endif // CARYDES_CONTROLLER_SESSION_CONTROLLER_HPP
