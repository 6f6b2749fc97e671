#include "carydes/controller/SessionController.hpp"
#include "carydes/config/AppConfig.hpp"
#include "carydes/core/UserLock.hpp"
#include "carydes/models/Errors.hpp"
#include "carydes/services/ConversationStore.hpp"
#include "carydes/services/InferenceClient.hpp"
#include "carydes/services/RateLimiter.hpp"
#include "carydes/services/Sanitizer.hpp"
#include "carydes/services/SessionService.hpp"
#include "carydes/services/TranscriptLogger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <spdlog/spdlog.h>

namespace carydes {
namespace controller {

    namespace {
        const char* const kCommandList =
            "**Commands:**\n"
            "/start - Start CARYDES\n"
            "/help - Show this help message\n"
            "/new - Start a new conversation (saves previous context)\n"
            "/reset - Clear conversation context (no save)\n"
            "/status - Check AI service status";

        const char* const kNotAuthorized = "❌ You are not authorized to use this bot.";
        const char* const kInvalidMessage = "❌ Invalid message.";
        const char* const kServiceUnavailable = "❌ Cannot connect to AI service. Please ensure it's running.";
        const char* const kTimedOut = "⏱️ Request timed out. The AI might be processing a long response.";
        const char* const kUpstreamError = "❌ Error from AI service. Please try again.";
    }

    SessionController::SessionController(
        const config::AppConfig& config,
        services::RateLimiter& rateLimiter,
        services::ConversationStore& conversationStore,
        services::TranscriptLogger& transcriptLogger,
        services::SessionService& sessionService,
        services::InferenceClient& inferenceClient,
        ClockFunction clock
    ) : _config(config),
        _rateLimiter(rateLimiter),
        _conversationStore(conversationStore),
        _transcriptLogger(transcriptLogger),
        _sessionService(sessionService),
        _inferenceClient(inferenceClient),
        _clock(std::move(clock)) {}

    bool SessionController::isAuthorized(models::UserId userId) const {
        return _config.isWhitelisted(userId);
    }

    std::optional<models::Command> SessionController::parseCommand(const std::string& text) {
        if (text.empty() || text[0] != '/') {
            return std::nullopt;
        }

        auto end = text.find_first_of(" @\t\r\n", 1);
        std::string name = text.substr(1, end == std::string::npos ? std::string::npos : end - 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (name == "start") return models::Command::START;
        if (name == "help") return models::Command::HELP;
        if (name == "new") return models::Command::NEW;
        if (name == "reset") return models::Command::RESET;
        if (name == "status") return models::Command::STATUS;
        return models::Command::UNKNOWN;
    }

    models::SessionResult SessionController::handle(models::UserId userId, const std::string& text,
                                                    const ProgressCallback& onAwaitingModel) {
        if (auto command = parseCommand(text)) {
            return handleCommand(userId, *command);
        }
        return handleMessage(userId, text, onAwaitingModel);
    }

    models::SessionResult SessionController::reject(models::SessionState state, models::SessionError error,
                                                    const std::string& reply) const {
        models::SessionResult result;
        result.state = state;
        result.error = error;
        result.reply = reply;
        return result;
    }

    models::SessionResult SessionController::handleMessage(models::UserId userId, const std::string& text,
                                                           const ProgressCallback& onAwaitingModel) {
        // Received -> Authorized
        if (!isAuthorized(userId)) {
            spdlog::warn("[SessionController] Unauthorized access attempt by user {}", userId);
            return reject(models::SessionState::REJECTED_UNAUTHORIZED, models::SessionError::AUTHORIZATION, kNotAuthorized);
        }

        // Authorized -> Sanitized; raw input is never echoed or logged
        auto validated = services::Sanitizer::validate_message(text, _config.max_message_length);
        if (!validated) {
            spdlog::warn("[SessionController] Rejected message from user {}: {}",
                         userId, services::to_string(*validated.reason));
            std::string reply = kInvalidMessage;
            if (*validated.reason == services::RejectionReason::TOO_LONG) {
                reply = "❌ Message too long. Maximum length is " +
                        std::to_string(_config.max_message_length) + " characters.";
            }
            return reject(models::SessionState::REJECTED_INVALID_INPUT, models::SessionError::VALIDATION, reply);
        }

        std::string content = services::Sanitizer::filter_prompt_injection(validated.text);
        if (content.empty()) {
            spdlog::warn("[SessionController] Rejected message from user {}: {}", userId,
                         services::to_string(services::RejectionReason::EMPTY_AFTER_TRIM));
            return reject(models::SessionState::REJECTED_INVALID_INPUT, models::SessionError::VALIDATION, kInvalidMessage);
        }

        // Sanitized -> RateChecked
        auto decision = _rateLimiter.admit(userId, _clock());
        if (!decision) {
            auto result = reject(models::SessionState::REJECTED_RATE_LIMITED, models::SessionError::RATE_LIMIT,
                                 "⏳ Too many messages. Please wait " +
                                 std::to_string(decision.retry_after.count()) + " seconds.");
            result.retry_after = decision.retry_after;
            return result;
        }

        // RateChecked -> Contextualized; the lock is held through logging
        std::unique_lock<core::UserLock> userLock(_sessionService.lock_for(userId));

        auto userTurn = models::ConversationTurn::user(content, _clock());
        services::InferenceRequest request;
        request.context = _conversationStore.snapshot(userId);
        request.context.push_back(userTurn);
        request.max_tokens = _config.max_tokens;
        request.temperature = _config.temperature;

        if (onAwaitingModel) {
            try {
                onAwaitingModel();
            } catch (const std::exception& e) {
                spdlog::debug("[SessionController] Progress callback failed for user {}: {}", userId, e.what());
            }
        }

        // Contextualized -> AwaitingModel
        std::string reply;
        try {
            reply = _inferenceClient.complete(request);
        } catch (const models::UpstreamError& e) {
            spdlog::error("[SessionController] Inference failed for user {} ({}): {}",
                          userId, models::to_string(e.fault()), e.what());
            const char* message = kUpstreamError;
            if (e.fault() == models::UpstreamFault::TIMEOUT) {
                message = kTimedOut;
            } else if (e.fault() == models::UpstreamFault::CONNECTION) {
                message = kServiceUnavailable;
            }
            return reject(models::SessionState::FAILED_UPSTREAM, models::SessionError::UPSTREAM, message);
        } catch (const std::exception& e) {
            spdlog::error("[SessionController] Unexpected inference error for user {}: {}", userId, e.what());
            return reject(models::SessionState::FAILED_UPSTREAM, models::SessionError::UPSTREAM, kServiceUnavailable);
        }

        // AwaitingModel -> Logged
        auto assistantTurn = models::ConversationTurn::assistant(reply, _clock());
        _conversationStore.append(userId, userTurn);
        _conversationStore.append(userId, assistantTurn);

        models::SessionResult result;
        bool userLogged = _transcriptLogger.record(userId, userTurn);
        bool assistantLogged = _transcriptLogger.record(userId, assistantTurn);
        if (!userLogged || !assistantLogged) {
            spdlog::warn("[SessionController] Transcript write failed for user {}, reply still delivered", userId);
            result.logging_failed = true;
        }
        _sessionService.record_exchange(userId);

        // Logged -> Replied
        userLock.unlock();
        result.state = models::SessionState::REPLIED;
        result.reply = reply;
        return result;
    }

    models::SessionResult SessionController::handleCommand(models::UserId userId, models::Command command) {
        if (!isAuthorized(userId)) {
            spdlog::warn("[SessionController] Unauthorized command attempt by user {}", userId);
            return reject(models::SessionState::REJECTED_UNAUTHORIZED, models::SessionError::AUTHORIZATION, kNotAuthorized);
        }

        if (command == models::Command::STATUS) {
            return statusReport(userId);
        }

        std::lock_guard<core::UserLock> userLock(_sessionService.lock_for(userId));
        models::SessionResult result;
        result.state = models::SessionState::REPLIED;

        switch (command) {
            case models::Command::START:
                _sessionService.start_session(userId);
                result.reply = std::string(
                    "👋 Hello! I'm **CARYDES**, your personal AI assistant.\n\n"
                    "I can help you with tasks, remind you of things, and have natural conversations. "
                    "Just send me a message!\n\n") + kCommandList;
                break;
            case models::Command::HELP:
                result.reply = std::string(
                    "🤖 **Help Guide**\n\n"
                    "I'm your personal AI assistant powered by a local AI model.\n\n"
                    "**Usage:**\n"
                    "Simply send me any message and I'll respond.\n\n") + kCommandList;
                break;
            case models::Command::NEW:
                if (!_conversationStore.clear_with_boundary(userId, _transcriptLogger)) {
                    result.logging_failed = true;
                }
                _sessionService.start_session(userId);
                result.reply = "✅ Starting a new conversation. Previous context has been saved.";
                break;
            case models::Command::RESET:
                _conversationStore.clear(userId);
                result.reply = "✅ Conversation context has been reset.";
                break;
            case models::Command::STATUS:
            case models::Command::UNKNOWN:
                result.reply = "❓ Unknown command. Send /help to see what I can do.";
                break;
        }
        return result;
    }

    models::SessionResult SessionController::statusReport(models::UserId userId) {
        std::lock_guard<core::UserLock> userLock(_sessionService.lock_for(userId));

        models::SessionResult result;
        result.state = models::SessionState::REPLIED;
        bool reachable = _inferenceClient.is_reachable();
        result.reply = reachable
            ? "✅ LM Studio is running and responding."
            : "⚠️ LM Studio is not responding. Please check that the server is running.";
        result.reply += "\n💬 Turns in context: " + std::to_string(_conversationStore.size(userId)) +
                        "/" + std::to_string(_conversationStore.max_turns());
        return result;
    }

}
}
