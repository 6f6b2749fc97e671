#ifndef CARYDES_MODELS_CONVERSATION_TURN_HPP
#define CARYDES_MODELS_CONVERSATION_TURN_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace carydes {
    namespace models {

        // Telegram user identity
        using UserId = int64_t;

        enum class TurnRole {
            USER,
            ASSISTANT
        };

        inline const char* to_string(TurnRole role) {
            switch (role) {
                case TurnRole::USER: return "user";
                case TurnRole::ASSISTANT: return "assistant";
            }
            return "user";
        }

        struct ConversationTurn {
            TurnRole role;
            std::string content;
            std::chrono::system_clock::time_point timestamp;

            static ConversationTurn user(const std::string& content,
                                         std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) {
                return ConversationTurn{TurnRole::USER, content, at};
            }

            static ConversationTurn assistant(const std::string& content,
                                              std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) {
                return ConversationTurn{TurnRole::ASSISTANT, content, at};
            }

            // OpenAI-style chat message
            nlohmann::json toJson() const {
                return {
                    {"role", to_string(role)},
                    {"content", content}
                };
            }
        };

    }
}

#endif // CARYDES_MODELS_CONVERSATION_TURN_HPP
