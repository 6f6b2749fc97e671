#ifndef CARYDES_SERVICES_TELEGRAM_GATEWAY_HPP
#define CARYDES_SERVICES_TELEGRAM_GATEWAY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <cpprest/http_client.h>
#include <pplx/pplxtasks.h>

#include "carydes/core/UserTaskQueue.hpp"
#include "carydes/models/ConversationTurn.hpp"

namespace carydes {
    namespace config {
        class AppConfig;
    }
    namespace controller {
        class SessionController;
    }
}

namespace carydes {
    namespace services {

        struct InboundMessage {
            int64_t update_id = 0;
            models::UserId user_id = 0;
            int64_t chat_id = 0;
            std::string text;
        };

        /**
         * @brief Telegram Bot API transport
         *
         * Long-polls getUpdates and hands each text message to the
         * SessionController on the gateway's own worker threads
         * (worker_threads in AppConfig). Messages from one user are queued so
         * they are handled in arrival order; different users run concurrently.
         */
        class TelegramGateway {
        public:
            TelegramGateway(const config::AppConfig& config, controller::SessionController& controller);
            ~TelegramGateway();

            // Blocks until stop()
            void run();
            void stop();

            bool send_message(int64_t chat_id, const std::string& text);
            void send_chat_action(int64_t chat_id, const std::string& action);

            static std::optional<InboundMessage> parse_update(const nlohmann::json& update);

        private:
            void poll_once();
            void dispatch(const InboundMessage& message);
            void process(const InboundMessage& message);
            // Send calls are not cancellable so replies still go out during shutdown
            nlohmann::json call(web::http::client::http_client& client, const std::string& method,
                                const nlohmann::json& payload,
                                const pplx::cancellation_token& token = pplx::cancellation_token::none());

            controller::SessionController& _controller;
            std::string _bot_path;
            web::http::client::http_client _poll_client;
            web::http::client::http_client _send_client;
            pplx::cancellation_token_source _cancellation;

            std::atomic<bool> _running;
            int64_t _offset;

            // Declared last: its workers must stop before the members they use
            core::UserTaskQueue _workers;
        };

    }
}

#endif // CARYDES_SERVICES_TELEGRAM_GATEWAY_HPP
