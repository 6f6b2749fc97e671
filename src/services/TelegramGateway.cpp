#include "carydes/services/TelegramGateway.hpp"
#include "carydes/config/AppConfig.hpp"
#include "carydes/controller/SessionController.hpp"
#include "carydes/utils/MessageChunker.hpp"

#include <stdexcept>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

using namespace web;
using namespace web::http;
using namespace web::http::client;

namespace carydes {
    namespace services {

        namespace {
            const char* const kTelegramApi = "https://api.telegram.org";
            const int kLongPollSeconds = 30;
            const std::chrono::seconds kPollRetryDelay(5);
            const char* const kUnexpectedError = "⚠️ An unexpected error occurred. Please try again later.";

            http_client_config client_config(std::chrono::seconds timeout) {
                http_client_config config;
                config.set_timeout(timeout);
                return config;
            }
        }

        TelegramGateway::TelegramGateway(const config::AppConfig& config, controller::SessionController& controller)
            : _controller(controller),
              _bot_path("/bot" + config.telegram_bot_token + "/"),
              _poll_client(U(kTelegramApi), client_config(std::chrono::seconds(kLongPollSeconds + 10))),
              _send_client(U(kTelegramApi), client_config(std::chrono::seconds(15))),
              _running(false),
              _offset(0),
              _workers(config.worker_threads) {}

        TelegramGateway::~TelegramGateway() {
            stop();
            _workers.shutdown();
        }

        std::optional<InboundMessage> TelegramGateway::parse_update(const nlohmann::json& update) {
            if (!update.is_object() || !update.contains("message")) {
                return std::nullopt;
            }
            const auto& message = update["message"];
            if (!message.is_object() || !message.contains("text") || !message["text"].is_string() ||
                !message.contains("from") || !message["from"].contains("id") ||
                !message.contains("chat") || !message["chat"].contains("id")) {
                return std::nullopt;
            }

            InboundMessage inbound;
            inbound.update_id = update.value("update_id", int64_t(0));
            inbound.user_id = message["from"]["id"].get<models::UserId>();
            inbound.chat_id = message["chat"]["id"].get<int64_t>();
            inbound.text = message["text"].get<std::string>();
            return inbound;
        }

        void TelegramGateway::run() {
            _running = true;
            spdlog::info("[TelegramGateway] Polling for updates...");

            while (_running) {
                try {
                    poll_once();
                } catch (const pplx::task_canceled&) {
                    break;
                } catch (const std::exception& e) {
                    if (!_running) break;
                    spdlog::error("[TelegramGateway] Polling failed: {}", e.what());
                    for (int i = 0; i < kPollRetryDelay.count() && _running; ++i) {
                        std::this_thread::sleep_for(std::chrono::seconds(1));
                    }
                }
            }

            spdlog::info("[TelegramGateway] Stopped polling, finishing {} queued message(s)", _workers.pending());
            _workers.shutdown();
        }

        void TelegramGateway::stop() {
            if (_running.exchange(false)) {
                _cancellation.cancel();
            }
        }

        nlohmann::json TelegramGateway::call(http_client& client, const std::string& method,
                                             const nlohmann::json& payload, const pplx::cancellation_token& token) {
            http_request request(methods::POST);
            request.set_request_uri(U(_bot_path + method));
            request.set_body(payload.dump(), "application/json");

            auto response = client.request(request, token).get();
            auto body = nlohmann::json::parse(response.extract_utf8string(true).get(), nullptr, false);
            if (body.is_discarded() || !body.value("ok", false)) {
                std::string description = body.is_discarded() ? "invalid JSON" : body.value("description", "unknown error");
                throw std::runtime_error("Telegram " + method + " failed (HTTP " +
                                         std::to_string(response.status_code()) + "): " + description);
            }
            return body.value("result", nlohmann::json());
        }

        void TelegramGateway::poll_once() {
            nlohmann::json payload = {
                {"offset", _offset},
                {"timeout", kLongPollSeconds},
                {"allowed_updates", nlohmann::json::array({"message"})}
            };

            auto updates = call(_poll_client, "getUpdates", payload, _cancellation.get_token());
            if (!updates.is_array()) {
                return;
            }

            for (const auto& update : updates) {
                int64_t update_id = update.value("update_id", int64_t(0));
                if (update_id >= _offset) {
                    _offset = update_id + 1;
                }
                if (auto message = parse_update(update)) {
                    dispatch(*message);
                }
            }
        }

        void TelegramGateway::dispatch(const InboundMessage& message) {
            bool queued = _workers.post(message.user_id, [this, message]() { process(message); });
            if (!queued) {
                spdlog::warn("[TelegramGateway] Dropped update {} from user {} during shutdown",
                             message.update_id, message.user_id);
            }
        }

        void TelegramGateway::process(const InboundMessage& message) {
            try {
                auto result = _controller.handle(message.user_id, message.text, [this, &message]() {
                    send_chat_action(message.chat_id, "typing");
                });

                if (result.reply.empty()) {
                    return;
                }
                for (const auto& chunk : utils::chunk_message(result.reply)) {
                    if (!send_message(message.chat_id, chunk)) {
                        break;
                    }
                }
            } catch (const std::exception& e) {
                spdlog::error("[TelegramGateway] Update {} from user {} caused error: {}",
                              message.update_id, message.user_id, e.what());
                send_message(message.chat_id, kUnexpectedError);
            }
        }

        bool TelegramGateway::send_message(int64_t chat_id, const std::string& text) {
            try {
                call(_send_client, "sendMessage", {{"chat_id", chat_id}, {"text", text}});
                return true;
            } catch (const std::exception& e) {
                spdlog::error("[TelegramGateway] Failed to send message to chat {}: {}", chat_id, e.what());
                return false;
            }
        }

        void TelegramGateway::send_chat_action(int64_t chat_id, const std::string& action) {
            try {
                call(_send_client, "sendChatAction", {{"chat_id", chat_id}, {"action", action}});
            } catch (const std::exception& e) {
                spdlog::debug("[TelegramGateway] Chat action failed for chat {}: {}", chat_id, e.what());
            }
        }

    }
}
