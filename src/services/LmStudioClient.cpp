#include "carydes/services/LmStudioClient.hpp"
#include "carydes/config/AppConfig.hpp"
#include "carydes/models/Errors.hpp"
#include "carydes/services/Sanitizer.hpp"

#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

using namespace web;
using namespace web::http;
using namespace web::http::client;

namespace carydes {
    namespace services {

        namespace {
            http_client make_client(const std::string& base_url, std::chrono::seconds timeout) {
                http_client_config client_config;
                client_config.set_timeout(timeout);
                return http_client(U(base_url), client_config);
            }
        }

        LmStudioClient::LmStudioClient(const config::AppConfig& config)
            : _system_prompt(config.system_prompt),
              _max_retries(config.max_retries),
              _request_timeout(config.request_timeout_seconds),
              _status_timeout(config.status_timeout_seconds) {
            auto checked = Sanitizer::validate_url(config.lm_studio_url);
            if (!checked) {
                throw models::ConfigurationError("Refusing inference URL " + config.lm_studio_url +
                                                 ": " + to_string(*checked.reason));
            }
            _base_url = checked.text;
        }

        nlohmann::json LmStudioClient::build_payload(const InferenceRequest& request) const {
            nlohmann::json messages = nlohmann::json::array();
            messages.push_back({{"role", "system"}, {"content", _system_prompt}});
            for (const auto& turn : request.context) {
                messages.push_back(turn.toJson());
            }

            return {
                {"model", "local-model"},
                {"messages", messages},
                {"temperature", request.temperature},
                {"max_tokens", request.max_tokens}
            };
        }

        std::string LmStudioClient::extract_reply(const nlohmann::json& body) {
            if (!body.is_object() || !body.contains("choices") ||
                !body["choices"].is_array() || body["choices"].empty()) {
                throw models::UpstreamError(models::UpstreamFault::MALFORMED, "Invalid response from LM Studio: no choices");
            }

            const auto& choice = body["choices"][0];
            if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
                throw models::UpstreamError(models::UpstreamFault::MALFORMED, "Invalid response from LM Studio: no message");
            }

            const auto& content = choice["message"].value("content", nlohmann::json());
            if (!content.is_string() || content.get<std::string>().empty()) {
                throw models::UpstreamError(models::UpstreamFault::MALFORMED, "Empty response from LM Studio");
            }
            return content.get<std::string>();
        }

        std::string LmStudioClient::complete(const InferenceRequest& request) {
            const nlohmann::json payload = build_payload(request);
            http_client client = make_client(_base_url, _request_timeout);

            for (uint32_t attempt = 0;; ++attempt) {
                try {
                    return post_completion(client, payload);
                } catch (const models::UpstreamError& e) {
                    if (!e.retryable() || attempt >= _max_retries) {
                        throw;
                    }
                    spdlog::warn("[LmStudioClient] {} ({}), retrying (attempt {})",
                                 e.what(), models::to_string(e.fault()), attempt + 1);
                    std::this_thread::sleep_for(std::chrono::seconds(1) * (attempt + 1));
                }
            }
        }

        std::string LmStudioClient::post_completion(http_client& client, const nlohmann::json& payload) {
            http_request request(methods::POST);
            request.set_request_uri(U("/v1/chat/completions"));
            request.set_body(payload.dump(), "application/json");

            http_response response;
            std::string body;
            try {
                response = client.request(request).get();
                body = response.extract_utf8string(true).get();
            } catch (const http_exception& e) {
                if (e.error_code() == std::errc::timed_out) {
                    throw models::UpstreamError(models::UpstreamFault::TIMEOUT, "Request to LM Studio timed out");
                }
                throw models::UpstreamError(models::UpstreamFault::CONNECTION,
                                            std::string("Cannot connect to LM Studio: ") + e.what());
            }

            const int status = response.status_code();
            if (status >= 300 && status < 400) {
                throw models::UpstreamError(models::UpstreamFault::REDIRECT,
                                            "LM Studio answered with redirect " + std::to_string(status), status);
            }
            if (status != status_codes::OK) {
                spdlog::error("[LmStudioClient] LM Studio error {}: {}", status, body.substr(0, 200));
                throw models::UpstreamError(models::UpstreamFault::HTTP_STATUS,
                                            "LM Studio returned HTTP " + std::to_string(status), status);
            }

            nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
            if (parsed.is_discarded()) {
                throw models::UpstreamError(models::UpstreamFault::MALFORMED, "LM Studio returned a non-JSON body");
            }
            return extract_reply(parsed);
        }

        bool LmStudioClient::is_reachable() {
            try {
                http_client client = make_client(_base_url, _status_timeout);
                auto response = client.request(methods::GET, U("/v1/models")).get();
                return response.status_code() == status_codes::OK;
            } catch (const std::exception& e) {
                spdlog::debug("[LmStudioClient] Status check failed: {}", e.what());
                return false;
            }
        }

    }
}
