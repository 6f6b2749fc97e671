#ifndef CARYDES_SERVICES_LM_STUDIO_CLIENT_HPP
#define CARYDES_SERVICES_LM_STUDIO_CLIENT_HPP

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include <cpprest/http_client.h>

#include "carydes/services/InferenceClient.hpp"

namespace carydes {
    namespace config {
        class AppConfig;
    }
    namespace services {

        /**
         * @brief OpenAI-compatible client for a local LM Studio server
         *
         * Only ever talks to the configured loopback base URL; 3xx responses
         * are reported as failures instead of being followed.
         */
        class LmStudioClient : public InferenceClient {
        public:
            explicit LmStudioClient(const config::AppConfig& config);

            std::string complete(const InferenceRequest& request) override;
            bool is_reachable() override;

            nlohmann::json build_payload(const InferenceRequest& request) const;
            static std::string extract_reply(const nlohmann::json& body);

        private:
            std::string post_completion(web::http::client::http_client& client, const nlohmann::json& payload);

            std::string _base_url;
            std::string _system_prompt;
            uint32_t _max_retries;
            std::chrono::seconds _request_timeout;
            std::chrono::seconds _status_timeout;
        };

    }
}

#endif // CARYDES_SERVICES_LM_STUDIO_CLIENT_HPP
