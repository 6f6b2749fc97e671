#ifndef CARYDES_SERVICES_INFERENCE_CLIENT_HPP
#define CARYDES_SERVICES_INFERENCE_CLIENT_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "carydes/models/ConversationTurn.hpp"

namespace carydes {
    namespace services {

        struct InferenceRequest {
            // Prior turns followed by the new user turn
            std::vector<models::ConversationTurn> context;
            uint32_t max_tokens = 1000;
            double temperature = 0.7;
        };

        /**
         * @brief Chat-completion collaborator
         *
         * complete() returns the model's reply text or throws
         * models::UpstreamError. is_reachable() never throws.
         */
        class InferenceClient {
        public:
            virtual ~InferenceClient() = default;

            virtual std::string complete(const InferenceRequest& request) = 0;
            virtual bool is_reachable() = 0;
        };

    }
}

#endif // CARYDES_SERVICES_INFERENCE_CLIENT_HPP
