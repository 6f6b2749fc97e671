#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "carydes/config/AppConfig.hpp"
#include "carydes/models/Errors.hpp"
#include "carydes/services/LmStudioClient.hpp"

using carydes::config::AppConfig;
using carydes::models::ConfigurationError;
using carydes::models::ConversationTurn;
using carydes::models::UpstreamError;
using carydes::models::UpstreamFault;
using carydes::services::InferenceRequest;
using carydes::services::LmStudioClient;

TEST(LmStudioClientTest, RefusesNonLocalEndpoint) {
    AppConfig config;
    config.withLmStudioUrl("http://93.184.216.34:1234");
    EXPECT_THROW(LmStudioClient client(config), ConfigurationError);
}

TEST(LmStudioClientTest, PayloadStartsWithSystemPrompt) {
    AppConfig config;
    config.system_prompt = "Be brief.";
    LmStudioClient client(config);

    InferenceRequest request;
    request.context = {ConversationTurn::user("hi"), ConversationTurn::assistant("hello"), ConversationTurn::user("bye")};
    request.max_tokens = 256;
    request.temperature = 0.5;

    auto payload = client.build_payload(request);
    ASSERT_EQ(payload["messages"].size(), 4u);
    EXPECT_EQ(payload["messages"][0]["role"], "system");
    EXPECT_EQ(payload["messages"][0]["content"], "Be brief.");
    EXPECT_EQ(payload["messages"][2]["role"], "assistant");
    EXPECT_EQ(payload["messages"][3]["content"], "bye");
    EXPECT_EQ(payload["max_tokens"], 256);
    EXPECT_DOUBLE_EQ(payload["temperature"].get<double>(), 0.5);
}

TEST(LmStudioClientTest, ExtractsFirstChoice) {
    auto body = nlohmann::json::parse(R"({
        "choices": [{"index": 0, "message": {"role": "assistant", "content": "Paris."}}]
    })");
    EXPECT_EQ(LmStudioClient::extract_reply(body), "Paris.");
}

TEST(LmStudioClientTest, MalformedBodiesAreUpstreamErrors) {
    const char* bodies[] = {
        R"({})",
        R"({"choices": []})",
        R"({"choices": [{"text": "legacy"}]})",
        R"({"choices": [{"message": {"content": ""}}]})",
        R"({"choices": [{"message": {"content": 42}}]})"
    };
    for (const char* raw : bodies) {
        try {
            LmStudioClient::extract_reply(nlohmann::json::parse(raw));
            ADD_FAILURE() << "accepted " << raw;
        } catch (const UpstreamError& e) {
            EXPECT_EQ(e.fault(), UpstreamFault::MALFORMED) << raw;
            EXPECT_FALSE(e.retryable());
        }
    }
}

TEST(LmStudioClientTest, OnlyTransientFaultsAreRetried) {
    EXPECT_TRUE(UpstreamError(UpstreamFault::CONNECTION, "refused").retryable());
    EXPECT_TRUE(UpstreamError(UpstreamFault::TIMEOUT, "slow").retryable());
    EXPECT_TRUE(UpstreamError(UpstreamFault::HTTP_STATUS, "bad gateway", 502).retryable());
    EXPECT_FALSE(UpstreamError(UpstreamFault::HTTP_STATUS, "bad request", 400).retryable());
    EXPECT_FALSE(UpstreamError(UpstreamFault::REDIRECT, "moved", 301).retryable());
}
