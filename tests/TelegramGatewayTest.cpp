#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "carydes/controller/SessionController.hpp"
#include "carydes/services/TelegramGateway.hpp"

using carydes::controller::SessionController;
using carydes::models::Command;
using carydes::services::TelegramGateway;

TEST(TelegramGatewayTest, ParsesTextMessage) {
    auto update = nlohmann::json::parse(R"({
        "update_id": 1001,
        "message": {
            "message_id": 5,
            "from": {"id": 123456789, "is_bot": false, "first_name": "A"},
            "chat": {"id": 123456789, "type": "private"},
            "date": 1700000000,
            "text": "hello there"
        }
    })");

    auto message = TelegramGateway::parse_update(update);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->update_id, 1001);
    EXPECT_EQ(message->user_id, 123456789);
    EXPECT_EQ(message->chat_id, 123456789);
    EXPECT_EQ(message->text, "hello there");
}

TEST(TelegramGatewayTest, IgnoresUpdatesWithoutText) {
    auto photo = nlohmann::json::parse(R"({
        "update_id": 1002,
        "message": {"from": {"id": 1}, "chat": {"id": 1}, "photo": []}
    })");
    EXPECT_FALSE(TelegramGateway::parse_update(photo).has_value());

    auto edited = nlohmann::json::parse(R"({
        "update_id": 1003,
        "edited_message": {"from": {"id": 1}, "chat": {"id": 1}, "text": "edit"}
    })");
    EXPECT_FALSE(TelegramGateway::parse_update(edited).has_value());

    auto no_sender = nlohmann::json::parse(R"({
        "update_id": 1004,
        "message": {"chat": {"id": 1}, "text": "anonymous"}
    })");
    EXPECT_FALSE(TelegramGateway::parse_update(no_sender).has_value());

    EXPECT_FALSE(TelegramGateway::parse_update(nlohmann::json::array()).has_value());
}

TEST(TelegramGatewayTest, ParsesCommands) {
    EXPECT_EQ(SessionController::parseCommand("/start"), Command::START);
    EXPECT_EQ(SessionController::parseCommand("/help"), Command::HELP);
    EXPECT_EQ(SessionController::parseCommand("/new@carydes_bot"), Command::NEW);
    EXPECT_EQ(SessionController::parseCommand("/reset now"), Command::RESET);
    EXPECT_EQ(SessionController::parseCommand("/STATUS"), Command::STATUS);
    EXPECT_EQ(SessionController::parseCommand("/weather"), Command::UNKNOWN);
}

TEST(TelegramGatewayTest, PlainTextIsNotACommand) {
    EXPECT_FALSE(SessionController::parseCommand("hello").has_value());
    EXPECT_FALSE(SessionController::parseCommand(" /start").has_value());
    EXPECT_FALSE(SessionController::parseCommand("").has_value());
}
