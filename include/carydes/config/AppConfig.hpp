#ifndef CARYDES_CONFIG_APP_CONFIG_HPP
#define CARYDES_CONFIG_APP_CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "carydes/models/ConversationTurn.hpp"
#include "carydes/models/Errors.hpp"
#include "carydes/services/Sanitizer.hpp"

namespace carydes {
namespace config {

/**
 * @brief Application configuration
 *
 * Built once at startup from defaults, an optional dotenv file, the
 * environment and an optional JSON file, then validated and handed to
 * every component as a const reference. Nothing mutates it afterwards.
 */
class AppConfig {
public:
    static constexpr double TEMPERATURE_MIN = 0.0;
    static constexpr double TEMPERATURE_MAX = 2.0;

    // Telegram
    std::string telegram_bot_token;
    std::set<models::UserId> user_whitelist;

    // Inference endpoint
    std::string lm_studio_url = "http://127.0.0.1:1234";
    uint32_t max_tokens = 1000;
    double temperature = 0.7;
    uint32_t request_timeout_seconds = 30;
    uint32_t status_timeout_seconds = 5;
    uint32_t max_retries = 2;
    std::string system_prompt = "You are a helpful AI assistant. Provide concise and accurate responses.";

    // Input and memory bounds
    size_t max_message_length = 2000;
    size_t max_conversation_history = 10;
    size_t max_log_line_length = 8192;

    // Rate limiting
    uint32_t rate_limit_max_messages = 10;
    uint32_t rate_limit_window_seconds = 60;

    // Threads handling inbound messages
    uint32_t worker_threads = 4;

    // Persistence and logging
    std::string chatlog_dir = "chatlogs";
    std::string log_level = "INFO";
    bool log_to_file = true;
    std::string log_file_path = "logs/bot.log";

    std::string config_file_path;

    static AppConfig builder() {
        return AppConfig();
    }

    AppConfig& withBotToken(const std::string& token) {
        telegram_bot_token = token;
        return *this;
    }

    AppConfig& withWhitelist(const std::set<models::UserId>& users) {
        user_whitelist = users;
        return *this;
    }

    AppConfig& withLmStudioUrl(const std::string& url) {
        lm_studio_url = url;
        return *this;
    }

    AppConfig& withMaxTokens(uint32_t tokens) {
        max_tokens = tokens;
        return *this;
    }

    AppConfig& withTemperature(double value) {
        temperature = value;
        return *this;
    }

    AppConfig& withMaxMessageLength(size_t length) {
        max_message_length = length;
        return *this;
    }

    AppConfig& withMaxConversationHistory(size_t turns) {
        max_conversation_history = turns;
        return *this;
    }

    AppConfig& withRateLimit(uint32_t max_messages, uint32_t window_seconds) {
        rate_limit_max_messages = max_messages;
        rate_limit_window_seconds = window_seconds;
        return *this;
    }

    AppConfig& withWorkerThreads(uint32_t threads) {
        worker_threads = threads;
        return *this;
    }

    AppConfig& withChatlogDir(const std::string& dir) {
        chatlog_dir = dir;
        return *this;
    }

    AppConfig& withConfigFile(const std::string& path) {
        config_file_path = path;
        return *this;
    }

    bool isWhitelisted(models::UserId user_id) const {
        return user_whitelist.count(user_id) > 0;
    }

    /**
     * @brief Load KEY=VALUE pairs from a dotenv file
     *
     * Keys already set in the real environment win over the file.
     * A missing file is not an error.
     */
    void loadFromDotEnv(const std::string& path = ".env") {
        std::ifstream file(path);
        if (!file.is_open()) {
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            if (line.rfind("export ", 0) == 0) {
                line = trim(line.substr(7));
            }

            auto eq = line.find('=');
            if (eq == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq));
            std::string value = unquote(trim(line.substr(eq + 1)));
            if (key.empty() || std::getenv(key.c_str()) != nullptr) continue;

            applyEnvValue(key, value);
        }
        spdlog::info("[AppConfig] Loaded environment file {}", path);
    }

    void loadFromEnvironment() {
        static const char* keys[] = {
            "TELEGRAM_BOT_TOKEN", "USER_WHITELIST", "LM_STUDIO_URL", "MAX_TOKENS",
            "MAX_CONVERSATION_HISTORY", "MAX_MESSAGE_LENGTH", "MAX_LOG_LINE_LENGTH", "TEMPERATURE",
            "RATE_LIMIT_MAX_MESSAGES", "RATE_LIMIT_WINDOW_SECONDS",
            "REQUEST_TIMEOUT_SECONDS", "STATUS_TIMEOUT_SECONDS", "MAX_RETRIES",
            "SYSTEM_PROMPT", "WORKER_THREADS", "CHATLOG_DIR", "LOG_LEVEL", "LOG_TO_FILE", "LOG_FILE_PATH",
            "CARYDES_CONFIG_FILE"
        };

        for (const char* key : keys) {
            const char* env_value = std::getenv(key);
            if (env_value != nullptr) {
                applyEnvValue(key, env_value);
            }
        }
    }

    void loadFromFile() {
        if (config_file_path.empty()) return;

        std::ifstream file(config_file_path);
        if (!file.is_open()) {
            throw models::ConfigurationError("Cannot open config file: " + config_file_path);
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw models::ConfigurationError("Error parsing config file " + config_file_path + ": " + e.what());
        }
        if (!j.is_object()) {
            throw models::ConfigurationError("Config file " + config_file_path + " must contain a JSON object");
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string env_key = toUpper(it.key());
            if (env_key == "USER_WHITELIST" && it.value().is_array()) {
                std::set<models::UserId> users;
                for (const auto& item : it.value()) {
                    users.insert(parseUserId(item.is_string() ? item.get<std::string>() : item.dump()));
                }
                user_whitelist = users;
                continue;
            }
            applyEnvValue(env_key, it.value().is_string() ? it.value().get<std::string>() : it.value().dump());
        }
        spdlog::info("[AppConfig] Loaded configuration from {}", config_file_path);
    }

    /**
     * @brief Reject configurations the bot must not start with
     * @throws models::ConfigurationError
     */
    void validate() const {
        if (telegram_bot_token.empty()) {
            throw models::ConfigurationError(
                "TELEGRAM_BOT_TOKEN not found in environment variables. "
                "Please set it in your .env file.");
        }
        if (user_whitelist.empty()) {
            throw models::ConfigurationError(
                "USER_WHITELIST is required. Please add at least one Telegram user ID. "
                "Format: USER_WHITELIST=123456789,987654321");
        }
        auto url_check = services::Sanitizer::validate_url(lm_studio_url);
        if (!url_check) {
            throw models::ConfigurationError(
                "Invalid LM_STUDIO_URL: " + lm_studio_url +
                " (" + services::to_string(*url_check.reason) + "). "
                "URL must be a plain http loopback address (http://127.0.0.1, http://localhost or http://[::1]).");
        }
        if (rate_limit_max_messages == 0 || rate_limit_window_seconds == 0) {
            throw models::ConfigurationError("Rate limit values must be positive");
        }
        if (max_message_length == 0) {
            throw models::ConfigurationError("MAX_MESSAGE_LENGTH must be positive");
        }
        if (worker_threads == 0) {
            throw models::ConfigurationError("WORKER_THREADS must be positive");
        }
    }

private:
    void applyEnvValue(const std::string& key, const std::string& value) {
        if (key == "TELEGRAM_BOT_TOKEN") {
            telegram_bot_token = value;
        } else if (key == "USER_WHITELIST") {
            user_whitelist = parseWhitelist(value);
        } else if (key == "LM_STUDIO_URL") {
            lm_studio_url = trim(value);
        } else if (key == "MAX_TOKENS") {
            max_tokens = parseUnsigned(key, value, max_tokens);
        } else if (key == "MAX_CONVERSATION_HISTORY") {
            max_conversation_history = parseUnsigned(key, value, max_conversation_history);
        } else if (key == "MAX_MESSAGE_LENGTH") {
            max_message_length = parseUnsigned(key, value, max_message_length);
        } else if (key == "MAX_LOG_LINE_LENGTH") {
            max_log_line_length = parseUnsigned(key, value, max_log_line_length);
        } else if (key == "TEMPERATURE") {
            temperature = parseTemperature(key, value, temperature);
        } else if (key == "RATE_LIMIT_MAX_MESSAGES") {
            rate_limit_max_messages = parseUnsigned(key, value, rate_limit_max_messages);
        } else if (key == "RATE_LIMIT_WINDOW_SECONDS") {
            rate_limit_window_seconds = parseUnsigned(key, value, rate_limit_window_seconds);
        } else if (key == "REQUEST_TIMEOUT_SECONDS") {
            request_timeout_seconds = parseUnsigned(key, value, request_timeout_seconds);
        } else if (key == "STATUS_TIMEOUT_SECONDS") {
            status_timeout_seconds = parseUnsigned(key, value, status_timeout_seconds);
        } else if (key == "MAX_RETRIES") {
            max_retries = parseUnsigned(key, value, max_retries);
        } else if (key == "WORKER_THREADS") {
            worker_threads = parseUnsigned(key, value, worker_threads);
        } else if (key == "SYSTEM_PROMPT") {
            system_prompt = value;
        } else if (key == "CHATLOG_DIR") {
            chatlog_dir = value;
        } else if (key == "LOG_LEVEL") {
            log_level = value;
        } else if (key == "LOG_TO_FILE") {
            log_to_file = parseBool(value);
        } else if (key == "LOG_FILE_PATH") {
            log_file_path = value;
        } else if (key == "CARYDES_CONFIG_FILE") {
            if (config_file_path.empty()) config_file_path = value;
        }
    }

    template<typename T>
    static T parseUnsigned(const std::string& key, const std::string& value, T fallback) {
        try {
            size_t consumed = 0;
            long long result = std::stoll(trim(value), &consumed);
            if (consumed != trim(value).size()) {
                throw std::invalid_argument(value);
            }
            if (result < 0) {
                spdlog::warn("[AppConfig] Negative value for {}, using default: {}", key, fallback);
                return fallback;
            }
            if (static_cast<unsigned long long>(result) > std::numeric_limits<T>::max()) {
                spdlog::warn("[AppConfig] Value for {} out of range, using default: {}", key, fallback);
                return fallback;
            }
            return static_cast<T>(result);
        } catch (const std::exception&) {
            spdlog::warn("[AppConfig] Invalid value for {}, using default: {}", key, fallback);
            return fallback;
        }
    }

    static double parseTemperature(const std::string& key, const std::string& value, double fallback) {
        double result;
        try {
            size_t consumed = 0;
            result = std::stod(trim(value), &consumed);
            if (consumed != trim(value).size()) {
                throw std::invalid_argument(value);
            }
        } catch (const std::exception&) {
            spdlog::warn("[AppConfig] Invalid value for {}, using default: {}", key, fallback);
            return fallback;
        }
        if (result < TEMPERATURE_MIN || result > TEMPERATURE_MAX) {
            spdlog::warn("[AppConfig] Value for {} outside [{}, {}], using default: {}",
                         key, TEMPERATURE_MIN, TEMPERATURE_MAX, fallback);
            return fallback;
        }
        return result;
    }

    static bool parseBool(const std::string& value) {
        const std::string lowered = toLower(trim(value));
        return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
    }

    static std::set<models::UserId> parseWhitelist(const std::string& value) {
        std::set<models::UserId> users;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                users.insert(parseUserId(item));
            }
        }
        return users;
    }

    static models::UserId parseUserId(const std::string& raw) {
        const std::string item = trim(raw);
        bool digits = !item.empty() &&
            std::all_of(item.begin() + (item[0] == '-' ? 1 : 0), item.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!digits || item == "-") {
            throw models::ConfigurationError("USER_WHITELIST entry is not a numeric user ID: " + item);
        }
        try {
            return static_cast<models::UserId>(std::stoll(item));
        } catch (const std::out_of_range&) {
            throw models::ConfigurationError("USER_WHITELIST entry out of range: " + item);
        }
    }

    static std::string trim(const std::string& value) {
        const char* whitespace = " \t\r\n";
        auto start = value.find_first_not_of(whitespace);
        if (start == std::string::npos) return "";
        auto end = value.find_last_not_of(whitespace);
        return value.substr(start, end - start + 1);
    }

    static std::string unquote(const std::string& value) {
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    static std::string toUpper(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return value;
    }

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
};

} // namespace config
} // namespace carydes

#endif // CARYDES_CONFIG_APP_CONFIG_HPP
