#ifndef CARYDES_CARYDES_APPLICATION_HPP
#define CARYDES_CARYDES_APPLICATION_HPP

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <pthread.h>
#include <spdlog/spdlog.h>

#include "carydes/config/AppConfig.hpp"
#include "carydes/controller/SessionController.hpp"
#include "carydes/models/Errors.hpp"
#include "carydes/services/ConversationStore.hpp"
#include "carydes/services/LmStudioClient.hpp"
#include "carydes/services/RateLimiter.hpp"
#include "carydes/services/SessionService.hpp"
#include "carydes/services/TelegramGateway.hpp"
#include "carydes/services/TranscriptLogger.hpp"
#include "carydes/utils/Logging.hpp"

namespace carydes {

/**
 * @brief Application runner
 *
 * Loads and validates configuration, wires the components and blocks in
 * the Telegram polling loop until SIGINT or SIGTERM.
 */
class CarydesApplication {
public:
    /**
     * @brief Build the application from the command line and environment
     *
     * Recognized arguments: --config <json file>, --env <dotenv file>.
     * @throws models::ConfigurationError on any invalid setting
     */
    static std::unique_ptr<CarydesApplication> create(int argc, char** argv) {
        auto app = std::unique_ptr<CarydesApplication>(new CarydesApplication());

        std::string env_file = ".env";
        std::string config_file;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "--config" || arg == "--env") && i + 1 < argc) {
                (arg == "--config" ? config_file : env_file) = argv[++i];
            } else {
                throw models::ConfigurationError("Unknown argument: " + arg +
                                                 " (usage: carydes [--config file.json] [--env .env])");
            }
        }

        app->config_ = config::AppConfig::builder();
        app->config_.loadFromDotEnv(env_file);
        app->config_.loadFromEnvironment();
        if (!config_file.empty()) {
            app->config_.withConfigFile(config_file);
        }
        app->config_.loadFromFile();
        app->config_.validate();

        return app;
    }

    const config::AppConfig& getConfig() const {
        return config_;
    }

    /**
     * @brief Start all components and block until shutdown
     */
    int run() {
        blockShutdownSignals();
        utils::configure_logging(config_);
        printBanner();

        setupDirectories();

        spdlog::info("[CarydesApplication] Configuration loaded successfully");
        spdlog::info("[CarydesApplication] LM Studio URL: {}", config_.lm_studio_url);
        spdlog::info("[CarydesApplication] Allowed users: {}", config_.user_whitelist.size());

        rate_limiter_ = std::make_unique<services::RateLimiter>(
            config_.rate_limit_max_messages, std::chrono::seconds(config_.rate_limit_window_seconds));
        conversation_store_ = std::make_unique<services::ConversationStore>(config_.max_conversation_history);
        transcript_logger_ = std::make_unique<services::TranscriptLogger>(config_.chatlog_dir, config_.max_log_line_length);
        session_service_ = std::make_unique<services::SessionService>();
        inference_client_ = std::make_unique<services::LmStudioClient>(config_);
        session_controller_ = std::make_unique<controller::SessionController>(
            config_, *rate_limiter_, *conversation_store_, *transcript_logger_,
            *session_service_, *inference_client_);
        gateway_ = std::make_unique<services::TelegramGateway>(config_, *session_controller_);

        startSignalWatcher();

        spdlog::info("[CarydesApplication] Starting CARYDES...");
        std::cout << "🚀 CARYDES is starting... Press Ctrl+C to stop." << std::endl;
        gateway_->run();

        shutdown();
        return 0;
    }

    void shutdown() {
        spdlog::info("[CarydesApplication] Shutting down...");
        if (gateway_) {
            gateway_->stop();
        }
        stopSignalWatcher();

        if (session_service_) {
            spdlog::info("[CarydesApplication] Sessions this run: {}", session_service_->get_all_sessions().size());
        }
        spdlog::info("[CarydesApplication] Shutdown complete");
        spdlog::default_logger()->flush();
    }

    void printBanner() {
        std::cout << R"(
  ___   _   _____   _____  ___ ___
 / __| /_\ | _ \ \ / /   \| __/ __|
| (__ / _ \|   /\ V /| |) | _|\__ \
 \___/_/ \_\_|_\ |_| |___/|___|___/
    )" << std::endl;
        std::cout << "CARYDES - Personal AI Assistant" << std::endl;
        std::cout << "===============================" << std::endl;
    }

    ~CarydesApplication() {
        stopSignalWatcher();
    }

private:
    CarydesApplication() = default;

    void setupDirectories() {
        std::error_code ec;
        std::filesystem::create_directories(config_.chatlog_dir, ec);
        if (ec) {
            throw models::ConfigurationError("Error creating directory " + config_.chatlog_dir + ": " + ec.message());
        }
        spdlog::info("[CarydesApplication] Ensured directory exists: {}", config_.chatlog_dir);
    }

    // Must run before any worker thread exists so every thread inherits the mask
    void blockShutdownSignals() {
        sigemptyset(&shutdown_signals_);
        sigaddset(&shutdown_signals_, SIGINT);
        sigaddset(&shutdown_signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &shutdown_signals_, nullptr);
    }

    void startSignalWatcher() {
        signal_watcher_ = std::thread([this]() {
            int signal = 0;
            if (sigwait(&shutdown_signals_, &signal) != 0) {
                return;
            }
            if (stopping_.exchange(true)) {
                return;
            }
            spdlog::info("[CarydesApplication] Received signal {}, initiating graceful shutdown...", signal);
            std::cout << "\n🛑 Shutting down gracefully..." << std::endl;
            gateway_->stop();
        });
    }

    void stopSignalWatcher() {
        if (!signal_watcher_.joinable()) {
            return;
        }
        if (!stopping_.exchange(true)) {
            // Wake the watcher when shutdown did not come from a signal
            pthread_kill(signal_watcher_.native_handle(), SIGTERM);
        }
        signal_watcher_.join();
    }

    config::AppConfig config_;
    sigset_t shutdown_signals_{};
    std::thread signal_watcher_;
    std::atomic<bool> stopping_{false};

    std::unique_ptr<services::RateLimiter> rate_limiter_;
    std::unique_ptr<services::ConversationStore> conversation_store_;
    std::unique_ptr<services::TranscriptLogger> transcript_logger_;
    std::unique_ptr<services::SessionService> session_service_;
    std::unique_ptr<services::InferenceClient> inference_client_;
    std::unique_ptr<controller::SessionController> session_controller_;
    std::unique_ptr<services::TelegramGateway> gateway_;
};

} // namespace carydes

#endif // CARYDES_CARYDES_APPLICATION_HPP
