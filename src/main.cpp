#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

#include "carydes/CarydesApplication.hpp"
#include "carydes/models/Errors.hpp"

int main(int argc, char** argv) {
    try {
        auto app = carydes::CarydesApplication::create(argc, argv);
        return app->run();
    } catch (const carydes::models::ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        std::cerr << "\n❌ Configuration Error: " << e.what() << std::endl;
        std::cerr << "\nPlease check your .env file and ensure all required variables are set:" << std::endl;
        std::cerr << "  - TELEGRAM_BOT_TOKEN (required)" << std::endl;
        std::cerr << "  - USER_WHITELIST (required - at least one user ID)" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Error starting bot: {}", e.what());
        std::cerr << "\n❌ Error: " << e.what() << std::endl;
        return 1;
    }
}
