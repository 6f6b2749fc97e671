#include "carydes/utils/Logging.hpp"
#include "carydes/config/AppConfig.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace carydes {
namespace utils {

    spdlog::level::level_enum parse_log_level(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "DEBUG") return spdlog::level::debug;
        if (upper == "INFO") return spdlog::level::info;
        if (upper == "WARNING" || upper == "WARN") return spdlog::level::warn;
        if (upper == "ERROR") return spdlog::level::err;
        if (upper == "CRITICAL") return spdlog::level::critical;
        return spdlog::level::info;
    }

    void configure_logging(const config::AppConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        std::string file_error;
        if (config.log_to_file) {
            try {
                std::filesystem::path log_path(config.log_file_path);
                if (log_path.has_parent_path()) {
                    std::filesystem::create_directories(log_path.parent_path());
                }
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file_path));
            } catch (const std::exception& e) {
                file_error = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("carydes", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");
        logger->set_level(parse_log_level(config.log_level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);

        if (!file_error.empty()) {
            spdlog::error("[Logging] Cannot open log file {}: {}", config.log_file_path, file_error);
        }
    }

}
}
