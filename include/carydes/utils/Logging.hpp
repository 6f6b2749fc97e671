#ifndef CARYDES_UTILS_LOGGING_HPP
#define CARYDES_UTILS_LOGGING_HPP

#include <string>
#include <spdlog/spdlog.h>

namespace carydes {
namespace config {
    class AppConfig;
}

namespace utils {

    // "DEBUG", "INFO", "WARNING"/"WARN", "ERROR", "CRITICAL"; anything else is info
    spdlog::level::level_enum parse_log_level(const std::string& name);

    /**
     * @brief Install the process-wide "carydes" logger as spdlog's default
     *
     * Console sink always; a file sink at log_file_path when log_to_file is
     * set. Falls back to console only if the file cannot be opened.
     */
    void configure_logging(const config::AppConfig& config);

}
}

#endif // CARYDES_UTILS_LOGGING_HPP
