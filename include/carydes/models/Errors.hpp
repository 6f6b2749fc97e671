#ifndef CARYDES_MODELS_ERRORS_HPP
#define CARYDES_MODELS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace carydes {
namespace models {

/**
 * @brief Invalid or missing startup configuration
 *
 * Fatal: raised before the bot accepts any message.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class UpstreamFault {
    CONNECTION,
    TIMEOUT,
    HTTP_STATUS,
    MALFORMED,
    REDIRECT
};

inline const char* to_string(UpstreamFault fault) {
    switch (fault) {
        case UpstreamFault::CONNECTION: return "connection";
        case UpstreamFault::TIMEOUT: return "timeout";
        case UpstreamFault::HTTP_STATUS: return "http_status";
        case UpstreamFault::MALFORMED: return "malformed";
        case UpstreamFault::REDIRECT: return "redirect";
    }
    return "unknown";
}

/**
 * @brief The inference endpoint could not produce a completion
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(UpstreamFault fault, const std::string& message, int http_status = 0)
        : std::runtime_error(message), _fault(fault), _http_status(http_status) {}

    UpstreamFault fault() const { return _fault; }
    // 0 unless fault() is HTTP_STATUS or REDIRECT
    int http_status() const { return _http_status; }

    bool retryable() const {
        return _fault == UpstreamFault::CONNECTION ||
               _fault == UpstreamFault::TIMEOUT ||
               (_fault == UpstreamFault::HTTP_STATUS && _http_status >= 500);
    }

private:
    UpstreamFault _fault;
    int _http_status;
};

} // namespace models
} // namespace carydes

#endif // CARYDES_MODELS_ERRORS_HPP
