#ifndef CARYDES_SERVICES_SANITIZER_HPP
#define CARYDES_SERVICES_SANITIZER_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace carydes {
    namespace services {

        enum class RejectionReason {
            TOO_LONG,
            CONTROL_CHARACTERS,
            EMPTY_AFTER_TRIM,
            NON_LOCAL_HOST,
            UNSUPPORTED_SCHEME,
            MALFORMED_URL
        };

        const char* to_string(RejectionReason reason);

        /**
         * @brief Cleaned text, or the reason it was refused
         */
        struct ValidationResult {
            std::string text;
            std::optional<RejectionReason> reason;

            static ValidationResult accept(std::string cleaned) {
                return ValidationResult{std::move(cleaned), std::nullopt};
            }

            static ValidationResult reject(RejectionReason why) {
                return ValidationResult{std::string(), why};
            }

            explicit operator bool() const { return !reason.has_value(); }
        };

        /**
         * @brief Stateless input, URL and log-line sanitation
         *
         * All lengths are counted in Unicode code points of the UTF-8 input.
         */
        class Sanitizer {
        public:
            static constexpr size_t DEFAULT_MAX_MESSAGE_LENGTH = 2000;
            static constexpr size_t DEFAULT_MAX_LOG_LINE_LENGTH = 8192;

            /**
             * @brief Validate one inbound chat message
             *
             * Rejects TOO_LONG above max_length, CONTROL_CHARACTERS for any
             * C0 control or DEL other than \n, \r and \t, any C1 control,
             * U+2028/U+2029 or malformed UTF-8, EMPTY_AFTER_TRIM for
             * whitespace-only text. Accepted text is trimmed.
             */
            static ValidationResult validate_message(const std::string& raw,
                                                     size_t max_length = DEFAULT_MAX_MESSAGE_LENGTH);

            /**
             * @brief Accept only plain http URLs whose host is loopback
             *
             * Allowed hosts: 127.0.0.1, localhost, ::1. The accepted text is the
             * URL without trailing slashes.
             */
            static ValidationResult validate_url(const std::string& url);

            /**
             * @brief Neutralize leading role/instruction overrides
             *
             * Heuristic defense-in-depth only: strips a leading "/system",
             * "/prompt", "[system]" or "system:/assistant:/user:" marker and
             * masks "ignore previous instructions" style phrases. It does not
             * make arbitrary input safe to send to a model.
             */
            static std::string filter_prompt_injection(const std::string& text);

            /**
             * @brief Make text safe to write as a single transcript line
             *
             * Escapes backslash, \n, \r, \t and other C0 bytes (\xHH), C1
             * controls and U+2028/U+2029 (\uHHHH) and bytes that are not valid
             * UTF-8 (\xHH). Output is cut to max_length code points at an
             * escape boundary.
             */
            static std::string sanitize_for_log(const std::string& text,
                                                size_t max_length = DEFAULT_MAX_LOG_LINE_LENGTH);

            static size_t utf8_length(const std::string& text);
        };

    }
}

#endif // CARYDES_SERVICES_SANITIZER_HPP
