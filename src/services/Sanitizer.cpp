#include "carydes/services/Sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <regex>
#include <cpprest/base_uri.h>

namespace carydes {
    namespace services {

        namespace {
            const char* const kWhitespace = " \t\r\n\f\v";
            const char* const kTruncatedMarker = "...[truncated]";

            bool is_forbidden_control(unsigned char c) {
                if (c == '\n' || c == '\r' || c == '\t') return false;
                return c < 0x20 || c == 0x7f;
            }

            bool is_continuation_byte(unsigned char c) {
                return (c & 0xC0) == 0x80;
            }

            // C1 controls (NEL, CSI, ...) and the Unicode line/paragraph separators
            bool is_multibyte_control(uint32_t code_point) {
                return (code_point >= 0x80 && code_point <= 0x9f) ||
                       code_point == 0x2028 || code_point == 0x2029;
            }

            // Byte length of the well-formed UTF-8 sequence at pos, 0 when malformed
            size_t decode_utf8(const std::string& text, size_t pos, uint32_t& code_point) {
                const unsigned char lead = static_cast<unsigned char>(text[pos]);
                size_t length;
                uint32_t minimum;
                if (lead < 0x80) {
                    code_point = lead;
                    return 1;
                } else if ((lead & 0xE0) == 0xC0) {
                    length = 2;
                    minimum = 0x80;
                    code_point = lead & 0x1F;
                } else if ((lead & 0xF0) == 0xE0) {
                    length = 3;
                    minimum = 0x800;
                    code_point = lead & 0x0F;
                } else if ((lead & 0xF8) == 0xF0) {
                    length = 4;
                    minimum = 0x10000;
                    code_point = lead & 0x07;
                } else {
                    return 0;
                }

                if (pos + length > text.size()) return 0;
                for (size_t i = 1; i < length; ++i) {
                    const unsigned char c = static_cast<unsigned char>(text[pos + i]);
                    if (!is_continuation_byte(c)) return 0;
                    code_point = (code_point << 6) | (c & 0x3F);
                }
                if (code_point < minimum || code_point > 0x10FFFF ||
                    (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                    return 0;
                }
                return length;
            }

            std::string escape_byte(unsigned char c) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                return buf;
            }

            std::string escape_code_point(uint32_t code_point) {
                char buf[12];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(code_point));
                return buf;
            }

            std::string trim(const std::string& text) {
                auto start = text.find_first_not_of(kWhitespace);
                if (start == std::string::npos) return "";
                auto end = text.find_last_not_of(kWhitespace);
                return text.substr(start, end - start + 1);
            }

            std::string to_lower(std::string value) {
                std::transform(value.begin(), value.end(), value.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return value;
            }

            const std::regex& leading_override_patterns(size_t index) {
                static const std::regex patterns[] = {
                    std::regex(R"(^/system\s*:?\s*)", std::regex::icase),
                    std::regex(R"(^/prompt\s*:?\s*)", std::regex::icase),
                    std::regex(R"(^\[system\]\s*)", std::regex::icase),
                    std::regex(R"(^(system|assistant|user)\s*:\s*)", std::regex::icase)
                };
                return patterns[index];
            }

            const std::regex& instruction_override_pattern() {
                static const std::regex pattern(
                    R"((ignore|disregard|forget)\s+(all\s+)?(of\s+)?(the\s+|your\s+)?(previous|prior|above|earlier)\s+(instructions|prompts|rules))",
                    std::regex::icase);
                return pattern;
            }
        }

        const char* to_string(RejectionReason reason) {
            switch (reason) {
                case RejectionReason::TOO_LONG: return "too_long";
                case RejectionReason::CONTROL_CHARACTERS: return "control_characters";
                case RejectionReason::EMPTY_AFTER_TRIM: return "empty_after_trim";
                case RejectionReason::NON_LOCAL_HOST: return "non_local_host";
                case RejectionReason::UNSUPPORTED_SCHEME: return "unsupported_scheme";
                case RejectionReason::MALFORMED_URL: return "malformed_url";
            }
            return "unknown";
        }

        size_t Sanitizer::utf8_length(const std::string& text) {
            return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
                return !is_continuation_byte(static_cast<unsigned char>(c));
            }));
        }

        ValidationResult Sanitizer::validate_message(const std::string& raw, size_t max_length) {
            if (utf8_length(raw) > max_length) {
                return ValidationResult::reject(RejectionReason::TOO_LONG);
            }

            for (size_t pos = 0; pos < raw.size();) {
                uint32_t code_point = 0;
                size_t length = decode_utf8(raw, pos, code_point);
                if (length == 0 ||
                    (length == 1 && is_forbidden_control(static_cast<unsigned char>(raw[pos]))) ||
                    (length > 1 && is_multibyte_control(code_point))) {
                    return ValidationResult::reject(RejectionReason::CONTROL_CHARACTERS);
                }
                pos += length;
            }

            std::string cleaned = trim(raw);
            if (cleaned.empty()) {
                return ValidationResult::reject(RejectionReason::EMPTY_AFTER_TRIM);
            }
            return ValidationResult::accept(std::move(cleaned));
        }

        ValidationResult Sanitizer::validate_url(const std::string& url) {
            const std::string candidate = trim(url);
            if (candidate.empty() || !web::uri::validate(candidate)) {
                return ValidationResult::reject(RejectionReason::MALFORMED_URL);
            }

            web::uri parsed(candidate);
            if (to_lower(parsed.scheme()) != "http") {
                return ValidationResult::reject(RejectionReason::UNSUPPORTED_SCHEME);
            }

            std::string host = to_lower(parsed.host());
            if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
                host = host.substr(1, host.size() - 2);
            }
            if (host != "127.0.0.1" && host != "localhost" && host != "::1") {
                return ValidationResult::reject(RejectionReason::NON_LOCAL_HOST);
            }

            std::string normalized = candidate;
            while (!normalized.empty() && normalized.back() == '/') {
                normalized.pop_back();
            }
            return ValidationResult::accept(normalized);
        }

        std::string Sanitizer::filter_prompt_injection(const std::string& text) {
            std::string filtered;
            filtered.reserve(text.size());
            for (char c : text) {
                if (c != '\0') filtered.push_back(c);
            }

            for (size_t i = 0; i < 4; ++i) {
                filtered = std::regex_replace(filtered, leading_override_patterns(i), "",
                                              std::regex_constants::format_first_only);
            }
            filtered = std::regex_replace(filtered, instruction_override_pattern(), "[filtered]");

            return trim(filtered);
        }

        std::string Sanitizer::sanitize_for_log(const std::string& text, size_t max_length) {
            std::string escaped;
            escaped.reserve(text.size());
            size_t written = 0;

            for (size_t pos = 0; pos < text.size();) {
                uint32_t code_point = 0;
                size_t length = decode_utf8(text, pos, code_point);

                std::string piece;
                if (length == 0) {
                    piece = escape_byte(static_cast<unsigned char>(text[pos]));
                    length = 1;
                } else if (length == 1) {
                    switch (code_point) {
                        case '\\': piece = "\\\\"; break;
                        case '\n': piece = "\\n"; break;
                        case '\r': piece = "\\r"; break;
                        case '\t': piece = "\\t"; break;
                        default:
                            piece = is_forbidden_control(static_cast<unsigned char>(code_point))
                                ? escape_byte(static_cast<unsigned char>(code_point))
                                : std::string(1, text[pos]);
                    }
                } else if (is_multibyte_control(code_point)) {
                    piece = escape_code_point(code_point);
                } else {
                    piece = text.substr(pos, length);
                }

                // An escape is kept whole or dropped with everything after it
                const size_t piece_length = utf8_length(piece);
                if (written + piece_length > max_length) {
                    escaped += kTruncatedMarker;
                    break;
                }
                escaped += piece;
                written += piece_length;
                pos += length;
            }
            return escaped;
        }

    }
}
