#include "carydes/utils/MessageChunker.hpp"
#include "carydes/services/Sanitizer.hpp"

#include <cstring>

namespace carydes {
namespace utils {

    namespace {
        const size_t kBreakSearchWindow = 200;
        const char* const kBreakCharacters = "\n .,!?;:";

        size_t prefix_bytes(const std::string& text, size_t begin, size_t code_points) {
            size_t seen = 0;
            for (size_t i = begin; i < text.size(); ++i) {
                if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
                    if (seen == code_points) return i;
                    ++seen;
                }
            }
            return text.size();
        }
    }

    std::vector<std::string> chunk_message(const std::string& message, size_t max_length) {
        if (max_length == 0 || services::Sanitizer::utf8_length(message) <= max_length) {
            return {message};
        }

        std::vector<std::string> chunks;
        size_t offset = 0;
        while (offset < message.size()) {
            size_t limit = prefix_bytes(message, offset, max_length);
            if (limit == message.size()) {
                chunks.push_back(message.substr(offset));
                break;
            }

            size_t window_chars = max_length > kBreakSearchWindow ? max_length - kBreakSearchWindow : 0;
            size_t window_start = prefix_bytes(message, offset, window_chars);

            size_t break_point = limit;
            for (size_t i = limit; i > window_start + 1; --i) {
                char c = message[i - 1];
                if (c != '\0' && std::strchr(kBreakCharacters, c) != nullptr) {
                    break_point = i;
                    break;
                }
            }

            chunks.push_back(message.substr(offset, break_point - offset));
            offset = break_point;
        }
        return chunks;
    }

}
}
