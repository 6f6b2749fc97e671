#ifndef CARYDES_UTILS_MESSAGE_CHUNKER_HPP
#define CARYDES_UTILS_MESSAGE_CHUNKER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace carydes {
namespace utils {

    constexpr size_t TELEGRAM_MAX_MESSAGE_LENGTH = 4096;

    /**
     * @brief Split text into pieces of at most max_length code points
     *
     * Prefers to cut just after one of "\n .,!?;:" found in the last 200
     * code points before the limit; otherwise cuts at the limit. Never
     * splits a UTF-8 sequence.
     */
    std::vector<std::string> chunk_message(const std::string& message,
                                           size_t max_length = TELEGRAM_MAX_MESSAGE_LENGTH);

}
}

#endif // CARYDES_UTILS_MESSAGE_CHUNKER_HPP
