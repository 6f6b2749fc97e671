#ifndef CARYDES_UTILS_TIME_UTILS_HPP
#define CARYDES_UTILS_TIME_UTILS_HPP

#include <chrono>
#include <ctime>
#include <string>

namespace carydes {
namespace utils {

    // strftime over local time; empty string if the format does not fit
    inline std::string format_local_time(std::chrono::system_clock::time_point when, const char* format) {
        std::time_t time = std::chrono::system_clock::to_time_t(when);
        std::tm local{};
        localtime_r(&time, &local);

        char buf[100];
        if (std::strftime(buf, sizeof(buf), format, &local)) {
            return std::string(buf);
        }
        return "";
    }

    inline std::string format_date(std::chrono::system_clock::time_point when) {
        return format_local_time(when, "%Y-%m-%d");
    }

    inline std::string format_timestamp(std::chrono::system_clock::time_point when) {
        return format_local_time(when, "%Y-%m-%d %H:%M:%S");
    }

}
}

#endif // CARYDES_UTILS_TIME_UTILS_HPP
