#ifndef CARYDES_TESTS_TEST_SUPPORT_HPP
#define CARYDES_TESTS_TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "carydes/services/InferenceClient.hpp"

namespace carydes {
namespace test {

    class TempDir {
    public:
        TempDir() {
            std::random_device rd;
            _path = std::filesystem::temp_directory_path() /
                    ("carydes-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
            std::filesystem::create_directories(_path);
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }

        const std::filesystem::path& path() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    inline std::vector<std::string> read_lines(const std::filesystem::path& file) {
        std::vector<std::string> lines;
        std::ifstream in(file);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline std::chrono::system_clock::time_point local_time(int year, int month, int day,
                                                            int hour = 12, int minute = 0, int second = 0) {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        tm.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&tm));
    }

    /**
     * @brief Scripted InferenceClient
     *
     * Replies "reply to <last user content>" unless a responder is set.
     * Records every request and the peak number of concurrent calls.
     */
    class FakeInferenceClient : public services::InferenceClient {
    public:
        using Responder = std::function<std::string(const services::InferenceRequest&)>;

        std::string complete(const services::InferenceRequest& request) override {
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _requests.push_back(request);
            }
            int now_in_flight = ++_in_flight;
            int peak = _peak_in_flight.load();
            while (now_in_flight > peak && !_peak_in_flight.compare_exchange_weak(peak, now_in_flight)) {
            }

            struct Leave {
                std::atomic<int>& counter;
                ~Leave() { --counter; }
            } leave{_in_flight};

            if (_responder) {
                return _responder(request);
            }
            return "reply to " + request.context.back().content;
        }

        bool is_reachable() override {
            ++_status_checks;
            return _reachable;
        }

        void set_responder(Responder responder) { _responder = std::move(responder); }
        void set_reachable(bool reachable) { _reachable = reachable; }

        std::vector<services::InferenceRequest> requests() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _requests;
        }

        size_t call_count() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _requests.size();
        }

        int peak_in_flight() const { return _peak_in_flight.load(); }
        int status_checks() const { return _status_checks.load(); }

    private:
        mutable std::mutex _mutex;
        std::vector<services::InferenceRequest> _requests;
        Responder _responder;
        std::atomic<bool> _reachable{true};
        std::atomic<int> _in_flight{0};
        std::atomic<int> _peak_in_flight{0};
        std::atomic<int> _status_checks{0};
    };

}
}

#endif // CARYDES_TESTS_TEST_SUPPORT_HPP
