#pragma once
#include <chrono>
#include <ctime>
#include <random>
#include <sstream>
#include <string>

namespace conductor::core::config {

    // "<prefix>-" followed by `length` random hex characters.
    inline std::string generate_id(const std::string& prefix, int length = 8) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_run_id() {
        return generate_id("run");
    }

    inline std::string generate_correlation_id() {
        return generate_id("corr", 12);
    }

    // UTC timestamp, second precision: 2024-05-01T12:00:00Z
    inline std::string rfc3339_utc(std::chrono::system_clock::time_point tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_utc{};
        gmtime_r(&t, &tm_utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        return buffer;
    }

    inline std::string now_rfc3339() {
        return rfc3339_utc(std::chrono::system_clock::now());
    }

} // namespace conductor::core::config
