#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace conductor::protocol {

    enum class HealthState {
        Healthy,
        Warning,
        Unhealthy,
        Unknown
    };

    inline std::string to_string(HealthState state) {
        switch (state) {
            case HealthState::Healthy:   return "healthy";
            case HealthState::Warning:   return "warning";
            case HealthState::Unhealthy: return "unhealthy";
            case HealthState::Unknown:   return "unknown";
        }
        return "unknown";
    }

    struct HealthStatus {
        HealthState state = HealthState::Unknown;
        std::string message;
        nlohmann::json details = nlohmann::json::object();
        std::chrono::system_clock::time_point checked_at = std::chrono::system_clock::now();
    };

    // One entry in a tool's health history.
    struct HealthCheckRecord {
        HealthState state = HealthState::Unknown;
        std::chrono::system_clock::time_point checked_at;
        std::chrono::milliseconds duration{0};
        std::optional<std::string> error;
    };

} // namespace conductor::protocol
