#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol/health.hpp"

namespace conductor::registry {

// Bounded per-tool history of health checks, ordered by checked_at.
class HealthMonitor {
public:
    explicit HealthMonitor(std::size_t max_history = 100, std::size_t failure_threshold = 3);

    void record(const std::string& tool_id, const protocol::HealthCheckRecord& record);

    // True only when the latest `failure_threshold` records are all
    // Unhealthy. A shorter history is never consistently unhealthy.
    bool is_consistently_unhealthy(const std::string& tool_id) const;

    std::vector<protocol::HealthCheckRecord> history(const std::string& tool_id) const;
    std::optional<protocol::HealthCheckRecord> latest(const std::string& tool_id) const;

    std::size_t max_history() const { return max_history_; }
    std::size_t failure_threshold() const { return failure_threshold_; }

private:
    std::size_t max_history_;
    std::size_t failure_threshold_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<protocol::HealthCheckRecord>> history_;
};

}  // namespace conductor::registry
