#include "registry/health_monitor.hpp"

#include <algorithm>

namespace conductor::registry {

using protocol::HealthCheckRecord;
using protocol::HealthState;

HealthMonitor::HealthMonitor(std::size_t max_history, std::size_t failure_threshold)
    : max_history_(std::max<std::size_t>(max_history, 1)),
      failure_threshold_(std::max<std::size_t>(failure_threshold, 1)) {}

void HealthMonitor::record(const std::string& tool_id, const HealthCheckRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entries = history_[tool_id];

    // Concurrent probes may finish out of order; insert by checked_at.
    auto pos = std::upper_bound(entries.begin(), entries.end(), record,
                                [](const HealthCheckRecord& a, const HealthCheckRecord& b) {
                                    return a.checked_at < b.checked_at;
                                });
    entries.insert(pos, record);

    while (entries.size() > max_history_) {
        entries.pop_front();
    }
}

bool HealthMonitor::is_consistently_unhealthy(const std::string& tool_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(tool_id);
    if (it == history_.end() || it->second.size() < failure_threshold_) {
        return false;
    }
    const auto& entries = it->second;
    return std::all_of(entries.end() - static_cast<std::ptrdiff_t>(failure_threshold_),
                       entries.end(), [](const HealthCheckRecord& r) {
                           return r.state == HealthState::Unhealthy;
                       });
}

std::vector<HealthCheckRecord> HealthMonitor::history(const std::string& tool_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(tool_id);
    if (it == history_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::optional<HealthCheckRecord> HealthMonitor::latest(const std::string& tool_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(tool_id);
    if (it == history_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

}  // namespace conductor::registry
