#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "adapters/agent_adapter.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/health.hpp"
#include "registry/health_monitor.hpp"

namespace conductor::registry {

struct RegistryStats {
    std::size_t total = 0;
    std::size_t healthy = 0;
    std::size_t warning = 0;
    std::size_t unhealthy = 0;
    std::size_t unknown = 0;
};

// Maps tool ids to shared, immutable adapters. Built once at startup and
// passed by reference; there is no global instance.
class AdapterRegistry {
public:
    using AdapterPtr = std::shared_ptr<const adapters::AgentAdapter>;

    explicit AdapterRegistry(std::size_t max_history = 100, std::size_t failure_threshold = 3);
    ~AdapterRegistry();

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    // Rejects adapters with empty executable or memory names, or a zero
    // context window. A failing health check is only logged.
    core::errors::Result<core::errors::Unit> register_adapter(AdapterPtr adapter);

    // Returns the adapter even when it is unhealthy.
    core::errors::Result<AdapterPtr> create(const std::string& tool_id) const;

    bool supports(const std::string& tool_id) const;
    std::vector<std::string> supported_tools() const;

    // One check per tool. A failure in one adapter never affects another.
    std::map<std::string, protocol::HealthStatus> get_health_summary() const;
    RegistryStats get_stats() const;

    // Probes every adapter once and records the results.
    void probe_all_once();

    void start_health_monitoring(std::chrono::milliseconds interval);
    void stop_health_monitoring();
    bool is_monitoring() const;

    const HealthMonitor& monitor() const { return monitor_; }
    HealthMonitor& monitor() { return monitor_; }

private:
    std::map<std::string, AdapterPtr> snapshot() const;

    mutable std::shared_mutex adapters_mutex_;
    std::map<std::string, AdapterPtr> adapters_;
    HealthMonitor monitor_;

    mutable std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    bool stop_requested_ = false;
    std::thread worker_;
};

// Keeps background health probing running for its lifetime.
class HealthMonitoringScope {
public:
    HealthMonitoringScope(AdapterRegistry& registry, std::chrono::milliseconds interval);
    ~HealthMonitoringScope();

    HealthMonitoringScope(const HealthMonitoringScope&) = delete;
    HealthMonitoringScope& operator=(const HealthMonitoringScope&) = delete;

private:
    AdapterRegistry& registry_;
};

// Runs `adapter.health_check()` and converts errors and exceptions into an
// Unhealthy status.
protocol::HealthStatus checked_health(const adapters::AgentAdapter& adapter);

}  // namespace conductor::registry
