#include "registry/adapter_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::registry {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Unit;
using protocol::HealthCheckRecord;
using protocol::HealthState;
using protocol::HealthStatus;

namespace {

HealthStatus unhealthy(const std::string& message) {
    HealthStatus status;
    status.state = HealthState::Unhealthy;
    status.message = message;
    status.checked_at = std::chrono::system_clock::now();
    return status;
}

}  // namespace

HealthStatus checked_health(const adapters::AgentAdapter& adapter) {
    try {
        auto result = adapter.health_check();
        if (core::errors::is_error(result)) {
            return unhealthy("Health check failed: " + core::errors::get_error(result).message);
        }
        return core::errors::get_value(result);
    } catch (const std::exception& e) {
        return unhealthy(std::string("Health check threw: ") + e.what());
    }
}

AdapterRegistry::AdapterRegistry(std::size_t max_history, std::size_t failure_threshold)
    : monitor_(max_history, failure_threshold) {}

AdapterRegistry::~AdapterRegistry() {
    stop_health_monitoring();
}

core::errors::Result<Unit> AdapterRegistry::register_adapter(AdapterPtr adapter) {
    if (!adapter) {
        return AgentError{ErrorCategory::Validation, "Cannot register a null adapter.",
                          "invalid_adapter"};
    }
    const std::string tool_id = adapter->tool_id();
    if (tool_id.empty()) {
        return AgentError{ErrorCategory::Validation, "Adapter has an empty tool id.",
                          "invalid_adapter"};
    }
    if (adapter->get_executable_name().empty()) {
        return AgentError{ErrorCategory::Validation,
                          "Adapter " + tool_id + " has no executable name.", "invalid_adapter"};
    }
    if (adapter->get_memory_filename().empty()) {
        return AgentError{ErrorCategory::Validation,
                          "Adapter " + tool_id + " has no memory file name.", "invalid_adapter"};
    }
    if (adapter->get_capabilities().max_context_tokens == 0) {
        return AgentError{ErrorCategory::Validation,
                          "Adapter " + tool_id + " reports a zero context window.",
                          "invalid_adapter"};
    }

    const HealthStatus health = checked_health(*adapter);
    if (health.state != HealthState::Healthy) {
        LOG_WARN("AdapterRegistry: " + tool_id + " registered while " +
                 protocol::to_string(health.state) + ": " + health.message);
    }

    std::unique_lock<std::shared_mutex> lock(adapters_mutex_);
    const bool replaced = adapters_.count(tool_id) > 0;
    adapters_[tool_id] = std::move(adapter);
    LOG_INFO("AdapterRegistry: " + std::string(replaced ? "replaced " : "registered ") + tool_id);
    return Unit{};
}

core::errors::Result<AdapterRegistry::AdapterPtr> AdapterRegistry::create(
    const std::string& tool_id) const {
    std::shared_lock<std::shared_mutex> lock(adapters_mutex_);
    auto it = adapters_.find(tool_id);
    if (it == adapters_.end()) {
        std::string supported;
        for (const auto& entry : adapters_) {
            supported += (supported.empty() ? "" : ", ") + entry.first;
        }
        return AgentError{ErrorCategory::UnsupportedTool, "Unsupported tool: " + tool_id,
                          "unsupported_tool",
                          supported.empty() ? "No adapters are registered."
                                            : "Supported tools: " + supported};
    }
    AdapterPtr adapter = it->second;
    lock.unlock();

    if (monitor_.is_consistently_unhealthy(tool_id)) {
        LOG_WARN("AdapterRegistry: handing out " + tool_id +
                 " although its recent health checks all failed.");
    }
    return adapter;
}

bool AdapterRegistry::supports(const std::string& tool_id) const {
    std::shared_lock<std::shared_mutex> lock(adapters_mutex_);
    return adapters_.count(tool_id) > 0;
}

std::vector<std::string> AdapterRegistry::supported_tools() const {
    std::shared_lock<std::shared_mutex> lock(adapters_mutex_);
    std::vector<std::string> tools;
    tools.reserve(adapters_.size());
    for (const auto& entry : adapters_) {
        tools.push_back(entry.first);
    }
    return tools;
}

std::map<std::string, AdapterRegistry::AdapterPtr> AdapterRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(adapters_mutex_);
    return adapters_;
}

std::map<std::string, HealthStatus> AdapterRegistry::get_health_summary() const {
    std::map<std::string, HealthStatus> summary;
    for (const auto& [tool_id, adapter] : snapshot()) {
        summary[tool_id] = checked_health(*adapter);
    }
    return summary;
}

RegistryStats AdapterRegistry::get_stats() const {
    RegistryStats stats;
    for (const auto& [tool_id, status] : get_health_summary()) {
        ++stats.total;
        switch (status.state) {
            case HealthState::Healthy:   ++stats.healthy; break;
            case HealthState::Warning:   ++stats.warning; break;
            case HealthState::Unhealthy: ++stats.unhealthy; break;
            case HealthState::Unknown:   ++stats.unknown; break;
        }
    }
    return stats;
}

void AdapterRegistry::probe_all_once() {
    for (const auto& [tool_id, adapter] : snapshot()) {
        const auto started = std::chrono::steady_clock::now();
        const HealthStatus status = checked_health(*adapter);

        HealthCheckRecord record;
        record.state = status.state;
        record.checked_at = status.checked_at;
        record.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (status.state != HealthState::Healthy) {
            record.error = status.message;
        }
        monitor_.record(tool_id, record);

        if (monitor_.is_consistently_unhealthy(tool_id)) {
            LOG_ERROR("AdapterRegistry: " + tool_id + " is consistently unhealthy: " +
                      status.message);
        }
    }
}

void AdapterRegistry::start_health_monitoring(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread([this, interval]() {
        LOG_INFO("AdapterRegistry: health monitoring every " +
                 std::to_string(interval.count()) + "ms");
        std::unique_lock<std::mutex> wait_lock(worker_mutex_);
        while (!stop_requested_) {
            wait_lock.unlock();
            probe_all_once();
            wait_lock.lock();
            worker_cv_.wait_for(wait_lock, interval, [this]() { return stop_requested_; });
        }
    });
}

void AdapterRegistry::stop_health_monitoring() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    worker_cv_.notify_all();
    worker.join();
    LOG_INFO("AdapterRegistry: health monitoring stopped");
}

bool AdapterRegistry::is_monitoring() const {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    return worker_.joinable();
}

HealthMonitoringScope::HealthMonitoringScope(AdapterRegistry& registry,
                                             std::chrono::milliseconds interval)
    : registry_(registry) {
    registry_.start_health_monitoring(interval);
}

HealthMonitoringScope::~HealthMonitoringScope() {
    registry_.stop_health_monitoring();
}

}  // namespace conductor::registry
