#include "session/run_manager.hpp"
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace conductor::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::PipelineRequest;

std::string to_string(const RunState state) {
    switch (state) {
        case RunState::Created:
            return "created";
        case RunState::Running:
            return "running";
        case RunState::Completed:
            return "completed";
        case RunState::Failed:
            return "failed";
        case RunState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

bool RunManager::is_terminal(const RunState state) {
    return state == RunState::Completed || state == RunState::Failed ||
           state == RunState::Cancelled;
}

core::errors::Result<std::string> RunManager::start_run(const PipelineRequest& request) {
    if (request.repository.empty()) {
        return AgentError{ErrorCategory::Input, "Run request must name a repository.",
                          "invalid_run_request"};
    }
    if (request.task_id.empty()) {
        return AgentError{ErrorCategory::Input, "Run request must name a task.",
                          "invalid_run_request"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto active = active_by_repository_.find(request.repository);
    if (active != active_by_repository_.end()) {
        return AgentError{ErrorCategory::Input,
                          "Repository " + request.repository + " already has an active run: " +
                              active->second,
                          "run_already_active",
                          "Cancel the active run or wait for it to finish."};
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string run_id = core::config::generate_run_id();
        if (runs_.find(run_id) != runs_.end()) {
            continue;
        }

        RunRecord record;
        record.run_id = run_id;
        record.request = request;
        record.cancel_token = core::cancellation::make_cancel_token();
        record.state = RunState::Running;
        record.started_at = core::config::now_rfc3339();
        runs_.emplace(run_id, std::move(record));
        active_by_repository_[request.repository] = run_id;
        LOG_INFO("RunManager: run " + run_id + " for " + request.repository +
                 " transition created -> running");
        return run_id;
    }

    return AgentError{ErrorCategory::Internal, "Unable to allocate unique run ID.",
                      "run_id_generation_failed"};
}

core::errors::Result<RunState> RunManager::cancel_run(const std::string& run_id) {
    auto result = transition_to_terminal(run_id, RunState::Cancelled, std::nullopt);
    if (core::errors::is_error(result)) {
        return result;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    runs_.at(run_id).cancel_token->store(true);
    return result;
}

core::errors::Result<RunState> RunManager::mark_completed(const std::string& run_id) {
    return transition_to_terminal(run_id, RunState::Completed, std::nullopt);
}

core::errors::Result<RunState> RunManager::mark_failed(const std::string& run_id,
                                                       const std::string& reason) {
    return transition_to_terminal(run_id, RunState::Failed, reason);
}

core::errors::Result<RunState> RunManager::transition_to_terminal(
    const std::string& run_id, const RunState next_state,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AgentError{ErrorCategory::Input, "Run ID not found: " + run_id, "run_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return AgentError{ErrorCategory::Input,
                          "Run is already terminal: " + to_string(it->second.state),
                          "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    active_by_repository_.erase(it->second.request.repository);
    LOG_INFO("RunManager: run " + run_id + " transition " + prev + " -> " +
             to_string(next_state));
    return it->second.state;
}

core::errors::Result<RunState> RunManager::get_run_state(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AgentError{ErrorCategory::Input, "Run ID not found: " + run_id, "run_not_found"};
    }
    return it->second.state;
}

core::errors::Result<core::cancellation::CancelToken> RunManager::get_cancel_token(
    const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return AgentError{ErrorCategory::Input, "Run ID not found: " + run_id, "run_not_found"};
    }
    return it->second.cancel_token;
}

std::optional<std::string> RunManager::active_run(const std::string& repository) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_by_repository_.find(repository);
    if (it == active_by_repository_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t RunManager::run_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

}  // namespace conductor::session
