#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/pipeline_request.hpp"

namespace conductor::session {

enum class RunState {
    Created,
    Running,
    Completed,
    Failed,
    Cancelled
};

std::string to_string(RunState state);

struct RunRecord {
    std::string run_id;
    protocol::PipelineRequest request;
    RunState state = RunState::Created;
    std::optional<std::string> failure_reason;
    core::cancellation::CancelToken cancel_token;
    std::string started_at;
};

// Issues run handles and owns one cancellation token per run. Progress is
// keyed by repository, so at most one run per repository is active.
class RunManager {
public:
    core::errors::Result<std::string> start_run(const protocol::PipelineRequest& request);

    // Handle of the running run for `repository`, if any.
    std::optional<std::string> active_run(const std::string& repository) const;

    // Flips the run's token; the bridge observes it and terminates the agent.
    core::errors::Result<RunState> cancel_run(const std::string& run_id);
    core::errors::Result<RunState> get_run_state(const std::string& run_id) const;
    core::errors::Result<core::cancellation::CancelToken> get_cancel_token(
        const std::string& run_id) const;

    core::errors::Result<RunState> mark_completed(const std::string& run_id);
    core::errors::Result<RunState> mark_failed(const std::string& run_id,
                                               const std::string& reason);

    std::size_t run_count() const;

private:
    core::errors::Result<RunState> transition_to_terminal(
        const std::string& run_id, RunState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RunState state);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunRecord> runs_;
    std::unordered_map<std::string, std::string> active_by_repository_;
};

}  // namespace conductor::session
