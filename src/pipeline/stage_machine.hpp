#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "pipeline/stage.hpp"

namespace conductor::pipeline {

enum class StageOutcome {
    Pending,
    Running,
    Succeeded,
    Failed,
    Skipped
};

std::string to_string(StageOutcome outcome);

struct ResumePlan {
    Stage resume_point = Stage::Implementation;
    std::vector<Stage> skipped;  // strictly earlier stages, in order
};

struct RetryDecision {
    bool retry = false;
    std::string reason;
};

// Position of `stage` in kOrderedStages.
std::size_t stage_index(Stage stage);

// Resume point for a persisted stage. An unrecognized stage name is an
// error: the run must be reset explicitly rather than resumed at a guess.
core::errors::Result<ResumePlan> compute_resume(const StageValue& persisted);

// Whether a failed attempt of `stage` may run again.
RetryDecision retry_decision(const StageValue& stage, const core::errors::AgentError& failure);

std::optional<Stage> next_stage(Stage stage);
bool is_terminal(Stage stage);

// A stage may start once its predecessor succeeded or was skipped.
bool can_start(Stage stage, const std::map<Stage, StageOutcome>& outcomes);

}  // namespace conductor::pipeline
