#include "pipeline/stage_machine.hpp"

namespace conductor::pipeline {

using core::errors::AgentError;
using core::errors::ErrorCategory;

std::string to_string(const StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::Pending:
            return "pending";
        case StageOutcome::Running:
            return "running";
        case StageOutcome::Succeeded:
            return "succeeded";
        case StageOutcome::Failed:
            return "failed";
        case StageOutcome::Skipped:
            return "skipped";
    }
    return "unknown";
}

// No default: a new enumerator without a case here fails -Wswitch, and the
// assert below fails when the ordered list is not updated alongside.
std::size_t stage_index(const Stage stage) {
    static_assert(kOrderedStages.size() == static_cast<std::size_t>(Stage::Completed) + 1,
                  "kOrderedStages must list every Stage");
    switch (stage) {
        case Stage::Implementation:
            return 0;
        case Stage::Quality:
            return 1;
        case Stage::Security:
            return 2;
        case Stage::Testing:
            return 3;
        case Stage::WaitingExternalIntegration:
            return 4;
        case Stage::WaitingMerge:
            return 5;
        case Stage::Completed:
            return 6;
    }
    return kStageCount;
}

core::errors::Result<ResumePlan> compute_resume(const StageValue& persisted) {
    const auto* stage = std::get_if<Stage>(&persisted);
    if (stage == nullptr) {
        return AgentError{ErrorCategory::Validation,
                          "Persisted stage '" + to_string(persisted) +
                              "' is not recognized; refusing to guess a resume point.",
                          "unrecognized_stage",
                          "Reset the repository's progress to restart the pipeline."};
    }

    ResumePlan plan;
    plan.resume_point = *stage;
    const std::size_t index = stage_index(*stage);
    for (std::size_t i = 0; i < index; ++i) {
        plan.skipped.push_back(kOrderedStages[i]);
    }
    return plan;
}

RetryDecision retry_decision(const StageValue& value, const AgentError& failure) {
    const auto* stage = std::get_if<Stage>(&value);
    if (stage == nullptr) {
        return {false, "unrecognized stage '" + to_string(value) + "' is never retried"};
    }

    switch (*stage) {
        case Stage::Security:
            return {false, "security posts a single attestation and is never retried"};
        case Stage::Completed:
            return {false, "completed is terminal"};
        case Stage::Implementation:
        case Stage::Quality:
        case Stage::Testing:
        case Stage::WaitingExternalIntegration:
        case Stage::WaitingMerge:
            break;
    }

    switch (failure.category) {
        case ErrorCategory::Input:
        case ErrorCategory::Validation:
        case ErrorCategory::Template:
        case ErrorCategory::UnsupportedTool:
        case ErrorCategory::Initialization:
            return {false, core::errors::to_string(failure.category) +
                               " failures are deterministic and are not retried"};
        case ErrorCategory::Process:
        case ErrorCategory::Delivery:
        case ErrorCategory::Persistence:
        case ErrorCategory::Internal:
            break;
    }
    return {true, to_string(*stage) + " is retryable"};
}

std::optional<Stage> next_stage(const Stage stage) {
    const std::size_t index = stage_index(stage);
    if (index + 1 >= kStageCount) {
        return std::nullopt;
    }
    return kOrderedStages[index + 1];
}

bool is_terminal(const Stage stage) {
    return stage == Stage::Completed;
}

bool can_start(const Stage stage, const std::map<Stage, StageOutcome>& outcomes) {
    const std::size_t index = stage_index(stage);
    if (index == 0) {
        return true;
    }
    auto it = outcomes.find(kOrderedStages[index - 1]);
    if (it == outcomes.end()) {
        return false;
    }
    return it->second == StageOutcome::Succeeded || it->second == StageOutcome::Skipped;
}

}  // namespace conductor::pipeline
