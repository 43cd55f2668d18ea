#include "pipeline/pipeline_runner.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::pipeline {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

PipelineRunner::PipelineRunner(ProgressTracker& tracker, StageExecutor& executor,
                               Escalation& escalation, const session::RunJournal* journal)
    : tracker_(tracker), executor_(executor), escalation_(escalation), journal_(journal) {}

void PipelineRunner::journal(const protocol::PipelineRequest& request, const std::string& run_id,
                             const std::string& event, const json& payload) const {
    if (journal_ == nullptr) {
        return;
    }
    auto written =
        journal_->append(normalize_repository_key(request.repository), run_id, event, payload);
    if (core::errors::is_error(written)) {
        LOG_WARN("PipelineRunner: journal event '" + event +
                 "' not written: " + core::errors::get_error(written).message);
    }
}

core::errors::Result<StageProgress> PipelineRunner::persist(StageProgress record,
                                                            const Stage stage,
                                                            const ProgressStatus status) {
    record.stage = to_string(stage);
    record.status = status;
    return tracker_.write_progress(std::move(record));
}

AgentError PipelineRunner::suspend(const protocol::PipelineRequest& request,
                                   const std::string& run_id, StageProgress record,
                                   const Stage stage) {
    LOG_WARN("PipelineRunner: run " + run_id + " cancelled at stage " + to_string(stage));
    auto saved = persist(std::move(record), stage, ProgressStatus::Suspended);
    if (core::errors::is_error(saved)) {
        LOG_ERROR("PipelineRunner: unable to record suspension: " +
                  core::errors::get_error(saved).message);
    }
    journal(request, run_id, "run_finished",
            {{"status", "cancelled"}, {"stage", to_string(stage)}});
    return AgentError{ErrorCategory::Process,
                      "Run cancelled at stage '" + to_string(stage) + "'.", "run_cancelled",
                      "Start the run again to resume from this stage."};
}

core::errors::Result<PipelineOutcome> PipelineRunner::run(
    const protocol::PipelineRequest& request, const std::string& run_id,
    const core::cancellation::CancelToken& cancel) {
    if (request.repository.empty()) {
        return AgentError{ErrorCategory::Input, "Repository must not be empty.",
                          "missing_repository"};
    }

    auto existing_result = tracker_.read_progress(request.repository);
    if (core::errors::is_error(existing_result)) {
        return core::errors::get_error(existing_result);
    }
    const auto existing = core::errors::get_value(existing_result);

    ResumePlan plan;
    if (existing.has_value()) {
        auto plan_result = compute_resume(parse_stage(existing->stage));
        if (core::errors::is_error(plan_result)) {
            const auto& refused = core::errors::get_error(plan_result);
            EscalationNotice notice;
            notice.repository = request.repository;
            notice.task_id = request.task_id;
            notice.run_id = run_id;
            notice.stage = existing->stage;
            notice.error_kind = core::errors::to_string(refused.category);
            notice.error_code = refused.code;
            notice.cause = core::errors::compact_cause(refused);
            escalation_.notify(notice);
            return refused;
        }
        plan = core::errors::get_value(plan_result);
        LOG_INFO("PipelineRunner: resuming " + request.repository + " at stage " +
                 to_string(plan.resume_point) + " (previous run " + existing->run_handle +
                 ", status " + to_string(existing->status) + ")");
    }

    PipelineOutcome outcome;
    outcome.run_id = run_id;
    outcome.resumed_from = plan.resume_point;
    outcome.skipped = plan.skipped;
    for (const Stage stage : kOrderedStages) {
        outcome.outcomes[stage] = StageOutcome::Pending;
    }

    journal(request, run_id, "run_started",
            {{"repository", request.repository},
             {"task_id", request.task_id},
             {"tool", request.agent.tool_id},
             {"model", request.agent.model},
             {"resume_stage", to_string(plan.resume_point)}});

    for (const Stage stage : plan.skipped) {
        outcome.outcomes[stage] = StageOutcome::Skipped;
        journal(request, run_id, "stage_skipped", {{"stage", to_string(stage)}});
    }

    StageProgress record;
    record.repository = request.repository;
    record.task_id = request.task_id;
    record.branch = request.branch;
    record.workflow_name = request.workflow_name;
    record.run_handle = run_id;
    if (existing.has_value() && existing->task_id == request.task_id) {
        record.started_at = existing->started_at;
    }

    auto saved = persist(record, plan.resume_point,
                         is_terminal(plan.resume_point) ? ProgressStatus::Completed
                                                        : ProgressStatus::InProgress);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    record = core::errors::get_value(saved);

    const std::uint32_t max_attempts = std::max<std::uint32_t>(1, request.max_attempts);
    Stage stage = plan.resume_point;
    while (!is_terminal(stage)) {
        if (!can_start(stage, outcome.outcomes)) {
            return AgentError{ErrorCategory::Internal,
                              "Stage '" + to_string(stage) + "' started before its predecessor.",
                              "stage_order_violation"};
        }
        outcome.outcomes[stage] = StageOutcome::Running;

        std::uint32_t attempt = 0;
        while (true) {
            if (core::cancellation::is_cancelled(cancel)) {
                outcome.outcomes[stage] = StageOutcome::Failed;
                return suspend(request, run_id, record, stage);
            }

            ++attempt;
            outcome.attempts[stage] = attempt;
            LOG_INFO("PipelineRunner: stage " + to_string(stage) + " attempt " +
                     std::to_string(attempt) + "/" + std::to_string(max_attempts));
            journal(request, run_id, "stage_attempt",
                    {{"stage", to_string(stage)}, {"attempt", attempt}});

            const StageContext context{request, run_id, attempt};
            auto result = executor_.execute(stage, context, cancel);
            if (!core::errors::is_error(result)) {
                auto report = core::errors::get_value(result);
                journal(request, run_id, "stage_result",
                        {{"stage", to_string(stage)},
                         {"attempt", attempt},
                         {"outcome", "succeeded"},
                         {"summary", report.summary},
                         {"details", report.details}});
                outcome.reports[stage] = std::move(report);
                break;
            }

            const AgentError failure = core::errors::get_error(result);
            const RetryDecision decision = retry_decision(stage, failure);
            journal(request, run_id, "stage_result",
                    {{"stage", to_string(stage)},
                     {"attempt", attempt},
                     {"outcome", "failed"},
                     {"category", core::errors::to_string(failure.category)},
                     {"code", failure.code},
                     {"cause", core::errors::compact_cause(failure)},
                     {"retry", decision.retry},
                     {"reason", decision.reason}});

            if (core::cancellation::is_cancelled(cancel)) {
                outcome.outcomes[stage] = StageOutcome::Failed;
                return suspend(request, run_id, record, stage);
            }

            if (decision.retry && attempt < max_attempts) {
                LOG_WARN("PipelineRunner: stage " + to_string(stage) + " attempt " +
                         std::to_string(attempt) + " failed (" +
                         core::errors::compact_cause(failure) + "); retrying: " +
                         decision.reason);
                continue;
            }

            outcome.outcomes[stage] = StageOutcome::Failed;
            EscalationNotice notice;
            notice.repository = request.repository;
            notice.task_id = request.task_id;
            notice.run_id = run_id;
            notice.stage = to_string(stage);
            notice.error_kind = core::errors::to_string(failure.category);
            notice.error_code = failure.code;
            notice.cause = core::errors::compact_cause(failure);
            notice.attempts = attempt;
            notice.retryable = decision.retry;
            escalation_.notify(notice);

            auto failed = persist(record, stage, ProgressStatus::Failed);
            if (core::errors::is_error(failed)) {
                LOG_ERROR("PipelineRunner: unable to record failure: " +
                          core::errors::get_error(failed).message);
            }
            journal(request, run_id, "run_finished",
                    {{"status", "failed"}, {"stage", to_string(stage)}, {"cause", notice.cause}});
            return AgentError{failure.category,
                              "Stage '" + to_string(stage) + "' failed (" + notice.error_kind +
                                  "): " + notice.cause,
                              failure.code, failure.hint};
        }

        outcome.outcomes[stage] = StageOutcome::Succeeded;
        const Stage next = next_stage(stage).value_or(Stage::Completed);
        auto advanced = persist(record, next,
                                is_terminal(next) ? ProgressStatus::Completed
                                                  : ProgressStatus::InProgress);
        if (core::errors::is_error(advanced)) {
            return core::errors::get_error(advanced);
        }
        record = core::errors::get_value(advanced);
        stage = next;
    }

    outcome.outcomes[Stage::Completed] = StageOutcome::Succeeded;
    auto cleared = tracker_.clear_progress(request.repository);
    if (core::errors::is_error(cleared)) {
        return core::errors::get_error(cleared);
    }
    journal(request, run_id, "run_finished", {{"status", "completed"}});
    LOG_INFO("PipelineRunner: " + request.repository + " completed");
    return outcome;
}

}  // namespace conductor::pipeline
