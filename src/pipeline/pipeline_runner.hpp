#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"
#include "pipeline/escalation.hpp"
#include "pipeline/progress_store.hpp"
#include "pipeline/stage.hpp"
#include "pipeline/stage_executor.hpp"
#include "pipeline/stage_machine.hpp"
#include "protocol/pipeline_request.hpp"
#include "session/run_journal.hpp"

namespace conductor::pipeline {

struct PipelineOutcome {
    std::string run_id;
    Stage resumed_from = Stage::Implementation;
    std::vector<Stage> skipped;
    std::map<Stage, StageOutcome> outcomes;
    std::map<Stage, std::uint32_t> attempts;
    std::map<Stage, StageReport> reports;
};

// Drives one repository through the ordered stages, resuming from stored
// progress. The next stage is always persisted before it starts, so a crash
// between stages resumes at the right place.
class PipelineRunner {
public:
    PipelineRunner(ProgressTracker& tracker, StageExecutor& executor, Escalation& escalation,
                   const session::RunJournal* journal = nullptr);

    core::errors::Result<PipelineOutcome> run(const protocol::PipelineRequest& request,
                                              const std::string& run_id,
                                              const core::cancellation::CancelToken& cancel);

private:
    core::errors::Result<StageProgress> persist(StageProgress record, Stage stage,
                                                ProgressStatus status);
    void journal(const protocol::PipelineRequest& request, const std::string& run_id,
                 const std::string& event, const nlohmann::json& payload) const;
    core::errors::AgentError suspend(const protocol::PipelineRequest& request,
                                     const std::string& run_id, StageProgress record,
                                     Stage stage);

    ProgressTracker& tracker_;
    StageExecutor& executor_;
    Escalation& escalation_;
    const session::RunJournal* journal_;
};

}  // namespace conductor::pipeline
