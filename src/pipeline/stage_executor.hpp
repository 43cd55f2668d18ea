#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"
#include "pipeline/stage.hpp"
#include "protocol/pipeline_request.hpp"

namespace conductor::pipeline {

struct StageContext {
    const protocol::PipelineRequest& request;
    std::string run_id;
    std::uint32_t attempt = 1;
};

struct StageReport {
    std::string summary;
    nlohmann::json details = nlohmann::json::object();
};

// Runs one attempt of one stage. Failures come back as errors whose
// category drives the retry policy.
class StageExecutor {
public:
    virtual ~StageExecutor() = default;

    virtual core::errors::Result<StageReport> execute(
        Stage stage, const StageContext& context,
        const core::cancellation::CancelToken& cancel) = 0;
};

// Sends the two waiting stages to one executor and agent stages to another.
class StageRouter : public StageExecutor {
public:
    StageRouter(StageExecutor& agent_stages, StageExecutor& waiting_stages)
        : agent_stages_(agent_stages), waiting_stages_(waiting_stages) {}

    core::errors::Result<StageReport> execute(
        Stage stage, const StageContext& context,
        const core::cancellation::CancelToken& cancel) override {
        switch (stage) {
            case Stage::WaitingExternalIntegration:
            case Stage::WaitingMerge:
                return waiting_stages_.execute(stage, context, cancel);
            case Stage::Completed:
                return core::errors::AgentError{
                    core::errors::ErrorCategory::Internal,
                    "The completed stage has no work to execute.", "stage_not_executable"};
            default:
                return agent_stages_.execute(stage, context, cancel);
        }
    }

private:
    StageExecutor& agent_stages_;
    StageExecutor& waiting_stages_;
};

}  // namespace conductor::pipeline
