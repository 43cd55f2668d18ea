#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "bridge/subprocess_bridge.hpp"
#include "pipeline/stage_executor.hpp"
#include "registry/adapter_registry.hpp"

namespace conductor::pipeline {

struct AgentStageOptions {
    std::filesystem::path fifo_path;
    std::chrono::milliseconds termination_grace{5000};
    std::chrono::milliseconds hang_timeout{0};
    std::string container_name = "conductor-local";
    std::string k8s_namespace = "default";
};

// Runs an agent CLI for one stage: adapter lookup, config and memory files
// in the working directory, one prompt through the bridge, parsed output.
// The stage code never learns which tool it drove.
class AgentStageExecutor : public StageExecutor {
public:
    AgentStageExecutor(const registry::AdapterRegistry& registry,
                       const bridge::SubprocessBridge& bridge, AgentStageOptions options);

    core::errors::Result<StageReport> execute(
        Stage stage, const StageContext& context,
        const core::cancellation::CancelToken& cancel) override;

private:
    const registry::AdapterRegistry& registry_;
    const bridge::SubprocessBridge& bridge_;
    AgentStageOptions options_;
};

// Tool and model for `stage`: the per-stage override when one exists.
protocol::StageAgent agent_for_stage(const protocol::PipelineRequest& request, Stage stage);

std::string compose_stage_prompt(Stage stage, const protocol::PipelineRequest& request);

}  // namespace conductor::pipeline
