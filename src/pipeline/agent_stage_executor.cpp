#include "pipeline/agent_stage_executor.hpp"

#include <fstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::pipeline {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kStderrTail = 400;

core::errors::Result<core::errors::Unit> write_text_file(const std::filesystem::path& path,
                                                        const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return AgentError{ErrorCategory::Initialization,
                              "Unable to create directory: " + path.parent_path().string(),
                              "agent_file_write_failed"};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Initialization,
                          "Unable to open file for writing: " + path.string(),
                          "agent_file_write_failed"};
    }
    out << content;
    if (!out.good()) {
        return AgentError{ErrorCategory::Initialization, "Unable to write file: " + path.string(),
                          "agent_file_write_failed"};
    }
    return core::errors::Unit{};
}

std::string tail(const std::string& text, const std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return "..." + text.substr(text.size() - limit);
}

std::string first_line(const std::string& text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = text.find('\n', start);
    return text.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string stage_instructions(const Stage stage, const protocol::PipelineRequest& request) {
    return "Stage: " + to_string(stage) + "\nRepository: " + request.repository +
           "\nTask: " + request.task_id + (request.branch.empty() ? "" : "\nBranch: " + request.branch);
}

}  // namespace

protocol::StageAgent agent_for_stage(const protocol::PipelineRequest& request, const Stage stage) {
    const auto it = request.stage_agents.find(to_string(stage));
    if (it == request.stage_agents.end()) {
        return request.agent;
    }
    protocol::StageAgent agent = it->second;
    if (agent.model.empty() && agent.tool_id == request.agent.tool_id) {
        agent.model = request.agent.model;
    }
    return agent;
}

std::string compose_stage_prompt(const Stage stage, const protocol::PipelineRequest& request) {
    std::string prompt = stage_instructions(stage, request);
    if (!request.prompt.empty()) {
        prompt += "\n\n" + request.prompt;
    }
    return prompt;
}

AgentStageExecutor::AgentStageExecutor(const registry::AdapterRegistry& registry,
                                       const bridge::SubprocessBridge& bridge,
                                       AgentStageOptions options)
    : registry_(registry), bridge_(bridge), options_(std::move(options)) {}

core::errors::Result<StageReport> AgentStageExecutor::execute(
    const Stage stage, const StageContext& context,
    const core::cancellation::CancelToken& cancel) {
    const auto& request = context.request;
    const protocol::StageAgent agent = agent_for_stage(request, stage);

    auto adapter_result = registry_.create(agent.tool_id);
    if (core::errors::is_error(adapter_result)) {
        return core::errors::get_error(adapter_result);
    }
    const auto adapter = core::errors::get_value(adapter_result);

    protocol::AgentConfig config;
    config.tool_id = agent.tool_id;
    config.model = agent.model;
    config.tools.remote = request.remote_tools;
    config.correlation_id = context.run_id;

    const auto working_dir = request.working_directory;
    protocol::ContainerContext container;
    container.container_name = options_.container_name;
    container.working_dir = working_dir;
    container.k8s_namespace = options_.k8s_namespace;
    container.env = adapter->process_environment(working_dir);
    container.env["CONDUCTOR_RUN_ID"] = context.run_id;
    container.env["CONDUCTOR_STAGE"] = to_string(stage);
    container.env["CONDUCTOR_TASK_ID"] = request.task_id;
    container.env["CONDUCTOR_REPOSITORY"] = request.repository;

    auto initialized = adapter->initialize(container);
    if (core::errors::is_error(initialized)) {
        return core::errors::get_error(initialized);
    }

    auto rendered_config = adapter->generate_config(config);
    if (core::errors::is_error(rendered_config)) {
        return core::errors::get_error(rendered_config);
    }
    auto config_written = write_text_file(working_dir / adapter->get_config_filename(),
                                          core::errors::get_value(rendered_config));
    if (core::errors::is_error(config_written)) {
        return core::errors::get_error(config_written);
    }

    auto memory = adapter->generate_memory(config, stage_instructions(stage, request));
    if (core::errors::is_error(memory)) {
        return core::errors::get_error(memory);
    }
    auto memory_written = write_text_file(working_dir / adapter->get_memory_filename(),
                                          core::errors::get_value(memory));
    if (core::errors::is_error(memory_written)) {
        return core::errors::get_error(memory_written);
    }

    bridge::BridgeRequest bridge_request;
    bridge_request.argv = adapter->build_command(agent.model);
    bridge_request.working_dir = working_dir;
    bridge_request.env = container.env;
    bridge_request.fifo_path = options_.fifo_path;
    bridge_request.prompt = adapter->format_prompt(compose_stage_prompt(stage, request));
    bridge_request.termination_grace = options_.termination_grace;
    bridge_request.hang_timeout = options_.hang_timeout;

    LOG_INFO("AgentStageExecutor: stage " + to_string(stage) + " running " + agent.tool_id +
             " (" + agent.model + ")");
    auto bridged = bridge_.run(bridge_request, cancel);

    auto cleaned = adapter->cleanup(container);
    if (core::errors::is_error(cleaned)) {
        LOG_WARN("AgentStageExecutor: cleanup failed: " + core::errors::get_error(cleaned).message);
    }

    if (core::errors::is_error(bridged)) {
        return core::errors::get_error(bridged);
    }
    const auto& run = core::errors::get_value(bridged);

    if (run.cancelled) {
        return AgentError{ErrorCategory::Process,
                          agent.tool_id + " was cancelled during stage " + to_string(stage) + ".",
                          "agent_cancelled"};
    }
    if (run.timed_out) {
        return AgentError{ErrorCategory::Process,
                          agent.tool_id + " produced no exit within the hang timeout.",
                          "agent_hung", "Raise CONDUCTOR_HANG_TIMEOUT_MS or inspect the agent."};
    }
    if (run.exit_code != 0) {
        std::string message =
            agent.tool_id + " exited with code " + std::to_string(run.exit_code) + ".";
        if (!run.stderr_text.empty()) {
            message += "\n" + tail(run.stderr_text, kStderrTail);
        }
        return AgentError{ErrorCategory::Process, message, "agent_exit_nonzero"};
    }

    auto parsed_result = adapter->parse_response(run.stdout_text);
    if (core::errors::is_error(parsed_result)) {
        return core::errors::get_error(parsed_result);
    }
    const auto& parsed = core::errors::get_value(parsed_result);
    if (parsed.finish_reason == protocol::FinishReason::Error) {
        return AgentError{ErrorCategory::Process,
                          agent.tool_id + " reported an error: " + first_line(parsed.content),
                          "agent_reported_error"};
    }

    StageReport report;
    report.summary = first_line(parsed.content);
    report.details = {
        {"tool", agent.tool_id},
        {"model", agent.model},
        {"exit_code", run.exit_code},
        {"delivery", bridge::to_string(run.delivery)},
        {"duration_ms", run.duration_ms},
        {"finish_reason", protocol::to_string(parsed.finish_reason)},
        {"tool_calls", parsed.tool_calls.size()},
    };
    if (parsed.metadata.input_tokens.has_value()) {
        report.details["input_tokens"] = *parsed.metadata.input_tokens;
    }
    if (parsed.metadata.output_tokens.has_value()) {
        report.details["output_tokens"] = *parsed.metadata.output_tokens;
    }
    return report;
}

}  // namespace conductor::pipeline
