#include "adapters/codex_adapter.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/trim.hpp"

namespace conductor::adapters {

using core::errors::Unit;
using core::text::trim;
using nlohmann::json;
using protocol::FinishReason;
using protocol::ParsedResponse;
using protocol::ToolCall;

namespace {

constexpr std::uint32_t kCodexMaxContext = 128000;

void collect_commands(const json& doc, std::vector<ToolCall>& calls) {
    auto commands = doc.find("commands");
    if (commands == doc.end() || !commands->is_array()) {
        return;
    }
    for (const auto& command : *commands) {
        ToolCall call;
        call.name = first_string(command, {"command"}).value_or("local_shell");
        if (command.is_object() && command.contains("args") && !command["args"].is_null()) {
            call.arguments = command["args"];
        }
        calls.push_back(std::move(call));
    }
}

// `codex exec --json` prints one event per line.
void apply_event(const json& event, ParsedResponse& response,
                 std::vector<std::string>& texts) {
    const std::string type = event.value("type", "");
    if (type == "item.completed" || type == "item.started") {
        const json item = event.value("item", json::object());
        const std::string kind = item.value("type", "");
        if (type == "item.completed" && kind == "agent_message") {
            texts.push_back(item.value("text", ""));
        } else if (type == "item.started" && kind == "command_execution") {
            ToolCall call;
            call.name = "local_shell";
            call.arguments = {{"command", item.value("command", "")}};
            call.id = item.value("id", "");
            response.tool_calls.push_back(std::move(call));
        }
    } else if (type == "turn.completed") {
        merge_usage(event, response.metadata);
    } else if (type == "turn.failed" || type == "error") {
        response.finish_reason = FinishReason::Error;
        if (auto message = first_string(event, {"message"})) {
            texts.push_back(*message);
        } else if (event.contains("error")) {
            texts.push_back(first_string(event["error"], {"message"}).value_or("codex error"));
        }
    } else {
        collect_commands(event, response.tool_calls);
        merge_usage(event, response.metadata);
        if (auto message = first_string(event, {"message", "output", "content"})) {
            texts.push_back(*message);
        }
    }
}

}  // namespace

CodexAdapter::CodexAdapter(AdapterSettings settings,
                           std::shared_ptr<const templates::TemplateRenderer> renderer)
    : base_(std::move(settings), std::move(renderer)) {
    LOG_DEBUG("CodexAdapter initialized with template " +
              base_.settings().config_template.string());
}

bool CodexAdapter::validate_model(const std::string& model) const {
    return !trim(model).empty();
}

core::errors::Result<std::string> CodexAdapter::generate_config(
    const protocol::AgentConfig& config) const {
    auto valid = base_.validate_base_config(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    json context = base_.build_context(config);
    context["model_provider"] =
        first_string(config.passthrough, {"modelProvider", "model_provider"}).value_or("openai");
    context["reasoning_effort"] =
        first_string(config.passthrough, {"reasoningEffort", "model_reasoning_effort"})
            .value_or("medium");
    return base_.render_config(context);
}

core::errors::Result<std::string> CodexAdapter::generate_memory(
    const protocol::AgentConfig& config, const std::string& instructions) const {
    auto valid = base_.validate_base_config(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    json context = base_.build_context(config);
    context["instructions"] = instructions;
    return base_.render_memory(context);
}

core::errors::Result<ParsedResponse> CodexAdapter::parse_response(
    const std::string& output) const {
    ParsedResponse response;
    std::vector<std::string> texts;
    std::vector<std::string> plain;

    try {
        const json doc = json::parse(output, nullptr, false);
        if (!doc.is_discarded() && doc.is_object()) {
            apply_event(doc, response, texts);
        } else {
            std::istringstream in(output);
            std::string line;
            while (std::getline(in, line)) {
                line = trim(line);
                if (line.empty()) {
                    continue;
                }
                const json event = json::parse(line, nullptr, false);
                if (event.is_discarded() || !event.is_object()) {
                    plain.push_back(line);
                    continue;
                }
                apply_event(event, response, texts);
            }
        }
    } catch (const json::exception& e) {
        LOG_WARN(std::string("codex: unexpected event shape, keeping raw output: ") + e.what());
        response = ParsedResponse{};
        texts.clear();
        plain = {trim(output)};
    }

    for (const auto& line : plain) {
        texts.push_back(line);
    }
    std::string content;
    for (const auto& text : texts) {
        if (text.empty()) {
            continue;
        }
        content += (content.empty() ? "" : "\n") + text;
    }
    response.content = content;

    assign_unique_ids(response.tool_calls);
    if (!response.tool_calls.empty() && response.finish_reason == FinishReason::Stop) {
        response.finish_reason = FinishReason::ToolCall;
    }
    return response;
}

protocol::CapabilityDescriptor CodexAdapter::get_capabilities() const {
    protocol::CapabilityDescriptor caps;
    caps.supports_streaming = false;
    caps.supports_multimodal = false;
    caps.supports_function_calling = true;
    caps.supports_system_prompts = true;
    caps.max_context_tokens = base_.settings().max_context_tokens.value_or(kCodexMaxContext);
    caps.memory_filename = get_memory_filename();
    caps.config_format = protocol::ConfigFormat::Toml;
    caps.auth_methods = {protocol::AuthMethod::ApiKey};
    return caps;
}

std::vector<std::string> CodexAdapter::build_command(const std::string& model) const {
    return {get_executable_name(), "exec",
            "--dangerously-bypass-approvals-and-sandbox",
            "--skip-git-repo-check",
            "--json",
            "--model", model,
            "-"};
}

core::errors::Result<Unit> CodexAdapter::initialize(
    const protocol::ContainerContext& container) const {
    return base_.validate_container(container, "initialize");
}

core::errors::Result<Unit> CodexAdapter::cleanup(
    const protocol::ContainerContext& container) const {
    return base_.validate_container(container, "cleanup");
}

core::errors::Result<protocol::HealthStatus> CodexAdapter::health_check() const {
    return run_adapter_health_check(base_, *this, "{}");
}

}  // namespace conductor::adapters
