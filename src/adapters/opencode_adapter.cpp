#include "adapters/opencode_adapter.hpp"

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

constexpr std::uint32_t kOpenCodeMaxContext = 128000;
constexpr const char* kDefaultProvider = "openai";
constexpr const char* kDefaultProviderEnvKey = "OPENAI_API_KEY";

json provider_context(const json& passthrough) {
    json provider = passthrough.is_object() && passthrough.contains("provider") &&
                            passthrough["provider"].is_object()
                        ? passthrough["provider"]
                        : json::object();
    if (!provider.contains("name")) {
        provider["name"] = kDefaultProvider;
    }
    if (!provider.contains("envKey")) {
        provider["envKey"] = kDefaultProviderEnvKey;
    }
    return provider;
}

struct EventState {
    ParsedResponse response;
    std::vector<std::string> messages;
    std::vector<std::string> plain;
};

void apply_event(const json& event, EventState& state) {
    const std::string type = event.value("type", "");
    auto& response = state.response;

    if (auto message = first_string(event, {"message"})) {
        state.messages.push_back(*message);
    } else if (type == "message" || type == "text") {
        if (auto text = first_string(event, {"content", "text"})) {
            state.messages.push_back(*text);
        }
    }

    if (type == "tool_call" || type == "tool_use") {
        ToolCall call;
        call.name = first_string(event, {"toolName", "name", "tool"}).value_or("unknown_tool");
        for (const char* key : {"parameters", "input", "args", "arguments"}) {
            if (event.contains(key) && !event[key].is_null()) {
                call.arguments = event[key];
                break;
            }
        }
        call.id = first_string(event, {"id", "callId", "toolCallId"}).value_or("");
        response.tool_calls.push_back(std::move(call));
    }

    if (auto commands = event.find("commands"); commands != event.end() && commands->is_array()) {
        for (const auto& command : *commands) {
            ToolCall call;
            call.name = first_string(command, {"command"}).value_or("opencode_command");
            if (command.is_object() && command.contains("args")) {
                call.arguments = command["args"];
            }
            response.tool_calls.push_back(std::move(call));
        }
    }

    if (type == "result") {
        if (event.value("is_error", false)) {
            response.finish_reason = FinishReason::Error;
        }
        if (auto text = first_string(event, {"result"})) {
            state.messages.push_back(*text);
        }
        if (auto duration = first_u64(event, {"duration_ms"})) {
            response.metadata.duration_ms = *duration;
        }
    } else if (type == "error") {
        response.finish_reason = FinishReason::Error;
        if (auto text = first_string(event, {"error"})) {
            state.messages.push_back(*text);
        }
    }

    merge_usage(event, response.metadata);
    response.metadata.extra["opencode_event"] = event;
}

}  // namespace

OpenCodeAdapter::OpenCodeAdapter(AdapterSettings settings,
                                 std::shared_ptr<const templates::TemplateRenderer> renderer)
    : base_(std::move(settings), std::move(renderer)) {
    LOG_DEBUG("OpenCodeAdapter initialized with template " +
              base_.settings().config_template.string());
}

bool OpenCodeAdapter::validate_model(const std::string& model) const {
    return !trim(model).empty();
}

core::errors::Result<std::string> OpenCodeAdapter::generate_config(
    const protocol::AgentConfig& config) const {
    auto valid = base_.validate_base_config(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    json context = base_.build_context(config);
    context["provider"] = provider_context(config.passthrough);
    return base_.render_config(context);
}

core::errors::Result<std::string> OpenCodeAdapter::generate_memory(
    const protocol::AgentConfig& config, const std::string& instructions) const {
    auto valid = base_.validate_base_config(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    json context = base_.build_context(config);
    context["instructions"] = instructions;
    return base_.render_memory(context);
}

std::string OpenCodeAdapter::format_prompt(const std::string& prompt) const {
    if (!prompt.empty() && prompt.back() == '\n') {
        return prompt;
    }
    return prompt + "\n";
}

core::errors::Result<ParsedResponse> OpenCodeAdapter::parse_response(
    const std::string& output) const {
    EventState state;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const json event = json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object()) {
            state.plain.push_back(line);
            continue;
        }
        try {
            apply_event(event, state);
        } catch (const json::exception& e) {
            LOG_WARN(std::string("opencode: skipping malformed event: ") + e.what());
            state.plain.push_back(line);
        }
    }

    ParsedResponse response = std::move(state.response);
    std::string plain;
    for (const auto& text : state.plain) {
        plain += (plain.empty() ? "" : "\n") + text;
    }
    if (!plain.empty()) {
        state.messages.push_back(plain);
    }
    if (state.messages.empty()) {
        response.content = trim(output);
    } else {
        std::string content;
        for (const auto& message : state.messages) {
            content += (content.empty() ? "" : "\n") + message;
        }
        response.content = content;
    }

    assign_unique_ids(response.tool_calls);
    if (!response.tool_calls.empty() && response.finish_reason == FinishReason::Stop) {
        response.finish_reason = FinishReason::ToolCall;
    }
    return response;
}

protocol::CapabilityDescriptor OpenCodeAdapter::get_capabilities() const {
    protocol::CapabilityDescriptor caps;
    caps.supports_streaming = true;
    caps.supports_multimodal = true;
    caps.supports_function_calling = true;
    caps.supports_system_prompts = true;
    caps.max_context_tokens = base_.settings().max_context_tokens.value_or(kOpenCodeMaxContext);
    caps.memory_filename = get_memory_filename();
    caps.config_format = protocol::ConfigFormat::Json;
    caps.auth_methods = {protocol::AuthMethod::ApiKey};
    return caps;
}

std::vector<std::string> OpenCodeAdapter::build_command(const std::string& model) const {
    return {get_executable_name(), "run", "--model", model, "--format", "json"};
}

core::errors::Result<Unit> OpenCodeAdapter::initialize(
    const protocol::ContainerContext& container) const {
    return base_.validate_container(container, "initialize");
}

core::errors::Result<Unit> OpenCodeAdapter::cleanup(
    const protocol::ContainerContext& container) const {
    return base_.validate_container(container, "cleanup");
}

core::errors::Result<protocol::HealthStatus> OpenCodeAdapter::health_check() const {
    return run_adapter_health_check(base_, *this, "{}");
}

}  // namespace conductor::adapters
