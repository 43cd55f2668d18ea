#include "adapters/claude_adapter.hpp"

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

constexpr std::uint32_t kClaudeMaxContext = 200000;

// Returns every line that parses as a JSON object, or nothing when any
// non-empty line does not.
std::vector<json> json_lines(const std::string& output) {
    std::vector<json> events;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        json event = json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object() || !event.contains("type")) {
            return {};
        }
        events.push_back(std::move(event));
    }
    return events;
}

json parameter_value(const std::string& raw) {
    const std::string text = trim(raw);
    json parsed = json::parse(text, nullptr, false);
    if (!parsed.is_discarded() && (parsed.is_object() || parsed.is_array())) {
        return parsed;
    }
    return text;
}

}  // namespace

ClaudeAdapter::ClaudeAdapter(AdapterSettings settings,
                             std::shared_ptr<const templates::TemplateRenderer> renderer)
    : base_(std::move(settings), std::move(renderer)),
      model_patterns_{
          std::regex("^claude-3-5-sonnet.*"),
          std::regex("^claude-3-(opus|sonnet|haiku).*"),
          std::regex("^claude-(opus|sonnet|haiku)-[0-9].*"),
          std::regex("^claude-[4-9].*"),
          std::regex("^(opus|sonnet|haiku)$"),
      } {
    LOG_DEBUG("ClaudeAdapter initialized with template " +
              base_.settings().config_template.string());
}

bool ClaudeAdapter::validate_model(const std::string& model) const {
    if (model.empty()) {
        return false;
    }
    for (const auto& pattern : model_patterns_) {
        if (std::regex_match(model, pattern)) {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::string> ClaudeAdapter::generate_config(
    const protocol::AgentConfig& config) const {
    auto valid = base_.validate_base_config(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    if (!validate_model(config.model)) {
        LOG_WARN("claude: model '" + config.model +
                 "' does not match a known pattern; passing it through.");
    }
    return base_.render_config(base_.build_context(config));
}

core::errors::Result<std::string> ClaudeAdapter::generate_memory(
    const protocol::AgentConfig& config, const std::string& instructions) const {
    auto valid = base_.validate_base_config(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    json context = base_.build_context(config);
    context["instructions"] = instructions;
    return base_.render_memory(context);
}

std::string ClaudeAdapter::format_prompt(const std::string& prompt) const {
    if (prompt.rfind("Human:", 0) == 0) {
        return prompt;
    }
    return "Human: " + prompt + "\n\nAssistant: ";
}

ParsedResponse ClaudeAdapter::parse_markup(const std::string& output) const {
    static const std::regex block_re(R"(<function_calls>[\s\S]*?</function_calls>)");
    static const std::regex invoke_re(R"re(<invoke name="([^"]+)">([\s\S]*?)</invoke>)re");
    static const std::regex param_re(R"re(<parameter name="([^"]+)">([\s\S]*?)</parameter>)re");

    ParsedResponse response;
    for (auto it = std::sregex_iterator(output.begin(), output.end(), invoke_re);
         it != std::sregex_iterator(); ++it) {
        ToolCall call;
        call.name = (*it)[1].str();
        const std::string body = (*it)[2].str();
        for (auto p = std::sregex_iterator(body.begin(), body.end(), param_re);
             p != std::sregex_iterator(); ++p) {
            call.arguments[(*p)[1].str()] = parameter_value((*p)[2].str());
        }
        response.tool_calls.push_back(std::move(call));
    }

    response.content = trim(std::regex_replace(output, block_re, ""));
    return response;
}

ParsedResponse ClaudeAdapter::parse_stream_json(const std::vector<json>& events) const {
    ParsedResponse response;
    std::vector<std::string> texts;
    std::optional<std::string> final_result;

    for (const auto& event : events) {
        const std::string type = event.value("type", "");
        if (type == "system") {
            if (auto model = first_string(event, {"model"})) {
                response.metadata.model = *model;
            }
        } else if (type == "assistant") {
            const json message = event.value("message", json::object());
            merge_usage(message, response.metadata);
            const json content = message.value("content", json::array());
            if (!content.is_array()) {
                continue;
            }
            for (const auto& item : content) {
                const std::string kind = item.value("type", "");
                if (kind == "text") {
                    texts.push_back(item.value("text", ""));
                } else if (kind == "tool_use") {
                    ToolCall call;
                    call.name = item.value("name", "");
                    call.arguments = item.value("input", json::object());
                    call.id = item.value("id", "");
                    response.tool_calls.push_back(std::move(call));
                }
            }
        } else if (type == "result") {
            merge_usage(event, response.metadata);
            response.metadata.duration_ms = first_u64(event, {"duration_ms"});
            if (auto text = first_string(event, {"result"})) {
                final_result = *text;
            }
            if (event.value("is_error", false)) {
                response.finish_reason = FinishReason::Error;
            }
            if (event.value("subtype", "") == "error_max_turns") {
                response.finish_reason = FinishReason::Length;
            }
            if (event.contains("session_id")) {
                response.metadata.extra["session_id"] = event["session_id"];
            }
        }
    }

    if (final_result.has_value()) {
        response.content = *final_result;
    } else {
        std::string joined;
        for (const auto& text : texts) {
            joined += (joined.empty() ? "" : "\n") + text;
        }
        response.content = joined;
    }
    return response;
}

core::errors::Result<ParsedResponse> ClaudeAdapter::parse_response(
    const std::string& output) const {
    const auto events = json_lines(output);
    ParsedResponse response;
    try {
        response = events.empty() ? parse_markup(output) : parse_stream_json(events);
    } catch (const json::exception& e) {
        LOG_WARN(std::string("claude: malformed stream-json event, treating output as text: ") +
                 e.what());
        response = parse_markup(output);
    }

    assign_unique_ids(response.tool_calls);
    if (!response.tool_calls.empty() && response.finish_reason == FinishReason::Stop) {
        response.finish_reason = FinishReason::ToolCall;
    }
    return response;
}

protocol::CapabilityDescriptor ClaudeAdapter::get_capabilities() const {
    protocol::CapabilityDescriptor caps;
    caps.supports_streaming = true;
    caps.supports_multimodal = false;
    caps.supports_function_calling = true;
    caps.supports_system_prompts = true;
    caps.max_context_tokens = base_.settings().max_context_tokens.value_or(kClaudeMaxContext);
    caps.memory_filename = get_memory_filename();
    caps.config_format = protocol::ConfigFormat::Json;
    caps.auth_methods = {protocol::AuthMethod::SessionToken};
    return caps;
}

std::vector<std::string> ClaudeAdapter::build_command(const std::string& model) const {
    return {get_executable_name(),
            "-p",
            "--input-format", "stream-json",
            "--output-format", "stream-json",
            "--verbose",
            "--dangerously-skip-permissions",
            "--mcp-config", get_config_filename().string(),
            "--model", model};
}

core::errors::Result<Unit> ClaudeAdapter::initialize(
    const protocol::ContainerContext& container) const {
    return base_.validate_container(container, "initialize");
}

core::errors::Result<Unit> ClaudeAdapter::cleanup(
    const protocol::ContainerContext& container) const {
    return base_.validate_container(container, "cleanup");
}

core::errors::Result<protocol::HealthStatus> ClaudeAdapter::health_check() const {
    return run_adapter_health_check(base_, *this, "Hello from Claude");
}

}  // namespace conductor::adapters
