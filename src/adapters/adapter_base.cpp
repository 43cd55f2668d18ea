#include "adapters/adapter_base.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <unordered_set>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace conductor::adapters {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Unit;
using nlohmann::json;
using protocol::HealthState;
using protocol::HealthStatus;

namespace {

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::optional<std::uint32_t> parse_env_u32(const std::string& text) {
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_env_double(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

AgentError validation_error(const std::string& message, const std::string& code,
                            const std::string& hint = "") {
    return AgentError{ErrorCategory::Validation, message, code, hint};
}

}  // namespace

void apply_env_defaults(AdapterSettings& settings,
                        const core::config::EnvLookup& lookup) {
    const std::string prefix = upper(settings.tool_id);

    if (auto raw = lookup(prefix + "_DEFAULT_MAX_TOKENS"); raw && !raw->empty()) {
        const auto value = parse_env_u32(*raw);
        if (value && *value >= 1 && *value <= kMaxTokensLimit) {
            settings.default_max_tokens = *value;
        } else {
            LOG_WARN("Ignoring " + prefix + "_DEFAULT_MAX_TOKENS='" + *raw + "'");
        }
    }
    if (auto raw = lookup(prefix + "_DEFAULT_TEMPERATURE"); raw && !raw->empty()) {
        const auto value = parse_env_double(*raw);
        if (value && *value >= 0.0 && *value <= kMaxTemperature) {
            settings.default_temperature = *value;
        } else {
            LOG_WARN("Ignoring " + prefix + "_DEFAULT_TEMPERATURE='" + *raw + "'");
        }
    }
    if (auto raw = lookup(prefix + "_MAX_CONTEXT_TOKENS"); raw && !raw->empty()) {
        const auto value = parse_env_u32(*raw);
        if (value && *value > 0) {
            settings.max_context_tokens = *value;
        } else {
            LOG_WARN("Ignoring " + prefix + "_MAX_CONTEXT_TOKENS='" + *raw + "'");
        }
    }
}

AdapterBase::AdapterBase(AdapterSettings settings,
                         std::shared_ptr<const templates::TemplateRenderer> renderer)
    : settings_(std::move(settings)), renderer_(std::move(renderer)) {
    settings_.tools_server_url = core::config::trim_trailing_slash(settings_.tools_server_url);
}

core::errors::Result<Unit> AdapterBase::validate_base_config(
    const protocol::AgentConfig& config) const {
    if (config.tool_id.empty()) {
        return validation_error("Agent config is missing the tool id.", "missing_tool_id");
    }
    if (config.tool_id != settings_.tool_id) {
        return validation_error("Agent config is for '" + config.tool_id +
                                    "' but this adapter drives '" + settings_.tool_id + "'.",
                                "tool_mismatch");
    }
    if (config.model.empty()) {
        return validation_error("Agent config is missing the model.", "missing_model");
    }
    if (config.max_tokens.has_value() &&
        (*config.max_tokens < 1 || *config.max_tokens > kMaxTokensLimit)) {
        return validation_error("max_tokens out of range: " + std::to_string(*config.max_tokens),
                                "max_tokens_out_of_range",
                                "Must be between 1 and 1000000.");
    }
    if (config.temperature.has_value() &&
        (std::isnan(*config.temperature) || *config.temperature < 0.0 ||
         *config.temperature > kMaxTemperature)) {
        return validation_error("temperature out of range: " + std::to_string(*config.temperature),
                                "temperature_out_of_range",
                                "Must be between 0.0 and 2.0.");
    }
    return Unit{};
}

json AdapterBase::mcp_servers(const protocol::ToolConfiguration& tools) const {
    json servers = json::object();
    const std::string& url = settings_.tools_server_url;

    for (const auto& name : tools.remote) {
        servers[name] = {
            {"command", "tools"},
            {"args", json::array({"--url", url, "--tool", name})},
            {"env", {{"TOOLS_SERVER_URL", url}}},
        };
    }
    for (const auto& local : tools.local_servers) {
        if (!local.enabled) {
            continue;
        }
        servers[local.name] = {
            {"command", "mcp-server-" + local.name},
            {"args", json::array()},
            {"env", json::object()},
        };
    }
    return servers;
}

json AdapterBase::build_context(const protocol::AgentConfig& config) const {
    const json servers = mcp_servers(config.tools);
    json server_list = json::array();
    for (auto it = servers.begin(); it != servers.end(); ++it) {
        json entry = it.value();
        entry["name"] = it.key();
        json command_line = json::array({entry["command"]});
        for (const auto& arg : entry["args"]) {
            command_line.push_back(arg);
        }
        entry["command_line"] = command_line;
        server_list.push_back(std::move(entry));
    }

    json local = json::array();
    for (const auto& server : config.tools.local_servers) {
        if (server.enabled) {
            local.push_back({{"name", server.name}, {"tools", server.tools}});
        }
    }

    std::string correlation_id = config.correlation_id;
    if (correlation_id.empty()) {
        correlation_id = settings_.correlation_id.empty()
                             ? core::config::generate_correlation_id()
                             : settings_.correlation_id;
    }

    json context;
    context["cli"] = settings_.tool_id;
    context["model"] = config.model;
    context["max_tokens"] = config.max_tokens.value_or(settings_.default_max_tokens);
    context["temperature"] = config.temperature.value_or(settings_.default_temperature);
    context["correlation_id"] = correlation_id;
    context["timestamp"] = core::config::now_rfc3339();
    context["tools_url"] = settings_.tools_server_url;
    context["remote_tools"] = config.tools.remote;
    context["local_servers"] = local;
    context["mcp_servers"] = servers;
    context["mcp_server_list"] = server_list;
    context["passthrough"] = config.passthrough.is_null() ? json::object() : config.passthrough;
    return context;
}

core::errors::Result<std::string> AdapterBase::render_config(const json& context) const {
    return renderer_->render_file(settings_.config_template, context);
}

core::errors::Result<std::string> AdapterBase::render_memory(const json& context) const {
    return renderer_->render_file(settings_.memory_template, context);
}

core::errors::Result<Unit> AdapterBase::validate_container(
    const protocol::ContainerContext& container, const std::string& operation) const {
    if (container.container_name.empty()) {
        return AgentError{ErrorCategory::Initialization,
                          settings_.tool_id + " " + operation + ": container name is empty.",
                          "invalid_container"};
    }
    if (container.working_dir.empty()) {
        return AgentError{ErrorCategory::Initialization,
                          settings_.tool_id + " " + operation + ": working directory is empty.",
                          "invalid_container"};
    }
    LOG_DEBUG(settings_.tool_id + " " + operation + " for container " +
              container.container_name + " in " + container.working_dir.string());
    return Unit{};
}

HealthStatus AdapterBase::base_health_check() const {
    HealthStatus status;
    const auto started = std::chrono::steady_clock::now();

    const json probe = {{"cli", settings_.tool_id}};
    auto rendered = renderer_->render("test: {{cli}}", probe);
    const bool render_ok = !core::errors::is_error(rendered) &&
                           core::errors::get_value(rendered) == "test: " + settings_.tool_id;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    status.details["template_render"] = render_ok;
    status.details["latency_ms"] = elapsed.count();
    status.checked_at = std::chrono::system_clock::now();

    if (!render_ok) {
        status.state = HealthState::Unhealthy;
        status.message = core::errors::is_error(rendered)
                             ? "Template engine failed: " + core::errors::get_error(rendered).message
                             : "Template engine produced unexpected output.";
        return status;
    }
    if (elapsed > settings_.health_check_timeout) {
        status.state = HealthState::Warning;
        status.message = "Health check slower than " +
                         std::to_string(settings_.health_check_timeout.count()) + "ms.";
        return status;
    }
    status.state = HealthState::Healthy;
    status.message = settings_.tool_id + " adapter is healthy.";
    return status;
}

core::errors::Result<HealthStatus> run_adapter_health_check(
    const AdapterBase& base, const AgentAdapter& adapter,
    const std::string& sample_output) {
    HealthStatus status = base.base_health_check();
    if (status.state == HealthState::Unhealthy) {
        return status;
    }

    protocol::AgentConfig probe;
    probe.tool_id = adapter.tool_id();
    probe.model = "health-check-model";
    const bool config_ok = !core::errors::is_error(adapter.generate_config(probe));
    const bool parse_ok = !core::errors::is_error(adapter.parse_response(sample_output));

    status.details["config_generation"] = config_ok;
    status.details["response_parsing"] = parse_ok;

    if ((!config_ok || !parse_ok) && status.state == HealthState::Healthy) {
        status.state = HealthState::Warning;
        status.message = adapter.tool_id() + " adapter self-test failed:" +
                         (config_ok ? "" : " config_generation") +
                         (parse_ok ? "" : " response_parsing");
    }
    return status;
}

void assign_unique_ids(std::vector<protocol::ToolCall>& calls) {
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < calls.size(); ++i) {
        auto& call = calls[i];
        if (call.id.empty() || seen.count(call.id) > 0) {
            std::string candidate = "tool_" + std::to_string(i);
            int suffix = 1;
            while (seen.count(candidate) > 0) {
                candidate = "tool_" + std::to_string(i) + "_" + std::to_string(suffix++);
            }
            call.id = candidate;
        }
        seen.insert(call.id);
    }
}

std::optional<std::string> first_string(const json& value,
                                        std::initializer_list<const char*> keys) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = value.find(key);
        if (it != value.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

std::optional<std::uint64_t> first_u64(const json& value,
                                       std::initializer_list<const char*> keys) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = value.find(key);
        if (it != value.end() && it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it != value.end() && it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            return static_cast<std::uint64_t>(it->get<std::int64_t>());
        }
    }
    return std::nullopt;
}

void merge_usage(const json& event, protocol::ResponseMetadata& metadata) {
    if (auto model = first_string(event, {"model"})) {
        metadata.model = *model;
    }
    auto usage = event.find("usage");
    if (usage == event.end() || !usage->is_object()) {
        return;
    }
    if (auto input = first_u64(*usage, {"input_tokens", "prompt_tokens"})) {
        metadata.input_tokens = *input;
    }
    if (auto output = first_u64(*usage, {"output_tokens", "completion_tokens"})) {
        metadata.output_tokens = *output;
    }
}

}  // namespace conductor::adapters
