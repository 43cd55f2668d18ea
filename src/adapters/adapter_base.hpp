#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "adapters/agent_adapter.hpp"
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "templates/template_renderer.hpp"

namespace conductor::adapters {

inline constexpr std::uint32_t kMaxTokensLimit = 1000000;
inline constexpr double kMaxTemperature = 2.0;

// Per-adapter construction data. Template paths are relative to the
// renderer's lookup root.
struct AdapterSettings {
    std::string tool_id;
    std::filesystem::path config_template;
    std::filesystem::path memory_template;
    std::string tools_server_url = core::config::kDefaultToolsServerUrl;
    std::uint32_t default_max_tokens = 4096;
    double default_temperature = 0.7;
    std::optional<std::uint32_t> max_context_tokens;
    std::chrono::milliseconds health_check_timeout{5000};
    std::string correlation_id;
};

// Reads <TOOL>_DEFAULT_MAX_TOKENS, <TOOL>_DEFAULT_TEMPERATURE and
// <TOOL>_MAX_CONTEXT_TOKENS (tool id upper-cased). Malformed values are
// ignored with a warning.
void apply_env_defaults(AdapterSettings& settings,
                        const core::config::EnvLookup& lookup);

// Behaviour shared by every adapter. Adapters hold one as a member.
class AdapterBase {
public:
    AdapterBase(AdapterSettings settings,
                std::shared_ptr<const templates::TemplateRenderer> renderer);

    const AdapterSettings& settings() const { return settings_; }
    const std::string& tool_id() const { return settings_.tool_id; }

    core::errors::Result<core::errors::Unit> validate_base_config(
        const protocol::AgentConfig& config) const;

    // Context shared by config and memory templates.
    nlohmann::json build_context(const protocol::AgentConfig& config) const;

    // name -> {command, args, env} for every caller-supplied tool.
    nlohmann::json mcp_servers(const protocol::ToolConfiguration& tools) const;

    core::errors::Result<std::string> render_config(const nlohmann::json& context) const;
    core::errors::Result<std::string> render_memory(const nlohmann::json& context) const;

    core::errors::Result<core::errors::Unit> validate_container(
        const protocol::ContainerContext& container,
        const std::string& operation) const;

    // Inline template round trip and latency.
    protocol::HealthStatus base_health_check() const;

private:
    AdapterSettings settings_;
    std::shared_ptr<const templates::TemplateRenderer> renderer_;
};

// Base check followed by the adapter's own self-tests: a synthetic config
// render and a parse of `sample_output`. A failed self-test downgrades a
// healthy result to Warning.
core::errors::Result<protocol::HealthStatus> run_adapter_health_check(
    const AdapterBase& base, const AgentAdapter& adapter,
    const std::string& sample_output);

// Replaces empty or repeated ids with "tool_<index>".
void assign_unique_ids(std::vector<protocol::ToolCall>& calls);

// First string / unsigned value found under any of `keys`.
std::optional<std::string> first_string(const nlohmann::json& value,
                                        std::initializer_list<const char*> keys);
std::optional<std::uint64_t> first_u64(const nlohmann::json& value,
                                       std::initializer_list<const char*> keys);

// Copies model, usage.input_tokens and usage.output_tokens when present.
void merge_usage(const nlohmann::json& event, protocol::ResponseMetadata& metadata);

}  // namespace conductor::adapters
