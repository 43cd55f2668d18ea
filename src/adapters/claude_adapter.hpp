#pragma once

#include <map>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include "adapters/adapter_base.hpp"

namespace conductor::adapters {

// Drives Anthropic's `claude` CLI in stream-json mode.
class ClaudeAdapter final : public AgentAdapter {
public:
    ClaudeAdapter(AdapterSettings settings,
                  std::shared_ptr<const templates::TemplateRenderer> renderer);

    const std::string& tool_id() const override { return base_.tool_id(); }
    bool validate_model(const std::string& model) const override;
    core::errors::Result<std::string> generate_config(
        const protocol::AgentConfig& config) const override;
    core::errors::Result<std::string> generate_memory(
        const protocol::AgentConfig& config,
        const std::string& instructions) const override;
    std::string format_prompt(const std::string& prompt) const override;
    core::errors::Result<protocol::ParsedResponse> parse_response(
        const std::string& output) const override;
    protocol::CapabilityDescriptor get_capabilities() const override;
    std::string get_memory_filename() const override { return "CLAUDE.md"; }
    std::string get_executable_name() const override { return "claude"; }
    std::filesystem::path get_config_filename() const override { return ".mcp.json"; }
    std::vector<std::string> build_command(const std::string& model) const override;
    std::map<std::string, std::string> process_environment(
        const std::filesystem::path&) const override {
        return {};
    }
    core::errors::Result<core::errors::Unit> initialize(
        const protocol::ContainerContext& container) const override;
    core::errors::Result<core::errors::Unit> cleanup(
        const protocol::ContainerContext& container) const override;
    core::errors::Result<protocol::HealthStatus> health_check() const override;

private:
    // Markup form: <function_calls><invoke name=".."><parameter ..>
    protocol::ParsedResponse parse_markup(const std::string& output) const;
    // One JSON event per line, as printed by --output-format stream-json.
    protocol::ParsedResponse parse_stream_json(const std::vector<nlohmann::json>& events) const;

    AdapterBase base_;
    std::vector<std::regex> model_patterns_;
};

}  // namespace conductor::adapters
