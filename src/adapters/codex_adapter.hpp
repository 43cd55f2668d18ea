#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "adapters/adapter_base.hpp"

namespace conductor::adapters {

// Drives OpenAI's `codex exec`. Config is TOML; the model is not
// validated since codex routes to several providers.
class CodexAdapter final : public AgentAdapter {
public:
    CodexAdapter(AdapterSettings settings,
                 std::shared_ptr<const templates::TemplateRenderer> renderer);

    const std::string& tool_id() const override { return base_.tool_id(); }
    bool validate_model(const std::string& model) const override;
    core::errors::Result<std::string> generate_config(
        const protocol::AgentConfig& config) const override;
    core::errors::Result<std::string> generate_memory(
        const protocol::AgentConfig& config,
        const std::string& instructions) const override;
    std::string format_prompt(const std::string& prompt) const override { return prompt; }
    core::errors::Result<protocol::ParsedResponse> parse_response(
        const std::string& output) const override;
    protocol::CapabilityDescriptor get_capabilities() const override;
    std::string get_memory_filename() const override { return "AGENTS.md"; }
    std::string get_executable_name() const override { return "codex"; }
    std::filesystem::path get_config_filename() const override { return ".codex/config.toml"; }
    std::vector<std::string> build_command(const std::string& model) const override;
    std::map<std::string, std::string> process_environment(
        const std::filesystem::path& working_dir) const override {
        return {{"CODEX_HOME", (working_dir / ".codex").string()}};
    }
    core::errors::Result<core::errors::Unit> initialize(
        const protocol::ContainerContext& container) const override;
    core::errors::Result<core::errors::Unit> cleanup(
        const protocol::ContainerContext& container) const override;
    core::errors::Result<protocol::HealthStatus> health_check() const override;

private:
    AdapterBase base_;
};

}  // namespace conductor::adapters
