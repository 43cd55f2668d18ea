#include "registry/builtin_adapters.hpp"

#include <utility>
#include "adapters/claude_adapter.hpp"
#include "adapters/codex_adapter.hpp"
#include "adapters/opencode_adapter.hpp"

namespace conductor::registry {

adapters::AdapterSettings builtin_adapter_settings(const std::string& tool_id,
                                                   const core::config::Settings& settings,
                                                   const core::config::EnvLookup& lookup) {
    adapters::AdapterSettings adapter;
    adapter.tool_id = tool_id;
    adapter.tools_server_url = settings.tools_server_url;
    adapter.health_check_timeout = settings.health_check_timeout;

    if (tool_id == kClaude) {
        adapter.config_template = "claude/mcp.json.hbs";
        adapter.memory_template = "claude/memory.md.hbs";
    } else if (tool_id == kCodex) {
        adapter.config_template = "codex/config.toml.hbs";
        adapter.memory_template = "codex/memory.md.hbs";
    } else {
        adapter.config_template = tool_id + "/config.json.hbs";
        adapter.memory_template = tool_id + "/memory.md.hbs";
    }

    adapters::apply_env_defaults(adapter, lookup);
    return adapter;
}

core::errors::Result<std::unique_ptr<AdapterRegistry>> make_builtin_registry(
    const core::config::Settings& settings,
    std::shared_ptr<const templates::TemplateRenderer> renderer,
    const core::config::EnvLookup& lookup) {
    auto registry = std::make_unique<AdapterRegistry>(settings.health_history_size,
                                                      settings.failure_threshold);

    const AdapterRegistry::AdapterPtr builtins[] = {
        std::make_shared<adapters::ClaudeAdapter>(
            builtin_adapter_settings(kClaude, settings, lookup), renderer),
        std::make_shared<adapters::CodexAdapter>(
            builtin_adapter_settings(kCodex, settings, lookup), renderer),
        std::make_shared<adapters::OpenCodeAdapter>(
            builtin_adapter_settings(kOpenCode, settings, lookup), renderer),
    };
    for (const auto& adapter : builtins) {
        auto registered = registry->register_adapter(adapter);
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }
    return std::move(registry);
}

}  // namespace conductor::registry
