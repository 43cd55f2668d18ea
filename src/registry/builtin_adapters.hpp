#pragma once

#include <memory>
#include <string>
#include "adapters/adapter_base.hpp"
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "registry/adapter_registry.hpp"
#include "templates/template_renderer.hpp"

namespace conductor::registry {

// The only place that knows which tools ship with conductor.
inline constexpr const char* kClaude = "claude";
inline constexpr const char* kCodex = "codex";
inline constexpr const char* kOpenCode = "opencode";

// Template paths and defaults for one built-in tool.
adapters::AdapterSettings builtin_adapter_settings(
    const std::string& tool_id, const core::config::Settings& settings,
    const core::config::EnvLookup& lookup = core::config::process_env);

core::errors::Result<std::unique_ptr<AdapterRegistry>> make_builtin_registry(
    const core::config::Settings& settings,
    std::shared_ptr<const templates::TemplateRenderer> renderer,
    const core::config::EnvLookup& lookup = core::config::process_env);

}  // namespace conductor::registry
