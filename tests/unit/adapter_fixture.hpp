#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "adapters/adapter_base.hpp"
#include "core/config/settings.hpp"
#include "registry/builtin_adapters.hpp"
#include "templates/template_renderer.hpp"

namespace conductor::testing {

inline core::config::EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

inline std::shared_ptr<const templates::TemplateRenderer> shipped_templates() {
    return std::make_shared<const templates::FileTemplateRenderer>(CONDUCTOR_TEMPLATE_DIR);
}

// Built-in settings for `tool`, isolated from the real environment.
inline adapters::AdapterSettings adapter_settings(const std::string& tool,
                                                  std::map<std::string, std::string> env = {}) {
    core::config::Settings settings;
    settings.tools_server_url = "http://tools.test:3000/mcp";
    return registry::builtin_adapter_settings(tool, settings, env_from(std::move(env)));
}

}  // namespace conductor::testing
