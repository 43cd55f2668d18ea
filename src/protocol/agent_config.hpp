#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor::protocol {

    // A local MCP integration shipped alongside the agent (filesystem, git, ...)
    struct LocalServer {
        std::string name;
        bool enabled = true;
        std::vector<std::string> tools;
    };

    // The tool capability list for one agent run. Only these tools are
    // rendered into the agent's config; adapters add nothing of their own.
    struct ToolConfiguration {
        std::vector<std::string> remote;
        std::vector<LocalServer> local_servers;
    };

    // One request to configure an agent run. `model` is opaque and passed
    // through; `passthrough` carries tool-specific settings untouched.
    struct AgentConfig {
        std::string tool_id;
        std::string model;
        std::optional<std::uint32_t> max_tokens;
        std::optional<double> temperature;
        ToolConfiguration tools;
        nlohmann::json passthrough = nlohmann::json::object();
        std::string correlation_id;
    };

    // Where an agent runs.
    struct ContainerContext {
        std::string container_name;
        std::filesystem::path working_dir;
        std::map<std::string, std::string> env;
        std::string k8s_namespace = "default";
    };

} // namespace conductor::protocol
