#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/agent_config.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/health.hpp"
#include "protocol/response.hpp"

namespace conductor::adapters {

// Uniform surface over one agent CLI. Implementations are immutable after
// construction and safe to share across threads.
class AgentAdapter {
public:
    virtual ~AgentAdapter() = default;

    virtual const std::string& tool_id() const = 0;

    // Best-effort check. A false result is logged, never fatal.
    virtual bool validate_model(const std::string& model) const = 0;

    virtual core::errors::Result<std::string> generate_config(
        const protocol::AgentConfig& config) const = 0;

    virtual core::errors::Result<std::string> generate_memory(
        const protocol::AgentConfig& config,
        const std::string& instructions) const = 0;

    virtual std::string format_prompt(const std::string& prompt) const = 0;

    // Unrecognized output becomes content; only internal failures are errors.
    virtual core::errors::Result<protocol::ParsedResponse> parse_response(
        const std::string& output) const = 0;

    virtual protocol::CapabilityDescriptor get_capabilities() const = 0;
    virtual std::string get_memory_filename() const = 0;
    virtual std::string get_executable_name() const = 0;

    // Where the rendered config goes, relative to the working directory.
    virtual std::filesystem::path get_config_filename() const = 0;

    // Unattended invocation. Always the least restrictive sandbox and
    // approval mode the tool offers; the prompt arrives on stdin.
    virtual std::vector<std::string> build_command(const std::string& model) const = 0;

    // Extra variables the executable needs to find its rendered config.
    virtual std::map<std::string, std::string> process_environment(
        const std::filesystem::path& working_dir) const = 0;

    virtual core::errors::Result<core::errors::Unit> initialize(
        const protocol::ContainerContext& container) const = 0;

    virtual core::errors::Result<core::errors::Unit> cleanup(
        const protocol::ContainerContext& container) const = 0;

    virtual core::errors::Result<protocol::HealthStatus> health_check() const = 0;
};

}  // namespace conductor::adapters
