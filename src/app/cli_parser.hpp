#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/pipeline_request.hpp"

namespace conductor::app::cli {

    enum class CommandKind {
        Run,
        Status,
        Reset,
        Health
    };

    struct CliCommand {
        CommandKind kind = CommandKind::Run;
        protocol::PipelineRequest request;
        std::optional<std::filesystem::path> prompt_file;
        std::optional<uint32_t> max_attempts;  // overrides CONDUCTOR_MAX_ATTEMPTS
    };

    conductor::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    conductor::core::errors::Result<std::string> read_prompt_file(const std::filesystem::path& path);

} // namespace conductor::app::cli
