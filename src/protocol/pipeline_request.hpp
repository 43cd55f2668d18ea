#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace conductor::protocol {

    // Tool and model for one agent stage.
    struct StageAgent {
        std::string tool_id;
        std::string model;
    };

    // Everything the trigger layer hands over to start or resume a run.
    struct PipelineRequest {
        std::string repository;   // "owner/name"
        std::string task_id;
        std::string branch;
        std::string workflow_name = "conductor";
        StageAgent agent{"claude", ""};
        std::map<std::string, StageAgent> stage_agents;  // keyed by stage name
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::string prompt;
        std::vector<std::string> remote_tools;
        uint32_t max_attempts = 3;
        bool verbose = false;
    };

} // namespace conductor::protocol
