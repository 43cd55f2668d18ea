#include "cli_parser.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "pipeline/stage.hpp"

namespace conductor::app::cli {

    using namespace conductor::core::errors;
    using conductor::protocol::StageAgent;

    namespace {

        constexpr const char* kUsage =
            "Usage: conductor run --repo <owner/name> --task <id> --model <model> [--cli <tool>] "
            "[--branch <name>] [--stage-cli <stage>=<tool>[:<model>]] [--remote-tool <name>] "
            "[--working-dir <dir>] [--prompt-file <file>] [--max-attempts <n>] [--verbose]\n"
            "       conductor status --repo <owner/name>\n"
            "       conductor reset --repo <owner/name>\n"
            "       conductor health";

        // Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> repo;
            std::optional<std::string> task;
            std::optional<std::string> branch;
            std::optional<std::string> tool;
            std::optional<std::string> model;
            std::vector<std::string> stage_tools;
            std::vector<std::string> remote_tools;
            std::optional<std::string> cwd;
            std::optional<std::string> prompt_file;
            std::optional<std::string> max_attempts;
            bool verbose = false;
        };

        // "quality=codex:gpt-5" -> {"quality", {"codex", "gpt-5"}}
        Result<std::pair<std::string, StageAgent>> parse_stage_tool(const std::string& text) {
            const auto eq = text.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
                return AgentError{ErrorCategory::Input, "Invalid --stage-cli value: " + text, "invalid_stage_cli",
                                  "Use <stage>=<tool> or <stage>=<tool>:<model>."};
            }

            const auto stage = pipeline::parse_stage(text.substr(0, eq));
            if (!pipeline::is_known(stage)) {
                return AgentError{ErrorCategory::Input, "Unknown stage in --stage-cli: " + text.substr(0, eq),
                                  "invalid_stage_cli"};
            }
            const auto known = std::get<pipeline::Stage>(stage);
            if (known == pipeline::Stage::WaitingExternalIntegration || known == pipeline::Stage::WaitingMerge ||
                known == pipeline::Stage::Completed) {
                return AgentError{ErrorCategory::Input,
                                  "Stage " + pipeline::to_string(known) + " does not run an agent.",
                                  "invalid_stage_cli"};
            }

            const std::string rest = text.substr(eq + 1);
            const auto colon = rest.find(':');
            StageAgent agent;
            agent.tool_id = rest.substr(0, colon);
            if (colon != std::string::npos) {
                agent.model = rest.substr(colon + 1);
                if (agent.model.empty()) {
                    return AgentError{ErrorCategory::Input, "Missing model in --stage-cli: " + text,
                                      "invalid_stage_cli"};
                }
            }
            if (agent.tool_id.empty()) {
                return AgentError{ErrorCategory::Input, "Missing tool in --stage-cli: " + text, "invalid_stage_cli"};
            }
            return std::make_pair(pipeline::to_string(known), agent);
        }

        Result<std::filesystem::path> validate_directory(const std::string& raw) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliCommand cmd;
        const std::string command = argv[1];
        if (command == "run") {
            cmd.kind = CommandKind::Run;
        } else if (command == "status") {
            cmd.kind = CommandKind::Status;
        } else if (command == "reset") {
            cmd.kind = CommandKind::Reset;
        } else if (command == "health") {
            cmd.kind = CommandKind::Health;
        } else {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool has_value = i + 1 < args.size();
            auto take = [&](std::optional<std::string>& slot) -> bool {
                if (!has_value) return false;
                slot = args[++i];
                return true;
            };

            bool ok = true;
            if (flag == "--repo") {
                ok = take(raw.repo);
            } else if (cmd.kind != CommandKind::Run) {
                return AgentError{ErrorCategory::Input, "Unknown argument for " + command + ": " + flag, "unknown_argument"};
            } else if (flag == "--task") {
                ok = take(raw.task);
            } else if (flag == "--branch") {
                ok = take(raw.branch);
            } else if (flag == "--cli") {
                ok = take(raw.tool);
            } else if (flag == "--model") {
                ok = take(raw.model);
            } else if (flag == "--stage-cli") {
                ok = has_value;
                if (ok) raw.stage_tools.push_back(args[++i]);
            } else if (flag == "--remote-tool") {
                ok = has_value;
                if (ok) raw.remote_tools.push_back(args[++i]);
            } else if (flag == "--working-dir") {
                ok = take(raw.cwd);
            } else if (flag == "--prompt-file") {
                ok = take(raw.prompt_file);
            } else if (flag == "--max-attempts") {
                ok = take(raw.max_attempts);
            } else if (flag == "--verbose") {
                raw.verbose = true;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (!ok) {
                return AgentError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 2. Validator Phase: Enforce logic and bounds
        if (cmd.kind == CommandKind::Health) {
            if (raw.repo) {
                return AgentError{ErrorCategory::Input, "health takes no arguments", "unknown_argument"};
            }
            return cmd;
        }

        if (!raw.repo || raw.repo->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide --repo", "missing_required_flag"};
        }
        cmd.request.repository = raw.repo.value();
        if (cmd.kind != CommandKind::Run) {
            return cmd;
        }

        if (!raw.task || raw.task->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide --task", "missing_required_flag"};
        }
        if (!raw.model || raw.model->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide --model", "missing_required_flag"};
        }

        auto& req = cmd.request;
        req.task_id = raw.task.value();
        req.branch = raw.branch.value_or("");
        req.agent.model = raw.model.value();
        if (raw.tool) req.agent.tool_id = raw.tool.value();
        req.remote_tools = raw.remote_tools;
        req.verbose = raw.verbose;

        for (const auto& entry : raw.stage_tools) {
            auto parsed = parse_stage_tool(entry);
            if (is_error(parsed)) {
                return get_error(parsed);
            }
            const auto& [stage, agent] = get_value(parsed);
            // --model only applies to the default tool.
            if (agent.model.empty() && agent.tool_id != req.agent.tool_id) {
                return AgentError{ErrorCategory::Input,
                                  "--stage-cli " + entry + " switches to " + agent.tool_id + " without a model",
                                  "invalid_stage_cli", "Use " + entry + ":<model>."};
            }
            req.stage_agents[stage] = agent;
        }

        // Exception-free integer parsing
        if (raw.max_attempts) {
            uint32_t attempts = 0;
            const char* begin = raw.max_attempts->data();
            const char* end = raw.max_attempts->data() + raw.max_attempts->size();
            auto [ptr, ec] = std::from_chars(begin, end, attempts);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --max-attempts", "invalid_integer", "Provide a positive integer."};
            }
            if (attempts == 0 || attempts > 100) {
                return AgentError{ErrorCategory::Input, "--max-attempts out of bounds", "bounds_error", "Must be between 1 and 100."};
            }
            cmd.max_attempts = attempts;
        }

        // Path validation
        if (raw.cwd) {
            auto dir = validate_directory(raw.cwd.value());
            if (is_error(dir)) {
                return get_error(dir);
            }
            req.working_directory = get_value(dir);
        }

        if (raw.prompt_file) {
            std::filesystem::path p(raw.prompt_file.value());
            std::error_code path_ec;
            if (!std::filesystem::is_regular_file(p, path_ec) || path_ec) {
                return AgentError{ErrorCategory::Input, "Prompt file does not exist: " + p.string(), "invalid_path"};
            }
            cmd.prompt_file = p;
        }

        return cmd;
    }

    Result<std::string> read_prompt_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return AgentError{ErrorCategory::Input, "Unable to open prompt file: " + path.string(), "invalid_path"};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

} // namespace conductor::app::cli
