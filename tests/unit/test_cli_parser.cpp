#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "pipeline/agent_stage_executor.hpp"
#include "core/errors/agent_errors.hpp"
#include "temp_workspace.hpp"

namespace {

using conductor::app::cli::CliCommand;
using conductor::app::cli::CommandKind;
using conductor::app::cli::parse_and_validate;
using conductor::app::cli::read_prompt_file;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;

conductor::core::errors::Result<CliCommand> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("conductor");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

std::vector<std::string> run_args(std::vector<std::string> extra = {}) {
    std::vector<std::string> args = {"run", "--repo", "5dlabs/cto", "--task", "42",
                                     "--model", "sonnet"};
    args.insert(args.end(), extra.begin(), extra.end());
    return args;
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"deploy"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenRepoMissing) {
    auto result = parse_tokens({"run", "--task", "42", "--model", "sonnet"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenTaskOrModelMissing) {
    EXPECT_EQ(get_error(parse_tokens({"run", "--repo", "r", "--model", "m"})).code,
              "missing_required_flag");
    EXPECT_EQ(get_error(parse_tokens({"run", "--repo", "r", "--task", "1"})).code,
              "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--repo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownFlag) {
    auto result = parse_tokens(run_args({"--max-steps", "3"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenMaxAttemptsNotNumeric) {
    auto result = parse_tokens(run_args({"--max-attempts", "abc"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxAttemptsHasTrailingCharacters) {
    auto result = parse_tokens(run_args({"--max-attempts", "3x"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxAttemptsOutOfBounds) {
    EXPECT_EQ(get_error(parse_tokens(run_args({"--max-attempts", "0"}))).code, "bounds_error");
    EXPECT_EQ(get_error(parse_tokens(run_args({"--max-attempts", "101"}))).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenWorkingDirInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens(run_args({"--working-dir", missing_dir.string()}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenPromptFileMissing) {
    auto result = parse_tokens(run_args({"--prompt-file", "__missing_prompt__.md"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullRunRequest) {
    conductor::testing::TempWorkspace ws("cli_parser");
    const auto prompt = ws.root() / "prompt.md";
    conductor::testing::write_file(prompt, "Implement task 42.\n");

    auto result = parse_tokens(run_args({"--cli", "codex", "--branch", "feature/task-42",
                                         "--working-dir", ws.root().string(),
                                         "--prompt-file", prompt.string(),
                                         "--remote-tool", "github_create_pr",
                                         "--remote-tool", "memory_store",
                                         "--max-attempts", "5", "--verbose"}));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& cmd = get_value(result);
    EXPECT_EQ(cmd.kind, CommandKind::Run);
    const auto& req = cmd.request;
    EXPECT_EQ(req.repository, "5dlabs/cto");
    EXPECT_EQ(req.task_id, "42");
    EXPECT_EQ(req.branch, "feature/task-42");
    EXPECT_EQ(req.agent.tool_id, "codex");
    EXPECT_EQ(req.agent.model, "sonnet");
    EXPECT_EQ(req.remote_tools, (std::vector<std::string>{"github_create_pr", "memory_store"}));
    EXPECT_TRUE(req.verbose);
    EXPECT_EQ(req.working_directory.string(), std::filesystem::canonical(ws.root()).string());
    ASSERT_TRUE(cmd.prompt_file.has_value());
    ASSERT_TRUE(cmd.max_attempts.has_value());
    EXPECT_EQ(*cmd.max_attempts, 5U);

    auto text = read_prompt_file(*cmd.prompt_file);
    ASSERT_FALSE(is_error(text));
    EXPECT_EQ(get_value(text), "Implement task 42.\n");
}

TEST(CliParserTest, DefaultsToClaude) {
    auto result = parse_tokens(run_args());
    ASSERT_FALSE(is_error(result));
    const auto& cmd = get_value(result);
    EXPECT_EQ(cmd.request.agent.tool_id, "claude");
    EXPECT_FALSE(cmd.max_attempts.has_value());
    EXPECT_FALSE(cmd.prompt_file.has_value());
    EXPECT_TRUE(cmd.request.stage_agents.empty());
}

TEST(CliParserTest, ParsesStageOverrides) {
    auto result = parse_tokens(run_args({"--stage-cli", "quality=codex:gpt-5-codex",
                                         "--stage-cli", "Testing=claude"}));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& agents = get_value(result).request.stage_agents;
    ASSERT_EQ(agents.size(), 2U);
    EXPECT_EQ(agents.at("quality").tool_id, "codex");
    EXPECT_EQ(agents.at("quality").model, "gpt-5-codex");
    EXPECT_EQ(agents.at("testing").tool_id, "claude");
    EXPECT_TRUE(agents.at("testing").model.empty());
}

TEST(CliParserTest, RejectsBadStageOverrides) {
    EXPECT_EQ(get_error(parse_tokens(run_args({"--stage-cli", "quality"}))).code,
              "invalid_stage_cli");
    EXPECT_EQ(get_error(parse_tokens(run_args({"--stage-cli", "deploy=codex"}))).code,
              "invalid_stage_cli");
    EXPECT_EQ(get_error(parse_tokens(run_args({"--stage-cli", "waiting-merge=codex"}))).code,
              "invalid_stage_cli");
    EXPECT_EQ(get_error(parse_tokens(run_args({"--stage-cli", "quality=:gpt"}))).code,
              "invalid_stage_cli");
}

TEST(CliParserTest, OtherToolOverrideNeedsModel) {
    auto result = parse_tokens(run_args({"--cli", "claude", "--stage-cli", "quality=codex"}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_stage_cli");
    EXPECT_EQ(get_error(result).hint, "Use quality=codex:<model>.");

    EXPECT_EQ(get_error(parse_tokens(run_args({"--stage-cli", "quality=codex:"}))).code,
              "invalid_stage_cli");
}

TEST(CliParserTest, SameToolOverrideInheritsModel) {
    auto result = parse_tokens(run_args({"--cli", "codex", "--stage-cli", "security=codex"}));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& req = get_value(result).request;
    EXPECT_EQ(req.stage_agents.at("security").tool_id, "codex");
    EXPECT_TRUE(req.stage_agents.at("security").model.empty());
    const auto agent = conductor::pipeline::agent_for_stage(req, conductor::pipeline::Stage::Security);
    EXPECT_EQ(agent.tool_id, "codex");
    EXPECT_EQ(agent.model, "sonnet");
}

TEST(CliParserTest, ParsesStatusAndReset) {
    auto status = parse_tokens({"status", "--repo", "5dlabs/cto"});
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status).kind, CommandKind::Status);
    EXPECT_EQ(get_value(status).request.repository, "5dlabs/cto");

    auto reset = parse_tokens({"reset", "--repo", "5dlabs/cto"});
    ASSERT_FALSE(is_error(reset));
    EXPECT_EQ(get_value(reset).kind, CommandKind::Reset);
}

TEST(CliParserTest, StatusRejectsRunFlags) {
    auto result = parse_tokens({"status", "--repo", "r", "--task", "1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, HealthTakesNoArguments) {
    auto health = parse_tokens({"health"});
    ASSERT_FALSE(is_error(health));
    EXPECT_EQ(get_value(health).kind, CommandKind::Health);

    EXPECT_EQ(get_error(parse_tokens({"health", "--repo", "r"})).code, "unknown_argument");
}

}  // namespace
