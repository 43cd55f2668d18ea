#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "adapters/codex_adapter.hpp"
#include "core/errors/agent_errors.hpp"
#include "adapter_fixture.hpp"

namespace {

using conductor::adapters::CodexAdapter;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::AgentConfig;
using conductor::protocol::FinishReason;
using conductor::testing::adapter_settings;
using conductor::testing::shipped_templates;
using nlohmann::json;

CodexAdapter make_adapter() {
    return CodexAdapter(adapter_settings("codex"), shipped_templates());
}

AgentConfig make_config() {
    AgentConfig config;
    config.tool_id = "codex";
    config.model = "gpt-5-codex";
    return config;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(CodexAdapterTest, RendersTomlWithUnattendedPolicy) {
    const auto adapter = make_adapter();
    AgentConfig config = make_config();
    config.max_tokens = 8000;
    config.tools.remote = {"github_create_pr"};

    auto rendered = adapter.generate_config(config);
    ASSERT_FALSE(is_error(rendered)) << get_error(rendered).message;
    const std::string& toml = get_value(rendered);

    EXPECT_TRUE(contains(toml, "model = \"gpt-5-codex\"\n"));
    EXPECT_TRUE(contains(toml, "approval_policy = \"never\"\n"));
    EXPECT_TRUE(contains(toml, "sandbox_mode = \"danger-full-access\"\n"));
    EXPECT_TRUE(contains(toml, "model_provider = \"openai\"\n"));
    EXPECT_TRUE(contains(toml, "model_max_output_tokens = 8000\n"));
    EXPECT_TRUE(contains(toml, "[mcp_servers.\"github_create_pr\"]\n"));
    EXPECT_TRUE(contains(toml, "command = \"tools\"\n"));
    EXPECT_TRUE(contains(toml, "env = { \"TOOLS_SERVER_URL\" = \"http://tools.test:3000/mcp\" }"));
}

// Top-level `key = value` pairs before the first table. Scalar TOML values
// here are valid JSON.
json toml_root_values(const std::string& toml) {
    json values = json::object();
    std::size_t start = 0;
    while (start < toml.size()) {
        auto end = toml.find('\n', start);
        if (end == std::string::npos) {
            end = toml.size();
        }
        const std::string line = toml.substr(start, end - start);
        start = end + 1;
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line[0] == '[') {
            break;
        }
        const auto eq = line.find(" = ");
        if (eq != std::string::npos) {
            values[line.substr(0, eq)] = json::parse(line.substr(eq + 3));
        }
    }
    return values;
}

TEST(CodexAdapterTest, ConfigCarriesModelAndSampling) {
    const auto adapter = make_adapter();
    AgentConfig config = make_config();
    config.model = "gpt-5-codex-high";
    config.max_tokens = 12345;
    config.temperature = 0.5;
    config.tools.remote = {"memory_store"};

    auto rendered = adapter.generate_config(config);
    ASSERT_FALSE(is_error(rendered)) << get_error(rendered).message;

    const json values = toml_root_values(get_value(rendered));
    EXPECT_EQ(values.at("model"), "gpt-5-codex-high");
    EXPECT_EQ(values.at("model_max_output_tokens").get<unsigned>(), 12345U);
    EXPECT_DOUBLE_EQ(values.at("model_temperature").get<double>(), 0.5);
}

TEST(CodexAdapterTest, RendersNoServerTablesWithoutTools) {
    const auto adapter = make_adapter();
    auto rendered = adapter.generate_config(make_config());
    ASSERT_FALSE(is_error(rendered)) << get_error(rendered).message;
    EXPECT_FALSE(contains(get_value(rendered), "[mcp_servers"));
}

TEST(CodexAdapterTest, PassthroughSelectsProvider) {
    const auto adapter = make_adapter();
    AgentConfig config = make_config();
    config.passthrough = {{"modelProvider", "azure"}, {"reasoningEffort", "high"}};

    auto rendered = adapter.generate_config(config);
    ASSERT_FALSE(is_error(rendered));
    EXPECT_TRUE(contains(get_value(rendered), "model_provider = \"azure\""));
    EXPECT_TRUE(contains(get_value(rendered), "model_reasoning_effort = \"high\""));
}

TEST(CodexAdapterTest, AnyNonEmptyModelIsValid) {
    const auto adapter = make_adapter();
    EXPECT_TRUE(adapter.validate_model("o3"));
    EXPECT_TRUE(adapter.validate_model("anything/at-all"));
    EXPECT_FALSE(adapter.validate_model("   "));
}

TEST(CodexAdapterTest, RejectsClaudeConfig) {
    const auto adapter = make_adapter();
    AgentConfig config = make_config();
    config.tool_id = "claude";
    auto rendered = adapter.generate_config(config);
    ASSERT_TRUE(is_error(rendered));
    EXPECT_EQ(get_error(rendered).code, "tool_mismatch");
}

TEST(CodexAdapterTest, ParsesExecJsonEvents) {
    const auto adapter = make_adapter();
    const std::string output =
        R"({"type":"thread.started","thread_id":"t-1"})" "\n"
        R"({"type":"item.started","item":{"id":"item_1","type":"command_execution","command":"ls -la"}})" "\n"
        R"({"type":"item.completed","item":{"id":"item_2","type":"agent_message","text":"All tests pass."}})" "\n"
        R"({"type":"turn.completed","usage":{"input_tokens":120,"output_tokens":30}})" "\n";

    auto parsed = adapter.parse_response(output);
    ASSERT_FALSE(is_error(parsed));
    const auto& response = get_value(parsed);
    EXPECT_EQ(response.content, "All tests pass.");
    ASSERT_EQ(response.tool_calls.size(), 1U);
    EXPECT_EQ(response.tool_calls[0].name, "local_shell");
    EXPECT_EQ(response.tool_calls[0].arguments.at("command"), "ls -la");
    EXPECT_EQ(response.tool_calls[0].id, "item_1");
    EXPECT_EQ(response.finish_reason, FinishReason::ToolCall);
    EXPECT_EQ(response.metadata.input_tokens.value_or(0), 120U);
    EXPECT_EQ(response.metadata.output_tokens.value_or(0), 30U);
}

TEST(CodexAdapterTest, ParsesCommandsDocument) {
    const auto adapter = make_adapter();
    auto parsed = adapter.parse_response(
        R"({"message":"running","commands":[{"command":"cargo test","args":["--all"]},{"args":{"x":1}}]})");
    ASSERT_FALSE(is_error(parsed));
    const auto& response = get_value(parsed);
    EXPECT_EQ(response.content, "running");
    ASSERT_EQ(response.tool_calls.size(), 2U);
    EXPECT_EQ(response.tool_calls[0].name, "cargo test");
    EXPECT_EQ(response.tool_calls[1].name, "local_shell");
    EXPECT_EQ(response.tool_calls[0].id, "tool_0");
    EXPECT_EQ(response.tool_calls[1].id, "tool_1");
}

TEST(CodexAdapterTest, TurnFailedIsError) {
    const auto adapter = make_adapter();
    auto parsed = adapter.parse_response(
        R"({"type":"turn.failed","error":{"message":"rate limited"}})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).finish_reason, FinishReason::Error);
    EXPECT_EQ(get_value(parsed).content, "rate limited");
}

TEST(CodexAdapterTest, PlainLinesAreKept) {
    const auto adapter = make_adapter();
    auto parsed = adapter.parse_response("warming up\n{\"type\":\"item.completed\",\"item\":{\"type\":\"agent_message\",\"text\":\"ok\"}}\n");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).content, "ok\nwarming up");
}

TEST(CodexAdapterTest, DescribesItself) {
    const auto adapter = make_adapter();
    EXPECT_EQ(adapter.get_memory_filename(), "AGENTS.md");
    EXPECT_EQ(adapter.get_executable_name(), "codex");
    EXPECT_EQ(adapter.get_config_filename().string(), ".codex/config.toml");
    EXPECT_EQ(adapter.format_prompt("as is"), "as is");

    const auto caps = adapter.get_capabilities();
    EXPECT_FALSE(caps.supports_streaming);
    EXPECT_EQ(caps.config_format, conductor::protocol::ConfigFormat::Toml);
    EXPECT_EQ(caps.max_context_tokens, 128000U);

    const auto env = adapter.process_environment("/workspace/repo");
    EXPECT_EQ(env.at("CODEX_HOME"), "/workspace/repo/.codex");

    const auto argv = adapter.build_command("o3");
    EXPECT_EQ(argv.front(), "codex");
    EXPECT_EQ(argv.back(), "-");
}

TEST(CodexAdapterTest, MemoryUsesAgentsFile) {
    const auto adapter = make_adapter();
    auto memory = adapter.generate_memory(make_config(), "Stage: testing");
    ASSERT_FALSE(is_error(memory)) << get_error(memory).message;
    EXPECT_EQ(get_value(memory).rfind("# AGENTS.md", 0), 0U);
    EXPECT_TRUE(contains(get_value(memory), "Stage: testing"));
}

}  // namespace
