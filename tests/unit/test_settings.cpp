#include <map>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"

namespace {

using conductor::core::config::EnvLookup;
using conductor::core::config::load_settings;
using conductor::core::config::Settings;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::core::logging::LogLevel;

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

TEST(SettingsTest, DefaultsWithEmptyEnvironment) {
    auto result = load_settings(fake_env({}));
    ASSERT_FALSE(is_error(result));
    const Settings& s = get_value(result);

    EXPECT_EQ(s.tools_server_url, "http://tools.conductor.svc.cluster.local:3000/mcp");
    EXPECT_EQ(s.fifo_path.string(), "/workspace/agent-input.jsonl");
    EXPECT_FALSE(s.companion_url.has_value());
    EXPECT_EQ(s.readiness_attempts, 10U);
    EXPECT_EQ(s.readiness_backoff.count(), 500);
    EXPECT_EQ(s.termination_grace.count(), 5000);
    EXPECT_EQ(s.hang_timeout.count(), 0);
    EXPECT_EQ(s.failure_threshold, 3U);
    EXPECT_EQ(s.max_attempts, 3U);
    EXPECT_EQ(s.log_level, LogLevel::INFO);
    EXPECT_TRUE(s.code_host_command.empty());
}

TEST(SettingsTest, EnvironmentOverridesDefaults) {
    auto result = load_settings(fake_env({
        {"TOOLS_SERVER_URL", "http://tools.local:9000/mcp/"},
        {"CONDUCTOR_COMPANION_URL", "http://127.0.0.1:8080/"},
        {"CONDUCTOR_READINESS_ATTEMPTS", "4"},
        {"CONDUCTOR_HANG_TIMEOUT_MS", "120000"},
        {"CONDUCTOR_MAX_ATTEMPTS", "5"},
        {"CONDUCTOR_LOG_LEVEL", "debug"},
        {"CONDUCTOR_CODE_HOST_COMMAND", "gh-status"},
        {"FIFO_PATH", "/tmp/in.jsonl"},
    }));
    ASSERT_FALSE(is_error(result));
    const Settings& s = get_value(result);

    EXPECT_EQ(s.tools_server_url, "http://tools.local:9000/mcp");
    ASSERT_TRUE(s.companion_url.has_value());
    EXPECT_EQ(*s.companion_url, "http://127.0.0.1:8080");
    EXPECT_EQ(s.readiness_attempts, 4U);
    EXPECT_EQ(s.hang_timeout.count(), 120000);
    EXPECT_EQ(s.max_attempts, 5U);
    EXPECT_EQ(s.log_level, LogLevel::DEBUG);
    EXPECT_EQ(s.code_host_command, "gh-status");
    EXPECT_EQ(s.fifo_path.string(), "/tmp/in.jsonl");
}

TEST(SettingsTest, RejectsMalformedNumber) {
    auto result = load_settings(fake_env({{"CONDUCTOR_READINESS_BACKOFF_MS", "fast"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(SettingsTest, RejectsOutOfBoundsNumber) {
    auto result = load_settings(fake_env({{"CONDUCTOR_MAX_ATTEMPTS", "0"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(SettingsTest, RejectsUnknownLogLevel) {
    auto result = load_settings(fake_env({{"CONDUCTOR_LOG_LEVEL", "chatty"}}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(SettingsTest, EmptyValuesKeepDefaults) {
    auto result = load_settings(fake_env({{"CONDUCTOR_MAX_ATTEMPTS", ""}, {"FIFO_PATH", ""}}));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).max_attempts, 3U);
    EXPECT_EQ(get_value(result).fifo_path.string(), "/workspace/agent-input.jsonl");
}

}  // namespace
