#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"

using namespace conductor::core::errors;

// Simulates a stage that fails while launching its agent
Result<std::string> simulate_launch(bool should_fail) {
    if (should_fail) {
        return AgentError{ErrorCategory::Process, "agent exited with code 3", "agent_exit_nonzero"};
    }
    return std::string("launched");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_launch(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "launched");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_launch(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Process);
    EXPECT_EQ(error.message, "agent exited with code 3");
    EXPECT_EQ(error.code, "agent_exit_nonzero");
}

TEST(ErrorModelTest, CategoryNamesAreStable) {
    EXPECT_EQ(to_string(ErrorCategory::Validation), "validation");
    EXPECT_EQ(to_string(ErrorCategory::UnsupportedTool), "unsupported_tool");
    EXPECT_EQ(to_string(ErrorCategory::Persistence), "persistence");
}

TEST(ErrorModelTest, CompactCauseKeepsFirstLine) {
    AgentError error{ErrorCategory::Process, "codex exited with code 1.\nstack trace line"};
    EXPECT_EQ(compact_cause(error), "codex exited with code 1.");
}

TEST(ErrorModelTest, CompactCauseCapsLength) {
    AgentError error{ErrorCategory::Process, std::string(500, 'x')};
    const std::string cause = compact_cause(error);
    EXPECT_EQ(cause.size(), 200U);
    EXPECT_EQ(cause.substr(197), "...");
}
