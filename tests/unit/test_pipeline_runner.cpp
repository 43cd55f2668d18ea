#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"
#include "pipeline/escalation.hpp"
#include "pipeline/pipeline_runner.hpp"
#include "pipeline/progress_store.hpp"
#include "protocol/pipeline_request.hpp"
#include "session/run_journal.hpp"
#include "memory_progress_store.hpp"
#include "temp_workspace.hpp"

namespace {

using conductor::core::cancellation::CancelToken;
using conductor::core::cancellation::make_cancel_token;
using conductor::core::errors::AgentError;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::core::errors::Result;
using conductor::protocol::PipelineRequest;
using conductor::testing::MemoryProgressStore;
using conductor::testing::TempWorkspace;
using nlohmann::json;
using namespace conductor::pipeline;

const std::string kKey = "progress-5dlabs-cto";

// Records every call and the stored progress at the moment the stage ran.
class ScriptedExecutor : public StageExecutor {
public:
    explicit ScriptedExecutor(MemoryProgressStore& store) : store_(store) {}

    Result<StageReport> execute(Stage stage, const StageContext& context,
                                const CancelToken&) override {
        calls.push_back(stage);
        attempts_seen.push_back(context.attempt);
        auto it = store_.records.find(kKey);
        stored_stage_at_call.push_back(it == store_.records.end() ? "" : it->second.stage);

        if (cancel_on.has_value() && *cancel_on == stage && token) {
            token->store(true);
        }
        auto scripted = failures.find(stage);
        if (scripted != failures.end() && !scripted->second.empty()) {
            AgentError error = scripted->second.front();
            scripted->second.pop_front();
            return error;
        }
        return StageReport{to_string(stage) + " done", json::object()};
    }

    std::map<Stage, std::deque<AgentError>> failures;
    std::optional<Stage> cancel_on;
    CancelToken token;
    std::vector<Stage> calls;
    std::vector<std::uint32_t> attempts_seen;
    std::vector<std::string> stored_stage_at_call;

private:
    MemoryProgressStore& store_;
};

class RecordingEscalation : public Escalation {
public:
    void notify(const EscalationNotice& notice) override { notices.push_back(notice); }
    std::vector<EscalationNotice> notices;
};

AgentError transient(const std::string& message = "agent crashed") {
    return AgentError{ErrorCategory::Process, message, "agent_exit_nonzero"};
}

PipelineRequest make_request() {
    PipelineRequest request;
    request.repository = "5dlabs/cto";
    request.task_id = "42";
    request.branch = "feature/task-42";
    request.agent = {"claude", "sonnet"};
    request.max_attempts = 3;
    return request;
}

StageProgress stored(const std::string& stage, const std::string& task = "42") {
    StageProgress progress;
    progress.repository = "5dlabs/cto";
    progress.task_id = task;
    progress.stage = stage;
    progress.status = ProgressStatus::Suspended;
    progress.run_handle = "run-previous";
    progress.started_at = "2025-06-01T00:00:00Z";
    return progress;
}

struct Harness {
    MemoryProgressStore store;
    ProgressTracker tracker{store};
    ScriptedExecutor executor{store};
    RecordingEscalation escalation;
};

TEST(PipelineRunnerTest, RunsEveryStageInOrderAndClears) {
    Harness h;
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-1", make_cancel_token());
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const std::vector<Stage> expected = {Stage::Implementation, Stage::Quality, Stage::Security,
                                         Stage::Testing, Stage::WaitingExternalIntegration,
                                         Stage::WaitingMerge};
    EXPECT_EQ(h.executor.calls, expected);
    EXPECT_TRUE(h.store.records.empty());
    EXPECT_EQ(h.store.removals, 1);

    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.run_id, "run-1");
    EXPECT_TRUE(outcome.skipped.empty());
    for (const Stage stage : expected) {
        EXPECT_EQ(outcome.outcomes.at(stage), StageOutcome::Succeeded) << to_string(stage);
        EXPECT_EQ(outcome.attempts.at(stage), 1U);
    }
    EXPECT_EQ(outcome.reports.at(Stage::Testing).summary, "testing done");
    EXPECT_TRUE(h.escalation.notices.empty());
}

TEST(PipelineRunnerTest, PersistsEachStageBeforeItRuns) {
    Harness h;
    PipelineRunner runner(h.tracker, h.executor, h.escalation);
    ASSERT_FALSE(is_error(runner.run(make_request(), "run-1", make_cancel_token())));

    ASSERT_EQ(h.executor.calls.size(), h.executor.stored_stage_at_call.size());
    for (std::size_t i = 0; i < h.executor.calls.size(); ++i) {
        EXPECT_EQ(h.executor.stored_stage_at_call[i], to_string(h.executor.calls[i]));
    }

    // The final write marks completion before the record is cleared.
    ASSERT_FALSE(h.store.writes.empty());
    EXPECT_EQ(h.store.writes.back().stage, "completed");
    EXPECT_EQ(h.store.writes.back().status, ProgressStatus::Completed);
    EXPECT_EQ(h.store.writes.back().run_handle, "run-1");
}

TEST(PipelineRunnerTest, ResumesFromStoredStage) {
    Harness h;
    h.store.records[kKey] = stored("security");
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-2", make_cancel_token());
    ASSERT_FALSE(is_error(result));
    const auto& outcome = get_value(result);
    EXPECT_EQ(outcome.resumed_from, Stage::Security);
    ASSERT_EQ(outcome.skipped.size(), 2U);
    EXPECT_EQ(outcome.outcomes.at(Stage::Implementation), StageOutcome::Skipped);
    EXPECT_EQ(outcome.outcomes.at(Stage::Quality), StageOutcome::Skipped);
    EXPECT_EQ(h.executor.calls.front(), Stage::Security);
    EXPECT_EQ(h.executor.calls.size(), 4U);

    // Same task keeps the original start time.
    EXPECT_EQ(h.store.writes.front().started_at, "2025-06-01T00:00:00Z");
}

TEST(PipelineRunnerTest, ResumesFromAlias) {
    Harness h;
    h.store.records[kKey] = stored("waiting-pr-merged");
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-3", make_cancel_token());
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(h.executor.calls.size(), 1U);
    EXPECT_EQ(h.executor.calls.front(), Stage::WaitingMerge);
    EXPECT_EQ(get_value(result).skipped.size(), 5U);
}

TEST(PipelineRunnerTest, NewTaskGetsFreshStartTime) {
    Harness h;
    h.store.records[kKey] = stored("testing", "41");
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    ASSERT_FALSE(is_error(runner.run(make_request(), "run-4", make_cancel_token())));
    EXPECT_NE(h.store.writes.front().started_at, "2025-06-01T00:00:00Z");
    EXPECT_EQ(h.store.writes.front().task_id, "42");
}

TEST(PipelineRunnerTest, StoredCompletedRunsNothing) {
    Harness h;
    h.store.records[kKey] = stored("completed");
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-5", make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_TRUE(h.store.records.empty());
}

TEST(PipelineRunnerTest, UnknownStoredStageIsRefused) {
    Harness h;
    h.store.records[kKey] = stored("deploy-canary");
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-6", make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unrecognized_stage");
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_EQ(h.store.records.at(kKey).stage, "deploy-canary");

    ASSERT_EQ(h.escalation.notices.size(), 1U);
    const auto& notice = h.escalation.notices.front();
    EXPECT_EQ(notice.stage, "deploy-canary");
    EXPECT_EQ(notice.error_kind, "validation");
    EXPECT_EQ(notice.error_code, "unrecognized_stage");
    EXPECT_EQ(notice.attempts, 0U);
    EXPECT_FALSE(notice.retryable);
}

TEST(PipelineRunnerTest, RetriesTransientFailures) {
    Harness h;
    h.executor.failures[Stage::Quality] = {transient(), transient()};
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-7", make_cancel_token());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).attempts.at(Stage::Quality), 3U);
    EXPECT_TRUE(h.escalation.notices.empty());
}

TEST(PipelineRunnerTest, EscalatesAfterLastAttempt) {
    Harness h;
    h.executor.failures[Stage::Testing] = {transient("a"), transient("b"),
                                           transient("exit 2\nstack")};
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-8", make_cancel_token());
    ASSERT_TRUE(is_error(result));
    const auto& error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Process);
    EXPECT_EQ(error.code, "agent_exit_nonzero");
    EXPECT_EQ(error.message, "Stage 'testing' failed (process): exit 2");

    ASSERT_EQ(h.escalation.notices.size(), 1U);
    const auto& notice = h.escalation.notices.front();
    EXPECT_EQ(notice.stage, "testing");
    EXPECT_EQ(notice.attempts, 3U);
    EXPECT_TRUE(notice.retryable);
    EXPECT_EQ(notice.cause, "exit 2");
    EXPECT_EQ(notice.run_id, "run-8");

    const auto& record = h.store.records.at(kKey);
    EXPECT_EQ(record.stage, "testing");
    EXPECT_EQ(record.status, ProgressStatus::Failed);
    EXPECT_EQ(h.executor.calls.back(), Stage::Testing);
}

TEST(PipelineRunnerTest, SecurityIsAttemptedOnce) {
    Harness h;
    h.executor.failures[Stage::Security] = {transient()};
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-9", make_cancel_token());
    ASSERT_TRUE(is_error(result));
    ASSERT_EQ(h.escalation.notices.size(), 1U);
    EXPECT_EQ(h.escalation.notices.front().attempts, 1U);
    EXPECT_FALSE(h.escalation.notices.front().retryable);
    EXPECT_EQ(h.store.records.at(kKey).stage, "security");
}

TEST(PipelineRunnerTest, DeterministicFailuresAreNotRetried) {
    Harness h;
    h.executor.failures[Stage::Implementation] = {
        AgentError{ErrorCategory::UnsupportedTool, "Unsupported tool: gemini", "unsupported_tool"}};
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-10", make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::UnsupportedTool);
    EXPECT_EQ(h.executor.calls.size(), 1U);
}

TEST(PipelineRunnerTest, SingleAttemptBudget) {
    Harness h;
    h.executor.failures[Stage::Implementation] = {transient()};
    PipelineRunner runner(h.tracker, h.executor, h.escalation);
    PipelineRequest request = make_request();
    request.max_attempts = 1;

    ASSERT_TRUE(is_error(runner.run(request, "run-11", make_cancel_token())));
    EXPECT_EQ(h.executor.calls.size(), 1U);
}

TEST(PipelineRunnerTest, CancellationSuspendsAtCurrentStage) {
    Harness h;
    auto cancel = make_cancel_token();
    h.executor.cancel_on = Stage::Quality;
    h.executor.token = cancel;
    h.executor.failures[Stage::Quality] = {transient("killed")};
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-12", cancel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "run_cancelled");
    EXPECT_TRUE(h.escalation.notices.empty());
    EXPECT_EQ(h.executor.calls.size(), 2U);

    const auto& record = h.store.records.at(kKey);
    EXPECT_EQ(record.stage, "quality");
    EXPECT_EQ(record.status, ProgressStatus::Suspended);
}

TEST(PipelineRunnerTest, CancelledBeforeStartRunsNothing) {
    Harness h;
    auto cancel = make_cancel_token();
    cancel->store(true);
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-13", cancel);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "run_cancelled");
    EXPECT_TRUE(h.executor.calls.empty());
    EXPECT_EQ(h.store.records.at(kKey).status, ProgressStatus::Suspended);
}

TEST(PipelineRunnerTest, PersistenceFailureStopsTheRun) {
    Harness h;
    h.store.fail_writes = true;
    PipelineRunner runner(h.tracker, h.executor, h.escalation);

    auto result = runner.run(make_request(), "run-14", make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Persistence);
    EXPECT_TRUE(h.executor.calls.empty());
}

TEST(PipelineRunnerTest, MissingRepositoryIsInputError) {
    Harness h;
    PipelineRunner runner(h.tracker, h.executor, h.escalation);
    PipelineRequest request = make_request();
    request.repository.clear();

    auto result = runner.run(request, "run-15", make_cancel_token());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
}

TEST(PipelineRunnerTest, JournalsTheRun) {
    TempWorkspace ws("runner_journal");
    conductor::session::RunJournal journal(ws.root());
    Harness h;
    h.store.records[kKey] = stored("testing");
    h.executor.failures[Stage::WaitingMerge] = {transient()};
    PipelineRunner runner(h.tracker, h.executor, h.escalation, &journal);

    ASSERT_FALSE(is_error(runner.run(make_request(), "run-16", make_cancel_token())));

    auto path = journal.log_path(kKey, "run-16");
    ASSERT_FALSE(is_error(path));
    std::istringstream lines(conductor::testing::read_file(get_value(path)));
    std::vector<std::string> events;
    std::string line;
    while (std::getline(lines, line)) {
        events.push_back(json::parse(line).at("event").get<std::string>());
    }

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front(), "run_started");
    EXPECT_EQ(events.back(), "run_finished");
    EXPECT_EQ(std::count(events.begin(), events.end(), "stage_skipped"), 3);
    // testing, integration, merge twice
    EXPECT_EQ(std::count(events.begin(), events.end(), "stage_attempt"), 4);
    EXPECT_EQ(std::count(events.begin(), events.end(), "stage_result"), 4);
}

TEST(EscalationTest, DescribesTheFailure) {
    EscalationNotice notice;
    notice.repository = "5dlabs/cto";
    notice.task_id = "42";
    notice.stage = "quality";
    notice.error_kind = "process";
    notice.error_code = "agent_hung";
    notice.cause = "no output for 600s";
    notice.attempts = 1;
    EXPECT_EQ(describe(notice),
              "Stage 'quality' of 5dlabs/cto (task 42) failed after 1 attempt "
              "[process/agent_hung]: no output for 600s");
}

}  // namespace
