#include "pipeline/code_host.hpp"

#include <thread>
#include <utility>
#include "bridge/process_io.hpp"
#include "core/logging/logger.hpp"

namespace conductor::pipeline {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string pending_reason(const PullRequestStatus& status) {
    std::string reason;
    if (status.has_conflicts) {
        reason += "merge conflicts";
    }
    if (status.failing_checks > 0) {
        reason += std::string(reason.empty() ? "" : ", ") +
                  std::to_string(status.failing_checks) + " failing checks";
    }
    if (status.unresolved_comments > 0) {
        reason += std::string(reason.empty() ? "" : ", ") +
                  std::to_string(status.unresolved_comments) + " unresolved comments";
    }
    return reason;
}

// Sleeps in short slices so a cancelled run stops waiting promptly.
bool wait_or_cancel(const std::chrono::milliseconds total,
                    const core::cancellation::CancelToken& cancel) {
    const auto deadline = std::chrono::steady_clock::now() + total;
    while (std::chrono::steady_clock::now() < deadline) {
        if (core::cancellation::is_cancelled(cancel)) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !core::cancellation::is_cancelled(cancel);
}

}  // namespace

bool integration_ready(const PullRequestStatus& status) {
    return !status.has_conflicts && status.failing_checks == 0 &&
           status.unresolved_comments == 0;
}

core::errors::Result<PullRequestStatus> parse_pull_request_status(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return AgentError{ErrorCategory::Process,
                          "Code host status is not a JSON object: " + text.substr(0, 200),
                          "code_host_malformed"};
    }

    try {
        PullRequestStatus status;
        status.has_conflicts = doc.value("conflicts", false);
        status.failing_checks = doc.value("failing_checks", 0U);
        status.unresolved_comments = doc.value("unresolved_comments", 0U);
        status.merged = doc.value("merged", false);
        status.details = doc;
        return status;
    } catch (const json::exception& e) {
        return AgentError{ErrorCategory::Process,
                          std::string("Code host status has a field of the wrong type: ") + e.what(),
                          "code_host_malformed"};
    }
}

CommandCodeHostClient::CommandCodeHostClient(std::string command,
                                             const std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

core::errors::Result<PullRequestStatus> CommandCodeHostClient::check(
    const std::string& repository, const std::string& task_id, const std::string& branch,
    const core::cancellation::CancelToken& cancel) {
    if (command_.empty()) {
        return AgentError{ErrorCategory::Input, "No code host status command is configured.",
                          "code_host_unconfigured",
                          "Set CONDUCTOR_CODE_HOST_COMMAND to a command printing the status JSON."};
    }

    bridge::CommandSpec spec;
    spec.command = command_;
    spec.timeout = timeout_;
    spec.env = {{"CONDUCTOR_REPOSITORY", repository},
                {"CONDUCTOR_TASK_ID", task_id},
                {"CONDUCTOR_BRANCH", branch}};

    auto captured = bridge::run_command(spec, cancel);
    if (core::errors::is_error(captured)) {
        return core::errors::get_error(captured);
    }
    const auto& capture = core::errors::get_value(captured);
    if (capture.cancelled) {
        return AgentError{ErrorCategory::Process, "Code host check cancelled.",
                          "code_host_cancelled"};
    }
    if (capture.timed_out) {
        return AgentError{ErrorCategory::Process, "Code host check timed out.",
                          "code_host_timeout"};
    }
    if (capture.exit_code != 0) {
        return AgentError{ErrorCategory::Process,
                          "Code host command exited with code " +
                              std::to_string(capture.exit_code) + ": " + capture.stderr_text,
                          "code_host_failed"};
    }
    return parse_pull_request_status(capture.stdout_text);
}

CodeHostStageExecutor::CodeHostStageExecutor(CodeHostClient& client, CodeHostPolling polling)
    : client_(client), polling_(polling) {}

core::errors::Result<StageReport> CodeHostStageExecutor::execute(
    const Stage stage, const StageContext& context,
    const core::cancellation::CancelToken& cancel) {
    if (stage != Stage::WaitingExternalIntegration && stage != Stage::WaitingMerge) {
        return AgentError{ErrorCategory::Internal,
                          "Stage '" + to_string(stage) + "' is not a code host stage.",
                          "stage_not_executable"};
    }

    const auto& request = context.request;
    const std::uint32_t polls = polling_.max_polls == 0 ? 1 : polling_.max_polls;
    std::string last_reason;
    for (std::uint32_t poll = 1; poll <= polls; ++poll) {
        auto checked = client_.check(request.repository, request.task_id, request.branch, cancel);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        const auto& status = core::errors::get_value(checked);

        const bool done = stage == Stage::WaitingMerge ? status.merged : integration_ready(status);
        if (done) {
            StageReport report;
            report.summary = stage == Stage::WaitingMerge ? "merged" : "ready for merge";
            report.details = {{"polls", poll}, {"status", status.details}};
            return report;
        }

        last_reason = stage == Stage::WaitingMerge ? "not merged yet" : pending_reason(status);
        LOG_INFO("CodeHostStageExecutor: " + to_string(stage) + " waiting (" + last_reason +
                 "), poll " + std::to_string(poll) + "/" + std::to_string(polls));
        if (poll < polls && !wait_or_cancel(polling_.interval, cancel)) {
            return AgentError{ErrorCategory::Process, "Wait cancelled.", "code_host_cancelled"};
        }
    }

    return AgentError{ErrorCategory::Process,
                      "Stage '" + to_string(stage) + "' still pending: " + last_reason,
                      "code_host_pending"};
}

}  // namespace conductor::pipeline
