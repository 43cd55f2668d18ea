#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"
#include "pipeline/stage_executor.hpp"

namespace conductor::pipeline {

struct PullRequestStatus {
    bool has_conflicts = false;
    std::uint32_t failing_checks = 0;
    std::uint32_t unresolved_comments = 0;
    bool merged = false;
    nlohmann::json details = nlohmann::json::object();
};

// Opaque view of the code host. How the status is fetched is up to the
// implementation.
class CodeHostClient {
public:
    virtual ~CodeHostClient() = default;

    virtual core::errors::Result<PullRequestStatus> check(
        const std::string& repository, const std::string& task_id, const std::string& branch,
        const core::cancellation::CancelToken& cancel) = 0;
};

// Runs an operator-supplied shell command with CONDUCTOR_REPOSITORY,
// CONDUCTOR_TASK_ID and CONDUCTOR_BRANCH set. The command prints one JSON
// object: {"conflicts":bool,"failing_checks":n,"unresolved_comments":n,"merged":bool}.
class CommandCodeHostClient : public CodeHostClient {
public:
    explicit CommandCodeHostClient(std::string command,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(60));

    core::errors::Result<PullRequestStatus> check(
        const std::string& repository, const std::string& task_id, const std::string& branch,
        const core::cancellation::CancelToken& cancel) override;

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};

core::errors::Result<PullRequestStatus> parse_pull_request_status(const std::string& text);

struct CodeHostPolling {
    std::chrono::milliseconds interval{30000};
    std::uint32_t max_polls = 20;
};

// The two waiting stages. External integration is done when there are no
// conflicts, no failing checks and no unresolved comments; merge is done
// when the change is merged. Polls until then or until the budget runs out.
class CodeHostStageExecutor : public StageExecutor {
public:
    CodeHostStageExecutor(CodeHostClient& client, CodeHostPolling polling = {});

    core::errors::Result<StageReport> execute(
        Stage stage, const StageContext& context,
        const core::cancellation::CancelToken& cancel) override;

private:
    CodeHostClient& client_;
    CodeHostPolling polling_;
};

bool integration_ready(const PullRequestStatus& status);

}  // namespace conductor::pipeline
