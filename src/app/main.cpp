#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "bridge/companion_endpoint.hpp"
#include "bridge/subprocess_bridge.hpp"
#include "core/config/ids.hpp"
#include "core/config/settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/agent_stage_executor.hpp"
#include "pipeline/code_host.hpp"
#include "pipeline/escalation.hpp"
#include "pipeline/pipeline_runner.hpp"
#include "pipeline/progress_store.hpp"
#include "registry/builtin_adapters.hpp"
#include "session/run_journal.hpp"
#include "session/run_manager.hpp"
#include "templates/template_renderer.hpp"

namespace errors = conductor::core::errors;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInput = 2;

// The token of the run in flight; SIGINT/SIGTERM flip it.
std::atomic<std::atomic_bool*> g_active_cancel{nullptr};

void on_terminate_signal(int) {
    std::atomic_bool* token = g_active_cancel.load();
    if (token != nullptr) {
        token->store(true);
    }
}

int report(const errors::AgentError& err, const std::string& what) {
    LOG_ERROR(what + " [" + errors::to_string(err.category) + "/" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return err.category == errors::ErrorCategory::Input ? kExitInput : kExitFailure;
}

errors::Result<std::unique_ptr<conductor::registry::AdapterRegistry>> build_registry(
    const conductor::core::config::Settings& settings) {
    auto renderer =
        std::make_shared<const conductor::templates::FileTemplateRenderer>(settings.template_root);
    return conductor::registry::make_builtin_registry(settings, renderer);
}

int run_health(const conductor::core::config::Settings& settings) {
    auto built = build_registry(settings);
    if (errors::is_error(built)) {
        return report(errors::get_error(built), "Failed to build adapter registry");
    }
    const auto& registry = errors::get_value(built);

    bool all_usable = true;
    for (const auto& [tool, status] : registry->get_health_summary()) {
        std::cout << tool << "\t" << conductor::protocol::to_string(status.state) << "\t"
                  << status.message << "\n";
        if (status.state == conductor::protocol::HealthState::Unhealthy) {
            all_usable = false;
        }
    }
    return all_usable ? kExitOk : kExitFailure;
}

int run_status(const conductor::core::config::Settings& settings, const std::string& repository) {
    conductor::pipeline::FileProgressStore store(settings.progress_dir);
    conductor::pipeline::ProgressTracker tracker(store);
    auto progress = tracker.read_progress(repository);
    if (errors::is_error(progress)) {
        return report(errors::get_error(progress), "Failed to read progress");
    }
    const auto& record = errors::get_value(progress);
    if (!record.has_value()) {
        std::cout << "No progress recorded for " << repository << "\n";
        return kExitOk;
    }
    std::cout << conductor::pipeline::to_json(*record).dump(2) << "\n";
    return kExitOk;
}

int run_reset(const conductor::core::config::Settings& settings, const std::string& repository) {
    conductor::pipeline::FileProgressStore store(settings.progress_dir);
    conductor::pipeline::ProgressTracker tracker(store);
    auto cleared = tracker.clear_progress(repository);
    if (errors::is_error(cleared)) {
        return report(errors::get_error(cleared), "Failed to reset progress");
    }
    LOG_INFO("Progress cleared for " + repository);
    return kExitOk;
}

int run_pipeline(const conductor::core::config::Settings& settings,
                 conductor::app::cli::CliCommand cmd) {
    auto& req = cmd.request;
    req.max_attempts = cmd.max_attempts.value_or(settings.max_attempts);
    if (cmd.prompt_file) {
        auto prompt = conductor::app::cli::read_prompt_file(*cmd.prompt_file);
        if (errors::is_error(prompt)) {
            return report(errors::get_error(prompt), "Input error");
        }
        req.prompt = errors::get_value(prompt);
    }

    auto built = build_registry(settings);
    if (errors::is_error(built)) {
        return report(errors::get_error(built), "Failed to build adapter registry");
    }
    const auto& registry = errors::get_value(built);
    const conductor::registry::HealthMonitoringScope monitoring(
        *registry, settings.health_check_interval);

    std::shared_ptr<conductor::bridge::CompanionEndpoint> companion;
    if (settings.companion_url.has_value()) {
        companion = std::make_shared<conductor::bridge::HttpCompanionEndpoint>(
            *settings.companion_url, settings.readiness_attempts, settings.readiness_backoff);
    }
    const conductor::bridge::SubprocessBridge bridge(companion);

    conductor::pipeline::AgentStageOptions agent_options;
    agent_options.fifo_path = settings.fifo_path;
    agent_options.termination_grace = settings.termination_grace;
    agent_options.hang_timeout = settings.hang_timeout;
    conductor::pipeline::AgentStageExecutor agent_stages(*registry, bridge, agent_options);

    conductor::pipeline::CommandCodeHostClient code_host(settings.code_host_command);
    conductor::pipeline::CodeHostPolling polling;
    polling.interval = settings.code_host_poll_interval;
    polling.max_polls = settings.code_host_max_polls;
    conductor::pipeline::CodeHostStageExecutor waiting_stages(code_host, polling);
    conductor::pipeline::StageRouter router(agent_stages, waiting_stages);

    conductor::pipeline::FileProgressStore store(settings.progress_dir);
    conductor::pipeline::ProgressTracker tracker(store);
    conductor::pipeline::LogEscalation escalation;
    const conductor::session::RunJournal journal(settings.journal_dir);
    conductor::pipeline::PipelineRunner runner(tracker, router, escalation, &journal);

    conductor::session::RunManager run_manager;
    auto started = run_manager.start_run(req);
    if (errors::is_error(started)) {
        return report(errors::get_error(started), "Failed to start run");
    }
    const std::string run_id = errors::get_value(started);
    conductor::core::logging::Logger::get().set_run_id(run_id);

    auto token_result = run_manager.get_cancel_token(run_id);
    if (errors::is_error(token_result)) {
        return report(errors::get_error(token_result), "Failed to get cancellation token");
    }
    const auto cancel = errors::get_value(token_result);

    g_active_cancel.store(cancel.get());
    static_cast<void>(std::signal(SIGINT, on_terminate_signal));
    static_cast<void>(std::signal(SIGTERM, on_terminate_signal));

    if (settings.hang_timeout.count() == 0) {
        LOG_WARN("No hang timeout configured; agent processes may wait indefinitely.");
    }
    LOG_INFO("Run " + run_id + " started for " + req.repository + " task " + req.task_id);
    auto outcome = runner.run(req, run_id, cancel);
    g_active_cancel.store(nullptr);

    if (errors::is_error(outcome)) {
        const auto& err = errors::get_error(outcome);
        auto finished = err.code == "run_cancelled" ? run_manager.cancel_run(run_id)
                                                    : run_manager.mark_failed(run_id, err.message);
        if (errors::is_error(finished)) {
            static_cast<void>(report(errors::get_error(finished), "Failed to record run state"));
        }
        return report(err, "Pipeline failed");
    }

    const auto& result = errors::get_value(outcome);
    for (const auto stage : conductor::pipeline::kOrderedStages) {
        const auto it = result.outcomes.find(stage);
        if (it == result.outcomes.end()) {
            continue;
        }
        std::string line = conductor::pipeline::to_string(stage) + ": " +
                           conductor::pipeline::to_string(it->second);
        const auto report_it = result.reports.find(stage);
        if (report_it != result.reports.end() && !report_it->second.summary.empty()) {
            line += " (" + report_it->second.summary + ")";
        }
        LOG_INFO(line);
    }

    auto completed = run_manager.mark_completed(run_id);
    if (errors::is_error(completed)) {
        return report(errors::get_error(completed), "Failed to mark run as completed");
    }
    LOG_INFO("Run " + run_id + " completed");
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto& logger = conductor::core::logging::Logger::get();
    logger.set_run_id(conductor::core::config::generate_run_id());
    logger.set_correlation_id(conductor::core::config::generate_correlation_id());

    auto parsed = conductor::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        return report(errors::get_error(parsed), "Input error");
    }
    const auto& cmd = errors::get_value(parsed);

    auto loaded = conductor::core::config::load_settings();
    if (errors::is_error(loaded)) {
        return report(errors::get_error(loaded), "Configuration error");
    }
    const auto& settings = errors::get_value(loaded);
    logger.set_min_level(cmd.request.verbose ? conductor::core::logging::LogLevel::DEBUG
                                             : settings.log_level);

    switch (cmd.kind) {
        case conductor::app::cli::CommandKind::Health:
            return run_health(settings);
        case conductor::app::cli::CommandKind::Status:
            return run_status(settings, cmd.request.repository);
        case conductor::app::cli::CommandKind::Reset:
            return run_reset(settings, cmd.request.repository);
        case conductor::app::cli::CommandKind::Run:
            return run_pipeline(settings, cmd);
    }
    return kExitFailure;
}
