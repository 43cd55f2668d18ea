#include "pipeline/progress_store.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace conductor::pipeline {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Unit;
using nlohmann::json;

std::string to_string(const ProgressStatus status) {
    switch (status) {
        case ProgressStatus::InProgress:
            return "in-progress";
        case ProgressStatus::Suspended:
            return "suspended";
        case ProgressStatus::Failed:
            return "failed";
        case ProgressStatus::Completed:
            return "completed";
    }
    return "unknown";
}

std::optional<ProgressStatus> parse_progress_status(const std::string& text) {
    if (text == "in-progress") return ProgressStatus::InProgress;
    if (text == "suspended") return ProgressStatus::Suspended;
    if (text == "failed") return ProgressStatus::Failed;
    if (text == "completed") return ProgressStatus::Completed;
    return std::nullopt;
}

json to_json(const StageProgress& progress) {
    json doc;
    doc["repository"] = progress.repository;
    doc["task-id"] = progress.task_id;
    doc["branch"] = progress.branch;
    doc["workflow-name"] = progress.workflow_name;
    doc["stage"] = progress.stage;
    doc["status"] = to_string(progress.status);
    doc["run-handle"] = progress.run_handle;
    doc["started-at"] = progress.started_at;
    doc["last-updated"] = progress.last_updated;
    return doc;
}

core::errors::Result<StageProgress> progress_from_json(const json& doc) {
    if (!doc.is_object()) {
        return AgentError{ErrorCategory::Persistence, "Progress record is not a JSON object.",
                          "progress_malformed"};
    }
    for (const char* required : {"repository", "stage", "status"}) {
        if (!doc.contains(required) || !doc[required].is_string()) {
            return AgentError{ErrorCategory::Persistence,
                              std::string("Progress record is missing '") + required + "'.",
                              "progress_malformed"};
        }
    }

    const auto status = parse_progress_status(doc["status"].get<std::string>());
    if (!status.has_value()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unknown progress status: " + doc["status"].get<std::string>(),
                          "progress_malformed"};
    }

    auto text = [&doc](const char* key) {
        auto it = doc.find(key);
        return it != doc.end() && it->is_string() ? it->get<std::string>() : std::string();
    };

    StageProgress progress;
    progress.repository = text("repository");
    progress.task_id = text("task-id");
    progress.branch = text("branch");
    progress.workflow_name = text("workflow-name");
    progress.stage = text("stage");
    progress.status = *status;
    progress.run_handle = text("run-handle");
    progress.started_at = text("started-at");
    progress.last_updated = text("last-updated");
    return progress;
}

std::string normalize_repository_key(const std::string& repository) {
    std::string slug;
    bool pending_dash = false;
    for (const unsigned char c : repository) {
        if (std::isalnum(c)) {
            if (pending_dash && !slug.empty()) {
                slug.push_back('-');
            }
            pending_dash = false;
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_dash = true;
        }
    }
    return "progress-" + slug;
}

FileProgressStore::FileProgressStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileProgressStore::path_for(const std::string& key) const {
    return directory_ / (key + ".json");
}

core::errors::Result<Unit> FileProgressStore::put(const std::string& key,
                                                  const StageProgress& progress) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to create progress directory: " + directory_.string(),
                          "progress_dir_create_failed"};
    }

    const auto target = path_for(key);
    const auto temp = directory_ / (key + ".json.tmp");
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            return AgentError{ErrorCategory::Persistence,
                              "Unable to open progress file: " + temp.string(),
                              "progress_open_failed"};
        }
        out << to_json(progress).dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            return AgentError{ErrorCategory::Persistence,
                              "Unable to write progress file: " + temp.string(),
                              "progress_write_failed"};
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return AgentError{ErrorCategory::Persistence,
                          "Unable to replace progress file: " + target.string(),
                          "progress_write_failed"};
    }
    return Unit{};
}

core::errors::Result<std::optional<StageProgress>> FileProgressStore::get(
    const std::string& key) const {
    const auto path = path_for(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return std::optional<StageProgress>{};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open progress file: " + path.string(),
                          "progress_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded()) {
        return AgentError{ErrorCategory::Persistence,
                          "Progress file is not valid JSON: " + path.string(),
                          "progress_malformed"};
    }
    auto progress = progress_from_json(doc);
    if (core::errors::is_error(progress)) {
        return core::errors::get_error(progress);
    }
    return std::optional<StageProgress>(core::errors::get_value(progress));
}

core::errors::Result<Unit> FileProgressStore::remove(const std::string& key) {
    std::error_code ec;
    std::filesystem::remove(path_for(key), ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to remove progress file: " + path_for(key).string(),
                          "progress_remove_failed"};
    }
    return Unit{};
}

ProgressTracker::ProgressTracker(ProgressStore& store) : store_(store) {}

core::errors::Result<StageProgress> ProgressTracker::write_progress(StageProgress progress) {
    if (progress.repository.empty()) {
        return AgentError{ErrorCategory::Input, "Progress needs a repository.",
                          "missing_repository"};
    }
    const std::string now = core::config::now_rfc3339();
    if (progress.started_at.empty()) {
        progress.started_at = now;
    }
    progress.last_updated = now;

    const std::string key = normalize_repository_key(progress.repository);
    auto stored = store_.put(key, progress);
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }
    LOG_DEBUG("ProgressTracker: " + key + " -> " + progress.stage + " (" +
              to_string(progress.status) + ")");
    return progress;
}

core::errors::Result<std::optional<StageProgress>> ProgressTracker::read_progress(
    const std::string& repository) const {
    if (repository.empty()) {
        return AgentError{ErrorCategory::Input, "Progress lookup needs a repository.",
                          "missing_repository"};
    }
    return store_.get(normalize_repository_key(repository));
}

core::errors::Result<Unit> ProgressTracker::clear_progress(const std::string& repository) {
    if (repository.empty()) {
        return AgentError{ErrorCategory::Input, "Progress reset needs a repository.",
                          "missing_repository"};
    }
    const std::string key = normalize_repository_key(repository);
    auto removed = store_.remove(key);
    if (!core::errors::is_error(removed)) {
        LOG_INFO("ProgressTracker: cleared " + key);
    }
    return removed;
}

}  // namespace conductor::pipeline
