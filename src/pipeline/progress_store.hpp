#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace conductor::pipeline {

enum class ProgressStatus {
    InProgress,
    Suspended,
    Failed,
    Completed
};

std::string to_string(ProgressStatus status);
std::optional<ProgressStatus> parse_progress_status(const std::string& text);

// Durable resume state for one repository. `stage` stays a raw string so
// names written by other versions survive a round trip.
struct StageProgress {
    std::string repository;
    std::string task_id;
    std::string branch;
    std::string workflow_name;
    std::string stage;
    ProgressStatus status = ProgressStatus::InProgress;
    std::string run_handle;
    std::string started_at;
    std::string last_updated;
};

nlohmann::json to_json(const StageProgress& progress);
core::errors::Result<StageProgress> progress_from_json(const nlohmann::json& doc);

// "5dlabs/CTO" -> "progress-5dlabs-cto". Depends only on the repository name.
std::string normalize_repository_key(const std::string& repository);

// Key-value collaborator holding one record per key.
class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    // Creates or replaces.
    virtual core::errors::Result<core::errors::Unit> put(const std::string& key,
                                                         const StageProgress& progress) = 0;
    // Empty when no record exists.
    virtual core::errors::Result<std::optional<StageProgress>> get(const std::string& key) const = 0;
    // Removing a missing record succeeds.
    virtual core::errors::Result<core::errors::Unit> remove(const std::string& key) = 0;
};

// One JSON file per key, replaced atomically via rename.
class FileProgressStore : public ProgressStore {
public:
    explicit FileProgressStore(std::filesystem::path directory);

    core::errors::Result<core::errors::Unit> put(const std::string& key,
                                                 const StageProgress& progress) override;
    core::errors::Result<std::optional<StageProgress>> get(const std::string& key) const override;
    core::errors::Result<core::errors::Unit> remove(const std::string& key) override;

    std::filesystem::path path_for(const std::string& key) const;

private:
    std::filesystem::path directory_;
};

// write/read/clear keyed by repository.
class ProgressTracker {
public:
    explicit ProgressTracker(ProgressStore& store);

    // Stamps last_updated (and started_at when unset) before storing.
    core::errors::Result<StageProgress> write_progress(StageProgress progress);
    core::errors::Result<std::optional<StageProgress>> read_progress(
        const std::string& repository) const;
    core::errors::Result<core::errors::Unit> clear_progress(const std::string& repository);

private:
    ProgressStore& store_;
};

}  // namespace conductor::pipeline
