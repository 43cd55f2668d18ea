#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace conductor::session {

// Append-only JSONL record of one run:
// <journal_root>/<repository key>/<run id>.jsonl
class RunJournal {
public:
    explicit RunJournal(std::filesystem::path journal_root);

    core::errors::Result<std::filesystem::path> append(const std::string& repository_key,
                                                       const std::string& run_id,
                                                       const std::string& event,
                                                       const nlohmann::json& payload) const;

    core::errors::Result<std::filesystem::path> log_path(const std::string& repository_key,
                                                         const std::string& run_id) const;

    const std::filesystem::path& root() const { return journal_root_; }

private:
    std::filesystem::path journal_root_;
};

}  // namespace conductor::session
