#include "session/run_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include "core/config/ids.hpp"

namespace conductor::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return static_cast<std::int64_t>(ms);
}

bool is_plain_segment(const std::string& value) {
    return !value.empty() && value != "." && value != ".." &&
           value.find('/') == std::string::npos && value.find('\\') == std::string::npos;
}

}  // namespace

RunJournal::RunJournal(std::filesystem::path journal_root)
    : journal_root_(std::move(journal_root)) {}

core::errors::Result<std::filesystem::path> RunJournal::log_path(
    const std::string& repository_key, const std::string& run_id) const {
    if (!is_plain_segment(run_id)) {
        return AgentError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                          "invalid_run_id"};
    }
    if (!is_plain_segment(repository_key)) {
        return AgentError{ErrorCategory::Input,
                          "Invalid repository key: '" + repository_key + "'",
                          "invalid_repository_key"};
    }

    const auto directory = journal_root_ / repository_key;
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to create journal directory: " + directory.string(),
                          "journal_dir_create_failed"};
    }
    return directory / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> RunJournal::append(
    const std::string& repository_key, const std::string& run_id, const std::string& event,
    const json& payload) const {
    auto path_result = log_path(repository_key, run_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json entry;
    entry["ts"] = core::config::now_rfc3339();
    entry["ts_unix_ms"] = now_unix_ms();
    entry["event"] = event;
    entry["run_id"] = run_id;
    entry["payload"] = payload;

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to open journal file: " + path.string(),
                          "journal_open_failed"};
    }

    out << entry.dump() << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Persistence,
                          "Unable to write journal event: " + path.string(),
                          "journal_write_failed"};
    }
    return path;
}

}  // namespace conductor::session
