#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"

namespace conductor::core::config {

inline constexpr const char* kDefaultToolsServerUrl =
    "http://tools.conductor.svc.cluster.local:3000/mcp";
inline constexpr const char* kDefaultFifoPath = "/workspace/agent-input.jsonl";

// Process configuration. Every field has a default; environment variables
// override defaults and CLI flags override both.
struct Settings {
    std::filesystem::path template_root = "templates";
    std::string tools_server_url = kDefaultToolsServerUrl;
    std::filesystem::path progress_dir = ".conductor/progress";
    std::filesystem::path journal_dir = ".conductor/runs";
    std::filesystem::path fifo_path = kDefaultFifoPath;
    std::optional<std::string> companion_url;

    std::uint32_t readiness_attempts = 10;
    std::chrono::milliseconds readiness_backoff{500};
    std::chrono::milliseconds termination_grace{5000};
    std::chrono::milliseconds hang_timeout{0};  // 0 = wait forever

    std::chrono::seconds health_check_interval{60};
    std::chrono::milliseconds health_check_timeout{5000};
    std::uint32_t health_history_size = 100;
    std::uint32_t failure_threshold = 3;

    std::string code_host_command;  // empty = waiting stages cannot run
    std::chrono::seconds code_host_poll_interval{30};
    std::uint32_t code_host_max_polls = 20;

    std::uint32_t max_attempts = 3;
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
std::optional<std::string> process_env(const std::string& name);

// Builds Settings from `lookup`. Malformed numbers and unknown log levels
// are Input errors naming the offending variable.
errors::Result<Settings> load_settings(const EnvLookup& lookup = process_env);

// Strips trailing '/' characters.
std::string trim_trailing_slash(std::string url);

}  // namespace conductor::core::config
