#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "bridge/companion_endpoint.hpp"
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"

namespace conductor::bridge {

enum class DeliveryPath {
    None,
    Companion,
    Fifo
};

std::string to_string(DeliveryPath path);

struct BridgeRequest {
    std::vector<std::string> argv;
    std::filesystem::path working_dir = ".";
    std::map<std::string, std::string> env;  // added to the inherited environment
    std::filesystem::path fifo_path;
    std::string prompt;
    std::chrono::milliseconds termination_grace{5000};
    std::chrono::milliseconds hang_timeout{0};  // 0 = wait forever
    std::chrono::milliseconds open_retry_interval{20};
};

struct BridgeResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    DeliveryPath delivery = DeliveryPath::None;
    bool cancelled = false;
    bool timed_out = false;
    double duration_ms = 0.0;
};

// One stream-json user message, newline terminated.
std::string encode_user_message(const std::string& text);

// Runs one agent process and hands it exactly one message over a named
// pipe. The write end is always closed before the bridge waits for exit or
// signals the process; otherwise the agent blocks reading while the bridge
// blocks waiting and neither returns.
class SubprocessBridge {
public:
    explicit SubprocessBridge(std::shared_ptr<CompanionEndpoint> companion = nullptr);

    core::errors::Result<BridgeResult> run(const BridgeRequest& request,
                                           const core::cancellation::CancelToken& cancel) const;

private:
    std::shared_ptr<CompanionEndpoint> companion_;
};

}  // namespace conductor::bridge
