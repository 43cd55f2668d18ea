#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"

namespace conductor::bridge {

void set_nonblocking(int fd);

// Reads everything currently available. Closes `fd` and clears `is_open`
// on EOF or a hard error.
void drain_pipe(int fd, bool& is_open, std::string& out);

// The current environment as NAME=VALUE entries, with `overrides` replacing
// or adding variables. Built before fork so the child only calls exec.
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides);

// Null-terminated pointer array over `items`, which must outlive it.
std::vector<char*> c_string_array(std::vector<std::string>& items);

struct CommandSpec {
    std::string command;  // run through /bin/sh -c
    std::filesystem::path working_directory = ".";
    std::map<std::string, std::string> env;
    std::chrono::milliseconds timeout{30000};
};

struct CommandCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Short-lived helper commands (status probes, hooks). Agents go through
// SubprocessBridge instead.
core::errors::Result<CommandCapture> run_command(const CommandSpec& spec,
                                                 const core::cancellation::CancelToken& cancel);

}  // namespace conductor::bridge
