#include "bridge/subprocess_bridge.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <nlohmann/json.hpp>
#include "bridge/process_io.hpp"
#include "core/logging/logger.hpp"

namespace conductor::bridge {

using core::cancellation::CancelToken;
using core::cancellation::is_cancelled;
using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Unit;

namespace {

constexpr int kPollIntervalMs = 50;

struct CapturedOutput {
    std::string stdout_text;
    std::string stderr_text;
};

// Drains both streams until EOF, or until the child has been reaped and a
// final non-blocking drain has run. Descendants that keep the pipes open
// therefore cannot stall the bridge.
CapturedOutput pump_output(const int stdout_fd, const int stderr_fd,
                           std::shared_ptr<std::atomic_bool> child_exited) {
    CapturedOutput captured;
    bool stdout_open = true;
    bool stderr_open = true;

    while (stdout_open || stderr_open) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        static_cast<void>(poll(fds, nfds, kPollIntervalMs));

        const bool exited = child_exited->load();
        drain_pipe(stdout_fd, stdout_open, captured.stdout_text);
        drain_pipe(stderr_fd, stderr_open, captured.stderr_text);
        if (exited) {
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_fd));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_fd));
    }
    return captured;
}

// Owns the child pid. A child still running when this goes out of scope is
// killed and reaped so error paths never leak processes.
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ~ChildProcess() {
        if (!reaped_) {
            signal_group(SIGKILL);
            int status = 0;
            static_cast<void>(waitpid(pid_, &status, 0));
        }
    }

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

    // Non-blocking. True once the child has exited.
    bool poll_exit() {
        if (reaped_) {
            return true;
        }
        int status = 0;
        const pid_t waited = waitpid(pid_, &status, WNOHANG);
        if (waited == pid_ || (waited < 0 && errno == ECHILD)) {
            reaped_ = true;
            status_ = status;
        }
        return reaped_;
    }

    void signal_group(const int sig) const {
        if (kill(-pid_, sig) != 0) {
            static_cast<void>(kill(pid_, sig));
        }
    }

    int exit_code() const {
        if (WIFEXITED(status_)) {
            return WEXITSTATUS(status_);
        }
        if (WIFSIGNALED(status_)) {
            return 128 + WTERMSIG(status_);
        }
        return -1;
    }

private:
    pid_t pid_;
    bool reaped_ = false;
    int status_ = 0;
};

// Write end of the named pipe. Closing delivers end-of-stream to the agent.
class FifoWriter {
public:
    FifoWriter() = default;
    FifoWriter(const FifoWriter&) = delete;
    FifoWriter& operator=(const FifoWriter&) = delete;
    ~FifoWriter() { close_write_end(); }

    // Retries while no reader is attached yet (ENXIO).
    core::errors::Result<Unit> open(const std::filesystem::path& path, ChildProcess& child,
                                    const CancelToken& cancel,
                                    const std::chrono::milliseconds retry_interval) {
        while (true) {
            fd_ = ::open(path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
            if (fd_ >= 0) {
                return Unit{};
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != ENXIO) {
                return AgentError{ErrorCategory::Delivery,
                                  "Failed to open pipe " + path.string() + ": " +
                                      std::strerror(errno),
                                  "fifo_open_failed"};
            }
            if (is_cancelled(cancel)) {
                return AgentError{ErrorCategory::Delivery, "Delivery cancelled.",
                                  "delivery_cancelled"};
            }
            if (child.poll_exit()) {
                return AgentError{ErrorCategory::Delivery,
                                  "Agent exited before opening its input pipe.",
                                  "reader_exited"};
            }
            std::this_thread::sleep_for(retry_interval);
        }
    }

    core::errors::Result<Unit> write_all(const std::string& data, ChildProcess& child,
                                         const CancelToken& cancel) {
        std::size_t offset = 0;
        while (offset < data.size()) {
            const ssize_t n = ::write(fd_, data.data() + offset, data.size() - offset);
            const int write_errno = errno;
            if (n > 0) {
                offset += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && write_errno == EINTR) {
                continue;
            }
            if (n < 0 && (write_errno == EAGAIN || write_errno == EWOULDBLOCK)) {
                if (is_cancelled(cancel)) {
                    return AgentError{ErrorCategory::Delivery, "Delivery cancelled.",
                                      "delivery_cancelled"};
                }
                if (child.poll_exit()) {
                    return AgentError{ErrorCategory::Delivery,
                                      "Agent exited before reading its input.",
                                      "reader_exited"};
                }
                pollfd pfd{fd_, POLLOUT, 0};
                static_cast<void>(poll(&pfd, 1, kPollIntervalMs));
                continue;
            }
            return AgentError{ErrorCategory::Delivery,
                              std::string("Failed to write to pipe: ") +
                                  (n < 0 ? std::strerror(write_errno) : "short write"),
                              write_errno == EPIPE ? "reader_exited" : "fifo_write_failed"};
        }
        return Unit{};
    }

    void close_write_end() {
        if (fd_ >= 0) {
            static_cast<void>(::close(fd_));
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

core::errors::Result<Unit> ensure_fifo(const std::filesystem::path& path) {
    struct stat info {};
    if (stat(path.c_str(), &info) == 0) {
        if (S_ISFIFO(info.st_mode)) {
            return Unit{};
        }
        return AgentError{ErrorCategory::Process,
                          "Input path exists and is not a named pipe: " + path.string(),
                          "fifo_path_conflict"};
    }
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    if (mkfifo(path.c_str(), 0600) != 0 && errno != EEXIST) {
        return AgentError{ErrorCategory::Process,
                          "Failed to create named pipe " + path.string() + ": " +
                              std::strerror(errno),
                          "fifo_create_failed"};
    }
    return Unit{};
}

struct SpawnedChild {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

core::errors::Result<SpawnedChild> spawn(const BridgeRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return AgentError{ErrorCategory::Process, "No command to run.", "empty_command"};
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = merged_environment(request.env);
    std::vector<char*> envp = c_string_array(env_storage);

    const std::string cwd = request.working_dir.string();
    const std::string fifo = request.fifo_path.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return AgentError{ErrorCategory::Process, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        return AgentError{ErrorCategory::Process, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        return AgentError{ErrorCategory::Process, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        // Blocks until a writer attaches, either the bridge or the companion.
        const int input = ::open(fifo.c_str(), O_RDONLY);
        if (input < 0) {
            _exit(126);
        }
        static_cast<void>(dup2(input, STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(input));
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    return SpawnedChild{pid, stdout_pipe[0], stderr_pipe[0]};
}

// SIGTERM to the process group, SIGKILL after `grace`.
void terminate(ChildProcess& child, const std::chrono::milliseconds grace) {
    if (child.poll_exit()) {
        return;
    }
    LOG_WARN("Bridge: sending SIGTERM to agent pid " + std::to_string(child.pid()));
    child.signal_group(SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (child.poll_exit()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }

    LOG_WARN("Bridge: agent pid " + std::to_string(child.pid()) +
             " ignored SIGTERM; sending SIGKILL");
    child.signal_group(SIGKILL);
    while (!child.poll_exit()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void ignore_sigpipe_once() {
    static const bool ignored = []() {
        static_cast<void>(signal(SIGPIPE, SIG_IGN));
        return true;
    }();
    static_cast<void>(ignored);
}

}  // namespace

std::string to_string(const DeliveryPath path) {
    switch (path) {
        case DeliveryPath::None:
            return "none";
        case DeliveryPath::Companion:
            return "companion";
        case DeliveryPath::Fifo:
            return "fifo";
    }
    return "unknown";
}

std::string encode_user_message(const std::string& text) {
    const nlohmann::json message = {
        {"type", "user"},
        {"message",
         {{"role", "user"},
          {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}}},
    };
    return message.dump() + "\n";
}

SubprocessBridge::SubprocessBridge(std::shared_ptr<CompanionEndpoint> companion)
    : companion_(std::move(companion)) {}

core::errors::Result<BridgeResult> SubprocessBridge::run(const BridgeRequest& request,
                                                         const CancelToken& cancel) const {
    ignore_sigpipe_once();
    if (request.fifo_path.empty()) {
        return AgentError{ErrorCategory::Process, "No input pipe path configured.",
                          "missing_fifo_path"};
    }
    auto fifo_ready = ensure_fifo(request.fifo_path);
    if (core::errors::is_error(fifo_ready)) {
        return core::errors::get_error(fifo_ready);
    }

    const auto started = std::chrono::steady_clock::now();
    auto spawned = spawn(request);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    const SpawnedChild handles = core::errors::get_value(spawned);
    ChildProcess child(handles.pid);
    LOG_INFO("Bridge: spawned " + request.argv.front() + " as pid " + std::to_string(child.pid()));

    auto child_exited = std::make_shared<std::atomic_bool>(false);
    auto output = std::async(std::launch::async, pump_output, handles.stdout_fd,
                             handles.stderr_fd, child_exited);

    BridgeResult result;
    std::optional<AgentError> delivery_error;

    // 1. Deliver: companion first when configured, then the pipe itself.
    if (companion_ && !is_cancelled(cancel)) {
        if (companion_->wait_until_ready(cancel)) {
            auto posted = companion_->deliver(request.prompt);
            if (!core::errors::is_error(posted)) {
                result.delivery = DeliveryPath::Companion;
            } else {
                LOG_WARN("Bridge: companion delivery failed, using pipe: " +
                         core::errors::get_error(posted).message);
            }
        } else {
            LOG_WARN("Bridge: companion not ready, using pipe");
        }
    }

    if (result.delivery == DeliveryPath::None && !is_cancelled(cancel)) {
        FifoWriter writer;
        auto opened = writer.open(request.fifo_path, child, cancel, request.open_retry_interval);
        if (core::errors::is_error(opened)) {
            delivery_error = core::errors::get_error(opened);
        } else {
            auto written = writer.write_all(encode_user_message(request.prompt), child, cancel);
            if (core::errors::is_error(written)) {
                delivery_error = core::errors::get_error(written);
            } else {
                result.delivery = DeliveryPath::Fifo;
            }
        }
        // 2. Close. End-of-stream reaches the agent before any wait below.
        writer.close_write_end();
    }

    // 3. Wait for exit; cancellation or a hang escalates to termination.
    while (!child.poll_exit()) {
        if (is_cancelled(cancel)) {
            result.cancelled = true;
            terminate(child, request.termination_grace);
            break;
        }
        if (request.hang_timeout.count() > 0 &&
            std::chrono::steady_clock::now() - started > request.hang_timeout) {
            result.timed_out = true;
            LOG_WARN("Bridge: agent exceeded hang timeout of " +
                     std::to_string(request.hang_timeout.count()) + "ms");
            terminate(child, request.termination_grace);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }

    child_exited->store(true);
    CapturedOutput captured = output.get();
    result.stdout_text = std::move(captured.stdout_text);
    result.stderr_text = std::move(captured.stderr_text);
    result.exit_code = child.exit_code();
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();

    LOG_INFO("Bridge: pid " + std::to_string(child.pid()) + " exited with " +
             std::to_string(result.exit_code) + " via " + to_string(result.delivery) +
             (result.cancelled ? " (cancelled)" : "") + (result.timed_out ? " (timed out)" : ""));

    if (delivery_error.has_value() && !result.cancelled && !result.timed_out &&
        result.exit_code == 0) {
        return *delivery_error;
    }
    if (delivery_error.has_value()) {
        LOG_WARN("Bridge: delivery failed: " + delivery_error->message);
    }
    return result;
}

}  // namespace conductor::bridge
