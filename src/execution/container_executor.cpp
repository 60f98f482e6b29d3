#include "execution/container_executor.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace octavius::execution {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    int exec_errno = 0;
    OutputTail stdout_tail;
    OutputTail stderr_tail;
    double duration_ms = 0.0;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, OutputTail& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// timeout_ms == 0 means no limit.
core::errors::Result<ProcessCapture> run_process(
    const std::vector<std::string>& command, const std::int64_t timeout_ms,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // Reports execvp failure; closed on successful exec.
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe(exec_pipe) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return OctaviusError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }
    static_cast<void>(fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC));

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& part : command) {
        argv.push_back(const_cast<char*>(part.c_str()));
    }
    argv.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return OctaviusError{ErrorCategory::Internal, "Failed to fork process.",
                             "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a kill also reaches anything the runtime spawned.
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(argv[0], argv.data());
        const int err = errno;
        static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));

    ProcessCapture capture;
    {
        int err = 0;
        ssize_t n = 0;
        do {
            n = read(exec_pipe[0], &err, sizeof(err));
        } while (n < 0 && errno == EINTR);
        static_cast<void>(close(exec_pipe[0]));
        if (n == static_cast<ssize_t>(sizeof(err))) {
            capture.exec_errno = err;
        }
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!child_exited && !killed && cancel_token && cancel_token->load()) {
            capture.cancelled = true;
            killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!child_exited && !killed && timeout_ms > 0 && elapsed > timeout_ms) {
            capture.timed_out = true;
            killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            // Pipes closed but the child is still running.
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_tail);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_tail);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms = std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace

OutputTail::OutputTail(const std::size_t limit) : limit_(limit) {}

void OutputTail::append(const char* data, const std::size_t size) {
    const std::size_t total = text_.size() + size;
    if (total <= limit_) {
        text_.append(data, size);
        return;
    }
    truncated_ = true;
    if (size >= limit_) {
        text_.assign(data + (size - limit_), limit_);
        return;
    }
    text_.erase(0, total - limit_);
    text_.append(data, size);
}

std::string OutputTail::str() const {
    return truncated_ ? "..." + text_ : text_;
}

ContainerExecutor::ContainerExecutor(ContainerExecutorOptions options,
                                     core::logging::Logger& logger)
    : options_(std::move(options)), logger_(logger) {}

std::vector<std::string> ContainerExecutor::build_command(
    const protocol::ExecutionOrder& order) const {
    std::vector<std::string> command;
    command.push_back(options_.runtime_binary);
    command.insert(command.end(), options_.runtime_args.begin(),
                   options_.runtime_args.end());
    for (const auto& [key, value] : order.arguments) {
        command.push_back("-e");
        command.push_back(key + "=" + value);
    }
    command.push_back(order.image_name);
    return command;
}

core::errors::Result<std::string> ContainerExecutor::run(
    const core::context::CallContext& ctx, const protocol::ExecutionOrder& order) {
    const auto live = ctx.check("run " + order.job_name);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    // The tighter of the executor's own limit and the caller's deadline wins.
    std::int64_t timeout_ms = options_.timeout_ms;
    bool deadline_bound = false;
    const auto remaining = ctx.remaining_ms();
    if (remaining.has_value() && (timeout_ms == 0 || remaining.value() < timeout_ms)) {
        timeout_ms = remaining.value() > 0 ? remaining.value() : 1;
        deadline_bound = true;
    }

    logger_.info("ContainerExecutor: " + order.execution_id + " starting " +
                 order.job_name + " from image " + order.image_name);

    auto captured = run_process(build_command(order), timeout_ms, ctx.cancel_token());
    if (core::errors::is_error(captured)) {
        return core::errors::get_error(captured);
    }
    const auto& capture = core::errors::get_value(captured);

    if (!capture.stdout_tail.empty()) {
        logger_.debug("ContainerExecutor: " + order.execution_id + " stdout: " +
                      capture.stdout_tail.str());
    }

    if (capture.exec_errno != 0) {
        return OctaviusError{ErrorCategory::Internal,
                             "Unable to start container runtime '" +
                                 options_.runtime_binary +
                                 "': " + std::strerror(capture.exec_errno),
                             "runtime_unavailable",
                             "Set container_runtime in the configuration file."};
    }
    if (capture.cancelled) {
        return OctaviusError{ErrorCategory::Cancelled,
                             "Execution of " + order.job_name + " cancelled.",
                             "cancelled"};
    }
    if (capture.timed_out) {
        if (deadline_bound) {
            return OctaviusError{ErrorCategory::DeadlineExceeded,
                                 "Execution of " + order.job_name +
                                     " exceeded the call deadline.",
                                 "deadline_exceeded"};
        }
        return OctaviusError{ErrorCategory::Internal,
                             "Execution of " + order.job_name + " timed out after " +
                                 std::to_string(timeout_ms) + " ms.",
                             "execution_timed_out"};
    }

    logger_.info("ContainerExecutor: " + order.execution_id + " exited with code " +
                 std::to_string(capture.exit_code) + " after " +
                 std::to_string(static_cast<std::int64_t>(capture.duration_ms)) + " ms");

    if (capture.exit_code == 0) {
        return std::string("succeeded");
    }
    if (!capture.stderr_tail.empty()) {
        logger_.warn("ContainerExecutor: " + order.execution_id + " stderr: " +
                     capture.stderr_tail.str());
    }
    return "failed (exit code " + std::to_string(capture.exit_code) + ")";
}

}  // namespace octavius::execution
