#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace planloop::tools {

using core::errors::ErrorCategory;
using core::errors::LifecycleError;

namespace {

// How long output is still collected after the direct child exits.
constexpr int kOutputGraceMs = 200;

// Written by the child to the close-on-exec status pipe when it fails
// before exec. A successful exec closes the pipe with nothing written.
struct StartFailure {
    int stage = 0;  // 1 = chdir, 2 = exec
    int error_number = 0;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, bool& is_open, std::string& out) {
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
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        close_fd(fd);
        return;
    }
}

void report_start_failure(const int fd, const int stage) {
    StartFailure failure;
    failure.stage = stage;
    failure.error_number = errno;
    static_cast<void>(write(fd, &failure, sizeof(failure)));
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return LifecycleError{ErrorCategory::Input, "Process argv cannot be empty.",
                              "empty_argv"};
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return LifecycleError{ErrorCategory::Internal,
                              "Failed to create process pipes.",
                              "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return LifecycleError{ErrorCategory::Internal, "Failed to fork process.",
                              "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(close(status_pipe[0]));
        if (chdir(cwd.c_str()) != 0) {
            report_start_failure(status_pipe[1], 1);
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execvp(argv[0], argv.data());
        report_start_failure(status_pipe[1], 2);
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    StartFailure failure;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        const std::string what = failure.stage == 1
                                     ? "enter directory '" + cwd + "'"
                                     : "start '" + request.argv.front() + "'";
        return LifecycleError{ErrorCategory::Execution,
                              "Failed to " + what + ": " +
                                  std::strerror(failure.error_number),
                              "process_start_failed"};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    std::chrono::steady_clock::time_point exited_at;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (child_exited) {
            // Background children of the direct child may still hold the
            // pipes open. They are not waited on past the grace period.
            if (now - exited_at > std::chrono::milliseconds(kOutputGraceMs)) {
                static_cast<void>(kill(-pid, SIGKILL));
                drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
                drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);
                stdout_open = false;
                stderr_open = false;
                close_fd(stdout_pipe[0]);
                close_fd(stderr_pipe[0]);
                break;
            }
        } else {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
            if (!capture.timed_out && request.timeout_ms > 0 &&
                elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
                capture.timed_out = true;
                static_cast<void>(kill(-pid, SIGKILL));
            }
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
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                exited_at = std::chrono::steady_clock::now();
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.term_signal = WTERMSIG(status);
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

ProcessRequest shell_request(const std::string& command,
                             const std::filesystem::path& working_directory,
                             const std::uint32_t timeout_ms) {
    ProcessRequest request;
    request.argv = {"/bin/sh", "-c", command};
    request.working_directory = working_directory;
    request.timeout_ms = timeout_ms;
    return request;
}

std::string shell_quote(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    escaped.push_back('\'');
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

}  // namespace planloop::tools
