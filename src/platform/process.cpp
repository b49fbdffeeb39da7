#include "wheelsmith/process.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wheelsmith {

namespace {

constexpr int POLL_INTERVAL_MS = 50;

void append_available(int fd, std::string& out, bool& open) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
        open = false;
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> c_argv;
    for (const auto& s : argv) {
        c_argv.push_back(const_cast<char*>(s.c_str()));
    }
    c_argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    if (options.capture_output && pipe(out_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        if (options.capture_output) {
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        if (options.capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
        }

        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(127);
        }

        execvp(c_argv[0], c_argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    bool pipe_open = options.capture_output;
    if (options.capture_output) {
        close(out_pipe[1]);
    }

    const bool has_deadline = options.timeout_seconds > 0;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(options.timeout_seconds);

    int status = 0;
    bool reaped = false;

    while (!reaped) {
        if (pipe_open) {
            pollfd pfd{out_pipe[0], POLLIN, 0};
            if (poll(&pfd, 1, POLL_INTERVAL_MS) > 0) {
                append_available(out_pipe[0], result.output, pipe_open);
            }
        } else if (has_deadline) {
            usleep(POLL_INTERVAL_MS * 1000);
        }

        bool blocking = !pipe_open && !has_deadline;
        pid_t waited = waitpid(pid, &status, blocking ? 0 : WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited == -1 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            if (options.capture_output) close(out_pipe[0]);
            return result;
        }

        if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            reaped = true;
        }
    }

    if (options.capture_output) {
        while (pipe_open) {
            append_available(out_pipe[0], result.output, pipe_open);
        }
        close(out_pipe[0]);
    }

    if (result.timed_out) {
        result.error = "timed out after " + std::to_string(options.timeout_seconds) + "s";
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace wheelsmith
