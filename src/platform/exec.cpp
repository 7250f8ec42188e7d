#include "ctxstage/exec.hpp"
#include "ctxstage/interrupt.hpp"
#include "ctxstage/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace ctxstage {
namespace exec {

// ============================================================================
// ENVIRONMENT / COMMAND LINE BUILDING
// ============================================================================

std::vector<std::string> build_environment(const Command& command) {
    auto merged = get_all_env();
    for (const auto& [key, value] : command.environment) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    std::sort(env.begin(), env.end());
    return env;
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) line += " ";
        line += argv[i];
    }
    return line;
}

namespace {

// Upper bound on how long a signal that lands just before a blocking call
// can go unnoticed
constexpr int INTERRUPT_POLL_MS = 200;

enum class OutputMode {
    Pipe,
    Discard,
};

struct Spawned {
    pid_t pid = -1;
    int out_fd = -1;    // read end of the output pipe (Pipe mode)
    std::string error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// fork/exec with an error pipe: the child writes errno to it if execvpe fails,
// and the pipe is closed on a successful exec.
Spawned spawn(const Command& command, OutputMode mode) {
    Spawned spawned;

    if (command.argv.empty()) {
        spawned.error = "empty command";
        return spawned;
    }

    auto env_strings = build_environment(command);

    std::vector<char*> argv;
    for (const auto& s : command.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    if (mode == OutputMode::Pipe && pipe2(out_pipe, O_CLOEXEC) != 0) {
        spawned.error = "pipe failed: " + std::string(strerror(errno));
        return spawned;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        spawned.error = "pipe failed: " + std::string(strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return spawned;
    }

    pid_t pid = fork();

    if (pid == -1) {
        spawned.error = "fork failed: " + std::string(strerror(errno));
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return spawned;
    }

    if (pid == 0) {
        // Child process
        int out_target = out_pipe[1];
        if (mode == OutputMode::Discard) {
            out_target = open("/dev/null", O_WRONLY);
        }
        if (out_target < 0 || dup2(out_target, STDOUT_FILENO) < 0 ||
            dup2(out_target, STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        if (!command.cwd.empty() && chdir(command.cwd.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        // Restore default dispositions the parent may have overridden
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        spawned.error = "failed to execute '" + command.argv[0] + "': " +
                        std::string(strerror(child_errno));
        close_fd(out_pipe[0]);
        int status;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        return spawned;
    }

    spawned.pid = pid;
    spawned.out_fd = out_pipe[0];
    return spawned;
}

void forward_interrupt(pid_t pid, ExecResult& result) {
    if (!result.interrupted && interrupt_requested()) {
        kill(pid, SIGINT);
        result.interrupted = true;
    }
}

void wait_child(pid_t pid, ExecResult& result) {
    int status = 0;
    while (true) {
        forward_interrupt(pid, result);
        pid_t waited = waitpid(pid, &status, result.interrupted ? 0 : WNOHANG);
        if (waited == pid) break;
        if (waited == 0) {
            // Still running: sleep in poll so a signal wakes us up
            poll(nullptr, 0, INTERRUPT_POLL_MS);
            continue;
        }
        if (errno == EINTR) continue;
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return;
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
}

} // namespace

// ============================================================================
// EXECUTION
// ============================================================================

ExecResult run_streaming(const Command& command, const LineHandler& on_line) {
    ExecResult result;

    auto spawned = spawn(command, OutputMode::Pipe);
    if (spawned.pid < 0) {
        result.error = spawned.error;
        return result;
    }

    std::string pending;
    char buffer[4096];

    while (true) {
        // Signals can land outside read() too, e.g. while a line is handled
        forward_interrupt(spawned.pid, result);

        struct pollfd pfd {};
        pfd.fd = spawned.out_fd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, INTERRUPT_POLL_MS);
        if (ready == 0) continue;
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }

        ssize_t n = read(spawned.out_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = "read failed: " + std::string(strerror(errno));
            break;
        }
        if (n == 0) break;

        pending.append(buffer, static_cast<size_t>(n));

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            on_line(pending.substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        on_line(pending);
    }

    close_fd(spawned.out_fd);

    std::string read_error = result.error;
    wait_child(spawned.pid, result);
    if (!read_error.empty() && result.error.empty()) {
        result.error = read_error;
    }
    return result;
}

ExecResult run_quiet(const Command& command) {
    ExecResult result;

    auto spawned = spawn(command, OutputMode::Discard);
    if (spawned.pid < 0) {
        result.error = spawned.error;
        return result;
    }

    wait_child(spawned.pid, result);
    return result;
}

} // namespace exec
} // namespace ctxstage
