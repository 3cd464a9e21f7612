#pragma once
#include <sys/types.h>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace metamcp {

/// A program plus the arguments that always precede per-call arguments.
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
};

/// Child process with its stdin/stdout/stderr wired to pipes.
/// The child leads its own process group; signals go to the whole group.
/// The destructor kills and reaps a child that is still running, so a
/// Subprocess never leaves a zombie behind.
class Subprocess {
public:
    struct Output {
        int exit_code = 0;       // negative signal number if killed by a signal
        bool timed_out = false;
        std::string stdout_text;
        std::string stderr_text;
    };

    Subprocess(std::string program, std::vector<std::string> args);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /// Fork and exec. Throws ProcessError if pipes cannot be created or
    /// the program cannot be executed.
    void spawn();

    /// Close stdin, collect stdout/stderr until both reach EOF and the child
    /// exits. On deadline the process group is killed and timed_out is set.
    Output communicate(std::chrono::milliseconds timeout);

    /// Non-blocking liveness probe; reaps the child if it has exited.
    [[nodiscard]] bool is_running();

    /// Wait up to timeout for exit. Returns the exit code, or nullopt if the
    /// child is still running.
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// SIGTERM, wait up to grace, then SIGKILL. Always reaps.
    /// Returns the exit code and whether the kill escalation was needed.
    std::pair<int, bool> terminate(std::chrono::milliseconds grace);

    void close_stdin();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] int stdin_fd() const noexcept { return stdin_fd_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }
    [[nodiscard]] const std::optional<int>& exit_code() const noexcept { return exit_code_; }

private:
    void signal_group(int sig);
    bool reap(bool block);
    void close_fds();

    std::string program_;
    std::vector<std::string> args_;

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    std::optional<int> exit_code_;
};

} // namespace metamcp
