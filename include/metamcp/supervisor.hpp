#pragma once
#include "executor.hpp"
#include "process.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace metamcp {

/// Owns at most one long-lived worker process and runs one-shot engine
/// subprocesses for individual tool calls.
///
/// The worker slot is guarded by a mutex: ensure_started() and stop() are
/// mutually exclusive, with no ordering guarantee between waiting callers.
/// execute() never touches the worker; each call gets a fresh engine process
/// so no state survives between invocations.
class WorkerSupervisor : public IToolExecutor {
public:
    struct Options {
        /// Long-lived worker: program and its fixed handler script argument.
        CommandSpec worker{"metamcp-server", {}};
        /// One-shot engine: interpreter, its flags and the handler script.
        /// Tool name, JSON arguments and working directory are appended.
        CommandSpec engine{"Rscript", {"--vanilla", "scripts/entry/mcp_tools.R"}};
        std::chrono::milliseconds stop_grace{5000};
        std::size_t max_argument_bytes = 100000;
    };

    explicit WorkerSupervisor(Options opts);
    ~WorkerSupervisor() override;

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// Spawn the worker unless a live one exists. Throws ProcessError.
    void ensure_started();

    /// Terminate the worker: SIGTERM, wait stop_grace, SIGKILL. No-op when idle.
    void stop();

    [[nodiscard]] bool is_running();

    /// Pipe ends of the live worker, or -1 when none is running.
    /// Valid until the next stop().
    [[nodiscard]] int worker_stdin_fd() const;
    [[nodiscard]] int worker_stdout_fd() const;
    [[nodiscard]] pid_t worker_pid() const;

    /// Non-JSON stdout comes back as {"output", "stderr"} with invalid
    /// UTF-8 replaced by U+FFFD.
    nlohmann::ordered_json execute(const std::string& tool_name,
                                   const nlohmann::json& arguments,
                                   const std::filesystem::path& working_dir,
                                   std::chrono::milliseconds timeout) override;

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

private:
    void stop_locked();
    void drain_stderr(int fd, pid_t pid);

    Options opts_;

    mutable std::mutex mutex_;
    std::unique_ptr<Subprocess> worker_;
    std::thread stderr_thread_;
    std::atomic<bool> draining_{false};
};

} // namespace metamcp
