#include "metamcp/supervisor.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include "metamcp/types.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <string_view>

namespace metamcp {

namespace {

std::string trim(std::string_view s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(ws);
    return std::string(s.substr(begin, end - begin + 1));
}

} // anonymous namespace

WorkerSupervisor::WorkerSupervisor(Options opts)
    : opts_(std::move(opts)) {
}

WorkerSupervisor::~WorkerSupervisor() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_locked();
}

void WorkerSupervisor::ensure_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_ && worker_->is_running()) return;

    // A worker that exited on its own is already reaped; drop its handle.
    stop_locked();

    auto proc = std::make_unique<Subprocess>(opts_.worker.program, opts_.worker.args);
    proc->spawn();
    log::logger()->info("Worker started: {} (pid {})", opts_.worker.program, proc->pid());

    draining_ = true;
    stderr_thread_ = std::thread([this, fd = proc->stderr_fd(), pid = proc->pid()] {
        drain_stderr(fd, pid);
    });
    worker_ = std::move(proc);
}

void WorkerSupervisor::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_locked();
}

void WorkerSupervisor::stop_locked() {
    if (worker_) {
        pid_t pid = worker_->pid();
        worker_->close_stdin();
        auto [code, forced] = worker_->terminate(opts_.stop_grace);
        if (forced) {
            log::logger()->warn("Worker {} ignored SIGTERM, killed", pid);
        } else {
            log::logger()->info("Worker {} stopped (exit {})", pid, code);
        }
    }
    draining_ = false;
    if (stderr_thread_.joinable()) stderr_thread_.join();
    worker_.reset();
}

bool WorkerSupervisor::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_ && worker_->is_running();
}

int WorkerSupervisor::worker_stdin_fd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_ ? worker_->stdin_fd() : -1;
}

int WorkerSupervisor::worker_stdout_fd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_ ? worker_->stdout_fd() : -1;
}

pid_t WorkerSupervisor::worker_pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_ ? worker_->pid() : -1;
}

void WorkerSupervisor::drain_stderr(int fd, pid_t pid) {
    std::string pending;
    char chunk[4096];
    while (draining_) {
        struct pollfd pfd{fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(chunk, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            log::logger()->debug("[worker {}] {}", pid, pending.substr(0, nl));
            pending.erase(0, nl + 1);
        }
    }
    if (!pending.empty()) {
        log::logger()->debug("[worker {}] {}", pid, pending);
    }
}

nlohmann::ordered_json WorkerSupervisor::execute(const std::string& tool_name,
                                                 const nlohmann::json& arguments,
                                                 const std::filesystem::path& working_dir,
                                                 std::chrono::milliseconds timeout) {
    std::string encoded = arguments.dump();
    if (encoded.size() > opts_.max_argument_bytes) {
        throw ValidationError("Argument too large");
    }

    std::vector<std::string> args = opts_.engine.args;
    args.push_back(tool_name);
    args.push_back(std::move(encoded));
    args.push_back(working_dir.string());

    Subprocess proc(opts_.engine.program, std::move(args));
    try {
        proc.spawn();
    } catch (const ProcessError& e) {
        log::logger()->error("Engine spawn failed for {}: {}", tool_name, e.what());
        throw EngineError(message::EngineNotStarted);
    }

    auto out = proc.communicate(timeout);
    if (out.timed_out) {
        log::logger()->warn("Engine call {} timed out after {} ms (pid {})",
                            tool_name, timeout.count(), proc.pid());
        throw EngineTimeoutError(message::EngineTimedOut);
    }
    if (out.exit_code != 0) {
        log::logger()->warn("Engine call {} exited with {}: {}",
                            tool_name, out.exit_code, log::excerpt(trim(out.stderr_text), 2000));
        throw EngineError(message::EngineFailed);
    }

    std::string stdout_text = trim(out.stdout_text);
    try {
        return nlohmann::ordered_json::parse(stdout_text);
    } catch (const nlohmann::json::parse_error&) {
        log::logger()->debug("Engine call {} produced non-JSON output", tool_name);
        return nlohmann::ordered_json{{"output", to_valid_utf8(stdout_text)},
                                      {"stderr", to_valid_utf8(trim(out.stderr_text))}};
    }
}

} // namespace metamcp
