#include "metamcp/process.hpp"
#include "metamcp/error.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>

namespace metamcp {

namespace {

using Clock = std::chrono::steady_clock;

// Writes to a pipe whose reader died must fail with EPIPE, not kill us.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

} // anonymous namespace

Subprocess::Subprocess(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)) {
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !exit_code_) {
        signal_group(SIGKILL);
        reap(true);
    }
    close_fds();
}

void Subprocess::spawn() {
    if (pid_ > 0) {
        throw ProcessError("Process already spawned: " + program_);
    }
    ignore_sigpipe_once();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // reports exec failure errno back to the parent

    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0
        || ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_all();
        throw ProcessError(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args_.size() + 1);
    argv_storage.push_back(program_);
    argv_storage.insert(argv_storage.end(), args_.begin(), args_.end());
    std::vector<char*> argv_vec;
    argv_vec.reserve(argv_storage.size() + 1);
    for (auto& a : argv_storage) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw ProcessError(std::string("Failed to fork process: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(argv_vec[0], argv_vec.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(pid, pid);

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        reap(true);
        close_fds();
        throw ProcessError("Failed to execute " + program_ + ": " + std::strerror(child_errno));
    }
}

Subprocess::Output Subprocess::communicate(std::chrono::milliseconds timeout) {
    Output out;
    const auto deadline = Clock::now() + timeout;
    close_stdin();

    char chunk[4096];
    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int* owners[2];
        std::string* sinks[2];
        if (stdout_fd_ >= 0) {
            fds[nfds] = {stdout_fd_, POLLIN, 0};
            owners[nfds] = &stdout_fd_;
            sinks[nfds] = &out.stdout_text;
            ++nfds;
        }
        if (stderr_fd_ >= 0) {
            fds[nfds] = {stderr_fd_, POLLIN, 0};
            owners[nfds] = &stderr_fd_;
            sinks[nfds] = &out.stderr_text;
            ++nfds;
        }

        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) break;

        int ret = ::poll(fds, nfds, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) break;   // deadline

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                sinks[i]->append(chunk, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(*owners[i]);
            }
        }
    }

    if (stdout_fd_ < 0 && stderr_fd_ < 0) {
        if (auto code = wait_for(std::chrono::milliseconds(remaining_ms(deadline)))) {
            out.exit_code = *code;
            return out;
        }
    }

    out.timed_out = true;
    signal_group(SIGKILL);
    reap(true);
    close_fds();
    out.exit_code = exit_code_.value_or(-SIGKILL);
    return out;
}

bool Subprocess::is_running() {
    if (pid_ <= 0 || exit_code_) return false;
    return !reap(false);
}

std::optional<int> Subprocess::wait_for(std::chrono::milliseconds timeout) {
    if (pid_ <= 0) return std::nullopt;
    const auto deadline = Clock::now() + timeout;
    while (!exit_code_) {
        if (reap(false)) break;
        if (Clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return exit_code_;
}

std::pair<int, bool> Subprocess::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0) return {0, false};
    if (exit_code_) return {*exit_code_, false};

    signal_group(SIGTERM);
    if (auto code = wait_for(grace)) {
        return {*code, false};
    }
    signal_group(SIGKILL);
    reap(true);
    return {exit_code_.value_or(-SIGKILL), true};
}

void Subprocess::close_stdin() {
    close_fd(stdin_fd_);
}

void Subprocess::signal_group(int sig) {
    if (pid_ <= 0 || exit_code_) return;
    if (::kill(-pid_, sig) != 0) {
        ::kill(pid_, sig);
    }
}

bool Subprocess::reap(bool block) {
    if (exit_code_) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exit_code_ = decode_status(status);
        return true;
    }
    if (r < 0) {
        // ECHILD: someone else reaped it; treat as gone.
        exit_code_ = -1;
        return true;
    }
    return false;
}

void Subprocess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

} // namespace metamcp
