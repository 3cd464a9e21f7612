#include "metamcp/transport/stdio_transport.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string_view>

namespace metamcp {

namespace {

constexpr size_t kReadChunk = 4096;

// Write the whole buffer, retrying short writes. Returns errno on failure, 0 on success.
int write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return 0;
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start() means there is nothing to run
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    // CLOEXEC so engine subprocesses never inherit the wakeup pipe
    if (::pipe2(wakeup_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        running_ = false;
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_message, on_error);

    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string pending;
    char chunk[kReadChunk];

    auto emit_complete_lines = [&] {
        size_t start = 0;
        for (size_t nl; (nl = pending.find('\n', start)) != std::string::npos; start = nl + 1) {
            handle_line(pending.substr(start, nl - start), on_message, on_error);
        }
        pending.erase(0, start);
    };

    pollfd fds[2] = {{read_fd_, POLLIN, 0}, {wakeup_pipe_[0], POLLIN, 0}};

    while (running_) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            log::logger()->error("Transport poll failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) break;
        // A closed writer shows up as POLLHUP without POLLIN
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            pending.append(chunk, static_cast<size_t>(n));
            emit_complete_lines();
            continue;
        }
        if (n == 0) {
            // A final line without newline still counts
            if (!pending.empty()) handle_line(std::move(pending), on_message, on_error);
            log::logger()->debug("Transport input closed");
            break;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        if (!running_) break;

        std::string reason = std::strerror(errno);
        log::logger()->error("Transport read failed: {}", reason);
        if (on_error) {
            on_error(std::make_exception_ptr(McpTransportError("Read error: " + reason)));
        }
        break;
    }
}

void StdioTransport::handle_line(std::string line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) return;

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const McpParseError& e) {
        log::logger()->warn("Dropping malformed line ({}): {}", e.what(), log::excerpt(line));
        if (on_error) on_error(std::current_exception());
        return;
    }
    on_message(std::move(msg));
}

void StdioTransport::write_loop() {
    for (;;) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });
            // Drain everything queued before stopping
            if (write_queue_.empty()) return;
            line = std::move(write_queue_.front());
            write_queue_.pop();
        }
        line.push_back('\n');
        if (int err = write_all(write_fd_, line)) {
            log::logger()->error("Transport write failed: {}", std::strerror(err));
            connected_ = false;
            return;
        }
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are drained once write_loop() runs.
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            log::logger()->debug("Wakeup write failed: {}", std::strerror(errno));
        }
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) {
        write_cv_.notify_all();
        return;
    }
    connected_ = false;
    write_cv_.notify_all();
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace metamcp
