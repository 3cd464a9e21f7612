#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <thread>
#include <mutex>
#include <queue>
#include <condition_variable>

namespace metamcp {

/// Newline-delimited JSON over a pair of file descriptors.
/// Each line is one message; lines that fail to parse are logged and dropped.
/// The read loop ends on end of input or shutdown(); queued writes are
/// flushed by a background writer thread before it exits.
class StdioTransport : public ITransport {
public:
    /// Use the process stdin/stdout.
    StdioTransport();

    /// Use the given descriptors. When owns_fds is set they are closed
    /// by the destructor.
    StdioTransport(int read_fd, int write_fd, bool owns_fds = true);

    ~StdioTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(std::string line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace metamcp
