#pragma once
#include <atomic>
#include <functional>
#include <thread>
#include <signal.h>

namespace metamcp {

/// Runs a callback on a dedicated thread when SIGINT or SIGTERM arrives.
///
/// The constructor blocks both signals in the calling thread, so it must run
/// before any other thread is started: threads created afterwards inherit
/// the mask and the signal can only be taken by the waiting thread. The
/// callback therefore runs in normal thread context and may lock mutexes.
/// SIGPIPE is ignored process-wide so a vanished peer shows up as EPIPE.
class ShutdownSignals {
public:
    explicit ShutdownSignals(std::function<void(int)> on_signal);
    ~ShutdownSignals();

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

    /// Number of the signal that triggered the callback, or 0.
    [[nodiscard]] int received() const noexcept { return received_; }

private:
    void wait_loop();

    sigset_t signals_;
    std::function<void(int)> on_signal_;
    std::atomic<bool> done_{false};
    std::atomic<int> received_{0};
    std::thread waiter_;
};

} // namespace metamcp
