#include "metamcp/shutdown.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"
#include <pthread.h>
#include <cstring>
#include <string>

namespace metamcp {

ShutdownSignals::ShutdownSignals(std::function<void(int)> on_signal)
    : on_signal_(std::move(on_signal)) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    if (int err = pthread_sigmask(SIG_BLOCK, &signals_, nullptr)) {
        throw McpError(std::string("Failed to block shutdown signals: ") + std::strerror(err));
    }
    ::signal(SIGPIPE, SIG_IGN);
    waiter_ = std::thread([this] { wait_loop(); });
}

ShutdownSignals::~ShutdownSignals() {
    done_ = true;
    // Wake the waiter with a signal aimed at it alone
    pthread_kill(waiter_.native_handle(), SIGTERM);
    waiter_.join();
}

void ShutdownSignals::wait_loop() {
    int sig = 0;
    if (sigwait(&signals_, &sig) != 0 || done_) return;
    received_ = sig;
    log::logger()->info("Received signal {}, shutting down", sig);
    try {
        on_signal_(sig);
    } catch (const std::exception& e) {
        log::logger()->error("Shutdown handler failed: {}", e.what());
    }
}

} // namespace metamcp
