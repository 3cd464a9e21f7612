#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "sessions.hpp"
#include "supervisor.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace metamcp {

/// Hosts a ToolDispatcher on a transport. Requests are answered one at a
/// time in arrival order; serve() returns when the input ends or
/// shutdown() is called.
class ToolServer {
public:
    struct Options {
        std::filesystem::path sessions_root;
        WorkerSupervisor::Options supervisor;
        ToolDispatcher::Options dispatcher;
    };

    explicit ToolServer(Options opts);
    explicit ToolServer(const Config& cfg);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void shutdown();

    [[nodiscard]] bool is_running() const;

    [[nodiscard]] ToolDispatcher& dispatcher() noexcept { return dispatcher_; }
    [[nodiscard]] const SessionPathResolver& sessions() const noexcept { return sessions_; }

    static Options options_from(const Config& cfg);

private:
    Options opts_;
    SessionPathResolver sessions_;
    WorkerSupervisor supervisor_;
    ToolDispatcher dispatcher_;

    std::atomic<bool> running_{false};
    std::mutex transport_mutex_;
    ITransport* transport_ = nullptr;
};

} // namespace metamcp
