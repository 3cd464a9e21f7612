#pragma once
#include "client.hpp"
#include "supervisor.hpp"
#include <optional>

namespace metamcp {

/// One worker lifetime: start on construction, stop on destruction.
///
///     ClientSession session(supervisor);
///     auto result = session.call("health_check", {{"detailed", false}});
///
/// The worker is stopped even when the call throws.
class ClientSession {
public:
    struct Options {
        std::chrono::milliseconds request_timeout{30000};
    };

    /// Runs ensure_started() and connects to the worker pipes.
    /// Throws ProcessError if the worker cannot be spawned.
    ClientSession(WorkerSupervisor& supervisor, Options opts);
    explicit ClientSession(WorkerSupervisor& supervisor);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    /// List the worker's tools and, if `name` is among them, call it once.
    /// Returns nullopt when the tool is not offered.
    std::optional<CallToolResult> call(const std::string& name,
                                       const nlohmann::json& arguments = nlohmann::json::object());

    [[nodiscard]] ToolClient& client() noexcept { return client_; }

private:
    void close() noexcept;

    WorkerSupervisor& supervisor_;
    ToolClient client_;
};

} // namespace metamcp
