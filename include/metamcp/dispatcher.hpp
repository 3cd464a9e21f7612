#pragma once
#include "executor.hpp"
#include "router.hpp"
#include "sessions.hpp"
#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace metamcp {

/// Answers tools/list and tools/call. Every other method is rejected with
/// MethodNotFound by the underlying Router.
///
/// Tool-level failures never become JSON-RPC errors: they are returned as
/// ordinary results whose text is {"status": "error", "message": ...}.
class ToolDispatcher {
public:
    struct Options {
        std::chrono::milliseconds call_timeout{30000};
    };

    ToolDispatcher(IToolExecutor& executor, const SessionPathResolver& sessions, Options opts);
    ToolDispatcher(IToolExecutor& executor, const SessionPathResolver& sessions);

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    /// Handle one incoming message. Returns the response for requests.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    /// Run one tool call and wrap the outcome. Unknown tools are the
    /// caller's responsibility; this is reached only for registered names.
    CallToolResult call_tool(const std::string& name, const nlohmann::json& arguments);

    /// Sessions with a call in flight.
    [[nodiscard]] std::size_t tracked_sessions();

private:
    void register_handlers();
    std::shared_ptr<std::mutex> session_lock(const std::string& session_id);
    void release_session_lock(const std::string& session_id);

    IToolExecutor& executor_;
    const SessionPathResolver& sessions_;
    Options opts_;
    Router router_;

    std::mutex session_locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace metamcp
