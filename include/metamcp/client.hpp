#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <string>
#include <vector>
#include <chrono>

namespace metamcp {

/// Request/response client for a tool host over any transport.
/// Requests are correlated by id; responses for unknown ids are dropped.
class ToolClient {
public:
    struct Options {
        std::chrono::milliseconds request_timeout{30000};
    };

    ToolClient();
    explicit ToolClient(Options opts);
    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    /// Take ownership of the transport and start reading on a background thread.
    void connect(std::unique_ptr<ITransport> transport);

    /// Shut the transport down and join the reader. Safe to call repeatedly.
    void disconnect();

    /// Throws McpProtocolError on an error envelope, McpTimeoutError when no
    /// response arrives in time and McpTransportError when the peer is gone.
    [[nodiscard]] std::vector<ToolDefinition> list_tools();
    [[nodiscard]] CallToolResult call_tool(const std::string& name,
                                           const nlohmann::json& arguments = nlohmann::json::object());

    [[nodiscard]] bool is_connected() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace metamcp
