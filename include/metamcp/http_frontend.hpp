#pragma once
#include "dispatcher.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Keep httplib out of public headers
namespace httplib {
    class Server;
}

namespace metamcp {

/// HTTP front-end over a ToolDispatcher.
///   POST <path>   one JSON-RPC request in the body, its response envelope back
///   GET  /health  liveness probe
/// Each POST is answered synchronously on the httplib worker thread.
class HttpFrontend {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;          // 0 binds an ephemeral port
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;
    };

    HttpFrontend(ToolDispatcher& dispatcher, Options opts);
    ~HttpFrontend();

    HttpFrontend(const HttpFrontend&) = delete;
    HttpFrontend& operator=(const HttpFrontend&) = delete;

    /// Bind the listening socket and return the bound port.
    /// Throws McpTransportError if the address is unavailable.
    uint16_t bind();

    /// Bind if needed and serve until stop(). Blocks.
    void listen();

    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

private:
    void setup_routes();
    bool validate_origin(const std::string& origin) const;

    ToolDispatcher& dispatcher_;
    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> bound_{false};
    uint16_t bound_port_ = 0;
};

} // namespace metamcp
