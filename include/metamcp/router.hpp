#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace metamcp {

/// A handler returns either the result payload or a JSON-RPC error.
/// Throwing McpProtocolError is equivalent to returning its code and message.
using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;

/// Method table for incoming requests.
/// Handlers are registered once during setup; dispatch() is then safe to
/// call from several threads at once.
class Router {
public:
    void on_request(const std::string& method, RequestHandler handler);

    /// Requests always produce a response. Notifications are acknowledged
    /// by silence, and responses are never routed.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    JsonRpcResponse invoke(const JsonRpcRequest& req, const RequestHandler& handler) const;

    std::map<std::string, RequestHandler> handlers_;
};

} // namespace metamcp
