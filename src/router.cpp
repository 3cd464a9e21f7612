#include "metamcp/router.hpp"
#include "metamcp/error.hpp"
#include "metamcp/log.hpp"

namespace metamcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return handlers_.find(method) != handlers_.end();
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) const {
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        log::logger()->debug("Ignoring notification {}", notif->method);
        return std::nullopt;
    }
    const auto* req = std::get_if<JsonRpcRequest>(&msg);
    if (!req) {
        log::logger()->debug("Ignoring unsolicited response");
        return std::nullopt;
    }

    auto it = handlers_.find(req->method);
    if (it == handlers_.end()) {
        return make_error_response(req->id, error::MethodNotFound,
                                   "Method not found: " + req->method);
    }
    return invoke(*req, it->second);
}

JsonRpcResponse Router::invoke(const JsonRpcRequest& req, const RequestHandler& handler) const {
    const nlohmann::json params = req.params.value_or(nlohmann::json::object());
    try {
        auto result = handler(params);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            return JsonRpcResponse{req.id, std::nullopt, std::move(*err)};
        }
        return make_result_response(req.id, std::get<nlohmann::json>(std::move(result)));
    } catch (const McpProtocolError& e) {
        return make_error_response(req.id, e.code, e.what());
    } catch (const std::exception& e) {
        // Internal details stay in the log
        log::logger()->error("Handler for {} failed: {}", req.method, e.what());
        return make_error_response(req.id, error::InternalError, "Internal error");
    }
}

} // namespace metamcp
