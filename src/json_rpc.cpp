#include "metamcp/json_rpc.hpp"
#include "metamcp/version.hpp"
#include <stdexcept>

namespace metamcp {

void to_json(nlohmann::json& j, const RequestId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) {
        j = *n;
    } else {
        j = std::get<std::string>(id);
    }
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("Request id must be an integer or a string");
    }
}

std::string request_id_key(const RequestId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) return "n:" + std::to_string(*n);
    return "s:" + std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    j.at("code").get_to(e.code);
    j.at("message").get_to(e.message);
    auto data = j.find("data");
    if (data != j.end()) e.data = *data;
}

namespace {

nlohmann::json envelope() {
    return {{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

// RequestId is a std::variant, so ADL never finds our to_json for it.
nlohmann::json id_json(const RequestId& id) {
    nlohmann::json j;
    to_json(j, id);
    return j;
}

nlohmann::json encode(const JsonRpcRequest& r) {
    auto j = envelope();
    j["id"] = id_json(r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
    return j;
}

nlohmann::json encode(const JsonRpcResponse& r) {
    auto j = envelope();
    j["id"] = id_json(r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
    return j;
}

nlohmann::json encode(const JsonRpcNotification& n) {
    auto j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
    return j;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    j = std::visit([](const auto& v) { return encode(v); }, m);
}

JsonRpcResponse make_result_response(const RequestId& id, nlohmann::json result) {
    return JsonRpcResponse{id, std::move(result), std::nullopt};
}

JsonRpcResponse make_error_response(const RequestId& id, int code, std::string message) {
    return JsonRpcResponse{id, std::nullopt, JsonRpcError{code, std::move(message), std::nullopt}};
}

} // namespace metamcp
