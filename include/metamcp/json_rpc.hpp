#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace metamcp {

/// JSON-RPC ids are integers or strings; null ids never reach this type.
using RequestId = std::variant<int64_t, std::string>;

void to_json(nlohmann::json& j, const RequestId& id);
/// Throws std::invalid_argument for anything but an integer or a string.
void from_json(const nlohmann::json& j, RequestId& id);

/// Stable string key for correlating responses with pending requests.
/// Integer 1 and string "1" map to different keys.
std::string request_id_key(const RequestId& id);

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is set on every response we emit.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

/// Every envelope is written with "jsonrpc":"2.0", whether or not the
/// peer sent one.
void to_json(nlohmann::json& j, const JsonRpcMessage& m);

JsonRpcResponse make_result_response(const RequestId& id, nlohmann::json result);
JsonRpcResponse make_error_response(const RequestId& id, int code, std::string message);

} // namespace metamcp
