#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace metamcp {

class Codec {
public:
    /// Parse one wire line into a message.
    /// The "jsonrpc" member is optional; when present it must be "2.0".
    /// Throws McpParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace metamcp
