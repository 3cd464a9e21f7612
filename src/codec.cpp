#include "metamcp/codec.hpp"
#include "metamcp/error.hpp"
#include "metamcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <optional>
#include <string>

namespace metamcp {

namespace {

// Tool arguments are shallow; anything deeper than this is hostile input.
constexpr int kMaxDepth = 64;

[[noreturn]] void fail(const char* what, simdjson::error_code code) {
    throw McpParseError(std::string(what) + simdjson::error_message(code));
}

nlohmann::json number_of(simdjson::ondemand::value& val) {
    simdjson::ondemand::number num;
    if (val.get_number().get(num) != simdjson::SUCCESS) {
        // Integers beyond 64 bits: keep the magnitude, lose precision.
        return val.get_double().value();
    }
    switch (num.get_number_type()) {
        case simdjson::ondemand::number_type::signed_integer:
            return num.get_int64();
        case simdjson::ondemand::number_type::unsigned_integer:
            return num.get_uint64();
        default:
            return num.get_double();
    }
}

nlohmann::json to_document(simdjson::ondemand::value val, int depth) {
    if (depth > kMaxDepth) {
        throw McpParseError("JSON nesting too deep");
    }
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            auto out = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string key(field.unescaped_key().value());
                out[std::move(key)] = to_document(field.value(), depth + 1);
            }
            return out;
        }
        case simdjson::ondemand::json_type::array: {
            auto out = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                out.push_back(to_document(elem.value(), depth + 1));
            }
            return out;
        }
        case simdjson::ondemand::json_type::string:
            return std::string(val.get_string().value());
        case simdjson::ondemand::json_type::number:
            return number_of(val);
        case simdjson::ondemand::json_type::boolean:
            return val.get_bool().value();
        default:
            return nullptr;
    }
}

std::optional<nlohmann::json> member(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return *it;
}

RequestId id_of(const nlohmann::json& id, const char* kind) {
    if (id.is_null()) {
        throw McpParseError(std::string(kind) + " ID must not be null");
    }
    RequestId out;
    from_json(id, out);
    return out;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (auto version = member(j, "jsonrpc")) {
        if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
            throw McpParseError("Invalid jsonrpc version, expected '2.0'");
        }
    }

    auto id = member(j, "id");
    auto method = member(j, "method");

    if (method) {
        if (!method->is_string()) {
            throw McpParseError("'method' must be a string");
        }
        if (id) {
            JsonRpcRequest req{id_of(*id, "Request"), method->get<std::string>(),
                               member(j, "params")};
            return req;
        }
        return JsonRpcNotification{method->get<std::string>(), member(j, "params")};
    }

    if (!id) {
        throw McpParseError("Cannot determine message type: missing both 'id' and 'method'");
    }
    JsonRpcResponse resp;
    resp.id = id_of(*id, "Response");
    resp.result = member(j, "result");
    if (auto err = member(j, "error")) resp.error = err->get<JsonRpcError>();
    if (resp.result.has_value() == resp.error.has_value()) {
        throw McpParseError("Response must carry exactly one of 'result' or 'error'");
    }
    return resp;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // One parser per thread; the stdio reader and httplib workers each reuse theirs.
    thread_local simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    nlohmann::json j;
    try {
        simdjson::ondemand::document doc;
        if (auto ec = parser.iterate(padded).get(doc)) fail("JSON parse error: ", ec);

        simdjson::ondemand::value root;
        if (auto ec = doc.get_value().get(root)) fail("JSON parse error: ", ec);

        j = to_document(root, 0);
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON document");
        }
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }

    try {
        return parse_object(j);
    } catch (const nlohmann::json::exception& e) {
        throw McpParseError(std::string("Malformed message: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw McpParseError(std::string("Malformed message: ") + e.what());
    }
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace metamcp
