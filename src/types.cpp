#include "metamcp/types.hpp"
#include <stdexcept>

namespace metamcp {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    const std::string type = j.at("type").get<std::string>();
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.value("inputSchema", nlohmann::json::object());
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        j["content"].push_back(nlohmann::json(c));
    }
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            t.content.push_back(cj.get<TextContent>());
        }
    }
}

// ---------- Display text ----------

namespace {

constexpr auto kReplace = nlohmann::ordered_json::error_handler_t::replace;

void append_display_text(std::string& out, const nlohmann::ordered_json& j) {
    if (j.is_object()) {
        out += '{';
        bool first = true;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!first) out += ", ";
            first = false;
            out += nlohmann::ordered_json(it.key()).dump(-1, ' ', true, kReplace);
            out += ": ";
            append_display_text(out, it.value());
        }
        out += '}';
    } else if (j.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : j) {
            if (!first) out += ", ";
            first = false;
            append_display_text(out, item);
        }
        out += ']';
    } else {
        out += j.dump(-1, ' ', true, kReplace);
    }
}

} // anonymous namespace

std::string to_display_text(const nlohmann::ordered_json& j) {
    std::string out;
    append_display_text(out, j);
    return out;
}

std::string to_valid_utf8(const std::string& s) {
    auto escaped = nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(escaped).get<std::string>();
}

} // namespace metamcp
