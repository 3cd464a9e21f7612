#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace metamcp {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const {
        return text == o.text;
    }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

/// Tool failures are reported as {"status": "error", ...} text, so the
/// result never carries isError.
struct CallToolResult {
    std::vector<TextContent> content;

    bool operator==(const CallToolResult& o) const {
        return content == o.content;
    }
};

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

/// Serialize a document for the text content of a tool result.
/// Uses ", " and ": " separators, keeps member order and escapes every
/// non-ASCII character, so {"status":"ok"} renders as {"status": "ok"}.
/// Invalid UTF-8 in strings becomes \ufffd instead of throwing.
[[nodiscard]] std::string to_display_text(const nlohmann::ordered_json& j);

/// Copy of s with every invalid UTF-8 sequence replaced by U+FFFD.
[[nodiscard]] std::string to_valid_utf8(const std::string& s);

} // namespace metamcp
