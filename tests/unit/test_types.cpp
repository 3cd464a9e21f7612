#include <gtest/gtest.h>
#include "metamcp/types.hpp"

using namespace metamcp;
using json = nlohmann::json;

TEST(DisplayText, SpacedSeparators) {
    EXPECT_EQ(to_display_text(json::parse(R"({"status":"ok"})")), R"({"status": "ok"})");
    EXPECT_EQ(to_display_text(json::parse(R"({"a":[1,2,{"b":null}],"c":true})")),
              R"({"a": [1, 2, {"b": null}], "c": true})");
    EXPECT_EQ(to_display_text(json::object()), "{}");
    EXPECT_EQ(to_display_text(json::array()), "[]");
}

TEST(DisplayText, EscapesNonAscii) {
    EXPECT_EQ(to_display_text(json{{"name", "caf\xc3\xa9"}}), R"({"name": "caf\u00e9"})");
    EXPECT_EQ(to_display_text(json{{"msg", "line\nbreak \"q\""}}),
              R"({"msg": "line\nbreak \"q\""})");
}

TEST(DisplayText, ParsesBackToSameDocument) {
    json doc = {{"status", "success"}, {"estimate", 0.25}, {"studies", {"A", "B"}},
                {"nested", {{"k", -3}}}};
    EXPECT_EQ(json::parse(to_display_text(doc)), doc);
}

TEST(DisplayText, KeepsMemberOrder) {
    auto doc = nlohmann::ordered_json::parse(R"({"status":"ok","analysis":{"z":1,"a":2}})");
    EXPECT_EQ(to_display_text(doc), R"({"status": "ok", "analysis": {"z": 1, "a": 2}})");
}

TEST(DisplayText, ReplacesInvalidUtf8) {
    EXPECT_EQ(to_display_text(json{{"output", "caf\xe9 result"}}),
              R"({"output": "caf\ufffd result"})");
    EXPECT_EQ(to_display_text(json{{"bad\xfc", 1}}), R"({"bad\ufffd": 1})");
}

TEST(ValidUtf8, ReplacesOnlyInvalidBytes) {
    EXPECT_EQ(to_valid_utf8("Warnung: \xfc" "berlauf"), "Warnung: \xEF\xBF\xBD" "berlauf");
    EXPECT_EQ(to_valid_utf8("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(to_valid_utf8(""), "");
    EXPECT_NO_THROW((void)json(to_valid_utf8("\xff\xfe")).dump());
}

TEST(CallToolResult, SerializesTextContent) {
    CallToolResult result;
    result.content.push_back(TextContent{R"({"status": "ok"})"});
    json j = result;
    EXPECT_EQ(j, json::parse(R"({"content":[{"type":"text","text":"{\"status\": \"ok\"}"}]})"));
    EXPECT_FALSE(j.contains("isError"));

    auto back = j.get<CallToolResult>();
    EXPECT_EQ(back, result);
}

TEST(CallToolResult, RejectsNonTextContent) {
    json j = {{"content", {{{"type", "image"}, {"data", "..."}}}}};
    EXPECT_THROW(j.get<CallToolResult>(), std::invalid_argument);
}

TEST(ToolDefinition, UsesInputSchemaKey) {
    ToolDefinition def{"health_check", std::string("Check"), {{"type", "object"}}};
    json j = def;
    EXPECT_EQ(j.at("inputSchema").at("type"), "object");
    EXPECT_EQ(j.get<ToolDefinition>(), def);
}
