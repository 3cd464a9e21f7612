#include <gtest/gtest.h>
#include "metamcp/codec.hpp"
#include "metamcp/error.hpp"

using namespace metamcp;

// ---- Parse tests ----

TEST(CodecParse, RequestWithoutJsonrpcField) {
    auto msg = Codec::parse(R"({"id":1,"method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_FALSE(req.params.has_value());
}

TEST(CodecParse, RequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"call-7","method":"tools/call"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "call-7");
}

TEST(CodecParse, ToolCallParams) {
    auto msg = Codec::parse(
        R"({"id":3,"method":"tools/call","params":{"name":"health_check","arguments":{"detailed":false}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "health_check");
    EXPECT_EQ(req.params->at("arguments").at("detailed"), false);
}

TEST(CodecParse, SuccessResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
}

TEST(CodecParse, ErrorResponse) {
    auto msg = Codec::parse(R"({"id":2,"error":{"code":-32601,"message":"Unknown tool: bogus_tool"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Unknown tool: bogus_tool");
}

TEST(CodecParse, Notification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
}

TEST(CodecParse, Unicode) {
    auto msg = Codec::parse(R"({"id":1,"method":"tools/call","params":{"name":"café"}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.params->at("name").get<std::string>(), "caf\xc3\xa9");
}

TEST(CodecParse, Rejects) {
    EXPECT_THROW(Codec::parse(""), McpParseError);
    EXPECT_THROW(Codec::parse("{invalid json"), McpParseError);
    EXPECT_THROW(Codec::parse("[1,2,3]"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"tools/list"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"id":null,"method":"tools/list"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":5})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"id":true,"method":"tools/list"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"params":{}})"), McpParseError);
}

TEST(CodecParse, ResponseNeedsExactlyOneOutcome) {
    EXPECT_THROW(Codec::parse(R"({"id":1})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"id":1,"result":{},"error":{"code":1,"message":"x"}})"),
                 McpParseError);
}

TEST(CodecParse, TrailingContent) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"tools/list"} {"id":2})"), McpParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, ResponseCarriesVersionAndResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = nlohmann::json{{"tools", nlohmann::json::array()}};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j.at("jsonrpc"), "2.0");
    EXPECT_EQ(j.at("id"), 1);
    EXPECT_TRUE(j.contains("result"));
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseOmitsResult) {
    auto resp = make_error_response(RequestId{std::string("x")}, error::MethodNotFound,
                                    "Method not found: foo");
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j.at("id"), "x");
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j.at("error").at("code"), -32601);
    EXPECT_EQ(j.at("error").at("message"), "Method not found: foo");
}

TEST(CodecSerialize, SingleLine) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{9}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "generate_report"},
                                {"arguments", {{"format", "html"}, {"session_id", "s"}}}};
    std::string out = Codec::serialize(req);
    EXPECT_EQ(out.find('\n'), std::string::npos);

    auto parsed = Codec::parse(out);
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(parsed));
    EXPECT_EQ(std::get<JsonRpcRequest>(parsed), req);
}
