#include <gtest/gtest.h>
#include "metamcp/router.hpp"
#include "metamcp/error.hpp"
#include <string>

using namespace metamcp;

namespace {

JsonRpcRequest make_request(const std::string& method, int64_t id = 1) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = method;
    return req;
}

const JsonRpcResponse& as_response(const std::optional<JsonRpcMessage>& msg) {
    return std::get<JsonRpcResponse>(*msg);
}

} // namespace

TEST(Router, DispatchKnownRequestEchoesId) {
    Router router;
    nlohmann::json seen;
    router.on_request("tools/list", [&seen](const nlohmann::json& params) -> HandlerResult {
        seen = params;
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });

    auto response = router.dispatch(make_request("tools/list", 17));
    ASSERT_TRUE(response.has_value());
    auto& resp = as_response(response);
    EXPECT_EQ(std::get<int64_t>(resp.id), 17);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
    // Absent params arrive as an empty object
    EXPECT_EQ(seen, nlohmann::json::object());
}

TEST(Router, UnknownMethodIsMethodNotFound) {
    Router router;
    auto response = router.dispatch(make_request("resources/list"));
    ASSERT_TRUE(response.has_value());
    auto& resp = as_response(response);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_FALSE(resp.result.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Method not found: resources/list");
}

TEST(Router, NotificationsProduceNoResponse) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        ADD_FAILURE() << "notification must not reach a request handler";
        return nlohmann::json::object();
    });

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    EXPECT_FALSE(router.dispatch(notif).has_value());

    notif.method = "tools/list";
    EXPECT_FALSE(router.dispatch(notif).has_value());
}

TEST(Router, HandlerErrorResult) {
    Router router;
    router.on_request("tools/call", [](const nlohmann::json&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "Parameter 'name' must be a string", std::nullopt};
    });

    auto response = router.dispatch(make_request("tools/call"));
    auto& resp = as_response(response);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
}

TEST(Router, ProtocolErrorKeepsCode) {
    Router router;
    router.on_request("tools/call", [](const nlohmann::json&) -> HandlerResult {
        throw McpProtocolError(error::InvalidParams, "Bad params");
    });

    auto response = router.dispatch(make_request("tools/call"));
    auto& resp = as_response(response);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Bad params");
}

TEST(Router, OtherExceptionsBecomeInternalError) {
    Router router;
    router.on_request("tools/call", [](const nlohmann::json&) -> HandlerResult {
        throw std::runtime_error("disk on fire");
    });

    auto response = router.dispatch(make_request("tools/call"));
    auto& resp = as_response(response);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InternalError);
    // Internal details stay in the log
    EXPECT_EQ(resp.error->message, "Internal error");
}

TEST(Router, ResponsesAreNotRouted) {
    Router router;
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{1}};
    resp.result = nlohmann::json::object();
    EXPECT_FALSE(router.dispatch(resp).has_value());
}

TEST(Router, HasHandler) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    EXPECT_TRUE(router.has_handler("tools/list"));
    EXPECT_FALSE(router.has_handler("tools/call"));
}
