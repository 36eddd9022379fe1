#include <gtest/gtest.h>
#include "devagent/router.hpp"
#include "devagent/error.hpp"
#include "test_helpers.hpp"
#include <string>

using namespace devagent;
using devagent::test::quiet_logger;

namespace {

JsonRpcRequest make_request(const std::string& method, nlohmann::json params = nullptr) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = method;
    if (!params.is_null()) req.params = std::move(params);
    return req;
}

} // namespace

TEST(Router, DispatchKnownRequest) {
    Router router(quiet_logger());
    bool called = false;
    router.on_request("ping", [&called](const nlohmann::json&, const RequestId&) -> HandlerResult {
        called = true;
        return nlohmann::json::object();
    });

    auto response = router.dispatch(make_request("ping"));
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(called);
    EXPECT_FALSE(response->error.has_value());
    EXPECT_EQ(std::get<int64_t>(response->id), 1);
}

TEST(Router, HandlerSeesParamsAndId) {
    Router router(quiet_logger());
    router.on_request("echo", [](const nlohmann::json& params, const RequestId& id) -> HandlerResult {
        return nlohmann::json{{"params", params}, {"id", request_id_to_string(id)}};
    });

    JsonRpcRequest req;
    req.id = RequestId{std::string("req-9")};
    req.method = "echo";
    req.params = nlohmann::json{{"x", 1}};
    auto response = router.dispatch(req);
    ASSERT_TRUE(response->result.has_value());
    EXPECT_EQ((*response->result)["params"]["x"], 1);
    EXPECT_EQ((*response->result)["id"], "req-9");
    EXPECT_EQ(std::get<std::string>(response->id), "req-9");
}

TEST(Router, MissingParamsBecomeEmptyObject) {
    Router router(quiet_logger());
    router.on_request("check", [](const nlohmann::json& params, const RequestId&) -> HandlerResult {
        return nlohmann::json{{"isObject", params.is_object()}, {"empty", params.empty()}};
    });
    auto response = router.dispatch(make_request("check"));
    EXPECT_TRUE((*response->result)["isObject"].get<bool>());
    EXPECT_TRUE((*response->result)["empty"].get<bool>());
}

TEST(Router, DispatchUnknownMethod) {
    Router router(quiet_logger());
    auto response = router.dispatch(make_request("unknown/method"));
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::MethodNotFound);
    EXPECT_EQ(response->error->message, "Unknown method: unknown/method");
}

TEST(Router, HandlerReturnedError) {
    Router router(quiet_logger());
    router.on_request("fail", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "name is required", std::nullopt};
    });
    auto response = router.dispatch(make_request("fail"));
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::InvalidParams);
    EXPECT_EQ(response->error->message, "name is required");
}

TEST(Router, ProtocolErrorKeepsCodeAndData) {
    Router router(quiet_logger());
    router.on_request("limited", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
        throw ProtocolError(error::ToolExecutionError, "Rate limit exceeded",
                            nlohmann::json{{"details", {{"retryAfter", 2}}}});
    });
    auto response = router.dispatch(make_request("limited"));
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, -32001);
    EXPECT_EQ(response->error->message, "Rate limit exceeded");
    ASSERT_TRUE(response->error->data.has_value());
    EXPECT_EQ((*response->error->data)["details"]["retryAfter"], 2);
}

TEST(Router, StdExceptionBecomesInternalError) {
    Router router(quiet_logger());
    router.on_request("throws", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
        throw std::runtime_error("unexpected");
    });
    auto response = router.dispatch(make_request("throws"));
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::InternalError);
    EXPECT_EQ(response->error->message, "unexpected");
}

TEST(Router, JsonAccessErrorBecomesInvalidParams) {
    Router router(quiet_logger());
    router.on_request("strict", [](const nlohmann::json& params, const RequestId&) -> HandlerResult {
        return nlohmann::json{{"uri", params.at("uri").get<std::string>()}};
    });
    auto response = router.dispatch(make_request("strict", {{"other", 1}}));
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::InvalidParams);
}

TEST(Router, DispatchNotification) {
    Router router(quiet_logger());
    bool called = false;
    router.on_notification("notifications/initialized", [&called](const nlohmann::json&) {
        called = true;
    });

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    EXPECT_FALSE(router.dispatch(notif).has_value());
    EXPECT_TRUE(called);
}

TEST(Router, UnknownNotificationIgnored) {
    Router router(quiet_logger());
    JsonRpcNotification notif;
    notif.method = "unknown/notification";
    EXPECT_FALSE(router.dispatch(notif).has_value());
}

TEST(Router, ThrowingNotificationHandlerIsSwallowed) {
    Router router(quiet_logger());
    router.on_notification("bad", [](const nlohmann::json&) {
        throw std::runtime_error("handler failure");
    });
    JsonRpcNotification notif;
    notif.method = "bad";
    std::optional<JsonRpcResponse> response;
    EXPECT_NO_THROW(response = router.dispatch(notif));
    EXPECT_FALSE(response.has_value());
}

TEST(Router, LastRegistrationWins) {
    Router router(quiet_logger());
    router.on_request("v", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
        return nlohmann::json(1);
    });
    router.on_request("v", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
        return nlohmann::json(2);
    });
    EXPECT_EQ(*router.dispatch(make_request("v"))->result, 2);
}

TEST(Router, HasHandler) {
    Router router(quiet_logger());
    router.on_request("ping", [](const nlohmann::json&, const RequestId&) -> HandlerResult {
        return nlohmann::json::object();
    });
    router.on_notification("initialized", [](const nlohmann::json&) {});
    EXPECT_TRUE(router.has_handler("ping"));
    EXPECT_TRUE(router.has_handler("initialized"));
    EXPECT_FALSE(router.has_handler("tools/list"));
}
