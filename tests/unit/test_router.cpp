#include <gtest/gtest.h>
#include "dtmcp/router.hpp"
#include "dtmcp/error.hpp"
#include <stdexcept>
#include <string>

using namespace dtmcp;

namespace {

JsonRpcRequest make_request(std::optional<RequestId> id, const std::string& method,
                            std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

} // anonymous namespace

TEST(Router, DispatchKnownRequest) {
    Router router;
    bool called = false;
    router.on_request("initialize", [&called](const nlohmann::json&) -> HandlerResult {
        called = true;
        return nlohmann::json{{"ok", true}};
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "initialize"));
    EXPECT_TRUE(called);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ((*resp.result)["ok"], true);
    EXPECT_FALSE(resp.error.has_value());
    EXPECT_EQ(std::get<int64_t>(*resp.id), 1);
}

TEST(Router, DispatchUnknownMethod) {
    Router router;
    auto resp = router.dispatch(make_request(RequestId{int64_t{2}}, "resources/list"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Method not found: resources/list");
    EXPECT_FALSE(resp.result.has_value());
    EXPECT_EQ(std::get<int64_t>(*resp.id), 2);
}

TEST(Router, AbsentParamsReachHandlerAsEmptyObject) {
    Router router;
    nlohmann::json seen;
    router.on_request("tools/list", [&seen](const nlohmann::json& params) -> HandlerResult {
        seen = params;
        return nlohmann::json::object();
    });

    (void)router.dispatch(make_request(RequestId{int64_t{1}}, "tools/list"));
    EXPECT_EQ(seen, nlohmann::json::object());
}

TEST(Router, RequiredParamsMissingIsMethodNotFound) {
    Router router;
    bool called = false;
    router.on_request("tools/call", [&called](const nlohmann::json&) -> HandlerResult {
        called = true;
        return nlohmann::json::object();
    }, ParamsPolicy::Required);

    auto resp = router.dispatch(make_request(RequestId{int64_t{5}}, "tools/call"));
    EXPECT_FALSE(called);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Method not found: tools/call");

    auto with_params = router.dispatch(make_request(RequestId{int64_t{6}}, "tools/call",
                                                    nlohmann::json::object()));
    EXPECT_TRUE(called);
    EXPECT_TRUE(with_params.result.has_value());
}

TEST(Router, ProtocolErrorKeepsCode) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        throw McpProtocolError(error::InvalidParams, "bad params");
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "m"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "bad params");
}

TEST(Router, ExceptionBecomesInternalError) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        throw std::runtime_error("disk on fire");
    });

    auto resp = router.dispatch(make_request(RequestId{std::string("r-1")}, "m"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->message, "disk on fire");
    EXPECT_EQ(std::get<std::string>(*resp.id), "r-1");
    EXPECT_FALSE(resp.result.has_value());
}

TEST(Router, NonStandardExceptionIsContained) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        throw 42;
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "m"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->message, "Internal error");
}

TEST(Router, HandlerReturnedError) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "nope", nlohmann::json{{"field", "x"}}};
    });

    auto resp = router.dispatch(make_request(RequestId{int64_t{1}}, "m"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ((*resp.error->data)["field"], "x");
}

TEST(Router, NotificationGetsNullId) {
    Router router;
    router.on_request("initialize", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });

    auto ok = router.dispatch(make_request(std::nullopt, "initialize"));
    EXPECT_FALSE(ok.id.has_value());
    EXPECT_TRUE(ok.result.has_value());

    auto missing = router.dispatch(make_request(std::nullopt, "nope"));
    EXPECT_FALSE(missing.id.has_value());
    EXPECT_TRUE(missing.error.has_value());
}

TEST(Router, HasHandler) {
    Router router;
    router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    EXPECT_TRUE(router.has_handler("tools/list"));
    EXPECT_FALSE(router.has_handler("tools/call"));
}
