#include "mock_responder.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using mb::CorsPolicy;
using mb::HeaderMap;
using mb::Method;
using mb::MockResponder;
using mb::Response;
using json = nlohmann::json;

namespace {

const MockResponder kStatic(CorsPolicy::Static);
const MockResponder kReflective(CorsPolicy::Reflective);

}  // namespace

TEST(ResponseEnvelopeTest, SerializesAllFourKeys) {
    mb::ResponseEnvelope envelope;
    envelope.path = "/api/data";
    envelope.method = "POST";
    EXPECT_EQ(envelope.to_json(),
              R"({"message":"Backend response","method":"POST","path":"/api/data","status":"ok"})");
}

TEST(ResponseEnvelopeTest, NormalizePath) {
    EXPECT_EQ(mb::normalize_path(""), "/");
    EXPECT_EQ(mb::normalize_path("api/data"), "/api/data");
    EXPECT_EQ(mb::normalize_path("/api/data"), "/api/data");
}

TEST(MockResponderTest, EchoesPathAndMethodForBodyMethods) {
    const Method methods[] = {Method::Get, Method::Post, Method::Put, Method::Delete, Method::Patch};
    const char* paths[] = {"", "api/protected", "a/b/c", "/already/rooted"};

    for (const auto* responder : {&kStatic, &kReflective}) {
        for (Method m : methods) {
            for (const char* p : paths) {
                Response resp = responder->handle(m, p, {});
                ASSERT_EQ(resp.status, 200);
                EXPECT_EQ(resp.header("Content-Type"), "application/json");
                auto body = json::parse(resp.body);
                EXPECT_EQ(body["status"], "ok");
                EXPECT_EQ(body["message"], "Backend response");
                EXPECT_EQ(body["path"], mb::normalize_path(p));
                EXPECT_EQ(body["method"], mb::to_string(m));
                EXPECT_EQ(body.size(), 4u);
            }
        }
    }
}

TEST(MockResponderTest, NonUtf8PathStillAnswered) {
    auto request = mb::parse_request_head("GET /caf\xE9 HTTP/1.1\r\nHost: x\r\n\r\n").request;
    for (const auto* responder : {&kStatic, &kReflective}) {
        Response resp = responder->handle(request);
        ASSERT_EQ(resp.status, 200);
        auto body = json::parse(resp.body);
        EXPECT_EQ(body["path"], "/caf\xEF\xBF\xBD");

        Response head = responder->handle(Method::Head, request.path, {});
        EXPECT_EQ(*head.content_length, resp.body.size());
    }
}

TEST(MockResponderTest, EchoesDecodedPath) {
    auto request = mb::parse_request_head("GET /x%2Fy%20z HTTP/1.1\r\n\r\n").request;
    auto body = json::parse(kStatic.handle(request).body);
    EXPECT_EQ(body["path"], "/x/y z");
}

TEST(MockResponderTest, EmptyPathIsRoot) {
    auto body = json::parse(kStatic.handle(Method::Get, "", {}).body);
    EXPECT_EQ(body["path"], "/");
}

TEST(MockResponderTest, HeadHasNoBodyButGetContentLength) {
    for (const auto* responder : {&kStatic, &kReflective}) {
        Response get = responder->handle(Method::Get, "api/data", {});
        Response head = responder->handle(Method::Head, "api/data", {});

        EXPECT_EQ(head.status, 200);
        EXPECT_TRUE(head.body.empty());
        ASSERT_TRUE(head.content_length.has_value());
        EXPECT_EQ(*head.content_length, get.body.size());
        EXPECT_EQ(head.header("Content-Type"), "application/json");

        std::string wire = mb::serialize(head);
        EXPECT_NE(wire.find("Content-Length: " + std::to_string(get.body.size()) + "\r\n"),
                  std::string::npos);
        EXPECT_EQ(wire.substr(wire.size() - 4), "\r\n\r\n");
    }
}

TEST(MockResponderTest, TraceIsRejected) {
    for (const auto* responder : {&kStatic, &kReflective}) {
        Response resp = responder->handle(Method::Trace, "api/data", {});
        EXPECT_EQ(resp.status, 405);
        EXPECT_EQ(resp.body, "Method Not Allowed");
        EXPECT_EQ(resp.header("Content-Type"), "text/plain");
        EXPECT_FALSE(resp.header("Allow").empty());
    }
}

TEST(StaticPolicyTest, CorsHeadersOnEveryResponse) {
    for (Method m : {Method::Get, Method::Post, Method::Options, Method::Head, Method::Trace}) {
        Response resp = kStatic.handle(m, "x", {});
        EXPECT_EQ(resp.header("Access-Control-Allow-Origin"), "*");
        EXPECT_EQ(resp.header("Access-Control-Allow-Methods"), "GET, POST, PUT, DELETE, OPTIONS, PATCH");
        EXPECT_EQ(resp.header("Access-Control-Allow-Headers"),
                  "Content-Type, Authorization, X-PAYMENT, X-Custom-Header");
        EXPECT_EQ(resp.header("Access-Control-Expose-Headers"),
                  "X-Custom-Response-Header, X-Another-Custom-Header");
        EXPECT_EQ(resp.header("Access-Control-Max-Age"), "3600");
        EXPECT_FALSE(resp.has_header("Access-Control-Allow-Credentials"));
    }
}

TEST(StaticPolicyTest, IgnoresOrigin) {
    Response resp = kStatic.handle(Method::Get, "x", {{"Origin", "https://app.example"}});
    EXPECT_EQ(resp.header("Access-Control-Allow-Origin"), "*");
}

TEST(StaticPolicyTest, MarkerHeaders) {
    Response resp = kStatic.handle(Method::Get, "x", {});
    EXPECT_EQ(resp.header("X-Custom-Response-Header"), "custom-value-123");
    EXPECT_EQ(resp.header("X-Another-Custom-Header"), "another-value-456");
    EXPECT_EQ(resp.header("X-Backend-Version"), "1.0.0");
    EXPECT_EQ(resp.header("X-BACKEND-TEST"), "backend-header-value");
}

TEST(StaticPolicyTest, RequestIdEcho) {
    Response with = kStatic.handle(Method::Get, "x", {{"X-Request-ID", "abc123"}});
    EXPECT_EQ(with.header("X-Request-ID"), "abc123");

    Response lower = kStatic.handle(Method::Post, "x", {{"x-request-id", "def456"}});
    EXPECT_EQ(lower.header("X-Request-ID"), "def456");

    Response without = kStatic.handle(Method::Get, "x", {});
    EXPECT_EQ(without.header("X-Request-ID"), "not-provided");
}

TEST(StaticPolicyTest, OptionsAnsweredLikeGet) {
    Response resp = kStatic.handle(Method::Options, "api/data", {{"Origin", "https://app.example"}});
    EXPECT_EQ(resp.status, 200);
    auto body = json::parse(resp.body);
    EXPECT_EQ(body["method"], "OPTIONS");
    EXPECT_EQ(body["path"], "/api/data");
}

TEST(ReflectivePolicyTest, NoCorsWithoutOrigin) {
    for (Method m : {Method::Get, Method::Options, Method::Head}) {
        Response resp = kReflective.handle(m, "x", {{"Access-Control-Request-Method", "PUT"}});
        EXPECT_FALSE(resp.has_header("Access-Control-Allow-Origin"));
        EXPECT_FALSE(resp.has_header("Access-Control-Allow-Credentials"));
        EXPECT_FALSE(resp.has_header("Access-Control-Allow-Methods"));
    }
}

TEST(ReflectivePolicyTest, EchoesOriginExactly) {
    const char* origins[] = {"http://127.0.0.1:8080", "http://localhost:3000",
                             "https://example.com", "http://example.com:8080"};
    for (const char* origin : origins) {
        for (Method m : {Method::Get, Method::Options}) {
            Response resp = kReflective.handle(m, "api", {{"Origin", origin}});
            EXPECT_EQ(resp.header("Access-Control-Allow-Origin"), origin);
            EXPECT_EQ(resp.header("Access-Control-Allow-Credentials"), "true");
        }
    }
}

TEST(ReflectivePolicyTest, PreflightReflectsRequestedMethodAndHeaders) {
    HeaderMap headers = {
        {"Origin", "http://127.0.0.1:8080"},
        {"Access-Control-Request-Method", "PUT"},
        {"Access-Control-Request-Headers", "x-payment"},
    };
    Response resp = kReflective.handle(Method::Options, "api/protected", headers);

    EXPECT_EQ(resp.status, 204);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_EQ(resp.header("Access-Control-Allow-Methods"), "PUT");
    EXPECT_EQ(resp.header("Access-Control-Allow-Headers"), "x-payment");
    EXPECT_EQ(resp.header("Access-Control-Max-Age"), "3600");
}

TEST(ReflectivePolicyTest, PreflightFallsBackToDefaults) {
    Response resp = kReflective.handle(Method::Options, "api", {{"Origin", "https://example.com"}});
    EXPECT_EQ(resp.status, 204);
    EXPECT_EQ(resp.header("Access-Control-Allow-Methods"), "GET, POST, PUT, DELETE, OPTIONS, PATCH");
    EXPECT_EQ(resp.header("Access-Control-Allow-Headers"), "Content-Type, Authorization, X-PAYMENT");
}

TEST(ReflectivePolicyTest, PreflightWithoutOriginStillNoContent) {
    Response resp = kReflective.handle(Method::Options, "api", {{"X-PAYMENT", "dummy"}});
    EXPECT_EQ(resp.status, 204);
    EXPECT_TRUE(resp.body.empty());
    EXPECT_EQ(mb::serialize(resp).find("Content-Length"), std::string::npos);
}

TEST(ReflectivePolicyTest, NonPreflightOmitsPreflightHeaders) {
    Response resp = kReflective.handle(Method::Get, "api", {{"Origin", "https://example.com"}});
    EXPECT_FALSE(resp.has_header("Access-Control-Allow-Methods"));
    EXPECT_FALSE(resp.has_header("Access-Control-Max-Age"));
}

TEST(ReflectivePolicyTest, NoMarkerHeaders) {
    Response resp = kReflective.handle(Method::Get, "x", {{"X-Request-ID", "abc123"}});
    EXPECT_FALSE(resp.has_header("X-Request-ID"));
    EXPECT_FALSE(resp.has_header("X-Backend-Version"));
}

TEST(MockResponderTest, SameRequestSameBytes) {
    HeaderMap headers = {{"Origin", "https://example.com"}, {"X-Request-ID", "r-1"}};
    for (const auto* responder : {&kStatic, &kReflective}) {
        for (Method m : {Method::Get, Method::Head, Method::Options, Method::Trace}) {
            EXPECT_EQ(mb::serialize(responder->handle(m, "p", headers)),
                      mb::serialize(responder->handle(m, "p", headers)));
        }
    }
}
