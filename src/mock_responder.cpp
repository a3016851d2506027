#include "mock_responder.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace mb {

namespace {

constexpr const char* kAllowedMethods = "GET, POST, PUT, DELETE, OPTIONS, PATCH";
constexpr const char* kStaticAllowedHeaders = "Content-Type, Authorization, X-PAYMENT, X-Custom-Header";
constexpr const char* kReflectiveDefaultHeaders = "Content-Type, Authorization, X-PAYMENT";
constexpr const char* kExposedHeaders = "X-Custom-Response-Header, X-Another-Custom-Header";
constexpr const char* kMaxAge = "3600";
constexpr const char* kMethodNotAllowed = "Method Not Allowed";

} // namespace

std::string ResponseEnvelope::to_json() const {
    json body;
    body["status"] = status;
    body["message"] = message;
    body["path"] = path;
    body["method"] = method;
    // Paths are raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string normalize_path(const std::string& path) {
    if (path.empty()) return "/";
    if (path.front() == '/') return path;
    return "/" + path;
}

MockResponder::MockResponder(CorsPolicy policy)
    : policy_(policy)
{
}

Response MockResponder::handle(Method method, const std::string& path, const HeaderMap& headers) const {
    Request request;
    request.method = method;
    request.path = path;
    request.headers = headers;
    return handle(request);
}

Response MockResponder::handle(const Request& request) const {
    Response response;
    ResponseEnvelope envelope;
    envelope.path = normalize_path(request.path);
    envelope.method = to_string(request.method);

    switch (request.method) {
        case Method::Trace:
            response.status = 405;
            response.set_header("Content-Type", "text/plain");
            response.set_header("Allow", std::string(kAllowedMethods) + ", HEAD");
            response.body = kMethodNotAllowed;
            break;

        case Method::Head: {
            // Same headers as GET, no body
            envelope.method = to_string(Method::Get);
            response.set_header("Content-Type", "application/json");
            response.content_length = envelope.to_json().size();
            break;
        }

        case Method::Options:
            if (policy_ == CorsPolicy::Reflective) {
                response.status = 204;
                response.set_header("Content-Type", "application/json");
                break;
            }
            [[fallthrough]];

        default:
            response.set_header("Content-Type", "application/json");
            response.body = envelope.to_json();
            break;
    }

    if (policy_ == CorsPolicy::Static) {
        apply_static_headers(request, response);
    } else {
        apply_reflective_headers(request, response);
    }
    return response;
}

void MockResponder::apply_static_headers(const Request& request, Response& response) const {
    response.set_header("Access-Control-Allow-Origin", "*");
    response.set_header("Access-Control-Allow-Methods", kAllowedMethods);
    response.set_header("Access-Control-Allow-Headers", kStaticAllowedHeaders);
    response.set_header("Access-Control-Expose-Headers", kExposedHeaders);
    response.set_header("Access-Control-Max-Age", kMaxAge);

    // Marker headers checked by header pass-through tests
    response.set_header("X-Custom-Response-Header", "custom-value-123");
    response.set_header("X-Another-Custom-Header", "another-value-456");
    response.set_header("X-Backend-Version", "1.0.0");
    response.set_header("X-Request-ID",
        request.has_header("X-Request-ID") ? request.header("X-Request-ID") : "not-provided");
    response.set_header("X-BACKEND-TEST", "backend-header-value");
}

void MockResponder::apply_reflective_headers(const Request& request, Response& response) const {
    if (!request.has_header("Origin")) return;

    response.set_header("Access-Control-Allow-Origin", request.header("Origin"));
    response.set_header("Access-Control-Allow-Credentials", "true");
    response.set_header("Vary", "Origin");

    if (request.method != Method::Options) return;

    auto requested_method = request.header("Access-Control-Request-Method");
    auto requested_headers = request.header("Access-Control-Request-Headers");
    response.set_header("Access-Control-Allow-Methods",
        requested_method.empty() ? kAllowedMethods : requested_method);
    response.set_header("Access-Control-Allow-Headers",
        requested_headers.empty() ? kReflectiveDefaultHeaders : requested_headers);
    response.set_header("Access-Control-Max-Age", kMaxAge);
}

} // namespace mb
