#pragma once

#include "config.hpp"
#include "http_message.hpp"
#include <string>

namespace mb {

// JSON body echoed back for every request
struct ResponseEnvelope {
    std::string status = "ok";
    std::string message = "Backend response";
    std::string path;
    std::string method;

    // {"message":...,"method":...,"path":...,"status":...}
    std::string to_json() const;
};

// "/" + path, or "/" when empty. Paths already rooted are kept as-is.
std::string normalize_path(const std::string& path);

// Stateless request handler for the mock backend.
// Every request is answered; nothing is stored between calls.
class MockResponder {
public:
    explicit MockResponder(CorsPolicy policy = CorsPolicy::Static);

    Response handle(const Request& request) const;
    Response handle(Method method, const std::string& path, const HeaderMap& headers) const;

    CorsPolicy policy() const { return policy_; }

private:
    void apply_static_headers(const Request& request, Response& response) const;
    void apply_reflective_headers(const Request& request, Response& response) const;

    CorsPolicy policy_;
};

} // namespace mb
