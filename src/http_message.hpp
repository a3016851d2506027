#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mb {

enum class Method { Get, Post, Put, Delete, Options, Patch, Head, Trace };

// Exact, case-sensitive token match
std::optional<Method> parse_method(const std::string& token);
const char* to_string(Method method);

// Decodes %XX escapes; malformed escapes are kept literally
std::string percent_decode(const std::string& s);

// ASCII case-insensitive ordering for header names
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct Request {
    Method method = Method::Get;
    std::string path;       // query string stripped, percent-decoded; may be empty
    HeaderMap headers;

    // Empty string when the header is absent
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

struct Response {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;  // wire order
    std::string body;
    std::optional<size_t> content_length;  // overrides body.size() (HEAD)

    void set_header(const std::string& name, const std::string& value);
    // Empty string when the header is absent
    std::string header(const std::string& name) const;
    bool has_header(const std::string& name) const;
};

const char* reason_phrase(int status);

struct ParseResult {
    enum class Outcome { Ok, Incomplete, BadRequest, NotImplemented };

    Outcome outcome = Outcome::Incomplete;
    Request request;
    size_t head_size = 0;  // bytes consumed up to and including the blank line
    std::string error;
};

// Parse the request line and header block at the start of `raw`
ParseResult parse_request_head(const std::string& raw);

// Status line, headers, Content-Length, Connection: close, body
std::string serialize(const Response& response);

} // namespace mb
