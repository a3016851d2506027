#include "http_message.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace mb {

namespace {

const std::pair<const char*, Method> kMethods[] = {
    {"GET",     Method::Get},
    {"POST",    Method::Post},
    {"PUT",     Method::Put},
    {"DELETE",  Method::Delete},
    {"OPTIONS", Method::Options},
    {"PATCH",   Method::Patch},
    {"HEAD",    Method::Head},
    {"TRACE",   Method::Trace},
};

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string trim(const std::string& s) {
    const char* ws = " \t";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// RFC 9110 token characters
bool is_token(const std::string& s) {
    if (s.empty()) return false;
    static const std::string extra = "!#$%&'*+-.^_`|~";
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || extra.find(static_cast<char>(c)) != std::string::npos;
    });
}

// Request-target bytes: visible ASCII and obs-text, no controls or spaces
bool is_target(const std::string& s) {
    return std::none_of(s.begin(), s.end(), [](unsigned char c) { return c < 0x21 || c == 0x7f; });
}

// Field values must not carry CR, LF or NUL (RFC 9112 5.5)
bool is_field_value(const std::string& s) {
    return s.find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

ParseResult fail(ParseResult::Outcome outcome, const std::string& error) {
    ParseResult result;
    result.outcome = outcome;
    result.error = error;
    return result;
}

} // namespace

std::optional<Method> parse_method(const std::string& token) {
    for (const auto& [name, method] : kMethods) {
        if (token == name) return method;
    }
    return std::nullopt;
}

const char* to_string(Method method) {
    for (const auto& [name, m] : kMethods) {
        if (m == method) return name;
    }
    return "GET";
}

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::string Request::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string();
}

bool Request::has_header(const std::string& name) const {
    return headers.count(name) > 0;
}

void Response::set_header(const std::string& name, const std::string& value) {
    for (auto& [key, val] : headers) {
        if (iequals(key, name)) {
            val = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string Response::header(const std::string& name) const {
    for (const auto& [key, val] : headers) {
        if (iequals(key, name)) return val;
    }
    return "";
}

bool Response::has_header(const std::string& name) const {
    return std::any_of(headers.begin(), headers.end(),
                       [&name](const auto& h) { return iequals(h.first, name); });
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}

ParseResult parse_request_head(const std::string& raw) {
    auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        return fail(ParseResult::Outcome::Incomplete, "header block not terminated");
    }

    // Parse first line: "GET /path HTTP/1.1"
    auto first_line_end = raw.find("\r\n");
    std::string first_line = raw.substr(0, first_line_end);

    auto sp1 = first_line.find(' ');
    auto sp2 = sp1 == std::string::npos ? std::string::npos : first_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos ||
        first_line.find(' ', sp2 + 1) != std::string::npos) {
        return fail(ParseResult::Outcome::BadRequest, "malformed request line");
    }

    std::string token = first_line.substr(0, sp1);
    std::string target = first_line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string version = first_line.substr(sp2 + 1);

    if (!is_token(token) || target.empty() || !is_target(target)) {
        return fail(ParseResult::Outcome::BadRequest, "malformed request line");
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return fail(ParseResult::Outcome::BadRequest, "unsupported version " + version);
    }

    ParseResult result;
    result.head_size = head_end + 4;

    // Strip query string
    auto query = target.find('?');
    if (query != std::string::npos) {
        target = target.substr(0, query);
    }
    result.request.path = percent_decode(target);

    // Headers
    size_t pos = first_line_end + 2;
    while (pos < head_end + 2) {
        auto line_end = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, line_end - pos);
        pos = line_end + 2;
        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return fail(ParseResult::Outcome::BadRequest, "malformed header line");
        }
        std::string name = line.substr(0, colon);
        if (!is_token(name)) {
            return fail(ParseResult::Outcome::BadRequest, "invalid header name '" + name + "'");
        }
        std::string value = trim(line.substr(colon + 1));
        if (!is_field_value(value)) {
            return fail(ParseResult::Outcome::BadRequest, "control character in header '" + name + "'");
        }
        // First value wins on duplicates
        result.request.headers.emplace(name, value);
    }

    auto method = parse_method(token);
    if (!method) {
        return fail(ParseResult::Outcome::NotImplemented, "unknown method " + token);
    }
    result.request.method = *method;
    result.outcome = ParseResult::Outcome::Ok;
    return result;
}

std::string serialize(const Response& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << reason_phrase(response.status) << "\r\n";
    for (const auto& [name, value] : response.headers) {
        oss << name << ": " << value << "\r\n";
    }
    // 204 carries no Content-Length (RFC 9110 8.6)
    if (response.status != 204) {
        oss << "Content-Length: " << response.content_length.value_or(response.body.size()) << "\r\n";
    }
    oss << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return oss.str();
}

} // namespace mb
