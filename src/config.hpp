#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace mb {

// Which set of CORS headers the responder attaches
enum class CorsPolicy {
    Static,      // fixed headers + marker headers on every response
    Reflective,  // echo Origin / preflight request headers, only when Origin is sent
};

struct ServerConfig {
    uint16_t port = 9999;
    std::string bind_address = "0.0.0.0";
    int backlog = 16;
    int read_timeout_ms = 5000;
    size_t max_header_bytes = 64 * 1024;
};

struct CorsConfig {
    CorsPolicy policy = CorsPolicy::Static;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    CorsConfig cors;
    LoggingConfig logging;
};

// "static" / "reflective", case-insensitive. Throws std::invalid_argument otherwise.
CorsPolicy parse_cors_policy(const std::string& name);
const char* to_string(CorsPolicy policy);

// Load configuration from YAML file (empty path = defaults only),
// with environment variable overrides
AppConfig load_config(const std::string& path);

} // namespace mb
