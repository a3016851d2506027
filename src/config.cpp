#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace mb {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used != std::string(val).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in ") + name + ": '" + val + "'");
    }
}

static uint16_t checked_port(int port) {
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("Port out of range: " + std::to_string(port));
    }
    return static_cast<uint16_t>(port);
}

CorsPolicy parse_cors_policy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "static") return CorsPolicy::Static;
    if (lower == "reflective") return CorsPolicy::Reflective;
    throw std::invalid_argument("Unknown CORS policy '" + name + "' (expected static or reflective)");
}

const char* to_string(CorsPolicy policy) {
    switch (policy) {
        case CorsPolicy::Static:     return "static";
        case CorsPolicy::Reflective: return "reflective";
    }
    return "unknown";
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;

    if (!path.empty()) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to load config: " + std::string(e.what()));
        }

        try {
            // Server
            if (auto s = root["server"]) {
                cfg.server.port = checked_port(s["port"].as<int>(cfg.server.port));
                cfg.server.bind_address = s["bind_address"].as<std::string>(cfg.server.bind_address);
                cfg.server.backlog = s["backlog"].as<int>(cfg.server.backlog);
                cfg.server.read_timeout_ms = s["read_timeout_ms"].as<int>(cfg.server.read_timeout_ms);
                cfg.server.max_header_bytes = s["max_header_bytes"].as<size_t>(cfg.server.max_header_bytes);
            }

            // CORS
            if (auto c = root["cors"]) {
                if (c["policy"]) {
                    cfg.cors.policy = parse_cors_policy(c["policy"].as<std::string>());
                }
            }

            // Logging
            if (auto l = root["logging"]) {
                cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
                cfg.logging.file = l["file"].as<std::string>("");
                cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
                cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
            }
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Invalid config value: " + std::string(e.what()));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }

    // Environment variable overrides (Docker / test harness)
    cfg.server.port = checked_port(env_int_or("PORT", cfg.server.port));
    cfg.server.bind_address = env_or("BIND_ADDRESS", cfg.server.bind_address);
    if (const char* policy = std::getenv("CORS_POLICY")) {
        try {
            cfg.cors.policy = parse_cors_policy(policy);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }
    }
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    if (cfg.server.backlog <= 0) {
        throw std::runtime_error("server.backlog must be positive");
    }
    if (cfg.server.read_timeout_ms < 0) {
        throw std::runtime_error("server.read_timeout_ms must not be negative");
    }
    if (cfg.server.max_header_bytes == 0) {
        throw std::runtime_error("server.max_header_bytes must be positive");
    }

    return cfg;
}

} // namespace mb
