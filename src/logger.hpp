#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "http_message.hpp"
#include "mock_responder.hpp"

namespace mb {

// Unknown names fall back to info
inline spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

// Console always, rotating file when logging.file is set
inline void init_logger(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.back()->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (!cfg.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file,
            static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(cfg.max_files)));
        sinks.back()->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [pid %P] %v");
    }

    auto logger = std::make_shared<spdlog::logger>("mock-backend", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(cfg.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

// "GET /api/data -> 200 63B from 127.0.0.1:51234 rid=abc123"
inline std::string format_access_line(const Request& request, const Response& response,
                                      const std::string& peer) {
    std::string line = std::string(to_string(request.method)) + " " + normalize_path(request.path) +
                       " -> " + std::to_string(response.status) + " " +
                       std::to_string(response.content_length.value_or(response.body.size())) +
                       "B from " + peer;
    if (request.has_header("X-Request-ID")) {
        line += " rid=" + request.header("X-Request-ID");
    }
    if (request.has_header("Origin")) {
        line += " origin=" + request.header("Origin");
    }
    return line;
}

// One line per answered request; rejections (4xx/5xx) at warn
inline void log_access(const Request& request, const Response& response, const std::string& peer) {
    auto level = response.status >= 400 ? spdlog::level::warn : spdlog::level::info;
    spdlog::log(level, "{}", format_access_line(request, response, peer));
}

} // namespace mb
