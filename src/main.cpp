#include "config.hpp"
#include "logger.hpp"
#include "mock_responder.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "1.0.0"
#endif

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_banner(const mb::AppConfig& cfg, const std::string& config_path) {
    std::cout << R"(
  ┌─────────────────────────────────────────────┐
  │       MOCK BACKEND v)" APP_VERSION R"(                   │
  │       HTTP fixture for proxy tests          │
  └─────────────────────────────────────────────┘
)" << std::endl;

    spdlog::info("Configuration:");
    spdlog::info("  Config file     : {}", config_path.empty() ? "(none, defaults + env)" : config_path);
    spdlog::info("  Bind address    : {}", cfg.server.bind_address);
    spdlog::info("  Port            : {}", cfg.server.port);
    spdlog::info("  CORS policy     : {}", mb::to_string(cfg.cors.policy));
    spdlog::info("  Read timeout    : {} ms", cfg.server.read_timeout_ms);
    spdlog::info("  Log level       : {}", cfg.logging.level);
    spdlog::info("  Log file        : {}", cfg.logging.file.empty() ? "(disabled)" : cfg.logging.file);
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: mock-backend [options]\n"
                      << "Options:\n"
                      << "  -c, --config <path>    YAML config file (optional)\n"
                      << "  -h, --help             Show this help\n"
                      << "\nEnvironment variables:\n"
                      << "  PORT                   Listen port (default: 9999)\n"
                      << "  BIND_ADDRESS           Listen address (default: 0.0.0.0)\n"
                      << "  CORS_POLICY            static or reflective (default: static)\n"
                      << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
            return 0;
        } else {
            std::cerr << "ERROR: Unknown argument '" << arg << "' (see --help)" << std::endl;
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    mb::AppConfig config;
    try {
        config = mb::load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    try {
        mb::init_logger(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "ERROR: Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }
    print_banner(config, config_path);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Start server ─────────────────────────────────────────────────────────
    mb::MockResponder responder(config.cors.policy);
    mb::HttpServer http_server(config.server, responder);

    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on {}:{}",
                         config.server.bind_address, config.server.port);
        return 1;
    }

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    spdlog::info("Shutdown complete");

    return 0;
}
