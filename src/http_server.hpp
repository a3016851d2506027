#pragma once

#include "config.hpp"
#include "http_message.hpp"
#include "mock_responder.hpp"
#include <string>
#include <thread>
#include <atomic>

namespace mb {

// Single-threaded HTTP/1.1 front end for the mock responder.
// Connections are accepted and answered one at a time on a background thread.
class HttpServer {
public:
    HttpServer(const ServerConfig& config, const MockResponder& responder);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port, valid after start() (resolves port 0)
    uint16_t port() const { return bound_port_; }

private:
    // What became of reading one request head
    enum class ReadStatus { Ok, Closed, TimedOut, TooLarge };

    void server_thread();
    void handle_client(int client_fd, const std::string& peer);
    ReadStatus read_head(int fd, std::string& buffer) const;
    void drain_body(int fd, const Request& request, size_t already_read) const;
    void send_response(int fd, const Response& response);
    void send_error(int fd, int status, const std::string& body);
    void linger_close(int fd) const;

    ServerConfig config_;
    const MockResponder& responder_;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace mb
