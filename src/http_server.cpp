#include "http_server.hpp"
#include "logger.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>

namespace mb {

namespace {

// Request bodies are read and thrown away up to this size
constexpr size_t kMaxDrainBytes = 1024 * 1024;

// Upper bound on input swallowed after the response has been written
constexpr size_t kMaxLingerBytes = 64 * 1024 * 1024;

std::string peer_name(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

size_t content_length_of(const Request& request) {
    auto value = request.header("Content-Length");
    if (value.empty()) return 0;
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

HttpServer::HttpServer(const ServerConfig& config, const MockResponder& responder)
    : config_(config)
    , responder_(responder)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid bind address '{}'", config_.bind_address);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("HTTP: SO_REUSEADDR failed: {}", std::strerror(errno));
    }

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}: {}",
                      config_.bind_address, config_.port, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, config_.backlog) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (sockaddr*)&bound, &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on http://{}:{} (cors: {})",
                 config_.bind_address, bound_port_, to_string(responder_.policy()));
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HttpServer::server_thread() {
    const int listen_fd = server_fd_;

    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd, (sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_.load()) {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        // One connection at a time
        handle_client(client_fd, peer_name(client_addr));
        close(client_fd);
    }
}

void HttpServer::handle_client(int client_fd, const std::string& peer) {
    if (config_.read_timeout_ms > 0) {
        timeval tv{};
        tv.tv_sec = config_.read_timeout_ms / 1000;
        tv.tv_usec = (config_.read_timeout_ms % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    std::string buffer;
    switch (read_head(client_fd, buffer)) {
        case ReadStatus::Ok:
            break;
        case ReadStatus::Closed:
            spdlog::debug("HTTP: {} closed the connection before a full request", peer);
            return;
        case ReadStatus::TimedOut:
            spdlog::warn("HTTP: {} timed out sending the request head", peer);
            send_error(client_fd, 408, "Request Timeout");
            return;
        case ReadStatus::TooLarge:
            spdlog::warn("HTTP: {} sent a request head over {} bytes", peer, config_.max_header_bytes);
            send_error(client_fd, 413, "Payload Too Large");
            return;
    }

    ParseResult parsed = parse_request_head(buffer);
    switch (parsed.outcome) {
        case ParseResult::Outcome::Ok:
            break;
        case ParseResult::Outcome::NotImplemented:
            spdlog::warn("HTTP: {} {}", peer, parsed.error);
            send_error(client_fd, 501, "Not Implemented");
            return;
        case ParseResult::Outcome::Incomplete:
        case ParseResult::Outcome::BadRequest:
            spdlog::warn("HTTP: Bad request from {}: {}", peer, parsed.error);
            send_error(client_fd, 400, "Bad Request");
            return;
    }

    drain_body(client_fd, parsed.request, buffer.size() - parsed.head_size);

    Response response = responder_.handle(parsed.request);
    send_response(client_fd, response);
    log_access(parsed.request, response, peer);
    linger_close(client_fd);
}

HttpServer::ReadStatus HttpServer::read_head(int fd, std::string& buffer) const {
    char buf[4096];
    while (buffer.find("\r\n\r\n") == std::string::npos) {
        if (buffer.size() > config_.max_header_bytes) {
            return ReadStatus::TooLarge;
        }
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n == 0) return ReadStatus::Closed;
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadStatus::TimedOut;
            spdlog::debug("HTTP: recv failed: {}", std::strerror(errno));
            return ReadStatus::Closed;
        }
        buffer.append(buf, static_cast<size_t>(n));
    }
    if (buffer.find("\r\n\r\n") + 4 > config_.max_header_bytes) {
        return ReadStatus::TooLarge;
    }
    return ReadStatus::Ok;
}

void HttpServer::drain_body(int fd, const Request& request, size_t already_read) const {
    size_t length = content_length_of(request);
    if (length <= already_read) return;
    if (length > kMaxDrainBytes) {
        spdlog::debug("HTTP: Not draining {}-byte request body", length);
        return;
    }

    size_t remaining = length - already_read;
    char buf[4096];
    while (remaining > 0) {
        ssize_t n = recv(fd, buf, std::min(sizeof(buf), remaining), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        remaining -= static_cast<size_t>(n);
    }
}

void HttpServer::send_response(int fd, const Response& response) {
    std::string wire = serialize(response);
    const char* data = wire.data();
    size_t left = wire.size();

    while (left > 0) {
        ssize_t n = send(fd, data, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("HTTP: send failed: {}", std::strerror(errno));
            return;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
}

void HttpServer::send_error(int fd, int status, const std::string& body) {
    Response response;
    response.status = status;
    response.set_header("Content-Type", "text/plain");
    response.body = body;
    send_response(fd, response);
    linger_close(fd);
}

void HttpServer::linger_close(int fd) const {
    // Half-close and swallow unread input (oversized or chunked bodies) so
    // close() does not reset the connection before the client read the response
    shutdown(fd, SHUT_WR);
    char buf[4096];
    size_t discarded = 0;
    while (discarded < kMaxLingerBytes) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        discarded += static_cast<size_t>(n);
    }
    if (discarded > 0) {
        spdlog::debug("HTTP: Discarded {} unread request bytes", discarded);
    }
}

} // namespace mb
