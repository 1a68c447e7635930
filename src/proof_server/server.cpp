#include "server.hpp"

#include <iostream>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <string>
#include <utility>

#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <signal.h>

namespace typing_proof {
namespace proof_server {

namespace {

// An oversized body is drained up to this many bytes so the peer finishes its
// write and sees the rejection; beyond it the connection is simply closed.
constexpr size_t MAX_DISCARD_BYTES = 64'000'000;

void remove_socket_file(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        std::cerr << "[server] Could not remove socket file " << path
                  << ": " << strerror(errno) << std::endl;
    }
}

} // anonymous namespace

Server::Server(size_t max_body_bytes) : max_body_bytes_(max_body_bytes) {}

Server::~Server() {
    stop();
    if (!unix_socket_path_.empty()) {
        remove_socket_file(unix_socket_path_);
    }
}

void Server::set_request_handler(RequestHandler handler) {
    handler_ = std::move(handler);
}

bool Server::listen_tcp(const std::string& host, uint16_t port) {
    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::cerr << "[server] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    int opt = 1;
    if (::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[server] Failed to set SO_REUSEADDR: " << strerror(errno) << std::endl;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[server] Invalid address: " << host << std::endl;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[server] Failed to bind: " << strerror(errno) << std::endl;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::cerr << "[server] Failed to listen: " << strerror(errno) << std::endl;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    std::cout << "[server] Listening on " << host << ":" << port
              << " (max body " << max_body_bytes_ << " bytes)" << std::endl;
    return true;
}

bool Server::listen_unix(const std::string& path) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        std::cerr << "[server] Unix socket path must be 1.." << sizeof(addr.sun_path) - 1
                  << " bytes: " << path << std::endl;
        return false;
    }
    std::memcpy(addr.sun_path, path.data(), path.size());

    // A previous run may have left its socket file behind
    remove_socket_file(path);

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::cerr << "[server] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(server_fd_, 16) < 0) {
        std::cerr << "[server] Cannot serve on " << path << ": " << strerror(errno) << std::endl;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    unix_socket_path_ = path;
    std::cout << "[server] Listening on unix:" << path
              << " (max body " << max_body_bytes_ << " bytes)" << std::endl;
    return true;
}

void Server::run() {
    if (server_fd_ < 0) {
        std::cerr << "[server] run() called before listen_tcp/listen_unix" << std::endl;
        return;
    }

    running_.store(true);
    signal(SIGPIPE, SIG_IGN);

    std::cout << "[server] Ready to accept submissions" << std::endl;

    uint64_t served = 0;
    while (running_.load()) {
        struct sockaddr_storage client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = ::accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno == EINTR || !running_.load()) {
                continue;
            }
            std::cerr << "[server] Accept failed: " << strerror(errno) << std::endl;
            continue;
        }

        std::string peer = "local";
        if (client_addr.ss_family == AF_INET) {
            auto* addr = reinterpret_cast<struct sockaddr_in*>(&client_addr);
            char ip[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &addr->sin_addr, ip, sizeof(ip)) != nullptr) {
                peer = std::string(ip) + ":" + std::to_string(ntohs(addr->sin_port));
            }
        }
        std::cout << "[server] Connection #" << ++served << " from " << peer << std::endl;

        // Submissions are served one at a time, in arrival order
        handle_client(client_fd);
        ::close(client_fd);
    }

    std::cout << "[server] Stopped after " << served << " connection(s)" << std::endl;
}

void Server::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

void Server::handle_client(int client_fd) {
    SocketReader reader(client_fd);
    SocketWriter writer(client_fd);

    auto request_opt = reader.read_request(max_body_bytes_);
    if (!request_opt) {
        std::cerr << "[server] Failed to read request" << std::endl;
        return;
    }

    const ServerRequest& request = *request_opt;
    std::cout << "[server] Request received: job_id=" << request.job_id
              << " kind=" << static_cast<uint32_t>(request.kind)
              << " body=" << request.declared_body_len << " bytes" << std::endl;

    ServerResponse response;
    if (request.body_too_large) {
        // Consume the body so a peer that writes before reading gets the rejection
        if (request.declared_body_len <= MAX_DISCARD_BYTES && !reader.discard(request.declared_body_len)) {
            std::cerr << "[server] Connection closed while draining oversized body job_id="
                      << request.job_id << std::endl;
        }
        response = ServerResponse::failure(ResponseStatus::Rejected, request.job_id,
                                           "request body exceeds " + std::to_string(max_body_bytes_) + " bytes",
                                           "body_too_large");
    } else if (handler_) {
        auto start = std::chrono::steady_clock::now();
        try {
            response = handler_(request);
        } catch (const std::exception& e) {
            std::cerr << "[server] Handler error job_id=" << request.job_id << ": " << e.what() << std::endl;
            response = ServerResponse::failure(ResponseStatus::Error, request.job_id, e.what(), "internal");
        }
        auto end = std::chrono::steady_clock::now();
        double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
        std::cout << "[server] job_id=" << request.job_id
                  << " status=" << static_cast<uint32_t>(response.status)
                  << " duration_ms=" << duration_ms << std::endl;
    } else {
        std::cerr << "[server] No request handler set!" << std::endl;
        response = ServerResponse::failure(ResponseStatus::Error, request.job_id,
                                           "No request handler configured", "internal");
    }

    if (!writer.write_response(response)) {
        std::cerr << "[server] Failed to send response" << std::endl;
    }
}

} // namespace proof_server
} // namespace typing_proof
