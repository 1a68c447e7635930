#include "client.hpp"

#include <iostream>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace typing_proof {
namespace proof_server {

namespace {

int connect_unix(const std::string& path) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        std::cerr << "[client] Unix socket path too long: " << path << std::endl;
        return -1;
    }
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        std::cerr << "[client] Failed to create socket: " << strerror(errno) << std::endl;
        return -1;
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::cerr << "[client] Failed to connect to " << path << ": " << strerror(errno) << std::endl;
        ::close(fd);
        return -1;
    }
    return fd;
}

int connect_tcp(const std::string& host, uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (host == "localhost") {
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        std::cerr << "[client] Invalid address: " << host << std::endl;
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::cerr << "[client] Failed to create socket: " << strerror(errno) << std::endl;
        return -1;
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::cerr << "[client] Failed to connect to " << host << ":" << port
                  << ": " << strerror(errno) << std::endl;
        ::close(fd);
        return -1;
    }
    return fd;
}

} // anonymous namespace

int Client::connect_socket() const {
    if (address_.rfind("unix:", 0) == 0) {
        return connect_unix(address_.substr(5));
    }

    size_t colon = address_.rfind(':');
    if (colon == std::string::npos) {
        std::cerr << "[client] Invalid address, expected HOST:PORT or unix:PATH" << std::endl;
        return -1;
    }
    const std::string port_text = address_.substr(colon + 1);
    if (port_text.empty() || port_text.size() > 5 ||
        port_text.find_first_not_of("0123456789") != std::string::npos) {
        std::cerr << "[client] Invalid port: " << port_text << std::endl;
        return -1;
    }
    unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
        std::cerr << "[client] Invalid port: " << port_text << std::endl;
        return -1;
    }
    return connect_tcp(address_.substr(0, colon), static_cast<uint16_t>(port));
}

std::optional<ServerResponse> Client::send(const ServerRequest& request) const {
    int fd = connect_socket();
    if (fd < 0) return std::nullopt;

    SocketWriter writer(fd);
    SocketReader reader(fd);

    // The server may answer before the whole body is sent (an oversized body is
    // rejected from its header), so a failed write still looks for a response.
    bool sent = writer.write_request(request);
    std::optional<ServerResponse> response = reader.read_response();
    if (!response) {
        std::cerr << (sent ? "[client] Failed to read response" : "[client] Failed to send request")
                  << std::endl;
    } else if (!sent) {
        std::cerr << "[client] Request truncated; server answered with status "
                  << static_cast<uint32_t>(response->status) << std::endl;
    }
    ::close(fd);
    return response;
}

std::optional<ServerResponse> Client::prove(uint32_t job_id, const std::string& body) const {
    ServerRequest request;
    request.job_id = job_id;
    request.kind = RequestKind::Prove;
    request.body = body;
    request.declared_body_len = static_cast<uint32_t>(body.size());
    return send(request);
}

std::optional<ServerResponse> Client::current_challenge(uint32_t job_id) const {
    ServerRequest request;
    request.job_id = job_id;
    request.kind = RequestKind::CurrentChallenge;
    return send(request);
}

} // namespace proof_server
} // namespace typing_proof
