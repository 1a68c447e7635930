#pragma once

/**
 * Typing Proof Server
 * 
 * Socket server that receives submissions, runs them through the validation,
 * proving and binding pipeline, and returns the leaderboard handoff.
 * 
 * Usage:
 *   ./typing_proof_server --tcp 127.0.0.1:5556
 *   ./typing_proof_server --unix /tmp/typing-proof.sock
 */

#include <string>
#include <functional>
#include <atomic>

#include "protocol.hpp"

namespace typing_proof {
namespace proof_server {

// Callback type for handling requests
using RequestHandler = std::function<ServerResponse(const ServerRequest&)>;

class Server {
public:
    explicit Server(size_t max_body_bytes);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    void set_request_handler(RequestHandler handler);

    // Start listening on TCP
    bool listen_tcp(const std::string& host, uint16_t port);

    // Start listening on Unix socket
    bool listen_unix(const std::string& path);

    // Run the server (blocks until stop() is called)
    void run();

    // Stop the server
    void stop();

    bool is_running() const { return running_.load(); }

    // Serve exactly one request on an already-connected socket
    void handle_client(int client_fd);

private:
    int server_fd_ = -1;
    size_t max_body_bytes_;
    std::atomic<bool> running_{false};
    RequestHandler handler_;
    std::string unix_socket_path_;  // For cleanup
};

} // namespace proof_server
} // namespace typing_proof
