#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "protocol.hpp"

namespace typing_proof {
namespace proof_server {

/**
 * Blocking client for the framed protocol: one connection per request,
 * matching how the server serves connections.
 * 
 * Address forms: "HOST:PORT" (IPv4 or "localhost") or "unix:PATH".
 */
class Client {
public:
    explicit Client(std::string address) : address_(std::move(address)) {}

    // nullopt on connect or I/O failure (logged to stderr)
    std::optional<ServerResponse> send(const ServerRequest& request) const;

    std::optional<ServerResponse> prove(uint32_t job_id, const std::string& body) const;
    std::optional<ServerResponse> current_challenge(uint32_t job_id) const;

private:
    int connect_socket() const;

    std::string address_;
};

} // namespace proof_server
} // namespace typing_proof
