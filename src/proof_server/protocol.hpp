#pragma once

/**
 * Socket protocol for the typing proof server
 * 
 * Request:
 *   [4 bytes: magic "TPRQ" = 0x54505251]
 *   [4 bytes: version = 1]
 *   [4 bytes: job_id]
 *   [4 bytes: kind: 0=PROVE, 1=CURRENT_CHALLENGE]
 *   [4 bytes: body_len]  [body bytes: JSON submission, empty for CURRENT_CHALLENGE]
 * 
 * Response:
 *   [4 bytes: magic "TPRS" = 0x54505253]
 *   [4 bytes: status: 0=OK, 1=REJECTED, 2=PROVER_FAILED, 3=BINDING_FAILED, 4=ERROR]
 *   [4 bytes: job_id]
 *   [4 bytes: body_len]  [body bytes: JSON]
 * 
 * On OK the body is the leaderboard handoff (PROVE) or the challenge
 * (CURRENT_CHALLENGE). Otherwise it is {"error": "...", "reason": "..."}.
 * 
 * All integers are little-endian.
 */

#include <cstdint>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace typing_proof {
namespace proof_server {

// Protocol constants
constexpr uint32_t MAGIC_REQUEST = 0x54505251;  // "TPRQ"
constexpr uint32_t MAGIC_RESPONSE = 0x54505253; // "TPRS"
constexpr uint32_t PROTOCOL_VERSION = 1;

enum class RequestKind : uint32_t {
    Prove = 0,
    CurrentChallenge = 1,
};

enum class ResponseStatus : uint32_t {
    Ok = 0,
    Rejected = 1,
    ProverFailed = 2,
    BindingFailed = 3,
    Error = 4,
};

struct ServerRequest {
    uint32_t job_id = 0;
    RequestKind kind = RequestKind::Prove;
    std::string body;
    // Set when body_len exceeded the reader's limit; body is left unread
    bool body_too_large = false;
    uint32_t declared_body_len = 0;
};

struct ServerResponse {
    ResponseStatus status = ResponseStatus::Ok;
    uint32_t job_id = 0;
    std::string body;

    static ServerResponse ok(uint32_t job_id, const nlohmann::json& body) {
        ServerResponse r;
        r.status = ResponseStatus::Ok;
        r.job_id = job_id;
        r.body = body.dump();
        return r;
    }

    static ServerResponse failure(ResponseStatus status, uint32_t job_id,
                                  const std::string& message, const std::string& reason) {
        ServerResponse r;
        r.status = status;
        r.job_id = job_id;
        r.body = nlohmann::json{{"error", message}, {"reason", reason}}.dump();
        return r;
    }
};

// Read/write helpers for socket I/O
class SocketReader {
public:
    explicit SocketReader(int fd) : fd_(fd) {}

    // Read exactly n bytes
    bool read_exact(void* buf, size_t n);

    std::optional<uint32_t> read_u32_le();

    // Read and drop n bytes, e.g. the unread body of an oversized request
    bool discard(size_t n);

    // Read a complete request. A body longer than max_body_bytes is not read;
    // the request comes back flagged body_too_large.
    std::optional<ServerRequest> read_request(size_t max_body_bytes);

    std::optional<ServerResponse> read_response();

private:
    int fd_;
};

class SocketWriter {
public:
    explicit SocketWriter(int fd) : fd_(fd) {}

    // Write exactly n bytes
    bool write_all(const void* buf, size_t n);

    bool write_u32_le(uint32_t v);

    bool write_request(const ServerRequest& request);
    bool write_response(const ServerResponse& response);

private:
    int fd_;
};

} // namespace proof_server
} // namespace typing_proof
