#include "protocol.hpp"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace typing_proof {
namespace proof_server {

namespace {

// Responses are produced by this server and bounded by the handoff size
constexpr uint32_t MAX_RESPONSE_BODY_BYTES = 64'000'000;

} // anonymous namespace

// SocketReader implementation

bool SocketReader::read_exact(void* buf, size_t n) {
    uint8_t* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = n;

    while (remaining > 0) {
        ssize_t bytes_read = ::read(fd_, ptr, remaining);
        if (bytes_read <= 0) {
            if (bytes_read == 0) {
                // Connection closed
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        ptr += bytes_read;
        remaining -= static_cast<size_t>(bytes_read);
    }
    return true;
}

std::optional<uint32_t> SocketReader::read_u32_le() {
    uint8_t buf[4];
    if (!read_exact(buf, 4)) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(buf[0]) |
           (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

bool SocketReader::discard(size_t n) {
    uint8_t buf[64 * 1024];
    while (n > 0) {
        size_t chunk = n < sizeof(buf) ? n : sizeof(buf);
        if (!read_exact(buf, chunk)) {
            return false;
        }
        n -= chunk;
    }
    return true;
}

std::optional<ServerRequest> SocketReader::read_request(size_t max_body_bytes) {
    auto magic_opt = read_u32_le();
    if (!magic_opt) {
        return std::nullopt;
    }
    if (*magic_opt != MAGIC_REQUEST) {
        std::cerr << "[protocol] Invalid magic: expected 0x" << std::hex << MAGIC_REQUEST
                  << ", got 0x" << *magic_opt << std::dec << std::endl;
        return std::nullopt;
    }

    auto version_opt = read_u32_le();
    if (!version_opt) {
        return std::nullopt;
    }
    if (*version_opt != PROTOCOL_VERSION) {
        std::cerr << "[protocol] Unsupported version: " << *version_opt << std::endl;
        return std::nullopt;
    }

    auto job_id_opt = read_u32_le();
    if (!job_id_opt) return std::nullopt;

    auto kind_opt = read_u32_le();
    if (!kind_opt) return std::nullopt;
    if (*kind_opt > static_cast<uint32_t>(RequestKind::CurrentChallenge)) {
        std::cerr << "[protocol] Unknown request kind: " << *kind_opt << std::endl;
        return std::nullopt;
    }

    auto len_opt = read_u32_le();
    if (!len_opt) return std::nullopt;

    ServerRequest request;
    request.job_id = *job_id_opt;
    request.kind = static_cast<RequestKind>(*kind_opt);
    request.declared_body_len = *len_opt;

    if (*len_opt > max_body_bytes) {
        std::cerr << "[protocol] Body too large: " << *len_opt << " bytes" << std::endl;
        request.body_too_large = true;
        return request;
    }

    request.body.assign(*len_opt, '\0');
    if (!read_exact(&request.body[0], *len_opt)) {
        return std::nullopt;
    }
    return request;
}

std::optional<ServerResponse> SocketReader::read_response() {
    auto magic_opt = read_u32_le();
    if (!magic_opt || *magic_opt != MAGIC_RESPONSE) {
        return std::nullopt;
    }
    auto status_opt = read_u32_le();
    if (!status_opt || *status_opt > static_cast<uint32_t>(ResponseStatus::Error)) {
        return std::nullopt;
    }
    auto job_id_opt = read_u32_le();
    if (!job_id_opt) return std::nullopt;
    auto len_opt = read_u32_le();
    if (!len_opt || *len_opt > MAX_RESPONSE_BODY_BYTES) return std::nullopt;

    ServerResponse response;
    response.status = static_cast<ResponseStatus>(*status_opt);
    response.job_id = *job_id_opt;
    response.body.assign(*len_opt, '\0');
    if (!read_exact(&response.body[0], *len_opt)) {
        return std::nullopt;
    }
    return response;
}

// SocketWriter implementation

bool SocketWriter::write_all(const void* buf, size_t n) {
    const uint8_t* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = n;

    while (remaining > 0) {
        ssize_t bytes_written = ::write(fd_, ptr, remaining);
        if (bytes_written <= 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        ptr += bytes_written;
        remaining -= static_cast<size_t>(bytes_written);
    }
    return true;
}

bool SocketWriter::write_u32_le(uint32_t v) {
    uint8_t buf[4];
    buf[0] = static_cast<uint8_t>(v);
    buf[1] = static_cast<uint8_t>(v >> 8);
    buf[2] = static_cast<uint8_t>(v >> 16);
    buf[3] = static_cast<uint8_t>(v >> 24);
    return write_all(buf, 4);
}

bool SocketWriter::write_request(const ServerRequest& request) {
    if (!write_u32_le(MAGIC_REQUEST)) return false;
    if (!write_u32_le(PROTOCOL_VERSION)) return false;
    if (!write_u32_le(request.job_id)) return false;
    if (!write_u32_le(static_cast<uint32_t>(request.kind))) return false;
    if (!write_u32_le(static_cast<uint32_t>(request.body.size()))) return false;
    return write_all(request.body.data(), request.body.size());
}

bool SocketWriter::write_response(const ServerResponse& response) {
    if (!write_u32_le(MAGIC_RESPONSE)) return false;
    if (!write_u32_le(static_cast<uint32_t>(response.status))) return false;
    if (!write_u32_le(response.job_id)) return false;
    if (!write_u32_le(static_cast<uint32_t>(response.body.size()))) return false;
    return write_all(response.body.data(), response.body.size());
}

} // namespace proof_server
} // namespace typing_proof
