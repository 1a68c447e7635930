#pragma once

#include "types/digest.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// OpenSSL's EVP_MD_CTX, kept out of this header
struct evp_md_ctx_st;

namespace typing_proof {

/**
 * Sha256 - SHA-256 over OpenSSL's EVP interface
 * 
 * The prompt hash, journal hash and every digest compared against prover
 * output use this one function, so the server, the CLI and the proving guest
 * agree bit-for-bit.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, size_t len);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
    void update(const std::string& data);

    // Single use: the context cannot be updated after finalize()
    Digest finalize();

    static Digest hash(const uint8_t* data, size_t len);
    static Digest hash(const std::vector<uint8_t>& data) { return hash(data.data(), data.size()); }
    static Digest hash(const std::string& data);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

} // namespace typing_proof
