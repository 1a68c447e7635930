#include "hash/sha256.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace typing_proof {

void Sha256::ContextDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(const uint8_t* data, size_t len) {
    if (finalized_) {
        throw std::logic_error("Sha256::update after finalize");
    }
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

void Sha256::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Digest Sha256::finalize() {
    if (finalized_) {
        throw std::logic_error("Sha256::finalize called twice");
    }
    std::array<uint8_t, Digest::LEN> out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != Digest::LEN) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;
    return Digest(out);
}

Digest Sha256::hash(const uint8_t* data, size_t len) {
    Sha256 hasher;
    hasher.update(data, len);
    return hasher.finalize();
}

Digest Sha256::hash(const std::string& data) {
    return hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

} // namespace typing_proof
