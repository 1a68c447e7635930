#include "types/digest.hpp"
#include "common/hex.hpp"
#include <algorithm>
#include <stdexcept>

namespace typing_proof {

Digest Digest::from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != LEN) {
        throw std::invalid_argument("Invalid byte length for Digest: " + std::to_string(bytes.size()));
    }
    std::array<uint8_t, LEN> out;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Digest(out);
}

bool Digest::operator==(const Digest& rhs) const {
    return bytes_ == rhs.bytes_;
}

bool Digest::operator!=(const Digest& rhs) const {
    return !(*this == rhs);
}

std::string Digest::to_hex() const {
    return hex::encode(bytes_.data(), bytes_.size());
}

Digest Digest::from_hex(const std::string& hex) {
    std::vector<uint8_t> bytes = hex::decode(hex);
    if (bytes.size() != LEN) {
        throw std::invalid_argument("Invalid hex string length for Digest");
    }
    return from_bytes(bytes);
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    return os << digest.to_hex();
}

} // namespace typing_proof
