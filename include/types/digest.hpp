#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace typing_proof {

/**
 * Digest - 32-byte SHA-256 hash output
 * 
 * Used for the prompt content hash, the journal hash and the guest image id.
 * Hex form is lowercase with no prefix, matching what the proving host prints.
 */
class Digest {
public:
    static constexpr size_t LEN = 32;

    Digest() : bytes_{} {}

    explicit Digest(const std::array<uint8_t, LEN>& bytes)
        : bytes_(bytes) {}

    static Digest zero() { return Digest(); }

    // Throws std::invalid_argument unless `bytes` is exactly LEN long
    static Digest from_bytes(const std::vector<uint8_t>& bytes);

    const std::array<uint8_t, LEN>& bytes() const { return bytes_; }
    uint8_t operator[](size_t i) const { return bytes_[i]; }

    bool operator==(const Digest& rhs) const;
    bool operator!=(const Digest& rhs) const;

    std::string to_hex() const;
    // Accepts upper or lower case and an optional "0x" prefix
    static Digest from_hex(const std::string& hex);

    friend std::ostream& operator<<(std::ostream& os, const Digest& digest);

private:
    std::array<uint8_t, LEN> bytes_;
};

} // namespace typing_proof
