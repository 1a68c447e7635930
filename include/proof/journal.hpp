#pragma once

/**
 * Journal - public outputs committed by the proving guest
 * 
 * Layout (88 bytes, little-endian):
 *   [4 bytes:  challenge_id]
 *   [32 bytes: player identity]
 *   [32 bytes: prompt hash]
 *   [8 bytes:  score]
 *   [4 bytes:  wpm_x100]
 *   [4 bytes:  accuracy_bps]
 *   [4 bytes:  duration_ms]
 * 
 * journal_hash is SHA-256 over these bytes; it is what the on-chain verifier
 * checks the seal against.
 */

#include <array>
#include <cstdint>
#include <vector>

#include "types/digest.hpp"

namespace typing_proof {

using PlayerIdentity = std::array<uint8_t, 32>;

struct Journal {
    static constexpr size_t ENCODED_LEN = 88;

    uint32_t challenge_id = 0;
    PlayerIdentity player{};
    Digest prompt_hash;
    uint64_t score = 0;
    uint32_t wpm_x100 = 0;
    uint32_t accuracy_bps = 0;
    uint32_t duration_ms = 0;

    std::array<uint8_t, ENCODED_LEN> encode() const;

    // Throws FormatError unless `bytes` is exactly ENCODED_LEN long
    static Journal decode(const std::vector<uint8_t>& bytes);

    Digest hash() const;

    bool operator==(const Journal& rhs) const;
    bool operator!=(const Journal& rhs) const { return !(*this == rhs); }
};

} // namespace typing_proof
