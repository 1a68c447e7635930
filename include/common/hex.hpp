#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace typing_proof {
namespace hex {

// Lowercase hex, two characters per byte
std::string encode(const uint8_t* data, size_t len);
std::string encode(const std::vector<uint8_t>& bytes);

// Decodes an even-length hex string, optionally "0x"-prefixed, either case.
// Throws std::invalid_argument on odd length or a non-hex character.
std::vector<uint8_t> decode(const std::string& hex);

// True if `s` is exactly `digits` hex characters
bool is_hex_of_length(const std::string& s, size_t digits);

// Strips "0x"/"0X" and lowercases; used to compare hex values by content
std::string canonicalize(const std::string& hex);

} // namespace hex
} // namespace typing_proof
