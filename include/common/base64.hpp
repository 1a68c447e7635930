#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace typing_proof {
namespace base64 {

// Standard alphabet with '=' padding
std::string encode(const std::vector<uint8_t>& bytes);

/**
 * Strict base64 decode.
 * 
 * The input is trimmed of surrounding ASCII whitespace and must then be
 * non-empty, a multiple of 4 long, match [A-Za-z0-9+/]+={0,2}, and re-encode
 * to the same text (ignoring trailing '='). The last rule rejects inputs with
 * non-zero pad bits, which would otherwise decode to the same bytes as their
 * canonical form.
 * 
 * Throws FormatError naming `label` on any violation.
 */
std::vector<uint8_t> decode_strict(const std::string& text, const std::string& label);

} // namespace base64
} // namespace typing_proof
