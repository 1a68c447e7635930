#pragma once

#include <string>

#include "types/digest.hpp"

namespace typing_proof {

/**
 * Canonical prompt form.
 * 
 * ASCII only (a byte above 0x7F throws EncodingError). Runs of whitespace
 * (0x20 and 0x09-0x0D) collapse to a single space; leading and trailing
 * whitespace disappears. 'A'-'Z' are lowered by +32. Nothing else changes,
 * so punctuation and digits pass through.
 * 
 * Two prompts are the same challenge iff their normalized forms hash equal.
 */
std::string normalize_prompt(const std::string& raw);

// SHA-256 of already-normalized prompt bytes
Digest prompt_digest(const std::string& normalized);

// Lowercase hex of prompt_digest(normalize_prompt(raw))
std::string prompt_hash_hex(const std::string& raw);

} // namespace typing_proof
