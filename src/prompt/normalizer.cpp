#include "prompt/normalizer.hpp"
#include "hash/sha256.hpp"
#include "common/errors.hpp"

namespace typing_proof {

namespace {

bool is_ascii_whitespace(unsigned char c) {
    return c == 0x20 || (c >= 0x09 && c <= 0x0d);
}

} // anonymous namespace

std::string normalize_prompt(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    // Starting "in space" drops leading whitespace
    bool in_space = true;
    for (size_t i = 0; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);
        if (c > 0x7f) {
            throw EncodingError("prompt must be ASCII (byte " + std::to_string(c) +
                                " at offset " + std::to_string(i) + ")");
        }
        if (is_ascii_whitespace(c)) {
            if (!in_space) {
                out.push_back(' ');
                in_space = true;
            }
            continue;
        }
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<unsigned char>(c + 32);
        }
        out.push_back(static_cast<char>(c));
        in_space = false;
    }
    if (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

Digest prompt_digest(const std::string& normalized) {
    return Sha256::hash(normalized);
}

std::string prompt_hash_hex(const std::string& raw) {
    return prompt_digest(normalize_prompt(raw)).to_hex();
}

} // namespace typing_proof
