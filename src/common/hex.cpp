#include "common/hex.hpp"

#include <stdexcept>

namespace typing_proof {
namespace hex {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string strip_prefix(const std::string& s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        return s.substr(2);
    }
    return s;
}

} // anonymous namespace

std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string encode(const std::vector<uint8_t>& bytes) {
    return encode(bytes.data(), bytes.size());
}

std::vector<uint8_t> decode(const std::string& hex) {
    std::string digits = strip_prefix(hex);
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }
    std::vector<uint8_t> out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = nibble(digits[i]);
        int lo = nibble(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex character in: " + hex);
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool is_hex_of_length(const std::string& s, size_t digits) {
    if (s.size() != digits) {
        return false;
    }
    for (char c : s) {
        if (nibble(c) < 0) {
            return false;
        }
    }
    return true;
}

std::string canonicalize(const std::string& hex) {
    std::string out = strip_prefix(hex);
    for (char& c : out) {
        if (c >= 'A' && c <= 'F') {
            c = static_cast<char>(c + 32);
        }
    }
    return out;
}

} // namespace hex
} // namespace typing_proof
