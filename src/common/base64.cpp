#include "common/base64.hpp"
#include "common/errors.hpp"

#include <openssl/evp.h>

namespace typing_proof {
namespace base64 {

namespace {

bool is_ascii_whitespace(char c) {
    return c == ' ' || (c >= 0x09 && c <= 0x0d);
}

bool is_alphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_ascii_whitespace(s[begin])) ++begin;
    while (end > begin && is_ascii_whitespace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

std::string strip_padding(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && s[end - 1] == '=') --end;
    return s.substr(0, end);
}

} // anonymous namespace

std::string encode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> decode_strict(const std::string& text, const std::string& label) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw FormatError(label + " must not be empty");
    }
    if (trimmed.size() % 4 != 0) {
        throw FormatError(label + " has invalid length");
    }

    // [A-Za-z0-9+/]+={0,2}
    std::string body = strip_padding(trimmed);
    size_t padding = trimmed.size() - body.size();
    if (body.empty() || padding > 2) {
        throw FormatError(label + " has invalid characters");
    }
    for (char c : body) {
        if (!is_alphabet(c)) {
            throw FormatError(label + " has invalid characters");
        }
    }

    std::vector<uint8_t> out(trimmed.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(trimmed.data()),
                                  static_cast<int>(trimmed.size()));
    if (decoded < 0) {
        throw FormatError(label + " is not valid base64");
    }
    // EVP_DecodeBlock counts padding positions as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);

    if (strip_padding(encode(out)) != body) {
        throw FormatError(label + " is not valid base64");
    }
    return out;
}

} // namespace base64
} // namespace typing_proof
