#include "validation/account_address.hpp"
#include "common/hex.hpp"

#include <algorithm>
#include <vector>

namespace typing_proof {

namespace {

constexpr char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr size_t ADDRESS_CHARS = 56;
constexpr size_t DECODED_BYTES = 35;

int base32_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

} // anonymous namespace

uint16_t crc16_xmodem(const uint8_t* data, size_t len) {
    uint16_t crc = 0;
    for (size_t i = 0; i < len; ++i) {
        crc ^= static_cast<uint16_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

std::optional<PlayerIdentity> decode_account_address(const std::string& address) {
    if (address.size() != ADDRESS_CHARS) {
        return std::nullopt;
    }

    std::vector<uint8_t> decoded;
    decoded.reserve(DECODED_BYTES);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : address) {
        int v = base32_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<uint8_t>(buffer >> bits));
            buffer &= (1u << bits) - 1;
        }
    }
    // 56 chars are exactly 280 bits, so nothing may be left over
    if (decoded.size() != DECODED_BYTES || bits != 0) {
        return std::nullopt;
    }
    if (decoded[0] != STRKEY_VERSION_ED25519_PUBLIC) {
        return std::nullopt;
    }

    uint16_t expected = crc16_xmodem(decoded.data(), DECODED_BYTES - 2);
    uint16_t stored = static_cast<uint16_t>(decoded[DECODED_BYTES - 2]) |
                      static_cast<uint16_t>(static_cast<uint16_t>(decoded[DECODED_BYTES - 1]) << 8);
    if (expected != stored) {
        return std::nullopt;
    }

    PlayerIdentity key;
    std::copy(decoded.begin() + 1, decoded.begin() + 33, key.begin());
    return key;
}

std::string encode_account_address(const PlayerIdentity& key) {
    std::vector<uint8_t> raw;
    raw.reserve(DECODED_BYTES);
    raw.push_back(STRKEY_VERSION_ED25519_PUBLIC);
    raw.insert(raw.end(), key.begin(), key.end());
    uint16_t crc = crc16_xmodem(raw.data(), raw.size());
    raw.push_back(static_cast<uint8_t>(crc));
    raw.push_back(static_cast<uint8_t>(crc >> 8));

    std::string out;
    out.reserve(ADDRESS_CHARS);
    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : raw) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(BASE32_ALPHABET[(buffer >> bits) & 0x1F]);
        }
        buffer &= (1u << bits) - 1;
    }
    return out;
}

std::optional<PlayerIdentity> parse_player_identity(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::string digits = value;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (hex::is_hex_of_length(digits, 64)) {
        std::vector<uint8_t> bytes = hex::decode(digits);
        PlayerIdentity key;
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return key;
    }
    return decode_account_address(value);
}

} // namespace typing_proof
