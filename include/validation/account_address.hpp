#pragma once

#include <optional>
#include <string>

#include "proof/journal.hpp"

namespace typing_proof {

/**
 * Stellar account address (StrKey) decoding
 * 
 * A "G..." address is 56 base32 characters (RFC 4648 alphabet, no padding)
 * encoding 35 bytes:
 *   [1 byte:  version = 6 << 3 (ed25519 public key)]
 *   [32 bytes: public key]
 *   [2 bytes: CRC16-XModem of the first 33 bytes, little-endian]
 */
constexpr uint8_t STRKEY_VERSION_ED25519_PUBLIC = 6 << 3;

// Returns the 32-byte key, or nullopt for anything that is not a valid G-address
std::optional<PlayerIdentity> decode_account_address(const std::string& address);

// Inverse of decode_account_address
std::string encode_account_address(const PlayerIdentity& key);

/**
 * Player identity from either 64 hex characters (optionally "0x"-prefixed)
 * or a Stellar G-address. Returns nullopt if neither form matches.
 */
std::optional<PlayerIdentity> parse_player_identity(const std::string& value);

uint16_t crc16_xmodem(const uint8_t* data, size_t len);

} // namespace typing_proof
