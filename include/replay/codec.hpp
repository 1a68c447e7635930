#pragma once

/**
 * Replay codec
 * 
 * Wire format (little-endian):
 *   [2 bytes: event count]
 *   count x [2 bytes: dt_ms][1 byte: key]
 * 
 * The encoded length is always exactly 2 + 3 * count. Decoding rejects any
 * buffer that is shorter or longer than that, so one byte sequence has one
 * interpretation.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "types/replay_event.hpp"

namespace typing_proof {

constexpr size_t REPLAY_HEADER_BYTES = 2;
constexpr size_t REPLAY_RECORD_BYTES = 3;
constexpr size_t REPLAY_MAX_EVENTS = 0xFFFF;

// Throws RangeError for more than REPLAY_MAX_EVENTS events or a key above KEY_RANGE_MAX
std::vector<uint8_t> encode_events(const std::vector<ReplayEvent>& events);

// Throws FormatError if the buffer is shorter than the header or its length
// does not match the declared count. Key codes are passed through unchecked.
std::vector<ReplayEvent> decode_events(const std::vector<uint8_t>& bytes);

// Declared event count after the same exact-length check as decode_events()
uint16_t encoded_event_count(const std::vector<uint8_t>& bytes);

} // namespace typing_proof
