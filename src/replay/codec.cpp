#include "replay/codec.hpp"
#include "common/errors.hpp"

#include <string>

namespace typing_proof {

std::vector<uint8_t> encode_events(const std::vector<ReplayEvent>& events) {
    if (events.size() > REPLAY_MAX_EVENTS) {
        throw RangeError("events length exceeds u16: " + std::to_string(events.size()));
    }

    std::vector<uint8_t> out;
    out.reserve(REPLAY_HEADER_BYTES + events.size() * REPLAY_RECORD_BYTES);

    uint16_t count = static_cast<uint16_t>(events.size());
    out.push_back(static_cast<uint8_t>(count));
    out.push_back(static_cast<uint8_t>(count >> 8));

    for (const auto& event : events) {
        if (event.key > KEY_RANGE_MAX) {
            throw RangeError("key out of range: " + std::to_string(event.key));
        }
        out.push_back(static_cast<uint8_t>(event.dt_ms));
        out.push_back(static_cast<uint8_t>(event.dt_ms >> 8));
        out.push_back(event.key);
    }
    return out;
}

uint16_t encoded_event_count(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < REPLAY_HEADER_BYTES) {
        throw FormatError("events bytes too short");
    }
    uint16_t count = static_cast<uint16_t>(bytes[0]) |
                     static_cast<uint16_t>(static_cast<uint16_t>(bytes[1]) << 8);
    size_t expected = REPLAY_HEADER_BYTES + static_cast<size_t>(count) * REPLAY_RECORD_BYTES;
    if (bytes.size() != expected) {
        throw FormatError("events length mismatch: expected " + std::to_string(expected) +
                          " bytes, got " + std::to_string(bytes.size()));
    }
    return count;
}

std::vector<ReplayEvent> decode_events(const std::vector<uint8_t>& bytes) {
    uint16_t count = encoded_event_count(bytes);

    std::vector<ReplayEvent> events;
    events.reserve(count);
    size_t offset = REPLAY_HEADER_BYTES;
    for (uint16_t i = 0; i < count; ++i) {
        ReplayEvent event;
        event.dt_ms = static_cast<uint16_t>(bytes[offset]) |
                      static_cast<uint16_t>(static_cast<uint16_t>(bytes[offset + 1]) << 8);
        event.key = bytes[offset + 2];
        events.push_back(event);
        offset += REPLAY_RECORD_BYTES;
    }
    return events;
}

} // namespace typing_proof
