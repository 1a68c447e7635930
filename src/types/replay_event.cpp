#include "types/replay_event.hpp"
#include "common/errors.hpp"

#include <string>

namespace typing_proof {

ReplayEvent make_event(int64_t dt_ms, int64_t key) {
    if (dt_ms < 0 || dt_ms > 0xFFFF) {
        throw RangeError("dt_ms out of u16 range: " + std::to_string(dt_ms));
    }
    if (key < 0 || key > KEY_RANGE_MAX) {
        throw RangeError("key out of range: " + std::to_string(key));
    }
    ReplayEvent event;
    event.dt_ms = static_cast<uint16_t>(dt_ms);
    event.key = static_cast<uint8_t>(key);
    return event;
}

uint8_t key_for_char(char c) {
    if (c >= 'a' && c <= 'z') {
        return static_cast<uint8_t>(KEY_A + (c - 'a'));
    }
    if (c == ' ') {
        return KEY_SPACE;
    }
    throw RangeError("no key code for character " + std::to_string(static_cast<int>(c)));
}

} // namespace typing_proof
