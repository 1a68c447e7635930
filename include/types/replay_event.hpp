#pragma once

#include <cstdint>

namespace typing_proof {

// Key codes (canonical, shared with the proving guest)
constexpr uint8_t KEY_A = 0;
constexpr uint8_t KEY_Z = 25;
constexpr uint8_t KEY_SPACE = 26;
constexpr uint8_t KEY_BACKSPACE = 27;
constexpr uint8_t KEY_ENTER = 28;
constexpr uint8_t KEY_RANGE_MAX = KEY_ENTER;

/**
 * ReplayEvent - one timed keystroke
 * 
 * dt_ms is the time since the previous event, or since recording start for
 * the first event. Wider values (from a clock or a script) enter through
 * make_event(), which range-checks them.
 */
struct ReplayEvent {
    uint16_t dt_ms = 0;
    uint8_t key = 0;

    bool operator==(const ReplayEvent& rhs) const {
        return dt_ms == rhs.dt_ms && key == rhs.key;
    }
    bool operator!=(const ReplayEvent& rhs) const { return !(*this == rhs); }
};

// Throws RangeError if dt_ms is outside [0, 0xFFFF] or key outside [0, KEY_RANGE_MAX]
ReplayEvent make_event(int64_t dt_ms, int64_t key);

// Key code for a lowercase letter or space; throws RangeError for anything else
uint8_t key_for_char(char c);

} // namespace typing_proof
