#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "types/replay_event.hpp"

namespace typing_proof {

/**
 * ReplayRecorder - turns keystrokes observed against a millisecond clock into
 * ReplayEvents.
 * 
 * The first event's dt is measured from start(), or is 0 when record() is
 * called without a prior start(). A clock that steps backwards yields dt 0.
 * A gap longer than 0xFFFF ms throws RangeError, since it cannot be encoded.
 */
class ReplayRecorder {
public:
    using Clock = std::function<int64_t()>;

    explicit ReplayRecorder(Clock now_ms);

    // Marks recording start; returns the clock reading
    int64_t start();

    // Records one key; returns the stored event
    ReplayEvent record(uint8_t key);

    // Drops recorded events and the start mark
    void reset();

    bool is_started() const { return started_; }
    const std::vector<ReplayEvent>& events() const { return events_; }

    // Codec form of everything recorded so far
    std::vector<uint8_t> encode() const;

private:
    Clock now_ms_;
    bool started_ = false;
    int64_t last_ = 0;
    std::vector<ReplayEvent> events_;
};

// Millisecond gaps between successive timestamps, starting from `start`.
// Negative gaps clamp to 0.
std::vector<int64_t> compute_dt_list(const std::vector<int64_t>& timestamps, int64_t start = 0);

} // namespace typing_proof
