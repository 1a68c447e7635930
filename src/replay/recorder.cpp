#include "replay/recorder.hpp"
#include "replay/codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace typing_proof {

ReplayRecorder::ReplayRecorder(Clock now_ms) : now_ms_(std::move(now_ms)) {
    if (!now_ms_) {
        throw std::invalid_argument("ReplayRecorder requires a clock");
    }
}

int64_t ReplayRecorder::start() {
    last_ = now_ms_();
    started_ = true;
    return last_;
}

ReplayEvent ReplayRecorder::record(uint8_t key) {
    int64_t now = now_ms_();
    int64_t dt = 0;
    if (started_) {
        dt = std::max<int64_t>(0, now - last_);
    }
    ReplayEvent event = make_event(dt, key);
    last_ = now;
    started_ = true;
    events_.push_back(event);
    return event;
}

void ReplayRecorder::reset() {
    started_ = false;
    last_ = 0;
    events_.clear();
}

std::vector<uint8_t> ReplayRecorder::encode() const {
    return encode_events(events_);
}

std::vector<int64_t> compute_dt_list(const std::vector<int64_t>& timestamps, int64_t start) {
    std::vector<int64_t> out;
    out.reserve(timestamps.size());
    int64_t last = start;
    for (int64_t ts : timestamps) {
        out.push_back(std::max<int64_t>(0, ts - last));
        last = ts;
    }
    return out;
}

} // namespace typing_proof
