#pragma once

/**
 * Scoring engine
 * 
 * All arithmetic is unsigned 64-bit integer math with floor division. The
 * proving guest runs the same formulas; any floating point here would let
 * the preview, the server and the journal disagree.
 * 
 *   accuracy_bps    = correct_chars * 10000 / prompt_len     (0 if prompt_len == 0)
 *   wpm_x100        = typed_chars * 1'200'000 / duration_ms  (0 if duration_ms == 0)
 *   score           = wpm_x100 * accuracy_bps / 10000
 *   min_duration_ms = prompt_len * 40
 * 
 * 1'200'000 is (60'000 ms per minute / 5 chars per word) * 100 fixed-point.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types/replay_event.hpp"

namespace typing_proof {

constexpr uint64_t BPS_SCALE = 10'000;
constexpr uint64_t WPM_X100_NUMERATOR = 1'200'000;
constexpr uint64_t MIN_DURATION_PER_CHAR_MS = 40;
// Per-keystroke floor enforced by the proving guest
constexpr uint16_t MIN_DT_MS = 10;

struct ComputedStats {
    std::string normalized_prompt;
    std::string reconstructed_text;
    uint64_t duration_ms = 0;
    uint64_t typed_chars = 0;
    uint64_t correct_chars = 0;
    uint64_t accuracy_bps = 0;
    uint64_t wpm_x100 = 0;
    uint64_t score = 0;
    uint64_t min_duration_ms = 0;

    bool operator==(const ComputedStats& rhs) const;
    bool operator!=(const ComputedStats& rhs) const { return !(*this == rhs); }
};

/**
 * Normalizes `prompt`, replays `events`, and derives every metric.
 * Throws EncodingError (prompt) or InvalidKeyError (events) unchanged.
 */
ComputedStats compute_stats(const std::string& prompt, const std::vector<ReplayEvent>& events);

/**
 * TimingReport - advisory anti-cheat data
 * 
 * The engine never rejects on timing; a caller decides whether a violation is
 * a warning (client preview) or a rejection (server gate, see enforce_timing).
 */
struct TimingReport {
    bool empty_prompt = false;
    bool zero_duration = false;
    bool below_min_duration = false;
    // Index of the first event with dt_ms < MIN_DT_MS
    std::optional<size_t> first_fast_event;

    bool ok() const {
        return !empty_prompt && !zero_duration && !below_min_duration && !first_fast_event;
    }

    // Human-readable description of each violation, in check order
    std::vector<std::string> violations(const ComputedStats& stats,
                                        const std::vector<ReplayEvent>& events) const;
};

TimingReport evaluate_timing(const ComputedStats& stats, const std::vector<ReplayEvent>& events);

// Throws TimingError describing the first violation in `report`
void enforce_timing(const TimingReport& report,
                    const ComputedStats& stats,
                    const std::vector<ReplayEvent>& events);

} // namespace typing_proof
