#include "scoring/scoring.hpp"
#include "prompt/normalizer.hpp"
#include "replay/interpreter.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace typing_proof {

bool ComputedStats::operator==(const ComputedStats& rhs) const {
    return normalized_prompt == rhs.normalized_prompt &&
           reconstructed_text == rhs.reconstructed_text &&
           duration_ms == rhs.duration_ms &&
           typed_chars == rhs.typed_chars &&
           correct_chars == rhs.correct_chars &&
           accuracy_bps == rhs.accuracy_bps &&
           wpm_x100 == rhs.wpm_x100 &&
           score == rhs.score &&
           min_duration_ms == rhs.min_duration_ms;
}

ComputedStats compute_stats(const std::string& prompt, const std::vector<ReplayEvent>& events) {
    ComputedStats stats;
    stats.normalized_prompt = normalize_prompt(prompt);
    stats.reconstructed_text = apply_events(events);

    for (const auto& event : events) {
        stats.duration_ms += event.dt_ms;
    }

    const std::string& output = stats.reconstructed_text;
    const std::string& target = stats.normalized_prompt;
    const uint64_t prompt_len = target.size();

    stats.typed_chars = output.size();
    size_t cmp_len = std::min(output.size(), target.size());
    for (size_t i = 0; i < cmp_len; ++i) {
        if (output[i] == target[i]) {
            ++stats.correct_chars;
        }
    }

    stats.accuracy_bps = prompt_len == 0 ? 0 : stats.correct_chars * BPS_SCALE / prompt_len;
    stats.wpm_x100 = stats.duration_ms == 0 ? 0 : stats.typed_chars * WPM_X100_NUMERATOR / stats.duration_ms;
    stats.score = stats.wpm_x100 * stats.accuracy_bps / BPS_SCALE;
    stats.min_duration_ms = prompt_len * MIN_DURATION_PER_CHAR_MS;
    return stats;
}

TimingReport evaluate_timing(const ComputedStats& stats, const std::vector<ReplayEvent>& events) {
    TimingReport report;
    report.empty_prompt = stats.normalized_prompt.empty();
    report.zero_duration = stats.duration_ms == 0;
    report.below_min_duration = stats.duration_ms < stats.min_duration_ms;
    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].dt_ms < MIN_DT_MS) {
            report.first_fast_event = i;
            break;
        }
    }
    return report;
}

std::vector<std::string> TimingReport::violations(const ComputedStats& stats,
                                                  const std::vector<ReplayEvent>& events) const {
    std::vector<std::string> out;
    if (empty_prompt) {
        out.push_back("prompt length is zero");
    }
    if (first_fast_event) {
        size_t i = *first_fast_event;
        out.push_back("event " + std::to_string(i) + " dt " + std::to_string(events[i].dt_ms) +
                      " ms below minimum " + std::to_string(MIN_DT_MS) + " ms");
    }
    if (below_min_duration) {
        out.push_back("duration " + std::to_string(stats.duration_ms) + " ms below minimum " +
                      std::to_string(stats.min_duration_ms) + " ms");
    }
    if (zero_duration) {
        out.push_back("duration is zero");
    }
    return out;
}

void enforce_timing(const TimingReport& report,
                    const ComputedStats& stats,
                    const std::vector<ReplayEvent>& events) {
    if (report.ok()) {
        return;
    }
    throw TimingError(report.violations(stats, events).front());
}

} // namespace typing_proof
