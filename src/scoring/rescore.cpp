#include "scoring/rescore.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "prompt/normalizer.hpp"
#include "replay/codec.hpp"

#include <tbb/parallel_for.h>

namespace typing_proof {

namespace {

std::optional<uint64_t> optional_u64(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) return std::nullopt;
    if (!json[key].is_number_unsigned()) {
        throw FormatError(std::string(key) + " must be a non-negative integer");
    }
    return json[key].get<uint64_t>();
}

void compare(std::vector<std::string>& out, const char* field,
             const std::optional<uint64_t>& recorded, uint64_t recomputed) {
    if (recorded && *recorded != recomputed) {
        out.push_back(std::string(field) + ": recorded " + std::to_string(*recorded) +
                      ", recomputed " + std::to_string(recomputed));
    }
}

} // anonymous namespace

RescoreEntry RescoreEntry::from_json(const nlohmann::json& json, size_t index) {
    if (!json.is_object()) {
        throw FormatError("entry must be a JSON object");
    }

    RescoreEntry entry;
    if (json.contains("id") && json["id"].is_string()) {
        entry.id = json["id"].get<std::string>();
    } else if (json.contains("id") && json["id"].is_number_integer()) {
        entry.id = std::to_string(json["id"].get<int64_t>());
    } else {
        entry.id = "#" + std::to_string(index);
    }

    if (!json.contains("prompt") || !json["prompt"].is_string()) {
        throw FormatError("prompt is required");
    }
    entry.prompt = json["prompt"].get<std::string>();

    if (json.contains("events_bytes_base64") && json["events_bytes_base64"].is_string()) {
        entry.encoded_replay = base64::decode_strict(json["events_bytes_base64"].get<std::string>(),
                                                     "events_bytes_base64");
    } else if (json.contains("events_hex") && json["events_hex"].is_string()) {
        try {
            entry.encoded_replay = hex::decode(json["events_hex"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw FormatError(std::string("events_hex: ") + e.what());
        }
    } else {
        throw FormatError("events_bytes_base64 or events_hex is required");
    }

    entry.recorded.score = optional_u64(json, "score");
    entry.recorded.wpm_x100 = optional_u64(json, "wpm_x100");
    entry.recorded.accuracy_bps = optional_u64(json, "accuracy_bps");
    entry.recorded.duration_ms = optional_u64(json, "duration_ms");
    if (json.contains("prompt_hash_hex") && json["prompt_hash_hex"].is_string()) {
        entry.recorded.prompt_hash_hex = hex::canonicalize(json["prompt_hash_hex"].get<std::string>());
    }
    return entry;
}

RescoreResult rescore_entry(const RescoreEntry& entry) {
    RescoreResult result;
    result.id = entry.id;

    std::vector<ReplayEvent> events = decode_events(entry.encoded_replay);
    result.stats = compute_stats(entry.prompt, events);

    const ComputedStats& stats = result.stats;
    compare(result.differences, "score", entry.recorded.score, stats.score);
    compare(result.differences, "wpm_x100", entry.recorded.wpm_x100, stats.wpm_x100);
    compare(result.differences, "accuracy_bps", entry.recorded.accuracy_bps, stats.accuracy_bps);
    compare(result.differences, "duration_ms", entry.recorded.duration_ms, stats.duration_ms);

    if (entry.recorded.prompt_hash_hex) {
        std::string recomputed = prompt_digest(stats.normalized_prompt).to_hex();
        if (*entry.recorded.prompt_hash_hex != recomputed) {
            result.differences.push_back("prompt_hash: recorded " + *entry.recorded.prompt_hash_hex +
                                         ", recomputed " + recomputed);
        }
    }

    result.timing_violations = evaluate_timing(stats, events).violations(stats, events);
    result.status = result.differences.empty() ? RescoreStatus::Match : RescoreStatus::Diverged;
    return result;
}

std::vector<RescoreResult> rescore_batch(const nlohmann::json& entries) {
    if (!entries.is_array()) {
        throw FormatError("submissions must be a JSON array");
    }

    std::vector<RescoreResult> results(entries.size());
    tbb::parallel_for(size_t(0), entries.size(), [&](size_t i) {
        RescoreResult& out = results[i];
        out.id = "#" + std::to_string(i);
        try {
            RescoreEntry entry = RescoreEntry::from_json(entries[i], i);
            out.id = entry.id;
            out = rescore_entry(entry);
        } catch (const Error& e) {
            // A bad entry is a finding about that entry, not a batch failure
            out.status = RescoreStatus::Invalid;
            out.error = e.what();
        }
    });
    return results;
}

RescoreSummary summarize(const std::vector<RescoreResult>& results) {
    RescoreSummary summary;
    for (const auto& r : results) {
        switch (r.status) {
            case RescoreStatus::Match: ++summary.matched; break;
            case RescoreStatus::Diverged: ++summary.diverged; break;
            case RescoreStatus::Invalid: ++summary.invalid; break;
        }
    }
    return summary;
}

const char* rescore_status_name(RescoreStatus status) {
    switch (status) {
        case RescoreStatus::Match: return "match";
        case RescoreStatus::Diverged: return "diverged";
        case RescoreStatus::Invalid: return "invalid";
    }
    return "unknown";
}

nlohmann::json RescoreResult::to_json() const {
    nlohmann::json out = {
        {"id", id},
        {"status", rescore_status_name(status)},
    };
    if (status == RescoreStatus::Invalid) {
        out["error"] = error;
        return out;
    }
    out["score"] = stats.score;
    out["wpm_x100"] = stats.wpm_x100;
    out["accuracy_bps"] = stats.accuracy_bps;
    out["duration_ms"] = stats.duration_ms;
    out["differences"] = differences;
    out["timing_violations"] = timing_violations;
    return out;
}

} // namespace typing_proof
