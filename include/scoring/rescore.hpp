#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "scoring/scoring.hpp"

namespace typing_proof {

/**
 * Batch re-scoring
 * 
 * Recomputes stats for a corpus of past submissions and compares them with
 * the values that were recorded (typically copied out of journals). Entries
 * are independent and scored in parallel with oneTBB.
 * 
 * Entry JSON:
 *   { "id": "...", "prompt": "...",
 *     "events_bytes_base64": "..." | "events_hex": "...",
 *     "score": 0, "wpm_x100": 0, "accuracy_bps": 0, "duration_ms": 0,
 *     "prompt_hash_hex": "..." }
 * Only "prompt" and one events field are required.
 */

struct RecordedMetrics {
    std::optional<uint64_t> score;
    std::optional<uint64_t> wpm_x100;
    std::optional<uint64_t> accuracy_bps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> prompt_hash_hex;
};

struct RescoreEntry {
    std::string id;
    std::string prompt;
    std::vector<uint8_t> encoded_replay;
    RecordedMetrics recorded;

    // Throws FormatError on a missing or mistyped field
    static RescoreEntry from_json(const nlohmann::json& json, size_t index);
};

enum class RescoreStatus {
    Match,
    Diverged,
    Invalid,
};

struct RescoreResult {
    std::string id;
    RescoreStatus status = RescoreStatus::Invalid;
    ComputedStats stats;
    // "score: recorded 100, recomputed 90" per differing field
    std::vector<std::string> differences;
    // Timing bounds the proving guest would have rejected
    std::vector<std::string> timing_violations;
    // Set when status is Invalid
    std::string error;

    nlohmann::json to_json() const;
};

struct RescoreSummary {
    size_t matched = 0;
    size_t diverged = 0;
    size_t invalid = 0;
};

// One result per element of `entries` (a JSON array), in input order
std::vector<RescoreResult> rescore_batch(const nlohmann::json& entries);

RescoreResult rescore_entry(const RescoreEntry& entry);

RescoreSummary summarize(const std::vector<RescoreResult>& results);

const char* rescore_status_name(RescoreStatus status);

} // namespace typing_proof
