#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "proof/journal.hpp"
#include "scoring/scoring.hpp"
#include "types/digest.hpp"
#include "types/replay_event.hpp"

namespace typing_proof {

// Input handed to the prover. The prompt is the raw text; the prover
// normalizes it itself.
struct ProofRequest {
    uint32_t challenge_id = 0;
    PlayerIdentity player{};
    std::string prompt;
    std::vector<uint8_t> encoded_replay;
};

/**
 * ValidatedRequest - a ProofRequest that passed the gate, plus what the gate
 * derived from it locally. The prompt digest is never taken from a caller.
 * 
 * Threaded by value from validation through binding; nothing about a
 * submission is looked up from shared state.
 */
struct ValidatedRequest {
    ProofRequest request;
    Digest prompt_digest;
    std::vector<ReplayEvent> events;
    ComputedStats stats;
};

} // namespace typing_proof
