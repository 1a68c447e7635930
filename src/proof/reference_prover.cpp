#include "proof/prover.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "common/debug_control.hpp"
#include "prompt/normalizer.hpp"
#include "replay/codec.hpp"
#include "scoring/scoring.hpp"

#include <iostream>

namespace typing_proof {

Journal compute_journal(const ProofRequest& request) {
    std::vector<ReplayEvent> events = decode_events(request.encoded_replay);
    ComputedStats stats = compute_stats(request.prompt, events);
    enforce_timing(evaluate_timing(stats, events), stats, events);

    Journal journal;
    journal.challenge_id = request.challenge_id;
    journal.player = request.player;
    journal.prompt_hash = prompt_digest(stats.normalized_prompt);
    // The guest narrows to u32 before computing the score
    journal.wpm_x100 = static_cast<uint32_t>(stats.wpm_x100);
    journal.accuracy_bps = static_cast<uint32_t>(stats.accuracy_bps);
    journal.duration_ms = static_cast<uint32_t>(stats.duration_ms);
    journal.score = static_cast<uint64_t>(journal.wpm_x100) * journal.accuracy_bps / BPS_SCALE;
    return journal;
}

ReferenceProver::ReferenceProver(Digest image_id) : image_id_(image_id) {}

ProofArtifact ReferenceProver::prove(const ProofRequest& request) {
    Journal journal;
    try {
        journal = compute_journal(request);
    } catch (const Error& e) {
        throw ProverError(std::string("guest rejected input: ") + e.what());
    }

    TYPING_PROOF_DEBUG_COUT("[prover] reference journal challenge_id=" << journal.challenge_id
                            << " score=" << journal.score << std::endl);

    ProofArtifact artifact;
    artifact.score = journal.score;
    artifact.wpm_x100 = journal.wpm_x100;
    artifact.accuracy_bps = journal.accuracy_bps;
    artifact.duration_ms = journal.duration_ms;
    artifact.image_id_hex = image_id_.to_hex();
    artifact.journal_hash_hex = journal.hash().to_hex();
    // Dev-mode receipts carry no seal
    artifact.seal_hex = "";
    artifact.journal_challenge_id = journal.challenge_id;
    artifact.journal_player_hex = hex::encode(journal.player.data(), journal.player.size());
    artifact.journal_prompt_hash_hex = journal.prompt_hash.to_hex();
    return artifact;
}

} // namespace typing_proof
