#include "validation/binding_checker.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "common/debug_control.hpp"
#include "proof/journal.hpp"

#include <iostream>
#include <stdexcept>

namespace typing_proof {

BindingChecker::BindingChecker(BindingConfig config) : config_(config) {}

void BindingChecker::fail(const ValidatedRequest& validated, const std::string& what) const {
    std::cerr << "[binding] INTEGRITY: " << what
              << " challenge_id=" << validated.request.challenge_id
              << " prompt_hash=" << validated.prompt_digest << std::endl;
    throw BindingError(what);
}

void BindingChecker::check(const ValidatedRequest& validated, const ProofArtifact& artifact) const {
    const ProofRequest& request = validated.request;

    if (config_.max_seal_bytes && artifact.seal_bytes() > *config_.max_seal_bytes) {
        std::cerr << "[binding] Seal of " << artifact.seal_bytes() << " bytes exceeds limit of "
                  << *config_.max_seal_bytes << " bytes" << std::endl;
        throw OversizedArtifactError(artifact.seal_bytes(), *config_.max_seal_bytes);
    }

    const std::string expected_prompt_hash = validated.prompt_digest.to_hex();
    const std::string expected_player = hex::encode(request.player.data(), request.player.size());

    if (artifact.journal_prompt_hash_hex &&
        hex::canonicalize(*artifact.journal_prompt_hash_hex) != expected_prompt_hash) {
        fail(validated, "prompt hash mismatch");
    }
    if (artifact.journal_challenge_id && *artifact.journal_challenge_id != request.challenge_id) {
        fail(validated, "challenge mismatch");
    }
    if (artifact.journal_player_hex &&
        hex::canonicalize(*artifact.journal_player_hex) != expected_player) {
        fail(validated, "player mismatch");
    }

    // With every public input declared, the journal can be rebuilt and its
    // hash compared with what the seal commits to
    if (artifact.journal_prompt_hash_hex && artifact.journal_challenge_id && artifact.journal_player_hex) {
        Journal journal;
        journal.challenge_id = request.challenge_id;
        journal.player = request.player;
        journal.prompt_hash = validated.prompt_digest;
        journal.score = artifact.score;
        journal.wpm_x100 = artifact.wpm_x100;
        journal.accuracy_bps = artifact.accuracy_bps;
        journal.duration_ms = artifact.duration_ms;
        if (hex::canonicalize(artifact.journal_hash_hex) != journal.hash().to_hex()) {
            fail(validated, "journal hash mismatch");
        }
    }

    if (config_.check_metrics) {
        const ComputedStats& stats = validated.stats;
        if (artifact.score != stats.score ||
            artifact.wpm_x100 != stats.wpm_x100 ||
            artifact.accuracy_bps != stats.accuracy_bps ||
            artifact.duration_ms != stats.duration_ms) {
            fail(validated, "metrics mismatch");
        }
    }

    TYPING_PROOF_DEBUG_COUT("[binding] artifact bound to challenge_id=" << request.challenge_id
                            << " score=" << artifact.score << std::endl);
}

} // namespace typing_proof
