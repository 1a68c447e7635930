#include "pipeline.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "common/debug_control.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace typing_proof {
namespace proof_server {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // anonymous namespace

nlohmann::json LeaderboardSubmission::to_json() const {
    return {
        {"score", score},
        {"wpm_x100", wpm_x100},
        {"accuracy_bps", accuracy_bps},
        {"duration_ms", duration_ms},
        {"image_id_hex", image_id_hex},
        {"journal_sha256_hex", journal_hash_hex},
        {"seal_hex", seal_hex},
        {"challenge_id", challenge_id},
        {"prompt_hash_hex", prompt_hash.to_hex()},
        {"player_pubkey_hex", hex::encode(player.data(), player.size())},
    };
}

SubmissionPipeline::SubmissionPipeline(RequestValidator validator,
                                       BindingChecker binding,
                                       Prover& prover,
                                       std::string verifier_selector_hex)
    : validator_(std::move(validator)),
      binding_(std::move(binding)),
      prover_(prover),
      verifier_selector_hex_(hex::canonicalize(verifier_selector_hex)) {}

LeaderboardSubmission SubmissionPipeline::handoff(const ValidatedRequest& validated,
                                                  const ProofArtifact& artifact) const {
    LeaderboardSubmission out;
    out.challenge_id = validated.request.challenge_id;
    out.prompt_hash = validated.prompt_digest;
    out.player = validated.request.player;
    out.score = artifact.score;
    out.wpm_x100 = artifact.wpm_x100;
    out.accuracy_bps = artifact.accuracy_bps;
    out.duration_ms = artifact.duration_ms;
    out.image_id_hex = hex::canonicalize(artifact.image_id_hex);
    out.journal_hash_hex = hex::canonicalize(artifact.journal_hash_hex);
    out.seal_hex = verifier_selector_hex_ + hex::canonicalize(artifact.seal_hex);
    return out;
}

LeaderboardSubmission SubmissionPipeline::prove_and_bind(const ValidatedRequest& validated) const {
    auto start = std::chrono::steady_clock::now();
    ProofArtifact artifact = prover_.prove(validated.request);
    TYPING_PROOF_PROFILE_COUT("[pipeline] prover " << prover_.name() << " took "
                              << elapsed_ms(start) << " ms" << std::endl);

    binding_.check(validated, artifact);
    return handoff(validated, artifact);
}

SubmissionOutcome SubmissionPipeline::process(const std::string& body) const {
    SubmissionOutcome outcome;

    ValidatedRequest validated;
    try {
        validated = validator_.validate_json(body);
    } catch (const ValidationError& e) {
        std::cout << "[pipeline] Rejected (" << reject_reason_name(e.reason()) << "): "
                  << e.what() << std::endl;
        outcome.status = OutcomeStatus::Rejected;
        outcome.error = e.what();
        outcome.reason = reject_reason_name(e.reason());
        return outcome;
    }

    std::cout << "[pipeline] Accepted request challenge_id=" << validated.request.challenge_id
              << " events=" << validated.events.size()
              << " preview_score=" << validated.stats.score << std::endl;

    try {
        outcome.submission = prove_and_bind(validated);
        outcome.status = OutcomeStatus::Accepted;
    } catch (const ProverError& e) {
        std::cerr << "[pipeline] Prover failed: " << e.what() << std::endl;
        outcome.status = OutcomeStatus::ProverFailed;
        outcome.error = e.what();
        outcome.reason = "prover";
    } catch (const BindingError& e) {
        outcome.status = OutcomeStatus::BindingFailed;
        outcome.error = e.what();
        outcome.reason = "binding";
    } catch (const OversizedArtifactError& e) {
        outcome.status = OutcomeStatus::BindingFailed;
        outcome.error = e.what();
        outcome.reason = "oversized_artifact";
    }
    return outcome;
}

} // namespace proof_server
} // namespace typing_proof
