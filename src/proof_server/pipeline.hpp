#pragma once

/**
 * Submission pipeline
 * 
 * One submission end to end:
 *   body -> RequestValidator -> Prover -> BindingChecker -> LeaderboardSubmission
 * 
 * Each call owns its ValidatedRequest from start to finish, so concurrent
 * calls on one pipeline cannot see each other's context. The pipeline itself
 * holds only configuration and a reference to the prover.
 */

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "proof/artifact.hpp"
#include "proof/prover.hpp"
#include "proof/request.hpp"
#include "validation/binding_checker.hpp"
#include "validation/request_validator.hpp"

namespace typing_proof {
namespace proof_server {

// What is handed to on-chain submission
struct LeaderboardSubmission {
    uint32_t challenge_id = 0;
    Digest prompt_hash;
    PlayerIdentity player{};
    uint64_t score = 0;
    uint32_t wpm_x100 = 0;
    uint32_t accuracy_bps = 0;
    uint32_t duration_ms = 0;
    std::string image_id_hex;
    std::string journal_hash_hex;
    // Selector prefix (if configured) followed by the prover's seal
    std::string seal_hex;

    nlohmann::json to_json() const;
};

enum class OutcomeStatus {
    Accepted,
    Rejected,
    ProverFailed,
    BindingFailed,
};

struct SubmissionOutcome {
    OutcomeStatus status = OutcomeStatus::Rejected;
    std::optional<LeaderboardSubmission> submission;
    std::string error;
    // RejectReason name, "prover" or "binding"
    std::string reason;

    // Only prover failures may be retried by the caller
    bool retriable() const { return status == OutcomeStatus::ProverFailed; }
};

class SubmissionPipeline {
public:
    SubmissionPipeline(RequestValidator validator,
                       BindingChecker binding,
                       Prover& prover,
                       std::string verifier_selector_hex = "");

    // Never throws for input, prover or binding failures; those become the
    // outcome's status. Anything else propagates.
    SubmissionOutcome process(const std::string& body) const;

    // Prove and bind an already validated request. Throws ProverError,
    // BindingError or OversizedArtifactError.
    LeaderboardSubmission prove_and_bind(const ValidatedRequest& validated) const;

    LeaderboardSubmission handoff(const ValidatedRequest& validated, const ProofArtifact& artifact) const;

    const RequestValidator& validator() const { return validator_; }

private:
    RequestValidator validator_;
    BindingChecker binding_;
    Prover& prover_;
    std::string verifier_selector_hex_;
};

} // namespace proof_server
} // namespace typing_proof
