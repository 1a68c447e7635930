#pragma once

#include "config/config.hpp"
#include "pipeline.hpp"
#include "protocol.hpp"

namespace typing_proof {
namespace proof_server {

// {"challenge_id", "prompt", "prompt_hash_hex"} for the configured challenge
nlohmann::json challenge_json(const ChallengeConfig& challenge);

ResponseStatus response_status(OutcomeStatus status);

/**
 * Maps framed requests onto the submission pipeline.
 * 
 * PROVE bodies go through SubmissionPipeline::process; the outcome status
 * becomes the response status and the handoff (or error/reason) the body.
 * CURRENT_CHALLENGE answers from configuration without touching the prover.
 */
class RequestRouter {
public:
    RequestRouter(const SubmissionPipeline& pipeline, ChallengeConfig challenge);

    ServerResponse handle(const ServerRequest& request) const;

private:
    const SubmissionPipeline& pipeline_;
    ChallengeConfig challenge_;
};

} // namespace proof_server
} // namespace typing_proof
