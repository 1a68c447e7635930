#include "handler.hpp"
#include "prompt/normalizer.hpp"

#include <utility>

namespace typing_proof {
namespace proof_server {

nlohmann::json challenge_json(const ChallengeConfig& challenge) {
    return {
        {"challenge_id", challenge.id},
        {"prompt", challenge.prompt},
        {"prompt_hash_hex", prompt_hash_hex(challenge.prompt)},
    };
}

ResponseStatus response_status(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Accepted: return ResponseStatus::Ok;
        case OutcomeStatus::Rejected: return ResponseStatus::Rejected;
        case OutcomeStatus::ProverFailed: return ResponseStatus::ProverFailed;
        case OutcomeStatus::BindingFailed: return ResponseStatus::BindingFailed;
    }
    return ResponseStatus::Error;
}

RequestRouter::RequestRouter(const SubmissionPipeline& pipeline, ChallengeConfig challenge)
    : pipeline_(pipeline), challenge_(std::move(challenge)) {}

ServerResponse RequestRouter::handle(const ServerRequest& request) const {
    switch (request.kind) {
        case RequestKind::CurrentChallenge:
            return ServerResponse::ok(request.job_id, challenge_json(challenge_));

        case RequestKind::Prove: {
            SubmissionOutcome outcome = pipeline_.process(request.body);
            if (outcome.status == OutcomeStatus::Accepted) {
                return ServerResponse::ok(request.job_id, outcome.submission->to_json());
            }
            return ServerResponse::failure(response_status(outcome.status), request.job_id,
                                           outcome.error, outcome.reason);
        }
    }
    return ServerResponse::failure(ResponseStatus::Error, request.job_id,
                                   "unknown request kind", "internal");
}

} // namespace proof_server
} // namespace typing_proof
