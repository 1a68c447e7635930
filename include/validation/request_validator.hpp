#pragma once

/**
 * Request Validator
 * 
 * Server-side gate in front of the prover. Accepts a submission body:
 * 
 *   {
 *     "challenge_id": 1,
 *     "player_pubkey": "<64 hex chars | G... address>",
 *     "prompt": "the quick brown fox",
 *     "events_bytes_base64": "<strict base64 of the replay codec bytes>"
 *   }
 * 
 * and either returns a ValidatedRequest or throws ValidationError carrying a
 * RejectReason. It never calls the prover and holds no per-request state, so
 * one instance may be shared by concurrent callers.
 */

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "proof/request.hpp"

namespace typing_proof {

enum class RejectReason {
    BodyTooLarge,
    MalformedBody,
    MissingField,
    InvalidChallengeId,
    InvalidPlayerIdentity,
    PromptTooLong,
    InvalidPrompt,
    EmptyPrompt,
    InvalidBase64,
    InvalidReplay,
    TooManyEvents,
    InvalidKey,
    TimingViolation,
};

// Stable snake_case name, used in error bodies
const char* reject_reason_name(RejectReason reason);

class ValidationError : public Error {
public:
    ValidationError(RejectReason reason, const std::string& what)
        : Error(what), reason_(reason) {}

    RejectReason reason() const { return reason_; }

private:
    RejectReason reason_;
};

struct ValidatorConfig {
    size_t max_prompt_chars = 256;
    size_t max_events = 4096;
    size_t max_body_bytes = 1'000'000;
    // Reject replays the proving guest would reject on timing grounds
    bool enforce_timing = true;
};

class RequestValidator {
public:
    explicit RequestValidator(ValidatorConfig config);

    // Enforces max_body_bytes, parses JSON, then validate(json)
    ValidatedRequest validate_json(const std::string& body) const;

    ValidatedRequest validate(const nlohmann::json& body) const;

    const ValidatorConfig& config() const { return config_; }

    // Accepts a non-negative integer that fits u32, given as a JSON number
    // (integral floats included) or a decimal string
    static uint32_t parse_challenge_id(const nlohmann::json& value);

private:
    ValidatorConfig config_;
};

} // namespace typing_proof
