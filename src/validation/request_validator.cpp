#include "validation/request_validator.hpp"
#include "validation/account_address.hpp"
#include "common/base64.hpp"
#include "common/debug_control.hpp"
#include "prompt/normalizer.hpp"
#include "replay/codec.hpp"
#include "scoring/scoring.hpp"

#include <cmath>
#include <iostream>
#include <limits>

namespace typing_proof {

const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::BodyTooLarge: return "body_too_large";
        case RejectReason::MalformedBody: return "malformed_body";
        case RejectReason::MissingField: return "missing_field";
        case RejectReason::InvalidChallengeId: return "invalid_challenge_id";
        case RejectReason::InvalidPlayerIdentity: return "invalid_player_identity";
        case RejectReason::PromptTooLong: return "prompt_too_long";
        case RejectReason::InvalidPrompt: return "invalid_prompt";
        case RejectReason::EmptyPrompt: return "empty_prompt";
        case RejectReason::InvalidBase64: return "invalid_base64";
        case RejectReason::InvalidReplay: return "invalid_replay";
        case RejectReason::TooManyEvents: return "too_many_events";
        case RejectReason::InvalidKey: return "invalid_key";
        case RejectReason::TimingViolation: return "timing_violation";
    }
    return "unknown";
}

namespace {

constexpr const char* FIELD_CHALLENGE_ID = "challenge_id";
constexpr const char* FIELD_PLAYER = "player_pubkey";
constexpr const char* FIELD_PROMPT = "prompt";
constexpr const char* FIELD_EVENTS = "events_bytes_base64";

// Characters, not bytes: UTF-8 continuation bytes are not counted
size_t count_chars(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

} // anonymous namespace

RequestValidator::RequestValidator(ValidatorConfig config) : config_(config) {}

uint32_t RequestValidator::parse_challenge_id(const nlohmann::json& value) {
    const std::string message = "challenge_id must be a non-negative integer";
    uint64_t parsed = 0;

    if (value.is_number_unsigned()) {
        parsed = value.get<uint64_t>();
    } else if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        if (v < 0) {
            throw ValidationError(RejectReason::InvalidChallengeId, message);
        }
        parsed = static_cast<uint64_t>(v);
    } else if (value.is_number_float()) {
        double v = value.get<double>();
        if (!std::isfinite(v) || v < 0 || std::floor(v) != v ||
            v > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            throw ValidationError(RejectReason::InvalidChallengeId, message);
        }
        parsed = static_cast<uint64_t>(v);
    } else if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        if (s.empty() || s.size() > 10 || s.find_first_not_of("0123456789") != std::string::npos) {
            throw ValidationError(RejectReason::InvalidChallengeId, message);
        }
        parsed = std::stoull(s);
    } else {
        throw ValidationError(RejectReason::InvalidChallengeId, message);
    }

    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw ValidationError(RejectReason::InvalidChallengeId, "challenge_id exceeds u32 range");
    }
    return static_cast<uint32_t>(parsed);
}

ValidatedRequest RequestValidator::validate_json(const std::string& body) const {
    if (body.size() > config_.max_body_bytes) {
        throw ValidationError(RejectReason::BodyTooLarge,
                              "request body too large (" + std::to_string(body.size()) + " > " +
                              std::to_string(config_.max_body_bytes) + " bytes)");
    }
    if (body.empty()) {
        throw ValidationError(RejectReason::MalformedBody, "missing JSON body");
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        throw ValidationError(RejectReason::MalformedBody, "invalid JSON body");
    }
    return validate(json);
}

ValidatedRequest RequestValidator::validate(const nlohmann::json& body) const {
    if (!body.is_object()) {
        throw ValidationError(RejectReason::MalformedBody, "missing JSON body");
    }
    for (const char* field : {FIELD_CHALLENGE_ID, FIELD_PLAYER, FIELD_PROMPT, FIELD_EVENTS}) {
        if (!body.contains(field) || body[field].is_null()) {
            throw ValidationError(RejectReason::MissingField, std::string(field) + " is required");
        }
    }

    ValidatedRequest out;
    ProofRequest& request = out.request;
    request.challenge_id = parse_challenge_id(body[FIELD_CHALLENGE_ID]);

    if (!body[FIELD_PROMPT].is_string()) {
        throw ValidationError(RejectReason::InvalidPrompt, "prompt must be a string");
    }
    request.prompt = body[FIELD_PROMPT].get<std::string>();
    if (count_chars(request.prompt) > config_.max_prompt_chars) {
        throw ValidationError(RejectReason::PromptTooLong,
                              "prompt exceeds " + std::to_string(config_.max_prompt_chars) + " chars");
    }

    const nlohmann::json& player = body[FIELD_PLAYER];
    std::optional<PlayerIdentity> identity;
    if (player.is_string()) {
        identity = parse_player_identity(player.get<std::string>());
    }
    if (!identity) {
        throw ValidationError(RejectReason::InvalidPlayerIdentity,
                              "player_pubkey must be 32-byte hex or Stellar G... address");
    }
    request.player = *identity;

    if (!body[FIELD_EVENTS].is_string()) {
        throw ValidationError(RejectReason::InvalidBase64, "events_bytes_base64 must be a base64 string");
    }
    try {
        request.encoded_replay = base64::decode_strict(body[FIELD_EVENTS].get<std::string>(), FIELD_EVENTS);
    } catch (const FormatError& e) {
        throw ValidationError(RejectReason::InvalidBase64, e.what());
    }

    try {
        out.events = decode_events(request.encoded_replay);
    } catch (const FormatError& e) {
        throw ValidationError(RejectReason::InvalidReplay, e.what());
    }
    if (out.events.size() > config_.max_events) {
        throw ValidationError(RejectReason::TooManyEvents,
                              "too many events (" + std::to_string(out.events.size()) + " > " +
                              std::to_string(config_.max_events) + ")");
    }

    try {
        out.stats = compute_stats(request.prompt, out.events);
    } catch (const EncodingError& e) {
        throw ValidationError(RejectReason::InvalidPrompt, e.what());
    } catch (const InvalidKeyError& e) {
        throw ValidationError(RejectReason::InvalidKey, e.what());
    }
    if (out.stats.normalized_prompt.empty()) {
        throw ValidationError(RejectReason::EmptyPrompt, "prompt is empty after normalization");
    }

    if (config_.enforce_timing) {
        try {
            enforce_timing(evaluate_timing(out.stats, out.events), out.stats, out.events);
        } catch (const TimingError& e) {
            throw ValidationError(RejectReason::TimingViolation, e.what());
        }
    }

    // Computed here, never accepted from the caller
    out.prompt_digest = prompt_digest(out.stats.normalized_prompt);

    TYPING_PROOF_DEBUG_COUT("[validator] challenge_id=" << request.challenge_id
                            << " events=" << out.events.size()
                            << " typed=\"" << out.stats.reconstructed_text << "\""
                            << " prompt_hash=" << out.prompt_digest << std::endl);
    return out;
}

} // namespace typing_proof
