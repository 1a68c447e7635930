#pragma once

/**
 * Server configuration
 * 
 * Resolved once at startup and passed by value into the components that need
 * it. Sources, lowest priority first:
 *   1. built-in defaults (the member initializers below)
 *   2. a JSON file (--config PATH)
 *   3. environment variables
 * 
 * JSON keys mirror the member names, e.g.
 *   { "max_prompt_chars": 256, "max_seal_bytes": 4096,
 *     "challenge": { "id": 2, "prompt": "pack my box" } }
 * 
 * Environment variables:
 *   TYPING_PROOF_MAX_PROMPT_CHARS, TYPING_PROOF_MAX_EVENTS,
 *   TYPING_PROOF_MAX_BODY_BYTES, TYPING_PROOF_MAX_SEAL_BYTES,
 *   TYPING_PROOF_ENFORCE_TIMING, TYPING_PROOF_CHECK_METRICS,
 *   TYPING_PROOF_HOST_BIN, TYPING_PROOF_PROVER_TIMEOUT_MS,
 *   TYPING_PROOF_PROVER (host | reference), TYPING_PROOF_VERIFIER_SELECTOR,
 *   CHALLENGE_ID, CHALLENGE_PROMPT
 */

#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

#include "proof/prover.hpp"
#include "validation/binding_checker.hpp"
#include "validation/request_validator.hpp"

namespace typing_proof {

struct ChallengeConfig {
    uint32_t id = 1;
    std::string prompt = "the quick brown fox jumps over the lazy dog";
};

enum class ProverKind {
    Host,
    Reference,
};

struct ServerConfig {
    ValidatorConfig validator;
    BindingConfig binding;
    HostProverConfig host_prover;
    ProverKind prover_kind = ProverKind::Host;
    ChallengeConfig challenge;
    // Hex prefix prepended to the seal on handoff (e.g. a 4-byte verifier selector)
    std::string verifier_selector_hex;

    // Applies keys present in `json`; throws ConfigError on a wrong type or value
    void apply_json(const nlohmann::json& json);
    void load_file(const std::string& path);

    // Applies variables that `getenv` returns; the default reads the process environment
    void apply_env(const std::function<const char*(const char*)>& getenv);
    void apply_env();

    nlohmann::json to_json() const;

    // Defaults, then optional file, then environment
    static ServerConfig resolve(const std::string& config_path);
};

} // namespace typing_proof
