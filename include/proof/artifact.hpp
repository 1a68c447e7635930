#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace typing_proof {

/**
 * ProofArtifact - what the external prover returns
 * 
 * The seal is opaque. The journal_* fields are the prover's own statement of
 * the public outputs and are only used for the binding cross-check.
 */
struct ProofArtifact {
    uint64_t score = 0;
    uint32_t wpm_x100 = 0;
    uint32_t accuracy_bps = 0;
    uint32_t duration_ms = 0;
    std::string image_id_hex;
    std::string journal_hash_hex;
    std::string seal_hex;

    std::optional<uint32_t> journal_challenge_id;
    std::optional<std::string> journal_player_hex;
    std::optional<std::string> journal_prompt_hash_hex;

    // Seal length in bytes (half the hex length, ignoring a 0x prefix)
    size_t seal_bytes() const;
};

/**
 * Parses the proving host's stdout: one "key: value" per line, e.g.
 * 
 *   image_id: <hex>
 *   seal: <hex>
 *   journal_sha256: <hex>
 *   journal.challenge_id: 1
 *   journal.player_pubkey: <hex>
 *   journal.prompt_hash: <hex>
 *   journal.score: 12345
 *   journal.wpm_x100: 6789
 *   journal.accuracy_bps: 9100
 *   journal.duration_ms: 1200
 * 
 * Lines without ':' are ignored. Throws ProverError if a metric is missing
 * or a numeric field does not parse.
 */
ProofArtifact parse_prover_output(const std::string& stdout_text);

} // namespace typing_proof
