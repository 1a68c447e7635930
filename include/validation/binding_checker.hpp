#pragma once

/**
 * Binding Checker
 * 
 * Fast local gate between the prover and on-chain submission. Confirms that
 * the public outputs an artifact declares belong to the request that produced
 * it. The cryptographic check by the on-chain verifier stays authoritative;
 * this only stops a mismatched artifact from being relayed.
 * 
 * Declared fields that are absent are skipped. Any present field that
 * disagrees throws BindingError and is logged as an integrity incident.
 */

#include <cstddef>
#include <optional>
#include <string>

#include "proof/artifact.hpp"
#include "proof/request.hpp"

namespace typing_proof {

struct BindingConfig {
    // Hard ceiling from the on-chain transaction size
    std::optional<size_t> max_seal_bytes;
    // Compare artifact metrics with the locally computed stats
    bool check_metrics = true;
};

class BindingChecker {
public:
    explicit BindingChecker(BindingConfig config);

    /**
     * Checks, in order: seal size, prompt hash, challenge id, player identity,
     * journal hash (only when all three declared fields are present), and
     * metrics (when check_metrics is set).
     * 
     * Throws OversizedArtifactError or BindingError.
     */
    void check(const ValidatedRequest& validated, const ProofArtifact& artifact) const;

    const BindingConfig& config() const { return config_; }

private:
    [[noreturn]] void fail(const ValidatedRequest& validated, const std::string& what) const;

    BindingConfig config_;
};

} // namespace typing_proof
