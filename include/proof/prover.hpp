#pragma once

/**
 * Prover collaborators
 * 
 * The proving engine is external; this header defines the seam the pipeline
 * calls through and three ways of filling it:
 * 
 *   HostProcessProver - runs the proving host binary as a child process
 *   ReferenceProver   - runs the guest's computation in-process and returns
 *                       an unsealed artifact (dev mode, tests)
 *   CallbackProver    - wraps a function, for tests and embedding
 * 
 * Every prover failure surfaces as ProverError, the only retriable error.
 */

#include <chrono>
#include <functional>
#include <utility>
#include <string>
#include <vector>

#include "proof/artifact.hpp"
#include "proof/journal.hpp"
#include "proof/request.hpp"
#include "types/digest.hpp"

namespace typing_proof {

class Prover {
public:
    virtual ~Prover() = default;

    // Blocking, single-shot. Throws ProverError on any non-success outcome.
    virtual ProofArtifact prove(const ProofRequest& request) = 0;

    virtual std::string name() const = 0;
};

/**
 * Computes the journal exactly as the proving guest does, including the
 * guest's hard checks: non-empty prompt, every dt >= MIN_DT_MS, key codes in
 * range, duration >= min_duration_ms and non-zero. Throws the core error for
 * the first failed check.
 */
Journal compute_journal(const ProofRequest& request);

class ReferenceProver : public Prover {
public:
    explicit ReferenceProver(Digest image_id = Digest::zero());

    ProofArtifact prove(const ProofRequest& request) override;
    std::string name() const override { return "reference"; }

private:
    Digest image_id_;
};

struct HostProverConfig {
    // Empty: resolve via TYPING_PROOF_HOST_BIN, then next to the executable
    std::string binary_path;
    std::chrono::milliseconds timeout{600'000};
    // Passed to the child unless already set in the environment
    std::string receipt_kind = "groth16";
    std::string risc0_prover = "local";
};

class HostProcessProver : public Prover {
public:
    explicit HostProcessProver(HostProverConfig config);

    ProofArtifact prove(const ProofRequest& request) override;
    std::string name() const override { return "host:" + binary_; }

    // Command-line arguments handed to the host binary (without argv[0])
    static std::vector<std::string> build_arguments(const ProofRequest& request);

    const std::string& binary() const { return binary_; }

private:
    HostProverConfig config_;
    std::string binary_;
};

// Explicit path, else TYPING_PROOF_HOST_BIN, else known locations relative to
// the running executable. Throws ProverError if nothing exists.
std::string resolve_host_binary(const std::string& explicit_path);

class CallbackProver : public Prover {
public:
    using ProveFunction = std::function<ProofArtifact(const ProofRequest&)>;

    explicit CallbackProver(ProveFunction fn, std::string name = "callback")
        : fn_(std::move(fn)), name_(std::move(name)) {}

    ProofArtifact prove(const ProofRequest& request) override { return fn_(request); }
    std::string name() const override { return name_; }

private:
    ProveFunction fn_;
    std::string name_;
};

} // namespace typing_proof
