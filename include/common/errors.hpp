#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace typing_proof {

/**
 * Error taxonomy
 * 
 * Every failure raised by the replay codec, prompt normalizer, scoring engine,
 * request validator and binding checker derives from typing_proof::Error so a
 * caller can catch the whole family at a transport boundary while still
 * distinguishing kinds.
 * 
 * Only ProverError is eligible for retry; everything else is attributable to
 * the input (or to the prover's output, for BindingError) and must not be
 * retried.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed binary or base64 input
class FormatError : public Error {
public:
    explicit FormatError(const std::string& what) : Error(what) {}
};

// Value outside a declared bound (event count, dt, key code)
class RangeError : public Error {
public:
    explicit RangeError(const std::string& what) : Error(what) {}
};

// Prompt text that is not ASCII
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& what) : Error(what) {}
};

// Key code outside the closed alphabet during replay
class InvalidKeyError : public Error {
public:
    InvalidKeyError(uint32_t key, size_t index)
        : Error("invalid key " + std::to_string(key) + " at event " + std::to_string(index)),
          key_(key), index_(index) {}

    uint32_t key() const { return key_; }
    size_t index() const { return index_; }

private:
    uint32_t key_;
    size_t index_;
};

// Replay that breaks the anti-cheat timing bounds under a rejecting policy
class TimingError : public Error {
public:
    explicit TimingError(const std::string& what) : Error(what) {}
};

// Prover output that disagrees with the request it was produced for
class BindingError : public Error {
public:
    explicit BindingError(const std::string& what) : Error(what) {}
};

// Artifact larger than the configured transport limit
class OversizedArtifactError : public Error {
public:
    OversizedArtifactError(size_t actual_bytes, size_t limit_bytes)
        : Error("seal is " + std::to_string(actual_bytes) + " bytes, exceeds limit of " +
                std::to_string(limit_bytes) + " bytes"),
          actual_bytes_(actual_bytes), limit_bytes_(limit_bytes) {}

    size_t actual_bytes() const { return actual_bytes_; }
    size_t limit_bytes() const { return limit_bytes_; }

private:
    size_t actual_bytes_;
    size_t limit_bytes_;
};

// External prover failure (spawn, exit status, timeout, unparsable output)
class ProverError : public Error {
public:
    explicit ProverError(const std::string& what) : Error(what) {}
};

// Invalid configuration value
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace typing_proof
