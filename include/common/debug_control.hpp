#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace typing_proof {
namespace debug {

/**
 * Debug and Profile Control
 * 
 * Environment variables:
 * - TYPING_PROOF_PROFILE: Enable/disable timing output (validation, prover and
 *   binding durations). Set to "1" or "true" to enable.
 * 
 * - TYPING_PROOF_DEBUG: Enable/disable debug output (decoded replays, computed
 *   stats, raw prover output). Set to "1" or "true" to enable.
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag_enabled("TYPING_PROOF_PROFILE") ? 1 : 0;
    }
    return cached == 1;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag_enabled("TYPING_PROOF_DEBUG") ? 1 : 0;
    }
    return cached == 1;
}

} // namespace debug
} // namespace typing_proof

#define TYPING_PROOF_PROFILE_COUT(expr) \
    do { \
        if (typing_proof::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define TYPING_PROOF_DEBUG_COUT(expr) \
    do { \
        if (typing_proof::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)
