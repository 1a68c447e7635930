#include "config/config.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "prompt/normalizer.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace typing_proof {

namespace {

uint64_t parse_env_unsigned(const char* name, const char* value, uint64_t max) {
    std::string s(value);
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 19) {
        throw ConfigError(std::string(name) + " must be a non-negative integer, got '" + s + "'");
    }
    uint64_t parsed = std::stoull(s);
    if (parsed > max) {
        throw ConfigError(std::string(name) + " out of range: " + s);
    }
    return parsed;
}

bool parse_env_bool(const char* name, const char* value) {
    std::string s(value);
    if (s == "1" || s == "true") return true;
    if (s == "0" || s == "false") return false;
    throw ConfigError(std::string(name) + " must be 1/true or 0/false, got '" + s + "'");
}

ProverKind parse_prover_kind(const std::string& s) {
    if (s == "host") return ProverKind::Host;
    if (s == "reference") return ProverKind::Reference;
    throw ConfigError("prover must be 'host' or 'reference', got '" + s + "'");
}

const char* prover_kind_name(ProverKind kind) {
    return kind == ProverKind::Host ? "host" : "reference";
}

void validate_selector(const std::string& selector) {
    if (selector.empty()) {
        return;
    }
    try {
        hex::decode(selector);
    } catch (const std::invalid_argument&) {
        throw ConfigError("verifier selector must be even-length hex, got '" + selector + "'");
    }
}

void validate_challenge_prompt(const std::string& prompt) {
    try {
        if (normalize_prompt(prompt).empty()) {
            throw ConfigError("challenge prompt is empty after normalization");
        }
    } catch (const EncodingError& e) {
        throw ConfigError(std::string("challenge prompt: ") + e.what());
    }
}

} // anonymous namespace

void ServerConfig::apply_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }
    try {
        if (json.contains("max_prompt_chars")) validator.max_prompt_chars = json["max_prompt_chars"].get<size_t>();
        if (json.contains("max_events")) validator.max_events = json["max_events"].get<size_t>();
        if (json.contains("max_body_bytes")) validator.max_body_bytes = json["max_body_bytes"].get<size_t>();
        if (json.contains("enforce_timing")) validator.enforce_timing = json["enforce_timing"].get<bool>();
        if (json.contains("max_seal_bytes")) {
            if (json["max_seal_bytes"].is_null()) {
                binding.max_seal_bytes.reset();
            } else {
                binding.max_seal_bytes = json["max_seal_bytes"].get<size_t>();
            }
        }
        if (json.contains("check_metrics")) binding.check_metrics = json["check_metrics"].get<bool>();
        if (json.contains("host_bin")) host_prover.binary_path = json["host_bin"].get<std::string>();
        if (json.contains("prover_timeout_ms")) {
            host_prover.timeout = std::chrono::milliseconds(json["prover_timeout_ms"].get<uint64_t>());
        }
        if (json.contains("receipt_kind")) host_prover.receipt_kind = json["receipt_kind"].get<std::string>();
        if (json.contains("prover")) prover_kind = parse_prover_kind(json["prover"].get<std::string>());
        if (json.contains("verifier_selector_hex")) {
            verifier_selector_hex = json["verifier_selector_hex"].get<std::string>();
        }
        if (json.contains("challenge")) {
            const auto& c = json["challenge"];
            if (c.contains("id")) challenge.id = c["id"].get<uint32_t>();
            if (c.contains("prompt")) challenge.prompt = c["prompt"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
    validate_selector(verifier_selector_hex);
    validate_challenge_prompt(challenge.prompt);
}

void ServerConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }
    apply_json(json);
}

void ServerConfig::apply_env(const std::function<const char*(const char*)>& getenv) {
    const uint64_t size_max = std::numeric_limits<size_t>::max();
    if (const char* v = getenv("TYPING_PROOF_MAX_PROMPT_CHARS")) {
        validator.max_prompt_chars = parse_env_unsigned("TYPING_PROOF_MAX_PROMPT_CHARS", v, size_max);
    }
    if (const char* v = getenv("TYPING_PROOF_MAX_EVENTS")) {
        validator.max_events = parse_env_unsigned("TYPING_PROOF_MAX_EVENTS", v, size_max);
    }
    if (const char* v = getenv("TYPING_PROOF_MAX_BODY_BYTES")) {
        validator.max_body_bytes = parse_env_unsigned("TYPING_PROOF_MAX_BODY_BYTES", v, size_max);
    }
    if (const char* v = getenv("TYPING_PROOF_ENFORCE_TIMING")) {
        validator.enforce_timing = parse_env_bool("TYPING_PROOF_ENFORCE_TIMING", v);
    }
    if (const char* v = getenv("TYPING_PROOF_MAX_SEAL_BYTES")) {
        binding.max_seal_bytes = parse_env_unsigned("TYPING_PROOF_MAX_SEAL_BYTES", v, size_max);
    }
    if (const char* v = getenv("TYPING_PROOF_CHECK_METRICS")) {
        binding.check_metrics = parse_env_bool("TYPING_PROOF_CHECK_METRICS", v);
    }
    if (const char* v = getenv("TYPING_PROOF_HOST_BIN")) {
        host_prover.binary_path = v;
    }
    if (const char* v = getenv("TYPING_PROOF_PROVER_TIMEOUT_MS")) {
        host_prover.timeout = std::chrono::milliseconds(
            parse_env_unsigned("TYPING_PROOF_PROVER_TIMEOUT_MS", v, std::numeric_limits<int32_t>::max()));
    }
    if (const char* v = getenv("TYPING_PROOF_PROVER")) {
        prover_kind = parse_prover_kind(v);
    }
    if (const char* v = getenv("TYPING_PROOF_VERIFIER_SELECTOR")) {
        verifier_selector_hex = v;
        validate_selector(verifier_selector_hex);
    }
    if (const char* v = getenv("CHALLENGE_ID")) {
        challenge.id = static_cast<uint32_t>(
            parse_env_unsigned("CHALLENGE_ID", v, std::numeric_limits<uint32_t>::max()));
    }
    if (const char* v = getenv("CHALLENGE_PROMPT")) {
        if (*v) {
            challenge.prompt = v;
            validate_challenge_prompt(challenge.prompt);
        }
    }
}

void ServerConfig::apply_env() {
    apply_env([](const char* name) { return std::getenv(name); });
}

nlohmann::json ServerConfig::to_json() const {
    nlohmann::json j = {
        {"max_prompt_chars", validator.max_prompt_chars},
        {"max_events", validator.max_events},
        {"max_body_bytes", validator.max_body_bytes},
        {"enforce_timing", validator.enforce_timing},
        {"check_metrics", binding.check_metrics},
        {"host_bin", host_prover.binary_path},
        {"prover_timeout_ms", static_cast<uint64_t>(host_prover.timeout.count())},
        {"receipt_kind", host_prover.receipt_kind},
        {"prover", prover_kind_name(prover_kind)},
        {"verifier_selector_hex", verifier_selector_hex},
        {"challenge", {{"id", challenge.id}, {"prompt", challenge.prompt}}},
    };
    if (binding.max_seal_bytes) {
        j["max_seal_bytes"] = *binding.max_seal_bytes;
    } else {
        j["max_seal_bytes"] = nullptr;
    }
    return j;
}

ServerConfig ServerConfig::resolve(const std::string& config_path) {
    ServerConfig config;
    if (!config_path.empty()) {
        config.load_file(config_path);
    }
    config.apply_env();
    return config;
}

} // namespace typing_proof
