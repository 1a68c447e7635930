#include <gtest/gtest.h>
#include "config/config.hpp"
#include "common/errors.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <unistd.h>

using namespace typing_proof;

class ServerConfigTest : public ::testing::Test {
protected:
    std::function<const char*(const char*)> env_from(const std::map<std::string, std::string>& vars) {
        env_ = vars;
        return [this](const char* name) -> const char* {
            auto it = env_.find(name);
            return it == env_.end() ? nullptr : it->second.c_str();
        };
    }

    std::map<std::string, std::string> env_;
};

TEST_F(ServerConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.validator.max_prompt_chars, 256u);
    EXPECT_EQ(config.validator.max_events, 4096u);
    EXPECT_EQ(config.validator.max_body_bytes, 1000000u);
    EXPECT_TRUE(config.validator.enforce_timing);
    EXPECT_FALSE(config.binding.max_seal_bytes.has_value());
    EXPECT_TRUE(config.binding.check_metrics);
    EXPECT_EQ(config.host_prover.timeout.count(), 600000);
    EXPECT_EQ(config.host_prover.receipt_kind, "groth16");
    EXPECT_EQ(config.prover_kind, ProverKind::Host);
    EXPECT_EQ(config.challenge.id, 1u);
    EXPECT_EQ(config.challenge.prompt, "the quick brown fox jumps over the lazy dog");
}

TEST_F(ServerConfigTest, ApplyJson) {
    ServerConfig config;
    config.apply_json({
        {"max_prompt_chars", 64},
        {"max_seal_bytes", 4096},
        {"enforce_timing", false},
        {"prover", "reference"},
        {"verifier_selector_hex", "a1b2c3d4"},
        {"challenge", {{"id", 2}, {"prompt", "Pack my box"}}},
    });
    EXPECT_EQ(config.validator.max_prompt_chars, 64u);
    EXPECT_EQ(*config.binding.max_seal_bytes, 4096u);
    EXPECT_FALSE(config.validator.enforce_timing);
    EXPECT_EQ(config.prover_kind, ProverKind::Reference);
    EXPECT_EQ(config.verifier_selector_hex, "a1b2c3d4");
    EXPECT_EQ(config.challenge.id, 2u);
    EXPECT_EQ(config.challenge.prompt, "Pack my box");

    config.apply_json({{"max_seal_bytes", nullptr}});
    EXPECT_FALSE(config.binding.max_seal_bytes.has_value());
}

TEST_F(ServerConfigTest, ApplyJsonRejectsBadValues) {
    ServerConfig config;
    EXPECT_THROW(config.apply_json(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(config.apply_json({{"max_events", "many"}}), ConfigError);
    EXPECT_THROW(config.apply_json({{"prover", "gpu"}}), ConfigError);
    EXPECT_THROW(config.apply_json({{"verifier_selector_hex", "abc"}}), ConfigError);
    EXPECT_THROW(config.apply_json({{"challenge", {{"prompt", "   "}}}}), ConfigError);
}

TEST_F(ServerConfigTest, ApplyEnv) {
    ServerConfig config;
    config.apply_env(env_from({
        {"TYPING_PROOF_MAX_EVENTS", "100"},
        {"TYPING_PROOF_ENFORCE_TIMING", "false"},
        {"TYPING_PROOF_MAX_SEAL_BYTES", "512"},
        {"TYPING_PROOF_PROVER_TIMEOUT_MS", "2500"},
        {"TYPING_PROOF_PROVER", "reference"},
        {"CHALLENGE_ID", "12"},
        {"CHALLENGE_PROMPT", "Sphinx of black quartz"},
    }));
    EXPECT_EQ(config.validator.max_events, 100u);
    EXPECT_FALSE(config.validator.enforce_timing);
    EXPECT_EQ(*config.binding.max_seal_bytes, 512u);
    EXPECT_EQ(config.host_prover.timeout.count(), 2500);
    EXPECT_EQ(config.prover_kind, ProverKind::Reference);
    EXPECT_EQ(config.challenge.id, 12u);
    EXPECT_EQ(config.challenge.prompt, "Sphinx of black quartz");
}

TEST_F(ServerConfigTest, ApplyEnvRejectsBadValues) {
    ServerConfig config;
    EXPECT_THROW(config.apply_env(env_from({{"TYPING_PROOF_MAX_EVENTS", "-1"}})), ConfigError);
    EXPECT_THROW(config.apply_env(env_from({{"CHALLENGE_ID", "4294967296"}})), ConfigError);
    EXPECT_THROW(config.apply_env(env_from({{"TYPING_PROOF_CHECK_METRICS", "maybe"}})), ConfigError);
}

TEST_F(ServerConfigTest, EnvOverridesFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("typing_proof_config_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream f(path);
        f << R"({"max_events": 10, "challenge": {"id": 3}})";
    }
    ServerConfig config;
    config.load_file(path.string());
    config.apply_env(env_from({{"TYPING_PROOF_MAX_EVENTS", "20"}}));
    std::filesystem::remove(path);

    EXPECT_EQ(config.validator.max_events, 20u);
    EXPECT_EQ(config.challenge.id, 3u);
}

TEST_F(ServerConfigTest, LoadFileErrors) {
    ServerConfig config;
    EXPECT_THROW(config.load_file("/nonexistent/typing_proof.json"), ConfigError);

    auto path = std::filesystem::temp_directory_path() /
                ("typing_proof_bad_config_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    EXPECT_THROW(config.load_file(path.string()), ConfigError);
    std::filesystem::remove(path);
}

TEST_F(ServerConfigTest, ToJsonReflectsValues) {
    ServerConfig config;
    config.binding.max_seal_bytes = 99;
    nlohmann::json j = config.to_json();
    EXPECT_EQ(j["max_seal_bytes"], 99);
    EXPECT_EQ(j["prover"], "host");
    EXPECT_EQ(j["challenge"]["id"], 1);
}
