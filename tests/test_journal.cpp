#include <gtest/gtest.h>
#include "proof/journal.hpp"
#include "proof/artifact.hpp"
#include "proof/prover.hpp"
#include "prompt/normalizer.hpp"
#include "replay/codec.hpp"
#include "common/hex.hpp"
#include "common/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace typing_proof;

namespace {

PlayerIdentity filled_player(uint8_t value) {
    PlayerIdentity player;
    player.fill(value);
    return player;
}

std::vector<uint8_t> perfect_replay(const std::string& text, uint16_t dt_ms) {
    std::vector<ReplayEvent> events;
    for (char c : text) {
        events.push_back({dt_ms, key_for_char(c)});
    }
    return encode_events(events);
}

} // anonymous namespace

class JournalTest : public ::testing::Test {
protected:
    Journal sample() const {
        Journal j;
        j.challenge_id = 7;
        j.player = filled_player(0x11);
        j.prompt_hash = prompt_digest("abc");
        j.score = 12000;
        j.wpm_x100 = 12000;
        j.accuracy_bps = 10000;
        j.duration_ms = 300;
        return j;
    }
};

TEST_F(JournalTest, EncodedLayout) {
    auto bytes = sample().encode();
    ASSERT_EQ(bytes.size(), 88u);
    // challenge_id u32 LE
    EXPECT_EQ(bytes[0], 7);
    EXPECT_EQ(bytes[1], 0);
    EXPECT_EQ(bytes[4], 0x11);
    EXPECT_EQ(bytes[35], 0x11);
    // prompt hash starts at 36
    EXPECT_EQ(bytes[36], 0xba);
    // score u64 LE at 68: 12000 = 0x2ee0
    EXPECT_EQ(bytes[68], 0xe0);
    EXPECT_EQ(bytes[69], 0x2e);
    // duration_ms at 84: 300 = 0x012c
    EXPECT_EQ(bytes[84], 0x2c);
    EXPECT_EQ(bytes[85], 0x01);
}

TEST_F(JournalTest, HashOfEncodedBytes) {
    EXPECT_EQ(sample().hash().to_hex(),
              "738f5101fec6160dd8ea1142ee5e87f7dffd0eccb22673cbb63c242cceb1fd9c");
}

TEST_F(JournalTest, DecodeRoundTrip) {
    Journal j = sample();
    auto bytes = j.encode();
    EXPECT_EQ(Journal::decode(std::vector<uint8_t>(bytes.begin(), bytes.end())), j);
}

TEST_F(JournalTest, DecodeWrongLength) {
    EXPECT_THROW(Journal::decode(std::vector<uint8_t>(87)), FormatError);
    EXPECT_THROW(Journal::decode(std::vector<uint8_t>(89)), FormatError);
}

class ProverOutputTest : public ::testing::Test {
protected:
    std::string full_output() const {
        return "image_id: 0xAAAA\n"
               "seal: 0xdeadbeef\n"
               "journal_sha256: 738f5101fec6160dd8ea1142ee5e87f7dffd0eccb22673cbb63c242cceb1fd9c\n"
               "journal.challenge_id: 7\n"
               "journal.player_pubkey: " + std::string(64, '1') + "\n"
               "journal.prompt_hash: ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\n"
               "journal.score: 12000\n"
               "journal.wpm_x100: 12000\n"
               "journal.accuracy_bps: 10000\n"
               "journal.duration_ms: 300\n";
    }
};

TEST_F(ProverOutputTest, ParsesAllFields) {
    ProofArtifact a = parse_prover_output("Proving...\n" + full_output());
    EXPECT_EQ(a.image_id_hex, "0xAAAA");
    EXPECT_EQ(a.seal_hex, "0xdeadbeef");
    EXPECT_EQ(a.seal_bytes(), 4u);
    EXPECT_EQ(a.score, 12000u);
    EXPECT_EQ(a.wpm_x100, 12000u);
    EXPECT_EQ(a.accuracy_bps, 10000u);
    EXPECT_EQ(a.duration_ms, 300u);
    ASSERT_TRUE(a.journal_challenge_id.has_value());
    EXPECT_EQ(*a.journal_challenge_id, 7u);
    ASSERT_TRUE(a.journal_player_hex.has_value());
    EXPECT_EQ(*a.journal_player_hex, std::string(64, '1'));
}

TEST_F(ProverOutputTest, MissingScoreIsProverFailure) {
    EXPECT_THROW(parse_prover_output("image_id: aa\njournal_sha256: bb\n"), ProverError);
}

TEST_F(ProverOutputTest, OptionalFieldsAbsent) {
    ProofArtifact a = parse_prover_output(
        "image_id: aa\njournal_sha256: bb\njournal.score: 1\n"
        "journal.wpm_x100: 2\njournal.accuracy_bps: 3\njournal.duration_ms: 4\n");
    EXPECT_EQ(a.seal_hex, "");
    EXPECT_FALSE(a.journal_challenge_id.has_value());
    EXPECT_FALSE(a.journal_player_hex.has_value());
    EXPECT_FALSE(a.journal_prompt_hash_hex.has_value());
}

TEST_F(ProverOutputTest, NonNumericMetric) {
    std::string out = full_output();
    out.replace(out.find("journal.wpm_x100: 12000"), 23, "journal.wpm_x100: fast");
    EXPECT_THROW(parse_prover_output(out), ProverError);
}

TEST_F(ProverOutputTest, OutOfRangeNumbersRejected) {
    // A wrapped challenge id could otherwise match the request
    std::string out = full_output();
    out.replace(out.find("journal.challenge_id: 7"), 23, "journal.challenge_id: 4294967297");
    EXPECT_THROW(parse_prover_output(out), ProverError);

    out = full_output();
    out.replace(out.find("journal.wpm_x100: 12000"), 23, "journal.wpm_x100: 4294967301");
    EXPECT_THROW(parse_prover_output(out), ProverError);

    out = full_output();
    out.replace(out.find("journal.score: 12000"), 20, "journal.score: -1");
    EXPECT_THROW(parse_prover_output(out), ProverError);

    out = full_output();
    out.replace(out.find("journal.score: 12000"), 20, "journal.score: 18446744073709551616");
    EXPECT_THROW(parse_prover_output(out), ProverError);
}

class ReferenceProverTest : public ::testing::Test {
protected:
    ProofRequest request(const std::string& prompt, const std::string& typed, uint16_t dt_ms) const {
        ProofRequest r;
        r.challenge_id = 7;
        r.player = filled_player(0x11);
        r.prompt = prompt;
        r.encoded_replay = perfect_replay(typed, dt_ms);
        return r;
    }
};

TEST_F(ReferenceProverTest, JournalMatchesGuestComputation) {
    Journal j = compute_journal(request("ABC", "abc", 100));
    EXPECT_EQ(j.challenge_id, 7u);
    EXPECT_EQ(j.prompt_hash, prompt_digest("abc"));
    EXPECT_EQ(j.score, 12000u);
    EXPECT_EQ(j.wpm_x100, 12000u);
    EXPECT_EQ(j.accuracy_bps, 10000u);
    EXPECT_EQ(j.duration_ms, 300u);
}

TEST_F(ReferenceProverTest, GuestChecksRejectFastReplay) {
    EXPECT_THROW(compute_journal(request("abc", "abc", 5)), TimingError);
    EXPECT_THROW(compute_journal(request("   ", "abc", 100)), TimingError);
}

TEST_F(ReferenceProverTest, ArtifactDeclaresJournal) {
    ReferenceProver prover;
    ProofArtifact a = prover.prove(request("abc", "abc", 100));
    EXPECT_EQ(a.journal_hash_hex, "738f5101fec6160dd8ea1142ee5e87f7dffd0eccb22673cbb63c242cceb1fd9c");
    EXPECT_EQ(a.seal_hex, "");
    EXPECT_EQ(a.image_id_hex, std::string(64, '0'));
    EXPECT_EQ(*a.journal_prompt_hash_hex, prompt_digest("abc").to_hex());
}

TEST_F(ReferenceProverTest, RejectionBecomesProverError) {
    ReferenceProver prover;
    EXPECT_THROW(prover.prove(request("abc", "abc", 5)), ProverError);
}

// Runs a shell script standing in for the proving host
class HostProcessProverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("typing_proof_host_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_script(const std::string& name, const std::string& body) {
        auto path = dir_ / name;
        std::ofstream f(path);
        f << "#!/bin/sh\n" << body;
        f.close();
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

    HostProverConfig config_for(const std::string& binary) const {
        HostProverConfig config;
        config.binary_path = binary;
        config.timeout = std::chrono::milliseconds(5000);
        return config;
    }

    ProofRequest sample_request() const {
        ProofRequest r;
        r.challenge_id = 3;
        r.player = filled_player(0xab);
        r.prompt = "ab";
        r.encoded_replay = perfect_replay("ab", 100);
        return r;
    }

    // Hex of the 0xab-filled player
    static std::string ab_hex() {
        std::string out;
        for (int i = 0; i < 32; ++i) out += "ab";
        return out;
    }

    std::filesystem::path dir_;
};

TEST_F(HostProcessProverTest, BuildArguments) {
    auto args = HostProcessProver::build_arguments(sample_request());
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0], "3");
    EXPECT_EQ(args[1], ab_hex());
    EXPECT_EQ(args[2], "ab");
    EXPECT_EQ(args[3], "02006400006400" "01");
}

TEST_F(HostProcessProverTest, ParsesHostOutput) {
    std::string script = write_script("host_ok.sh",
        "echo \"image_id: $TYPING_PROOF_RECEIPT_KIND\"\n"
        "echo \"seal: 00ff\"\n"
        "echo \"journal_sha256: 11\"\n"
        "echo \"journal.challenge_id: $1\"\n"
        "echo \"journal.player_pubkey: $2\"\n"
        "echo \"journal.score: 24000\"\n"
        "echo \"journal.wpm_x100: 24000\"\n"
        "echo \"journal.accuracy_bps: 10000\"\n"
        "echo \"journal.duration_ms: 200\"\n");
    HostProcessProver prover(config_for(script));
    ProofArtifact a = prover.prove(sample_request());
    EXPECT_EQ(a.score, 24000u);
    EXPECT_EQ(a.seal_hex, "00ff");
    EXPECT_EQ(*a.journal_challenge_id, 3u);
    EXPECT_EQ(*a.journal_player_hex, ab_hex());
    if (std::getenv("TYPING_PROOF_RECEIPT_KIND") == nullptr) {
        EXPECT_EQ(a.image_id_hex, "groth16");
    }
}

TEST_F(HostProcessProverTest, NonZeroExitIsProverError) {
    std::string script = write_script("host_fail.sh", "echo 'guest panicked' >&2\nexit 3\n");
    HostProcessProver prover(config_for(script));
    try {
        prover.prove(sample_request());
        FAIL() << "expected ProverError";
    } catch (const ProverError& e) {
        EXPECT_NE(std::string(e.what()).find("guest panicked"), std::string::npos);
    }
}

TEST_F(HostProcessProverTest, TimeoutKillsChild) {
    std::string script = write_script("host_slow.sh", "exec sleep 10\n");
    HostProverConfig config = config_for(script);
    config.timeout = std::chrono::milliseconds(200);
    HostProcessProver prover(config);
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(prover.prove(sample_request()), ProverError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(HostProcessProverTest, MissingBinary) {
    HostProverConfig config = config_for((dir_ / "nope").string());
    EXPECT_THROW({ HostProcessProver prover(config); }, ProverError);
}
