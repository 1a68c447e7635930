#include <gtest/gtest.h>
#include "proof_server/client.hpp"
#include "proof_server/handler.hpp"
#include "proof_server/pipeline.hpp"
#include "proof_server/protocol.hpp"
#include "proof_server/server.hpp"
#include "prompt/normalizer.hpp"
#include "replay/codec.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"

#include <filesystem>
#include <thread>
#include <sys/socket.h>
#include <unistd.h>

using namespace typing_proof;
using namespace typing_proof::proof_server;

namespace {

std::string submission_body(const std::string& prompt, const std::string& typed, uint16_t dt_ms,
                            uint32_t challenge_id = 1) {
    std::vector<ReplayEvent> events;
    for (char c : typed) {
        events.push_back({dt_ms, key_for_char(c)});
    }
    return nlohmann::json{
        {"challenge_id", challenge_id},
        {"player_pubkey", std::string(64, 'e')},
        {"prompt", prompt},
        {"events_bytes_base64", base64::encode(encode_events(events))},
    }.dump();
}

} // anonymous namespace

class SubmissionPipelineTest : public ::testing::Test {
protected:
    SubmissionPipeline make_pipeline(Prover& prover, const std::string& selector = "") const {
        return SubmissionPipeline(RequestValidator(ValidatorConfig()),
                                  BindingChecker(BindingConfig()), prover, selector);
    }

    ReferenceProver reference_;
};

TEST_F(SubmissionPipelineTest, AcceptedHandoff) {
    SubmissionPipeline pipeline = make_pipeline(reference_);
    SubmissionOutcome outcome = pipeline.process(submission_body("abc", "abc", 100, 4));
    ASSERT_EQ(outcome.status, OutcomeStatus::Accepted) << outcome.error;
    ASSERT_TRUE(outcome.submission.has_value());

    nlohmann::json j = outcome.submission->to_json();
    EXPECT_EQ(j["score"], 12000);
    EXPECT_EQ(j["wpm_x100"], 12000);
    EXPECT_EQ(j["accuracy_bps"], 10000);
    EXPECT_EQ(j["duration_ms"], 300);
    EXPECT_EQ(j["challenge_id"], 4);
    EXPECT_EQ(j["prompt_hash_hex"], prompt_hash_hex("abc"));
    EXPECT_EQ(j["player_pubkey_hex"], std::string(64, 'e'));
    EXPECT_EQ(j["seal_hex"], "");
    EXPECT_EQ(j["image_id_hex"], std::string(64, '0'));
    EXPECT_EQ(j["journal_sha256_hex"].get<std::string>().size(), 64u);
}

TEST_F(SubmissionPipelineTest, SelectorPrefixesSeal) {
    CallbackProver prover([this](const ProofRequest& request) {
        ProofArtifact a = reference_.prove(request);
        a.seal_hex = "0xCC";
        return a;
    });
    SubmissionPipeline pipeline = make_pipeline(prover, "0xA1B2C3D4");
    SubmissionOutcome outcome = pipeline.process(submission_body("abc", "abc", 100));
    ASSERT_EQ(outcome.status, OutcomeStatus::Accepted) << outcome.error;
    EXPECT_EQ(outcome.submission->seal_hex, "a1b2c3d4cc");
}

TEST_F(SubmissionPipelineTest, RejectedBeforeProving) {
    bool called = false;
    CallbackProver prover([&called](const ProofRequest&) -> ProofArtifact {
        called = true;
        throw ProverError("should not run");
    });
    SubmissionPipeline pipeline = make_pipeline(prover);
    SubmissionOutcome outcome = pipeline.process(submission_body("abc", "abc", 5));
    EXPECT_EQ(outcome.status, OutcomeStatus::Rejected);
    EXPECT_EQ(outcome.reason, "timing_violation");
    EXPECT_FALSE(outcome.retriable());
    EXPECT_FALSE(called);
}

TEST_F(SubmissionPipelineTest, ProverFailureIsRetriable) {
    CallbackProver prover([](const ProofRequest&) -> ProofArtifact {
        throw ProverError("prover timed out after 10 ms");
    });
    SubmissionPipeline pipeline = make_pipeline(prover);
    SubmissionOutcome outcome = pipeline.process(submission_body("abc", "abc", 100));
    EXPECT_EQ(outcome.status, OutcomeStatus::ProverFailed);
    EXPECT_EQ(outcome.reason, "prover");
    EXPECT_TRUE(outcome.retriable());
}

// A prover answering for another prompt must never reach the leaderboard
TEST_F(SubmissionPipelineTest, BindingFailureBlocksHandoff) {
    CallbackProver prover([this](const ProofRequest& request) {
        ProofRequest other = request;
        other.prompt = "abd";
        return reference_.prove(other);
    });
    SubmissionPipeline pipeline = make_pipeline(prover);
    SubmissionOutcome outcome = pipeline.process(submission_body("abc", "abc", 100));
    EXPECT_EQ(outcome.status, OutcomeStatus::BindingFailed);
    EXPECT_EQ(outcome.error, "prompt hash mismatch");
    EXPECT_FALSE(outcome.submission.has_value());
    EXPECT_FALSE(outcome.retriable());
}

TEST_F(SubmissionPipelineTest, OversizedArtifact) {
    CallbackProver prover([this](const ProofRequest& request) {
        ProofArtifact a = reference_.prove(request);
        a.seal_hex = std::string(200, 'a');
        return a;
    });
    BindingConfig binding;
    binding.max_seal_bytes = 64;
    SubmissionPipeline pipeline(RequestValidator(ValidatorConfig()), BindingChecker(binding), prover);
    SubmissionOutcome outcome = pipeline.process(submission_body("abc", "abc", 100));
    EXPECT_EQ(outcome.status, OutcomeStatus::BindingFailed);
    EXPECT_EQ(outcome.reason, "oversized_artifact");
}

class ProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds_), 0);
    }

    void TearDown() override {
        ::close(fds_[0]);
        ::close(fds_[1]);
    }

    int fds_[2] = {-1, -1};
};

TEST_F(ProtocolTest, RequestRoundTrip) {
    ServerRequest request;
    request.job_id = 77;
    request.kind = RequestKind::Prove;
    request.body = R"({"a":1})";
    ASSERT_TRUE(SocketWriter(fds_[0]).write_request(request));

    auto read = SocketReader(fds_[1]).read_request(1024);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->job_id, 77u);
    EXPECT_EQ(read->kind, RequestKind::Prove);
    EXPECT_EQ(read->body, request.body);
    EXPECT_FALSE(read->body_too_large);
}

TEST_F(ProtocolTest, HeaderIsLittleEndian) {
    ServerResponse response = ServerResponse::ok(0x01020304, nlohmann::json::object());
    ASSERT_TRUE(SocketWriter(fds_[0]).write_response(response));

    uint8_t header[16];
    ASSERT_TRUE(SocketReader(fds_[1]).read_exact(header, sizeof(header)));
    // "TPRS"
    EXPECT_EQ(header[0], 0x53);
    EXPECT_EQ(header[3], 0x54);
    EXPECT_EQ(header[8], 0x04);
    EXPECT_EQ(header[11], 0x01);
    EXPECT_EQ(header[12], 2);
}

TEST_F(ProtocolTest, OversizedBodyFlagged) {
    ServerRequest request;
    request.job_id = 1;
    request.body = std::string(100, 'x');
    ASSERT_TRUE(SocketWriter(fds_[0]).write_request(request));

    auto read = SocketReader(fds_[1]).read_request(10);
    ASSERT_TRUE(read.has_value());
    EXPECT_TRUE(read->body_too_large);
    EXPECT_EQ(read->declared_body_len, 100u);
    EXPECT_TRUE(read->body.empty());
}

TEST_F(ProtocolTest, DiscardSkipsBody) {
    ServerRequest first;
    first.job_id = 1;
    first.body = std::string(200'000, 'x');
    ServerRequest second;
    second.job_id = 2;
    second.body = "{}";

    std::thread writer([&]() {
        SocketWriter w(fds_[0]);
        EXPECT_TRUE(w.write_request(first));
        EXPECT_TRUE(w.write_request(second));
    });

    SocketReader reader(fds_[1]);
    auto oversized = reader.read_request(1000);
    ASSERT_TRUE(oversized.has_value());
    ASSERT_TRUE(oversized->body_too_large);
    EXPECT_TRUE(reader.discard(oversized->declared_body_len));

    auto next = reader.read_request(1000);
    writer.join();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->job_id, 2u);
    EXPECT_EQ(next->body, "{}");
}

TEST_F(ProtocolTest, BadMagicRejected) {
    SocketWriter writer(fds_[0]);
    ASSERT_TRUE(writer.write_u32_le(0xdeadbeef));
    ASSERT_TRUE(writer.write_u32_le(PROTOCOL_VERSION));
    EXPECT_FALSE(SocketReader(fds_[1]).read_request(1024).has_value());
}

TEST_F(ProtocolTest, FailureBody) {
    ServerResponse r = ServerResponse::failure(ResponseStatus::Rejected, 5, "prompt exceeds 256 chars",
                                               "prompt_too_long");
    nlohmann::json body = nlohmann::json::parse(r.body);
    EXPECT_EQ(body["error"], "prompt exceeds 256 chars");
    EXPECT_EQ(body["reason"], "prompt_too_long");
}

class ServerTest : public ProtocolTest {
protected:
    ServerTest()
        : pipeline_(RequestValidator(ValidatorConfig()), BindingChecker(BindingConfig()), prover_),
          router_(pipeline_, challenge()) {}

    static ChallengeConfig challenge() {
        ChallengeConfig c;
        c.id = 6;
        c.prompt = "Pack my box";
        return c;
    }

    // Serves one framed request over the socket pair
    std::optional<ServerResponse> exchange(const ServerRequest& request, size_t max_body_bytes = 1'000'000) {
        Server server(max_body_bytes);
        server.set_request_handler([this](const ServerRequest& r) { return router_.handle(r); });
        if (!SocketWriter(fds_[0]).write_request(request)) {
            return std::nullopt;
        }
        server.handle_client(fds_[1]);
        return SocketReader(fds_[0]).read_response();
    }

    static std::string socket_path(const std::string& name) {
        return (std::filesystem::temp_directory_path() /
                ("typing_proof_" + name + "_" + std::to_string(::getpid()) + ".sock")).string();
    }

    ReferenceProver prover_;
    SubmissionPipeline pipeline_;
    RequestRouter router_;
};

TEST_F(ServerTest, CurrentChallenge) {
    ServerRequest request;
    request.job_id = 3;
    request.kind = RequestKind::CurrentChallenge;
    auto response = exchange(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, ResponseStatus::Ok);
    EXPECT_EQ(response->job_id, 3u);
    nlohmann::json body = nlohmann::json::parse(response->body);
    EXPECT_EQ(body["challenge_id"], 6);
    EXPECT_EQ(body["prompt"], "Pack my box");
    EXPECT_EQ(body["prompt_hash_hex"], prompt_hash_hex("pack my box"));
}

TEST_F(ServerTest, ProveAccepted) {
    ServerRequest request;
    request.job_id = 4;
    request.body = submission_body("Pack my box", "pack my box", 90, 6);
    auto response = exchange(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, ResponseStatus::Ok) << response->body;
    nlohmann::json body = nlohmann::json::parse(response->body);
    EXPECT_EQ(body["accuracy_bps"], 10000);
    EXPECT_EQ(body["challenge_id"], 6);
}

TEST_F(ServerTest, ProveRejected) {
    ServerRequest request;
    request.job_id = 5;
    request.body = R"({"challenge_id": 1})";
    auto response = exchange(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, ResponseStatus::Rejected);
    EXPECT_EQ(nlohmann::json::parse(response->body)["reason"], "missing_field");
}

TEST_F(ServerTest, BodyTooLarge) {
    ServerRequest request;
    request.job_id = 8;
    request.body = submission_body("abc", "abc", 100);
    auto response = exchange(request, 16);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, ResponseStatus::Rejected);
    EXPECT_EQ(nlohmann::json::parse(response->body)["reason"], "body_too_large");
}

TEST_F(ServerTest, BodyTooLargeBeyondSocketBuffer) {
    // Several MB cannot sit in the socket buffer; the server has to drain it
    ServerRequest request;
    request.job_id = 10;
    request.body = std::string(4'000'000, 'a');

    std::optional<ServerResponse> response;
    std::thread client([&]() {
        EXPECT_TRUE(SocketWriter(fds_[0]).write_request(request));
        response = SocketReader(fds_[0]).read_response();
    });

    Server server(1'000'000);
    server.set_request_handler([this](const ServerRequest& r) { return router_.handle(r); });
    server.handle_client(fds_[1]);
    client.join();

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, ResponseStatus::Rejected);
    EXPECT_EQ(response->job_id, 10u);
    EXPECT_EQ(nlohmann::json::parse(response->body)["reason"], "body_too_large");
}

TEST_F(ServerTest, HandlerExceptionBecomesError) {
    Server server(1024);
    server.set_request_handler([](const ServerRequest&) -> ServerResponse {
        throw std::runtime_error("boom");
    });
    ServerRequest request;
    request.job_id = 9;
    ASSERT_TRUE(SocketWriter(fds_[0]).write_request(request));
    server.handle_client(fds_[1]);
    auto response = SocketReader(fds_[0]).read_response();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, ResponseStatus::Error);
}

TEST_F(ServerTest, ClientOverUnixSocket) {
    std::string path = socket_path("client");
    Server server(1'000'000);
    server.set_request_handler([this](const ServerRequest& r) { return router_.handle(r); });
    ASSERT_TRUE(server.listen_unix(path));

    std::thread runner([&server]() { server.run(); });

    Client client("unix:" + path);
    auto challenge_response = client.current_challenge(1);
    auto prove_response = client.prove(2, submission_body("Pack my box", "pack my box", 90, 6));

    server.stop();
    runner.join();

    ASSERT_TRUE(challenge_response.has_value());
    EXPECT_EQ(challenge_response->status, ResponseStatus::Ok);
    ASSERT_TRUE(prove_response.has_value());
    EXPECT_EQ(prove_response->status, ResponseStatus::Ok) << prove_response->body;
    EXPECT_EQ(prove_response->job_id, 2u);
}

TEST_F(ServerTest, ClientSeesOversizedRejectionOverUnixSocket) {
    std::string path = socket_path("oversized");
    Server server(1'000'000);
    server.set_request_handler([this](const ServerRequest& r) { return router_.handle(r); });
    ASSERT_TRUE(server.listen_unix(path));

    std::thread runner([&server]() { server.run(); });

    Client client("unix:" + path);
    auto oversized = client.prove(11, std::string(4'000'000, 'a'));
    auto follow_up = client.current_challenge(12);

    server.stop();
    runner.join();

    ASSERT_TRUE(oversized.has_value());
    EXPECT_EQ(oversized->status, ResponseStatus::Rejected);
    EXPECT_EQ(oversized->job_id, 11u);
    EXPECT_EQ(nlohmann::json::parse(oversized->body)["reason"], "body_too_large");
    ASSERT_TRUE(follow_up.has_value());
    EXPECT_EQ(follow_up->status, ResponseStatus::Ok);
}

TEST_F(ServerTest, ListenUnixRejectsOverlongPath) {
    Server server(1024);
    EXPECT_FALSE(server.listen_unix("/tmp/" + std::string(200, 'p') + ".sock"));
    EXPECT_FALSE(server.listen_unix(""));
}

TEST_F(ServerTest, ClientRejectsBadAddress) {
    EXPECT_FALSE(Client("no-port").current_challenge(1).has_value());
    EXPECT_FALSE(Client("127.0.0.1:notaport").current_challenge(1).has_value());
}
