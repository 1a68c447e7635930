#include <iostream>
#include <fstream>
#include <sstream>
#include <optional>
#include <string>
#include <vector>
#include <csignal>
#include <nlohmann/json.hpp>

#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/hex.hpp"
#include "proof/journal.hpp"
#include "prompt/normalizer.hpp"
#include "proof_server/client.hpp"
#include "replay/codec.hpp"
#include "scoring/scoring.hpp"
#include "types/replay_event.hpp"
#include "validation/account_address.hpp"
#include "validation/request_validator.hpp"

using namespace typing_proof;

static void print_usage(const char* program) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << program << " hash <prompt>\n";
    std::cerr << "  " << program << " fixture <prompt> [dt_ms]\n";
    std::cerr << "  " << program << " score <prompt> <events>\n";
    std::cerr << "  " << program << " journal <journal_hex>\n";
    std::cerr << "  " << program << " request <challenge_id> <player> <prompt> <events>\n";
    std::cerr << "  " << program << " submit <address> <body.json | ->\n";
    std::cerr << "  " << program << " challenge <address>\n";
    std::cerr << "\n";
    std::cerr << "  events:  encoded replay as hex (0x... or bare hex digits) or base64\n";
    std::cerr << "  player:  64 hex digits or a G... account address\n";
    std::cerr << "  address: HOST:PORT or unix:PATH of a running typing_proof_server\n";
}

static bool looks_like_hex(const std::string& s) {
    if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return true;
    if (s.empty() || s.size() % 2 != 0) return false;
    return s.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos;
}

// Hex is tried first; a bare-hex base64 string must be passed with a
// trailing '=' pad or converted to hex.
static std::vector<uint8_t> parse_events_bytes(const std::string& text) {
    if (looks_like_hex(text)) {
        return hex::decode(text);
    }
    return base64::decode_strict(text, "events");
}

static std::vector<ReplayEvent> perfect_fixture(const std::string& prompt, uint16_t dt_ms) {
    const std::string normalized = normalize_prompt(prompt);
    std::vector<ReplayEvent> events;
    events.reserve(normalized.size());
    for (char c : normalized) {
        events.push_back({dt_ms, key_for_char(c)});
    }
    return events;
}

static void print_stats(const ComputedStats& stats) {
    std::cout << "normalized_prompt: " << stats.normalized_prompt << std::endl;
    std::cout << "reconstructed: " << stats.reconstructed_text << std::endl;
    std::cout << "duration_ms: " << stats.duration_ms << std::endl;
    std::cout << "typed_chars: " << stats.typed_chars << std::endl;
    std::cout << "correct_chars: " << stats.correct_chars << std::endl;
    std::cout << "accuracy_bps: " << stats.accuracy_bps << std::endl;
    std::cout << "wpm_x100: " << stats.wpm_x100 << std::endl;
    std::cout << "score: " << stats.score << std::endl;
    std::cout << "min_duration_ms: " << stats.min_duration_ms << std::endl;
}

static int cmd_hash(const std::string& prompt) {
    std::cout << "normalized_prompt: " << normalize_prompt(prompt) << std::endl;
    std::cout << "prompt_hash: " << prompt_hash_hex(prompt) << std::endl;
    return 0;
}

static int cmd_fixture(const std::string& prompt, const std::string& dt_text) {
    // make_event range-checks dt against the wire width
    const uint16_t dt_ms = make_event(std::stoll(dt_text), KEY_A).dt_ms;
    std::vector<ReplayEvent> events = perfect_fixture(prompt, dt_ms);
    std::vector<uint8_t> encoded = encode_events(events);
    std::cout << "events: " << events.size() << std::endl;
    std::cout << "events_hex: " << hex::encode(encoded) << std::endl;
    std::cout << "events_base64: " << base64::encode(encoded) << std::endl;
    return 0;
}

static int cmd_score(const std::string& prompt, const std::string& events_text) {
    std::vector<ReplayEvent> events = decode_events(parse_events_bytes(events_text));
    ComputedStats stats = compute_stats(prompt, events);
    print_stats(stats);

    // Advisory only: the server and the proving guest reject these
    TimingReport report = evaluate_timing(stats, events);
    for (const std::string& warning : report.violations(stats, events)) {
        std::cerr << "[score] WARNING: " << warning << std::endl;
    }
    std::cout << "timing_ok: " << (report.ok() ? "true" : "false") << std::endl;
    return 0;
}

static int cmd_journal(const std::string& journal_hex) {
    Journal journal = Journal::decode(hex::decode(journal_hex));
    std::cout << "journal_sha256: " << journal.hash().to_hex() << std::endl;
    std::cout << "journal.challenge_id: " << journal.challenge_id << std::endl;
    std::cout << "journal.player_pubkey: " << hex::encode(journal.player.data(), journal.player.size()) << std::endl;
    std::cout << "journal.player_address: " << encode_account_address(journal.player) << std::endl;
    std::cout << "journal.prompt_hash: " << journal.prompt_hash.to_hex() << std::endl;
    std::cout << "journal.score: " << journal.score << std::endl;
    std::cout << "journal.wpm_x100: " << journal.wpm_x100 << std::endl;
    std::cout << "journal.accuracy_bps: " << journal.accuracy_bps << std::endl;
    std::cout << "journal.duration_ms: " << journal.duration_ms << std::endl;
    return 0;
}

static int cmd_request(const std::string& challenge_id, const std::string& player,
                       const std::string& prompt, const std::string& events_text) {
    // Same rules the server applies to a string challenge_id
    const uint32_t id = RequestValidator::parse_challenge_id(nlohmann::json(challenge_id));
    if (!parse_player_identity(player)) {
        std::cerr << "Error: player must be 64 hex digits or a G... account address" << std::endl;
        return 1;
    }
    std::vector<uint8_t> encoded = parse_events_bytes(events_text);
    // Fails early on a malformed replay instead of at the server
    decode_events(encoded);

    nlohmann::json body = {
        {"challenge_id", id},
        {"player_pubkey", player},
        {"prompt", prompt},
        {"events_bytes_base64", base64::encode(encoded)},
    };
    std::cout << body.dump(2) << std::endl;
    return 0;
}

static int print_response(const std::optional<proof_server::ServerResponse>& response) {
    if (!response) {
        std::cerr << "Error: no response from server" << std::endl;
        return 1;
    }
    nlohmann::json body = nlohmann::json::parse(response->body, nullptr, false);
    std::cout << "status: " << static_cast<uint32_t>(response->status) << std::endl;
    if (body.is_discarded()) {
        std::cout << response->body << std::endl;
    } else {
        std::cout << body.dump(2) << std::endl;
    }
    return response->status == proof_server::ResponseStatus::Ok ? 0 : 2;
}

static int cmd_submit(const std::string& address, const std::string& body_path) {
    std::string body;
    if (body_path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        body = ss.str();
    } else {
        std::ifstream f(body_path, std::ios::binary);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open request body: " + body_path);
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        body = ss.str();
    }

    proof_server::Client client(address);
    return print_response(client.prove(1, body));
}

static int cmd_challenge(const std::string& address) {
    proof_server::Client client(address);
    return print_response(client.current_challenge(1));
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Write errors are reported by the socket helpers
    std::signal(SIGPIPE, SIG_IGN);

    const std::string command = argv[1];
    const int nargs = argc - 2;

    try {
        if (command == "hash" && nargs == 1) {
            return cmd_hash(argv[2]);
        } else if (command == "fixture" && (nargs == 1 || nargs == 2)) {
            return cmd_fixture(argv[2], nargs == 2 ? argv[3] : "100");
        } else if (command == "score" && nargs == 2) {
            return cmd_score(argv[2], argv[3]);
        } else if (command == "journal" && nargs == 1) {
            return cmd_journal(argv[2]);
        } else if (command == "request" && nargs == 4) {
            return cmd_request(argv[2], argv[3], argv[4], argv[5]);
        } else if (command == "submit" && nargs == 2) {
            return cmd_submit(argv[2], argv[3]);
        } else if (command == "challenge" && nargs == 1) {
            return cmd_challenge(argv[2]);
        } else if (command == "--help" || command == "-h" || command == "help") {
            print_usage(argv[0]);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
