#include "proof/artifact.hpp"
#include "common/errors.hpp"

#include <limits>
#include <map>
#include <sstream>

namespace typing_proof {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

uint64_t parse_unsigned(const std::string& key, const std::string& value, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ProverError("prover output " + key + " is not an unsigned integer: '" + value + "'");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ProverError("prover output " + key + " out of range: " + value);
    }
    if (parsed > max) {
        throw ProverError("prover output " + key + " out of range: " + value);
    }
    return parsed;
}

uint32_t parse_u32(const std::string& key, const std::string& value) {
    return static_cast<uint32_t>(parse_unsigned(key, value, std::numeric_limits<uint32_t>::max()));
}

const std::string& require(const std::map<std::string, std::string>& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        throw ProverError("prover output missing " + key);
    }
    return it->second;
}

} // anonymous namespace

size_t ProofArtifact::seal_bytes() const {
    size_t digits = seal_hex.size();
    if (digits >= 2 && seal_hex[0] == '0' && (seal_hex[1] == 'x' || seal_hex[1] == 'X')) {
        digits -= 2;
    }
    return digits / 2;
}

ProofArtifact parse_prover_output(const std::string& stdout_text) {
    std::map<std::string, std::string> fields;
    std::istringstream in(stdout_text);
    std::string line;
    while (std::getline(in, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        fields[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }

    ProofArtifact a;
    a.score = parse_unsigned("journal.score", require(fields, "journal.score"),
                             std::numeric_limits<uint64_t>::max());
    a.wpm_x100 = parse_u32("journal.wpm_x100", require(fields, "journal.wpm_x100"));
    a.accuracy_bps = parse_u32("journal.accuracy_bps", require(fields, "journal.accuracy_bps"));
    a.duration_ms = parse_u32("journal.duration_ms", require(fields, "journal.duration_ms"));
    a.image_id_hex = require(fields, "image_id");
    a.journal_hash_hex = require(fields, "journal_sha256");
    // An empty seal is legitimate for dev-mode receipts
    auto seal = fields.find("seal");
    if (seal != fields.end()) {
        a.seal_hex = seal->second;
    }

    auto cid = fields.find("journal.challenge_id");
    if (cid != fields.end()) {
        a.journal_challenge_id = parse_u32("journal.challenge_id", cid->second);
    }
    auto player = fields.find("journal.player_pubkey");
    if (player != fields.end()) {
        a.journal_player_hex = player->second;
    }
    auto prompt_hash = fields.find("journal.prompt_hash");
    if (prompt_hash != fields.end()) {
        a.journal_prompt_hash_hex = prompt_hash->second;
    }
    return a;
}

} // namespace typing_proof
