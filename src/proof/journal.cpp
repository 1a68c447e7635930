#include "proof/journal.hpp"
#include "hash/sha256.hpp"
#include "common/errors.hpp"

#include <cstring>
#include <string>

namespace typing_proof {

namespace {

class JournalWriter {
public:
    explicit JournalWriter(uint8_t* out) : out_(out) {}

    void u32(uint32_t v) {
        for (size_t i = 0; i < 4; ++i) out_[offset_++] = static_cast<uint8_t>(v >> (8 * i));
    }
    void u64(uint64_t v) {
        for (size_t i = 0; i < 8; ++i) out_[offset_++] = static_cast<uint8_t>(v >> (8 * i));
    }
    void bytes32(const uint8_t* data) {
        std::memcpy(out_ + offset_, data, 32);
        offset_ += 32;
    }

private:
    uint8_t* out_;
    size_t offset_ = 0;
};

class JournalReader {
public:
    explicit JournalReader(const uint8_t* in) : in_(in) {}

    uint32_t u32() {
        uint32_t v = 0;
        for (size_t i = 0; i < 4; ++i) v |= static_cast<uint32_t>(in_[offset_++]) << (8 * i);
        return v;
    }
    uint64_t u64() {
        uint64_t v = 0;
        for (size_t i = 0; i < 8; ++i) v |= static_cast<uint64_t>(in_[offset_++]) << (8 * i);
        return v;
    }
    std::array<uint8_t, 32> bytes32() {
        std::array<uint8_t, 32> out;
        std::memcpy(out.data(), in_ + offset_, 32);
        offset_ += 32;
        return out;
    }

private:
    const uint8_t* in_;
    size_t offset_ = 0;
};

} // anonymous namespace

std::array<uint8_t, Journal::ENCODED_LEN> Journal::encode() const {
    std::array<uint8_t, ENCODED_LEN> out{};
    JournalWriter w(out.data());
    w.u32(challenge_id);
    w.bytes32(player.data());
    w.bytes32(prompt_hash.bytes().data());
    w.u64(score);
    w.u32(wpm_x100);
    w.u32(accuracy_bps);
    w.u32(duration_ms);
    return out;
}

Journal Journal::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.size() != ENCODED_LEN) {
        throw FormatError("journal length mismatch: expected " + std::to_string(ENCODED_LEN) +
                          " bytes, got " + std::to_string(bytes.size()));
    }
    JournalReader r(bytes.data());
    Journal j;
    j.challenge_id = r.u32();
    j.player = r.bytes32();
    j.prompt_hash = Digest(r.bytes32());
    j.score = r.u64();
    j.wpm_x100 = r.u32();
    j.accuracy_bps = r.u32();
    j.duration_ms = r.u32();
    return j;
}

Digest Journal::hash() const {
    auto bytes = encode();
    return Sha256::hash(bytes.data(), bytes.size());
}

bool Journal::operator==(const Journal& rhs) const {
    return challenge_id == rhs.challenge_id &&
           player == rhs.player &&
           prompt_hash == rhs.prompt_hash &&
           score == rhs.score &&
           wpm_x100 == rhs.wpm_x100 &&
           accuracy_bps == rhs.accuracy_bps &&
           duration_ms == rhs.duration_ms;
}

} // namespace typing_proof
