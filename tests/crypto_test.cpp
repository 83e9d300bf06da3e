#include "tagchunk/chunk.hpp"
#include "tagchunk/crypto.hpp"
#include "tagchunk/util.hpp"
#include <gtest/gtest.h>

using namespace tagchunk;

namespace {

const std::vector<uint8_t> kKey = hex_to_bytes(
    "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff");

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(SodiumSealer, SealOpen) {
    SodiumSealer s;
    ASSERT_TRUE(s.ready());
    s.set_key(kKey);
    std::vector<uint8_t> buf = bytes("hidden message");
    ASSERT_TRUE(s.seal(buf));
    EXPECT_EQ(buf.size(), 14 + SodiumSealer::overhead());
    EXPECT_NE(buf, bytes("hidden message"));
    ASSERT_TRUE(s.open(buf));
    EXPECT_EQ(buf, bytes("hidden message"));
}

TEST(SodiumSealer, EmptyPayload) {
    SodiumSealer s;
    s.set_key(kKey);
    std::vector<uint8_t> buf;
    ASSERT_TRUE(s.seal(buf));
    EXPECT_EQ(buf.size(), SodiumSealer::overhead());
    ASSERT_TRUE(s.open(buf));
    EXPECT_TRUE(buf.empty());
}

TEST(SodiumSealer, NoncesDiffer) {
    SodiumSealer s;
    s.set_key(kKey);
    std::vector<uint8_t> a = bytes("same"), b = bytes("same");
    ASSERT_TRUE(s.seal(a));
    ASSERT_TRUE(s.seal(b));
    EXPECT_NE(a, b);
}

TEST(SodiumSealer, WrongKeyFails) {
    SodiumSealer s;
    s.set_key(kKey);
    std::vector<uint8_t> buf = bytes("hidden");
    ASSERT_TRUE(s.seal(buf));

    SodiumSealer other;
    other.set_key(bytes("a short passphrase"));
    EXPECT_FALSE(other.open(buf));
}

TEST(SodiumSealer, ShortKeyIsHashed) {
    SodiumSealer a, b;
    a.set_key(bytes("passphrase"));
    b.set_key(bytes("passphrase"));
    std::vector<uint8_t> buf = bytes("hidden");
    ASSERT_TRUE(a.seal(buf));
    ASSERT_TRUE(b.open(buf));
    EXPECT_EQ(buf, bytes("hidden"));
}

TEST(SodiumSealer, TamperAndTruncationFail) {
    SodiumSealer s;
    s.set_key(kKey);
    std::vector<uint8_t> buf = bytes("hidden");
    ASSERT_TRUE(s.seal(buf));

    std::vector<uint8_t> flipped = buf;
    flipped.back() ^= 0x01;
    EXPECT_FALSE(s.open(flipped));

    std::vector<uint8_t> cut(buf.begin(), buf.begin() + 10);
    EXPECT_FALSE(s.open(cut));
}

TEST(SodiumSealer, SealedPayloadSurvivesChunkRoundTrip) {
    SodiumSealer s;
    s.set_key(kKey);
    std::vector<uint8_t> payload = bytes("meet at noon");
    ASSERT_TRUE(s.seal(payload));

    Chunk c(std::get<ChunkType>(ChunkType::from_text("ruSt")), payload);
    ChunkResult r = Chunk::parse(c.as_bytes());
    ASSERT_TRUE(std::holds_alternative<Chunk>(r));

    std::vector<uint8_t> back = std::get<Chunk>(r).data();
    ASSERT_TRUE(s.open(back));
    EXPECT_EQ(back, bytes("meet at noon"));
}
