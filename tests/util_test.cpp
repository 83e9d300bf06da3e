#include "tagchunk/logging.hpp"
#include "tagchunk/protocol.hpp"
#include "tagchunk/util.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <string>

using namespace tagchunk;

namespace {

bool utf8(const std::string& s) {
    return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

} // namespace

TEST(Crc32, CheckValue) {
    const std::string s = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(s.data()), s.size()), 0xCBF43926u);
    EXPECT_EQ(crc32(nullptr, 0), 0u);
}

TEST(Crc32, IncrementalMatchesOneShot) {
    const std::string s = "RuStThis is where your secret message will be!";
    const auto* p = reinterpret_cast<const uint8_t*>(s.data());
    uint32_t c = crc32_update(crc32_init(), p, 4);
    c = crc32_update(c, p + 4, s.size() - 4);
    EXPECT_EQ(crc32_final(c), crc32(p, s.size()));
    EXPECT_EQ(crc32_final(c), 2882656334u);
}

TEST(BigEndian, ReadAppend) {
    std::vector<uint8_t> out;
    append_be32(out, 0x0A0B0C0Du);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], 0x0A);
    EXPECT_EQ(out[3], 0x0D);
    EXPECT_EQ(read_be32(out.data()), 0x0A0B0C0Du);
}

TEST(BigEndian, PayloadLimitIsLengthFieldWidth) {
    EXPECT_TRUE(payload_fits(0));
    EXPECT_TRUE(payload_fits(0xFFFFFFFFull));
    EXPECT_FALSE(payload_fits(0x100000000ull));
}

TEST(Hex, RoundTrip) {
    std::vector<uint8_t> b = hex_to_bytes("00ff10Ab");
    ASSERT_EQ(b.size(), 4u);
    EXPECT_EQ(b[1], 0xFF);
    EXPECT_EQ(b[3], 0xAB);
    EXPECT_EQ(bytes_to_hex(b.data(), b.size()), "00ff10ab");
}

TEST(Hex, Rejects) {
    EXPECT_TRUE(hex_to_bytes("").empty());
    EXPECT_TRUE(hex_to_bytes("abc").empty());
    EXPECT_TRUE(hex_to_bytes("zz").empty());
}

TEST(Utf8, Accepts) {
    EXPECT_TRUE(utf8(""));
    EXPECT_TRUE(utf8("plain ascii"));
    EXPECT_TRUE(utf8("\xE2\x82\xAC"));
    EXPECT_TRUE(utf8("\xF0\x9F\x98\x80"));
    EXPECT_TRUE(utf8("\xEF\xBF\xBD"));
}

TEST(Utf8, Rejects) {
    EXPECT_FALSE(utf8("\xFF"));
    EXPECT_FALSE(utf8("\xC0\x80"));          // overlong NUL
    EXPECT_FALSE(utf8("\xE0\x80\xAF"));      // overlong '/'
    EXPECT_FALSE(utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(utf8("\xF4\x90\x80\x80"));  // above U+10FFFF
    EXPECT_FALSE(utf8("\xE2\x82"));          // truncated
    EXPECT_FALSE(utf8("\x80"));              // lone continuation
}

TEST(LogLevel, Parse) {
    LogLevel l = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", l));
    EXPECT_EQ(l, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", l));
    EXPECT_EQ(l, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud", l));
    EXPECT_EQ(l, LogLevel::ERROR);
}


TEST(File, WriteRead) {
    std::string path = ::testing::TempDir() + "tagchunk_util_test.bin";
    std::vector<uint8_t> data = {0x00, 0x01, 0xFE, 0xFF};
    ASSERT_TRUE(write_file(path, data));
    std::vector<uint8_t> back;
    ASSERT_TRUE(read_file(path, back));
    EXPECT_EQ(back, data);
    std::remove(path.c_str());
    EXPECT_FALSE(read_file(path, back));
}
