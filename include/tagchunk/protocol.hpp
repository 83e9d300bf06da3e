#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace tagchunk {

// [length:4][type:4][payload:length][crc:4], integers big-endian.
constexpr size_t kLengthBytes = 4;
constexpr size_t kTypeBytes = 4;
constexpr size_t kCrcBytes = 4;
constexpr size_t kMetadataBytes = kLengthBytes + kTypeBytes + kCrcBytes;
static_assert(kMetadataBytes == 12, "chunk metadata must be 12 bytes");

// The length field is a u32, so no payload may exceed this.
constexpr uint64_t kMaxPayloadBytes = 0xFFFFFFFFull;
constexpr bool payload_fits(uint64_t n) { return n <= kMaxPayloadBytes; }

// CRC-32/IEEE (reflected 0xEDB88320, init and final xor 0xFFFFFFFF).
uint32_t crc32(const uint8_t* data, size_t len);

// Feed more bytes into a running CRC. Start from crc32_init() and finish
// with crc32_final().
constexpr uint32_t crc32_init() { return ~0u; }
uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t len);
constexpr uint32_t crc32_final(uint32_t crc) { return ~crc; }

uint32_t read_be32(const uint8_t* p);
void append_be32(std::vector<uint8_t>& out, uint32_t v);

} // namespace tagchunk
