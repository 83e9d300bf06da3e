#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "tagchunk/chunk_type.hpp"

namespace tagchunk {

enum class ChunkErrc : uint8_t {
    InputTooSmall = 1,  // fewer than kMetadataBytes
    InvalidTagType,     // tag fails ChunkType::is_valid()
    BoundsError,        // declared length runs past the buffer
    InvalidCrc,         // stored crc != computed crc
    PayloadNotUtf8      // data_as_string() on binary payload
};

struct ChunkError {
    ChunkErrc code;
    uint32_t expected_crc{};  // InvalidCrc only
    uint32_t actual_crc{};    // InvalidCrc only
    std::string message() const;
};

class Chunk;
using ChunkResult = std::variant<Chunk, ChunkError>;
using TextResult = std::variant<std::string, ChunkError>;

class Chunk {
public:
    // Tag validity is not checked here. payload.size() must satisfy
    // payload_fits(); as_bytes() would otherwise write a truncated length.
    Chunk(const ChunkType& type, std::vector<uint8_t> payload);

    // Parses one chunk from the front of the buffer. Bytes after the crc
    // are ignored. On any error no Chunk is produced.
    static ChunkResult parse(const uint8_t* data, size_t len);
    static ChunkResult parse(const std::vector<uint8_t>& bytes);

    size_t length() const { return payload_.size(); }
    const ChunkType& chunk_type() const { return type_; }
    const std::vector<uint8_t>& data() const { return payload_; }

    // CRC-32 over (type bytes || payload), recomputed on every call.
    uint32_t crc() const;

    TextResult data_as_string() const;

    std::vector<uint8_t> as_bytes() const;
    size_t encoded_size() const;

    // Multi-line summary for humans; not a wire format.
    std::string describe() const;

private:
    ChunkType type_;
    std::vector<uint8_t> payload_;
};

} // namespace tagchunk
