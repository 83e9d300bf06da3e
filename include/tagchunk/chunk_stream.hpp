#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "tagchunk/chunk.hpp"

namespace tagchunk {

struct StreamParse {
    std::vector<Chunk> chunks;
    // Set when parsing stopped before the end of the buffer.
    std::optional<ChunkError> error;
    size_t error_offset{};
};

// Parses back-to-back chunks, advancing by encoded_size() each time.
// Stops at the first chunk that fails to parse.
StreamParse split_chunks(const uint8_t* data, size_t len);
StreamParse split_chunks(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> join_chunks(const std::vector<Chunk>& chunks);

std::optional<size_t> find_chunk(const std::vector<Chunk>& chunks, const ChunkType& type);

} // namespace tagchunk
