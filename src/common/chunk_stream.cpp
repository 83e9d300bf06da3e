#include "tagchunk/chunk_stream.hpp"
#include "tagchunk/logging.hpp"

namespace tagchunk {

StreamParse split_chunks(const uint8_t *data, size_t len) {
  StreamParse out;
  size_t off = 0;
  while (off < len) {
    ChunkResult r = Chunk::parse(data + off, len - off);
    if (auto *err = std::get_if<ChunkError>(&r)) {
      Logger::instance().log(LogLevel::WARN, "chunk at offset %zu: %s", off,
                             err->message().c_str());
      out.error = *err;
      out.error_offset = off;
      break;
    }
    Chunk &c = std::get<Chunk>(r);
    off += c.encoded_size();
    out.chunks.push_back(std::move(c));
  }
  return out;
}

StreamParse split_chunks(const std::vector<uint8_t> &bytes) {
  return split_chunks(bytes.data(), bytes.size());
}

std::vector<uint8_t> join_chunks(const std::vector<Chunk> &chunks) {
  size_t total = 0;
  for (const auto &c : chunks)
    total += c.encoded_size();
  std::vector<uint8_t> out;
  out.reserve(total);
  for (const auto &c : chunks) {
    auto b = c.as_bytes();
    out.insert(out.end(), b.begin(), b.end());
  }
  return out;
}

std::optional<size_t> find_chunk(const std::vector<Chunk> &chunks,
                                 const ChunkType &type) {
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].chunk_type() == type)
      return i;
  }
  return std::nullopt;
}

} // namespace tagchunk
