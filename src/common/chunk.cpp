#include "tagchunk/chunk.hpp"
#include "tagchunk/logging.hpp"
#include "tagchunk/protocol.hpp"
#include "tagchunk/util.hpp"
#include <sstream>
#include <utility>

namespace tagchunk {

std::string ChunkError::message() const {
  switch (code) {
  case ChunkErrc::InputTooSmall:
    return "input is too small to be a chunk (" +
           std::to_string(kMetadataBytes) + " bytes minimum)";
  case ChunkErrc::InvalidTagType:
    return "invalid chunk type";
  case ChunkErrc::BoundsError:
    return "declared chunk length exceeds the available bytes";
  case ChunkErrc::InvalidCrc:
    return "expected crc " + std::to_string(expected_crc) +
           " does not match actual crc " + std::to_string(actual_crc);
  case ChunkErrc::PayloadNotUtf8:
    return "chunk data is not valid UTF-8";
  }
  return "unknown chunk error";
}

Chunk::Chunk(const ChunkType &type, std::vector<uint8_t> payload)
    : type_(type), payload_(std::move(payload)) {}

ChunkResult Chunk::parse(const std::vector<uint8_t> &bytes) {
  return parse(bytes.data(), bytes.size());
}

ChunkResult Chunk::parse(const uint8_t *data, size_t len) {
  if (len < kMetadataBytes) {
    Logger::instance().log(LogLevel::DEBUG, "chunk rejected: %zu bytes", len);
    return ChunkError{ChunkErrc::InputTooSmall};
  }
  size_t off = 0;
  uint32_t declared = read_be32(data + off);
  off += kLengthBytes;

  ChunkType type = ChunkType::from_bytes(
      {data[off], data[off + 1], data[off + 2], data[off + 3]});
  off += kTypeBytes;
  if (!type.is_valid()) {
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk rejected: invalid type %02x%02x%02x%02x",
                           data[4], data[5], data[6], data[7]);
    return ChunkError{ChunkErrc::InvalidTagType};
  }

  size_t remaining = len - off;
  if (declared > remaining || remaining - declared < kCrcBytes) {
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk rejected: length %u with %zu bytes left",
                           (unsigned)declared, remaining);
    return ChunkError{ChunkErrc::BoundsError};
  }
  std::vector<uint8_t> payload(data + off, data + off + declared);
  off += declared;
  uint32_t expected = read_be32(data + off);

  Chunk chunk(type, std::move(payload));
  uint32_t actual = chunk.crc();
  if (expected != actual) {
    Logger::instance().log(LogLevel::DEBUG,
                           "chunk rejected: crc expected=%u actual=%u",
                           (unsigned)expected, (unsigned)actual);
    return ChunkError{ChunkErrc::InvalidCrc, expected, actual};
  }
  return chunk;
}

uint32_t Chunk::crc() const {
  auto tb = type_.bytes();
  uint32_t c = crc32_update(crc32_init(), tb.data(), tb.size());
  c = crc32_update(c, payload_.data(), payload_.size());
  return crc32_final(c);
}

TextResult Chunk::data_as_string() const {
  if (!is_valid_utf8(payload_.data(), payload_.size()))
    return ChunkError{ChunkErrc::PayloadNotUtf8};
  return std::string(payload_.begin(), payload_.end());
}

size_t Chunk::encoded_size() const { return kMetadataBytes + payload_.size(); }

std::vector<uint8_t> Chunk::as_bytes() const {
  std::vector<uint8_t> out;
  out.reserve(encoded_size());
  append_be32(out, (uint32_t)payload_.size());
  auto tb = type_.bytes();
  out.insert(out.end(), tb.begin(), tb.end());
  out.insert(out.end(), payload_.begin(), payload_.end());
  append_be32(out, crc());
  return out;
}

std::string Chunk::describe() const {
  auto tb = type_.bytes();
  std::ostringstream os;
  os << "Chunk {\n";
  os << "  Length: " << length() << "\n";
  os << "  Type: " << type_.to_string().value_or(bytes_to_hex(tb.data(), tb.size()))
     << "\n";
  os << "  Data: " << payload_.size() << " bytes\n";
  os << "  Crc: " << crc() << "\n";
  os << "}\n";
  return os.str();
}

} // namespace tagchunk
