#include "tagchunk/chunk_type.hpp"
#include "tagchunk/util.hpp"
#include <algorithm>

namespace tagchunk {

static bool is_ascii_upper(uint8_t b) { return b >= 'A' && b <= 'Z'; }
static bool is_ascii_lower(uint8_t b) { return b >= 'a' && b <= 'z'; }
static bool is_ascii_alpha(uint8_t b) {
  return is_ascii_upper(b) || is_ascii_lower(b);
}

std::string TagError::message() const {
  switch (code) {
  case TagErrc::LengthError:
    return "expected 4 bytes but received " + std::to_string(actual_len) +
           " when creating chunk type";
  case TagErrc::InvalidCharacter:
    return "chunk type contains one or more non-alphabetic characters";
  }
  return "unknown chunk type error";
}

ChunkType ChunkType::from_bytes(const Bytes &bytes) { return ChunkType(bytes); }

TagResult ChunkType::from_text(const std::string &s) {
  if (s.size() != 4)
    return TagError{TagErrc::LengthError, s.size()};
  if (!std::all_of(s.begin(), s.end(),
                   [](char c) { return is_ascii_alpha((uint8_t)c); }))
    return TagError{TagErrc::InvalidCharacter, s.size()};
  return from_bytes({(uint8_t)s[0], (uint8_t)s[1], (uint8_t)s[2],
                     (uint8_t)s[3]});
}

bool ChunkType::is_valid() const {
  return std::all_of(bytes_.begin(), bytes_.end(), is_ascii_alpha) &&
         is_reserved_bit_valid();
}

bool ChunkType::is_critical() const {
  return is_ascii_upper(bytes_[kCriticalByte]);
}

bool ChunkType::is_public() const { return is_ascii_upper(bytes_[kPublicByte]); }

bool ChunkType::is_reserved_bit_valid() const {
  return is_ascii_upper(bytes_[kReservedByte]);
}

bool ChunkType::is_safe_to_copy() const {
  return is_ascii_lower(bytes_[kSafeToCopyByte]);
}

std::optional<std::string> ChunkType::to_string() const {
  if (!is_valid_utf8(bytes_.data(), bytes_.size()))
    return std::nullopt;
  return std::string(bytes_.begin(), bytes_.end());
}

} // namespace tagchunk
