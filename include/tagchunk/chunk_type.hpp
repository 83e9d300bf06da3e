#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tagchunk {

enum class TagErrc : uint8_t {
    LengthError = 1,      // text was not exactly 4 bytes
    InvalidCharacter = 2  // text held a byte outside A-Z / a-z
};

struct TagError {
    TagErrc code;
    size_t actual_len{};  // LengthError only
    std::string message() const;
};

class ChunkType;
using TagResult = std::variant<ChunkType, TagError>;

/*
    ChunkType

    Four raw bytes naming a chunk. Each flag is the ASCII case of one byte:

      byte | flag               | set when
      -----+--------------------+----------
        0  | critical           | uppercase
        1  | public             | uppercase
        2  | reserved bit valid | uppercase  (also gates is_valid)
        3  | safe to copy       | lowercase

    from_bytes() and from_text() do NOT validate alike. from_bytes() keeps any
    4 bytes, so a ChunkType may hold digits or non-ASCII; is_valid() is what
    reports that. from_text() rejects non-alphabetic input up front. Chunk
    parsing checks is_valid() whichever way the tag was built.
*/
class ChunkType {
public:
    using Bytes = std::array<uint8_t, 4>;

    static constexpr size_t kCriticalByte = 0;
    static constexpr size_t kPublicByte = 1;
    static constexpr size_t kReservedByte = 2;
    static constexpr size_t kSafeToCopyByte = 3;

    static ChunkType from_bytes(const Bytes& bytes);
    static TagResult from_text(const std::string& s);

    Bytes bytes() const { return bytes_; }

    bool is_valid() const;
    bool is_critical() const;
    bool is_public() const;
    bool is_reserved_bit_valid() const;
    bool is_safe_to_copy() const;

    // nullopt when the bytes are not UTF-8 (only reachable via from_bytes).
    std::optional<std::string> to_string() const;

    bool operator==(const ChunkType& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const ChunkType& o) const { return bytes_ != o.bytes_; }

private:
    explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}
    Bytes bytes_;
};

} // namespace tagchunk
