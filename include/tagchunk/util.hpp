#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tagchunk {

// Empty result on odd length or a non-hex digit.
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const uint8_t* data, size_t len);

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
bool is_valid_utf8(const uint8_t* data, size_t len);

bool read_file(const std::string& path, std::vector<uint8_t>& out);
bool write_file(const std::string& path, const std::vector<uint8_t>& data);

} // namespace tagchunk
