#include "commands.hpp"
#include "tagchunk/chunk.hpp"
#include "tagchunk/chunk_stream.hpp"
#include "tagchunk/crypto.hpp"
#include "tagchunk/protocol.hpp"
#include "tagchunk/util.hpp"
#include <cstddef>
#include <fstream>
#include <ostream>

namespace tagchunk {

static bool load_stream(const std::string &path, bool allow_missing,
                        std::vector<Chunk> &chunks) {
  std::vector<uint8_t> bytes;
  if (!read_file(path, bytes)) {
    if (allow_missing && !std::ifstream(path)) {
      Logger::instance().log(LogLevel::INFO, "%s does not exist, starting empty",
                             path.c_str());
      return true;
    }
    Logger::instance().log(LogLevel::ERROR, "cannot read %s", path.c_str());
    return false;
  }
  StreamParse sp = split_chunks(bytes);
  if (sp.error) {
    Logger::instance().log(LogLevel::ERROR, "%s: bad chunk at offset %zu: %s",
                           path.c_str(), sp.error_offset,
                           sp.error->message().c_str());
    return false;
  }
  chunks = std::move(sp.chunks);
  return true;
}

static bool parse_type(const std::string &text, ChunkType &out) {
  TagResult r = ChunkType::from_text(text);
  if (auto *err = std::get_if<TagError>(&r)) {
    Logger::instance().log(LogLevel::ERROR, "bad chunk type '%s': %s",
                           text.c_str(), err->message().c_str());
    return false;
  }
  out = std::get<ChunkType>(r);
  return true;
}

int run_encode(const ToolConfig &cfg) {
  ChunkType type = ChunkType::from_bytes({0, 0, 0, 0});
  if (!parse_type(cfg.type, type))
    return 1;
  if (!type.is_valid()) {
    Logger::instance().log(LogLevel::ERROR,
                           "chunk type '%s' needs an uppercase third letter",
                           cfg.type.c_str());
    return 1;
  }
  std::vector<Chunk> chunks;
  if (!load_stream(cfg.file, true, chunks))
    return 1;

  std::vector<uint8_t> payload(cfg.message.begin(), cfg.message.end());
  if (!cfg.key.empty()) {
    SodiumSealer sealer;
    sealer.set_key(cfg.key);
    if (!sealer.seal(payload)) {
      Logger::instance().log(LogLevel::ERROR, "sealing message failed");
      return 1;
    }
  }
  if (!payload_fits(payload.size())) {
    Logger::instance().log(LogLevel::ERROR, "message too large: %zu bytes",
                           payload.size());
    return 1;
  }
  chunks.emplace_back(type, std::move(payload));

  const std::string &dst = cfg.out_file.empty() ? cfg.file : cfg.out_file;
  if (!write_file(dst, join_chunks(chunks))) {
    Logger::instance().log(LogLevel::ERROR, "cannot write %s", dst.c_str());
    return 1;
  }
  Logger::instance().log(LogLevel::INFO, "wrote %s chunk (%zu bytes) to %s",
                         cfg.type.c_str(), chunks.back().length(), dst.c_str());
  return 0;
}

int run_decode(const ToolConfig &cfg, std::ostream &out) {
  ChunkType type = ChunkType::from_bytes({0, 0, 0, 0});
  if (!parse_type(cfg.type, type))
    return 1;
  std::vector<Chunk> chunks;
  if (!load_stream(cfg.file, false, chunks))
    return 1;
  auto idx = find_chunk(chunks, type);
  if (!idx) {
    Logger::instance().log(LogLevel::ERROR, "no %s chunk in %s",
                           cfg.type.c_str(), cfg.file.c_str());
    return 1;
  }

  const Chunk &found = chunks[*idx];
  if (!cfg.key.empty()) {
    std::vector<uint8_t> payload = found.data();
    SodiumSealer sealer;
    sealer.set_key(cfg.key);
    if (!sealer.open(payload)) {
      Logger::instance().log(LogLevel::ERROR,
                             "cannot open sealed %s chunk (wrong key?)",
                             cfg.type.c_str());
      return 1;
    }
    if (!is_valid_utf8(payload.data(), payload.size())) {
      Logger::instance().log(LogLevel::ERROR, "message is not valid UTF-8");
      return 1;
    }
    out << std::string(payload.begin(), payload.end()) << std::endl;
    return 0;
  }

  TextResult text = found.data_as_string();
  if (auto *err = std::get_if<ChunkError>(&text)) {
    Logger::instance().log(LogLevel::ERROR, "%s", err->message().c_str());
    return 1;
  }
  out << std::get<std::string>(text) << std::endl;
  return 0;
}

int run_remove(const ToolConfig &cfg) {
  ChunkType type = ChunkType::from_bytes({0, 0, 0, 0});
  if (!parse_type(cfg.type, type))
    return 1;
  std::vector<Chunk> chunks;
  if (!load_stream(cfg.file, false, chunks))
    return 1;
  auto idx = find_chunk(chunks, type);
  if (!idx) {
    Logger::instance().log(LogLevel::ERROR, "no %s chunk in %s",
                           cfg.type.c_str(), cfg.file.c_str());
    return 1;
  }
  chunks.erase(chunks.begin() + (std::ptrdiff_t)*idx);
  if (!write_file(cfg.file, join_chunks(chunks))) {
    Logger::instance().log(LogLevel::ERROR, "cannot write %s",
                           cfg.file.c_str());
    return 1;
  }
  Logger::instance().log(LogLevel::INFO, "removed %s chunk from %s",
                         cfg.type.c_str(), cfg.file.c_str());
  return 0;
}

int run_print(const ToolConfig &cfg, std::ostream &out) {
  std::vector<Chunk> chunks;
  if (!load_stream(cfg.file, false, chunks))
    return 1;
  for (const auto &c : chunks)
    out << c.describe();
  Logger::instance().log(LogLevel::DEBUG, "%zu chunks in %s", chunks.size(),
                         cfg.file.c_str());
  return 0;
}

} // namespace tagchunk
