#include "commands.hpp"
#include "tagchunk/util.hpp"
#include <cstdlib>
#include <iostream>

using namespace tagchunk;

static void usage() {
  std::cerr << "usage:\n"
               "  tagchunk encode <file> <type> <message> [--key hex] [--out file]\n"
               "  tagchunk decode <file> <type> [--key hex]\n"
               "  tagchunk remove <file> <type>\n"
               "  tagchunk print <file>\n"
               "options: --log-level trace|debug|info|warn|error\n";
}

int main(int argc, char **argv) {
  ToolConfig cfg;
  std::string key_hex;
  std::string level = "info";
  std::vector<std::string> pos;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--key")
      key_hex = next(i);
    else if (a == "--out")
      cfg.out_file = next(i);
    else if (a == "--log-level")
      level = next(i);
    else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else
      pos.push_back(a);
  }

  if (!parse_log_level(level, cfg.log_level)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(cfg.log_level);

  if (!key_hex.empty()) {
    cfg.key = hex_to_bytes(key_hex);
    if (cfg.key.empty()) {
      std::cerr << "bad key" << std::endl;
      return 1;
    }
  }

  if (pos.size() < 2) {
    usage();
    return 1;
  }
  cfg.command = pos[0];
  cfg.file = pos[1];

  if (cfg.command == "encode" && pos.size() == 4) {
    cfg.type = pos[2];
    cfg.message = pos[3];
    return run_encode(cfg);
  }
  if (cfg.command == "decode" && pos.size() == 3) {
    cfg.type = pos[2];
    return run_decode(cfg, std::cout);
  }
  if (cfg.command == "remove" && pos.size() == 3) {
    cfg.type = pos[2];
    return run_remove(cfg);
  }
  if (cfg.command == "print" && pos.size() == 2)
    return run_print(cfg, std::cout);

  usage();
  return 1;
}
