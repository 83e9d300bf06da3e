#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "tagchunk/logging.hpp"

namespace tagchunk {

struct ToolConfig {
    std::string command;
    std::string file;
    std::string type;
    std::string message;
    std::string out_file;        // encode only; defaults to file
    std::vector<uint8_t> key;    // empty: payload stored in the clear
    LogLevel log_level{LogLevel::INFO};
};

int run_encode(const ToolConfig& cfg);
int run_decode(const ToolConfig& cfg, std::ostream& out);
int run_remove(const ToolConfig& cfg);
int run_print(const ToolConfig& cfg, std::ostream& out);

} // namespace tagchunk
