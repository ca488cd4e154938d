#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace preflop {

struct CommandLine {
  std::vector<std::string> args;
  std::optional<std::string> config_fn;
  std::optional<uint64_t> seed;
  std::string board;
};

// global options are consumed here, everything else lands in args
CommandLine parse_command_line(int argc, const char* const argv[]);

}
