#include <stdexcept>
#include <preflop/cli.hpp>
#include <preflop/logging.hpp>

namespace preflop {

static uint64_t parse_seed(const std::string& str) {
  size_t pos = 0;
  uint64_t seed;
  try {
    seed = std::stoull(str, &pos);
  }
  catch(const std::logic_error&) {
    throw std::invalid_argument{"Invalid seed: \"" + str + "\""};
  }
  if(pos != str.size() || str.front() == '-') throw std::invalid_argument{"Invalid seed: \"" + str + "\""};
  return seed;
}

CommandLine parse_command_line(const int argc, const char* const argv[]) {
  CommandLine cl;
  for(int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if(arg == "--verbose") Logger::set_debug(1);
    else if(arg == "--config" && has_value) cl.config_fn = argv[++i];
    else if(arg == "--seed" && has_value) cl.seed = parse_seed(argv[++i]);
    else if(arg == "--board" && has_value) cl.board = argv[++i];
    else if(arg == "--log-dir" && has_value) Logger::set_directory(argv[++i]);
    else cl.args.push_back(arg);
  }
  return cl;
}

}
