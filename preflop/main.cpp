#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <preflop/blockers.hpp>
#include <preflop/charts.hpp>
#include <preflop/cli.hpp>
#include <preflop/config.hpp>
#include <preflop/decision.hpp>
#include <preflop/equity.hpp>
#include <preflop/eval.hpp>
#include <preflop/logging.hpp>
#include <preflop/server.hpp>

using namespace preflop;

std::string arg_or(const std::vector<std::string>& args, const size_t i, const std::string& fallback) {
  return i < args.size() ? args[i] : fallback;
}

int run(const CommandLine& cl) {
  const auto& args = cl.args;
  const EngineConfig config = cl.config_fn ? load_config(*cl.config_fn) : EngineConfig::defaults();
  const uint64_t seed = choose_seed(cl.seed, config.simulation);

  if(const std::string& command = args[0]; command == "decide") {
    // ./Preflop decide hand position stack line [opponent] [facing_bet] [aggressor] [--seed N]
    if(args.size() < 5) {
      std::cout << "Missing arguments to decide.\n";
      return 1;
    }
    DecisionRequest request;
    request.hero = Hand{args[1]};
    request.position = args[2];
    request.stack_bb = std::stod(args[3]);
    if(!str_to_line(args[4], request.line)) Logger::error("Unknown line: " + args[4]);
    request.opponent = arg_or(args, 5, "unknown");
    request.facing_bet = std::stod(arg_or(args, 6, "0"));
    if(args.size() > 7) request.aggressor = args[7];
    request.seed = seed;
    std::cout << DecisionEngine{config}.decide(request).to_string();
  }
  else if(command == "equity") {
    // ./Preflop equity hand villain_position [action] [trials] [--seed N] [--board cards]
    if(args.size() < 3) {
      std::cout << "Missing arguments to equity.\n";
      return 1;
    }
    const Hand hero{args[1]};
    const long trials = std::stol(arg_or(args, 4, std::to_string(config.simulation.trials)));
    const ChartRange chart = chart_range(resolve_position(args[2], config), resolve_range_action(arg_or(args, 3, "open")), config);
    EquitySimulator sim{config.simulation};
    sim.set_verbose(true);
    const EquityResult result = sim.estimate(hero, chart.range, trials, seed, parse_board(cl.board));
    std::cout << hero.to_string() << " vs " << pos_to_str(chart.position) << " " << range_action_to_str(chart.action)
              << " (" << chart.range_percent << "%): " << result.to_string() << "\n";
  }
  else if(command == "blockers") {
    // ./Preflop blockers hand
    if(args.size() < 2) {
      std::cout << "Missing arguments to blockers.\n";
      return 1;
    }
    const BlockerReport report = BlockerAnalyzer{config}.analyze(Hand{args[1]});
    std::cout << report.to_string() << "\n";
    for(const auto& note : report.notes) std::cout << "- " << note << "\n";
  }
  else if(command == "rank") {
    // ./Preflop rank hand [board]
    if(args.size() < 2) {
      std::cout << "Missing arguments to rank.\n";
      return 1;
    }
    const HandRank rank = HandRanker{}.rank(Hand{args[1]}, parse_board(arg_or(args, 2, "")));
    std::cout << rank.label << " (class " << rank.rank_class << ", score " << rank.score << ")\n";
  }
  else if(command == "outs") {
    // ./Preflop outs hand board
    if(args.size() < 3) {
      std::cout << "Missing arguments to outs.\n";
      return 1;
    }
    const Outs outs = HandRanker{}.count_outs(Hand{args[1]}, parse_board(args[2]));
    std::cout << outs.count << " outs: " << cards_to_str(outs.cards) << "\n";
  }
  else if(command == "export-config") {
    // ./Preflop export-config out_fn
    if(args.size() < 2) {
      std::cout << "Missing arguments to export config.\n";
      return 1;
    }
    save_config(config, args[1]);
  }
  else if(command == "server") {
    // ./Preflop server [port]
    PreflopServer server{config};
    server.start("0.0.0.0", std::stoi(arg_or(args, 1, "8080")));
  }
  else {
    std::cout << "Unknown command: " << command << "\n";
    return 1;
  }
  return 0;
}

int main(int argc, char* argv[]) {
  try {
    const CommandLine cl = parse_command_line(argc, argv);
    if(cl.args.empty()) {
      std::cerr << "Usage: " << argv[0] << " <decide|equity|blockers|rank|outs|export-config|server> [args] [--config fn] [--seed N] [--log-dir dir] [--verbose]" << std::endl;
      return 1;
    }
    return run(cl);
  }
  catch(const InvalidCardError& e) {
    std::cerr << "Invalid cards: " << e.what() << std::endl;
  }
  catch(const ConfigError& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
  }
  catch(const std::exception& e) {
    std::cerr << e.what() << std::endl;
  }
  return 1;
}
