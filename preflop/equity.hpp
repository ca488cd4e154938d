#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <preflop/config.hpp>
#include <preflop/eval.hpp>
#include <preflop/poker.hpp>
#include <preflop/range.hpp>

namespace preflop {

struct EquityResult {
  double equity = NEUTRAL_EQUITY;
  long wins = 0;
  long ties = 0;
  long losses = 0;
  long trials = 0;
  bool exact = false;

  std::string to_string(int precision = 2) const;
};

class EquitySimulator {
public:
  explicit EquitySimulator(const SimulationConfig& config = SimulationConfig{}, const ExternalRanker* ranker = OmpRanker::get_instance())
      : _ranker{ranker}, _exact_ceiling{config.exact_ceiling}, _block_size{config.block_size} {}

  EquitySimulator* set_exact_ceiling(long n) { _exact_ceiling = n; return this; }
  EquitySimulator* set_block_size(long n) { _block_size = n; return this; }
  EquitySimulator* set_verbose(bool verbose) { _verbose = verbose; return this; }

  // exact enumeration when the work fits under the ceiling, seeded sampling otherwise
  EquityResult estimate(const Hand& hero, const Range& range, long trials, uint64_t seed, const std::vector<uint8_t>& board = {}) const;
  EquityResult sample(const Hand& hero, const Range& range, long trials, uint64_t seed, const std::vector<uint8_t>& board = {}) const;
  EquityResult enumerate(const Hand& hero, const Range& range, const std::vector<uint8_t>& board = {}) const;

private:
  Range _live_range(const Hand& hero, const Range& range, const std::vector<uint8_t>& board) const;

  const ExternalRanker* _ranker;
  long _exact_ceiling;
  long _block_size;
  bool _verbose = false;
};

uint64_t choose_seed(const std::optional<uint64_t>& requested, const SimulationConfig& config);
double estimate_equity(const Hand& hero, const Range& range, long trials, uint64_t seed, const std::vector<uint8_t>& board = {});
double pot_odds(double pot, double call);
// rough equity from the starting-hand percentile alone, shrunk for every extra opponent
double quick_equity_estimate(const Hand& hero, int n_opponents = 1, const EngineConfig& config = EngineConfig::defaults());
long n_choose_k(int n, int k);

struct PositionEquity {
  EquityResult result;
  Position position;
  RangeAction action;
  int range_percent;
};

PositionEquity equity_vs_position(const Hand& hero, const std::string& villain_position, const std::string& action, long trials,
    uint64_t seed, const EngineConfig& config = EngineConfig::defaults());

}
