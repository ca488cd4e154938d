#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>
#include <cereal/types/array.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <preflop/constants.hpp>
#include <preflop/poker.hpp>
#include <preflop/profiles.hpp>

namespace preflop {

struct SimulationConfig {
  long trials = 2'000;
  long exact_ceiling = 2'000'000;
  long block_size = 256;
  long max_trials = 200'000;
  // used when a caller supplies no seed, 0 draws process entropy
  uint64_t seed = 0;

  std::string to_string() const;

  bool operator==(const SimulationConfig&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(trials, exact_ceiling, block_size, max_trials, seed);
  }
};

// sizes in big blinds
struct BetSizing {
  double blinds = 1.5;
  double open = 2.5;
  double three_bet = 9.0;
  double four_bet = 22.0;
  double three_bet_multiplier = 3.0;
  double four_bet_multiplier = 2.2;

  bool operator==(const BetSizing&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(blinds, open, three_bet, four_bet, three_bet_multiplier, four_bet_multiplier);
  }
};

struct EngineConfig {
  EngineConfig();

  static const EngineConfig& defaults();

  void validate() const;
  std::string to_string() const;

  const PositionChart& chart(Position pos) const;
  const OpponentProfile& opponent(OpponentType type) const;
  const std::vector<FrequencyRow>& frequency_table(const LineType line) const { return frequency_tables[static_cast<int>(line)]; }
  const std::vector<AdjustmentRow>& adjustment_table(const BlockerAction action) const { return blocker_adjustments[static_cast<int>(action)]; }

  bool operator==(const EngineConfig&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(simulation, sizing, default_position, charts, opponents, frequency_tables, open_position_shift, in_position_shift,
       out_of_position_shift, opponent_shift_scale, equity_shift_divisor, max_equity_shift, percentiles, default_percentile,
       blocker_watch, blocker_adjustments);
  }

  SimulationConfig simulation;
  BetSizing sizing;
  Position default_position = Position::CO;
  std::vector<PositionChart> charts;
  std::vector<OpponentProfile> opponents;
  std::array<std::vector<FrequencyRow>, N_LINES> frequency_tables;
  std::array<int, N_POSITIONS> open_position_shift{};
  int in_position_shift = 0;
  int out_of_position_shift = 0;
  double opponent_shift_scale = 20.0;
  double equity_shift_divisor = 4.0;
  int max_equity_shift = 6;
  std::vector<PercentileEntry> percentiles;
  int default_percentile = 5;
  std::vector<BlockerWatch> blocker_watch;
  std::array<std::vector<AdjustmentRow>, N_BLOCKER_ACTIONS> blocker_adjustments;
};

EngineConfig load_config(const std::string& fn);
void save_config(const EngineConfig& config, const std::string& fn);

}
