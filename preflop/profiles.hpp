#pragma once

#include <array>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>
#include <cereal/types/array.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <preflop/constants.hpp>
#include <preflop/poker.hpp>

namespace preflop {

enum class PlayerAction : uint8_t {
  RAISE, CALL, FOLD
};

std::string action_to_str(PlayerAction action);

struct Frequencies {
  int raise = 0;
  int call = 0;
  int fold = 0;

  constexpr int sum() const { return raise + call + fold; }
  int of(PlayerAction action) const;
  std::string to_string() const;

  bool operator==(const Frequencies&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(raise, call, fold);
  }
};

// strict maximum, ties go to the more aggressive action
PlayerAction primary_action(const Frequencies& freq);

struct FrequencyRow {
  int threshold = 0;
  Frequencies freq;

  bool operator==(const FrequencyRow&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(threshold, freq);
  }
};

enum class LineType : uint8_t {
  OPEN = 0, FACING_OPEN = 1, FACING_3BET = 2, FACING_4BET = 3
};

std::string line_to_str(LineType line);
bool str_to_line(const std::string& str, LineType& line);

enum class RangeAction : uint8_t {
  OPEN = 0, DEFEND = 1, THREE_BET = 2, FOUR_BET = 3
};

static constexpr int N_RANGE_ACTIONS = 4;

std::string range_action_to_str(RangeAction action);
bool str_to_range_action(const std::string& str, RangeAction& action);
// range the aggressor holds when hero faces the given line
RangeAction aggressor_action(LineType line);

enum class OpponentType : uint8_t {
  UNKNOWN, FISH, REG, NIT, TAG, LAG, MANIAC
};

struct OpponentProfile {
  OpponentType type = OpponentType::UNKNOWN;
  std::string name;
  double open_width = 25.0;
  double fold_to_3bet = 0.5;
  double four_bet_freq = 0.08;
  double blocker_awareness = 1.0;
  // exploit note shown with recommendations, empty when there is nothing specific
  std::string advice;

  bool operator==(const OpponentProfile&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(type, name, open_width, fold_to_3bet, four_bet_freq, blocker_awareness, advice);
  }
};

struct PositionChart {
  Position position = Position::CO;
  int range_percent = 0;
  // hand notations per RangeAction, empty when the seat has no chart for the action
  std::array<std::vector<std::string>, N_RANGE_ACTIONS> actions;

  const std::vector<std::string>& for_action(const RangeAction action) const { return actions[static_cast<int>(action)]; }

  bool operator==(const PositionChart&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(position, range_percent, actions);
  }
};

enum class BlockerAction : uint8_t {
  RAISE = 0, BLUFF = 1, CALL = 2
};

static constexpr int N_BLOCKER_ACTIONS = 3;

struct BlockerWatch {
  std::string target;
  int per_card_points = 0;
  int both_ranks_points = 0;
  int one_rank_points = 0;

  bool operator==(const BlockerWatch&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(target, per_card_points, both_ranks_points, one_rank_points);
  }
};

struct AdjustmentRow {
  int min_score = 0;
  int points = 0;

  bool operator==(const AdjustmentRow&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(min_score, points);
  }
};

struct PercentileEntry {
  std::string notation;
  int percentile = 0;

  bool operator==(const PercentileEntry&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(notation, percentile);
  }
};

}
