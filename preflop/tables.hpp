#pragma once

#include <array>
#include <climits>
#include <string_view>
#include <preflop/poker.hpp>
#include <preflop/profiles.hpp>

namespace preflop::tables {

template <size_t N>
constexpr bool is_valid_frequency_table(const std::array<FrequencyRow, N>& rows) {
  for(size_t i = 0; i < N; ++i) {
    const Frequencies& f = rows[i].freq;
    if(f.raise < 0 || f.call < 0 || f.fold < 0 || f.sum() != 100) return false;
    if(i > 0 && rows[i].threshold >= rows[i - 1].threshold) return false;
  }
  return N > 0 && rows[N - 1].threshold == 0;
}

template <size_t N>
constexpr bool is_valid_adjustment_table(const std::array<AdjustmentRow, N>& rows) {
  for(size_t i = 1; i < N; ++i) {
    if(rows[i].min_score >= rows[i - 1].min_score) return false;
  }
  return N > 0 && rows[N - 1].min_score == INT_MIN;
}

// rows are ordered by descending percentile threshold, the first matching row wins
inline constexpr std::array<FrequencyRow, 6> OPEN_TABLE{{
  {85, {100, 0, 0}}, {70, {90, 0, 10}}, {55, {70, 0, 30}}, {40, {40, 0, 60}}, {25, {15, 0, 85}}, {0, {0, 0, 100}}
}};

inline constexpr std::array<FrequencyRow, 6> FACING_OPEN_TABLE{{
  {92, {85, 15, 0}}, {80, {45, 50, 5}}, {65, {20, 55, 25}}, {50, {10, 40, 50}}, {35, {5, 20, 75}}, {0, {0, 0, 100}}
}};

inline constexpr std::array<FrequencyRow, 5> FACING_3BET_TABLE{{
  {95, {90, 10, 0}}, {88, {40, 55, 5}}, {78, {15, 50, 35}}, {65, {5, 30, 65}}, {0, {0, 0, 100}}
}};

inline constexpr std::array<FrequencyRow, 4> FACING_4BET_TABLE{{
  {97, {95, 5, 0}}, {93, {50, 35, 15}}, {86, {10, 30, 60}}, {0, {0, 0, 100}}
}};

static_assert(is_valid_frequency_table(OPEN_TABLE));
static_assert(is_valid_frequency_table(FACING_OPEN_TABLE));
static_assert(is_valid_frequency_table(FACING_3BET_TABLE));
static_assert(is_valid_frequency_table(FACING_4BET_TABLE));

// UTG, MP, CO, BTN, SB, BB
inline constexpr std::array<int, N_POSITIONS> OPEN_POSITION_SHIFT{12, 8, 2, -8, -3, 0};
inline constexpr int IN_POSITION_SHIFT = -3;
inline constexpr int OUT_OF_POSITION_SHIFT = 2;

struct OpponentSeed {
  OpponentType type;
  std::string_view name;
  double open_width;
  double fold_to_3bet;
  double four_bet_freq;
  double blocker_awareness;
  std::string_view advice;
};

inline constexpr std::array<OpponentSeed, 7> OPPONENTS{{
  {OpponentType::UNKNOWN, "unknown", 25.0, 0.50, 0.08, 1.0, ""},
  {OpponentType::FISH, "fish", 45.0, 0.35, 0.03, 0.3, "Fish: value bet wider and size up, bluff rarely since they call too much."},
  {OpponentType::REG, "reg", 24.0, 0.55, 0.09, 1.2, "Reg: stay close to the default ranges and pick 3-bet bluffs with blockers."},
  {OpponentType::NIT, "nit", 12.0, 0.70, 0.04, 1.5, "Nit: steal often, but give up without a premium hand when they play back."},
  {OpponentType::TAG, "tag", 20.0, 0.60, 0.10, 1.2, "TAG: respect their 3-bets and attack their opens in position with suited hands."},
  {OpponentType::LAG, "lag", 35.0, 0.45, 0.14, 0.8, "LAG: widen the value range and 4-bet bluff with ace blockers."},
  {OpponentType::MANIAC, "maniac", 60.0, 0.25, 0.22, 0.2, "Maniac: trap strong hands, call down lighter and skip the bluffs."}
}};

struct BlockerWatchSeed {
  std::string_view target;
  int per_card_points;
  int both_ranks_points;
  int one_rank_points;
};

inline constexpr std::array<BlockerWatchSeed, 5> BLOCKER_WATCH{{
  {"AA", 15, 0, 0}, {"KK", 12, 0, 0}, {"QQ", 10, 0, 0}, {"AK", 0, 20, 5}, {"AQ", 0, 15, 0}
}};

inline constexpr std::array<AdjustmentRow, 3> RAISE_ADJUSTMENT{{{30, 10}, {15, 5}, {INT_MIN, 0}}};
inline constexpr std::array<AdjustmentRow, 4> BLUFF_ADJUSTMENT{{{30, 15}, {15, 8}, {1, 0}, {INT_MIN, -10}}};
inline constexpr std::array<AdjustmentRow, 2> CALL_ADJUSTMENT{{{30, 5}, {INT_MIN, 0}}};

static_assert(is_valid_adjustment_table(RAISE_ADJUSTMENT));
static_assert(is_valid_adjustment_table(BLUFF_ADJUSTMENT));
static_assert(is_valid_adjustment_table(CALL_ADJUSTMENT));

struct PercentileSeed {
  std::string_view notation;
  int percentile;
};

inline constexpr int DEFAULT_PERCENTILE = 5;

inline constexpr std::array<PercentileSeed, 100> HAND_PERCENTILES{{
  {"AA", 100}, {"KK", 99}, {"QQ", 98}, {"AKs", 97}, {"JJ", 96}, {"AKo", 95},
  {"AQs", 94}, {"TT", 93}, {"AQo", 92}, {"AJs", 91}, {"KQs", 90}, {"99", 89},
  {"ATs", 88}, {"AJo", 87}, {"KJs", 86}, {"KQo", 85}, {"88", 84}, {"KTs", 83},
  {"ATo", 82}, {"QJs", 81}, {"KJo", 80}, {"QTs", 79}, {"JTs", 78}, {"77", 77},
  {"A9s", 76}, {"KTo", 75}, {"A8s", 74}, {"Q9s", 73}, {"QJo", 72}, {"JTo", 71},
  {"A7s", 70}, {"A5s", 69}, {"A6s", 68}, {"66", 67}, {"K9s", 66}, {"QTo", 65},
  {"T9s", 64}, {"A4s", 63}, {"J9s", 62}, {"A3s", 61}, {"K8s", 60}, {"A2s", 59},
  {"55", 58}, {"K7s", 57}, {"Q8s", 56}, {"K9o", 55}, {"T8s", 54}, {"K6s", 53},
  {"J8s", 52}, {"98s", 51}, {"44", 50}, {"K5s", 49}, {"Q9o", 48}, {"T9o", 47},
  {"J9o", 46}, {"K4s", 45}, {"Q7s", 44}, {"T7s", 43}, {"K3s", 42}, {"97s", 41},
  {"33", 40}, {"K2s", 39}, {"Q6s", 38}, {"87s", 37}, {"J7s", 36}, {"Q5s", 35},
  {"98o", 34}, {"T8o", 33}, {"96s", 32}, {"22", 31}, {"Q4s", 30}, {"J8o", 29},
  {"76s", 28}, {"Q3s", 27}, {"86s", 26}, {"J6s", 25}, {"Q2s", 24}, {"T6s", 23},
  {"87o", 22}, {"J5s", 21}, {"65s", 20}, {"97o", 19}, {"75s", 18}, {"J4s", 17},
  {"95s", 16}, {"54s", 15}, {"J3s", 14}, {"T7o", 13}, {"J2s", 12}, {"64s", 11},
  {"85s", 10}, {"76o", 9}, {"T5s", 8}, {"96o", 7}, {"86o", 6}, {"53s", 5},
  {"T4s", 4}, {"74s", 3}, {"43s", 2}, {"T3s", 1},
}};

constexpr bool is_valid_percentile_chart() {
  for(const auto& [notation, percentile] : HAND_PERCENTILES) {
    if(percentile < 1 || percentile > 100 || notation.size() < 2 || notation.size() > 3) return false;
  }
  return true;
}

static_assert(is_valid_percentile_chart());

inline constexpr std::array<std::string_view, 19> UTG_OPEN_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "99", "88", "77", "AKs", "AQs", "AJs", "ATs", "KQs", "KJs", "QJs", "AKo", "AQo",
  "AJo", "KQo",
};

inline constexpr std::array<std::string_view, 26> MP_OPEN_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "99", "88", "77", "66", "AKs", "AQs", "AJs", "ATs", "A9s", "KQs", "KJs", "KTs",
  "QJs", "QTs", "JTs", "AKo", "AQo", "AJo", "ATo", "KQo", "KJo",
};

inline constexpr std::array<std::string_view, 41> CO_OPEN_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "99", "88", "77", "66", "55", "AKs", "AQs", "AJs", "ATs", "A9s", "A8s", "A7s",
  "A6s", "A5s", "KQs", "KJs", "KTs", "K9s", "QJs", "QTs", "Q9s", "JTs", "J9s", "T9s", "98s", "AKo", "AQo",
  "AJo", "ATo", "A9o", "KQo", "KJo", "KTo", "QJo", "QTo", "JTo",
};

inline constexpr std::array<std::string_view, 66> BTN_OPEN_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "99", "88", "77", "66", "55", "44", "33", "22", "AKs", "AQs", "AJs", "ATs",
  "A9s", "A8s", "A7s", "A6s", "A5s", "A4s", "A3s", "A2s", "KQs", "KJs", "KTs", "K9s", "K8s", "K7s", "K6s",
  "QJs", "QTs", "Q9s", "Q8s", "JTs", "J9s", "J8s", "T9s", "T8s", "98s", "97s", "87s", "76s", "65s", "54s",
  "AKo", "AQo", "AJo", "ATo", "A9o", "A8o", "A7o", "A6o", "A5o", "KQo", "KJo", "KTo", "K9o", "QJo", "QTo",
  "Q9o", "JTo", "J9o", "T9o",
};

inline constexpr std::array<std::string_view, 46> SB_OPEN_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "99", "88", "77", "66", "55", "44", "AKs", "AQs", "AJs", "ATs", "A9s", "A8s",
  "A7s", "A6s", "A5s", "A4s", "KQs", "KJs", "KTs", "K9s", "K8s", "QJs", "QTs", "Q9s", "JTs", "J9s", "T9s",
  "98s", "87s", "AKo", "AQo", "AJo", "ATo", "A9o", "A8o", "KQo", "KJo", "KTo", "QJo", "QTo", "JTo",
};

inline constexpr std::array<std::string_view, 78> BB_DEFEND_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "99", "88", "77", "66", "55", "44", "33", "22", "AKs", "AQs", "AJs", "ATs",
  "A9s", "A8s", "A7s", "A6s", "A5s", "A4s", "A3s", "A2s", "KQs", "KJs", "KTs", "K9s", "K8s", "K7s", "K6s",
  "K5s", "QJs", "QTs", "Q9s", "Q8s", "Q7s", "JTs", "J9s", "J8s", "T9s", "T8s", "98s", "97s", "87s", "86s",
  "76s", "75s", "65s", "64s", "54s", "53s", "43s", "AKo", "AQo", "AJo", "ATo", "A9o", "A8o", "A7o", "A6o",
  "A5o", "A4o", "A3o", "KQo", "KJo", "KTo", "K9o", "K8o", "QJo", "QTo", "Q9o", "JTo", "J9o", "T9o", "98o",
  "87o",
};

inline constexpr std::array<std::string_view, 13> CO_3BET_CHART{
  "AA", "KK", "QQ", "JJ", "TT", "AKs", "AQs", "AJs", "KQs", "A5s", "A4s", "AKo", "AQo",
};

inline constexpr std::array<std::string_view, 6> CO_4BET_CHART{
  "AA", "KK", "QQ", "AKs", "AKo", "A5s",
};

inline constexpr std::array<int, N_POSITIONS> RANGE_PERCENT{15, 18, 25, 35, 30, 40};

}
