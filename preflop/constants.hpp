#pragma once

namespace preflop {
  static constexpr int MAX_CARDS = 52;
  static constexpr int N_RANKS = 13;
  static constexpr int N_SUITS = 4;
  static constexpr int MAX_BOARD_CARDS = 5;
  static constexpr int MAX_PREFLOP_COMBOS = 169;
  static constexpr int MAX_COMBOS = 1326;
  static constexpr int N_DISTINCT_RANKS = 7462;
  static constexpr int N_POSITIONS = 6;
  static constexpr int N_LINES = 4;
  static constexpr double NEUTRAL_EQUITY = 50.0;
}
