#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <preflop/blockers.hpp>
#include <preflop/config.hpp>
#include <preflop/equity.hpp>
#include <preflop/poker.hpp>
#include <preflop/profiles.hpp>

namespace preflop {

struct DecisionRequest {
  Hand hero;
  std::string position = "CO";
  double stack_bb = 100.0;
  LineType line = LineType::OPEN;
  std::string opponent = "unknown";
  // total size of the bet hero faces in bb, <= 0 selects the line's default size
  double facing_bet = 0.0;
  std::optional<std::string> aggressor;
  std::optional<uint64_t> seed;
  // <= 0 selects the configured trial count
  long trials = 0;
};

struct Recommendation {
  std::string hand_class;
  std::string description;
  int percentile = 0;
  Position position = Position::CO;
  LineType line = LineType::OPEN;
  std::string opponent;
  PlayerAction primary_action = PlayerAction::FOLD;
  Frequencies frequencies;
  double confidence = 0.0;
  double equity = 0.0;
  bool equity_exact = false;
  long equity_trials = 0;
  double pot = 0.0;
  double call_amount = 0.0;
  double pot_odds = 0.0;
  double spr = 0.0;
  double ev = 0.0;
  int threshold_shift = 0;
  int villain_range_percent = 0;
  BlockerReport blockers;
  std::vector<std::string> reasons;
  std::string opponent_advice;
  // follow-up plan, e.g. "If 3-bet: 4-bet"
  std::vector<std::string> if_then;

  std::string to_string() const;
};

Frequencies lookup_frequencies(const std::vector<FrequencyRow>& rows, int percentile, int shift);
double confidence_score(int percentile, LineType line, const Frequencies& freq, OpponentType opponent);
// hero's response when the raise hero makes on this line is raised again
PlayerAction response_to_reraise(LineType line, int percentile, int shift, const EngineConfig& config);
std::vector<std::string> contingency_plan(const Recommendation& rec, const EngineConfig& config);

class DecisionEngine {
public:
  explicit DecisionEngine(EngineConfig config = EngineConfig::defaults());

  Recommendation decide(const DecisionRequest& request) const;
  const EngineConfig& config() const { return _config; }

private:
  EngineConfig _config;
  BlockerAnalyzer _blockers;
  EquitySimulator _simulator;
};

Recommendation decide(const DecisionRequest& request);

}
