#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>
#include <string_view>
#include <preflop/charts.hpp>
#include <preflop/decision.hpp>
#include <preflop/logging.hpp>
#include <preflop/util.hpp>

namespace preflop {

// share of fold-to-3bet that carries over to each line's raise, indexed by LineType
static constexpr std::array<double, N_LINES> FOLD_EQUITY_SCALE{1.0, 1.0, 0.6, 0.3};
static constexpr std::array<double, N_LINES> LINE_SIMPLICITY{0.10, 0.05, 0.0, -0.05};

Frequencies lookup_frequencies(const std::vector<FrequencyRow>& rows, const int percentile, const int shift) {
  if(rows.empty()) throw ConfigError{"Empty frequency table."};
  for(const FrequencyRow& row : rows) {
    if(percentile >= row.threshold + shift) return row.freq;
  }
  return rows.back().freq;
}

double confidence_score(const int percentile, const LineType line, const Frequencies& freq, const OpponentType opponent) {
  double confidence = 0.5 + (percentile - 50) / 100.0 * 0.6 + LINE_SIMPLICITY[static_cast<int>(line)];
  if(freq.of(primary_action(freq)) >= 90) confidence += 0.05;
  if(opponent == OpponentType::UNKNOWN) confidence -= 0.05;
  return std::clamp(confidence, 0.3, 0.95);
}

PlayerAction response_to_reraise(const LineType line, const int percentile, const int shift, const EngineConfig& config) {
  switch(line) {
    case LineType::OPEN: return primary_action(lookup_frequencies(config.frequency_table(LineType::FACING_3BET), percentile, shift));
    case LineType::FACING_OPEN: return primary_action(lookup_frequencies(config.frequency_table(LineType::FACING_4BET), percentile, shift));
    case LineType::FACING_3BET: {
      // a 5-bet puts hero all-in
      const PlayerAction action = primary_action(lookup_frequencies(config.frequency_table(LineType::FACING_4BET), percentile, shift));
      return action == PlayerAction::FOLD ? PlayerAction::FOLD : PlayerAction::CALL;
    }
    case LineType::FACING_4BET: return PlayerAction::CALL;
  }
  return PlayerAction::FOLD;
}

static std::string reraise_verb(const LineType line, const PlayerAction action) {
  if(action == PlayerAction::FOLD) return "fold";
  if(action == PlayerAction::CALL) return "call";
  return line == LineType::OPEN ? "4-bet" : "jam";
}

std::vector<std::string> contingency_plan(const Recommendation& rec, const EngineConfig& config) {
  static constexpr std::array<std::string_view, N_LINES> RERAISE_NAME{"3-bet", "4-bet", "5-bet", ""};
  std::vector<std::string> plan;
  if(rec.primary_action == PlayerAction::FOLD) return plan;
  if(rec.primary_action == PlayerAction::RAISE && rec.line != LineType::FACING_4BET) {
    const PlayerAction response = response_to_reraise(rec.line, rec.percentile, rec.threshold_shift, config);
    plan.push_back("If " + std::string{RERAISE_NAME[static_cast<int>(rec.line)]} + ": " + reraise_verb(rec.line, response));
  }
  else if(rec.primary_action == PlayerAction::CALL && rec.line == LineType::FACING_OPEN) {
    const PlayerAction response = response_to_reraise(LineType::OPEN, rec.percentile, rec.threshold_shift, config);
    plan.push_back("If squeezed: " + reraise_verb(LineType::OPEN, response));
  }
  if(rec.spr < 3.0) plan.push_back("If the flop connects: commit the stack at SPR " + round_to_str(rec.spr, 1));
  return plan;
}

std::string Recommendation::to_string() const {
  std::ostringstream oss;
  oss << "================ Recommendation ================\n"
      << "Hand: " << hand_class << " (" << description << "), percentile " << percentile << "\n"
      << "Spot: " << pos_to_str(position) << " " << line_to_str(line) << " vs " << opponent << "\n"
      << "Action: " << action_to_str(primary_action) << " (" << frequencies.to_string() << ")\n"
      << "Confidence: " << round_to_str(confidence * 100.0, 0) << "%\n"
      << "Equity: " << round_to_str(equity, 1) << "%" << (equity_exact ? " (exact)" : "") << ", pot odds: " << round_to_str(pot_odds, 1)
      << "%, SPR: " << round_to_str(spr, 1) << ", EV: " << round_to_str(ev, 2) << "bb\n"
      << blockers.to_string() << "\n";
  for(const auto& reason : reasons) oss << "- " << reason << "\n";
  if(!opponent_advice.empty()) oss << opponent_advice << "\n";
  for(const auto& line : if_then) oss << "> " << line << "\n";
  oss << "------------------------------------------------\n";
  return oss.str();
}

DecisionEngine::DecisionEngine(EngineConfig config) : _config{std::move(config)}, _blockers{_config}, _simulator{_config.simulation} {
  _config.validate();
}

static double default_bet(const LineType line, const BetSizing& sizing) {
  switch(line) {
    case LineType::FACING_OPEN: return sizing.open;
    case LineType::FACING_3BET: return sizing.three_bet;
    case LineType::FACING_4BET: return sizing.four_bet;
    default: return 0.0;
  }
}

static double prior_investment(const LineType line, const BetSizing& sizing) {
  switch(line) {
    case LineType::FACING_3BET: return sizing.open;
    case LineType::FACING_4BET: return sizing.three_bet;
    default: return 0.0;
  }
}

static double raise_size(const LineType line, const double bet, const double stack, const BetSizing& sizing) {
  switch(line) {
    case LineType::OPEN: return std::min(sizing.open, stack);
    case LineType::FACING_OPEN: return std::min(bet * sizing.three_bet_multiplier, stack);
    case LineType::FACING_3BET: return std::min(bet * sizing.four_bet_multiplier, stack);
    case LineType::FACING_4BET: return stack;
  }
  return stack;
}

static BlockerAction blocker_action(const LineType line, const int percentile) {
  switch(line) {
    case LineType::OPEN: return BlockerAction::RAISE;
    case LineType::FACING_4BET: return BlockerAction::CALL;
    default: return percentile < 60 ? BlockerAction::BLUFF : BlockerAction::RAISE;
  }
}

Recommendation DecisionEngine::decide(const DecisionRequest& request) const {
  if(!(request.stack_bb > 0.0)) throw std::invalid_argument{"Stack must be positive, got " + std::to_string(request.stack_bb)};
  const LineType line = request.line;
  const bool facing = line != LineType::OPEN;

  Recommendation rec;
  const HandClass hand_class = HandClass::of(request.hero);
  rec.hand_class = hand_class.to_string();
  rec.description = hand_class.describe();
  rec.percentile = percentile_of(hand_class, _config);
  rec.position = resolve_position(request.position, _config);
  rec.line = line;
  rec.blockers = _blockers.analyze(request.hero);
  const OpponentProfile& opponent = resolve_opponent(request.opponent, _config);
  rec.opponent = opponent.name;

  const BetSizing& sizing = _config.sizing;
  const double bet = request.facing_bet > 0.0 ? request.facing_bet : default_bet(line, sizing);
  const double prior = prior_investment(line, sizing);
  rec.pot = sizing.blinds + (facing ? prior + bet : 0.0);
  rec.call_amount = facing ? std::clamp(bet - prior, 0.0, std::max(request.stack_bb - prior, 0.0)) : 0.0;
  rec.pot_odds = pot_odds(rec.pot, rec.call_amount);
  rec.spr = request.stack_bb / rec.pot;

  int shift = 0;
  if(facing) {
    const Position aggressor = request.aggressor ? resolve_position(*request.aggressor, _config) : _config.default_position;
    const ChartRange chart = chart_range(aggressor, aggressor_action(line), _config);
    const long trials = request.trials > 0 ? std::min(request.trials, _config.simulation.max_trials) : _config.simulation.trials;
    const uint64_t seed = choose_seed(request.seed, _config.simulation);
    const EquityResult equity = _simulator.estimate(request.hero, chart.range, trials, seed);
    rec.equity = equity.equity;
    rec.equity_exact = equity.exact;
    rec.equity_trials = equity.trials;
    rec.villain_range_percent = chart.range_percent;
    const bool in_position = postflop_order(rec.position) > postflop_order(aggressor);
    shift += in_position ? _config.in_position_shift : _config.out_of_position_shift;
    const double equity_gap = (rec.pot_odds - rec.equity) / _config.equity_shift_divisor;
    shift += std::clamp(static_cast<int>(std::lround(equity_gap)), -_config.max_equity_shift, _config.max_equity_shift);
    rec.reasons.push_back("Equity " + round_to_str(rec.equity, 1) + "% vs " + pos_to_str(chart.position) + " " +
        range_action_to_str(chart.action) + " range (" + std::to_string(chart.range_percent) + "%), pot odds " + round_to_str(rec.pot_odds, 1) + "%");
    rec.reasons.push_back(in_position ? "In position against the aggressor" : "Out of position against the aggressor");
  }
  else {
    rec.equity = rec.percentile;
    shift += _config.open_position_shift[static_cast<int>(rec.position)];
    rec.reasons.push_back("Opening from " + pos_to_str(rec.position));
  }

  shift += static_cast<int>(std::lround(-(opponent.fold_to_3bet - 0.5) * _config.opponent_shift_scale));
  const int blocker_points = _blockers.adjustment_for(rec.blockers, blocker_action(line, rec.percentile));
  shift -= blocker_points;
  rec.threshold_shift = shift;

  rec.frequencies = lookup_frequencies(_config.frequency_table(line), rec.percentile, shift);
  rec.primary_action = primary_action(rec.frequencies);
  rec.confidence = confidence_score(rec.percentile, line, rec.frequencies, opponent.type);

  const double eq = rec.equity / 100.0;
  const double raise_to = raise_size(line, bet, request.stack_bb, sizing);
  const double base_fe = line == LineType::OPEN ? 1.0 - opponent.open_width / 100.0 : opponent.fold_to_3bet * FOLD_EQUITY_SCALE[static_cast<int>(line)];
  const double fe = std::clamp(base_fe + _blockers.fold_equity_adjustment(rec.blockers, opponent) / 100.0, 0.0, 0.95);
  const double showdown = eq * (rec.pot + 2.0 * raise_to) - raise_to;
  double ev_raise = fe * rec.pot + (1.0 - fe) * showdown;
  if(line == LineType::FACING_OPEN) {
    // villain 4-bets some of the hands that do not fold to the 3-bet
    const double four_bet = std::min(opponent.four_bet_freq, 1.0 - fe);
    const bool continues = response_to_reraise(line, rec.percentile, shift, _config) != PlayerAction::FOLD;
    const double ev_vs_4bet = continues ? eq * (rec.pot + 2.0 * request.stack_bb) - request.stack_bb : -raise_to;
    ev_raise = fe * rec.pot + four_bet * ev_vs_4bet + (1.0 - fe - four_bet) * showdown;
  }
  const double ev_call = eq * (rec.pot + rec.call_amount) - rec.call_amount;
  rec.ev = (rec.frequencies.raise * ev_raise + rec.frequencies.call * ev_call) / 100.0;

  rec.reasons.push_back("Top " + std::to_string(101 - rec.percentile) + "% starting hand");
  if(rec.blockers.effect != BlockerEffect::NONE) {
    rec.reasons.push_back(effect_to_str(rec.blockers.effect) + " blockers (" + std::to_string(blocker_points) + " point adjustment)");
  }
  if(opponent.type != OpponentType::UNKNOWN) {
    rec.reasons.push_back("Opponent " + opponent.name + " folds to 3-bets " + round_to_str(opponent.fold_to_3bet * 100.0, 0) + "% of the time");
  }
  if(rec.spr < 3.0) rec.reasons.push_back("Low stack-to-pot ratio " + round_to_str(rec.spr, 1));
  rec.opponent_advice = opponent.advice;
  rec.if_then = contingency_plan(rec, _config);

  Logger::log("Decision " + request.hero.to_string() + " " + pos_to_str(rec.position) + " " + line_to_str(line) + ": " +
      action_to_str(rec.primary_action) + " (" + rec.frequencies.to_string() + "), shift=" + std::to_string(shift), 1);
  return rec;
}

Recommendation decide(const DecisionRequest& request) {
  static const DecisionEngine engine;
  return engine.decide(request);
}

}
