#include <climits>
#include <sstream>
#include <unordered_set>
#include <preflop/cereal_ext.hpp>
#include <preflop/config.hpp>
#include <preflop/errors.hpp>
#include <preflop/logging.hpp>
#include <preflop/range.hpp>
#include <preflop/tables.hpp>

namespace preflop {

std::string SimulationConfig::to_string() const {
  return "trials=" + std::to_string(trials) + ", exact ceiling=" + std::to_string(exact_ceiling) + ", block size=" +
      std::to_string(block_size) + ", max trials=" + std::to_string(max_trials) + ", seed=" + std::to_string(seed);
}

template <size_t N>
std::vector<FrequencyRow> to_rows(const std::array<FrequencyRow, N>& table) {
  return std::vector<FrequencyRow>{table.begin(), table.end()};
}

template <size_t N>
std::vector<AdjustmentRow> to_rows(const std::array<AdjustmentRow, N>& table) {
  return std::vector<AdjustmentRow>{table.begin(), table.end()};
}

template <size_t N>
std::vector<std::string> to_notations(const std::array<std::string_view, N>& chart) {
  std::vector<std::string> notations;
  notations.reserve(N);
  for(const auto& n : chart) notations.emplace_back(n);
  return notations;
}

EngineConfig::EngineConfig() {
  frequency_tables[static_cast<int>(LineType::OPEN)] = to_rows(tables::OPEN_TABLE);
  frequency_tables[static_cast<int>(LineType::FACING_OPEN)] = to_rows(tables::FACING_OPEN_TABLE);
  frequency_tables[static_cast<int>(LineType::FACING_3BET)] = to_rows(tables::FACING_3BET_TABLE);
  frequency_tables[static_cast<int>(LineType::FACING_4BET)] = to_rows(tables::FACING_4BET_TABLE);
  open_position_shift = tables::OPEN_POSITION_SHIFT;
  in_position_shift = tables::IN_POSITION_SHIFT;
  out_of_position_shift = tables::OUT_OF_POSITION_SHIFT;

  for(int p = 0; p < N_POSITIONS; ++p) {
    charts.push_back(PositionChart{static_cast<Position>(p), tables::RANGE_PERCENT[p], {}});
  }
  auto set_chart = [&](const Position pos, const RangeAction action, std::vector<std::string> notations) {
    charts[static_cast<int>(pos)].actions[static_cast<int>(action)] = std::move(notations);
  };
  set_chart(Position::UTG, RangeAction::OPEN, to_notations(tables::UTG_OPEN_CHART));
  set_chart(Position::MP, RangeAction::OPEN, to_notations(tables::MP_OPEN_CHART));
  set_chart(Position::CO, RangeAction::OPEN, to_notations(tables::CO_OPEN_CHART));
  set_chart(Position::CO, RangeAction::THREE_BET, to_notations(tables::CO_3BET_CHART));
  set_chart(Position::CO, RangeAction::FOUR_BET, to_notations(tables::CO_4BET_CHART));
  set_chart(Position::BTN, RangeAction::OPEN, to_notations(tables::BTN_OPEN_CHART));
  set_chart(Position::SB, RangeAction::OPEN, to_notations(tables::SB_OPEN_CHART));
  set_chart(Position::BB, RangeAction::DEFEND, to_notations(tables::BB_DEFEND_CHART));

  for(const auto& o : tables::OPPONENTS) {
    opponents.push_back(OpponentProfile{o.type, std::string{o.name}, o.open_width, o.fold_to_3bet, o.four_bet_freq, o.blocker_awareness,
        std::string{o.advice}});
  }
  for(const auto& [notation, percentile] : tables::HAND_PERCENTILES) {
    percentiles.push_back(PercentileEntry{std::string{notation}, percentile});
  }
  default_percentile = tables::DEFAULT_PERCENTILE;
  for(const auto& w : tables::BLOCKER_WATCH) {
    blocker_watch.push_back(BlockerWatch{std::string{w.target}, w.per_card_points, w.both_ranks_points, w.one_rank_points});
  }
  blocker_adjustments[static_cast<int>(BlockerAction::RAISE)] = to_rows(tables::RAISE_ADJUSTMENT);
  blocker_adjustments[static_cast<int>(BlockerAction::BLUFF)] = to_rows(tables::BLUFF_ADJUSTMENT);
  blocker_adjustments[static_cast<int>(BlockerAction::CALL)] = to_rows(tables::CALL_ADJUSTMENT);
}

const EngineConfig& EngineConfig::defaults() {
  static const EngineConfig config;
  return config;
}

const PositionChart& EngineConfig::chart(const Position pos) const {
  for(const auto& c : charts) {
    if(c.position == pos) return c;
  }
  throw ConfigError{"No range chart for position " + pos_to_str(pos)};
}

const OpponentProfile& EngineConfig::opponent(const OpponentType type) const {
  for(const auto& o : opponents) {
    if(o.type == type) return o;
  }
  throw ConfigError{"No opponent profile for type " + std::to_string(static_cast<int>(type))};
}

static void validate_notation(const std::string& notation, const std::string& where) {
  try {
    HandClass{notation};
  }
  catch(const InvalidCardError& e) {
    throw ConfigError{where + ": invalid hand notation \"" + notation + "\" (" + e.what() + ")"};
  }
}

void EngineConfig::validate() const {
  if(simulation.trials <= 0) throw ConfigError{"Simulation trials must be positive."};
  if(simulation.block_size <= 0) throw ConfigError{"Simulation block size must be positive."};
  if(simulation.exact_ceiling < 0) throw ConfigError{"Exact enumeration ceiling must not be negative."};
  if(simulation.max_trials < simulation.trials) throw ConfigError{"Trial cap is below the default trial count."};
  if(sizing.blinds <= 0 || sizing.open <= 0 || sizing.three_bet <= sizing.open || sizing.four_bet <= sizing.three_bet) {
    throw ConfigError{"Bet sizes must be positive and increasing."};
  }

  for(int l = 0; l < N_LINES; ++l) {
    const auto& rows = frequency_tables[l];
    const std::string name = line_to_str(static_cast<LineType>(l));
    if(rows.empty()) throw ConfigError{"Frequency table " + name + " is empty."};
    for(int i = 0; i < rows.size(); ++i) {
      const Frequencies& f = rows[i].freq;
      if(f.raise < 0 || f.call < 0 || f.fold < 0) throw ConfigError{"Negative frequency in table " + name + ", row " + std::to_string(i)};
      if(f.sum() != 100) throw ConfigError{"Frequencies in table " + name + ", row " + std::to_string(i) + " sum to " + std::to_string(f.sum())};
      if(i > 0 && rows[i].threshold >= rows[i - 1].threshold) throw ConfigError{"Thresholds of table " + name + " are not descending."};
    }
    if(rows.back().threshold != 0) throw ConfigError{"Last row of table " + name + " must have threshold 0."};
  }

  for(int p = 0; p < N_POSITIONS; ++p) {
    const PositionChart& c = chart(static_cast<Position>(p));
    if(c.range_percent < 0 || c.range_percent > 100) throw ConfigError{"Range percent out of bounds for " + pos_to_str(c.position)};
    for(const auto& notations : c.actions) {
      for(const auto& n : notations) validate_notation(n, "Chart " + pos_to_str(c.position));
    }
  }
  const PositionChart& fallback = chart(default_position);
  for(const RangeAction a : {RangeAction::OPEN, RangeAction::THREE_BET, RangeAction::FOUR_BET}) {
    if(fallback.for_action(a).empty()) throw ConfigError{"Default position has no " + range_action_to_str(a) + " chart."};
  }

  opponent(OpponentType::UNKNOWN);
  for(const auto& o : opponents) {
    if(o.fold_to_3bet < 0.0 || o.fold_to_3bet > 1.0 || o.four_bet_freq < 0.0 || o.four_bet_freq > 1.0) {
      throw ConfigError{"Opponent profile " + o.name + " has frequencies outside [0, 1]."};
    }
    if(o.fold_to_3bet + o.four_bet_freq > 1.0) throw ConfigError{"Opponent profile " + o.name + " folds and 4-bets more than 100% of the time."};
    if(o.open_width <= 0.0 || o.open_width > 100.0) throw ConfigError{"Opponent profile " + o.name + " has an invalid opening width."};
  }

  std::unordered_set<std::string> seen;
  for(const auto& e : percentiles) {
    validate_notation(e.notation, "Percentile chart");
    if(e.percentile < 1 || e.percentile > 100) throw ConfigError{"Percentile of " + e.notation + " out of bounds."};
    if(!seen.insert(e.notation).second) throw ConfigError{"Duplicate percentile entry " + e.notation};
  }
  if(default_percentile < 1 || default_percentile > 100) throw ConfigError{"Default percentile out of bounds."};

  for(const auto& w : blocker_watch) validate_notation(w.target, "Blocker watch-list");
  for(int a = 0; a < N_BLOCKER_ACTIONS; ++a) {
    const auto& rows = blocker_adjustments[a];
    if(rows.empty() || rows.back().min_score != INT_MIN) throw ConfigError{"Blocker adjustment table " + std::to_string(a) + " has no catch-all row."};
    for(int i = 1; i < rows.size(); ++i) {
      if(rows[i].min_score >= rows[i - 1].min_score) throw ConfigError{"Blocker adjustment table " + std::to_string(a) + " is not descending."};
    }
  }
}

std::string EngineConfig::to_string() const {
  std::ostringstream oss;
  oss << "================ Engine Config ================\n"
      << "Simulation: " << simulation.to_string() << "\n"
      << "Bet sizes: open=" << sizing.open << "bb, 3-bet=" << sizing.three_bet << "bb, 4-bet=" << sizing.four_bet << "bb\n"
      << "Default position: " << pos_to_str(default_position) << "\n"
      << "Opponent profiles: " << opponents.size() << "\n"
      << "Percentile entries: " << percentiles.size() << " (default " << default_percentile << ")\n";
  for(int l = 0; l < N_LINES; ++l) {
    oss << "Table " << line_to_str(static_cast<LineType>(l)) << ": " << frequency_tables[l].size() << " rows\n";
  }
  oss << "-----------------------------------------------\n";
  return oss.str();
}

EngineConfig load_config(const std::string& fn) {
  auto config = cereal_load<EngineConfig>(fn);
  config.validate();
  return config;
}

void save_config(const EngineConfig& config, const std::string& fn) {
  config.validate();
  cereal_save(config, fn);
}

}
