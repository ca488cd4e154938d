#include <preflop/charts.hpp>
#include <preflop/logging.hpp>
#include <preflop/util.hpp>

namespace preflop {

ChartRange chart_range(const Position pos, const RangeAction action, const EngineConfig& config) {
  const PositionChart& own = config.chart(pos);
  const PositionChart& fallback = config.chart(config.default_position);
  const std::vector<std::pair<const PositionChart*, RangeAction>> candidates = {
    {&own, action}, {&fallback, action}, {&own, RangeAction::OPEN}, {&fallback, RangeAction::OPEN}
  };
  for(const auto& [chart, a] : candidates) {
    const auto& notations = chart->for_action(a);
    if(notations.empty()) continue;
    if(chart != &own || a != action) {
      Logger::log("No " + range_action_to_str(action) + " chart for " + pos_to_str(pos) + ", using " +
          pos_to_str(chart->position) + " " + range_action_to_str(a), 1);
    }
    Range range;
    for(const auto& n : notations) range.add_class(HandClass{n});
    return ChartRange{range, chart->position, a, chart->range_percent};
  }
  throw ConfigError{"No range chart available for " + pos_to_str(pos)};
}

Range range_for(const Position pos, const RangeAction action, const EngineConfig& config) {
  return chart_range(pos, action, config).range;
}

Range range_for(const std::string& position, const std::string& action, const EngineConfig& config) {
  return range_for(resolve_position(position, config), resolve_range_action(action), config);
}

Position resolve_position(const std::string& name, const EngineConfig& config) {
  Position pos;
  if(str_to_pos(name, pos)) return pos;
  Logger::log("Unknown position \"" + name + "\", using " + pos_to_str(config.default_position), 1);
  return config.default_position;
}

RangeAction resolve_range_action(const std::string& name) {
  RangeAction action;
  if(str_to_range_action(name, action)) return action;
  Logger::log("Unknown range action \"" + name + "\", using open", 1);
  return RangeAction::OPEN;
}

const OpponentProfile& resolve_opponent(const std::string& name, const EngineConfig& config) {
  const std::string lower = to_lower(name);
  for(const auto& o : config.opponents) {
    if(o.name == lower) return o;
  }
  Logger::log("Unknown opponent profile \"" + name + "\", using unknown", 1);
  return config.opponent(OpponentType::UNKNOWN);
}

int percentile_of(const HandClass& hand_class, const EngineConfig& config) {
  const std::string notation = hand_class.to_string();
  for(const auto& e : config.percentiles) {
    if(e.notation == notation) return e.percentile;
  }
  return config.default_percentile;
}

}
