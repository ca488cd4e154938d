#pragma once

#include <string>
#include <preflop/config.hpp>
#include <preflop/poker.hpp>
#include <preflop/profiles.hpp>
#include <preflop/range.hpp>

namespace preflop {

struct ChartRange {
  Range range;
  Position position;
  RangeAction action;
  int range_percent;
};

ChartRange chart_range(Position pos, RangeAction action, const EngineConfig& config = EngineConfig::defaults());
Range range_for(Position pos, RangeAction action, const EngineConfig& config = EngineConfig::defaults());
Range range_for(const std::string& position, const std::string& action, const EngineConfig& config = EngineConfig::defaults());

Position resolve_position(const std::string& name, const EngineConfig& config = EngineConfig::defaults());
RangeAction resolve_range_action(const std::string& name);
const OpponentProfile& resolve_opponent(const std::string& name, const EngineConfig& config = EngineConfig::defaults());

int percentile_of(const HandClass& hand_class, const EngineConfig& config = EngineConfig::defaults());
inline int percentile_of(const Hand& hand, const EngineConfig& config = EngineConfig::defaults()) {
  return percentile_of(HandClass::of(hand), config);
}

}
