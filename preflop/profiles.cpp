#include <preflop/profiles.hpp>
#include <preflop/util.hpp>

namespace preflop {

std::string action_to_str(const PlayerAction action) {
  switch(action) {
    case PlayerAction::RAISE: return "raise";
    case PlayerAction::CALL: return "call";
    case PlayerAction::FOLD: return "fold";
  }
  throw std::runtime_error{"Unknown player action."};
}

int Frequencies::of(const PlayerAction action) const {
  switch(action) {
    case PlayerAction::RAISE: return raise;
    case PlayerAction::CALL: return call;
    case PlayerAction::FOLD: return fold;
  }
  throw std::runtime_error{"Unknown player action."};
}

std::string Frequencies::to_string() const {
  return "raise " + std::to_string(raise) + "%, call " + std::to_string(call) + "%, fold " + std::to_string(fold) + "%";
}

PlayerAction primary_action(const Frequencies& freq) {
  if(freq.raise >= freq.call && freq.raise >= freq.fold) return PlayerAction::RAISE;
  if(freq.call >= freq.fold) return PlayerAction::CALL;
  return PlayerAction::FOLD;
}

std::string line_to_str(const LineType line) {
  switch(line) {
    case LineType::OPEN: return "open";
    case LineType::FACING_OPEN: return "facing-open";
    case LineType::FACING_3BET: return "facing-3bet";
    case LineType::FACING_4BET: return "facing-4bet";
  }
  throw std::runtime_error{"Unknown line type."};
}

bool str_to_line(const std::string& str, LineType& line) {
  const std::string s = to_lower(str);
  if(s == "open" || s == "rfi") line = LineType::OPEN;
  else if(s == "facing-open" || s == "vs_open") line = LineType::FACING_OPEN;
  else if(s == "facing-3bet" || s == "vs_3bet") line = LineType::FACING_3BET;
  else if(s == "facing-4bet" || s == "vs_4bet") line = LineType::FACING_4BET;
  else return false;
  return true;
}

std::string range_action_to_str(const RangeAction action) {
  switch(action) {
    case RangeAction::OPEN: return "open";
    case RangeAction::DEFEND: return "defend";
    case RangeAction::THREE_BET: return "3bet";
    case RangeAction::FOUR_BET: return "4bet";
  }
  throw std::runtime_error{"Unknown range action."};
}

bool str_to_range_action(const std::string& str, RangeAction& action) {
  const std::string s = to_lower(str);
  if(s == "open") action = RangeAction::OPEN;
  else if(s == "defend") action = RangeAction::DEFEND;
  else if(s == "3bet") action = RangeAction::THREE_BET;
  else if(s == "4bet") action = RangeAction::FOUR_BET;
  else return false;
  return true;
}

RangeAction aggressor_action(const LineType line) {
  switch(line) {
    case LineType::FACING_3BET: return RangeAction::THREE_BET;
    case LineType::FACING_4BET: return RangeAction::FOUR_BET;
    default: return RangeAction::OPEN;
  }
}

}
