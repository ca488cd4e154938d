#include <preflop/json_io.hpp>

using json = nlohmann::json;

namespace preflop {

void to_json(json& j, const Frequencies& freq) {
  j = json{{"raise", freq.raise}, {"call", freq.call}, {"fold", freq.fold}};
}

void to_json(json& j, const BlockerReport& report) {
  json blocked = json::array();
  for(const auto& b : report.blocked) {
    blocked.push_back(json{{"target", b.target.to_string()}, {"remaining", b.remaining}, {"points", b.points}});
  }
  j = json{{"effect", effect_to_str(report.effect)}, {"score", report.score}, {"blocked", blocked}, {"notes", report.notes}};
}

void to_json(json& j, const EquityResult& result) {
  j = json{{"equity", result.equity}, {"wins", result.wins}, {"ties", result.ties}, {"losses", result.losses},
           {"trials", result.trials}, {"exact", result.exact}};
}

void to_json(json& j, const Recommendation& rec) {
  j = json{
    {"hand", rec.hand_class},
    {"description", rec.description},
    {"percentile", rec.percentile},
    {"position", pos_to_str(rec.position)},
    {"line", line_to_str(rec.line)},
    {"opponent", rec.opponent},
    {"action", action_to_str(rec.primary_action)},
    {"frequencies", rec.frequencies},
    {"confidence", rec.confidence},
    {"equity", rec.equity},
    {"equity_exact", rec.equity_exact},
    {"equity_trials", rec.equity_trials},
    {"pot", rec.pot},
    {"call_amount", rec.call_amount},
    {"pot_odds", rec.pot_odds},
    {"spr", rec.spr},
    {"ev", rec.ev},
    {"villain_range_percent", rec.villain_range_percent},
    {"blockers", rec.blockers},
    {"reasons", rec.reasons},
    {"opponent_advice", rec.opponent_advice},
    {"if_then", rec.if_then}
  };
}

DecisionRequest request_from_json(const json& j) {
  DecisionRequest request;
  request.hero = Hand{j.at("hand").get<std::string>()};
  request.position = j.value("position", request.position);
  request.stack_bb = j.value("stack", request.stack_bb);
  if(const auto line = j.value("line", std::string{"open"}); !str_to_line(line, request.line)) {
    throw std::invalid_argument{"Unknown line \"" + line + "\""};
  }
  request.opponent = j.value("opponent", request.opponent);
  request.facing_bet = j.value("facing_bet", request.facing_bet);
  if(j.contains("aggressor") && !j.at("aggressor").is_null()) request.aggressor = j.at("aggressor").get<std::string>();
  if(j.contains("seed") && !j.at("seed").is_null()) request.seed = j.at("seed").get<uint64_t>();
  request.trials = j.value("trials", request.trials);
  return request;
}

}
