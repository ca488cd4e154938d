#pragma once

#include <nlohmann/json.hpp>
#include <preflop/blockers.hpp>
#include <preflop/decision.hpp>
#include <preflop/equity.hpp>

namespace preflop {

void to_json(nlohmann::json& j, const Frequencies& freq);
void to_json(nlohmann::json& j, const BlockerReport& report);
void to_json(nlohmann::json& j, const EquityResult& result);
void to_json(nlohmann::json& j, const Recommendation& rec);

// missing optional fields take the DecisionRequest defaults
DecisionRequest request_from_json(const nlohmann::json& j);

}
