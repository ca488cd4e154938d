#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include <omp/Hand.h>
#include <omp/HandEvaluator.h>
#include <preflop/blockers.hpp>
#include <preflop/charts.hpp>
#include <preflop/decision.hpp>
#include <preflop/equity.hpp>
#include <preflop/eval.hpp>
#include <preflop/poker.hpp>

using namespace preflop;
using std::string;

TEST_CASE("Evaluate benchmark", "[eval]") {
  const OmpRanker* ranker = OmpRanker::get_instance();
  omp::Hand hero = omp::Hand::empty() + omp::Hand(card_to_idx("Qd")) + omp::Hand(card_to_idx("As")) + omp::Hand(card_to_idx("6h")) +
      omp::Hand(card_to_idx("Js")) + omp::Hand(card_to_idx("2c"));
  omp::Hand villain = omp::Hand::empty() + omp::Hand(card_to_idx("3d")) + omp::Hand(card_to_idx("9h")) + omp::Hand(card_to_idx("Kc")) +
      omp::Hand(card_to_idx("4h")) + omp::Hand(card_to_idx("8s"));
  BENCHMARK("Dense score 5 cards") {
    return ranker->score(hero) < ranker->score(villain);
  };

  hero += omp::Hand(card_to_idx("Jd")) + omp::Hand(card_to_idx("6c"));
  villain += omp::Hand(card_to_idx("4c")) + omp::Hand(card_to_idx("Qc"));
  BENCHMARK("Dense score 7 cards") {
    return ranker->score(hero) < ranker->score(villain);
  };

  const std::vector<uint8_t> cards = str_to_cards("QdAs6hJs2cJd6c");
  BENCHMARK("Dense score 7 card indices") {
    return ranker->score(cards.data(), 7);
  };
}

TEST_CASE("Equity benchmark", "[equity]") {
  const Hand hero{"AsKs"};
  const Range villain = range_for(Position::CO, RangeAction::OPEN);
  BENCHMARK("Sample 2000 trials vs CO open") {
    return estimate_equity(hero, villain, 2'000, 42);
  };
  BENCHMARK("Enumerate turn and river vs CO open") {
    return EquitySimulator{}.enumerate(hero, villain, parse_board("Qh7h2c"));
  };
}

TEST_CASE("Decision benchmark", "[decision]") {
  DecisionRequest open;
  open.hero = Hand{"Ts9s"};
  open.position = "BTN";
  open.seed = 1;
  BENCHMARK("Decide open") {
    return decide(open);
  };

  DecisionRequest facing = open;
  facing.line = LineType::FACING_OPEN;
  facing.aggressor = "UTG";
  BENCHMARK("Decide facing open") {
    return decide(facing);
  };

  const BlockerAnalyzer analyzer;
  BENCHMARK("Analyze blockers") {
    return analyzer.analyze(Hand{"AsKd"});
  };
}
