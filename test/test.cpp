#ifdef UNIT_TEST

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <omp/CardRange.h>
#include <omp/EquityCalculator.h>
#include <omp.h>
#include <preflop/blockers.hpp>
#include <preflop/cereal_ext.hpp>
#include <preflop/charts.hpp>
#include <preflop/cli.hpp>
#include <preflop/config.hpp>
#include <preflop/decision.hpp>
#include <preflop/equity.hpp>
#include <preflop/eval.hpp>
#include <preflop/json_io.hpp>
#include <preflop/poker.hpp>
#include <preflop/range.hpp>
#include <preflop/tables.hpp>

#include "lib.hpp"

using namespace preflop;
using namespace testlib;
using Catch::Matchers::WithinAbs;
using std::string;

TEST_CASE("Card encode/decode", "[card]") {
  int idx = 0;
  for(const char rank : RANKS) {
    for(const char suit : SUITS) {
      const string card = string(1, rank) + suit;
      const int card_idx = card_to_idx(card);
      REQUIRE(card_idx == idx++);
      REQUIRE(idx_to_card(card_idx) == card);
    }
  }
  REQUIRE(card_to_idx("as") == card_to_idx("AS"));
  REQUIRE(str_to_cards("Ah Kd, 2c") == std::vector<uint8_t>{card_to_idx("Ah"), card_to_idx("Kd"), card_to_idx("2c")});
}

TEST_CASE("Invalid cards", "[card]") {
  REQUIRE_THROWS_AS(card_to_idx("1s"), InvalidCardError);
  REQUIRE_THROWS_AS(card_to_idx("Ax"), InvalidCardError);
  REQUIRE_THROWS_AS(card_to_idx("Asd"), InvalidCardError);
  REQUIRE_THROWS_AS(idx_to_card(52), InvalidCardError);
  REQUIRE_THROWS_AS(Hand{"AsAs"}, InvalidCardError);
  REQUIRE_THROWS_AS(Hand{"AsKsQs"}, InvalidHandError);
  REQUIRE_THROWS_AS(Hand{"As"}, InvalidHandError);
  REQUIRE_THROWS_AS(parse_board("2c3c4c5c6c7c"), InvalidHandError);
  REQUIRE_THROWS_AS(parse_board("2c3c2c"), InvalidCardError);
}

TEST_CASE("Hand equality ignores card order", "[hand]") {
  REQUIRE(Hand{"AsKd"} == Hand{"KdAs"});
  REQUIRE(Hand{"AsKd"}.to_string() == "AsKd");
  REQUIRE(Hand{"2h7c"}.to_string() == "7c2h");
  REQUIRE(Hand{"AsKd"}.collides(Hand{"KdQh"}));
  REQUIRE(!Hand{"AsKd"}.collides(Hand{"KhQh"}));
}

TEST_CASE("Hole card index", "[hand]") {
  std::set<int> indices;
  for(uint8_t c1 = 0; c1 < MAX_CARDS; ++c1) {
    for(uint8_t c2 = 0; c2 < c1; ++c2) indices.insert(hole_card_index(Hand{c1, c2}));
  }
  REQUIRE(indices.size() == MAX_COMBOS);
  REQUIRE(*indices.begin() == 0);
  REQUIRE(*indices.rbegin() == MAX_COMBOS - 1);
}

TEST_CASE("Positions", "[hand]") {
  Position pos;
  REQUIRE(str_to_pos("btn", pos));
  REQUIRE(pos == Position::BTN);
  REQUIRE(!str_to_pos("UTG+1", pos));
  REQUIRE(postflop_order(Position::SB) < postflop_order(Position::BB));
  REQUIRE(postflop_order(Position::BB) < postflop_order(Position::UTG));
  REQUIRE(postflop_order(Position::CO) < postflop_order(Position::BTN));
}

TEST_CASE("Dense ranking table", "[eval]") {
  REQUIRE(OmpRanker::get_instance()->n_distinct() == N_DISTINCT_RANKS);
  const ExternalRanker* ranker = OmpRanker::get_instance();
  REQUIRE(ranker->score(str_to_cards("AsKsQsJsTs")) == 1);
  REQUIRE(ranker->score(str_to_cards("KsQsJsTs9s")) == 2);
  REQUIRE(ranker->score(str_to_cards("7s5h4d3c2s")) == N_DISTINCT_RANKS);
  REQUIRE(ranker->score(str_to_cards("AsKsQsJsTs2d3h")) == 1);
}

TEST_CASE("Evaluate hand", "[eval]") {
  const HandRanker ranker;
  const HandRank royal = ranker.rank(Hand{"AsKs"}, parse_board("QsJsTs"));
  REQUIRE(royal.rank_class == 1);
  REQUIRE(royal.score == 1);
  REQUIRE(royal.label == "Royal Flush");
  REQUIRE(ranker.rank(Hand{"2c3d"}, parse_board("4h5s6c")).rank_class == static_cast<int>(HandCategory::STRAIGHT));
  REQUIRE(ranker.rank(Hand{"AcAd"}, parse_board("AhAs2c")).rank_class == static_cast<int>(HandCategory::FOUR_OF_A_KIND));
  REQUIRE(ranker.rank(Hand{"7c2d"}, parse_board("9hJsKc4d3s")).rank_class == static_cast<int>(HandCategory::HIGH_CARD));
  REQUIRE(ranker.rank(Hand{"KcKd"}, parse_board("Kh2s2c")).rank_class == static_cast<int>(HandCategory::FULL_HOUSE));
  REQUIRE(ranker.rank(Hand{"AsKs"}, parse_board("Qs")).score == preflop_rank(Hand{"AsKs"}).score);
}

TEST_CASE("Evaluate invalid input", "[eval]") {
  const HandRanker ranker;
  REQUIRE_THROWS_AS(ranker.rank(str_to_cards("AsKsQs")), InvalidHandError);
  REQUIRE_THROWS_AS(ranker.rank(Hand{"AsKs"}, parse_board("AsQdJc")), InvalidCardError);
  REQUIRE_THROWS_AS(ranker.rank(Hand{"AsKs"}, str_to_cards("2c3c4c5c6c7c")), InvalidHandError);
  REQUIRE_THROWS_AS(ranker.compare(Hand{"AsKs"}, Hand{"AsQd"}), InvalidCardError);
}

TEST_CASE("Compare hands", "[eval]") {
  const HandRanker ranker;
  REQUIRE(ranker.compare(Hand{"AsAd"}, Hand{"KsKd"}, parse_board("2c7h9dJs3c")) == Showdown::A_WINS);
  REQUIRE(ranker.compare(Hand{"KsKd"}, Hand{"AsAd"}, parse_board("2c7h9dJs3c")) == Showdown::B_WINS);
  REQUIRE(ranker.compare(Hand{"2s3d"}, Hand{"2h3c"}, parse_board("AcKdQhJsTc")) == Showdown::TIE);
  REQUIRE(ranker.compare(Hand{"AsAd"}, Hand{"KsKd"}) == Showdown::A_WINS);
}

TEST_CASE("Preflop ranking is monotonic", "[eval]") {
  REQUIRE(preflop_rank(Hand{"AsAd"}).score < preflop_rank(Hand{"KsKd"}).score);
  REQUIRE(preflop_rank(Hand{"KsKd"}).score < preflop_rank(Hand{"AsKs"}).score);
  REQUIRE(preflop_rank(Hand{"AsKs"}).score < preflop_rank(Hand{"AsKd"}).score);
  REQUIRE(preflop_rank(Hand{"7s2d"}).rank_class == 8);

  std::vector<HandRank> ranks;
  for(const HandClass& hc : HandClass::all()) ranks.push_back(preflop_rank(hc.expand().front()));
  for(const HandRank& a : ranks) {
    for(const HandRank& b : ranks) {
      if(a.rank_class < b.rank_class) REQUIRE(a.score < b.score);
    }
  }
}

TEST_CASE("Count outs", "[eval]") {
  const HandRanker ranker;
  const Outs flush_draw = ranker.count_outs(Hand{"AhKh"}, parse_board("2h7h9c"));
  for(const string& heart : {"3h", "4h", "5h", "6h", "8h", "9h", "Th", "Jh", "Qh"}) {
    REQUIRE(std::ranges::find(flush_draw.cards, card_to_idx(heart)) != flush_draw.cards.end());
  }
  REQUIRE(flush_draw.count == static_cast<int>(flush_draw.cards.size()));
  REQUIRE(ranker.count_outs(Hand{"AsAd"}, parse_board("AhAcKs")).count == 0);
  REQUIRE_THROWS_AS(ranker.count_outs(Hand{"AsAd"}, parse_board("AhAcKs2d3d")), InvalidHandError);
}

TEST_CASE("Expand hand classes", "[range]") {
  REQUIRE(expand_class(HandClass{"QQ"}).size() == 6);
  REQUIRE(expand_class(HandClass{"AKs"}).size() == 4);
  REQUIRE(expand_class(HandClass{"AKo"}).size() == 12);
  REQUIRE(expand_class(HandClass{"AK"}).size() == 16);
  for(const HandClass& hc : HandClass::all()) REQUIRE(hc.expand().size() == hc.n_combos());
  for(const Hand& hand : expand_class(HandClass{"T9s"})) REQUIRE(hand.is_suited());
  for(const Hand& hand : expand_class(HandClass{"T9o"})) REQUIRE(!hand.is_suited());
  REQUIRE(HandClass{"KA"} == HandClass{"AK"});
  REQUIRE(HandClass{"t9S"}.to_string() == "T9s");
}

TEST_CASE("All hand classes", "[range]") {
  const auto& classes = HandClass::all();
  REQUIRE(classes.size() == MAX_PREFLOP_COMBOS);
  const std::set<string> names = [&] {
    std::set<string> out;
    for(const auto& hc : classes) out.insert(hc.to_string());
    return out;
  }();
  REQUIRE(names.size() == MAX_PREFLOP_COMBOS);
  Range full{classes};
  REQUIRE(full.size() == MAX_COMBOS);
  REQUIRE_THAT(full.percent_of_all(), WithinAbs(100.0, 1e-9));
  for(const Hand& hand : full.hands()) REQUIRE(HandClass::of(hand).contains(hand));
}

TEST_CASE("Invalid hand notation", "[range]") {
  REQUIRE_THROWS_AS(HandClass{"AAs"}, InvalidHandError);
  REQUIRE_THROWS_AS(HandClass{"AKx"}, InvalidHandError);
  REQUIRE_THROWS_AS(HandClass{"A"}, InvalidHandError);
  REQUIRE_THROWS_AS(HandClass{"1K"}, InvalidCardError);
}

TEST_CASE("Hand descriptions", "[range]") {
  REQUIRE(HandClass{"AA"}.describe() == "Pocket Aces (monster)");
  REQUIRE(HandClass{"66"}.describe() == "Pocket Sixes");
  REQUIRE(HandClass{"AKs"}.describe() == "Ace-King suited");
  REQUIRE(HandClass{"A5o"}.describe() == "Ace with kicker offsuit");
  REQUIRE(HandClass{"98s"}.describe() == "Connector suited");
}

TEST_CASE("Range de-duplicates hands", "[range]") {
  Range range;
  range.add_class(HandClass{"AK"});
  range.add_class(HandClass{"AKs"});
  range.add_hand(Hand{"KdAh"});
  REQUIRE(range.size() == 16);
  REQUIRE(range.contains(Hand{"AhKd"}));
  REQUIRE(Range{std::vector<Hand>{Hand{"AsKs"}, Hand{"QdQc"}}}.to_string() == "AsKs QdQc");
  REQUIRE(!range.contains(Hand{"AhQd"}));
}

TEST_CASE("Filter dead cards", "[range]") {
  const Range aces{std::vector{HandClass{"AA"}}};
  REQUIRE(filter_dead_cards(aces, str_to_cards("As")).size() == 3);
  REQUIRE(filter_dead_cards(aces, str_to_cards("AsAh")).size() == 1);
  REQUIRE(filter_dead_cards(aces, str_to_cards("AsAhAd")).empty());
  const Range ak{std::vector{HandClass{"AKo"}}};
  REQUIRE(filter_dead_cards(ak, str_to_cards("AsKs")).size() == 6);
}

TEST_CASE("Range charts", "[range]") {
  REQUIRE(range_for(Position::UTG, RangeAction::OPEN).size() == 124);
  REQUIRE(range_for("UTG", "open") == range_for(Position::UTG, RangeAction::OPEN));
  REQUIRE(range_for("nowhere", "open") == range_for(Position::CO, RangeAction::OPEN));
  REQUIRE(range_for("BTN", "jam") == range_for(Position::BTN, RangeAction::OPEN));
  REQUIRE(range_for("BB", "open") == range_for(Position::CO, RangeAction::OPEN));
  REQUIRE(range_for("BTN", "3bet") == range_for(Position::CO, RangeAction::THREE_BET));

  const ChartRange defend = chart_range(Position::BB, RangeAction::DEFEND);
  REQUIRE(defend.position == Position::BB);
  REQUIRE(defend.range_percent == 40);
  REQUIRE(chart_range(Position::BTN, RangeAction::OPEN).range_percent == 35);
  REQUIRE(range_for(Position::BTN, RangeAction::OPEN).size() > range_for(Position::UTG, RangeAction::OPEN).size());
}

TEST_CASE("Hand percentiles", "[range]") {
  REQUIRE(percentile_of(HandClass{"AA"}) == 100);
  REQUIRE(percentile_of(HandClass{"AKs"}) == 97);
  REQUIRE(percentile_of(HandClass{"T3s"}) == 1);
  REQUIRE(percentile_of(HandClass{"72o"}) == 5);
  REQUIRE(percentile_of(Hand{"KhAh"}) == 97);
}

TEST_CASE("Blockers with pocket aces", "[blockers]") {
  const BlockerAnalyzer analyzer;
  const BlockerReport report = analyzer.analyze(Hand{"AsAh"});
  const BlockedClass* aces = report.find(HandClass{"AA"});
  REQUIRE(aces != nullptr);
  REQUIRE_THAT(aces->remaining, WithinAbs(0.0, 1e-12));
  REQUIRE(report.effect == BlockerEffect::STRONG);
  REQUIRE(report.score == 35);
  REQUIRE(report.find(HandClass{"KK"}) == nullptr);
}

TEST_CASE("Blockers with ace-king", "[blockers]") {
  const BlockerAnalyzer analyzer;
  const BlockerReport report = analyzer.analyze(Hand{"AsKs"});
  REQUIRE(report.effect >= BlockerEffect::MODERATE);
  REQUIRE_THAT(report.find(HandClass{"AA"})->remaining, WithinAbs(0.5, 1e-12));
  REQUIRE_THAT(report.find(HandClass{"KK"})->remaining, WithinAbs(0.5, 1e-12));
  REQUIRE_THAT(report.find(HandClass{"AK"})->remaining, WithinAbs(9.0 / 16.0, 1e-12));
  REQUIRE_THAT(report.find(HandClass{"AQ"})->remaining, WithinAbs(12.0 / 16.0, 1e-12));
  REQUIRE(report.score == 15 + 12 + 20);
}

TEST_CASE("Blocker effect thresholds", "[blockers]") {
  const BlockerAnalyzer analyzer;
  REQUIRE(analyzer.analyze(Hand{"7s2d"}).effect == BlockerEffect::NONE);
  REQUIRE(analyzer.analyze(Hand{"7s2d"}).blocked.empty());
  REQUIRE(analyzer.analyze(Hand{"Qs2d"}).effect == BlockerEffect::WEAK);
  REQUIRE(analyzer.analyze(Hand{"As2d"}).effect == BlockerEffect::MODERATE);
  REQUIRE(effect_of_score(30) == BlockerEffect::STRONG);
  REQUIRE(effect_of_score(0) == BlockerEffect::NONE);
}

TEST_CASE("Blocker adjustments", "[blockers]") {
  const BlockerAnalyzer analyzer;
  REQUIRE(analyzer.adjustment_for(Hand{"AsAh"}, BlockerAction::RAISE) == 10);
  REQUIRE(analyzer.adjustment_for(Hand{"AsAh"}, BlockerAction::BLUFF) == 15);
  REQUIRE(analyzer.adjustment_for(Hand{"AsAh"}, BlockerAction::CALL) == 5);
  REQUIRE(analyzer.adjustment_for(Hand{"As5s"}, BlockerAction::RAISE) == 5);
  REQUIRE(analyzer.adjustment_for(Hand{"As5s"}, BlockerAction::BLUFF) == 8);
  REQUIRE(analyzer.adjustment_for(Hand{"7s2d"}, BlockerAction::BLUFF) == -10);
  REQUIRE(analyzer.adjustment_for(Hand{"7s2d"}, BlockerAction::CALL) == 0);

  const EngineConfig& config = EngineConfig::defaults();
  const double nit = analyzer.fold_equity_adjustment(Hand{"AsAh"}, config.opponent(OpponentType::NIT));
  const double fish = analyzer.fold_equity_adjustment(Hand{"AsAh"}, config.opponent(OpponentType::FISH));
  REQUIRE_THAT(nit, WithinAbs(35.0 / 5.0 * 1.5, 1e-9));
  REQUIRE(fish < nit);
}

TEST_CASE("Pot odds", "[equity]") {
  REQUIRE_THAT(pot_odds(4.5, 3.0), WithinAbs(40.0, 1e-9));
  REQUIRE(pot_odds(10.0, 0.0) == 0.0);
  REQUIRE(pot_odds(10.0, -1.0) == 0.0);
  REQUIRE(n_choose_k(48, 5) == 1'712'304);
}

TEST_CASE("Equity against an empty range is neutral", "[equity]") {
  const Hand hero{"AsAh"};
  const Range blocked{std::vector<Hand>{Hand{"AsAd"}, Hand{"AhAc"}}};
  REQUIRE(filter_dead_cards(blocked, hero.as_vector()).empty());
  REQUIRE(estimate_equity(hero, blocked, 1'000, 1) == NEUTRAL_EQUITY);
  REQUIRE(estimate_equity(hero, Range{}, 1'000, 1) == NEUTRAL_EQUITY);
  const EquityResult result = EquitySimulator{}.sample(hero, blocked, 1'000, 1);
  REQUIRE(result.trials == 0);
  REQUIRE(result.equity == NEUTRAL_EQUITY);
}

TEST_CASE("Equity is reproducible for a seed", "[equity]") {
  const Hand hero{"AsKs"};
  const Range villain = range_for(Position::CO, RangeAction::OPEN);
  EquitySimulator sim;
  const EquityResult a = sim.sample(hero, villain, 3'000, 1234);
  const EquityResult b = sim.sample(hero, villain, 3'000, 1234);
  REQUIRE(a.equity == b.equity);
  REQUIRE(a.wins == b.wins);
  REQUIRE(a.trials == 3'000);
  REQUIRE(!a.exact);

  EquitySimulator small_blocks;
  small_blocks.set_block_size(1'000);
  const EquityResult c = small_blocks.sample(hero, villain, 3'000, 1234);
  REQUIRE(c.trials == 3'000);
  REQUIRE(std::abs(c.equity - a.equity) < 5.0);
}

TEST_CASE("Equity does not depend on thread count", "[equity]") {
  const Hand hero{"QsQh"};
  const Range villain = range_for(Position::BTN, RangeAction::OPEN);
  EquitySimulator sim;
  sim.set_block_size(500);
  const int threads = omp_get_max_threads();
  omp_set_num_threads(1);
  const EquityResult single = sim.sample(hero, villain, 4'000, 2024);
  omp_set_num_threads(4);
  const EquityResult multi = sim.sample(hero, villain, 4'000, 2024);
  omp_set_num_threads(threads);
  REQUIRE(single.wins == multi.wins);
  REQUIRE(single.ties == multi.ties);
  REQUIRE(single.losses == multi.losses);
  REQUIRE(single.equity == multi.equity);
}

TEST_CASE("Seed selection", "[equity]") {
  SimulationConfig config;
  REQUIRE(choose_seed(std::optional<uint64_t>{9}, config) == 9);
  config.seed = 17;
  REQUIRE(choose_seed(std::nullopt, config) == 17);
  REQUIRE(choose_seed(std::optional<uint64_t>{9}, config) == 9);
}

TEST_CASE("Equity converges with more trials", "[equity][slow]") {
  const Hand hero{"AsKs"};
  const Range utg = range_for(Position::UTG, RangeAction::OPEN);
  const double coarse = estimate_equity(hero, utg, 500, 99);
  const double fine = estimate_equity(hero, utg, 5'000, 99);
  REQUIRE(std::abs(coarse - fine) < 8.0);
  REQUIRE(fine > 40.0);
  REQUIRE(fine < 75.0);
}

TEST_CASE("Exact equity matches reference calculator", "[equity]") {
  const Hand hero{"AhKh"};
  const Range villain{std::vector<Hand>{Hand{"QsQd"}}};
  const string board_str = "Qh7h2c";
  const EquityResult result = EquitySimulator{}.estimate(hero, villain, 1'000, 5, parse_board(board_str));
  REQUIRE(result.exact);
  REQUIRE(result.trials == n_choose_k(45, 2));

  omp::EquityCalculator eq;
  eq.start({omp::CardRange("AhKh"), omp::CardRange("QsQd")}, omp::CardRange::getCardMask(board_str), 0, true);
  eq.wait();
  REQUIRE_THAT(result.equity, WithinAbs(eq.getResults().equity[0] * 100.0, 1e-4));
}

TEST_CASE("Sampled equity with a flop board", "[equity]") {
  const Hand hero{"AhKh"};
  const Range villain{std::vector<Hand>{Hand{"QsQd"}}};
  const auto board = parse_board("Qh7h2c");
  EquitySimulator sampler;
  sampler.set_exact_ceiling(0);
  const EquityResult sampled = sampler.estimate(hero, villain, 20'000, 5, board);
  const EquityResult exact = EquitySimulator{}.estimate(hero, villain, 20'000, 5, board);
  REQUIRE(!sampled.exact);
  REQUIRE(sampled.trials == 20'000);
  REQUIRE(sampled.wins + sampled.ties + sampled.losses == sampled.trials);
  REQUIRE(exact.exact);
  REQUIRE_THAT(sampled.equity, WithinAbs(exact.equity, 2.0));
}

TEST_CASE("Exact equity on the river", "[equity]") {
  const EquityResult result = EquitySimulator{}.estimate(Hand{"AsAh"}, Range{std::vector{HandClass{"KK"}}}, 100, 5, parse_board("2c7d9hJsQc"));
  REQUIRE(result.exact);
  REQUIRE(result.trials == 6);
  REQUIRE(result.equity == 100.0);
}

TEST_CASE("Preflop exact equity", "[equity][slow]") {
  const EquityResult result = EquitySimulator{}.estimate(Hand{"AsAc"}, Range{std::vector<Hand>{Hand{"KhKd"}}}, 1'000, 5);
  REQUIRE(result.exact);
  REQUIRE(result.trials == n_choose_k(48, 5));
  REQUIRE(result.equity > 80.0);
  REQUIRE(result.equity < 84.0);
}

TEST_CASE("Equity rejects conflicting boards", "[equity]") {
  const Range villain = range_for(Position::CO, RangeAction::OPEN);
  REQUIRE_THROWS_AS(estimate_equity(Hand{"AsKs"}, villain, 100, 1, parse_board("As7d2c")), InvalidCardError);
  REQUIRE_THROWS_AS(EquitySimulator{}.sample(Hand{"AsKs"}, villain, 0, 1), std::invalid_argument);
}

TEST_CASE("Equity against a position", "[equity]") {
  const PositionEquity eq = equity_vs_position(Hand{"QsQh"}, "MP", "open", 2'000, 3);
  REQUIRE(eq.position == Position::MP);
  REQUIRE(eq.range_percent == 18);
  REQUIRE(eq.result.equity > 50.0);
}

TEST_CASE("Quick equity estimate", "[equity]") {
  REQUIRE_THAT(quick_equity_estimate(Hand{"AsAh"}), WithinAbs(90.0, 1e-9));
  REQUIRE_THAT(quick_equity_estimate(Hand{"AsAh"}, 3), WithinAbs(90.0 / 1.3, 1e-9));
  REQUIRE_THAT(quick_equity_estimate(Hand{"7s2d"}), WithinAbs(14.0, 1e-9));
  REQUIRE(quick_equity_estimate(Hand{"AsKs"}, 2) < quick_equity_estimate(Hand{"AsKs"}, 1));
  REQUIRE_THROWS_AS(quick_equity_estimate(Hand{"AsAh"}, 0), std::invalid_argument);
}

TEST_CASE("Frequency tables", "[decision]") {
  const EngineConfig& config = EngineConfig::defaults();
  for(int l = 0; l < N_LINES; ++l) {
    for(const FrequencyRow& row : config.frequency_table(static_cast<LineType>(l))) REQUIRE(row.freq.sum() == 100);
  }
  REQUIRE(tables::is_valid_frequency_table(tables::OPEN_TABLE));
  const auto& rows = config.frequency_table(LineType::OPEN);
  REQUIRE(lookup_frequencies(rows, 100, 0) == Frequencies{100, 0, 0});
  REQUIRE(lookup_frequencies(rows, 0, 50) == Frequencies{0, 0, 100});
  REQUIRE(lookup_frequencies(rows, 80, 20) == Frequencies{70, 0, 30});
}

TEST_CASE("Primary action tie-breaking", "[decision]") {
  REQUIRE(primary_action(Frequencies{50, 50, 0}) == PlayerAction::RAISE);
  REQUIRE(primary_action(Frequencies{0, 50, 50}) == PlayerAction::CALL);
  REQUIRE(primary_action(Frequencies{40, 20, 40}) == PlayerAction::RAISE);
  REQUIRE(primary_action(Frequencies{10, 45, 45}) == PlayerAction::CALL);
  REQUIRE(primary_action(Frequencies{10, 20, 70}) == PlayerAction::FOLD);
}

TEST_CASE("Open with pocket aces", "[decision]") {
  const Recommendation rec = decide(make_request("AsAh", "BTN", LineType::OPEN));
  REQUIRE(rec.primary_action == PlayerAction::RAISE);
  REQUIRE(rec.frequencies == Frequencies{100, 0, 0});
  REQUIRE(rec.confidence >= 0.85);
  REQUIRE(rec.confidence <= 0.95);
  REQUIRE(rec.percentile == 100);
  REQUIRE(rec.equity == 100.0);
  REQUIRE(rec.blockers.effect == BlockerEffect::STRONG);
  REQUIRE(rec.ev > 0.0);
}

TEST_CASE("Fold seven-deuce under the gun", "[decision]") {
  const Recommendation rec = decide(make_request("7s2d", "UTG", LineType::OPEN));
  REQUIRE(rec.primary_action == PlayerAction::FOLD);
  REQUIRE(rec.frequencies.fold == 100);
  REQUIRE(rec.ev == 0.0);
  REQUIRE(rec.confidence >= 0.3);
}

TEST_CASE("Opponent advice and follow-up plan", "[decision]") {
  const Recommendation aces = decide(make_request("AsAh", "BTN", LineType::OPEN));
  REQUIRE(aces.opponent_advice.empty());
  REQUIRE(aces.if_then == std::vector<string>{"If 3-bet: 4-bet"});

  const Recommendation trash = decide(make_request("7s2d", "UTG", LineType::OPEN, "nit"));
  REQUIRE(trash.if_then.empty());
  REQUIRE(trash.opponent_advice == EngineConfig::defaults().opponent(OpponentType::NIT).advice);
  REQUIRE(!trash.opponent_advice.empty());

  DecisionRequest request = make_request("AsKs", "BTN", LineType::FACING_OPEN, "nit", 3.0, 11);
  request.aggressor = "UTG";
  request.trials = 500;
  const Recommendation ak = decide(request);
  REQUIRE(ak.primary_action == PlayerAction::RAISE);
  REQUIRE(!ak.if_then.empty());
  REQUIRE(ak.if_then.front() == "If 4-bet: jam");
  REQUIRE(ak.to_string().find("> If 4-bet: jam") != string::npos);
}

TEST_CASE("Contingency plan when shallow", "[decision]") {
  Recommendation rec;
  rec.line = LineType::FACING_OPEN;
  rec.primary_action = PlayerAction::CALL;
  rec.percentile = 60;
  rec.threshold_shift = 0;
  rec.spr = 2.0;
  const std::vector<string> plan = contingency_plan(rec, EngineConfig::defaults());
  REQUIRE(plan.size() == 2);
  REQUIRE(plan[0] == "If squeezed: fold");
  REQUIRE(plan[1].starts_with("If the flop connects"));

  rec.primary_action = PlayerAction::FOLD;
  REQUIRE(contingency_plan(rec, EngineConfig::defaults()).empty());
  REQUIRE(response_to_reraise(LineType::FACING_4BET, 1, 0, EngineConfig::defaults()) == PlayerAction::CALL);
  REQUIRE(response_to_reraise(LineType::FACING_3BET, 97, 0, EngineConfig::defaults()) == PlayerAction::CALL);
}

TEST_CASE("Four-bet frequency changes the value of a 3-bet", "[decision]") {
  EngineConfig passive;
  EngineConfig aggressive;
  for(auto& o : aggressive.opponents) {
    if(o.type == OpponentType::NIT) o.four_bet_freq = 0.25;
  }
  DecisionRequest request = make_request("AsKs", "BTN", LineType::FACING_OPEN, "nit", 3.0, 11);
  request.aggressor = "UTG";
  request.trials = 500;
  const Recommendation low = DecisionEngine{passive}.decide(request);
  const Recommendation high = DecisionEngine{aggressive}.decide(request);
  REQUIRE(low.equity == high.equity);
  REQUIRE(low.frequencies == high.frequencies);
  REQUIRE(low.ev != high.ev);
}

TEST_CASE("Facing an open with ace-king suited", "[decision][slow]") {
  DecisionRequest request = make_request("AsKs", "BTN", LineType::FACING_OPEN, "nit", 3.0, 11);
  request.aggressor = "UTG";
  const Recommendation rec = decide(request);
  REQUIRE(rec.equity != static_cast<double>(rec.percentile));
  REQUIRE(rec.equity > 40.0);
  REQUIRE(rec.villain_range_percent == 15);
  REQUIRE_THAT(rec.pot, WithinAbs(4.5, 1e-9));
  REQUIRE_THAT(rec.call_amount, WithinAbs(3.0, 1e-9));
  REQUIRE_THAT(rec.pot_odds, WithinAbs(40.0, 1e-9));
  REQUIRE(rec.primary_action == PlayerAction::RAISE);
  REQUIRE(rec.frequencies.sum() == 100);

  const Recommendation again = decide(request);
  REQUIRE(again.equity == rec.equity);
}

TEST_CASE("Decision pot and stack-to-pot ratio", "[decision]") {
  DecisionRequest request = make_request("QsQh", "CO", LineType::FACING_3BET, "reg", 0.0, 3);
  request.stack_bb = 26.0;
  request.trials = 500;
  const Recommendation rec = decide(request);
  REQUIRE_THAT(rec.pot, WithinAbs(1.5 + 2.5 + 9.0, 1e-9));
  REQUIRE_THAT(rec.call_amount, WithinAbs(6.5, 1e-9));
  REQUIRE_THAT(rec.spr, WithinAbs(2.0, 1e-9));
}

TEST_CASE("Unknown spot names fall back to defaults", "[decision]") {
  const Recommendation rec = decide(make_request("KsKh", "LJ", LineType::OPEN, "whale"));
  REQUIRE(rec.position == Position::CO);
  REQUIRE(rec.opponent == "unknown");
}

TEST_CASE("Every spot yields a full distribution", "[decision][slow]") {
  EngineConfig config;
  config.simulation.trials = 100;
  config.simulation.exact_ceiling = 0;
  const DecisionEngine engine{config};
  const std::vector<string> hands = {"AsAh", "AsKd", "Ts9s", "7s2d", "5h5d"};
  const std::vector<string> positions = {"UTG", "MP", "CO", "BTN", "SB", "BB"};
  for(int l = 0; l < N_LINES; ++l) {
    for(const auto& opponent : config.opponents) {
      for(const auto& position : positions) {
        for(const auto& hand : hands) {
          const Recommendation rec = engine.decide(make_request(hand, position, static_cast<LineType>(l), opponent.name));
          REQUIRE(rec.frequencies.sum() == 100);
          REQUIRE(rec.frequencies.raise >= 0);
          REQUIRE(rec.frequencies.call >= 0);
          REQUIRE(rec.frequencies.fold >= 0);
          REQUIRE(rec.confidence >= 0.3);
          REQUIRE(rec.confidence <= 0.95);
          REQUIRE(rec.frequencies.of(rec.primary_action) == std::max({rec.frequencies.raise, rec.frequencies.call, rec.frequencies.fold}));
        }
      }
    }
  }
}

TEST_CASE("Invalid stack", "[decision]") {
  DecisionRequest request = make_request("AsAh", "BTN", LineType::OPEN);
  request.stack_bb = 0.0;
  REQUIRE_THROWS_AS(decide(request), std::invalid_argument);
}

TEST_CASE("Default config is valid", "[config]") {
  REQUIRE_NOTHROW(EngineConfig::defaults().validate());
  REQUIRE(EngineConfig::defaults() == EngineConfig{});
  REQUIRE(EngineConfig::defaults().percentiles.size() == 100);
  REQUIRE(EngineConfig::defaults().opponents.size() == 7);
}

TEST_CASE("Malformed config is rejected", "[config]") {
  EngineConfig bad_row;
  bad_row.frequency_tables[static_cast<int>(LineType::FACING_OPEN)][1].freq.call -= 1;
  REQUIRE_THROWS_AS(bad_row.validate(), ConfigError);
  REQUIRE_THROWS_AS(DecisionEngine{bad_row}, ConfigError);

  EngineConfig bad_order;
  std::swap(bad_order.frequency_tables[0][0], bad_order.frequency_tables[0][1]);
  REQUIRE_THROWS_AS(bad_order.validate(), ConfigError);

  EngineConfig bad_chart;
  bad_chart.charts[0].actions[0].push_back("AXs");
  REQUIRE_THROWS_AS(bad_chart.validate(), ConfigError);

  EngineConfig no_fallback;
  no_fallback.charts[static_cast<int>(Position::CO)].actions[static_cast<int>(RangeAction::THREE_BET)].clear();
  REQUIRE_THROWS_AS(no_fallback.validate(), ConfigError);

  EngineConfig bad_blocks;
  bad_blocks.simulation.block_size = 0;
  REQUIRE_THROWS_AS(bad_blocks.validate(), ConfigError);
}

TEST_CASE("Opponent frequencies are bounded", "[config]") {
  EngineConfig config;
  config.opponents[1].fold_to_3bet = 0.9;
  config.opponents[1].four_bet_freq = 0.2;
  REQUIRE_THROWS_AS(config.validate(), ConfigError);
}

TEST_CASE("Serialize EngineConfig", "[serialize]") {
  EngineConfig config;
  config.simulation.trials = 777;
  config.opponents[1].fold_to_3bet = 0.4;
  REQUIRE(test_serialization(config));
  REQUIRE(test_serialization(Hand{"Ac2s"}));
}

TEST_CASE("Recommendation to json", "[json]") {
  const Recommendation rec = decide(make_request("AsAh", "BTN", LineType::OPEN));
  const nlohmann::json j = rec;
  REQUIRE(j.at("action").get<string>() == "raise");
  REQUIRE(j.at("frequencies").at("raise").get<int>() == 100);
  REQUIRE(j.at("blockers").at("effect").get<string>() == "strong");
  REQUIRE(j.at("hand").get<string>() == "AA");
  REQUIRE(j.at("if_then").get<std::vector<string>>() == std::vector<string>{"If 3-bet: 4-bet"});
  REQUIRE(j.at("opponent_advice").get<string>().empty());

  const nlohmann::json nit = decide(make_request("7s2d", "UTG", LineType::OPEN, "nit"));
  REQUIRE(nit.at("if_then").empty());
  REQUIRE(nit.at("opponent_advice").get<string>().starts_with("Nit:"));
}

TEST_CASE("Decision request from json", "[json]") {
  const auto j = nlohmann::json::parse(R"({"hand": "AsKs", "position": "BTN", "stack": 40, "line": "vs_open", "facing_bet": 3, "aggressor": "UTG", "seed": 5})");
  const DecisionRequest request = request_from_json(j);
  REQUIRE(request.hero == Hand{"KsAs"});
  REQUIRE(request.line == LineType::FACING_OPEN);
  REQUIRE(request.stack_bb == 40.0);
  REQUIRE(request.aggressor == std::optional<string>{"UTG"});
  REQUIRE(request.seed == std::optional<uint64_t>{5});
  REQUIRE(request.opponent == "unknown");
  REQUIRE_THROWS_AS(request_from_json(nlohmann::json::parse(R"({"hand": "AsKs", "line": "limp"})")), std::invalid_argument);
  REQUIRE_THROWS_AS(request_from_json(nlohmann::json::parse(R"({"hand": "AsAs"})")), InvalidCardError);
}

TEST_CASE("Command line options", "[cli]") {
  const char* argv[] = {"Preflop", "decide", "AsAh", "--seed", "42", "BTN", "--board", "Qh7h2c"};
  const CommandLine cl = parse_command_line(8, argv);
  REQUIRE(cl.args == std::vector<string>{"decide", "AsAh", "BTN"});
  REQUIRE(cl.seed == std::optional<uint64_t>{42});
  REQUIRE(cl.board == "Qh7h2c");
  REQUIRE(!cl.config_fn);

  const char* bad_seed[] = {"Preflop", "equity", "--seed", "abc"};
  REQUIRE_THROWS_AS(parse_command_line(4, bad_seed), std::invalid_argument);
  const char* partial_seed[] = {"Preflop", "equity", "--seed", "12x"};
  REQUIRE_THROWS_AS(parse_command_line(4, partial_seed), std::invalid_argument);
}

#endif
