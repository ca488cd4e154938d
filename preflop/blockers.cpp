#include <algorithm>
#include <sstream>
#include <preflop/blockers.hpp>
#include <preflop/util.hpp>

namespace preflop {

std::string effect_to_str(const BlockerEffect effect) {
  switch(effect) {
    case BlockerEffect::NONE: return "none";
    case BlockerEffect::WEAK: return "weak";
    case BlockerEffect::MODERATE: return "moderate";
    case BlockerEffect::STRONG: return "strong";
  }
  throw std::runtime_error{"Unknown blocker effect."};
}

BlockerEffect effect_of_score(const int score) {
  if(score >= 30) return BlockerEffect::STRONG;
  if(score >= 15) return BlockerEffect::MODERATE;
  if(score > 0) return BlockerEffect::WEAK;
  return BlockerEffect::NONE;
}

static int count_rank(const Hand& hand, const int rank) {
  return (card_rank(hand.high()) == rank) + (card_rank(hand.low()) == rank);
}

double surviving_fraction(const HandClass& target, const Hand& hero) {
  if(target.suitedness() == Suitedness::PAIRED) {
    // each held card of the rank takes half of the pair's combinations
    return std::max(0.0, 1.0 - count_rank(hero, target.high()) / 2.0);
  }
  const auto combos = target.expand();
  const long live = std::ranges::count_if(combos, [&](const Hand& h) { return !h.collides(hero); });
  return static_cast<double>(live) / static_cast<double>(combos.size());
}

const BlockedClass* BlockerReport::find(const HandClass& target) const {
  const auto it = std::ranges::find_if(blocked, [&](const BlockedClass& b) { return b.target == target; });
  return it == blocked.end() ? nullptr : &*it;
}

std::string BlockerReport::to_string() const {
  std::ostringstream oss;
  oss << "Blockers: " << effect_to_str(effect) << " (score " << score << ")";
  for(const auto& b : blocked) oss << ", " << b.target.to_string() << " " << round_to_str(b.remaining * 100.0, 0) << "% left";
  return oss.str();
}

BlockerReport BlockerAnalyzer::analyze(const Hand& hero) const {
  BlockerReport report;
  for(const BlockerWatch& watch : _config.blocker_watch) {
    const HandClass target{watch.target};
    int points = 0;
    if(target.suitedness() == Suitedness::PAIRED) {
      points = count_rank(hero, target.high()) * watch.per_card_points;
    }
    else {
      const bool has_high = count_rank(hero, target.high()) > 0;
      const bool has_low = count_rank(hero, target.low()) > 0;
      if(has_high && has_low) points = watch.both_ranks_points;
      else if(has_high || has_low) points = watch.one_rank_points;
    }
    const double remaining = surviving_fraction(target, hero);
    if(remaining >= 1.0) continue;
    report.blocked.push_back(BlockedClass{target, remaining, points});
    report.score += points;
    const std::string blocked_pct = round_to_str((1.0 - remaining) * 100.0, 0);
    if(remaining <= 0.0) report.notes.push_back("Fully blocks " + target.to_string());
    else report.notes.push_back("Blocks " + blocked_pct + "% of " + target.to_string() + " combos");
  }
  report.effect = effect_of_score(report.score);
  return report;
}

int BlockerAnalyzer::adjustment_for(const BlockerReport& report, const BlockerAction action) const {
  for(const AdjustmentRow& row : _config.adjustment_table(action)) {
    if(report.score >= row.min_score) return row.points;
  }
  return 0;
}

int BlockerAnalyzer::adjustment_for(const Hand& hero, const BlockerAction action) const {
  return adjustment_for(analyze(hero), action);
}

double BlockerAnalyzer::fold_equity_adjustment(const BlockerReport& report, const OpponentProfile& opponent) const {
  return report.score / 5.0 * opponent.blocker_awareness;
}

double BlockerAnalyzer::fold_equity_adjustment(const Hand& hero, const OpponentProfile& opponent) const {
  return fold_equity_adjustment(analyze(hero), opponent);
}

}
