#pragma once

#include <string>
#include <vector>
#include <preflop/config.hpp>
#include <preflop/poker.hpp>
#include <preflop/profiles.hpp>
#include <preflop/range.hpp>

namespace preflop {

enum class BlockerEffect : uint8_t {
  NONE, WEAK, MODERATE, STRONG
};

std::string effect_to_str(BlockerEffect effect);

struct BlockedClass {
  HandClass target;
  // share of the target's combinations still available to the opponent, 0..1
  double remaining;
  int points;
};

struct BlockerReport {
  BlockerEffect effect = BlockerEffect::NONE;
  int score = 0;
  std::vector<BlockedClass> blocked;
  std::vector<std::string> notes;

  const BlockedClass* find(const HandClass& target) const;
  std::string to_string() const;
};

class BlockerAnalyzer {
public:
  explicit BlockerAnalyzer(EngineConfig config = EngineConfig::defaults()) : _config{std::move(config)} {}

  BlockerReport analyze(const Hand& hero) const;
  int adjustment_for(const Hand& hero, BlockerAction action) const;
  int adjustment_for(const BlockerReport& report, BlockerAction action) const;
  double fold_equity_adjustment(const Hand& hero, const OpponentProfile& opponent) const;
  double fold_equity_adjustment(const BlockerReport& report, const OpponentProfile& opponent) const;

private:
  EngineConfig _config;
};

BlockerEffect effect_of_score(int score);
double surviving_fraction(const HandClass& target, const Hand& hero);

}
