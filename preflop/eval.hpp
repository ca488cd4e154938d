#pragma once

#include <memory>
#include <string>
#include <vector>
#include <omp/HandEvaluator.h>
#include <preflop/poker.hpp>

namespace preflop {

enum class HandCategory : uint8_t {
  ROYAL_FLUSH = 1, STRAIGHT_FLUSH = 2, FOUR_OF_A_KIND = 3, FULL_HOUSE = 4, FLUSH = 5,
  STRAIGHT = 6, THREE_OF_A_KIND = 7, TWO_PAIR = 8, PAIR = 9, HIGH_CARD = 10
};

std::string category_to_str(HandCategory category);

struct HandRank {
  int rank_class;
  int score;
  std::string label;

  bool operator==(const HandRank&) const = default;
};

enum class Showdown : uint8_t {
  A_WINS, B_WINS, TIE
};

struct Outs {
  int count;
  std::vector<uint8_t> cards;
};

// Ranks the best five card hand out of five to seven cards. Scores are dense, 1 is a royal flush and 7462 the worst high card.
class ExternalRanker {
public:
  virtual ~ExternalRanker() = default;
  virtual int score(const uint8_t* cards, int n_cards) const = 0;
  int score(const std::vector<uint8_t>& cards) const { return score(cards.data(), static_cast<int>(cards.size())); }
};

class OmpRanker : public ExternalRanker {
public:
  static const OmpRanker* get_instance() {
    static const OmpRanker instance;
    return &instance;
  }

  int score(const uint8_t* cards, int n_cards) const override;
  int score(const omp::Hand& hand) const { return _dense[_eval.evaluate(hand)]; }
  int n_distinct() const { return _n_distinct; }

  OmpRanker(const OmpRanker&) = delete;
  OmpRanker& operator=(const OmpRanker&) = delete;

private:
  OmpRanker();

  omp::HandEvaluator _eval;
  std::vector<uint16_t> _dense;
  int _n_distinct = 0;
};

HandCategory category_of_score(int score);
HandRank preflop_rank(const Hand& hand);

class HandRanker {
public:
  explicit HandRanker(const ExternalRanker* ranker = OmpRanker::get_instance()) : _ranker{ranker} {}

  // throws InvalidHandError for more than five board cards and InvalidCardError when hole and board share a card
  HandRank rank(const Hand& hole, const std::vector<uint8_t>& board = {}) const;
  HandRank rank(const std::vector<uint8_t>& hole, const std::vector<uint8_t>& board = {}) const;
  Showdown compare(const Hand& a, const Hand& b, const std::vector<uint8_t>& board = {}) const;
  Outs count_outs(const Hand& hole, const std::vector<uint8_t>& board) const;

private:
  int showdown_score(const Hand& hole, const std::vector<uint8_t>& board) const;

  const ExternalRanker* _ranker;
};

}
