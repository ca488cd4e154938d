#include <algorithm>
#include <preflop/eval.hpp>
#include <preflop/logging.hpp>

namespace preflop {

std::string category_to_str(const HandCategory category) {
  switch(category) {
    case HandCategory::ROYAL_FLUSH: return "Royal Flush";
    case HandCategory::STRAIGHT_FLUSH: return "Straight Flush";
    case HandCategory::FOUR_OF_A_KIND: return "Four of a Kind";
    case HandCategory::FULL_HOUSE: return "Full House";
    case HandCategory::FLUSH: return "Flush";
    case HandCategory::STRAIGHT: return "Straight";
    case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
    case HandCategory::TWO_PAIR: return "Two Pair";
    case HandCategory::PAIR: return "Pair";
    case HandCategory::HIGH_CARD: return "High Card";
  }
  throw std::runtime_error{"Unknown hand category."};
}

OmpRanker::OmpRanker() : _dense(10 * omp::HAND_CATEGORY_OFFSET, 0) {
  std::vector<bool> seen(_dense.size(), false);
  for(int c0 = 0; c0 < MAX_CARDS; ++c0) {
    const omp::Hand h0 = omp::Hand::empty() + omp::Hand(c0);
    for(int c1 = c0 + 1; c1 < MAX_CARDS; ++c1) {
      const omp::Hand h1 = h0 + omp::Hand(c1);
      for(int c2 = c1 + 1; c2 < MAX_CARDS; ++c2) {
        const omp::Hand h2 = h1 + omp::Hand(c2);
        for(int c3 = c2 + 1; c3 < MAX_CARDS; ++c3) {
          const omp::Hand h3 = h2 + omp::Hand(c3);
          for(int c4 = c3 + 1; c4 < MAX_CARDS; ++c4) {
            seen[_eval.evaluate(h3 + omp::Hand(c4))] = true;
          }
        }
      }
    }
  }
  int rank = 0;
  for(int value = static_cast<int>(seen.size()) - 1; value >= 0; --value) {
    if(seen[value]) _dense[value] = static_cast<uint16_t>(++rank);
  }
  _n_distinct = rank;
  if(_n_distinct != N_DISTINCT_RANKS) {
    Logger::error("Hand ranking table has " + std::to_string(_n_distinct) + " distinct values, expected " + std::to_string(N_DISTINCT_RANKS));
  }
}

int OmpRanker::score(const uint8_t* cards, const int n_cards) const {
  omp::Hand hand = omp::Hand::empty();
  for(int i = 0; i < n_cards; ++i) hand += omp::Hand(cards[i]);
  return score(hand);
}

HandCategory category_of_score(const int score) {
  if(score < 1 || score > N_DISTINCT_RANKS) throw std::out_of_range{"Hand score out of range: " + std::to_string(score)};
  if(score == 1) return HandCategory::ROYAL_FLUSH;
  if(score <= 10) return HandCategory::STRAIGHT_FLUSH;
  if(score <= 166) return HandCategory::FOUR_OF_A_KIND;
  if(score <= 322) return HandCategory::FULL_HOUSE;
  if(score <= 1599) return HandCategory::FLUSH;
  if(score <= 1609) return HandCategory::STRAIGHT;
  if(score <= 2467) return HandCategory::THREE_OF_A_KIND;
  if(score <= 3325) return HandCategory::TWO_PAIR;
  if(score <= 6185) return HandCategory::PAIR;
  return HandCategory::HIGH_CARD;
}

HandRank preflop_rank(const Hand& hand) {
  const int hi = card_rank(hand.high());
  const int lo = card_rank(hand.low());
  const int r1 = std::max(hi, lo), r2 = std::min(hi, lo);
  const int top = N_RANKS - 1;
  std::string notation = std::string(1, RANKS[r1]) + RANKS[r2];

  if(r1 == r2) {
    if(r1 >= top - 1) return HandRank{1, 100 + top - r1, notation + " (monster pair)"};
    if(r1 >= top - 3) return HandRank{2, 300 + top - 2 - r1, notation + " (premium pair)"};
    if(r1 >= top - 5) return HandRank{3, 600 + top - 4 - r1, notation + " (strong pair)"};
    return HandRank{4, 1000 + top - 6 - r1, notation + " (pair)"};
  }

  notation += hand.is_suited() ? "s" : "o";
  // A, K, Q, J over A, K, Q, J, T
  if(r1 >= top - 3 && r2 >= top - 4) {
    const int offset = (top - r1) * 5 + (top - r2);
    if(hand.is_suited()) return HandRank{2, 400 + offset, notation + " (suited broadway)"};
    return HandRank{3, 700 + offset, notation + " (broadway)"};
  }
  if(hand.is_suited() && r1 - r2 <= 2) return HandRank{4, 1200 + (top - r1) * 3 + r1 - r2 - 1, notation + " (suited connector)"};
  if(r1 == top) {
    if(hand.is_suited()) return HandRank{5, 1500 + top - r2, notation + " (suited ace)"};
    return HandRank{6, 2000 + top - r2, notation + " (offsuit ace)"};
  }
  const int offset = (top - r1) * N_RANKS + (top - r2);
  if(hand.is_suited()) return HandRank{7, 3000 + offset, notation + " (suited)"};
  return HandRank{8, 5000 + offset, notation + " (weak)"};
}

HandRank HandRanker::rank(const Hand& hole, const std::vector<uint8_t>& board) const {
  if(board.size() > MAX_BOARD_CARDS) throw InvalidHandError{"Board has more than five cards: " + cards_to_str(board)};
  std::vector<uint8_t> cards = board;
  cards.insert(cards.end(), hole.cards().begin(), hole.cards().end());
  validate_cards(cards);
  if(board.size() < 3) return preflop_rank(hole);
  const int score = _ranker->score(cards);
  const HandCategory category = category_of_score(score);
  return HandRank{static_cast<int>(category), score, category_to_str(category)};
}

HandRank HandRanker::rank(const std::vector<uint8_t>& hole, const std::vector<uint8_t>& board) const {
  return rank(Hand{hole}, board);
}

int HandRanker::showdown_score(const Hand& hole, const std::vector<uint8_t>& board) const {
  if(board.size() < 3) return preflop_rank(hole).score;
  std::array<uint8_t, 7> cards;
  cards[0] = hole.high();
  cards[1] = hole.low();
  std::ranges::copy(board, cards.begin() + 2);
  return _ranker->score(cards.data(), static_cast<int>(board.size()) + 2);
}

Showdown HandRanker::compare(const Hand& a, const Hand& b, const std::vector<uint8_t>& board) const {
  if(board.size() > MAX_BOARD_CARDS) throw InvalidHandError{"Board has more than five cards: " + cards_to_str(board)};
  std::vector<uint8_t> cards = board;
  cards.insert(cards.end(), a.cards().begin(), a.cards().end());
  cards.insert(cards.end(), b.cards().begin(), b.cards().end());
  validate_cards(cards);
  const int score_a = showdown_score(a, board);
  const int score_b = showdown_score(b, board);
  if(score_a < score_b) return Showdown::A_WINS;
  if(score_a > score_b) return Showdown::B_WINS;
  return Showdown::TIE;
}

Outs HandRanker::count_outs(const Hand& hole, const std::vector<uint8_t>& board) const {
  if(board.size() < 3 || board.size() > 4) throw InvalidHandError{"Outs are defined on the flop and the turn, got " + std::to_string(board.size()) + " board cards."};
  const int current = rank(hole, board).rank_class;
  const uint64_t dead = hole.mask() | card_mask(board);
  Outs outs{0, {}};
  std::vector<uint8_t> next_board = board;
  next_board.push_back(0);
  for(uint8_t c = 0; c < MAX_CARDS; ++c) {
    if(dead & card_mask(c)) continue;
    next_board.back() = c;
    if(static_cast<int>(category_of_score(showdown_score(hole, next_board))) < current) {
      ++outs.count;
      outs.cards.push_back(c);
    }
  }
  return outs;
}

}
