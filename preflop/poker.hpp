#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <cereal/types/array.hpp>
#include <preflop/constants.hpp>
#include <preflop/errors.hpp>

namespace preflop {

static constexpr std::string_view RANKS = "23456789TJQKA";
static constexpr std::string_view SUITS = "shdc";

inline constexpr int card_rank(const uint8_t card) { return card / 4; }
inline constexpr int card_suit(const uint8_t card) { return card % 4; }
inline constexpr uint8_t make_card(const int rank, const int suit) { return static_cast<uint8_t>(rank * 4 + suit); }
inline uint64_t card_mask(const uint8_t card) { return 1ULL << card; }
uint64_t card_mask(const std::vector<uint8_t>& cards);

int rank_from_char(char c);
int suit_from_char(char c);
uint8_t card_to_idx(const std::string& card);
std::string idx_to_card(int idx);
std::vector<uint8_t> str_to_cards(const std::string& card_str);
std::string cards_to_str(const std::vector<uint8_t>& cards);
void validate_cards(const std::vector<uint8_t>& cards);
std::vector<uint8_t> parse_board(const std::string& board_str);

class Hand {
public:
  Hand() : _cards{1, 0} {}
  Hand(uint8_t c1, uint8_t c2);
  explicit Hand(const std::vector<uint8_t>& cards);
  explicit Hand(const std::string& card_str);

  uint8_t high() const { return _cards[0]; }
  uint8_t low() const { return _cards[1]; }
  const std::array<uint8_t, 2>& cards() const { return _cards; }
  std::vector<uint8_t> as_vector() const { return {_cards[0], _cards[1]}; }
  uint64_t mask() const { return card_mask(_cards[0]) | card_mask(_cards[1]); }
  bool collides(const Hand& other) const { return mask() & other.mask(); }
  bool collides(const uint64_t mask) const { return this->mask() & mask; }
  bool is_pair() const { return card_rank(_cards[0]) == card_rank(_cards[1]); }
  bool is_suited() const { return card_suit(_cards[0]) == card_suit(_cards[1]); }
  std::string to_string() const { return idx_to_card(_cards[0]) + idx_to_card(_cards[1]); }

  bool operator==(const Hand&) const = default;

  template <class Archive>
  void serialize(Archive& ar) {
    ar(_cards);
  }

private:
  std::array<uint8_t, 2> _cards;
};

// 0 .. 1325, matches the order of enumerating c1 > c2 from the bottom of the deck
inline int hole_card_index(const Hand& hand) { return hand.high() * (hand.high() - 1) / 2 + hand.low(); }

enum class Position : uint8_t {
  UTG = 0, MP = 1, CO = 2, BTN = 3, SB = 4, BB = 5
};

std::string pos_to_str(Position pos);
// returns false if the name is not a known seat
bool str_to_pos(const std::string& str, Position& pos);
// 0 acts first after the flop (SB) .. 5 acts last (BTN)
int postflop_order(Position pos);

}
