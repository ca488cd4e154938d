#include <algorithm>
#include <cctype>
#include <preflop/poker.hpp>
#include <preflop/util.hpp>

namespace preflop {

uint64_t card_mask(const std::vector<uint8_t>& cards) {
  uint64_t mask = 0;
  for(const uint8_t c : cards) mask |= card_mask(c);
  return mask;
}

int rank_from_char(const char c) {
  const auto pos = RANKS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  if(pos == std::string_view::npos) throw InvalidCardError{"Invalid rank: " + std::string(1, c)};
  return static_cast<int>(pos);
}

int suit_from_char(const char c) {
  const auto pos = SUITS.find(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if(pos == std::string_view::npos) throw InvalidCardError{"Invalid suit: " + std::string(1, c)};
  return static_cast<int>(pos);
}

uint8_t card_to_idx(const std::string& card) {
  if(card.length() != 2) throw InvalidCardError{"Invalid card: \"" + card + "\""};
  return make_card(rank_from_char(card[0]), suit_from_char(card[1]));
}

std::string idx_to_card(const int idx) {
  if(idx < 0 || idx >= MAX_CARDS) throw InvalidCardError{"Card index out of range: " + std::to_string(idx)};
  return std::string(1, RANKS[card_rank(idx)]) + SUITS[card_suit(idx)];
}

std::vector<uint8_t> str_to_cards(const std::string& card_str) {
  std::string compact;
  std::ranges::copy_if(card_str, std::back_inserter(compact), [](const char c) { return c != ' ' && c != ','; });
  if(compact.size() % 2 != 0) throw InvalidCardError{"Malformed card string: \"" + card_str + "\""};
  std::vector<uint8_t> cards;
  cards.reserve(compact.size() / 2);
  for(int i = 0; i < compact.size(); i += 2) cards.push_back(card_to_idx(compact.substr(i, 2)));
  return cards;
}

std::string cards_to_str(const std::vector<uint8_t>& cards) {
  std::string str;
  for(const uint8_t c : cards) str += idx_to_card(c);
  return str;
}

void validate_cards(const std::vector<uint8_t>& cards) {
  uint64_t mask = 0;
  for(const uint8_t c : cards) {
    if(c >= MAX_CARDS) throw InvalidCardError{"Card index out of range: " + std::to_string(c)};
    if(mask & card_mask(c)) throw InvalidCardError{"Duplicate card: " + idx_to_card(c)};
    mask |= card_mask(c);
  }
}

std::vector<uint8_t> parse_board(const std::string& board_str) {
  auto board = str_to_cards(board_str);
  if(board.size() > MAX_BOARD_CARDS) throw InvalidHandError{"Board has more than five cards: " + board_str};
  validate_cards(board);
  return board;
}

Hand::Hand(const uint8_t c1, const uint8_t c2) : _cards{std::max(c1, c2), std::min(c1, c2)} {
  validate_cards({c1, c2});
}

Hand::Hand(const std::vector<uint8_t>& cards) {
  if(cards.size() != 2) throw InvalidHandError{"Expected exactly two hole cards, got " + std::to_string(cards.size())};
  validate_cards(cards);
  _cards = {std::max(cards[0], cards[1]), std::min(cards[0], cards[1])};
}

Hand::Hand(const std::string& card_str) : Hand{str_to_cards(card_str)} {}

std::string pos_to_str(const Position pos) {
  switch(pos) {
    case Position::UTG: return "UTG";
    case Position::MP: return "MP";
    case Position::CO: return "CO";
    case Position::BTN: return "BTN";
    case Position::SB: return "SB";
    case Position::BB: return "BB";
  }
  throw std::runtime_error{"Unknown position."};
}

bool str_to_pos(const std::string& str, Position& pos) {
  std::string upper = str;
  std::ranges::transform(upper, upper.begin(), [](const unsigned char c) { return std::toupper(c); });
  if(upper == "UTG") pos = Position::UTG;
  else if(upper == "MP" || upper == "HJ") pos = Position::MP;
  else if(upper == "CO") pos = Position::CO;
  else if(upper == "BTN" || upper == "BU") pos = Position::BTN;
  else if(upper == "SB") pos = Position::SB;
  else if(upper == "BB") pos = Position::BB;
  else return false;
  return true;
}

int postflop_order(const Position pos) {
  switch(pos) {
    case Position::SB: return 0;
    case Position::BB: return 1;
    default: return static_cast<int>(pos) + 2;
  }
}

}
