#include <algorithm>
#include <array>
#include <cctype>
#include <preflop/range.hpp>
#include <preflop/util.hpp>

namespace preflop {

HandClass::HandClass(const int high, const int low, const Suitedness suitedness) : _high{high}, _low{low}, _suitedness{suitedness} {
  if(high < 0 || high >= N_RANKS || low < 0 || low >= N_RANKS) throw InvalidHandError{"Hand class rank out of range."};
  if(high < low) std::swap(_high, _low);
  if((_high == _low) != (_suitedness == Suitedness::PAIRED)) {
    throw InvalidHandError{"Paired hand classes need equal ranks: " + std::string(1, RANKS[_high]) + RANKS[_low]};
  }
}

HandClass::HandClass(const std::string& notation) : HandClass{0, 0, Suitedness::PAIRED} {
  if(notation.size() != 2 && notation.size() != 3) throw InvalidHandError{"Invalid hand notation: \"" + notation + "\""};
  const int r1 = rank_from_char(notation[0]);
  const int r2 = rank_from_char(notation[1]);
  Suitedness suitedness = Suitedness::ANY;
  if(r1 == r2) {
    if(notation.size() == 3) throw InvalidHandError{"Pairs take no suitedness suffix: \"" + notation + "\""};
    suitedness = Suitedness::PAIRED;
  }
  else if(notation.size() == 3) {
    const char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(notation[2])));
    if(suffix == 's') suitedness = Suitedness::SUITED;
    else if(suffix == 'o') suitedness = Suitedness::OFFSUIT;
    else throw InvalidHandError{"Invalid suitedness suffix: \"" + notation + "\""};
  }
  *this = HandClass{r1, r2, suitedness};
}

HandClass HandClass::of(const Hand& hand) {
  const int r1 = card_rank(hand.high()), r2 = card_rank(hand.low());
  if(r1 == r2) return HandClass{r1, r2, Suitedness::PAIRED};
  return HandClass{r1, r2, hand.is_suited() ? Suitedness::SUITED : Suitedness::OFFSUIT};
}

const std::vector<HandClass>& HandClass::all() {
  static const std::vector<HandClass> classes = [] {
    std::vector<HandClass> out;
    out.reserve(MAX_PREFLOP_COMBOS);
    for(int r1 = N_RANKS - 1; r1 >= 0; --r1) {
      out.emplace_back(r1, r1, Suitedness::PAIRED);
      for(int r2 = r1 - 1; r2 >= 0; --r2) {
        out.emplace_back(r1, r2, Suitedness::SUITED);
        out.emplace_back(r1, r2, Suitedness::OFFSUIT);
      }
    }
    return out;
  }();
  return classes;
}

bool HandClass::contains(const Hand& hand) const {
  const int r1 = card_rank(hand.high()), r2 = card_rank(hand.low());
  if(std::max(r1, r2) != _high || std::min(r1, r2) != _low) return false;
  switch(_suitedness) {
    case Suitedness::SUITED: return hand.is_suited();
    case Suitedness::OFFSUIT: return !hand.is_suited();
    default: return true;
  }
}

std::vector<Hand> HandClass::expand() const {
  std::vector<Hand> hands;
  hands.reserve(16);
  for(int s1 = 0; s1 < N_SUITS; ++s1) {
    for(int s2 = 0; s2 < N_SUITS; ++s2) {
      if(_suitedness == Suitedness::PAIRED && s2 <= s1) continue;
      if(_suitedness == Suitedness::SUITED && s1 != s2) continue;
      if(_suitedness == Suitedness::OFFSUIT && s1 == s2) continue;
      hands.emplace_back(make_card(_high, s1), make_card(_low, s2));
    }
  }
  return hands;
}

int HandClass::n_combos() const {
  switch(_suitedness) {
    case Suitedness::PAIRED: return 6;
    case Suitedness::SUITED: return 4;
    case Suitedness::OFFSUIT: return 12;
    case Suitedness::ANY: return 16;
  }
  return 0;
}

std::string HandClass::to_string() const {
  std::string str = std::string(1, RANKS[_high]) + RANKS[_low];
  if(_suitedness == Suitedness::SUITED) str += 's';
  else if(_suitedness == Suitedness::OFFSUIT) str += 'o';
  return str;
}

static std::string rank_name(const int rank) {
  static const std::array<std::string, N_RANKS> names = {
    "Deuce", "Three", "Four", "Five", "Six", "Seven", "Eight", "Nine", "Ten", "Jack", "Queen", "King", "Ace"
  };
  return names[rank];
}

static std::string rank_plural(const int rank) {
  return rank == 4 ? "Sixes" : rank_name(rank) + "s";
}

std::string HandClass::describe() const {
  if(_suitedness == Suitedness::PAIRED) {
    const std::string base = "Pocket " + rank_plural(_high);
    if(_high >= 11) return base + " (monster)";
    if(_high >= 9) return base + " (premium)";
    if(_high == 8) return base + " (strong)";
    return base;
  }
  std::string base;
  if(_high == 12 && _low >= 9) base = "Ace-" + rank_name(_low);
  else if(_high == 12) base = "Ace with kicker";
  else if(_high == 11 && _low == 10) base = "King-Queen";
  else if(_high == 11) base = "King with kicker";
  else base = _high - _low == 1 ? "Connector" : "Unconnected";
  if(_suitedness == Suitedness::SUITED) return base + " suited";
  if(_suitedness == Suitedness::OFFSUIT) return base + " offsuit";
  return base;
}

std::vector<Hand> expand_class(const HandClass& hand_class) { return hand_class.expand(); }

Range::Range(const std::vector<Hand>& hands) : Range{} {
  for(const Hand& hand : hands) add_hand(hand);
}

Range::Range(const std::vector<HandClass>& classes) : Range{} {
  for(const HandClass& hc : classes) add_class(hc);
}

void Range::add_hand(const Hand& hand) {
  const int idx = hole_card_index(hand);
  if(_members[idx]) return;
  _members[idx] = true;
  _hands.push_back(hand);
}

void Range::add_class(const HandClass& hand_class) {
  for(const Hand& hand : hand_class.expand()) add_hand(hand);
}

Range Range::remove_cards(const std::vector<uint8_t>& dead_cards) const {
  const uint64_t dead = card_mask(dead_cards);
  Range filtered;
  for(const Hand& hand : _hands) {
    if(!hand.collides(dead)) filtered.add_hand(hand);
  }
  return filtered;
}

std::string Range::to_string() const {
  std::vector<std::string> strs;
  strs.reserve(_hands.size());
  for(const Hand& hand : _hands) strs.push_back(hand.to_string());
  return join_strs(strs, " ");
}

Range filter_dead_cards(const Range& range, const std::vector<uint8_t>& dead_cards) { return range.remove_cards(dead_cards); }

}
