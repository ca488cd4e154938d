#pragma once

#include <string>
#include <vector>
#include <preflop/constants.hpp>
#include <preflop/poker.hpp>

namespace preflop {

enum class Suitedness : uint8_t {
  PAIRED, SUITED, OFFSUIT, ANY
};

// Starting hand category ignoring suits, e.g. "AKs", "T9o", "QQ". ANY ("AK") covers both suited and offsuit combos.
class HandClass {
public:
  HandClass(int high, int low, Suitedness suitedness);
  explicit HandClass(const std::string& notation);

  static HandClass of(const Hand& hand);
  static const std::vector<HandClass>& all();

  int high() const { return _high; }
  int low() const { return _low; }
  Suitedness suitedness() const { return _suitedness; }
  bool contains(const Hand& hand) const;
  std::vector<Hand> expand() const;
  int n_combos() const;
  std::string to_string() const;
  std::string describe() const;

  bool operator==(const HandClass&) const = default;

private:
  int _high;
  int _low;
  Suitedness _suitedness;
};

std::vector<Hand> expand_class(const HandClass& hand_class);

class Range {
public:
  Range() : _members(MAX_COMBOS, false) {}
  explicit Range(const std::vector<Hand>& hands);
  explicit Range(const std::vector<HandClass>& classes);

  void add_hand(const Hand& hand);
  void add_class(const HandClass& hand_class);
  bool contains(const Hand& hand) const { return _members[hole_card_index(hand)]; }
  const std::vector<Hand>& hands() const { return _hands; }
  size_t size() const { return _hands.size(); }
  bool empty() const { return _hands.empty(); }
  double percent_of_all() const { return 100.0 * static_cast<double>(_hands.size()) / MAX_COMBOS; }
  Range remove_cards(const std::vector<uint8_t>& dead_cards) const;
  std::string to_string() const;

  bool operator==(const Range& other) const { return _members == other._members; }

private:
  std::vector<Hand> _hands;
  std::vector<bool> _members;
};

Range filter_dead_cards(const Range& range, const std::vector<uint8_t>& dead_cards);

}
