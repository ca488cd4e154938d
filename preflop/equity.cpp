#include <algorithm>
#include <array>
#include <iomanip>
#include <omp.h>
#include <sstream>
#include <preflop/charts.hpp>
#include <preflop/equity.hpp>
#include <preflop/logging.hpp>
#include <preflop/rng.hpp>

namespace preflop {

std::string EquityResult::to_string(const int precision) const {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << "Equity=" << equity << "%, wins=" << wins << ", ties=" << ties
      << ", losses=" << losses << ", trials=" << trials << (exact ? " (exact)" : " (sampled)");
  return oss.str();
}

long n_choose_k(const int n, const int k) {
  if(k < 0 || k > n) return 0;
  long result = 1;
  for(int i = 1; i <= k; ++i) result = result * (n - k + i) / i;
  return result;
}

double pot_odds(const double pot, const double call) {
  if(call <= 0.0) return 0.0;
  return call / (pot + call) * 100.0;
}

double quick_equity_estimate(const Hand& hero, const int n_opponents, const EngineConfig& config) {
  if(n_opponents < 1) throw std::invalid_argument{"Need at least one opponent, got " + std::to_string(n_opponents)};
  const double heads_up = NEUTRAL_EQUITY + (percentile_of(hero, config) - 50) * 0.8;
  return heads_up / (1.0 + 0.15 * (n_opponents - 1));
}

struct ShowdownCounts {
  long wins = 0;
  long ties = 0;
  long losses = 0;

  void add(const int hero_score, const int villain_score) {
    if(hero_score < villain_score) ++wins;
    else if(hero_score > villain_score) ++losses;
    else ++ties;
  }

  ShowdownCounts& operator+=(const ShowdownCounts& other) {
    wins += other.wins;
    ties += other.ties;
    losses += other.losses;
    return *this;
  }
};

static EquityResult to_result(const ShowdownCounts& counts, const bool exact) {
  const long total = counts.wins + counts.ties + counts.losses;
  EquityResult result{NEUTRAL_EQUITY, counts.wins, counts.ties, counts.losses, total, exact};
  if(total > 0) result.equity = (counts.wins + 0.5 * counts.ties) / static_cast<double>(total) * 100.0;
  return result;
}

// cards layout: hero hole cards, board, villain hole cards
class ShowdownCards {
public:
  ShowdownCards(const Hand& hero, const std::vector<uint8_t>& board) : _n_known{static_cast<int>(board.size())} {
    _hero[0] = hero.high();
    _hero[1] = hero.low();
    std::ranges::copy(board, _hero.begin() + 2);
  }

  void set_villain(const Hand& villain) {
    _villain[0] = villain.high();
    _villain[1] = villain.low();
  }

  void set_board_card(const int i, const uint8_t card) {
    _hero[2 + i] = card;
  }

  ShowdownCards& finish() {
    std::copy(_hero.begin() + 2, _hero.end(), _villain.begin() + 2);
    return *this;
  }

  int n_known() const { return _n_known; }
  const uint8_t* hero() const { return _hero.data(); }
  const uint8_t* villain() const { return _villain.data(); }

private:
  std::array<uint8_t, 7> _hero{};
  std::array<uint8_t, 7> _villain{};
  int _n_known;
};

static std::vector<uint8_t> live_cards(const uint64_t dead) {
  std::vector<uint8_t> cards;
  cards.reserve(MAX_CARDS);
  for(uint8_t c = 0; c < MAX_CARDS; ++c) {
    if(!(dead & card_mask(c))) cards.push_back(c);
  }
  return cards;
}

static void validate_inputs(const Hand& hero, const std::vector<uint8_t>& board) {
  if(board.size() > MAX_BOARD_CARDS) throw InvalidHandError{"Board has more than five cards: " + cards_to_str(board)};
  std::vector<uint8_t> known = board;
  known.insert(known.end(), hero.cards().begin(), hero.cards().end());
  validate_cards(known);
}

Range EquitySimulator::_live_range(const Hand& hero, const Range& range, const std::vector<uint8_t>& board) const {
  std::vector<uint8_t> dead = board;
  dead.insert(dead.end(), hero.cards().begin(), hero.cards().end());
  return range.remove_cards(dead);
}

EquityResult EquitySimulator::estimate(const Hand& hero, const Range& range, const long trials, const uint64_t seed,
    const std::vector<uint8_t>& board) const {
  validate_inputs(hero, board);
  const Range live = _live_range(hero, range, board);
  if(live.empty()) {
    Logger::log("Equity " + hero.to_string() + ": no opponent combos left after removing dead cards", 1);
    return EquityResult{};
  }
  const int n_missing = MAX_BOARD_CARDS - static_cast<int>(board.size());
  const long work = static_cast<long>(live.size()) * n_choose_k(MAX_CARDS - 4 - static_cast<int>(board.size()), n_missing);
  if(work <= _exact_ceiling) return enumerate(hero, live, board);
  return sample(hero, live, trials, seed, board);
}

EquityResult EquitySimulator::sample(const Hand& hero, const Range& range, const long trials, const uint64_t seed,
    const std::vector<uint8_t>& board) const {
  validate_inputs(hero, board);
  if(trials <= 0) throw std::invalid_argument{"Equity simulation needs a positive number of trials."};
  if(_block_size <= 0) throw std::invalid_argument{"Equity simulation needs a positive block size."};
  const Range live = _live_range(hero, range, board);
  if(live.empty()) return EquityResult{};

  const uint64_t dead = hero.mask() | card_mask(board);
  const int n_missing = MAX_BOARD_CARDS - static_cast<int>(board.size());
  const long n_blocks = (trials + _block_size - 1) / _block_size;
  std::vector<ShowdownCounts> thread_results(omp_get_max_threads());

  #pragma omp parallel for schedule(dynamic)
  for(long b = 0; b < n_blocks; ++b) {
    GSLStream rng{substream_seed(seed, static_cast<uint64_t>(b))};
    ShowdownCards cards{hero, board};
    ShowdownCounts counts;
    std::vector<uint8_t> deck;
    const long end = std::min(trials, (b + 1) * _block_size);
    for(long t = b * _block_size; t < end; ++t) {
      const Hand& villain = live.hands()[rng.uniform_int(live.size())];
      cards.set_villain(villain);
      deck = live_cards(dead | villain.mask());
      for(int i = 0; i < n_missing; ++i) {
        const size_t j = i + rng.uniform_int(deck.size() - i);
        std::swap(deck[i], deck[j]);
        cards.set_board_card(cards.n_known() + i, deck[i]);
      }
      cards.finish();
      counts.add(_ranker->score(cards.hero(), 7), _ranker->score(cards.villain(), 7));
    }
    thread_results[omp_get_thread_num()] += counts;
  }

  ShowdownCounts total;
  for(const auto& counts : thread_results) total += counts;
  const EquityResult result = to_result(total, false);
  if(_verbose) Logger::log("Sampled equity " + hero.to_string() + " vs " + std::to_string(live.size()) + " combos: " + result.to_string(), 1);
  return result;
}

EquityResult EquitySimulator::enumerate(const Hand& hero, const Range& range, const std::vector<uint8_t>& board) const {
  validate_inputs(hero, board);
  const Range live = _live_range(hero, range, board);
  if(live.empty()) return EquityResult{};

  const uint64_t dead = hero.mask() | card_mask(board);
  const int n_missing = MAX_BOARD_CARDS - static_cast<int>(board.size());
  const long n_villains = static_cast<long>(live.size());
  std::vector<ShowdownCounts> thread_results(omp_get_max_threads());

  #pragma omp parallel for schedule(dynamic)
  for(long v = 0; v < n_villains; ++v) {
    const Hand& villain = live.hands()[v];
    ShowdownCards cards{hero, board};
    cards.set_villain(villain);
    ShowdownCounts counts;
    const std::vector<uint8_t> deck = live_cards(dead | villain.mask());
    const int n_deck = static_cast<int>(deck.size());
    std::array<int, MAX_BOARD_CARDS> idx{};
    for(int i = 0; i < n_missing; ++i) idx[i] = i;
    while(true) {
      for(int i = 0; i < n_missing; ++i) cards.set_board_card(cards.n_known() + i, deck[idx[i]]);
      cards.finish();
      counts.add(_ranker->score(cards.hero(), 7), _ranker->score(cards.villain(), 7));
      int i = n_missing - 1;
      while(i >= 0 && idx[i] == n_deck - n_missing + i) --i;
      if(i < 0) break;
      ++idx[i];
      for(int j = i + 1; j < n_missing; ++j) idx[j] = idx[j - 1] + 1;
    }
    thread_results[omp_get_thread_num()] += counts;
  }

  ShowdownCounts total;
  for(const auto& counts : thread_results) total += counts;
  const EquityResult result = to_result(total, true);
  if(_verbose) Logger::log("Exact equity " + hero.to_string() + " vs " + std::to_string(live.size()) + " combos: " + result.to_string(), 1);
  return result;
}

uint64_t choose_seed(const std::optional<uint64_t>& requested, const SimulationConfig& config) {
  if(requested) return *requested;
  return config.seed != 0 ? config.seed : entropy_seed();
}

double estimate_equity(const Hand& hero, const Range& range, const long trials, const uint64_t seed, const std::vector<uint8_t>& board) {
  return EquitySimulator{}.estimate(hero, range, trials, seed, board).equity;
}

PositionEquity equity_vs_position(const Hand& hero, const std::string& villain_position, const std::string& action, const long trials,
    const uint64_t seed, const EngineConfig& config) {
  const ChartRange chart = chart_range(resolve_position(villain_position, config), resolve_range_action(action), config);
  const EquityResult result = EquitySimulator{config.simulation}.estimate(hero, chart.range, trials, seed);
  return PositionEquity{result, chart.position, chart.action, chart.range_percent};
}

}
