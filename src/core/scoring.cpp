#include "core/scoring.hpp"

#include "core/analysis_result.hpp"
#include "core/tile.hpp"
#include "common/throw.hpp"
#include <sstream>
#include <ostream>
#include <algorithm>
#include <iterator>
#include <vector>
#include <array>
#include <string>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

void credit(Hupai::Score &score, std::int_fast32_t const points, std::string const &label)
{
  if (points == 0) {
    return;
  }
  score.points += points;
  std::ostringstream oss;
  oss << label << ": " << (points > 0 ? "+" : "") << points;
  score.breakdown.push_back(std::move(oss).str());
}

void append(Hupai::Score &score, Hupai::Score &&rhs)
{
  score.points += rhs.points;
  score.breakdown.insert(
    score.breakdown.end(), std::make_move_iterator(rhs.breakdown.begin()),
    std::make_move_iterator(rhs.breakdown.end()));
}

std::string withCount(char const *label, unsigned const count)
{
  std::ostringstream oss;
  oss << label << " x" << count;
  return std::move(oss).str();
}

// 花牌 (bonus tiles)
Hupai::Score scoreBonusTiles(std::uint_fast8_t const seat, std::vector<Hupai::Tile> const &bonus_tiles)
{
  Hupai::Score result;
  if (bonus_tiles.empty()) {
    return result;
  }

  std::uint_fast8_t const own_rank = seat + 1u;
  std::uint_fast8_t num_own = 0u;
  // [color][rank - 1] for the numbered ranks 1 to 4.
  std::array<std::array<bool, 4u>, 2u> held{};
  for (Hupai::Tile const &tile : bonus_tiles) {
    std::uint_fast8_t const rank = tile.getRank();
    if (rank == own_rank) {
      ++num_own;
    }
    if (rank <= 4u) {
      std::uint_fast8_t const color = tile.getSuit() == Hupai::Suit::blue_bonus ? 0u : 1u;
      held[color][rank - 1u] = true;
    }
  }

  if (num_own == 0u) {
    credit(result, -1, "Bad Flower(s)");
  }
  else if (num_own >= 2u) {
    credit(result, 1, "Good Flowers");
  }

  auto all = [](std::array<bool, 4u> const &a) {
    return std::all_of(a.cbegin(), a.cend(), [](bool const b) { return b; });
  };
  bool const blue_set = all(held[0u]);
  bool const red_set = all(held[1u]);
  bool mixed_set = true;
  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    mixed_set = mixed_set && (held[0u][i] || held[1u][i]);
  }

  if (blue_set && red_set) {
    credit(result, 3, "All Eight Flowers");
  }
  else if (blue_set || red_set) {
    credit(result, blue_set ? 2 : 0, "Blue Flower Set");
    credit(result, red_set ? 2 : 0, "Red Flower Set");
  }
  else if (mixed_set) {
    credit(result, 1, "Mixed Flower Set");
  }

  return result;
}

Hupai::Score scoreWinManner(
  Hupai::AnalysisResult const &analysis, bool const self_drawn,
  std::uint_fast8_t const num_self_quads, std::uint_fast8_t const num_claimed_quads)
{
  Hupai::Score result;

  // 門前清自摸和
  if (self_drawn && analysis.isFullyConcealed()) {
    credit(result, 3, "Concealed Self-Drawn");
  }
  else if (self_drawn) {
    credit(result, 1, "Self-Drawn");
  }
  if (!self_drawn && analysis.isFullyExposed()) {
    credit(result, 2, "Fully Exposed Hand");
  }

  credit(result, 2 * num_self_quads, withCount("Self-Declared Quad", num_self_quads));
  credit(result, num_claimed_quads, withCount("Claimed Quad", num_claimed_quads));
  return result;
}

Hupai::Score scoreComposition(
  Hupai::AnalysisResult const &analysis, Hupai::Ordinal const seat_wind,
  Hupai::Ordinal const round_wind)
{
  Hupai::Score result;

  // 清一色 / 混一色
  if (analysis.isPureSuit()) {
    credit(result, 4, "True Pure Hand");
  }
  else if (analysis.isHalfSuit()) {
    credit(result, 2, "Half Hand");
  }

  if (analysis.getNumSequences() == 4u) {
    credit(result, 1, "All Sequences");
  }
  else if (analysis.getNumTriplets() == 4u) {
    credit(result, 2, "All Triplets");
  }

  std::vector<Hupai::Ordinal> const &triplets = analysis.getTriplets();
  auto has_triplet = [&triplets](Hupai::Ordinal const ordinal) {
    return std::find(triplets.cbegin(), triplets.cend(), ordinal) != triplets.cend();
  };
  bool const dragon = std::any_of(
    triplets.cbegin(), triplets.cend(), [](Hupai::Ordinal const o) { return o / 100u == 5u; });
  credit(result, dragon ? 1 : 0, "Dragon Triplet");
  // When both winds are the same each credit is given once.
  credit(result, has_triplet(seat_wind) ? 1 : 0, "Seat Wind Triplet");
  credit(result, has_triplet(round_wind) ? 1 : 0, "Round Wind Triplet");

  return result;
}

} // namespace `anonymous`

namespace Hupai{

Scorer::Scorer(RuleConfig const &config)
  : config_(config)
{
  if (config_.round_wind < east_wind || north_wind < config_.round_wind) {
    HUPAI_THROW<std::invalid_argument>(_1) << config_.round_wind << ": An invalid round wind.";
  }
}

RuleConfig const &Scorer::getConfig() const noexcept
{
  return config_;
}

Score Scorer::score(
  AnalysisResult const &analysis, std::uint_fast8_t const seat, bool const self_drawn,
  std::uint_fast8_t const num_self_quads, std::uint_fast8_t const num_claimed_quads,
  std::vector<Tile> const &bonus_tiles) const
{
  if (seat >= 4u) {
    HUPAI_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  for (Tile const &tile : bonus_tiles) {
    if (!tile.isBonus()) {
      HUPAI_THROW<std::invalid_argument>(_1) << tile << ": Not a bonus tile.";
    }
  }

  Score result;
  switch (analysis.getWinKind()) {
  case WinKind::none:
    return result;
  case WinKind::thirteen_orphans:
    credit(result, 8, "Thirteen Orphans");
    return result;
  default:
    break;
  }

  credit(result, 1, "Base Win");
  Score bonus = scoreBonusTiles(seat, bonus_tiles);

  switch (analysis.getWinKind()) {
  case WinKind::seven_pairs:
    append(result, std::move(bonus));
    credit(result, 3, "Seven Pairs");
    return result;
  case WinKind::pure_suit_fallback:
    append(result, std::move(bonus));
    credit(result, 3, "Pure Hand (Non-Traditional)");
    return result;
  case WinKind::traditional:
    break;
  default:
    HUPAI_THROW<std::logic_error>("A logic error.");
  }

  append(result, scoreWinManner(analysis, self_drawn, num_self_quads, num_claimed_quads));
  append(result, std::move(bonus));
  append(result, scoreComposition(analysis, east_wind + seat, config_.round_wind));
  return result;
}

std::ostream &operator<<(std::ostream &os, Score const &score)
{
  for (std::string const &line : score.breakdown) {
    os << line << '\n';
  }
  return os << "Total: " << score.points << '\n';
}

} // namespace Hupai
