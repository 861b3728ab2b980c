#include "core/analysis_result.hpp"

#include "core/decomposer.hpp"
#include "core/tile.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <stdexcept>
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>


namespace Hupai{

char const *getWinKindName(WinKind const kind)
{
  switch (kind) {
  case WinKind::none:
    return "None";
  case WinKind::thirteen_orphans:
    return "Thirteen Orphans";
  case WinKind::seven_pairs:
    return "Seven Pairs";
  case WinKind::traditional:
    return "Traditional";
  case WinKind::pure_suit_fallback:
    return "Pure Suit";
  }
  HUPAI_THROW<std::logic_error>("A logic error.");
}

AnalysisResult::AnalysisResult(
  WinFlags const &flags, Decomposition decomposition, std::uint_fast8_t const num_bonus_tiles)
  : flags_(flags),
    decomposition_(std::move(decomposition)),
    num_bonus_tiles_(num_bonus_tiles)
{}

bool AnalysisResult::isWinning() const noexcept
{
  return getWinKind() != WinKind::none;
}

bool AnalysisResult::isTraditional() const noexcept
{
  return flags_.traditional;
}

bool AnalysisResult::isSevenPairs() const noexcept
{
  return flags_.seven_pairs;
}

bool AnalysisResult::isThirteenOrphans() const noexcept
{
  return flags_.thirteen_orphans;
}

bool AnalysisResult::isPureSuit() const noexcept
{
  return flags_.pure_suit;
}

bool AnalysisResult::isHalfSuit() const noexcept
{
  return flags_.half_suit;
}

bool AnalysisResult::isFullyConcealed() const noexcept
{
  return flags_.fully_concealed;
}

bool AnalysisResult::isFullyExposed() const noexcept
{
  return flags_.fully_exposed;
}

WinKind AnalysisResult::getWinKind() const noexcept
{
  if (flags_.thirteen_orphans) {
    return WinKind::thirteen_orphans;
  }
  if (flags_.seven_pairs) {
    return WinKind::seven_pairs;
  }
  if (flags_.traditional) {
    return WinKind::traditional;
  }
  if (flags_.pure_suit) {
    return WinKind::pure_suit_fallback;
  }
  return WinKind::none;
}

std::uint_fast8_t AnalysisResult::getNumBonusTiles() const noexcept
{
  return num_bonus_tiles_;
}

std::optional<Ordinal> const &AnalysisResult::getPair() const noexcept
{
  return decomposition_.pair;
}

std::vector<Ordinal> const &AnalysisResult::getTriplets() const noexcept
{
  return decomposition_.triplets;
}

std::vector<Ordinal> const &AnalysisResult::getSequences() const noexcept
{
  return decomposition_.sequences;
}

std::uint_fast8_t AnalysisResult::getNumTriplets() const noexcept
{
  return decomposition_.triplets.size();
}

std::uint_fast8_t AnalysisResult::getNumSequences() const noexcept
{
  return decomposition_.sequences.size();
}

std::ostream &operator<<(std::ostream &os, AnalysisResult const &result)
{
  os << "Win: " << getWinKindName(result.getWinKind()) << '\n';
  if (result.getPair()) {
    os << "  Pair: " << toString(std::vector<Tile>(2u, Tile(*result.getPair()))) << '\n';
  }
  for (Ordinal const ordinal : result.getTriplets()) {
    os << "  Triplet: " << toString(std::vector<Tile>(3u, Tile(ordinal))) << '\n';
  }
  for (Ordinal const ordinal : result.getSequences()) {
    std::vector<Tile> const sequence = { Tile(ordinal), Tile(ordinal + 1u), Tile(ordinal + 2u) };
    os << "  Sequence: " << toString(sequence) << '\n';
  }
  if (result.isPureSuit()) {
    os << "  Pure suit\n";
  }
  else if (result.isHalfSuit()) {
    os << "  Half suit\n";
  }
  if (result.isFullyConcealed()) {
    os << "  Fully concealed\n";
  }
  if (result.isFullyExposed()) {
    os << "  Fully exposed\n";
  }
  os << "  Bonus tiles: " << static_cast<unsigned>(result.getNumBonusTiles()) << '\n';
  return os;
}

} // namespace Hupai
