#include "core/win_analyzer.hpp"

#include "core/special_hand.hpp"
#include "core/decomposer.hpp"
#include "core/analysis_result.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "core/errors.hpp"
#include "common/throw.hpp"
#include <algorithm>
#include <vector>
#include <set>
#include <optional>
#include <functional>
#include <utility>
#include <cstdint>


namespace{

using std::placeholders::_1;

Hupai::TileCounts countConcealedAndDrawn(Hupai::Hand const &hand)
{
  std::vector<Hupai::Tile> tiles(hand.getConcealed());
  if (hand.getDrawn()) {
    tiles.push_back(*hand.getDrawn());
  }
  return Hupai::countFunctionalTiles(tiles);
}

void checkNumCopies(Hupai::Hand const &hand)
{
  for (auto const &[ordinal, count] : Hupai::countFunctionalTiles(hand.getFunctionalTiles())) {
    if (count > 4u) {
      HUPAI_THROW<Hupai::MalformedHand>(_1)
        << Hupai::Tile(ordinal) << ": " << static_cast<unsigned>(count) << " copies in the hand.";
    }
  }
}

// 副露 (exposed groups) go into the decomposition found for the concealed tiles.
void foldExposedGroups(Hupai::Hand const &hand, Hupai::Decomposition &decomposition)
{
  auto add_triplet = [&decomposition](Hupai::Ordinal const ordinal) {
    std::vector<Hupai::Ordinal> &triplets = decomposition.triplets;
    if (std::find(triplets.cbegin(), triplets.cend(), ordinal) == triplets.cend()) {
      triplets.push_back(ordinal);
    }
  };

  for (Hupai::Tile const &tile : hand.getSelfQuads()) {
    add_triplet(tile.getOrdinal());
  }
  for (Hupai::Meld const &meld : hand.getMelds()) {
    if (meld.getType() == Hupai::MeldType::sequence) {
      decomposition.sequences.push_back(meld.getRoot());
      continue;
    }
    add_triplet(meld.getRoot());
  }
}

} // namespace `anonymous`

namespace Hupai{

AnalysisResult analyze(Hand const &hand)
{
  std::uint_fast8_t const num_exposed_groups = hand.getNumExposedGroups();
  if (num_exposed_groups > 4u) {
    HUPAI_THROW<MalformedHand>(_1)
      << static_cast<unsigned>(num_exposed_groups) << ": Too many exposed groups.";
  }
  std::uint_fast8_t const num_sets = 4u - num_exposed_groups;
  checkNumCopies(hand);

  TileCounts const counts = countConcealedAndDrawn(hand);
  if (getNumTiles(counts) != 3u * num_sets + 2u) {
    return AnalysisResult();
  }

  WinFlags flags;
  Decomposition decomposition;

  // 七対子 and 国士無双 need a hand without any group set aside.
  if (num_exposed_groups == 0u) {
    flags.seven_pairs = isSevenPairs(counts);
    flags.thirteen_orphans = isThirteenOrphans(counts);
  }
  if (std::optional<Decomposition> found = decomposeWithPair(counts, num_sets)) {
    flags.traditional = true;
    decomposition = std::move(*found);
    foldExposedGroups(hand, decomposition);
  }

  std::vector<Tile> const tiles = hand.getFunctionalTiles();
  std::set<Suit> numbered_suits;
  bool has_honor = false;
  for (Tile const &tile : tiles) {
    if (tile.isSuited()) {
      numbered_suits.insert(tile.getSuit());
    }
    else {
      has_honor = true;
    }
  }
  flags.pure_suit = numbered_suits.size() == 1u && !has_honor;
  flags.half_suit = numbered_suits.size() == 1u && has_honor && tiles.size() >= 14u;
  flags.fully_concealed = hand.getMelds().empty();
  flags.fully_exposed = hand.getMelds().size() == 4u && hand.getSelfQuads().empty();

  return AnalysisResult(flags, std::move(decomposition), hand.getBonusTiles().size());
}

std::vector<Ordinal> findWinningTiles(Hand const &hand)
{
  if (hand.getDrawn() || hand.getNumExposedGroups() > 4u) {
    return {};
  }
  std::uint_fast8_t const num_sets = 4u - hand.getNumExposedGroups();
  if (getNumTiles(countConcealedAndDrawn(hand)) != 3u * num_sets + 1u) {
    return {};
  }

  TileCounts const held = countFunctionalTiles(hand.getFunctionalTiles());
  std::vector<Ordinal> result;
  for (Ordinal const ordinal : getFunctionalOrdinals()) {
    auto const found = held.find(ordinal);
    if (found != held.cend() && found->second >= 4u) {
      continue;
    }
    Hand completed(hand);
    completed.setDrawn(Tile(ordinal));
    if (analyze(completed).isWinning()) {
      result.push_back(ordinal);
    }
  }
  return result;
}

std::vector<Ordinal> findSelfQuadCandidates(Hand const &hand)
{
  std::vector<Ordinal> result;
  for (auto const &[ordinal, count] : countConcealedAndDrawn(hand)) {
    if (count == 4u) {
      result.push_back(ordinal);
    }
  }
  return result;
}

} // namespace Hupai
