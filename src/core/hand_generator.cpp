#include "core/hand_generator.hpp"

#include "core/special_hand.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "common/assert.hpp"
#include <random>
#include <algorithm>
#include <vector>
#include <array>
#include <utility>
#include <cstddef>
#include <cstdint>


namespace{

struct Group
{
  Hupai::Ordinal first;
  bool sequence;
}; // struct Group

} // namespace `anonymous`

namespace Hupai{

std::vector<std::uint_least32_t> getRandomSeed()
{
  constexpr std::size_t state_size = std::mt19937::state_size;

  std::random_device rand;
  std::vector<std::uint_least32_t> seed;
  seed.reserve(state_size);
  for (std::size_t i = 0; i < state_size; ++i) {
    seed.push_back(rand());
  }
  return seed;
}

HandGenerator::HandGenerator(std::vector<std::uint_least32_t> const &seed)
  : urng_()
{
  std::seed_seq sseq(seed.cbegin(), seed.cend());
  urng_.seed(sseq);
}

Hand HandGenerator::generateWinningHand()
{
  return generateWinningHand_(getFunctionalOrdinals());
}

Hand HandGenerator::generatePureHand()
{
  std::uniform_int_distribution<unsigned> dist(1u, 3u);
  Ordinal const suit = dist(urng_) * 100u;
  std::vector<Ordinal> ordinals;
  for (Ordinal rank = 1u; rank <= 9u; ++rank) {
    ordinals.push_back(suit + rank);
  }
  return generateWinningHand_(ordinals);
}

std::pair<Hand, Tile> HandGenerator::generateSevenPairsWait()
{
  std::vector<Ordinal> ordinals(getFunctionalOrdinals());
  std::shuffle(ordinals.begin(), ordinals.end(), urng_);

  Hand hand;
  for (std::size_t i = 0u; i < 6u; ++i) {
    hand.addConcealed(Tile(ordinals[i]));
    hand.addConcealed(Tile(ordinals[i]));
  }
  hand.addConcealed(Tile(ordinals[6u]));
  return { std::move(hand), Tile(ordinals[6u]) };
}

std::pair<Hand, Tile> HandGenerator::generateThirteenOrphansWait()
{
  std::array<Ordinal, 13u> ordinals = thirteen_orphans_ordinals;
  std::shuffle(ordinals.begin(), ordinals.end(), urng_);

  // ordinals[0] is missing and one of the others is held twice.
  std::uniform_int_distribution<std::size_t> dist(1u, 12u);
  Hand hand;
  for (std::size_t i = 1u; i < 13u; ++i) {
    hand.addConcealed(Tile(ordinals[i]));
  }
  hand.addConcealed(Tile(ordinals[dist(urng_)]));
  return { std::move(hand), Tile(ordinals[0u]) };
}

Hand HandGenerator::generateWinningHand_(std::vector<Ordinal> const &ordinals)
{
  std::array<std::uint_fast8_t, 800u> counts{};
  std::vector<Tile> tiles;

  {
    std::uniform_int_distribution<std::size_t> dist(0u, ordinals.size() - 1u);
    Ordinal const pair = ordinals[dist(urng_)];
    counts[pair] += 2u;
    tiles.insert(tiles.end(), 2u, Tile(pair));
  }

  for (std::uint_fast8_t i = 0u; i < 4u; ++i) {
    std::vector<Group> groups;
    for (Ordinal const ordinal : ordinals) {
      if (counts[ordinal] <= 1u) {
        groups.push_back({ ordinal, false });
      }
      if (ordinal < 400u && ordinal % 100u <= 7u && counts[ordinal] <= 3u
          && counts[ordinal + 1u] <= 3u && counts[ordinal + 2u] <= 3u) {
        groups.push_back({ ordinal, true });
      }
    }
    HUPAI_ASSERT((!groups.empty()));

    std::uniform_int_distribution<std::size_t> dist(0u, groups.size() - 1u);
    Group const group = groups[dist(urng_)];
    if (group.sequence) {
      for (Ordinal j = 0u; j < 3u; ++j) {
        ++counts[group.first + j];
        tiles.emplace_back(group.first + j);
      }
    }
    else {
      counts[group.first] += 3u;
      tiles.insert(tiles.end(), 3u, Tile(group.first));
    }
  }

  std::shuffle(tiles.begin(), tiles.end(), urng_);
  Tile const drawn = tiles.back();
  tiles.pop_back();
  Hand hand(tiles);
  hand.setDrawn(drawn);
  return hand;
}

} // namespace Hupai
