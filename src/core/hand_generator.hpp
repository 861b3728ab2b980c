#if !defined(HUPAI_CORE_HAND_GENERATOR_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_HAND_GENERATOR_HPP_INCLUDE_GUARD

#include "core/hand.hpp"
#include "core/tile.hpp"
#include <random>
#include <vector>
#include <utility>
#include <cstdint>


namespace Hupai{

std::vector<std::uint_least32_t> getRandomSeed();

class HandGenerator
{
public:
  explicit HandGenerator(std::vector<std::uint_least32_t> const &seed);

  HandGenerator(HandGenerator const &) = delete;

  HandGenerator &operator=(HandGenerator const &) = delete;

public:
  // A pair and four groups. The last tile is the drawn one.
  Hand generateWinningHand();

  // A winning hand made of a single numbered suit.
  Hand generatePureHand();

  // 13 tiles, one short of Seven Pairs, and the tile they wait for.
  std::pair<Hand, Tile> generateSevenPairsWait();

  // 13 tiles, one short of Thirteen Orphans, and the tile they wait for.
  std::pair<Hand, Tile> generateThirteenOrphansWait();

private:
  Hand generateWinningHand_(std::vector<Ordinal> const &ordinals);

private:
  std::mt19937 urng_;
}; // class HandGenerator

} // namespace Hupai

#endif // !defined(HUPAI_CORE_HAND_GENERATOR_HPP_INCLUDE_GUARD)
