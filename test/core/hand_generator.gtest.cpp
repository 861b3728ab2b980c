#include "core/hand_generator.hpp"

#include "core/win_analyzer.hpp"
#include "core/analysis_result.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include <gtest/gtest.h>
#include <random>
#include <algorithm>
#include <vector>
#include <cstdint>


namespace Hupai::Testing{

namespace{

std::vector<std::uint_least32_t> const seed = { 20u, 26u, 10u, 19u };

bool contains(std::vector<Ordinal> const &ordinals, Tile const &tile)
{
  return std::find(ordinals.cbegin(), ordinals.cend(), tile.getOrdinal()) != ordinals.cend();
}

} // namespace `anonymous`

TEST(HandGenerator, RandomSeedFillsTheState)
{
  EXPECT_EQ(getRandomSeed().size(), std::mt19937::state_size);
}

TEST(HandGenerator, WinningHandsAreWinning)
{
  HandGenerator generator(seed);
  for (int i = 0; i < 500; ++i) {
    Hand const hand = generator.generateWinningHand();
    ASSERT_TRUE(hand.getDrawn());
    EXPECT_EQ(hand.getConcealed().size(), 13u);
    EXPECT_TRUE(hand.getBonusTiles().empty());

    AnalysisResult const result = analyze(hand);
    ASSERT_TRUE(result.isWinning()) << hand;
    ASSERT_TRUE(result.isTraditional()) << hand;
    EXPECT_EQ(result.getNumTriplets() + result.getNumSequences(), 4u) << hand;
    EXPECT_TRUE(result.getPair()) << hand;
  }
}

TEST(HandGenerator, PureHandsAreSingleSuited)
{
  HandGenerator generator(seed);
  for (int i = 0; i < 200; ++i) {
    Hand const hand = generator.generatePureHand();
    std::vector<Tile> const tiles = hand.getFunctionalTiles();
    ASSERT_EQ(tiles.size(), 14u);
    for (Tile const &tile : tiles) {
      EXPECT_TRUE(tile.isSuited()) << hand;
      EXPECT_EQ(tile.getSuit(), tiles.front().getSuit()) << hand;
    }

    AnalysisResult const result = analyze(hand);
    EXPECT_TRUE(result.isWinning()) << hand;
    EXPECT_TRUE(result.isPureSuit()) << hand;
  }
}

TEST(HandGenerator, SevenPairsWait)
{
  HandGenerator generator(seed);
  for (int i = 0; i < 200; ++i) {
    auto const [hand, wait] = generator.generateSevenPairsWait();
    EXPECT_EQ(hand.getConcealed().size(), 13u);
    EXPECT_TRUE(contains(findWinningTiles(hand), wait)) << hand;

    Hand completed(hand);
    completed.setDrawn(wait);
    EXPECT_TRUE(analyze(completed).isSevenPairs()) << completed;
  }
}

TEST(HandGenerator, ThirteenOrphansWait)
{
  HandGenerator generator(seed);
  for (int i = 0; i < 200; ++i) {
    auto const [hand, wait] = generator.generateThirteenOrphansWait();
    EXPECT_EQ(hand.getConcealed().size(), 13u);
    EXPECT_FALSE(analyze(hand).isWinning());
    EXPECT_EQ(findWinningTiles(hand), std::vector<Ordinal>{ wait.getOrdinal() }) << hand;

    Hand completed(hand);
    completed.setDrawn(wait);
    AnalysisResult const result = analyze(completed);
    EXPECT_TRUE(result.isThirteenOrphans()) << completed;
    EXPECT_EQ(result.getWinKind(), WinKind::thirteen_orphans);
  }
}

TEST(HandGenerator, SameSeedSameHands)
{
  HandGenerator a(seed);
  HandGenerator b(seed);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(a.generateWinningHand().getFunctionalTiles(), b.generateWinningHand().getFunctionalTiles());
  }
}

} // namespace Hupai::Testing
