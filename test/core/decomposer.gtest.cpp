#include "core/decomposer.hpp"

#include "core/tile.hpp"
#include <gtest/gtest.h>
#include <optional>
#include <vector>
#include <stdexcept>


namespace Hupai::Testing{

namespace{

TileCounts count(char const *text)
{
  return countFunctionalTiles(parseTiles(text));
}

} // namespace `anonymous`

TEST(Decomposer, EmptyHandHasZeroSets)
{
  std::optional<Decomposition> const result = decompose(TileCounts(), 0u);
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->triplets.empty());
  EXPECT_TRUE(result->sequences.empty());
  EXPECT_FALSE(decompose(TileCounts(), 1u));
  EXPECT_FALSE(decompose(count("1m"), 0u));
}

TEST(Decomposer, PrefersTriplets)
{
  // 111222333m is three triplets as well as three identical sequences.
  std::optional<Decomposition> const result = decompose(count("111222333m"), 3u);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->triplets, (std::vector<Ordinal>{ 101u, 102u, 103u }));
  EXPECT_TRUE(result->sequences.empty());
}

TEST(Decomposer, FallsBackToSequences)
{
  std::optional<Decomposition> const result = decompose(count("111123m"), 2u);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->triplets, (std::vector<Ordinal>{ 101u }));
  EXPECT_EQ(result->sequences, (std::vector<Ordinal>{ 101u }));
}

TEST(Decomposer, HonorsNeverFormSequences)
{
  EXPECT_FALSE(decompose(count("123w"), 1u));
  EXPECT_FALSE(decompose(count("123d"), 1u));
}

TEST(Decomposer, SequencesDoNotWrapAround)
{
  EXPECT_FALSE(decompose(count("89m1p"), 1u));
}

TEST(Decomposer, WithPair)
{
  std::optional<Decomposition> const result
    = decomposeWithPair(count("123m456p789s111w22d"), 4u);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->pair, std::optional<Ordinal>(502u));
  EXPECT_EQ(result->sequences, (std::vector<Ordinal>{ 101u, 204u, 307u }));
  EXPECT_EQ(result->triplets, (std::vector<Ordinal>{ 401u }));
}

TEST(Decomposer, PairCandidatesInAscendingOrder)
{
  // 11122m: the pair 1m leaves 122m, the pair 2m leaves the triplet 1m.
  std::optional<Decomposition> const result = decomposeWithPair(count("11122m"), 1u);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->pair, std::optional<Ordinal>(102u));
  EXPECT_EQ(result->triplets, (std::vector<Ordinal>{ 101u }));
}

TEST(Decomposer, NoPairNoWin)
{
  EXPECT_FALSE(decomposeWithPair(count("123m456p789s111w23d"), 4u));
  EXPECT_FALSE(decomposeWithPair(count("12m"), 0u));
}

TEST(Decomposer, RejectsTooManySets)
{
  EXPECT_THROW(decompose(TileCounts(), 5u), std::invalid_argument);
  EXPECT_THROW(decomposeWithPair(TileCounts(), 5u), std::invalid_argument);
}

} // namespace Hupai::Testing
