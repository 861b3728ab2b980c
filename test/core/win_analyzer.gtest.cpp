#include "core/win_analyzer.hpp"

#include "core/analysis_result.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <optional>
#include <vector>
#include <string>


namespace Hupai::Testing{

namespace{

Hand makeHand(char const *concealed, char const *drawn)
{
  Hand hand(parseTiles(concealed));
  hand.setDrawn(parseTile(drawn));
  return hand;
}

std::vector<Ordinal> toOrdinals(char const *text)
{
  std::vector<Ordinal> result;
  for (Tile const &tile : parseTiles(text)) {
    result.push_back(tile.getOrdinal());
  }
  return result;
}

} // namespace `anonymous`

TEST(WinAnalyzer, ConcealedTraditionalWin)
{
  AnalysisResult const result = analyze(makeHand("123m456p789s111w2d", "2d"));
  EXPECT_TRUE(result.isWinning());
  EXPECT_TRUE(result.isTraditional());
  EXPECT_EQ(result.getWinKind(), WinKind::traditional);
  EXPECT_FALSE(result.isSevenPairs());
  EXPECT_FALSE(result.isPureSuit());
  EXPECT_FALSE(result.isHalfSuit());
  EXPECT_TRUE(result.isFullyConcealed());
  EXPECT_FALSE(result.isFullyExposed());
  EXPECT_EQ(result.getPair(), std::optional<Ordinal>(502u));
  EXPECT_EQ(result.getTriplets(), toOrdinals("1w"));
  EXPECT_EQ(result.getSequences(), toOrdinals("1m4p7s"));
}

TEST(WinAnalyzer, ReportsComposition)
{
  Hand hand = makeHand("123m456p789s111w2d", "2d");
  hand.addBonusTile(parseTile("1b"));

  std::ostringstream oss;
  oss << analyze(hand);
  EXPECT_EQ(
    oss.str(),
    "Win: Traditional\n"
    "  Pair: 22d\n"
    "  Triplet: 111w\n"
    "  Sequence: 123m\n"
    "  Sequence: 456p\n"
    "  Sequence: 789s\n"
    "  Fully concealed\n"
    "  Bonus tiles: 1\n");
}

TEST(WinAnalyzer, SevenPairs)
{
  AnalysisResult const result = analyze(makeHand("1199m2255p88s113w", "3w"));
  EXPECT_TRUE(result.isWinning());
  EXPECT_TRUE(result.isSevenPairs());
  EXPECT_FALSE(result.isTraditional());
  EXPECT_EQ(result.getWinKind(), WinKind::seven_pairs);
}

TEST(WinAnalyzer, SevenPairsThatAlsoFormGroups)
{
  AnalysisResult const result = analyze(makeHand("112233m4p556677s", "4p"));
  EXPECT_TRUE(result.isWinning());
  EXPECT_TRUE(result.isSevenPairs());
  EXPECT_TRUE(result.isTraditional());
  EXPECT_EQ(result.getNumTriplets() + result.getNumSequences(), 4u);
  EXPECT_EQ(result.getPair(), std::optional<Ordinal>(204u));
  EXPECT_EQ(result.getWinKind(), WinKind::seven_pairs);
}

TEST(WinKindName, Names)
{
  EXPECT_STREQ(getWinKindName(WinKind::none), "None");
  EXPECT_STREQ(getWinKindName(WinKind::seven_pairs), "Seven Pairs");
  EXPECT_STREQ(getWinKindName(WinKind::pure_suit_fallback), "Pure Suit");
}

TEST(WinAnalyzer, FourCopiesAreNotSevenPairs)
{
  AnalysisResult const result = analyze(makeHand("1111m2255p88s113w", "3w"));
  EXPECT_FALSE(result.isSevenPairs());
  EXPECT_FALSE(result.isWinning());
}

TEST(WinAnalyzer, ThirteenOrphans)
{
  AnalysisResult const result = analyze(makeHand("119m19p19s1234w12d", "3d"));
  EXPECT_TRUE(result.isWinning());
  EXPECT_TRUE(result.isThirteenOrphans());
  EXPECT_EQ(result.getWinKind(), WinKind::thirteen_orphans);
}

TEST(WinAnalyzer, FoldsExposedGroups)
{
  Hand hand = makeHand("456p789s2d", "2d");
  hand.addMeld(Meld(MeldType::sequence, parseTiles("123m"), parseTile("1m")));
  hand.addMeld(Meld(MeldType::triplet, parseTiles("111w"), parseTile("1w")));

  AnalysisResult const result = analyze(hand);
  EXPECT_TRUE(result.isTraditional());
  EXPECT_FALSE(result.isFullyConcealed());
  EXPECT_FALSE(result.isFullyExposed());
  EXPECT_EQ(result.getSequences(), toOrdinals("4p7s1m"));
  EXPECT_EQ(result.getTriplets(), toOrdinals("1w"));
}

TEST(WinAnalyzer, SelfQuadsCountAsTriplets)
{
  Hand hand = makeHand("456p789s2d", "2d");
  hand.addSelfQuad(parseTile("1w"));
  hand.addMeld(Meld(MeldType::quad, parseTiles("3333d"), parseTile("3d")));

  AnalysisResult const result = analyze(hand);
  EXPECT_TRUE(result.isTraditional());
  EXPECT_FALSE(result.isFullyConcealed());
  EXPECT_EQ(result.getTriplets(), toOrdinals("1w3d"));
}

TEST(WinAnalyzer, FullyExposed)
{
  Hand hand = makeHand("2d", "2d");
  hand.addMeld(Meld(MeldType::sequence, parseTiles("123m"), parseTile("3m")));
  hand.addMeld(Meld(MeldType::sequence, parseTiles("456p"), parseTile("4p")));
  hand.addMeld(Meld(MeldType::triplet, parseTiles("999s"), parseTile("9s")));
  hand.addMeld(Meld(MeldType::triplet, parseTiles("111w"), parseTile("1w")));

  AnalysisResult const result = analyze(hand);
  EXPECT_TRUE(result.isTraditional());
  EXPECT_TRUE(result.isFullyExposed());
  EXPECT_EQ(result.getNumTriplets(), 2u);
  EXPECT_EQ(result.getNumSequences(), 2u);
}

TEST(WinAnalyzer, HalfSuit)
{
  AnalysisResult const result = analyze(makeHand("123456789m222w2m", "2m"));
  EXPECT_TRUE(result.isTraditional());
  EXPECT_TRUE(result.isHalfSuit());
  EXPECT_FALSE(result.isPureSuit());
}

TEST(WinAnalyzer, PureSuitWithoutGroups)
{
  AnalysisResult const result = analyze(makeHand("1357m2468m13579m", "9m"));
  EXPECT_FALSE(result.isTraditional());
  EXPECT_FALSE(result.isSevenPairs());
  EXPECT_TRUE(result.isPureSuit());
  EXPECT_TRUE(result.isWinning());
  EXPECT_EQ(result.getWinKind(), WinKind::pure_suit_fallback);
}

TEST(WinAnalyzer, WrongTileCountIsNotAWin)
{
  AnalysisResult const result = analyze(Hand(parseTiles("123m456p789s111w2d")));
  EXPECT_FALSE(result.isWinning());
  EXPECT_EQ(result.getWinKind(), WinKind::none);
  EXPECT_FALSE(result.getPair());
}

TEST(WinAnalyzer, NoGroupsNoWin)
{
  EXPECT_FALSE(analyze(makeHand("123m456p789s112w2d", "3d")).isWinning());
}

TEST(WinAnalyzer, FifthCopyIsMalformed)
{
  EXPECT_THROW(analyze(makeHand("1111m", "1m")), MalformedHand);

  Hand hand = makeHand("1m", "2m");
  hand.addSelfQuad(parseTile("1m"));
  EXPECT_THROW(analyze(hand), MalformedHand);
}

TEST(WinAnalyzer, TooManyExposedGroups)
{
  Hand hand;
  for (char const *tile : { "1m", "2m", "3m", "4m", "5m" }) {
    hand.addSelfQuad(parseTile(tile));
  }
  EXPECT_THROW(analyze(hand), MalformedHand);
}

TEST(WinAnalyzer, FindWinningTiles)
{
  EXPECT_EQ(findWinningTiles(Hand(parseTiles("123m456p789s111w2d"))), toOrdinals("2d"));
  EXPECT_EQ(findWinningTiles(Hand(parseTiles("2223m456p789s111w"))), toOrdinals("134m"));
}

TEST(WinAnalyzer, FindWinningTilesThirteenWays)
{
  std::vector<Ordinal> const waits = findWinningTiles(Hand(parseTiles("19m19p19s1234w123d")));
  EXPECT_EQ(waits, toOrdinals("19m19p19s1234w123d"));
}

TEST(WinAnalyzer, FindWinningTilesSkipsExhaustedTiles)
{
  // The only wait is 5m and all four copies are already held.
  Hand hand(parseTiles("5m"));
  hand.addMeld(Meld(MeldType::triplet, parseTiles("555m"), parseTile("5m")));
  hand.addMeld(Meld(MeldType::sequence, parseTiles("123p"), parseTile("1p")));
  hand.addMeld(Meld(MeldType::sequence, parseTiles("456p"), parseTile("4p")));
  hand.addMeld(Meld(MeldType::triplet, parseTiles("777s"), parseTile("7s")));
  EXPECT_TRUE(findWinningTiles(hand).empty());
}

TEST(WinAnalyzer, FindWinningTilesNeedsAShortHand)
{
  EXPECT_TRUE(findWinningTiles(makeHand("123m456p789s111w2d", "2d")).empty());
  EXPECT_TRUE(findWinningTiles(Hand(parseTiles("123m456p789s11w2d"))).empty());
}

TEST(WinAnalyzer, FindSelfQuadCandidates)
{
  EXPECT_EQ(findSelfQuadCandidates(makeHand("1112m3p", "1m")), toOrdinals("1m"));
  EXPECT_EQ(findSelfQuadCandidates(makeHand("1111m2222p3s", "4s")), toOrdinals("1m2p"));
  EXPECT_TRUE(findSelfQuadCandidates(makeHand("111m", "2m")).empty());
}

} // namespace Hupai::Testing
