#include "analyze/scenario.hpp"

#include "core/interrupt.hpp"
#include "core/scoring.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "core/errors.hpp"
#include "common/scenario.pb.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <optional>
#include <vector>
#include <string>
#include <exception>
#include <stdexcept>


namespace Hupai::Testing{

namespace{

std::string report(char const *text)
{
  std::ostringstream oss;
  Hupai::report(parseScenario(text), oss);
  return oss.str();
}

} // namespace `anonymous`

TEST(Scenario, MakeHand)
{
  hupai::Scenario const scenario = parseScenario(R"(
    concealed: "456p789s2d"
    drawn: "2d"
    self_quads: "1w"
    melds { type: SEQUENCE tiles: "123m" claimed: "2m" }
    bonus: "1b3r"
  )");

  Hand const hand = makeHand(scenario);
  EXPECT_EQ(toString(hand.getConcealed()), "456p789s2d");
  EXPECT_EQ(hand.getDrawn(), std::optional<Tile>(parseTile("2d")));
  EXPECT_EQ(hand.getNumSelfQuads(), 1u);
  ASSERT_EQ(hand.getMelds().size(), 1u);
  EXPECT_EQ(hand.getMelds().front().getClaimed(), parseTile("2m"));
  EXPECT_EQ(toString(hand.getBonusTiles()), "1b3r");
}

TEST(Scenario, RuleConfig)
{
  EXPECT_EQ(makeRuleConfig(parseScenario("")).round_wind, east_wind);
  EXPECT_EQ(makeRuleConfig(parseScenario(R"(round_wind: "3w")")).round_wind, west_wind);
  EXPECT_THROW(makeRuleConfig(parseScenario(R"(round_wind: "1d")")), std::invalid_argument);
}

TEST(Scenario, ReactionCandidates)
{
  hupai::Scenario const scenario = parseScenario(R"(
    discard {
      seat: 0
      tile: "4m"
      reactions { seat: 1 type: CHI chi_with: "53m" }
      reactions { seat: 2 type: PON }
    }
  )");

  std::vector<ReactionCandidate> const candidates = makeReactionCandidates(scenario.discard());
  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0u].seat, 1u);
  EXPECT_EQ(candidates[0u].type, ReactionType::chi);
  ASSERT_TRUE(candidates[0u].chi_option);
  EXPECT_EQ(*candidates[0u].chi_option, ChiOption(104u, 103u, 105u));
  EXPECT_EQ(candidates[1u].type, ReactionType::pon);
  EXPECT_FALSE(candidates[1u].chi_option);
}

TEST(Scenario, ChiNeedsTwoTiles)
{
  hupai::Scenario const scenario = parseScenario(R"(
    discard { seat: 0 tile: "4m" reactions { seat: 1 type: CHI chi_with: "3m" } }
  )");
  EXPECT_THROW(makeReactionCandidates(scenario.discard()), std::invalid_argument);
}

TEST(Scenario, ReportWinningHand)
{
  std::string const text = report(R"(
    name: "east wind"
    seat: 0
    self_drawn: true
    concealed: "123m456p789s111w2d"
    drawn: "2d"
  )");
  EXPECT_EQ(
    text,
    "== east wind\n"
    "Hand: 123m456p789s111w2d + 2d\n"
    "Win: Traditional\n"
    "  Pair: 22d\n"
    "  Triplet: 111w\n"
    "  Sequence: 123m\n"
    "  Sequence: 456p\n"
    "  Sequence: 789s\n"
    "  Fully concealed\n"
    "  Bonus tiles: 0\n"
    "Base Win: +1\n"
    "Concealed Self-Drawn: +3\n"
    "Seat Wind Triplet: +1\n"
    "Round Wind Triplet: +1\n"
    "Total: 6\n");
}

TEST(Scenario, ReportWaitingHand)
{
  std::string const text = report(R"(
    name: "waiting"
    concealed: "2223m456p789s111w"
  )");
  EXPECT_EQ(
    text,
    "== waiting\n"
    "Hand: 2223m456p789s111w\n"
    "Win: None\n"
    "  Bonus tiles: 0\n"
    "Waiting: 134m\n");
}

TEST(Scenario, ReportQuadCandidate)
{
  std::string const text = report(R"(
    concealed: "1112m456p789s111w"
    drawn: "1m"
  )");
  EXPECT_NE(text.find("Quad available: 1m\n"), std::string::npos);
}

TEST(Scenario, ReportDiscard)
{
  std::string const text = report(R"(
    name: "claims"
    seat: 1
    concealed: "123m456p789s111w2d"
    discard {
      seat: 0
      tile: "4m"
      reactions { seat: 1 type: CHI chi_with: "23m" }
      reactions { seat: 2 type: PON }
    }
  )");
  EXPECT_NE(text.find("Chi available: 234m (4m claimed)\n"), std::string::npos);
  EXPECT_EQ(text.find("Pon available"), std::string::npos);
  EXPECT_EQ(text.find("Ron available"), std::string::npos);
  EXPECT_NE(text.find("Discard 4m by seat 0 goes to seat 2: Pon\n"), std::string::npos);
}

TEST(Scenario, ReportRon)
{
  std::string const text = report(R"(
    seat: 3
    concealed: "123m456p789s111w2d"
    discard {
      seat: 1
      tile: "2d"
      reactions { seat: 3 type: RON }
    }
  )");
  EXPECT_EQ(text.find("Chi available"), std::string::npos);
  EXPECT_NE(text.find("Ron available\n"), std::string::npos);
  EXPECT_NE(text.find("Discard 2d by seat 1 goes to seat 3: Ron\n"), std::string::npos);
}

TEST(Scenario, ParseErrors)
{
  EXPECT_THROW(parseScenario("concealed: "), std::runtime_error);
  EXPECT_THROW(parseScenario("no_such_field: 1"), std::runtime_error);
  EXPECT_THROW(report(R"(seat: 4 concealed: "1m")"), std::invalid_argument);
  EXPECT_THROW(report(R"(concealed: "1x")"), InvalidTile);
}

TEST(Scenario, LoadScenario)
{
  std::filesystem::path const dir = std::filesystem::temp_directory_path();
  EXPECT_THROW(loadScenario(dir / "hupai-no-such-scenario.textproto"), std::invalid_argument);
  EXPECT_THROW(loadScenario(dir), std::invalid_argument);

  std::filesystem::path const good = dir / "hupai-scenario-good.textproto";
  {
    std::ofstream ofs(good);
    ofs << "name: \"loaded\"\nconcealed: \"11m\"\n";
  }
  EXPECT_EQ(loadScenario(good).name(), "loaded");
  std::filesystem::remove(good);

  std::filesystem::path const broken = dir / "hupai-scenario-broken.textproto";
  {
    std::ofstream ofs(broken);
    ofs << "name: {\n";
  }
  try {
    loadScenario(broken);
    FAIL();
  }
  catch (std::runtime_error const &e) {
    EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
  }
  std::filesystem::remove(broken);
}

} // namespace Hupai::Testing
