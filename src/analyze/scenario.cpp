#include "analyze/scenario.hpp"

#include "core/interrupt_arbiter.hpp"
#include "core/interrupt.hpp"
#include "core/win_analyzer.hpp"
#include "core/scoring.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "common/throw.hpp"
#include "common/scenario.pb.h"
#include <google/protobuf/text_format.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <ostream>
#include <ios>
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

Hupai::MeldType decodeMeldType(hupai::Meld::Type const type)
{
  switch (type) {
  case hupai::Meld::SEQUENCE:
    return Hupai::MeldType::sequence;
  case hupai::Meld::TRIPLET:
    return Hupai::MeldType::triplet;
  case hupai::Meld::QUAD:
    return Hupai::MeldType::quad;
  default:
    HUPAI_THROW<std::invalid_argument>(_1) << static_cast<int>(type) << ": An unknown meld type.";
  }
}

Hupai::ReactionType decodeReactionType(hupai::Reaction::Type const type)
{
  switch (type) {
  case hupai::Reaction::PASS:
    return Hupai::ReactionType::pass;
  case hupai::Reaction::CHI:
    return Hupai::ReactionType::chi;
  case hupai::Reaction::PON:
    return Hupai::ReactionType::pon;
  case hupai::Reaction::KONG:
    return Hupai::ReactionType::kong;
  case hupai::Reaction::RON:
    return Hupai::ReactionType::ron;
  default:
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<int>(type) << ": An unknown reaction type.";
  }
}

std::uint_fast8_t decodeSeat(std::uint32_t const seat)
{
  if (seat >= 4u) {
    HUPAI_THROW<std::invalid_argument>(_1) << seat << ": An invalid seat.";
  }
  return seat;
}

} // namespace `anonymous`

namespace Hupai{

hupai::Scenario parseScenario(std::string_view const text)
{
  hupai::Scenario scenario;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text), &scenario)) {
    HUPAI_THROW<std::runtime_error>("Failed to parse a scenario.");
  }
  return scenario;
}

hupai::Scenario loadScenario(std::filesystem::path const &path)
{
  if (!std::filesystem::exists(path)) {
    HUPAI_THROW<std::invalid_argument>(_1) << path << ": does not exist.";
  }
  if (!std::filesystem::is_regular_file(path)) {
    HUPAI_THROW<std::invalid_argument>(_1) << path << ": not a regular file.";
  }

  std::string const text = [&path]() {
    std::ifstream ifs(path, std::ios_base::in);
    if (!ifs) {
      HUPAI_THROW<std::runtime_error>(_1) << path << ": Failed to open.";
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return std::move(oss).str();
  }();

  try {
    return parseScenario(text);
  }
  catch (std::runtime_error const &) {
    HUPAI_THROW_WITH_NESTED<std::runtime_error>(_1) << path << ": A broken scenario.";
  }
}

Hand makeHand(hupai::Scenario const &scenario)
{
  Hand hand(parseTiles(scenario.concealed()));
  if (!scenario.drawn().empty()) {
    hand.setDrawn(parseTile(scenario.drawn()));
  }
  for (Tile const &tile : parseTiles(scenario.self_quads())) {
    hand.addSelfQuad(tile);
  }
  for (hupai::Meld const &meld : scenario.melds()) {
    hand.addMeld(Meld(decodeMeldType(meld.type()), parseTiles(meld.tiles()), parseTile(meld.claimed())));
  }
  for (Tile const &tile : parseTiles(scenario.bonus())) {
    hand.addBonusTile(tile);
  }
  return hand;
}

RuleConfig makeRuleConfig(hupai::Scenario const &scenario)
{
  RuleConfig config;
  if (scenario.round_wind().empty()) {
    return config;
  }
  Tile const wind = parseTile(scenario.round_wind());
  if (wind.getSuit() != Suit::wind) {
    HUPAI_THROW<std::invalid_argument>(_1) << wind << ": The round wind must be a wind.";
  }
  config.round_wind = wind.getOrdinal();
  return config;
}

std::vector<ReactionCandidate> makeReactionCandidates(hupai::Discard const &discard)
{
  Tile const discarded = parseTile(discard.tile());

  std::vector<ReactionCandidate> result;
  for (hupai::Reaction const &reaction : discard.reactions()) {
    ReactionCandidate candidate{ decodeSeat(reaction.seat()), decodeReactionType(reaction.type()), std::nullopt };
    if (candidate.type == ReactionType::chi) {
      std::vector<Tile> const with = parseTiles(reaction.chi_with());
      if (with.size() != 2u) {
        HUPAI_THROW<std::invalid_argument>(_1)
          << reaction.chi_with() << ": Chi needs exactly two tiles from the hand.";
      }
      candidate.chi_option.emplace(discarded.getOrdinal(), with[0u].getOrdinal(), with[1u].getOrdinal());
    }
    result.push_back(candidate);
  }
  return result;
}

void report(hupai::Scenario const &scenario, std::ostream &os)
{
  std::uint_fast8_t const seat = decodeSeat(scenario.seat());
  Hand const hand = makeHand(scenario);
  Scorer const scorer(makeRuleConfig(scenario));

  os << "== " << scenario.name() << '\n';
  os << "Hand: " << hand << '\n';

  AnalysisResult const analysis = analyze(hand);
  os << analysis;
  if (analysis.isWinning()) {
    os << scorer.score(
      analysis, seat, scenario.self_drawn(), hand.getNumSelfQuads(), hand.getNumClaimedQuads(),
      hand.getBonusTiles());
  }
  else {
    std::vector<Tile> waits;
    for (Ordinal const ordinal : findWinningTiles(hand)) {
      waits.emplace_back(ordinal);
    }
    if (!waits.empty()) {
      os << "Waiting: " << toString(waits) << '\n';
    }
  }

  std::vector<Ordinal> const quads = findSelfQuadCandidates(hand);
  for (Ordinal const ordinal : quads) {
    os << "Quad available: " << Tile(ordinal) << '\n';
  }

  if (!scenario.has_discard()) {
    return;
  }

  hupai::Discard const &discard = scenario.discard();
  std::uint_fast8_t const discarding_seat = decodeSeat(discard.seat());
  Tile const discarded = parseTile(discard.tile());

  if (seat != discarding_seat) {
    ReactionOptions const options
      = getReactionOptions(hand, discarded, seat == (discarding_seat + 1u) % 4u);
    for (ChiOption const &option : options.chi_options) {
      os << "Chi available: " << option << '\n';
    }
    if (options.pon) {
      os << "Pon available\n";
    }
    if (options.kong) {
      os << "Kong available\n";
    }
    if (options.ron) {
      os << "Ron available\n";
    }
  }

  InterruptArbiter arbiter;
  arbiter.onDiscard(discarding_seat, discarded);
  for (ReactionCandidate const &candidate : makeReactionCandidates(discard)) {
    if (arbiter.submit(candidate)) {
      break;
    }
  }
  os << "Discard " << discarded << " by seat " << static_cast<unsigned>(discarding_seat)
     << " goes to " << arbiter.closeWindow() << '\n';
}

} // namespace Hupai
