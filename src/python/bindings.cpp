#define PY_SSIZE_T_CLEAN
#include "python/bindings.hpp"

#include "core/interrupt.hpp"
#include "core/win_analyzer.hpp"
#include "core/scoring.hpp"
#include "core/analysis_result.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "core/errors.hpp"
#include "common/throw.hpp"
#include <boost/python/exception_translator.hpp>
#include <boost/python/extract.hpp>
#include <boost/python/dict.hpp>
#include <boost/python/list.hpp>
#include <boost/python/tuple.hpp>
#include <boost/python/str.hpp>
#include <boost/python/object.hpp>
#include <Python.h>
#include <vector>
#include <array>
#include <string>
#include <optional>
#include <functional>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;
namespace python = boost::python;

long extractLong(python::object o, char const *what)
{
  python::extract<long> value(o);
  if (!value.check()) {
    HUPAI_THROW<std::invalid_argument>(_1) << what << ": A type error.";
  }
  return value();
}

Hupai::Tile toTile(python::object o, char const *what)
{
  long const ordinal = extractLong(o, what);
  if (ordinal < 0) {
    HUPAI_THROW<Hupai::InvalidTile>(_1) << ordinal << ": An invalid ordinal.";
  }
  return Hupai::Tile(static_cast<Hupai::Ordinal>(ordinal));
}

std::vector<Hupai::Tile> toTiles(python::object tiles, char const *what)
{
  std::vector<Hupai::Tile> result;
  if (tiles.is_none()) {
    return result;
  }
  python::ssize_t const length = python::len(tiles);
  for (python::ssize_t i = 0; i < length; ++i) {
    result.push_back(toTile(tiles[i], what));
  }
  return result;
}

Hupai::MeldType toMeldType(python::object o)
{
  python::extract<std::string> type(o);
  if (!type.check()) {
    HUPAI_THROW<std::invalid_argument>("meld type: A type error.");
  }
  std::string const name = type();
  if (name == "sequence") {
    return Hupai::MeldType::sequence;
  }
  if (name == "triplet") {
    return Hupai::MeldType::triplet;
  }
  if (name == "quad") {
    return Hupai::MeldType::quad;
  }
  HUPAI_THROW<std::invalid_argument>(_1) << name << ": An unknown meld type.";
}

Hupai::ReactionType toReactionType(python::object o)
{
  python::extract<std::string> type(o);
  if (!type.check()) {
    HUPAI_THROW<std::invalid_argument>("reaction type: A type error.");
  }
  std::string const name = type();
  for (Hupai::ReactionType const t : {
         Hupai::ReactionType::pass, Hupai::ReactionType::chi, Hupai::ReactionType::pon,
         Hupai::ReactionType::kong, Hupai::ReactionType::ron }) {
    if (name == Hupai::getReactionTypeName(t)) {
      return t;
    }
  }
  HUPAI_THROW<std::invalid_argument>(_1) << name << ": An unknown reaction type.";
}

Hupai::Hand toHand(python::dict hand)
{
  Hupai::Hand result(toTiles(hand.get("concealed"), "concealed"));
  python::object const drawn = hand.get("drawn");
  if (!drawn.is_none()) {
    result.setDrawn(toTile(drawn, "drawn"));
  }
  for (Hupai::Tile const &tile : toTiles(hand.get("self_quads"), "self_quads")) {
    result.addSelfQuad(tile);
  }
  python::object const melds = hand.get("melds");
  if (!melds.is_none()) {
    python::ssize_t const length = python::len(melds);
    for (python::ssize_t i = 0; i < length; ++i) {
      python::object const meld = melds[i];
      result.addMeld(Hupai::Meld(
        toMeldType(meld["type"]), toTiles(meld["tiles"], "meld tiles"),
        toTile(meld["claimed"], "meld claimed")));
    }
  }
  for (Hupai::Tile const &tile : toTiles(hand.get("bonus"), "bonus")) {
    result.addBonusTile(tile);
  }
  return result;
}

python::list toList(std::vector<Hupai::Ordinal> const &ordinals)
{
  python::list result;
  for (Hupai::Ordinal const ordinal : ordinals) {
    result.append(static_cast<long>(ordinal));
  }
  return result;
}

void translateToValueError(std::exception const &e)
{
  PyErr_SetString(PyExc_ValueError, e.what());
}

} // namespace `anonymous`

namespace Hupai::Python{

python::list parseTiles(std::string const &text)
{
  std::vector<Ordinal> ordinals;
  for (Tile const &tile : Hupai::parseTiles(text)) {
    ordinals.push_back(tile.getOrdinal());
  }
  return toList(ordinals);
}

python::dict analyze(python::dict hand)
{
  AnalysisResult const analysis = Hupai::analyze(toHand(hand));

  python::dict result;
  result["is_winning"] = analysis.isWinning();
  result["win_kind"] = python::str(getWinKindName(analysis.getWinKind()));
  result["is_traditional"] = analysis.isTraditional();
  result["is_seven_pairs"] = analysis.isSevenPairs();
  result["is_thirteen_orphans"] = analysis.isThirteenOrphans();
  result["is_pure_suit"] = analysis.isPureSuit();
  result["is_half_suit"] = analysis.isHalfSuit();
  result["is_fully_concealed"] = analysis.isFullyConcealed();
  result["is_fully_exposed"] = analysis.isFullyExposed();
  result["bonus_tile_count"] = static_cast<long>(analysis.getNumBonusTiles());
  if (analysis.getPair()) {
    result["pair"] = static_cast<long>(*analysis.getPair());
  }
  else {
    result["pair"] = python::object();
  }
  result["triplets"] = toList(analysis.getTriplets());
  result["sequences"] = toList(analysis.getSequences());
  return result;
}

python::dict score(python::dict hand, long const seat, bool const self_drawn, long const round_wind)
{
  if (seat < 0 || 4 <= seat) {
    HUPAI_THROW<std::invalid_argument>(std::placeholders::_1) << seat << ": An invalid seat.";
  }
  if (round_wind < 0) {
    HUPAI_THROW<std::invalid_argument>(std::placeholders::_1) << round_wind << ": An invalid round wind.";
  }

  Hand const hand_ = toHand(hand);
  RuleConfig config;
  config.round_wind = round_wind;
  Scorer const scorer(config);
  Score const score = scorer.score(
    Hupai::analyze(hand_), seat, self_drawn, hand_.getNumSelfQuads(),
    hand_.getNumClaimedQuads(), hand_.getBonusTiles());

  python::list breakdown;
  for (std::string const &line : score.breakdown) {
    breakdown.append(line);
  }
  python::dict result;
  result["points"] = static_cast<long>(score.points);
  result["breakdown"] = breakdown;
  return result;
}

python::list findWinningTiles(python::dict hand)
{
  return toList(Hupai::findWinningTiles(toHand(hand)));
}

python::list enumerateChiOptions(python::list concealed, long const discarded)
{
  Hand const hand(toTiles(concealed, "concealed"));
  python::list result;
  for (ChiOption const &option : Hupai::enumerateChiOptions(hand, toTile(python::object(discarded), "discarded"))) {
    std::array<Ordinal, 2u> const with = option.getHandTiles();
    result.append(python::make_tuple(
      static_cast<long>(option.getDiscarded()), static_cast<long>(with[0u]),
      static_cast<long>(with[1u])));
  }
  return result;
}

python::tuple resolveInterrupt(python::list candidates)
{
  std::vector<ReactionCandidate> candidates_;
  python::ssize_t const length = python::len(candidates);
  for (python::ssize_t i = 0; i < length; ++i) {
    python::object const candidate = candidates[i];
    long const seat = extractLong(candidate[0], "seat");
    if (seat < 0 || 4 <= seat) {
      HUPAI_THROW<std::invalid_argument>(std::placeholders::_1) << seat << ": An invalid seat.";
    }
    ReactionCandidate c{ static_cast<std::uint_fast8_t>(seat), toReactionType(candidate[1]), std::nullopt };
    python::object chi;
    if (python::len(candidate) >= 3) {
      chi = candidate[2];
    }
    if (!chi.is_none()) {
      c.chi_option.emplace(
        extractLong(chi[0], "chi"), extractLong(chi[1], "chi"), extractLong(chi[2], "chi"));
    }
    candidates_.push_back(c);
  }

  ReactionCandidate const winner = Hupai::resolveInterrupt(candidates_);
  python::object chi;
  if (winner.chi_option) {
    std::array<Ordinal, 2u> const with = winner.chi_option->getHandTiles();
    chi = python::make_tuple(
      static_cast<long>(winner.chi_option->getDiscarded()), static_cast<long>(with[0u]),
      static_cast<long>(with[1u]));
  }
  return python::make_tuple(
    static_cast<long>(winner.seat), python::str(getReactionTypeName(winner.type)), chi);
}

void registerExceptionTranslators()
{
  python::register_exception_translator<std::invalid_argument>(&translateToValueError);
  python::register_exception_translator<MalformedHand>(&translateToValueError);
}

} // namespace Hupai::Python
