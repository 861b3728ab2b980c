#include "core/hand.hpp"

#include "core/errors.hpp"
#include "core/tile.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <algorithm>
#include <vector>
#include <optional>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>
#include <cstddef>


namespace{

using std::placeholders::_1;

void insertSorted(std::vector<Hupai::Tile> &tiles, Hupai::Tile const &tile)
{
  tiles.insert(std::upper_bound(tiles.begin(), tiles.end(), tile), tile);
}

} // namespace `anonymous`

namespace Hupai{

Meld::Meld(MeldType const type, std::vector<Tile> tiles, Tile const &claimed)
  : type_(type),
    tiles_(std::move(tiles)),
    claimed_(claimed)
{
  std::sort(tiles_.begin(), tiles_.end());

  std::size_t const expected_size = type_ == MeldType::quad ? 4u : 3u;
  if (tiles_.size() != expected_size) {
    HUPAI_THROW<MalformedHand>(_1)
      << toString(tiles_) << ": A meld of " << tiles_.size() << " tiles.";
  }
  for (Tile const &tile : tiles_) {
    if (tile.isBonus()) {
      HUPAI_THROW<MalformedHand>(_1) << toString(tiles_) << ": A bonus tile in a meld.";
    }
  }
  if (std::find(tiles_.cbegin(), tiles_.cend(), claimed_) == tiles_.cend()) {
    HUPAI_THROW<MalformedHand>(_1)
      << toString(tiles_) << ": The claimed tile " << claimed_ << " is not a member.";
  }

  if (type_ == MeldType::sequence) {
    if (!tiles_.front().isSuited() || tiles_.front().getSuit() != tiles_.back().getSuit()
        || tiles_[1u].getOrdinal() != tiles_[0u].getOrdinal() + 1u
        || tiles_[2u].getOrdinal() != tiles_[1u].getOrdinal() + 1u) {
      HUPAI_THROW<MalformedHand>(_1) << toString(tiles_) << ": Not a sequence.";
    }
    return;
  }
  if (tiles_.front() != tiles_.back()) {
    HUPAI_THROW<MalformedHand>(_1)
      << toString(tiles_) << ": Not " << (type_ == MeldType::quad ? "a quad." : "a triplet.");
  }
}

MeldType Meld::getType() const noexcept
{
  return type_;
}

std::vector<Tile> const &Meld::getTiles() const noexcept
{
  return tiles_;
}

Tile const &Meld::getClaimed() const noexcept
{
  return claimed_;
}

Ordinal Meld::getRoot() const noexcept
{
  return tiles_.front().getOrdinal();
}

void swap(Hand &lhs, Hand &rhs) noexcept
{
  lhs.swap(rhs);
}

Hand::Hand(std::vector<Tile> const &concealed)
  : Hand()
{
  for (Tile const &tile : concealed) {
    addConcealed(tile);
  }
}

void Hand::swap(Hand &rhs) noexcept
{
  using std::swap;
  swap(concealed_, rhs.concealed_);
  swap(drawn_, rhs.drawn_);
  swap(self_quads_, rhs.self_quads_);
  swap(melds_, rhs.melds_);
  swap(bonus_tiles_, rhs.bonus_tiles_);
}

Hand &Hand::operator=(Hand const &rhs)
{
  Hand(rhs).swap(*this);
  return *this;
}

Hand &Hand::operator=(Hand &&rhs) noexcept
{
  Hand(std::move(rhs)).swap(*this);
  return *this;
}

std::vector<Tile> const &Hand::getConcealed() const noexcept
{
  return concealed_;
}

std::optional<Tile> const &Hand::getDrawn() const noexcept
{
  return drawn_;
}

std::vector<Tile> const &Hand::getSelfQuads() const noexcept
{
  return self_quads_;
}

std::vector<Meld> const &Hand::getMelds() const noexcept
{
  return melds_;
}

std::vector<Tile> const &Hand::getBonusTiles() const noexcept
{
  return bonus_tiles_;
}

std::vector<Tile> Hand::getFunctionalTiles() const
{
  std::vector<Tile> result(concealed_);
  if (drawn_) {
    result.push_back(*drawn_);
  }
  for (Tile const &tile : self_quads_) {
    result.insert(result.end(), 4u, tile);
  }
  for (Meld const &meld : melds_) {
    result.insert(result.end(), meld.getTiles().cbegin(), meld.getTiles().cend());
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::uint_fast8_t Hand::getNumSelfQuads() const noexcept
{
  return self_quads_.size();
}

std::uint_fast8_t Hand::getNumClaimedQuads() const noexcept
{
  return std::count_if(
    melds_.cbegin(), melds_.cend(),
    [](Meld const &meld) { return meld.getType() == MeldType::quad; });
}

std::uint_fast8_t Hand::getNumExposedGroups() const noexcept
{
  return self_quads_.size() + melds_.size();
}

std::uint_fast8_t Hand::countConcealed(Ordinal const ordinal) const noexcept
{
  return std::count_if(
    concealed_.cbegin(), concealed_.cend(),
    [ordinal](Tile const &tile) { return tile.getOrdinal() == ordinal; });
}

void Hand::addConcealed(Tile const &tile)
{
  if (tile.isBonus()) {
    insertSorted(bonus_tiles_, tile);
    return;
  }
  insertSorted(concealed_, tile);
}

void Hand::setDrawn(Tile const &tile)
{
  if (tile.isBonus()) {
    insertSorted(bonus_tiles_, tile);
    return;
  }
  if (drawn_) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << tile << ": A drawn tile (" << *drawn_ << ") is already present.";
  }
  drawn_ = tile;
}

void Hand::mergeDrawn()
{
  if (!drawn_) {
    return;
  }
  insertSorted(concealed_, *drawn_);
  drawn_.reset();
}

Tile Hand::discard(Tile const &tile)
{
  if (drawn_ && *drawn_ == tile) {
    drawn_.reset();
    return tile;
  }
  if (countConcealed(tile.getOrdinal()) == 0u) {
    HUPAI_THROW<std::invalid_argument>(_1) << tile << ": Not in the hand.";
  }
  removeConcealed_(tile, 1u);
  mergeDrawn();
  return tile;
}

void Hand::addSelfQuad(Tile const &tile)
{
  if (tile.isBonus()) {
    HUPAI_THROW<MalformedHand>(_1) << tile << ": A quad of bonus tiles.";
  }
  self_quads_.push_back(tile);
}

void Hand::declareSelfQuad(Tile const &tile)
{
  mergeDrawn();
  if (countConcealed(tile.getOrdinal()) < 4u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << tile << ": Fewer than 4 copies are held (" << toString(concealed_) << ").";
  }
  removeConcealed_(tile, 4u);
  addSelfQuad(tile);
}

void Hand::addMeld(Meld meld)
{
  melds_.push_back(std::move(meld));
}

void Hand::claim(Meld meld)
{
  std::vector<Tile> members(meld.getTiles());
  members.erase(std::find(members.begin(), members.end(), meld.getClaimed()));
  for (Tile const &tile : members) {
    std::uint_fast8_t const needed = std::count(members.cbegin(), members.cend(), tile);
    if (countConcealed(tile.getOrdinal()) < needed) {
      HUPAI_THROW<std::invalid_argument>(_1)
        << toString(meld.getTiles()) << ": The hand lacks " << tile << '.';
    }
  }
  for (Tile const &tile : members) {
    removeConcealed_(tile, 1u);
  }
  addMeld(std::move(meld));
}

void Hand::addBonusTile(Tile const &tile)
{
  if (!tile.isBonus()) {
    HUPAI_THROW<std::invalid_argument>(_1) << tile << ": Not a bonus tile.";
  }
  insertSorted(bonus_tiles_, tile);
}

void Hand::removeConcealed_(Tile const &tile, std::uint_fast8_t count)
{
  for (auto iter = concealed_.begin(); iter != concealed_.end() && count > 0u;) {
    if (*iter == tile) {
      iter = concealed_.erase(iter);
      --count;
      continue;
    }
    ++iter;
  }
}

std::ostream &operator<<(std::ostream &os, Hand const &hand)
{
  os << toString(hand.getConcealed());
  if (hand.getDrawn()) {
    os << " + " << *hand.getDrawn();
  }
  for (Tile const &tile : hand.getSelfQuads()) {
    os << " [" << toString(std::vector<Tile>(4u, tile)) << ']';
  }
  for (Meld const &meld : hand.getMelds()) {
    os << " (" << toString(meld.getTiles()) << ')';
  }
  if (!hand.getBonusTiles().empty()) {
    os << " {" << toString(hand.getBonusTiles()) << '}';
  }
  return os;
}

} // namespace Hupai
