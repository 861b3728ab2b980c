#include "core/tile.hpp"

#include "core/errors.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <vector>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <cstdint>
#include <cstddef>


namespace{

using std::placeholders::_1;

std::uint_fast8_t getMaxRank(std::uint_fast8_t const suit) noexcept
{
  switch (suit) {
  case 1u:
  case 2u:
  case 3u:
    return 9u;
  case 4u:
    return 4u;
  case 5u:
    return 3u;
  case 6u:
  case 7u:
    return 8u;
  default:
    return 0u;
  }
}

Hupai::Suit decodeSuitLetter(char const c)
{
  switch (c) {
  case 'm':
    return Hupai::Suit::characters;
  case 'p':
    return Hupai::Suit::circles;
  case 's':
    return Hupai::Suit::bamboos;
  case 'w':
    return Hupai::Suit::wind;
  case 'd':
    return Hupai::Suit::dragon;
  case 'b':
    return Hupai::Suit::blue_bonus;
  case 'r':
    return Hupai::Suit::red_bonus;
  default:
    HUPAI_THROW<Hupai::InvalidTile>(_1) << c << ": An unknown suit letter.";
  }
}

char encodeSuitLetter(Hupai::Suit const suit)
{
  switch (suit) {
  case Hupai::Suit::characters:
    return 'm';
  case Hupai::Suit::circles:
    return 'p';
  case Hupai::Suit::bamboos:
    return 's';
  case Hupai::Suit::wind:
    return 'w';
  case Hupai::Suit::dragon:
    return 'd';
  case Hupai::Suit::blue_bonus:
    return 'b';
  case Hupai::Suit::red_bonus:
    return 'r';
  }
  HUPAI_THROW<std::logic_error>("A logic error.");
}

bool isSpace(char const c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',';
}

} // namespace `anonymous`

namespace Hupai{

bool isValidOrdinal(Ordinal const ordinal) noexcept
{
  if (ordinal >= 800u) {
    return false;
  }
  std::uint_fast8_t const rank = ordinal % 100u;
  return rank >= 1u && rank <= getMaxRank(ordinal / 100u);
}

std::vector<Ordinal> const &getFunctionalOrdinals()
{
  static std::vector<Ordinal> const ordinals = []() {
    std::vector<Ordinal> result;
    for (std::uint_fast8_t suit = 1u; suit <= 5u; ++suit) {
      for (std::uint_fast8_t rank = 1u; rank <= getMaxRank(suit); ++rank) {
        result.push_back(suit * 100u + rank);
      }
    }
    return result;
  }();
  return ordinals;
}

Tile::Tile(Suit const suit, std::uint_fast8_t const rank)
  : ordinal_(static_cast<Ordinal>(suit) * 100u + rank)
{
  std::uint_fast8_t const max_rank = getMaxRank(static_cast<std::uint_fast8_t>(suit));
  if (max_rank == 0u) {
    HUPAI_THROW<InvalidTile>(_1) << static_cast<unsigned>(suit) << ": An invalid suit.";
  }
  if (rank < 1u || max_rank < rank) {
    HUPAI_THROW<InvalidTile>(_1)
      << static_cast<unsigned>(rank) << ": An invalid rank for the suit "
      << static_cast<unsigned>(suit) << '.';
  }
}

Tile::Tile(Ordinal const ordinal)
  : ordinal_(ordinal)
{
  if (!isValidOrdinal(ordinal)) {
    HUPAI_THROW<InvalidTile>(_1) << ordinal << ": An invalid ordinal.";
  }
}

Suit Tile::getSuit() const noexcept
{
  return static_cast<Suit>(ordinal_ / 100u);
}

std::uint_fast8_t Tile::getRank() const noexcept
{
  return ordinal_ % 100u;
}

Ordinal Tile::getOrdinal() const noexcept
{
  return ordinal_;
}

bool Tile::isSuited() const noexcept
{
  return ordinal_ < 400u;
}

bool Tile::isHonor() const noexcept
{
  return 400u <= ordinal_ && ordinal_ < 600u;
}

bool Tile::isBonus() const noexcept
{
  return ordinal_ >= 600u;
}

bool operator==(Tile const &lhs, Tile const &rhs) noexcept
{
  return lhs.getOrdinal() == rhs.getOrdinal();
}

bool operator!=(Tile const &lhs, Tile const &rhs) noexcept
{
  return !(lhs == rhs);
}

bool operator<(Tile const &lhs, Tile const &rhs) noexcept
{
  return lhs.getOrdinal() < rhs.getOrdinal();
}

bool operator>(Tile const &lhs, Tile const &rhs) noexcept
{
  return rhs < lhs;
}

bool operator<=(Tile const &lhs, Tile const &rhs) noexcept
{
  return !(rhs < lhs);
}

bool operator>=(Tile const &lhs, Tile const &rhs) noexcept
{
  return !(lhs < rhs);
}

TileCounts countFunctionalTiles(std::vector<Tile> const &tiles)
{
  TileCounts counts;
  for (Tile const &tile : tiles) {
    if (tile.isBonus()) {
      continue;
    }
    ++counts[tile.getOrdinal()];
  }
  return counts;
}

std::uint_fast8_t getNumTiles(TileCounts const &counts) noexcept
{
  std::uint_fast8_t result = 0u;
  for (auto const &[ordinal, count] : counts) {
    result += count;
  }
  return result;
}

std::vector<Tile> parseTiles(std::string_view const text)
{
  std::vector<Tile> tiles;
  std::vector<std::uint_fast8_t> ranks;
  for (char const c : text) {
    if (isSpace(c)) {
      if (!ranks.empty()) {
        HUPAI_THROW<InvalidTile>(_1) << text << ": A rank without a suit letter.";
      }
      continue;
    }
    if ('0' <= c && c <= '9') {
      ranks.push_back(c - '0');
      continue;
    }
    Suit const suit = decodeSuitLetter(c);
    if (ranks.empty()) {
      HUPAI_THROW<InvalidTile>(_1) << text << ": A suit letter without a rank.";
    }
    for (std::uint_fast8_t const rank : ranks) {
      tiles.emplace_back(suit, rank);
    }
    ranks.clear();
  }
  if (!ranks.empty()) {
    HUPAI_THROW<InvalidTile>(_1) << text << ": A rank without a suit letter.";
  }
  return tiles;
}

Tile parseTile(std::string_view const text)
{
  std::vector<Tile> const tiles = parseTiles(text);
  if (tiles.size() != 1u) {
    HUPAI_THROW<InvalidTile>(_1) << text << ": Exactly one tile is expected.";
  }
  return tiles.front();
}

std::string toString(Tile const &tile)
{
  std::string result;
  result.push_back('0' + tile.getRank());
  result.push_back(encodeSuitLetter(tile.getSuit()));
  return result;
}

std::string toString(std::vector<Tile> const &tiles)
{
  std::string result;
  for (std::size_t i = 0u; i < tiles.size(); ++i) {
    result.push_back('0' + tiles[i].getRank());
    if (i + 1u == tiles.size() || tiles[i + 1u].getSuit() != tiles[i].getSuit()) {
      result.push_back(encodeSuitLetter(tiles[i].getSuit()));
    }
  }
  return result;
}

std::ostream &operator<<(std::ostream &os, Tile const &tile)
{
  return os << Hupai::toString(tile);
}

} // namespace Hupai
