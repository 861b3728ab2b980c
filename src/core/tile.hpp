#if !defined(HUPAI_CORE_TILE_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_TILE_HPP_INCLUDE_GUARD

#include <iosfwd>
#include <vector>
#include <map>
#include <string>
#include <string_view>
#include <cstdint>


namespace Hupai{

enum struct Suit : std::uint_fast8_t
{
  characters = 1u,
  circles = 2u,
  bamboos = 3u,
  wind = 4u,
  dragon = 5u,
  blue_bonus = 6u,
  red_bonus = 7u,
}; // enum struct Suit

// suit * 100 + rank
using Ordinal = std::uint_fast16_t;

// Ordinal -> number of copies, smallest ordinal first.
using TileCounts = std::map<Ordinal, std::uint_fast8_t>;

inline constexpr Ordinal east_wind = 401u;
inline constexpr Ordinal south_wind = 402u;
inline constexpr Ordinal west_wind = 403u;
inline constexpr Ordinal north_wind = 404u;

bool isValidOrdinal(Ordinal ordinal) noexcept;

// The 34 distinct non-bonus ordinals in ascending order.
std::vector<Ordinal> const &getFunctionalOrdinals();

class Tile
{
public:
  Tile(Suit suit, std::uint_fast8_t rank);

  explicit Tile(Ordinal ordinal);

  Tile(Tile const &rhs) = default;

  Tile &operator=(Tile const &rhs) = default;

public:
  Suit getSuit() const noexcept;

  std::uint_fast8_t getRank() const noexcept;

  Ordinal getOrdinal() const noexcept;

  // Characters, Circles or Bamboos.
  bool isSuited() const noexcept;

  // Wind or Dragon.
  bool isHonor() const noexcept;

  // Blue or red bonus tile. Never part of a set.
  bool isBonus() const noexcept;

private:
  Ordinal ordinal_;
}; // class Tile

bool operator==(Tile const &lhs, Tile const &rhs) noexcept;

bool operator!=(Tile const &lhs, Tile const &rhs) noexcept;

bool operator<(Tile const &lhs, Tile const &rhs) noexcept;

bool operator>(Tile const &lhs, Tile const &rhs) noexcept;

bool operator<=(Tile const &lhs, Tile const &rhs) noexcept;

bool operator>=(Tile const &lhs, Tile const &rhs) noexcept;

// Counts the non-bonus tiles.
TileCounts countFunctionalTiles(std::vector<Tile> const &tiles);

std::uint_fast8_t getNumTiles(TileCounts const &counts) noexcept;

// "123m456p789s11w5d2b": rank digits followed by a suit letter (m, p, s, w,
// d, b, r).
std::vector<Tile> parseTiles(std::string_view text);

Tile parseTile(std::string_view text);

std::string toString(Tile const &tile);

std::string toString(std::vector<Tile> const &tiles);

std::ostream &operator<<(std::ostream &os, Tile const &tile);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_TILE_HPP_INCLUDE_GUARD)
