#if !defined(HUPAI_CORE_HAND_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_HAND_HPP_INCLUDE_GUARD

#include "core/tile.hpp"
#include <iosfwd>
#include <vector>
#include <optional>
#include <cstdint>


namespace Hupai{

enum struct MeldType : std::uint_fast8_t
{
  sequence,
  triplet,
  quad,
}; // enum struct MeldType

// A group completed with a tile claimed from another player's discard.
class Meld
{
public:
  Meld(MeldType type, std::vector<Tile> tiles, Tile const &claimed);

  Meld(Meld const &rhs) = default;

  Meld(Meld &&rhs) = default;

  Meld &operator=(Meld const &rhs) = default;

  Meld &operator=(Meld &&rhs) = default;

public:
  MeldType getType() const noexcept;

  // Sorted.
  std::vector<Tile> const &getTiles() const noexcept;

  Tile const &getClaimed() const noexcept;

  // The lowest ordinal of the meld.
  Ordinal getRoot() const noexcept;

private:
  MeldType type_;
  std::vector<Tile> tiles_;
  Tile claimed_;
}; // class Meld

class Hand;

void swap(Hand &lhs, Hand &rhs) noexcept;

class Hand
{
public:
  Hand() = default;

  // Bonus tiles among `concealed` are set aside.
  explicit Hand(std::vector<Tile> const &concealed);

  Hand(Hand const &rhs) = default;

  Hand(Hand &&rhs) = default;

  void swap(Hand &rhs) noexcept;

  Hand &operator=(Hand const &rhs);

  Hand &operator=(Hand &&rhs) noexcept;

public:
  std::vector<Tile> const &getConcealed() const noexcept;

  std::optional<Tile> const &getDrawn() const noexcept;

  // One tile per self-declared quad.
  std::vector<Tile> const &getSelfQuads() const noexcept;

  std::vector<Meld> const &getMelds() const noexcept;

  std::vector<Tile> const &getBonusTiles() const noexcept;

  // Concealed, drawn, self-declared quads and melds. Bonus tiles excluded.
  std::vector<Tile> getFunctionalTiles() const;

  std::uint_fast8_t getNumSelfQuads() const noexcept;

  std::uint_fast8_t getNumClaimedQuads() const noexcept;

  std::uint_fast8_t getNumExposedGroups() const noexcept;

  std::uint_fast8_t countConcealed(Ordinal ordinal) const noexcept;

public:
  void addConcealed(Tile const &tile);

  void setDrawn(Tile const &tile);

  void mergeDrawn();

  Tile discard(Tile const &tile);

  // Records a quad that is already set aside. Use `declareSelfQuad` to
  // take the four tiles out of the concealed ones.
  void addSelfQuad(Tile const &tile);

  void declareSelfQuad(Tile const &tile);

  // Records a meld that is already set aside. Use `claim` to take the
  // non-claimed members out of the concealed ones.
  void addMeld(Meld meld);

  void claim(Meld meld);

  void addBonusTile(Tile const &tile);

private:
  void removeConcealed_(Tile const &tile, std::uint_fast8_t count);

private:
  std::vector<Tile> concealed_;
  std::optional<Tile> drawn_;
  std::vector<Tile> self_quads_;
  std::vector<Meld> melds_;
  std::vector<Tile> bonus_tiles_;
}; // class Hand

std::ostream &operator<<(std::ostream &os, Hand const &hand);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_HAND_HPP_INCLUDE_GUARD)
