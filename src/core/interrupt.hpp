#if !defined(HUPAI_CORE_INTERRUPT_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_INTERRUPT_HPP_INCLUDE_GUARD

#include "core/hand.hpp"
#include "core/tile.hpp"
#include <iosfwd>
#include <vector>
#include <array>
#include <optional>
#include <cstdint>


namespace Hupai{

// In ascending order of priority. Pon and Kong share one priority.
enum struct ReactionType : std::uint_fast8_t
{
  pass,
  chi,
  pon,
  kong,
  ron,
}; // enum struct ReactionType

char const *getReactionTypeName(ReactionType type);

// チー: the discard and the two concealed tiles that complete the sequence.
class ChiOption
{
public:
  ChiOption(Ordinal discarded, Ordinal first, Ordinal second);

  ChiOption(ChiOption const &rhs) = default;

  ChiOption &operator=(ChiOption const &rhs) = default;

public:
  Ordinal getDiscarded() const noexcept;

  // The two concealed tiles, lower one first.
  std::array<Ordinal, 2u> getHandTiles() const noexcept;

  std::array<Ordinal, 3u> getSequence() const noexcept;

private:
  Ordinal discarded_;
  Ordinal first_;
  Ordinal second_;
}; // class ChiOption

bool operator==(ChiOption const &lhs, ChiOption const &rhs) noexcept;

bool operator!=(ChiOption const &lhs, ChiOption const &rhs) noexcept;

std::ostream &operator<<(std::ostream &os, ChiOption const &option);

struct ReactionCandidate
{
  std::uint_fast8_t seat;
  ReactionType type;
  // Set only for Chi.
  std::optional<ChiOption> chi_option;
}; // struct ReactionCandidate

std::ostream &operator<<(std::ostream &os, ReactionCandidate const &candidate);

struct ReactionOptions
{
  std::vector<ChiOption> chi_options;
  bool pon = false;
  bool kong = false;
  bool ron = false;
}; // struct ReactionOptions

// Sequences {d-2, d-1}, {d-1, d+1}, {d+1, d+2} found among the concealed tiles
// of `hand`, in that order. Empty unless `discarded` is a numbered tile.
std::vector<ChiOption> enumerateChiOptions(Hand const &hand, Tile const &discarded);

// What the owner of `hand` may declare on `discarded`. Chi is offered only to
// the seat right after the discarder.
ReactionOptions getReactionOptions(Hand const &hand, Tile const &discarded, bool is_next_seat);

// Ron > Kong = Pon > Chi > Pass. Ties go to the candidate registered first.
// When everybody passes the first candidate is returned.
ReactionCandidate resolveInterrupt(std::vector<ReactionCandidate> const &candidates);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_INTERRUPT_HPP_INCLUDE_GUARD)
