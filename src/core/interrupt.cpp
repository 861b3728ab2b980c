#include "core/interrupt.hpp"

#include "core/win_analyzer.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include "common/throw.hpp"
#include <ostream>
#include <algorithm>
#include <vector>
#include <array>
#include <optional>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstdint>


namespace{

using std::placeholders::_1;

std::uint_fast8_t getPriority(Hupai::ReactionType const type)
{
  switch (type) {
  case Hupai::ReactionType::ron:
    return 3u;
  case Hupai::ReactionType::kong:
  case Hupai::ReactionType::pon:
    return 2u;
  case Hupai::ReactionType::chi:
    return 1u;
  case Hupai::ReactionType::pass:
    return 0u;
  }
  HUPAI_THROW<std::logic_error>("A logic error.");
}

} // namespace `anonymous`

namespace Hupai{

char const *getReactionTypeName(ReactionType const type)
{
  switch (type) {
  case ReactionType::pass:
    return "Pass";
  case ReactionType::chi:
    return "Chi";
  case ReactionType::pon:
    return "Pon";
  case ReactionType::kong:
    return "Kong";
  case ReactionType::ron:
    return "Ron";
  }
  HUPAI_THROW<std::logic_error>("A logic error.");
}

ChiOption::ChiOption(Ordinal const discarded, Ordinal const first, Ordinal const second)
  : discarded_(discarded),
    first_(std::min(first, second)),
    second_(std::max(first, second))
{
  std::array<Ordinal, 3u> const sequence = getSequence();
  if (!Tile(sequence[0u]).isSuited() || sequence[0u] / 100u != sequence[2u] / 100u
      || sequence[1u] != sequence[0u] + 1u || sequence[2u] != sequence[1u] + 1u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << discarded << ", " << first << ", " << second << ": Not a sequence.";
  }
}

Ordinal ChiOption::getDiscarded() const noexcept
{
  return discarded_;
}

std::array<Ordinal, 2u> ChiOption::getHandTiles() const noexcept
{
  return { first_, second_ };
}

std::array<Ordinal, 3u> ChiOption::getSequence() const noexcept
{
  std::array<Ordinal, 3u> result = { discarded_, first_, second_ };
  std::sort(result.begin(), result.end());
  return result;
}

bool operator==(ChiOption const &lhs, ChiOption const &rhs) noexcept
{
  return lhs.getDiscarded() == rhs.getDiscarded() && lhs.getHandTiles() == rhs.getHandTiles();
}

bool operator!=(ChiOption const &lhs, ChiOption const &rhs) noexcept
{
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &os, ChiOption const &option)
{
  std::array<Ordinal, 3u> const sequence = option.getSequence();
  return os << toString({ Tile(sequence[0u]), Tile(sequence[1u]), Tile(sequence[2u]) })
            << " (" << Tile(option.getDiscarded()) << " claimed)";
}

std::ostream &operator<<(std::ostream &os, ReactionCandidate const &candidate)
{
  os << "seat " << static_cast<unsigned>(candidate.seat) << ": "
     << getReactionTypeName(candidate.type);
  if (candidate.chi_option) {
    os << ' ' << *candidate.chi_option;
  }
  return os;
}

std::vector<ChiOption> enumerateChiOptions(Hand const &hand, Tile const &discarded)
{
  std::vector<ChiOption> result;
  if (!discarded.isSuited()) {
    return result;
  }

  Ordinal const d = discarded.getOrdinal();
  std::uint_fast8_t const rank = discarded.getRank();
  auto held = [&hand](Ordinal const ordinal) { return hand.countConcealed(ordinal) >= 1u; };

  if (rank >= 3u && held(d - 2u) && held(d - 1u)) {
    result.emplace_back(d, d - 2u, d - 1u);
  }
  if (rank >= 2u && rank <= 8u && held(d - 1u) && held(d + 1u)) {
    result.emplace_back(d, d - 1u, d + 1u);
  }
  if (rank <= 7u && held(d + 1u) && held(d + 2u)) {
    result.emplace_back(d, d + 1u, d + 2u);
  }
  return result;
}

ReactionOptions getReactionOptions(Hand const &hand, Tile const &discarded, bool const is_next_seat)
{
  ReactionOptions result;
  if (discarded.isBonus()) {
    return result;
  }

  if (is_next_seat) {
    result.chi_options = enumerateChiOptions(hand, discarded);
  }
  std::uint_fast8_t const num_copies = hand.countConcealed(discarded.getOrdinal());
  result.pon = num_copies >= 2u;
  result.kong = num_copies >= 3u;

  // 栄和 (Ron)
  Hand completed(hand);
  completed.mergeDrawn();
  completed.setDrawn(discarded);
  result.ron = analyze(completed).isWinning();

  return result;
}

ReactionCandidate resolveInterrupt(std::vector<ReactionCandidate> const &candidates)
{
  if (candidates.empty()) {
    HUPAI_THROW<std::invalid_argument>("No reaction candidate.");
  }
  for (ReactionCandidate const &candidate : candidates) {
    if (candidate.type == ReactionType::chi && !candidate.chi_option) {
      HUPAI_THROW<std::invalid_argument>(_1)
        << static_cast<unsigned>(candidate.seat) << ": Chi without a chosen option.";
    }
  }

  // `max_element` returns the first of equal elements.
  return *std::max_element(
    candidates.cbegin(), candidates.cend(),
    [](ReactionCandidate const &lhs, ReactionCandidate const &rhs) {
      return getPriority(lhs.type) < getPriority(rhs.type);
    });
}

} // namespace Hupai
