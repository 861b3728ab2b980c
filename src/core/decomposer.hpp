#if !defined(HUPAI_CORE_DECOMPOSER_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_DECOMPOSER_HPP_INCLUDE_GUARD

#include "core/tile.hpp"
#include <vector>
#include <optional>
#include <cstdint>


namespace Hupai{

struct Decomposition
{
  std::optional<Ordinal> pair;
  std::vector<Ordinal> triplets;
  // Lowest ordinal of each sequence.
  std::vector<Ordinal> sequences;
}; // struct Decomposition

// Splits `counts` into exactly `num_sets` triplets and sequences, always
// starting from the smallest remaining ordinal and preferring a triplet to a
// sequence. Returns the first split found. `num_sets` must be in [0, 4].
std::optional<Decomposition> decompose(TileCounts counts, std::uint_fast8_t num_sets);

// Same as `decompose`, with one pair taken out first. Pair candidates are
// tried in ascending order.
std::optional<Decomposition> decomposeWithPair(TileCounts const &counts, std::uint_fast8_t num_sets);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_DECOMPOSER_HPP_INCLUDE_GUARD)
