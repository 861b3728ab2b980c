#include "core/special_hand.hpp"

#include "core/tile.hpp"
#include <algorithm>
#include <cstdint>


namespace Hupai{

bool isSevenPairs(TileCounts const &counts)
{
  if (getNumTiles(counts) != 14u || counts.size() != 7u) {
    return false;
  }
  return std::all_of(
    counts.cbegin(), counts.cend(), [](auto const &entry) { return entry.second == 2u; });
}

bool isThirteenOrphans(TileCounts const &counts)
{
  if (getNumTiles(counts) != 14u) {
    return false;
  }

  std::uint_fast8_t num_singles = 0u;
  std::uint_fast8_t num_pairs = 0u;
  for (Ordinal const ordinal : thirteen_orphans_ordinals) {
    auto const found = counts.find(ordinal);
    if (found == counts.cend()) {
      return false;
    }
    switch (found->second) {
    case 1u:
      ++num_singles;
      break;
    case 2u:
      ++num_pairs;
      break;
    default:
      return false;
    }
  }

  // With 14 tiles over the 13 required ordinals nothing else can be present.
  return num_singles == 12u && num_pairs == 1u;
}

} // namespace Hupai
