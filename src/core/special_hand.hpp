#if !defined(HUPAI_CORE_SPECIAL_HAND_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_SPECIAL_HAND_HPP_INCLUDE_GUARD

#include "core/tile.hpp"
#include <array>


namespace Hupai{

inline constexpr std::array<Ordinal, 13u> thirteen_orphans_ordinals = {
  101u, 109u, 201u, 209u, 301u, 309u, 401u, 402u, 403u, 404u, 501u, 502u, 503u
};

// Seven distinct pairs. Four copies of a tile do not count as two pairs.
// `counts` must not contain bonus tiles.
bool isSevenPairs(TileCounts const &counts);

// Each terminal and honor once plus one of them twice.
// `counts` must not contain bonus tiles.
bool isThirteenOrphans(TileCounts const &counts);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_SPECIAL_HAND_HPP_INCLUDE_GUARD)
