#if !defined(HUPAI_CORE_WIN_ANALYZER_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_WIN_ANALYZER_HPP_INCLUDE_GUARD

#include "core/analysis_result.hpp"
#include "core/hand.hpp"
#include "core/tile.hpp"
#include <vector>


namespace Hupai{

// Throws `MalformedHand` when the groups of `hand` cannot add up. A hand with
// the wrong number of concealed tiles is merely not a win.
AnalysisResult analyze(Hand const &hand);

// The tiles that complete `hand` when drawn. `hand` must be one tile short of
// a win and hold no drawn tile, otherwise the result is empty.
std::vector<Ordinal> findWinningTiles(Hand const &hand);

// Ordinals held four times among the concealed and drawn tiles.
std::vector<Ordinal> findSelfQuadCandidates(Hand const &hand);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_WIN_ANALYZER_HPP_INCLUDE_GUARD)
