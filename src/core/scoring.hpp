#if !defined(HUPAI_CORE_SCORING_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_SCORING_HPP_INCLUDE_GUARD

#include "core/analysis_result.hpp"
#include "core/tile.hpp"
#include <iosfwd>
#include <vector>
#include <string>
#include <cstdint>


namespace Hupai{

struct RuleConfig
{
  // 場風
  Ordinal round_wind = east_wind;
}; // struct RuleConfig

struct Score
{
  std::int_fast32_t points = 0;
  // One line per nonzero contribution.
  std::vector<std::string> breakdown;
}; // struct Score

class Scorer
{
public:
  explicit Scorer(RuleConfig const &config);

  Scorer(Scorer const &rhs) = default;

  Scorer &operator=(Scorer const &rhs) = default;

public:
  RuleConfig const &getConfig() const noexcept;

  // `seat` is in [0, 4). The seat wind of seat `s` is East + `s`.
  Score score(
    AnalysisResult const &analysis, std::uint_fast8_t seat, bool self_drawn,
    std::uint_fast8_t num_self_quads, std::uint_fast8_t num_claimed_quads,
    std::vector<Tile> const &bonus_tiles) const;

private:
  RuleConfig config_;
}; // class Scorer

std::ostream &operator<<(std::ostream &os, Score const &score);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_SCORING_HPP_INCLUDE_GUARD)
