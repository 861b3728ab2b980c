#if !defined(HUPAI_CORE_ANALYSIS_RESULT_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_ANALYSIS_RESULT_HPP_INCLUDE_GUARD

#include "core/decomposer.hpp"
#include "core/tile.hpp"
#include <iosfwd>
#include <vector>
#include <optional>
#include <cstdint>


namespace Hupai{

enum struct WinKind : std::uint_fast8_t
{
  none,
  thirteen_orphans,
  seven_pairs,
  traditional,
  pure_suit_fallback,
}; // enum struct WinKind

char const *getWinKindName(WinKind kind);

struct WinFlags
{
  bool traditional = false;
  bool seven_pairs = false;
  bool thirteen_orphans = false;
  bool pure_suit = false;
  bool half_suit = false;
  bool fully_concealed = false;
  bool fully_exposed = false;
}; // struct WinFlags

class AnalysisResult
{
public:
  // Not a win.
  AnalysisResult() = default;

  AnalysisResult(
    WinFlags const &flags, Decomposition decomposition, std::uint_fast8_t num_bonus_tiles);

  AnalysisResult(AnalysisResult const &rhs) = default;

  AnalysisResult(AnalysisResult &&rhs) = default;

  AnalysisResult &operator=(AnalysisResult const &rhs) = default;

  AnalysisResult &operator=(AnalysisResult &&rhs) = default;

public:
  bool isWinning() const noexcept;

  bool isTraditional() const noexcept;

  bool isSevenPairs() const noexcept;

  bool isThirteenOrphans() const noexcept;

  bool isPureSuit() const noexcept;

  bool isHalfSuit() const noexcept;

  bool isFullyConcealed() const noexcept;

  bool isFullyExposed() const noexcept;

  // The flags above may overlap. This is the one that decides the score.
  WinKind getWinKind() const noexcept;

  std::uint_fast8_t getNumBonusTiles() const noexcept;

  std::optional<Ordinal> const &getPair() const noexcept;

  std::vector<Ordinal> const &getTriplets() const noexcept;

  std::vector<Ordinal> const &getSequences() const noexcept;

  std::uint_fast8_t getNumTriplets() const noexcept;

  std::uint_fast8_t getNumSequences() const noexcept;

private:
  WinFlags flags_{};
  Decomposition decomposition_{};
  std::uint_fast8_t num_bonus_tiles_ = 0u;
}; // class AnalysisResult

// Multi-line report of the composition.
std::ostream &operator<<(std::ostream &os, AnalysisResult const &result);

} // namespace Hupai

#endif // !defined(HUPAI_CORE_ANALYSIS_RESULT_HPP_INCLUDE_GUARD)
