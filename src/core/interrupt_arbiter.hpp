#if !defined(HUPAI_CORE_INTERRUPT_ARBITER_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_INTERRUPT_ARBITER_HPP_INCLUDE_GUARD

#include "core/interrupt.hpp"
#include "core/tile.hpp"
#include <vector>
#include <array>
#include <optional>
#include <mutex>
#include <cstddef>
#include <cstdint>


namespace Hupai{

// Collects at most one reaction per seat to a discard and emits exactly one
// winner per discard. Submissions from several threads are serialized.
class InterruptArbiter
{
public:
  enum struct State : std::uint_fast8_t
  {
    idle,
    awaiting_reactions,
    awaiting_chi_choice,
    resolved,
  }; // enum struct State

public:
  InterruptArbiter() = default;

  InterruptArbiter(InterruptArbiter const &) = delete;

  InterruptArbiter &operator=(InterruptArbiter const &) = delete;

public:
  State getState() const;

  std::optional<Tile> getDiscarded() const;

  // Chi options waiting for `selectChiOption`.
  std::vector<ChiOption> getPendingChiOptions() const;

  std::optional<ReactionCandidate> getResult() const;

public:
  // Opens a new collection window. The previous result, if any, is dropped.
  void onDiscard(std::uint_fast8_t seat, Tile const &tile);

  // Returns `true` when the submission closed the window.
  bool submit(ReactionCandidate const &candidate);

  // A single option is submitted right away. Several options wait for
  // `selectChiOption`.
  bool submitChi(std::uint_fast8_t seat, std::vector<ChiOption> const &options);

  bool selectChiOption(std::uint_fast8_t seat, std::size_t index);

  // Timeout. Seats that have not answered, and a Chi still waiting for its
  // option, count as Pass.
  ReactionCandidate closeWindow();

private:
  void checkSubmission_(std::uint_fast8_t seat) const;

  void register_(ReactionCandidate const &candidate);

  bool tryResolve_();

  void resolve_();

private:
  mutable std::mutex mtx_;
  State state_ = State::idle;
  std::uint_fast8_t discarding_seat_ = 0u;
  std::optional<Tile> discarded_;
  std::array<bool, 4u> answered_{};
  std::vector<ReactionCandidate> candidates_;
  std::vector<ChiOption> pending_chi_options_;
  std::optional<ReactionCandidate> result_;
}; // class InterruptArbiter

} // namespace Hupai

#endif // !defined(HUPAI_CORE_INTERRUPT_ARBITER_HPP_INCLUDE_GUARD)
