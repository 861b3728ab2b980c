#include "core/interrupt_arbiter.hpp"

#include "core/interrupt.hpp"
#include "core/tile.hpp"
#include "common/assert.hpp"
#include "common/throw.hpp"
#include <vector>
#include <optional>
#include <mutex>
#include <functional>
#include <stdexcept>
#include <cstddef>
#include <cstdint>


namespace{

using std::placeholders::_1;

} // namespace `anonymous`

namespace Hupai{

InterruptArbiter::State InterruptArbiter::getState() const
{
  std::scoped_lock lock(mtx_);
  return state_;
}

std::optional<Tile> InterruptArbiter::getDiscarded() const
{
  std::scoped_lock lock(mtx_);
  return discarded_;
}

std::vector<ChiOption> InterruptArbiter::getPendingChiOptions() const
{
  std::scoped_lock lock(mtx_);
  return pending_chi_options_;
}

std::optional<ReactionCandidate> InterruptArbiter::getResult() const
{
  std::scoped_lock lock(mtx_);
  return result_;
}

void InterruptArbiter::onDiscard(std::uint_fast8_t const seat, Tile const &tile)
{
  std::scoped_lock lock(mtx_);

  if (state_ == State::awaiting_reactions || state_ == State::awaiting_chi_choice) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << tile << ": The reactions to " << *discarded_ << " are still being collected.";
  }
  if (seat >= 4u) {
    HUPAI_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  if (tile.isBonus()) {
    HUPAI_THROW<std::invalid_argument>(_1) << tile << ": A bonus tile cannot be discarded.";
  }

  state_ = State::awaiting_reactions;
  discarding_seat_ = seat;
  discarded_ = tile;
  answered_ = { false, false, false, false };
  answered_[seat] = true;
  candidates_.clear();
  pending_chi_options_.clear();
  result_.reset();
}

bool InterruptArbiter::submit(ReactionCandidate const &candidate)
{
  std::scoped_lock lock(mtx_);

  checkSubmission_(candidate.seat);
  if (candidate.type != ReactionType::chi) {
    register_({ candidate.seat, candidate.type, std::nullopt });
    return tryResolve_();
  }

  if (!candidate.chi_option) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(candidate.seat) << ": Chi without a chosen option.";
  }
  if (candidate.chi_option->getDiscarded() != discarded_->getOrdinal()) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << *candidate.chi_option << ": The option does not use the discard " << *discarded_ << '.';
  }
  register_(candidate);
  return tryResolve_();
}

bool InterruptArbiter::submitChi(std::uint_fast8_t const seat, std::vector<ChiOption> const &options)
{
  std::scoped_lock lock(mtx_);

  checkSubmission_(seat);
  if (seat != (discarding_seat_ + 1u) % 4u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(seat) << ": Chi is only allowed for the seat after the discarder.";
  }
  if (options.empty()) {
    HUPAI_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": No Chi option.";
  }
  for (ChiOption const &option : options) {
    if (option.getDiscarded() != discarded_->getOrdinal()) {
      HUPAI_THROW<std::invalid_argument>(_1)
        << option << ": The option does not use the discard " << *discarded_ << '.';
    }
  }

  if (options.size() == 1u) {
    register_({ seat, ReactionType::chi, options.front() });
    return tryResolve_();
  }

  answered_[seat] = true;
  pending_chi_options_ = options;
  state_ = State::awaiting_chi_choice;
  return false;
}

bool InterruptArbiter::selectChiOption(std::uint_fast8_t const seat, std::size_t const index)
{
  std::scoped_lock lock(mtx_);

  if (state_ != State::awaiting_chi_choice) {
    HUPAI_THROW<std::invalid_argument>("No Chi option is waiting for a choice.");
  }
  if (seat != (discarding_seat_ + 1u) % 4u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(seat) << ": Not the seat choosing a Chi option.";
  }
  if (index >= pending_chi_options_.size()) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << index << ": An invalid index into " << pending_chi_options_.size() << " Chi options.";
  }

  candidates_.push_back({ seat, ReactionType::chi, pending_chi_options_[index] });
  pending_chi_options_.clear();
  state_ = State::awaiting_reactions;
  return tryResolve_();
}

ReactionCandidate InterruptArbiter::closeWindow()
{
  std::scoped_lock lock(mtx_);

  if (state_ == State::idle) {
    HUPAI_THROW<std::invalid_argument>("No discard to react to.");
  }
  if (state_ != State::resolved) {
    resolve_();
  }
  return *result_;
}

void InterruptArbiter::checkSubmission_(std::uint_fast8_t const seat) const
{
  if (state_ != State::awaiting_reactions && state_ != State::awaiting_chi_choice) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(seat) << ": No reaction is being collected.";
  }
  if (seat >= 4u) {
    HUPAI_THROW<std::invalid_argument>(_1) << static_cast<unsigned>(seat) << ": An invalid seat.";
  }
  if (seat == discarding_seat_) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(seat) << ": The discarding seat cannot react.";
  }
  if (answered_[seat]) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(seat) << ": The seat has already reacted.";
  }
}

void InterruptArbiter::register_(ReactionCandidate const &candidate)
{
  // チーは上家の打牌に対してのみ (Chi only on the discard of the previous seat).
  if (candidate.type == ReactionType::chi && candidate.seat != (discarding_seat_ + 1u) % 4u) {
    HUPAI_THROW<std::invalid_argument>(_1)
      << static_cast<unsigned>(candidate.seat)
      << ": Chi is only allowed for the seat after the discarder.";
  }
  answered_[candidate.seat] = true;
  candidates_.push_back(candidate);
}

bool InterruptArbiter::tryResolve_()
{
  if (state_ != State::awaiting_reactions) {
    return false;
  }
  for (bool const answered : answered_) {
    if (!answered) {
      return false;
    }
  }
  resolve_();
  return true;
}

void InterruptArbiter::resolve_()
{
  HUPAI_ASSERT((discarded_));

  for (std::uint_fast8_t i = 1u; i < 4u; ++i) {
    std::uint_fast8_t const seat = (discarding_seat_ + i) % 4u;
    if (!answered_[seat]) {
      answered_[seat] = true;
      candidates_.push_back({ seat, ReactionType::pass, std::nullopt });
    }
  }
  if (state_ == State::awaiting_chi_choice) {
    candidates_.push_back({
      static_cast<std::uint_fast8_t>((discarding_seat_ + 1u) % 4u), ReactionType::pass, std::nullopt });
    pending_chi_options_.clear();
  }

  result_ = resolveInterrupt(candidates_);
  candidates_.clear();
  state_ = State::resolved;
}

} // namespace Hupai
