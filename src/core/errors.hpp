#if !defined(HUPAI_CORE_ERRORS_HPP_INCLUDE_GUARD)
#define HUPAI_CORE_ERRORS_HPP_INCLUDE_GUARD

#include <stdexcept>
#include <string>


namespace Hupai{

// An out-of-range suit or rank, or an unreadable tile notation.
class InvalidTile
  : public std::invalid_argument
{
public:
  explicit InvalidTile(std::string const &error_message);

  InvalidTile(InvalidTile const &rhs) noexcept = default;

  InvalidTile &operator=(InvalidTile const &) noexcept = default;
}; // class InvalidTile

// The groups of a hand cannot add up (too many groups, a broken meld, a fifth
// copy of a tile, ...).
class MalformedHand
  : public std::runtime_error
{
public:
  explicit MalformedHand(std::string const &error_message);

  MalformedHand(MalformedHand const &rhs) noexcept = default;

  MalformedHand &operator=(MalformedHand const &) noexcept = default;
}; // class MalformedHand

} // namespace Hupai

#endif // !defined(HUPAI_CORE_ERRORS_HPP_INCLUDE_GUARD)
