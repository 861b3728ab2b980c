#include "core/errors.hpp"

#include <stdexcept>
#include <string>


namespace Hupai{

InvalidTile::InvalidTile(std::string const &error_message)
  : std::invalid_argument(error_message)
{}

MalformedHand::MalformedHand(std::string const &error_message)
  : std::runtime_error(error_message)
{}

} // namespace Hupai
