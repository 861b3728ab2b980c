#include "common/type_name.hpp"

#include <string>
#include <memory>
#include <typeinfo>
#include <cstdlib>
#include <cxxabi.h>


namespace Hupai{

std::string getTypeName(std::type_info const &ti)
{
  char const * const mangled = ti.name();
  int status = -1;
  std::unique_ptr<char, void (*)(void *)> demangled(
    abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  if (status != 0 || demangled == nullptr) {
    return mangled;
  }
  return demangled.get();
}

} // namespace Hupai
