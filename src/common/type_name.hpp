#if !defined(HUPAI_COMMON_TYPE_NAME_HPP_INCLUDE_GUARD)
#define HUPAI_COMMON_TYPE_NAME_HPP_INCLUDE_GUARD

#include <string>
#include <typeinfo>


namespace Hupai{

// Demangled name of the dynamic type.
std::string getTypeName(std::type_info const &ti);

template<typename T>
std::string getTypeName(T const &x)
{
  return Hupai::getTypeName(typeid(x));
}

} // namespace Hupai

#endif // !defined(HUPAI_COMMON_TYPE_NAME_HPP_INCLUDE_GUARD)
