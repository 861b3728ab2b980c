#if !defined(HUPAI_COMMON_ASSERT_HPP_INCLUDE_GUARD)
#define HUPAI_COMMON_ASSERT_HPP_INCLUDE_GUARD

#include <stdexcept>
#include <string>
#include <string_view>


namespace Hupai{

class AssertionFailure
  : public std::logic_error
{
public:
  explicit AssertionFailure(std::string const &error_message);

  explicit AssertionFailure(std::string_view error_message);

  AssertionFailure(AssertionFailure const &rhs) noexcept = default;

  AssertionFailure &operator=(AssertionFailure const &) noexcept = default;
}; // class AssertionFailure

} // namespace Hupai

#if defined(HUPAI_ENABLE_ASSERT)

#include <boost/stacktrace/stacktrace.hpp>
#include <boost/current_function.hpp>
#include <boost/config.hpp>
#include <sstream>
#include <ostream>
#include <ios>
#include <utility>


namespace Hupai::Detail_{

class AssertMessenger
{
public:
  AssertMessenger(char const *file_name, int line_number, char const *function_name,
                  char const *expression, boost::stacktrace::stacktrace &&stacktrace);

  AssertMessenger(AssertMessenger const &) = delete;

  AssertMessenger &operator=(AssertMessenger const &) = delete;

  template<typename T>
  AssertMessenger &operator<<(T &&x)
  {
    oss_ << std::forward<T>(x);
    return *this;
  }

  AssertMessenger &operator<<(std::ostream &(*pf)(std::ostream &));

  operator int() const noexcept;

  [[noreturn]] ~AssertMessenger() noexcept(false);

private:
  std::ostringstream oss_;
  char const *file_name_;
  int line_number_;
  char const *function_name_;
  boost::stacktrace::stacktrace stacktrace_;
}; // class AssertMessenger

} // namespace Hupai::Detail_

#define HUPAI_ASSERT(EXPR)                                             \
  BOOST_LIKELY(!!(EXPR)) ? 0 :                                         \
  ::Hupai::Detail_::AssertMessenger(__FILE__,                          \
                                    __LINE__,                          \
                                    BOOST_CURRENT_FUNCTION,            \
                                    #EXPR,                             \
                                    ::boost::stacktrace::stacktrace()) \
  /**/

#else // defined(HUPAI_ENABLE_ASSERT)

#include <ostream>


namespace Hupai::Detail_{

class DummyAssertMessenger
{
public:
  constexpr DummyAssertMessenger() = default;

  DummyAssertMessenger(DummyAssertMessenger const &) = delete;

  DummyAssertMessenger &operator=(DummyAssertMessenger const &) = delete;

  template<typename T>
  DummyAssertMessenger const &operator<<(T &&) const noexcept
  {
    return *this;
  }

  DummyAssertMessenger const &operator<<(std::ostream &(*)(std::ostream &)) const noexcept
  {
    return *this;
  }

  constexpr operator int() const noexcept
  {
    return 0;
  }
}; // class DummyAssertMessenger

} // namespace Hupai::Detail_

#define HUPAI_ASSERT(EXPR)                            \
  true ? 0 : ::Hupai::Detail_::DummyAssertMessenger{} \
  /**/

#endif // defined(HUPAI_ENABLE_ASSERT)

#endif // !defined(HUPAI_COMMON_ASSERT_HPP_INCLUDE_GUARD)
