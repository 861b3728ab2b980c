#if !defined(HUPAI_COMMON_THROW_HPP_INCLUDE_GUARD)
#define HUPAI_COMMON_THROW_HPP_INCLUDE_GUARD

#include <boost/exception/enable_error_info.hpp>
#include <boost/exception/info.hpp>
#include <boost/exception/exception.hpp>
#include <boost/stacktrace/frame.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <boost/current_function.hpp>
#include <sstream>
#include <ostream>
#include <ios>
#include <string>
#include <type_traits>
#include <functional>
#include <tuple>
#include <utility>
#include <exception>


namespace Hupai{

namespace Detail_{

struct StackTraceErrorInfoTag_;

} // namespace Detail_

using StackTraceErrorInfo = boost::error_info<
  Detail_::StackTraceErrorInfoTag_, boost::stacktrace::stacktrace>;

namespace Detail_{

enum struct ThrowType
{
  throw_,
  throw_with_nested,
}; // enum struct ThrowType

struct ThrowSite
{
  char const *function_name;
  char const *file_name;
  int line_number;
  boost::stacktrace::stacktrace stacktrace;
}; // struct ThrowSite

template<ThrowType throw_type, typename Exception>
[[noreturn]] void throwWithSite(ThrowSite &&site, Exception &&e)
{
  auto decorated = boost::enable_error_info(std::forward<Exception>(e))
    << boost::throw_function(site.function_name)
    << boost::throw_file(site.file_name)
    << boost::throw_line(site.line_number)
    << StackTraceErrorInfo(std::move(site.stacktrace));
  if constexpr (throw_type == ThrowType::throw_) {
    throw decorated;
  }
  else {
    std::throw_with_nested(std::move(decorated));
  }
}

template<typename T>
using RemoveCVRef = std::remove_cv_t<std::remove_reference_t<T>>;

template<typename T>
inline constexpr bool is_placeholder_v = (std::is_placeholder<RemoveCVRef<T>>::value == 1);

template<typename Exception, ThrowType throw_type, typename HasPlaceholder, typename... Args>
class ExceptionThrower;

// Without a placeholder the exception is built from the arguments as they are.
template<typename Exception, ThrowType throw_type, typename... Args>
class ExceptionThrower<Exception, throw_type, std::false_type, Args...>
{
private:
  static_assert(!std::is_reference_v<Exception>);
  static_assert(!std::is_const_v<Exception>);
  static_assert(!std::is_volatile_v<Exception>);
  static_assert((... && std::is_reference_v<Args>));

public:
  ExceptionThrower(ThrowSite &&site, std::tuple<Args...> args) noexcept
    : site_(std::move(site)),
      args_(std::move(args))
  {}

  ExceptionThrower(ExceptionThrower const &) = delete;

  ExceptionThrower &operator=(ExceptionThrower const &) = delete;

  [[noreturn]] ~ExceptionThrower() noexcept(false)
  {
    Hupai::Detail_::throwWithSite<throw_type>(
      std::move(site_),
      std::apply([](Args... args) { return Exception(std::forward<Args>(args)...); },
                 std::move(args_)));
  }

private:
  ThrowSite site_;
  std::tuple<Args...> args_;
}; // class ExceptionThrower

// With a placeholder the message streamed into the thrower replaces `_1`.
template<typename Exception, ThrowType throw_type, typename... Args>
class ExceptionThrower<Exception, throw_type, std::true_type, Args...>
{
private:
  static_assert(!std::is_reference_v<Exception>);
  static_assert(!std::is_const_v<Exception>);
  static_assert(!std::is_volatile_v<Exception>);
  static_assert((... && std::is_reference_v<Args>));

  template<typename T>
  static decltype(auto) substitute_(T &&arg, std::string const &what) noexcept
  {
    if constexpr (is_placeholder_v<T>) {
      return (what);
    }
    else {
      return std::forward<T>(arg);
    }
  }

public:
  ExceptionThrower(ThrowSite &&site, std::tuple<Args...> args) noexcept
    : site_(std::move(site)),
      args_(std::move(args)),
      oss_()
  {}

  ExceptionThrower(ExceptionThrower const &) = delete;

  ExceptionThrower &operator=(ExceptionThrower const &) = delete;

  template<typename T>
  ExceptionThrower &operator<<(T &&value)
  {
    oss_ << std::forward<T>(value);
    return *this;
  }

  ExceptionThrower &operator<<(std::ostream &(*pf)(std::ostream &))
  {
    oss_ << pf;
    return *this;
  }

  ExceptionThrower &operator<<(std::ios &(*pf)(std::ios &))
  {
    oss_ << pf;
    return *this;
  }

  ExceptionThrower &operator<<(std::ios_base &(*pf)(std::ios_base &))
  {
    oss_ << pf;
    return *this;
  }

  [[noreturn]] ~ExceptionThrower() noexcept(false)
  {
    std::string const what = oss_.str();
    Hupai::Detail_::throwWithSite<throw_type>(
      std::move(site_),
      std::apply(
        [&what](Args... args) { return Exception(substitute_(std::forward<Args>(args), what)...); },
        std::move(args_)));
  }

private:
  ThrowSite site_;
  std::tuple<Args...> args_;
  std::ostringstream oss_;
}; // class ExceptionThrower

class ExceptionInfoHolder
{
public:
  ExceptionInfoHolder(char const *function_name, char const *file_name, int line_number,
                      boost::stacktrace::stacktrace &&stacktrace) noexcept
    : site_{function_name, file_name, line_number, std::move(stacktrace)}
  {}

  ExceptionInfoHolder(ExceptionInfoHolder const &) = delete;

  ExceptionInfoHolder &operator=(ExceptionInfoHolder const &) = delete;

  template<typename... Args>
  using HasPlaceholder = std::bool_constant<(... || is_placeholder_v<Args>)>;

  template<typename Exception, ThrowType throw_type, typename... Args>
  using Thrower = ExceptionThrower<Exception, throw_type, HasPlaceholder<Args...>, Args &&...>;

  template<typename Exception, typename... Args>
  Thrower<Exception, ThrowType::throw_, Args...> setExceptionToThrow(Args &&... args) noexcept
  {
    static_assert((... && (std::is_placeholder<RemoveCVRef<Args>>::value <= 1)));
    return { std::move(site_), std::forward_as_tuple(std::forward<Args>(args)...) };
  }

  template<typename Exception, typename... Args>
  Thrower<Exception, ThrowType::throw_with_nested, Args...>
  setExceptionToThrowWithNested(Args &&... args) noexcept
  {
    static_assert((... && (std::is_placeholder<RemoveCVRef<Args>>::value <= 1)));
    return { std::move(site_), std::forward_as_tuple(std::forward<Args>(args)...) };
  }

private:
  ThrowSite site_;
}; // class ExceptionInfoHolder

} // namespace Detail_

} // namespace Hupai

#define HUPAI_THROW                      \
  ::Hupai::Detail_::ExceptionInfoHolder( \
    BOOST_CURRENT_FUNCTION,              \
    __FILE__,                            \
    __LINE__,                            \
    ::boost::stacktrace::stacktrace())   \
    .template setExceptionToThrow        \
  /**/

#define HUPAI_THROW_WITH_NESTED                \
  ::Hupai::Detail_::ExceptionInfoHolder(       \
    BOOST_CURRENT_FUNCTION,                    \
    __FILE__,                                  \
    __LINE__,                                  \
    ::boost::stacktrace::stacktrace())         \
    .template setExceptionToThrowWithNested    \
  /**/

namespace Hupai{

// Writes the location, message, nested exceptions and the stack trace of the
// exception currently being handled to `os`.
void printCurrentException(std::ostream &os);

} // namespace Hupai

namespace Hupai::Detail_{

class TerminateHandlerSetter
{
private:
  [[noreturn]] static void terminate_handler_() noexcept;

public:
  TerminateHandlerSetter() noexcept;

  TerminateHandlerSetter(TerminateHandlerSetter const &) = delete;

  TerminateHandlerSetter &operator=(TerminateHandlerSetter const &) = delete;
}; // class TerminateHandlerSetter

// Must stay in the header. A definition in a .cpp file is only initialized
// when something else in that translation unit gets used.
inline TerminateHandlerSetter terminate_handler_setter;

} // namespace Hupai::Detail_

#endif // !defined(HUPAI_COMMON_THROW_HPP_INCLUDE_GUARD)
