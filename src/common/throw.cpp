#include "common/throw.hpp"

#include "common/type_name.hpp"
#include <boost/exception/get_error_info.hpp>
#include <boost/exception/exception.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <iostream>
#include <ostream>
#include <vector>
#include <exception>
#include <cstdlib>


namespace{

void printErrorLocation(std::ostream &os, boost::exception const &e)
{
  if (char const * const * const p = boost::get_error_info<boost::throw_file>(e)) {
    os << *p << ':';
  }
  if (int const * const p = boost::get_error_info<boost::throw_line>(e)) {
    os << *p << ": ";
  }
  if (char const * const * const p = boost::get_error_info<boost::throw_function>(e)) {
    os << *p << ": ";
  }
  if (std::exception const * const p = dynamic_cast<std::exception const *>(&e)) {
    os << p->what() << '\n';
  }
}

// Unwinds `std::nested_exception` chains, outermost first.
std::vector<std::exception_ptr> collectNestedExceptions(std::exception_ptr p)
{
  std::vector<std::exception_ptr> result;
  while (p != nullptr) {
    result.push_back(p);
    try {
      std::rethrow_exception(p);
    }
    catch (std::exception const &e) {
      try {
        std::rethrow_if_nested(e);
        p = nullptr;
      }
      catch (...) {
        p = std::current_exception();
      }
    }
    catch (...) {
      p = nullptr;
    }
  }
  return result;
}

} // namespace *unnamed*

namespace Hupai{

void printCurrentException(std::ostream &os)
{
  using Stacktrace = boost::stacktrace::stacktrace;

  std::vector<std::exception_ptr> const exceptions
    = collectNestedExceptions(std::current_exception());
  if (exceptions.empty()) {
    os << "No exception is being handled.\n";
    return;
  }

  bool innermost = true;
  for (auto iter = exceptions.crbegin(); iter != exceptions.crend(); ++iter) {
    try {
      std::rethrow_exception(*iter);
    }
    catch (boost::exception const &e) {
      os << (innermost ? "An exception of type `" : "A nesting exception of type `")
         << Hupai::getTypeName(e) << "'.\n";
      printErrorLocation(os, e);
      if (innermost) {
        if (Stacktrace const * const p = boost::get_error_info<Hupai::StackTraceErrorInfo>(e)) {
          if (p->size() != 0) {
            os << "Backtrace:\n" << *p;
          }
        }
      }
    }
    catch (std::exception const &e) {
      os << (innermost ? "An exception of type `" : "A nesting exception of type `")
         << Hupai::getTypeName(e) << "'.\n" << e.what() << '\n';
    }
    catch (...) {
      os << (innermost ? "An exception" : "A nesting exception") << " of an unknown type.\n";
    }
    innermost = false;
  }
  os << std::flush;
}

} // namespace Hupai

namespace Hupai::Detail_{

[[noreturn]] void TerminateHandlerSetter::terminate_handler_() noexcept
try {
  if (std::current_exception() == nullptr) {
    std::cerr << "`std::terminate' is called without throwing any exception.\n";
    boost::stacktrace::stacktrace stacktrace;
    if (!stacktrace.empty()) {
      std::cerr << "Backtrace:\n" << stacktrace;
    }
    std::cerr << std::flush;
    std::abort();
  }

  std::cerr << "`std::terminate' is called.\n";
  Hupai::printCurrentException(std::cerr);
  std::abort();
}
catch (...) {
  std::abort();
}

TerminateHandlerSetter::TerminateHandlerSetter() noexcept
{
  std::set_terminate(&terminate_handler_);
}

} // namespace Hupai::Detail_
