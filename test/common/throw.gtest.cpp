#include "common/throw.hpp"

#include "common/type_name.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <boost/exception/get_error_info.hpp>
#include <boost/exception/exception.hpp>
#include <sstream>
#include <string>
#include <functional>
#include <exception>
#include <stdexcept>


namespace Hupai::Testing{

namespace{

using std::placeholders::_1;

[[noreturn]] void throwInner()
{
  HUPAI_THROW<MalformedHand>(_1) << "inner " << 42 << '.';
}

[[noreturn]] void throwOuter()
{
  try {
    throwInner();
  }
  catch (MalformedHand const &) {
    HUPAI_THROW_WITH_NESTED<std::runtime_error>("outer.");
  }
}

} // namespace `anonymous`

TEST(Throw, StreamsTheMessage)
{
  try {
    HUPAI_THROW<std::invalid_argument>(_1) << "seat " << 5 << ": An invalid seat.";
    FAIL();
  }
  catch (std::invalid_argument const &e) {
    EXPECT_STREQ(e.what(), "seat 5: An invalid seat.");
  }
}

TEST(Throw, PlainArguments)
{
  try {
    HUPAI_THROW<std::runtime_error>("A plain message.");
    FAIL();
  }
  catch (std::runtime_error const &e) {
    EXPECT_STREQ(e.what(), "A plain message.");
  }
}

TEST(Throw, RecordsTheThrowSite)
{
  try {
    throwInner();
  }
  catch (boost::exception const &e) {
    char const * const * const file = boost::get_error_info<boost::throw_file>(e);
    ASSERT_NE(file, nullptr);
    EXPECT_NE(std::string(*file).find("throw.gtest.cpp"), std::string::npos);
    EXPECT_NE(boost::get_error_info<boost::throw_line>(e), nullptr);
    EXPECT_NE(boost::get_error_info<StackTraceErrorInfo>(e), nullptr);
  }
}

TEST(Throw, Nested)
{
  try {
    throwOuter();
    FAIL();
  }
  catch (std::runtime_error const &e) {
    EXPECT_STREQ(e.what(), "outer.");
    EXPECT_THROW(std::rethrow_if_nested(e), MalformedHand);
  }
}

TEST(Throw, PrintCurrentException)
{
  std::ostringstream oss;
  try {
    throwOuter();
  }
  catch (std::exception const &) {
    printCurrentException(oss);
  }

  std::string const text = oss.str();
  std::string::size_type const inner = text.find("inner 42.");
  std::string::size_type const outer = text.find("outer.");
  ASSERT_NE(inner, std::string::npos);
  ASSERT_NE(outer, std::string::npos);
  EXPECT_LT(inner, outer);
  EXPECT_NE(text.find("A nesting exception of type"), std::string::npos);
}

TEST(Throw, NothingToPrint)
{
  std::ostringstream oss;
  printCurrentException(oss);
  EXPECT_EQ(oss.str(), "No exception is being handled.\n");
}

TEST(TypeName, Demangles)
{
  EXPECT_EQ(getTypeName(typeid(int)), "int");
  EXPECT_EQ(getTypeName(MalformedHand("x")), "Hupai::MalformedHand");
}

} // namespace Hupai::Testing
