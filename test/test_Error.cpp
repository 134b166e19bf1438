#include "initbench/core/Error.hpp"

#include <cerrno>

#include <gtest/gtest.h>

using namespace initbench::core;

namespace {

auto halve(int value) -> Result<int> {
  if (value % 2 != 0) {
    return fail("{} is odd", value);
  }
  return value / 2;
}

} // namespace

TEST(Error, FailFormatsMessage) {
  auto result = halve(3);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "3 is odd");
  EXPECT_FALSE(result.error().exit_code().has_value());

  ASSERT_TRUE(halve(4).has_value());
  EXPECT_EQ(*halve(4), 2);
}

TEST(Error, ContextIsPrefixed) {
  Error error{"bash script failed (status = 127)", 127};
  auto  chained = error.with_context("while parsing possibly escaped text: \"a b\"");
  EXPECT_EQ(chained.message(), "while parsing possibly escaped text: \"a b\": bash script failed (status = 127)");
  EXPECT_EQ(chained.exit_code(), 127);
}

TEST(Error, ErrnoError) {
  auto error = errno_error("open", ENOENT);
  EXPECT_EQ(error.message(), "open: No such file or directory");
}

TEST(Error, Formatting) {
  Error error{"something broke"};
  EXPECT_EQ(fmt::format("error: {}", error), "error: something broke");
}
