#include "initbench/core/Strings.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

using namespace initbench::core;
using namespace std::string_view_literals;

TEST(Strings, TrimRemovesSurroundingWhitespace) {
  EXPECT_EQ(trim("  text \t\n"), "text");
  EXPECT_EQ(trim("inner  space"), "inner  space");
  EXPECT_EQ(trim(" \n\t "), "");
  EXPECT_EQ(trim(""), "");
}

TEST(Strings, ToLower) {
  EXPECT_EQ(to_lower("TrAcE"), "trace");
  EXPECT_EQ(to_lower("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");
}

TEST(Strings, LinesSkipsLeadingBlankLines) {
  auto result = lines("\n\n  \nfirst\n\nsecond\n\n");
  ASSERT_EQ(result.size(), 3);
  EXPECT_EQ(result[0], "first");
  EXPECT_EQ(result[1], "");
  EXPECT_EQ(result[2], "second");
}

TEST(Strings, LinesOfBlankText) {
  EXPECT_TRUE(lines("").empty());
  EXPECT_TRUE(lines(" \n \n").empty());
}

TEST(Strings, EscapeAscii) {
  EXPECT_EQ(escape_ascii("plain text"), "plain text");
  EXPECT_EQ(escape_ascii("a\nb\tc"), "a\\nb\\tc");
  EXPECT_EQ(escape_ascii("'quoted' \"text\""), "\\'quoted\\' \\\"text\\\"");
  EXPECT_EQ(escape_ascii("back\\slash"), "back\\\\slash");
  EXPECT_EQ(escape_ascii("binary\xFF\x01"), "binary\\xff\\x01");
}

TEST(Strings, ReprKeepsValidUtf8) {
  EXPECT_EQ(repr("just some text"), "b\"just some text\"");
  EXPECT_EQ(repr("caf\xC3\xA9"), "b\"caf\xC3\xA9\"");
  EXPECT_EQ(repr("binary\xFF\xFF" "data"), "b\"binary\\xFF\\xFFdata\"");
  EXPECT_EQ(repr("null\0byte"sv), "b\"null\\0byte\"");
  EXPECT_EQ(repr("line\n\"quoted\""), "b\"line\\n\\\"quoted\\\"\"");
}

TEST(Strings, ValidUtf8) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("ascii"));
  EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
  EXPECT_FALSE(is_valid_utf8("\xFF"));
  EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));       // overlong
  EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));   // surrogate
  EXPECT_FALSE(is_valid_utf8("\xF0\x90\x80"));   // truncated
}

class LossyUtf8Test : public ::testing::TestWithParam<std::pair<std::string_view, std::string_view>> {};

TEST_P(LossyUtf8Test, ReplacesInvalidSequences) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(to_utf8_lossy(input), expected);
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(
  Strings,
  LossyUtf8Test,
  ::testing::Values(
    std::make_pair("Hello World"sv,                   "Hello World"sv),
    std::make_pair("Hello \xF0\x90\x80World"sv,       "Hello \xEF\xBF\xBDWorld"sv),
    std::make_pair("\xFF\xFE"sv,                      "\xEF\xBF\xBD\xEF\xBF\xBD"sv),
    std::make_pair("ab\xE2\x82"sv,                    "ab\xEF\xBF\xBD"sv),
    std::make_pair("\xC3\xA9\x80"sv,                  "\xC3\xA9\xEF\xBF\xBD"sv)
  )
);
// clang-format on
