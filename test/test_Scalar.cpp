#include "initbench/bash/Array.hpp"
#include "initbench/bash/Scalar.hpp"
#include "test_utils.h"

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include <gtest/gtest.h>

using namespace initbench::bash;
using namespace std::string_view_literals;
using initbench::core::Error;
using initbench::test::ScriptedOracle;

class EscapeTest : public ::testing::TestWithParam<std::pair<std::string_view, std::string_view>> {};

TEST_P(EscapeTest, RawBytesGetCanonicalQuoting) {
  auto const& [raw, escaped] = GetParam();

  auto scalar = BashScalar::from_raw(raw);
  ASSERT_TRUE(scalar.has_value()) << scalar.error().message();
  EXPECT_EQ(scalar->source(), escaped);
  EXPECT_EQ(scalar->as_raw(), raw);

  auto parsed = BashScalar::from_escaped(scalar->source());
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
  EXPECT_EQ(parsed->as_raw(), raw);
}

// clang-format off
INSTANTIATE_TEST_SUITE_P(
  Scalar,
  EscapeTest,
  ::testing::Values(
    std::make_pair("text"sv,                          "text"sv),
    std::make_pair("just some text"sv,                "'just some text'"sv),
    std::make_pair("needs\nescaping"sv,               "$'needs\\nescaping'"sv),
    std::make_pair("binary\xFF\xFF" "data"sv,         "$'binary\\377\\377data'"sv),
    std::make_pair("trailing newlines\n\n"sv,         "$'trailing newlines\\n\\n'"sv),
    std::make_pair("it's"sv,                          "'it'\\''s'"sv),
    std::make_pair("a$b"sv,                           "'a$b'"sv),
    std::make_pair("/boot/vmlinuz-linux"sv,           "/boot/vmlinuz-linux"sv),
    std::make_pair(""sv,                              ""sv)
  )
);
// clang-format on

TEST(Scalar, NulBytesAreDroppedFromQuotedForm) {
  auto raw    = "string 'with quotes' and\0 null byte"sv;
  auto scalar = BashScalar::from_raw(raw);
  ASSERT_TRUE(scalar.has_value()) << scalar.error().message();
  EXPECT_EQ(scalar->source(), "'string '\\''with quotes'\\'' and null byte'");
  EXPECT_EQ(scalar->as_raw(), raw);
}

TEST(Scalar, FromEscaped) {
  auto simple = BashScalar::from_escaped("'Simple string!'");
  ASSERT_TRUE(simple.has_value());
  EXPECT_EQ(simple->source(), "'Simple string!'");
  EXPECT_EQ(simple->as_raw(), "Simple string!");

  auto ansi = BashScalar::from_escaped("$'contains\\tescapes\\n'");
  ASSERT_TRUE(ansi.has_value());
  EXPECT_EQ(ansi->as_raw(), "contains\tescapes\n");

  auto substituted = BashScalar::from_escaped("\"$(echo hi)\"");
  ASSERT_TRUE(substituted.has_value());
  EXPECT_EQ(substituted->as_raw(), "hi");
}

TEST(Scalar, FromEscapedTruncatesAtNul) {
  auto scalar = BashScalar::from_escaped("$'null character\\0 is ignored'");
  ASSERT_TRUE(scalar.has_value());
  EXPECT_EQ(scalar->as_raw(), "null character");
}

TEST(Scalar, UnquotedWordsAreRejected) {
  auto scalar = BashScalar::from_escaped("multiple words");
  ASSERT_FALSE(scalar.has_value());
  EXPECT_EQ(scalar.error().exit_code(), 127);
  EXPECT_TRUE(scalar.error().message().starts_with("while parsing possibly escaped text: \"multiple words\": "));
  EXPECT_NE(scalar.error().message().find("command not found"), std::string::npos);
}

TEST(Scalar, ParseFallsBackToLiteralText) {
  auto quoted = BashScalar::parse("'quoted text'");
  ASSERT_TRUE(quoted.has_value());
  EXPECT_EQ(quoted->as_raw(), "quoted text");

  auto literal = BashScalar::parse("multiple words");
  ASSERT_TRUE(literal.has_value()) << literal.error().message();
  EXPECT_EQ(literal->as_raw(), "multiple words");
  EXPECT_EQ(literal->source(), "'multiple words'");
}

TEST(Scalar, ReescapeNormalizesQuoting) {
  auto scalar = BashScalar::from_escaped("\"double quoted\"");
  ASSERT_TRUE(scalar.has_value());
  EXPECT_EQ(scalar->source(), "\"double quoted\"");

  auto once = scalar->reescape();
  ASSERT_TRUE(once.has_value());
  EXPECT_EQ(once->source(), "'double quoted'");
  EXPECT_EQ(*once, *scalar);

  auto twice = once->reescape();
  ASSERT_TRUE(twice.has_value());
  EXPECT_EQ(twice->source(), once->source());
}

TEST(Scalar, EqualityAndHashUseRawBytes) {
  auto single = BashScalar::from_escaped("'same text'");
  auto dbl    = BashScalar::from_escaped("\"same text\"");
  auto other  = BashScalar::from_escaped("other");
  ASSERT_TRUE(single && dbl && other);

  EXPECT_EQ(*single, *dbl);
  EXPECT_NE(*single, *other);
  EXPECT_EQ(*single, "same text"sv);
  EXPECT_LT(*other, *single);
  EXPECT_EQ(ScalarHash{}(*single), ScalarHash{}(*dbl));
  EXPECT_EQ(ScalarHash{}(*single), ScalarHash{}("same text"sv));

  std::unordered_set<BashScalar, ScalarHash, ScalarEqual> set{*single, *dbl, *other};
  EXPECT_EQ(set.size(), 2);
  EXPECT_TRUE(set.contains("other"sv));
}

TEST(Scalar, Conversions) {
  auto scalar = BashScalar::from_raw("Hello \xF0\x90\x80World");
  ASSERT_TRUE(scalar.has_value());
  EXPECT_EQ(scalar->to_utf8_lossy(), "Hello \xEF\xBF\xBDWorld");
  EXPECT_NE(*scalar, "Hello \xEF\xBF\xBDWorld"sv);
  EXPECT_FALSE(scalar->as_utf8().has_value());
  EXPECT_EQ(scalar->as_repr(), "b\"Hello \\xF0\\x90\\x80World\"");
  EXPECT_EQ(fmt::format("{}", *scalar), "Hello \xEF\xBF\xBDWorld");

  auto path = BashScalar::from_path("/boot/initramfs-linux.img");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->source(), "/boot/initramfs-linux.img");
  EXPECT_EQ(path->as_path(), std::filesystem::path{"/boot/initramfs-linux.img"});
  ASSERT_TRUE(path->as_utf8().has_value());
  EXPECT_EQ(*path->as_utf8(), "/boot/initramfs-linux.img");
}

TEST(Scalar, ArrayizeAndMapfile) {
  auto scalar = BashScalar::from_raw("string 'with quotes' and\0 null byte"sv);
  ASSERT_TRUE(scalar.has_value());

  std::vector<std::string> const words{"string", "'with", "quotes'", "and", "null", "byte"};

  auto split = scalar->arrayize();
  ASSERT_TRUE(split.has_value()) << split.error().message();
  EXPECT_EQ(split->raw_values(), words);

  auto mapped = scalar->mapfile(' ');
  ASSERT_TRUE(mapped.has_value()) << mapped.error().message();
  EXPECT_EQ(mapped->raw_values(), words);

  auto whole = scalar->mapfile('\0');
  ASSERT_TRUE(whole.has_value()) << whole.error().message();
  EXPECT_EQ(whole->raw_values(), std::vector<std::string>{"string 'with quotes' and null byte"});
}

TEST(Scalar, MapfileKeepsEmptyFields) {
  auto scalar = BashScalar::from_raw("a  b");
  ASSERT_TRUE(scalar.has_value());

  auto mapped = scalar->mapfile(' ');
  ASSERT_TRUE(mapped.has_value());
  EXPECT_EQ(mapped->raw_values(), (std::vector<std::string>{"a", "", "b"}));

  auto split = scalar->arrayize();
  ASSERT_TRUE(split.has_value());
  EXPECT_EQ(split->raw_values(), (std::vector<std::string>{"a", "b"}));
}

TEST(Scalar, ScriptsSentToOracle) {
  ScriptedOracle oracle{[](std::string_view) { return std::string{"quoted text"}; }};

  auto scalar = BashScalar::from_escaped("  'quoted text'\n", oracle);
  ASSERT_TRUE(scalar.has_value());
  EXPECT_EQ(scalar->source(), "'quoted text'");
  EXPECT_EQ(scalar->as_raw(), "quoted text");
  ASSERT_EQ(oracle.scripts().size(), 1);
  EXPECT_EQ(oracle.scripts()[0], "INPUT='quoted text'\nprintf '%s' \"$INPUT\"");
}

TEST(Scalar, OracleErrorsGetContext) {
  ScriptedOracle oracle{[](std::string_view) -> initbench::core::Result<std::string> {
    return std::unexpected(Error{"bash script failed (status = 2)", 2});
  }};

  auto escaped = BashScalar::from_escaped("(", oracle);
  ASSERT_FALSE(escaped.has_value());
  EXPECT_EQ(escaped.error().message(), "while parsing possibly escaped text: \"(\": bash script failed (status = 2)");
  EXPECT_EQ(escaped.error().exit_code(), 2);

  auto raw = BashScalar::from_raw("a\xFF", oracle);
  ASSERT_FALSE(raw.has_value());
  EXPECT_EQ(raw.error().message(), "while escaping raw bytes: b\"a\\xFF\": bash script failed (status = 2)");
}
