#include "initbench/cli/ArgumentParser.hpp"
#include "initbench/core/Constants.hpp"

#include <array>
#include <memory>
#include <string>

#include <gtest/gtest.h>

namespace initbench::cli::test {

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser_ = std::make_unique<ArgumentParser>("test", "Test parser");
  }

  void TearDown() override {
    parser_.reset();
  }

  std::unique_ptr<ArgumentParser> parser_;
};

TEST_F(ArgumentParserTest, FlagOption) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");
  parser_->add_argument("run", "r").desc("Run mkinitcpio");

  auto argv   = std::array<char const*, 3>{"test", "--verbose", "--run"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has("verbose"));
  EXPECT_TRUE(result->has("run"));
  EXPECT_EQ(result->get("verbose"), "true");
  EXPECT_FALSE(result->has("help"));
}

TEST_F(ArgumentParserTest, CombinedShortOptions) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");
  parser_->add_argument("run", "r").desc("Run mkinitcpio");
  parser_->add_argument("outdir", "o").nargs(1).desc("Output directory");

  auto argv   = std::array<char const*, 3>{"test", "-vro", "out/"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_TRUE(result->has("verbose"));
  EXPECT_TRUE(result->has("run"));
  EXPECT_EQ(result->get("outdir"), "out/");
}

TEST_F(ArgumentParserTest, ValueOptionInsideShortGroup) {
  parser_->add_argument("outdir", "o").nargs(1).desc("Output directory");
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 3>{"test", "-ov", "out/"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(
      result.error().message(), "option -o requires a value and cannot be combined with other short options"
  );
}

TEST_F(ArgumentParserTest, LongOptionWithEquals) {
  parser_->add_argument("outdir", "o").nargs(1).desc("Output directory");
  parser_->add_argument("presets", "p").nargs(1).desc("Preset directory");

  auto argv   = std::array<char const*, 4>{"test", "--presets=/etc/mkinitcpio.d", "--outdir=out/", "--outdir="};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get("presets"), "/etc/mkinitcpio.d");
  EXPECT_EQ(result->get("outdir"), "");
}

TEST_F(ArgumentParserTest, StrayArgumentIsRejected) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 3>{"test", "-v", "linux"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "unexpected argument: linux");
}

TEST_F(ArgumentParserTest, DefaultValues) {
  parser_->add_argument("outdir", "o").nargs(1).default_value("output/").desc("Output directory");
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 2>{"test", "-v"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get("outdir"), "output/");

  auto overridden = std::array<char const*, 3>{"test", "-o", "elsewhere/"};
  result          = parser_->parse(overridden.size(), overridden.data());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get("outdir"), "elsewhere/");
}

TEST_F(ArgumentParserTest, UnknownOption) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 3>{"test", "--unknown1", "--unknown2"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "unknown option: --unknown1");
}

TEST_F(ArgumentParserTest, UnknownShortOption) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");
  parser_->add_argument("help", "h").desc("Help");

  auto argv   = std::array<char const*, 2>{"test", "-vxh"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "unknown option: -x");
}

TEST_F(ArgumentParserTest, EmptyShortNameNeverMatches) {
  parser_->add_argument("verbose", "").desc("Verbose mode");

  auto argv   = std::array<char const*, 2>{"test", "-v"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "unknown option: -v");
}

TEST_F(ArgumentParserTest, FlagWithValue) {
  parser_->add_argument("verbose", "v").desc("Enable verbose output");

  auto argv   = std::array<char const*, 2>{"test", "--verbose=true"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "flag option --verbose does not accept a value");
}

TEST_F(ArgumentParserTest, LongOptionMissingArguments) {
  parser_->add_argument("outdir", "o").nargs(1).desc("Output directory");

  auto argv   = std::array<char const*, 2>{"test", "--outdir"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "option --outdir requires 1 arguments, got 0");
}

TEST_F(ArgumentParserTest, ArgumentsStopAtNextOption) {
  parser_->add_argument("include", "I").nargs(3).desc("Include paths");
  parser_->add_argument("verbose", "v").desc("Verbose mode");

  auto argv   = std::array<char const*, 4>{"test", "-I", "path1", "--verbose"};
  auto result = parser_->parse(argv.size(), argv.data());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "option -I requires 3 arguments, got 1");
}

TEST_F(ArgumentParserTest, HelpListsOptions) {
  parser_->add_argument("outdir", "o").nargs(1).default_value("output/").desc("Output directory");
  parser_->add_argument("run", "r").desc("Run mkinitcpio");

  EXPECT_EQ(
      parser_->help(),
      "Usage: test [OPTIONS]\n\n"
      "Test parser\n\n"
      "Options:\n"
      "  -o, --outdir <value>\n"
      "    Output directory (default: output/)\n"
      "  -r, --run\n"
      "    Run mkinitcpio\n"
  );
}

TEST(DefaultArgumentParser, Defaults) {
  auto parser = create_default_arg_parser();

  auto argv   = std::array<char const*, 1>{"initbench"};
  auto result = parser.parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->get("outdir"), "output/");
  EXPECT_EQ(result->get("presets"), initbench::core::DEFAULT_PRESET_DIR);
  EXPECT_FALSE(result->has("run"));
  EXPECT_FALSE(result->has("verbose"));
}

TEST(DefaultArgumentParser, ShortFlags) {
  auto parser = create_default_arg_parser();

  auto argv   = std::array<char const*, 5>{"initbench", "-rv", "-p", "/tmp/presets", "-V"};
  auto result = parser.parse(argv.size(), argv.data());

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_TRUE(result->has("run"));
  EXPECT_TRUE(result->has("verbose"));
  EXPECT_TRUE(result->has("version"));
  EXPECT_EQ(result->get("presets"), "/tmp/presets");
}

} // namespace initbench::cli::test
