#include "initbench/mkinitcpio/Files.hpp"
#include "test_utils.h"

#include <filesystem>

#include <gtest/gtest.h>

using namespace initbench::mkinitcpio;
using initbench::test::TempDir;

namespace fs = std::filesystem;

TEST(Files, RecursiveCreateAndCleanup) {
  TempDir dir;
  auto    nested = dir / "a" / "b" / "c";

  ASSERT_TRUE(create_dir(nested).has_value());
  EXPECT_TRUE(fs::is_directory(nested));
  ASSERT_TRUE(create_dir(nested).has_value());

  ASSERT_TRUE(initbench::mkinitcpio::write_file(nested / "file", "data").has_value());
  ASSERT_TRUE(cleanup(dir / "a").has_value());
  EXPECT_FALSE(fs::exists(dir / "a"));
}

TEST(Files, CleanupOfMissingPathSucceeds) {
  TempDir dir;
  EXPECT_TRUE(cleanup(dir / "missing").has_value());
}

TEST(Files, CleanupRemovesPlainFile) {
  TempDir dir;
  ASSERT_TRUE(initbench::mkinitcpio::write_file(dir / "file", "data").has_value());
  ASSERT_TRUE(cleanup(dir / "file").has_value());
  EXPECT_FALSE(fs::exists(dir / "file"));
}

TEST(Files, CreateDirOverFileFails) {
  TempDir dir;
  ASSERT_TRUE(initbench::mkinitcpio::write_file(dir / "file", "data").has_value());
  auto created = create_dir(dir / "file" / "sub");
  ASSERT_FALSE(created.has_value());
  EXPECT_TRUE(created.error().message().starts_with("could not create "));
}

TEST(Files, WriteCreatesParentAndReadReturnsBytes) {
  TempDir     dir;
  auto        path = dir / "new" / "dir" / "file.bin";
  std::string data{"bytes\0\xFF", 7};

  ASSERT_TRUE(initbench::mkinitcpio::write_file(path, data).has_value());
  auto contents = initbench::mkinitcpio::read_file(path);
  ASSERT_TRUE(contents.has_value());
  EXPECT_EQ(*contents, data);

  EXPECT_FALSE(initbench::mkinitcpio::read_file(dir / "missing").has_value());
}
