#pragma once

#include "initbench/core/Constants.hpp"
#include "initbench/core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace initbench::bash {

using core::Result;

// The interpreter that decides what Bash source means. Every codec goes through
// this interface, so tests can replace Bash with canned answers.
class ShellOracle {
public:
  ShellOracle()          = default;
  virtual ~ShellOracle() = default;

  ShellOracle(ShellOracle const&)            = delete;
  ShellOracle& operator=(ShellOracle const&) = delete;
  ShellOracle(ShellOracle&&)                 = delete;
  ShellOracle& operator=(ShellOracle&&)      = delete;

  // Runs `script` in `dir` and returns its stdout. Fails when the script fails.
  [[nodiscard]] virtual auto run_at(std::string_view script, std::filesystem::path const& dir) const
      -> Result<std::string> = 0;

  [[nodiscard]] auto run(std::string_view script) const -> Result<std::string>;

  // Runs `script`, then reports the quoted value assigned to the sentinel
  // variable. Fails when the sentinel is missing or reported more than once.
  [[nodiscard]] auto run_with_output_at(std::string_view script, std::filesystem::path const& dir) const
      -> Result<std::string>;
  [[nodiscard]] auto run_with_output(std::string_view script) const -> Result<std::string>;

  // Shared RestrictedBash at /usr/bin/bash.
  [[nodiscard]] static auto system() -> ShellOracle const&;
};

// `bash -r` with an empty environment. Scripts run under `set -o errexit`.
class RestrictedBash final : public ShellOracle {
  std::filesystem::path shell_;

public:
  explicit RestrictedBash(std::filesystem::path shell = core::BASH_PATH);

  [[nodiscard]] auto shell() const noexcept -> std::filesystem::path const&;

  [[nodiscard]] auto run_at(std::string_view script, std::filesystem::path const& dir) const
      -> Result<std::string> override;
};

// Canonicalizes `path` and splits it into (directory, file name). The path must
// name a regular file.
[[nodiscard]] auto resolve_file(std::filesystem::path const& path)
    -> Result<std::pair<std::filesystem::path, std::string>>;

} // namespace initbench::bash
