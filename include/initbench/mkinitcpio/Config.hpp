#pragma once

#include "initbench/bash/Array.hpp"
#include "initbench/bash/Scalar.hpp"
#include "initbench/bash/ShellOracle.hpp"
#include "initbench/core/Constants.hpp"
#include "initbench/core/Error.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace initbench::mkinitcpio {

using core::Result;

// The variables of mkinitcpio.conf. An absent field was not set at all.
struct Config {
  std::optional<bash::BashArray>  modules_;
  std::optional<bash::BashArray>  binaries_;
  std::optional<bash::BashArray>  files_;
  std::optional<bash::BashArray>  hooks_;
  std::optional<bash::BashScalar> compression_;
  std::optional<bash::BashArray>  compression_options_;
  std::optional<bash::BashScalar> modules_decompress_;

  // Sources the file and keeps the recognized variables, coerced to their field
  // shape and re-escaped. Everything else is dropped.
  [[nodiscard]] static auto load_config(
      std::filesystem::path const& path,
      bash::ShellOracle const&     oracle = bash::ShellOracle::system()
  ) -> Result<Config>;

  // `base` followed by every *.conf in `drop_in_dir`, in directory listing order.
  [[nodiscard]] static auto load_layered(
      std::filesystem::path const& base,
      std::filesystem::path const& drop_in_dir,
      bash::ShellOracle const&     oracle = bash::ShellOracle::system()
  ) -> Result<Config>;

  // The system configuration with its drop-ins.
  [[nodiscard]] static auto load_default(bash::ShellOracle const& oracle = bash::ShellOracle::system())
      -> Result<Config>;

  // One `NAME=value` line per present field.
  [[nodiscard]] auto to_string() const -> std::string;

  // Creates the parent directory when needed.
  [[nodiscard]] auto save_to(std::filesystem::path const& path) const -> Result<void>;

  friend auto operator==(Config const& lhs, Config const& rhs) -> bool = default;
};

} // namespace initbench::mkinitcpio
