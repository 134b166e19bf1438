#pragma once

#include "initbench/bash/Array.hpp"
#include "initbench/bash/Scalar.hpp"
#include "initbench/bash/ShellOracle.hpp"
#include "initbench/core/Error.hpp"
#include "initbench/mkinitcpio/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace initbench::mkinitcpio {

// One entry of PRESETS in a preset file.
struct Preset {
  bash::BashScalar filename_; // file stem
  bash::BashScalar name_;

  std::optional<bash::BashScalar> kver_;
  std::optional<bash::BashScalar> config_;
  std::optional<bash::BashScalar> image_;
  std::optional<bash::BashScalar> uki_;
  std::optional<bash::BashScalar> efi_image_;
  std::optional<bash::BashScalar> microcode_;
  std::optional<bash::BashArray>  options_;

  // Every preset named by PRESETS. kver, config and microcode fall back to their
  // ALL_ variable.
  [[nodiscard]] static auto load_preset(
      std::filesystem::path const& path,
      bash::ShellOracle const&     oracle = bash::ShellOracle::system()
  ) -> Result<std::vector<Preset>>;

  // All *.preset files directly inside `dir`, sorted by name.
  [[nodiscard]] static auto load_all_presets(
      std::filesystem::path const& dir,
      bash::ShellOracle const&     oracle = bash::ShellOracle::system()
  ) -> Result<std::vector<Preset>>;

  [[nodiscard]] static auto load_default_presets(bash::ShellOracle const& oracle = bash::ShellOracle::system())
      -> Result<std::vector<Preset>>;

  // The Config named by `config`, if any.
  [[nodiscard]] auto load_config(bash::ShellOracle const& oracle = bash::ShellOracle::system()) const
      -> Result<std::optional<Config>>;

  // A preset file declaring only this preset.
  [[nodiscard]] auto to_string() const -> std::string;
  [[nodiscard]] auto save_to(std::filesystem::path const& path) const -> Result<void>;

  friend auto operator==(Preset const& lhs, Preset const& rhs) -> bool = default;
};

} // namespace initbench::mkinitcpio
