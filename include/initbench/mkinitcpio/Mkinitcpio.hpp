#pragma once

#include "initbench/bash/ShellOracle.hpp"
#include "initbench/core/Constants.hpp"
#include "initbench/core/Error.hpp"
#include "initbench/mkinitcpio/Config.hpp"
#include "initbench/mkinitcpio/Preset.hpp"

#include <filesystem>
#include <optional>

namespace initbench::mkinitcpio {

// Writes a copy of `preset` under `<output_dir>/<file stem>/<preset name>/` that
// builds an uncompressed test.img and test.efi there, with its own
// mkinitcpio.conf. The preset's config is used when it names one, otherwise
// `default_config`, which is loaded on first use. Returns the new preset file.
[[nodiscard]] auto create_mock_preset(
    Preset                       preset,
    std::filesystem::path const& output_dir,
    std::optional<Config>&       default_config,
    bash::ShellOracle const&     oracle = bash::ShellOracle::system()
) -> Result<std::filesystem::path>;

// `mkinitcpio --preset <preset_file>`. Its stdout is logged at info level.
[[nodiscard]] auto run_mkinitcpio(
    std::filesystem::path const& preset_file,
    std::filesystem::path const& program = core::MKINITCPIO_PATH
) -> Result<void>;

} // namespace initbench::mkinitcpio
