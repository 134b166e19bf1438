#include "initbench/mkinitcpio/Mkinitcpio.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/mkinitcpio/Files.hpp"
#include "initbench/process/Command.hpp"

namespace initbench::mkinitcpio {

namespace fs = std::filesystem;

auto create_mock_preset(
    Preset                   preset,
    fs::path const&          output_dir,
    std::optional<Config>&   default_config,
    bash::ShellOracle const& oracle
) -> Result<fs::path> {
  core::log::trace("create_mock_preset: preset={}, output_dir={}", preset.name_, output_dir.string());

  auto preset_dir = output_dir / preset.filename_.as_path() / preset.name_.as_path();
  if (auto removed = cleanup(preset_dir); !removed) {
    return std::unexpected(removed.error());
  }
  if (auto created = create_dir(preset_dir); !created) {
    return std::unexpected(created.error());
  }

  auto preset_config = preset.load_config(oracle);
  if (!preset_config) {
    return std::unexpected(preset_config.error());
  }
  core::log::debug(
      "create_mock_preset: preset_config={}, default_config={}",
      preset_config->has_value(),
      default_config.has_value()
  );

  if (!preset_config->has_value() && !default_config) {
    auto loaded = Config::load_default(oracle);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    default_config = std::move(*loaded);
  }
  // The cached default stays untouched, the overrides go to a copy.
  Config config = preset_config->has_value() ? std::move(**preset_config) : *default_config;

  auto uncompressed = bash::BashScalar::from_raw("cat", oracle);
  if (!uncompressed) {
    return std::unexpected(uncompressed.error());
  }
  config.compression_ = std::move(*uncompressed);
  config.compression_options_.reset();

  auto config_file = preset_dir / "mkinitcpio.conf";
  core::log::trace("create_mock_preset: config_file={}", config_file.string());
  if (auto saved = config.save_to(config_file); !saved) {
    return std::unexpected(saved.error());
  }

  auto config_path = bash::BashScalar::from_path(config_file, oracle);
  if (!config_path) {
    return std::unexpected(config_path.error());
  }
  auto image_path = bash::BashScalar::from_path(preset_dir / "test.img", oracle);
  if (!image_path) {
    return std::unexpected(image_path.error());
  }
  auto uki_path = bash::BashScalar::from_path(preset_dir / "test.efi", oracle);
  if (!uki_path) {
    return std::unexpected(uki_path.error());
  }
  preset.config_ = std::move(*config_path);
  preset.image_  = std::move(*image_path);
  preset.uki_    = std::move(*uki_path);
  preset.efi_image_.reset();

  auto preset_file = preset_dir / fmt::format("{}.preset", preset.filename_.as_raw());
  core::log::trace("create_mock_preset: preset_file={}", preset_file.string());
  if (auto saved = preset.save_to(preset_file); !saved) {
    return std::unexpected(saved.error());
  }
  return preset_file;
}

auto run_mkinitcpio(fs::path const& preset_file, fs::path const& program) -> Result<void> {
  core::log::trace("mkinitcpio: preset={}", preset_file.string());
  auto output = process::Command{program.string()}.arg("--preset").arg(preset_file.string()).output();
  if (!output) {
    return std::unexpected(output.error());
  }
  auto checked = process::check("mkinitcpio", std::move(*output), true);
  if (!checked) {
    return std::unexpected(checked.error());
  }
  return {};
}

} // namespace initbench::mkinitcpio
