#include "initbench/cli/ArgumentParser.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/mkinitcpio/Mkinitcpio.hpp"

#include <filesystem>
#include <optional>

#include <fmt/format.h>

namespace {

namespace fs      = std::filesystem;
namespace logging = initbench::core::log;
using initbench::core::Result;

auto mock_presets(fs::path const& preset_dir, fs::path const& output_dir, bool run) -> Result<void> {
  namespace mk = initbench::mkinitcpio;

  auto presets = mk::Preset::load_all_presets(preset_dir);
  if (!presets) {
    return std::unexpected(presets.error());
  }
  logging::info("found {} presets in {}", presets->size(), preset_dir.string());

  std::optional<mk::Config> default_config;
  for (auto& preset : *presets) {
    auto preset_file = mk::create_mock_preset(std::move(preset), output_dir, default_config);
    if (!preset_file) {
      return std::unexpected(preset_file.error());
    }
    fmt::print("{}\n", preset_file->string());

    if (run) {
      if (auto built = mk::run_mkinitcpio(*preset_file); !built) {
        return built;
      }
    }
  }
  return {};
}

} // namespace

int main(int argc, char* argv[]) {
  logging::init_from_env();

  auto parser = initbench::cli::create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args) {
    fmt::print(stderr, "Error: {}\n\n", args.error());
    fmt::print(stderr, "{}", parser.help());
    return 1;
  }

  if (args->has("help")) {
    parser.print_help();
    return 0;
  }
  if (args->has("version")) {
    initbench::cli::ArgumentParser::print_version();
    return 0;
  }

  if (args->has("verbose") && logging::level() > logging::Level::Debug) {
    logging::set_level(logging::Level::Debug);
  }

  auto outdir  = args->get("outdir").value_or("output/");
  auto presets = args->get("presets").value_or(initbench::core::DEFAULT_PRESET_DIR);

  if (auto result = mock_presets(presets, outdir, args->has("run")); !result) {
    fmt::print(stderr, "Error: {}\n", result.error());
    return 1;
  }
  return 0;
}
