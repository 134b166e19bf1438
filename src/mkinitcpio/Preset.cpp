#include "initbench/mkinitcpio/Preset.hpp"
#include "initbench/bash/Value.hpp"
#include "initbench/core/Constants.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/mkinitcpio/Files.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

namespace initbench::mkinitcpio {

namespace fs = std::filesystem;

namespace {

auto as_scalar(bash::BashValue const& value, bash::ShellOracle const& oracle) -> Result<bash::BashScalar> {
  if (auto const* array = value.array()) {
    return array->to_concatenated_string(oracle);
  }
  return value.scalar()->reescape(oracle);
}

auto as_array(bash::BashValue const& value, bash::ShellOracle const& oracle) -> Result<bash::BashArray> {
  if (auto const* scalar = value.scalar()) {
    auto split = scalar->mapfile(' ', oracle);
    if (!split) {
      return split;
    }
    return split->reescape(oracle);
  }
  return value.array()->reescape(oracle);
}

class PresetReader {
  bash::Environment const& env_;
  bash::BashScalar const&  name_;
  bash::ShellOracle const& oracle_;

public:
  PresetReader(bash::Environment const& env, bash::BashScalar const& name, bash::ShellOracle const& oracle)
      : env_(env),
        name_(name),
        oracle_(oracle) {}

  // `<name>_<field>`, or `ALL_<field>` when `fallback` is set.
  auto lookup(std::string_view field, bool fallback) const -> bash::BashValue const* {
    if (auto const* value = env_.get(fmt::format("{}_{}", name_.as_raw(), field))) {
      return value;
    }
    return fallback ? env_.get(fmt::format("ALL_{}", field)) : nullptr;
  }

  template<typename T, typename Convert>
  auto read(std::string_view field, bool fallback, std::optional<T>& out, Convert convert) const -> Result<void> {
    auto const* value = lookup(field, fallback);
    if (value == nullptr) {
      return {};
    }
    auto converted = convert(*value, oracle_);
    if (!converted) {
      return std::unexpected(converted.error().with_context(fmt::format("while reading {}_{}", name_, field)));
    }
    out = std::move(*converted);
    return {};
  }
};

template<typename T>
void write_var(std::string& out, bash::BashScalar const& name, std::string_view field, std::optional<T> const& value) {
  if (value) {
    out += fmt::format("{}_{}={}\n", name.source(), field, value->source());
  }
}

} // namespace

auto Preset::load_preset(fs::path const& path, bash::ShellOracle const& oracle) -> Result<std::vector<Preset>> {
  core::log::debug("load_preset: {}", path.string());
  if (path.stem().empty()) {
    return core::fail("missing filename for preset: {}", path.string());
  }
  auto filename = bash::BashScalar::from_path(path.stem(), oracle);
  if (!filename) {
    return std::unexpected(filename.error());
  }

  auto env = bash::source(path, oracle);
  if (!env) {
    return std::unexpected(env.error());
  }

  auto const* presets = env->get("PRESETS");
  if (presets == nullptr) {
    return core::fail("missing PRESETS array in {}", path.string());
  }

  std::vector<bash::BashScalar> names;
  if (auto const* array = presets->array()) {
    auto escaped = array->reescape(oracle);
    if (!escaped) {
      return std::unexpected(escaped.error());
    }
    names = escaped->values();
  } else {
    auto escaped = presets->scalar()->reescape(oracle);
    if (!escaped) {
      return std::unexpected(escaped.error());
    }
    names.push_back(std::move(*escaped));
  }

  std::vector<Preset> result;
  result.reserve(names.size());
  for (auto& name : names) {
    PresetReader reader{*env, name, oracle};
    Preset       preset{*filename, name};

    if (auto loaded = reader.read("kver", true, preset.kver_, as_scalar); !loaded) {
      return std::unexpected(loaded.error());
    }
    if (auto loaded = reader.read("config", true, preset.config_, as_scalar); !loaded) {
      return std::unexpected(loaded.error());
    }
    if (auto loaded = reader.read("image", false, preset.image_, as_scalar); !loaded) {
      return std::unexpected(loaded.error());
    }
    if (auto loaded = reader.read("uki", false, preset.uki_, as_scalar); !loaded) {
      return std::unexpected(loaded.error());
    }
    if (auto loaded = reader.read("efi_image", false, preset.efi_image_, as_scalar); !loaded) {
      return std::unexpected(loaded.error());
    }
    if (auto loaded = reader.read("microcode", true, preset.microcode_, as_scalar); !loaded) {
      return std::unexpected(loaded.error());
    }
    if (auto loaded = reader.read("options", false, preset.options_, as_array); !loaded) {
      return std::unexpected(loaded.error());
    }

    core::log::trace("load_preset: loaded {}/{}", preset.filename_, preset.name_);
    result.push_back(std::move(preset));
  }
  return result;
}

auto Preset::load_all_presets(fs::path const& dir, bash::ShellOracle const& oracle) -> Result<std::vector<Preset>> {
  std::error_code        ec;
  fs::directory_iterator entry(dir, ec);
  if (ec) {
    return core::fail("could not list {}: {}", dir.string(), ec.message());
  }

  std::vector<fs::path> paths;
  for (; entry != fs::directory_iterator{}; entry.increment(ec)) {
    if (entry->path().extension() == ".preset") {
      paths.push_back(entry->path());
    }
  }
  if (ec) {
    return core::fail("could not list {}: {}", dir.string(), ec.message());
  }
  std::ranges::sort(paths);

  std::vector<Preset> presets;
  for (auto const& path : paths) {
    auto loaded = load_preset(path, oracle);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    presets.insert(presets.end(), std::make_move_iterator(loaded->begin()), std::make_move_iterator(loaded->end()));
  }
  return presets;
}

auto Preset::load_default_presets(bash::ShellOracle const& oracle) -> Result<std::vector<Preset>> {
  return load_all_presets(core::DEFAULT_PRESET_DIR, oracle);
}

auto Preset::load_config(bash::ShellOracle const& oracle) const -> Result<std::optional<Config>> {
  if (!config_) {
    return std::optional<Config>{};
  }
  auto config = Config::load_config(config_->as_path(), oracle);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<Config>{std::move(*config)};
}

auto Preset::to_string() const -> std::string {
  auto out = fmt::format("PRESETS=({})\n", name_.source());
  write_var(out, name_, "kver", kver_);
  write_var(out, name_, "config", config_);
  write_var(out, name_, "image", image_);
  write_var(out, name_, "uki", uki_);
  write_var(out, name_, "efi_image", efi_image_);
  write_var(out, name_, "microcode", microcode_);
  write_var(out, name_, "options", options_);
  return out;
}

auto Preset::save_to(fs::path const& path) const -> Result<void> {
  core::log::debug("save_to: preset={}", path.string());
  return write_file(path, to_string());
}

} // namespace initbench::mkinitcpio
