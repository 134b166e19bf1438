#include "initbench/mkinitcpio/Config.hpp"
#include "initbench/bash/Value.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/TempFile.hpp"
#include "initbench/mkinitcpio/Files.hpp"

#include <system_error>
#include <vector>

namespace initbench::mkinitcpio {

namespace fs = std::filesystem;

namespace {

auto as_scalar(bash::BashValue const& value, bash::ShellOracle const& oracle) -> Result<bash::BashScalar> {
  if (auto const* array = value.array()) {
    auto joined = array->to_concatenated_string(oracle);
    if (!joined) {
      return joined;
    }
    return joined->reescape(oracle);
  }
  return value.scalar()->reescape(oracle);
}

auto as_array(bash::BashValue const& value, bash::ShellOracle const& oracle) -> Result<bash::BashArray> {
  if (auto const* scalar = value.scalar()) {
    auto split = scalar->arrayize(oracle);
    if (!split) {
      return split;
    }
    return split->reescape(oracle);
  }
  return value.array()->reescape(oracle);
}

// Moves `name` out of `env` into `field`, coerced with `convert`.
template<typename T, typename Convert>
auto take_field(
    bash::Environment&       env,
    std::string_view         name,
    std::optional<T>&        field,
    Convert                  convert,
    bash::ShellOracle const& oracle
) -> Result<void> {
  auto value = env.take(name);
  if (!value) {
    return {};
  }
  auto converted = convert(*value, oracle);
  if (!converted) {
    return std::unexpected(converted.error().with_context(fmt::format("while reading {}", name)));
  }
  field = std::move(*converted);
  return {};
}

template<typename T>
void write_var(std::string& out, std::string_view name, std::optional<T> const& field) {
  if (field) {
    out += fmt::format("{}={}\n", name, field->source());
  }
}

} // namespace

auto Config::load_config(fs::path const& path, bash::ShellOracle const& oracle) -> Result<Config> {
  core::log::debug("load_config: {}", path.string());
  auto env = bash::source(path, oracle);
  if (!env) {
    return std::unexpected(env.error());
  }

  Config config;
  if (auto taken = take_field(*env, "MODULES", config.modules_, as_array, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  if (auto taken = take_field(*env, "BINARIES", config.binaries_, as_array, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  if (auto taken = take_field(*env, "FILES", config.files_, as_array, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  if (auto taken = take_field(*env, "HOOKS", config.hooks_, as_array, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  if (auto taken = take_field(*env, "COMPRESSION", config.compression_, as_scalar, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  if (auto taken = take_field(*env, "COMPRESSION_OPTIONS", config.compression_options_, as_array, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  if (auto taken = take_field(*env, "MODULES_DECOMPRESS", config.modules_decompress_, as_scalar, oracle); !taken) {
    return std::unexpected(taken.error());
  }
  return config;
}

auto Config::load_layered(fs::path const& base, fs::path const& drop_in_dir, bash::ShellOracle const& oracle)
    -> Result<Config> {
  auto merged = core::TempFile::create_in_temp_dir(".conf");
  if (!merged) {
    return std::unexpected(merged.error());
  }

  auto append = [&merged](fs::path const& path) -> Result<void> {
    core::log::debug("load_layered: appending {}", path.string());
    auto contents = read_file(path);
    if (!contents) {
      return std::unexpected(contents.error());
    }
    if (auto written = merged->write_all(*contents); !written) {
      return written;
    }
    return merged->write_all("\n");
  };

  if (auto appended = append(base); !appended) {
    return std::unexpected(appended.error());
  }

  std::error_code        ec;
  fs::directory_iterator entry(drop_in_dir, ec);
  if (ec) {
    core::log::debug("load_layered: no drop-ins in {}: {}", drop_in_dir.string(), ec.message());
    return load_config(merged->path(), oracle);
  }
  std::vector<fs::path> drop_ins;
  for (; entry != fs::directory_iterator{}; entry.increment(ec)) {
    if (entry->path().extension() == ".conf") {
      drop_ins.push_back(entry->path());
    }
  }
  if (ec) {
    return core::fail("could not list {}: {}", drop_in_dir.string(), ec.message());
  }

  for (auto const& path : drop_ins) {
    if (auto appended = append(path); !appended) {
      return std::unexpected(appended.error());
    }
  }

  return load_config(merged->path(), oracle);
}

auto Config::load_default(bash::ShellOracle const& oracle) -> Result<Config> {
  return load_layered(core::DEFAULT_CONFIG_PATH, core::CONFIG_DROP_IN_DIR, oracle);
}

auto Config::to_string() const -> std::string {
  std::string out;
  write_var(out, "MODULES", modules_);
  write_var(out, "BINARIES", binaries_);
  write_var(out, "FILES", files_);
  write_var(out, "HOOKS", hooks_);
  write_var(out, "COMPRESSION", compression_);
  write_var(out, "COMPRESSION_OPTIONS", compression_options_);
  write_var(out, "MODULES_DECOMPRESS", modules_decompress_);
  return out;
}

auto Config::save_to(fs::path const& path) const -> Result<void> {
  core::log::debug("save_to: config={}", path.string());
  return write_file(path, to_string());
}

} // namespace initbench::mkinitcpio
