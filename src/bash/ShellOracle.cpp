#include "initbench/bash/ShellOracle.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/Strings.hpp"
#include "initbench/process/Command.hpp"

#include <optional>
#include <system_error>

namespace initbench::bash {

auto ShellOracle::run(std::string_view script) const -> Result<std::string> {
  return run_at(script, core::DEFAULT_WORKDIR);
}

auto ShellOracle::run_with_output_at(std::string_view script, std::filesystem::path const& dir) const
    -> Result<std::string> {
  auto command = fmt::format("{}\ndeclare | grep -E '^{}=' || true", script, core::SENTINEL_VAR);
  auto output  = run_at(command, dir);
  if (!output) {
    return std::unexpected(output.error());
  }
  if (!core::is_valid_utf8(*output)) {
    return core::fail("invalid UTF-8 in bash output: {}", core::repr(*output));
  }

  auto const                      prefix = fmt::format("{}=", core::SENTINEL_VAR);
  std::optional<std::string_view> value;
  std::string_view                remaining{*output};
  while (!remaining.empty()) {
    auto newline = remaining.find('\n');
    auto line    = remaining.substr(0, newline);
    remaining    = newline == std::string_view::npos ? std::string_view{} : remaining.substr(newline + 1);

    if (!line.starts_with(prefix)) {
      continue;
    }
    if (value) {
      return core::fail("multiple {} variables", core::SENTINEL_VAR);
    }
    value = line.substr(prefix.size());
  }

  if (!value) {
    return core::fail("missing {} variable", core::SENTINEL_VAR);
  }
  return std::string{*value};
}

auto ShellOracle::run_with_output(std::string_view script) const -> Result<std::string> {
  return run_with_output_at(script, core::DEFAULT_WORKDIR);
}

auto ShellOracle::system() -> ShellOracle const& {
  static RestrictedBash const instance;
  return instance;
}

RestrictedBash::RestrictedBash(std::filesystem::path shell)
    : shell_(std::move(shell)) {}

auto RestrictedBash::shell() const noexcept -> std::filesystem::path const& {
  return shell_;
}

auto RestrictedBash::run_at(std::string_view script, std::filesystem::path const& dir) const -> Result<std::string> {
  core::log::trace("rbash: dir={}", dir.string());
  core::log::trace("rbash: commands={}", core::escape_ascii(script));

  auto output = process::Command{shell_.string()}
                    .arg("-r")
                    .current_dir(dir)
                    .stdin_data(fmt::format("set -o errexit\n{}\nexit\n", script))
                    .output();
  if (!output) {
    return std::unexpected(output.error());
  }
  return process::check("bash script", std::move(*output), false);
}

auto resolve_file(std::filesystem::path const& path) -> Result<std::pair<std::filesystem::path, std::string>> {
  std::error_code ec;
  auto            resolved = std::filesystem::canonical(path, ec);
  if (ec) {
    return core::fail("could not resolve {}: {}", path.string(), ec.message());
  }
  core::log::trace("resolve_file: {} => {}", path.string(), resolved.string());

  if (!std::filesystem::is_regular_file(resolved, ec)) {
    return core::fail("not a file: {} (resolved from {})", resolved.string(), path.string());
  }
  if (!resolved.has_parent_path() || !resolved.has_filename()) {
    return core::fail("invalid path: {} (resolved from {})", resolved.string(), path.string());
  }
  return std::make_pair(resolved.parent_path(), resolved.filename().string());
}

} // namespace initbench::bash
