#include "initbench/bash/Scalar.hpp"
#include "initbench/bash/Array.hpp"
#include "initbench/core/Constants.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/Strings.hpp"
#include "initbench/core/TempFile.hpp"

#include <functional>

namespace initbench::bash {

auto escape(std::string_view raw, ShellOracle const& oracle) -> Result<std::string> {
  core::log::trace("escape: input={}", core::escape_ascii(raw));

  auto temp = core::TempFile::create_in_temp_dir();
  if (!temp) {
    return std::unexpected(temp.error());
  }
  if (auto written = temp->write_all(raw); !written) {
    return std::unexpected(written.error());
  }
  core::log::trace("escape: temp file={}", temp->path().string());

  auto location = resolve_file(temp->path());
  if (!location) {
    return std::unexpected(location.error());
  }
  auto const& [dir, file] = *location;

  // Command substitution strips trailing newlines, the guard byte keeps them.
  auto script = fmt::format(
      "{0}=\"$(cat -- '{1}'; printf x)\"\n"
      "{0}=\"${{{0}%x}}\"",
      core::SENTINEL_VAR,
      file
  );
  auto output = oracle.run_with_output_at(script, dir);
  if (output) {
    core::log::trace("escape: output={}", core::escape_ascii(*output));
  }
  return output;
}

auto unescape(std::string_view text, ShellOracle const& oracle) -> Result<std::string> {
  core::log::trace("unescape: input={}", core::escape_ascii(text));

  auto script = fmt::format("INPUT={}\nprintf '%s' \"$INPUT\"", core::trim(text));
  auto output = oracle.run(script);
  if (output) {
    core::log::trace("unescape: output={}", core::escape_ascii(*output));
  }
  return output;
}

BashScalar::BashScalar(std::string escaped, std::string raw)
    : escaped_(std::move(escaped)),
      raw_(std::move(raw)) {}

auto BashScalar::from_raw(std::string_view raw, ShellOracle const& oracle) -> Result<BashScalar> {
  auto escaped = escape(raw, oracle);
  if (!escaped) {
    return std::unexpected(escaped.error().with_context(fmt::format("while escaping raw bytes: {}", core::repr(raw))));
  }
  return BashScalar{std::move(*escaped), std::string{raw}};
}

auto BashScalar::from_escaped(std::string_view text, ShellOracle const& oracle) -> Result<BashScalar> {
  auto raw = unescape(text, oracle);
  if (!raw) {
    return std::unexpected(
        raw.error().with_context(fmt::format("while parsing possibly escaped text: \"{}\"", core::escape_ascii(text)))
    );
  }
  return BashScalar{std::string{core::trim(text)}, std::move(*raw)};
}

auto BashScalar::parse(std::string_view text, ShellOracle const& oracle) -> Result<BashScalar> {
  auto scalar = from_escaped(text, oracle);
  if (scalar) {
    return scalar;
  }
  core::log::debug("parse: falling back to literal text: {}", scalar.error());
  return from_raw(text, oracle);
}

auto BashScalar::from_path(std::filesystem::path const& path, ShellOracle const& oracle) -> Result<BashScalar> {
  return from_raw(path.native(), oracle);
}

auto BashScalar::source() const noexcept -> std::string const& {
  return escaped_;
}

auto BashScalar::as_raw() const noexcept -> std::string const& {
  return raw_;
}

auto BashScalar::as_utf8() const -> Result<std::string_view> {
  if (!core::is_valid_utf8(raw_)) {
    return core::fail("invalid UTF-8: {}", core::repr(raw_));
  }
  return std::string_view{raw_};
}

auto BashScalar::to_utf8_lossy() const -> std::string {
  return core::to_utf8_lossy(raw_);
}

auto BashScalar::as_repr() const -> std::string {
  return core::repr(raw_);
}

auto BashScalar::as_path() const -> std::filesystem::path {
  return std::filesystem::path{raw_};
}

auto BashScalar::arrayize(ShellOracle const& oracle) const -> Result<BashArray> {
  auto script = fmt::format(
      "set -f\n"
      "INPUT={}\n"
      "read -r -a {} <<< \"$INPUT\"",
      escaped_,
      core::SENTINEL_VAR
  );
  auto output = oracle.run_with_output(script);
  if (!output) {
    return std::unexpected(output.error());
  }
  return BashArray::parse(*output, oracle);
}

auto BashScalar::mapfile(char delimiter, ShellOracle const& oracle) const -> Result<BashArray> {
  auto script = fmt::format(
      "declare -a {0}=()\n"
      "INPUT={1}\n"
      "mapfile -d $'\\x{2:02x}' -t {0} 1>&- < <(printf '%s' \"$INPUT\")",
      core::SENTINEL_VAR,
      escaped_,
      static_cast<unsigned char>(delimiter)
  );
  auto output = oracle.run_with_output(script);
  if (!output) {
    return std::unexpected(output.error());
  }
  return BashArray::parse(*output, oracle);
}

auto BashScalar::reescape(ShellOracle const& oracle) const -> Result<BashScalar> {
  return from_raw(raw_, oracle);
}

auto ScalarHash::operator()(BashScalar const& scalar) const noexcept -> std::size_t {
  return std::hash<std::string_view>{}(scalar.as_raw());
}

auto ScalarHash::operator()(std::string_view raw) const noexcept -> std::size_t {
  return std::hash<std::string_view>{}(raw);
}

} // namespace initbench::bash
