#include "initbench/bash/Value.hpp"
#include "initbench/bash/Vars.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/Strings.hpp"

namespace initbench::bash {

namespace {

// 'text' with embedded single quotes spliced in as '\''.
auto single_quote(std::string_view text) -> std::string {
  std::string quoted{"'"};
  for (char ch : text) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted += ch;
    }
  }
  quoted += '\'';
  return quoted;
}

} // namespace

BashValue::BashValue(BashScalar scalar)
    : value_(std::move(scalar)) {}

BashValue::BashValue(BashArray array)
    : value_(std::move(array)) {}

auto BashValue::from_source(std::string_view text, ShellOracle const& oracle) -> Result<BashValue> {
  if (BashArray::is_array_source(core::trim(text))) {
    auto array = BashArray::parse(text, oracle);
    if (!array) {
      return std::unexpected(array.error());
    }
    return BashValue{std::move(*array)};
  }

  auto scalar = BashScalar::from_escaped(text, oracle);
  if (!scalar) {
    return std::unexpected(scalar.error());
  }
  return BashValue{std::move(*scalar)};
}

auto BashValue::source() const noexcept -> std::string const& {
  if (auto const* array = std::get_if<BashArray>(&value_)) {
    return array->source();
  }
  return std::get<BashScalar>(value_).source();
}

auto BashValue::is_scalar() const noexcept -> bool {
  return std::holds_alternative<BashScalar>(value_);
}

auto BashValue::is_array() const noexcept -> bool {
  return std::holds_alternative<BashArray>(value_);
}

auto BashValue::scalar() const noexcept -> BashScalar const* {
  return std::get_if<BashScalar>(&value_);
}

auto BashValue::array() const noexcept -> BashArray const* {
  return std::get_if<BashArray>(&value_);
}

auto BashValue::get() const noexcept -> std::variant<BashScalar, BashArray> const& {
  return value_;
}

Environment::Environment(Map vars)
    : vars_(std::move(vars)) {}

auto Environment::parse(std::string_view text, ShellOracle const& oracle) -> Result<Environment> {
  auto vars = parse_vars(
      text,
      [&oracle](std::string_view name) { return BashScalar::from_escaped(name, oracle); },
      [&oracle](std::string_view value) { return BashValue::from_source(value, oracle); }
  );
  if (!vars) {
    return std::unexpected(vars.error());
  }

  Environment env;
  for (auto& [name, value] : *vars) {
    env.insert_or_assign(std::move(name), std::move(value));
  }
  core::log::trace("environment: {} variables", env.size());
  return env;
}

auto Environment::get(std::string_view name) const -> BashValue const* {
  auto found = vars_.find(name);
  return found == vars_.end() ? nullptr : &found->second;
}

auto Environment::contains(std::string_view name) const -> bool {
  return vars_.find(name) != vars_.end();
}

auto Environment::take(std::string_view name) -> std::optional<BashValue> {
  auto found = vars_.find(name);
  if (found == vars_.end()) {
    return std::nullopt;
  }
  auto value = std::move(found->second);
  vars_.erase(found);
  return value;
}

void Environment::insert_or_assign(BashScalar name, BashValue value) {
  vars_.insert_or_assign(std::move(name), std::move(value));
}

auto Environment::size() const noexcept -> std::size_t {
  return vars_.size();
}

auto Environment::empty() const noexcept -> bool {
  return vars_.empty();
}

auto Environment::vars() const noexcept -> Map const& {
  return vars_;
}

auto source(std::filesystem::path const& path, ShellOracle const& oracle) -> Result<Environment> {
  auto location = resolve_file(path);
  if (!location) {
    return std::unexpected(location.error());
  }
  auto const& [dir, file] = *location;
  core::log::debug("source: {} in {}", file, dir.string());

  auto script = fmt::format("source {} 1>&-\ndeclare", single_quote(file));
  auto output = oracle.run_at(script, dir);
  if (!output) {
    return std::unexpected(output.error().with_context(fmt::format("while sourcing {}", path.string())));
  }
  return Environment::parse(*output, oracle);
}

auto declare(std::string_view script, ShellOracle const& oracle) -> Result<Environment> {
  auto output = oracle.run(fmt::format("{}\ndeclare", script));
  if (!output) {
    return std::unexpected(output.error());
  }
  return Environment::parse(*output, oracle);
}

} // namespace initbench::bash
