#pragma once

#include "initbench/bash/Array.hpp"
#include "initbench/bash/Scalar.hpp"
#include "initbench/bash/ShellOracle.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace initbench::bash {

// The value of one Bash variable.
class BashValue {
  std::variant<BashScalar, BashArray> value_;

public:
  BashValue(BashScalar scalar);
  BashValue(BashArray array);

  // Text in parentheses is an indexed array, anything else a scalar.
  [[nodiscard]] static auto from_source(std::string_view text, ShellOracle const& oracle = ShellOracle::system())
      -> Result<BashValue>;

  [[nodiscard]] auto source() const noexcept -> std::string const&;
  [[nodiscard]] auto is_scalar() const noexcept -> bool;
  [[nodiscard]] auto is_array() const noexcept -> bool;
  [[nodiscard]] auto scalar() const noexcept -> BashScalar const*;
  [[nodiscard]] auto array() const noexcept -> BashArray const*;
  [[nodiscard]] auto get() const noexcept -> std::variant<BashScalar, BashArray> const&;

  friend auto operator==(BashValue const& lhs, BashValue const& rhs) -> bool = default;
};

// Variables captured from one Bash run, keyed by name.
class Environment {
public:
  using Map = std::unordered_map<BashScalar, BashValue, ScalarHash, ScalarEqual>;

private:
  Map vars_;

public:
  Environment() = default;
  explicit Environment(Map vars);

  // Parses `declare` output. A repeated name keeps its last value.
  [[nodiscard]] static auto parse(std::string_view text, ShellOracle const& oracle = ShellOracle::system())
      -> Result<Environment>;

  [[nodiscard]] auto get(std::string_view name) const -> BashValue const*;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  // Removes the variable and hands it over.
  [[nodiscard]] auto take(std::string_view name) -> std::optional<BashValue>;
  void               insert_or_assign(BashScalar name, BashValue value);

  [[nodiscard]] auto size() const noexcept -> std::size_t;
  [[nodiscard]] auto empty() const noexcept -> bool;
  [[nodiscard]] auto vars() const noexcept -> Map const&;
};

// Sources `path` from its own directory with stdout closed, then captures every
// variable with `declare`. Bash's own variables are included.
[[nodiscard]] auto source(std::filesystem::path const& path, ShellOracle const& oracle = ShellOracle::system())
    -> Result<Environment>;

// Runs `script`, then captures every variable with `declare`.
[[nodiscard]] auto declare(std::string_view script, ShellOracle const& oracle = ShellOracle::system())
    -> Result<Environment>;

} // namespace initbench::bash
