#pragma once

#include "initbench/bash/Scalar.hpp"
#include "initbench/bash/ShellOracle.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace initbench::bash {

enum struct ArrayKind {
  Indexed,
  Associative
};

// A Bash array as (key, value) pairs in Bash's own iteration order. Indexed
// arrays may have holes.
class BashArray {
public:
  using Index              = std::int32_t;
  using IndexedEntries     = std::vector<std::pair<Index, BashScalar>>;
  using AssociativeEntries = std::vector<std::pair<BashScalar, BashScalar>>;
  using Entries            = std::variant<IndexedEntries, AssociativeEntries>;

private:
  std::string source_;
  Entries     entries_;

  BashArray(std::string source, Entries entries);

public:
  // Only checks for the enclosing parentheses. Bash rejects malformed contents.
  [[nodiscard]] static auto is_array_source(std::string_view text) noexcept -> bool;

  [[nodiscard]] static auto parse(std::string_view text, ShellOracle const& oracle = ShellOracle::system())
      -> Result<BashArray>;
  [[nodiscard]] static auto parse_associative(
      std::string_view   text,
      ShellOracle const& oracle = ShellOracle::system()
  ) -> Result<BashArray>;

  [[nodiscard]] auto source() const noexcept -> std::string const&;
  [[nodiscard]] auto kind() const noexcept -> ArrayKind;
  [[nodiscard]] auto entries() const noexcept -> Entries const&;

  // Empty for associative arrays.
  [[nodiscard]] auto indices() const -> std::vector<Index>;
  // Empty for indexed arrays.
  [[nodiscard]] auto keys() const -> std::vector<BashScalar>;
  [[nodiscard]] auto values() const -> std::vector<BashScalar>;
  [[nodiscard]] auto raw_values() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t;
  [[nodiscard]] auto empty() const noexcept -> bool;

  // `$ARRAY`: the element at index (or key) 0, empty when there is none.
  [[nodiscard]] auto to_bash_string(ShellOracle const& oracle = ShellOracle::system()) const -> Result<BashScalar>;
  // `${ARRAY[*]}`: all values joined with a space.
  [[nodiscard]] auto to_concatenated_string(ShellOracle const& oracle = ShellOracle::system()) const
      -> Result<BashScalar>;

  // Re-escapes every key and value and rebuilds the source from them.
  [[nodiscard]] auto reescape(ShellOracle const& oracle = ShellOracle::system()) const -> Result<BashArray>;

  // Associative arrays compare regardless of order. The source is ignored.
  friend auto operator==(BashArray const& lhs, BashArray const& rhs) -> bool;
};

} // namespace initbench::bash

template<>
struct fmt::formatter<initbench::bash::BashArray> : fmt::formatter<std::string_view> {
  template<typename FormatContext>
  auto format(initbench::bash::BashArray const& array, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(array.source(), ctx);
  }
};
