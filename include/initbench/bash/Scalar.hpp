#pragma once

#include "initbench/bash/ShellOracle.hpp"
#include "initbench/core/Error.hpp"

#include <compare>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace initbench::bash {

class BashArray;

// Quotes raw bytes the way Bash does. NUL bytes are dropped by Bash.
[[nodiscard]] auto escape(std::string_view raw, ShellOracle const& oracle = ShellOracle::system())
    -> Result<std::string>;

// Evaluates quoted text as the right-hand side of an assignment.
[[nodiscard]] auto unescape(std::string_view text, ShellOracle const& oracle = ShellOracle::system())
    -> Result<std::string>;

// A single Bash value, kept both as Bash source and as raw bytes. Comparison and
// hashing only look at the raw bytes.
class BashScalar {
  std::string escaped_;
  std::string raw_;

  BashScalar(std::string escaped, std::string raw);

public:
  [[nodiscard]] static auto from_raw(std::string_view raw, ShellOracle const& oracle = ShellOracle::system())
      -> Result<BashScalar>;
  [[nodiscard]] static auto from_escaped(std::string_view text, ShellOracle const& oracle = ShellOracle::system())
      -> Result<BashScalar>;
  // Quoted text when Bash accepts it, otherwise the text taken literally.
  [[nodiscard]] static auto parse(std::string_view text, ShellOracle const& oracle = ShellOracle::system())
      -> Result<BashScalar>;
  [[nodiscard]] static auto from_path(
      std::filesystem::path const& path,
      ShellOracle const&           oracle = ShellOracle::system()
  ) -> Result<BashScalar>;

  [[nodiscard]] auto source() const noexcept -> std::string const&;
  [[nodiscard]] auto as_raw() const noexcept -> std::string const&;
  [[nodiscard]] auto as_utf8() const -> Result<std::string_view>;
  [[nodiscard]] auto to_utf8_lossy() const -> std::string;
  [[nodiscard]] auto as_repr() const -> std::string;
  [[nodiscard]] auto as_path() const -> std::filesystem::path;

  // Word splitting with `read -a` under the default IFS.
  [[nodiscard]] auto arrayize(ShellOracle const& oracle = ShellOracle::system()) const -> Result<BashArray>;
  // Splitting at `delimiter` with `mapfile -d`. Empty fields are kept.
  [[nodiscard]] auto mapfile(char delimiter, ShellOracle const& oracle = ShellOracle::system()) const
      -> Result<BashArray>;

  // Same raw bytes, canonical quoting.
  [[nodiscard]] auto reescape(ShellOracle const& oracle = ShellOracle::system()) const -> Result<BashScalar>;

  friend auto operator==(BashScalar const& lhs, BashScalar const& rhs) noexcept -> bool {
    return lhs.raw_ == rhs.raw_;
  }
  friend auto operator<=>(BashScalar const& lhs, BashScalar const& rhs) noexcept -> std::strong_ordering {
    return lhs.raw_ <=> rhs.raw_;
  }
  friend auto operator==(BashScalar const& lhs, std::string_view rhs) noexcept -> bool {
    return lhs.raw_ == rhs;
  }
};

struct ScalarHash {
  using is_transparent = void;

  auto operator()(BashScalar const& scalar) const noexcept -> std::size_t;
  auto operator()(std::string_view raw) const noexcept -> std::size_t;
};

struct ScalarEqual {
  using is_transparent = void;

  auto operator()(BashScalar const& lhs, BashScalar const& rhs) const noexcept -> bool {
    return lhs == rhs;
  }
  auto operator()(BashScalar const& lhs, std::string_view rhs) const noexcept -> bool {
    return lhs == rhs;
  }
  auto operator()(std::string_view lhs, BashScalar const& rhs) const noexcept -> bool {
    return rhs == lhs;
  }
};

} // namespace initbench::bash

template<>
struct fmt::formatter<initbench::bash::BashScalar> : fmt::formatter<std::string_view> {
  template<typename FormatContext>
  auto format(initbench::bash::BashScalar const& scalar, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(scalar.to_utf8_lossy(), ctx);
  }
};
