#pragma once

#include "initbench/core/Error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace initbench::cli {

class Option;
class Arguments;

class ArgumentParser {
  std::string         name_;
  std::string         desc_;
  std::vector<Option> options_;

public:
  explicit ArgumentParser(std::string name = "", std::string desc = "") noexcept;

  auto parse(int argc, char const* const* argv) const -> core::Result<Arguments>;
  auto add_argument(std::string name, std::string short_name = "") noexcept -> Option&;

  [[nodiscard]] auto help() const -> std::string;
  void               print_help() const;

  static void print_version();
};

auto create_default_arg_parser() -> ArgumentParser;

class Option {
  std::string                             name_;
  std::string                             short_name_;
  std::string                             description_;
  std::optional<std::vector<std::string>> default_value_;
  std::size_t                             nargs_ = 0;

public:
  Option(std::string name, std::string short_name) noexcept;

  auto desc(std::string desc) noexcept -> Option&;
  auto default_value(std::string value) noexcept -> Option&;
  auto nargs(std::size_t n) noexcept -> Option&;

  friend class ArgumentParser;
};

class Arguments {
  std::unordered_map<std::string, std::vector<std::string>> args_;

public:
  Arguments() = default;

  [[nodiscard]] bool has(std::string const& name) const noexcept;
  // First value of the option, when it has one.
  [[nodiscard]] auto get(std::string const& name) const -> std::optional<std::string>;

  friend class ArgumentParser;
};

} // namespace initbench::cli
