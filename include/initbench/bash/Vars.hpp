#pragma once

#include "initbench/core/Error.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/Strings.hpp"

#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace initbench::bash {

// Parses `NAME=VALUE` lines, splitting each at its first '='. Blank lines are
// skipped. Both parsers take a string_view and return a Result.
template<typename ParseKey, typename ParseValue>
[[nodiscard]] auto parse_vars(std::string_view text, ParseKey parse_key, ParseValue parse_value) {
  using Key   = typename std::invoke_result_t<ParseKey&, std::string_view>::value_type;
  using Value = typename std::invoke_result_t<ParseValue&, std::string_view>::value_type;
  using Vars  = std::vector<std::pair<Key, Value>>;

  if (!core::is_valid_utf8(text)) {
    return core::Result<Vars>{core::fail("invalid UTF-8 in variable listing: {}", core::repr(text))};
  }

  Vars vars;
  while (!text.empty()) {
    auto newline = text.find('\n');
    auto line    = text.substr(0, newline);
    text         = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);

    if (core::trim(line).empty()) {
      continue;
    }
    core::log::trace("parse_vars: {}", line);

    auto equals = line.find('=');
    if (equals == std::string_view::npos) {
      return core::Result<Vars>{core::fail("missing variable assignment: {}", line)};
    }

    auto key = parse_key(line.substr(0, equals));
    if (!key) {
      return core::Result<Vars>{std::unexpected(key.error())};
    }
    auto value = parse_value(line.substr(equals + 1));
    if (!value) {
      return core::Result<Vars>{std::unexpected(value.error())};
    }
    vars.emplace_back(std::move(*key), std::move(*value));
  }
  return core::Result<Vars>{std::move(vars)};
}

} // namespace initbench::bash
