#pragma once

#include <cstdio>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace initbench::core::log {

enum struct Level {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

auto level() noexcept -> Level;
void set_level(Level level) noexcept;

// Reads INITBENCH_LOG, leaving the current level untouched when unset or invalid.
void init_from_env();

[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<Level>;
[[nodiscard]] auto level_name(Level level) noexcept -> std::string_view;

[[nodiscard]] inline auto enabled(Level at) noexcept -> bool {
  return at >= level() && at != Level::Off;
}

template<typename... Args>
void write(Level at, fmt::format_string<Args...> format, Args&&... args) {
  if (!enabled(at)) {
    return;
  }
  fmt::print(stderr, "[{:<5} initbench] {}\n", level_name(at), fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Trace, format, std::forward<Args>(args)...);
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  write(Level::Error, format, std::forward<Args>(args)...);
}

} // namespace initbench::core::log
