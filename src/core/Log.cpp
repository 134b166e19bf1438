#include "initbench/core/Log.hpp"
#include "initbench/core/Constants.hpp"
#include "initbench/core/Strings.hpp"

#include <atomic>
#include <cstdlib>

namespace initbench::core::log {

namespace {

std::atomic<Level> current_level{Level::Warn}; // NOLINT

} // namespace

auto level() noexcept -> Level {
  return current_level.load(std::memory_order_relaxed);
}

void set_level(Level level) noexcept {
  current_level.store(level, std::memory_order_relaxed);
}

void init_from_env() {
  char const* value = std::getenv(LOG_ENV_VAR);
  if (value == nullptr) {
    return;
  }
  if (auto parsed = parse_level(value)) {
    set_level(*parsed);
  } else {
    warn("ignoring invalid {}=\"{}\"", LOG_ENV_VAR, escape_ascii(value));
  }
}

auto parse_level(std::string_view name) -> std::optional<Level> {
  auto lowered = to_lower(trim(name));
  if (lowered == "trace") {
    return Level::Trace;
  }
  if (lowered == "debug") {
    return Level::Debug;
  }
  if (lowered == "info") {
    return Level::Info;
  }
  if (lowered == "warn" || lowered == "warning") {
    return Level::Warn;
  }
  if (lowered == "error") {
    return Level::Error;
  }
  if (lowered == "off") {
    return Level::Off;
  }
  return std::nullopt;
}

auto level_name(Level level) noexcept -> std::string_view {
  switch (level) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

} // namespace initbench::core::log
