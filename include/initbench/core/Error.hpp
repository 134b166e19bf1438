#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace initbench::core {

class Error {
  std::string        message_;
  std::optional<int> exit_code_;

public:
  explicit Error(std::string message, std::optional<int> exit_code = std::nullopt);

  [[nodiscard]] auto message() const noexcept -> std::string const&;
  [[nodiscard]] auto exit_code() const noexcept -> std::optional<int>;

  // Prefixes "context: " to the message, keeping the exit code.
  [[nodiscard]] auto with_context(std::string_view context) const -> Error;
};

template<typename T>
using Result = std::expected<T, Error>;

template<typename... Args>
[[nodiscard]] auto fail(fmt::format_string<Args...> format, Args&&... args) -> std::unexpected<Error> {
  return std::unexpected(Error{fmt::format(format, std::forward<Args>(args)...)});
}

// "<what>: <strerror(err)>"
[[nodiscard]] auto errno_error(std::string_view what, int err) -> Error;

} // namespace initbench::core

template<>
struct fmt::formatter<initbench::core::Error> : fmt::formatter<std::string_view> {
  template<typename FormatContext>
  auto format(initbench::core::Error const& error, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(error.message(), ctx);
  }
};
