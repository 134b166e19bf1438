#include "initbench/core/Error.hpp"

#include <cstring>

namespace initbench::core {

Error::Error(std::string message, std::optional<int> exit_code)
    : message_(std::move(message)), exit_code_(exit_code) {}

auto Error::message() const noexcept -> std::string const& {
  return message_;
}

auto Error::exit_code() const noexcept -> std::optional<int> {
  return exit_code_;
}

auto Error::with_context(std::string_view context) const -> Error {
  return Error{fmt::format("{}: {}", context, message_), exit_code_};
}

auto errno_error(std::string_view what, int err) -> Error {
  return Error{fmt::format("{}: {}", what, std::strerror(err))};
}

} // namespace initbench::core
