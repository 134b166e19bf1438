#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace initbench::core {

[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view;
[[nodiscard]] auto to_lower(std::string_view text) -> std::string;

// Splits trimmed text at '\n', skipping blank lines at the start.
[[nodiscard]] auto lines(std::string_view text) -> std::vector<std::string_view>;

// Printable ASCII kept as is, everything else as \n, \t, \r, \\, \', \" or \xHH.
[[nodiscard]] auto escape_ascii(std::string_view bytes) -> std::string;

// Byte string literal: b"..." with valid UTF-8 kept and invalid bytes as \xHH.
[[nodiscard]] auto repr(std::string_view bytes) -> std::string;

[[nodiscard]] auto is_valid_utf8(std::string_view bytes) noexcept -> bool;

// Replaces every maximal invalid UTF-8 subsequence with U+FFFD.
[[nodiscard]] auto to_utf8_lossy(std::string_view bytes) -> std::string;

} // namespace initbench::core
