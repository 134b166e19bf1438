#include "initbench/core/Strings.hpp"

#include <fmt/format.h>

namespace initbench::core {

namespace {

constexpr std::string_view WHITESPACE  = " \t\n\r\f\v";
constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence at `pos`, or 0 with `invalid_len` set to the
// length of the maximal invalid prefix.
auto decode_utf8(std::string_view bytes, size_t pos, size_t& invalid_len) noexcept -> size_t {
  auto lead = static_cast<unsigned char>(bytes[pos]);
  if (lead < 0x80) {
    return 1;
  }

  size_t        needed = 0;
  unsigned char lower  = 0x80;
  unsigned char upper  = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    needed = 1;
  } else if (lead == 0xE0) {
    needed = 2;
    lower  = 0xA0;
  } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
    needed = 2;
  } else if (lead == 0xED) {
    needed = 2;
    upper  = 0x9F;
  } else if (lead == 0xF0) {
    needed = 3;
    lower  = 0x90;
  } else if (lead >= 0xF1 && lead <= 0xF3) {
    needed = 3;
  } else if (lead == 0xF4) {
    needed = 3;
    upper  = 0x8F;
  } else {
    invalid_len = 1;
    return 0;
  }

  for (size_t i = 1; i <= needed; ++i) {
    if (pos + i >= bytes.size()) {
      invalid_len = i;
      return 0;
    }
    auto next = static_cast<unsigned char>(bytes[pos + i]);
    if (next < lower || next > upper) {
      invalid_len = i;
      return 0;
    }
    lower = 0x80;
    upper = 0xBF;
  }
  return needed + 1;
}

void push_hex(std::string& out, unsigned char byte) {
  out += fmt::format("\\x{:02X}", byte);
}

} // namespace

auto trim(std::string_view text) noexcept -> std::string_view {
  auto first = text.find_first_not_of(WHITESPACE);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

auto to_lower(std::string_view text) -> std::string {
  std::string out{text};
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

auto lines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> result;
  auto                          remaining = trim(text);
  bool                          started   = false;
  while (!remaining.empty()) {
    auto             newline = remaining.find('\n');
    std::string_view line    = remaining.substr(0, newline);
    if (started || !trim(line).empty()) {
      started = true;
      result.push_back(line);
    }
    if (newline == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(newline + 1);
  }
  return result;
}

auto escape_ascii(std::string_view bytes) -> std::string {
  std::string out;
  out.reserve(bytes.size());
  for (char c : bytes) {
    switch (c) {
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      case '\r': out += "\\r"; break;
      case '\\': out += "\\\\"; break;
      case '\'': out += "\\'"; break;
      case '"': out += "\\\""; break;
      default:
        if (c >= 0x20 && c < 0x7F) {
          out.push_back(c);
        } else {
          out += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
        }
    }
  }
  return out;
}

auto repr(std::string_view bytes) -> std::string {
  std::string out = "b\"";
  size_t      pos = 0;
  while (pos < bytes.size()) {
    size_t invalid_len = 0;
    size_t valid_len   = decode_utf8(bytes, pos, invalid_len);
    if (valid_len == 0) {
      for (size_t i = 0; i < invalid_len; ++i) {
        push_hex(out, static_cast<unsigned char>(bytes[pos + i]));
      }
      pos += invalid_len;
      continue;
    }
    if (valid_len > 1) {
      out.append(bytes.substr(pos, valid_len));
      pos += valid_len;
      continue;
    }

    char c = bytes[pos++];
    switch (c) {
      case '\0': out += "\\0"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      case '\r': out += "\\r"; break;
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      default:
        if (c >= 0x20 && c < 0x7F) {
          out.push_back(c);
        } else {
          push_hex(out, static_cast<unsigned char>(c));
        }
    }
  }
  out.push_back('"');
  return out;
}

auto is_valid_utf8(std::string_view bytes) noexcept -> bool {
  size_t pos = 0;
  while (pos < bytes.size()) {
    size_t invalid_len = 0;
    size_t valid_len   = decode_utf8(bytes, pos, invalid_len);
    if (valid_len == 0) {
      return false;
    }
    pos += valid_len;
  }
  return true;
}

auto to_utf8_lossy(std::string_view bytes) -> std::string {
  std::string out;
  out.reserve(bytes.size());
  size_t pos = 0;
  while (pos < bytes.size()) {
    size_t invalid_len = 0;
    size_t valid_len   = decode_utf8(bytes, pos, invalid_len);
    if (valid_len == 0) {
      out.append(REPLACEMENT);
      pos += invalid_len;
      continue;
    }
    out.append(bytes.substr(pos, valid_len));
    pos += valid_len;
  }
  return out;
}

} // namespace initbench::core
