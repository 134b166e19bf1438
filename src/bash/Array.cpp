#include "initbench/bash/Array.hpp"
#include "initbench/bash/Vars.hpp"
#include "initbench/core/Constants.hpp"
#include "initbench/core/Log.hpp"
#include "initbench/core/Strings.hpp"

#include <algorithm>
#include <charconv>

#include <fmt/ranges.h>

namespace initbench::bash {

namespace {

auto declare_flag(ArrayKind kind) -> std::string_view {
  return kind == ArrayKind::Associative ? "-A" : "-a";
}

auto parse_index(std::string_view text) -> Result<BashArray::Index> {
  BashArray::Index index = 0;
  auto const* end        = text.data() + text.size();
  auto [ptr, ec]         = std::from_chars(text.data(), end, index);
  if (ec != std::errc{} || ptr != end) {
    return core::fail("invalid array index: \"{}\"", core::escape_ascii(text));
  }
  return index;
}

// Canonical quoting of a value inside an array literal, where an empty word
// would vanish.
auto element_source(BashScalar const& value) -> std::string_view {
  return value.source().empty() ? std::string_view{"''"} : std::string_view{value.source()};
}

auto build_source(BashArray::IndexedEntries const& entries) -> std::string {
  bool dense = true;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].first != static_cast<BashArray::Index>(i)) {
      dense = false;
      break;
    }
  }

  std::vector<std::string> words;
  words.reserve(entries.size());
  for (auto const& [index, value] : entries) {
    if (dense) {
      words.emplace_back(element_source(value));
    } else {
      words.push_back(fmt::format("[{}]={}", index, element_source(value)));
    }
  }
  return fmt::format("({})", fmt::join(words, " "));
}

auto build_source(BashArray::AssociativeEntries const& entries) -> std::string {
  std::vector<std::string> words;
  words.reserve(entries.size());
  for (auto const& [key, value] : entries) {
    words.push_back(fmt::format("[{}]={}", element_source(key), element_source(value)));
  }
  return fmt::format("({})", fmt::join(words, " "));
}

} // namespace

BashArray::BashArray(std::string source, Entries entries)
    : source_(std::move(source)),
      entries_(std::move(entries)) {}

auto BashArray::is_array_source(std::string_view text) noexcept -> bool {
  return !text.empty() && text.front() == '(' && text.back() == ')';
}

auto BashArray::parse(std::string_view text, ShellOracle const& oracle) -> Result<BashArray> {
  text = core::trim(text);
  if (!is_array_source(text)) {
    return core::fail("invalid array source: {}", text);
  }
  core::log::trace("array: parsing {}", text);

  auto script = fmt::format(
      "declare -a ARR={}\n"
      "for KEY in \"${{!ARR[@]}}\"; do\n"
      "  printf '%q=%q\\n' \"$KEY\" \"${{ARR[$KEY]}}\"\n"
      "done",
      text
  );
  auto output = oracle.run(script);
  if (!output) {
    return std::unexpected(output.error());
  }

  auto entries = parse_vars(*output, parse_index, [&oracle](std::string_view value) {
    return BashScalar::from_escaped(value, oracle);
  });
  if (!entries) {
    return std::unexpected(entries.error());
  }
  return BashArray{std::string{text}, Entries{std::move(*entries)}};
}

auto BashArray::parse_associative(std::string_view text, ShellOracle const& oracle) -> Result<BashArray> {
  text = core::trim(text);
  if (!is_array_source(text)) {
    return core::fail("invalid array source: {}", text);
  }
  core::log::trace("array: parsing associative {}", text);

  // `%q` keeps '=' unescaped, so keys and values go on separate lines.
  auto script = fmt::format(
      "declare -A ARR={}\n"
      "for KEY in \"${{!ARR[@]}}\"; do\n"
      "  printf 'key=%q\\nvalue=%q\\n' \"$KEY\" \"${{ARR[$KEY]}}\"\n"
      "done",
      text
  );
  auto output = oracle.run(script);
  if (!output) {
    return std::unexpected(output.error());
  }

  auto verbatim = [](std::string_view part) -> Result<std::string_view> { return part; };
  auto lines    = parse_vars(*output, verbatim, verbatim);
  if (!lines) {
    return std::unexpected(lines.error());
  }
  if (lines->size() % 2 != 0) {
    return core::fail("incomplete associative array listing for {}", text);
  }

  AssociativeEntries entries;
  entries.reserve(lines->size() / 2);
  for (std::size_t i = 0; i < lines->size(); i += 2) {
    auto const& [key_name, key_text]     = (*lines)[i];
    auto const& [value_name, value_text] = (*lines)[i + 1];
    if (key_name != "key" || value_name != "value") {
      return core::fail("unexpected associative array listing: {}={}", key_name, key_text);
    }

    auto key = BashScalar::from_escaped(key_text, oracle);
    if (!key) {
      return std::unexpected(key.error());
    }
    auto value = BashScalar::from_escaped(value_text, oracle);
    if (!value) {
      return std::unexpected(value.error());
    }
    entries.emplace_back(std::move(*key), std::move(*value));
  }
  return BashArray{std::string{text}, Entries{std::move(entries)}};
}

auto BashArray::source() const noexcept -> std::string const& {
  return source_;
}

auto BashArray::kind() const noexcept -> ArrayKind {
  return std::holds_alternative<IndexedEntries>(entries_) ? ArrayKind::Indexed : ArrayKind::Associative;
}

auto BashArray::entries() const noexcept -> Entries const& {
  return entries_;
}

auto BashArray::indices() const -> std::vector<Index> {
  std::vector<Index> result;
  if (auto const* indexed = std::get_if<IndexedEntries>(&entries_)) {
    result.reserve(indexed->size());
    for (auto const& entry : *indexed) {
      result.push_back(entry.first);
    }
  }
  return result;
}

auto BashArray::keys() const -> std::vector<BashScalar> {
  std::vector<BashScalar> result;
  if (auto const* associative = std::get_if<AssociativeEntries>(&entries_)) {
    result.reserve(associative->size());
    for (auto const& entry : *associative) {
      result.push_back(entry.first);
    }
  }
  return result;
}

auto BashArray::values() const -> std::vector<BashScalar> {
  return std::visit(
      [](auto const& entries) {
        std::vector<BashScalar> result;
        result.reserve(entries.size());
        for (auto const& entry : entries) {
          result.push_back(entry.second);
        }
        return result;
      },
      entries_
  );
}

auto BashArray::raw_values() const -> std::vector<std::string> {
  return std::visit(
      [](auto const& entries) {
        std::vector<std::string> result;
        result.reserve(entries.size());
        for (auto const& entry : entries) {
          result.push_back(entry.second.as_raw());
        }
        return result;
      },
      entries_
  );
}

auto BashArray::size() const noexcept -> std::size_t {
  return std::visit([](auto const& entries) { return entries.size(); }, entries_);
}

auto BashArray::empty() const noexcept -> bool {
  return size() == 0;
}

auto BashArray::to_bash_string(ShellOracle const& oracle) const -> Result<BashScalar> {
  auto script = fmt::format(
      "declare {} ARRAY={}\n"
      "{}=\"$ARRAY\"",
      declare_flag(kind()),
      source_,
      core::SENTINEL_VAR
  );
  auto output = oracle.run_with_output(script);
  if (!output) {
    return std::unexpected(output.error());
  }
  return BashScalar::from_escaped(*output, oracle);
}

auto BashArray::to_concatenated_string(ShellOracle const& oracle) const -> Result<BashScalar> {
  auto script = fmt::format(
      "declare {} ARRAY={}\n"
      "{}=\"${{ARRAY[*]}}\"",
      declare_flag(kind()),
      source_,
      core::SENTINEL_VAR
  );
  auto output = oracle.run_with_output(script);
  if (!output) {
    return std::unexpected(output.error());
  }
  return BashScalar::from_escaped(*output, oracle);
}

auto BashArray::reescape(ShellOracle const& oracle) const -> Result<BashArray> {
  if (auto const* indexed = std::get_if<IndexedEntries>(&entries_)) {
    IndexedEntries entries;
    entries.reserve(indexed->size());
    for (auto const& [index, value] : *indexed) {
      auto escaped = value.reescape(oracle);
      if (!escaped) {
        return std::unexpected(escaped.error());
      }
      entries.emplace_back(index, std::move(*escaped));
    }
    auto source = build_source(entries);
    core::log::trace("array: reescaped {} => {}", source_, source);
    return BashArray{std::move(source), Entries{std::move(entries)}};
  }

  AssociativeEntries entries;
  auto const&        associative = std::get<AssociativeEntries>(entries_);
  entries.reserve(associative.size());
  for (auto const& [key, value] : associative) {
    auto escaped_key = key.reescape(oracle);
    if (!escaped_key) {
      return std::unexpected(escaped_key.error());
    }
    auto escaped_value = value.reescape(oracle);
    if (!escaped_value) {
      return std::unexpected(escaped_value.error());
    }
    entries.emplace_back(std::move(*escaped_key), std::move(*escaped_value));
  }
  auto source = build_source(entries);
  core::log::trace("array: reescaped {} => {}", source_, source);
  return BashArray{std::move(source), Entries{std::move(entries)}};
}

auto operator==(BashArray const& lhs, BashArray const& rhs) -> bool {
  if (lhs.entries_.index() != rhs.entries_.index()) {
    return false;
  }
  if (auto const* indexed = std::get_if<BashArray::IndexedEntries>(&lhs.entries_)) {
    return *indexed == std::get<BashArray::IndexedEntries>(rhs.entries_);
  }

  auto const& left  = std::get<BashArray::AssociativeEntries>(lhs.entries_);
  auto const& right = std::get<BashArray::AssociativeEntries>(rhs.entries_);
  if (left.size() != right.size()) {
    return false;
  }
  return std::ranges::all_of(left, [&right](auto const& entry) {
    return std::ranges::find(right, entry) != right.end();
  });
}

} // namespace initbench::bash
