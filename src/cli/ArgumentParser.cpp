#include "initbench/cli/ArgumentParser.hpp"
#include "initbench/core/Constants.hpp"

#include <algorithm>
#include <string_view>

#include <fmt/format.h>

namespace initbench::cli {

namespace {

// Collects up to `nargs` values following argv[i], stopping at the next option.
auto take_values(int argc, char const* const* argv, int& i, std::size_t nargs) -> std::vector<std::string> {
  std::vector<std::string> values;
  values.reserve(nargs);
  for (std::size_t k = 0; k < nargs && i + 1 < argc; ++k) {
    if (std::string_view{argv[i + 1]}.starts_with("-")) {
      break;
    }
    ++i;
    values.emplace_back(argv[i]);
  }
  return values;
}

} // namespace

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

auto Arguments::get(std::string const& name) const -> std::optional<std::string> {
  auto it = args_.find(name);
  if (it == args_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.front();
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::default_value(std::string value) noexcept -> Option& {
  default_value_ = {std::move(value)};
  return *this;
}

auto Option::nargs(std::size_t n) noexcept -> Option& {
  nargs_ = n;
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) noexcept -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::parse(int argc, char const* const* argv) const -> core::Result<Arguments> {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  for (int i = 1; i < argc; ++i) {
    if (std::string_view arg{argv[i]}; arg.starts_with("--")) {
      // Long option
      std::string_view name        = arg.substr(2);
      std::size_t      eq_pos      = name.find('=');
      std::string_view option_name = name.substr(0, eq_pos);

      auto option_it = std::ranges::find_if(options_, [option_name](Option const& opt) {
        return opt.name_ == option_name;
      });

      if (option_it == options_.end()) {
        return core::fail("unknown option: --{}", option_name);
      }

      if (option_it->nargs_ == 0) {
        if (eq_pos != std::string_view::npos) {
          return core::fail("flag option --{} does not accept a value", option_name);
        }
        result.args_[option_it->name_] = std::vector<std::string>{"true"};
        continue;
      }

      std::vector<std::string> values;
      if (eq_pos != std::string_view::npos) {
        values.emplace_back(name.substr(eq_pos + 1));
      } else {
        values = take_values(argc, argv, i, option_it->nargs_);
      }

      if (values.size() < option_it->nargs_) {
        return core::fail("option --{} requires {} arguments, got {}", option_name, option_it->nargs_, values.size());
      }
      result.args_[option_it->name_] = std::move(values);
    } else if (arg.starts_with("-") && arg.size() > 1) {
      // Short option(s)
      for (std::size_t j = 1; j < arg.size(); ++j) {
        char short_opt{arg[j]};

        auto option_it = std::ranges::find_if(options_, [short_opt](Option const& opt) {
          return !opt.short_name_.empty() && opt.short_name_.front() == short_opt;
        });

        if (option_it == options_.end()) {
          return core::fail("unknown option: -{}", short_opt);
        }

        if (option_it->nargs_ == 0) {
          result.args_[option_it->name_] = {"true"};
          continue;
        }

        if (j < arg.size() - 1) {
          return core::fail("option -{} requires a value and cannot be combined with other short options", short_opt);
        }

        auto values = take_values(argc, argv, i, option_it->nargs_);
        if (values.size() < option_it->nargs_) {
          return core::fail("option -{} requires {} arguments, got {}", short_opt, option_it->nargs_, values.size());
        }
        result.args_[option_it->name_] = std::move(values);
      }
    } else {
      return core::fail("unexpected argument: {}", arg);
    }
  }

  return result;
}

auto ArgumentParser::help() const -> std::string {
  std::string out = fmt::format("Usage: {}", name_);
  if (!options_.empty()) {
    out += " [OPTIONS]";
  }
  out += "\n\n";

  if (!desc_.empty()) {
    out += fmt::format("{}\n\n", desc_);
  }

  if (!options_.empty()) {
    out += "Options:\n";
    for (auto const& option : options_) {
      out += "  ";

      if (!option.short_name_.empty()) {
        out += fmt::format("-{}", option.short_name_);
        if (!option.name_.empty()) {
          out += ", ";
        }
      }

      if (!option.name_.empty()) {
        out += fmt::format("--{}", option.name_);
      }

      if (option.nargs_ > 0) {
        out += " <value>";
        if (option.nargs_ > 1) {
          out += "...";
        }
      }

      if (!option.description_.empty()) {
        out += fmt::format("\n    {}", option.description_);
      }

      if (option.default_value_) {
        out += fmt::format(" (default: {})", option.default_value_->front());
      }

      out += "\n";
    }
  }
  return out;
}

void ArgumentParser::print_help() const {
  fmt::print("{}", help());
}

void ArgumentParser::print_version() {
  fmt::print("{} {} {}\n", core::EXE_NAME, core::EXE_DESC, core::VERSION);
}

auto create_default_arg_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser(core::EXE_NAME, core::EXE_DESC);

  parser.add_argument("outdir", "o")
    .nargs(1)
    .default_value("output/")
    .desc("Directory for the generated presets and images");
  parser.add_argument("presets", "p")
    .nargs(1)
    .default_value(core::DEFAULT_PRESET_DIR)
    .desc("Directory with the *.preset files to mock");
  parser.add_argument("run", "r")
    .desc("Run mkinitcpio on every generated preset");
  parser.add_argument("verbose", "v")
    .desc("Enable verbose output");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

} // namespace initbench::cli
