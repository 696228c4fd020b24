#include "shpure/ArgParser.hpp"

#include "shpure/Constants.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdio>
#include <expected>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace shpure::cli {

bool Arguments::has(std::string const& name) const noexcept {
  return args_.contains(name);
}

Option::Option(std::string name, std::string short_name) noexcept
    : name_{std::move(name)}, short_name_{std::move(short_name)} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::value(std::string value_name) noexcept -> Option& {
  value_name_ = std::move(value_name);
  return *this;
}

auto Option::default_value(std::string value) noexcept -> Option& {
  default_value_ = std::move(value);
  return *this;
}

auto Option::sets(bool config::PurifyOptions::*field, bool to) -> Option& {
  setter_ = [field, to](config::PurifyOptions& options, std::string const&) -> core::Result<void> {
    options.*field = to;
    return {};
  };
  return *this;
}

auto Option::sets(bool config::FormatOptions::*field, bool to) -> Option& {
  setter_ = [field, to](config::PurifyOptions& options, std::string const&) -> core::Result<void> {
    options.format_.*field = to;
    return {};
  };
  return *this;
}

auto Option::applies(Setter setter) -> Option& {
  setter_ = std::move(setter);
  return *this;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc, std::string usage) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)}, usage_{std::move(usage)} {}

auto ArgumentParser::add_argument(std::string name, std::string short_name) noexcept -> Option& {
  options_.emplace_back(std::move(name), std::move(short_name));
  return options_.back();
}

auto ArgumentParser::find_long(std::string_view name) const noexcept -> Option const* {
  auto it = std::ranges::find_if(options_, [name](Option const& opt) { return opt.name_ == name; });
  return it == options_.end() ? nullptr : &*it;
}

auto ArgumentParser::find_short(char name) const noexcept -> Option const* {
  auto it = std::ranges::find_if(options_, [name](Option const& opt) {
    return !opt.short_name_.empty() && opt.short_name_.front() == name;
  });
  return it == options_.end() ? nullptr : &*it;
}

auto ArgumentParser::parse(int argc, char const* const* argv) const -> core::Result<Arguments> {
  Arguments result;

  for (auto const& option : options_) {
    if (option.default_value_) {
      result.args_[option.name_] = *option.default_value_;
    }
  }

  // The value of `option` is the next argument unless that one is an option itself
  auto next_value = [&](Option const& option, int& i, std::string const& spelled) -> core::Result<void> {
    if (i + 1 >= argc || std::string_view{argv[i + 1]}.starts_with("-")) {
      return std::unexpected(fmt::format("Option {} requires a value", spelled));
    }
    result.args_[option.name_] = argv[++i];
    return {};
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg{argv[i]};

    if (arg == "--") {
      // everything after `--` is positional
      for (++i; i < argc; ++i) {
        result.positional_.emplace_back(argv[i]);
      }
    } else if (arg.starts_with("--")) {
      auto eq_pos = arg.find('=');
      auto name   = arg.substr(2, eq_pos == std::string_view::npos ? std::string_view::npos : eq_pos - 2);

      auto const* option = find_long(name);
      if (option == nullptr) {
        return std::unexpected(fmt::format("Unknown option: --{}", name));
      }

      if (!option->takes_value()) {
        if (eq_pos != std::string_view::npos) {
          return std::unexpected(fmt::format("Flag option --{} does not accept a value", name));
        }
        result.args_[option->name_] = "true";
      } else if (eq_pos != std::string_view::npos) {
        result.args_[option->name_] = arg.substr(eq_pos + 1);
      } else if (auto ok = next_value(*option, i, fmt::format("--{}", name)); !ok) {
        return std::unexpected(ok.error());
      }
    } else if (arg.starts_with("-") && arg.size() > 1) {
      // A cluster of short flags; only the last one may take a value
      for (size_t j = 1; j < arg.size(); ++j) {
        auto const* option = find_short(arg[j]);
        if (option == nullptr) {
          return std::unexpected(fmt::format("Unknown option: -{}", arg[j]));
        }

        if (!option->takes_value()) {
          result.args_[option->name_] = "true";
          continue;
        }
        if (j < arg.size() - 1) {
          return std::unexpected(
              fmt::format("Option -{} requires a value and cannot be combined with other short options", arg[j])
          );
        }
        if (auto ok = next_value(*option, i, fmt::format("-{}", arg[j])); !ok) {
          return std::unexpected(ok.error());
        }
      }
    } else {
      result.positional_.emplace_back(arg);
    }
  }

  return result;
}

auto ArgumentParser::apply(Arguments const& args, config::PurifyOptions base) const
    -> core::Result<config::PurifyOptions> {
  for (auto const& option : options_) {
    auto it = args.args_.find(option.name_);
    if (!option.setter_ || it == args.args_.end()) {
      continue;
    }
    if (auto ok = option.setter_(base, option.takes_value() ? it->second : std::string{}); !ok) {
      return std::unexpected(ok.error());
    }
  }
  return base;
}

auto ArgumentParser::help() const -> std::string {
  auto out = fmt::format("Usage: {}", name_);
  if (!options_.empty()) {
    out += " [OPTIONS]";
  }
  if (!usage_.empty()) {
    out += " " + usage_;
  }
  out += "\n\n";

  if (!desc_.empty()) {
    out += desc_ + "\n\n";
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

      if (option.takes_value()) {
        out += fmt::format(" <{}>", option.value_name_);
      }

      if (!option.description_.empty()) {
        out += fmt::format("\n    {}", option.description_);
      }

      if (option.default_value_) {
        out += fmt::format(" (default: {})", *option.default_value_);
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
  fmt::print("{} {} {}\n", constant::EXE_NAME, constant::EXE_DESC, constant::VERSION);
}

namespace {

auto set_max_line_length(config::PurifyOptions& options, std::string const& value) -> core::Result<void> {
  std::size_t limit = 0;

  auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
  if (ec != std::errc{} || end != value.data() + value.size() || limit == 0) {
    return std::unexpected(fmt::format("--max-line-length expects a positive number, got '{}'", value));
  }
  options.format_.max_line_length_ = limit;
  return {};
}

} // namespace

auto create_default_arg_parser() -> ArgumentParser {
  using config::FormatOptions;
  using config::PurifyOptions;

  // clang-format off
  ArgumentParser parser(std::string{constant::EXE_NAME}, std::string{constant::EXE_DESC}, "FILE");

  parser.add_argument("dialect", "d")
    .value("dialect")
    .desc("Input dialect: shell, make or docker (default: from the file name)");
  parser.add_argument("output", "o")
    .value("file")
    .desc("Write the purified text to this file instead of stdout");
  parser.add_argument("report", "r")
    .value("format")
    .desc("Print a report to stderr: text, json or markdown");
  parser.add_argument("config", "c")
    .value("file")
    .desc("Read options from a JSON file; flags override it");
  parser.add_argument("no-idempotency")
    .sets(&PurifyOptions::strict_idempotency_, false)
    .desc("Disable idempotency rules");
  parser.add_argument("no-determinism")
    .sets(&PurifyOptions::remove_non_deterministic_, false)
    .desc("Disable determinism and reproducibility rules");
  parser.add_argument("no-side-effects")
    .sets(&PurifyOptions::track_side_effects_, false)
    .desc("Disable side-effect tracking");
  parser.add_argument("type-check")
    .sets(&PurifyOptions::type_check_, true)
    .desc("Enable the gradual type check");
  parser.add_argument("emit-guards")
    .sets(&PurifyOptions::emit_guards_, true)
    .desc("Insert runtime guards for annotated variables");
  parser.add_argument("type-strict")
    .sets(&PurifyOptions::type_strict_, true)
    .desc("Report type diagnostics with high severity");
  parser.add_argument("preserve-formatting")
    .sets(&FormatOptions::preserve_formatting_, true)
    .desc("Keep blank lines and line continuations");
  parser.add_argument("skip-blank-line-removal")
    .sets(&FormatOptions::skip_blank_line_removal_, true)
    .desc("Keep blank lines");
  parser.add_argument("skip-consolidation")
    .sets(&FormatOptions::skip_consolidation_, true)
    .desc("Keep line continuations as written");
  parser.add_argument("max-line-length")
    .value("columns")
    .applies(set_max_line_length)
    .desc("Wrap lines longer than this");
  parser.add_argument("verbose", "v")
    .desc("Enable verbose output");
  parser.add_argument("help", "h")
    .desc("Show help message");
  parser.add_argument("version", "V")
    .desc("Show version message");

  return parser;
  // clang-format on
}

} // namespace shpure::cli
