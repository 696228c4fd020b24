#include "shpure/App.hpp"

#include "shpure/Log.hpp"
#include "shpure/Purify.hpp"

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace shpure::cli {

namespace {

auto read_file(std::filesystem::path const& path) -> std::optional<std::string> {
  std::ifstream in{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

auto format_report(report::PurificationReport const& report, std::string_view layout)
    -> std::optional<std::string> {
  if (layout == "text") {
    return report::format_text(report);
  }
  if (layout == "json") {
    return report::format_json(report);
  }
  if (layout == "markdown") {
    return report::format_markdown(report);
  }
  return std::nullopt;
}

} // namespace

auto App::run(int argc, char const* const* argv) -> int {
  auto parser = create_default_arg_parser();
  auto args   = parser.parse(argc, argv);

  if (!args.has_value()) {
    fmt::print(stderr, "Error parsing arguments: {}\n", args.error());
    return UsageError;
  }

  if (args->has("help")) {
    parser.print_help();
    return Success;
  }

  if (args->has("version")) {
    ArgumentParser::print_version();
    return Success;
  }

  if (args->has("verbose")) {
    verbose_ = true;
    core::log::set_level(core::log::Level::Debug);
  }

  if (args->positional_.size() != 1) {
    fmt::print(stderr, "Error: expected exactly one input file\n\n{}", parser.help());
    return UsageError;
  }
  std::filesystem::path input{args->positional_.front()};

  config::PurifyOptions options;
  if (auto path = args->get<std::string>("config")) {
    if (!std::filesystem::exists(*path)) {
      fmt::print(stderr, "Error: configuration file '{}' does not exist\n", *path);
      return IoError;
    }
    auto loaded = config::load_options(*path);
    if (!loaded) {
      fmt::print(stderr, "Error: {}\n", loaded.error());
      return UsageError;
    }
    options = std::move(*loaded);
  }
  auto merged = parser.apply(*args, std::move(options));
  if (!merged) {
    fmt::print(stderr, "Error: {}\n", merged.error());
    return UsageError;
  }

  auto dialect = detect_dialect(input);
  if (auto flag = args->get<std::string>("dialect")) {
    auto parsed = core::parse_dialect(*flag);
    if (!parsed) {
      fmt::print(stderr, "Error: unknown dialect '{}'\n", *flag);
      return UsageError;
    }
    dialect = *parsed;
  }

  auto layout = args->get<std::string>("report");
  if (layout && *layout != "text" && *layout != "json" && *layout != "markdown") {
    fmt::print(stderr, "Error: unknown report format '{}'\n", *layout);
    return UsageError;
  }

  auto source = read_file(input);
  if (!source) {
    fmt::print(stderr, "Error: cannot read '{}'\n", input.string());
    return IoError;
  }
  core::log::debug("purifying {} as {}", input.string(), to_string(dialect));

  auto result = purify(*source, dialect, *merged);
  if (!result) {
    fmt::print(stderr, "{}\n", result.error().to_string(input.string()));
    return UsageError;
  }

  if (auto out = args->get<std::string>("output")) {
    std::ofstream file{*out, std::ios::binary};
    if (!file || !(file << result->text_)) {
      fmt::print(stderr, "Error: cannot write '{}'\n", *out);
      return IoError;
    }
  } else {
    fmt::print("{}", result->text_);
  }

  if (layout) {
    fmt::print(stderr, "{}", format_report(result->report_, *layout).value_or(""));
  }
  if (verbose_) {
    core::log::info(
        "{} issues, {} fixed, {} need a manual fix",
        result->issues_.size(),
        result->report_.issues_fixed_,
        result->report_.manual_fixes_needed_
    );
  }
  return Success;
}

} // namespace shpure::cli
