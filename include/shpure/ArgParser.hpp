#pragma once

#include <charconv>
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "shpure/Config.hpp"
#include "shpure/Core.hpp"

namespace shpure::cli {

template<typename T>
concept ArgType = std::convertible_to<T, std::string> || requires(T t, char const* ptr, char const* end) {
  std::from_chars(ptr, end, t);
};

// Writes a parsed option into the purifier settings. `value` is empty for flags.
using Setter = std::function<core::Result<void>(config::PurifyOptions& options, std::string const& value)>;

class Option;
class Arguments;

class ArgumentParser {
  std::string         name_;
  std::string         desc_;
  std::string         usage_;
  std::vector<Option> options_;

public:
  explicit ArgumentParser(std::string name = "", std::string desc = "", std::string usage = "") noexcept;

  auto parse(int argc, char const* const* argv) const -> core::Result<Arguments>;
  auto add_argument(std::string name, std::string short_name = "") noexcept -> Option&;

  // Runs the setter of every option present in `args`, in registration order
  [[nodiscard]] auto apply(Arguments const& args, config::PurifyOptions base = {}) const
      -> core::Result<config::PurifyOptions>;

  [[nodiscard]] auto help() const -> std::string;
  void               print_help() const;

  static void print_version();

private:
  [[nodiscard]] auto find_long(std::string_view name) const noexcept -> Option const*;
  [[nodiscard]] auto find_short(char name) const noexcept -> Option const*;
};

auto create_default_arg_parser() -> ArgumentParser;

class Option {
  std::string                name_;
  std::string                short_name_;
  std::string                description_;
  std::string                value_name_; // empty for flags
  std::optional<std::string> default_value_;
  Setter                     setter_;

public:
  Option(std::string name, std::string short_name) noexcept;

  auto desc(std::string desc) noexcept -> Option&;
  auto value(std::string value_name = "value") noexcept -> Option&;
  auto default_value(std::string value) noexcept -> Option&;

  // Flag bindings: presence stores `to` in the field
  auto sets(bool config::PurifyOptions::*field, bool to) -> Option&;
  auto sets(bool config::FormatOptions::*field, bool to) -> Option&;
  auto applies(Setter setter) -> Option&;

  [[nodiscard]] bool takes_value() const noexcept {
    return !value_name_.empty();
  }

  friend class ArgumentParser;
};

class Arguments {
  std::unordered_map<std::string, std::string> args_;

public:
  std::vector<std::string> positional_;

  Arguments() = default;

  [[nodiscard]] bool has(std::string const& name) const noexcept;

  template<ArgType T>
  [[nodiscard]] auto get(std::string const& name) const -> std::optional<T> {
    auto it = args_.find(name);
    if (it == args_.end()) {
      return std::nullopt;
    }

    std::string const& str = it->second;

    if constexpr (std::convertible_to<T, std::string>) {
      return str;
    } else {
      T value = 0;

      auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} || end != str.data() + str.size()) {
        return std::nullopt;
      }
      return value;
    }
  }

  friend class ArgumentParser;
};

} // namespace shpure::cli
