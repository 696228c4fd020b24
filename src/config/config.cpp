#include "shpure/Config.hpp"

#include "shpure/Log.hpp"

#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace shpure::config {

namespace {

using json = nlohmann::json;

core::Result<void> read_bool(json const& object, std::string_view key, bool& out) {
  auto it = object.find(std::string{key});
  if (it == object.end()) {
    return {};
  }
  if (!it->is_boolean()) {
    return std::unexpected(fmt::format("option '{}' must be a boolean", key));
  }
  out = it->get<bool>();
  return {};
}

core::Result<void> read_line_length(json const& object, std::optional<std::size_t>& out) {
  auto it = object.find("max_line_length");
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (!it->is_number_unsigned() || it->get<std::size_t>() == 0) {
    return std::unexpected(std::string{"option 'max_line_length' must be a positive integer or null"});
  }
  out = it->get<std::size_t>();
  return {};
}

core::Result<void> read_categories(json const& object, std::vector<core::Category>& out) {
  auto it = object.find("disabled_categories");
  if (it == object.end()) {
    return {};
  }
  if (!it->is_array()) {
    return std::unexpected(std::string{"option 'disabled_categories' must be an array of category names"});
  }
  for (auto const& entry : *it) {
    if (!entry.is_string()) {
      return std::unexpected(std::string{"option 'disabled_categories' must be an array of category names"});
    }
    auto name     = entry.get<std::string>();
    auto category = core::parse_category(name);
    if (!category) {
      return std::unexpected(fmt::format("unknown category '{}' in 'disabled_categories'", name));
    }
    out.push_back(*category);
  }
  return {};
}

} // namespace

auto options_from_json(nlohmann::json const& object) -> core::Result<PurifyOptions> {
  return options_from_json(object, PurifyOptions{});
}

auto options_from_json(nlohmann::json const& object, PurifyOptions base) -> core::Result<PurifyOptions> {
  if (!object.is_object()) {
    return std::unexpected(std::string{"configuration must be a JSON object"});
  }

  std::pair<std::string_view, bool*> const flags[] = {
      {"strict_idempotency", &base.strict_idempotency_},
      {"remove_non_deterministic", &base.remove_non_deterministic_},
      {"track_side_effects", &base.track_side_effects_},
      {"type_check", &base.type_check_},
      {"emit_guards", &base.emit_guards_},
      {"type_strict", &base.type_strict_},
      {"preserve_formatting", &base.format_.preserve_formatting_},
      {"skip_blank_line_removal", &base.format_.skip_blank_line_removal_},
      {"skip_consolidation", &base.format_.skip_consolidation_},
  };
  for (auto const& [key, target] : flags) {
    if (auto ok = read_bool(object, key, *target); !ok) {
      return std::unexpected(ok.error());
    }
  }
  if (auto ok = read_line_length(object, base.format_.max_line_length_); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = read_categories(object, base.disabled_categories_); !ok) {
    return std::unexpected(ok.error());
  }

  for (auto const& [key, value] : object.items()) {
    bool known = key == "max_line_length" || key == "disabled_categories";
    for (auto const& flag : flags) {
      known = known || flag.first == key;
    }
    if (!known) {
      core::log::debug("ignoring unknown option '{}'", key);
    }
  }
  return base;
}

auto load_options(std::filesystem::path const& path) -> core::Result<PurifyOptions> {
  std::ifstream in{path};
  if (!in) {
    return std::unexpected(fmt::format("cannot open configuration file '{}'", path.string()));
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded()) {
    return std::unexpected(fmt::format("'{}' is not valid JSON", path.string()));
  }
  core::log::debug("loaded configuration from {}", path.string());
  return options_from_json(parsed);
}

} // namespace shpure::config
