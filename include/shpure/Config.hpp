#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "shpure/Core.hpp"

namespace shpure::config {

// Layout policy of the code generators
struct FormatOptions {
  bool                       preserve_formatting_     = false;
  std::optional<std::size_t> max_line_length_;
  bool                       skip_blank_line_removal_ = false;
  bool                       skip_consolidation_      = false;

  [[nodiscard]] bool keepBlankLines() const noexcept {
    return preserve_formatting_ || skip_blank_line_removal_;
  }

  [[nodiscard]] bool keepContinuations() const noexcept {
    return preserve_formatting_ || skip_consolidation_;
  }
};

struct PurifyOptions {
  bool strict_idempotency_       = true;
  bool remove_non_deterministic_ = true;
  bool track_side_effects_       = true;
  bool type_check_               = false;
  bool emit_guards_              = false;
  bool type_strict_              = false;

  FormatOptions format_;

  std::vector<core::Category> disabled_categories_;
};

// Reads the keys of a JSON object into options; unknown keys are ignored and
// values of the wrong type are reported
[[nodiscard]] auto options_from_json(nlohmann::json const& json) -> core::Result<PurifyOptions>;
[[nodiscard]] auto options_from_json(nlohmann::json const& json, PurifyOptions base) -> core::Result<PurifyOptions>;

[[nodiscard]] auto load_options(std::filesystem::path const& path) -> core::Result<PurifyOptions>;

} // namespace shpure::config
