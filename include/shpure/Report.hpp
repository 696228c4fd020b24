#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "shpure/Core.hpp"
#include "shpure/Transform.hpp"

namespace shpure::report {

struct ReportLine {
  core::Category category_ = core::Category::Determinism;
  core::Span     span_;
  std::string    text_;
  bool           applied_ = false;
};

struct PurificationReport {
  core::Dialect                    dialect_                 = core::Dialect::Shell;
  std::size_t                      transformations_applied_ = 0; // every recorded transformation
  std::size_t                      issues_fixed_            = 0;
  std::size_t                      manual_fixes_needed_     = 0;
  std::vector<ReportLine>          lines_;
  std::vector<core::SemanticIssue> issues_;
};

[[nodiscard]] auto build_report(
    core::Dialect dialect, std::vector<transform::Transformation> const& transformations, std::vector<core::SemanticIssue> issues
) -> PurificationReport;

[[nodiscard]] auto format_text(PurificationReport const& report) -> std::string;
[[nodiscard]] auto format_json(PurificationReport const& report) -> std::string;
[[nodiscard]] auto format_markdown(PurificationReport const& report) -> std::string;

// Appends issues found by another tool after the native ones, as given
void merge_external(PurificationReport& report, std::vector<core::SemanticIssue> const& issues);

} // namespace shpure::report
