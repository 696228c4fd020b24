#include "shpure/Report.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace shpure::report {

namespace {

using json = nlohmann::json;

auto line_text(transform::Transformation const& t) -> std::string {
  if (t.suggestion_.empty()) {
    return t.description_;
  }
  return fmt::format("{} ({})", t.description_, t.suggestion_);
}

auto status(ReportLine const& line) -> std::string_view {
  return line.applied_ ? "fixed" : "manual";
}

// Table cells cannot hold a raw '|'
auto escape_cell(std::string_view text) -> std::string {
  std::string out;
  for (char c : text) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n') {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

auto build_report(
    core::Dialect dialect, std::vector<transform::Transformation> const& transformations, std::vector<core::SemanticIssue> issues
) -> PurificationReport {
  PurificationReport report;
  report.dialect_                 = dialect;
  report.transformations_applied_ = transformations.size();
  for (auto const& t : transformations) {
    if (t.applied()) {
      ++report.issues_fixed_;
    } else {
      ++report.manual_fixes_needed_;
    }
    report.lines_.push_back(ReportLine{t.category_, t.span_, line_text(t), t.applied()});
  }
  report.issues_ = std::move(issues);
  return report;
}

auto format_text(PurificationReport const& report) -> std::string {
  auto out = fmt::format("Purification report ({})\n", to_string(report.dialect_));
  out += fmt::format("  transformations:     {}\n", report.transformations_applied_);
  out += fmt::format("  issues fixed:        {}\n", report.issues_fixed_);
  out += fmt::format("  manual fixes needed: {}\n", report.manual_fixes_needed_);
  if (!report.lines_.empty()) {
    out.push_back('\n');
  }
  for (size_t i = 0; i < report.lines_.size(); ++i) {
    auto const& line = report.lines_[i];
    out += fmt::format(
        "{}. [{}] {} at {}: {}\n", i + 1, status(line), to_string(line.category_), line.span_.to_string(), line.text_
    );
  }
  return out;
}

auto format_json(PurificationReport const& report) -> std::string {
  json lines = json::array();
  for (auto const& line : report.lines_) {
    lines.push_back({
        {"category", std::string{to_string(line.category_)}},
        {"line", line.span_.start_line_},
        {"column", line.span_.start_col_},
        {"text", line.text_},
        {"applied", line.applied_},
    });
  }

  json issues = json::array();
  for (auto const& issue : report.issues_) {
    issues.push_back({
        {"rule", issue.rule_id_},
        {"category", std::string{to_string(issue.category_)}},
        {"severity", std::string{to_string(issue.severity_)}},
        {"line", issue.span_.start_line_},
        {"column", issue.span_.start_col_},
        {"message", issue.message_},
        {"fix", issue.fix_ ? json(*issue.fix_) : json(nullptr)},
    });
  }

  json object = {
      {"dialect", std::string{to_string(report.dialect_)}},
      {"transformations_applied", report.transformations_applied_},
      {"issues_fixed", report.issues_fixed_},
      {"manual_fixes_needed", report.manual_fixes_needed_},
      {"report", std::move(lines)},
      {"issues", std::move(issues)},
  };
  return object.dump(2) + "\n";
}

auto format_markdown(PurificationReport const& report) -> std::string {
  auto out = fmt::format("# Purification report ({})\n\n", to_string(report.dialect_));
  out += fmt::format("- Transformations: {}\n", report.transformations_applied_);
  out += fmt::format("- Issues fixed: {}\n", report.issues_fixed_);
  out += fmt::format("- Manual fixes needed: {}\n", report.manual_fixes_needed_);
  if (report.lines_.empty()) {
    return out;
  }
  out += "\n| # | Status | Category | Location | Description |\n";
  out += "|---|---|---|---|---|\n";
  for (size_t i = 0; i < report.lines_.size(); ++i) {
    auto const& line = report.lines_[i];
    out += fmt::format(
        "| {} | {} | {} | {} | {} |\n",
        i + 1,
        status(line),
        to_string(line.category_),
        line.span_.to_string(),
        escape_cell(line.text_)
    );
  }
  return out;
}

void merge_external(PurificationReport& report, std::vector<core::SemanticIssue> const& issues) {
  report.issues_.insert(report.issues_.end(), issues.begin(), issues.end());
}

} // namespace shpure::report
