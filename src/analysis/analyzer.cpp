#include "shpure/Analyzer.hpp"

#include "shpure/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shpure::analysis {

namespace {

template<typename Tree>
auto run_rules(Tree const& tree, std::vector<Rule<Tree>> const& rules, AnalyzerConfig const& config, char const* what)
    -> std::vector<core::SemanticIssue> {
  auto start = std::chrono::steady_clock::now();

  std::vector<core::SemanticIssue> issues;
  for (auto const& rule : rules) {
    if (!config.enabled(rule.category_)) {
      continue;
    }
    auto      first = issues.size();
    IssueSink sink{rule.id_, rule.category_, issues};
    rule.check_(tree, config, sink);
    std::stable_sort(
        issues.begin() + static_cast<std::ptrdiff_t>(first),
        issues.end(),
        [](core::SemanticIssue const& a, core::SemanticIssue const& b) { return a.span_ < b.span_; }
    );
  }

  auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  core::log::debug("{} analysis: {} issues in {:.3f}ms", what, issues.size(), elapsed);
  return issues;
}

} // namespace

auto AnalyzerConfig::from(config::PurifyOptions const& options) -> AnalyzerConfig {
  AnalyzerConfig cfg;
  cfg.set(core::Category::Idempotency, options.strict_idempotency_);
  cfg.set(core::Category::Determinism, options.remove_non_deterministic_);
  cfg.set(core::Category::Reproducibility, options.remove_non_deterministic_);
  cfg.set(core::Category::SideEffect, options.track_side_effects_);
  cfg.set(core::Category::TypeSafety, options.type_check_ || options.emit_guards_);
  for (auto category : options.disabled_categories_) {
    cfg.set(category, false);
  }
  cfg.type_check_  = options.type_check_;
  cfg.emit_guards_ = options.emit_guards_;
  cfg.type_strict_ = options.type_strict_;
  return cfg;
}

void IssueSink::report(core::Span span, core::Severity severity, std::string message, std::optional<std::string> fix) {
  reportAs(rule_id_, span, severity, std::move(message), std::move(fix));
}

void IssueSink::reportAs(
    std::string_view           rule_id,
    core::Span                 span,
    core::Severity             severity,
    std::string                message,
    std::optional<std::string> fix
) {
  out_.push_back(core::SemanticIssue{
      std::string{rule_id},
      category_,
      severity,
      span,
      std::move(message),
      std::move(fix),
  });
}

auto analyze(shell::Script const& script, AnalyzerConfig const& config) -> std::vector<core::SemanticIssue> {
  return run_rules(script, shell_rules(), config, "shell");
}

auto analyze(make::Makefile const& makefile, AnalyzerConfig const& config) -> std::vector<core::SemanticIssue> {
  return run_rules(makefile, make_rules(), config, "makefile");
}

auto analyze(docker::Dockerfile const& dockerfile, AnalyzerConfig const& config) -> std::vector<core::SemanticIssue> {
  return run_rules(dockerfile, docker_rules(), config, "dockerfile");
}

} // namespace shpure::analysis
