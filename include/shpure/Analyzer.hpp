#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "shpure/AST.hpp"
#include "shpure/Config.hpp"
#include "shpure/Core.hpp"
#include "shpure/Dockerfile.hpp"
#include "shpure/Makefile.hpp"

namespace shpure::analysis {

constexpr std::size_t CATEGORY_COUNT = 10;

struct AnalyzerConfig {
  std::array<bool, CATEGORY_COUNT> categories_{
      true, true, true, true, true, true, true, true, true, true,
  };
  bool type_check_  = false;
  bool emit_guards_ = false;
  bool type_strict_ = false;

  [[nodiscard]] bool enabled(core::Category category) const noexcept {
    return categories_[static_cast<std::size_t>(category)];
  }

  void set(core::Category category, bool on) noexcept {
    categories_[static_cast<std::size_t>(category)] = on;
  }

  [[nodiscard]] static auto from(config::PurifyOptions const& options) -> AnalyzerConfig;
};

// Receives the issues of one rule
class IssueSink {
  std::string_view                  rule_id_;
  core::Category                    category_;
  std::vector<core::SemanticIssue>& out_;

public:
  IssueSink(std::string_view rule_id, core::Category category, std::vector<core::SemanticIssue>& out) noexcept
      : rule_id_(rule_id), category_(category), out_(out) {}

  void report(
      core::Span                 span,
      core::Severity             severity,
      std::string                message,
      std::optional<std::string> fix = std::nullopt
  );

  // For rule families that report under several ids
  void reportAs(
      std::string_view           rule_id,
      core::Span                 span,
      core::Severity             severity,
      std::string                message,
      std::optional<std::string> fix = std::nullopt
  );

  [[nodiscard]] auto ruleId() const noexcept -> std::string_view {
    return rule_id_;
  }
};

template<typename Tree>
struct Rule {
  std::string_view id_;
  core::Category   category_;
  void (*check_)(Tree const&, AnalyzerConfig const&, IssueSink&);
};

[[nodiscard]] auto shell_rules() noexcept -> std::vector<Rule<shell::Script>> const&;
[[nodiscard]] auto make_rules() noexcept -> std::vector<Rule<make::Makefile>> const&;
[[nodiscard]] auto docker_rules() noexcept -> std::vector<Rule<docker::Dockerfile>> const&;

[[nodiscard]] auto analyze(shell::Script const& script, AnalyzerConfig const& config = {})
    -> std::vector<core::SemanticIssue>;
[[nodiscard]] auto analyze(make::Makefile const& makefile, AnalyzerConfig const& config = {})
    -> std::vector<core::SemanticIssue>;
[[nodiscard]] auto analyze(docker::Dockerfile const& dockerfile, AnalyzerConfig const& config = {})
    -> std::vector<core::SemanticIssue>;

// Shell helpers shared by the rule catalog and the transformation planner

// True when a short option cluster (`-rf`) or long option (`--force`) among
// the arguments of `cmd` carries `flag`
[[nodiscard]] bool has_flag(shell::Command const& cmd, char flag, std::string_view long_name = {});

// Shebang interpreter of a script ("bash" for `#!/usr/bin/env bash`)
[[nodiscard]] auto shebang(shell::Script const& script) -> std::optional<std::string>;

// Bash-only constructs that survive purification; empty when the script is
// plain POSIX apart from automatically fixed constructs
[[nodiscard]] auto bash_only_constructs(shell::Script const& script) -> std::vector<std::string>;

// Names whose type was declared with `# @type name: type` or `declare -i`
struct TypeAnnotation {
  std::string name_;
  std::string type_; // int, str or path
  core::Span  span_;
};

[[nodiscard]] auto type_annotations(shell::Script const& script) -> std::vector<TypeAnnotation>;

// `$(wildcard` / `$(shell find` calls in a make value with no enclosing
// `$(sort`. `preceding` is text before `value` whose open calls still apply.
[[nodiscard]] auto unsorted_calls(std::string_view value, std::string_view call, std::string_view preceding = {})
    -> std::size_t;

// Stable tag for well-known base images ("22.04" for ubuntu)
[[nodiscard]] auto stable_tag(std::string_view image) noexcept -> std::optional<std::string_view>;

// Cleanup command a RUN instruction still needs after installing packages
[[nodiscard]] auto package_cleanup(std::string_view run_arguments) -> std::optional<std::string>;

// `ADD` arguments that copy a local file rather than fetching or unpacking
[[nodiscard]] bool adds_local_file(std::string_view add_arguments);

} // namespace shpure::analysis
