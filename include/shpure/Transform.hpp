#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "shpure/AST.hpp"
#include "shpure/Config.hpp"
#include "shpure/Core.hpp"
#include "shpure/Dockerfile.hpp"
#include "shpure/Makefile.hpp"

namespace shpure::transform {

// ---------------------------------------------------------------------------
// Shell
// ---------------------------------------------------------------------------

// Adds `-flag` after the command name, or merges it into an option cluster
// made only of flags that take no argument
struct AddFlag {
  std::string command_;
  char        flag_ = 0;
};

struct QuoteExpansion {
  std::string name_;
};

struct RenameCommand {
  std::string from_;
  std::string to_;
};

// `&> f` to `> f 2>&1`, `&>> f` to `>> f 2>&1`
struct SplitCombinedRedirect {
  bool append_ = false;
};

struct RewriteShebang {
  std::string interpreter_ = "/bin/sh";
};

struct InsertGuard {
  std::string name_;
  std::string type_; // int, str or path
};

// ---------------------------------------------------------------------------
// Makefile
// ---------------------------------------------------------------------------

struct WrapWithSort {
  std::string variable_;
  std::string pattern_; // "$(wildcard" or "$(shell find"
};

struct AddPhony {
  std::string target_;
};

// ---------------------------------------------------------------------------
// Dockerfile
// ---------------------------------------------------------------------------

struct PinBaseImage {
  std::string image_;
  std::string tag_;
};

struct CleanPackageCache {
  std::string cleanup_;
};

struct AddNoInstallRecommends {};

struct AddToCopy {};

// Documentation only; never changes the tree
struct Advisory {
  std::string                message_;
  std::optional<std::string> fix_;
};

struct Transformation {
  using Kind = std::variant<
      AddFlag,
      QuoteExpansion,
      RenameCommand,
      SplitCombinedRedirect,
      RewriteShebang,
      InsertGuard,
      WrapWithSort,
      AddPhony,
      PinBaseImage,
      CleanPackageCache,
      AddNoInstallRecommends,
      AddToCopy,
      Advisory>;

  Kind           kind_;
  std::string    rule_id_;
  core::Category category_ = core::Category::Determinism;
  core::Span     span_;
  std::string    description_;
  std::string    suggestion_;
  bool           safe_       = true;
  bool           downgraded_ = false; // target no longer matched when applied

  template<typename T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(kind_);
  }

  template<typename T>
  [[nodiscard]] T const* getIf() const noexcept {
    return std::get_if<T>(&kind_);
  }

  // Applied to the tree, as opposed to reported for a manual fix
  [[nodiscard]] bool applied() const noexcept {
    return safe_ && !downgraded_;
  }
};

[[nodiscard]] auto kind_name(Transformation const& t) noexcept -> std::string_view;

struct PlanOptions {
  bool emit_guards_ = false;

  [[nodiscard]] static auto from(config::PurifyOptions const& options) noexcept -> PlanOptions {
    return PlanOptions{options.emit_guards_};
  }
};

// Maps every issue that has a template to zero or one transformation, ordered
// by span and then by rule id
[[nodiscard]] auto plan(shell::Script const& script, std::vector<core::SemanticIssue> const& issues, PlanOptions const& options = {})
    -> std::vector<Transformation>;
[[nodiscard]] auto plan(make::Makefile const& makefile, std::vector<core::SemanticIssue> const& issues, PlanOptions const& options = {})
    -> std::vector<Transformation>;
[[nodiscard]] auto plan(docker::Dockerfile const& dockerfile, std::vector<core::SemanticIssue> const& issues, PlanOptions const& options = {})
    -> std::vector<Transformation>;

template<typename Tree>
struct RewriteResult {
  Tree                        tree_;
  std::vector<Transformation> transformations_;
};

// Applies the safe transformations to a copy of the tree. A transformation
// whose target does not match any more is downgraded to an advisory.
[[nodiscard]] auto apply(shell::Script const& script, std::vector<Transformation> transformations)
    -> RewriteResult<shell::Script>;
[[nodiscard]] auto apply(make::Makefile const& makefile, std::vector<Transformation> transformations)
    -> RewriteResult<make::Makefile>;
[[nodiscard]] auto apply(docker::Dockerfile const& dockerfile, std::vector<Transformation> transformations)
    -> RewriteResult<docker::Dockerfile>;

// Wraps every occurrence of `pattern` (e.g. "$(wildcard") that no enclosing
// `$(sort ...)` covers. Occurrences without a closing parenthesis stay as
// written. Calls left open in `preceding` enclose `text` too.
[[nodiscard]] auto wrap_with_sort(std::string_view text, std::string_view pattern, std::string_view preceding = {})
    -> std::string;

// `case "$name" in ...) ... exit 1 ;; esac` checking a typed variable at run time
[[nodiscard]] auto make_guard(std::string const& name, std::string_view type, core::Span span) -> shell::Stmt;

} // namespace shpure::transform
