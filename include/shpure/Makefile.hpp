#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "shpure/Core.hpp"

namespace shpure::make {

template<typename T>
using Result = core::Result<T, core::ParseError>;

enum struct Flavor {
  Recursive,   // =
  Simple,      // := and ::=
  Conditional, // ?=
  Append,      // +=
  Shell,       // !=
  Define,      // define ... endef
};

// One logical line of a recipe. `segments_` holds the physical lines of a
// backslash-continued line, empty when the line was not continued.
struct RecipeLine {
  std::string              text_;
  std::vector<std::string> segments_;
  core::Span               span_;
  std::size_t              blank_before_ = 0;
};

struct Variable {
  std::string              name_;
  std::string              value_;
  Flavor                   flavor_ = Flavor::Recursive;
  std::string              directive_; // "export", "override" or empty
  std::vector<std::string> segments_;
};

struct Target {
  std::string              name_; // may list several targets
  std::vector<std::string> prerequisites_;
  std::vector<RecipeLine>  recipe_;
  bool                     phony_        = false;
  bool                     double_colon_ = false;
  std::vector<std::string> segments_;
};

struct PatternRule {
  std::string              target_pattern_;
  std::vector<std::string> prereq_patterns_;
  std::vector<RecipeLine>  recipe_;
  bool                     double_colon_ = false;
  std::vector<std::string> segments_;
};

enum struct ConditionKind {
  Ifeq,
  Ifneq,
  Ifdef,
  Ifndef,
};

struct Item;

struct Conditional {
  ConditionKind                    kind_ = ConditionKind::Ifeq;
  std::string                      arguments_; // text after the keyword
  std::vector<Item>                then_;
  std::optional<std::vector<Item>> else_;
  bool                             chained_ = false; // written as `else ifeq ...`
};

struct Include {
  std::string path_;
  bool        optional_ = false; // -include and sinclude
};

struct Comment {
  std::string text_; // including the leading '#'
};

// Recipe line inside a conditional that belongs to the enclosing rule
struct Recipe {
  RecipeLine line_;
};

// Line kept as written: vpath, unexport, $(eval ...), target-specific
// variables and other directives that are not analyzed
struct Raw {
  std::string              text_;
  std::vector<std::string> segments_;
};

struct Item {
  using Kind = std::variant<Variable, Target, PatternRule, Conditional, Include, Comment, Recipe, Raw>;

  Kind        node_;
  core::Span  span_;
  std::size_t blank_before_ = 0;

  template<typename T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(node_);
  }

  template<typename T>
  [[nodiscard]] T const* getIf() const noexcept {
    return std::get_if<T>(&node_);
  }

  template<typename T>
  [[nodiscard]] T* getIf() noexcept {
    return std::get_if<T>(&node_);
  }
};

struct Makefile {
  std::vector<Item> items_;
  core::Metadata    metadata_;
};

[[nodiscard]] auto to_string(Flavor flavor) noexcept -> std::string_view;
[[nodiscard]] auto to_string(ConditionKind kind) noexcept -> std::string_view;

Result<Makefile> parse_makefile(std::string_view src, std::string_view file = {});

// Pre-order walk over every item, including conditional branches
void walk(std::vector<Item> const& items, auto const& fn) {
  for (auto const& item : items) {
    fn(item);
    if (auto const* cond = item.getIf<Conditional>()) {
      walk(cond->then_, fn);
      if (cond->else_) {
        walk(*cond->else_, fn);
      }
    }
  }
}

void walk(std::vector<Item>& items, auto const& fn) {
  for (auto& item : items) {
    fn(item);
    if (auto* cond = item.getIf<Conditional>()) {
      walk(cond->then_, fn);
      if (cond->else_) {
        walk(*cond->else_, fn);
      }
    }
  }
}

// Names listed as prerequisites of any `.PHONY` rule
[[nodiscard]] auto phony_targets(Makefile const& makefile) -> std::vector<std::string>;

// Individual target names of a rule (`a b: c` lists two)
[[nodiscard]] auto target_names(Target const& target) -> std::vector<std::string>;

// Every recipe line of the makefile in source order, with its owning rule
// name (empty for orphan recipe lines)
struct RecipeRef {
  std::string_view  rule_;
  RecipeLine const* line_ = nullptr;
};

[[nodiscard]] auto recipe_lines(Makefile const& makefile) -> std::vector<RecipeRef>;

// Finds the matching ')' of a `$(` or `${` opening at `open`
[[nodiscard]] auto find_closing_paren(std::string_view text, std::size_t open) noexcept -> std::optional<std::size_t>;

// True when `pos` lies within the arguments of an enclosing `$(sort ...)`,
// however deep. Unclosed calls in `text` before `pos` count as enclosing.
[[nodiscard]] auto inside_sort(std::string_view text, std::size_t pos) -> bool;

} // namespace shpure::make
