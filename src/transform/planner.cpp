#include "shpure/Transform.hpp"

#include "shpure/Analyzer.hpp"
#include "shpure/Log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace shpure::transform {

namespace {

using core::SemanticIssue;
using core::Span;

template<typename Tree>
using TemplateFn = auto (*)(Tree const&, SemanticIssue const&, PlanOptions const&) -> std::optional<Transformation>;

// Keyed by full rule id ("IDEM001") or by family ("DET")
template<typename Tree>
struct Template {
  std::string_view key_;
  TemplateFn<Tree> make_;
};

auto base(SemanticIssue const& issue, Transformation::Kind kind) -> Transformation {
  Transformation t;
  t.kind_        = std::move(kind);
  t.rule_id_     = issue.rule_id_;
  t.category_    = issue.category_;
  t.span_        = issue.span_;
  t.description_ = issue.message_;
  t.suggestion_  = issue.fix_.value_or("");
  return t;
}

auto advisory(SemanticIssue const& issue) -> Transformation {
  auto t  = base(issue, Advisory{issue.message_, issue.fix_});
  t.safe_ = false;
  return t;
}

template<typename Tree>
auto make_advisory(Tree const&, SemanticIssue const& issue, PlanOptions const&) -> std::optional<Transformation> {
  return advisory(issue);
}

auto family(std::string_view rule_id) -> std::string_view {
  while (!rule_id.empty() && std::isdigit(static_cast<unsigned char>(rule_id.back()))) {
    rule_id.remove_suffix(1);
  }
  return rule_id;
}

template<typename Tree>
auto find_template(std::vector<Template<Tree>> const& table, std::string_view rule_id) -> Template<Tree> const* {
  for (auto const& entry : table) {
    if (entry.key_ == rule_id) {
      return &entry;
    }
  }
  auto prefix = family(rule_id);
  for (auto const& entry : table) {
    if (entry.key_ == prefix) {
      return &entry;
    }
  }
  return nullptr;
}

// Text between the first pair of single quotes
auto quoted_name(std::string_view text) -> std::optional<std::string> {
  auto open = text.find('\'');
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  auto close = text.find('\'', open + 1);
  if (close == std::string_view::npos || close == open + 1) {
    return std::nullopt;
  }
  return std::string{text.substr(open + 1, close - open - 1)};
}

template<typename Tree>
auto plan_with(
    Tree const&                        tree,
    std::vector<SemanticIssue> const&  issues,
    PlanOptions const&                 options,
    std::vector<Template<Tree>> const& table,
    char const*                        what
) -> std::vector<Transformation> {
  std::vector<Transformation> out;
  for (auto const& issue : issues) {
    auto const* entry = find_template(table, issue.rule_id_);
    if (entry == nullptr) {
      continue;
    }
    if (auto t = entry->make_(tree, issue, options)) {
      out.push_back(std::move(*t));
    }
  }
  std::stable_sort(out.begin(), out.end(), [](Transformation const& a, Transformation const& b) {
    if (a.span_ != b.span_) {
      return a.span_ < b.span_;
    }
    return a.rule_id_ < b.rule_id_;
  });
  core::log::debug("{} plan: {} transformations from {} issues", what, out.size(), issues.size());
  return out;
}

// ---------------------------------------------------------------------------
// Shell
// ---------------------------------------------------------------------------

auto expansion_name(shell::Script const& script, Span span) -> std::optional<std::string> {
  std::optional<std::string> name;
  shell::walk(script.statements_, [&](shell::Stmt const& stmt) {
    shell::for_each_expr(stmt, [&](shell::Expr const& expr) {
      if (name || expr.span_ != span) {
        return;
      }
      if (auto const* var = expr.getIf<shell::Variable>()) {
        name = var->name_;
      } else if (auto const* param = expr.getIf<shell::ParamExpansion>()) {
        name = param->name_;
      }
    });
  });
  return name;
}

auto redirect_at(shell::Script const& script, Span span) -> std::optional<shell::RedirectKind> {
  std::optional<shell::RedirectKind> kind;
  auto check = [&](std::vector<shell::Redirect> const& redirects) {
    for (auto const& redir : redirects) {
      if (!kind && redir.span_ == span) {
        kind = redir.kind_;
      }
    }
  };
  shell::walk(script.statements_, [&](shell::Stmt const& stmt) {
    if (auto const* cmd = stmt.getIf<shell::Command>()) {
      check(cmd->redirects_);
    }
    check(stmt.redirects_);
  });
  return kind;
}

auto assignment_at(shell::Script const& script, Span span) -> shell::Assignment const* {
  shell::Assignment const* found = nullptr;
  shell::walk(script.statements_, [&](shell::Stmt const& stmt) {
    if (found == nullptr && stmt.span_ == span) {
      found = stmt.getIf<shell::Assignment>();
    }
  });
  return found;
}

template<char FLAG>
auto add_flag(shell::Script const&, SemanticIssue const& issue, PlanOptions const&) -> std::optional<Transformation> {
  std::string_view command = issue.rule_id_ == "IDEM001" ? "mkdir" : issue.rule_id_ == "IDEM002" ? "rm" : "ln";
  return base(issue, AddFlag{std::string{command}, FLAG});
}

auto quote_expansion(shell::Script const& script, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto name = expansion_name(script, issue.span_);
  if (!name) {
    return advisory(issue);
  }
  return base(issue, QuoteExpansion{*name});
}

auto split_redirect(shell::Script const& script, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto kind = redirect_at(script, issue.span_);
  if (!kind) {
    return advisory(issue);
  }
  return base(issue, SplitCombinedRedirect{*kind == shell::RedirectKind::AppendAll});
}

auto rename_source(shell::Script const&, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  return base(issue, RenameCommand{"source", "."});
}

auto rewrite_shebang(shell::Script const& script, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto remaining = analysis::bash_only_constructs(script);
  if (!remaining.empty()) {
    auto t         = advisory(issue);
    t.description_ = fmt::format("{}: still uses {}", issue.message_, core::util::join(remaining, ", "));
    return t;
  }
  return base(issue, RewriteShebang{});
}

auto insert_guard(shell::Script const& script, SemanticIssue const& issue, PlanOptions const& options)
    -> std::optional<Transformation> {
  auto const* assign = options.emit_guards_ ? assignment_at(script, issue.span_) : nullptr;
  if (assign == nullptr) {
    return advisory(issue);
  }
  std::optional<std::string> type;
  for (auto const& annotation : analysis::type_annotations(script)) {
    if (annotation.name_ == assign->name_ && annotation.span_ < issue.span_) {
      type = annotation.type_;
    }
  }
  if (!type) {
    return advisory(issue);
  }
  return base(issue, InsertGuard{assign->name_, *type});
}

auto shell_templates() -> std::vector<Template<shell::Script>> const& {
  static std::vector<Template<shell::Script>> const table{
      {"IDEM001", add_flag<'p'>},
      {"IDEM002", add_flag<'f'>},
      {"IDEM003", add_flag<'f'>},
      {"SEC002", quote_expansion},
      {"PORT002", split_redirect},
      {"PORT003", rename_source},
      {"PORT006", rewrite_shebang},
      {"TYPE003", insert_guard},
      {"DET", make_advisory<shell::Script>},
      {"IDEM", make_advisory<shell::Script>},
      {"SEC", make_advisory<shell::Script>},
      {"PORT", make_advisory<shell::Script>},
      {"TYPE", make_advisory<shell::Script>},
  };
  return table;
}

// ---------------------------------------------------------------------------
// Makefile
// ---------------------------------------------------------------------------

auto variable_at(make::Makefile const& makefile, Span span) -> make::Variable const* {
  make::Variable const* found = nullptr;
  make::walk(makefile.items_, [&](make::Item const& item) {
    if (found == nullptr && item.span_ == span) {
      found = item.getIf<make::Variable>();
    }
  });
  return found;
}

template<bool FIND>
auto wrap_sort(make::Makefile const& makefile, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto const* var = variable_at(makefile, issue.span_);
  if (var == nullptr) {
    return advisory(issue);
  }
  return base(issue, WrapWithSort{var->name_, FIND ? "$(shell find" : "$(wildcard"});
}

auto add_phony(make::Makefile const&, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto name = quoted_name(issue.message_);
  if (!name) {
    return advisory(issue);
  }
  return base(issue, AddPhony{*name});
}

auto make_templates() -> std::vector<Template<make::Makefile>> const& {
  static std::vector<Template<make::Makefile>> const table{
      {"NO_WILDCARD", wrap_sort<false>},
      {"NO_UNORDERED_FIND", wrap_sort<true>},
      {"AUTO_PHONY", add_phony},
      {"NO_TIMESTAMPS", make_advisory<make::Makefile>},
      {"NO_RANDOM", make_advisory<make::Makefile>},
      {"MAKE_PAR", make_advisory<make::Makefile>},
      {"MAKE_REPRO", make_advisory<make::Makefile>},
      {"MAKE_PERF", make_advisory<make::Makefile>},
      {"MAKE_ERR", make_advisory<make::Makefile>},
      {"MAKE_PORT", make_advisory<make::Makefile>},
  };
  return table;
}

// ---------------------------------------------------------------------------
// Dockerfile
// ---------------------------------------------------------------------------

auto instruction_at(docker::Dockerfile const& dockerfile, Span span) -> docker::Instruction const* {
  for (auto const& item : dockerfile.items_) {
    if (item.span_ == span) {
      return item.getIf<docker::Instruction>();
    }
  }
  return nullptr;
}

auto pin_image(docker::Dockerfile const& dockerfile, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto const* inst = instruction_at(dockerfile, issue.span_);
  if (inst == nullptr) {
    return advisory(issue);
  }
  auto ref = docker::parse_image(inst->arguments_);
  auto tag = analysis::stable_tag(ref.name_);
  if (!tag) {
    return advisory(issue);
  }
  return base(issue, PinBaseImage{ref.name_, std::string{*tag}});
}

auto clean_cache(docker::Dockerfile const& dockerfile, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  auto const* inst = instruction_at(dockerfile, issue.span_);
  if (inst == nullptr) {
    return advisory(issue);
  }
  auto cleanup = analysis::package_cleanup(inst->arguments_);
  if (!cleanup) {
    return advisory(issue);
  }
  return base(issue, CleanPackageCache{*cleanup});
}

auto no_recommends(docker::Dockerfile const&, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  return base(issue, AddNoInstallRecommends{});
}

auto add_to_copy(docker::Dockerfile const&, SemanticIssue const& issue, PlanOptions const&)
    -> std::optional<Transformation> {
  return base(issue, AddToCopy{});
}

auto docker_templates() -> std::vector<Template<docker::Dockerfile>> const& {
  static std::vector<Template<docker::Dockerfile>> const table{
      {"DOCKER002", pin_image},
      {"DOCKER003", clean_cache},
      {"DOCKER005", no_recommends},
      {"DOCKER006", add_to_copy},
      {"DOCKER", make_advisory<docker::Dockerfile>},
  };
  return table;
}

} // namespace

auto kind_name(Transformation const& t) noexcept -> std::string_view {
  static constexpr std::string_view NAMES[] = {
      "add-flag",
      "quote-expansion",
      "rename-command",
      "split-combined-redirect",
      "rewrite-shebang",
      "insert-guard",
      "wrap-with-sort",
      "add-phony",
      "pin-base-image",
      "clean-package-cache",
      "add-no-install-recommends",
      "add-to-copy",
      "advisory",
  };
  static_assert(std::size(NAMES) == std::variant_size_v<Transformation::Kind>);
  return NAMES[t.kind_.index()];
}

auto plan(shell::Script const& script, std::vector<core::SemanticIssue> const& issues, PlanOptions const& options)
    -> std::vector<Transformation> {
  return plan_with(script, issues, options, shell_templates(), "shell");
}

auto plan(make::Makefile const& makefile, std::vector<core::SemanticIssue> const& issues, PlanOptions const& options)
    -> std::vector<Transformation> {
  return plan_with(makefile, issues, options, make_templates(), "makefile");
}

auto plan(docker::Dockerfile const& dockerfile, std::vector<core::SemanticIssue> const& issues, PlanOptions const& options)
    -> std::vector<Transformation> {
  return plan_with(dockerfile, issues, options, docker_templates(), "dockerfile");
}

} // namespace shpure::transform
