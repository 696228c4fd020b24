#include "shpure/Transform.hpp"

#include "shpure/Analyzer.hpp"
#include "shpure/Log.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace shpure::transform {

namespace {

using namespace shpure::shell;
using core::Span;

// Short options that take no argument and can share a cluster with the added flag
auto mergeable_flags(std::string_view command) noexcept -> std::string_view {
  if (command == "mkdir") {
    return "pv";
  }
  if (command == "rm") {
    return "rRfidv";
  }
  if (command == "ln") {
    return "sfnvbirTLP";
  }
  return {};
}

Stmt* find_stmt(std::vector<Stmt>& stmts, Span span) {
  Stmt* found = nullptr;
  walk(stmts, [&](Stmt& stmt) {
    if (found == nullptr && stmt.span_ == span && stmt.is<Command>()) {
      found = &stmt;
    }
  });
  return found;
}

Redirect* find_redirect(std::vector<Stmt>& stmts, Span span, std::vector<Redirect>*& owner) {
  Redirect* found = nullptr;
  auto      check = [&](std::vector<Redirect>& redirects) {
    for (auto& redir : redirects) {
      if (found == nullptr && redir.span_ == span) {
        found = &redir;
        owner = &redirects;
      }
    }
  };
  walk(stmts, [&](Stmt& stmt) {
    if (auto* cmd = stmt.getIf<Command>()) {
      check(cmd->redirects_);
    }
    check(stmt.redirects_);
  });
  return found;
}

bool insert_after(std::vector<Stmt>& list, Span span, std::string_view name, Stmt& guard);

bool insert_in_children(Stmt& stmt, Span span, std::string_view name, Stmt& guard) {
  bool done = false;
  for_each_child_list(stmt, [&](std::vector<Stmt>& list) {
    done = done || insert_after(list, span, name, guard);
  });
  if (done) {
    return true;
  }
  if (auto* negated = stmt.getIf<Negated>()) {
    return insert_in_children(*negated->body_, span, name, guard);
  }
  if (auto* background = stmt.getIf<Background>()) {
    return insert_in_children(*background->body_, span, name, guard);
  }
  return false;
}

bool insert_after(std::vector<Stmt>& list, Span span, std::string_view name, Stmt& guard) {
  for (size_t i = 0; i < list.size(); ++i) {
    auto const* assign = list[i].getIf<Assignment>();
    if (assign != nullptr && list[i].span_ == span && assign->name_ == name) {
      list.insert(list.begin() + static_cast<std::ptrdiff_t>(i) + 1, std::move(guard));
      return true;
    }
    if (insert_in_children(list[i], span, name, guard)) {
      return true;
    }
  }
  return false;
}

class ShellRewriter {
  Script& script_;
  Span    span_;

public:
  ShellRewriter(Script& script, Span span) noexcept
      : script_(script), span_(span) {}

  bool operator()(AddFlag const& fix) {
    auto* stmt = find_stmt(script_.statements_, span_);
    if (stmt == nullptr) {
      return false;
    }
    auto& cmd = *stmt->getIf<Command>();
    if (command_name(cmd) != std::optional<std::string_view>{fix.command_}) {
      return false;
    }
    if (analysis::has_flag(cmd, fix.flag_)) {
      return true;
    }

    auto allowed = mergeable_flags(fix.command_);
    for (size_t i = 1; i < cmd.words_.size(); ++i) {
      auto* lit = cmd.words_[i].getIf<Literal>();
      if (lit == nullptr || lit->value_ == "--" || !lit->value_.starts_with("-")) {
        break;
      }
      auto const& word = lit->value_;
      bool        cluster =
          word.size() > 1 && word[1] != '-' && std::all_of(word.begin() + 1, word.end(), [&](char c) {
            return allowed.find(c) != std::string_view::npos;
          });
      if (cluster) {
        lit->value_.push_back(fix.flag_);
        return true;
      }
    }
    auto flag = make_literal(fmt::format("-{}", fix.flag_), cmd.words_.front().span_);
    cmd.words_.insert(cmd.words_.begin() + 1, std::move(flag));
    return true;
  }

  bool operator()(QuoteExpansion const& fix) {
    bool quoted = false;
    walk(script_.statements_, [&](Stmt& stmt) {
      for_each_expr(stmt, [&](Expr& expr) {
        if (quoted || expr.span_ != span_) {
          return;
        }
        if (auto* var = expr.getIf<Variable>(); var != nullptr && var->name_ == fix.name_) {
          var->quoted_ = true;
          quoted       = true;
        } else if (auto* param = expr.getIf<ParamExpansion>(); param != nullptr && param->name_ == fix.name_) {
          param->quoted_ = true;
          quoted         = true;
        }
      });
    });
    return quoted;
  }

  bool operator()(RenameCommand const& fix) {
    auto* stmt = find_stmt(script_.statements_, span_);
    if (stmt == nullptr) {
      return false;
    }
    auto& cmd = *stmt->getIf<Command>();
    if (command_name(cmd) != std::optional<std::string_view>{fix.from_}) {
      return false;
    }
    cmd.words_.front() = make_literal(fix.to_, cmd.words_.front().span_);
    return true;
  }

  bool operator()(SplitCombinedRedirect const& fix) {
    std::vector<Redirect>* owner = nullptr;
    auto*                  redir = find_redirect(script_.statements_, span_, owner);
    auto expected = fix.append_ ? RedirectKind::AppendAll : RedirectKind::OutputAll;
    if (redir == nullptr || redir->kind_ != expected) {
      return false;
    }
    redir->kind_ = fix.append_ ? RedirectKind::Append : RedirectKind::Output;

    Redirect dup;
    dup.kind_   = RedirectKind::DupOutput;
    dup.fd_     = 2;
    dup.target_ = make_literal("1", redir->span_);
    dup.span_   = redir->span_;
    auto index  = redir - owner->data();
    owner->insert(owner->begin() + index + 1, std::move(dup));
    return true;
  }

  bool operator()(RewriteShebang const& fix) {
    if (script_.statements_.empty()) {
      return false;
    }
    auto* comment = script_.statements_.front().getIf<Comment>();
    if (comment == nullptr || !comment->text_.starts_with("!")) {
      return false;
    }
    comment->text_ = "!" + fix.interpreter_;
    return true;
  }

  bool operator()(InsertGuard const& fix) {
    auto guard = make_guard(fix.name_, fix.type_, span_);
    return insert_after(script_.statements_, span_, fix.name_, guard);
  }

  // Makefile and Dockerfile kinds never target a shell script
  template<typename Other>
  bool operator()(Other const&) {
    return false;
  }
};

auto guard_message(std::string_view name, std::string_view type) -> std::string {
  if (type == "int") {
    return fmt::format("type error: {} must be an integer", name);
  }
  if (type == "path") {
    return fmt::format("type error: {} must be a non-empty path", name);
  }
  return fmt::format("type error: {} must be a non-empty string", name);
}

} // namespace

auto make_guard(std::string const& name, std::string_view type, core::Span span) -> shell::Stmt {
  auto glob = [&](std::string pattern) { return Expr{Glob{std::move(pattern)}, span}; };

  std::vector<Expr> patterns;
  patterns.push_back(make_literal("", span));
  if (type == "int") {
    patterns.push_back(make_literal("-", span));
    patterns.push_back(glob("*[!0-9-]*"));
    patterns.push_back(glob("?*-*"));
  } else if (type == "path") {
    patterns.push_back(glob("-*"));
  }

  Command echo;
  echo.words_.push_back(make_literal("echo", span));
  echo.words_.push_back(make_literal(guard_message(name, type), span));
  Redirect to_stderr;
  to_stderr.kind_   = RedirectKind::DupOutput;
  to_stderr.target_ = make_literal("2", span);
  to_stderr.span_   = span;
  echo.redirects_.push_back(std::move(to_stderr));

  Return failure;
  failure.exit_ = true;
  failure.code_ = make_literal("1", span);

  CaseArm arm;
  arm.patterns_ = std::move(patterns);
  arm.body_.push_back(Stmt{std::move(echo), {}, span});
  arm.body_.push_back(Stmt{std::move(failure), {}, span});
  arm.span_ = span;

  Case guard{Expr{Variable{name, true}, span}, {}};
  guard.arms_.push_back(std::move(arm));
  return Stmt{std::move(guard), {}, span};
}

auto apply(shell::Script const& script, std::vector<Transformation> transformations) -> RewriteResult<shell::Script> {
  auto out = script.clone();
  for (auto& t : transformations) {
    if (!t.safe_) {
      continue;
    }
    ShellRewriter rewriter{out, t.span_};
    if (!std::visit(rewriter, t.kind_)) {
      t.downgraded_ = true;
      core::log::debug("{} at {}: target no longer matches, reported for a manual fix", t.rule_id_, t.span_.to_string());
    }
  }
  return RewriteResult<shell::Script>{std::move(out), std::move(transformations)};
}

} // namespace shpure::transform
