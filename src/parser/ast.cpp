#include "shpure/AST.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace shpure::shell {

namespace {

template<typename T>
auto clone_ptr(std::unique_ptr<T> const& ptr) -> std::unique_ptr<T> {
  return ptr ? std::make_unique<T>(ptr->clone()) : nullptr;
}

template<typename Node, typename T>
constexpr bool is_node = std::is_same_v<std::remove_cvref_t<Node>, T>;

auto clone_list(std::optional<std::vector<Expr>> const& items) -> std::optional<std::vector<Expr>> {
  if (!items) {
    return std::nullopt;
  }
  return clone(*items);
}

// Walks an expression and everything nested in it except command
// substitution bodies. Works for both const and mutable trees.
template<typename E, typename F>
void expr_tree(E& expr, F const& fn);

template<typename T, typename F>
void test_tree(T& test, F const& fn) {
  std::visit(
      [&](auto& node) {
        using N = decltype(node);
        if constexpr (is_node<N, TestUnary>) {
          expr_tree(node.operand_, fn);
        } else if constexpr (is_node<N, TestBinary>) {
          expr_tree(node.lhs_, fn);
          expr_tree(node.rhs_, fn);
        } else if constexpr (is_node<N, TestNot>) {
          test_tree(*node.operand_, fn);
        } else if constexpr (is_node<N, TestAnd> || is_node<N, TestOr>) {
          test_tree(*node.lhs_, fn);
          test_tree(*node.rhs_, fn);
        } else {
          expr_tree(node.word_, fn);
        }
      },
      test.node_
  );
}

template<typename E, typename F>
void expr_tree(E& expr, F const& fn) {
  fn(expr);
  if (auto* concat = expr.template getIf<Concat>()) {
    for (auto& part : concat->parts_) {
      expr_tree(part, fn);
    }
  } else if (auto* array = expr.template getIf<Array>()) {
    for (auto& item : array->items_) {
      expr_tree(item, fn);
    }
  } else if (auto* test = expr.template getIf<TestExpression>()) {
    if (test->expr_) {
      test_tree(*test->expr_, fn);
    }
  }
}

template<typename S, typename F>
void child_lists(S& stmt, F const& fn) {
  std::visit(
      [&](auto& node) {
        using N = decltype(node);
        if constexpr (is_node<N, Pipeline>) {
          fn(node.commands_);
        } else if constexpr (is_node<N, AndOr>) {
          fn(node.items_);
        } else if constexpr (is_node<N, If>) {
          fn(node.condition_);
          fn(node.then_);
          for (auto& elif : node.elifs_) {
            fn(elif.condition_);
            fn(elif.body_);
          }
          if (node.else_) {
            fn(*node.else_);
          }
        } else if constexpr (is_node<N, While>) {
          fn(node.condition_);
          fn(node.body_);
        } else if constexpr (is_node<N, Case>) {
          for (auto& arm : node.arms_) {
            fn(arm.body_);
          }
        } else if constexpr (is_node<N, For> || is_node<N, ForArith> || is_node<N, Select> || is_node<N, Function>
                             || is_node<N, BraceGroup> || is_node<N, Coproc>) {
          fn(node.body_);
        }
      },
      stmt.node_
  );
}

template<typename S, typename F>
void stmt_exprs(S& stmt, F const& fn) {
  std::visit(
      [&](auto& node) {
        using N = decltype(node);
        if constexpr (is_node<N, Command>) {
          for (auto& assign : node.prefix_) {
            expr_tree(assign.value_, fn);
          }
          for (auto& word : node.words_) {
            expr_tree(word, fn);
          }
          for (auto& redir : node.redirects_) {
            expr_tree(redir.target_, fn);
          }
        } else if constexpr (is_node<N, For> || is_node<N, Select>) {
          if (node.items_) {
            for (auto& item : *node.items_) {
              expr_tree(item, fn);
            }
          }
        } else if constexpr (is_node<N, Case>) {
          expr_tree(node.word_, fn);
          for (auto& arm : node.arms_) {
            for (auto& pattern : arm.patterns_) {
              expr_tree(pattern, fn);
            }
          }
        } else if constexpr (is_node<N, Assignment>) {
          expr_tree(node.value_, fn);
        } else if constexpr (is_node<N, Return>) {
          if (node.code_) {
            expr_tree(*node.code_, fn);
          }
        } else if constexpr (is_node<N, ExprStmt>) {
          expr_tree(node.expr_, fn);
        }
      },
      stmt.node_
  );
  for (auto& redir : stmt.redirects_) {
    expr_tree(redir.target_, fn);
  }
}

template<typename S, typename F>
void walk_stmt(S& stmt, F const& fn);

template<typename L, typename F>
void walk_list(L& stmts, F const& fn) {
  for (auto& stmt : stmts) {
    walk_stmt(stmt, fn);
  }
}

template<typename S, typename F>
void walk_stmt(S& stmt, F const& fn) {
  fn(stmt);
  child_lists(stmt, [&](auto& list) { walk_list(list, fn); });
  if (auto* negated = stmt.template getIf<Negated>()) {
    walk_stmt(*negated->body_, fn);
  } else if (auto* background = stmt.template getIf<Background>()) {
    walk_stmt(*background->body_, fn);
  }
  stmt_exprs(stmt, [&](auto& expr) {
    if (auto* subst = expr.template getIf<CommandSubst>()) {
      walk_list(subst->body_, fn);
    }
  });
}

} // namespace

auto to_string(ArithOp op) noexcept -> std::string_view {
  switch (op) {
    case ArithOp::Add: return "+";
    case ArithOp::Sub: return "-";
    case ArithOp::Mul: return "*";
    case ArithOp::Div: return "/";
    case ArithOp::Mod: return "%";
    case ArithOp::Pow: return "**";
    case ArithOp::Shl: return "<<";
    case ArithOp::Shr: return ">>";
    case ArithOp::BitAnd: return "&";
    case ArithOp::BitOr: return "|";
    case ArithOp::BitXor: return "^";
    case ArithOp::LogAnd: return "&&";
    case ArithOp::LogOr: return "||";
    case ArithOp::Eq: return "==";
    case ArithOp::Ne: return "!=";
    case ArithOp::Lt: return "<";
    case ArithOp::Le: return "<=";
    case ArithOp::Gt: return ">";
    case ArithOp::Ge: return ">=";
    case ArithOp::Comma: return ",";
  }
  return "+";
}

auto to_string(ArithUnaryOp op) noexcept -> std::string_view {
  switch (op) {
    case ArithUnaryOp::Neg: return "-";
    case ArithUnaryOp::Plus: return "+";
    case ArithUnaryOp::Not: return "!";
    case ArithUnaryOp::BitNot: return "~";
    case ArithUnaryOp::PreInc:
    case ArithUnaryOp::PostInc: return "++";
    case ArithUnaryOp::PreDec:
    case ArithUnaryOp::PostDec: return "--";
  }
  return "-";
}

auto to_string(ArithAssignOp op) noexcept -> std::string_view {
  switch (op) {
    case ArithAssignOp::Assign: return "=";
    case ArithAssignOp::AddAssign: return "+=";
    case ArithAssignOp::SubAssign: return "-=";
    case ArithAssignOp::MulAssign: return "*=";
    case ArithAssignOp::DivAssign: return "/=";
    case ArithAssignOp::ModAssign: return "%=";
  }
  return "=";
}

auto to_string(RedirectKind kind) noexcept -> std::string_view {
  switch (kind) {
    case RedirectKind::Input: return "<";
    case RedirectKind::Output: return ">";
    case RedirectKind::Append: return ">>";
    case RedirectKind::Clobber: return ">|";
    case RedirectKind::ReadWrite: return "<>";
    case RedirectKind::DupInput: return "<&";
    case RedirectKind::DupOutput: return ">&";
    case RedirectKind::OutputAll: return "&>";
    case RedirectKind::AppendAll: return "&>>";
    case RedirectKind::HereString: return "<<<";
    case RedirectKind::HereDoc: return "<<";
  }
  return ">";
}

auto ArithExpr::clone() const -> ArithExpr {
  return std::visit(
      [](auto const& node) -> ArithExpr {
        using N = decltype(node);
        if constexpr (is_node<N, ArithUnary>) {
          return ArithExpr{ArithUnary{node.op_, clone_ptr(node.operand_)}};
        } else if constexpr (is_node<N, ArithBinary>) {
          return ArithExpr{ArithBinary{node.op_, clone_ptr(node.lhs_), clone_ptr(node.rhs_)}};
        } else if constexpr (is_node<N, ArithAssign>) {
          return ArithExpr{ArithAssign{node.name_, node.op_, clone_ptr(node.value_)}};
        } else if constexpr (is_node<N, ArithTernary>) {
          return ArithExpr{ArithTernary{clone_ptr(node.cond_), clone_ptr(node.then_), clone_ptr(node.else_)}};
        } else {
          return ArithExpr{node};
        }
      },
      node_
  );
}

auto Expr::clone() const -> Expr {
  auto node = std::visit(
      [](auto const& n) -> Kind {
        using N = decltype(n);
        if constexpr (is_node<N, CommandSubst>) {
          return CommandSubst{shell::clone(n.body_), n.quoted_};
        } else if constexpr (is_node<N, Arithmetic>) {
          return Arithmetic{clone_ptr(n.expr_)};
        } else if constexpr (is_node<N, Array>) {
          return Array{shell::clone(n.items_)};
        } else if constexpr (is_node<N, Concat>) {
          return Concat{shell::clone(n.parts_), n.quoted_};
        } else if constexpr (is_node<N, TestExpression>) {
          return TestExpression{clone_ptr(n.expr_), n.extended_};
        } else {
          return n;
        }
      },
      node_
  );
  return Expr{std::move(node), span_};
}

auto TestExpr::clone() const -> TestExpr {
  return std::visit(
      [](auto const& n) -> TestExpr {
        using N = decltype(n);
        if constexpr (is_node<N, TestUnary>) {
          return TestExpr{TestUnary{n.op_, n.operand_.clone()}};
        } else if constexpr (is_node<N, TestBinary>) {
          return TestExpr{TestBinary{n.op_, n.lhs_.clone(), n.rhs_.clone()}};
        } else if constexpr (is_node<N, TestNot>) {
          return TestExpr{TestNot{clone_ptr(n.operand_)}};
        } else if constexpr (is_node<N, TestAnd>) {
          return TestExpr{TestAnd{clone_ptr(n.lhs_), clone_ptr(n.rhs_)}};
        } else if constexpr (is_node<N, TestOr>) {
          return TestExpr{TestOr{clone_ptr(n.lhs_), clone_ptr(n.rhs_)}};
        } else {
          return TestExpr{TestWord{n.word_.clone()}};
        }
      },
      node_
  );
}

auto Redirect::clone() const -> Redirect {
  Redirect out;
  out.kind_       = kind_;
  out.fd_         = fd_;
  out.target_     = target_.clone();
  out.delimiter_  = delimiter_;
  out.body_       = body_;
  out.quoted_     = quoted_;
  out.strip_tabs_ = strip_tabs_;
  out.span_       = span_;
  return out;
}

auto Stmt::clone() const -> Stmt {
  auto clone_redirects = [](std::vector<Redirect> const& redirects) {
    std::vector<Redirect> out;
    out.reserve(redirects.size());
    for (auto const& r : redirects) {
      out.push_back(r.clone());
    }
    return out;
  };

  auto node = std::visit(
      [&](auto const& n) -> Kind {
        using N = decltype(n);
        if constexpr (is_node<N, Command>) {
          Command cmd;
          for (auto const& a : n.prefix_) {
            cmd.prefix_.push_back(EnvAssign{a.name_, a.index_, a.value_.clone(), a.append_});
          }
          cmd.words_     = shell::clone(n.words_);
          cmd.redirects_ = clone_redirects(n.redirects_);
          return cmd;
        } else if constexpr (is_node<N, Pipeline>) {
          return Pipeline{shell::clone(n.commands_)};
        } else if constexpr (is_node<N, AndOr>) {
          return AndOr{shell::clone(n.items_), n.ops_};
        } else if constexpr (is_node<N, If>) {
          If out;
          out.condition_ = shell::clone(n.condition_);
          out.then_      = shell::clone(n.then_);
          for (auto const& elif : n.elifs_) {
            out.elifs_.push_back(ElifBranch{shell::clone(elif.condition_), shell::clone(elif.body_)});
          }
          if (n.else_) {
            out.else_ = shell::clone(*n.else_);
          }
          return out;
        } else if constexpr (is_node<N, While>) {
          return While{shell::clone(n.condition_), shell::clone(n.body_), n.until_};
        } else if constexpr (is_node<N, For>) {
          return For{n.variable_, clone_list(n.items_), shell::clone(n.body_)};
        } else if constexpr (is_node<N, ForArith>) {
          return ForArith{n.init_, n.condition_, n.update_, shell::clone(n.body_)};
        } else if constexpr (is_node<N, Case>) {
          Case out{n.word_.clone(), {}};
          for (auto const& arm : n.arms_) {
            out.arms_.push_back(CaseArm{shell::clone(arm.patterns_), shell::clone(arm.body_), arm.terminator_, arm.span_});
          }
          return out;
        } else if constexpr (is_node<N, Select>) {
          return Select{n.variable_, clone_list(n.items_), shell::clone(n.body_)};
        } else if constexpr (is_node<N, Function>) {
          return Function{n.name_, shell::clone(n.body_), n.subshell_};
        } else if constexpr (is_node<N, BraceGroup>) {
          return BraceGroup{shell::clone(n.body_), n.subshell_};
        } else if constexpr (is_node<N, Negated>) {
          return Negated{clone_ptr(n.body_)};
        } else if constexpr (is_node<N, Background>) {
          return Background{clone_ptr(n.body_)};
        } else if constexpr (is_node<N, Coproc>) {
          return Coproc{n.name_, shell::clone(n.body_)};
        } else if constexpr (is_node<N, Assignment>) {
          return Assignment{n.name_, n.index_, n.value_.clone(), n.exported_, n.append_};
        } else if constexpr (is_node<N, Return>) {
          Return out;
          out.exit_ = n.exit_;
          if (n.code_) {
            out.code_ = n.code_->clone();
          }
          return out;
        } else if constexpr (is_node<N, ExprStmt>) {
          return ExprStmt{n.expr_.clone()};
        } else {
          return n;
        }
      },
      node_
  );
  return Stmt{std::move(node), clone_redirects(redirects_), span_, blank_before_};
}

auto Script::clone() const -> Script {
  return Script{shell::clone(statements_), metadata_};
}

auto clone(std::vector<Stmt> const& stmts) -> std::vector<Stmt> {
  std::vector<Stmt> out;
  out.reserve(stmts.size());
  for (auto const& stmt : stmts) {
    out.push_back(stmt.clone());
  }
  return out;
}

auto clone(std::vector<Expr> const& exprs) -> std::vector<Expr> {
  std::vector<Expr> out;
  out.reserve(exprs.size());
  for (auto const& expr : exprs) {
    out.push_back(expr.clone());
  }
  return out;
}

auto make_literal(std::string value, core::Span span) -> Expr {
  return Expr{Literal{std::move(value)}, span};
}

auto literal_value(Expr const& expr) noexcept -> std::optional<std::string_view> {
  if (auto const* lit = expr.getIf<Literal>()) {
    return std::string_view{lit->value_};
  }
  return std::nullopt;
}

auto command_name(Command const& cmd) noexcept -> std::optional<std::string_view> {
  if (cmd.words_.empty()) {
    return std::nullopt;
  }
  return literal_value(cmd.words_.front());
}

auto count_statements(std::vector<Stmt> const& stmts) -> std::size_t {
  std::size_t count = 0;
  walk(stmts, [&count](Stmt const&) { ++count; });
  return count;
}

auto count_statements(Script const& script) -> std::size_t {
  return count_statements(script.statements_);
}

void for_each_child_list(Stmt const& stmt, std::function<void(std::vector<Stmt> const&)> const& fn) {
  child_lists(stmt, fn);
}

void for_each_child_list(Stmt& stmt, std::function<void(std::vector<Stmt>&)> const& fn) {
  child_lists(stmt, fn);
}

void for_each_expr(Stmt const& stmt, std::function<void(Expr const&)> const& fn) {
  stmt_exprs(stmt, fn);
}

void for_each_expr(Stmt& stmt, std::function<void(Expr&)> const& fn) {
  stmt_exprs(stmt, fn);
}

void walk(std::vector<Stmt> const& stmts, std::function<void(Stmt const&)> const& fn) {
  walk_list(stmts, fn);
}

void walk(std::vector<Stmt>& stmts, std::function<void(Stmt&)> const& fn) {
  walk_list(stmts, fn);
}

} // namespace shpure::shell
