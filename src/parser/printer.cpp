#include "shpure/Printer.hpp"

#include <cstdio>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

namespace shpure::shell {

namespace {

template<typename Node, typename T>
constexpr bool is_node = std::is_same_v<std::remove_cvref_t<Node>, T>;

std::string_view param_op_name(ParamOp op) noexcept {
  switch (op) {
    case ParamOp::Default: return "Default";
    case ParamOp::AssignDefault: return "AssignDefault";
    case ParamOp::ErrorIfUnset: return "ErrorIfUnset";
    case ParamOp::Alternative: return "Alternative";
    case ParamOp::Length: return "Length";
    case ParamOp::RemoveSuffix: return "RemoveSuffix";
    case ParamOp::RemoveLongSuffix: return "RemoveLongSuffix";
    case ParamOp::RemovePrefix: return "RemovePrefix";
    case ParamOp::RemoveLongPrefix: return "RemoveLongPrefix";
    case ParamOp::Other: return "Other";
  }
  return "Other";
}

std::string_view terminator_text(CaseTerminator t) noexcept {
  switch (t) {
    case CaseTerminator::Break: return ";;";
    case CaseTerminator::FallThrough: return ";&";
    case CaseTerminator::Continue: return ";;&";
  }
  return ";;";
}

} // namespace

auto ASTPrinter::print(Script const& script) -> std::string {
  return print(script.statements_);
}

auto ASTPrinter::print(std::vector<Stmt> const& stmts) -> std::string {
  out_.clear();
  indent_level_ = 0;
  print_list("Script", stmts);
  return out_;
}

void ASTPrinter::dump(Script const& script) {
  fmt::print(stderr, "{}", print(script));
}

void ASTPrinter::print_indent() {
  out_.append(static_cast<size_t>(indent_level_) * 2, ' ');
}

void ASTPrinter::print_indented(std::string_view text) {
  print_indent();
  out_.append(text);
  out_.push_back('\n');
}

void ASTPrinter::print_list(std::string_view label, std::vector<Stmt> const& stmts) {
  print_indented(fmt::format("{}:", label));
  indent_level_++;
  for (auto const& stmt : stmts) {
    print_stmt(stmt);
  }
  indent_level_--;
}

void ASTPrinter::print_stmt(Stmt const& stmt) {
  std::visit(
      [this](auto const& node) {
        using N = decltype(node);
        if constexpr (is_node<N, Command>) {
          print_command(node);
        } else if constexpr (is_node<N, Pipeline>) {
          print_list("Pipeline", node.commands_);
        } else if constexpr (is_node<N, AndOr>) {
          std::string ops;
          for (auto op : node.ops_) {
            ops += op == AndOrOp::And ? " &&" : " ||";
          }
          print_list(fmt::format("AndOr{}", ops), node.items_);
        } else if constexpr (is_node<N, If>) {
          print_indented("If:");
          indent_level_++;
          print_list("Condition", node.condition_);
          print_list("Then", node.then_);
          for (auto const& elif : node.elifs_) {
            print_list("ElifCondition", elif.condition_);
            print_list("ElifBody", elif.body_);
          }
          if (node.else_) {
            print_list("Else", *node.else_);
          }
          indent_level_--;
        } else if constexpr (is_node<N, While>) {
          print_indented(node.until_ ? "Until:" : "While:");
          indent_level_++;
          print_list("Condition", node.condition_);
          print_list("Body", node.body_);
          indent_level_--;
        } else if constexpr (is_node<N, For> || is_node<N, Select>) {
          print_indented(fmt::format("{} {}:", is_node<N, For> ? "For" : "Select", node.variable_));
          indent_level_++;
          if (node.items_) {
            print_indented("Items:");
            indent_level_++;
            for (auto const& item : *node.items_) {
              print_expr(item);
            }
            indent_level_--;
          }
          print_list("Body", node.body_);
          indent_level_--;
        } else if constexpr (is_node<N, ForArith>) {
          print_indented(fmt::format("ForArith ({}; {}; {}):", node.init_, node.condition_, node.update_));
          indent_level_++;
          print_list("Body", node.body_);
          indent_level_--;
        } else if constexpr (is_node<N, Case>) {
          print_indented("Case:");
          indent_level_++;
          print_expr(node.word_);
          for (auto const& arm : node.arms_) {
            print_indented(fmt::format("Arm {}:", terminator_text(arm.terminator_)));
            indent_level_++;
            for (auto const& pattern : arm.patterns_) {
              print_expr(pattern);
            }
            print_list("Body", arm.body_);
            indent_level_--;
          }
          indent_level_--;
        } else if constexpr (is_node<N, Function>) {
          print_list(fmt::format("Function {}{}", node.name_, node.subshell_ ? " (subshell)" : ""), node.body_);
        } else if constexpr (is_node<N, BraceGroup>) {
          print_list(node.subshell_ ? "Subshell" : "BraceGroup", node.body_);
        } else if constexpr (is_node<N, Negated>) {
          print_indented("Negated:");
          indent_level_++;
          print_stmt(*node.body_);
          indent_level_--;
        } else if constexpr (is_node<N, Background>) {
          print_indented("Background:");
          indent_level_++;
          print_stmt(*node.body_);
          indent_level_--;
        } else if constexpr (is_node<N, Coproc>) {
          print_list(fmt::format("Coproc {}", node.name_.value_or("-")), node.body_);
        } else if constexpr (is_node<N, Assignment>) {
          print_indented(fmt::format(
              "Assignment {}{}{}{}:",
              node.name_,
              node.index_ ? fmt::format("[{}]", *node.index_) : std::string{},
              node.append_ ? " +=" : "",
              node.exported_ ? " (exported)" : ""
          ));
          indent_level_++;
          print_expr(node.value_);
          indent_level_--;
        } else if constexpr (is_node<N, Return>) {
          print_indented(node.exit_ ? "Exit:" : "Return:");
          if (node.code_) {
            indent_level_++;
            print_expr(*node.code_);
            indent_level_--;
          }
        } else if constexpr (is_node<N, ExprStmt>) {
          print_indented("ExprStmt:");
          indent_level_++;
          print_expr(node.expr_);
          indent_level_--;
        } else {
          print_indented(fmt::format("Comment \"{}\"", node.text_));
        }
      },
      stmt.node_
  );

  if (!stmt.redirects_.empty()) {
    indent_level_++;
    for (auto const& redir : stmt.redirects_) {
      print_redirect(redir);
    }
    indent_level_--;
  }
}

void ASTPrinter::print_command(Command const& cmd) {
  print_indented("Command:");
  indent_level_++;
  for (auto const& assign : cmd.prefix_) {
    print_indented(fmt::format(
        "Env {}{}{}:",
        assign.name_,
        assign.index_ ? fmt::format("[{}]", *assign.index_) : std::string{},
        assign.append_ ? " +=" : ""
    ));
    indent_level_++;
    print_expr(assign.value_);
    indent_level_--;
  }
  for (auto const& word : cmd.words_) {
    print_expr(word);
  }
  for (auto const& redir : cmd.redirects_) {
    print_redirect(redir);
  }
  indent_level_--;
}

void ASTPrinter::print_redirect(Redirect const& redir) {
  auto fd = redir.fd_ ? std::to_string(*redir.fd_) : std::string{};
  if (redir.kind_ == RedirectKind::HereDoc) {
    print_indented(fmt::format(
        "HereDoc {}{}{} \"{}\"{}:",
        fd,
        redir.strip_tabs_ ? "<<-" : "<<",
        redir.delimiter_,
        redir.body_,
        redir.quoted_ ? " (quoted)" : ""
    ));
    return;
  }
  print_indented(fmt::format("Redirect {}{}:", fd, to_string(redir.kind_)));
  indent_level_++;
  print_expr(redir.target_);
  indent_level_--;
}

void ASTPrinter::print_expr(Expr const& expr) {
  std::visit(
      [this](auto const& node) {
        using N = decltype(node);
        if constexpr (is_node<N, Literal>) {
          print_indented(fmt::format("Literal \"{}\"", node.value_));
        } else if constexpr (is_node<N, Variable>) {
          print_indented(fmt::format("Variable {}{}", node.name_, node.quoted_ ? " (quoted)" : ""));
        } else if constexpr (is_node<N, ParamExpansion>) {
          print_indented(fmt::format(
              "Param {} {}{} \"{}\"{}",
              node.name_,
              param_op_name(node.op_),
              node.colon_ ? ":" : "",
              node.word_,
              node.quoted_ ? " (quoted)" : ""
          ));
        } else if constexpr (is_node<N, CommandSubst>) {
          print_list(node.quoted_ ? "CommandSubst (quoted)" : "CommandSubst", node.body_);
        } else if constexpr (is_node<N, Arithmetic>) {
          print_indented(fmt::format("Arithmetic {}", arith_text(*node.expr_)));
        } else if constexpr (is_node<N, Array>) {
          print_indented("Array:");
          indent_level_++;
          for (auto const& item : node.items_) {
            print_expr(item);
          }
          indent_level_--;
        } else if constexpr (is_node<N, Concat>) {
          print_indented(node.quoted_ ? "Concat (quoted):" : "Concat:");
          indent_level_++;
          for (auto const& part : node.parts_) {
            print_expr(part);
          }
          indent_level_--;
        } else if constexpr (is_node<N, Glob>) {
          print_indented(fmt::format("Glob \"{}\"", node.pattern_));
        } else {
          print_indented(node.extended_ ? "Test [[ ]]:" : "Test [ ]:");
          indent_level_++;
          print_test(*node.expr_);
          indent_level_--;
        }
      },
      expr.node_
  );
}

void ASTPrinter::print_test(TestExpr const& test) {
  std::visit(
      [this](auto const& node) {
        using N = decltype(node);
        if constexpr (is_node<N, TestUnary>) {
          print_indented(fmt::format("Unary {}:", node.op_));
          indent_level_++;
          print_expr(node.operand_);
          indent_level_--;
        } else if constexpr (is_node<N, TestBinary>) {
          print_indented(fmt::format("Binary {}:", node.op_));
          indent_level_++;
          print_expr(node.lhs_);
          print_expr(node.rhs_);
          indent_level_--;
        } else if constexpr (is_node<N, TestNot>) {
          print_indented("Not:");
          indent_level_++;
          print_test(*node.operand_);
          indent_level_--;
        } else if constexpr (is_node<N, TestAnd> || is_node<N, TestOr>) {
          print_indented(is_node<N, TestAnd> ? "And:" : "Or:");
          indent_level_++;
          print_test(*node.lhs_);
          print_test(*node.rhs_);
          indent_level_--;
        } else {
          print_indented("Word:");
          indent_level_++;
          print_expr(node.word_);
          indent_level_--;
        }
      },
      test.node_
  );
}

auto ASTPrinter::arith_text(ArithExpr const& expr) -> std::string {
  return std::visit(
      [](auto const& node) -> std::string {
        using N = decltype(node);
        if constexpr (is_node<N, ArithNumber>) {
          return node.text_;
        } else if constexpr (is_node<N, ArithVar>) {
          return node.dollar_ ? "$" + node.name_ : node.name_;
        } else if constexpr (is_node<N, ArithRaw>) {
          return fmt::format("raw({})", node.text_);
        } else if constexpr (is_node<N, ArithUnary>) {
          bool postfix = node.op_ == ArithUnaryOp::PostInc || node.op_ == ArithUnaryOp::PostDec;
          return fmt::format("({}{} {})", postfix ? "post" : "", to_string(node.op_), arith_text(*node.operand_));
        } else if constexpr (is_node<N, ArithBinary>) {
          return fmt::format("({} {} {})", to_string(node.op_), arith_text(*node.lhs_), arith_text(*node.rhs_));
        } else if constexpr (is_node<N, ArithAssign>) {
          return fmt::format("({} {} {})", to_string(node.op_), node.name_, arith_text(*node.value_));
        } else {
          return fmt::format(
              "(? {} {} {})", arith_text(*node.cond_), arith_text(*node.then_), arith_text(*node.else_)
          );
        }
      },
      expr.node_
  );
}

bool structurally_equal(Script const& lhs, Script const& rhs) {
  ASTPrinter a;
  ASTPrinter b;
  return a.print(lhs) == b.print(rhs);
}

} // namespace shpure::shell
