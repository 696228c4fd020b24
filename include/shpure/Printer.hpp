#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "shpure/AST.hpp"

namespace shpure::shell {

// Indented structural dump of a syntax tree. Source spans and blank line
// counts are left out so that two dumps compare equal exactly when the trees
// have the same shape and content.
class ASTPrinter {
  int         indent_level_ = 0;
  std::string out_;

public:
  [[nodiscard]] auto print(Script const& script) -> std::string;
  [[nodiscard]] auto print(std::vector<Stmt> const& stmts) -> std::string;

  // Writes the dump to stderr
  void dump(Script const& script);

private:
  void print_indent();
  void print_indented(std::string_view text);

  void print_list(std::string_view label, std::vector<Stmt> const& stmts);
  void print_stmt(Stmt const& stmt);
  void print_command(Command const& cmd);
  void print_redirect(Redirect const& redir);
  void print_expr(Expr const& expr);
  void print_test(TestExpr const& test);

  [[nodiscard]] static auto arith_text(ArithExpr const& expr) -> std::string;
};

[[nodiscard]] bool structurally_equal(Script const& lhs, Script const& rhs);

} // namespace shpure::shell
