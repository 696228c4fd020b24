#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "shpure/Core.hpp"

namespace shpure::shell {

struct Stmt;
struct Expr;
struct TestExpr;

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

enum struct ArithOp {
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Pow,
  Shl,
  Shr,
  BitAnd,
  BitOr,
  BitXor,
  LogAnd,
  LogOr,
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  Comma,
};

enum struct ArithUnaryOp {
  Neg,
  Plus,
  Not,
  BitNot,
  PreInc,
  PreDec,
  PostInc,
  PostDec,
};

enum struct ArithAssignOp {
  Assign,
  AddAssign,
  SubAssign,
  MulAssign,
  DivAssign,
  ModAssign,
};

struct ArithExpr;

struct ArithNumber {
  std::string text_;
};

struct ArithVar {
  std::string name_;
  bool        dollar_ = false;
};

// Operand that is not a plain name or number: `${#a[@]}`, `$(cmd)`, `a[i]`
struct ArithRaw {
  std::string text_;
};

struct ArithUnary {
  ArithUnaryOp               op_;
  std::unique_ptr<ArithExpr> operand_;
};

struct ArithBinary {
  ArithOp                    op_;
  std::unique_ptr<ArithExpr> lhs_;
  std::unique_ptr<ArithExpr> rhs_;
};

struct ArithAssign {
  std::string                name_;
  ArithAssignOp              op_;
  std::unique_ptr<ArithExpr> value_;
};

struct ArithTernary {
  std::unique_ptr<ArithExpr> cond_;
  std::unique_ptr<ArithExpr> then_;
  std::unique_ptr<ArithExpr> else_;
};

struct ArithExpr {
  using Kind = std::variant<ArithNumber, ArithVar, ArithRaw, ArithUnary, ArithBinary, ArithAssign, ArithTernary>;

  Kind node_;

  [[nodiscard]] auto clone() const -> ArithExpr;
};

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct Literal {
  std::string value_;
};

struct Variable {
  std::string name_;
  bool        quoted_ = false;
};

enum struct ParamOp {
  Default,          // ${x:-w}
  AssignDefault,    // ${x:=w}
  ErrorIfUnset,     // ${x:?w}
  Alternative,      // ${x:+w}
  Length,           // ${#x}
  RemoveSuffix,     // ${x%w}
  RemoveLongSuffix, // ${x%%w}
  RemovePrefix,     // ${x#w}
  RemoveLongPrefix, // ${x##w}
  Other,            // anything else, `word_` holds the text between the braces
};

struct ParamExpansion {
  std::string name_;
  ParamOp     op_ = ParamOp::Other;
  std::string word_;
  bool        colon_  = true; // `${x-w}` vs `${x:-w}`
  bool        quoted_ = false;
};

struct CommandSubst {
  std::vector<Stmt> body_;
  bool              quoted_ = false;
};

struct Arithmetic {
  std::unique_ptr<ArithExpr> expr_;
};

struct Array {
  std::vector<Expr> items_;
};

// Parts of one shell word. `quoted_` is set when the whole word was one
// double-quoted string.
struct Concat {
  std::vector<Expr> parts_;
  bool              quoted_ = false;
};

struct Glob {
  std::string pattern_;
};

struct TestExpression {
  std::unique_ptr<TestExpr> expr_;
  bool                      extended_ = false; // [[ ]]
};

struct Expr {
  using Kind = std::variant<
      Literal,
      Variable,
      ParamExpansion,
      CommandSubst,
      Arithmetic,
      Array,
      Concat,
      Glob,
      TestExpression>;

  Kind       node_;
  core::Span span_;

  [[nodiscard]] auto clone() const -> Expr;

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

// ---------------------------------------------------------------------------
// Test expressions ([ ] and [[ ]])
// ---------------------------------------------------------------------------

struct TestUnary {
  std::string op_; // -e -f -d -z -n ...
  Expr        operand_;
};

struct TestBinary {
  std::string op_; // = == != -eq -lt ...
  Expr        lhs_;
  Expr        rhs_;
};

struct TestNot {
  std::unique_ptr<TestExpr> operand_;
};

struct TestAnd {
  std::unique_ptr<TestExpr> lhs_;
  std::unique_ptr<TestExpr> rhs_;
};

struct TestOr {
  std::unique_ptr<TestExpr> lhs_;
  std::unique_ptr<TestExpr> rhs_;
};

struct TestWord {
  Expr word_;
};

struct TestExpr {
  using Kind = std::variant<TestUnary, TestBinary, TestNot, TestAnd, TestOr, TestWord>;

  Kind node_;

  [[nodiscard]] auto clone() const -> TestExpr;
};

// ---------------------------------------------------------------------------
// Redirections
// ---------------------------------------------------------------------------

enum struct RedirectKind {
  Input,        // <
  Output,       // >
  Append,       // >>
  Clobber,      // >|
  ReadWrite,    // <>
  DupInput,     // <&
  DupOutput,    // >&
  OutputAll,    // &>
  AppendAll,    // &>>
  HereString,   // <<<
  HereDoc,      // << and <<-
};

struct Redirect {
  RedirectKind       kind_ = RedirectKind::Output;
  std::optional<int> fd_;
  Expr               target_;

  // Here-document data
  std::string delimiter_;
  std::string body_;
  bool        quoted_     = false; // quoted delimiter: body is literal
  bool        strip_tabs_ = false;

  core::Span span_;

  [[nodiscard]] auto clone() const -> Redirect;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct EnvAssign {
  std::string                name_;
  std::optional<std::string> index_;
  Expr                       value_;
  bool                       append_ = false;
};

struct Command {
  std::vector<EnvAssign> prefix_;
  std::vector<Expr>      words_;
  std::vector<Redirect>  redirects_;
};

struct Pipeline {
  std::vector<Stmt> commands_;
};

enum struct AndOrOp {
  And,
  Or,
};

struct AndOr {
  std::vector<Stmt>    items_;
  std::vector<AndOrOp> ops_;
};

struct ElifBranch {
  std::vector<Stmt> condition_;
  std::vector<Stmt> body_;
};

struct If {
  std::vector<Stmt>                condition_;
  std::vector<Stmt>                then_;
  std::vector<ElifBranch>          elifs_;
  std::optional<std::vector<Stmt>> else_;
};

struct While {
  std::vector<Stmt> condition_;
  std::vector<Stmt> body_;
  bool              until_ = false;
};

struct For {
  std::string                      variable_;
  std::optional<std::vector<Expr>> items_; // absent: iterate "$@"
  std::vector<Stmt>                body_;
};

// for ((init; condition; update)); clauses are kept as written
struct ForArith {
  std::string       init_;
  std::string       condition_;
  std::string       update_;
  std::vector<Stmt> body_;
};

enum struct CaseTerminator {
  Break,       // ;;
  FallThrough, // ;&
  Continue,    // ;;&
};

struct CaseArm {
  std::vector<Expr> patterns_;
  std::vector<Stmt> body_;
  CaseTerminator    terminator_ = CaseTerminator::Break;
  core::Span        span_;
};

struct Case {
  Expr                 word_;
  std::vector<CaseArm> arms_;
};

struct Select {
  std::string                      variable_;
  std::optional<std::vector<Expr>> items_;
  std::vector<Stmt>                body_;
};

struct Function {
  std::string       name_;
  std::vector<Stmt> body_;
  bool              subshell_ = false;
};

struct BraceGroup {
  std::vector<Stmt> body_;
  bool              subshell_ = false;
};

struct Negated {
  std::unique_ptr<Stmt> body_;
};

struct Background {
  std::unique_ptr<Stmt> body_;
};

struct Coproc {
  std::optional<std::string> name_;
  std::vector<Stmt>          body_;
};

struct Assignment {
  std::string                name_;
  std::optional<std::string> index_;
  Expr                       value_;
  bool                       exported_ = false;
  bool                       append_   = false;
};

struct Return {
  std::optional<Expr> code_;
  bool                exit_ = false;
};

// [ ], [[ ]] or (( )) evaluated for its exit status
struct ExprStmt {
  Expr expr_;
};

struct Comment {
  std::string text_;
};

struct Stmt {
  using Kind = std::variant<
      Command,
      Pipeline,
      AndOr,
      If,
      While,
      For,
      ForArith,
      Case,
      Select,
      Function,
      BraceGroup,
      Negated,
      Background,
      Coproc,
      Assignment,
      Return,
      ExprStmt,
      Comment>;

  Kind                  node_;
  std::vector<Redirect> redirects_; // trailing redirections of compound commands
  core::Span            span_;
  std::size_t           blank_before_ = 0;

  [[nodiscard]] auto clone() const -> Stmt;

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

using Metadata = core::Metadata;

struct Script {
  std::vector<Stmt> statements_;
  Metadata          metadata_;

  [[nodiscard]] auto clone() const -> Script;
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Operator spelling as written in shell source
[[nodiscard]] auto to_string(ArithOp op) noexcept -> std::string_view;
[[nodiscard]] auto to_string(ArithUnaryOp op) noexcept -> std::string_view;
[[nodiscard]] auto to_string(ArithAssignOp op) noexcept -> std::string_view;
[[nodiscard]] auto to_string(RedirectKind kind) noexcept -> std::string_view;

[[nodiscard]] auto clone(std::vector<Stmt> const& stmts) -> std::vector<Stmt>;
[[nodiscard]] auto clone(std::vector<Expr> const& exprs) -> std::vector<Expr>;

[[nodiscard]] auto make_literal(std::string value, core::Span span = {}) -> Expr;

// Literal text of an expression, if it is a plain literal
[[nodiscard]] auto literal_value(Expr const& expr) noexcept -> std::optional<std::string_view>;

// Name of a simple command when its first word is a literal
[[nodiscard]] auto command_name(Command const& cmd) noexcept -> std::optional<std::string_view>;

[[nodiscard]] auto count_statements(std::vector<Stmt> const& stmts) -> std::size_t;
[[nodiscard]] auto count_statements(Script const& script) -> std::size_t;

// Nested statement lists of a statement (bodies, conditions, branches)
void for_each_child_list(Stmt const& stmt, std::function<void(std::vector<Stmt> const&)> const& fn);
void for_each_child_list(Stmt& stmt, std::function<void(std::vector<Stmt>&)> const& fn);

// Expressions owned directly by `stmt` (words, values, redirect targets,
// patterns, test operands), including parts of concatenations. Nested
// statements, including command substitution bodies, are not entered.
void for_each_expr(Stmt const& stmt, std::function<void(Expr const&)> const& fn);
void for_each_expr(Stmt& stmt, std::function<void(Expr&)> const& fn);

// Pre-order walk over every statement, including those inside command
// substitutions.
void walk(std::vector<Stmt> const& stmts, std::function<void(Stmt const&)> const& fn);
void walk(std::vector<Stmt>& stmts, std::function<void(Stmt&)> const& fn);

} // namespace shpure::shell
