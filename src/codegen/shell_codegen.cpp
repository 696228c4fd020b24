#include "shpure/Codegen.hpp"

#include "shpure/Constants.hpp"
#include "shpure/Parser.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace shpure::codegen {

namespace {

using namespace shpure::shell;
using core::Span;

template<typename Node, typename T>
constexpr bool is_node = std::is_same_v<std::remove_cvref_t<Node>, T>;

constexpr bool is_name_char(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

constexpr bool is_bare_char(char c) noexcept {
  return is_name_char(c) || std::string_view{"./:@%+,=-"}.find(c) != std::string_view::npos;
}

auto single_quote(std::string_view text) -> std::string {
  std::string out = "'";
  for (char c : text) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

// Position of a word. A whole word must never read as a reserved word, and a
// command name must not read as an assignment either. Fragments of a
// concatenated word are never keywords.
enum struct Position {
  Argument,
  CommandName,
  Pattern,
  Fragment,
};

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

constexpr int PRIMARY_PRECEDENCE = 16;
constexpr int UNARY_PRECEDENCE   = 15;
constexpr int ASSIGN_PRECEDENCE  = 2;
constexpr int TERNARY_PRECEDENCE = 3;

int precedence(ArithOp op) noexcept {
  switch (op) {
    case ArithOp::Comma: return 1;
    case ArithOp::LogOr: return 4;
    case ArithOp::LogAnd: return 5;
    case ArithOp::BitOr: return 6;
    case ArithOp::BitXor: return 7;
    case ArithOp::BitAnd: return 8;
    case ArithOp::Eq:
    case ArithOp::Ne: return 9;
    case ArithOp::Lt:
    case ArithOp::Le:
    case ArithOp::Gt:
    case ArithOp::Ge: return 10;
    case ArithOp::Shl:
    case ArithOp::Shr: return 11;
    case ArithOp::Add:
    case ArithOp::Sub: return 12;
    case ArithOp::Mul:
    case ArithOp::Div:
    case ArithOp::Mod: return 13;
    case ArithOp::Pow: return 14;
  }
  return 0;
}

int precedence(ArithExpr const& expr) noexcept {
  return std::visit(
      [](auto const& node) -> int {
        using N = decltype(node);
        if constexpr (is_node<N, ArithUnary>) {
          return UNARY_PRECEDENCE;
        } else if constexpr (is_node<N, ArithBinary>) {
          return precedence(node.op_);
        } else if constexpr (is_node<N, ArithAssign>) {
          return ASSIGN_PRECEDENCE;
        } else if constexpr (is_node<N, ArithTernary>) {
          return TERNARY_PRECEDENCE;
        } else {
          return PRIMARY_PRECEDENCE;
        }
      },
      expr.node_
  );
}

auto arith_text(ArithExpr const& expr) -> std::string;

auto arith_operand(ArithExpr const& expr, bool parens) -> std::string {
  auto text = arith_text(expr);
  return parens ? "(" + text + ")" : text;
}

auto arith_text(ArithExpr const& expr) -> std::string {
  return std::visit(
      [](auto const& node) -> std::string {
        using N = decltype(node);
        if constexpr (is_node<N, ArithNumber>) {
          return node.text_;
        } else if constexpr (is_node<N, ArithVar>) {
          return node.dollar_ ? "$" + node.name_ : node.name_;
        } else if constexpr (is_node<N, ArithRaw>) {
          return node.text_;
        } else if constexpr (is_node<N, ArithUnary>) {
          if (node.op_ == ArithUnaryOp::PostInc || node.op_ == ArithUnaryOp::PostDec) {
            return arith_text(*node.operand_) + std::string{to_string(node.op_)};
          }
          // `- -x` must not turn into `--x`
          bool parens = precedence(*node.operand_) != PRIMARY_PRECEDENCE;
          return std::string{to_string(node.op_)} + arith_operand(*node.operand_, parens);
        } else if constexpr (is_node<N, ArithBinary>) {
          int  prec  = precedence(node.op_);
          bool right = node.op_ == ArithOp::Pow;
          int  lhs   = precedence(*node.lhs_);
          int  rhs   = precedence(*node.rhs_);
          auto left  = arith_operand(*node.lhs_, lhs < prec || (right && lhs == prec));
          auto other = arith_operand(*node.rhs_, rhs < prec || (!right && rhs == prec));
          if (node.op_ == ArithOp::Comma) {
            return fmt::format("{}, {}", left, other);
          }
          return fmt::format("{} {} {}", left, to_string(node.op_), other);
        } else if constexpr (is_node<N, ArithAssign>) {
          return fmt::format(
              "{} {} {}",
              node.name_,
              to_string(node.op_),
              arith_operand(*node.value_, precedence(*node.value_) < ASSIGN_PRECEDENCE)
          );
        } else {
          return fmt::format(
              "{} ? {} : {}",
              arith_operand(*node.cond_, precedence(*node.cond_) <= TERNARY_PRECEDENCE),
              arith_operand(*node.then_, precedence(*node.then_) < ASSIGN_PRECEDENCE),
              arith_operand(*node.else_, precedence(*node.else_) < TERNARY_PRECEDENCE)
          );
        }
      },
      expr.node_
  );
}

// ---------------------------------------------------------------------------
// Parameter expansion
// ---------------------------------------------------------------------------

auto param_op_text(ParamOp op) noexcept -> std::string_view {
  switch (op) {
    case ParamOp::Default: return "-";
    case ParamOp::AssignDefault: return "=";
    case ParamOp::ErrorIfUnset: return "?";
    case ParamOp::Alternative: return "+";
    case ParamOp::RemoveSuffix: return "%";
    case ParamOp::RemoveLongSuffix: return "%%";
    case ParamOp::RemovePrefix: return "#";
    case ParamOp::RemoveLongPrefix: return "##";
    case ParamOp::Length:
    case ParamOp::Other: return "";
  }
  return "";
}

auto param_text(ParamExpansion const& param) -> std::string {
  switch (param.op_) {
    case ParamOp::Length: return fmt::format("${{#{}}}", param.name_);
    case ParamOp::Other: return fmt::format("${{{}}}", param.word_);
    case ParamOp::Default:
    case ParamOp::AssignDefault:
    case ParamOp::ErrorIfUnset:
    case ParamOp::Alternative:
      return fmt::format("${{{}{}{}{}}}", param.name_, param.colon_ ? ":" : "", param_op_text(param.op_), param.word_);
    default: return fmt::format("${{{}{}{}}}", param.name_, param_op_text(param.op_), param.word_);
  }
}

auto variable_text(std::string const& name, std::string_view next) -> std::string {
  bool positional = name.size() > 1 && std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; });
  bool glued      = core::util::is_name(name) && !next.empty() && is_name_char(next.front());
  return positional || glued ? fmt::format("${{{}}}", name) : "$" + name;
}

auto escape_double_quoted(std::string_view text) -> std::string {
  std::string out;
  for (char c : text) {
    if (c == '\\' || c == '"' || c == '$' || c == '`') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

// Text of the literal that follows part `i`, used to decide on `${x}`
auto next_literal(std::vector<Expr> const& parts, std::size_t i) -> std::string_view {
  if (i + 1 < parts.size()) {
    if (auto const* lit = parts[i + 1].getIf<Literal>()) {
      return lit->value_;
    }
  }
  return {};
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

bool has_heredoc(std::vector<Redirect> const& redirects) {
  return std::any_of(redirects.begin(), redirects.end(), [](Redirect const& r) {
    return r.kind_ == RedirectKind::HereDoc;
  });
}

// Statements that fit on one line, separated by `;`
bool fits_inline(Stmt const& stmt) {
  if (has_heredoc(stmt.redirects_)) {
    return false;
  }
  return std::visit(
      [](auto const& node) -> bool {
        using N = decltype(node);
        if constexpr (is_node<N, Command>) {
          return !has_heredoc(node.redirects_);
        } else if constexpr (is_node<N, Pipeline>) {
          return std::all_of(node.commands_.begin(), node.commands_.end(), [](Stmt const& s) { return fits_inline(s); });
        } else if constexpr (is_node<N, AndOr>) {
          return std::all_of(node.items_.begin(), node.items_.end(), [](Stmt const& s) { return fits_inline(s); });
        } else if constexpr (is_node<N, Negated> || is_node<N, Background>) {
          return fits_inline(*node.body_);
        } else if constexpr (is_node<N, BraceGroup>) {
          return !node.body_.empty()
              && std::all_of(node.body_.begin(), node.body_.end(), [](Stmt const& s) { return fits_inline(s); });
        } else {
          return is_node<N, Assignment> || is_node<N, Return> || is_node<N, ExprStmt>;
        }
      },
      stmt.node_
  );
}

bool list_fits_inline(std::vector<Stmt> const& stmts) {
  return !stmts.empty() && std::all_of(stmts.begin(), stmts.end(), [](Stmt const& s) { return fits_inline(s); });
}

// Members of a `{ a; b; }` written on one line
bool is_simple(Stmt const& stmt) {
  if (has_heredoc(stmt.redirects_)) {
    return false;
  }
  if (auto const* cmd = stmt.getIf<Command>()) {
    return !has_heredoc(cmd->redirects_);
  }
  return stmt.is<Assignment>() || stmt.is<Return>();
}

bool trailing_comment(Stmt const& prev, Stmt const& comment) {
  return comment.is<Comment>() && !prev.is<Comment>() && !prev.span_.empty() && !comment.span_.empty()
      && prev.span_.end_line_ == comment.span_.start_line_;
}

// How a sequence of statements written on one line ended
enum struct Tail {
  Open,       // needs `;` before the next keyword
  Background, // ended with `&`
  Newline,    // ended with a comment
};

auto literal_word(std::string value, Span span) -> Expr {
  return make_literal(std::move(value), span);
}

auto simple_command(std::vector<std::string> const& words, Span span) -> Stmt {
  Command cmd;
  for (auto const& word : words) {
    cmd.words_.push_back(literal_word(word, span));
  }
  return Stmt{std::move(cmd), {}, span};
}

auto to_stderr(Span span) -> Redirect {
  Redirect redir;
  redir.kind_   = RedirectKind::DupOutput;
  redir.target_ = literal_word("2", span);
  redir.span_   = span;
  return redir;
}

constexpr std::string_view SELECT_INDEX = "_shpure_i";
constexpr std::string_view SELECT_ITEM  = "_shpure_item";

auto increment_index(Span span) -> Stmt {
  auto sum = std::make_unique<ArithExpr>(ArithExpr{ArithBinary{
      ArithOp::Add,
      std::make_unique<ArithExpr>(ArithExpr{ArithVar{std::string{SELECT_INDEX}, false}}),
      std::make_unique<ArithExpr>(ArithExpr{ArithNumber{"1"}}),
  }});
  return Stmt{Assignment{std::string{SELECT_INDEX}, std::nullopt, Expr{Arithmetic{std::move(sum)}, span}}, {}, span};
}

auto assign(std::string_view name, Expr value, Span span) -> Stmt {
  return Stmt{Assignment{std::string{name}, std::nullopt, std::move(value)}, {}, span};
}

auto quoted_var(std::string_view name, Span span) -> Expr {
  return Expr{Variable{std::string{name}, true}, span};
}

auto item_loop(Select const& select, std::vector<Stmt> body, Span span) -> Stmt {
  std::optional<std::vector<Expr>> items;
  if (select.items_) {
    items = clone(*select.items_);
  }
  return Stmt{For{std::string{SELECT_ITEM}, std::move(items), std::move(body)}, {}, span};
}

// `select` is not POSIX; it becomes a numbered menu loop on stderr
auto lower_select(Select const& select, Span span) -> Stmt {
  std::vector<Stmt> listing;
  listing.push_back(increment_index(span));
  {
    Command print;
    print.words_.push_back(literal_word("printf", span));
    print.words_.push_back(literal_word("%s) %s\\n", span));
    print.words_.push_back(quoted_var(SELECT_INDEX, span));
    print.words_.push_back(quoted_var(SELECT_ITEM, span));
    print.redirects_.push_back(to_stderr(span));
    listing.push_back(Stmt{std::move(print), {}, span});
  }

  Command prompt;
  prompt.words_.push_back(literal_word("printf", span));
  prompt.words_.push_back(literal_word("%s", span));
  prompt.words_.push_back(Expr{ParamExpansion{"PS3", ParamOp::Default, "#? ", false, true}, span});
  prompt.redirects_.push_back(to_stderr(span));

  AndOr read;
  read.items_.push_back(simple_command({"read", "-r", "REPLY"}, span));
  read.items_.push_back(simple_command({"break"}, span));
  read.ops_.push_back(AndOrOp::Or);

  If chosen;
  {
    auto test = std::make_unique<TestExpr>(
        TestExpr{TestBinary{"=", quoted_var(SELECT_INDEX, span), quoted_var("REPLY", span)}}
    );
    chosen.condition_.push_back(Stmt{ExprStmt{Expr{TestExpression{std::move(test), false}, span}}, {}, span});
    chosen.then_.push_back(assign(select.variable_, Expr{Variable{std::string{SELECT_ITEM}, false}, span}, span));
  }
  std::vector<Stmt> matching;
  matching.push_back(increment_index(span));
  matching.push_back(Stmt{std::move(chosen), {}, span});

  While loop;
  loop.condition_.push_back(simple_command({"true"}, span));
  loop.body_.push_back(assign(SELECT_INDEX, literal_word("0", span), span));
  loop.body_.push_back(item_loop(select, std::move(listing), span));
  loop.body_.push_back(Stmt{std::move(prompt), {}, span});
  loop.body_.push_back(Stmt{std::move(read), {}, span});
  loop.body_.push_back(assign(select.variable_, literal_word("", span), span));
  loop.body_.push_back(assign(SELECT_INDEX, literal_word("0", span), span));
  loop.body_.push_back(item_loop(select, std::move(matching), span));
  for (auto& stmt : clone(select.body_)) {
    loop.body_.push_back(std::move(stmt));
  }
  return Stmt{std::move(loop), {}, span};
}

struct PendingHereDoc {
  std::string body_;
  std::string delimiter_;
};

class ShellWriter {
  config::FormatOptions const& options_;
  std::size_t                  indent_ = 0;
  std::string                  out_;
  std::string                  line_;
  std::vector<PendingHereDoc>  heredocs_;

public:
  explicit ShellWriter(config::FormatOptions const& options, std::size_t indent = 0) noexcept
      : options_(options), indent_(indent) {}

  auto render(std::vector<Stmt> const& stmts) -> std::string {
    list(stmts);
    if (!line_.empty()) {
      newline();
    }
    return std::move(out_);
  }

  // Statements joined with `;` on a single line
  auto renderInline(std::vector<Stmt> const& stmts) -> std::string {
    sequence(stmts);
    return std::move(line_);
  }

  auto word(Expr const& expr, Position position = Position::Argument) -> std::string {
    return std::visit(
        [&](auto const& node) -> std::string {
          using N = decltype(node);
          if constexpr (is_node<N, Literal>) {
            bool keyword = position != Position::Fragment && is_reserved_word(node.value_);
            bool assigns = position == Position::CommandName && node.value_.find('=') != std::string::npos;
            return keyword || assigns ? single_quote(node.value_) : quote(node.value_);
          } else if constexpr (is_node<N, Variable>) {
            auto text = variable_text(node.name_, {});
            return node.quoted_ ? "\"" + text + "\"" : text;
          } else if constexpr (is_node<N, ParamExpansion>) {
            auto text = param_text(node);
            return node.quoted_ ? "\"" + text + "\"" : text;
          } else if constexpr (is_node<N, CommandSubst>) {
            auto text = substitution(node.body_);
            return node.quoted_ ? "\"" + text + "\"" : text;
          } else if constexpr (is_node<N, Arithmetic>) {
            return arithmetic(node);
          } else if constexpr (is_node<N, Array>) {
            std::string out = "(";
            for (std::size_t i = 0; i < node.items_.size(); ++i) {
              out += (i == 0 ? "" : " ") + word(node.items_[i]);
            }
            return out + ")";
          } else if constexpr (is_node<N, Concat>) {
            return node.quoted_ ? "\"" + quotedParts(node.parts_) + "\"" : parts(node.parts_, position);
          } else if constexpr (is_node<N, Glob>) {
            return node.pattern_;
          } else {
            return test(node);
          }
        },
        expr.node_
    );
  }

private:
  // -------------------------------------------------------------------------
  // Line handling
  // -------------------------------------------------------------------------

  void put(std::string_view text) {
    if (line_.empty() && !text.empty()) {
      line_.assign(indent_ * constant::INDENT_WIDTH, ' ');
    }
    line_ += text;
  }

  // Ends the current line; pending here-document bodies follow it
  void newline() {
    out_ += line_;
    out_.push_back('\n');
    line_.clear();
    for (auto const& doc : heredocs_) {
      out_ += doc.body_;
      out_ += doc.delimiter_;
      out_.push_back('\n');
    }
    heredocs_.clear();
  }

  // Continues a logical line on the next physical line
  void breakLine() {
    out_ += line_;
    out_ += " \\\n";
    line_.assign((indent_ + 1) * constant::INDENT_WIDTH, ' ');
  }

  [[nodiscard]] bool exceeds(std::size_t extra) const noexcept {
    return options_.max_line_length_ && line_.size() + extra > *options_.max_line_length_;
  }

  // -------------------------------------------------------------------------
  // Lists
  // -------------------------------------------------------------------------

  void list(std::vector<Stmt> const& stmts) {
    Stmt const* prev = nullptr;
    for (auto const& stmt : stmts) {
      if (prev != nullptr) {
        if (trailing_comment(*prev, stmt)) {
          put(" #" + stmt.getIf<Comment>()->text_);
          newline();
          prev = nullptr;
          continue;
        }
        newline();
      }
      if (options_.keepBlankLines()) {
        for (std::size_t i = 0; i < stmt.blank_before_; ++i) {
          newline();
        }
      }
      statement(stmt);
      prev = &stmt;
    }
    if (prev != nullptr) {
      newline();
    }
  }

  void block(std::vector<Stmt> const& stmts) {
    ++indent_;
    list(stmts);
    --indent_;
  }

  auto sequence(std::vector<Stmt> const& stmts) -> Tail {
    auto tail  = Tail::Newline;
    bool first = true;
    for (auto const& stmt : stmts) {
      if (auto const* comment = stmt.getIf<Comment>()) {
        if (!first) {
          put(" ");
        }
        put("#" + comment->text_);
        newline();
        tail  = Tail::Newline;
        first = true;
        continue;
      }
      if (!first) {
        put(tail == Tail::Background ? " " : "; ");
      }
      statement(stmt);
      tail  = stmt.is<Background>() ? Tail::Background : Tail::Open;
      first = false;
    }
    return tail;
  }

  // `cond; then` and `cond; do`
  void header(std::vector<Stmt> const& condition, std::string_view keyword) {
    switch (sequence(condition)) {
      case Tail::Open: put(fmt::format("; {}", keyword)); break;
      case Tail::Background: put(fmt::format(" {}", keyword)); break;
      case Tail::Newline: put(keyword); break;
    }
    newline();
  }

  void group(std::vector<Stmt> const& body, bool subshell) {
    bool one_line = !body.empty() && std::all_of(body.begin(), body.end(), is_simple);
    if (one_line) {
      put(subshell ? "( " : "{ ");
      sequence(body);
      put(subshell ? " )" : "; }");
      return;
    }
    put(subshell ? "(" : "{");
    newline();
    block(body);
    put(subshell ? ")" : "}");
  }

  // -------------------------------------------------------------------------
  // Statements
  // -------------------------------------------------------------------------

  void statement(Stmt const& stmt) {
    std::visit(
        [&](auto const& node) {
          using N = decltype(node);
          if constexpr (is_node<N, Command>) {
            command(node);
          } else if constexpr (is_node<N, Pipeline>) {
            for (std::size_t i = 0; i < node.commands_.size(); ++i) {
              if (i > 0) {
                put(" | ");
              }
              statement(node.commands_[i]);
            }
          } else if constexpr (is_node<N, AndOr>) {
            for (std::size_t i = 0; i < node.items_.size(); ++i) {
              if (i > 0) {
                put(node.ops_[i - 1] == AndOrOp::And ? " && " : " || ");
              }
              statement(node.items_[i]);
            }
          } else if constexpr (is_node<N, If>) {
            put("if ");
            header(node.condition_, "then");
            block(node.then_);
            for (auto const& elif : node.elifs_) {
              put("elif ");
              header(elif.condition_, "then");
              block(elif.body_);
            }
            if (node.else_) {
              put("else");
              newline();
              block(*node.else_);
            }
            put("fi");
          } else if constexpr (is_node<N, While>) {
            put(node.until_ ? "until " : "while ");
            header(node.condition_, "do");
            block(node.body_);
            put("done");
          } else if constexpr (is_node<N, For>) {
            put("for " + node.variable_);
            if (node.items_) {
              put(" in");
              for (auto const& item : *node.items_) {
                put(" " + word(item));
              }
            }
            put("; do");
            newline();
            block(node.body_);
            put("done");
          } else if constexpr (is_node<N, ForArith>) {
            put(fmt::format("for (({}; {}; {})); do", node.init_, node.condition_, node.update_));
            newline();
            block(node.body_);
            put("done");
          } else if constexpr (is_node<N, Case>) {
            caseStatement(node);
          } else if constexpr (is_node<N, Select>) {
            statement(lower_select(node, stmt.span_));
          } else if constexpr (is_node<N, Function>) {
            put(fmt::format("{}() {}", node.name_, node.subshell_ ? "(" : "{"));
            newline();
            block(node.body_);
            put(node.subshell_ ? ")" : "}");
          } else if constexpr (is_node<N, BraceGroup>) {
            group(node.body_, node.subshell_);
          } else if constexpr (is_node<N, Negated>) {
            put("! ");
            statement(*node.body_);
          } else if constexpr (is_node<N, Background>) {
            statement(*node.body_);
            put(" &");
          } else if constexpr (is_node<N, Coproc>) {
            put("coproc ");
            if (!node.name_ && node.body_.size() == 1 && node.body_.front().template is<Command>()) {
              statement(node.body_.front());
            } else {
              if (node.name_) {
                put(*node.name_ + " ");
              }
              group(node.body_, false);
            }
          } else if constexpr (is_node<N, Assignment>) {
            put(assignment(node));
          } else if constexpr (is_node<N, Return>) {
            put(node.exit_ ? "exit" : "return");
            if (node.code_) {
              put(" " + word(*node.code_));
            }
          } else if constexpr (is_node<N, ExprStmt>) {
            if (auto const* arith = node.expr_.template getIf<Arithmetic>()) {
              put(fmt::format("(( {} ))", arith->expr_ ? arith_text(*arith->expr_) : std::string{}));
            } else if (auto const* cond = node.expr_.template getIf<TestExpression>()) {
              put(test(*cond));
            } else {
              throw std::logic_error("expression statement holds neither a test nor an arithmetic expression");
            }
          } else {
            put("#" + node.text_);
          }
        },
        stmt.node_
    );
    for (auto const& redir : stmt.redirects_) {
      put(" " + redirect(redir));
    }
  }

  void command(Command const& cmd) {
    std::vector<std::string> pieces;
    for (auto const& env : cmd.prefix_) {
      pieces.push_back(fmt::format(
          "{}{}{}{}",
          env.name_,
          env.index_ ? fmt::format("[{}]", *env.index_) : std::string{},
          env.append_ ? "+=" : "=",
          value(env.value_)
      ));
    }
    for (std::size_t i = 0; i < cmd.words_.size(); ++i) {
      pieces.push_back(word(cmd.words_[i], i == 0 ? Position::CommandName : Position::Argument));
    }
    for (auto const& redir : cmd.redirects_) {
      pieces.push_back(redirect(redir));
    }

    for (std::size_t i = 0; i < pieces.size(); ++i) {
      if (i == 0) {
        put(pieces[i]);
      } else if (exceeds(pieces[i].size() + 1)) {
        breakLine();
        line_ += pieces[i];
      } else {
        put(" " + pieces[i]);
      }
    }
  }

  void caseStatement(Case const& node) {
    put(fmt::format("case {} in", word(node.word_)));
    newline();
    ++indent_;
    for (auto const& arm : node.arms_) {
      std::string patterns;
      for (std::size_t i = 0; i < arm.patterns_.size(); ++i) {
        patterns += (i == 0 ? "" : "|") + word(arm.patterns_[i], Position::Pattern);
      }
      put(patterns + ")");
      newline();
      ++indent_;
      list(arm.body_);
      switch (arm.terminator_) {
        case CaseTerminator::Break: put(";;"); break;
        case CaseTerminator::FallThrough: put(";&"); break;
        case CaseTerminator::Continue: put(";;&"); break;
      }
      newline();
      --indent_;
    }
    --indent_;
    put("esac");
  }

  auto assignment(Assignment const& node) -> std::string {
    return fmt::format(
        "{}{}{}{}{}",
        node.exported_ ? "export " : "",
        node.name_,
        node.index_ ? fmt::format("[{}]", *node.index_) : std::string{},
        node.append_ ? "+=" : "=",
        value(node.value_)
    );
  }

  // Right side of an assignment; an empty literal is written as nothing
  auto value(Expr const& expr) -> std::string {
    if (auto lit = literal_value(expr); lit && lit->empty()) {
      return {};
    }
    return word(expr);
  }

  auto redirect(Redirect const& redir) -> std::string {
    auto fd = redir.fd_ ? std::to_string(*redir.fd_) : std::string{};
    switch (redir.kind_) {
      case RedirectKind::HereDoc:
        heredocs_.push_back(PendingHereDoc{redir.body_, redir.delimiter_});
        return fmt::format(
            "{}{}{}", fd, redir.strip_tabs_ ? "<<-" : "<<", redir.quoted_ ? single_quote(redir.delimiter_) : redir.delimiter_
        );
      case RedirectKind::DupInput:
      case RedirectKind::DupOutput: return fmt::format("{}{}{}", fd, to_string(redir.kind_), word(redir.target_));
      default: return fmt::format("{}{} {}", fd, to_string(redir.kind_), word(redir.target_));
    }
  }

  // -------------------------------------------------------------------------
  // Words
  // -------------------------------------------------------------------------

  auto parts(std::vector<Expr> const& items, Position position) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
      auto const* var = items[i].getIf<Variable>();
      if (var != nullptr && !var->quoted_) {
        out += variable_text(var->name_, next_literal(items, i));
      } else {
        out += word(items[i], i == 0 && position != Position::Argument ? position : Position::Fragment);
      }
    }
    return out;
  }

  auto quotedParts(std::vector<Expr> const& items) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
      auto const& part = items[i];
      if (auto const* lit = part.getIf<Literal>()) {
        out += escape_double_quoted(lit->value_);
      } else if (auto const* var = part.getIf<Variable>()) {
        out += variable_text(var->name_, next_literal(items, i));
      } else if (auto const* param = part.getIf<ParamExpansion>()) {
        out += param_text(*param);
      } else if (auto const* subst = part.getIf<CommandSubst>()) {
        out += substitution(subst->body_);
      } else {
        out += word(part);
      }
    }
    return out;
  }

  auto substitution(std::vector<Stmt> const& body) -> std::string {
    if (list_fits_inline(body)) {
      ShellWriter nested{options_};
      auto        text = nested.renderInline(body);
      // `$((` would start an arithmetic expansion
      return text.starts_with("(") ? "$( " + text + " )" : "$(" + text + ")";
    }
    ShellWriter nested{options_, indent_ + 1};
    return "$(\n" + nested.render(body) + std::string(indent_ * constant::INDENT_WIDTH, ' ') + ")";
  }

  static auto arithmetic(Arithmetic const& node) -> std::string {
    return fmt::format("$(({}))", node.expr_ ? arith_text(*node.expr_) : std::string{});
  }

  auto test(TestExpression const& node) -> std::string {
    auto body = node.expr_ ? testText(*node.expr_, node.extended_) : std::string{"''"};
    return node.extended_ ? fmt::format("[[ {} ]]", body) : fmt::format("[ {} ]", body);
  }

  static int testPrecedence(TestExpr const& expr) noexcept {
    if (std::holds_alternative<TestOr>(expr.node_)) {
      return 1;
    }
    if (std::holds_alternative<TestAnd>(expr.node_)) {
      return 2;
    }
    if (std::holds_alternative<TestNot>(expr.node_)) {
      return 3;
    }
    return 4;
  }

  auto testOperand(TestExpr const& expr, bool extended, bool parens) -> std::string {
    auto text = testText(expr, extended);
    if (!parens) {
      return text;
    }
    return extended ? fmt::format("( {} )", text) : fmt::format("\\( {} \\)", text);
  }

  auto testText(TestExpr const& expr, bool extended) -> std::string {
    return std::visit(
        [&](auto const& node) -> std::string {
          using N = decltype(node);
          if constexpr (is_node<N, TestUnary>) {
            return fmt::format("{} {}", node.op_, word(node.operand_));
          } else if constexpr (is_node<N, TestBinary>) {
            return fmt::format("{} {} {}", word(node.lhs_), node.op_, word(node.rhs_));
          } else if constexpr (is_node<N, TestNot>) {
            return "! " + testOperand(*node.operand_, extended, testPrecedence(*node.operand_) < 3);
          } else if constexpr (is_node<N, TestAnd>) {
            return fmt::format(
                "{} {} {}",
                testOperand(*node.lhs_, extended, testPrecedence(*node.lhs_) < 2),
                extended ? "&&" : "-a",
                testOperand(*node.rhs_, extended, testPrecedence(*node.rhs_) <= 2)
            );
          } else if constexpr (is_node<N, TestOr>) {
            return fmt::format(
                "{} {} {}",
                testText(*node.lhs_, extended),
                extended ? "||" : "-o",
                testOperand(*node.rhs_, extended, testPrecedence(*node.rhs_) <= 1)
            );
          } else {
            return word(node.word_);
          }
        },
        expr.node_
    );
  }
};

} // namespace

auto quote(std::string_view literal) -> std::string {
  if (literal.empty()) {
    return "''";
  }
  if (std::all_of(literal.begin(), literal.end(), is_bare_char)) {
    return std::string{literal};
  }
  return single_quote(literal);
}

auto render_word(shell::Expr const& word) -> std::string {
  config::FormatOptions options;
  ShellWriter           writer{options};
  return writer.word(word);
}

auto render(shell::Script const& script, config::FormatOptions const& options) -> std::string {
  ShellWriter writer{options};
  return writer.render(script.statements_);
}

} // namespace shpure::codegen
