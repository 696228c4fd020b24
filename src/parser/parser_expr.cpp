#include "shpure/AST.hpp"
#include "shpure/Constants.hpp"
#include "shpure/Parser.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace shpure::shell {

namespace {

constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

constexpr bool is_name_start(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr bool is_name_char(char c) noexcept {
  return is_name_start(c) || is_digit(c);
}

constexpr bool is_special_param(char c) noexcept {
  return c == '?' || c == '$' || c == '#' || c == '@' || c == '*' || c == '!' || c == '-';
}

size_t find_closing(std::string_view s, size_t open_pos, char open, char close);

// Index one past the closing quote of the double-quoted string at `i`
size_t skip_double_quoted(std::string_view s, size_t i) {
  ++i;
  while (i < s.size() && s[i] != '"') {
    if (s[i] == '\\') {
      i += 2;
      continue;
    }
    if (s[i] == '$' && i + 1 < s.size() && (s[i + 1] == '(' || s[i + 1] == '{')) {
      auto end = find_closing(s, i + 1, s[i + 1], s[i + 1] == '(' ? ')' : '}');
      if (end == std::string_view::npos) {
        return std::string_view::npos;
      }
      i = end + 1;
      continue;
    }
    ++i;
  }
  return i < s.size() ? i + 1 : std::string_view::npos;
}

size_t skip_backtick(std::string_view s, size_t i) {
  ++i;
  while (i < s.size() && s[i] != '`') {
    i += s[i] == '\\' ? 2 : 1;
  }
  return i < s.size() ? i + 1 : std::string_view::npos;
}

// Index of the character closing the group opened at `open_pos`
size_t find_closing(std::string_view s, size_t open_pos, char open, char close) {
  int    depth = 0;
  size_t i     = open_pos;
  while (i < s.size()) {
    char c = s[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == '\'' && open == '(') {
      auto end = s.find('\'', i + 1);
      if (end == std::string_view::npos) {
        return end;
      }
      i = end + 1;
      continue;
    }
    if (c == '"') {
      i = skip_double_quoted(s, i);
      if (i == std::string_view::npos) {
        return i;
      }
      continue;
    }
    if (c == '`') {
      i = skip_backtick(s, i);
      if (i == std::string_view::npos) {
        return i;
      }
      continue;
    }
    if (c == '$' && i + 1 < s.size() && (s[i + 1] == '(' || s[i + 1] == '{') && i + 1 != open_pos) {
      auto end = find_closing(s, i + 1, s[i + 1], s[i + 1] == '(' ? ')' : '}');
      if (end == std::string_view::npos) {
        return end;
      }
      i = end + 1;
      continue;
    }
    if (c == open) {
      ++depth;
    } else if (c == close && --depth == 0) {
      return i;
    }
    ++i;
  }
  return std::string_view::npos;
}

// Words that the shell expands by pattern or that carry quoting forms we do
// not model are kept verbatim.
bool is_opaque_word(std::string_view raw) {
  if (raw.starts_with('~') || raw.starts_with("<(") || raw.starts_with(">(")) {
    return true;
  }
  size_t i = 0;
  while (i < raw.size()) {
    char c = raw[i];
    switch (c) {
      case '\\': i += 2; continue;
      case '\'': {
        auto end = raw.find('\'', i + 1);
        if (end == std::string_view::npos) {
          return false;
        }
        i = end + 1;
        continue;
      }
      case '"': {
        i = skip_double_quoted(raw, i);
        if (i == std::string_view::npos) {
          return false;
        }
        continue;
      }
      case '`': {
        i = skip_backtick(raw, i);
        if (i == std::string_view::npos) {
          return false;
        }
        continue;
      }
      case '$': {
        char next = i + 1 < raw.size() ? raw[i + 1] : '\0';
        if (next == '\'' || next == '"') {
          return true;
        }
        if (next == '(' || next == '{') {
          auto end = find_closing(raw, i + 1, next, next == '(' ? ')' : '}');
          if (end == std::string_view::npos) {
            return false;
          }
          i = end + 1;
          continue;
        }
        // `$?` and friends are parameters, not patterns
        i += is_special_param(next) ? 2 : 1;
        continue;
      }
      case '*':
      case '?': return true;
      case '[':
        if (raw.find(']', i + 1) != std::string_view::npos) {
          return true;
        }
        break;
      case '{': {
        auto end = raw.find('}', i + 1);
        if (end != std::string_view::npos) {
          auto body = raw.substr(i + 1, end - i - 1);
          if (body.find(',') != std::string_view::npos || body.find("..") != std::string_view::npos) {
            return true;
          }
        }
        break;
      }
      default: break;
    }
    ++i;
  }
  return false;
}

void clear_quoted(Expr& expr) {
  if (auto* v = expr.getIf<Variable>()) {
    v->quoted_ = false;
  } else if (auto* p = expr.getIf<ParamExpansion>()) {
    p->quoted_ = false;
  } else if (auto* c = expr.getIf<CommandSubst>()) {
    c->quoted_ = false;
  }
}

class WordParser {
  std::string_view raw_;
  size_t           pos_ = 0;
  size_t           line_;
  size_t           column_;
  size_t           depth_;

public:
  WordParser(std::string_view raw, size_t line, size_t column, size_t depth)
      : raw_(raw), line_(line), column_(column), depth_(depth) {}

  Result<Expr> parse(core::Span span) {
    if (is_opaque_word(raw_)) {
      return Expr{Glob{std::string{raw_}}, span};
    }

    std::vector<Expr> parts;
    if (peek() == '"') {
      if (auto ok = parseDoubleQuoted(parts); !ok) {
        return std::unexpected(ok.error());
      }
      if (pos_ == raw_.size()) {
        return collapseQuoted(std::move(parts), span);
      }
    }

    while (pos_ < raw_.size()) {
      auto start = here();
      char c     = peek();
      if (c == '\\') {
        if (pos_ + 1 < raw_.size()) {
          appendLiteral(parts, std::string(1, raw_[pos_ + 1]), start);
          advance(2);
        } else {
          appendLiteral(parts, "\\", start);
          advance();
        }
        continue;
      }
      if (c == '\'') {
        auto end = raw_.find('\'', pos_ + 1);
        if (end == std::string_view::npos) {
          return std::unexpected(error("unterminated single quote"));
        }
        appendLiteral(parts, std::string{raw_.substr(pos_ + 1, end - pos_ - 1)}, start);
        advance(end + 1 - pos_);
        continue;
      }
      if (c == '"') {
        if (auto ok = parseDoubleQuoted(parts); !ok) {
          return std::unexpected(ok.error());
        }
        continue;
      }
      if (c == '$' || c == '`') {
        auto expr = c == '$' ? parseDollar(false) : parseBacktick(false);
        if (!expr) {
          return std::unexpected(expr.error());
        }
        if (auto const* lit = expr->getIf<Literal>()) {
          appendLiteral(parts, lit->value_, start);
        } else {
          parts.push_back(std::move(*expr));
        }
        continue;
      }
      appendLiteral(parts, std::string(1, c), start);
      advance();
    }

    if (parts.empty()) {
      return make_literal("", span);
    }
    if (parts.size() == 1) {
      parts.front().span_ = span;
      return std::move(parts.front());
    }
    return Expr{Concat{std::move(parts), false}, span};
  }

private:
  [[nodiscard]] char peek(size_t offset = 0) const noexcept {
    return pos_ + offset < raw_.size() ? raw_[pos_ + offset] : '\0';
  }

  void advance(size_t count = 1) noexcept {
    for (size_t i = 0; i < count && pos_ < raw_.size(); ++i) {
      if (raw_[pos_] == '\n') {
        ++line_;
        column_ = 1;
      } else {
        ++column_;
      }
      ++pos_;
    }
  }

  [[nodiscard]] auto here() const noexcept -> core::Span {
    return core::Span::point(line_, column_);
  }

  [[nodiscard]] auto error(std::string msg) const -> core::ParseError {
    return core::ParseError{std::move(msg), line_, column_};
  }

  [[nodiscard]] auto spanFrom(core::Span start) const noexcept -> core::Span {
    return core::Span{start.start_line_, start.start_col_, line_, column_};
  }

  void appendLiteral(std::vector<Expr>& parts, std::string text, core::Span start) const {
    if (!parts.empty()) {
      if (auto* lit = parts.back().getIf<Literal>()) {
        lit->value_ += text;
        parts.back().span_ = parts.back().span_.merge(spanFrom(start));
        return;
      }
    }
    parts.push_back(make_literal(std::move(text), spanFrom(start)));
  }

  static Expr collapseQuoted(std::vector<Expr> parts, core::Span span) {
    if (parts.empty()) {
      return make_literal("", span);
    }
    if (parts.size() == 1) {
      parts.front().span_ = span;
      return std::move(parts.front());
    }
    for (auto& part : parts) {
      clear_quoted(part);
    }
    return Expr{Concat{std::move(parts), true}, span};
  }

  Result<void> parseDoubleQuoted(std::vector<Expr>& parts) {
    advance(); // opening quote
    while (pos_ < raw_.size() && peek() != '"') {
      auto start = here();
      char c     = peek();
      if (c == '\\') {
        char next = peek(1);
        if (next == '$' || next == '`' || next == '"' || next == '\\' || next == '\n') {
          appendLiteral(parts, std::string(1, next), start);
          advance(2);
        } else {
          appendLiteral(parts, "\\", start);
          advance();
        }
        continue;
      }
      if (c == '$' || c == '`') {
        auto expr = c == '$' ? parseDollar(true) : parseBacktick(true);
        if (!expr) {
          return std::unexpected(expr.error());
        }
        if (auto const* lit = expr->getIf<Literal>()) {
          appendLiteral(parts, lit->value_, start);
        } else {
          parts.push_back(std::move(*expr));
        }
        continue;
      }
      appendLiteral(parts, std::string(1, c), start);
      advance();
    }
    if (pos_ >= raw_.size()) {
      return std::unexpected(error("unterminated double quote"));
    }
    advance(); // closing quote
    // `""` contributes an empty literal so that the word is not dropped
    if (parts.empty()) {
      parts.push_back(make_literal("", here()));
    }
    return {};
  }

  Result<Expr> parseDollar(bool quoted) {
    auto start = here();
    char next  = peek(1);

    if (next == '(') {
      auto close = find_closing(raw_, pos_ + 1, '(', ')');
      if (close == std::string_view::npos) {
        return std::unexpected(error("unterminated command substitution"));
      }
      // $(( ... )) when the inner group closes right before the outer one
      if (peek(2) == '(' && raw_[close - 1] == ')' && find_closing(raw_, pos_ + 2, '(', ')') == close - 1) {
        auto text = raw_.substr(pos_ + 3, close - pos_ - 4);
        advance(close + 1 - pos_);
        auto parsed = parse_arithmetic(text);
        if (!parsed && core::is_nesting_error(parsed.error())) {
          return std::unexpected(core::nesting_error(start.start_line_, start.start_col_));
        }
        auto expr = parsed ? std::move(*parsed) : ArithExpr{ArithRaw{std::string{core::util::trim(text)}}};
        return Expr{Arithmetic{std::make_unique<ArithExpr>(std::move(expr))}, spanFrom(start)};
      }
      auto inner = raw_.substr(pos_ + 2, close - pos_ - 2);
      advance(2);
      auto body = parse_nested(inner, line_, column_, depth_ + 1);
      if (!body) {
        return std::unexpected(body.error());
      }
      advance(close + 1 - pos_);
      return Expr{CommandSubst{std::move(*body), quoted}, spanFrom(start)};
    }

    if (next == '{') {
      auto close = find_closing(raw_, pos_ + 1, '{', '}');
      if (close == std::string_view::npos) {
        return std::unexpected(error("unterminated parameter expansion"));
      }
      auto inner = raw_.substr(pos_ + 2, close - pos_ - 2);
      advance(close + 1 - pos_);
      auto expr = parseBraced(inner, quoted);
      if (!expr) {
        return std::unexpected(expr.error());
      }
      expr->span_ = spanFrom(start);
      return expr;
    }

    if (is_name_start(next)) {
      size_t end = pos_ + 1;
      while (end < raw_.size() && is_name_char(raw_[end])) {
        ++end;
      }
      auto name = std::string{raw_.substr(pos_ + 1, end - pos_ - 1)};
      advance(end - pos_);
      return Expr{Variable{std::move(name), quoted}, spanFrom(start)};
    }

    if (is_digit(next) || is_special_param(next)) {
      advance(2);
      return Expr{Variable{std::string(1, next), quoted}, spanFrom(start)};
    }

    advance();
    return make_literal("$", spanFrom(start));
  }

  Result<Expr> parseBraced(std::string_view inner, bool quoted) const {
    if (inner.empty()) {
      return std::unexpected(error("bad substitution"));
    }

    ParamExpansion param;
    param.quoted_ = quoted;

    if (inner.size() > 1 && inner.front() == '#') {
      auto name = inner.substr(1);
      if (core::util::is_name(name) || (name.size() == 1 && (is_digit(name[0]) || is_special_param(name[0])))) {
        param.name_ = std::string{name};
        param.op_   = ParamOp::Length;
        return Expr{std::move(param), {}};
      }
    }

    size_t len = 0;
    if (is_name_start(inner.front())) {
      while (len < inner.size() && is_name_char(inner[len])) {
        ++len;
      }
    } else if (is_digit(inner.front())) {
      while (len < inner.size() && is_digit(inner[len])) {
        ++len;
      }
    } else if (is_special_param(inner.front()) && inner.front() != '!') {
      len = 1;
    }

    param.name_ = std::string{inner.substr(0, len)};
    auto rest   = inner.substr(len);
    if (len > 0 && rest.empty()) {
      return Expr{Variable{param.name_, quoted}, {}};
    }

    struct OpSpelling {
      std::string_view text_;
      ParamOp          op_;
      bool             colon_;
    };
    static constexpr std::array<OpSpelling, 12> OPS = {{
        {":-", ParamOp::Default, true},
        {":=", ParamOp::AssignDefault, true},
        {":?", ParamOp::ErrorIfUnset, true},
        {":+", ParamOp::Alternative, true},
        {"%%", ParamOp::RemoveLongSuffix, false},
        {"##", ParamOp::RemoveLongPrefix, false},
        {"-", ParamOp::Default, false},
        {"=", ParamOp::AssignDefault, false},
        {"?", ParamOp::ErrorIfUnset, false},
        {"+", ParamOp::Alternative, false},
        {"%", ParamOp::RemoveSuffix, false},
        {"#", ParamOp::RemovePrefix, false},
    }};

    if (len > 0) {
      for (auto const& spelling : OPS) {
        if (rest.starts_with(spelling.text_)) {
          param.op_    = spelling.op_;
          param.colon_ = spelling.colon_;
          param.word_  = std::string{rest.substr(spelling.text_.size())};
          return Expr{std::move(param), {}};
        }
      }
    }

    // Indirection, slicing, substitution, case modification and subscripts
    param.op_   = ParamOp::Other;
    param.word_ = std::string{inner};
    return Expr{std::move(param), {}};
  }

  Result<Expr> parseBacktick(bool quoted) {
    auto start = here();
    auto end   = skip_backtick(raw_, pos_);
    if (end == std::string_view::npos) {
      return std::unexpected(error("unterminated backquote substitution"));
    }
    std::string inner;
    for (size_t i = pos_ + 1; i + 1 < end; ++i) {
      if (raw_[i] == '\\' && i + 2 < end && (raw_[i + 1] == '\\' || raw_[i + 1] == '`' || raw_[i + 1] == '$')) {
        inner.push_back(raw_[++i]);
        continue;
      }
      inner.push_back(raw_[i]);
    }
    auto body = parse_nested(inner, line_, column_ + 1, depth_ + 1);
    if (!body) {
      return std::unexpected(body.error());
    }
    advance(end - pos_);
    return Expr{CommandSubst{std::move(*body), quoted}, spanFrom(start)};
  }
};

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

struct ArithLexeme {
  enum struct Kind {
    Number,
    Name,
    Dollar,
    Raw,
    Op,
    End,
  };
  Kind        kind_ = Kind::End;
  std::string text_;
};

constexpr std::array<std::string_view, 28> ARITH_OPS = {
    "<<=", ">>=", "**", "++", "--", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||", "+=",
    "-=",  "*=",  "/=", "%=", "&=", "|=", "^=", "+",  "-",  "*",  "/",  "%",  "<",  ">",
};

constexpr std::string_view ARITH_SINGLE_OPS = "=!~&|^?:,()";

Result<std::vector<ArithLexeme>> tokenize_arith(std::string_view text) {
  std::vector<ArithLexeme> out;
  size_t                  i = 0;
  while (i < text.size()) {
    char c = text[i];
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      ++i;
      continue;
    }
    if (is_digit(c)) {
      size_t end = i;
      while (end < text.size() && (is_name_char(text[end]) || text[end] == '#')) {
        ++end;
      }
      out.push_back({ArithLexeme::Kind::Number, std::string{text.substr(i, end - i)}});
      i = end;
      continue;
    }
    if (is_name_start(c)) {
      size_t end = i;
      while (end < text.size() && is_name_char(text[end])) {
        ++end;
      }
      if (end < text.size() && text[end] == '[') {
        auto close = text.find(']', end);
        if (close == std::string_view::npos) {
          return std::unexpected(core::ParseError{"unterminated subscript", 0, i + 1});
        }
        out.push_back({ArithLexeme::Kind::Raw, std::string{text.substr(i, close + 1 - i)}});
        i = close + 1;
        continue;
      }
      out.push_back({ArithLexeme::Kind::Name, std::string{text.substr(i, end - i)}});
      i = end;
      continue;
    }
    if (c == '$') {
      char next = i + 1 < text.size() ? text[i + 1] : '\0';
      if (next == '(' || next == '{') {
        auto close = find_closing(text, i + 1, next, next == '(' ? ')' : '}');
        if (close == std::string_view::npos) {
          return std::unexpected(core::ParseError{"unterminated expansion in arithmetic", 0, i + 1});
        }
        out.push_back({ArithLexeme::Kind::Raw, std::string{text.substr(i, close + 1 - i)}});
        i = close + 1;
        continue;
      }
      size_t end = i + 1;
      while (end < text.size() && is_name_char(text[end])) {
        ++end;
      }
      if (end == i + 1) {
        if (!is_special_param(next)) {
          return std::unexpected(core::ParseError{"stray '$' in arithmetic", 0, i + 1});
        }
        end = i + 2;
      }
      out.push_back({ArithLexeme::Kind::Dollar, std::string{text.substr(i + 1, end - i - 1)}});
      i = end;
      continue;
    }
    bool matched = false;
    for (auto op : ARITH_OPS) {
      if (text.substr(i).starts_with(op)) {
        out.push_back({ArithLexeme::Kind::Op, std::string{op}});
        i += op.size();
        matched = true;
        break;
      }
    }
    if (matched) {
      continue;
    }
    if (ARITH_SINGLE_OPS.find(c) != std::string_view::npos) {
      out.push_back({ArithLexeme::Kind::Op, std::string(1, c)});
      ++i;
      continue;
    }
    return std::unexpected(core::ParseError{fmt::format("unexpected '{}' in arithmetic", c), 0, i + 1});
  }
  out.push_back({ArithLexeme::Kind::End, {}});
  return out;
}

std::optional<ArithOp> binary_op(std::string_view op) noexcept {
  if (op == "+") return ArithOp::Add;
  if (op == "-") return ArithOp::Sub;
  if (op == "*") return ArithOp::Mul;
  if (op == "/") return ArithOp::Div;
  if (op == "%") return ArithOp::Mod;
  if (op == "**") return ArithOp::Pow;
  if (op == "<<") return ArithOp::Shl;
  if (op == ">>") return ArithOp::Shr;
  if (op == "&") return ArithOp::BitAnd;
  if (op == "|") return ArithOp::BitOr;
  if (op == "^") return ArithOp::BitXor;
  if (op == "&&") return ArithOp::LogAnd;
  if (op == "||") return ArithOp::LogOr;
  if (op == "==") return ArithOp::Eq;
  if (op == "!=") return ArithOp::Ne;
  if (op == "<") return ArithOp::Lt;
  if (op == "<=") return ArithOp::Le;
  if (op == ">") return ArithOp::Gt;
  if (op == ">=") return ArithOp::Ge;
  if (op == ",") return ArithOp::Comma;
  return std::nullopt;
}

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

std::optional<ArithAssignOp> assign_op(std::string_view op) noexcept {
  if (op == "=") return ArithAssignOp::Assign;
  if (op == "+=") return ArithAssignOp::AddAssign;
  if (op == "-=") return ArithAssignOp::SubAssign;
  if (op == "*=") return ArithAssignOp::MulAssign;
  if (op == "/=") return ArithAssignOp::DivAssign;
  if (op == "%=") return ArithAssignOp::ModAssign;
  return std::nullopt;
}

constexpr int ASSIGN_PRECEDENCE  = 2;
constexpr int TERNARY_PRECEDENCE = 3;

class ArithParser {
  std::vector<ArithLexeme> tokens_;
  size_t                  pos_   = 0;
  size_t                  depth_ = 0;

public:
  explicit ArithParser(std::vector<ArithLexeme> tokens)
      : tokens_(std::move(tokens)) {}

  Result<ArithExpr> parse() {
    auto expr = parseBinary(1);
    if (!expr) {
      return expr;
    }
    if (peek().kind_ != ArithLexeme::Kind::End) {
      return std::unexpected(error(fmt::format("unexpected '{}'", peek().text_)));
    }
    return expr;
  }

private:
  [[nodiscard]] ArithLexeme const& peek() const {
    return tokens_[std::min(pos_, tokens_.size() - 1)];
  }

  [[nodiscard]] bool atOp(std::string_view op) const {
    return peek().kind_ == ArithLexeme::Kind::Op && peek().text_ == op;
  }

  ArithLexeme const& consume() {
    auto const& t = peek();
    if (pos_ < tokens_.size() - 1) {
      ++pos_;
    }
    return t;
  }

  [[nodiscard]] auto error(std::string msg) const -> core::ParseError {
    return core::ParseError{std::move(msg), 0, pos_ + 1};
  }

  static auto boxed(ArithExpr expr) -> std::unique_ptr<ArithExpr> {
    return std::make_unique<ArithExpr>(std::move(expr));
  }

  // Every recursive path passes through parseBinary or parseUnary
  [[nodiscard]] bool tooDeep() const noexcept {
    return depth_ >= constant::MAX_NESTING_DEPTH;
  }

  Result<ArithExpr> parseBinary(int min_prec) {
    if (tooDeep()) {
      return std::unexpected(core::nesting_error(0, pos_ + 1));
    }
    ++depth_;
    auto expr = parseOperators(min_prec);
    --depth_;
    return expr;
  }

  Result<ArithExpr> parseUnary() {
    if (tooDeep()) {
      return std::unexpected(core::nesting_error(0, pos_ + 1));
    }
    ++depth_;
    auto expr = parsePrefix();
    --depth_;
    return expr;
  }

  Result<ArithExpr> parseOperators(int min_prec) {
    auto lhs = parseUnary();
    if (!lhs) {
      return lhs;
    }
    while (peek().kind_ == ArithLexeme::Kind::Op) {
      auto const& text = peek().text_;

      if (auto assign = assign_op(text); assign && min_prec <= ASSIGN_PRECEDENCE) {
        auto const* var = std::get_if<ArithVar>(&lhs->node_);
        if (var == nullptr || var->dollar_) {
          return std::unexpected(error("assignment to a non-variable"));
        }
        consume();
        auto rhs = parseBinary(ASSIGN_PRECEDENCE);
        if (!rhs) {
          return rhs;
        }
        lhs = ArithExpr{ArithAssign{var->name_, *assign, boxed(std::move(*rhs))}};
        continue;
      }

      if (text == "?" && min_prec <= TERNARY_PRECEDENCE) {
        consume();
        auto then = parseBinary(ASSIGN_PRECEDENCE);
        if (!then) {
          return then;
        }
        if (!atOp(":")) {
          return std::unexpected(error("expected ':' in conditional expression"));
        }
        consume();
        auto otherwise = parseBinary(TERNARY_PRECEDENCE);
        if (!otherwise) {
          return otherwise;
        }
        lhs = ArithExpr{ArithTernary{boxed(std::move(*lhs)), boxed(std::move(*then)), boxed(std::move(*otherwise))}};
        continue;
      }

      auto op = binary_op(text);
      if (!op || precedence(*op) < min_prec) {
        break;
      }
      consume();
      int  next_min = *op == ArithOp::Pow ? precedence(*op) : precedence(*op) + 1;
      auto rhs      = parseBinary(next_min);
      if (!rhs) {
        return rhs;
      }
      lhs = ArithExpr{ArithBinary{*op, boxed(std::move(*lhs)), boxed(std::move(*rhs))}};
    }
    return lhs;
  }

  Result<ArithExpr> parsePrefix() {
    if (peek().kind_ == ArithLexeme::Kind::Op) {
      std::optional<ArithUnaryOp> op;
      auto const&                 text = peek().text_;
      if (text == "-") {
        op = ArithUnaryOp::Neg;
      } else if (text == "+") {
        op = ArithUnaryOp::Plus;
      } else if (text == "!") {
        op = ArithUnaryOp::Not;
      } else if (text == "~") {
        op = ArithUnaryOp::BitNot;
      } else if (text == "++") {
        op = ArithUnaryOp::PreInc;
      } else if (text == "--") {
        op = ArithUnaryOp::PreDec;
      }
      if (op) {
        consume();
        auto operand = parseUnary();
        if (!operand) {
          return operand;
        }
        return ArithExpr{ArithUnary{*op, boxed(std::move(*operand))}};
      }
    }
    return parsePostfix();
  }

  Result<ArithExpr> parsePostfix() {
    auto primary = parsePrimary();
    if (!primary) {
      return primary;
    }
    if (std::holds_alternative<ArithVar>(primary->node_) && (atOp("++") || atOp("--"))) {
      auto op = consume().text_ == "++" ? ArithUnaryOp::PostInc : ArithUnaryOp::PostDec;
      return ArithExpr{ArithUnary{op, boxed(std::move(*primary))}};
    }
    return primary;
  }

  Result<ArithExpr> parsePrimary() {
    auto const& t = peek();
    switch (t.kind_) {
      case ArithLexeme::Kind::Number: return ArithExpr{ArithNumber{consume().text_}};
      case ArithLexeme::Kind::Name: return ArithExpr{ArithVar{consume().text_, false}};
      case ArithLexeme::Kind::Dollar: return ArithExpr{ArithVar{consume().text_, true}};
      case ArithLexeme::Kind::Raw: return ArithExpr{ArithRaw{consume().text_}};
      case ArithLexeme::Kind::Op:
        if (t.text_ == "(") {
          consume();
          auto inner = parseBinary(1);
          if (!inner) {
            return inner;
          }
          if (!atOp(")")) {
            return std::unexpected(error("expected ')'"));
          }
          consume();
          return inner;
        }
        return std::unexpected(error(fmt::format("unexpected '{}'", t.text_)));
      case ArithLexeme::Kind::End: return std::unexpected(error("unexpected end of arithmetic expression"));
    }
    return std::unexpected(error("invalid arithmetic expression"));
  }
};

// ---------------------------------------------------------------------------
// Test expressions
// ---------------------------------------------------------------------------

constexpr std::array<std::string_view, 26> UNARY_TEST_OPS = {
    "-a", "-b", "-c", "-d", "-e", "-f", "-g", "-h", "-k", "-p", "-r", "-s", "-t",
    "-u", "-w", "-x", "-G", "-L", "-N", "-O", "-S", "-z", "-n", "-o", "-v", "-R",
};

constexpr std::array<std::string_view, 17> BINARY_TEST_OPS = {
    "=", "==", "!=", "=~", "<", ">", "\\<", "\\>", "-eq", "-ne", "-lt", "-le", "-gt", "-ge", "-nt", "-ot", "-ef",
};

bool is_unary_test_op(std::string_view s) noexcept {
  return std::ranges::find(UNARY_TEST_OPS, s) != UNARY_TEST_OPS.end();
}

bool is_binary_test_op(std::string_view s) noexcept {
  return std::ranges::find(BINARY_TEST_OPS, s) != BINARY_TEST_OPS.end();
}

class TestParser {
  std::vector<TestOperand> const& operands_;
  size_t                          pos_ = 0;
  bool                            extended_;
  size_t                          depth_;
  size_t                          nesting_ = 0;

public:
  TestParser(std::vector<TestOperand> const& operands, bool extended, size_t depth)
      : operands_(operands), extended_(extended), depth_(depth) {}

  Result<TestExpr> parse() {
    if (operands_.empty()) {
      return TestExpr{TestWord{make_literal("")}};
    }
    auto expr = parseOr();
    if (!expr) {
      return expr;
    }
    if (pos_ < operands_.size()) {
      return std::unexpected(error(fmt::format("unexpected '{}' in test expression", operands_[pos_].raw_)));
    }
    return expr;
  }

private:
  [[nodiscard]] bool at(std::string_view text) const {
    return pos_ < operands_.size() && operands_[pos_].raw_ == text;
  }

  [[nodiscard]] bool atOr() const {
    return extended_ ? at("||") : at("-o");
  }

  [[nodiscard]] bool atAnd() const {
    return extended_ ? at("&&") : at("-a");
  }

  [[nodiscard]] bool atOpen() const {
    return extended_ ? at("(") : (at("\\(") || at("("));
  }

  [[nodiscard]] bool atClose() const {
    return extended_ ? at(")") : (at("\\)") || at(")"));
  }

  [[nodiscard]] TestOperand const& current() const {
    return pos_ < operands_.size() ? operands_[pos_] : operands_.back();
  }

  [[nodiscard]] auto error(std::string msg) const -> core::ParseError {
    auto span = current().span_;
    return core::ParseError{std::move(msg), span.start_line_, span.start_col_};
  }

  Result<Expr> word(TestOperand const& operand) const {
    return parse_word(operand.raw_, operand.span_, depth_);
  }

  Result<TestExpr> parseOr() {
    auto lhs = parseAnd();
    if (!lhs) {
      return lhs;
    }
    while (atOr()) {
      ++pos_;
      auto rhs = parseAnd();
      if (!rhs) {
        return rhs;
      }
      lhs = TestExpr{TestOr{std::make_unique<TestExpr>(std::move(*lhs)), std::make_unique<TestExpr>(std::move(*rhs))}};
    }
    return lhs;
  }

  Result<TestExpr> parseAnd() {
    auto lhs = parseNot();
    if (!lhs) {
      return lhs;
    }
    while (atAnd()) {
      ++pos_;
      auto rhs = parseNot();
      if (!rhs) {
        return rhs;
      }
      lhs =
          TestExpr{TestAnd{std::make_unique<TestExpr>(std::move(*lhs)), std::make_unique<TestExpr>(std::move(*rhs))}};
    }
    return lhs;
  }

  // `!` chains and parenthesized groups both recurse through here
  Result<TestExpr> parseNot() {
    if (nesting_ >= constant::MAX_NESTING_DEPTH) {
      auto span = current().span_;
      return std::unexpected(core::nesting_error(span.start_line_, span.start_col_));
    }
    ++nesting_;
    auto expr = parseNegation();
    --nesting_;
    return expr;
  }

  Result<TestExpr> parseNegation() {
    if (at("!") && pos_ + 1 < operands_.size()) {
      ++pos_;
      auto operand = parseNot();
      if (!operand) {
        return operand;
      }
      return TestExpr{TestNot{std::make_unique<TestExpr>(std::move(*operand))}};
    }
    return parsePrimary();
  }

  Result<TestExpr> parsePrimary() {
    if (pos_ >= operands_.size()) {
      return std::unexpected(error("missing test operand"));
    }
    if (atOpen()) {
      ++pos_;
      auto inner = parseOr();
      if (!inner) {
        return inner;
      }
      if (!atClose()) {
        return std::unexpected(error("expected ')' in test expression"));
      }
      ++pos_;
      return inner;
    }

    auto const& current = operands_[pos_];
    if (pos_ + 2 < operands_.size() && is_binary_test_op(operands_[pos_ + 1].raw_)) {
      auto const& op  = operands_[pos_ + 1].raw_;
      auto const& rhs = operands_[pos_ + 2];
      auto        lhs_expr = word(current);
      if (!lhs_expr) {
        return std::unexpected(lhs_expr.error());
      }
      // The right side of =~ is a regular expression and is kept verbatim
      auto rhs_expr = op == "=~" ? Result<Expr>{Expr{Glob{rhs.raw_}, rhs.span_}} : word(rhs);
      if (!rhs_expr) {
        return std::unexpected(rhs_expr.error());
      }
      pos_ += 3;
      return TestExpr{TestBinary{op, std::move(*lhs_expr), std::move(*rhs_expr)}};
    }

    if (is_unary_test_op(current.raw_) && pos_ + 1 < operands_.size()) {
      auto operand = word(operands_[pos_ + 1]);
      if (!operand) {
        return std::unexpected(operand.error());
      }
      pos_ += 2;
      return TestExpr{TestUnary{current.raw_, std::move(*operand)}};
    }

    auto expr = word(current);
    if (!expr) {
      return std::unexpected(expr.error());
    }
    ++pos_;
    return TestExpr{TestWord{std::move(*expr)}};
  }
};

} // namespace

Result<Expr> parse_word(std::string_view raw, core::Span span, size_t depth) {
  WordParser parser{raw, span.start_line_, span.start_col_, depth};
  return parser.parse(span);
}

Result<ArithExpr> parse_arithmetic(std::string_view text) {
  auto tokens = tokenize_arith(text);
  if (!tokens) {
    return std::unexpected(tokens.error());
  }
  ArithParser parser{std::move(*tokens)};
  return parser.parse();
}

Result<TestExpr> parse_test(std::vector<TestOperand> const& operands, bool extended, size_t depth) {
  TestParser parser{operands, extended, depth};
  return parser.parse();
}

} // namespace shpure::shell
