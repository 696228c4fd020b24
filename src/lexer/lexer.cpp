#include "shpure/Lexer.hpp"
#include "shpure/Constants.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace shpure::shell {

namespace {

constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

constexpr bool is_name_char(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_';
}

// `name=`, `name+=` or `name[index]=` with nothing after the operator
bool ends_with_array_assignment(std::string_view text) noexcept {
  if (text.empty() || text.back() != '=') {
    return false;
  }
  text.remove_suffix(1);
  if (!text.empty() && text.back() == '+') {
    text.remove_suffix(1);
  }
  if (!text.empty() && text.back() == ']') {
    auto open = text.find('[');
    if (open == std::string_view::npos) {
      return false;
    }
    text = text.substr(0, open);
  }
  if (text.empty() || is_digit(text.front())) {
    return false;
  }
  for (char c : text) {
    if (!is_name_char(c)) {
      return false;
    }
  }
  return true;
}

std::string strip_quotes(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '\'' || c == '"') {
      continue;
    }
    if (c == '\\' && i + 1 < raw.size()) {
      out.push_back(raw[++i]);
      continue;
    }
    out.push_back(c);
  }
  return out;
}

} // namespace

std::string const& Token::word() const noexcept {
  static std::string const empty;
  if (auto const* w = getIf<WordToken>()) {
    return w->text_;
  }
  return empty;
}

bool Token::isWord(std::string_view text) const noexcept {
  auto const* w = getIf<WordToken>();
  return w != nullptr && w->text_ == text;
}

std::string tokenText(Token const& t) {
  return std::visit(
      [](auto const& k) -> std::string {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, EndToken>) {
          return "end of input";
        } else if constexpr (std::is_same_v<T, NewlineToken>) {
          return "newline";
        } else if constexpr (std::is_same_v<T, SemiToken>) {
          return ";";
        } else if constexpr (std::is_same_v<T, DSemiToken>) {
          return ";;";
        } else if constexpr (std::is_same_v<T, SemiAmpToken>) {
          return ";&";
        } else if constexpr (std::is_same_v<T, DSemiAmpToken>) {
          return ";;&";
        } else if constexpr (std::is_same_v<T, AmpToken>) {
          return "&";
        } else if constexpr (std::is_same_v<T, AndIfToken>) {
          return "&&";
        } else if constexpr (std::is_same_v<T, OrIfToken>) {
          return "||";
        } else if constexpr (std::is_same_v<T, PipeToken>) {
          return "|";
        } else if constexpr (std::is_same_v<T, PipeAmpToken>) {
          return "|&";
        } else if constexpr (std::is_same_v<T, LParenToken>) {
          return "(";
        } else if constexpr (std::is_same_v<T, RParenToken>) {
          return ")";
        } else if constexpr (std::is_same_v<T, LessToken>) {
          return "<";
        } else if constexpr (std::is_same_v<T, GreatToken>) {
          return ">";
        } else if constexpr (std::is_same_v<T, DGreatToken>) {
          return ">>";
        } else if constexpr (std::is_same_v<T, ClobberToken>) {
          return ">|";
        } else if constexpr (std::is_same_v<T, LessGreatToken>) {
          return "<>";
        } else if constexpr (std::is_same_v<T, LessAndToken>) {
          return "<&";
        } else if constexpr (std::is_same_v<T, GreatAndToken>) {
          return ">&";
        } else if constexpr (std::is_same_v<T, AndGreatToken>) {
          return "&>";
        } else if constexpr (std::is_same_v<T, AndDGreatToken>) {
          return "&>>";
        } else if constexpr (std::is_same_v<T, TLessToken>) {
          return "<<<";
        } else if constexpr (std::is_same_v<T, HereDocToken>) {
          return (k.strip_tabs_ ? "<<-" : "<<") + k.delimiter_;
        } else if constexpr (std::is_same_v<T, IoNumberToken>) {
          return std::to_string(k.fd_);
        } else if constexpr (std::is_same_v<T, ArithToken>) {
          return "((" + k.text_ + "))";
        } else if constexpr (std::is_same_v<T, WordToken>) {
          return k.text_;
        } else {
          return "#" + k.text_;
        }
      },
      t.kind_
  );
}

Lexer::Lexer(std::string_view src, size_t first_line, size_t first_column)
    : src_(src), line_(first_line), column_(first_column) {}

std::expected<std::vector<Token>, core::ParseError> Lexer::lex() {
  std::vector<Token> out;

  auto push = [&](Token::Kind kind, core::Span start) {
    out.push_back(Token{std::move(kind), core::Span{start.start_line_, start.start_col_, line_, column_}});
  };

  while (true) {
    skipWsExceptNewline();
    auto start = here();

    if (atEnd()) {
      if (!pending_heredocs_.empty()) {
        auto const& doc = std::get<HereDocToken>(out[pending_heredocs_.front()].kind_);
        return std::unexpected(error("unterminated here-document", "'" + doc.delimiter_ + "'"));
      }
      push(EndToken{}, start);
      break;
    }

    char c = peek();
    if (c == '\n') {
      advance();
      push(NewlineToken{}, start);
      if (!pending_heredocs_.empty()) {
        if (auto ok = readHereDocBodies(out); !ok) {
          return std::unexpected(ok.error());
        }
      }
      continue;
    }

    if (c == '#') {
      auto comment = lexComment();
      if (!comment) {
        return std::unexpected(comment.error());
      }
      push(std::move(*comment), start);
      continue;
    }

    if (c == '(' && startsArithmeticCommand()) {
      auto text = lexArithmetic();
      if (!text) {
        return std::unexpected(text.error());
      }
      push(ArithToken{std::move(*text)}, start);
      continue;
    }

    // Process substitution is kept as an opaque word
    if ((c == '<' || c == '>') && peek(1) == '(') {
      auto word = lexWord();
      if (!word) {
        return std::unexpected(word.error());
      }
      push(std::move(*word), start);
      continue;
    }

    // Operators, longest match first
    if (match(";;&")) {
      push(DSemiAmpToken{}, start);
      continue;
    }
    if (match(";;")) {
      push(DSemiToken{}, start);
      continue;
    }
    if (match(";&")) {
      push(SemiAmpToken{}, start);
      continue;
    }
    if (match("&&")) {
      push(AndIfToken{}, start);
      continue;
    }
    if (match("&>>")) {
      push(AndDGreatToken{}, start);
      continue;
    }
    if (match("&>")) {
      push(AndGreatToken{}, start);
      continue;
    }
    if (match("||")) {
      push(OrIfToken{}, start);
      continue;
    }
    if (match("|&")) {
      push(PipeAmpToken{}, start);
      continue;
    }
    if (match("<<<")) {
      push(TLessToken{}, start);
      continue;
    }
    if (match("<<-")) {
      auto doc = lexHereDocHeader(true);
      if (!doc) {
        return std::unexpected(doc.error());
      }
      pending_heredocs_.push_back(out.size());
      push(std::move(*doc), start);
      continue;
    }
    if (match("<<")) {
      auto doc = lexHereDocHeader(false);
      if (!doc) {
        return std::unexpected(doc.error());
      }
      pending_heredocs_.push_back(out.size());
      push(std::move(*doc), start);
      continue;
    }
    if (match("<&")) {
      push(LessAndToken{}, start);
      continue;
    }
    if (match("<>")) {
      push(LessGreatToken{}, start);
      continue;
    }
    if (match(">>")) {
      push(DGreatToken{}, start);
      continue;
    }
    if (match(">&")) {
      push(GreatAndToken{}, start);
      continue;
    }
    if (match(">|")) {
      push(ClobberToken{}, start);
      continue;
    }

    switch (c) {
      case ';':
        advance();
        push(SemiToken{}, start);
        continue;
      case '&':
        advance();
        push(AmpToken{}, start);
        continue;
      case '|':
        advance();
        push(PipeToken{}, start);
        continue;
      case '(':
        advance();
        push(LParenToken{}, start);
        continue;
      case ')':
        advance();
        push(RParenToken{}, start);
        continue;
      case '<':
        advance();
        push(LessToken{}, start);
        continue;
      case '>':
        advance();
        push(GreatToken{}, start);
        continue;
      default: break;
    }

    // A run of digits directly followed by a redirection operator is a fd
    if (is_digit(c)) {
      size_t j = pos_;
      while (j < src_.size() && is_digit(src_[j])) {
        ++j;
      }
      if (j < src_.size() && (src_[j] == '<' || src_[j] == '>') && j - pos_ <= 4) {
        int fd = std::stoi(std::string{src_.substr(pos_, j - pos_)});
        advance(j - pos_);
        push(IoNumberToken{fd}, start);
        continue;
      }
    }

    auto word = lexWord();
    if (!word) {
      return std::unexpected(word.error());
    }
    push(std::move(*word), start);
  }
  return out;
}

char Lexer::peek(size_t offset) const noexcept {
  return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
}

bool Lexer::atEnd() const noexcept {
  return pos_ >= src_.size();
}

void Lexer::advance(size_t count) noexcept {
  for (size_t i = 0; i < count && pos_ < src_.size(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }
}

bool Lexer::match(std::string_view literal) noexcept {
  if (src_.substr(pos_).starts_with(literal)) {
    advance(literal.size());
    return true;
  }
  return false;
}

void Lexer::skipWsExceptNewline() noexcept {
  while (pos_ < src_.size()) {
    char c = src_[pos_];
    if (c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f') {
      advance();
      continue;
    }
    if (c == '\\' && peek(1) == '\n') {
      advance(2);
      continue;
    }
    break;
  }
}

auto Lexer::here() const noexcept -> core::Span {
  return core::Span::point(line_, column_);
}

auto Lexer::error(std::string msg, std::string expected) const -> core::ParseError {
  return core::ParseError{std::move(msg), line_, column_, std::move(expected)};
}

std::expected<CommentToken, core::ParseError> Lexer::lexComment() {
  advance(); // '#'
  size_t start = pos_;
  while (pos_ < src_.size() && src_[pos_] != '\n') {
    advance();
  }
  auto text = src_.substr(start, pos_ - start);
  if (!text.empty() && text.back() == '\r') {
    text.remove_suffix(1);
  }
  return CommentToken{std::string{text}};
}

bool Lexer::isWordBreak(char c) noexcept {
  switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case ';':
    case '&':
    case '|':
    case '(':
    case ')':
    case '<':
    case '>': return true;
    default: return false;
  }
}

std::expected<WordToken, core::ParseError> Lexer::lexWord() {
  std::string text;

  if ((peek() == '<' || peek() == '>') && peek(1) == '(') {
    text.push_back(peek());
    advance();
    if (auto ok = scanBalanced(text, '(', ')'); !ok) {
      return std::unexpected(ok.error());
    }
  }

  while (!atEnd()) {
    char c = peek();

    if (c == '(' && ends_with_array_assignment(text)) {
      if (auto ok = scanBalanced(text, '(', ')'); !ok) {
        return std::unexpected(ok.error());
      }
      continue;
    }
    if (isWordBreak(c)) {
      break;
    }

    std::expected<void, core::ParseError> ok;
    switch (c) {
      case '\\':
        if (peek(1) == '\n') {
          advance(2);
          continue;
        }
        text.push_back(c);
        advance();
        if (!atEnd()) {
          text.push_back(peek());
          advance();
        }
        continue;
      case '\'': ok = scanSingleQuoted(text); break;
      case '"': ok = scanDoubleQuoted(text); break;
      case '`': ok = scanBacktick(text); break;
      case '$': ok = scanDollar(text); break;
      default:
        text.push_back(c);
        advance();
        continue;
    }
    if (!ok) {
      return std::unexpected(ok.error());
    }
  }
  return WordToken{std::move(text)};
}

std::expected<void, core::ParseError> Lexer::scanSingleQuoted(std::string& out) {
  auto start = here();
  out.push_back('\'');
  advance();
  while (!atEnd() && peek() != '\'') {
    out.push_back(peek());
    advance();
  }
  if (atEnd()) {
    return std::unexpected(
        core::ParseError{"unterminated single quote", start.start_line_, start.start_col_, "closing '"}
    );
  }
  out.push_back('\'');
  advance();
  return {};
}

std::expected<void, core::ParseError> Lexer::scanDoubleQuoted(std::string& out) {
  auto start = here();
  out.push_back('"');
  advance();
  while (!atEnd() && peek() != '"') {
    char c = peek();
    if (c == '\\') {
      out.push_back(c);
      advance();
      if (!atEnd()) {
        out.push_back(peek());
        advance();
      }
      continue;
    }
    std::expected<void, core::ParseError> ok;
    if (c == '$' && (peek(1) == '(' || peek(1) == '{')) {
      ok = scanDollar(out);
    } else if (c == '`') {
      ok = scanBacktick(out);
    } else {
      out.push_back(c);
      advance();
    }
    if (!ok) {
      return ok;
    }
  }
  if (atEnd()) {
    return std::unexpected(
        core::ParseError{"unterminated double quote", start.start_line_, start.start_col_, "closing \""}
    );
  }
  out.push_back('"');
  advance();
  return {};
}

std::expected<void, core::ParseError> Lexer::scanBacktick(std::string& out) {
  auto start = here();
  out.push_back('`');
  advance();
  while (!atEnd() && peek() != '`') {
    if (peek() == '\\') {
      out.push_back(peek());
      advance();
      if (atEnd()) {
        break;
      }
    }
    out.push_back(peek());
    advance();
  }
  if (atEnd()) {
    return std::unexpected(
        core::ParseError{"unterminated backquote substitution", start.start_line_, start.start_col_, "closing `"}
    );
  }
  out.push_back('`');
  advance();
  return {};
}

std::expected<void, core::ParseError> Lexer::scanDollar(std::string& out) {
  char next = peek(1);
  if (next == '(') {
    out.push_back('$');
    advance();
    return scanBalanced(out, '(', ')');
  }
  if (next == '{') {
    out.push_back('$');
    advance();
    return scanBalanced(out, '{', '}');
  }
  if (next == '\'') {
    // ANSI-C quoting: backslash escapes are honored while scanning
    auto start = here();
    out += "$'";
    advance(2);
    while (!atEnd() && peek() != '\'') {
      if (peek() == '\\') {
        out.push_back(peek());
        advance();
        if (atEnd()) {
          break;
        }
      }
      out.push_back(peek());
      advance();
    }
    if (atEnd()) {
      return std::unexpected(
          core::ParseError{"unterminated ANSI-C quote", start.start_line_, start.start_col_, "closing '"}
      );
    }
    out.push_back('\'');
    advance();
    return {};
  }
  out.push_back('$');
  advance();
  return {};
}

// Substitutions nest through scanDollar; the depth is bounded here
std::expected<void, core::ParseError> Lexer::scanBalanced(std::string& out, char open, char close) {
  if (nesting_ >= constant::MAX_NESTING_DEPTH) {
    return std::unexpected(core::nesting_error(line_, column_));
  }
  ++nesting_;
  auto ok = scanGroup(out, open, close);
  --nesting_;
  return ok;
}

std::expected<void, core::ParseError> Lexer::scanGroup(std::string& out, char open, char close) {
  auto start = here();
  int  depth = 0;
  while (!atEnd()) {
    char c = peek();
    std::expected<void, core::ParseError> ok;
    if (c == '\\') {
      out.push_back(c);
      advance();
      if (!atEnd()) {
        out.push_back(peek());
        advance();
      }
      continue;
    }
    if (c == '\'' && open == '(') {
      ok = scanSingleQuoted(out);
    } else if (c == '"') {
      ok = scanDoubleQuoted(out);
    } else if (c == '`') {
      ok = scanBacktick(out);
    } else if (c == '$' && (peek(1) == '(' || peek(1) == '{')) {
      ok = scanDollar(out);
    } else {
      out.push_back(c);
      advance();
      if (c == open) {
        ++depth;
      } else if (c == close) {
        if (--depth == 0) {
          return {};
        }
      }
      continue;
    }
    if (!ok) {
      return ok;
    }
  }
  std::string what = open == '{' ? "unterminated parameter expansion" : "unterminated command substitution";
  return std::unexpected(core::ParseError{what, start.start_line_, start.start_col_, std::string{"closing "} + close});
}

bool Lexer::startsArithmeticCommand() const noexcept {
  if (peek() != '(' || peek(1) != '(') {
    return false;
  }
  int depth = 0;
  for (size_t j = pos_ + 2; j < src_.size(); ++j) {
    char c = src_[j];
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      if (depth == 0) {
        return j + 1 < src_.size() && src_[j + 1] == ')';
      }
      --depth;
    }
  }
  return false;
}

std::expected<std::string, core::ParseError> Lexer::lexArithmetic() {
  auto start = here();
  advance(2);
  std::string text;
  int         depth = 0;
  while (!atEnd()) {
    char c = peek();
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      if (depth == 0 && peek(1) == ')') {
        advance(2);
        return text;
      }
      --depth;
    }
    text.push_back(c);
    advance();
  }
  return std::unexpected(
      core::ParseError{"unterminated arithmetic command", start.start_line_, start.start_col_, "'))'"}
  );
}

std::expected<HereDocToken, core::ParseError> Lexer::lexHereDocHeader(bool strip_tabs) {
  skipWsExceptNewline();
  if (atEnd() || isWordBreak(peek())) {
    return std::unexpected(error("missing here-document delimiter", "delimiter word"));
  }
  auto raw = lexWord();
  if (!raw) {
    return std::unexpected(raw.error());
  }
  HereDocToken doc;
  doc.quoted_     = raw->text_.find_first_of("'\"\\") != std::string::npos;
  doc.delimiter_  = strip_quotes(raw->text_);
  doc.strip_tabs_ = strip_tabs;
  return doc;
}

std::expected<void, core::ParseError> Lexer::readHereDocBodies(std::vector<Token>& out) {
  for (size_t index : pending_heredocs_) {
    auto& doc      = std::get<HereDocToken>(out[index].kind_);
    bool  finished = false;
    while (!atEnd()) {
      size_t nl   = src_.find('\n', pos_);
      size_t end  = nl == std::string_view::npos ? src_.size() : nl;
      auto   line = src_.substr(pos_, end - pos_);
      advance(end - pos_ + (nl == std::string_view::npos ? 0 : 1));

      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }
      if (doc.strip_tabs_) {
        while (!line.empty() && line.front() == '\t') {
          line.remove_prefix(1);
        }
      }
      if (line == doc.delimiter_) {
        finished = true;
        break;
      }
      doc.body_.append(line);
      doc.body_.push_back('\n');
    }
    if (!finished) {
      return std::unexpected(error("unterminated here-document", "'" + doc.delimiter_ + "'"));
    }
  }
  pending_heredocs_.clear();
  return {};
}

} // namespace shpure::shell
