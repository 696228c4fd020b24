#include "shpure/Parser.hpp"
#include "shpure/AST.hpp"
#include "shpure/Constants.hpp"
#include "shpure/Lexer.hpp"
#include "shpure/Log.hpp"
#include "shpure/Tokens.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace shpure::shell {

namespace {

constexpr std::array<std::string_view, 21> RESERVED_WORDS = {
    "if",   "then",  "else",     "elif", "fi", "do", "done", "case", "esac", "while",  "until",
    "for",  "in",    "select",   "function", "{",  "}",  "!",    "[[",   "]]",   "coproc",
};

constexpr bool is_name_start(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr bool is_name_char(char c) noexcept {
  return is_name_start(c) || (c >= '0' && c <= '9');
}

bool is_function_name(std::string_view word) noexcept {
  if (word.empty() || is_reserved_word(word)) {
    return false;
  }
  return std::ranges::all_of(word, [](char c) { return is_name_char(c) || c == '-' || c == '.' || c == ':'; });
}

bool adjacent(core::Span const& lhs, core::Span const& rhs) noexcept {
  return lhs.end_line_ == rhs.start_line_ && lhs.end_col_ == rhs.start_col_;
}

// Splits the header of `for ((init; cond; update))` at top level semicolons
std::vector<std::string> split_arith_clauses(std::string_view text) {
  std::vector<std::string> out;
  std::string              current;
  int                      depth = 0;
  for (char c : text) {
    if (c == '(') {
      ++depth;
    } else if (c == ')') {
      --depth;
    }
    if (c == ';' && depth == 0) {
      out.emplace_back(core::util::trim(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  out.emplace_back(core::util::trim(current));
  return out;
}

void add_stderr_dup(Stmt& stmt) {
  Redirect dup;
  dup.kind_   = RedirectKind::DupOutput;
  dup.fd_     = 2;
  dup.target_ = make_literal("1");
  if (auto* cmd = stmt.getIf<Command>()) {
    cmd->redirects_.push_back(std::move(dup));
  } else {
    stmt.redirects_.push_back(std::move(dup));
  }
}

} // namespace

bool is_reserved_word(std::string_view word) noexcept {
  return std::ranges::find(RESERVED_WORDS, word) != RESERVED_WORDS.end();
}

bool is_assignment_word(std::string_view raw) noexcept {
  if (raw.empty() || !is_name_start(raw.front())) {
    return false;
  }
  size_t i = 0;
  while (i < raw.size() && is_name_char(raw[i])) {
    ++i;
  }
  if (i < raw.size() && raw[i] == '[') {
    auto close = raw.find(']', i);
    if (close == std::string_view::npos) {
      return false;
    }
    i = close + 1;
  }
  if (i < raw.size() && raw[i] == '+') {
    ++i;
  }
  return i < raw.size() && raw[i] == '=';
}

Parser::Parser(std::vector<Token> t, size_t depth)
    : tokens_(std::move(t)), depth_(depth) {
  if (tokens_.empty() || !tokens_.back().is<EndToken>()) {
    tokens_.push_back(Token{EndToken{}, {}});
  }
}

Result<std::vector<Stmt>> Parser::parseProgram() {
  auto list = parseList();
  if (!list) {
    return std::unexpected(list.error());
  }
  if (!at<EndToken>()) {
    return std::unexpected(unexpectedToken({}));
  }
  return list;
}

Token const& Parser::peek(size_t offset) const {
  return tokens_[std::min(pos_ + offset, tokens_.size() - 1)];
}

bool Parser::atWord(std::string_view text) const {
  return peek().isWord(text);
}

Token const& Parser::consume() {
  auto const& t = tokens_[std::min(pos_, tokens_.size() - 1)];
  if (pos_ < tokens_.size() - 1) {
    ++pos_;
  }
  return t;
}

Result<void> Parser::expectWord(std::string_view word) {
  if (!atWord(word)) {
    return std::unexpected(unexpectedToken(fmt::format("'{}'", word)));
  }
  consume();
  return {};
}

auto Parser::unexpectedToken(std::string expected) const -> core::ParseError {
  auto const& t   = peek();
  std::string msg = t.is<EndToken>() ? std::string{"unexpected end of input"}
                                     : fmt::format("unexpected '{}'", tokenText(t));
  return core::ParseError{std::move(msg), t.span_.start_line_, t.span_.start_col_, std::move(expected)};
}

auto Parser::lastSpan() const -> core::Span {
  return pos_ == 0 ? peek().span_ : tokens_[pos_ - 1].span_;
}

size_t Parser::consumeLinebreak() {
  size_t newlines = 0;
  while (atAny<NewlineToken, CommentToken>()) {
    if (at<NewlineToken>()) {
      ++newlines;
    }
    consume();
  }
  return newlines;
}

bool Parser::atListTerminator() const {
  if (atAny<EndToken, RParenToken, DSemiToken, SemiAmpToken, DSemiAmpToken>()) {
    return true;
  }
  auto const* w = peek().getIf<WordToken>();
  if (w == nullptr) {
    return false;
  }
  auto const& text = w->text_;
  return text == "then" || text == "else" || text == "elif" || text == "fi" || text == "do" || text == "done"
      || text == "esac" || text == "}";
}

Result<void> Parser::enter() {
  if (++depth_ > constant::MAX_NESTING_DEPTH) {
    auto const& t = peek();
    return std::unexpected(core::nesting_error(t.span_.start_line_, t.span_.start_col_));
  }
  return {};
}

void Parser::leave() noexcept {
  --depth_;
}

Result<std::vector<Stmt>> Parser::parseList() {
  std::vector<Stmt> list;
  size_t            newlines = 0;

  auto blank_lines = [&newlines]() -> size_t { return newlines > 1 ? newlines - 1 : 0; };

  while (true) {
    while (true) {
      if (tryConsume<NewlineToken>()) {
        ++newlines;
        continue;
      }
      if (tryConsume<SemiToken>()) {
        continue;
      }
      if (auto const* c = peek().getIf<CommentToken>()) {
        list.push_back(Stmt{Comment{c->text_}, {}, peek().span_, blank_lines()});
        consume();
        newlines = 0;
        continue;
      }
      break;
    }
    if (atListTerminator()) {
      break;
    }

    auto stmt = parseAndOr();
    if (!stmt) {
      return std::unexpected(stmt.error());
    }
    stmt->blank_before_ = blank_lines();
    newlines            = 0;

    if (tryConsume<AmpToken>()) {
      auto span  = stmt->span_.merge(lastSpan());
      auto blank = stmt->blank_before_;
      stmt->blank_before_ = 0;
      list.push_back(Stmt{Background{std::make_unique<Stmt>(std::move(*stmt))}, {}, span, blank});
      continue;
    }
    list.push_back(std::move(*stmt));
    if (tryConsume<SemiToken>()) {
      continue;
    }
    if (!atAny<NewlineToken, CommentToken>() && !atListTerminator()) {
      return std::unexpected(unexpectedToken("';' or newline"));
    }
  }
  return list;
}

Result<Stmt> Parser::parseAndOr() {
  auto first = parsePipeline();
  if (!first || !atAny<AndIfToken, OrIfToken>()) {
    return first;
  }

  AndOr node;
  auto  span = first->span_;
  node.items_.push_back(std::move(*first));
  while (true) {
    AndOrOp op{};
    if (tryConsume<AndIfToken>()) {
      op = AndOrOp::And;
    } else if (tryConsume<OrIfToken>()) {
      op = AndOrOp::Or;
    } else {
      break;
    }
    consumeLinebreak();
    auto next = parsePipeline();
    if (!next) {
      return std::unexpected(next.error());
    }
    span = span.merge(next->span_);
    node.ops_.push_back(op);
    node.items_.push_back(std::move(*next));
  }
  return Stmt{std::move(node), {}, span};
}

Result<Stmt> Parser::parsePipeline() {
  if (atWord("!")) {
    auto start = consume().span_;
    auto inner = parsePipeline();
    if (!inner) {
      return std::unexpected(inner.error());
    }
    auto span = start.merge(inner->span_);
    return Stmt{Negated{std::make_unique<Stmt>(std::move(*inner))}, {}, span};
  }

  auto first = parseCommand();
  if (!first || !atAny<PipeToken, PipeAmpToken>()) {
    return first;
  }

  Pipeline node;
  auto     span = first->span_;
  node.commands_.push_back(std::move(*first));
  while (atAny<PipeToken, PipeAmpToken>()) {
    // `a |& b` is shorthand for `a 2>&1 | b`
    if (tryConsume<PipeAmpToken>()) {
      add_stderr_dup(node.commands_.back());
    } else {
      consume();
    }
    consumeLinebreak();
    auto next = parseCommand();
    if (!next) {
      return std::unexpected(next.error());
    }
    span = span.merge(next->span_);
    node.commands_.push_back(std::move(*next));
  }
  return Stmt{std::move(node), {}, span};
}

Result<Stmt> Parser::parseCommand() {
  if (auto ok = enter(); !ok) {
    return std::unexpected(ok.error());
  }
  auto stmt = parseCommandBody();
  leave();
  return stmt;
}

Result<Stmt> Parser::parseCommandBody() {
  if (at<WordToken>() || at<IoNumberToken>() || isRedirection(peek())) {
    auto const& w = peek().word();
    bool        compound =
        w == "if" || w == "while" || w == "until" || w == "for" || w == "select" || w == "case" || w == "function"
        || w == "{" || w == "[[" || w == "[" || w == "coproc"
        || (at<WordToken>() && peek(1).is<LParenToken>() && peek(2).is<RParenToken>());
    if (!compound) {
      if (at<WordToken>() && is_reserved_word(w) && w != "!") {
        return std::unexpected(unexpectedToken("command"));
      }
      return parseSimpleCommand();
    }
  }

  auto stmt = [this]() -> Result<Stmt> {
    if (at<ArithToken>()) {
      return parseArithCommand();
    }
    if (at<LParenToken>()) {
      return parseSubshell();
    }
    if (atWord("if")) {
      return parseIf();
    }
    if (atWord("while")) {
      return parseWhile(false);
    }
    if (atWord("until")) {
      return parseWhile(true);
    }
    if (atWord("for")) {
      return parseFor();
    }
    if (atWord("select")) {
      return parseSelect();
    }
    if (atWord("case")) {
      return parseCase();
    }
    if (atWord("function")) {
      return parseFunction(true);
    }
    if (atWord("{")) {
      return parseBraceGroup();
    }
    if (atWord("[[")) {
      return parseTestCommand(true);
    }
    if (atWord("[")) {
      return parseTestCommand(false);
    }
    if (atWord("coproc")) {
      return parseCoproc();
    }
    if (at<WordToken>() && peek(1).is<LParenToken>()) {
      if (!is_function_name(peek().word())) {
        return std::unexpected(unexpectedToken("function name"));
      }
      return parseFunction(false);
    }
    return std::unexpected(unexpectedToken("command"));
  }();

  if (!stmt) {
    return stmt;
  }
  if (auto ok = parseTrailingRedirects(*stmt); !ok) {
    return std::unexpected(ok.error());
  }
  return stmt;
}

Result<Expr> Parser::parseWordToken(Token const& t) {
  return parse_word(t.word(), t.span_, depth_);
}

Result<EnvAssign> Parser::parseEnvAssign(Token const& t) {
  std::string_view raw = t.word();
  EnvAssign        assign;

  size_t i = 0;
  while (i < raw.size() && is_name_char(raw[i])) {
    ++i;
  }
  assign.name_ = std::string{raw.substr(0, i)};
  if (i < raw.size() && raw[i] == '[') {
    auto close    = raw.find(']', i);
    assign.index_ = std::string{raw.substr(i + 1, close - i - 1)};
    i             = close + 1;
  }
  if (raw[i] == '+') {
    assign.append_ = true;
    ++i;
  }
  ++i; // '='

  auto value      = raw.substr(i);
  auto value_span = core::Span{
      t.span_.start_line_,
      t.span_.start_col_ + i,
      t.span_.end_line_,
      t.span_.end_col_,
  };

  if (value.size() >= 2 && value.front() == '(' && value.back() == ')') {
    Lexer lexer{value.substr(1, value.size() - 2), value_span.start_line_, value_span.start_col_ + 1};
    auto  tokens = lexer.lex();
    if (!tokens) {
      return std::unexpected(tokens.error());
    }
    Array array;
    for (auto const& tok : *tokens) {
      if (!tok.is<WordToken>()) {
        continue;
      }
      auto item = parse_word(tok.word(), tok.span_, depth_);
      if (!item) {
        return std::unexpected(item.error());
      }
      array.items_.push_back(std::move(*item));
    }
    assign.value_ = Expr{std::move(array), value_span};
    return assign;
  }

  if (value.empty()) {
    assign.value_ = make_literal("", value_span);
    return assign;
  }
  auto parsed = parse_word(value, value_span, depth_);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }
  assign.value_ = std::move(*parsed);
  return assign;
}

Result<Stmt> Parser::parseSimpleCommand() {
  Command             cmd;
  auto                span = peek().span_;
  std::vector<size_t> word_tokens;

  while (true) {
    if (auto const* io = peek().getIf<IoNumberToken>()) {
      int fd = io->fd_;
      consume();
      if (!isRedirection(peek())) {
        return std::unexpected(unexpectedToken("redirection operator"));
      }
      auto redir = parseRedirect(fd);
      if (!redir) {
        return std::unexpected(redir.error());
      }
      cmd.redirects_.push_back(std::move(*redir));
      continue;
    }
    if (isRedirection(peek())) {
      auto redir = parseRedirect(std::nullopt);
      if (!redir) {
        return std::unexpected(redir.error());
      }
      cmd.redirects_.push_back(std::move(*redir));
      continue;
    }
    if (at<WordToken>()) {
      if (cmd.words_.empty() && is_assignment_word(peek().word())) {
        auto assign = parseEnvAssign(consume());
        if (!assign) {
          return std::unexpected(assign.error());
        }
        cmd.prefix_.push_back(std::move(*assign));
        continue;
      }
      word_tokens.push_back(pos_);
      auto word = parseWordToken(consume());
      if (!word) {
        return std::unexpected(word.error());
      }
      cmd.words_.push_back(std::move(*word));
      continue;
    }
    break;
  }
  span = span.merge(lastSpan());

  if (cmd.words_.empty() && cmd.redirects_.empty() && cmd.prefix_.size() == 1) {
    auto& a = cmd.prefix_.front();
    return Stmt{Assignment{a.name_, a.index_, std::move(a.value_), false, a.append_}, {}, span};
  }

  if (cmd.prefix_.empty() && cmd.redirects_.empty() && !cmd.words_.empty()) {
    auto name = command_name(cmd);
    if ((name == "return" || name == "exit") && cmd.words_.size() <= 2) {
      Return ret;
      ret.exit_ = name == "exit";
      if (cmd.words_.size() == 2) {
        ret.code_ = std::move(cmd.words_[1]);
      }
      return Stmt{std::move(ret), {}, span};
    }
    if (name == "export" && cmd.words_.size() == 2 && is_assignment_word(tokens_[word_tokens[1]].word())) {
      auto assign = parseEnvAssign(tokens_[word_tokens[1]]);
      if (!assign) {
        return std::unexpected(assign.error());
      }
      return Stmt{
          Assignment{assign->name_, assign->index_, std::move(assign->value_), true, assign->append_},
          {},
          span,
      };
    }
  }
  return Stmt{std::move(cmd), {}, span};
}

Result<Redirect> Parser::parseRedirect(std::optional<int> fd) {
  auto        start = fd ? lastSpan() : peek().span_;
  auto const& op    = consume();

  Redirect redir;
  redir.fd_ = fd;

  if (auto const* doc = op.getIf<HereDocToken>()) {
    redir.kind_       = RedirectKind::HereDoc;
    redir.delimiter_  = doc->delimiter_;
    redir.body_       = doc->body_;
    redir.quoted_     = doc->quoted_;
    redir.strip_tabs_ = doc->strip_tabs_;
    redir.target_     = make_literal(doc->delimiter_, op.span_);
    redir.span_       = start.merge(op.span_);
    return redir;
  }

  if (op.is<LessToken>()) {
    redir.kind_ = RedirectKind::Input;
  } else if (op.is<GreatToken>()) {
    redir.kind_ = RedirectKind::Output;
  } else if (op.is<DGreatToken>()) {
    redir.kind_ = RedirectKind::Append;
  } else if (op.is<ClobberToken>()) {
    redir.kind_ = RedirectKind::Clobber;
  } else if (op.is<LessGreatToken>()) {
    redir.kind_ = RedirectKind::ReadWrite;
  } else if (op.is<LessAndToken>()) {
    redir.kind_ = RedirectKind::DupInput;
  } else if (op.is<GreatAndToken>()) {
    redir.kind_ = RedirectKind::DupOutput;
  } else if (op.is<AndGreatToken>()) {
    redir.kind_ = RedirectKind::OutputAll;
  } else if (op.is<AndDGreatToken>()) {
    redir.kind_ = RedirectKind::AppendAll;
  } else {
    redir.kind_ = RedirectKind::HereString;
  }

  if (!at<WordToken>()) {
    return std::unexpected(unexpectedToken("redirection target"));
  }
  auto target = parseWordToken(consume());
  if (!target) {
    return std::unexpected(target.error());
  }
  redir.target_ = std::move(*target);
  redir.span_   = start.merge(lastSpan());
  return redir;
}

Result<void> Parser::parseTrailingRedirects(Stmt& stmt) {
  while (at<IoNumberToken>() || isRedirection(peek())) {
    std::optional<int> fd;
    if (auto const* io = peek().getIf<IoNumberToken>()) {
      fd = io->fd_;
      consume();
    }
    auto redir = parseRedirect(fd);
    if (!redir) {
      return std::unexpected(redir.error());
    }
    stmt.span_ = stmt.span_.merge(redir->span_);
    stmt.redirects_.push_back(std::move(*redir));
  }
  return {};
}

Result<Stmt> Parser::parseIf() {
  auto start = consume().span_;
  If   node;

  auto condition = parseList();
  if (!condition) {
    return std::unexpected(condition.error());
  }
  if (condition->empty()) {
    return std::unexpected(unexpectedToken("condition"));
  }
  node.condition_ = std::move(*condition);
  if (auto ok = expectWord("then"); !ok) {
    return std::unexpected(ok.error());
  }
  auto then = parseList();
  if (!then) {
    return std::unexpected(then.error());
  }
  node.then_ = std::move(*then);

  while (atWord("elif")) {
    consume();
    ElifBranch branch;
    auto       cond = parseList();
    if (!cond) {
      return std::unexpected(cond.error());
    }
    branch.condition_ = std::move(*cond);
    if (auto ok = expectWord("then"); !ok) {
      return std::unexpected(ok.error());
    }
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    branch.body_ = std::move(*body);
    node.elifs_.push_back(std::move(branch));
  }

  if (atWord("else")) {
    consume();
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    node.else_ = std::move(*body);
  }

  if (auto ok = expectWord("fi"); !ok) {
    return std::unexpected(ok.error());
  }
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<std::vector<Stmt>> Parser::parseDoGroup() {
  consumeLinebreak();
  if (auto ok = expectWord("do"); !ok) {
    return std::unexpected(ok.error());
  }
  auto body = parseList();
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto ok = expectWord("done"); !ok) {
    return std::unexpected(ok.error());
  }
  return body;
}

Result<Stmt> Parser::parseWhile(bool until) {
  auto  start = consume().span_;
  While node;
  node.until_ = until;

  auto condition = parseList();
  if (!condition) {
    return std::unexpected(condition.error());
  }
  if (condition->empty()) {
    return std::unexpected(unexpectedToken("condition"));
  }
  node.condition_ = std::move(*condition);

  auto body = parseDoGroup();
  if (!body) {
    return std::unexpected(body.error());
  }
  node.body_ = std::move(*body);
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<std::optional<std::vector<Expr>>> Parser::parseInList() {
  consumeLinebreak();
  if (!atWord("in")) {
    tryConsume<SemiToken>();
    return std::optional<std::vector<Expr>>{};
  }
  consume();

  std::vector<Expr> items;
  while (at<WordToken>()) {
    auto item = parseWordToken(consume());
    if (!item) {
      return std::unexpected(item.error());
    }
    items.push_back(std::move(*item));
  }
  if (!tryConsume<SemiToken>() && !atAny<NewlineToken, CommentToken>()) {
    return std::unexpected(unexpectedToken("';' or newline"));
  }
  return std::optional<std::vector<Expr>>{std::move(items)};
}

Result<Stmt> Parser::parseFor() {
  auto start = consume().span_;

  if (auto const* arith = peek().getIf<ArithToken>()) {
    auto clauses = split_arith_clauses(arith->text_);
    if (clauses.size() != 3) {
      auto const& t = peek();
      return std::unexpected(core::ParseError{
          "arithmetic for loop needs three clauses",
          t.span_.start_line_,
          t.span_.start_col_,
          "'((init; condition; update))'",
      });
    }
    consume();
    tryConsume<SemiToken>();

    ForArith node;
    node.init_      = std::move(clauses[0]);
    node.condition_ = std::move(clauses[1]);
    node.update_    = std::move(clauses[2]);
    auto body       = parseDoGroup();
    if (!body) {
      return std::unexpected(body.error());
    }
    node.body_ = std::move(*body);
    return Stmt{std::move(node), {}, start.merge(lastSpan())};
  }

  if (!at<WordToken>() || !core::util::is_name(peek().word())) {
    return std::unexpected(unexpectedToken("loop variable"));
  }
  For node;
  node.variable_ = consume().word();

  auto items = parseInList();
  if (!items) {
    return std::unexpected(items.error());
  }
  node.items_ = std::move(*items);

  auto body = parseDoGroup();
  if (!body) {
    return std::unexpected(body.error());
  }
  node.body_ = std::move(*body);
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<Stmt> Parser::parseSelect() {
  auto start = consume().span_;
  if (!at<WordToken>() || !core::util::is_name(peek().word())) {
    return std::unexpected(unexpectedToken("select variable"));
  }
  Select node;
  node.variable_ = consume().word();

  auto items = parseInList();
  if (!items) {
    return std::unexpected(items.error());
  }
  node.items_ = std::move(*items);

  auto body = parseDoGroup();
  if (!body) {
    return std::unexpected(body.error());
  }
  node.body_ = std::move(*body);
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<Stmt> Parser::parseCase() {
  auto start = consume().span_;
  if (!at<WordToken>()) {
    return std::unexpected(unexpectedToken("word after 'case'"));
  }
  auto word = parseWordToken(consume());
  if (!word) {
    return std::unexpected(word.error());
  }
  consumeLinebreak();
  if (auto ok = expectWord("in"); !ok) {
    return std::unexpected(ok.error());
  }
  consumeLinebreak();

  Case node{std::move(*word), {}};
  while (!atWord("esac")) {
    if (at<EndToken>()) {
      return std::unexpected(unexpectedToken("'esac'"));
    }

    CaseArm arm;
    auto    arm_start = peek().span_;
    tryConsume<LParenToken>();
    while (true) {
      if (!at<WordToken>()) {
        return std::unexpected(unexpectedToken("case pattern"));
      }
      auto pattern = parseWordToken(consume());
      if (!pattern) {
        return std::unexpected(pattern.error());
      }
      arm.patterns_.push_back(std::move(*pattern));
      if (!tryConsume<PipeToken>()) {
        break;
      }
    }
    if (auto ok = expectConsume<RParenToken>("')'"); !ok) {
      return std::unexpected(ok.error());
    }

    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    arm.body_ = std::move(*body);

    if (tryConsume<DSemiToken>()) {
      arm.terminator_ = CaseTerminator::Break;
    } else if (tryConsume<SemiAmpToken>()) {
      arm.terminator_ = CaseTerminator::FallThrough;
    } else if (tryConsume<DSemiAmpToken>()) {
      arm.terminator_ = CaseTerminator::Continue;
    } else if (at<EndToken>()) {
      return std::unexpected(unexpectedToken("'esac'"));
    } else if (!atWord("esac")) {
      return std::unexpected(unexpectedToken("';;'"));
    }
    arm.span_ = arm_start.merge(lastSpan());
    consumeLinebreak();
    node.arms_.push_back(std::move(arm));
  }
  consume(); // esac
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<std::vector<Stmt>> Parser::parseFunctionBody(bool& subshell) {
  if (atWord("{")) {
    consume();
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    if (auto ok = expectWord("}"); !ok) {
      return std::unexpected(ok.error());
    }
    return body;
  }
  if (tryConsume<LParenToken>()) {
    subshell  = true;
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    if (auto ok = expectConsume<RParenToken>("')'"); !ok) {
      return std::unexpected(ok.error());
    }
    return body;
  }
  auto cmd = parseCommand();
  if (!cmd) {
    return std::unexpected(cmd.error());
  }
  std::vector<Stmt> body;
  body.push_back(std::move(*cmd));
  return body;
}

Result<Stmt> Parser::parseFunction(bool keyword) {
  auto start = peek().span_;
  if (keyword) {
    consume();
    if (!at<WordToken>() || !is_function_name(peek().word())) {
      return std::unexpected(unexpectedToken("function name"));
    }
  }
  Function node;
  node.name_ = consume().word();

  if (tryConsume<LParenToken>()) {
    if (auto ok = expectConsume<RParenToken>("')'"); !ok) {
      return std::unexpected(ok.error());
    }
  }
  consumeLinebreak();

  auto body = parseFunctionBody(node.subshell_);
  if (!body) {
    return std::unexpected(body.error());
  }
  node.body_ = std::move(*body);
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<Stmt> Parser::parseBraceGroup() {
  auto start = consume().span_;
  auto body  = parseList();
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto ok = expectWord("}"); !ok) {
    return std::unexpected(ok.error());
  }
  return Stmt{BraceGroup{std::move(*body), false}, {}, start.merge(lastSpan())};
}

Result<Stmt> Parser::parseSubshell() {
  auto start = consume().span_;
  auto body  = parseList();
  if (!body) {
    return std::unexpected(body.error());
  }
  if (auto ok = expectConsume<RParenToken>("')'"); !ok) {
    return std::unexpected(ok.error());
  }
  return Stmt{BraceGroup{std::move(*body), true}, {}, start.merge(lastSpan())};
}

Result<Stmt> Parser::parseCoproc() {
  auto   start = consume().span_;
  Coproc node;

  if (at<WordToken>() && core::util::is_name(peek().word()) && peek(1).isWord("{")) {
    node.name_ = consume().word();
  }
  if (atWord("{")) {
    consume();
    auto body = parseList();
    if (!body) {
      return std::unexpected(body.error());
    }
    if (auto ok = expectWord("}"); !ok) {
      return std::unexpected(ok.error());
    }
    node.body_ = std::move(*body);
  } else {
    auto cmd = parseCommand();
    if (!cmd) {
      return std::unexpected(cmd.error());
    }
    node.body_.push_back(std::move(*cmd));
  }
  return Stmt{std::move(node), {}, start.merge(lastSpan())};
}

Result<Stmt> Parser::parseArithCommand() {
  auto const& t    = consume();
  auto const& text = t.getIf<ArithToken>()->text_;

  auto parsed = parse_arithmetic(text);
  if (!parsed && core::is_nesting_error(parsed.error())) {
    return std::unexpected(core::nesting_error(t.span_.start_line_, t.span_.start_col_));
  }
  auto expr = parsed ? std::move(*parsed) : ArithExpr{ArithRaw{std::string{core::util::trim(text)}}};
  if (!parsed) {
    core::log::debug("keeping arithmetic '{}' as written: {}", text, parsed.error().message());
  }
  return Stmt{ExprStmt{Expr{Arithmetic{std::make_unique<ArithExpr>(std::move(expr))}, t.span_}}, {}, t.span_};
}

Result<Stmt> Parser::parseTestCommand(bool extended) {
  auto             start = consume().span_;
  std::string_view close = extended ? "]]" : "]";

  std::vector<TestOperand> operands;
  bool                     in_regex = false;
  core::Span               previous;
  while (!atWord(close)) {
    if (atAny<EndToken, NewlineToken, SemiToken>()) {
      return std::unexpected(unexpectedToken(fmt::format("'{}'", close)));
    }
    auto const& t = peek();
    std::string text;
    if (t.is<WordToken>()) {
      text = t.word();
    } else if (extended
               && holdsAny<AndIfToken, OrIfToken, LParenToken, RParenToken, LessToken, GreatToken, PipeToken>(t)) {
      text = tokenText(t);
    } else {
      return std::unexpected(unexpectedToken(fmt::format("'{}'", close)));
    }
    consume();

    // A regex after =~ may contain operator characters; glue adjacent pieces
    if (in_regex && !operands.empty() && adjacent(previous, t.span_)) {
      operands.back().raw_ += text;
      operands.back().span_ = operands.back().span_.merge(t.span_);
    } else {
      bool starts_regex = !operands.empty() && operands.back().raw_ == "=~";
      operands.push_back(TestOperand{std::move(text), t.span_});
      in_regex = starts_regex;
    }
    previous = t.span_;
  }
  consume(); // ] or ]]

  auto test = parse_test(operands, extended, depth_);
  if (!test) {
    return std::unexpected(test.error());
  }
  auto span = start.merge(lastSpan());
  return Stmt{
      ExprStmt{Expr{TestExpression{std::make_unique<TestExpr>(std::move(*test)), extended}, span}},
      {},
      span,
  };
}

Result<std::vector<Stmt>> parse_nested(std::string_view src, size_t line, size_t column, size_t depth) {
  Lexer lexer{src, line, column};
  auto  tokens = lexer.lex();
  if (!tokens) {
    return std::unexpected(tokens.error());
  }
  Parser parser{std::move(*tokens), depth};
  return parser.parseProgram();
}

Result<Script> parse(std::string_view src, std::string_view file) {
  auto started = std::chrono::steady_clock::now();

  Lexer lexer{src};
  auto  tokens = lexer.lex();
  if (!tokens) {
    return std::unexpected(tokens.error());
  }
  core::log::debug("lexed {} tokens", tokens->size());

  Parser parser{std::move(*tokens)};
  auto   statements = parser.parseProgram();
  if (!statements) {
    return std::unexpected(statements.error());
  }

  Script script;
  script.statements_             = std::move(*statements);
  script.metadata_.source_file_  = std::string{file};
  script.metadata_.line_count_   = core::util::split_lines(src).size();
  script.metadata_.parse_time_ms_ =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  core::log::debug(
      "parsed {} statements in {:.3f}ms", count_statements(script), script.metadata_.parse_time_ms_
  );
  return script;
}

} // namespace shpure::shell
