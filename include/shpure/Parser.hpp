#pragma once

#include "shpure/AST.hpp"
#include "shpure/Core.hpp"
#include "shpure/Tokens.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shpure::shell {

template<typename T>
using Result = core::Result<T, core::ParseError>;

class Parser {
  std::vector<Token> tokens_;
  size_t             pos_   = 0;
  size_t             depth_ = 0;

public:
  explicit Parser(std::vector<Token> t, size_t depth = 0);

  Result<std::vector<Stmt>> parseProgram();

private:
  [[nodiscard]] Token const& peek(size_t offset = 0) const;

  template<typename T>
  [[nodiscard]] bool at() const {
    return peek().is<T>();
  }

  template<typename... Ts>
  [[nodiscard]] bool atAny() const {
    return holdsAny<Ts...>(peek());
  }

  // Unquoted word with exactly this text in the current position
  [[nodiscard]] bool atWord(std::string_view text) const;

  Token const& consume();

  template<typename T>
  bool tryConsume() {
    if (at<T>()) {
      ++pos_;
      return true;
    }
    return false;
  }

  template<typename T>
  Result<void> expectConsume(char const* what) {
    if (!at<T>()) {
      return std::unexpected(unexpectedToken(what));
    }
    consume();
    return {};
  }

  Result<void> expectWord(std::string_view word);

  [[nodiscard]] auto unexpectedToken(std::string expected) const -> core::ParseError;
  [[nodiscard]] auto lastSpan() const -> core::Span;

  // Skips newlines and comments; returns the number of newlines consumed
  size_t consumeLinebreak();
  [[nodiscard]] bool atListTerminator() const;

  Result<void> enter();
  void         leave() noexcept;

  Result<std::vector<Stmt>> parseList();
  Result<Stmt>              parseAndOr();
  Result<Stmt>              parsePipeline();
  Result<Stmt>              parseCommand();
  Result<Stmt>              parseCommandBody();
  Result<Stmt>              parseSimpleCommand();
  Result<Redirect>          parseRedirect(std::optional<int> fd);
  Result<void>              parseTrailingRedirects(Stmt& stmt);

  Result<Stmt> parseIf();
  Result<Stmt> parseWhile(bool until);
  Result<Stmt> parseFor();
  Result<Stmt> parseSelect();
  Result<Stmt> parseCase();
  Result<Stmt> parseFunction(bool keyword);
  Result<Stmt> parseBraceGroup();
  Result<Stmt> parseSubshell();
  Result<Stmt> parseCoproc();
  Result<Stmt> parseArithCommand();
  Result<Stmt> parseTestCommand(bool extended);

  Result<std::vector<Stmt>>                parseDoGroup();
  Result<std::optional<std::vector<Expr>>> parseInList();
  Result<std::vector<Stmt>>                parseFunctionBody(bool& subshell);

  Result<Expr>      parseWordToken(Token const& t);
  Result<EnvAssign> parseEnvAssign(Token const& t);
};

// Lexes and parses a complete script
Result<Script> parse(std::string_view src, std::string_view file = {});

// Parses `src` as the body of a command substitution starting at the given
// position. `depth` carries the nesting level of the enclosing parser.
Result<std::vector<Stmt>> parse_nested(std::string_view src, size_t line, size_t column, size_t depth);

// Parses the raw text of one shell word (quotes included)
Result<Expr> parse_word(std::string_view raw, core::Span span, size_t depth = 0);

// Parses the text between `((` and `))`
Result<ArithExpr> parse_arithmetic(std::string_view text);

// One element of a test command together with its source position
struct TestOperand {
  std::string raw_;
  core::Span  span_;
};

// Parses the operands between `[`/`]` or `[[`/`]]`
Result<TestExpr> parse_test(std::vector<TestOperand> const& operands, bool extended, size_t depth = 0);

// True for `name=...`, `name+=...` and `name[index]=...`
[[nodiscard]] bool is_assignment_word(std::string_view raw) noexcept;

[[nodiscard]] bool is_reserved_word(std::string_view word) noexcept;

} // namespace shpure::shell
