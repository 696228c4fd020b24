#pragma once

#include "shpure/Core.hpp"
#include "shpure/Tokens.hpp"

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

namespace shpure::shell {

class Lexer {
  std::string_view src_;
  size_t           pos_     = 0;
  size_t           line_    = 1;
  size_t           column_  = 1;
  size_t           nesting_ = 0;

  // Indices of here-document tokens whose bodies start after the next newline
  std::vector<size_t> pending_heredocs_;

public:
  explicit Lexer(std::string_view src, size_t first_line = 1, size_t first_column = 1);

  Lexer(Lexer const&)                = delete;
  Lexer& operator=(Lexer const&)     = delete;
  Lexer(Lexer&&) noexcept            = default;
  Lexer& operator=(Lexer&&) noexcept = default;
  ~Lexer()                           = default;

  std::expected<std::vector<Token>, core::ParseError> lex();

private:
  [[nodiscard]] char peek(size_t offset = 0) const noexcept;
  [[nodiscard]] bool atEnd() const noexcept;

  void advance(size_t count = 1) noexcept;
  bool match(std::string_view literal) noexcept;
  void skipWsExceptNewline() noexcept;

  [[nodiscard]] auto here() const noexcept -> core::Span;
  [[nodiscard]] auto error(std::string msg, std::string expected = {}) const -> core::ParseError;

  std::expected<CommentToken, core::ParseError> lexComment();
  std::expected<WordToken, core::ParseError>    lexWord();
  std::expected<HereDocToken, core::ParseError> lexHereDocHeader(bool strip_tabs);
  std::expected<void, core::ParseError>         readHereDocBodies(std::vector<Token>& out);
  std::expected<std::string, core::ParseError>  lexArithmetic();

  // Scanners used by lexWord; each appends the consumed raw text to `out`
  std::expected<void, core::ParseError> scanSingleQuoted(std::string& out);
  std::expected<void, core::ParseError> scanDoubleQuoted(std::string& out);
  std::expected<void, core::ParseError> scanBacktick(std::string& out);
  std::expected<void, core::ParseError> scanDollar(std::string& out);
  std::expected<void, core::ParseError> scanBalanced(std::string& out, char open, char close);
  std::expected<void, core::ParseError> scanGroup(std::string& out, char open, char close);

  [[nodiscard]] bool startsArithmeticCommand() const noexcept;
  [[nodiscard]] static bool isWordBreak(char c) noexcept;
};

} // namespace shpure::shell
