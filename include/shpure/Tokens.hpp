#pragma once

#include <string>
#include <variant>

#include "shpure/Core.hpp"

namespace shpure::shell {

// Leaf token types
struct EndToken {};
struct NewlineToken {};
struct SemiToken {};
struct DSemiToken {};    // ;;
struct SemiAmpToken {};  // ;&
struct DSemiAmpToken {}; // ;;&
struct AmpToken {};
struct AndIfToken {};
struct OrIfToken {};
struct PipeToken {};
struct PipeAmpToken {}; // |&
struct LParenToken {};
struct RParenToken {};

// Redirections
struct LessToken {};
struct GreatToken {};
struct DGreatToken {};
struct ClobberToken {};
struct LessGreatToken {};
struct LessAndToken {};
struct GreatAndToken {};
struct AndGreatToken {};  // &>
struct AndDGreatToken {}; // &>>
struct TLessToken {};     // <<<

// `<<` / `<<-` together with the delimiter word and the collected body
struct HereDocToken {
  std::string delimiter_;
  std::string body_;
  bool        quoted_     = false;
  bool        strip_tabs_ = false;
};

// File descriptor prefix of a redirection, as in `2>`
struct IoNumberToken {
  int fd_ = 0;
};

// Raw text between `((` and `))`
struct ArithToken {
  std::string text_;
};

// Word token carries its raw text, quotes included
struct WordToken {
  std::string text_;
};

struct CommentToken {
  std::string text_;
};

// Token wrapper with position and variant payload
struct Token {
  using Kind = std::variant<
      EndToken,
      NewlineToken,
      SemiToken,
      DSemiToken,
      SemiAmpToken,
      DSemiAmpToken,
      AmpToken,
      AndIfToken,
      OrIfToken,
      PipeToken,
      PipeAmpToken,
      LParenToken,
      RParenToken,
      LessToken,
      GreatToken,
      DGreatToken,
      ClobberToken,
      LessGreatToken,
      LessAndToken,
      GreatAndToken,
      AndGreatToken,
      AndDGreatToken,
      TLessToken,
      HereDocToken,
      IoNumberToken,
      ArithToken,
      WordToken,
      CommentToken>;

  Kind       kind_;
  core::Span span_;

  template<typename T>
  [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(kind_);
  }

  template<typename T>
  [[nodiscard]] T const* getIf() const noexcept {
    return std::get_if<T>(&kind_);
  }

  // Word text when this is a word, empty otherwise
  [[nodiscard]] std::string const& word() const noexcept;

  // True for an unquoted word equal to `text`
  [[nodiscard]] bool isWord(std::string_view text) const noexcept;
};

template<typename... Ts>
inline bool holdsAny(Token const& t) {
  return (t.is<Ts>() || ...);
}

inline bool isRedirection(Token const& t) {
  return holdsAny<
      LessToken,
      GreatToken,
      DGreatToken,
      ClobberToken,
      LessGreatToken,
      LessAndToken,
      GreatAndToken,
      AndGreatToken,
      AndDGreatToken,
      TLessToken,
      HereDocToken>(t);
}

// Human readable text of a token for error messages
std::string tokenText(Token const& t);

} // namespace shpure::shell
