#pragma once

#include <compare>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shpure::core {

template<typename T, typename U = std::string>
using Result = std::expected<T, U>;

// 1-based source range. A default constructed span (all zero) marks a
// synthesized node that has no source location.
struct Span {
  std::size_t start_line_ = 0;
  std::size_t start_col_  = 0;
  std::size_t end_line_   = 0;
  std::size_t end_col_    = 0;

  [[nodiscard]] static auto point(std::size_t line, std::size_t col) noexcept -> Span;

  [[nodiscard]] auto merge(Span const& other) const noexcept -> Span;
  [[nodiscard]] auto contains(Span const& other) const noexcept -> bool;
  [[nodiscard]] auto empty() const noexcept -> bool;
  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(Span const&) const -> bool = default;
  auto operator<=>(Span const&) const        = default;
};

// Facts about a parsed input; not part of the tree structure
struct Metadata {
  std::string source_file_;
  std::size_t line_count_    = 0;
  double      parse_time_ms_ = 0.0;
};

enum struct Dialect {
  Shell,
  Makefile,
  Dockerfile,
};

enum struct Category {
  Determinism,
  Idempotency,
  Security,
  Portability,
  ParallelSafety,
  Performance,
  ErrorHandling,
  Reproducibility,
  TypeSafety,
  SideEffect,
};

enum struct Severity {
  Info,
  Low,
  Medium,
  High,
  Critical,
};

[[nodiscard]] auto to_string(Dialect dialect) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Category category) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Severity severity) noexcept -> std::string_view;

[[nodiscard]] auto parse_dialect(std::string_view text) noexcept -> std::optional<Dialect>;
[[nodiscard]] auto parse_category(std::string_view text) noexcept -> std::optional<Category>;

struct SemanticIssue {
  std::string                rule_id_;
  Category                   category_ = Category::Determinism;
  Severity                   severity_ = Severity::Medium;
  Span                       span_;
  std::string                message_;
  std::optional<std::string> fix_;
};

struct ParseError {
  std::string message_;
  std::size_t line_   = 0;
  std::size_t column_ = 0;
  std::string expected_;

  ParseError(std::string msg, std::size_t line, std::size_t column, std::string expected = {});

  ParseError(ParseError const&)                = default;
  ParseError& operator=(ParseError const&)     = default;
  ParseError(ParseError&&) noexcept            = default;
  ParseError& operator=(ParseError&&) noexcept = default;
  ~ParseError()                                = default;

  [[nodiscard]] std::string const& message() const noexcept;
  [[nodiscard]] std::size_t        line() const noexcept;
  [[nodiscard]] std::size_t        column() const noexcept;

  // "file:line:col: message"; the file part is omitted when empty
  [[nodiscard]] auto to_string(std::string_view file = {}) const -> std::string;
};

// Input nested deeper than constant::MAX_NESTING_DEPTH. Never recovered from.
[[nodiscard]] auto nesting_error(std::size_t line, std::size_t column) -> ParseError;
[[nodiscard]] bool is_nesting_error(ParseError const& error) noexcept;

namespace util {

[[nodiscard]] auto trim(std::string_view s) noexcept -> std::string_view;
[[nodiscard]] auto trim_left(std::string_view s) noexcept -> std::string_view;
[[nodiscard]] auto trim_right(std::string_view s) noexcept -> std::string_view;
[[nodiscard]] auto split_whitespace(std::string_view s) -> std::vector<std::string>;
[[nodiscard]] auto split_lines(std::string_view s) -> std::vector<std::string_view>;
[[nodiscard]] auto join(std::vector<std::string> const& parts, std::string_view separator) -> std::string;
[[nodiscard]] auto contains(std::string_view haystack, std::string_view needle) noexcept -> bool;
[[nodiscard]] auto count(std::string_view haystack, std::string_view needle) noexcept -> std::size_t;
[[nodiscard]] auto is_name(std::string_view s) noexcept -> bool;
[[nodiscard]] auto is_integer(std::string_view s) noexcept -> bool;
[[nodiscard]] auto to_upper(std::string_view s) -> std::string;

// Word-boundary aware search: `needle` must not be preceded or followed by a
// name character. Used for command detection in raw recipe text.
[[nodiscard]] auto contains_word(std::string_view haystack, std::string_view needle) noexcept -> bool;

} // namespace util

} // namespace shpure::core
