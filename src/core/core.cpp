#include <algorithm>
#include <atomic>
#include <cctype>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#include "shpure/Constants.hpp"
#include "shpure/Core.hpp"
#include "shpure/Log.hpp"

namespace shpure::core {

auto Span::point(std::size_t line, std::size_t col) noexcept -> Span {
  return Span{line, col, line, col};
}

auto Span::merge(Span const& other) const noexcept -> Span {
  if (empty()) {
    return other;
  }
  if (other.empty()) {
    return *this;
  }
  Span out = *this;
  if (std::tie(other.start_line_, other.start_col_) < std::tie(start_line_, start_col_)) {
    out.start_line_ = other.start_line_;
    out.start_col_  = other.start_col_;
  }
  if (std::tie(other.end_line_, other.end_col_) > std::tie(end_line_, end_col_)) {
    out.end_line_ = other.end_line_;
    out.end_col_  = other.end_col_;
  }
  return out;
}

auto Span::contains(Span const& other) const noexcept -> bool {
  return std::tie(start_line_, start_col_) <= std::tie(other.start_line_, other.start_col_)
      && std::tie(other.end_line_, other.end_col_) <= std::tie(end_line_, end_col_);
}

auto Span::empty() const noexcept -> bool {
  return start_line_ == 0 && start_col_ == 0 && end_line_ == 0 && end_col_ == 0;
}

auto Span::to_string() const -> std::string {
  return fmt::format("{}:{}", start_line_, start_col_);
}

auto to_string(Dialect dialect) noexcept -> std::string_view {
  switch (dialect) {
    case Dialect::Shell: return "shell";
    case Dialect::Makefile: return "makefile";
    case Dialect::Dockerfile: return "dockerfile";
  }
  return "shell";
}

auto to_string(Category category) noexcept -> std::string_view {
  switch (category) {
    case Category::Determinism: return "determinism";
    case Category::Idempotency: return "idempotency";
    case Category::Security: return "security";
    case Category::Portability: return "portability";
    case Category::ParallelSafety: return "parallel-safety";
    case Category::Performance: return "performance";
    case Category::ErrorHandling: return "error-handling";
    case Category::Reproducibility: return "reproducibility";
    case Category::TypeSafety: return "type-safety";
    case Category::SideEffect: return "side-effect";
  }
  return "determinism";
}

auto to_string(Severity severity) noexcept -> std::string_view {
  switch (severity) {
    case Severity::Info: return "info";
    case Severity::Low: return "low";
    case Severity::Medium: return "medium";
    case Severity::High: return "high";
    case Severity::Critical: return "critical";
  }
  return "info";
}

auto parse_dialect(std::string_view text) noexcept -> std::optional<Dialect> {
  if (text == "shell" || text == "sh" || text == "bash") {
    return Dialect::Shell;
  }
  if (text == "make" || text == "makefile") {
    return Dialect::Makefile;
  }
  if (text == "docker" || text == "dockerfile") {
    return Dialect::Dockerfile;
  }
  return std::nullopt;
}

auto parse_category(std::string_view text) noexcept -> std::optional<Category> {
  for (auto category : {Category::Determinism,
                        Category::Idempotency,
                        Category::Security,
                        Category::Portability,
                        Category::ParallelSafety,
                        Category::Performance,
                        Category::ErrorHandling,
                        Category::Reproducibility,
                        Category::TypeSafety,
                        Category::SideEffect}) {
    if (to_string(category) == text) {
      return category;
    }
  }
  return std::nullopt;
}

ParseError::ParseError(std::string msg, std::size_t line, std::size_t column, std::string expected)
    : message_(std::move(msg)), line_(line), column_(column), expected_(std::move(expected)) {}

std::string const& ParseError::message() const noexcept {
  return message_;
}

std::size_t ParseError::line() const noexcept {
  return line_;
}

std::size_t ParseError::column() const noexcept {
  return column_;
}

auto ParseError::to_string(std::string_view file) const -> std::string {
  std::string out;
  if (!file.empty()) {
    out = fmt::format("{}:", file);
  }
  out += fmt::format("{}:{}: {}", line_, column_, message_);
  if (!expected_.empty()) {
    out += fmt::format(" (expected {})", expected_);
  }
  return out;
}

namespace {

constexpr std::string_view NESTING_PREFIX = "maximum nesting depth";

} // namespace

auto nesting_error(std::size_t line, std::size_t column) -> ParseError {
  return ParseError{fmt::format("{} of {} exceeded", NESTING_PREFIX, constant::MAX_NESTING_DEPTH), line, column};
}

bool is_nesting_error(ParseError const& error) noexcept {
  return error.message().starts_with(NESTING_PREFIX);
}

namespace util {

namespace {

constexpr bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

constexpr bool is_name_char(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace

auto trim_left(std::string_view s) noexcept -> std::string_view {
  size_t i = 0;
  while (i < s.size() && is_space(s[i])) {
    ++i;
  }
  return s.substr(i);
}

auto trim_right(std::string_view s) noexcept -> std::string_view {
  size_t n = s.size();
  while (n > 0 && is_space(s[n - 1])) {
    --n;
  }
  return s.substr(0, n);
}

auto trim(std::string_view s) noexcept -> std::string_view {
  return trim_right(trim_left(s));
}

auto split_whitespace(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> out;
  size_t                   i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i])) {
      ++i;
    }
    size_t start = i;
    while (i < s.size() && !is_space(s[i])) {
      ++i;
    }
    if (i > start) {
      out.emplace_back(s.substr(start, i - start));
    }
  }
  return out;
}

auto split_lines(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  size_t                        start = 0;
  while (start < s.size()) {
    size_t nl = s.find('\n', start);
    if (nl == std::string_view::npos) {
      out.push_back(s.substr(start));
      break;
    }
    auto line = s.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    out.push_back(line);
    start = nl + 1;
  }
  return out;
}

auto join(std::vector<std::string> const& parts, std::string_view separator) -> std::string {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

auto contains(std::string_view haystack, std::string_view needle) noexcept -> bool {
  return haystack.find(needle) != std::string_view::npos;
}

auto count(std::string_view haystack, std::string_view needle) noexcept -> std::size_t {
  if (needle.empty()) {
    return 0;
  }
  std::size_t n   = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    ++n;
    pos = haystack.find(needle, pos + needle.size());
  }
  return n;
}

auto is_name(std::string_view s) noexcept -> bool {
  if (s.empty() || (s.front() >= '0' && s.front() <= '9')) {
    return false;
  }
  return std::ranges::all_of(s, [](char c) { return is_name_char(c); });
}

auto is_integer(std::string_view s) noexcept -> bool {
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    s.remove_prefix(1);
  }
  return !s.empty() && std::ranges::all_of(s, [](char c) { return c >= '0' && c <= '9'; });
}

auto to_upper(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

auto contains_word(std::string_view haystack, std::string_view needle) noexcept -> bool {
  if (needle.empty()) {
    return false;
  }
  size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    bool left_ok  = pos == 0 || !is_name_char(haystack[pos - 1]);
    size_t end    = pos + needle.size();
    bool right_ok = end >= haystack.size() || !is_name_char(haystack[end]);
    if (left_ok && right_ok) {
      return true;
    }
    pos = haystack.find(needle, pos + 1);
  }
  return false;
}

} // namespace util

namespace log {

namespace {

std::atomic<Level> g_level{Level::Warn}; // NOLINT

} // namespace

void set_level(Level level) noexcept {
  g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
  return g_level.load(std::memory_order_relaxed);
}

} // namespace log

} // namespace shpure::core
