#include "shpure/Makefile.hpp"

#include "shpure/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace shpure::make {

namespace {

using core::util::trim;
using core::util::trim_left;
using core::util::trim_right;

// Odd number of trailing backslashes continues the line
auto is_continued(std::string_view line) noexcept -> bool {
  size_t n = 0;
  while (n < line.size() && line[line.size() - 1 - n] == '\\') {
    ++n;
  }
  return n % 2 == 1;
}

auto strip_continuation(std::string_view line) noexcept -> std::string_view {
  line.remove_suffix(1);
  return trim_right(line);
}

struct LogicalLine {
  std::string              text_;
  std::vector<std::string> segments_;
  bool                     recipe_ = false;
  core::Span               span_;
};

struct Separators {
  std::optional<size_t> colon_;
  std::optional<size_t> equals_;
};

// First ':' and '=' outside of `$(...)` and `${...}`
auto find_separators(std::string_view text) noexcept -> Separators {
  Separators sep;
  int        depth = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '$' && i + 1 < text.size() && (text[i + 1] == '(' || text[i + 1] == '{')) {
      ++depth;
      ++i;
    } else if ((c == '(' || c == '{') && depth > 0) {
      ++depth;
    } else if ((c == ')' || c == '}') && depth > 0) {
      --depth;
    } else if (depth == 0 && c == ':' && !sep.colon_) {
      sep.colon_ = i;
    } else if (depth == 0 && c == '=' && !sep.equals_) {
      sep.equals_ = i;
    }
  }
  return sep;
}

auto find_top_level(std::string_view text, char wanted) noexcept -> std::optional<size_t> {
  int depth = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '$' && i + 1 < text.size() && (text[i + 1] == '(' || text[i + 1] == '{')) {
      ++depth;
      ++i;
    } else if ((c == '(' || c == '{') && depth > 0) {
      ++depth;
    } else if ((c == ')' || c == '}') && depth > 0) {
      --depth;
    } else if (depth == 0 && c == wanted) {
      return i;
    }
  }
  return std::nullopt;
}

// Splits `NAME op value` at the operator ending at `equals`
auto split_assignment(std::string_view text, size_t equals) -> std::pair<std::string_view, Flavor> {
  size_t name_end = equals;
  Flavor flavor   = Flavor::Recursive;
  if (equals >= 1) {
    switch (text[equals - 1]) {
      case ':':
        flavor   = Flavor::Simple;
        name_end = (equals >= 2 && text[equals - 2] == ':') ? equals - 2 : equals - 1;
        break;
      case '?':
        flavor   = Flavor::Conditional;
        name_end = equals - 1;
        break;
      case '+':
        flavor   = Flavor::Append;
        name_end = equals - 1;
        break;
      case '!':
        flavor   = Flavor::Shell;
        name_end = equals - 1;
        break;
      default: break;
    }
  }
  return {trim(text.substr(0, name_end)), flavor};
}

auto is_assignment(std::string_view text) noexcept -> bool {
  auto sep = find_separators(text);
  if (!sep.equals_) {
    return false;
  }
  if (!sep.colon_ || *sep.colon_ > *sep.equals_) {
    return true;
  }
  auto e = *sep.equals_;
  auto c = *sep.colon_;
  return c + 1 == e || (c + 2 == e && text[c + 1] == ':');
}

auto first_word(std::string_view text) noexcept -> std::pair<std::string_view, std::string_view> {
  auto end = text.find_first_of(" \t");
  if (end == std::string_view::npos) {
    return {text, {}};
  }
  return {text.substr(0, end), trim_left(text.substr(end))};
}

auto condition_kind(std::string_view word) noexcept -> std::optional<ConditionKind> {
  if (word == "ifeq") {
    return ConditionKind::Ifeq;
  }
  if (word == "ifneq") {
    return ConditionKind::Ifneq;
  }
  if (word == "ifdef") {
    return ConditionKind::Ifdef;
  }
  if (word == "ifndef") {
    return ConditionKind::Ifndef;
  }
  return std::nullopt;
}

// `(a,b)`, `"a" "b"` or `'a' 'b'`
auto valid_comparison(std::string_view args) noexcept -> bool {
  if (args.size() >= 2 && args.front() == '(' && args.back() == ')') {
    auto inner = args.substr(1, args.size() - 2);
    return find_top_level(inner, ',').has_value();
  }
  size_t quoted = 0;
  size_t i      = 0;
  while (i < args.size()) {
    char q = args[i];
    if (q != '"' && q != '\'') {
      return false;
    }
    auto close = args.find(q, i + 1);
    if (close == std::string_view::npos) {
      return false;
    }
    ++quoted;
    i = close + 1;
    while (i < args.size() && (args[i] == ' ' || args[i] == '\t')) {
      ++i;
    }
  }
  return quoted == 2;
}

enum struct Stop {
  EndOfInput,
  Else,
  Endif,
};

struct BlockEnd {
  Stop        stop_ = Stop::EndOfInput;
  std::string else_rest_;
  core::Span  span_;
};

class MakeParser {
  std::vector<std::string_view> lines_;
  size_t                        pos_       = 0;
  size_t                        blank_     = 0;
  bool                          in_rule_   = false;
  bool                          seen_rule_ = false;

public:
  explicit MakeParser(std::string_view src) : lines_(core::util::split_lines(src)) {}

  Result<std::vector<Item>> parseAll() {
    std::vector<Item> items;
    auto              end = parseBlock(items, 0);
    if (!end) {
      return std::unexpected(end.error());
    }
    return items;
  }

private:
  [[nodiscard]] auto error(std::string msg, core::Span const& span, std::string expected = {}) const
      -> core::ParseError {
    return core::ParseError{std::move(msg), span.start_line_, span.start_col_, std::move(expected)};
  }

  auto nextLine() -> std::optional<LogicalLine> {
    if (pos_ >= lines_.size()) {
      return std::nullopt;
    }
    LogicalLine line;
    auto        first = lines_[pos_];
    line.recipe_      = !first.empty() && first.front() == '\t';
    if (line.recipe_) {
      first.remove_prefix(1);
    }
    size_t start = pos_ + 1;

    if (!is_continued(first)) {
      line.text_ = std::string{line.recipe_ ? trim_right(first) : trim(first)};
      line.span_ = core::Span{start, 1, start, lines_[pos_].size() + 1};
      ++pos_;
      return line;
    }

    std::vector<std::string> parts;
    auto                     segment = strip_continuation(first);
    line.segments_.emplace_back(line.recipe_ ? segment : trim_left(segment));
    parts.emplace_back(trim(segment));
    ++pos_;
    while (pos_ < lines_.size()) {
      auto physical = lines_[pos_];
      ++pos_;
      bool more = is_continued(physical);
      auto seg  = more ? strip_continuation(physical) : trim_right(physical);
      line.segments_.emplace_back(seg);
      if (!trim(seg).empty()) {
        parts.emplace_back(trim(seg));
      }
      if (!more) {
        break;
      }
    }
    line.text_ = core::util::join(parts, " ");
    line.span_ = core::Span{start, 1, pos_, lines_[pos_ - 1].size() + 1};
    return line;
  }

  auto takeBlank() noexcept -> size_t {
    return std::exchange(blank_, 0);
  }

  void push(std::vector<Item>& items, Item::Kind node, core::Span span) {
    items.push_back(Item{std::move(node), span, takeBlank()});
  }

  Result<BlockEnd> parseBlock(std::vector<Item>& items, size_t depth) {
    while (auto line = nextLine()) {
      if (line->recipe_ && !trim(line->text_).empty()) {
        if (in_rule_) {
          addRecipe(items, std::move(*line));
          continue;
        }
        if (!seen_rule_) {
          return std::unexpected(error("recipe line before any rule", line->span_, "a rule"));
        }
      }

      std::string_view text = trim(line->text_);
      if (text.empty()) {
        ++blank_;
        continue;
      }
      if (text.front() == '#') {
        push(items, Comment{std::string{text}}, line->span_);
        continue;
      }

      auto [word, rest] = first_word(text);
      if (word == "else") {
        if (depth == 0) {
          return std::unexpected(error("'else' without matching conditional", line->span_));
        }
        return BlockEnd{Stop::Else, std::string{rest}, line->span_};
      }
      if (word == "endif") {
        if (depth == 0) {
          return std::unexpected(error("'endif' without matching conditional", line->span_));
        }
        return BlockEnd{Stop::Endif, {}, line->span_};
      }
      if (auto kind = condition_kind(word)) {
        auto cond = parseConditional(*kind, rest, line->span_, depth, false);
        if (!cond) {
          return std::unexpected(cond.error());
        }
        items.push_back(std::move(*cond));
        continue;
      }

      auto parsed = parseLine(items, std::move(*line));
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
    }
    return BlockEnd{};
  }

  void addRecipe(std::vector<Item>& items, LogicalLine line) {
    RecipeLine recipe{std::move(line.text_), std::move(line.segments_), line.span_, takeBlank()};
    if (!items.empty()) {
      auto& last = items.back();
      if (auto* target = last.getIf<Target>()) {
        last.span_ = last.span_.merge(recipe.span_);
        target->recipe_.push_back(std::move(recipe));
        return;
      }
      if (auto* rule = last.getIf<PatternRule>()) {
        last.span_ = last.span_.merge(recipe.span_);
        rule->recipe_.push_back(std::move(recipe));
        return;
      }
    }
    auto span  = recipe.span_;
    auto blank = recipe.blank_before_;
    items.push_back(Item{Recipe{std::move(recipe)}, span, blank});
  }

  Result<Item> parseConditional(ConditionKind kind, std::string_view args, core::Span span, size_t depth, bool chained) {
    args = trim(args);
    if (kind == ConditionKind::Ifeq || kind == ConditionKind::Ifneq) {
      if (!valid_comparison(args)) {
        return std::unexpected(
            error(fmt::format("malformed {} condition", to_string(kind)), span, "'(arg1,arg2)' or '\"arg1\" \"arg2\"'")
        );
      }
    } else if (args.empty()) {
      return std::unexpected(error(fmt::format("{} needs a variable name", to_string(kind)), span, "a variable name"));
    }

    Conditional cond{kind, std::string{args}, {}, std::nullopt, chained};
    size_t      blank = chained ? 0 : takeBlank();

    auto end = parseBlock(cond.then_, depth + 1);
    if (!end) {
      return std::unexpected(end.error());
    }
    if (end->stop_ == Stop::EndOfInput) {
      return std::unexpected(error("conditional without 'endif'", span, "'endif'"));
    }

    if (end->stop_ == Stop::Else) {
      auto else_span = end->span_;
      if (!end->else_rest_.empty()) {
        auto [word, rest] = first_word(end->else_rest_);
        auto next_kind    = condition_kind(word);
        if (!next_kind) {
          return std::unexpected(error("unexpected text after 'else'", else_span, "a conditional directive"));
        }
        auto nested = parseConditional(*next_kind, rest, else_span, depth, true);
        if (!nested) {
          return std::unexpected(nested.error());
        }
        auto end_span = nested->span_;
        cond.else_.emplace();
        cond.else_->push_back(std::move(*nested));
        return Item{std::move(cond), span.merge(end_span), blank};
      }

      cond.else_.emplace();
      auto else_end = parseBlock(*cond.else_, depth + 1);
      if (!else_end) {
        return std::unexpected(else_end.error());
      }
      if (else_end->stop_ == Stop::EndOfInput) {
        return std::unexpected(error("conditional without 'endif'", span, "'endif'"));
      }
      if (else_end->stop_ == Stop::Else) {
        return std::unexpected(error("more than one 'else' in conditional", else_end->span_, "'endif'"));
      }
      end = std::move(else_end);
    }
    return Item{std::move(cond), span.merge(end->span_), blank};
  }

  Result<void> parseDefine(std::vector<Item>& items, std::string_view rest, core::Span span) {
    auto name = trim(rest);
    if (name.empty()) {
      return std::unexpected(error("missing variable name", span, "a variable name"));
    }
    std::vector<std::string> body;
    while (pos_ < lines_.size()) {
      auto physical = lines_[pos_++];
      if (trim(physical) == "endef") {
        span.end_line_ = pos_;
        span.end_col_  = physical.size() + 1;
        push(items, Variable{std::string{name}, core::util::join(body, "\n"), Flavor::Define, {}, {}}, span);
        in_rule_ = false;
        return {};
      }
      body.emplace_back(physical);
    }
    return std::unexpected(error("'define' without 'endef'", span, "'endef'"));
  }

  Result<void> parseLine(std::vector<Item>& items, LogicalLine line) {
    std::string_view text = trim(line.text_);
    auto [word, rest]     = first_word(text);

    if (word == "include" || word == "-include" || word == "sinclude") {
      if (rest.empty()) {
        return std::unexpected(error("include without a path", line.span_, "a file name"));
      }
      push(items, Include{std::string{rest}, word != "include"}, line.span_);
      in_rule_ = false;
      return {};
    }
    if (word == "define") {
      return parseDefine(items, rest, line.span_);
    }

    std::string directive;
    if ((word == "export" || word == "override" || word == "private") && is_assignment(rest)) {
      directive = std::string{word};
      text      = rest;
    }

    if (is_assignment(text)) {
      auto eq             = *find_separators(text).equals_;
      auto [name, flavor] = split_assignment(text, eq);
      if (name.empty()) {
        return std::unexpected(error("missing variable name", line.span_, "a variable name"));
      }
      if (name.find_first_of(" \t") != std::string_view::npos) {
        push(items, Raw{line.text_, std::move(line.segments_)}, line.span_);
        return {};
      }
      auto value = trim(text.substr(eq + 1));
      push(
          items,
          Variable{std::string{name}, std::string{value}, flavor, std::move(directive), std::move(line.segments_)},
          line.span_
      );
      in_rule_ = false;
      return {};
    }

    auto sep = find_separators(text);
    if (!sep.colon_) {
      // vpath, export NAME, $(eval ...) and friends
      push(items, Raw{line.text_, std::move(line.segments_)}, line.span_);
      return {};
    }

    auto colon   = *sep.colon_;
    auto targets = trim(text.substr(0, colon));
    if (targets.empty()) {
      return std::unexpected(error("missing target name", line.span_, "a target"));
    }
    bool double_colon = colon + 1 < text.size() && text[colon + 1] == ':';
    auto rest_text    = text.substr(colon + (double_colon ? 2 : 1));

    std::optional<std::string> inline_recipe;
    if (auto semi = find_top_level(rest_text, ';')) {
      inline_recipe = std::string{trim(rest_text.substr(*semi + 1))};
      rest_text     = rest_text.substr(0, *semi);
    }
    if (find_top_level(rest_text, '=')) {
      // target-specific variable
      push(items, Raw{line.text_, std::move(line.segments_)}, line.span_);
      return {};
    }

    auto prereqs = core::util::split_whitespace(rest_text);
    std::vector<RecipeLine> recipe;
    if (inline_recipe && !inline_recipe->empty()) {
      recipe.push_back(RecipeLine{std::move(*inline_recipe), {}, line.span_, 0});
    }

    if (targets.find('%') != std::string_view::npos) {
      push(
          items,
          PatternRule{std::string{targets}, std::move(prereqs), std::move(recipe), double_colon, std::move(line.segments_)},
          line.span_
      );
    } else {
      push(
          items,
          Target{
              std::string{targets},
              std::move(prereqs),
              std::move(recipe),
              false,
              double_colon,
              std::move(line.segments_),
          },
          line.span_
      );
    }
    in_rule_   = true;
    seen_rule_ = true;
    return {};
  }
};

} // namespace

auto to_string(Flavor flavor) noexcept -> std::string_view {
  switch (flavor) {
    case Flavor::Recursive: return "=";
    case Flavor::Simple: return ":=";
    case Flavor::Conditional: return "?=";
    case Flavor::Append: return "+=";
    case Flavor::Shell: return "!=";
    case Flavor::Define: return "define";
  }
  return "=";
}

auto to_string(ConditionKind kind) noexcept -> std::string_view {
  switch (kind) {
    case ConditionKind::Ifeq: return "ifeq";
    case ConditionKind::Ifneq: return "ifneq";
    case ConditionKind::Ifdef: return "ifdef";
    case ConditionKind::Ifndef: return "ifndef";
  }
  return "ifeq";
}

auto find_closing_paren(std::string_view text, std::size_t open) noexcept -> std::optional<std::size_t> {
  if (open + 1 >= text.size() || text[open] != '$') {
    return std::nullopt;
  }
  char   opener = text[open + 1];
  char   closer = opener == '{' ? '}' : ')';
  size_t depth  = 0;
  for (size_t i = open + 1; i < text.size(); ++i) {
    char c = text[i];
    if (c == opener) {
      ++depth;
    } else if (c == closer) {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::nullopt;
}

auto inside_sort(std::string_view text, std::size_t pos) -> bool {
  constexpr std::string_view SORT = "sort";

  std::vector<bool> frames; // one per open group, true for $(sort
  for (size_t i = 0; i < pos && i < text.size(); ++i) {
    char c = text[i];
    if (c == '$' && i + 1 < text.size()) {
      char next = text[i + 1];
      if (next == '(' || next == '{') {
        auto after = i + 2 + SORT.size();
        frames.push_back(
            text.substr(i + 2).starts_with(SORT) && after < text.size() && (text[after] == ' ' || text[after] == '\t')
        );
      }
      ++i; // `$$` and the opening bracket are consumed together
    } else if (c == '(' || c == '{') {
      frames.push_back(false);
    } else if ((c == ')' || c == '}') && !frames.empty()) {
      frames.pop_back();
    }
  }
  return std::find(frames.begin(), frames.end(), true) != frames.end();
}

auto phony_targets(Makefile const& makefile) -> std::vector<std::string> {
  std::vector<std::string> names;
  walk(makefile.items_, [&names](Item const& item) {
    if (auto const* target = item.getIf<Target>(); target != nullptr && target->name_ == ".PHONY") {
      for (auto const& prereq : target->prerequisites_) {
        if (std::find(names.begin(), names.end(), prereq) == names.end()) {
          names.push_back(prereq);
        }
      }
    }
  });
  return names;
}

auto target_names(Target const& target) -> std::vector<std::string> {
  return core::util::split_whitespace(target.name_);
}

auto recipe_lines(Makefile const& makefile) -> std::vector<RecipeRef> {
  std::vector<RecipeRef> out;
  std::string_view       current;
  walk(makefile.items_, [&](Item const& item) {
    if (auto const* target = item.getIf<Target>()) {
      current = target->name_;
      for (auto const& line : target->recipe_) {
        out.push_back(RecipeRef{current, &line});
      }
    } else if (auto const* rule = item.getIf<PatternRule>()) {
      current = rule->target_pattern_;
      for (auto const& line : rule->recipe_) {
        out.push_back(RecipeRef{current, &line});
      }
    } else if (auto const* recipe = item.getIf<Recipe>()) {
      out.push_back(RecipeRef{current, &recipe->line_});
    }
  });
  return out;
}

Result<Makefile> parse_makefile(std::string_view src, std::string_view file) {
  auto start = std::chrono::steady_clock::now();

  MakeParser parser{src};
  auto       items = parser.parseAll();
  if (!items) {
    return std::unexpected(items.error());
  }

  Makefile makefile;
  makefile.items_ = std::move(*items);

  auto phony = phony_targets(makefile);
  std::set<std::string, std::less<>> declared(phony.begin(), phony.end());
  walk(makefile.items_, [&declared](Item& item) {
    if (auto* target = item.getIf<Target>()) {
      auto names      = target_names(*target);
      target->phony_ = !names.empty() && std::all_of(names.begin(), names.end(), [&](auto const& n) {
        return declared.contains(n);
      });
    }
  });

  makefile.metadata_.source_file_ = std::string{file};
  makefile.metadata_.line_count_  = core::util::split_lines(src).size();
  makefile.metadata_.parse_time_ms_ =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  core::log::debug("parsed {} makefile items in {:.3f}ms", makefile.items_.size(), makefile.metadata_.parse_time_ms_);
  return makefile;
}

} // namespace shpure::make
