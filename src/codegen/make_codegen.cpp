#include "shpure/Codegen.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace shpure::codegen {

namespace {

using namespace shpure::make;

auto join_segments(std::vector<std::string> const& segments) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      out += " \\\n";
    }
    out += segments[i];
  }
  return out;
}

class MakeWriter {
  config::FormatOptions const& options_;
  std::string                  out_;

public:
  explicit MakeWriter(config::FormatOptions const& options) noexcept : options_(options) {}

  auto render(std::vector<Item> const& items) -> std::string {
    list(items);
    return std::move(out_);
  }

private:
  void blank(std::size_t count) {
    if (options_.keepBlankLines()) {
      out_.append(count, '\n');
    }
  }

  // A logical line, either continued as written or rebuilt from its text
  void line(std::string_view text, std::vector<std::string> const& segments, std::string_view indent = {}) {
    if (options_.keepContinuations() && !segments.empty()) {
      out_ += indent;
      out_ += join_segments(segments);
    } else if (options_.max_line_length_) {
      out_ += indent;
      auto limit = *options_.max_line_length_;
      out_ += wrap_line(text, limit > indent.size() ? limit - indent.size() : 1, "\t");
    } else {
      out_ += indent;
      out_ += text;
    }
    out_.push_back('\n');
  }

  void recipe(std::vector<RecipeLine> const& lines) {
    for (auto const& recipe_line : lines) {
      blank(recipe_line.blank_before_);
      line(recipe_line.text_, recipe_line.segments_, "\t");
    }
  }

  void list(std::vector<Item> const& items) {
    for (auto const& item : items) {
      blank(item.blank_before_);
      std::visit([this](auto const& node) { write(node); }, item.node_);
    }
  }

  void write(Variable const& var) {
    if (var.flavor_ == Flavor::Define) {
      out_ += fmt::format("define {}\n", var.name_);
      if (!var.value_.empty()) {
        out_ += var.value_;
        out_.push_back('\n');
      }
      out_ += "endef\n";
      return;
    }
    auto text = fmt::format("{}{} {}", var.directive_.empty() ? "" : var.directive_ + " ", var.name_, to_string(var.flavor_));
    if (!var.value_.empty()) {
      text += " " + var.value_;
    }
    line(text, var.segments_);
  }

  void write(Target const& target) {
    auto text = target.name_ + (target.double_colon_ ? "::" : ":");
    for (auto const& prereq : target.prerequisites_) {
      text += " " + prereq;
    }
    line(text, target.segments_);
    recipe(target.recipe_);
  }

  void write(PatternRule const& rule) {
    auto text = rule.target_pattern_ + (rule.double_colon_ ? "::" : ":");
    for (auto const& prereq : rule.prereq_patterns_) {
      text += " " + prereq;
    }
    line(text, rule.segments_);
    recipe(rule.recipe_);
  }

  void write(Conditional const& cond) {
    out_ += fmt::format("{} {}\n", to_string(cond.kind_), cond.arguments_);
    list(cond.then_);
    auto const* branch = &cond;
    while (branch->else_) {
      auto const& rest = *branch->else_;
      auto const* next = rest.size() == 1 ? rest.front().getIf<Conditional>() : nullptr;
      if (next != nullptr && next->chained_) {
        out_ += fmt::format("else {} {}\n", to_string(next->kind_), next->arguments_);
        list(next->then_);
        branch = next;
        continue;
      }
      out_ += "else\n";
      list(rest);
      break;
    }
    out_ += "endif\n";
  }

  void write(Include const& include) {
    out_ += fmt::format("{}include {}\n", include.optional_ ? "-" : "", include.path_);
  }

  void write(Comment const& comment) {
    out_ += comment.text_;
    out_.push_back('\n');
  }

  void write(Recipe const& orphan) {
    line(orphan.line_.text_, orphan.line_.segments_, "\t");
  }

  void write(Raw const& raw) {
    line(raw.text_, raw.segments_);
  }
};

} // namespace

auto wrap_line(std::string_view line, std::size_t limit, std::string_view indent) -> std::string {
  std::vector<std::string_view> pieces;
  char                          quote = '\0';
  std::size_t                   start = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
    } else if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '\\') {
      ++i;
    } else if (c == ' ') {
      if (i > start) {
        pieces.push_back(line.substr(start, i - start));
      }
      start = i + 1;
    }
  }
  if (start < line.size()) {
    pieces.push_back(line.substr(start));
  }
  if (pieces.empty()) {
    return std::string{line};
  }

  std::string out;
  std::string current{pieces.front()};
  for (std::size_t i = 1; i < pieces.size(); ++i) {
    if (current.size() + 1 + pieces[i].size() > limit) {
      out += current + " \\\n";
      current = std::string{indent} + std::string{pieces[i]};
    } else {
      current += " ";
      current += pieces[i];
    }
  }
  return out + current;
}

auto render(make::Makefile const& makefile, config::FormatOptions const& options) -> std::string {
  MakeWriter writer{options};
  return writer.render(makefile.items_);
}

} // namespace shpure::codegen
