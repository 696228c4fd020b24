#include "shpure/Analyzer.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace shpure::analysis {

namespace {

using namespace shpure::shell;
using core::Severity;

auto normalize_type(std::string_view name) -> std::optional<std::string> {
  if (name == "int" || name == "integer") {
    return "int";
  }
  if (name == "str" || name == "string") {
    return "str";
  }
  if (name == "path") {
    return "path";
  }
  return std::nullopt;
}

// `@type name: type`
auto parse_annotation(std::string_view comment) -> std::optional<std::pair<std::string, std::string>> {
  auto text = core::util::trim(comment);
  if (!text.starts_with("@type ")) {
    return std::nullopt;
  }
  text       = text.substr(6);
  auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto name = core::util::trim(text.substr(0, colon));
  auto type = normalize_type(core::util::trim(text.substr(colon + 1)));
  if (!core::util::is_name(name) || !type) {
    return std::nullopt;
  }
  return std::pair{std::string{name}, *type};
}

auto lookup(std::vector<TypeAnnotation> const& annotations, std::string_view name, core::Span before)
    -> std::optional<std::string_view> {
  std::optional<std::string_view> type;
  for (auto const& annotation : annotations) {
    if (annotation.name_ == name && annotation.span_ < before) {
      type = annotation.type_;
    }
  }
  return type;
}

Severity type_severity(AnalyzerConfig const& config) noexcept {
  return config.type_strict_ ? Severity::High : Severity::Medium;
}

bool is_guard_for(Stmt const& stmt, std::string_view name) {
  auto const* guard = stmt.getIf<Case>();
  if (guard == nullptr) {
    return false;
  }
  auto const* var = guard->word_.getIf<Variable>();
  return var != nullptr && var->name_ == name;
}

template<typename F>
void each_list(std::vector<Stmt> const& stmts, F const& fn) {
  fn(stmts);
  walk(stmts, [&](Stmt const& stmt) {
    for_each_child_list(stmt, [&](std::vector<Stmt> const& list) { fn(list); });
  });
}

void collect_arith(ArithExpr const& expr, std::vector<std::string_view>& out) {
  std::visit(
      [&](auto const& node) {
        using N = std::remove_cvref_t<decltype(node)>;
        if constexpr (std::is_same_v<N, ArithVar>) {
          out.push_back(node.name_);
        } else if constexpr (std::is_same_v<N, ArithAssign>) {
          out.push_back(node.name_);
          collect_arith(*node.value_, out);
        } else if constexpr (std::is_same_v<N, ArithUnary>) {
          collect_arith(*node.operand_, out);
        } else if constexpr (std::is_same_v<N, ArithBinary>) {
          collect_arith(*node.lhs_, out);
          collect_arith(*node.rhs_, out);
        } else if constexpr (std::is_same_v<N, ArithTernary>) {
          collect_arith(*node.cond_, out);
          collect_arith(*node.then_, out);
          collect_arith(*node.else_, out);
        }
      },
      expr.node_
  );
}

} // namespace

auto type_annotations(Script const& script) -> std::vector<TypeAnnotation> {
  std::vector<TypeAnnotation> annotations;
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* comment = stmt.getIf<Comment>()) {
      if (auto parsed = parse_annotation(comment->text_)) {
        annotations.push_back(TypeAnnotation{parsed->first, parsed->second, stmt.span_});
      }
      return;
    }
    auto const* cmd = stmt.getIf<Command>();
    if (cmd == nullptr) {
      return;
    }
    auto name = command_name(*cmd);
    if (!name || (*name != "declare" && *name != "typeset" && *name != "local")) {
      return;
    }
    bool integer = false;
    for (size_t i = 1; i < cmd->words_.size(); ++i) {
      auto word = literal_value(cmd->words_[i]);
      if (!word) {
        continue;
      }
      if (word->starts_with("-")) {
        integer = integer || word->find('i') != std::string_view::npos;
        continue;
      }
      auto var = word->substr(0, word->find('='));
      if (integer && core::util::is_name(var)) {
        annotations.push_back(TypeAnnotation{std::string{var}, "int", stmt.span_});
      }
    }
  });
  return annotations;
}

void check_type_mismatch(Script const& script, AnalyzerConfig const& config, IssueSink& sink) {
  if (!config.type_check_) {
    return;
  }
  auto annotations = type_annotations(script);
  if (annotations.empty()) {
    return;
  }
  walk(script.statements_, [&](Stmt const& stmt) {
    auto const* assign = stmt.getIf<Assignment>();
    if (assign == nullptr || assign->index_) {
      return;
    }
    auto type = lookup(annotations, assign->name_, stmt.span_);
    if (type != std::optional<std::string_view>{"int"}) {
      return;
    }
    auto value = literal_value(assign->value_);
    if (value && !core::util::is_integer(*value)) {
      sink.report(
          stmt.span_,
          type_severity(config),
          fmt::format("{} is declared int but assigned '{}'", assign->name_, *value),
          fmt::format("assign an integer to {} or change its declared type", assign->name_)
      );
    }
  });
}

void check_string_arithmetic(Script const& script, AnalyzerConfig const& config, IssueSink& sink) {
  if (!config.type_check_) {
    return;
  }
  auto annotations = type_annotations(script);
  if (annotations.empty()) {
    return;
  }
  auto check = [&](Expr const& expr) {
    auto const* arith = expr.getIf<Arithmetic>();
    if (arith == nullptr || !arith->expr_) {
      return;
    }
    std::vector<std::string_view> names;
    collect_arith(*arith->expr_, names);
    for (auto name : names) {
      auto type = lookup(annotations, name, expr.span_);
      if (type && *type != "int") {
        sink.report(
            expr.span_,
            type_severity(config),
            fmt::format("{} is declared {} but used in arithmetic", name, *type),
            fmt::format("declare {} as int or convert it before the calculation", name)
        );
      }
    }
  };
  walk(script.statements_, [&](Stmt const& stmt) { for_each_expr(stmt, check); });
}

void check_missing_guard(Script const& script, AnalyzerConfig const& config, IssueSink& sink) {
  if (!config.emit_guards_) {
    return;
  }
  auto annotations = type_annotations(script);
  if (annotations.empty()) {
    return;
  }
  each_list(script.statements_, [&](std::vector<Stmt> const& list) {
    for (size_t i = 0; i < list.size(); ++i) {
      auto const* assign = list[i].getIf<Assignment>();
      if (assign == nullptr || assign->index_) {
        continue;
      }
      auto type = lookup(annotations, assign->name_, list[i].span_);
      if (!type) {
        continue;
      }
      if (i + 1 < list.size() && is_guard_for(list[i + 1], assign->name_)) {
        continue;
      }
      sink.report(
          list[i].span_,
          type_severity(config),
          fmt::format("{} is declared {} but never checked at run time", assign->name_, *type),
          fmt::format("insert a {} guard after the assignment", *type)
      );
    }
  });
}

} // namespace shpure::analysis
