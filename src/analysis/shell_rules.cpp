#include "shpure/Analyzer.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
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
using core::Category;
using core::Severity;
using core::Span;

// ---------------------------------------------------------------------------
// Traversal helpers
// ---------------------------------------------------------------------------

template<typename F>
void each_command(Script const& script, F const& fn) {
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* cmd = stmt.getIf<Command>()) {
      fn(stmt, *cmd);
    }
  });
}

template<typename F>
void each_expr(Script const& script, F const& fn) {
  walk(script.statements_, [&](Stmt const& stmt) { for_each_expr(stmt, [&](Expr const& expr) { fn(stmt, expr); }); });
}

template<typename F>
void each_redirect(Script const& script, F const& fn) {
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* cmd = stmt.getIf<Command>()) {
      for (auto const& redir : cmd->redirects_) {
        fn(redir);
      }
    }
    for (auto const& redir : stmt.redirects_) {
      fn(redir);
    }
  });
}

template<typename F>
void arith_names(ArithExpr const& expr, F const& fn) {
  std::visit(
      [&](auto const& node) {
        using N = std::remove_cvref_t<decltype(node)>;
        if constexpr (std::is_same_v<N, ArithVar>) {
          fn(std::string_view{node.name_});
        } else if constexpr (std::is_same_v<N, ArithUnary>) {
          arith_names(*node.operand_, fn);
        } else if constexpr (std::is_same_v<N, ArithBinary>) {
          arith_names(*node.lhs_, fn);
          arith_names(*node.rhs_, fn);
        } else if constexpr (std::is_same_v<N, ArithAssign>) {
          arith_names(*node.value_, fn);
        } else if constexpr (std::is_same_v<N, ArithTernary>) {
          arith_names(*node.cond_, fn);
          arith_names(*node.then_, fn);
          arith_names(*node.else_, fn);
        }
      },
      expr.node_
  );
}

auto word_text(Expr const& expr) -> std::optional<std::string_view> {
  if (auto lit = literal_value(expr)) {
    return lit;
  }
  if (auto const* glob = expr.getIf<Glob>()) {
    return std::string_view{glob->pattern_};
  }
  return std::nullopt;
}

bool is_short_cluster(std::string_view word) noexcept {
  return word.size() > 1 && word.front() == '-' && word[1] != '-'
      && std::all_of(word.begin() + 1, word.end(), [](char c) {
           return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
         });
}

// `$name` / `${name` in raw text (here-document bodies, glob patterns)
bool mentions_variable(std::string_view text, std::string_view name) {
  auto is_name_char = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
  };
  for (auto prefix : {std::string{"$"} + std::string{name}, std::string{"${"} + std::string{name}}) {
    size_t pos = 0;
    while ((pos = text.find(prefix, pos)) != std::string_view::npos) {
      auto end = pos + prefix.size();
      if (name == "$" || end >= text.size() || !is_name_char(text[end])) {
        return true;
      }
      pos = end;
    }
  }
  return false;
}

bool contains_command(std::vector<Stmt> const& body, std::initializer_list<std::string_view> names) {
  bool found = false;
  walk(body, [&](Stmt const& stmt) {
    if (auto const* cmd = stmt.getIf<Command>()) {
      if (auto name = command_name(*cmd)) {
        found = found || std::find(names.begin(), names.end(), *name) != names.end();
      }
    }
  });
  return found;
}

// Reports every use of the given variables: plain and braced expansions,
// arithmetic operands, C-style for clauses, glob words and unquoted
// here-document bodies
void scan_variables(
    Script const&                           script,
    std::initializer_list<std::string_view> names,
    IssueSink&                              sink,
    Severity                                severity,
    char const*                             what,
    char const*                             fix
) {
  auto listed = [&](std::string_view name) { return std::find(names.begin(), names.end(), name) != names.end(); };
  auto report = [&](Span span, std::string_view name) {
    sink.report(span, severity, fmt::format("${} is {}", name, what), std::string{fix});
  };

  each_expr(script, [&](Stmt const&, Expr const& expr) {
    if (auto const* var = expr.getIf<Variable>(); var != nullptr && listed(var->name_)) {
      report(expr.span_, var->name_);
    } else if (auto const* param = expr.getIf<ParamExpansion>(); param != nullptr && listed(param->name_)) {
      report(expr.span_, param->name_);
    } else if (auto const* arith = expr.getIf<Arithmetic>(); arith != nullptr && arith->expr_) {
      arith_names(*arith->expr_, [&](std::string_view name) {
        if (listed(name)) {
          report(expr.span_, name);
        }
      });
    } else if (auto const* glob = expr.getIf<Glob>()) {
      for (auto name : names) {
        if (mentions_variable(glob->pattern_, name)) {
          report(expr.span_, name);
        }
      }
    }
  });

  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* loop = stmt.getIf<ForArith>()) {
      for (auto name : names) {
        if (core::util::contains_word(loop->init_ + ";" + loop->condition_ + ";" + loop->update_, name)) {
          report(stmt.span_, name);
        }
      }
    }
  });

  each_redirect(script, [&](Redirect const& redir) {
    if (redir.kind_ != RedirectKind::HereDoc || redir.quoted_) {
      return;
    }
    for (auto name : names) {
      if (mentions_variable(redir.body_, name)) {
        report(redir.span_, name);
      }
    }
  });
}

template<typename F>
void each_named_command(Script const& script, std::initializer_list<std::string_view> names, F const& fn) {
  each_command(script, [&](Stmt const& stmt, Command const& cmd) {
    auto name = command_name(cmd);
    if (name && std::find(names.begin(), names.end(), *name) != names.end()) {
      fn(stmt, cmd, *name);
    }
  });
}

// ---------------------------------------------------------------------------
// Determinism
// ---------------------------------------------------------------------------

void check_random(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  scan_variables(
      script,
      {"RANDOM", "SRANDOM"},
      sink,
      Severity::High,
      "non-deterministic",
      "replace it with a deterministic value such as a version string or a checksum of the input"
  );
}

void check_process_id(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  scan_variables(
      script,
      {"$", "BASHPID", "PPID"},
      sink,
      Severity::Medium,
      "a process id and differs between runs",
      "use a fixed name, or a directory created once with mkdir -p"
  );
}

bool date_is_fixed(Command const& cmd) {
  for (size_t i = 1; i < cmd.words_.size(); ++i) {
    auto word = word_text(cmd.words_[i]);
    if (!word) {
      continue;
    }
    if (*word == "-r" || word->starts_with("--reference") || word->starts_with("-d@")
        || word->starts_with("--date=@")) {
      return true;
    }
    if ((*word == "-d" || *word == "--date") && i + 1 < cmd.words_.size()) {
      auto next = word_text(cmd.words_[i + 1]);
      if (next && next->starts_with("@")) {
        return true;
      }
    }
  }
  return false;
}

void check_wall_clock(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"date"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    if (!date_is_fixed(cmd)) {
      sink.report(
          stmt.span_,
          Severity::High,
          "date reads the wall clock",
          "use a fixed epoch, e.g. date -d @\"${SOURCE_DATE_EPOCH}\""
      );
    }
  });
  scan_variables(
      script,
      {"SECONDS", "EPOCHSECONDS", "EPOCHREALTIME"},
      sink,
      Severity::High,
      "a wall-clock value",
      "use SOURCE_DATE_EPOCH or an explicit timestamp"
  );
}

void check_hostname(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"hostname"}, [&](Stmt const& stmt, Command const&, std::string_view) {
    sink.report(
        stmt.span_, Severity::Medium, "hostname depends on the machine", "pass the host name in as a parameter"
    );
  });
  scan_variables(
      script, {"HOSTNAME"}, sink, Severity::Medium, "machine dependent", "pass the host name in as a parameter"
  );
}

void check_temp_files(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"mktemp", "tempfile"}, [&](Stmt const& stmt, Command const&, std::string_view name) {
    sink.report(
        stmt.span_,
        Severity::Medium,
        fmt::format("{} generates a random file name", name),
        "use a fixed path below a directory created with mkdir -p"
    );
  });
}

constexpr std::array FLAGGED_VARIABLES{
    std::string_view{"RANDOM"},
    std::string_view{"SRANDOM"},
    std::string_view{"$"},
    std::string_view{"BASHPID"},
    std::string_view{"PPID"},
    std::string_view{"SECONDS"},
    std::string_view{"EPOCHSECONDS"},
    std::string_view{"EPOCHREALTIME"},
    std::string_view{"HOSTNAME"},
};

bool is_flagged_source(Expr const& value, std::vector<std::string> const& tainted) {
  bool flagged = false;
  auto check   = [&](std::string_view name) {
    flagged = flagged || std::find(FLAGGED_VARIABLES.begin(), FLAGGED_VARIABLES.end(), name) != FLAGGED_VARIABLES.end()
           || std::find(tainted.begin(), tainted.end(), name) != tainted.end();
  };
  auto visit = [&](Expr const& expr) {
    if (auto const* var = expr.getIf<Variable>()) {
      check(var->name_);
    } else if (auto const* param = expr.getIf<ParamExpansion>()) {
      check(param->name_);
    } else if (auto const* arith = expr.getIf<Arithmetic>(); arith != nullptr && arith->expr_) {
      arith_names(*arith->expr_, check);
    } else if (auto const* subst = expr.getIf<CommandSubst>()) {
      flagged = flagged || contains_command(subst->body_, {"date", "hostname", "mktemp", "tempfile"});
    }
  };
  visit(value);
  if (auto const* concat = value.getIf<Concat>()) {
    for (auto const& part : concat->parts_) {
      visit(part);
    }
  }
  return flagged;
}

// Statement lists of a script, including command substitution bodies
template<typename F>
void each_list(Script const& script, F const& fn) {
  fn(script.statements_);
  walk(script.statements_, [&](Stmt const& stmt) {
    for_each_child_list(stmt, [&](std::vector<Stmt> const& list) { fn(list); });
    for_each_expr(stmt, [&](Expr const& expr) {
      if (auto const* subst = expr.getIf<CommandSubst>()) {
        fn(subst->body_);
      }
    });
  });
}

// Every expression below a statement, nested statements included
template<typename F>
void deep_exprs(Stmt const& stmt, F const& fn) {
  for_each_expr(stmt, [&](Expr const& expr) {
    fn(expr);
    if (auto const* subst = expr.getIf<CommandSubst>()) {
      walk(subst->body_, [&](Stmt const& inner) { for_each_expr(inner, fn); });
    }
  });
  for_each_child_list(stmt, [&](std::vector<Stmt> const& list) {
    walk(list, [&](Stmt const& inner) { for_each_expr(inner, fn); });
  });
  if (auto const* negated = stmt.getIf<Negated>()) {
    deep_exprs(*negated->body_, fn);
  } else if (auto const* background = stmt.getIf<Background>()) {
    deep_exprs(*background->body_, fn);
  }
}

void check_tainted_uses(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_list(script, [&](std::vector<Stmt> const& list) {
    std::vector<std::string> tainted;
    for (auto const& stmt : list) {
      if (!tainted.empty()) {
        deep_exprs(stmt, [&](Expr const& expr) {
          std::string_view name;
          if (auto const* var = expr.getIf<Variable>()) {
            name = var->name_;
          } else if (auto const* param = expr.getIf<ParamExpansion>()) {
            name = param->name_;
          }
          if (!name.empty() && std::find(tainted.begin(), tainted.end(), name) != tainted.end()) {
            sink.report(
                expr.span_,
                Severity::Medium,
                fmt::format("${} holds a value derived from a non-deterministic source", name),
                fmt::format("assign {} from a deterministic value", name)
            );
          }
        });
      }
      if (auto const* assign = stmt.getIf<Assignment>()) {
        auto it = std::find(tainted.begin(), tainted.end(), assign->name_);
        if (is_flagged_source(assign->value_, tainted)) {
          if (it == tainted.end()) {
            tainted.push_back(assign->name_);
          }
        } else if (it != tainted.end() && !assign->append_) {
          tainted.erase(it);
        }
      }
    }
  });
}

// ---------------------------------------------------------------------------
// Idempotency
// ---------------------------------------------------------------------------

void check_mkdir(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"mkdir"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    if (!has_flag(cmd, 'p', "--parents")) {
      sink.report(stmt.span_, Severity::Medium, "mkdir fails when the directory already exists", "use mkdir -p");
    }
  });
}

void check_rm(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"rm"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    if (!has_flag(cmd, 'f', "--force")) {
      sink.report(stmt.span_, Severity::Medium, "rm fails when the file is already gone", "use rm -f");
    }
  });
}

void check_ln(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"ln"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    if (has_flag(cmd, 's', "--symbolic") && !has_flag(cmd, 'f', "--force")) {
      sink.report(stmt.span_, Severity::Medium, "ln -s fails when the link already exists", "use ln -sf");
    }
  });
}

void check_append(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_redirect(script, [&](Redirect const& redir) {
    if (redir.kind_ != RedirectKind::Append && redir.kind_ != RedirectKind::AppendAll) {
      return;
    }
    if (literal_value(redir.target_) == std::optional<std::string_view>{"/dev/null"}) {
      return;
    }
    sink.report(
        redir.span_,
        Severity::Low,
        "appending to a file repeats the content on every run",
        "write the file with > or check for the line with grep -q before appending"
    );
  });
}

void check_copy_move(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"cp", "mv"}, [&](Stmt const& stmt, Command const&, std::string_view name) {
    sink.report(
        stmt.span_,
        Severity::Low,
        fmt::format("{} may behave differently when the destination already exists", name),
        "check the destination first or make the target path unique"
    );
  });
}

// ---------------------------------------------------------------------------
// Security
// ---------------------------------------------------------------------------

bool has_expansion(Expr const& expr) {
  if (expr.is<Variable>() || expr.is<ParamExpansion>() || expr.is<CommandSubst>() || expr.is<Arithmetic>()) {
    return true;
  }
  if (auto const* glob = expr.getIf<Glob>()) {
    return glob->pattern_.find('$') != std::string::npos || glob->pattern_.find('`') != std::string::npos;
  }
  if (auto const* concat = expr.getIf<Concat>()) {
    return std::any_of(concat->parts_.begin(), concat->parts_.end(), [](Expr const& part) {
      return has_expansion(part);
    });
  }
  return false;
}

void check_eval(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"eval"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    bool expanded = std::any_of(cmd.words_.begin() + 1, cmd.words_.end(), [](Expr const& w) {
      return has_expansion(w);
    });
    if (expanded) {
      sink.report(
          stmt.span_,
          Severity::Critical,
          "eval executes expanded input as code",
          "call the intended command directly or validate the input against a fixed set of values"
      );
    }
  });
}

bool is_special_parameter(std::string_view name) noexcept {
  return name == "?" || name == "#" || name == "$" || name == "!" || name == "-";
}

auto unquoted_expansion(Expr const& expr) -> std::optional<std::string_view> {
  if (auto const* var = expr.getIf<Variable>(); var != nullptr && !var->quoted_ && !is_special_parameter(var->name_)) {
    return std::string_view{var->name_};
  }
  if (auto const* param = expr.getIf<ParamExpansion>(); param != nullptr && !param->quoted_) {
    return std::string_view{param->name_};
  }
  return std::nullopt;
}

void check_unquoted(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  auto report = [&](Expr const& expr, std::string_view name) {
    sink.report(
        expr.span_,
        Severity::Medium,
        fmt::format("${} is subject to word splitting and globbing", name),
        fmt::format("quote it: \"${}\"", name)
    );
  };
  each_command(script, [&](Stmt const&, Command const& cmd) {
    for (size_t i = 1; i < cmd.words_.size(); ++i) {
      auto const& word = cmd.words_[i];
      if (auto name = unquoted_expansion(word)) {
        report(word, *name);
      } else if (auto const* concat = word.getIf<Concat>(); concat != nullptr && !concat->quoted_) {
        for (auto const& part : concat->parts_) {
          if (auto part_name = unquoted_expansion(part)) {
            report(part, *part_name);
          }
        }
      }
    }
  });
}

void check_find_exec(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"find"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    auto const& words = cmd.words_;
    for (size_t i = 1; i + 3 < words.size(); ++i) {
      auto exec  = word_text(words[i]);
      auto shell = word_text(words[i + 1]);
      auto flag  = word_text(words[i + 2]);
      auto body  = word_text(words[i + 3]);
      if (!exec || !shell || !flag || !body) {
        continue;
      }
      bool is_exec  = *exec == "-exec" || *exec == "-execdir";
      bool is_shell = *shell == "sh" || *shell == "bash" || *shell == "/bin/sh" || *shell == "/bin/bash";
      if (is_exec && is_shell && *flag == "-c" && body->find("{}") != std::string_view::npos) {
        sink.report(
            stmt.span_,
            Severity::High,
            "file names are spliced into a shell script by find -exec",
            "pass the name as an argument: -exec sh -c '... \"$1\"' sh {} \\;"
        );
        return;
      }
    }
  });
}

bool world_writable(std::string_view mode) {
  if (!mode.empty() && std::all_of(mode.begin(), mode.end(), [](char c) { return c >= '0' && c <= '7'; })) {
    if (mode.size() < 3 || mode.size() > 4) {
      return false;
    }
    char other = mode.back();
    return other == '2' || other == '3' || other == '6' || other == '7';
  }
  size_t start = 0;
  while (start <= mode.size()) {
    auto end    = mode.find(',', start);
    auto clause = mode.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    auto op     = clause.find_first_of("+=");
    if (op != std::string_view::npos) {
      auto who   = clause.substr(0, op);
      auto perms = clause.substr(op + 1);
      bool other = who.find('o') != std::string_view::npos || who.find('a') != std::string_view::npos;
      if (other && perms.find('w') != std::string_view::npos) {
        return true;
      }
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return false;
}

void check_permissions(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"chmod"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    for (size_t i = 1; i < cmd.words_.size(); ++i) {
      auto mode = literal_value(cmd.words_[i]);
      if (mode && world_writable(*mode)) {
        sink.report(
            stmt.span_,
            Severity::High,
            fmt::format("chmod {} makes the file writable by every user", *mode),
            "grant write access to the owner or group only, e.g. chmod 755"
        );
        return;
      }
    }
  });
}

bool is_shell_name(std::string_view name) noexcept {
  return name == "sh" || name == "bash" || name == "zsh" || name == "dash" || name == "ksh" || name == "/bin/sh"
      || name == "/bin/bash";
}

bool runs_shell(Command const& cmd) {
  auto name = command_name(cmd);
  if (!name) {
    return false;
  }
  if (is_shell_name(*name)) {
    return true;
  }
  if (*name == "sudo" && cmd.words_.size() > 1) {
    auto next = literal_value(cmd.words_[1]);
    return next && is_shell_name(*next);
  }
  return false;
}

bool downloads(Command const& cmd) {
  auto name = command_name(cmd);
  return name && (*name == "curl" || *name == "wget");
}

void check_pipe_to_shell(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  auto report = [&](Span span) {
    sink.report(
        span,
        Severity::Critical,
        "downloaded content is executed by a shell without verification",
        "download to a file, verify its checksum, then run it"
    );
  };
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* pipe = stmt.getIf<Pipeline>()) {
      bool fetched = false;
      for (auto const& part : pipe->commands_) {
        auto const* cmd = part.getIf<Command>();
        if (cmd == nullptr) {
          continue;
        }
        if (fetched && runs_shell(*cmd)) {
          report(stmt.span_);
          return;
        }
        fetched = fetched || downloads(*cmd);
      }
    } else if (auto const* cmd = stmt.getIf<Command>(); cmd != nullptr && runs_shell(*cmd)) {
      for (size_t i = 1; i < cmd->words_.size(); ++i) {
        auto const& word = cmd->words_[i];
        if (auto const* subst = word.getIf<CommandSubst>();
            subst != nullptr && contains_command(subst->body_, {"curl", "wget"})) {
          report(stmt.span_);
          return;
        }
        if (auto const* glob = word.getIf<Glob>(); glob != nullptr && glob->pattern_.starts_with("<(")
                                                    && (core::util::contains_word(glob->pattern_, "curl")
                                                        || core::util::contains_word(glob->pattern_, "wget"))) {
          report(stmt.span_);
          return;
        }
      }
    }
  });
}

void check_path_traversal(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(
      script,
      {"rm", "cp", "mv", "cat", "chmod", "chown", "ln", "touch", "mkdir", "rmdir", "tar"},
      [&](Stmt const&, Command const& cmd, std::string_view name) {
        for (size_t i = 1; i < cmd.words_.size(); ++i) {
          auto const* concat = cmd.words_[i].getIf<Concat>();
          if (concat == nullptr) {
            continue;
          }
          bool expanded = false;
          bool parent   = false;
          for (auto const& part : concat->parts_) {
            if (auto lit = literal_value(part)) {
              parent = parent || lit->find("..") != std::string_view::npos;
            } else {
              expanded = expanded || has_expansion(part);
            }
          }
          if (expanded && parent) {
            sink.report(
                cmd.words_[i].span_,
                Severity::High,
                fmt::format("{} operates on an expanded path that climbs with '..'", name),
                "resolve the path with realpath and check that it stays below the intended directory"
            );
          }
        }
      }
  );
}

// ---------------------------------------------------------------------------
// Portability
// ---------------------------------------------------------------------------

void check_double_bracket(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* expr_stmt = stmt.getIf<ExprStmt>()) {
      if (auto const* test = expr_stmt->expr_.getIf<TestExpression>(); test != nullptr && test->extended_) {
        sink.report(stmt.span_, Severity::Low, "[[ ]] is not POSIX", "use [ ] with quoted operands");
      }
    }
  });
}

void check_combined_redirect(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_redirect(script, [&](Redirect const& redir) {
    if (redir.kind_ == RedirectKind::OutputAll) {
      sink.report(redir.span_, Severity::Low, "&> is not POSIX", "use > file 2>&1");
    } else if (redir.kind_ == RedirectKind::AppendAll) {
      sink.report(redir.span_, Severity::Low, "&>> is not POSIX", "use >> file 2>&1");
    }
  });
}

void check_source(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"source"}, [&](Stmt const& stmt, Command const&, std::string_view) {
    sink.report(stmt.span_, Severity::Low, "source is not POSIX", "use . instead");
  });
}

bool echo_with_options(Command const& cmd) {
  if (cmd.words_.size() < 2) {
    return false;
  }
  auto first = literal_value(cmd.words_[1]);
  return first && first->size() > 1 && first->front() == '-'
      && first->find_first_not_of("neE", 1) == std::string_view::npos;
}

void check_echo(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_named_command(script, {"echo"}, [&](Stmt const& stmt, Command const& cmd, std::string_view) {
    if (echo_with_options(cmd)) {
      sink.report(
          stmt.span_,
          Severity::Low,
          fmt::format("echo {} behaves differently between shells", *literal_value(cmd.words_[1])),
          "use printf"
      );
    }
  });
}

constexpr std::array BASH_BUILTINS{
    std::string_view{"declare"},
    std::string_view{"typeset"},
    std::string_view{"shopt"},
    std::string_view{"mapfile"},
    std::string_view{"readarray"},
    std::string_view{"pushd"},
    std::string_view{"popd"},
    std::string_view{"let"},
};

// Calls fn(span, description) for every construct that needs bash
template<typename F>
void each_bash_construct(Script const& script, F const& fn) {
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* assign = stmt.getIf<Assignment>()) {
      if (assign->index_ || assign->value_.is<Array>()) {
        fn(stmt.span_, "array");
      }
    } else if (stmt.is<Coproc>()) {
      fn(stmt.span_, "coproc");
    } else if (stmt.is<ForArith>()) {
      fn(stmt.span_, "C-style for loop");
    } else if (auto const* case_stmt = stmt.getIf<Case>()) {
      for (auto const& arm : case_stmt->arms_) {
        if (arm.terminator_ != CaseTerminator::Break) {
          fn(arm.span_, "case fall-through");
        }
      }
    } else if (auto const* expr_stmt = stmt.getIf<ExprStmt>()) {
      if (expr_stmt->expr_.is<Arithmetic>()) {
        fn(stmt.span_, "(( )) command");
      }
    } else if (auto const* cmd = stmt.getIf<Command>()) {
      for (auto const& env : cmd->prefix_) {
        if (env.index_ || env.value_.is<Array>()) {
          fn(stmt.span_, "array");
        }
      }
      if (auto name = command_name(*cmd);
          name && std::find(BASH_BUILTINS.begin(), BASH_BUILTINS.end(), *name) != BASH_BUILTINS.end()) {
        fn(stmt.span_, fmt::format("{} builtin", *name));
      }
    }
  });

  each_redirect(script, [&](Redirect const& redir) {
    if (redir.kind_ == RedirectKind::HereString) {
      fn(redir.span_, "here-string");
    }
  });

  each_expr(script, [&](Stmt const&, Expr const& expr) {
    if (auto const* param = expr.getIf<ParamExpansion>()) {
      if (param->op_ == ParamOp::Other || param->name_.find('[') != std::string::npos) {
        fn(expr.span_, "bash parameter expansion");
      }
    } else if (auto const* glob = expr.getIf<Glob>()) {
      auto const& text = glob->pattern_;
      if (text.starts_with("<(") || text.starts_with(">(")) {
        fn(expr.span_, "process substitution");
      } else if (text.find("$'") != std::string::npos || text.find("$\"") != std::string::npos) {
        fn(expr.span_, "ANSI-C quoting");
      }
    }
  });
}

void check_bashisms(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_bash_construct(script, [&](Span span, std::string const& what) {
    sink.report(span, Severity::Low, fmt::format("{} is bash-only", what), "rewrite it with POSIX constructs");
  });
}

void check_shebang(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  auto interpreter = shebang(script);
  if (!interpreter || *interpreter != "bash") {
    return;
  }
  sink.report(
      script.statements_.front().span_,
      Severity::Low,
      "script requires bash",
      "use #!/bin/sh once no bash-only construct remains"
  );
}

// ---------------------------------------------------------------------------
// Side effects
// ---------------------------------------------------------------------------

constexpr std::array SIDE_EFFECT_COMMANDS{
    std::string_view{"apt"},      std::string_view{"apt-get"},  std::string_view{"yum"},
    std::string_view{"dnf"},      std::string_view{"apk"},      std::string_view{"pacman"},
    std::string_view{"zypper"},   std::string_view{"brew"},     std::string_view{"pip"},
    std::string_view{"pip3"},     std::string_view{"npm"},      std::string_view{"gem"},
    std::string_view{"systemctl"}, std::string_view{"service"}, std::string_view{"useradd"},
    std::string_view{"userdel"},  std::string_view{"usermod"},  std::string_view{"groupadd"},
    std::string_view{"passwd"},   std::string_view{"crontab"},  std::string_view{"iptables"},
    std::string_view{"mount"},    std::string_view{"umount"},   std::string_view{"reboot"},
    std::string_view{"shutdown"}, std::string_view{"scp"},      std::string_view{"rsync"},
};

bool uploads(Command const& cmd) {
  auto name = command_name(cmd);
  if (!name || (*name != "curl" && *name != "wget")) {
    return false;
  }
  return std::any_of(cmd.words_.begin() + 1, cmd.words_.end(), [](Expr const& word) {
    auto text = literal_value(word);
    return text
        && (*text == "-d" || *text == "-T" || *text == "-F" || text->starts_with("--data") || *text == "--upload-file"
            || text->starts_with("--post") || *text == "-XPOST" || *text == "-XPUT");
  });
}

void check_side_effects(Script const& script, AnalyzerConfig const&, IssueSink& sink) {
  each_command(script, [&](Stmt const& stmt, Command const& cmd) {
    auto name = command_name(cmd);
    if (!name) {
      return;
    }
    if (std::find(SIDE_EFFECT_COMMANDS.begin(), SIDE_EFFECT_COMMANDS.end(), *name) != SIDE_EFFECT_COMMANDS.end()) {
      sink.report(
          stmt.span_, Severity::Info, fmt::format("{} changes state outside the script", *name), std::nullopt
      );
    } else if (uploads(cmd)) {
      sink.report(stmt.span_, Severity::Info, fmt::format("{} sends data to a remote host", *name), std::nullopt);
    }
  });
}

} // namespace

bool has_flag(Command const& cmd, char flag, std::string_view long_name) {
  for (size_t i = 1; i < cmd.words_.size(); ++i) {
    auto word = literal_value(cmd.words_[i]);
    if (!word) {
      continue;
    }
    if (*word == "--") {
      break;
    }
    if (word->starts_with("--")) {
      if (!long_name.empty() && (*word == long_name || word->starts_with(std::string{long_name} + "="))) {
        return true;
      }
      continue;
    }
    if (is_short_cluster(*word) && word->find(flag, 1) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

auto shebang(Script const& script) -> std::optional<std::string> {
  if (script.statements_.empty()) {
    return std::nullopt;
  }
  auto const& first   = script.statements_.front();
  auto const* comment = first.getIf<Comment>();
  if (comment == nullptr || !comment->text_.starts_with("!") || first.span_.start_line_ > 1) {
    return std::nullopt;
  }
  auto words = core::util::split_whitespace(std::string_view{comment->text_}.substr(1));
  if (words.empty()) {
    return std::nullopt;
  }
  auto basename = [](std::string const& path) { return path.substr(path.find_last_of('/') + 1); };
  auto program  = basename(words.front());
  if (program == "env") {
    for (size_t i = 1; i < words.size(); ++i) {
      if (!words[i].starts_with("-")) {
        return basename(words[i]);
      }
    }
    return std::nullopt;
  }
  return program;
}

auto bash_only_constructs(Script const& script) -> std::vector<std::string> {
  std::vector<std::string> found;
  auto                     add = [&found](std::string what) {
    if (std::find(found.begin(), found.end(), what) == found.end()) {
      found.push_back(std::move(what));
    }
  };
  each_bash_construct(script, [&](Span, std::string const& what) { add(what); });
  walk(script.statements_, [&](Stmt const& stmt) {
    if (auto const* expr_stmt = stmt.getIf<ExprStmt>()) {
      if (auto const* test = expr_stmt->expr_.getIf<TestExpression>(); test != nullptr && test->extended_) {
        add("[[ ]]");
      }
    } else if (auto const* cmd = stmt.getIf<Command>(); cmd != nullptr && command_name(*cmd) == "echo") {
      if (echo_with_options(*cmd) && literal_value(cmd->words_[1])->find('e') != std::string_view::npos) {
        add("echo -e");
      }
    }
  });
  return found;
}

void check_type_mismatch(Script const& script, AnalyzerConfig const& config, IssueSink& sink);
void check_string_arithmetic(Script const& script, AnalyzerConfig const& config, IssueSink& sink);
void check_missing_guard(Script const& script, AnalyzerConfig const& config, IssueSink& sink);

auto shell_rules() noexcept -> std::vector<Rule<Script>> const& {
  static std::vector<Rule<Script>> const rules{
      {"DET001", Category::Determinism, check_random},
      {"DET002", Category::Determinism, check_process_id},
      {"DET003", Category::Determinism, check_wall_clock},
      {"DET004", Category::Determinism, check_hostname},
      {"DET005", Category::Determinism, check_temp_files},
      {"DET006", Category::Determinism, check_tainted_uses},
      {"IDEM001", Category::Idempotency, check_mkdir},
      {"IDEM002", Category::Idempotency, check_rm},
      {"IDEM003", Category::Idempotency, check_ln},
      {"IDEM004", Category::Idempotency, check_append},
      {"IDEM005", Category::Idempotency, check_copy_move},
      {"SEC001", Category::Security, check_eval},
      {"SEC002", Category::Security, check_unquoted},
      {"SEC003", Category::Security, check_find_exec},
      {"SEC004", Category::Security, check_permissions},
      {"SEC005", Category::Security, check_pipe_to_shell},
      {"SEC006", Category::Security, check_path_traversal},
      {"PORT001", Category::Portability, check_double_bracket},
      {"PORT002", Category::Portability, check_combined_redirect},
      {"PORT003", Category::Portability, check_source},
      {"PORT004", Category::Portability, check_echo},
      {"PORT005", Category::Portability, check_bashisms},
      {"PORT006", Category::Portability, check_shebang},
      {"SIDE001", Category::SideEffect, check_side_effects},
      {"TYPE001", Category::TypeSafety, check_type_mismatch},
      {"TYPE002", Category::TypeSafety, check_string_arithmetic},
      {"TYPE003", Category::TypeSafety, check_missing_guard},
  };
  return rules;
}

} // namespace shpure::analysis
