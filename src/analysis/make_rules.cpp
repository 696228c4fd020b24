#include "shpure/Analyzer.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace shpure::analysis {

namespace {

using namespace shpure::make;
using core::Category;
using core::Severity;
using core::Span;
using core::util::contains;
using core::util::contains_word;

struct RuleView {
  std::string_view                name_;
  std::vector<std::string> const* prerequisites_;
  std::vector<RecipeLine> const*  recipe_;
  Span                            span_;
};

auto collect_rules(Makefile const& makefile, bool with_patterns) -> std::vector<RuleView> {
  std::vector<RuleView> rules;
  walk(makefile.items_, [&](Item const& item) {
    if (auto const* target = item.getIf<Target>()) {
      rules.push_back(RuleView{target->name_, &target->prerequisites_, &target->recipe_, item.span_});
    } else if (auto const* pattern = item.getIf<PatternRule>(); pattern != nullptr && with_patterns) {
      rules.push_back(RuleView{pattern->target_pattern_, &pattern->prereq_patterns_, &pattern->recipe_, item.span_});
    }
  });
  return rules;
}

bool has_special_target(Makefile const& makefile, std::string_view name) {
  bool found = false;
  walk(makefile.items_, [&](Item const& item) {
    if (auto const* target = item.getIf<Target>()) {
      auto names = target_names(*target);
      found      = found || std::find(names.begin(), names.end(), name) != names.end();
    }
  });
  return found;
}

// Span of the first rule, used for file-level recommendations
auto first_rule_span(Makefile const& makefile) -> std::optional<Span> {
  std::optional<Span> span;
  walk(makefile.items_, [&](Item const& item) {
    if (!span && (item.is<Target>() || item.is<PatternRule>())) {
      span = item.span_;
    }
  });
  return span;
}

// Recipe text without the `@`, `-` and `+` prefixes
auto command_text(std::string_view line) -> std::string_view {
  auto text = core::util::trim(line);
  while (!text.empty() && (text.front() == '@' || text.front() == '-' || text.front() == '+')) {
    text.remove_prefix(1);
    text = core::util::trim_left(text);
  }
  return text;
}

// First whitespace separated word after `marker`
auto word_after(std::string_view text, std::string_view marker) -> std::optional<std::string> {
  auto pos = text.find(marker);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  auto words = core::util::split_whitespace(text.substr(pos + marker.size()));
  if (words.empty()) {
    return std::nullopt;
  }
  return words.front();
}

bool is_automatic_variable(std::string_view word) noexcept {
  return word == "$@" || word == "$<" || word == "$^" || word == "$?" || word == "$*" || word == "$+";
}

bool calls_shell(std::string_view value) {
  return contains(value, "$(shell") || contains(value, "${shell");
}

// ---------------------------------------------------------------------------
// Determinism of variable values
// ---------------------------------------------------------------------------

template<typename F>
void each_variable(Makefile const& makefile, F const& fn) {
  walk(makefile.items_, [&](Item const& item) {
    if (auto const* var = item.getIf<Variable>()) {
      fn(item, *var);
    }
  });
}

void check_timestamps(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  each_variable(makefile, [&](Item const& item, Variable const& var) {
    if (calls_shell(var.value_) && contains_word(var.value_, "date")) {
      sink.report(
          item.span_,
          Severity::Critical,
          fmt::format("{} embeds the build time through $(shell date)", var.name_),
          "derive the value from SOURCE_DATE_EPOCH, e.g. $(shell date -u -d @$(SOURCE_DATE_EPOCH) +%Y%m%d)"
      );
    }
  });
}

void check_wildcard(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  each_variable(makefile, [&](Item const& item, Variable const& var) {
    if (unsorted_calls(var.value_, "$(wildcard") > 0) {
      sink.report(
          item.span_,
          Severity::Medium,
          fmt::format("{} depends on the directory order returned by $(wildcard)", var.name_),
          "wrap the call in $(sort ...)"
      );
    }
  });
}

void check_unordered_find(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  each_variable(makefile, [&](Item const& item, Variable const& var) {
    if (unsorted_calls(var.value_, "$(shell find") > 0) {
      sink.report(
          item.span_,
          Severity::High,
          fmt::format("{} depends on the unspecified output order of find", var.name_),
          "wrap the call in $(sort ...)"
      );
    }
  });
}

void check_random(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  each_variable(makefile, [&](Item const& item, Variable const& var) {
    if (contains(var.value_, "$RANDOM") || contains(var.value_, "$$RANDOM")) {
      sink.report(
          item.span_,
          Severity::High,
          fmt::format("{} uses $RANDOM", var.name_),
          "use a fixed value or one derived from the version"
      );
    }
  });
}

// ---------------------------------------------------------------------------
// Idempotency
// ---------------------------------------------------------------------------

constexpr std::array CONVENTIONAL_TARGETS{
    std::string_view{"all"},
    std::string_view{"build"},
    std::string_view{"check"},
    std::string_view{"clean"},
    std::string_view{"deploy"},
    std::string_view{"distclean"},
    std::string_view{"docs"},
    std::string_view{"format"},
    std::string_view{"help"},
    std::string_view{"install"},
    std::string_view{"lint"},
    std::string_view{"run"},
    std::string_view{"test"},
};

void check_phony(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  auto declared = phony_targets(makefile);
  walk(makefile.items_, [&](Item const& item) {
    auto const* target = item.getIf<Target>();
    if (target == nullptr || target->phony_) {
      return;
    }
    for (auto const& name : target_names(*target)) {
      bool conventional =
          std::find(CONVENTIONAL_TARGETS.begin(), CONVENTIONAL_TARGETS.end(), name) != CONVENTIONAL_TARGETS.end();
      if (conventional && std::find(declared.begin(), declared.end(), name) == declared.end()) {
        sink.report(
            item.span_,
            Severity::Medium,
            fmt::format("target '{}' does not produce a file of that name but is not .PHONY", name),
            fmt::format("add '{}' to .PHONY", name)
        );
      }
    }
  });
}

// ---------------------------------------------------------------------------
// Parallel safety
// ---------------------------------------------------------------------------

struct FileUse {
  std::string_view target_;
  Span             span_;
};

void check_parallel_safety(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  auto rules = collect_rules(makefile, false);
  bool fired = false;

  // MAKE_PAR001: the same file is written by several targets
  std::map<std::string, std::vector<FileUse>> writers;
  for (auto const& rule : rules) {
    for (auto const& line : *rule.recipe_) {
      for (auto marker : {std::string_view{" > "}, std::string_view{" -o "}}) {
        auto file = word_after(line.text_, marker);
        if (file && !is_automatic_variable(*file)) {
          auto& uses = writers[*file];
          if (std::none_of(uses.begin(), uses.end(), [&](FileUse const& u) { return u.target_ == rule.name_; })) {
            uses.push_back(FileUse{rule.name_, line.span_});
          }
        }
      }
    }
  }
  for (auto const& [file, uses] : writers) {
    if (uses.size() < 2) {
      continue;
    }
    fired = true;
    sink.reportAs(
        "MAKE_PAR001",
        uses[1].span_,
        Severity::High,
        fmt::format("'{}' is written by {} targets and may be corrupted by a parallel build", file, uses.size()),
        "let a single target produce the file and depend on it"
    );
  }

  // MAKE_PAR002: a file is read from a target that does not depend on its producer
  std::map<std::string, std::string_view> producers;
  for (auto const& rule : rules) {
    for (auto const& line : *rule.recipe_) {
      if (auto file = word_after(line.text_, " > "); file && !is_automatic_variable(*file)) {
        producers.emplace(*file, rule.name_);
      }
    }
  }
  for (auto const& rule : rules) {
    for (auto const& line : *rule.recipe_) {
      auto file = word_after(line.text_, "cat ");
      if (!file || is_automatic_variable(*file)) {
        continue;
      }
      auto producer = producers.find(*file);
      if (producer == producers.end() || producer->second == rule.name_) {
        continue;
      }
      auto const& prereqs = *rule.prerequisites_;
      bool linked         = std::any_of(prereqs.begin(), prereqs.end(), [&](std::string const& p) {
        return p == producer->second || p == *file;
      });
      if (!linked) {
        fired = true;
        sink.reportAs(
            "MAKE_PAR002",
            line.span_,
            Severity::High,
            fmt::format("{} reads '{}' produced by {} without depending on it", rule.name_, *file, producer->second),
            fmt::format("add {} as a prerequisite of {}", producer->second, rule.name_)
        );
      }
    }
  }

  // MAKE_PAR003: recursive make into subdirectories
  for (auto const& rule : rules) {
    for (auto const& line : *rule.recipe_) {
      bool recursive = contains(line.text_, "$(MAKE)") || contains(line.text_, "${MAKE}");
      if (recursive && word_after(line.text_, "-C ")) {
        fired = true;
        sink.reportAs(
            "MAKE_PAR003",
            line.span_,
            Severity::Medium,
            fmt::format("{} runs make recursively, hiding dependencies from the parallel scheduler", rule.name_),
            "declare the subdirectory builds as separate targets with explicit order"
        );
        break;
      }
    }
  }

  // MAKE_PAR004: several targets create the same directory
  std::map<std::string, std::vector<FileUse>> directories;
  for (auto const& rule : rules) {
    for (auto const& line : *rule.recipe_) {
      auto pos = line.text_.find("mkdir");
      if (pos == std::string::npos) {
        continue;
      }
      for (auto const& word : core::util::split_whitespace(std::string_view{line.text_}.substr(pos + 5))) {
        if (word == "&&" || word == "||" || word == ";") {
          break;
        }
        if (word.starts_with("-")) {
          continue;
        }
        auto& uses = directories[word];
        if (std::none_of(uses.begin(), uses.end(), [&](FileUse const& u) { return u.target_ == rule.name_; })) {
          uses.push_back(FileUse{rule.name_, line.span_});
        }
      }
    }
  }
  for (auto const& [directory, uses] : directories) {
    if (uses.size() < 2) {
      continue;
    }
    fired = true;
    sink.reportAs(
        "MAKE_PAR004",
        uses[1].span_,
        Severity::Medium,
        fmt::format("directory '{}' is created by {} targets", directory, uses.size()),
        fmt::format("create {} in one target and use it as an order-only prerequisite (| {})", directory, directory)
    );
  }

  auto span = first_rule_span(makefile);
  if (fired && span && !has_special_target(makefile, ".NOTPARALLEL")) {
    sink.reportAs(
        "MAKE_PAR005",
        *span,
        Severity::Low,
        "parallel safety issues found and no .NOTPARALLEL declared",
        "fix the dependencies above or add .NOTPARALLEL:"
    );
  }
}

// ---------------------------------------------------------------------------
// Reproducibility
// ---------------------------------------------------------------------------

bool git_timestamp(std::string_view text) {
  return contains_word(text, "git") && contains_word(text, "log")
      && (contains(text, "%cd") || contains(text, "%ci") || contains(text, "%ct") || contains(text, "--date"));
}

auto unpinned_install(std::string_view text) -> std::optional<std::string> {
  auto words = core::util::split_whitespace(text);
  for (size_t i = 0; i + 1 < words.size(); ++i) {
    auto const& tool = words[i];
    if ((tool == "pip" || tool == "pip3" || tool == "npm") && words[i + 1] == "install") {
      for (size_t j = i + 2; j < words.size() && words[j] != "&&" && words[j] != ";"; ++j) {
        auto const& pkg = words[j];
        if (pkg.starts_with("-") || pkg.starts_with("$")) {
          continue;
        }
        bool pinned = tool == "npm" ? pkg.find('@', 1) != std::string::npos
                                    : pkg.find("==") != std::string::npos || pkg.find(".txt") != std::string::npos;
        if (!pinned) {
          return fmt::format("{} install {}", tool, pkg);
        }
      }
    }
    if (tool == "go" && (words[i + 1] == "get" || words[i + 1] == "install")) {
      for (size_t j = i + 2; j < words.size(); ++j) {
        if (words[j].ends_with("@latest")) {
          return fmt::format("go {} {}", words[i + 1], words[j]);
        }
      }
    }
  }
  if ((contains_word(text, "curl") || contains_word(text, "wget")) && contains(text, "/latest/")) {
    return std::string{"download of a 'latest' URL"};
  }
  return std::nullopt;
}

void check_reproducibility(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  for (auto const& ref : recipe_lines(makefile)) {
    auto const& line = *ref.line_;
    auto        text = command_text(line.text_);
    if (contains_word(text, "date") && !contains(text, "SOURCE_DATE_EPOCH")) {
      sink.reportAs(
          "MAKE_REPRO001",
          line.span_,
          Severity::Medium,
          "recipe records the current date",
          "use SOURCE_DATE_EPOCH for timestamps"
      );
    }
    if (contains(text, "$$RANDOM")) {
      sink.reportAs(
          "MAKE_REPRO002", line.span_, Severity::Medium, "recipe uses $RANDOM", "use a fixed or derived value"
      );
    }
    if (contains(text, "$$$$")) {
      sink.reportAs(
          "MAKE_REPRO003",
          line.span_,
          Severity::Medium,
          "recipe uses the process id ($$$$)",
          "use a fixed file name below the build directory"
      );
    }
    if (contains_word(text, "hostname")) {
      sink.reportAs(
          "MAKE_REPRO004",
          line.span_,
          Severity::Medium,
          "recipe depends on the build host name",
          "pass the value in as a make variable"
      );
    }
    if (git_timestamp(text)) {
      sink.reportAs(
          "MAKE_REPRO005",
          line.span_,
          Severity::Low,
          "recipe embeds git commit dates",
          "set SOURCE_DATE_EPOCH from the commit once and reuse it"
      );
    }
    if (contains_word(text, "mktemp")) {
      sink.reportAs(
          "MAKE_REPRO006",
          line.span_,
          Severity::Medium,
          "mktemp creates randomly named files",
          "use a fixed path below the build directory"
      );
    }
    if (auto install = unpinned_install(text)) {
      sink.reportAs(
          "MAKE_REPRO007",
          line.span_,
          Severity::Medium,
          fmt::format("unpinned dependency: {}", *install),
          "pin an exact version"
      );
    }
  }

  each_variable(makefile, [&](Item const& item, Variable const& var) {
    if (contains(var.value_, "$$$$")) {
      sink.reportAs(
          "MAKE_REPRO003",
          item.span_,
          Severity::Medium,
          fmt::format("{} uses the process id", var.name_),
          "use a fixed value"
      );
    }
    if (calls_shell(var.value_) && contains_word(var.value_, "hostname")) {
      sink.reportAs(
          "MAKE_REPRO004",
          item.span_,
          Severity::Medium,
          fmt::format("{} depends on the build host name", var.name_),
          "pass the value in as a make variable"
      );
    }
    if (git_timestamp(var.value_)) {
      sink.reportAs(
          "MAKE_REPRO005",
          item.span_,
          Severity::Low,
          fmt::format("{} embeds git commit dates", var.name_),
          "set SOURCE_DATE_EPOCH from the commit once and reuse it"
      );
    }
  });
}

// ---------------------------------------------------------------------------
// Performance
// ---------------------------------------------------------------------------

void check_performance(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  bool fired = false;

  each_variable(makefile, [&](Item const& item, Variable const& var) {
    if (var.flavor_ != Flavor::Recursive) {
      return;
    }
    if (calls_shell(var.value_)) {
      fired = true;
      sink.reportAs(
          "MAKE_PERF001",
          item.span_,
          Severity::Medium,
          fmt::format("{} re-runs $(shell ...) on every expansion", var.name_),
          fmt::format("use {} := ...", var.name_)
      );
    } else if (!contains(var.value_, "$(") && !contains(var.value_, "${")) {
      fired = true;
      sink.reportAs(
          "MAKE_PERF002",
          item.span_,
          Severity::Info,
          fmt::format("{} has no references but is recursively expanded", var.name_),
          fmt::format("use {} := ...", var.name_)
      );
    }
  });

  auto rules = collect_rules(makefile, false);
  for (auto const& rule : rules) {
    auto const& recipe = *rule.recipe_;
    if (recipe.size() >= 3) {
      bool chained = std::any_of(recipe.begin(), recipe.end(), [](RecipeLine const& line) {
        return contains(line.text_, "&&") || contains(line.text_, ";");
      });
      if (!chained) {
        fired = true;
        sink.reportAs(
            "MAKE_PERF003",
            rule.span_,
            Severity::Low,
            fmt::format("{} starts a shell for each of its {} recipe lines", rule.name_, recipe.size()),
            "combine the commands with && or use .ONESHELL"
        );
      }
    }
    auto removals = std::count_if(recipe.begin(), recipe.end(), [](RecipeLine const& line) {
      return command_text(line.text_).starts_with("rm ");
    });
    if (removals >= 2) {
      fired = true;
      sink.reportAs(
          "MAKE_PERF004",
          rule.span_,
          Severity::Low,
          fmt::format("{} runs rm {} times", rule.name_, removals),
          "remove all files with a single rm"
      );
    }
  }

  std::vector<RuleView const*> objects;
  for (auto const& rule : rules) {
    bool compiles = std::any_of(rule.recipe_->begin(), rule.recipe_->end(), [](RecipeLine const& line) {
      return contains(line.text_, "-c");
    });
    if (rule.name_.ends_with(".o") && compiles) {
      objects.push_back(&rule);
    }
  }
  if (objects.size() >= 3) {
    fired = true;
    sink.reportAs(
        "MAKE_PERF005",
        objects[2]->span_,
        Severity::Low,
        fmt::format("{} explicit object rules share the same recipe", objects.size()),
        "replace them with a pattern rule %.o: %.c"
    );
  }

  auto span = first_rule_span(makefile);
  if (fired && span && !has_special_target(makefile, ".SUFFIXES")) {
    sink.reportAs(
        "MAKE_PERF006",
        *span,
        Severity::Info,
        "built-in suffix rules are active",
        "add an empty .SUFFIXES: rule to disable them"
    );
  }
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

void check_error_handling(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  constexpr std::array CRITICAL_COMMANDS{
      std::string_view{"mkdir"},
      std::string_view{"gcc"},
      std::string_view{"cp"},
      std::string_view{"mv"},
  };

  bool fired = false;
  auto rules = collect_rules(makefile, true);
  for (auto const& rule : rules) {
    auto const& recipe = *rule.recipe_;
    for (auto const& line : recipe) {
      auto raw  = core::util::trim(line.text_);
      auto text = command_text(raw);
      auto args = core::util::split_whitespace(text);

      bool ignored = raw.starts_with("-") || raw.starts_with("@-");
      if (!args.empty() && ignored
          && std::find(CRITICAL_COMMANDS.begin(), CRITICAL_COMMANDS.end(), args.front()) != CRITICAL_COMMANDS.end()
          && !contains(text, "||") && !contains(text, "&&")) {
        fired = true;
        sink.reportAs(
            "MAKE_ERR001",
            line.span_,
            Severity::Medium,
            fmt::format("failure of '{}' is ignored", text),
            "drop the '-' prefix or handle the failure explicitly"
        );
      }

      if (raw.starts_with("@") && !args.empty() && args.front() != "echo" && args.front() != "printf") {
        fired = true;
        sink.reportAs(
            "MAKE_ERR002",
            line.span_,
            Severity::Low,
            fmt::format("'{}' runs silently", text),
            "drop the '@' so failing commands are visible"
        );
      }

      if (contains(text, "bash -c") && !contains(text, "set -e")) {
        fired = true;
        sink.reportAs(
            "MAKE_ERR004",
            line.span_,
            Severity::Medium,
            "bash -c script continues after a failing command",
            "start the script with set -e"
        );
      }

      if (contains_word(text, "for") && contains_word(text, "do") && !contains(text, "|| exit")
          && !contains(text, "|| return")) {
        fired = true;
        sink.reportAs(
            "MAKE_ERR005",
            line.span_,
            Severity::Medium,
            "loop ignores failures of its body",
            "append || exit 1 to the loop body commands"
        );
      }
    }

    if (recipe.size() >= 2) {
      bool changes_dir = std::any_of(recipe.begin(), recipe.end(), [](RecipeLine const& line) {
        return command_text(line.text_).starts_with("cd ");
      });
      bool chained = std::any_of(recipe.begin(), recipe.end(), [](RecipeLine const& line) {
        return contains(line.text_, "&&") || contains(line.text_, ";");
      });
      if (changes_dir && !chained) {
        fired = true;
        sink.reportAs(
            "MAKE_ERR003",
            rule.span_,
            Severity::High,
            fmt::format("{} changes directory in a recipe line of its own; the next line runs elsewhere", rule.name_),
            "join the commands with && or use .ONESHELL"
        );
      }
    }
  }

  auto span = first_rule_span(makefile);
  if (fired && span && !has_special_target(makefile, ".DELETE_ON_ERROR")) {
    sink.reportAs(
        "MAKE_ERR006",
        *span,
        Severity::Low,
        "partially written targets survive failed recipes",
        "add .DELETE_ON_ERROR:"
    );
  }
}

// ---------------------------------------------------------------------------
// Portability
// ---------------------------------------------------------------------------

void check_portability(Makefile const& makefile, AnalyzerConfig const&, IssueSink& sink) {
  for (auto const& ref : recipe_lines(makefile)) {
    auto const& line = *ref.line_;
    auto        text = command_text(line.text_);
    auto        port = [&](char const* id, std::string message, char const* fix) {
      sink.reportAs(id, line.span_, Severity::Low, std::move(message), std::string{fix});
    };

    if (contains(text, "[[")) {
      port("MAKE_PORT001", "[[ is not available in /bin/sh", "use [ ]");
    }
    if (contains(text, "$((")) {
      port("MAKE_PORT001", "$(( )) arithmetic is not portable to every make shell", "use expr");
    }
    for (auto command : {"uname", "ifconfig"}) {
      if (contains_word(text, command)) {
        port("MAKE_PORT002", fmt::format("{} is platform specific", command), "detect the platform in a configure step");
      }
    }
    if (contains(text, "/proc/")) {
      port("MAKE_PORT002", "/proc is Linux specific", "detect the platform in a configure step");
    }
    if (contains(text, "source ")) {
      port("MAKE_PORT003", "source is not POSIX", "use . instead");
    }
    if (contains_word(text, "declare")) {
      port("MAKE_PORT003", "declare is bash specific", "use a plain assignment");
    }
    for (auto flag : {"--preserve", "--color"}) {
      if (contains(text, flag)) {
        port("MAKE_PORT004", fmt::format("{} is a GNU extension", flag), "use the POSIX option");
      }
    }
    for (auto echo : {"echo -e", "echo -n"}) {
      if (contains(text, echo)) {
        port("MAKE_PORT005", fmt::format("{} behaves differently between shells", echo), "use printf");
      }
    }
    if (contains(text, "sed -i")) {
      port("MAKE_PORT006", "sed -i is not portable", "write to a temporary file and move it into place");
    }
  }
}

} // namespace

auto unsorted_calls(std::string_view value, std::string_view call, std::string_view preceding) -> std::size_t {
  std::string context{preceding};
  context.append(value);

  std::size_t count = 0;
  for (auto pos = value.find(call); pos != std::string_view::npos; pos = value.find(call, pos + call.size())) {
    if (!make::inside_sort(context, preceding.size() + pos)) {
      ++count;
    }
  }
  return count;
}

auto make_rules() noexcept -> std::vector<Rule<Makefile>> const& {
  static std::vector<Rule<Makefile>> const rules{
      {"NO_TIMESTAMPS", Category::Determinism, check_timestamps},
      {"NO_WILDCARD", Category::Determinism, check_wildcard},
      {"NO_UNORDERED_FIND", Category::Determinism, check_unordered_find},
      {"NO_RANDOM", Category::Determinism, check_random},
      {"AUTO_PHONY", Category::Idempotency, check_phony},
      {"MAKE_PAR", Category::ParallelSafety, check_parallel_safety},
      {"MAKE_REPRO", Category::Reproducibility, check_reproducibility},
      {"MAKE_PERF", Category::Performance, check_performance},
      {"MAKE_ERR", Category::ErrorHandling, check_error_handling},
      {"MAKE_PORT", Category::Portability, check_portability},
  };
  return rules;
}

} // namespace shpure::analysis
