#include "shpure/Transform.hpp"

#include "shpure/Analyzer.hpp"
#include "shpure/Log.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shpure::transform {

namespace {

using namespace shpure::make;
using core::Span;

bool lists_name(Target const& target, std::string_view name) {
  auto names = target_names(target);
  return std::find(names.begin(), names.end(), name) != names.end();
}

Target* find_phony_rule(std::vector<Item>& items) {
  Target* found = nullptr;
  walk(items, [&](Item& item) {
    if (auto* target = item.getIf<Target>(); found == nullptr && target != nullptr && target->name_ == ".PHONY") {
      found = target;
    }
  });
  return found;
}

// Inserts `.PHONY: name` right before the rule that defines `name`
bool insert_phony_rule(std::vector<Item>& items, std::string const& name) {
  for (size_t i = 0; i < items.size(); ++i) {
    auto* target = items[i].getIf<Target>();
    if (target != nullptr && target->name_ != ".PHONY" && lists_name(*target, name)) {
      Item phony{Target{".PHONY", {name}}, items[i].span_, items[i].blank_before_};
      items[i].blank_before_ = 0;
      items.insert(items.begin() + static_cast<std::ptrdiff_t>(i), std::move(phony));
      return true;
    }
    if (auto* cond = items[i].getIf<Conditional>()) {
      if (insert_phony_rule(cond->then_, name) || (cond->else_ && insert_phony_rule(*cond->else_, name))) {
        return true;
      }
    }
  }
  return false;
}

void refresh_phony_flags(Makefile& makefile) {
  auto                               phony = phony_targets(makefile);
  std::set<std::string, std::less<>> declared(phony.begin(), phony.end());
  walk(makefile.items_, [&declared](Item& item) {
    if (auto* target = item.getIf<Target>()) {
      auto names     = target_names(*target);
      target->phony_ = !names.empty() && std::all_of(names.begin(), names.end(), [&](auto const& n) {
        return declared.contains(n);
      });
    }
  });
}

class MakeRewriter {
  Makefile& makefile_;
  Span      span_;

public:
  MakeRewriter(Makefile& makefile, Span span) noexcept
      : makefile_(makefile), span_(span) {}

  bool operator()(WrapWithSort const& fix) {
    Variable* var = nullptr;
    walk(makefile_.items_, [&](Item& item) {
      if (auto* candidate = item.getIf<Variable>();
          var == nullptr && candidate != nullptr && item.span_ == span_ && candidate->name_ == fix.variable_) {
        var = candidate;
      }
    });
    if (var == nullptr) {
      return false;
    }
    auto wrapped = wrap_with_sort(var->value_, fix.pattern_);
    if (wrapped == var->value_) {
      return false;
    }
    var->value_ = std::move(wrapped);

    std::string preceding;
    for (auto& segment : var->segments_) {
      auto original = segment;
      segment       = wrap_with_sort(original, fix.pattern_, preceding);
      preceding += original;
    }
    // a call split across continuation lines cannot be wrapped line by line
    std::string wrapped_before;
    bool        leftover = false;
    for (auto const& segment : var->segments_) {
      leftover = leftover || analysis::unsorted_calls(segment, fix.pattern_, wrapped_before) > 0;
      wrapped_before += segment;
    }
    if (leftover) {
      var->segments_.clear();
    }
    return true;
  }

  bool operator()(AddPhony const& fix) {
    bool exists = false;
    walk(makefile_.items_, [&](Item const& item) {
      auto const* target = item.getIf<Target>();
      exists = exists || (target != nullptr && target->name_ != ".PHONY" && lists_name(*target, fix.target_));
    });
    if (!exists) {
      return false;
    }

    if (auto* phony = find_phony_rule(makefile_.items_)) {
      auto& prereqs = phony->prerequisites_;
      if (std::find(prereqs.begin(), prereqs.end(), fix.target_) == prereqs.end()) {
        prereqs.push_back(fix.target_);
        if (!phony->segments_.empty()) {
          phony->segments_.back() += " " + fix.target_;
        }
      }
    } else if (!insert_phony_rule(makefile_.items_, fix.target_)) {
      return false;
    }
    refresh_phony_flags(makefile_);
    return true;
  }

  // shell and Dockerfile kinds never target a makefile
  template<typename Other>
  bool operator()(Other const&) {
    return false;
  }
};

} // namespace

auto wrap_with_sort(std::string_view text, std::string_view pattern, std::string_view preceding) -> std::string {
  std::string context{preceding};
  context.append(text);

  std::string out;
  size_t      copied = 0;
  size_t      from   = 0;
  for (auto pos = text.find(pattern); pos != std::string_view::npos; pos = text.find(pattern, from)) {
    from = pos + pattern.size();
    if (make::inside_sort(context, preceding.size() + pos)) {
      continue;
    }
    auto close = make::find_closing_paren(text, pos);
    if (!close) {
      continue;
    }
    out.append(text.substr(copied, pos - copied));
    out.append("$(sort ");
    out.append(text.substr(pos, *close + 1 - pos));
    out.push_back(')');
    copied = *close + 1;
    from   = copied;
  }
  out.append(text.substr(copied));
  return out;
}

auto apply(make::Makefile const& makefile, std::vector<Transformation> transformations) -> RewriteResult<make::Makefile> {
  auto out = makefile;
  for (auto& t : transformations) {
    if (!t.safe_) {
      continue;
    }
    MakeRewriter rewriter{out, t.span_};
    if (!std::visit(rewriter, t.kind_)) {
      t.downgraded_ = true;
      core::log::debug("{} at {}: target no longer matches, reported for a manual fix", t.rule_id_, t.span_.to_string());
    }
  }
  return RewriteResult<make::Makefile>{std::move(out), std::move(transformations)};
}

} // namespace shpure::transform
