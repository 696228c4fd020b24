#include "shpure/Transform.hpp"

#include "shpure/Analyzer.hpp"
#include "shpure/Log.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

namespace shpure::transform {

namespace {

using namespace shpure::docker;
using core::Span;

constexpr std::string_view APT_INSTALL   = "apt-get install";
constexpr std::string_view NO_RECOMMENDS = " --no-install-recommends";

auto insert_no_recommends(std::string const& text) -> std::pair<std::string, std::size_t> {
  std::string out;
  std::size_t inserted = 0;
  std::size_t copied   = 0;
  for (auto pos = text.find(APT_INSTALL); pos != std::string::npos; pos = text.find(APT_INSTALL, pos + 1)) {
    auto end = pos + APT_INSTALL.size();
    out.append(text, copied, end - copied);
    out.append(NO_RECOMMENDS);
    copied = end;
    ++inserted;
  }
  out.append(text, copied);
  return {out, inserted};
}

class DockerRewriter {
  Dockerfile& dockerfile_;
  Span        span_;

  Instruction* instruction(std::string_view keyword) {
    for (auto& item : dockerfile_.items_) {
      if (item.span_ != span_) {
        continue;
      }
      auto* inst = item.getIf<Instruction>();
      return inst != nullptr && inst->keyword_ == keyword ? inst : nullptr;
    }
    return nullptr;
  }

public:
  DockerRewriter(Dockerfile& dockerfile, Span span) noexcept
      : dockerfile_(dockerfile), span_(span) {}

  bool operator()(PinBaseImage const& fix) {
    auto* inst = instruction("FROM");
    if (inst == nullptr) {
      return false;
    }
    auto ref = parse_image(inst->arguments_);
    if (ref.name_ != fix.image_ || !ref.digest_.empty() || (!ref.tag_.empty() && ref.tag_ != "latest")) {
      return false;
    }

    std::string args;
    if (!ref.flags_.empty()) {
      args = ref.flags_ + " ";
    }
    if (!ref.registry_.empty()) {
      args += ref.registry_ + "/";
    }
    args += fmt::format("{}:{}", ref.name_, fix.tag_);
    if (!ref.rest_.empty()) {
      args += " " + ref.rest_;
    }
    inst->arguments_ = std::move(args);
    inst->segments_.clear();
    return true;
  }

  bool operator()(CleanPackageCache const& fix) {
    auto* inst = instruction("RUN");
    if (inst == nullptr || !inst->heredoc_.empty()) {
      return false;
    }
    if (analysis::package_cleanup(inst->arguments_) != std::optional<std::string>{fix.cleanup_}) {
      return false;
    }
    auto suffix = " && " + fix.cleanup_;
    inst->arguments_ += suffix;
    if (!inst->segments_.empty()) {
      inst->segments_.back() += suffix;
    }
    return true;
  }

  bool operator()(AddNoInstallRecommends const&) {
    auto* inst = instruction("RUN");
    if (inst == nullptr) {
      return false;
    }
    auto [args, count] = insert_no_recommends(inst->arguments_);
    if (count == 0) {
      return false;
    }
    inst->arguments_ = std::move(args);

    std::size_t in_segments = 0;
    for (auto& segment : inst->segments_) {
      auto [text, n] = insert_no_recommends(segment);
      segment        = std::move(text);
      in_segments += n;
    }
    // `apt-get` and `install` on different physical lines
    if (!inst->segments_.empty() && in_segments != count) {
      inst->segments_.clear();
    }
    return true;
  }

  bool operator()(AddToCopy const&) {
    auto* inst = instruction("ADD");
    if (inst == nullptr || !analysis::adds_local_file(inst->arguments_)) {
      return false;
    }
    inst->keyword_ = "COPY";
    if (!inst->segments_.empty()) {
      inst->segments_.front() = "COPY" + inst->segments_.front().substr(3);
    }
    return true;
  }

  // shell and makefile kinds never target a Dockerfile
  template<typename Other>
  bool operator()(Other const&) {
    return false;
  }
};

} // namespace

auto apply(docker::Dockerfile const& dockerfile, std::vector<Transformation> transformations)
    -> RewriteResult<docker::Dockerfile> {
  auto out = dockerfile;
  for (auto& t : transformations) {
    if (!t.safe_) {
      continue;
    }
    DockerRewriter rewriter{out, t.span_};
    if (!std::visit(rewriter, t.kind_)) {
      t.downgraded_ = true;
      core::log::debug("{} at {}: target no longer matches, reported for a manual fix", t.rule_id_, t.span_.to_string());
    }
  }
  return RewriteResult<docker::Dockerfile>{std::move(out), std::move(transformations)};
}

} // namespace shpure::transform
