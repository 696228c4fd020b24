#include "shpure/Analyzer.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace shpure::analysis {

namespace {

using namespace shpure::docker;
using core::Category;
using core::Severity;
using core::util::contains;
using core::util::contains_word;

constexpr std::array STABLE_TAGS{
    std::pair{std::string_view{"ubuntu"}, std::string_view{"22.04"}},
    std::pair{std::string_view{"debian"}, std::string_view{"12-slim"}},
    std::pair{std::string_view{"alpine"}, std::string_view{"3.19"}},
    std::pair{std::string_view{"node"}, std::string_view{"20-alpine"}},
    std::pair{std::string_view{"python"}, std::string_view{"3.11-slim"}},
    std::pair{std::string_view{"rust"}, std::string_view{"1.75-alpine"}},
    std::pair{std::string_view{"nginx"}, std::string_view{"1.25-alpine"}},
    std::pair{std::string_view{"postgres"}, std::string_view{"16-alpine"}},
    std::pair{std::string_view{"redis"}, std::string_view{"7-alpine"}},
};

template<typename F>
void each_instruction(Dockerfile const& dockerfile, std::string_view keyword, F const& fn) {
  for (auto const& item : dockerfile.items_) {
    if (auto const* inst = item.getIf<Instruction>(); inst != nullptr && inst->keyword_ == keyword) {
      fn(item, *inst);
    }
  }
}

// RUN text including here-document bodies
auto script_text(Instruction const& inst) -> std::string {
  if (inst.heredoc_.empty()) {
    return inst.arguments_;
  }
  return inst.arguments_ + "\n" + core::util::join(inst.heredoc_, "\n");
}

// Stage name declared with `FROM image AS name`
auto stage_alias(ImageRef const& ref) -> std::optional<std::string> {
  auto words = core::util::split_whitespace(ref.rest_);
  if (words.size() >= 2 && core::util::to_upper(words[0]) == "AS") {
    return words[1];
  }
  return std::nullopt;
}

void check_root_user(Dockerfile const& dockerfile, AnalyzerConfig const&, IssueSink& sink) {
  Item const*      last_from = nullptr;
  std::string_view user;
  for (auto const& item : dockerfile.items_) {
    auto const* inst = item.getIf<Instruction>();
    if (inst == nullptr) {
      continue;
    }
    if (inst->keyword_ == "FROM") {
      last_from = &item;
      user      = {};
    } else if (inst->keyword_ == "USER") {
      user = core::util::trim(inst->arguments_);
    }
  }
  if (last_from == nullptr) {
    return;
  }
  auto ref = parse_image(last_from->getIf<Instruction>()->arguments_);
  if (ref.name_ == "scratch") {
    return;
  }
  auto name = user.substr(0, user.find(':'));
  if (!name.empty() && name != "root" && name != "0") {
    return;
  }
  sink.report(
      last_from->span_,
      Severity::High,
      "the final stage runs as root",
      "create an unprivileged user and switch to it with USER before CMD/ENTRYPOINT"
  );
}

void check_base_image(Dockerfile const& dockerfile, AnalyzerConfig const&, IssueSink& sink) {
  std::vector<std::string> stages;
  each_instruction(dockerfile, "FROM", [&](Item const& item, Instruction const& inst) {
    auto ref = parse_image(inst.arguments_);
    bool own_stage =
        std::find(stages.begin(), stages.end(), core::util::to_upper(ref.name_)) != stages.end();
    if (auto alias = stage_alias(ref)) {
      stages.push_back(core::util::to_upper(*alias));
    }
    if (own_stage || ref.name_ == "scratch" || contains(ref.name_, "$") || !ref.digest_.empty()) {
      return;
    }
    if (!ref.tag_.empty() && ref.tag_ != "latest") {
      return;
    }
    auto tag = stable_tag(ref.name_);
    sink.report(
        item.span_,
        Severity::High,
        ref.tag_.empty() ? fmt::format("base image {} has no tag", ref.name_)
                         : fmt::format("base image {} uses the moving 'latest' tag", ref.name_),
        tag ? fmt::format("pin it: {}:{}", ref.name_, *tag) : std::string{"pin an explicit version or digest"}
    );
  });
}

void check_package_cache(Dockerfile const& dockerfile, AnalyzerConfig const&, IssueSink& sink) {
  each_instruction(dockerfile, "RUN", [&](Item const& item, Instruction const& inst) {
    if (auto cleanup = package_cleanup(inst.arguments_)) {
      sink.report(
          item.span_,
          Severity::Medium,
          "package manager cache is left in the image layer",
          fmt::format("append && {} to the same RUN", *cleanup)
      );
    }
  });
}

bool pipes_download_to_shell(std::string_view text) {
  if (!contains_word(text, "curl") && !contains_word(text, "wget")) {
    return false;
  }
  size_t pos = 0;
  while ((pos = text.find('|', pos)) != std::string_view::npos) {
    if (pos + 1 < text.size() && text[pos + 1] == '|') {
      pos += 2;
      continue;
    }
    auto words = core::util::split_whitespace(text.substr(pos + 1));
    if (!words.empty() && words.front() == "sudo") {
      words.erase(words.begin());
    }
    if (!words.empty()) {
      auto shell = words.front().substr(words.front().find_last_of('/') + 1);
      if (shell == "sh" || shell == "bash" || shell == "zsh" || shell == "dash") {
        return true;
      }
    }
    ++pos;
  }
  return false;
}

void check_pipe_to_shell(Dockerfile const& dockerfile, AnalyzerConfig const&, IssueSink& sink) {
  each_instruction(dockerfile, "RUN", [&](Item const& item, Instruction const& inst) {
    if (pipes_download_to_shell(script_text(inst))) {
      sink.report(
          item.span_,
          Severity::Critical,
          "a downloaded script is piped into a shell",
          "download the script, verify its checksum, then run it"
      );
    }
  });
}

void check_install_recommends(Dockerfile const& dockerfile, AnalyzerConfig const&, IssueSink& sink) {
  each_instruction(dockerfile, "RUN", [&](Item const& item, Instruction const& inst) {
    auto const& args = inst.arguments_;
    if (contains(args, "apt-get install") && !contains(args, "--no-install-recommends")) {
      sink.report(
          item.span_,
          Severity::Low,
          "apt-get install pulls in recommended packages",
          "add --no-install-recommends"
      );
    }
  });
}

void check_add(Dockerfile const& dockerfile, AnalyzerConfig const&, IssueSink& sink) {
  each_instruction(dockerfile, "ADD", [&](Item const& item, Instruction const& inst) {
    if (adds_local_file(inst.arguments_)) {
      sink.report(
          item.span_,
          Severity::Medium,
          "ADD is used for a local file",
          "use COPY, which neither fetches URLs nor unpacks archives"
      );
    }
  });
}

} // namespace

auto stable_tag(std::string_view image) noexcept -> std::optional<std::string_view> {
  for (auto const& [name, tag] : STABLE_TAGS) {
    if (name == image) {
      return tag;
    }
  }
  return std::nullopt;
}

auto package_cleanup(std::string_view run_arguments) -> std::optional<std::string> {
  auto installs = [&](std::string_view tool, std::string_view verb) {
    return contains_word(run_arguments, tool) && contains_word(run_arguments, verb);
  };
  if ((installs("apt-get", "install") || installs("apt", "install")) && !contains(run_arguments, "/var/lib/apt/lists")) {
    return std::string{"rm -rf /var/lib/apt/lists/*"};
  }
  if (installs("apk", "add") && !contains(run_arguments, "--no-cache") && !contains(run_arguments, "/var/cache/apk")) {
    return std::string{"rm -rf /var/cache/apk/*"};
  }
  for (auto tool : {std::string_view{"yum"}, std::string_view{"dnf"}}) {
    if (installs(tool, "install") && !contains(run_arguments, "clean all")) {
      return fmt::format("{} clean all", tool);
    }
  }
  return std::nullopt;
}

bool adds_local_file(std::string_view add_arguments) {
  auto words = core::util::split_whitespace(add_arguments);
  if (words.empty() || words.front().starts_with("[")) {
    return false;
  }
  size_t i = 0;
  for (; i < words.size() && words[i].starts_with("--"); ++i) {
    if (!words[i].starts_with("--chown") && !words[i].starts_with("--chmod")) {
      return false;
    }
  }
  if (i + 1 >= words.size()) {
    return false;
  }
  auto const& source = words[i];
  if (source.starts_with("http://") || source.starts_with("https://") || source.starts_with("git@")) {
    return false;
  }
  for (auto suffix : {".tar", ".tar.gz", ".tgz", ".tar.bz2", ".tar.xz", ".tar.Z"}) {
    if (source.ends_with(suffix)) {
      return false;
    }
  }
  return true;
}

auto docker_rules() noexcept -> std::vector<Rule<Dockerfile>> const& {
  static std::vector<Rule<Dockerfile>> const rules{
      {"DOCKER001", Category::Security, check_root_user},
      {"DOCKER002", Category::Reproducibility, check_base_image},
      {"DOCKER003", Category::Performance, check_package_cache},
      {"DOCKER004", Category::Security, check_pipe_to_shell},
      {"DOCKER005", Category::Performance, check_install_recommends},
      {"DOCKER006", Category::Security, check_add},
  };
  return rules;
}

} // namespace shpure::analysis
