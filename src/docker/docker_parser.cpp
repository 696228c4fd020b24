#include "shpure/Dockerfile.hpp"

#include "shpure/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace shpure::docker {

namespace {

using core::util::trim;
using core::util::trim_left;
using core::util::trim_right;

constexpr std::array KEYWORDS{
    std::string_view{"FROM"},
    std::string_view{"RUN"},
    std::string_view{"CMD"},
    std::string_view{"LABEL"},
    std::string_view{"MAINTAINER"},
    std::string_view{"EXPOSE"},
    std::string_view{"ENV"},
    std::string_view{"ADD"},
    std::string_view{"COPY"},
    std::string_view{"ENTRYPOINT"},
    std::string_view{"VOLUME"},
    std::string_view{"USER"},
    std::string_view{"WORKDIR"},
    std::string_view{"ARG"},
    std::string_view{"ONBUILD"},
    std::string_view{"STOPSIGNAL"},
    std::string_view{"HEALTHCHECK"},
    std::string_view{"SHELL"},
};

auto is_continued(std::string_view line) noexcept -> bool {
  return !line.empty() && line.back() == '\\';
}

auto strip_continuation(std::string_view line) noexcept -> std::string_view {
  line.remove_suffix(1);
  return trim_right(line);
}

// Delimiters of `<<EOF` / `<<-"EOF"` here-documents in RUN/COPY arguments
auto heredoc_delimiters(std::string_view args) -> std::vector<std::string> {
  std::vector<std::string> out;
  size_t                   pos = 0;
  while ((pos = args.find("<<", pos)) != std::string_view::npos) {
    pos += 2;
    if (pos < args.size() && args[pos] == '-') {
      ++pos;
    }
    if (pos < args.size() && (args[pos] == '"' || args[pos] == '\'')) {
      ++pos;
    }
    size_t start = pos;
    while (pos < args.size() && (std::isalnum(static_cast<unsigned char>(args[pos])) || args[pos] == '_')) {
      ++pos;
    }
    if (pos > start) {
      out.emplace_back(args.substr(start, pos - start));
    }
  }
  return out;
}

class DockerParser {
  std::vector<std::string_view> lines_;
  size_t                        pos_   = 0;
  size_t                        blank_ = 0;

public:
  explicit DockerParser(std::string_view src) : lines_(core::util::split_lines(src)) {}

  Result<std::vector<Item>> parseAll() {
    std::vector<Item> items;
    while (pos_ < lines_.size()) {
      auto raw  = lines_[pos_];
      auto text = trim(raw);
      if (text.empty()) {
        ++blank_;
        ++pos_;
        continue;
      }
      if (text.front() == '#') {
        items.push_back(Item{Comment{std::string{text}}, line_span(pos_, pos_), std::exchange(blank_, 0)});
        ++pos_;
        continue;
      }
      auto inst = parseInstruction();
      if (!inst) {
        return std::unexpected(inst.error());
      }
      items.push_back(std::move(*inst));
    }
    return items;
  }

private:
  [[nodiscard]] auto line_span(size_t first, size_t last) const noexcept -> core::Span {
    return core::Span{first + 1, 1, last + 1, lines_[last].size() + 1};
  }

  Result<Item> parseInstruction() {
    size_t first = pos_;
    auto   start = trim(lines_[pos_]);

    auto                     head        = is_continued(start) ? strip_continuation(start) : start;
    auto                     keyword_end = head.find_first_of(" \t");
    auto                     keyword     = core::util::to_upper(head.substr(0, keyword_end));
    std::vector<std::string> segments;
    std::vector<std::string> parts;

    if (!is_instruction_keyword(keyword)) {
      return std::unexpected(core::ParseError{
          fmt::format("unknown instruction '{}'", head.substr(0, keyword_end)),
          first + 1,
          lines_[first].size() - trim_left(lines_[first]).size() + 1,
          "a Dockerfile instruction",
      });
    }

    auto line = start;
    while (true) {
      bool more = is_continued(line);
      auto seg  = more ? strip_continuation(line) : line;
      segments.emplace_back(segments.empty() ? seg : trim(seg));
      if (!trim(seg).empty()) {
        parts.emplace_back(trim(seg));
      }
      ++pos_;
      if (!more) {
        break;
      }
      // comment lines inside a continuation are dropped by the builder
      while (pos_ < lines_.size() && !trim(lines_[pos_]).empty() && trim(lines_[pos_]).front() == '#') {
        core::log::debug("dropping comment inside continued {} at line {}", keyword, pos_ + 1);
        ++pos_;
      }
      if (pos_ >= lines_.size()) {
        return std::unexpected(core::ParseError{
            "line continuation at end of input",
            pos_,
            lines_[pos_ - 1].size() + 1,
            "a continuation line",
        });
      }
      line = lines_[pos_];
    }

    auto joined    = core::util::join(parts, " ");
    auto arguments = trim(std::string_view{joined}.substr(std::min(keyword.size(), joined.size())));
    if (arguments.empty()) {
      return std::unexpected(core::ParseError{
          fmt::format("{} instruction without arguments", keyword),
          first + 1,
          1,
          "instruction arguments",
      });
    }
    if (segments.size() == 1) {
      segments.clear();
    }

    Instruction inst{keyword, std::string{arguments}, std::move(segments), {}};
    for (auto const& delimiter : heredoc_delimiters(inst.arguments_)) {
      bool closed = false;
      while (pos_ < lines_.size()) {
        auto body_line = lines_[pos_++];
        inst.heredoc_.emplace_back(body_line);
        if (trim(body_line) == delimiter) {
          closed = true;
          break;
        }
      }
      if (!closed) {
        return std::unexpected(core::ParseError{
            fmt::format("here-document delimited by '{}' is not terminated", delimiter),
            first + 1,
            1,
            fmt::format("'{}'", delimiter),
        });
      }
    }
    return Item{std::move(inst), line_span(first, pos_ - 1), std::exchange(blank_, 0)};
  }
};

} // namespace

bool is_instruction_keyword(std::string_view upper) noexcept {
  return std::find(KEYWORDS.begin(), KEYWORDS.end(), upper) != KEYWORDS.end();
}

auto parse_image(std::string_view from_arguments) -> ImageRef {
  ImageRef         ref;
  std::string_view rest = trim(from_arguments);

  while (rest.starts_with("--")) {
    auto end = rest.find_first_of(" \t");
    if (!ref.flags_.empty()) {
      ref.flags_ += ' ';
    }
    ref.flags_ += std::string{rest.substr(0, end)};
    rest = end == std::string_view::npos ? std::string_view{} : trim_left(rest.substr(end));
  }

  auto end   = rest.find_first_of(" \t");
  auto image = rest.substr(0, end);
  ref.rest_  = end == std::string_view::npos ? std::string{} : std::string{trim(rest.substr(end))};

  if (auto at = image.find('@'); at != std::string_view::npos) {
    ref.digest_ = std::string{image.substr(at + 1)};
    image       = image.substr(0, at);
  }
  if (auto slash = image.find('/'); slash != std::string_view::npos) {
    auto prefix = image.substr(0, slash);
    if (prefix.find('.') != std::string_view::npos || prefix.find(':') != std::string_view::npos
        || prefix == "localhost") {
      ref.registry_ = std::string{prefix};
      image         = image.substr(slash + 1);
    }
  }
  if (auto colon = image.rfind(':'); colon != std::string_view::npos) {
    ref.tag_ = std::string{image.substr(colon + 1)};
    image    = image.substr(0, colon);
  }
  ref.name_ = std::string{image};
  return ref;
}

Result<Dockerfile> parse_dockerfile(std::string_view src, std::string_view file) {
  auto start = std::chrono::steady_clock::now();

  DockerParser parser{src};
  auto         items = parser.parseAll();
  if (!items) {
    return std::unexpected(items.error());
  }

  Dockerfile dockerfile;
  dockerfile.items_                 = std::move(*items);
  dockerfile.metadata_.source_file_ = std::string{file};
  dockerfile.metadata_.line_count_  = core::util::split_lines(src).size();
  dockerfile.metadata_.parse_time_ms_ =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  core::log::debug(
      "parsed {} dockerfile items in {:.3f}ms", dockerfile.items_.size(), dockerfile.metadata_.parse_time_ms_
  );
  return dockerfile;
}

} // namespace shpure::docker
