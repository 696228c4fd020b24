#include "shpure/Codegen.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace shpure::codegen {

namespace {

using namespace shpure::docker;

constexpr std::string_view CONTINUATION_INDENT = "    ";

class DockerWriter {
  config::FormatOptions const& options_;
  std::string                  out_;

public:
  explicit DockerWriter(config::FormatOptions const& options) noexcept : options_(options) {}

  auto render(Dockerfile const& dockerfile) -> std::string {
    for (auto const& item : dockerfile.items_) {
      if (options_.keepBlankLines()) {
        out_.append(item.blank_before_, '\n');
      }
      std::visit([this](auto const& node) { write(node); }, item.node_);
    }
    return std::move(out_);
  }

private:
  void write(Instruction const& inst) {
    if (options_.keepContinuations() && !inst.segments_.empty()) {
      for (std::size_t i = 0; i < inst.segments_.size(); ++i) {
        if (i > 0) {
          out_ += " \\\n";
          out_ += CONTINUATION_INDENT;
        }
        out_ += inst.segments_[i];
      }
    } else {
      auto text = inst.keyword_ + " " + inst.arguments_;
      out_ += options_.max_line_length_ ? wrap_line(text, *options_.max_line_length_, CONTINUATION_INDENT) : text;
    }
    out_.push_back('\n');
    // here-document lines are written exactly as read
    for (auto const& line : inst.heredoc_) {
      out_ += line;
      out_.push_back('\n');
    }
  }

  void write(Comment const& comment) {
    out_ += comment.text_;
    out_.push_back('\n');
  }
};

} // namespace

auto render(docker::Dockerfile const& dockerfile, config::FormatOptions const& options) -> std::string {
  DockerWriter writer{options};
  return writer.render(dockerfile);
}

} // namespace shpure::codegen
