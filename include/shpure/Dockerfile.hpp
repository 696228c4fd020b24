#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "shpure/Core.hpp"

namespace shpure::docker {

template<typename T>
using Result = core::Result<T, core::ParseError>;

// `segments_` keeps the physical lines of a continued instruction, the first
// one starting with the keyword as written
struct Instruction {
  std::string              keyword_; // upper case
  std::string              arguments_;
  std::vector<std::string> segments_;
  std::vector<std::string> heredoc_; // lines after `<<EOF`, terminator included
};

struct Comment {
  std::string text_; // including the leading '#'
};

struct Item {
  using Kind = std::variant<Instruction, Comment>;

  Kind        node_;
  core::Span  span_;
  std::size_t blank_before_ = 0;

  template<typename T>
  [[nodiscard]] T const* getIf() const noexcept {
    return std::get_if<T>(&node_);
  }

  template<typename T>
  [[nodiscard]] T* getIf() noexcept {
    return std::get_if<T>(&node_);
  }
};

struct Dockerfile {
  std::vector<Item> items_;
  core::Metadata    metadata_;
};

[[nodiscard]] bool is_instruction_keyword(std::string_view upper) noexcept;

Result<Dockerfile> parse_dockerfile(std::string_view src, std::string_view file = {});

// Image reference of a FROM instruction split into its parts:
// `[registry/]name[:tag][@digest] [AS stage]`
struct ImageRef {
  std::string registry_;
  std::string name_;
  std::string tag_;
  std::string digest_;
  std::string rest_; // everything after the image, e.g. "AS build"
  std::string flags_; // leading --platform=... options
};

[[nodiscard]] auto parse_image(std::string_view from_arguments) -> ImageRef;

} // namespace shpure::docker
