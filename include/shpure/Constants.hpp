#pragma once

#include <cstddef>
#include <string_view>

namespace shpure::constant {

constexpr std::string_view EXE_NAME = "shpure";
constexpr std::string_view EXE_DESC = "Shell, Makefile and Dockerfile purifier";
constexpr std::string_view VERSION  = "v0.3.0";

constexpr std::size_t MAX_NESTING_DEPTH = 256;
constexpr std::size_t INDENT_WIDTH      = 4;

}; // namespace shpure::constant
