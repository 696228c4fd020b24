#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "shpure/AST.hpp"
#include "shpure/Config.hpp"
#include "shpure/Dockerfile.hpp"
#include "shpure/Makefile.hpp"

namespace shpure::codegen {

// Source text for a tree. Rendering a freshly parsed tree with default
// options and parsing the output again gives a structurally equal tree,
// except that `select` loops come back as their POSIX lowering.
[[nodiscard]] auto render(shell::Script const& script, config::FormatOptions const& options = {}) -> std::string;
[[nodiscard]] auto render(make::Makefile const& makefile, config::FormatOptions const& options = {}) -> std::string;
[[nodiscard]] auto render(docker::Dockerfile const& dockerfile, config::FormatOptions const& options = {})
    -> std::string;

// One shell word as it would appear in argument position
[[nodiscard]] auto render_word(shell::Expr const& word) -> std::string;

// Shell quoting of a literal: bare when it needs no quotes, otherwise single
// quoted with embedded quotes written as '\''
[[nodiscard]] auto quote(std::string_view literal) -> std::string;

// Splits `line` at spaces outside quotes so that no piece exceeds `limit`
// where possible; pieces after the first are prefixed with `indent`
[[nodiscard]] auto wrap_line(std::string_view line, std::size_t limit, std::string_view indent) -> std::string;

} // namespace shpure::codegen
