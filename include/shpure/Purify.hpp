#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "shpure/AST.hpp"
#include "shpure/Config.hpp"
#include "shpure/Core.hpp"
#include "shpure/Dockerfile.hpp"
#include "shpure/Makefile.hpp"
#include "shpure/Report.hpp"
#include "shpure/Transform.hpp"

namespace shpure {

using Tree = std::variant<shell::Script, make::Makefile, docker::Dockerfile>;

struct PurificationResult {
  std::string                            text_;
  Tree                                   tree_;
  std::vector<core::SemanticIssue>       issues_;
  std::vector<transform::Transformation> transformations_; // applied and advisory, in application order
  report::PurificationReport             report_;
};

template<typename T>
using PurifyResult = std::expected<T, core::ParseError>;

// parse, analyze, plan, rewrite, render and report one input. Only parsing
// can fail.
[[nodiscard]] auto purify(std::string_view source, core::Dialect dialect, config::PurifyOptions const& options = {})
    -> PurifyResult<PurificationResult>;

[[nodiscard]] auto purify_shell(std::string_view source, config::PurifyOptions const& options = {})
    -> PurifyResult<PurificationResult>;
[[nodiscard]] auto purify_makefile(std::string_view source, config::PurifyOptions const& options = {})
    -> PurifyResult<PurificationResult>;
[[nodiscard]] auto purify_dockerfile(std::string_view source, config::PurifyOptions const& options = {})
    -> PurifyResult<PurificationResult>;

// Makefile, GNUmakefile and *.mk are makefiles; Dockerfile, Dockerfile.* and
// *.dockerfile are Dockerfiles; everything else is shell
[[nodiscard]] auto detect_dialect(std::filesystem::path const& path) -> core::Dialect;

} // namespace shpure
