#include "shpure/Purify.hpp"

#include "shpure/Analyzer.hpp"
#include "shpure/Codegen.hpp"
#include "shpure/Log.hpp"
#include "shpure/Parser.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace shpure {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsed_ms(Clock::time_point since) -> double {
  return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

template<typename TreeT>
auto run(TreeT parsed, core::Dialect dialect, config::PurifyOptions const& options) -> PurificationResult {
  auto started = Clock::now();
  auto issues  = analysis::analyze(parsed, analysis::AnalyzerConfig::from(options));
  core::log::debug("{}: {} issues in {:.3f}ms", to_string(dialect), issues.size(), elapsed_ms(started));

  started      = Clock::now();
  auto planned = transform::plan(parsed, issues, transform::PlanOptions::from(options));
  auto result  = transform::apply(parsed, std::move(planned));
  core::log::debug(
      "{}: {} transformations planned and applied in {:.3f}ms",
      to_string(dialect),
      result.transformations_.size(),
      elapsed_ms(started)
  );

  started   = Clock::now();
  auto text = codegen::render(result.tree_, options.format_);
  core::log::debug("{}: rendered {} bytes in {:.3f}ms", to_string(dialect), text.size(), elapsed_ms(started));

  auto summary = report::build_report(dialect, result.transformations_, issues);
  return PurificationResult{
      std::move(text),
      Tree{std::move(result.tree_)},
      std::move(issues),
      std::move(result.transformations_),
      std::move(summary),
  };
}

} // namespace

auto purify_shell(std::string_view source, config::PurifyOptions const& options) -> PurifyResult<PurificationResult> {
  auto script = shell::parse(source);
  if (!script) {
    return std::unexpected(script.error());
  }
  return run(std::move(*script), core::Dialect::Shell, options);
}

auto purify_makefile(std::string_view source, config::PurifyOptions const& options) -> PurifyResult<PurificationResult> {
  auto makefile = make::parse_makefile(source);
  if (!makefile) {
    return std::unexpected(makefile.error());
  }
  return run(std::move(*makefile), core::Dialect::Makefile, options);
}

auto purify_dockerfile(std::string_view source, config::PurifyOptions const& options)
    -> PurifyResult<PurificationResult> {
  auto dockerfile = docker::parse_dockerfile(source);
  if (!dockerfile) {
    return std::unexpected(dockerfile.error());
  }
  return run(std::move(*dockerfile), core::Dialect::Dockerfile, options);
}

auto purify(std::string_view source, core::Dialect dialect, config::PurifyOptions const& options)
    -> PurifyResult<PurificationResult> {
  switch (dialect) {
    case core::Dialect::Makefile: return purify_makefile(source, options);
    case core::Dialect::Dockerfile: return purify_dockerfile(source, options);
    case core::Dialect::Shell: break;
  }
  return purify_shell(source, options);
}

auto detect_dialect(std::filesystem::path const& path) -> core::Dialect {
  auto name      = path.filename().string();
  auto extension = path.extension().string();
  if (name == "Makefile" || name == "makefile" || name == "GNUmakefile" || extension == ".mk") {
    return core::Dialect::Makefile;
  }
  if (name == "Dockerfile" || name.starts_with("Dockerfile.") || extension == ".dockerfile") {
    return core::Dialect::Dockerfile;
  }
  return core::Dialect::Shell;
}

} // namespace shpure
