#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shpure/Analyzer.hpp"
#include "shpure/Codegen.hpp"
#include "shpure/Printer.hpp"
#include "shpure/Transform.hpp"
#include "test_utils.h"

namespace shpure::transform::test {

using shpure::test::parse_dockerfile_ok;
using shpure::test::parse_makefile_ok;
using shpure::test::parse_ok;

class ShellRewriterTest : public ::testing::Test {
protected:
  static auto purified(std::string_view src, analysis::AnalyzerConfig const& config = {}, PlanOptions options = {})
      -> std::string {
    auto script = parse_ok(src);
    auto result = transform::apply(script, plan(script, analysis::analyze(script, config), options));
    return codegen::render(result.tree_);
  }

  static auto manual(Transformation::Kind kind, core::Span span) -> Transformation {
    Transformation t;
    t.kind_    = std::move(kind);
    t.rule_id_ = "TEST";
    t.span_    = span;
    return t;
  }
};

TEST_F(ShellRewriterTest, AddsFlags) {
  EXPECT_EQ(purified("mkdir /tmp/dir"), "mkdir -p /tmp/dir\n");
  EXPECT_EQ(purified("ln -s target link"), "ln -sf target link\n");
  EXPECT_EQ(purified("rm -r build"), "rm -rf build\n");
}

TEST_F(ShellRewriterTest, FlagsAreMergedOnlyIntoPlainClusters) {
  EXPECT_EQ(purified("mkdir -v out"), "mkdir -vp out\n");
  EXPECT_EQ(purified("mkdir -m 755 out"), "mkdir -p -m 755 out\n");
}

TEST_F(ShellRewriterTest, NestedCommandsAreRewritten) {
  EXPECT_EQ(purified("if true; then mkdir out; fi"), "if true; then\n    mkdir -p out\nfi\n");
}

TEST_F(ShellRewriterTest, QuotesExpansions) {
  EXPECT_EQ(purified("echo $name"), "echo \"$name\"\n");
  EXPECT_EQ(purified("printf '%s\\n' ${name}"), "printf '%s\\n' \"$name\"\n");
  EXPECT_EQ(purified("cat $dir/file"), "cat \"$dir\"/file\n");
}

TEST_F(ShellRewriterTest, SplitsCombinedRedirects) {
  EXPECT_EQ(purified("make &> build.log"), "make > build.log 2>&1\n");
  EXPECT_EQ(purified("make &>> build.log"), "make >> build.log 2>&1\n");
}

TEST_F(ShellRewriterTest, SourceBecomesDot) {
  EXPECT_EQ(purified("source ./env.sh"), ". ./env.sh\n");
}

TEST_F(ShellRewriterTest, ShebangIsRewrittenOnlyForPosixScripts) {
  EXPECT_EQ(purified("#!/bin/bash\necho hi\n"), "#!/bin/sh\necho hi\n");
  EXPECT_EQ(purified("#!/bin/bash\narr=(a b)\n"), "#!/bin/bash\narr=(a b)\n");
}

TEST_F(ShellRewriterTest, InsertsTypeGuards) {
  analysis::AnalyzerConfig config;
  config.emit_guards_ = true;
  EXPECT_EQ(
      purified("# @type port: int\nport=8080\n", config, PlanOptions{true}),
      "# @type port: int\n"
      "port=8080\n"
      "case \"$port\" in\n"
      "    ''|-|*[!0-9-]*|?*-*)\n"
      "        echo 'type error: port must be an integer' >&2\n"
      "        exit 1\n"
      "        ;;\n"
      "esac\n"
  );
}

TEST_F(ShellRewriterTest, GuardedScriptIsStable) {
  analysis::AnalyzerConfig config;
  config.emit_guards_ = true;
  auto once  = purified("# @type dir: path\ndir=/srv\n", config, PlanOptions{true});
  auto twice = purified(once, config, PlanOptions{true});
  EXPECT_EQ(once, twice);
}

TEST_F(ShellRewriterTest, AdvisoriesLeaveTheTreeAlone) {
  EXPECT_EQ(purified("x=$RANDOM"), "x=$RANDOM\n");
}

TEST_F(ShellRewriterTest, StaleTargetsAreDowngraded) {
  auto                        script = parse_ok("echo hi");
  std::vector<Transformation> transformations;
  transformations.push_back(manual(AddFlag{"mkdir", 'p'}, script.statements_[0].span_));
  transformations.push_back(manual(QuoteExpansion{"x"}, core::Span{5, 1, 5, 3}));

  auto result = transform::apply(script, std::move(transformations));
  ASSERT_EQ(result.transformations_.size(), 2);
  for (auto const& t : result.transformations_) {
    EXPECT_TRUE(t.downgraded_);
    EXPECT_FALSE(t.applied());
  }
  EXPECT_EQ(codegen::render(result.tree_), "echo hi\n");
}

TEST_F(ShellRewriterTest, ExistingFlagIsNotAddedTwice) {
  auto                        script = parse_ok("mkdir -p out");
  std::vector<Transformation> transformations;
  transformations.push_back(manual(AddFlag{"mkdir", 'p'}, script.statements_[0].span_));
  auto result = transform::apply(script, std::move(transformations));
  EXPECT_FALSE(result.transformations_[0].downgraded_);
  EXPECT_EQ(codegen::render(result.tree_), "mkdir -p out\n");
}

TEST_F(ShellRewriterTest, InputTreeIsNotModified) {
  auto script = parse_ok("mkdir out\necho $x\n");
  auto before = shell::ASTPrinter{}.print(script);
  auto result = transform::apply(script, plan(script, analysis::analyze(script)));
  EXPECT_EQ(shell::ASTPrinter{}.print(script), before);
  EXPECT_FALSE(shell::structurally_equal(script, result.tree_));
}

TEST(GuardTest, Shapes) {
  auto text = codegen::render(shell::Script{[] {
    std::vector<shell::Stmt> stmts;
    stmts.push_back(make_guard("name", "str", {}));
    return stmts;
  }()});
  EXPECT_EQ(
      text,
      "case \"$name\" in\n"
      "    '')\n"
      "        echo 'type error: name must be a non-empty string' >&2\n"
      "        exit 1\n"
      "        ;;\n"
      "esac\n"
  );
}

TEST(MakeRewriterTest, WrapsWildcardInSort) {
  auto makefile = parse_makefile_ok("FILES := $(wildcard *.c)\n");
  auto result   = transform::apply(makefile, plan(makefile, analysis::analyze(makefile)));
  EXPECT_EQ(codegen::render(result.tree_), "FILES := $(sort $(wildcard *.c))\n");
}

TEST(MakeRewriterTest, WrapsFindInSort) {
  auto makefile = parse_makefile_ok("SRCS := $(shell find src -name '*.c')\n");
  auto result   = transform::apply(makefile, plan(makefile, analysis::analyze(makefile)));
  EXPECT_EQ(codegen::render(result.tree_), "SRCS := $(sort $(shell find src -name '*.c'))\n");
}

TEST(MakeRewriterTest, InsertsPhonyBeforeTheTarget) {
  auto makefile = parse_makefile_ok("all: main.o\n\tcc -o app main.o\n");
  auto result   = transform::apply(makefile, plan(makefile, analysis::analyze(makefile)));
  EXPECT_EQ(codegen::render(result.tree_), ".PHONY: all\nall: main.o\n\tcc -o app main.o\n");
  EXPECT_EQ(make::phony_targets(result.tree_), (std::vector<std::string>{"all"}));
}

TEST(MakeRewriterTest, ExtendsAnExistingPhonyRule) {
  auto makefile = parse_makefile_ok(".PHONY: clean\nall: app\nclean:\n\trm -f app\n");
  auto result   = transform::apply(makefile, plan(makefile, analysis::analyze(makefile)));
  EXPECT_EQ(codegen::render(result.tree_), ".PHONY: clean all\nall: app\nclean:\n\trm -f app\n");
}

TEST(MakeRewriterTest, WrapWithSort) {
  EXPECT_EQ(
      wrap_with_sort("$(wildcard a/*.c) $(sort $(wildcard b/*.c))", "$(wildcard"),
      "$(sort $(wildcard a/*.c)) $(sort $(wildcard b/*.c))"
  );
  EXPECT_EQ(wrap_with_sort("$(wildcard $(DIR)/*.c)", "$(wildcard"), "$(sort $(wildcard $(DIR)/*.c))");
  EXPECT_EQ(wrap_with_sort("$(wildcard a", "$(wildcard"), "$(wildcard a");
}

TEST(MakeRewriterTest, EnclosingSortIsNotWrappedAgain) {
  std::string sorted = "$(sort $(wildcard a/*) $(wildcard b/*))";
  EXPECT_EQ(wrap_with_sort(sorted, "$(wildcard"), sorted);
  EXPECT_EQ(
      wrap_with_sort("$(sort $(notdir $(wildcard a/*))) $(wildcard b/*)", "$(wildcard"),
      "$(sort $(notdir $(wildcard a/*))) $(sort $(wildcard b/*))"
  );
  EXPECT_EQ(wrap_with_sort(" $(wildcard b/*))", "$(wildcard", "$(sort $(wildcard a/*)"), " $(wildcard b/*))");
}

TEST(DockerRewriterTest, FixesBaseImageAndAptGet) {
  auto dockerfile = parse_dockerfile_ok("FROM ubuntu\nRUN apt-get install -y curl\n");
  auto result     = transform::apply(dockerfile, plan(dockerfile, analysis::analyze(dockerfile)));
  EXPECT_EQ(
      codegen::render(result.tree_),
      "FROM ubuntu:22.04\nRUN apt-get install --no-install-recommends -y curl && rm -rf /var/lib/apt/lists/*\n"
  );
  size_t advisories = 0;
  for (auto const& t : result.transformations_) {
    advisories += t.applied() ? 0 : 1;
  }
  EXPECT_EQ(advisories, 1);
}

TEST(DockerRewriterTest, KeepsFlagsAndStageName) {
  auto dockerfile = parse_dockerfile_ok("FROM --platform=linux/amd64 ubuntu AS base\nUSER app\n");
  auto result     = transform::apply(dockerfile, plan(dockerfile, analysis::analyze(dockerfile)));
  EXPECT_EQ(codegen::render(result.tree_), "FROM --platform=linux/amd64 ubuntu:22.04 AS base\nUSER app\n");
}

TEST(DockerRewriterTest, AddBecomesCopy) {
  auto dockerfile = parse_dockerfile_ok("FROM alpine:3.19\nADD app.py /app/\nUSER app\n");
  auto result     = transform::apply(dockerfile, plan(dockerfile, analysis::analyze(dockerfile)));
  EXPECT_EQ(codegen::render(result.tree_), "FROM alpine:3.19\nCOPY app.py /app/\nUSER app\n");
}

TEST(DockerRewriterTest, ApkCacheIsCleaned) {
  auto dockerfile = parse_dockerfile_ok("FROM alpine:3.19\nRUN apk add curl\nUSER app\n");
  auto result     = transform::apply(dockerfile, plan(dockerfile, analysis::analyze(dockerfile)));
  EXPECT_EQ(codegen::render(result.tree_), "FROM alpine:3.19\nRUN apk add curl && rm -rf /var/cache/apk/*\nUSER app\n");
}

} // namespace shpure::transform::test
