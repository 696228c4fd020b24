#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "shpure/Parser.hpp"
#include "shpure/Purify.hpp"

namespace shpure::test {

namespace {

auto purified(std::string_view src, core::Dialect dialect = core::Dialect::Shell, config::PurifyOptions const& options = {})
    -> PurificationResult {
  auto result = purify(src, dialect, options);
  if (!result) {
    ADD_FAILURE() << result.error().to_string() << "\n" << src;
    return PurificationResult{};
  }
  return std::move(*result);
}

auto statement_count(Tree const& tree) -> std::size_t {
  return std::visit(
      [](auto const& node) -> std::size_t {
        if constexpr (std::is_same_v<std::decay_t<decltype(node)>, shell::Script>) {
          return node.statements_.size();
        } else {
          return node.items_.size();
        }
      },
      tree
  );
}

std::vector<std::string_view> const SHELL_INPUTS{
    "mkdir /tmp/dir\n",
    "ln -s target link\nrm -r build\n",
    "#!/bin/bash\nsource ./env.sh\necho $HOME\nmake &> build.log\n",
    "x=$RANDOM\necho \"$x\" >> /var/log/run.log\n",
    "for f in $(ls *.txt); do cp $f /backup/; done\n",
    "if [ -d out ]; then\n  rm -r out\nfi\nmkdir out\n",
    "greet() {\n  echo \"hello $1\"\n}\ngreet $USER\n",
    "case $1 in\n  start) mkdir -p run ;;\n  *) echo usage ;;\nesac\n",
};

} // namespace

TEST(PurifyTest, WildcardIsSorted) {
  auto result = purified("FILES := $(wildcard *.c)\n", core::Dialect::Makefile);
  EXPECT_EQ(result.text_, "FILES := $(sort $(wildcard *.c))\n");
  EXPECT_EQ(result.report_.transformations_applied_, 1);
  EXPECT_EQ(result.report_.issues_fixed_, 1);
  EXPECT_EQ(result.report_.manual_fixes_needed_, 0);
}

TEST(PurifyTest, SortedWildcardsAreLeftAlone) {
  std::string_view src    = "A := $(sort $(wildcard a/*) $(wildcard b/*))\n";
  auto             result = purified(src, core::Dialect::Makefile);
  EXPECT_EQ(result.text_, src);
  EXPECT_EQ(result.report_.issues_fixed_, 0);
}

TEST(PurifyTest, MkdirGetsParents) {
  auto result = purified("mkdir /tmp/dir\n");
  EXPECT_EQ(result.text_, "mkdir -p /tmp/dir\n");
  EXPECT_EQ(result.report_.issues_fixed_, 1);
  ASSERT_EQ(result.report_.lines_.size(), 1);
  EXPECT_EQ(result.report_.lines_[0].category_, core::Category::Idempotency);
}

TEST(PurifyTest, LinksAreForced) {
  auto result = purified("ln -s target link\n");
  EXPECT_NE(result.text_.find("-sf"), std::string::npos) << result.text_;
  EXPECT_EQ(result.report_.issues_fixed_, 1);
}

TEST(PurifyTest, RandomNeedsAManualFix) {
  auto result = purified("x=$RANDOM\n");
  EXPECT_EQ(result.text_, "x=$RANDOM\n");
  EXPECT_EQ(result.report_.transformations_applied_, 1);
  EXPECT_EQ(result.report_.issues_fixed_, 0);
  EXPECT_EQ(result.report_.manual_fixes_needed_, 1);
  ASSERT_EQ(result.issues_.size(), 1);
  ASSERT_TRUE(result.issues_[0].fix_.has_value());
  EXPECT_NE(result.issues_[0].fix_->find("deterministic"), std::string::npos);
}

TEST(PurifyTest, Makefile) {
  auto result = purified("all: main.o\n\tcc -o app main.o\n", core::Dialect::Makefile);
  EXPECT_EQ(result.text_, ".PHONY: all\nall: main.o\n\tcc -o app main.o\n");
  EXPECT_TRUE(std::holds_alternative<make::Makefile>(result.tree_));
}

TEST(PurifyTest, Dockerfile) {
  auto result = purified("FROM ubuntu\nRUN apt-get install -y curl\n", core::Dialect::Dockerfile);
  EXPECT_EQ(
      result.text_,
      "FROM ubuntu:22.04\nRUN apt-get install --no-install-recommends -y curl && rm -rf /var/lib/apt/lists/*\n"
  );
  EXPECT_EQ(result.report_.issues_fixed_, 3);
  EXPECT_EQ(result.report_.manual_fixes_needed_, 1);
}

TEST(PurifyTest, ParseErrorsStopThePipeline) {
  auto result = purify_shell("case $x in a) echo a ;;\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_GT(result.error().line(), 0);
  EXPECT_NE(result.error().to_string("run.sh").find("run.sh:"), std::string::npos);

  EXPECT_FALSE(purify_shell("echo 'unterminated\n").has_value());
  EXPECT_FALSE(purify_shell("for ((i = 0; i < 3)); do :; done\n").has_value());
}

TEST(PurifyTest, Idempotence) {
  for (auto src : SHELL_INPUTS) {
    auto once  = purified(src);
    auto twice = purified(once.text_);
    EXPECT_EQ(twice.report_.issues_fixed_, 0) << src << "\n--\n" << once.text_;
    EXPECT_EQ(twice.text_, once.text_) << src;
  }

  auto docker = purified("FROM node:latest\nADD app.js /app/\nRUN apk add nodejs\n", core::Dialect::Dockerfile);
  EXPECT_EQ(purified(docker.text_, core::Dialect::Dockerfile).report_.issues_fixed_, 0) << docker.text_;

  auto make = purified("SRCS := $(wildcard src/*.c)\nclean:\n\trm -rf out\n", core::Dialect::Makefile);
  EXPECT_EQ(purified(make.text_, core::Dialect::Makefile).report_.issues_fixed_, 0) << make.text_;
}

TEST(PurifyTest, Determinism) {
  for (auto src : SHELL_INPUTS) {
    EXPECT_EQ(purified(src).text_, purified(src).text_) << src;
  }
}

TEST(PurifyTest, SafeRewritesKeepTheStatementCount) {
  for (auto src : SHELL_INPUTS) {
    auto result = purified(src);
    auto before = shell::parse(src);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(statement_count(result.tree_), before->statements_.size()) << src;
  }
}

TEST(PurifyTest, OptionsReachTheAnalyzer) {
  config::PurifyOptions options;
  options.strict_idempotency_ = false;
  EXPECT_EQ(purified("mkdir /tmp/dir\n", core::Dialect::Shell, options).text_, "mkdir /tmp/dir\n");

  options              = {};
  options.emit_guards_ = true;
  auto result          = purified("# @type port: int\nport=8080\n", core::Dialect::Shell, options);
  EXPECT_NE(result.text_.find("case \"$port\" in"), std::string::npos) << result.text_;
}

TEST(PurifyTest, FormatOptionsReachTheGenerator) {
  config::PurifyOptions options;
  options.format_.preserve_formatting_ = true;
  EXPECT_EQ(purified("a\n\nb\n", core::Dialect::Shell, options).text_, "a\n\nb\n");
  EXPECT_EQ(purified("a\n\nb\n").text_, "a\nb\n");
}

TEST(DetectDialectTest, FileNames) {
  EXPECT_EQ(detect_dialect("Makefile"), core::Dialect::Makefile);
  EXPECT_EQ(detect_dialect("src/GNUmakefile"), core::Dialect::Makefile);
  EXPECT_EQ(detect_dialect("rules.mk"), core::Dialect::Makefile);
  EXPECT_EQ(detect_dialect("Dockerfile"), core::Dialect::Dockerfile);
  EXPECT_EQ(detect_dialect("docker/Dockerfile.dev"), core::Dialect::Dockerfile);
  EXPECT_EQ(detect_dialect("app.dockerfile"), core::Dialect::Dockerfile);
  EXPECT_EQ(detect_dialect("install.sh"), core::Dialect::Shell);
  EXPECT_EQ(detect_dialect("configure"), core::Dialect::Shell);
}

} // namespace shpure::test
