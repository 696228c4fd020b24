#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shpure/Analyzer.hpp"
#include "test_utils.h"

namespace shpure::analysis::test {

using shpure::test::count_rule;
using shpure::test::has_rule;
using shpure::test::parse_makefile_ok;

namespace {

auto issues_of(std::string_view src) -> std::vector<core::SemanticIssue> {
  return analyze(parse_makefile_ok(src));
}

} // namespace

TEST(MakeRulesTest, CleanMakefileHasNoIssues) {
  auto issues = issues_of(R"(.PHONY: all clean
.SUFFIXES:
.DELETE_ON_ERROR:

CC := gcc
SRCS := $(sort $(wildcard src/*.c))

all: app

app: $(SRCS)
	$(CC) -o $@ $^

clean:
	rm -f app
)");
  EXPECT_TRUE(issues.empty()) << core::util::join(shpure::test::rule_ids(issues), " ");
}

TEST(MakeRulesTest, Timestamps) {
  auto issues = issues_of("BUILD_DATE := $(shell date +%Y%m%d)\n");
  ASSERT_TRUE(has_rule(issues, "NO_TIMESTAMPS"));
  EXPECT_EQ(issues.at(0).severity_, core::Severity::Critical);
  EXPECT_EQ(issues.at(0).category_, core::Category::Determinism);
}

TEST(MakeRulesTest, Wildcard) {
  EXPECT_TRUE(has_rule(issues_of("SRCS := $(wildcard *.c)\n"), "NO_WILDCARD"));
  EXPECT_FALSE(has_rule(issues_of("SRCS := $(sort $(wildcard *.c))\n"), "NO_WILDCARD"));
  EXPECT_EQ(unsorted_calls("$(wildcard a/*.c) $(sort $(wildcard b/*.c)) $(wildcard c/*.c)", "$(wildcard"), 2);
}

TEST(MakeRulesTest, WildcardUnderAnEnclosingSort) {
  EXPECT_FALSE(has_rule(issues_of("A := $(sort $(wildcard a/*) $(wildcard b/*))\n"), "NO_WILDCARD"));
  EXPECT_FALSE(has_rule(issues_of("A := $(sort $(addprefix x/,$(wildcard b/*)))\n"), "NO_WILDCARD"));
  EXPECT_TRUE(has_rule(issues_of("A := $(sort a) $(wildcard b/*)\n"), "NO_WILDCARD"));
  EXPECT_FALSE(
      has_rule(issues_of("A := $(sort $(wildcard a/*) $(shell find src -name '*.c'))\n"), "NO_UNORDERED_FIND")
  );
  EXPECT_EQ(unsorted_calls("$(sort $(wildcard a/*) $(wildcard b/*)) $(wildcard c/*)", "$(wildcard"), 1);
  EXPECT_EQ(unsorted_calls(" $(wildcard b/*))", "$(wildcard", "$(sort $(wildcard a/*)"), 0);
}

TEST(MakeRulesTest, UnorderedFind) {
  EXPECT_TRUE(has_rule(issues_of("FILES := $(shell find src -name '*.c')\n"), "NO_UNORDERED_FIND"));
  EXPECT_FALSE(has_rule(issues_of("FILES := $(sort $(shell find src -name '*.c'))\n"), "NO_UNORDERED_FIND"));
}

TEST(MakeRulesTest, Random) {
  EXPECT_TRUE(has_rule(issues_of("ID := $(shell echo $$RANDOM)\n"), "NO_RANDOM"));
}

TEST(MakeRulesTest, ConventionalTargetsShouldBePhony) {
  auto issues = issues_of("all: app\napp: main.o\n\tcc -o app main.o\n");
  ASSERT_EQ(count_rule(issues, "AUTO_PHONY"), 1);
  EXPECT_EQ(issues.at(0).fix_, "add 'all' to .PHONY");
  EXPECT_FALSE(has_rule(issues_of(".PHONY: all\nall: app\n"), "AUTO_PHONY"));
}

TEST(MakeRulesTest, SharedOutputFile) {
  auto issues = issues_of("a:\n\techo a > out.txt\nb:\n\techo b > out.txt\n");
  EXPECT_TRUE(has_rule(issues, "MAKE_PAR001"));
  EXPECT_TRUE(has_rule(issues, "MAKE_PAR005"));
  EXPECT_FALSE(has_rule(issues_of(".NOTPARALLEL:\na:\n\techo a > out.txt\nb:\n\techo b > out.txt\n"), "MAKE_PAR005"));
}

TEST(MakeRulesTest, MissingDependencyOnProducer) {
  auto issues = issues_of("gen:\n\techo data > data.txt\nuse:\n\tcat data.txt\n");
  EXPECT_TRUE(has_rule(issues, "MAKE_PAR002"));
  EXPECT_FALSE(has_rule(issues_of("gen:\n\techo data > data.txt\nuse: gen\n\tcat data.txt\n"), "MAKE_PAR002"));
}

TEST(MakeRulesTest, RecursiveMakeAndSharedDirectories) {
  EXPECT_TRUE(has_rule(issues_of("sub:\n\t$(MAKE) -C lib\n"), "MAKE_PAR003"));
  EXPECT_TRUE(has_rule(issues_of("a:\n\tmkdir -p build\nb:\n\tmkdir -p build\n"), "MAKE_PAR004"));
}

TEST(MakeRulesTest, Reproducibility) {
  EXPECT_TRUE(has_rule(issues_of("stamp:\n\tdate > stamp.txt\n"), "MAKE_REPRO001"));
  EXPECT_FALSE(has_rule(issues_of("stamp:\n\tdate -d @$$SOURCE_DATE_EPOCH > stamp.txt\n"), "MAKE_REPRO001"));
  EXPECT_TRUE(has_rule(issues_of("seed:\n\techo $$RANDOM > seed\n"), "MAKE_REPRO002"));
  EXPECT_TRUE(has_rule(issues_of("tmp:\n\ttouch /tmp/x.$$$$\n"), "MAKE_REPRO003"));
  EXPECT_TRUE(has_rule(issues_of("HOST := $(shell hostname)\n"), "MAKE_REPRO004"));
  EXPECT_TRUE(has_rule(issues_of("info:\n\tgit log -1 --format=%cd > when\n"), "MAKE_REPRO005"));
  EXPECT_TRUE(has_rule(issues_of("tmp:\n\tmktemp -d\n"), "MAKE_REPRO006"));
}

TEST(MakeRulesTest, UnpinnedInstalls) {
  EXPECT_TRUE(has_rule(issues_of("deps:\n\tpip install requests\n"), "MAKE_REPRO007"));
  EXPECT_FALSE(has_rule(issues_of("deps:\n\tpip install requests==2.31.0\n"), "MAKE_REPRO007"));
  EXPECT_FALSE(has_rule(issues_of("deps:\n\tpip install -r requirements.txt\n"), "MAKE_REPRO007"));
  EXPECT_TRUE(has_rule(issues_of("deps:\n\tnpm install left-pad\n"), "MAKE_REPRO007"));
  EXPECT_TRUE(has_rule(issues_of("deps:\n\tgo install example.com/tool@latest\n"), "MAKE_REPRO007"));
}

TEST(MakeRulesTest, Performance) {
  auto recursive_shell = issues_of("REV = $(shell git rev-parse HEAD)\n");
  EXPECT_TRUE(has_rule(recursive_shell, "MAKE_PERF001"));

  EXPECT_TRUE(has_rule(issues_of("CC = gcc\n"), "MAKE_PERF002"));
  EXPECT_FALSE(has_rule(issues_of("CFLAGS = $(BASE) -O2\n"), "MAKE_PERF002"));

  EXPECT_TRUE(has_rule(issues_of("many:\n\tone\n\ttwo\n\tthree\n"), "MAKE_PERF003"));
  EXPECT_FALSE(has_rule(issues_of("many:\n\tone && two\n\tthree\n\tfour\n"), "MAKE_PERF003"));
  EXPECT_TRUE(has_rule(issues_of("clean:\n\trm -f a\n\trm -f b\n"), "MAKE_PERF004"));
}

TEST(MakeRulesTest, ExplicitObjectRules) {
  auto issues = issues_of("a.o: a.c\n\tcc -c a.c\nb.o: b.c\n\tcc -c b.c\nc.o: c.c\n\tcc -c c.c\n");
  EXPECT_TRUE(has_rule(issues, "MAKE_PERF005"));
  EXPECT_TRUE(has_rule(issues, "MAKE_PERF006"));
}

TEST(MakeRulesTest, ErrorHandling) {
  auto ignored = issues_of("dirs:\n\t-mkdir build\n");
  EXPECT_TRUE(has_rule(ignored, "MAKE_ERR001"));
  EXPECT_TRUE(has_rule(ignored, "MAKE_ERR006"));
  EXPECT_FALSE(has_rule(issues_of("clean:\n\t-rm -f app\n"), "MAKE_ERR001"));

  EXPECT_TRUE(has_rule(issues_of("app:\n\t@cc -o app main.c\n"), "MAKE_ERR002"));
  EXPECT_FALSE(has_rule(issues_of("app:\n\t@echo building\n"), "MAKE_ERR002"));

  EXPECT_TRUE(has_rule(issues_of("build:\n\tcd src\n\tmake\n"), "MAKE_ERR003"));
  EXPECT_FALSE(has_rule(issues_of("build:\n\tcd src && make\n\ttrue\n"), "MAKE_ERR003"));

  EXPECT_TRUE(has_rule(issues_of("run:\n\tbash -c 'a; b'\n"), "MAKE_ERR004"));
  EXPECT_TRUE(has_rule(issues_of("each:\n\tfor d in a b; do make -C $$d; done\n"), "MAKE_ERR005"));
  EXPECT_FALSE(has_rule(issues_of("each:\n\tfor d in a b; do make -C $$d || exit 1; done\n"), "MAKE_ERR005"));
}

TEST(MakeRulesTest, Portability) {
  EXPECT_TRUE(has_rule(issues_of("t:\n\t[[ -f x ]] && echo y\n"), "MAKE_PORT001"));
  EXPECT_TRUE(has_rule(issues_of("t:\n\tuname -s\n"), "MAKE_PORT002"));
  EXPECT_TRUE(has_rule(issues_of("t:\n\tsource env.sh\n"), "MAKE_PORT003"));
  EXPECT_TRUE(has_rule(issues_of("t:\n\tls --color\n"), "MAKE_PORT004"));
  EXPECT_TRUE(has_rule(issues_of("t:\n\techo -n x\n"), "MAKE_PORT005"));
  EXPECT_TRUE(has_rule(issues_of("t:\n\tsed -i s/a/b/ file\n"), "MAKE_PORT006"));
}

TEST(MakeRulesTest, RulesInsideConditionalsAreChecked) {
  auto issues = issues_of("ifdef DEBUG\nFLAGS := $(wildcard *.dbg)\nendif\n");
  EXPECT_TRUE(has_rule(issues, "NO_WILDCARD"));
}

TEST(MakeRulesTest, DisabledCategory) {
  AnalyzerConfig config;
  config.set(core::Category::Performance, false);
  auto issues = analyze(parse_makefile_ok("CC = gcc\n"), config);
  EXPECT_FALSE(has_rule(issues, "MAKE_PERF002"));
}

} // namespace shpure::analysis::test
