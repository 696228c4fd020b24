#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shpure/Codegen.hpp"
#include "shpure/Printer.hpp"
#include "test_utils.h"

namespace shpure::codegen::test {

using shpure::test::parse_dockerfile_ok;
using shpure::test::parse_makefile_ok;
using shpure::test::parse_ok;

class ShellCodegenTest : public ::testing::Test {
protected:
  static auto rendered(std::string_view src, config::FormatOptions const& options = {}) -> std::string {
    return render(parse_ok(src), options);
  }

  static void expectRoundTrip(std::string_view src) {
    auto script = parse_ok(src);
    auto text   = render(script);
    auto again  = shell::parse(text);
    ASSERT_TRUE(again.has_value()) << again.error().to_string() << "\n" << text;
    EXPECT_TRUE(shell::structurally_equal(script, *again)) << "input:\n" << src << "\noutput:\n" << text;
    EXPECT_EQ(render(*again), text) << "output is not a fixed point";
  }
};

TEST_F(ShellCodegenTest, RoundTrips) {
  expectRoundTrip("if a; then b; elif c; then d; else e; fi");
  expectRoundTrip("for f in *.txt; do wc -l \"$f\"; done");
  expectRoundTrip("for x; do echo \"$x\"; done");
  expectRoundTrip("while read -r line; do echo \"$line\"; done < input.txt");
  expectRoundTrip("until false; do break; done");
  expectRoundTrip("case $1 in start|run) go ;; stop) halt ;& *) echo \"usage: $0\" ;; esac");
  expectRoundTrip("greet() { echo \"hello, $1\"; }\ngreet world\n");
  expectRoundTrip("a | b && c || d");
  expectRoundTrip("! grep -q x file");
  expectRoundTrip("sleep 10 &\nwait\n");
  expectRoundTrip("x=$(date +%s)\ny=`hostname`\n");
  expectRoundTrip("n=$(( (a + b) * c - d / 2 ))");
  expectRoundTrip("{ echo a; echo b; } > out.txt 2>&1");
  expectRoundTrip("( cd sub && make )");
  expectRoundTrip("cat <<EOF\nhello $name\nEOF\n");
  expectRoundTrip("cat <<-'END'\n\tliteral $x\n\tEND\n");
  expectRoundTrip("echo \"${HOME:-/root}\" \"${#list}\" \"${file%.txt}\"");
  expectRoundTrip("export PATH=\"$HOME/bin:$PATH\"");
  expectRoundTrip("[ -f a ] && [ \"$x\" = y ]");
  expectRoundTrip("[[ -n $x && ( -f a || -d b ) ]]");
  expectRoundTrip("for ((i = 0; i < 3; i++)); do echo \"$i\"; done");
  expectRoundTrip("arr=(one 'two three')\necho \"${arr[1]}\"");
  expectRoundTrip("echo 'it'\\''s' \"a \\\"quoted\\\" word\"");
  expectRoundTrip("exec 3<> /dev/tcp/host/80");
}

TEST_F(ShellCodegenTest, CanonicalLayout) {
  EXPECT_EQ(rendered("if true; then echo y; fi"), "if true; then\n    echo y\nfi\n");
  EXPECT_EQ(rendered("f() { echo hi; }"), "f() {\n    echo hi\n}\n");
  EXPECT_EQ(
      rendered("case $x in a|b) echo ab ;; *) echo other ;; esac"),
      "case $x in\n    a|b)\n        echo ab\n        ;;\n    *)\n        echo other\n        ;;\nesac\n"
  );
  EXPECT_EQ(rendered("while true\ndo\n  sleep 1\ndone"), "while true; do\n    sleep 1\ndone\n");
}

TEST_F(ShellCodegenTest, BlankLines) {
  EXPECT_EQ(rendered("a\n\n\nb\n"), "a\nb\n");

  config::FormatOptions keep;
  keep.preserve_formatting_ = true;
  EXPECT_EQ(rendered("a\n\n\nb\n", keep), "a\n\n\nb\n");

  config::FormatOptions skip;
  skip.skip_blank_line_removal_ = true;
  EXPECT_EQ(rendered("a\n\nb\n", skip), "a\n\nb\n");
}

TEST_F(ShellCodegenTest, Comments) {
  EXPECT_EQ(rendered("#!/bin/sh\n# setup\necho hi # greet\n"), "#!/bin/sh\n# setup\necho hi # greet\n");
}

TEST_F(ShellCodegenTest, HereDocumentBodyFollowsTheLine) {
  EXPECT_EQ(rendered("cat <<EOF | sort\nb\na\nEOF\n"), "cat <<EOF | sort\nb\na\nEOF\n");
}

TEST_F(ShellCodegenTest, Arithmetic) {
  EXPECT_EQ(rendered("x=$(( (1 + 2) * 3 ))"), "x=$(((1 + 2) * 3))\n");
  EXPECT_EQ(rendered("y=$((a - (b - c)))"), "y=$((a - (b - c)))\n");
  EXPECT_EQ(rendered("z=$((2 ** 3 ** 2))"), "z=$((2 ** 3 ** 2))\n");
}

TEST_F(ShellCodegenTest, SubshellInsideSubstitution) {
  EXPECT_EQ(rendered("x=$( (cd d; pwd) )"), "x=$( ( cd d; pwd ) )\n");
}

TEST_F(ShellCodegenTest, ReservedWordsAsCommandNamesAreQuoted) {
  EXPECT_EQ(rendered("'if' x"), "'if' x\n");
  EXPECT_EQ(rendered("'{' x"), "'{' x\n");
}

TEST_F(ShellCodegenTest, ReservedWordsAsArgumentsAreQuoted) {
  EXPECT_EQ(rendered("echo if then done"), "echo 'if' 'then' 'done'\n");
  EXPECT_EQ(rendered("printf '%s\\n' in esac"), "printf '%s\\n' 'in' 'esac'\n");
  expectRoundTrip("echo if then done");
  expectRoundTrip("test ! -f x");
}

TEST_F(ShellCodegenTest, KeywordFragmentsStayBare) {
  EXPECT_EQ(rendered("echo if$y"), "echo if$y\n");
}

TEST_F(ShellCodegenTest, SelectIsLowered) {
  auto text = rendered("select opt in a b; do echo \"$opt\"; break; done");
  EXPECT_EQ(text.find("select"), std::string::npos) << text;
  EXPECT_NE(text.find("while true; do"), std::string::npos) << text;
  EXPECT_NE(text.find("read -r REPLY || break"), std::string::npos) << text;
  EXPECT_TRUE(shell::parse(text).has_value()) << text;
}

TEST_F(ShellCodegenTest, LongCommandsAreWrapped) {
  config::FormatOptions options;
  options.max_line_length_ = 20;
  EXPECT_EQ(
      rendered("echo aaaaaaaaaa bbbbbbbbbb cccccccccc", options),
      "echo aaaaaaaaaa \\\n    bbbbbbbbbb \\\n    cccccccccc\n"
  );
}

TEST(QuoteTest, Literals) {
  EXPECT_EQ(quote(""), "''");
  EXPECT_EQ(quote("plain-word_1.txt"), "plain-word_1.txt");
  EXPECT_EQ(quote("a b"), "'a b'");
  EXPECT_EQ(quote("$HOME"), "'$HOME'");
  EXPECT_EQ(quote("it's"), "'it'\\''s'");
}

TEST(QuoteTest, RenderWord) {
  auto script = parse_ok("echo \"$a\"b 'c d'");
  auto const* cmd = script.statements_.at(0).getIf<shell::Command>();
  ASSERT_NE(cmd, nullptr);
  EXPECT_EQ(render_word(cmd->words_[1]), "\"$a\"b");
  EXPECT_EQ(render_word(cmd->words_[2]), "'c d'");
}

TEST(WrapLineTest, SplitsAtSpacesOutsideQuotes) {
  EXPECT_EQ(wrap_line("a b c", 3, "\t"), "a b \\\n\tc");
  EXPECT_EQ(wrap_line("x 'a b c d' y", 5, "  "), "x \\\n  'a b c d' \\\n  y");
  EXPECT_EQ(wrap_line("short", 80, "\t"), "short");
}

TEST(MakeCodegenTest, RoundTripsAsWritten) {
  std::string const src = R"(# build
CC := gcc
CFLAGS ?= -O2
LIBS += -lm
export PREFIX = /usr/local

ifeq ($(OS),Windows_NT)
EXE = .exe
else ifdef CROSS
EXE = .bin
else
EXE =
endif

include common.mk
-include local.mk

.PHONY: all
all: app$(EXE)

%.o: %.c
	$(CC) $(CFLAGS) -c $< -o $@

app$(EXE): main.o
	@echo linking
	$(CC) -o $@ $^ $(LIBS)
)";
  config::FormatOptions keep;
  keep.preserve_formatting_ = true;
  EXPECT_EQ(render(parse_makefile_ok(src), keep), src);
}

TEST(MakeCodegenTest, ContinuationsAreJoined) {
  auto makefile = parse_makefile_ok("SRCS = a.c \\\n       b.c\n");
  EXPECT_EQ(render(makefile), "SRCS = a.c b.c\n");

  config::FormatOptions keep;
  keep.skip_consolidation_ = true;
  EXPECT_NE(render(makefile, keep).find(" \\\n"), std::string::npos);
}

TEST(MakeCodegenTest, DefineBlocks) {
  auto makefile = parse_makefile_ok("define BANNER\nline one\nline two\nendef\n");
  EXPECT_EQ(render(makefile), "define BANNER\nline one\nline two\nendef\n");
}

TEST(MakeCodegenTest, BlankLinesAreDroppedByDefault) {
  EXPECT_EQ(render(parse_makefile_ok("A = 1\n\n\nB = 2\n")), "A = 1\nB = 2\n");
}

TEST(DockerCodegenTest, Continuations) {
  auto dockerfile = parse_dockerfile_ok("RUN apt-get update && \\\n    apt-get install -y curl \\\n    git\n");
  EXPECT_EQ(render(dockerfile), "RUN apt-get update && apt-get install -y curl git\n");

  config::FormatOptions keep;
  keep.preserve_formatting_ = true;
  EXPECT_EQ(render(dockerfile, keep), "RUN apt-get update && \\\n    apt-get install -y curl \\\n    git\n");
}

TEST(DockerCodegenTest, CommentsAndHereDocuments) {
  std::string const src = "# syntax=docker/dockerfile:1\nFROM alpine:3.19\nRUN <<EOF\napk add curl\nEOF\n";
  EXPECT_EQ(render(parse_dockerfile_ok(src)), src);
}

TEST(DockerCodegenTest, LongInstructionsAreWrapped) {
  config::FormatOptions options;
  options.max_line_length_ = 24;
  auto dockerfile          = parse_dockerfile_ok("RUN apt-get update && apt-get upgrade\n");
  EXPECT_EQ(render(dockerfile, options), "RUN apt-get update && \\\n    apt-get upgrade\n");
}

} // namespace shpure::codegen::test
