#include <string>

#include <gtest/gtest.h>

#include "shpure/Printer.hpp"
#include "test_utils.h"

namespace shpure::shell::test {

using shpure::test::parse_ok;

TEST(PrinterTest, SimpleCommand) {
  ASTPrinter printer;
  EXPECT_EQ(printer.print(parse_ok("echo hi")), "Script:\n  Command:\n    Literal \"echo\"\n    Literal \"hi\"\n");
}

TEST(PrinterTest, ArithmeticIsPrefixNotation) {
  ASTPrinter printer;
  auto       text = printer.print(parse_ok("y=$((x + 2 * 3))"));
  EXPECT_NE(text.find("Arithmetic (+ x (* 2 3))"), std::string::npos) << text;
}

TEST(PrinterTest, QuotedVariable) {
  ASTPrinter printer;
  auto       text = printer.print(parse_ok("echo \"$name\""));
  EXPECT_NE(text.find("Variable name (quoted)"), std::string::npos) << text;
}

TEST(PrinterTest, HereDocument) {
  ASTPrinter printer;
  auto       text = printer.print(parse_ok("cat <<'EOF'\nbody\nEOF\n"));
  EXPECT_NE(text.find("HereDoc <<EOF \"body\n\" (quoted):"), std::string::npos) << text;
}

TEST(PrinterTest, PrinterIsReusable) {
  ASTPrinter printer;
  auto       first = printer.print(parse_ok("echo a"));
  auto       again = printer.print(parse_ok("echo a"));
  EXPECT_EQ(first, again);
}

TEST(StructurallyEqualTest, IgnoresLayout) {
  auto compact = parse_ok("if true; then echo y; fi");
  auto spread  = parse_ok("\n\nif true\nthen\n    echo y\nfi\n");
  EXPECT_TRUE(structurally_equal(compact, spread));
}

TEST(StructurallyEqualTest, QuotingStyleDoesNotMatter) {
  EXPECT_TRUE(structurally_equal(parse_ok("echo 'a b'"), parse_ok("echo \"a b\"")));
  EXPECT_TRUE(structurally_equal(parse_ok("echo abc"), parse_ok("echo 'abc'")));
}

TEST(StructurallyEqualTest, DetectsDifferences) {
  EXPECT_FALSE(structurally_equal(parse_ok("echo a"), parse_ok("echo b")));
  EXPECT_FALSE(structurally_equal(parse_ok("a && b"), parse_ok("a || b")));
  EXPECT_FALSE(structurally_equal(parse_ok("echo $x"), parse_ok("echo \"$x\"")));
  EXPECT_FALSE(structurally_equal(parse_ok("mkdir d"), parse_ok("mkdir -p d")));
}

TEST(StructurallyEqualTest, CloneIsEqual) {
  auto script = parse_ok("for f in *.txt; do\n  wc -l \"$f\" > \"$f.count\"\ndone\n");
  EXPECT_TRUE(structurally_equal(script, script.clone()));
}

} // namespace shpure::shell::test
