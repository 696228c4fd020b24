#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shpure/Analyzer.hpp"
#include "test_utils.h"

namespace shpure::analysis::test {

using shpure::test::count_rule;
using shpure::test::has_rule;
using shpure::test::parse_ok;

namespace {

AnalyzerConfig type_checking() {
  AnalyzerConfig config;
  config.type_check_ = true;
  return config;
}

AnalyzerConfig guarding() {
  AnalyzerConfig config;
  config.emit_guards_ = true;
  return config;
}

} // namespace

TEST(TypeAnnotationTest, CommentsAndDeclarations) {
  auto script = parse_ok("# @type port: int\n# @type dir: path\n# @type x: float\ndeclare -i count=0\nlocal name\n");
  auto found  = type_annotations(script);
  ASSERT_EQ(found.size(), 3);
  EXPECT_EQ(found[0].name_, "port");
  EXPECT_EQ(found[0].type_, "int");
  EXPECT_EQ(found[1].type_, "path");
  EXPECT_EQ(found[2].name_, "count");
  EXPECT_EQ(found[2].type_, "int");
  EXPECT_EQ(found[2].span_.start_line_, 4);
}

TEST(TypeAnnotationTest, LongTypeNames) {
  auto found = type_annotations(parse_ok("# @type n: integer\n# @type s: string\n"));
  ASSERT_EQ(found.size(), 2);
  EXPECT_EQ(found[0].type_, "int");
  EXPECT_EQ(found[1].type_, "str");
}

TEST(TypeRulesTest, OffUnlessRequested) {
  auto issues = analyze(parse_ok("# @type port: int\nport=abc\n"));
  EXPECT_FALSE(has_rule(issues, "TYPE001"));
  EXPECT_FALSE(has_rule(issues, "TYPE003"));
}

TEST(TypeRulesTest, IntegerAssignedText) {
  auto issues = analyze(parse_ok("# @type port: int\nport=abc\nport=8080\n"), type_checking());
  ASSERT_EQ(count_rule(issues, "TYPE001"), 1);
  auto const& issue = issues.at(0);
  EXPECT_EQ(issue.rule_id_, "TYPE001");
  EXPECT_EQ(issue.message_, "port is declared int but assigned 'abc'");
  EXPECT_EQ(issue.severity_, core::Severity::Medium);
  EXPECT_EQ(issue.span_.start_line_, 2);
}

TEST(TypeRulesTest, DeclareMakesAnInteger) {
  auto issues = analyze(parse_ok("declare -i count\ncount=many\n"), type_checking());
  EXPECT_TRUE(has_rule(issues, "TYPE001"));
}

TEST(TypeRulesTest, AnnotationMustPrecedeTheUse) {
  auto issues = analyze(parse_ok("port=abc\n# @type port: int\n"), type_checking());
  EXPECT_FALSE(has_rule(issues, "TYPE001"));
}

TEST(TypeRulesTest, ExpansionsAreNotChecked) {
  auto issues = analyze(parse_ok("# @type port: int\nport=$1\n"), type_checking());
  EXPECT_FALSE(has_rule(issues, "TYPE001"));
}

TEST(TypeRulesTest, StringInArithmetic) {
  auto issues = analyze(parse_ok("# @type name: str\ny=$((name + 1))\n"), type_checking());
  ASSERT_TRUE(has_rule(issues, "TYPE002"));
  EXPECT_FALSE(has_rule(analyze(parse_ok("# @type n: int\ny=$((n + 1))\n"), type_checking()), "TYPE002"));
}

TEST(TypeRulesTest, StrictRaisesSeverity) {
  auto config         = type_checking();
  config.type_strict_ = true;
  auto issues         = analyze(parse_ok("# @type port: int\nport=abc\n"), config);
  ASSERT_TRUE(has_rule(issues, "TYPE001"));
  EXPECT_EQ(issues.at(0).severity_, core::Severity::High);
}

TEST(TypeRulesTest, MissingGuard) {
  auto issues = analyze(parse_ok("# @type port: int\nport=8080\n"), guarding());
  ASSERT_EQ(count_rule(issues, "TYPE003"), 1);
  EXPECT_NE(issues.at(0).message_.find("never checked"), std::string::npos);
}

TEST(TypeRulesTest, ExistingGuardIsAccepted) {
  auto issues = analyze(
      parse_ok("# @type port: int\nport=8080\ncase \"$port\" in\n  ''|*[!0-9]*) exit 1 ;;\nesac\n"), guarding()
  );
  EXPECT_FALSE(has_rule(issues, "TYPE003"));
}

} // namespace shpure::analysis::test
