#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "shpure/AST.hpp"
#include "shpure/Parser.hpp"
#include "test_utils.h"

namespace shpure::shell::test {

using shpure::test::parse_ok;

class ParserTest : public ::testing::Test {
protected:
  // The only statement of a one-statement script
  static auto single(Script const& script) -> Stmt const& {
    EXPECT_EQ(script.statements_.size(), 1);
    return script.statements_.front();
  }

  static auto literal(Expr const& expr) -> std::string {
    auto value = literal_value(expr);
    return value ? std::string{*value} : std::string{"<not a literal>"};
  }
};

TEST_F(ParserTest, EmptyScript) {
  auto script = parse_ok("");
  EXPECT_TRUE(script.statements_.empty());
  script = parse_ok("\n\n   \n");
  EXPECT_TRUE(script.statements_.empty());
}

TEST_F(ParserTest, SimpleCommand) {
  auto        script = parse_ok("echo hello world");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  ASSERT_EQ(cmd->words_.size(), 3);
  EXPECT_EQ(command_name(*cmd), "echo");
  EXPECT_EQ(literal(cmd->words_[2]), "world");
}

TEST_F(ParserTest, QuotingProducesLiterals) {
  auto        script = parse_ok(R"(echo 'a b' "c d" e\ f)");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  ASSERT_EQ(cmd->words_.size(), 4);
  EXPECT_EQ(literal(cmd->words_[1]), "a b");
  EXPECT_EQ(literal(cmd->words_[2]), "c d");
  EXPECT_EQ(literal(cmd->words_[3]), "e f");
}

TEST_F(ParserTest, QuotedVariable) {
  auto        script = parse_ok(R"(echo "$name" $other)");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  auto const* quoted = cmd->words_[1].getIf<Variable>();
  auto const* bare   = cmd->words_[2].getIf<Variable>();
  ASSERT_NE(quoted, nullptr);
  ASSERT_NE(bare, nullptr);
  EXPECT_EQ(quoted->name_, "name");
  EXPECT_TRUE(quoted->quoted_);
  EXPECT_FALSE(bare->quoted_);
}

TEST_F(ParserTest, ConcatenatedWord) {
  auto        script = parse_ok(R"(cp "$src"/file.txt dest)");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  auto const* concat = cmd->words_[1].getIf<Concat>();
  ASSERT_NE(concat, nullptr);
  ASSERT_EQ(concat->parts_.size(), 2);
  EXPECT_TRUE(concat->parts_[0].is<Variable>());
  EXPECT_EQ(literal(concat->parts_[1]), "/file.txt");
}

TEST_F(ParserTest, ParameterExpansion) {
  auto        script = parse_ok("echo ${HOME:-/root} ${#list} ${file%.c}");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);

  auto const* with_default = cmd->words_[1].getIf<ParamExpansion>();
  ASSERT_NE(with_default, nullptr);
  EXPECT_EQ(with_default->name_, "HOME");
  EXPECT_EQ(with_default->op_, ParamOp::Default);
  EXPECT_EQ(with_default->word_, "/root");
  EXPECT_TRUE(with_default->colon_);

  auto const* length = cmd->words_[2].getIf<ParamExpansion>();
  ASSERT_NE(length, nullptr);
  EXPECT_EQ(length->op_, ParamOp::Length);

  auto const* suffix = cmd->words_[3].getIf<ParamExpansion>();
  ASSERT_NE(suffix, nullptr);
  EXPECT_EQ(suffix->op_, ParamOp::RemoveSuffix);
  EXPECT_EQ(suffix->word_, ".c");
}

TEST_F(ParserTest, Assignment) {
  auto        script = parse_ok("x=$RANDOM");
  auto const* assign = single(script).getIf<Assignment>();
  ASSERT_NE(assign, nullptr);
  EXPECT_EQ(assign->name_, "x");
  EXPECT_FALSE(assign->exported_);
  auto const* var = assign->value_.getIf<Variable>();
  ASSERT_NE(var, nullptr);
  EXPECT_EQ(var->name_, "RANDOM");
}

TEST_F(ParserTest, ExportAssignment) {
  auto        script = parse_ok("export PATH=/usr/bin");
  auto const* assign = single(script).getIf<Assignment>();
  ASSERT_NE(assign, nullptr);
  EXPECT_TRUE(assign->exported_);
  EXPECT_EQ(literal(assign->value_), "/usr/bin");
}

TEST_F(ParserTest, PrefixAssignment) {
  auto        script = parse_ok("LC_ALL=C sort file");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  ASSERT_EQ(cmd->prefix_.size(), 1);
  EXPECT_EQ(cmd->prefix_[0].name_, "LC_ALL");
  EXPECT_EQ(command_name(*cmd), "sort");
}

TEST_F(ParserTest, CommandSubstitution) {
  auto        script = parse_ok("now=$(date +%s)");
  auto const* assign = single(script).getIf<Assignment>();
  ASSERT_NE(assign, nullptr);
  auto const* subst = assign->value_.getIf<CommandSubst>();
  ASSERT_NE(subst, nullptr);
  ASSERT_EQ(subst->body_.size(), 1);
  auto const* inner = subst->body_[0].getIf<Command>();
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(command_name(*inner), "date");
}

TEST_F(ParserTest, BacktickIsCommandSubstitution) {
  auto        script = parse_ok("d=`pwd`");
  auto const* assign = single(script).getIf<Assignment>();
  ASSERT_NE(assign, nullptr);
  EXPECT_TRUE(assign->value_.is<CommandSubst>());
}

TEST_F(ParserTest, ArithmeticExpansion) {
  auto        script = parse_ok("y=$((x + 2 * 3))");
  auto const* assign = single(script).getIf<Assignment>();
  ASSERT_NE(assign, nullptr);
  auto const* arith = assign->value_.getIf<Arithmetic>();
  ASSERT_NE(arith, nullptr);
  ASSERT_NE(arith->expr_, nullptr);
  auto const* sum = std::get_if<ArithBinary>(&arith->expr_->node_);
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->op_, ArithOp::Add);
  EXPECT_TRUE(std::holds_alternative<ArithBinary>(sum->rhs_->node_));
}

TEST_F(ParserTest, PipelineAndList) {
  auto        script = parse_ok("a | b && c || d");
  auto const* and_or = single(script).getIf<AndOr>();
  ASSERT_NE(and_or, nullptr);
  ASSERT_EQ(and_or->items_.size(), 3);
  ASSERT_EQ(and_or->ops_.size(), 2);
  EXPECT_EQ(and_or->ops_[0], AndOrOp::And);
  EXPECT_EQ(and_or->ops_[1], AndOrOp::Or);
  auto const* pipe = and_or->items_[0].getIf<Pipeline>();
  ASSERT_NE(pipe, nullptr);
  EXPECT_EQ(pipe->commands_.size(), 2);
}

TEST_F(ParserTest, BackgroundAndNegation) {
  auto script = parse_ok("sleep 1 &\n! grep -q x f");
  ASSERT_EQ(script.statements_.size(), 2);
  EXPECT_TRUE(script.statements_[0].is<Background>());
  EXPECT_TRUE(script.statements_[1].is<Negated>());
}

TEST_F(ParserTest, IfElifElse) {
  auto script = parse_ok(R"(if [ -f a ]; then
  echo file
elif [ -d a ]; then
  echo dir
else
  echo none
fi)");
  auto const* if_stmt = single(script).getIf<If>();
  ASSERT_NE(if_stmt, nullptr);
  ASSERT_EQ(if_stmt->condition_.size(), 1);
  EXPECT_TRUE(if_stmt->condition_[0].is<ExprStmt>());
  EXPECT_EQ(if_stmt->then_.size(), 1);
  EXPECT_EQ(if_stmt->elifs_.size(), 1);
  ASSERT_TRUE(if_stmt->else_.has_value());
  EXPECT_EQ(if_stmt->else_->size(), 1);
}

TEST_F(ParserTest, TestCommand) {
  auto        script = parse_ok("[ \"$a\" = b ]");
  auto const* expr   = single(script).getIf<ExprStmt>();
  ASSERT_NE(expr, nullptr);
  auto const* test = expr->expr_.getIf<TestExpression>();
  ASSERT_NE(test, nullptr);
  EXPECT_FALSE(test->extended_);
  auto const* binary = std::get_if<TestBinary>(&test->expr_->node_);
  ASSERT_NE(binary, nullptr);
  EXPECT_EQ(binary->op_, "=");
}

TEST_F(ParserTest, ExtendedTest) {
  auto        script = parse_ok("[[ -n $x && $y == z* ]]");
  auto const* expr   = single(script).getIf<ExprStmt>();
  ASSERT_NE(expr, nullptr);
  auto const* test = expr->expr_.getIf<TestExpression>();
  ASSERT_NE(test, nullptr);
  EXPECT_TRUE(test->extended_);
  EXPECT_TRUE(std::holds_alternative<TestAnd>(test->expr_->node_));
}

TEST_F(ParserTest, WhileAndUntil) {
  auto script = parse_ok("while read -r line; do echo \"$line\"; done < input.txt\nuntil false; do :; done");
  ASSERT_EQ(script.statements_.size(), 2);
  auto const* loop = script.statements_[0].getIf<While>();
  ASSERT_NE(loop, nullptr);
  EXPECT_FALSE(loop->until_);
  ASSERT_EQ(script.statements_[0].redirects_.size(), 1);
  EXPECT_EQ(script.statements_[0].redirects_[0].kind_, RedirectKind::Input);
  auto const* until = script.statements_[1].getIf<While>();
  ASSERT_NE(until, nullptr);
  EXPECT_TRUE(until->until_);
}

TEST_F(ParserTest, ForLoops) {
  auto script = parse_ok("for i in 1 2 3; do echo $i; done\nfor arg; do echo \"$arg\"; done");
  ASSERT_EQ(script.statements_.size(), 2);
  auto const* with_items = script.statements_[0].getIf<For>();
  ASSERT_NE(with_items, nullptr);
  EXPECT_EQ(with_items->variable_, "i");
  ASSERT_TRUE(with_items->items_.has_value());
  EXPECT_EQ(with_items->items_->size(), 3);
  auto const* positional = script.statements_[1].getIf<For>();
  ASSERT_NE(positional, nullptr);
  EXPECT_FALSE(positional->items_.has_value());
}

TEST_F(ParserTest, ArithmeticForLoop) {
  auto        script = parse_ok("for ((i = 0; i < 3; i++)); do echo $i; done");
  auto const* loop   = single(script).getIf<ForArith>();
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(loop->body_.size(), 1);
}

TEST_F(ParserTest, CaseStatement) {
  auto script = parse_ok(R"(case "$1" in
  start|begin) run ;;
  stop) halt ;&
  *) usage ;;
esac)");
  auto const* case_stmt = single(script).getIf<Case>();
  ASSERT_NE(case_stmt, nullptr);
  ASSERT_EQ(case_stmt->arms_.size(), 3);
  EXPECT_EQ(case_stmt->arms_[0].patterns_.size(), 2);
  EXPECT_EQ(case_stmt->arms_[1].terminator_, CaseTerminator::FallThrough);
  EXPECT_TRUE(case_stmt->arms_[2].patterns_[0].is<Glob>());
}

TEST_F(ParserTest, Functions) {
  auto script = parse_ok("greet() {\n  echo hi\n}\nfunction bye { echo bye; }");
  ASSERT_EQ(script.statements_.size(), 2);
  auto const* greet = script.statements_[0].getIf<Function>();
  ASSERT_NE(greet, nullptr);
  EXPECT_EQ(greet->name_, "greet");
  EXPECT_EQ(greet->body_.size(), 1);
  auto const* bye = script.statements_[1].getIf<Function>();
  ASSERT_NE(bye, nullptr);
  EXPECT_EQ(bye->name_, "bye");
}

TEST_F(ParserTest, GroupsAndSubshells) {
  auto script = parse_ok("{ echo a; echo b; } > out\n( cd /tmp && ls )");
  ASSERT_EQ(script.statements_.size(), 2);
  auto const* group = script.statements_[0].getIf<BraceGroup>();
  ASSERT_NE(group, nullptr);
  EXPECT_FALSE(group->subshell_);
  EXPECT_EQ(script.statements_[0].redirects_.size(), 1);
  auto const* subshell = script.statements_[1].getIf<BraceGroup>();
  ASSERT_NE(subshell, nullptr);
  EXPECT_TRUE(subshell->subshell_);
}

TEST_F(ParserTest, ReturnAndExit) {
  auto script = parse_ok("exit 1\nreturn");
  ASSERT_EQ(script.statements_.size(), 2);
  auto const* exit_stmt = script.statements_[0].getIf<Return>();
  ASSERT_NE(exit_stmt, nullptr);
  EXPECT_TRUE(exit_stmt->exit_);
  ASSERT_TRUE(exit_stmt->code_.has_value());
  auto const* ret = script.statements_[1].getIf<Return>();
  ASSERT_NE(ret, nullptr);
  EXPECT_FALSE(ret->exit_);
}

TEST_F(ParserTest, Redirections) {
  auto        script = parse_ok("cmd > out 2>&1 &>> all.log");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  ASSERT_EQ(cmd->redirects_.size(), 3);
  EXPECT_EQ(cmd->redirects_[0].kind_, RedirectKind::Output);
  EXPECT_EQ(cmd->redirects_[1].kind_, RedirectKind::DupOutput);
  EXPECT_EQ(cmd->redirects_[1].fd_, 2);
  EXPECT_EQ(cmd->redirects_[2].kind_, RedirectKind::AppendAll);
}

TEST_F(ParserTest, HereDocument) {
  auto        script = parse_ok("cat <<EOF\nhello $x\nEOF\n");
  auto const* cmd    = single(script).getIf<Command>();
  ASSERT_NE(cmd, nullptr);
  ASSERT_EQ(cmd->redirects_.size(), 1);
  auto const& doc = cmd->redirects_[0];
  EXPECT_EQ(doc.kind_, RedirectKind::HereDoc);
  EXPECT_EQ(doc.delimiter_, "EOF");
  EXPECT_EQ(doc.body_, "hello $x\n");
  EXPECT_FALSE(doc.quoted_);
}

TEST_F(ParserTest, CommentsAreStatements) {
  auto script = parse_ok("#!/bin/sh\n# setup\necho a # inline\n");
  ASSERT_EQ(script.statements_.size(), 4);
  auto const* shebang = script.statements_[0].getIf<Comment>();
  ASSERT_NE(shebang, nullptr);
  EXPECT_EQ(shebang->text_, "!/bin/sh");
  EXPECT_TRUE(script.statements_[3].is<Comment>());
}

TEST_F(ParserTest, BlankLinesAreCounted) {
  auto script = parse_ok("echo a\n\n\necho b\n");
  ASSERT_EQ(script.statements_.size(), 2);
  EXPECT_EQ(script.statements_[0].blank_before_, 0);
  EXPECT_EQ(script.statements_[1].blank_before_, 2);
}

TEST_F(ParserTest, SpansAreOneBased) {
  auto script = parse_ok("echo a\n  mkdir b\n");
  ASSERT_EQ(script.statements_.size(), 2);
  EXPECT_EQ(script.statements_[1].span_.start_line_, 2);
  EXPECT_EQ(script.statements_[1].span_.start_col_, 3);
}

TEST_F(ParserTest, Metadata) {
  auto script = parse("echo a\necho b\n", "build.sh");
  ASSERT_TRUE(script.has_value());
  EXPECT_EQ(script->metadata_.source_file_, "build.sh");
  EXPECT_EQ(script->metadata_.line_count_, 2);
}

TEST_F(ParserTest, MissingEsacIsAnError) {
  auto script = parse("case x in\n  a) echo a ;;\n");
  ASSERT_FALSE(script.has_value());
  EXPECT_GT(script.error().line(), 0);
}

TEST_F(ParserTest, MissingFiIsAnError) {
  EXPECT_FALSE(parse("if true; then echo x").has_value());
}

TEST_F(ParserTest, StrayKeywordIsAnError) {
  auto script = parse("echo a\ndone\n");
  ASSERT_FALSE(script.has_value());
  EXPECT_EQ(script.error().line(), 2);
}

TEST_F(ParserTest, DeepNestingIsRejected) {
  std::string src;
  for (int i = 0; i < 300; ++i) {
    src += "{ ";
  }
  src += "echo deep; ";
  for (int i = 0; i < 300; ++i) {
    src += "}; ";
  }
  auto script = parse(src);
  ASSERT_FALSE(script.has_value());
  EXPECT_NE(script.error().message().find("nesting"), std::string::npos);
}

TEST_F(ParserTest, DeepArithmeticIsRejected) {
  auto nesting_error = [](std::string const& src) {
    auto script = parse(src);
    ASSERT_FALSE(script.has_value()) << src.substr(0, 40);
    EXPECT_NE(script.error().message().find("nesting"), std::string::npos) << script.error().message();
    EXPECT_EQ(script.error().line(), 1);
  };

  nesting_error("x=$((" + std::string(1000, '-') + "1))\n");
  nesting_error("x=$((" + std::string(1000, '(') + "1" + std::string(1000, ')') + "))\n");
  nesting_error("((" + std::string(1000, '!') + "x))\n");

  std::string chain = "x=$((a";
  for (int i = 0; i < 1000; ++i) {
    chain += " = a";
  }
  nesting_error(chain + "))\n");

  std::string subst = "echo ";
  for (int i = 0; i < 1000; ++i) {
    subst += "$(echo ";
  }
  nesting_error(subst + std::string(1000, ')') + "\n");

  EXPECT_TRUE(parse("x=$((" + std::string(50, '(') + "1" + std::string(50, ')') + "))\n").has_value());
}

TEST_F(ParserTest, DeepTestExpressionIsRejected) {
  std::string negated = "[[";
  for (int i = 0; i < 1000; ++i) {
    negated += " !";
  }
  auto script = parse(negated + " a ]]\n");
  ASSERT_FALSE(script.has_value());
  EXPECT_NE(script.error().message().find("nesting"), std::string::npos);

  std::string grouped = "[[";
  for (int i = 0; i < 1000; ++i) {
    grouped += " (";
  }
  grouped += " a";
  for (int i = 0; i < 1000; ++i) {
    grouped += " )";
  }
  script = parse(grouped + " ]]\n");
  ASSERT_FALSE(script.has_value());
  EXPECT_NE(script.error().message().find("nesting"), std::string::npos);

  EXPECT_TRUE(parse("[[ ! ( ! ( a ) ) ]]\n").has_value());
}

TEST_F(ParserTest, CountStatements) {
  auto script = parse_ok("if true; then\n  echo a\n  echo b\nfi\necho c\n");
  EXPECT_EQ(count_statements(script), 5);
}

TEST_F(ParserTest, ReservedAndAssignmentWords) {
  EXPECT_TRUE(is_reserved_word("esac"));
  EXPECT_FALSE(is_reserved_word("echo"));
  EXPECT_TRUE(is_assignment_word("a=1"));
  EXPECT_TRUE(is_assignment_word("a+=x"));
  EXPECT_TRUE(is_assignment_word("arr[2]=x"));
  EXPECT_FALSE(is_assignment_word("=x"));
  EXPECT_FALSE(is_assignment_word("1a=x"));
}

} // namespace shpure::shell::test
