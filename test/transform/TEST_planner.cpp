#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shpure/Analyzer.hpp"
#include "shpure/Transform.hpp"
#include "test_utils.h"

namespace shpure::transform::test {

using shpure::test::parse_dockerfile_ok;
using shpure::test::parse_makefile_ok;
using shpure::test::parse_ok;

namespace {

auto plan_shell(std::string_view src, PlanOptions const& options = {}, analysis::AnalyzerConfig const& config = {})
    -> std::vector<Transformation> {
  auto script = parse_ok(src);
  return plan(script, analysis::analyze(script, config), options);
}

auto find(std::vector<Transformation> const& plan, std::string_view rule_id) -> Transformation const* {
  for (auto const& t : plan) {
    if (t.rule_id_ == rule_id) {
      return &t;
    }
  }
  return nullptr;
}

} // namespace

TEST(ShellPlannerTest, MkdirGetsParents) {
  auto        transformations = plan_shell("mkdir /tmp/dir");
  auto const* t               = find(transformations, "IDEM001");
  ASSERT_NE(t, nullptr);
  auto const* flag = t->getIf<AddFlag>();
  ASSERT_NE(flag, nullptr);
  EXPECT_EQ(flag->command_, "mkdir");
  EXPECT_EQ(flag->flag_, 'p');
  EXPECT_TRUE(t->safe_);
  EXPECT_EQ(t->suggestion_, "use mkdir -p");
  EXPECT_EQ(kind_name(*t), "add-flag");
}

TEST(ShellPlannerTest, RandomIsOnlyAdvised) {
  auto transformations = plan_shell("x=$RANDOM");
  ASSERT_EQ(transformations.size(), 1);
  EXPECT_TRUE(transformations[0].is<Advisory>());
  EXPECT_FALSE(transformations[0].safe_);
  EXPECT_FALSE(transformations[0].applied());
  EXPECT_EQ(kind_name(transformations[0]), "advisory");
}

TEST(ShellPlannerTest, SideEffectsAreNotPlanned) {
  EXPECT_TRUE(plan_shell("apt-get install -y curl").empty());
}

TEST(ShellPlannerTest, QuoteNamesTheExpansion) {
  auto        transformations = plan_shell("echo $name");
  auto const* t               = find(transformations, "SEC002");
  ASSERT_NE(t, nullptr);
  ASSERT_TRUE(t->is<QuoteExpansion>());
  EXPECT_EQ(t->getIf<QuoteExpansion>()->name_, "name");
}

TEST(ShellPlannerTest, CombinedRedirects) {
  auto        transformations = plan_shell("make &>> build.log");
  auto const* t               = find(transformations, "PORT002");
  ASSERT_NE(t, nullptr);
  ASSERT_TRUE(t->is<SplitCombinedRedirect>());
  EXPECT_TRUE(t->getIf<SplitCombinedRedirect>()->append_);
}

TEST(ShellPlannerTest, SourceBecomesDot) {
  auto const* t = find(plan_shell("source ./env.sh"), "PORT003");
  ASSERT_NE(t, nullptr);
  ASSERT_TRUE(t->is<RenameCommand>());
  EXPECT_EQ(t->getIf<RenameCommand>()->to_, ".");
}

TEST(ShellPlannerTest, ShebangOnlyWhenNothingNeedsBash) {
  auto plain = plan_shell("#!/bin/bash\necho hi\n");
  ASSERT_NE(find(plain, "PORT006"), nullptr);
  EXPECT_TRUE(find(plain, "PORT006")->is<RewriteShebang>());

  auto        bashy = plan_shell("#!/bin/bash\n[[ -n \"$x\" ]] && echo y\n");
  auto const* t     = find(bashy, "PORT006");
  ASSERT_NE(t, nullptr);
  EXPECT_TRUE(t->is<Advisory>());
  EXPECT_NE(t->description_.find("still uses [[ ]]"), std::string::npos) << t->description_;
}

TEST(ShellPlannerTest, GuardsNeedTheOption) {
  analysis::AnalyzerConfig config;
  config.emit_guards_ = true;
  auto src            = "# @type port: int\nport=8080\n";

  auto advised = plan_shell(src, PlanOptions{false}, config);
  ASSERT_NE(find(advised, "TYPE003"), nullptr);
  EXPECT_TRUE(find(advised, "TYPE003")->is<Advisory>());

  auto guarded = plan_shell(src, PlanOptions{true}, config);
  ASSERT_NE(find(guarded, "TYPE003"), nullptr);
  auto const* guard = find(guarded, "TYPE003")->getIf<InsertGuard>();
  ASSERT_NE(guard, nullptr);
  EXPECT_EQ(guard->name_, "port");
  EXPECT_EQ(guard->type_, "int");
}

TEST(ShellPlannerTest, OrderedBySpanThenRule) {
  auto transformations = plan_shell("mkdir $dir\nrm $file\n");
  ASSERT_GE(transformations.size(), 4);
  for (size_t i = 1; i < transformations.size(); ++i) {
    auto const& prev = transformations[i - 1];
    auto const& cur  = transformations[i];
    EXPECT_TRUE(prev.span_ < cur.span_ || (prev.span_ == cur.span_ && prev.rule_id_ <= cur.rule_id_));
  }
}

TEST(ShellPlannerTest, PlanningIsDeterministic) {
  auto src   = "mkdir $a\nln -s $b c\necho $RANDOM >> log\n";
  auto first = plan_shell(src);
  auto again = plan_shell(src);
  ASSERT_EQ(first.size(), again.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].rule_id_, again[i].rule_id_);
    EXPECT_EQ(first[i].span_, again[i].span_);
    EXPECT_EQ(first[i].kind_.index(), again[i].kind_.index());
  }
}

TEST(MakePlannerTest, WildcardAndPhony) {
  auto makefile        = parse_makefile_ok("FILES := $(wildcard *.c)\nall: app\n");
  auto transformations = plan(makefile, analysis::analyze(makefile));

  auto const* sort = find(transformations, "NO_WILDCARD");
  ASSERT_NE(sort, nullptr);
  ASSERT_TRUE(sort->is<WrapWithSort>());
  EXPECT_EQ(sort->getIf<WrapWithSort>()->variable_, "FILES");
  EXPECT_EQ(sort->getIf<WrapWithSort>()->pattern_, "$(wildcard");

  auto const* phony = find(transformations, "AUTO_PHONY");
  ASSERT_NE(phony, nullptr);
  ASSERT_TRUE(phony->is<AddPhony>());
  EXPECT_EQ(phony->getIf<AddPhony>()->target_, "all");
}

TEST(MakePlannerTest, RuleFamiliesAreAdvisories) {
  auto makefile        = parse_makefile_ok("deps:\n\tpip install requests\n");
  auto transformations = plan(makefile, analysis::analyze(makefile));
  auto const* t        = find(transformations, "MAKE_REPRO007");
  ASSERT_NE(t, nullptr);
  EXPECT_TRUE(t->is<Advisory>());
  EXPECT_EQ(t->category_, core::Category::Reproducibility);
}

TEST(DockerPlannerTest, KnownImagesArePinned) {
  auto dockerfile      = parse_dockerfile_ok("FROM ubuntu\nRUN apt-get install -y curl\n");
  auto transformations = plan(dockerfile, analysis::analyze(dockerfile));

  auto const* pin = find(transformations, "DOCKER002");
  ASSERT_NE(pin, nullptr);
  ASSERT_TRUE(pin->is<PinBaseImage>());
  EXPECT_EQ(pin->getIf<PinBaseImage>()->tag_, "22.04");

  EXPECT_TRUE(find(transformations, "DOCKER001")->is<Advisory>());
  EXPECT_TRUE(find(transformations, "DOCKER003")->is<CleanPackageCache>());
  EXPECT_TRUE(find(transformations, "DOCKER005")->is<AddNoInstallRecommends>());
}

TEST(DockerPlannerTest, UnknownImagesAreAdvised) {
  auto        dockerfile      = parse_dockerfile_ok("FROM example/tool\nUSER app\n");
  auto        transformations = plan(dockerfile, analysis::analyze(dockerfile));
  auto const* t               = find(transformations, "DOCKER002");
  ASSERT_NE(t, nullptr);
  EXPECT_TRUE(t->is<Advisory>());
}

} // namespace shpure::transform::test
