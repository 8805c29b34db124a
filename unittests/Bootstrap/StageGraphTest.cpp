//===-- StageGraphTest.cpp ------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "stagebuild/Bootstrap/StageGraph.h"

#include "stagebuild/Bootstrap/BootstrapError.h"

#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

using namespace stagebuild;
using namespace stagebuild::bootstrap;

namespace {

Platform parsePlatform(StringRef spelling) {
  auto platform = Platform::parse(spelling);
  EXPECT_TRUE(bool(platform));
  if (!platform) {
    llvm::consumeError(platform.takeError());
    return Platform();
  }
  return *platform;
}

std::vector<std::string> getNames(const BuildPlan& plan) {
  std::vector<std::string> result;
  for (const auto& step: plan.getSteps())
    result.push_back(step.getName());
  return result;
}

BuildPlan makePlan(const StageGraph& graph, ArrayRef<Platform> targets,
                   BootstrapAction action) {
  auto plan = graph.plan(targets, action);
  EXPECT_TRUE(bool(plan));
  if (!plan) {
    ADD_FAILURE() << llvm::toString(plan.takeError());
    return BuildPlan();
  }
  return std::move(*plan);
}

/// Check every dependency precedes its dependent and sits in an earlier
/// group.
void checkTopologicalOrder(const BuildPlan& plan) {
  for (unsigned i = 0, e = plan.size(); i != e; ++i) {
    for (auto dependency: plan[i].dependencies) {
      EXPECT_LT(dependency, i) << plan[i].getName();
      EXPECT_LT(plan[dependency].group, plan[i].group) << plan[i].getName();
    }
  }
}

class StageGraphTest : public ::testing::Test {
protected:
  Platform x86 = parsePlatform("x86_64-unknown-linux-gnu");
  Platform arm = parsePlatform("aarch64-unknown-linux-gnu");
  Platform wasm = parsePlatform("wasm32-unknown-wasi");
};

TEST_F(StageGraphTest, actionNames) {
  for (auto action: { BootstrapAction::Build, BootstrapAction::Test,
                      BootstrapAction::Install, BootstrapAction::Clean,
                      BootstrapAction::Validate }) {
    auto parsed = parseActionName(getActionName(action));
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(action, *parsed);
  }
  EXPECT_FALSE(parseActionName("deploy").hasValue());
}

TEST_F(StageGraphTest, singleHostBuild) {
  StageGraph graph({ x86 }, 2);
  auto plan = makePlan(graph, {}, BootstrapAction::Build);
  EXPECT_EQ((std::vector<std::string>{
                "fetch stage 0 for x86_64-unknown-linux-gnu",
                "build stage 1 for x86_64-unknown-linux-gnu",
                "build stage 2 for x86_64-unknown-linux-gnu",
                "verify fixed point of stage 2 for x86_64-unknown-linux-gnu"
              }), getNames(plan));
  checkTopologicalOrder(plan);

  EXPECT_EQ(std::vector<unsigned>{ 0 }, plan[1].dependencies);
  EXPECT_EQ(std::vector<unsigned>{ 2 }, plan[3].dependencies);
  EXPECT_EQ(3u, plan[3].group);
  EXPECT_EQ(std::vector<Platform>{ x86 }, plan.getFetchPlatforms());
  EXPECT_EQ(2u, plan.count(PlanStepKind::Build));
  EXPECT_EQ(2u, *plan.find(PlanStepKind::Build, 2, x86, x86));
  EXPECT_FALSE(plan.find(PlanStepKind::Build, 3, x86, x86).hasValue());
}

TEST_F(StageGraphTest, fixedPointCanBeDisabled) {
  StageGraph graph({ x86 }, 2, /*verifyFixedPoint=*/false);
  auto plan = makePlan(graph, {}, BootstrapAction::Build);
  EXPECT_EQ(0u, plan.count(PlanStepKind::FixedPoint));
  EXPECT_EQ(3u, plan.size());

  // An explicit validation still checks it.
  plan = makePlan(graph, {}, BootstrapAction::Validate);
  EXPECT_EQ(1u, plan.count(PlanStepKind::FixedPoint));
}

TEST_F(StageGraphTest, stageOneHasNoFixedPoint) {
  StageGraph graph({ x86 }, 1);
  auto plan = makePlan(graph, {}, BootstrapAction::Build);
  EXPECT_EQ(2u, plan.size());
  EXPECT_EQ(0u, plan.count(PlanStepKind::FixedPoint));

  // Stage 0 only fetches.
  StageGraph fetchOnly({ x86 }, 0);
  plan = makePlan(fetchOnly, {}, BootstrapAction::Build);
  EXPECT_EQ((std::vector<std::string>{
                "fetch stage 0 for x86_64-unknown-linux-gnu" }),
            getNames(plan));
}

TEST_F(StageGraphTest, crossTargetUsesPrimaryHost) {
  StageGraph graph({ x86 }, 2);
  EXPECT_EQ(x86, graph.getBuilder(arm));
  EXPECT_FALSE(graph.isHost(arm));

  auto plan = makePlan(graph, { arm }, BootstrapAction::Build);
  EXPECT_EQ((std::vector<std::string>{
                "fetch stage 0 for x86_64-unknown-linux-gnu",
                "build stage 1 for x86_64-unknown-linux-gnu",
                "build stage 2 for aarch64-unknown-linux-gnu on "
                "x86_64-unknown-linux-gnu" }),
            getNames(plan));
  // Cross artifacts can't rebuild themselves here.
  EXPECT_EQ(0u, plan.count(PlanStepKind::FixedPoint));
}

TEST_F(StageGraphTest, sharedProducersAreCreatedOnce) {
  StageGraph graph({ x86 }, 2);
  auto plan = makePlan(graph, { x86, arm, wasm, arm },
                       BootstrapAction::Build);
  checkTopologicalOrder(plan);
  EXPECT_EQ(1u, plan.count(PlanStepKind::Fetch));
  EXPECT_EQ(1u, plan.count(PlanStepKind::FixedPoint));
  // stage 1 and 2 for the host, stage 2 for each cross target.
  EXPECT_EQ(4u, plan.count(PlanStepKind::Build));

  // Independent stage 2 builds share a group.
  auto x86Step = *plan.find(PlanStepKind::Build, 2, x86, x86);
  auto armStep = *plan.find(PlanStepKind::Build, 2, x86, arm);
  auto wasmStep = *plan.find(PlanStepKind::Build, 2, x86, wasm);
  EXPECT_EQ(plan[x86Step].group, plan[armStep].group);
  EXPECT_EQ(plan[x86Step].group, plan[wasmStep].group);
  EXPECT_EQ(plan[armStep].dependencies, plan[wasmStep].dependencies);
}

TEST_F(StageGraphTest, multipleHostsBuildIndependently) {
  StageGraph graph({ x86, arm, x86 }, 2);
  EXPECT_EQ((std::vector<Platform>{ x86, arm }), graph.getHosts());
  EXPECT_EQ(arm, graph.getBuilder(arm));

  auto plan = makePlan(graph, {}, BootstrapAction::Build);
  checkTopologicalOrder(plan);
  EXPECT_EQ((std::vector<Platform>{ x86, arm }), plan.getFetchPlatforms());
  EXPECT_EQ(2u, plan.count(PlanStepKind::FixedPoint));

  auto armStage1 = *plan.find(PlanStepKind::Build, 1, arm, arm);
  auto armFetch = *plan.find(PlanStepKind::Fetch, 0, arm, arm);
  EXPECT_EQ(std::vector<unsigned>{ armFetch }, plan[armStage1].dependencies);
}

TEST_F(StageGraphTest, testAndInstallFollowValidation) {
  StageGraph graph({ x86 }, 2);
  auto plan = makePlan(graph, { x86, arm }, BootstrapAction::Test);
  checkTopologicalOrder(plan);
  EXPECT_EQ(2u, plan.count(PlanStepKind::Test));

  auto fixedPoint = *plan.find(PlanStepKind::FixedPoint, 2, x86, x86);
  auto armTest = *plan.find(PlanStepKind::Test, 2, x86, arm);
  auto armBuild = *plan.find(PlanStepKind::Build, 2, x86, arm);
  EXPECT_EQ((std::vector<unsigned>{ armBuild, fixedPoint }),
            plan[armTest].dependencies);
  EXPECT_EQ("test stage 2 for aarch64-unknown-linux-gnu",
            plan[armTest].getName());

  plan = makePlan(graph, { x86 }, BootstrapAction::Install);
  EXPECT_EQ("install stage 2 for x86_64-unknown-linux-gnu",
            plan[plan.size() - 1].getName());
  EXPECT_EQ(0u, plan.count(PlanStepKind::Test));
}

TEST_F(StageGraphTest, invalidActions) {
  StageGraph graph({ x86 }, 1);
  auto plan = graph.plan({}, BootstrapAction::Validate);
  ASSERT_FALSE(bool(plan));
  EXPECT_EQ(ErrorKind::InvalidConfiguration,
            describeError(plan.takeError()).kind);

  plan = graph.plan({}, BootstrapAction::Clean);
  ASSERT_FALSE(bool(plan));
  EXPECT_EQ(ErrorKind::InvalidConfiguration,
            describeError(plan.takeError()).kind);

  StageGraph stageZero({ x86 }, 0);
  plan = stageZero.plan({}, BootstrapAction::Install);
  ASSERT_FALSE(bool(plan));
  EXPECT_NE(std::string::npos,
            describeError(plan.takeError()).message.find("at least 1"));
}

TEST_F(StageGraphTest, emptyHostsUseMachine) {
  StageGraph graph({}, 1);
  EXPECT_EQ(std::vector<Platform>{ Platform::getHost() }, graph.getHosts());
}

TEST_F(StageGraphTest, dump) {
  StageGraph graph({ x86 }, 1);
  auto plan = makePlan(graph, {}, BootstrapAction::Build);
  std::string text;
  llvm::raw_string_ostream os(text);
  plan.dump(os);
  EXPECT_EQ("0: [0] fetch stage 0 for x86_64-unknown-linux-gnu\n"
            "1: [1] build stage 1 for x86_64-unknown-linux-gnu (after 0)\n",
            os.str());
}

}
