//===-- StageGraph.cpp ----------------------------------------------------===//
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

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <map>
#include <tuple>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

StringRef bootstrap::getActionName(BootstrapAction action) {
  switch (action) {
  case BootstrapAction::Build: return "build";
  case BootstrapAction::Test: return "test";
  case BootstrapAction::Install: return "install";
  case BootstrapAction::Clean: return "clean";
  case BootstrapAction::Validate: return "validate";
  }
  return "<unknown>";
}

Optional<BootstrapAction> bootstrap::parseActionName(StringRef name) {
  return llvm::StringSwitch<Optional<BootstrapAction>>(name)
    .Case("build", BootstrapAction::Build)
    .Case("test", BootstrapAction::Test)
    .Case("install", BootstrapAction::Install)
    .Case("clean", BootstrapAction::Clean)
    .Case("validate", BootstrapAction::Validate)
    .Default(None);
}

StringRef bootstrap::getPlanStepKindName(PlanStepKind kind) {
  switch (kind) {
  case PlanStepKind::Fetch: return "fetch";
  case PlanStepKind::Build: return "build";
  case PlanStepKind::FixedPoint: return "fixed-point";
  case PlanStepKind::Test: return "test";
  case PlanStepKind::Install: return "install";
  }
  return "<unknown>";
}

std::string PlanStep::getName() const {
  std::string stageName = "stage " + std::to_string(stage);
  switch (kind) {
  case PlanStepKind::Fetch:
    return "fetch " + stageName + " for " + host.str();
  case PlanStepKind::Build:
    if (host == target)
      return "build " + stageName + " for " + target.str();
    return "build " + stageName + " for " + target.str() + " on " +
      host.str();
  case PlanStepKind::FixedPoint:
    return "verify fixed point of " + stageName + " for " + host.str();
  case PlanStepKind::Test:
    return "test " + stageName + " for " + target.str();
  case PlanStepKind::Install:
    return "install " + stageName + " for " + target.str();
  }
  return stageName;
}

#pragma mark - BuildPlan

Optional<unsigned> BuildPlan::find(PlanStepKind kind, unsigned stage,
                                   const Platform& host,
                                   const Platform& target) const {
  for (unsigned i = 0, e = steps.size(); i != e; ++i) {
    const auto& step = steps[i];
    if (step.kind == kind && step.stage == stage && step.host == host &&
        step.target == target)
      return i;
  }
  return None;
}

std::vector<Platform> BuildPlan::getFetchPlatforms() const {
  std::vector<Platform> result;
  for (const auto& step: steps) {
    if (step.kind == PlanStepKind::Fetch)
      result.push_back(step.host);
  }
  return result;
}

unsigned BuildPlan::count(PlanStepKind kind) const {
  return std::count_if(steps.begin(), steps.end(),
                       [&](const PlanStep& step) { return step.kind == kind; });
}

void BuildPlan::dump(llvm::raw_ostream& os) const {
  for (unsigned i = 0, e = steps.size(); i != e; ++i) {
    const auto& step = steps[i];
    os << i << ": [" << step.group << "] " << step.getName();
    if (!step.dependencies.empty()) {
      os << " (after ";
      bool first = true;
      for (auto dependency: step.dependencies) {
        if (!first)
          os << ", ";
        os << dependency;
        first = false;
      }
      os << ")";
    }
    os << "\n";
  }
}

#pragma mark - StageGraph

namespace {

/// Accumulates the steps of a plan, creating each one (and its producers) at
/// most once.
class PlanBuilder {
  const StageGraph& graph;

  std::vector<PlanStep>& steps;

  typedef std::tuple<PlanStepKind, unsigned, std::string, std::string> StepKey;
  std::map<StepKey, unsigned> stepIndices;

  unsigned addStep(PlanStepKind kind, unsigned stage, const Platform& host,
                   const Platform& target,
                   std::vector<unsigned> dependencies) {
    StepKey key(kind, stage, host.str(), target.str());
    auto it = stepIndices.find(key);
    if (it != stepIndices.end())
      return it->second;

    PlanStep step;
    step.kind = kind;
    step.stage = stage;
    step.host = host;
    step.target = target;
    step.group = 0;
    for (auto dependency: dependencies)
      step.group = std::max(step.group, steps[dependency].group + 1);
    step.dependencies = std::move(dependencies);

    unsigned index = steps.size();
    steps.push_back(std::move(step));
    stepIndices[key] = index;
    return index;
  }

public:
  PlanBuilder(const StageGraph& graph, std::vector<PlanStep>& steps)
      : graph(graph), steps(steps) {}

  unsigned addFetch(const Platform& host) {
    return addStep(PlanStepKind::Fetch, 0, host, host, {});
  }

  /// Add the steps producing the \p stage artifact for \p target.
  unsigned addArtifact(unsigned stage, const Platform& target) {
    const Platform& builder = graph.getBuilder(target);
    if (stage == 0)
      return addFetch(builder);

    unsigned producer = addArtifact(stage - 1, builder);
    return addStep(PlanStepKind::Build, stage, builder, target, { producer });
  }

  unsigned addFixedPoint(const Platform& host) {
    unsigned stage = graph.getFinalStage();
    unsigned producer = addArtifact(stage, host);
    return addStep(PlanStepKind::FixedPoint, stage, host, host, { producer });
  }

  unsigned addFinalStep(PlanStepKind kind, const Platform& target,
                        ArrayRef<unsigned> validations) {
    unsigned stage = graph.getFinalStage();
    std::vector<unsigned> dependencies;
    dependencies.push_back(addArtifact(stage, target));
    dependencies.insert(dependencies.end(), validations.begin(),
                        validations.end());
    return addStep(kind, stage, graph.getBuilder(target), target,
                   std::move(dependencies));
  }
};

template<typename T>
std::vector<T> uniqued(ArrayRef<T> values) {
  std::vector<T> result;
  for (const auto& value: values) {
    if (std::find(result.begin(), result.end(), value) == result.end())
      result.push_back(value);
  }
  return result;
}

}

StageGraph::StageGraph(ArrayRef<Platform> hosts, unsigned finalStage,
                       bool verifyFixedPoint)
    : hosts(uniqued(hosts)), finalStage(finalStage),
      verifyFixedPoint(verifyFixedPoint) {
  if (this->hosts.empty())
    this->hosts.push_back(Platform::getHost());
}

bool StageGraph::isHost(const Platform& platform) const {
  return std::find(hosts.begin(), hosts.end(), platform) != hosts.end();
}

const Platform& StageGraph::getBuilder(const Platform& target) const {
  for (const auto& host: hosts) {
    if (host == target)
      return host;
  }
  return hosts.front();
}

llvm::Expected<BuildPlan> StageGraph::plan(ArrayRef<Platform> requestedTargets,
                                           BootstrapAction action) const {
  switch (action) {
  case BootstrapAction::Clean:
    return makeError(ErrorKind::InvalidConfiguration,
                     "'clean' does not use a build plan");
  case BootstrapAction::Validate:
    if (finalStage < 2) {
      return makeError(ErrorKind::InvalidConfiguration,
                       "'validate' requires a final stage of at least 2 "
                       "(got " + Twine(finalStage) + ")");
    }
    break;
  case BootstrapAction::Test:
  case BootstrapAction::Install:
    if (finalStage == 0) {
      return makeError(ErrorKind::InvalidConfiguration,
                       "'" + getActionName(action) +
                       "' requires a final stage of at least 1");
    }
    break;
  case BootstrapAction::Build:
    break;
  }

  std::vector<Platform> targets = uniqued(requestedTargets);
  if (targets.empty())
    targets = hosts;

  std::vector<PlanStep> steps;
  PlanBuilder builder(*this, steps);

  for (const auto& target: targets)
    builder.addArtifact(finalStage, target);

  // Fixed points are checked for every host being built, or for every host
  // when validating explicitly.
  std::vector<unsigned> validations;
  if (action == BootstrapAction::Validate) {
    for (const auto& host: hosts)
      validations.push_back(builder.addFixedPoint(host));
  } else if (finalStage >= 2 && verifyFixedPoint) {
    for (const auto& target: targets) {
      if (isHost(target))
        validations.push_back(builder.addFixedPoint(target));
    }
  }

  if (action == BootstrapAction::Test || action == BootstrapAction::Install) {
    PlanStepKind kind = action == BootstrapAction::Test ?
      PlanStepKind::Test : PlanStepKind::Install;
    for (const auto& target: targets)
      builder.addFinalStep(kind, target, validations);
  }

  // Order the steps by depth, keeping creation order within a group, and
  // renumber the dependencies to match.
  std::vector<unsigned> order(steps.size());
  for (unsigned i = 0, e = steps.size(); i != e; ++i)
    order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](unsigned lhs, unsigned rhs) {
      return steps[lhs].group < steps[rhs].group;
    });
  std::vector<unsigned> newIndex(steps.size());
  for (unsigned i = 0, e = order.size(); i != e; ++i)
    newIndex[order[i]] = i;

  BuildPlan result;
  for (auto index: order) {
    PlanStep step = steps[index];
    for (auto& dependency: step.dependencies)
      dependency = newIndex[dependency];
    std::sort(step.dependencies.begin(), step.dependencies.end());
    result.steps.push_back(std::move(step));
  }
  return std::move(result);
}
