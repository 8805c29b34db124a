//===- StageGraph.h ---------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_STAGEGRAPH_H
#define STAGEBUILD_BOOTSTRAP_STAGEGRAPH_H

#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/Platform.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace llvm {
class raw_ostream;
}

namespace stagebuild {
namespace bootstrap {

/// The actions the bootstrap frontend performs.
enum class BootstrapAction {
  Build,
  Test,
  Install,
  Clean,
  Validate,
};

StringRef getActionName(BootstrapAction action);

Optional<BootstrapAction> parseActionName(StringRef name);

enum class PlanStepKind {
  /// Ensure the stage 0 snapshot for a host is present.
  Fetch,

  /// Build a stage for a target, using the previous stage of its host.
  Build,

  /// Rebuild a host's final stage with itself, and compare.
  FixedPoint,

  /// Run the test suite of a target's final stage.
  Test,

  /// Copy a target's final stage into the install prefix.
  Install,
};

StringRef getPlanStepKindName(PlanStepKind kind);

/// A single step of a build plan.
struct PlanStep {
  PlanStepKind kind;

  /// The stage the step produces or operates on.
  unsigned stage;

  /// The platform whose toolchain runs the step.
  Platform host;

  /// The platform the step produces (or operates on) an artifact for.
  Platform target;

  /// The indices of the steps which must complete before this one.
  std::vector<unsigned> dependencies;

  /// The depth of the step in the plan; steps with the same group never
  /// depend on one another.
  unsigned group = 0;

  /// Get a unique, human readable name for the step.
  std::string getName() const;
};

/// A topologically ordered sequence of plan steps.
class BuildPlan {
  std::vector<PlanStep> steps;

  friend class StageGraph;

public:
  const std::vector<PlanStep>& getSteps() const { return steps; }

  size_t size() const { return steps.size(); }
  bool empty() const { return steps.empty(); }

  const PlanStep& operator[](unsigned index) const { return steps[index]; }

  /// Find the step with the given identity.
  Optional<unsigned> find(PlanStepKind kind, unsigned stage,
                          const Platform& host, const Platform& target) const;

  /// Get the hosts whose snapshots the plan fetches.
  std::vector<Platform> getFetchPlatforms() const;

  /// Count the steps of the given kind.
  unsigned count(PlanStepKind kind) const;

  /// Print the plan, one step per line.
  void dump(llvm::raw_ostream& os) const;
};

/// The dependency graph of stages, crossed with the platforms being built.
///
/// Stage N for a target requires stage N-1 built for the host which builds
/// the target: the target itself when it is one of the hosts, otherwise the
/// primary (first) host.
class StageGraph {
  std::vector<Platform> hosts;

  unsigned finalStage;

  bool verifyFixedPoint;

public:
  /// \param hosts The host platforms; the machine's own platform if empty.
  /// \param finalStage The last stage to build.
  /// \param verifyFixedPoint Whether builds reaching stage 2 also check the
  /// fixed point of each host.
  StageGraph(ArrayRef<Platform> hosts, unsigned finalStage,
             bool verifyFixedPoint = true);

  const std::vector<Platform>& getHosts() const { return hosts; }
  unsigned getFinalStage() const { return finalStage; }

  /// Get the host whose toolchain builds \p target.
  const Platform& getBuilder(const Platform& target) const;

  bool isHost(const Platform& platform) const;

  /// Compute the plan for performing \p action for \p targets (the hosts if
  /// empty).
  llvm::Expected<BuildPlan> plan(ArrayRef<Platform> targets,
                                 BootstrapAction action) const;
};

}
}

#endif
