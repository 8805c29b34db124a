//===- Orchestrator.h -------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_ORCHESTRATOR_H
#define STAGEBUILD_BOOTSTRAP_ORCHESTRATOR_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/BootstrapError.h"
#include "stagebuild/Bootstrap/Fingerprint.h"
#include "stagebuild/Bootstrap/Platform.h"
#include "stagebuild/Bootstrap/StageGraph.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace stagebuild {
namespace basic {
class FileSystem;
}

namespace bootstrap {

class BuildCache;
class SnapshotManifest;
class SnapshotTransport;
struct BootstrapConfig;

enum class OrchestratorState {
  Idle,
  Planning,
  Fetching,
  Building,
  Validating,
  Testing,
  Installing,
  Done,
  Failed,
};

StringRef getOrchestratorStateName(OrchestratorState state);

/// A request to the orchestrator.
struct OrchestratorRequest {
  BootstrapAction action = BootstrapAction::Build;

  /// The host platforms; the machine's own platform if empty.
  std::vector<Platform> hosts;

  /// The target platforms; the hosts if empty.
  std::vector<Platform> targets;

  /// The final stage, overriding the configuration.
  Optional<unsigned> stage;

  /// Compute the plan and report what would run, without running anything.
  bool dryRun = false;
};

enum class StepOutcome {
  /// The step has not run (yet).
  Pending,

  /// The step's artifact was found in the cache (or, for a fetch, the
  /// snapshot was already installed).
  CacheHit,

  /// The step ran and succeeded.
  Completed,

  /// The step ran and failed.
  Failed,

  /// The step did not run, because a step it depends on failed or the run
  /// stopped.
  Skipped,
};

StringRef getStepOutcomeName(StepOutcome outcome);

/// The progress of a single plan step.
struct StepReport {
  unsigned index = 0;

  PlanStep step;

  StepOutcome outcome = StepOutcome::Pending;

  /// The fingerprint of the step's artifact, or the snapshot checksum for a
  /// fetch. Null for steps which produce nothing.
  Fingerprint fingerprint;

  /// The artifact the step produced or found.
  std::string artifactPath;

  /// The command line of the toolchain invocation, if any.
  std::vector<std::string> commandLine;

  /// The output of the toolchain invocation, if any.
  std::string diagnostics;
};

/// The result of an orchestrator run.
struct RunSummary {
  OrchestratorState finalState = OrchestratorState::Idle;

  std::vector<StepReport> steps;

  std::vector<ErrorDescription> errors;

  bool succeeded() const { return errors.empty(); }

  /// Count the steps with the given outcome.
  unsigned count(StepOutcome outcome) const;

  /// Get the process exit code for the run; with several errors, the most
  /// severe code wins.
  int getExitCode() const;
};

/// Delegate interface for orchestrator progress.
///
/// All calls are made on the thread running \see Orchestrator::run().
class OrchestratorDelegate {
public:
  virtual ~OrchestratorDelegate();

  /// Called on every state transition. \p stage is the stage being built, for
  /// the Building state.
  virtual void stateChanged(OrchestratorState state, unsigned stage) = 0;

  /// Called once the plan is known.
  virtual void planComputed(const BuildPlan& plan) {}

  virtual void snapshotFetchStarted(const Platform& platform, StringRef url) {}

  virtual void snapshotFetchRetrying(const Platform& platform,
                                     unsigned attempt, StringRef reason,
                                     std::chrono::milliseconds delay) {}

  /// Called when a step begins work which wasn't found in the cache.
  virtual void stepStarted(const StepReport& report) = 0;

  /// Called when a step reaches its outcome, including cache hits and skips.
  virtual void stepFinished(const StepReport& report) = 0;

  /// Called when a lookup finds a corrupted cache entry.
  virtual void cacheEntryCorrupted(const Fingerprint& fingerprint,
                                   StringRef reason) {}

  /// Called for each error of the run.
  virtual void hadError(const ErrorDescription& error) = 0;
};

/// Drives a build plan to completion.
///
/// The orchestrator resolves cache hits, fetches stage 0 snapshots, runs the
/// toolchain for cache misses on a bounded pool of workers, commits their
/// results and validates the fixed point. All cache writes happen on the
/// thread running \see run().
class Orchestrator {
  void* impl;

public:
  Orchestrator(const BootstrapConfig& config,
               const SnapshotManifest& manifest,
               basic::FileSystem& fs, BuildCache& cache,
               SnapshotTransport& transport, OrchestratorDelegate& delegate);
  ~Orchestrator();

  /// Write a trace of the run to \p path.
  bool enableTracing(StringRef path, std::string* error_out);

  /// Set the function used to wait between snapshot fetch retries.
  void setRetrySleepFunction(
      std::function<void(std::chrono::milliseconds)> fn);

  /// Set the time build tools are given to exit after an interrupt.
  void setCancellationGracePeriod(std::chrono::milliseconds gracePeriod);

  /// Perform \p request.
  RunSummary run(const OrchestratorRequest& request);

  /// Cancel the current run. This may be called from any thread.
  void cancel();

  OrchestratorState getState() const;
};

}
}

#endif
