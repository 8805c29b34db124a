//===-- Orchestrator.cpp --------------------------------------------------===//
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

#include "stagebuild/Bootstrap/Orchestrator.h"

#include "stagebuild/Basic/ExecutionQueue.h"
#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/ShellUtility.h"
#include "stagebuild/Bootstrap/BuildCache.h"
#include "stagebuild/Bootstrap/Configuration.h"
#include "stagebuild/Bootstrap/SnapshotManager.h"
#include "stagebuild/Bootstrap/SnapshotManifest.h"
#include "stagebuild/Bootstrap/ToolchainInvoker.h"
#include "stagebuild/Bootstrap/TreeManifest.h"

#include "OrchestratorTrace.h"

#include "llvm/ADT/SmallString.h"

#include <atomic>
#include <cassert>
#include <condition_variable>
#include <deque>
#include <mutex>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

StringRef bootstrap::getOrchestratorStateName(OrchestratorState state) {
  switch (state) {
  case OrchestratorState::Idle: return "Idle";
  case OrchestratorState::Planning: return "Planning";
  case OrchestratorState::Fetching: return "Fetching";
  case OrchestratorState::Building: return "Building";
  case OrchestratorState::Validating: return "Validating";
  case OrchestratorState::Testing: return "Testing";
  case OrchestratorState::Installing: return "Installing";
  case OrchestratorState::Done: return "Done";
  case OrchestratorState::Failed: return "Failed";
  }
  return "<unknown>";
}

StringRef bootstrap::getStepOutcomeName(StepOutcome outcome) {
  switch (outcome) {
  case StepOutcome::Pending: return "pending";
  case StepOutcome::CacheHit: return "cached";
  case StepOutcome::Completed: return "completed";
  case StepOutcome::Failed: return "failed";
  case StepOutcome::Skipped: return "skipped";
  }
  return "<unknown>";
}

unsigned RunSummary::count(StepOutcome outcome) const {
  unsigned result = 0;
  for (const auto& report: steps) {
    if (report.outcome == outcome)
      ++result;
  }
  return result;
}

int RunSummary::getExitCode() const {
  int result = 0;
  for (const auto& error: errors)
    result = mergeExitCodes(result, getExitCodeForErrorKind(error.kind));
  return result;
}

OrchestratorDelegate::~OrchestratorDelegate() {}

namespace {

struct StepJobDescriptor : public basic::JobDescriptor {
  std::string name;
  std::string commandLine;

  StepJobDescriptor(StringRef name, StringRef commandLine)
      : name(name.str()), commandLine(commandLine.str()) {}

  virtual void getShortDescription(
      SmallVectorImpl<char>& result) const override {
    result.append(name.begin(), name.end());
  }

  virtual void getVerboseDescription(
      SmallVectorImpl<char>& result) const override {
    if (commandLine.empty()) {
      getShortDescription(result);
      return;
    }
    result.append(commandLine.begin(), commandLine.end());
  }
};

/// Everything a worker needs to perform a step, computed on the orchestrator
/// thread.
struct StepWork {
  unsigned index = 0;
  PlanStepKind kind = PlanStepKind::Build;
  Fingerprint fingerprint;
  InvocationRequest request;

  /// The artifact a fixed point rebuild must reproduce, or the artifact to
  /// install.
  std::string sourceArtifact;

  /// The install destination.
  std::string installPath;
};

/// The result of a step's work, posted back to the orchestrator thread.
struct StepEvent {
  unsigned index = 0;

  /// Set if the step failed before (or instead of) producing a result.
  Optional<ErrorDescription> error;

  /// Set if the run stopped before the step's work began.
  bool skipped = false;

  /// Set if another process committed the artifact while we waited for it.
  bool cacheHit = false;
  CacheEntry entry;

  BuildResult result;

  std::string installedPath;

  /// The build lock for the fingerprint, held until the commit.
  std::unique_ptr<basic::FileLock> lock;
};

class OrchestratorImpl : public SnapshotManagerDelegate,
                         public basic::ExecutionQueueDelegate {
  const BootstrapConfig& config;
  const SnapshotManifest& manifest;
  basic::FileSystem& fs;
  BuildCache& cache;
  OrchestratorDelegate& delegate;

  SnapshotManager snapshots;
  ToolchainInvoker invoker;
  OrchestratorTrace trace;

  std::atomic<OrchestratorState> state{OrchestratorState::Idle};
  unsigned currentStage = 0;
  std::atomic<bool> cancelled{false};

  /// The queue of the running plan, for cancellation.
  basic::ExecutionQueue* currentQueue = nullptr;
  std::mutex currentQueueMutex;

  /// @name Run State
  /// @{

  BuildPlan plan;
  RunSummary summary;
  basic::Digest sourceDigest;
  basic::Digest configDigest;
  std::vector<std::unique_ptr<StepJobDescriptor>> descriptors;
  std::vector<unsigned> pendingDependencies;
  std::vector<std::vector<unsigned>> dependents;
  std::deque<unsigned> readySteps;
  unsigned stepsInFlight = 0;

  /// Set once a failure stops the run; queued steps which have not begun
  /// are skipped.
  std::atomic<bool> halted{false};

  /// Fetch steps for hosts the manifest has no snapshot for.
  std::vector<std::pair<unsigned, ErrorDescription>> unsupportedFetches;

  std::deque<StepEvent> events;
  std::mutex eventsMutex;
  std::condition_variable eventsCondition;

  /// @}

  void setState(OrchestratorState newState, unsigned stage = 0) {
    if (state == newState && currentStage == stage)
      return;
    state = newState;
    currentStage = stage;
    if (trace.isOpen())
      trace.stateChanged(getOrchestratorStateName(newState), stage);
    delegate.stateChanged(newState, stage);
  }

  ErrorContext getStepContext(unsigned index) const {
    const auto& report = summary.steps[index];
    ErrorContext context;
    context.stage = report.step.stage;
    context.platform = report.step.target.str();
    if (!report.fingerprint.isNull())
      context.fingerprint = report.fingerprint.toHex();
    return context;
  }

  void recordError(ErrorDescription error) {
    // Every cancelled step reports the same thing; once is enough.
    if (error.kind == ErrorKind::Cancelled) {
      for (const auto& existing: summary.errors) {
        if (existing.kind == ErrorKind::Cancelled)
          return;
      }
    }

    if (trace.isOpen())
      trace.errorRecorded(getErrorKindName(error.kind), error.str());
    delegate.hadError(error);
    summary.errors.push_back(std::move(error));
  }

  void recordError(llvm::Error error) {
    recordError(describeError(std::move(error)));
  }

  void finishStep(unsigned index, StepOutcome outcome) {
    auto& report = summary.steps[index];
    report.outcome = outcome;
    if (trace.isOpen())
      trace.stepFinished(index, getStepOutcomeName(outcome));
    delegate.stepFinished(report);
  }

  void completeStep(unsigned index, StepOutcome outcome) {
    finishStep(index, outcome);
    for (auto dependent: dependents[index]) {
      if (--pendingDependencies[dependent] == 0 &&
          summary.steps[dependent].outcome == StepOutcome::Pending)
        readySteps.push_back(dependent);
    }
  }

  void skipDependents(unsigned index) {
    for (auto dependent: dependents[index]) {
      if (summary.steps[dependent].outcome != StepOutcome::Pending)
        continue;
      finishStep(dependent, StepOutcome::Skipped);
      skipDependents(dependent);
    }
  }

  void failStep(unsigned index, ErrorDescription error) {
    const auto& step = summary.steps[index].step;

    ErrorContext context = getStepContext(index);
    if (!error.context.stage.hasValue())
      error.context.stage = context.stage;
    if (error.context.platform.empty())
      error.context.platform = context.platform;
    if (error.context.fingerprint.empty())
      error.context.fingerprint = context.fingerprint;

    // Fetch failures only affect their own platform; a fixed point mismatch
    // always ends the run.
    switch (error.kind) {
    case ErrorKind::Cancelled:
    case ErrorKind::FixedPointMismatch:
      halted = true;
      break;
    default:
      if (step.kind != PlanStepKind::Fetch && !config.keepGoing)
        halted = true;
      break;
    }

    recordError(std::move(error));
    finishStep(index, StepOutcome::Failed);
    skipDependents(index);
  }

  void failStep(unsigned index, llvm::Error error) {
    failStep(index, describeError(std::move(error)));
  }

  std::string getOutputDir(unsigned stage, const Platform& target,
                           StringRef kind, const Fingerprint& fingerprint) {
    return config.buildDir + "/stage" + std::to_string(stage) + "/" +
      target.str() + "/" + kind.str() + "-" + fingerprint.toHex();
  }

  /// @name Planning
  /// @{

  bool computePlan(const OrchestratorRequest& request) {
    unsigned finalStage = request.stage.hasValue() ? *request.stage :
      config.stages;
    StageGraph graph(request.hosts, finalStage, config.verifyFixedPoint);
    auto result = graph.plan(request.targets, request.action);
    if (!result) {
      recordError(result.takeError());
      return false;
    }
    plan = std::move(*result);

    if (request.action == BootstrapAction::Install &&
        config.installPrefix.empty()) {
      recordError(makeError(ErrorKind::InvalidConfiguration,
                            "'install' requires an install prefix "
                            "(--prefix or 'install-prefix')"));
      return false;
    }

    // Digest the inputs, keeping the build's own state out of the sources.
    std::vector<std::string> sourceIgnore = config.sourceIgnore;
    StringRef sourceDir = StringRef(config.sourceDir).rtrim('/');
    for (StringRef dir: { StringRef(config.cacheDir),
                          StringRef(config.buildDir) }) {
      if (dir.startswith(sourceDir) && dir.size() > sourceDir.size() &&
          dir[sourceDir.size()] == '/')
        sourceIgnore.push_back(dir.drop_front(sourceDir.size() + 1).str());
    }

    std::string error;
    TreeManifest sources;
    if (!computeTreeManifest(fs, config.sourceDir, sourceIgnore,
                             /*hashContents=*/true, sources, &error)) {
      recordError(makeError(ErrorKind::IO,
                            "unable to read the source tree: " + error));
      return false;
    }
    sourceDigest = sources.getDigest();
    configDigest = computeConfigDigest(config);

    // Prepare the per-step state, in plan order so producers come first.
    const auto& steps = plan.getSteps();
    summary.steps.resize(steps.size());
    pendingDependencies.assign(steps.size(), 0);
    dependents.assign(steps.size(), {});
    for (unsigned i = 0, e = steps.size(); i != e; ++i) {
      const auto& step = steps[i];
      auto& report = summary.steps[i];
      report.index = i;
      report.step = step;
      pendingDependencies[i] = step.dependencies.size();
      for (auto dependency: step.dependencies)
        dependents[dependency].push_back(i);

      switch (step.kind) {
      case PlanStepKind::Fetch: {
        // An unsupported host fails its own chain; other hosts still build.
        auto entry = manifest.lookup(step.host);
        if (!entry) {
          unsupportedFetches.emplace_back(i, describeError(entry.takeError()));
          break;
        }
        report.fingerprint = entry->checksum;
        break;
      }
      case PlanStepKind::Build:
      case PlanStepKind::FixedPoint: {
        FingerprintInputs inputs;
        inputs.stage = step.stage;
        inputs.kind = step.kind == PlanStepKind::Build ?
          StepKind::Build : StepKind::FixedPoint;
        inputs.host = step.host;
        inputs.target = step.target;
        inputs.sourceDigest = sourceDigest;
        inputs.configDigest = configDigest;
        inputs.predecessor =
          summary.steps[step.dependencies.front()].fingerprint;
        report.fingerprint = computeFingerprint(inputs);
        break;
      }
      case PlanStepKind::Test:
      case PlanStepKind::Install:
        break;
      }

      descriptors.emplace_back(new StepJobDescriptor(step.getName(), ""));
      if (trace.isOpen()) {
        trace.stepPlanned(i, step.getName(), report.fingerprint.isNull() ?
                          "" : report.fingerprint.toHex());
      }
    }

    return true;
  }

  /// Fail the chains of hosts without a snapshot, before anything is fetched.
  void rejectUnsupportedHosts() {
    for (auto& unsupported: unsupportedFetches)
      failStep(unsupported.first, std::move(unsupported.second));
    unsupportedFetches.clear();
  }

  /// Report what a run would do, without doing it.
  void predictOutcomes() {
    for (auto& report: summary.steps) {
      if (report.outcome != StepOutcome::Pending)
        continue;
      switch (report.step.kind) {
      case PlanStepKind::Fetch:
        if (snapshots.isAvailableOffline(report.step.host))
          report.outcome = StepOutcome::CacheHit;
        break;
      case PlanStepKind::Build:
      case PlanStepKind::FixedPoint: {
        auto lookup = cache.lookup(report.fingerprint);
        if (!lookup) {
          recordError(lookup.takeError());
          break;
        }
        if (lookup->isHit()) {
          report.outcome = StepOutcome::CacheHit;
          report.artifactPath = lookup->entry.path;
        }
        break;
      }
      case PlanStepKind::Test:
      case PlanStepKind::Install:
        break;
      }
    }
  }

  /// @}

  /// @name Execution
  /// @{

  void fetchSnapshots() {
    const auto& steps = plan.getSteps();
    if (plan.count(PlanStepKind::Fetch) != 0)
      setState(OrchestratorState::Fetching);

    for (unsigned i = 0, e = steps.size(); i != e; ++i) {
      if (steps[i].kind != PlanStepKind::Fetch ||
          summary.steps[i].outcome != StepOutcome::Pending)
        continue;
      if (cancelled || halted)
        break;

      bool wasInstalled = snapshots.isAvailableOffline(steps[i].host);
      if (!wasInstalled) {
        if (trace.isOpen())
          trace.stepStarted(i);
        delegate.stepStarted(summary.steps[i]);
      }

      auto artifact = snapshots.ensureStage0(steps[i].host);
      if (!artifact) {
        failStep(i, artifact.takeError());
        continue;
      }
      summary.steps[i].artifactPath = artifact->path;
      completeStep(i, wasInstalled ? StepOutcome::CacheHit :
                   StepOutcome::Completed);
    }
  }

  /// Find the artifact produced by the step at \p index.
  const std::string& getArtifactPath(unsigned index) const {
    return summary.steps[index].artifactPath;
  }

  StepWork prepareWork(unsigned index) {
    const auto& report = summary.steps[index];
    const auto& step = report.step;

    StepWork work;
    work.index = index;
    work.kind = step.kind;
    work.fingerprint = report.fingerprint;

    InvocationRequest& request = work.request;
    request.stage = step.stage;
    request.host = step.host;
    request.target = step.target;
    request.sourceDir = config.sourceDir;
    request.buildTool = config.buildTool;
    request.timeout = std::chrono::seconds(config.stepTimeout);

    switch (step.kind) {
    case PlanStepKind::Fetch:
      break;

    case PlanStepKind::Build:
      request.mode = InvocationMode::Build;
      request.toolchainDir = getArtifactPath(step.dependencies.front());
      request.outputDir = getOutputDir(step.stage, step.target, "build",
                                       report.fingerprint);
      break;

    case PlanStepKind::FixedPoint:
      // The final stage builds the next generation of itself.
      request.mode = InvocationMode::Build;
      request.stage = step.stage + 1;
      request.toolchainDir = getArtifactPath(step.dependencies.front());
      request.outputDir = getOutputDir(step.stage, step.target, "fixed-point",
                                       report.fingerprint);
      work.sourceArtifact = request.toolchainDir;
      break;

    case PlanStepKind::Test:
    case PlanStepKind::Install: {
      // Both operate on the final stage artifact for the target, which was
      // built by the previous stage of its host.
      auto build = plan.find(PlanStepKind::Build, step.stage, step.host,
                             step.target);
      assert(build.hasValue() && "final stage step is missing its build");
      const auto& buildReport = summary.steps[*build];
      if (step.kind == PlanStepKind::Install) {
        work.sourceArtifact = getArtifactPath(*build);
        work.installPath = config.installPrefix + "/" + step.target.str();
        break;
      }
      request.mode = InvocationMode::Test;
      request.toolchainDir = getArtifactPath(
          buildReport.step.dependencies.front());
      request.artifactDir = getArtifactPath(*build);
      request.outputDir = getOutputDir(step.stage, step.target, "test",
                                       buildReport.fingerprint);
      break;
    }
    }

    return work;
  }

  void startStep(unsigned index, basic::ExecutionQueue& queue) {
    auto& report = summary.steps[index];
    const auto& step = report.step;

    if (step.kind == PlanStepKind::Build ||
        step.kind == PlanStepKind::FixedPoint) {
      auto lookup = cache.lookup(report.fingerprint);
      if (!lookup) {
        failStep(index, lookup.takeError());
        return;
      }
      if (lookup->isHit()) {
        report.artifactPath = lookup->entry.path;
        completeStep(index, StepOutcome::CacheHit);
        return;
      }
      if (lookup->status == CacheLookupStatus::Corrupted) {
        if (trace.isOpen())
          trace.cacheEntryCorrupted(report.fingerprint.toHex(),
                                    lookup->reason);
        delegate.cacheEntryCorrupted(report.fingerprint, lookup->reason);
      }
    }

    switch (step.kind) {
    case PlanStepKind::Fetch:
      break;
    case PlanStepKind::Build:
      setState(OrchestratorState::Building, step.stage);
      break;
    case PlanStepKind::FixedPoint:
      setState(OrchestratorState::Validating);
      break;
    case PlanStepKind::Test:
      setState(OrchestratorState::Testing);
      break;
    case PlanStepKind::Install:
      setState(OrchestratorState::Installing);
      break;
    }

    StepWork work = prepareWork(index);
    if (step.kind != PlanStepKind::Install) {
      report.commandLine = ToolchainInvoker::getCommandLine(work.request);
      descriptors[index]->commandLine =
        basic::formatShellCommand(report.commandLine);
    }

    if (trace.isOpen())
      trace.stepStarted(index);
    delegate.stepStarted(report);

    ++stepsInFlight;
    queue.addJob(basic::QueueJob(
        descriptors[index].get(),
        [this, work](basic::QueueJobContext* context) {
          StepEvent event = executeStep(work, context);
          // Stop before this lane takes its next job.
          if (stopsRun(work, event))
            halted = true;
          {
            std::lock_guard<std::mutex> guard(eventsMutex);
            events.push_back(std::move(event));
          }
          eventsCondition.notify_one();
        }));
  }

  /// Whether the failure reported by \p event ends the run. This must agree
  /// with failStep().
  bool stopsRun(const StepWork& work, const StepEvent& event) const {
    if (event.skipped || event.cacheHit)
      return false;
    if (event.error.hasValue()) {
      if (event.error->kind == ErrorKind::Cancelled ||
          event.error->kind == ErrorKind::FixedPointMismatch)
        return true;
      return !config.keepGoing;
    }
    if (work.kind == PlanStepKind::Install)
      return false;
    return !event.result.isSuccess() && !config.keepGoing;
  }

  /// Perform a step's work. This runs on a worker thread, and must not touch
  /// the run state.
  StepEvent executeStep(const StepWork& work, basic::QueueJobContext* context) {
    StepEvent event;
    event.index = work.index;

    if (cancelled || context->isCancelled()) {
      event.error = ErrorDescription{ ErrorKind::Cancelled, "cancelled", {} };
      return event;
    }

    // A step queued before the run stopped is not started.
    if (halted) {
      event.skipped = true;
      return event;
    }

    if (work.kind == PlanStepKind::Build ||
        work.kind == PlanStepKind::FixedPoint) {
      auto lock = cache.acquireLock(work.fingerprint);
      if (!lock) {
        event.error = describeError(lock.takeError());
        return event;
      }
      event.lock = std::move(*lock);

      // Another process may have committed the artifact while we waited.
      auto lookup = cache.lookup(work.fingerprint);
      if (!lookup) {
        event.error = describeError(lookup.takeError());
        return event;
      }
      if (lookup->isHit()) {
        event.cacheHit = true;
        event.entry = lookup->entry;
        return event;
      }
    }

    if (work.kind == PlanStepKind::Install) {
      install(work, event);
      return event;
    }

    event.result = invoker.run(work.request);
    if (work.kind == PlanStepKind::FixedPoint && event.result.isSuccess())
      compareFixedPoint(work, event);
    return event;
  }

  void compareFixedPoint(const StepWork& work, StepEvent& event) {
    std::vector<std::string> ignore = config.fixedPointIgnore;
    ignore.push_back(BuildCache::getEntryMarkerName().str());

    std::string error;
    TreeManifest expected;
    TreeManifest actual;
    if (!computeTreeManifest(fs, work.sourceArtifact, ignore,
                             /*hashContents=*/true, expected, &error) ||
        !computeTreeManifest(fs, event.result.artifactDir, ignore,
                             /*hashContents=*/true, actual, &error)) {
      fs.remove(event.result.artifactDir);
      event.error = ErrorDescription{ ErrorKind::IO, error, {} };
      return;
    }
    if (expected.getDigest() == actual.getDigest())
      return;

    std::string message = "stage " + std::to_string(work.request.stage - 1) +
      " is not a fixed point: rebuilding it with itself changed its output";
    for (const auto& difference: diffTreeManifests(expected, actual))
      message += "\n  " + difference;
    fs.remove(event.result.artifactDir);
    event.error = ErrorDescription{ ErrorKind::FixedPointMismatch, message,
                                    {} };
  }

  void install(const StepWork& work, StepEvent& event) {
    std::string error;
    std::string stagingPath = work.installPath + ".partial";

    fs.remove(stagingPath);
    if (!fs.createDirectories(config.installPrefix)) {
      event.error = ErrorDescription{
        ErrorKind::IO,
        "unable to create install prefix '" + config.installPrefix + "'", {} };
      return;
    }
    if (!fs.copyTree(work.sourceArtifact, stagingPath, &error) ||
        !fs.remove(stagingPath + "/" +
                   BuildCache::getEntryMarkerName().str()) ||
        !fs.remove(work.installPath) ||
        !fs.rename(stagingPath, work.installPath, &error)) {
      fs.remove(stagingPath);
      if (error.empty())
        error = "unable to replace '" + work.installPath + "'";
      event.error = ErrorDescription{ ErrorKind::IO, error, {} };
      return;
    }
    event.installedPath = work.installPath;
  }

  void handleEvent(StepEvent event) {
    unsigned index = event.index;
    auto& report = summary.steps[index];
    const auto& step = report.step;

    if (event.error.hasValue()) {
      failStep(index, std::move(*event.error));
      return;
    }

    if (event.skipped) {
      finishStep(index, StepOutcome::Skipped);
      skipDependents(index);
      return;
    }

    if (event.cacheHit) {
      report.artifactPath = event.entry.path;
      completeStep(index, StepOutcome::CacheHit);
      return;
    }

    if (step.kind == PlanStepKind::Install) {
      report.artifactPath = event.installedPath;
      completeStep(index, StepOutcome::Completed);
      return;
    }

    BuildResult& result = event.result;
    report.diagnostics = result.diagnostics;

    // Work finishing after a cancellation is discarded.
    if (result.isSuccess() && cancelled) {
      fs.remove(result.artifactDir);
      result.kind = BuildResult::Kind::ProcessError;
      result.cancelled = true;
    }

    if (!result.isSuccess()) {
      ErrorKind kind = ErrorKind::Process;
      if (result.cancelled)
        kind = ErrorKind::Cancelled;
      else if (result.kind == BuildResult::Kind::CompileError)
        kind = ErrorKind::Compile;
      failStep(index, ErrorDescription{
          kind, step.getName() + " failed: " + result.getFailureDescription(),
          {} });
      return;
    }

    if (step.kind == PlanStepKind::Test) {
      completeStep(index, StepOutcome::Completed);
      return;
    }

    CacheEntry description;
    description.fingerprint = report.fingerprint;
    description.stage = step.stage;
    description.kind = step.kind == PlanStepKind::Build ?
      StepKind::Build : StepKind::FixedPoint;
    description.host = step.host;
    description.target = step.target;
    auto entry = cache.commit(description, result.artifactDir);
    fs.remove(result.artifactDir);
    if (!entry) {
      failStep(index, entry.takeError());
      return;
    }
    report.artifactPath = entry->path;
    completeStep(index, StepOutcome::Completed);
  }

  void executePlan() {
    // Every step depends on a fetch, so the fetches have already made the
    // first steps ready.
    auto queue = basic::createLaneBasedExecutionQueue(
        *this, int(config.getEffectiveJobs()));
    {
      std::lock_guard<std::mutex> guard(currentQueueMutex);
      currentQueue = queue.get();
    }
    if (cancelled)
      queue->cancelAllJobs();

    while (true) {
      // Start everything which is ready; a step is only ready once all of its
      // producers are committed.
      while (!halted && !cancelled && !readySteps.empty()) {
        unsigned index = readySteps.front();
        readySteps.pop_front();
        if (summary.steps[index].outcome == StepOutcome::Pending)
          startStep(index, *queue);
      }

      if (stepsInFlight == 0)
        break;

      StepEvent event;
      {
        std::unique_lock<std::mutex> lock(eventsMutex);
        eventsCondition.wait(lock, [&] { return !events.empty(); });
        event = std::move(events.front());
        events.pop_front();
      }
      --stepsInFlight;
      handleEvent(std::move(event));
    }

    {
      std::lock_guard<std::mutex> guard(currentQueueMutex);
      currentQueue = nullptr;
    }
  }

  /// @}

public:
  OrchestratorImpl(const BootstrapConfig& config,
                   const SnapshotManifest& manifest, basic::FileSystem& fs,
                   BuildCache& cache, SnapshotTransport& transport,
                   OrchestratorDelegate& delegate)
      : config(config), manifest(manifest), fs(fs), cache(cache),
        delegate(delegate),
        snapshots(manifest, fs, transport, config.cacheDir, config.retryCount,
                  config.snapshotMirror, this),
        invoker(fs) {}

  ~OrchestratorImpl() {
    if (trace.isOpen()) {
      std::string error;
      if (!trace.close(&error))
        delegate.hadError(ErrorDescription{ ErrorKind::IO, error, {} });
    }
  }

  bool enableTracing(StringRef path, std::string* error_out) {
    return trace.open(path.str(), error_out);
  }

  void setRetrySleepFunction(
      std::function<void(std::chrono::milliseconds)> fn) {
    snapshots.setSleepFunction(std::move(fn));
  }

  void setCancellationGracePeriod(std::chrono::milliseconds gracePeriod) {
    invoker.setCancellationGracePeriod(gracePeriod);
  }

  OrchestratorState getState() const { return state; }

  RunSummary run(const OrchestratorRequest& request) {
    summary = RunSummary();
    descriptors.clear();
    readySteps.clear();
    stepsInFlight = 0;
    halted = false;
    unsupportedFetches.clear();

    if (trace.isOpen())
      trace.runStarted(getActionName(request.action));

    setState(OrchestratorState::Planning);
    bool planned = computePlan(request);
    if (planned) {
      delegate.planComputed(plan);
      rejectUnsupportedHosts();

      if (request.dryRun) {
        predictOutcomes();
      } else {
        fetchSnapshots();
        executePlan();

        // Steps which never started, because the run stopped.
        for (auto& report: summary.steps) {
          if (report.outcome == StepOutcome::Pending)
            finishStep(report.index, StepOutcome::Skipped);
        }

        if (auto err = cache.flushScheduledEvictions())
          recordError(std::move(err));
      }
    }

    if (cancelled)
      recordError(ErrorDescription{ ErrorKind::Cancelled, "cancelled", {} });

    setState(summary.succeeded() ? OrchestratorState::Done :
             OrchestratorState::Failed);
    summary.finalState = state;
    if (trace.isOpen())
      trace.runEnded(summary.getExitCode());
    return std::move(summary);
  }

  void cancel() {
    cancelled = true;
    snapshots.cancel();
    invoker.cancel();

    std::lock_guard<std::mutex> guard(currentQueueMutex);
    if (currentQueue)
      currentQueue->cancelAllJobs();
  }

  /// @name SnapshotManagerDelegate
  /// @{

  virtual void snapshotFetchStarted(const Platform& platform,
                                    StringRef url) override {
    delegate.snapshotFetchStarted(platform, url);
  }

  virtual void snapshotFetchRetrying(const Platform& platform,
                                     unsigned attempt, StringRef reason,
                                     std::chrono::milliseconds delay) override {
    delegate.snapshotFetchRetrying(platform, attempt, reason, delay);
  }

  /// @}

  /// @name ExecutionQueueDelegate
  /// @{

  // Progress is reported from the orchestrator thread as events arrive.
  virtual void queueJobStarted(basic::JobDescriptor*) override {}
  virtual void queueJobFinished(basic::JobDescriptor*) override {}

  /// @}
};

}

#pragma mark - Orchestrator

Orchestrator::Orchestrator(const BootstrapConfig& config,
                           const SnapshotManifest& manifest,
                           basic::FileSystem& fs, BuildCache& cache,
                           SnapshotTransport& transport,
                           OrchestratorDelegate& delegate)
    : impl(new OrchestratorImpl(config, manifest, fs, cache, transport,
                                delegate)) {}

Orchestrator::~Orchestrator() {
  delete static_cast<OrchestratorImpl*>(impl);
}

bool Orchestrator::enableTracing(StringRef path, std::string* error_out) {
  return static_cast<OrchestratorImpl*>(impl)->enableTracing(path, error_out);
}

void Orchestrator::setRetrySleepFunction(
    std::function<void(std::chrono::milliseconds)> fn) {
  static_cast<OrchestratorImpl*>(impl)->setRetrySleepFunction(std::move(fn));
}

void Orchestrator::setCancellationGracePeriod(
    std::chrono::milliseconds gracePeriod) {
  static_cast<OrchestratorImpl*>(impl)->setCancellationGracePeriod(
      gracePeriod);
}

RunSummary Orchestrator::run(const OrchestratorRequest& request) {
  return static_cast<OrchestratorImpl*>(impl)->run(request);
}

void Orchestrator::cancel() {
  static_cast<OrchestratorImpl*>(impl)->cancel();
}

OrchestratorState Orchestrator::getState() const {
  return static_cast<OrchestratorImpl*>(impl)->getState();
}
