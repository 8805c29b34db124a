//===-- BootstrapCommand.cpp ----------------------------------------------===//
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

#include "stagebuild/Commands/Commands.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/InterruptSignalAwaiter.h"
#include "stagebuild/Basic/ShellUtility.h"
#include "stagebuild/Basic/Version.h"
#include "stagebuild/Bootstrap/BootstrapError.h"
#include "stagebuild/Bootstrap/BootstrapInvocation.h"
#include "stagebuild/Bootstrap/BuildCache.h"
#include "stagebuild/Bootstrap/Configuration.h"
#include "stagebuild/Bootstrap/Orchestrator.h"
#include "stagebuild/Bootstrap/SnapshotManager.h"
#include "stagebuild/Bootstrap/SnapshotManifest.h"

#include "CommandLineStatusOutput.h"
#include "CommandUtil.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <cstdio>

using namespace stagebuild;
using namespace stagebuild::bootstrap;
using namespace stagebuild::commands;

namespace {

/// Reports orchestrator progress on the console.
class ConsoleOrchestratorDelegate : public OrchestratorDelegate {
  llvm::SourceMgr& sourceMgr;
  CommandLineStatusOutput& output;
  unsigned verbosity;

  /// The number of steps which do work, for the progress counter.
  unsigned numSteps = 0;
  unsigned numStarted = 0;

  std::chrono::steady_clock::time_point startTime =
    std::chrono::steady_clock::now();

  void writeNote(const Twine& message) {
    output.writeText(("note: " + message + "\n").str());
  }

public:
  ConsoleOrchestratorDelegate(llvm::SourceMgr& sourceMgr,
                              CommandLineStatusOutput& output,
                              unsigned verbosity)
      : sourceMgr(sourceMgr), output(output), verbosity(verbosity) {}

  virtual void stateChanged(OrchestratorState state,
                            unsigned stage) override {
    if (verbosity == 0)
      return;
    if (state == OrchestratorState::Building) {
      writeNote("building stage " + Twine(stage));
    } else {
      writeNote("state: " + getOrchestratorStateName(state));
    }
  }

  virtual void planComputed(const BuildPlan& plan) override {
    numSteps = plan.size();
    if (verbosity < 2)
      return;
    std::string text;
    llvm::raw_string_ostream os(text);
    os << "plan:\n";
    plan.dump(os);
    output.writeText(os.str());
  }

  virtual void snapshotFetchStarted(const Platform& platform,
                                    StringRef url) override {
    if (verbosity == 0) {
      output.setOrWriteLine("Fetching stage 0 for " + platform.str());
      return;
    }
    writeNote("fetching stage 0 for " + platform.str() + " from '" +
              url.str() + "'");
  }

  virtual void snapshotFetchRetrying(const Platform& platform,
                                     unsigned attempt, StringRef reason,
                                     std::chrono::milliseconds delay) override {
    output.finishLine();
    sourceMgr.PrintMessage(
        llvm::SMLoc{}, llvm::SourceMgr::DK_Warning,
        "fetching stage 0 for " + platform.str() + " failed (" + reason.str() +
        "), retrying in " + util::formatDuration(delay.count()) +
        " (attempt " + Twine(attempt + 1) + ")");
  }

  virtual void stepStarted(const StepReport& report) override {
    ++numStarted;
    std::string line = "[" + std::to_string(report.index + 1) + "/" +
      std::to_string(numSteps) + "] " + report.step.getName();
    if (verbosity == 0) {
      output.setOrWriteLine(line);
      return;
    }
    output.writeText(line + "\n");
    if (!report.commandLine.empty())
      output.writeText(util::indentLines(
                           basic::formatShellCommand(report.commandLine), 2));
  }

  virtual void stepFinished(const StepReport& report) override {
    switch (report.outcome) {
    case StepOutcome::CacheHit:
      if (verbosity != 0)
        writeNote(report.step.getName() + " is up to date");
      break;
    case StepOutcome::Completed:
      if (verbosity >= 2 && !report.diagnostics.empty())
        output.writeText(util::indentLines(report.diagnostics, 2));
      break;
    case StepOutcome::Failed:
      output.finishLine();
      if (!report.diagnostics.empty()) {
        llvm::errs() << util::indentLines(report.diagnostics, 2);
        llvm::errs().flush();
      }
      break;
    case StepOutcome::Skipped:
      if (verbosity != 0)
        writeNote("skipped " + report.step.getName());
      break;
    case StepOutcome::Pending:
      break;
    }
  }

  virtual void cacheEntryCorrupted(const Fingerprint& fingerprint,
                                   StringRef reason) override {
    output.finishLine();
    sourceMgr.PrintMessage(
        llvm::SMLoc{}, llvm::SourceMgr::DK_Warning,
        "cache entry " + fingerprint.toHex() + " is damaged (" + reason.str() +
        "), rebuilding");
  }

  virtual void hadError(const ErrorDescription& error) override {
    output.finishLine();
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error,
                           error.str());
  }

  uint64_t getElapsedMilliseconds() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
  }
};

void usage(FILE* fp) {
  int optionWidth = 25;
  fprintf(fp, "Usage: %s <command> [options]\n", getProgramName());
  fprintf(fp, "\nCommands:\n");
  fprintf(fp, "  %-*s %s\n", optionWidth, "build",
          "build the toolchain up to the final stage");
  fprintf(fp, "  %-*s %s\n", optionWidth, "test",
          "build, then run the final stage's tests");
  fprintf(fp, "  %-*s %s\n", optionWidth, "install",
          "build, then install the final stage");
  fprintf(fp, "  %-*s %s\n", optionWidth, "clean",
          "remove cached artifacts");
  fprintf(fp, "  %-*s %s\n", optionWidth, "validate",
          "build, then check the fixed point of every host");
  fprintf(fp, "\nOptions:\n");
  fflush(fp);
  llvm::raw_fd_ostream os(fileno(fp), /*shouldClose=*/false);
  BootstrapInvocation::getUsage(optionWidth, os);
}

/// Report \p error and get the exit code it maps to.
int reportError(llvm::SourceMgr& sourceMgr, llvm::Error error) {
  auto description = describeError(std::move(error));
  sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error,
                         description.str());
  return getExitCodeForErrorKind(description.kind);
}

/// Assemble the configuration from its layers: defaults, the configuration
/// file, the environment and the command line.
llvm::Error loadConfiguration(basic::FileSystem& fs,
                              const BootstrapInvocation& invocation,
                              BootstrapConfig& config) {
  SmallString<256> workingDir;
  if (auto ec = llvm::sys::fs::current_path(workingDir)) {
    return makeError(ErrorKind::IO, "unable to get the working directory: " +
                     ec.message());
  }

  if (!invocation.configPath.empty()) {
    SmallString<256> path(invocation.configPath);
    llvm::sys::fs::make_absolute(workingDir, path);
    if (auto err = loadConfigFile(fs, path, config))
      return err;
  }
  if (auto err = applyEnvironment(invocation.environment, config))
    return err;
  invocation.applyTo(config);
  if (auto err = config.resolveDefaults(invocation.environment, workingDir))
    return err;
  return config.validate();
}

int executeClean(llvm::SourceMgr& sourceMgr,
                 const BootstrapInvocation& invocation,
                 basic::FileSystem& fs, const BootstrapConfig& config) {
  auto cache = BuildCache::open(config.cacheDir, fs);
  if (!cache)
    return reportError(sourceMgr, cache.takeError());

  unsigned numRemoved = 0;
  if (invocation.corruptedOnly) {
    auto corrupted = (*cache)->verifyIntegrity();
    if (!corrupted)
      return reportError(sourceMgr, corrupted.takeError());
    for (const auto& fingerprint: *corrupted) {
      if (auto err = (*cache)->evict(fingerprint))
        return reportError(sourceMgr, std::move(err));
      ++numRemoved;
    }
    printf("removed %u damaged cache entries\n", numRemoved);
    return 0;
  }

  CacheFilter filter;
  filter.stage = invocation.stage;
  if (!invocation.targets.empty()) {
    if (invocation.targets.size() != 1) {
      sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error,
                             "'clean' accepts at most one '--target'");
      return getExitCodeForErrorKind(ErrorKind::InvalidConfiguration);
    }
    auto request = invocation.getRequest();
    if (!request)
      return reportError(sourceMgr, request.takeError());
    filter.target = request->targets.front();
  }

  auto removed = (*cache)->clear(filter);
  if (!removed)
    return reportError(sourceMgr, removed.takeError());
  numRemoved = *removed;

  // Without a filter the stage 0 snapshots go too.
  if (filter.empty()) {
    SnapshotManifest manifest;
    auto transport = createDefaultSnapshotTransport(fs, invocation.environment);
    SnapshotManager snapshots(manifest, fs, *transport, config.cacheDir,
                              config.retryCount);
    if (auto err = snapshots.removeAll())
      return reportError(sourceMgr, std::move(err));
    if (!fs.remove(config.buildDir)) {
      return reportError(sourceMgr,
                         makeError(ErrorKind::IO, "unable to remove '" +
                                   config.buildDir + "'"));
    }
  }

  printf("removed %u cache entries\n", numRemoved);
  return 0;
}

void printDryRun(const RunSummary& summary) {
  auto& os = llvm::outs();
  for (const auto& report: summary.steps) {
    os << "  " << report.step.getName();
    switch (report.step.kind) {
    case PlanStepKind::Fetch:
    case PlanStepKind::Build:
    case PlanStepKind::FixedPoint:
      os << (report.outcome == StepOutcome::CacheHit ? " (cached)" :
             " (would run)");
      break;
    case PlanStepKind::Test:
    case PlanStepKind::Install:
      os << " (would run)";
      break;
    }
    if (!report.fingerprint.isNull())
      os << " " << report.fingerprint.toHex();
    os << "\n";
  }
  os.flush();
}

}

int commands::executeBootstrapCommand(const std::vector<std::string>& args,
                                      const char* const* environment) {
  // The source manager to use for diagnostics.
  llvm::SourceMgr sourceMgr;

  BootstrapInvocation invocation{};
  invocation.environment = environment;
  invocation.parse(args, sourceMgr);

  if (invocation.showUsage) {
    usage(stdout);
    return 0;
  } else if (invocation.showVersion) {
    printf("%s\n", getStagebuildFullVersion().c_str());
    return 0;
  } else if (invocation.hadErrors) {
    fprintf(stderr, "\n");
    usage(stderr);
    return getExitCodeForErrorKind(ErrorKind::InvalidConfiguration);
  }

  if (!invocation.positionalArgs.empty()) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Error,
                           "unexpected argument '" +
                           invocation.positionalArgs.front() + "'");
    return getExitCodeForErrorKind(ErrorKind::InvalidConfiguration);
  }

  auto fs = basic::createLocalFileSystem();
  BootstrapConfig config;
  if (auto err = loadConfiguration(*fs, invocation, config))
    return reportError(sourceMgr, std::move(err));

  if (*invocation.action == BootstrapAction::Clean)
    return executeClean(sourceMgr, invocation, *fs, config);

  auto request = invocation.getRequest();
  if (!request)
    return reportError(sourceMgr, request.takeError());

  auto manifest = SnapshotManifest::load(*fs, config.snapshotManifest);
  if (!manifest)
    return reportError(sourceMgr, manifest.takeError());

  auto cache = BuildCache::open(config.cacheDir, *fs);
  if (!cache)
    return reportError(sourceMgr, cache.takeError());

  auto transport = createDefaultSnapshotTransport(*fs, environment);

  CommandLineStatusOutput output;
  std::string error;
  if (!output.open(stdout, environment, &error)) {
    return reportError(sourceMgr, makeError(ErrorKind::IO,
                                            "unable to open output: " + error));
  }

  ConsoleOrchestratorDelegate delegate(sourceMgr, output, config.verbosity);
  Orchestrator orchestrator(config, *manifest, *fs, **cache, *transport,
                            delegate);
  if (!invocation.traceFilePath.empty()) {
    if (!orchestrator.enableTracing(invocation.traceFilePath, &error)) {
      return reportError(sourceMgr, makeError(ErrorKind::IO,
                                              "unable to open trace file '" +
                                              invocation.traceFilePath +
                                              "': " + error));
    }
  }

  basic::InterruptSignalAwaiter::GlobalAwaiter.setInterruptHandler([&] {
      orchestrator.cancel();
    });
  auto summary = orchestrator.run(*request);
  basic::InterruptSignalAwaiter::GlobalAwaiter.resetInterruptHandler();

  output.finishLine();
  if (request->dryRun) {
    printDryRun(summary);
  } else if (summary.succeeded()) {
    unsigned numCached = summary.count(StepOutcome::CacheHit);
    unsigned numRan = summary.count(StepOutcome::Completed);
    output.writeText(getActionName(request->action).str() + " succeeded: " +
                     std::to_string(numRan) + " steps run, " +
                     std::to_string(numCached) + " up to date (" +
                     util::formatDuration(delegate.getElapsedMilliseconds()) +
                     ")\n");
  } else {
    fprintf(stderr, "%s failed: %u steps failed, %u skipped\n",
            getActionName(request->action).str().c_str(),
            summary.count(StepOutcome::Failed),
            summary.count(StepOutcome::Skipped));
  }

  if (!output.close(&error)) {
    sourceMgr.PrintMessage(llvm::SMLoc{}, llvm::SourceMgr::DK_Warning, error);
  }

  return summary.getExitCode();
}
