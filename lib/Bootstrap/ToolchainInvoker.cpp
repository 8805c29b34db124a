//===-- ToolchainInvoker.cpp ----------------------------------------------===//
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

#include "stagebuild/Bootstrap/ToolchainInvoker.h"

#include "stagebuild/Basic/FileSystem.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Path.h"

#include <signal.h>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

static bool hasBuildTool(basic::FileSystem& fs, StringRef artifactDir,
                         StringRef buildTool) {
  auto info = fs.getFileInfo(artifactDir.str() + "/" + buildTool.str());
  return info.isSymlink() || (info.isFile() && info.isExecutable);
}

std::string BuildResult::getFailureDescription() const {
  switch (kind) {
  case Kind::Success:
    return "succeeded";
  case Kind::CompileError:
    return "compile error (exit code " + std::to_string(exitCode) + ")";
  case Kind::ProcessError:
    break;
  }

  if (cancelled)
    return "cancelled";
  if (timedOut)
    return "timed out";
  if (!message.empty())
    return message;
  if (signal)
    return "terminated by signal " + std::to_string(signal);
  return "exited with code " + std::to_string(exitCode);
}

ToolchainInvoker::ToolchainInvoker(basic::FileSystem& fs,
                                   std::chrono::milliseconds gracePeriod)
    : fs(fs), gracePeriod(gracePeriod) {}

ToolchainInvoker::~ToolchainInvoker() {
  std::lock_guard<std::mutex> guard(killAfterTimeoutThreadMutex);
  if (killAfterTimeoutThread) {
    {
      std::unique_lock<std::mutex> lock(shutdownMutex);
      shutdown = true;
      shutdownCondition.notify_all();
    }
    killAfterTimeoutThread->join();
  }
}

void ToolchainInvoker::killAfterTimeout() {
  std::unique_lock<std::mutex> lock(shutdownMutex);
  if (!shutdownCondition.wait_for(lock, gracePeriod,
                                  [&] { return shutdown; })) {
    processGroup.signalAll(SIGKILL);
  }
}

void ToolchainInvoker::cancel() {
  {
    std::lock_guard<std::mutex> guard(processGroup.mutex);
    if (cancelled) return;
    cancelled = true;
    processGroup.close();
  }

  processGroup.signalAll(SIGINT);
  {
    std::lock_guard<std::mutex> guard(killAfterTimeoutThreadMutex);
    killAfterTimeoutThread = std::unique_ptr<std::thread>(
        new std::thread(&ToolchainInvoker::killAfterTimeout, this));
  }
}

std::vector<std::string> ToolchainInvoker::getCommandLine(
    const InvocationRequest& request) {
  std::vector<std::string> result;
  result.push_back(request.toolchainDir + "/" + request.buildTool);
  result.push_back(request.mode == InvocationMode::Build ? "build" : "test");
  result.push_back("--stage");
  result.push_back(std::to_string(request.stage));
  result.push_back("--host");
  result.push_back(request.host.str());
  result.push_back("--target");
  result.push_back(request.target.str());
  result.push_back("--source-dir");
  result.push_back(request.sourceDir);
  if (request.mode == InvocationMode::Build) {
    result.push_back("--output-dir");
    result.push_back(request.outputDir);
  } else {
    result.push_back("--artifact-dir");
    result.push_back(request.artifactDir);
  }
  return result;
}

std::string ToolchainInvoker::getScratchDir(const InvocationRequest& request) {
  return StringRef(request.outputDir).rtrim('/').str() + ".tmp";
}

void ToolchainInvoker::getEnvironment(const InvocationRequest& request,
                                      basic::POSIXEnvironment& environment) {
  std::string scratchDir = getScratchDir(request);
  environment.setIfMissing("PATH",
                           request.toolchainDir + "/bin:/usr/bin:/bin");
  environment.setIfMissing("HOME", scratchDir);
  environment.setIfMissing("TMPDIR", scratchDir);
  environment.setIfMissing("LANG", "C");
  environment.setIfMissing("LC_ALL", "C");
  environment.setIfMissing("SOURCE_DATE_EPOCH", "0");
  environment.setIfMissing("STAGEBUILD_STAGE", std::to_string(request.stage));
  environment.setIfMissing("STAGEBUILD_HOST", request.host.str());
  environment.setIfMissing("STAGEBUILD_TARGET", request.target.str());
}

BuildResult ToolchainInvoker::run(const InvocationRequest& request) {
  BuildResult result;
  result.kind = BuildResult::Kind::ProcessError;

  if (cancelled) {
    result.cancelled = true;
    return result;
  }

  // Validate the build tool before touching any directories.
  auto commandLine = getCommandLine(request);
  if (!hasBuildTool(fs, request.toolchainDir, request.buildTool)) {
    result.message = "build tool '" + commandLine[0] +
      "' is missing or not executable";
    return result;
  }

  std::string scratchDir = getScratchDir(request);
  bool isBuild = request.mode == InvocationMode::Build;

  // Start from a clean slate; a previous interrupted run may have left
  // anything behind.
  fs.remove(request.outputDir);
  fs.remove(scratchDir);
  if (!fs.createDirectories(request.outputDir) ||
      !fs.createDirectories(scratchDir)) {
    result.message = "unable to create output directory '" +
      request.outputDir + "'";
    fs.remove(request.outputDir);
    fs.remove(scratchDir);
    return result;
  }

  basic::POSIXEnvironment environment;
  getEnvironment(request, environment);

  SmallVector<StringRef, 16> args;
  for (const auto& arg: commandLine)
    args.push_back(arg);

  basic::ProcessAttributes attributes{ /*canSafelyInterrupt=*/true };
  attributes.workingDir = request.sourceDir;
  attributes.timeoutMilliseconds =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        request.timeout).count();

  std::string errors;
  auto processResult = basic::executeProcessAndCollect(
      processGroup, args, std::move(environment), attributes,
      &result.diagnostics, &errors);
  fs.remove(scratchDir);

  result.exitCode = processResult.exitCode;
  result.signal = processResult.signal;

  switch (processResult.status) {
  case basic::ProcessStatus::Succeeded:
    result.kind = BuildResult::Kind::Success;
    break;
  case basic::ProcessStatus::Cancelled:
    result.cancelled = true;
    break;
  case basic::ProcessStatus::TimedOut:
    result.timedOut = true;
    break;
  case basic::ProcessStatus::Failed:
    if (processResult.signal == 0 && processResult.exitCode == 1)
      result.kind = BuildResult::Kind::CompileError;
    else if (!errors.empty())
      result.message = StringRef(errors).trim().str();
    break;
  }

  // A successful build must have produced an artifact, and an artifact which
  // runs on the machine it was built on must be able to build the next stage.
  if (result.isSuccess() && isBuild) {
    std::vector<basic::TreeEntry> contents;
    std::string error;
    if (!fs.listTree(request.outputDir, {}, contents, &error)) {
      result.kind = BuildResult::Kind::ProcessError;
      result.message = error;
    } else if (contents.empty()) {
      result.kind = BuildResult::Kind::ProcessError;
      result.message = "build tool produced no output";
    } else if (request.host == request.target &&
               !hasBuildTool(fs, request.outputDir, request.buildTool)) {
      result.kind = BuildResult::Kind::ProcessError;
      result.message = "host artifact is missing its build tool '" +
        request.buildTool + "'";
    }
  }

  if (result.isSuccess() && isBuild) {
    result.artifactDir = request.outputDir;
  } else {
    fs.remove(request.outputDir);
  }
  return result;
}
