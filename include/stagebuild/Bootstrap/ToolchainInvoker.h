//===- ToolchainInvoker.h ---------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_TOOLCHAININVOKER_H
#define STAGEBUILD_BOOTSTRAP_TOOLCHAININVOKER_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Basic/POSIXEnvironment.h"
#include "stagebuild/Basic/Subprocess.h"
#include "stagebuild/Bootstrap/Platform.h"

#include "llvm/ADT/StringRef.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stagebuild {
namespace basic {
class FileSystem;
}

namespace bootstrap {

enum class InvocationMode {
  /// Build a new artifact into the output directory.
  Build,

  /// Run the toolchain's test suite against an existing artifact.
  Test,
};

/// A single invocation of a toolchain's build tool.
struct InvocationRequest {
  InvocationMode mode = InvocationMode::Build;

  /// The stage being built (or tested).
  unsigned stage = 0;

  Platform host;
  Platform target;

  /// The directory of the artifact whose build tool is run.
  std::string toolchainDir;

  std::string sourceDir;

  /// The directory the new artifact is written to. In test mode, a scratch
  /// directory which is removed afterwards.
  std::string outputDir;

  /// The artifact under test, in test mode.
  std::string artifactDir;

  /// The build tool, relative to \see toolchainDir.
  std::string buildTool;

  /// The time limit for the invocation, or zero for none.
  std::chrono::seconds timeout{0};
};

struct BuildResult {
  enum class Kind {
    Success,

    /// The build tool reported a compile error (exit status 1).
    CompileError,

    /// The build tool could not be run, crashed, timed out, was cancelled or
    /// produced no usable output.
    ProcessError,
  };

  Kind kind = Kind::ProcessError;

  /// The produced artifact, on success in build mode.
  std::string artifactDir;

  /// The merged output of the build tool.
  std::string diagnostics;

  int exitCode = -1;
  int signal = 0;
  bool timedOut = false;
  bool cancelled = false;

  /// A description of a process error not explained by the fields above.
  std::string message;

  bool isSuccess() const { return kind == Kind::Success; }

  /// Get a one line description of a failure.
  std::string getFailureDescription() const;
};

/// Runs build tools of staged toolchains as subprocesses.
///
/// Each invocation gets an environment built from scratch, so the build tool
/// cannot pick up unrelated toolchains from the calling environment, and runs
/// in its own process group. Invocations may run concurrently.
class ToolchainInvoker {
  ToolchainInvoker(const ToolchainInvoker&) STAGEBUILD_DELETED_FUNCTION;
  void operator=(const ToolchainInvoker&) STAGEBUILD_DELETED_FUNCTION;

  basic::FileSystem& fs;

  basic::ProcessGroup processGroup;

  std::atomic<bool> cancelled{false};

  /// The time processes are given to exit after SIGINT, before SIGKILL.
  std::chrono::milliseconds gracePeriod;

  /// Management of cancellation and SIGKILL escalation
  std::mutex killAfterTimeoutThreadMutex;
  std::unique_ptr<std::thread> killAfterTimeoutThread = nullptr;
  std::condition_variable shutdownCondition;
  std::mutex shutdownMutex;
  bool shutdown = false;

  void killAfterTimeout();

public:
  explicit ToolchainInvoker(basic::FileSystem& fs,
                            std::chrono::milliseconds gracePeriod =
                                std::chrono::seconds(10));
  ~ToolchainInvoker();

  /// Get the command line for \p request.
  static std::vector<std::string> getCommandLine(
      const InvocationRequest& request);

  /// Get the scratch directory used as `HOME` and `TMPDIR` for \p request.
  static std::string getScratchDir(const InvocationRequest& request);

  /// Populate \p environment for \p request.
  static void getEnvironment(const InvocationRequest& request,
                             basic::POSIXEnvironment& environment);

  /// Run \p request to completion.
  ///
  /// The output directory is created empty beforehand and removed again on
  /// any failure.
  BuildResult run(const InvocationRequest& request);

  /// Cancel all running and future invocations.
  ///
  /// Running build tools are sent SIGINT, and SIGKILL once the grace period
  /// passes.
  void cancel();

  bool isCancelled() const { return cancelled; }

  void setCancellationGracePeriod(std::chrono::milliseconds value) {
    gracePeriod = value;
  }
};

}
}

#endif
