//===- BootstrapInvocation.h ------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_BOOTSTRAPINVOCATION_H
#define STAGEBUILD_BOOTSTRAP_BOOTSTRAPINVOCATION_H

#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/StageGraph.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace llvm {
class SourceMgr;
}

namespace stagebuild {
namespace bootstrap {

struct BootstrapConfig;
struct OrchestratorRequest;

/// The command line parameters of a `stagebuild` invocation.
class BootstrapInvocation {
public:
  /// Whether the command usage should be printed.
  bool showUsage = false;

  /// Whether the command version should be printed.
  bool showVersion = false;

  /// The requested action, from the first positional argument.
  Optional<BootstrapAction> action;

  /// The final stage to build (`--stage`).
  Optional<unsigned> stage;

  /// The requested target triples (`--target`).
  std::vector<std::string> targets;

  /// The requested host triples (`--host`).
  std::vector<std::string> hosts;

  /// The number of concurrent steps (`-j`, `--jobs`).
  Optional<unsigned> jobs;

  /// The configuration file to load, if any.
  std::string configPath;

  /// @name Configuration Overrides
  /// @{

  std::string manifestPath;
  std::string sourceDir;
  std::string cacheDir;
  std::string installPrefix;
  bool keepGoing = false;

  /// @}

  /// The path of the trace output file to use, if any.
  std::string traceFilePath;

  /// The number of `-v` flags.
  unsigned verbosity = 0;

  /// Whether to print the plan without running it.
  bool dryRun = false;

  /// For `clean`, evict only the entries failing the integrity check.
  bool corruptedOnly = false;

  /// The base environment, in the format of `::main()`.
  const char* const* environment = nullptr;

  /// Any positional arguments after the action.
  std::vector<std::string> positionalArgs;

  /// Whether there were any parsing errors.
  bool hadErrors = false;

public:
  /// Get the appropriate "usage" text to use for the built in arguments.
  static void getUsage(int optionWidth, raw_ostream& os);

  /// Parse the invocation parameters from the given arguments.
  ///
  /// \param sourceMgr The source manager to use for diagnostics.
  void parse(ArrayRef<std::string> args, llvm::SourceMgr& sourceMgr);

  /// Apply the command line overrides to \p config.
  void applyTo(BootstrapConfig& config) const;

  /// Form the orchestrator request for the invocation, checking the
  /// requested platforms.
  llvm::Expected<OrchestratorRequest> getRequest() const;
};

}
}

#endif
