//===- Configuration.h ------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_CONFIGURATION_H
#define STAGEBUILD_BOOTSTRAP_CONFIGURATION_H

#include "stagebuild/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace stagebuild {
namespace basic {
class FileSystem;
}

namespace bootstrap {

/// The settings of a bootstrap run.
///
/// Values are layered with increasing precedence: the defaults below, a
/// configuration file (\see loadConfigFile), the environment (\see
/// applyEnvironment) and finally the command line.
struct BootstrapConfig {
  /// The number of steps to run concurrently, or 0 for the hardware
  /// concurrency.
  unsigned jobs = 0;

  /// The root of the artifact cache.
  std::string cacheDir;

  /// If set, the base URL snapshots are fetched from instead of the one in
  /// the manifest.
  std::string snapshotMirror;

  /// The number of retries after a failed snapshot download.
  unsigned retryCount = 3;

  /// The final stage to build.
  unsigned stages = 2;

  /// The snapshot manifest, defaulting to `<source-dir>/stage0.yaml`.
  std::string snapshotManifest;

  /// The toolchain source tree, defaulting to the working directory.
  std::string sourceDir;

  /// Where toolchain invocations write their outputs, defaulting to
  /// `<cache-dir>/build`.
  std::string buildDir;

  /// The build tool, relative to a toolchain artifact.
  std::string buildTool = "bin/build-tool";

  /// The maximum duration of a single toolchain invocation in seconds, or 0
  /// for no limit.
  unsigned stepTimeout = 0;

  /// Whether independent steps continue after a compile error.
  bool keepGoing = false;

  /// Whether `build` verifies the fixed point of the final stage.
  bool verifyFixedPoint = true;

  /// Glob patterns excluded from the fixed point comparison.
  std::vector<std::string> fixedPointIgnore;

  /// Glob patterns excluded from the source tree fingerprint.
  std::vector<std::string> sourceIgnore;

  /// Where `install` copies artifacts to.
  std::string installPrefix;

  /// The amount of detail reported (0-2).
  unsigned verbosity = 0;

  /// Get the effective number of concurrent steps.
  unsigned getEffectiveJobs() const;

  /// Fill in defaults which depend on the environment and make every path
  /// absolute.
  ///
  /// \param environment A `::main()` style environment, used for `HOME`.
  /// \param workingDir The directory relative paths are resolved against.
  llvm::Error resolveDefaults(const char* const* environment,
                              StringRef workingDir);

  /// Check the settings are consistent.
  llvm::Error validate() const;
};

/// Parse a configuration file's \p contents into \p config.
///
/// Only keys present in the file are assigned. Unknown keys are an error.
/// Relative paths are resolved against the directory containing \p path.
llvm::Error parseConfig(StringRef contents, StringRef path,
                        BootstrapConfig& config);

/// Load the configuration file at \p path into \p config.
llvm::Error loadConfigFile(basic::FileSystem& fs, StringRef path,
                           BootstrapConfig& config);

/// Apply the `STAGEBUILD_*` environment variables in \p environment.
llvm::Error applyEnvironment(const char* const* environment,
                             BootstrapConfig& config);

}
}

#endif
