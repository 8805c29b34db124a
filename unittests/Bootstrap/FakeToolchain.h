//===- FakeToolchain.h ------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_TESTS_FAKETOOLCHAIN
#define STAGEBUILD_TESTS_FAKETOOLCHAIN

#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Bootstrap/Platform.h"
#include "stagebuild/Bootstrap/SnapshotManager.h"
#include "stagebuild/Bootstrap/SnapshotManifest.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace stagebuild {
class TmpDir;

namespace unittests {

/// Get the text of a `/bin/sh` build tool which follows the toolchain
/// contract.
///
/// `build` writes a deterministic artifact into its output directory: a copy
/// of the tool itself, the concatenation of the `*.src` files in the source
/// directory and the target. Every invocation is appended to \p logPath as
/// `<mode> <stage> <host> <target>`.
///
/// The source directory controls failures:
///   - `fail-stage-<N>`: building stage N prints an error and exits with 1.
///   - `fail-target-<T>`: building any stage for target T fails the same
///     way.
///   - `crash-stage-<N>`: building stage N exits with 3.
///   - `sleep-stage-<N>`: building stage N sleeps for the seconds in the
///     file first.
///   - `nondeterministic`: the artifact records the stage being built.
///   - `fail-tests`: `test` exits with 1.
std::string getFakeBuildToolScript(StringRef logPath);

/// Write a complete stage 0 toolchain into \p relativeDir of \p tmp.
///
/// \returns The absolute path of the toolchain.
std::string writeFakeToolchain(TmpDir& tmp, StringRef relativeDir,
                               StringRef logPath);

/// Read the invocation log written by the fake build tool.
std::vector<std::string> readInvocationLog(StringRef logPath);

/// A snapshot transport serving in-memory archives.
///
/// An "archive" is an arbitrary string; unpacking one copies the toolchain
/// directory registered for it.
class FakeSnapshotTransport : public bootstrap::SnapshotTransport {
  struct Snapshot {
    std::string contents;
    std::string toolchainDir;
  };

  std::mutex mutex;
  llvm::StringMap<Snapshot> snapshots;

public:
  /// The number of fetches which fail before one succeeds.
  std::atomic<unsigned> failuresRemaining{0};

  std::atomic<unsigned> numFetches{0};
  std::atomic<unsigned> numUnpacks{0};
  std::atomic<bool> cancelled{false};

  /// Serve \p contents at \p url; unpacking it yields \p toolchainDir.
  ///
  /// \returns The checksum of \p contents.
  basic::Digest addSnapshot(StringRef url, StringRef contents,
                            StringRef toolchainDir);

  virtual bool fetch(StringRef url, StringRef destination,
                     std::string* error_out) override;

  virtual bool unpack(StringRef archive, StringRef destination,
                      std::string* error_out) override;

  virtual void cancel() override { cancelled = true; }
};

/// Get the YAML text of a snapshot manifest with one entry.
std::string getManifestEntryText(const bootstrap::Platform& platform,
                                 StringRef url, const basic::Digest& checksum,
                                 unsigned formatVersion = 1);

}
}

#endif
