//===- SnapshotManager.h ----------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_SNAPSHOTMANAGER_H
#define STAGEBUILD_BOOTSTRAP_SNAPSHOTMANAGER_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/Artifact.h"
#include "stagebuild/Bootstrap/BootstrapError.h"
#include "stagebuild/Bootstrap/SnapshotManifest.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace stagebuild {
namespace basic {
class FileSystem;
}

namespace bootstrap {

/// The network and archive operations used to install a snapshot.
///
/// NOTE: Implementations must be thread-safe with respect to \see cancel(),
/// which is called from an arbitrary thread.
class SnapshotTransport {
  SnapshotTransport(const SnapshotTransport&) STAGEBUILD_DELETED_FUNCTION;
  void operator=(const SnapshotTransport&) STAGEBUILD_DELETED_FUNCTION;

public:
  SnapshotTransport() {}
  virtual ~SnapshotTransport();

  /// Download \p url into the file \p destination.
  ///
  /// \returns True on success.
  virtual bool fetch(StringRef url, StringRef destination,
                     std::string* error_out) = 0;

  /// Unpack the archive \p archive into the existing directory
  /// \p destination.
  ///
  /// \returns True on success.
  virtual bool unpack(StringRef archive, StringRef destination,
                      std::string* error_out) = 0;

  /// Abort any in-progress operation.
  virtual void cancel() = 0;
};

/// Create the transport which copies `file://` URLs directly, downloads other
/// URLs with `curl`, and unpacks archives with `tar`.
///
/// \param environment A `::main()` style environment, from which only the
/// proxy variables are forwarded to the download subprocess.
std::unique_ptr<SnapshotTransport>
createDefaultSnapshotTransport(basic::FileSystem& fs,
                               const char* const* environment);

/// Observer of snapshot installation.
class SnapshotManagerDelegate {
public:
  virtual ~SnapshotManagerDelegate();

  /// Called before \p url is downloaded for \p platform.
  virtual void snapshotFetchStarted(const Platform& platform,
                                    StringRef url) = 0;

  /// Called after a failed download, before waiting \p delay to retry.
  virtual void snapshotFetchRetrying(const Platform& platform,
                                     unsigned attempt,
                                     StringRef reason,
                                     std::chrono::milliseconds delay) = 0;
};

/// Fetches, verifies and installs stage 0 toolchains.
///
/// Installed snapshots live in `<cache-dir>/stage0/<checksum>/` and are
/// reused without network access.
class SnapshotManager {
public:
  typedef std::function<void(std::chrono::milliseconds)> SleepFn;

private:
  const SnapshotManifest& manifest;
  basic::FileSystem& fs;
  SnapshotTransport& transport;
  std::string cacheDir;
  unsigned retryCount;
  std::string mirror;
  SnapshotManagerDelegate* delegate;
  SleepFn sleepFn;

  std::atomic<bool> cancelled{false};

  /// Wakes a retry delay early when this manager is cancelled.
  std::mutex retrySleepMutex;
  std::condition_variable retrySleepCondition;

  /// Platforms whose download did not match its checksum during this run.
  std::set<Platform> unusablePlatforms;
  std::mutex unusablePlatformsMutex;

  bool isInstalled(const std::string& path, const SnapshotEntry& entry);

  llvm::Error install(const SnapshotEntry& entry, const std::string& path,
                      const ErrorContext& context);

  llvm::Error download(const SnapshotEntry& entry, StringRef url,
                       const std::string& archivePath,
                       const ErrorContext& context);

public:
  SnapshotManager(const SnapshotManifest& manifest, basic::FileSystem& fs,
                  SnapshotTransport& transport, StringRef cacheDir,
                  unsigned retryCount, StringRef mirror = {},
                  SnapshotManagerDelegate* delegate = nullptr);
  ~SnapshotManager();

  /// Replace the function used to wait between retries.
  void setSleepFunction(SleepFn fn) { sleepFn = std::move(fn); }

  /// Get the stage 0 toolchain for \p platform, downloading it if needed.
  ///
  /// Safe to call concurrently, also from different processes sharing the
  /// cache directory.
  llvm::Expected<Artifact> ensureStage0(const Platform& platform);

  /// Get the directory snapshot \p entry is installed to.
  std::string getInstallPath(const SnapshotEntry& entry) const;

  /// Check whether the snapshot for \p platform is installed, without
  /// locking or network access.
  bool isAvailableOffline(const Platform& platform);

  /// Remove every installed snapshot.
  llvm::Error removeAll();

  /// Abort in-progress downloads; later calls fail as cancelled.
  void cancel();

  /// Get the delay before retry number \p retry (counting from 0).
  static std::chrono::milliseconds getRetryDelay(unsigned retry);

  /// Get the URL \p url is fetched from when \p mirror is configured.
  static std::string applyMirror(StringRef url, StringRef mirror);
};

}
}

#endif
