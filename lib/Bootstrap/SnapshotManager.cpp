//===-- SnapshotManager.cpp -----------------------------------------------===//
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

#include "stagebuild/Bootstrap/SnapshotManager.h"

#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Bootstrap/BootstrapError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <thread>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

/// The file written into an installed snapshot once it is complete.
static const char* const snapshotMarkerName = ".stagebuild-snapshot";

SnapshotTransport::~SnapshotTransport() {}

SnapshotManagerDelegate::~SnapshotManagerDelegate() {}

namespace {

std::string getMarkerContents(const SnapshotEntry& entry) {
  return "sha256:" + entry.checksum.toHex() + "\n";
}

}

SnapshotManager::SnapshotManager(const SnapshotManifest& manifest,
                                 basic::FileSystem& fs,
                                 SnapshotTransport& transport,
                                 StringRef cacheDir, unsigned retryCount,
                                 StringRef mirror,
                                 SnapshotManagerDelegate* delegate)
    : manifest(manifest), fs(fs), transport(transport),
      cacheDir(cacheDir.str()), retryCount(retryCount), mirror(mirror.str()),
      delegate(delegate) {}

SnapshotManager::~SnapshotManager() {}

std::chrono::milliseconds SnapshotManager::getRetryDelay(unsigned retry) {
  const uint64_t baseDelay = 500;
  const uint64_t maxDelay = 30000;
  uint64_t delay = baseDelay;
  for (unsigned i = 0; i != retry && delay < maxDelay; ++i)
    delay *= 2;
  return std::chrono::milliseconds(std::min(delay, maxDelay));
}

std::string SnapshotManager::applyMirror(StringRef url, StringRef mirror) {
  if (mirror.empty())
    return url.str();

  StringRef basename = url;
  auto slash = url.rfind('/');
  if (slash != StringRef::npos)
    basename = url.substr(slash + 1);
  return mirror.rtrim('/').str() + "/" + basename.str();
}

std::string SnapshotManager::getInstallPath(const SnapshotEntry& entry) const {
  return cacheDir + "/stage0/" + entry.checksum.toHex();
}

bool SnapshotManager::isInstalled(const std::string& path,
                                  const SnapshotEntry& entry) {
  if (!fs.getFileInfo(path).isDirectory())
    return false;
  auto marker = fs.getFileContents(path + "/" + snapshotMarkerName);
  return marker && marker->getBuffer() == getMarkerContents(entry);
}

bool SnapshotManager::isAvailableOffline(const Platform& platform) {
  if (!manifest.contains(platform))
    return false;
  auto entry = manifest.lookup(platform);
  if (!entry) {
    llvm::consumeError(entry.takeError());
    return false;
  }
  return isInstalled(getInstallPath(*entry), *entry);
}

llvm::Expected<Artifact> SnapshotManager::ensureStage0(
    const Platform& platform) {
  ErrorContext context;
  context.stage = 0;
  context.platform = platform.str();

  if (cancelled)
    return makeError(ErrorKind::Cancelled, "snapshot fetch cancelled",
                     context);

  {
    std::lock_guard<std::mutex> guard(unusablePlatformsMutex);
    if (unusablePlatforms.count(platform)) {
      return makeError(ErrorKind::ChecksumMismatch,
                       "the snapshot for '" + platform.str() +
                       "' failed verification earlier in this run", context);
    }
  }

  auto entry = manifest.lookup(platform);
  if (!entry)
    return entry.takeError();

  Artifact artifact;
  artifact.stage = 0;
  artifact.host = platform;
  artifact.target = platform;
  artifact.path = getInstallPath(*entry);
  artifact.fingerprint = entry->checksum;
  context.fingerprint = entry->checksum.toHex();

  if (isInstalled(artifact.path, *entry))
    return artifact;

  for (const char* dir: { "locks", "stage0", "scratch" }) {
    std::string path = cacheDir + "/" + dir;
    if (!fs.createDirectories(path)) {
      return makeError(ErrorKind::IO,
                       "unable to create directory '" + path + "'", context);
    }
  }

  // Serialize installation of the same snapshot across processes, then look
  // again: the previous holder may have installed it.
  std::string error;
  auto lock = basic::FileLock::acquire(
      cacheDir + "/locks/stage0-" + entry->checksum.toHex() + ".lock", &error);
  if (!lock)
    return makeError(ErrorKind::IO, error, context);

  if (isInstalled(artifact.path, *entry))
    return artifact;

  if (auto err = install(*entry, artifact.path, context))
    return std::move(err);

  return artifact;
}

llvm::Error SnapshotManager::download(const SnapshotEntry& entry,
                                      StringRef url,
                                      const std::string& archivePath,
                                      const ErrorContext& context) {
  if (delegate)
    delegate->snapshotFetchStarted(entry.platform, url);

  for (unsigned attempt = 0; ; ++attempt) {
    if (cancelled)
      return makeError(ErrorKind::Cancelled, "snapshot fetch cancelled",
                       context);

    std::string error;
    fs.remove(archivePath);
    if (transport.fetch(url, archivePath, &error))
      return llvm::Error::success();
    fs.remove(archivePath);

    if (cancelled)
      return makeError(ErrorKind::Cancelled, "snapshot fetch cancelled",
                       context);

    if (attempt >= retryCount) {
      return makeError(ErrorKind::Network,
                       "unable to fetch snapshot '" + url + "' after " +
                       Twine(attempt + 1) +
                       (attempt == 0 ? " attempt: " : " attempts: ") + error,
                       context);
    }

    auto delay = getRetryDelay(attempt);
    if (delegate)
      delegate->snapshotFetchRetrying(entry.platform, attempt + 1, error,
                                      delay);
    if (sleepFn) {
      sleepFn(delay);
    } else {
      std::unique_lock<std::mutex> lock(retrySleepMutex);
      retrySleepCondition.wait_for(lock, delay,
                                   [&] { return cancelled.load(); });
    }
  }
}

llvm::Error SnapshotManager::install(const SnapshotEntry& entry,
                                     const std::string& path,
                                     const ErrorContext& context) {
  std::string hex = entry.checksum.toHex();
  std::string scratchDir = cacheDir + "/scratch";
  std::string archivePath = scratchDir + "/" + hex + ".partial";
  std::string url = applyMirror(entry.url, mirror);

  if (auto err = download(entry, url, archivePath, context))
    return err;

  // Verify the download before anything else looks at it.
  std::string error;
  basic::Digest actual;
  if (!basic::hashFile(archivePath, actual, &error)) {
    fs.remove(archivePath);
    return makeError(ErrorKind::IO, error, context);
  }
  if (actual != entry.checksum) {
    fs.remove(archivePath);
    {
      std::lock_guard<std::mutex> guard(unusablePlatformsMutex);
      unusablePlatforms.insert(entry.platform);
    }
    return makeError(ErrorKind::ChecksumMismatch,
                     "checksum mismatch for snapshot '" + url +
                     "' (expected sha256:" + hex + ", got sha256:" +
                     actual.toHex() + ")", context);
  }

  SmallString<256> unpackDir;
  if (std::error_code ec = llvm::sys::fs::createUniqueDirectory(
          scratchDir + "/unpack-" + hex, unpackDir)) {
    fs.remove(archivePath);
    return makeError(ErrorKind::IO,
                     "unable to create scratch directory (" + ec.message() +
                     ")", context);
  }
  std::string unpackPath = unpackDir.str().str();

  bool unpacked = transport.unpack(archivePath, unpackPath, &error);
  fs.remove(archivePath);
  if (!unpacked) {
    fs.remove(unpackPath);
    if (cancelled)
      return makeError(ErrorKind::Cancelled, "snapshot unpack cancelled",
                       context);
    return makeError(ErrorKind::IO,
                     "unable to unpack snapshot '" + url + "': " + error,
                     context);
  }

  // Archives which wrap everything in a single directory are installed from
  // inside it.
  std::string root = unpackPath;
  {
    std::error_code ec;
    std::vector<std::string> children;
    for (llvm::sys::fs::directory_iterator it(unpackPath, ec), end;
         it != end && !ec; it.increment(ec))
      children.push_back(it->path());
    if (ec) {
      fs.remove(unpackPath);
      return makeError(ErrorKind::IO,
                       "unable to read unpacked snapshot (" + ec.message() +
                       ")", context);
    }
    if (children.size() == 1 && fs.getFileInfo(children[0]).isDirectory())
      root = children[0];
  }

  // The marker is written last, so an interrupted install is never mistaken
  // for a complete one.
  if (!fs.writeFileContents(root + "/" + snapshotMarkerName,
                            getMarkerContents(entry), &error)) {
    fs.remove(unpackPath);
    return makeError(ErrorKind::IO, error, context);
  }

  // Replace any incomplete leftover of an earlier run.
  if (!fs.remove(path)) {
    fs.remove(unpackPath);
    return makeError(ErrorKind::IO,
                     "unable to remove incomplete snapshot '" + path + "'",
                     context);
  }
  if (!fs.rename(root, path, &error)) {
    fs.remove(unpackPath);
    return makeError(ErrorKind::IO, error, context);
  }
  if (root != unpackPath)
    fs.remove(unpackPath);

  return llvm::Error::success();
}

llvm::Error SnapshotManager::removeAll() {
  std::string path = cacheDir + "/stage0";
  if (!fs.remove(path)) {
    return makeError(ErrorKind::IO,
                     "unable to remove snapshots in '" + path + "'");
  }
  return llvm::Error::success();
}

void SnapshotManager::cancel() {
  {
    std::lock_guard<std::mutex> lock(retrySleepMutex);
    cancelled = true;
    retrySleepCondition.notify_all();
  }
  transport.cancel();
}
