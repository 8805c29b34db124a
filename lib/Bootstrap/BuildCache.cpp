//===-- BuildCache.cpp ----------------------------------------------------===//
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

#include "stagebuild/Bootstrap/BuildCache.h"

#include "stagebuild/Basic/BinaryCoding.h"
#include "stagebuild/Basic/FileSystem.h"
#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Bootstrap/BootstrapError.h"
#include "stagebuild/Bootstrap/TreeManifest.h"

#include "CacheIndex.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>

using namespace stagebuild;
using namespace stagebuild::bootstrap;

/// The integrity marker written into every entry directory.
static const char* const entryMarkerName = ".stagebuild-entry";

namespace {

/// The contents of an entry's integrity marker.
struct EntryMarker {
  /// Version History:
  /// * 1: Initial version.
  static const uint32_t currentVersion = 1;

  Fingerprint fingerprint;
  uint32_t stage = 0;
  uint8_t kind = 0;
  std::string host;
  std::string target;
  basic::Digest contentDigest;
  TreeManifest manifest;

  std::string encode() const {
    basic::BinaryEncoder coder;
    coder.write(currentVersion);
    coder.write(fingerprint);
    coder.write(stage);
    coder.write(kind);
    coder.writeString(host);
    coder.writeString(target);
    coder.write(contentDigest);
    coder.write(manifest);
    return coder.getData().str();
  }

  bool decode(StringRef data) {
    basic::BinaryDecoder coder(data);
    uint32_t version;
    coder.read(version);
    if (coder.hadError() || version != currentVersion)
      return false;
    coder.read(fingerprint);
    coder.read(stage);
    coder.read(kind);
    coder.readString(host);
    coder.readString(target);
    coder.read(contentDigest);
    coder.read(manifest);
    return coder.finish();
  }
};

uint64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

ErrorContext getContext(const Fingerprint& fingerprint) {
  ErrorContext context;
  context.fingerprint = fingerprint.toHex();
  return context;
}

class BuildCacheImpl {
  std::string cacheDir;

  basic::FileSystem& fs;

  CacheIndex index;

  /// The entries found to be corrupted by lookups.
  std::set<Fingerprint> scheduledEvictions;
  mutable std::mutex scheduledEvictionsMutex;

  std::string getEntryPath(const Fingerprint& fingerprint) const {
    return cacheDir + "/entries/" + fingerprint.toHex();
  }

  /// Interpret an index row, or explain why it can't be.
  bool getEntryForRow(const CacheIndexRow& row, CacheEntry& entry,
                      std::string* reason_out) {
    auto fingerprint = basic::Digest::fromHex(row.fingerprint);
    auto contentDigest = basic::Digest::fromHex(row.contentDigest);
    if (!fingerprint.hasValue() || !contentDigest.hasValue()) {
      *reason_out = "malformed digest in index row";
      return false;
    }
    if (row.kind > uint8_t(StepKind::FixedPoint)) {
      *reason_out = "unknown step kind in index row";
      return false;
    }

    auto host = Platform::parse(row.host);
    if (!host) {
      *reason_out = "invalid host in index row: " +
        llvm::toString(host.takeError());
      return false;
    }
    auto target = Platform::parse(row.target);
    if (!target) {
      *reason_out = "invalid target in index row: " +
        llvm::toString(target.takeError());
      return false;
    }

    entry.fingerprint = *fingerprint;
    entry.stage = row.stage;
    entry.kind = StepKind(row.kind);
    entry.host = *host;
    entry.target = *target;
    entry.path = cacheDir + "/" + row.path;
    entry.contentDigest = *contentDigest;
    entry.createdAt = row.createdAt;
    entry.valid = row.valid;
    return true;
  }

  /// Check the entry directory against its marker.
  ///
  /// A shallow check compares the file types and sizes recorded in the
  /// marker; a deep check re-hashes the whole tree.
  bool checkEntry(const CacheEntry& entry, bool deep,
                  std::string* reason_out) {
    if (!fs.getFileInfo(entry.path).isDirectory()) {
      *reason_out = "entry directory is missing";
      return false;
    }

    auto markerData = fs.getFileContents(entry.path + "/" + entryMarkerName);
    if (!markerData) {
      *reason_out = "integrity marker is missing";
      return false;
    }
    EntryMarker marker;
    if (!marker.decode(markerData->getBuffer())) {
      *reason_out = "integrity marker is unreadable";
      return false;
    }
    if (marker.fingerprint != entry.fingerprint ||
        marker.stage != entry.stage || marker.kind != uint8_t(entry.kind) ||
        marker.host != entry.host.str() ||
        marker.target != entry.target.str() ||
        marker.contentDigest != entry.contentDigest ||
        marker.manifest.getDigest() != entry.contentDigest) {
      *reason_out = "integrity marker does not match the index";
      return false;
    }

    if (!deep) {
      for (const auto& file: marker.manifest.entries) {
        auto info = fs.getFileInfo(entry.path + "/" + file.path);
        if (info.kind != file.kind) {
          *reason_out = "'" + file.path + "' is missing or changed type";
          return false;
        }
        if (info.isFile() && info.size != file.size) {
          *reason_out = "'" + file.path + "' changed size";
          return false;
        }
      }
      return true;
    }

    std::string error;
    TreeManifest actual;
    if (!computeTreeManifest(fs, entry.path, { entryMarkerName },
                             /*hashContents=*/true, actual, &error)) {
      *reason_out = error;
      return false;
    }
    if (actual.getDigest() != entry.contentDigest) {
      auto differences = diffTreeManifests(marker.manifest, actual, 1);
      *reason_out = "contents changed";
      if (!differences.empty())
        *reason_out += " (" + differences.front() + ")";
      return false;
    }
    return true;
  }

public:
  BuildCacheImpl(StringRef cacheDir, basic::FileSystem& fs)
      : cacheDir(cacheDir.rtrim('/').str()), fs(fs),
        index(this->cacheDir + "/index.db") {}

  StringRef getCacheDir() const { return cacheDir; }

  llvm::Error open() {
    for (const char* dir: { "", "/entries", "/scratch", "/locks" }) {
      std::string path = cacheDir + dir;
      if (!fs.createDirectories(path)) {
        return makeError(ErrorKind::IO,
                         "unable to create cache directory '" + path + "'");
      }
    }

    // Creating the index must not race with another process doing the same.
    std::string error;
    auto lock = basic::FileLock::acquire(cacheDir + "/locks/index.lock",
                                         &error);
    if (!lock)
      return makeError(ErrorKind::IO, error);
    if (!index.open(&error))
      return makeError(ErrorKind::IO, error);
    return llvm::Error::success();
  }

  llvm::Expected<CacheLookup> lookup(const Fingerprint& fingerprint,
                                     bool scheduleEviction) {
    std::string error;
    CacheIndexRow row;
    bool found;
    if (!index.lookup(fingerprint.toHex(), row, &found, &error))
      return makeError(ErrorKind::IO, error, getContext(fingerprint));

    CacheLookup result;
    if (!found) {
      if (fs.getFileInfo(getEntryPath(fingerprint)).isMissing())
        return result;
      // A commit which was interrupted after the rename.
      result.reason = "entry directory has no index row";
    } else if (getEntryForRow(row, result.entry, &result.reason)) {
      if (!result.entry.valid) {
        result.reason = "entry is marked invalid";
      } else if (checkEntry(result.entry, /*deep=*/false, &result.reason)) {
        result.status = CacheLookupStatus::Hit;
        return result;
      }
    }

    result.status = CacheLookupStatus::Corrupted;
    result.entry.fingerprint = fingerprint;
    if (scheduleEviction) {
      std::lock_guard<std::mutex> guard(scheduledEvictionsMutex);
      scheduledEvictions.insert(fingerprint);
    }
    return result;
  }

  llvm::Expected<CacheEntry> commit(const CacheEntry& description,
                                    StringRef artifactDir) {
    const Fingerprint& fingerprint = description.fingerprint;
    ErrorContext context = getContext(fingerprint);
    context.stage = description.stage;
    context.platform = description.target.str();

    auto existing = lookup(fingerprint, /*scheduleEviction=*/true);
    if (!existing)
      return existing.takeError();
    if (existing->isHit())
      return existing->entry;
    if (existing->status == CacheLookupStatus::Corrupted) {
      if (auto err = evict(fingerprint))
        return std::move(err);
    }

    std::string error;
    std::string hex = fingerprint.toHex();
    std::string entryPath = getEntryPath(fingerprint);

    EntryMarker marker;
    marker.fingerprint = fingerprint;
    marker.stage = description.stage;
    marker.kind = uint8_t(description.kind);
    marker.host = description.host.str();
    marker.target = description.target.str();
    if (!computeTreeManifest(fs, artifactDir, { entryMarkerName },
                             /*hashContents=*/true, marker.manifest, &error))
      return makeError(ErrorKind::IO, error, context);
    marker.contentDigest = marker.manifest.getDigest();

    // Assemble the entry in scratch space, then rename it into place.
    SmallString<256> staging;
    if (std::error_code ec = llvm::sys::fs::createUniqueDirectory(
            cacheDir + "/scratch/commit-" + hex, staging)) {
      return makeError(ErrorKind::IO,
                       "unable to create scratch directory (" +
                       ec.message() + ")", context);
    }
    std::string stagingPath = staging.str().str();
    std::string stagedEntry = stagingPath + "/entry";

    if (!fs.moveTree(artifactDir.str(), stagedEntry, &error) ||
        !fs.writeFileContents(stagedEntry + "/" + entryMarkerName,
                              marker.encode(), &error) ||
        !fs.rename(stagedEntry, entryPath, &error)) {
      fs.remove(stagingPath);
      return makeError(ErrorKind::IO, "unable to commit artifact: " + error,
                       context);
    }
    fs.remove(stagingPath);

    CacheIndexRow row;
    row.fingerprint = hex;
    row.stage = description.stage;
    row.kind = uint8_t(description.kind);
    row.host = description.host.str();
    row.target = description.target.str();
    row.path = "entries/" + hex;
    row.contentDigest = marker.contentDigest.toHex();
    row.createdAt = getCurrentTime();
    row.valid = true;

    bool inserted;
    if (!index.insert(row, &inserted, &error)) {
      fs.remove(entryPath);
      return makeError(ErrorKind::IO, error, context);
    }

    CacheEntry result;
    if (!inserted) {
      // Another writer got there first; its entry wins.
      auto winner = lookup(fingerprint, /*scheduleEviction=*/true);
      if (!winner)
        return winner.takeError();
      if (!winner->isHit()) {
        return makeError(ErrorKind::CacheCorruption,
                         "concurrent commit left a corrupted entry: " +
                         winner->reason, context);
      }
      return winner->entry;
    }

    if (!getEntryForRow(row, result, &error))
      return makeError(ErrorKind::CacheCorruption, error, context);
    return result;
  }

  llvm::Error evict(const Fingerprint& fingerprint) {
    std::string error;
    std::string entryPath = getEntryPath(fingerprint);

    // Removing the row first makes the entry invisible before its files go.
    if (!index.remove(fingerprint.toHex(), &error))
      return makeError(ErrorKind::IO, error, getContext(fingerprint));
    if (!fs.remove(entryPath)) {
      return makeError(ErrorKind::IO,
                       "unable to remove cache entry '" + entryPath + "'",
                       getContext(fingerprint));
    }

    std::lock_guard<std::mutex> guard(scheduledEvictionsMutex);
    scheduledEvictions.erase(fingerprint);
    return llvm::Error::success();
  }

  std::vector<Fingerprint> getScheduledEvictions() const {
    std::lock_guard<std::mutex> guard(scheduledEvictionsMutex);
    return std::vector<Fingerprint>(scheduledEvictions.begin(),
                                    scheduledEvictions.end());
  }

  llvm::Error flushScheduledEvictions() {
    for (const auto& fingerprint: getScheduledEvictions()) {
      // The entry may have been repaired by another process meanwhile.
      auto lock = acquireLock(fingerprint);
      if (!lock)
        return lock.takeError();

      auto result = lookup(fingerprint, /*scheduleEviction=*/false);
      if (!result)
        return result.takeError();
      if (result->status == CacheLookupStatus::Corrupted) {
        if (auto err = evict(fingerprint))
          return err;
      } else {
        std::lock_guard<std::mutex> guard(scheduledEvictionsMutex);
        scheduledEvictions.erase(fingerprint);
      }
    }
    return llvm::Error::success();
  }

  llvm::Expected<std::vector<Fingerprint>> verifyIntegrity() {
    std::string error;
    std::vector<CacheIndexRow> rows;
    if (!index.getRows(rows, &error))
      return makeError(ErrorKind::IO, error);

    std::vector<Fingerprint> corrupted;
    std::set<std::string> indexed;
    for (const auto& row: rows) {
      indexed.insert(row.fingerprint);

      auto fingerprint = basic::Digest::fromHex(row.fingerprint);
      if (!fingerprint.hasValue()) {
        return makeError(ErrorKind::CacheCorruption,
                         "the cache index contains a malformed fingerprint '" +
                         row.fingerprint + "'; run 'stagebuild clean'");
      }

      std::string reason;
      CacheEntry entry;
      if (!getEntryForRow(row, entry, &reason) || !entry.valid ||
          !checkEntry(entry, /*deep=*/true, &reason))
        corrupted.push_back(*fingerprint);
    }

    // Entry directories the index doesn't know about.
    std::error_code ec;
    std::string entriesDir = cacheDir + "/entries";
    for (llvm::sys::fs::directory_iterator it(entriesDir, ec), end;
         it != end && !ec; it.increment(ec)) {
      StringRef name = llvm::sys::path::filename(it->path());
      if (indexed.count(name.str()))
        continue;
      if (auto fingerprint = basic::Digest::fromHex(name))
        corrupted.push_back(*fingerprint);
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return makeError(ErrorKind::IO, "unable to list '" + entriesDir +
                       "' (" + ec.message() + ")");
    }

    std::sort(corrupted.begin(), corrupted.end());
    return corrupted;
  }

  llvm::Expected<std::vector<CacheEntry>> entries() {
    std::string error;
    std::vector<CacheIndexRow> rows;
    if (!index.getRows(rows, &error))
      return makeError(ErrorKind::IO, error);

    // Rows which can't be interpreted are not entries; they are reported by
    // verifyIntegrity().
    std::vector<CacheEntry> result;
    for (const auto& row: rows) {
      CacheEntry entry;
      std::string reason;
      if (getEntryForRow(row, entry, &reason))
        result.push_back(std::move(entry));
    }
    return result;
  }

  llvm::Expected<unsigned> clear(const CacheFilter& filter) {
    std::string error;
    unsigned count = 0;

    if (filter.empty()) {
      std::vector<CacheIndexRow> rows;
      if (!index.getRows(rows, &error))
        return makeError(ErrorKind::IO, error);
      for (const auto& row: rows) {
        if (!index.remove(row.fingerprint, &error))
          return makeError(ErrorKind::IO, error);
        ++count;
      }
      for (const char* dir: { "/entries", "/scratch" }) {
        std::string path = cacheDir + dir;
        if (!fs.remove(path) || !fs.createDirectories(path)) {
          return makeError(ErrorKind::IO,
                           "unable to clear '" + path + "'");
        }
      }
      std::lock_guard<std::mutex> guard(scheduledEvictionsMutex);
      scheduledEvictions.clear();
      return count;
    }

    auto all = entries();
    if (!all)
      return all.takeError();
    for (const auto& entry: *all) {
      if (!filter.matches(entry))
        continue;
      if (auto err = evict(entry.fingerprint))
        return std::move(err);
      ++count;
    }
    return count;
  }

  llvm::Expected<std::unique_ptr<basic::FileLock>>
  acquireLock(const Fingerprint& fingerprint) {
    std::string locksDir = cacheDir + "/locks";
    if (!fs.createDirectories(locksDir)) {
      return makeError(ErrorKind::IO,
                       "unable to create directory '" + locksDir + "'");
    }

    std::string error;
    auto lock = basic::FileLock::acquire(
        locksDir + "/" + fingerprint.toHex() + ".lock", &error);
    if (!lock)
      return makeError(ErrorKind::IO, error, getContext(fingerprint));
    return std::move(lock);
  }
};

}

#pragma mark - BuildCache

BuildCache::BuildCache(void* impl) : impl(impl) {}

BuildCache::~BuildCache() {
  delete static_cast<BuildCacheImpl*>(impl);
}

llvm::Expected<std::unique_ptr<BuildCache>>
BuildCache::open(StringRef cacheDir, basic::FileSystem& fs) {
  std::unique_ptr<BuildCacheImpl> impl(new BuildCacheImpl(cacheDir, fs));
  if (auto err = impl->open())
    return std::move(err);
  return std::unique_ptr<BuildCache>(new BuildCache(impl.release()));
}

StringRef BuildCache::getEntryMarkerName() {
  return entryMarkerName;
}

StringRef BuildCache::getCacheDir() const {
  return static_cast<BuildCacheImpl*>(impl)->getCacheDir();
}

llvm::Expected<CacheLookup> BuildCache::lookup(const Fingerprint& fingerprint) {
  return static_cast<BuildCacheImpl*>(impl)->lookup(
      fingerprint, /*scheduleEviction=*/true);
}

llvm::Expected<CacheEntry> BuildCache::commit(const CacheEntry& description,
                                              StringRef artifactDir) {
  return static_cast<BuildCacheImpl*>(impl)->commit(description, artifactDir);
}

llvm::Error BuildCache::evict(const Fingerprint& fingerprint) {
  return static_cast<BuildCacheImpl*>(impl)->evict(fingerprint);
}

std::vector<Fingerprint> BuildCache::getScheduledEvictions() const {
  return static_cast<BuildCacheImpl*>(impl)->getScheduledEvictions();
}

llvm::Error BuildCache::flushScheduledEvictions() {
  return static_cast<BuildCacheImpl*>(impl)->flushScheduledEvictions();
}

llvm::Expected<std::vector<Fingerprint>> BuildCache::verifyIntegrity() {
  return static_cast<BuildCacheImpl*>(impl)->verifyIntegrity();
}

llvm::Expected<std::vector<CacheEntry>> BuildCache::entries() {
  return static_cast<BuildCacheImpl*>(impl)->entries();
}

llvm::Expected<unsigned> BuildCache::clear(const CacheFilter& filter) {
  return static_cast<BuildCacheImpl*>(impl)->clear(filter);
}

llvm::Expected<std::unique_ptr<basic::FileLock>>
BuildCache::acquireLock(const Fingerprint& fingerprint) {
  return static_cast<BuildCacheImpl*>(impl)->acquireLock(fingerprint);
}
