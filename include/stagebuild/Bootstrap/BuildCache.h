//===- BuildCache.h ---------------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_BUILDCACHE_H
#define STAGEBUILD_BOOTSTRAP_BUILDCACHE_H

#include "stagebuild/Basic/Compiler.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/Artifact.h"
#include "stagebuild/Bootstrap/Fingerprint.h"
#include "stagebuild/Bootstrap/Platform.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <vector>

namespace stagebuild {
namespace basic {
class FileLock;
class FileSystem;
}

namespace bootstrap {

enum class CacheLookupStatus {
  /// The entry is committed and intact.
  Hit,

  /// There is no entry for the fingerprint.
  Miss,

  /// There is an entry, but it failed its integrity check. It is never served,
  /// and is scheduled for eviction.
  Corrupted,
};

/// The result of a cache lookup.
struct CacheLookup {
  CacheLookupStatus status = CacheLookupStatus::Miss;

  /// The entry, for a hit.
  CacheEntry entry;

  /// Why the entry was considered corrupted.
  std::string reason;

  bool isHit() const { return status == CacheLookupStatus::Hit; }
};

/// Selects cache entries for \see BuildCache::clear().
struct CacheFilter {
  Optional<unsigned> stage;
  Optional<Platform> target;

  bool empty() const { return !stage.hasValue() && !target.hasValue(); }

  bool matches(const CacheEntry& entry) const {
    if (stage.hasValue() && entry.stage != *stage)
      return false;
    if (target.hasValue() && entry.target != *target)
      return false;
    return true;
  }
};

/// A content-addressed store of built artifacts, keyed by fingerprint.
///
/// Each entry is a directory `entries/<fingerprint>` holding the artifact and
/// an integrity marker, together with a row in an SQLite index. The index row
/// is the commit point: an entry is only visible once its row exists, and a
/// committed entry is never modified.
///
/// Lookups and commits may be performed from multiple threads. Processes
/// sharing a cache directory coordinate through \see acquireLock().
class BuildCache {
  void* impl;

  explicit BuildCache(void* impl);

public:
  ~BuildCache();

  /// Open (creating as necessary) the cache in \p cacheDir.
  static llvm::Expected<std::unique_ptr<BuildCache>>
  open(StringRef cacheDir, basic::FileSystem& fs);

  /// Get the cache directory.
  StringRef getCacheDir() const;

  /// Get the name of the integrity marker inside each entry directory.
  static StringRef getEntryMarkerName();

  /// Look up the entry for \p fingerprint.
  ///
  /// This never builds anything. A corrupted entry is reported as such and
  /// scheduled for eviction, but otherwise left in place.
  ///
  /// Only file types and sizes are checked against the integrity marker; a
  /// same-size change to a file's contents needs \see verifyIntegrity().
  llvm::Expected<CacheLookup> lookup(const Fingerprint& fingerprint);

  /// Commit the artifact in \p artifactDir as the entry described by
  /// \p description.
  ///
  /// The directory is moved into the cache. If an intact entry for the same
  /// fingerprint already exists, it is returned unchanged and \p artifactDir
  /// is left alone.
  llvm::Expected<CacheEntry> commit(const CacheEntry& description,
                                    StringRef artifactDir);

  /// Remove the entry for \p fingerprint, if present.
  llvm::Error evict(const Fingerprint& fingerprint);

  /// Get the fingerprints scheduled for eviction by lookups.
  std::vector<Fingerprint> getScheduledEvictions() const;

  /// Evict every scheduled entry which is still corrupted.
  llvm::Error flushScheduledEvictions();

  /// Fully re-hash every entry.
  ///
  /// \returns The fingerprints of all entries which failed verification,
  /// including entry directories without an index row.
  llvm::Expected<std::vector<Fingerprint>> verifyIntegrity();

  /// Get the committed entries, ordered by fingerprint.
  llvm::Expected<std::vector<CacheEntry>> entries();

  /// Evict the entries matching \p filter; an empty filter removes everything.
  ///
  /// \returns The number of entries removed.
  llvm::Expected<unsigned> clear(const CacheFilter& filter);

  /// Acquire the cross-process lock for building \p fingerprint, blocking
  /// while another process holds it.
  llvm::Expected<std::unique_ptr<basic::FileLock>>
  acquireLock(const Fingerprint& fingerprint);
};

}
}

#endif
