//===- SnapshotManifest.h ---------------------------------------*- C++ -*-===//
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

#ifndef STAGEBUILD_BOOTSTRAP_SNAPSHOTMANIFEST_H
#define STAGEBUILD_BOOTSTRAP_SNAPSHOTMANIFEST_H

#include "stagebuild/Basic/Hashing.h"
#include "stagebuild/Basic/LLVM.h"
#include "stagebuild/Bootstrap/Platform.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>
#include <vector>

namespace stagebuild {
namespace basic {
class FileSystem;
}

namespace bootstrap {

/// Where to get the stage 0 toolchain for one platform.
struct SnapshotEntry {
  Platform platform;
  std::string url;

  /// The SHA-256 checksum of the archive.
  basic::Digest checksum;

  unsigned formatVersion = 0;
};

/// The list of trusted stage 0 snapshots, one per host platform.
///
/// The manifest is immutable once loaded.
class SnapshotManifest {
  std::map<Platform, SnapshotEntry> entries;

  /// Platforms whose entry was rejected, with the reason.
  std::map<Platform, std::string> rejected;

public:
  /// The snapshot format version this tool understands.
  static const unsigned SupportedFormatVersion = 1;

  SnapshotManifest() {}

  /// Parse manifest \p contents, read from \p path.
  ///
  /// A malformed document, platform or checksum makes the whole manifest
  /// invalid. An entry with an unsupported format version is rejected and its
  /// platform reported as unsupported by \see lookup().
  static llvm::Expected<SnapshotManifest> parse(StringRef contents,
                                                StringRef path);

  /// Load the manifest at \p path.
  static llvm::Expected<SnapshotManifest> load(basic::FileSystem& fs,
                                               StringRef path);

  /// Get the snapshot for \p platform.
  llvm::Expected<SnapshotEntry> lookup(const Platform& platform) const;

  /// Check whether \p platform has a usable snapshot.
  bool contains(const Platform& platform) const {
    return entries.count(platform) != 0;
  }

  /// Get every usable platform, in order.
  std::vector<Platform> getPlatforms() const;
};

}
}

#endif
